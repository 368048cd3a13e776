#pragma once

/// @file game_error.hpp
/// @brief Error carried by GameResult<T>: a code, a message, optional payload.

#include <any>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include "tcc/foundation/error_code.hpp"

namespace tcc::foundation {

/// Rejected input reported by a rules, grid or session call.
///
/// The optional context is a typed payload for tooling, e.g. the offending
/// notation string on a dice parse failure so a content editor can
/// highlight it. Retrieve it with context<T>().
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// "Rules", "Grid", "Session", ...
    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }

    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// One-line form for logs: "Rules 0x0901: bad dice notation '2x6'".
    [[nodiscard]] std::string describe() const {
        char hex[8];
        std::snprintf(hex, sizeof(hex), "0x%04X", static_cast<unsigned>(code_));
        std::string out(subsystem());
        out += ' ';
        out += hex;
        if (!message_.empty()) {
            out += ": ";
            out += message_;
        }
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

}  // namespace tcc::foundation
