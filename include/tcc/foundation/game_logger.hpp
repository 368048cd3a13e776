#pragma once

/// @file game_logger.hpp
/// @brief GameLogger: category-filtered logging on top of kcenon common_system.
///
/// The combat core logs through the kcenon logger registry so that the
/// embedding service decides where records go (console, file, JSON).
/// The core itself only picks a category and a level.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tcc/foundation/game_result.hpp"
#include "tcc/foundation/types.hpp"

namespace tcc::foundation {

/// Log severity levels.
///
/// Maps 1:1 onto kcenon::common::interfaces::log_level.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Subsystem categories, each with its own runtime minimum level.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Configuration, registry construction
    Grid      = 1, ///< Pathfinding and grid mutation
    Rules     = 2, ///< Dice, attacks, saves, damage
    Reactions = 3, ///< Reaction economy
    Status    = 4, ///< Death saves and exhaustion
    Session   = 5  ///< Combat session lifecycle
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Grid", "Rules", "Reactions", "Status", "Session"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields appended to a log line as "{k=v, ...}".
///
/// Ids come first, then extras in insertion order.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.combatantId = CombatantId(7);
///   ctx.add("roll", "20").add("target", "goblin");
///   logger.logWithContext(LogLevel::Info, LogCategory::Rules,
///                         "Critical hit", ctx);
/// @endcode
struct LogContext {
    std::optional<CombatantId> combatantId;
    std::optional<SessionId> sessionId;
    std::optional<std::string> traceId;
    std::vector<std::pair<std::string, std::string>> extra;

    LogContext& add(std::string key, std::string value) {
        extra.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    [[nodiscard]] bool empty() const noexcept {
        return !(combatantId && combatantId->isValid()) && !(sessionId && sessionId->isValid()) &&
               !(traceId && !traceId->empty()) && extra.empty();
    }
};

/// Category-aware logger, PIMPL over the kcenon logger registry.
///
/// Default minimum levels:
/// | Category  | Level |
/// |-----------|-------|
/// | Core      | Info  |
/// | Grid      | Debug |
/// | Rules     | Debug |
/// | Reactions | Debug |
/// | Status    | Info  |
/// | Session   | Info  |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// No-op if the level is below the category's minimum.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    GameResult<void> flush();

    /// Process-wide logger used by the TCC_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Raises or lowers one category's level for the lifetime of the object,
/// then restores whatever level was set before.
///
/// @code
///   ScopedLogLevel verbose(LogCategory::Grid, LogLevel::Trace);
///   Pathfinder::findPath(grid, from, to, budget);
/// @endcode
class ScopedLogLevel {
public:
    ScopedLogLevel(LogCategory cat, LogLevel level,
                   GameLogger& logger = GameLogger::instance())
        : logger_(logger), cat_(cat), previous_(logger.getCategoryLevel(cat)) {
        logger_.setCategoryLevel(cat_, level);
    }

    ~ScopedLogLevel() { logger_.setCategoryLevel(cat_, previous_); }

    ScopedLogLevel(const ScopedLogLevel&) = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

private:
    GameLogger& logger_;
    LogCategory cat_;
    LogLevel previous_;
};

} // namespace tcc::foundation

/// @name TCC_LOG Macros
/// @brief Logging macros with a compile-time floor and a runtime category check.
///
/// Define TCC_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold (0=Trace ... 6=Off).
/// @{

#ifndef TCC_MIN_LOG_LEVEL
    #define TCC_MIN_LOG_LEVEL 0
#endif

#define TCC_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= TCC_MIN_LOG_LEVEL &&                      \
            ::tcc::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::tcc::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define TCC_LOG_DEBUG(cat, msg) \
    TCC_LOG(::tcc::foundation::LogLevel::Debug, (cat), (msg))

#define TCC_LOG_INFO(cat, msg) \
    TCC_LOG(::tcc::foundation::LogLevel::Info, (cat), (msg))

#define TCC_LOG_WARN(cat, msg) \
    TCC_LOG(::tcc::foundation::LogLevel::Warning, (cat), (msg))

#define TCC_LOG_ERROR(cat, msg) \
    TCC_LOG(::tcc::foundation::LogLevel::Error, (cat), (msg))

/// @}
