/// @file game_logger.cpp
/// @brief GameLogger over the kcenon GlobalLoggerRegistry.

#include "tcc/foundation/game_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <string>

namespace tcc::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

// Indexed by LogLevel; the enums share ordering.
constexpr std::array<kci::log_level, 7> kKcenonLevels = {
    kci::log_level::trace,   kci::log_level::debug, kci::log_level::info,
    kci::log_level::warning, kci::log_level::error, kci::log_level::critical,
    kci::log_level::off,
};

// Indexed by LogCategory.
constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Debug,  // Grid
    LogLevel::Debug,  // Rules
    LogLevel::Debug,  // Reactions
    LogLevel::Info,   // Status
    LogLevel::Info,   // Session
};

kci::log_level toKcenon(LogLevel level) {
    auto idx = static_cast<std::size_t>(level);
    return idx < kKcenonLevels.size() ? kKcenonLevels[idx] : kci::log_level::info;
}

bool validCategory(LogCategory cat) {
    return static_cast<std::size_t>(cat) < kLogCategoryCount;
}

void appendField(std::string& out, std::string_view key, std::string_view value) {
    if (!out.empty()) {
        out += ", ";
    }
    out += key;
    out += '=';
    out += value;
}

// "[Grid] no path {combatant_id=3, session_id=1}"
std::string formatLine(LogCategory cat, std::string_view msg, const LogContext* ctx) {
    std::string line;
    line.reserve(msg.size() + 32);
    line += '[';
    line += logCategoryName(cat);
    line += "] ";
    line += msg;

    if (ctx == nullptr || ctx->empty()) {
        return line;
    }

    std::string fields;
    if (ctx->combatantId && ctx->combatantId->isValid()) {
        appendField(fields, "combatant_id", std::to_string(ctx->combatantId->value()));
    }
    if (ctx->sessionId && ctx->sessionId->isValid()) {
        appendField(fields, "session_id", std::to_string(ctx->sessionId->value()));
    }
    if (ctx->traceId && !ctx->traceId->empty()) {
        appendField(fields, "trace_id", *ctx->traceId);
    }
    for (const auto& [key, value] : ctx->extra) {
        appendField(fields, key, value);
    }

    line += " {";
    line += fields;
    line += '}';
    return line;
}

} // namespace

struct GameLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> minLevels;
    std::array<std::string, kLogCategoryCount> names;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            minLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            names[i] = "tcc." + std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    // A host may register "tcc.Grid" etc. to route one category elsewhere;
    // anything unregistered goes to the registry default.
    std::shared_ptr<kci::ILogger> sinkFor(LogCategory cat) const {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto named = registry.get_logger(names[static_cast<std::size_t>(cat)]);
        if (named == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return named;
    }

    void write(LogLevel level, LogCategory cat, std::string_view msg,
               const LogContext* ctx) const {
        sinkFor(cat)->log(toKcenon(level), formatLine(cat, msg, ctx));
    }
};

GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

GameLogger::GameLogger(GameLogger&&) noexcept = default;
GameLogger& GameLogger::operator=(GameLogger&&) noexcept = default;

void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (isEnabled(level, cat)) {
        impl_->write(level, cat, msg, nullptr);
    }
}

void GameLogger::logWithContext(LogLevel level, LogCategory cat, std::string_view msg,
                                const LogContext& ctx) {
    if (isEnabled(level, cat)) {
        impl_->write(level, cat, msg, &ctx);
    }
}

void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    if (validCategory(cat)) {
        impl_->minLevels[static_cast<std::size_t>(cat)].store(minLevel,
                                                              std::memory_order_release);
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    if (!validCategory(cat)) {
        return LogLevel::Off;
    }
    return impl_->minLevels[static_cast<std::size_t>(cat)].load(std::memory_order_acquire);
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    if (level == LogLevel::Off) {
        return false;
    }
    const LogLevel floor = getCategoryLevel(cat);
    return floor != LogLevel::Off && static_cast<uint8_t>(level) >= static_cast<uint8_t>(floor);
}

GameResult<void> GameLogger::flush() {
    auto result = kci::GlobalLoggerRegistry::instance().get_default_logger()->flush();
    if (result.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "default logger failed to flush"));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger logger;
    return logger;
}

} // namespace tcc::foundation
