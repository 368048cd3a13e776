/// @file session_store.cpp
/// @brief SessionStore: owns every live combat session.

#include "tcc/session/session_store.hpp"

#include <string>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::session {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::LogCategory;

GameResult<SessionSettings> SessionSettings::fromConfig(const foundation::ConfigManager& config) {
    SessionSettings settings;

    int32_t maxSessions = static_cast<int32_t>(settings.maxSessions);
    std::string policyName(grid::diagonalPolicyName(settings.diagonalPolicy));

    if (auto r = config.readIfPresent("grid.width", settings.gridWidth); !r) {
        return GameResult<SessionSettings>::err(r.error());
    }
    if (auto r = config.readIfPresent("grid.height", settings.gridHeight); !r) {
        return GameResult<SessionSettings>::err(r.error());
    }
    if (auto r = config.readIfPresent("combat.default_speed", settings.defaultSpeedFeet); !r) {
        return GameResult<SessionSettings>::err(r.error());
    }
    if (auto r = config.readIfPresent("sessions.max_sessions", maxSessions); !r) {
        return GameResult<SessionSettings>::err(r.error());
    }
    if (auto r = config.readIfPresent("grid.diagonal_policy", policyName); !r) {
        return GameResult<SessionSettings>::err(r.error());
    }

    auto policy = grid::parseDiagonalPolicy(policyName);
    if (!policy) {
        return GameResult<SessionSettings>::err(GameError(
            ErrorCode::InvalidArgument, "unknown grid.diagonal_policy: " + policyName));
    }
    if (maxSessions < 1) {
        return GameResult<SessionSettings>::err(GameError(
            ErrorCode::InvalidArgument,
            "sessions.max_sessions must be positive, got " + std::to_string(maxSessions)));
    }
    settings.diagonalPolicy = *policy;
    settings.maxSessions = static_cast<std::size_t>(maxSessions);
    return GameResult<SessionSettings>::ok(settings);
}

SessionStore::SessionStore(SessionSettings settings)
    : settings_(settings) {}

GameResult<SessionId> SessionStore::create() {
    return create(settings_.gridWidth, settings_.gridHeight, settings_.diagonalPolicy);
}

GameResult<SessionId> SessionStore::create(int32_t width, int32_t height,
                                           grid::DiagonalPolicy policy) {
    if (sessions_.size() >= settings_.maxSessions) {
        TCC_LOG_WARN(LogCategory::Session,
                     "session limit reached (" + std::to_string(settings_.maxSessions) + ")");
        return GameResult<SessionId>::err(
            GameError(ErrorCode::SessionLimitReached,
                      "session limit reached: " + std::to_string(settings_.maxSessions)));
    }

    const SessionId id = ids_.next();
    sessions_.emplace(id, std::make_unique<CombatSession>(id, width, height, policy,
                                                          settings_.defaultSpeedFeet));
    TCC_LOG_INFO(LogCategory::Session, "created session " + std::to_string(id.value()) +
                                           " (" + std::to_string(width) + "x" +
                                           std::to_string(height) + ")");
    return GameResult<SessionId>::ok(id);
}

CombatSession* SessionStore::find(SessionId id) {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.get();
}

const CombatSession* SessionStore::find(SessionId id) const {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.get();
}

GameResult<void> SessionStore::destroy(SessionId id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return GameResult<void>::err(GameError(
            ErrorCode::SessionNotFound, "session not found: " + std::to_string(id.value())));
    }
    sessions_.erase(it);
    TCC_LOG_INFO(LogCategory::Session, "destroyed session " + std::to_string(id.value()));
    return GameResult<void>::ok();
}

} // namespace tcc::session
