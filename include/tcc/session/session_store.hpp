#pragma once

/// @file session_store.hpp
/// @brief Owner of every live CombatSession, keyed by SessionId.

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>

#include "tcc/foundation/config_manager.hpp"
#include "tcc/foundation/game_result.hpp"
#include "tcc/session/combat_session.hpp"

namespace tcc::session {

/// Defaults applied to new sessions.
///
/// Config keys: grid.width, grid.height, grid.diagonal_policy,
/// combat.default_speed, sessions.max_sessions.
struct SessionSettings {
    int32_t gridWidth = grid::kDefaultGridWidth;
    int32_t gridHeight = grid::kDefaultGridHeight;
    grid::DiagonalPolicy diagonalPolicy = grid::DiagonalPolicy::Chebyshev;
    int32_t defaultSpeedFeet = CombatSession::kDefaultSpeedFeet;
    std::size_t maxSessions = 64;

    /// Missing keys keep their defaults; a malformed value is an error.
    static GameResult<SessionSettings> fromConfig(const foundation::ConfigManager& config);
};

/// Arena of combat sessions.
///
/// Replaces any process-wide session table: whoever owns the store owns
/// the sessions, and each session is reachable only through its id.
/// Pointers returned by find() stay valid until that session is destroyed.
///
/// Thread safety: None.
class SessionStore {
public:
    explicit SessionStore(SessionSettings settings = {});

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;
    SessionStore(SessionStore&&) = default;
    SessionStore& operator=(SessionStore&&) = default;

    /// New session with the configured grid and speed defaults.
    GameResult<SessionId> create();

    /// SessionLimitReached once maxSessions are live.
    GameResult<SessionId> create(int32_t width, int32_t height, grid::DiagonalPolicy policy);

    /// nullptr for an unknown id.
    [[nodiscard]] CombatSession* find(SessionId id);
    [[nodiscard]] const CombatSession* find(SessionId id) const;

    /// Drop the session and everything it owns. SessionNotFound when absent.
    GameResult<void> destroy(SessionId id);

    [[nodiscard]] std::size_t size() const noexcept { return sessions_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return settings_.maxSessions; }
    [[nodiscard]] const SessionSettings& settings() const noexcept { return settings_; }

private:
    SessionSettings settings_;
    foundation::IdAllocator<SessionId> ids_;
    std::map<SessionId, std::unique_ptr<CombatSession>> sessions_;
};

} // namespace tcc::session
