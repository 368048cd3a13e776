#pragma once

/// @file combat_session.hpp
/// @brief One combat encounter: grid, reactions, statuses and turn order.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tcc/foundation/game_result.hpp"
#include "tcc/foundation/types.hpp"
#include "tcc/grid/combat_grid.hpp"
#include "tcc/grid/pathfinder.hpp"
#include "tcc/grid/tactical_queries.hpp"
#include "tcc/reactions/reaction_registry.hpp"
#include "tcc/reactions/reaction_resolver.hpp"
#include "tcc/rules/resolution_engine.hpp"
#include "tcc/status/death_saves.hpp"
#include "tcc/status/exhaustion.hpp"

namespace tcc::session {

using foundation::CombatantId;
using foundation::GameResult;
using foundation::SessionId;

/// Per-combatant state created on entry and dropped on exit.
struct CombatantStatus {
    status::DeathSaveState deathSaves;
    status::ExhaustionState exhaustion;
};

/// Encounter-local facts about a combatant. The core keeps no richer
/// combatant model; stats arrive per call.
struct CombatantSetup {
    uint32_t team = 0;                      ///< Different teams are enemies
    int32_t reachFeet = grid::kFeetPerSquare;
    bool sentinel = false;
    bool polearmMaster = false;
    std::optional<int32_t> speedFeet;       ///< Session default when unset
};

enum class CombatEventKind : uint8_t {
    CombatantJoined,
    CombatantLeft,
    TurnStarted,
    Moved,
    ReactionUsed,
    CombatantDied,
    CombatEnded
};

[[nodiscard]] std::string_view combatEventKindName(CombatEventKind kind) noexcept;

struct CombatEvent {
    CombatEventKind kind = CombatEventKind::CombatantJoined;
    uint32_t round = 0;
    std::optional<CombatantId> combatant;
    std::string detail;
};

struct MoveOutcome {
    grid::PathfindingResult path;
    int32_t movementRemaining = 0;  ///< Feet left this turn after the move
    /// Enemies whose reach the mover left along the path and who still
    /// have their reaction, in order of first trigger.
    std::vector<CombatantId> opportunityAttackers;
    /// Polearm Master holders whose reach the mover entered.
    std::vector<CombatantId> polearmAttackers;
};

/// A single combat encounter.
///
/// The session owns its grid, reaction registry and per-combatant status
/// records by value; nothing is shared between sessions. Entering and
/// leaving combat update all three in one call, so callers never observe
/// a combatant that is on the grid but has no reaction record, or the
/// reverse.
///
/// Turns are strictly sequential: beginNextTurn() opens the next
/// combatant's turn, restores their reaction and movement budget, and
/// moveCombatant() only accepts the combatant whose turn is open.
///
/// Thread safety: None. One thread drives one session.
class CombatSession {
public:
    static constexpr int32_t kDefaultSpeedFeet = 30;

    CombatSession(SessionId id, int32_t width = grid::kDefaultGridWidth,
                  int32_t height = grid::kDefaultGridHeight,
                  grid::DiagonalPolicy policy = grid::DiagonalPolicy::Chebyshev,
                  int32_t defaultSpeedFeet = kDefaultSpeedFeet);

    // ── Accessors ──────────────────────────────────────────────────────

    [[nodiscard]] SessionId id() const noexcept { return id_; }

    /// Terrain, cover, elevation and hazards are set through the grid;
    /// occupancy belongs to addCombatant / moveCombatant / removeCombatant.
    [[nodiscard]] grid::CombatGrid& grid() noexcept { return grid_; }
    [[nodiscard]] const grid::CombatGrid& grid() const noexcept { return grid_; }

    [[nodiscard]] const reactions::ReactionRegistry& reactions() const noexcept {
        return reactions_;
    }

    [[nodiscard]] bool hasEnded() const noexcept { return ended_; }
    [[nodiscard]] uint32_t round() const noexcept { return round_; }
    [[nodiscard]] std::optional<CombatantId> currentCombatant() const noexcept {
        return current_;
    }
    /// Feet the current combatant can still move at its configured speed.
    [[nodiscard]] int32_t movementRemaining() const;

    [[nodiscard]] bool contains(CombatantId id) const;
    [[nodiscard]] std::size_t combatantCount() const noexcept { return combatants_.size(); }
    [[nodiscard]] const std::vector<CombatantId>& initiativeOrder() const noexcept {
        return order_;
    }

    [[nodiscard]] const std::vector<CombatEvent>& events() const noexcept { return events_; }

    // ── Membership ─────────────────────────────────────────────────────

    /// Occupy @p pos, register a reaction and create fresh status.
    ///
    /// Fails with OutOfBounds, CellNotPassable (impassable terrain),
    /// CellOccupied or CombatantAlreadyPresent, changing nothing.
    GameResult<void> addCombatant(CombatantId id, grid::GridPos pos,
                                  const CombatantSetup& setup = {});

    /// Vacate the cell, drop the reaction and status, and take the
    /// combatant out of the initiative order.
    GameResult<void> removeCombatant(CombatantId id);

    // ── Turns ──────────────────────────────────────────────────────────

    /// Replace the turn order and restart at round 0. Every id must be in
    /// the session exactly once.
    GameResult<void> setInitiativeOrder(const std::vector<CombatantId>& order);

    /// Open the next turn. The round counter increments when the order
    /// wraps (and on the first call).
    GameResult<CombatantId> beginNextTurn();

    // ── Movement ───────────────────────────────────────────────────────

    /// Move the combatant whose turn is open.
    ///
    /// The budget is the combatant's speed (after exhaustion) minus what
    /// it already moved this turn. A failed path is not an error: the
    /// outcome reports it and nothing moves.
    GameResult<MoveOutcome> moveCombatant(CombatantId id, grid::GridPos to,
                                          const grid::MoverState& mover = {});

    /// Same as above with an explicit base speed for this turn.
    GameResult<MoveOutcome> moveCombatant(CombatantId id, grid::GridPos to, int32_t speedFeet,
                                          const grid::MoverState& mover = {});

    // ── Reactions ──────────────────────────────────────────────────────

    /// Spend @p id's reaction. False if it was already spent.
    GameResult<bool> useReaction(CombatantId id);

    /// Resolve an opportunity attack by @p reactor on @p target.
    GameResult<reactions::ReactionResult>
    resolveOpportunityAttack(CombatantId reactor, CombatantId target,
                             const rules::AttackRequest& attack,
                             rules::ResolutionEngine& engine);

    GameResult<void> setReadiedAction(CombatantId id, reactions::ReadiedAction action);

    // ── Status ─────────────────────────────────────────────────────────

    [[nodiscard]] const CombatantStatus* status(CombatantId id) const;

    /// Store a death save state produced by DeathSaves; rejects corrupt
    /// counters.
    GameResult<void> setDeathSaveState(CombatantId id, const status::DeathSaveState& state);

    GameResult<void> setExhaustionState(CombatantId id, const status::ExhaustionState& state);

    /// @p id took a hit while at 0 HP. Adds death save failures, or kills
    /// outright when @p overflow reaches @p maxHp and @p rules enable
    /// massive damage. The combatant stays in the session either way.
    GameResult<status::DamageWhileDyingResult>
    damageWhileDying(CombatantId id, bool critical, int32_t overflow, int32_t maxHp,
                     const rules::RulesConfig& rules);

    // ── Teardown ───────────────────────────────────────────────────────

    /// Remove every combatant. Later mutations fail with CombatEnded.
    GameResult<void> end();

private:
    struct Participant {
        CombatantSetup setup;
        CombatantStatus status;
    };

    GameResult<void> ensureActive() const;
    Participant* participant(CombatantId id);
    void record(CombatEventKind kind, std::optional<CombatantId> who, std::string detail);
    std::vector<grid::ThreatProfile> enemiesOf(CombatantId id) const;
    int32_t speedBudget(const Participant& who, int32_t baseSpeed) const;

    SessionId id_;
    int32_t defaultSpeedFeet_;
    grid::CombatGrid grid_;
    reactions::ReactionRegistry reactions_;
    std::unordered_map<CombatantId, Participant> combatants_;

    std::vector<CombatantId> order_;
    std::size_t nextIndex_ = 0;
    std::optional<CombatantId> current_;
    uint32_t round_ = 0;
    int32_t movementUsed_ = 0;

    bool ended_ = false;
    std::vector<CombatEvent> events_;
};

} // namespace tcc::session
