/// @file combat_session.cpp
/// @brief CombatSession implementation.

#include "tcc/session/combat_session.hpp"

#include <algorithm>
#include <unordered_set>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::session {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::LogCategory;
using foundation::LogContext;

namespace {

std::string idText(CombatantId id) {
    return std::to_string(id.value());
}

std::string posText(grid::GridPos pos) {
    return "(" + std::to_string(pos.x) + "," + std::to_string(pos.y) + ")";
}

GameError notFound(CombatantId id) {
    return GameError(ErrorCode::CombatantNotFound, "combatant not in session: " + idText(id));
}

// Appends the ids in @p from that are not yet in @p into.
void appendUnique(std::vector<CombatantId>& into, const std::vector<CombatantId>& from) {
    for (const auto& id : from) {
        if (std::find(into.begin(), into.end(), id) == into.end()) {
            into.push_back(id);
        }
    }
}

} // namespace

std::string_view combatEventKindName(CombatEventKind kind) noexcept {
    switch (kind) {
        case CombatEventKind::CombatantJoined: return "combatant_joined";
        case CombatEventKind::CombatantLeft:   return "combatant_left";
        case CombatEventKind::TurnStarted:     return "turn_started";
        case CombatEventKind::Moved:           return "moved";
        case CombatEventKind::ReactionUsed:    return "reaction_used";
        case CombatEventKind::CombatantDied:   return "combatant_died";
        case CombatEventKind::CombatEnded:     return "combat_ended";
    }
    return "unknown";
}

CombatSession::CombatSession(SessionId id, int32_t width, int32_t height,
                             grid::DiagonalPolicy policy, int32_t defaultSpeedFeet)
    : id_(id),
      defaultSpeedFeet_(std::max(0, defaultSpeedFeet)),
      grid_(width, height, policy) {}

// ── Accessors ───────────────────────────────────────────────────────────

bool CombatSession::contains(CombatantId id) const {
    return combatants_.find(id) != combatants_.end();
}

int32_t CombatSession::movementRemaining() const {
    if (!current_) {
        return 0;
    }
    auto it = combatants_.find(*current_);
    if (it == combatants_.end()) {
        return 0;
    }
    const int32_t base = it->second.setup.speedFeet.value_or(defaultSpeedFeet_);
    return speedBudget(it->second, base);
}

const CombatantStatus* CombatSession::status(CombatantId id) const {
    auto it = combatants_.find(id);
    return it == combatants_.end() ? nullptr : &it->second.status;
}

// ── Membership ──────────────────────────────────────────────────────────

GameResult<void> CombatSession::addCombatant(CombatantId id, grid::GridPos pos,
                                             const CombatantSetup& setup) {
    if (auto active = ensureActive(); !active) {
        return active;
    }
    if (!id.isValid()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "combatant id 0 is reserved"));
    }
    if (contains(id)) {
        return GameResult<void>::err(GameError(ErrorCode::CombatantAlreadyPresent,
                                               "combatant already in session: " + idText(id)));
    }
    const grid::GridCell* cell = grid_.cell(pos);
    if (cell == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::OutOfBounds, "position outside the grid: " + posText(pos)));
    }
    if (cell->occupant) {
        return GameResult<void>::err(GameError(
            ErrorCode::CellOccupied, "cell " + posText(pos) + " is occupied by " +
                                         idText(*cell->occupant)));
    }
    if (cell->terrain == grid::TerrainKind::Impassable) {
        return GameResult<void>::err(
            GameError(ErrorCode::CellNotPassable, "cell " + posText(pos) + " is impassable"));
    }

    grid_.setOccupant(pos, id);
    reactions_.registerCombatant(id);
    combatants_.emplace(id, Participant{setup, CombatantStatus{}});

    record(CombatEventKind::CombatantJoined, id, "at " + posText(pos));
    return GameResult<void>::ok();
}

GameResult<void> CombatSession::removeCombatant(CombatantId id) {
    if (auto active = ensureActive(); !active) {
        return active;
    }
    auto it = combatants_.find(id);
    if (it == combatants_.end()) {
        return GameResult<void>::err(notFound(id));
    }

    if (auto pos = grid_.findCombatant(id)) {
        grid_.setOccupant(*pos, std::nullopt);
    }
    reactions_.unregisterCombatant(id);
    combatants_.erase(it);

    auto orderIt = std::find(order_.begin(), order_.end(), id);
    if (orderIt != order_.end()) {
        const auto index = static_cast<std::size_t>(orderIt - order_.begin());
        order_.erase(orderIt);
        if (index < nextIndex_) {
            --nextIndex_;
        }
    }
    if (current_ == id) {
        current_.reset();
        movementUsed_ = 0;
    }

    record(CombatEventKind::CombatantLeft, id, {});
    return GameResult<void>::ok();
}

// ── Turns ───────────────────────────────────────────────────────────────

GameResult<void> CombatSession::setInitiativeOrder(const std::vector<CombatantId>& order) {
    if (auto active = ensureActive(); !active) {
        return active;
    }
    std::unordered_set<CombatantId> seen;
    for (const auto& id : order) {
        if (!contains(id)) {
            return GameResult<void>::err(notFound(id));
        }
        if (!seen.insert(id).second) {
            return GameResult<void>::err(GameError(
                ErrorCode::InvalidArgument, "combatant listed twice in initiative: " + idText(id)));
        }
    }

    order_ = order;
    nextIndex_ = 0;
    current_.reset();
    round_ = 0;
    movementUsed_ = 0;
    return GameResult<void>::ok();
}

GameResult<CombatantId> CombatSession::beginNextTurn() {
    if (ended_) {
        return GameResult<CombatantId>::err(
            GameError(ErrorCode::CombatEnded, "combat has ended"));
    }
    if (order_.empty()) {
        return GameResult<CombatantId>::err(
            GameError(ErrorCode::InvalidArgument, "initiative order is empty"));
    }

    if (nextIndex_ >= order_.size()) {
        nextIndex_ = 0;
        ++round_;
    } else if (round_ == 0) {
        round_ = 1;
    }

    const CombatantId id = order_[nextIndex_++];
    current_ = id;
    movementUsed_ = 0;
    reactions_.resetForTurn(id);

    record(CombatEventKind::TurnStarted, id, "round " + std::to_string(round_));
    return GameResult<CombatantId>::ok(id);
}

// ── Movement ────────────────────────────────────────────────────────────

GameResult<MoveOutcome> CombatSession::moveCombatant(CombatantId id, grid::GridPos to,
                                                     const grid::MoverState& mover) {
    auto it = combatants_.find(id);
    const int32_t base = it == combatants_.end()
        ? defaultSpeedFeet_
        : it->second.setup.speedFeet.value_or(defaultSpeedFeet_);
    return moveCombatant(id, to, base, mover);
}

GameResult<MoveOutcome> CombatSession::moveCombatant(CombatantId id, grid::GridPos to,
                                                     int32_t speedFeet,
                                                     const grid::MoverState& mover) {
    if (ended_) {
        return GameResult<MoveOutcome>::err(GameError(ErrorCode::CombatEnded, "combat has ended"));
    }
    Participant* who = participant(id);
    if (who == nullptr) {
        return GameResult<MoveOutcome>::err(notFound(id));
    }
    if (current_ != id) {
        return GameResult<MoveOutcome>::err(GameError(
            ErrorCode::NotCombatantsTurn, "not the turn of combatant " + idText(id)));
    }
    auto from = grid_.findCombatant(id);
    if (!from) {
        return GameResult<MoveOutcome>::err(
            GameError(ErrorCode::CorruptState, "combatant " + idText(id) + " is not on the grid"));
    }

    const int32_t budget = speedBudget(*who, speedFeet);

    MoveOutcome outcome;
    outcome.path = grid::Pathfinder::findPath(grid_, *from, to, budget);
    outcome.movementRemaining = budget;
    if (!outcome.path.success || outcome.path.path.size() < 2) {
        return GameResult<MoveOutcome>::ok(std::move(outcome));
    }

    // Reach is checked per step; leaving the same reach twice still
    // yields one trigger.
    const auto enemies = enemiesOf(id);
    const auto& path = outcome.path.path;
    for (std::size_t i = 1; i < path.size(); ++i) {
        appendUnique(outcome.opportunityAttackers,
                     grid::TacticalQueries::opportunityAttackTriggers(grid_, path[i - 1], path[i],
                                                                      enemies, mover));
        appendUnique(outcome.polearmAttackers,
                     grid::TacticalQueries::polearmMasterTriggers(grid_, path[i - 1], path[i],
                                                                  enemies));
    }
    outcome.opportunityAttackers = reactions_.eligibleReactors(outcome.opportunityAttackers);
    outcome.polearmAttackers = reactions_.eligibleReactors(outcome.polearmAttackers);

    grid_.setOccupant(*from, std::nullopt);
    grid_.setOccupant(to, id);
    movementUsed_ += outcome.path.totalCost;
    outcome.movementRemaining = budget - outcome.path.totalCost;

    record(CombatEventKind::Moved, id,
           posText(*from) + " -> " + posText(to) + " for " +
               std::to_string(outcome.path.totalCost) + "ft");
    return GameResult<MoveOutcome>::ok(std::move(outcome));
}

// ── Reactions ───────────────────────────────────────────────────────────

GameResult<bool> CombatSession::useReaction(CombatantId id) {
    if (ended_) {
        return GameResult<bool>::err(GameError(ErrorCode::CombatEnded, "combat has ended"));
    }
    if (!contains(id)) {
        return GameResult<bool>::err(notFound(id));
    }
    const bool used = reactions_.useReaction(id);
    if (used) {
        record(CombatEventKind::ReactionUsed, id, {});
    }
    return GameResult<bool>::ok(used);
}

GameResult<reactions::ReactionResult>
CombatSession::resolveOpportunityAttack(CombatantId reactor, CombatantId target,
                                        const rules::AttackRequest& attack,
                                        rules::ResolutionEngine& engine) {
    using Outcome = GameResult<reactions::ReactionResult>;
    if (ended_) {
        return Outcome::err(GameError(ErrorCode::CombatEnded, "combat has ended"));
    }
    if (!contains(reactor)) {
        return Outcome::err(notFound(reactor));
    }
    if (!contains(target)) {
        return Outcome::err(notFound(target));
    }

    reactions::ReactionResolver resolver(reactions_, engine);
    auto result = resolver.opportunityAttack(reactor, target, attack);
    if (result && result.value().success) {
        record(CombatEventKind::ReactionUsed, reactor, result.value().description);
    }
    return result;
}

GameResult<void> CombatSession::setReadiedAction(CombatantId id,
                                                 reactions::ReadiedAction action) {
    if (auto active = ensureActive(); !active) {
        return active;
    }
    if (!reactions_.setReadiedAction(id, std::move(action))) {
        return GameResult<void>::err(notFound(id));
    }
    return GameResult<void>::ok();
}

// ── Status ──────────────────────────────────────────────────────────────

GameResult<void> CombatSession::setDeathSaveState(CombatantId id,
                                                  const status::DeathSaveState& state) {
    if (auto active = ensureActive(); !active) {
        return active;
    }
    Participant* who = participant(id);
    if (who == nullptr) {
        return GameResult<void>::err(notFound(id));
    }
    auto valid = status::DeathSaves::validate(state);
    if (!valid) {
        return GameResult<void>::err(valid.error());
    }
    who->status.deathSaves = valid.value();
    return GameResult<void>::ok();
}

GameResult<status::DamageWhileDyingResult>
CombatSession::damageWhileDying(CombatantId id, bool critical, int32_t overflow, int32_t maxHp,
                                const rules::RulesConfig& rules) {
    using Result = GameResult<status::DamageWhileDyingResult>;
    if (auto active = ensureActive(); !active) {
        return Result::err(active.error());
    }
    Participant* who = participant(id);
    if (who == nullptr) {
        return Result::err(notFound(id));
    }

    const bool wasDead = who->status.deathSaves.dead;
    auto outcome = status::DeathSaves::takeDamage(who->status.deathSaves, critical, overflow,
                                                  maxHp, rules);
    who->status.deathSaves = outcome.state;
    if (outcome.died && !wasDead) {
        record(CombatEventKind::CombatantDied, id,
               outcome.massiveDamage ? "from massive damage" : "from death save failures");
    }
    return Result::ok(std::move(outcome));
}

GameResult<void> CombatSession::setExhaustionState(CombatantId id,
                                                   const status::ExhaustionState& state) {
    if (auto active = ensureActive(); !active) {
        return active;
    }
    Participant* who = participant(id);
    if (who == nullptr) {
        return GameResult<void>::err(notFound(id));
    }
    auto valid = status::Exhaustion::validate(state);
    if (!valid) {
        return GameResult<void>::err(valid.error());
    }
    who->status.exhaustion = valid.value();
    return GameResult<void>::ok();
}

// ── Teardown ────────────────────────────────────────────────────────────

GameResult<void> CombatSession::end() {
    if (auto active = ensureActive(); !active) {
        return active;
    }
    for (const auto& [id, who] : combatants_) {
        if (auto pos = grid_.findCombatant(id)) {
            grid_.setOccupant(*pos, std::nullopt);
        }
    }
    combatants_.clear();
    reactions_.clear();
    order_.clear();
    nextIndex_ = 0;
    current_.reset();
    movementUsed_ = 0;

    record(CombatEventKind::CombatEnded, std::nullopt, "after round " + std::to_string(round_));
    ended_ = true;
    return GameResult<void>::ok();
}

// ── Internals ───────────────────────────────────────────────────────────

GameResult<void> CombatSession::ensureActive() const {
    if (ended_) {
        return GameResult<void>::err(GameError(ErrorCode::CombatEnded, "combat has ended"));
    }
    return GameResult<void>::ok();
}

CombatSession::Participant* CombatSession::participant(CombatantId id) {
    auto it = combatants_.find(id);
    return it == combatants_.end() ? nullptr : &it->second;
}

void CombatSession::record(CombatEventKind kind, std::optional<CombatantId> who,
                           std::string detail) {
    LogContext ctx;
    ctx.sessionId = id_;
    ctx.combatantId = who;
    foundation::GameLogger::instance().logWithContext(
        foundation::LogLevel::Debug, LogCategory::Session,
        std::string(combatEventKindName(kind)) + (detail.empty() ? "" : " " + detail), ctx);

    events_.push_back(CombatEvent{kind, round_, who, std::move(detail)});
}

std::vector<grid::ThreatProfile> CombatSession::enemiesOf(CombatantId id) const {
    std::vector<grid::ThreatProfile> enemies;
    auto self = combatants_.find(id);
    if (self == combatants_.end()) {
        return enemies;
    }
    for (const auto& [otherId, other] : combatants_) {
        if (otherId == id || other.setup.team == self->second.setup.team) {
            continue;
        }
        enemies.push_back(grid::ThreatProfile{otherId, other.setup.reachFeet,
                                              other.setup.sentinel,
                                              other.setup.polearmMaster});
    }
    // Map order is unspecified; keep trigger lists stable.
    std::sort(enemies.begin(), enemies.end(),
              [](const auto& a, const auto& b) { return a.id < b.id; });
    return enemies;
}

int32_t CombatSession::speedBudget(const Participant& who, int32_t baseSpeed) const {
    const int32_t speed = status::Exhaustion::applySpeed(who.status.exhaustion.level, baseSpeed);
    return std::max(0, speed - movementUsed_);
}

} // namespace tcc::session
