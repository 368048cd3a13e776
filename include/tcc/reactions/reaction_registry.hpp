#pragma once

/// @file reaction_registry.hpp
/// @brief Per-combatant reaction availability and readied actions.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tcc/foundation/types.hpp"

namespace tcc::reactions {

using foundation::CombatantId;

/// Condition that fires a reaction or a readied action.
enum class ReactionTrigger : uint8_t {
    EnemyLeavesReach,
    EnemyEntersReach,
    BeingAttacked,
    BeingHit,
    TakingDamage,
    EnemyCastsSpell,
    AllyAttacked,
    Custom
};

[[nodiscard]] std::string_view reactionTriggerName(ReactionTrigger trigger) noexcept;

/// Deferred action stored by "ready an action".
struct ReadiedAction {
    ReactionTrigger trigger = ReactionTrigger::Custom;
    std::string action;                 ///< Caller-defined payload, e.g. "attack"
    std::optional<CombatantId> target;

    bool operator==(const ReadiedAction&) const = default;
};

struct ReactionRecord {
    CombatantId combatant;
    bool available = true;
    std::optional<ReadiedAction> readied;
};

/// Tracks the once-per-round reaction of every combatant in an encounter.
///
/// A reaction can be spent at most once between two resetForTurn() calls,
/// which the session makes at the start of that combatant's own turn.
/// Trigger detection happens elsewhere; this registry only answers "can
/// they react" and records that they did. Calls naming an unregistered
/// combatant are no-ops returning false / std::nullopt.
///
/// Thread safety: None.
class ReactionRegistry {
public:
    /// Registering twice keeps the existing record.
    void registerCombatant(CombatantId id);

    /// @return false if @p id was not registered.
    bool unregisterCombatant(CombatantId id);

    [[nodiscard]] bool isRegistered(CombatantId id) const;

    [[nodiscard]] bool hasReaction(CombatantId id) const;

    /// Spend the reaction. False, with no state change, if already spent.
    bool useReaction(CombatantId id);

    /// Restore the reaction at the start of @p id's own turn.
    bool resetForTurn(CombatantId id);

    bool setReadiedAction(CombatantId id, ReadiedAction action);
    bool clearReadiedAction(CombatantId id);

    [[nodiscard]] std::optional<ReadiedAction> readiedAction(CombatantId id) const;

    /// Fire the readied action: spends the reaction and clears the
    /// readied action. std::nullopt when nothing is readied or the
    /// reaction is already spent.
    std::optional<ReadiedAction> triggerReadiedAction(CombatantId id);

    /// @p candidates that are registered and still have their reaction,
    /// in input order.
    [[nodiscard]] std::vector<CombatantId>
    eligibleReactors(const std::vector<CombatantId>& candidates) const;

    [[nodiscard]] const ReactionRecord* record(CombatantId id) const;

    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

    void clear() noexcept { records_.clear(); }

private:
    std::unordered_map<CombatantId, ReactionRecord> records_;
};

} // namespace tcc::reactions
