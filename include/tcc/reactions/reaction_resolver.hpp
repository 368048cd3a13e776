#pragma once

/// @file reaction_resolver.hpp
/// @brief Resolution of the common reactions against a ReactionRegistry.

#include <cstdint>
#include <optional>
#include <string>

#include "tcc/foundation/game_result.hpp"
#include "tcc/reactions/reaction_registry.hpp"
#include "tcc/rules/resolution_engine.hpp"

namespace tcc::reactions {

using foundation::GameResult;

enum class ReactionKind : uint8_t {
    OpportunityAttack,
    Shield,
    UncannyDodge
};

struct ReactionResult {
    bool success = false;  ///< The reaction was spent
    ReactionKind kind = ReactionKind::OpportunityAttack;
    std::string description;
    int32_t damageDealt = 0;
    int32_t damagePrevented = 0;
    int32_t acBonus = 0;
    bool attackNowMisses = false;                  ///< Shield only
    std::optional<rules::AttackOutcome> attack;    ///< Opportunity attack only
};

/// Spends reactions through a ReactionRegistry and resolves their effect.
///
/// Every operation first checks that the reactor still has a reaction;
/// if not, it returns success == false and leaves all state untouched.
class ReactionResolver {
public:
    static constexpr int32_t kShieldAcBonus = 5;

    ReactionResolver(ReactionRegistry& registry, rules::ResolutionEngine& engine)
        : registry_(registry), engine_(engine) {}

    /// Melee attack against a creature leaving reach. A miss still spends
    /// the reaction. Bad damage notation is an error and spends nothing.
    GameResult<ReactionResult> opportunityAttack(CombatantId reactor, CombatantId target,
                                                 const rules::AttackRequest& attack);

    /// +5 AC against an attack that has already been rolled. A critical
    /// hit lands regardless of AC, so the reaction is spent without
    /// turning it into a miss.
    ReactionResult shield(CombatantId caster, int32_t incomingAttackTotal, int32_t currentAc,
                          bool hasSpellSlot = true, bool incomingCritical = false);

    /// Halve the damage of one incoming hit (floor).
    ReactionResult uncannyDodge(CombatantId rogue, int32_t incomingDamage);

private:
    ReactionRegistry& registry_;
    rules::ResolutionEngine& engine_;
};

} // namespace tcc::reactions
