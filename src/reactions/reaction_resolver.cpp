/// @file reaction_resolver.cpp
/// @brief Shield, Uncanny Dodge and opportunity attack resolution.

#include "tcc/reactions/reaction_resolver.hpp"

#include <algorithm>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::reactions {

using foundation::LogCategory;

namespace {

ReactionResult spent(ReactionKind kind, CombatantId id) {
    ReactionResult result;
    result.kind = kind;
    result.description = "combatant " + std::to_string(id.value()) + " has no reaction available";
    return result;
}

} // namespace

GameResult<ReactionResult> ReactionResolver::opportunityAttack(CombatantId reactor,
                                                               CombatantId target,
                                                               const rules::AttackRequest& attack) {
    if (!registry_.hasReaction(reactor)) {
        return GameResult<ReactionResult>::ok(spent(ReactionKind::OpportunityAttack, reactor));
    }
    auto terms = rules::Dice::parseDiceNotation(attack.damageNotation);
    if (!terms) {
        return GameResult<ReactionResult>::err(terms.error());
    }

    registry_.useReaction(reactor);
    auto outcome = engine_.resolveAttack(attack);
    if (!outcome) {
        return GameResult<ReactionResult>::err(outcome.error());
    }

    ReactionResult result;
    result.success = true;
    result.kind = ReactionKind::OpportunityAttack;
    result.damageDealt = outcome.value().totalDamage();

    const std::string who = std::to_string(reactor.value());
    const std::string whom = std::to_string(target.value());
    if (!outcome.value().hit) {
        result.description = "opportunity attack by " + who + " against " + whom + " misses";
    } else if (outcome.value().criticalHit) {
        result.description = "critical opportunity attack by " + who + " against " + whom +
                             " for " + std::to_string(result.damageDealt) + " damage";
    } else {
        result.description = "opportunity attack by " + who + " against " + whom + " for " +
                             std::to_string(result.damageDealt) + " damage";
    }
    result.attack = std::move(outcome).value();

    TCC_LOG_DEBUG(LogCategory::Reactions, result.description);
    return GameResult<ReactionResult>::ok(std::move(result));
}

ReactionResult ReactionResolver::shield(CombatantId caster, int32_t incomingAttackTotal,
                                        int32_t currentAc, bool hasSpellSlot,
                                        bool incomingCritical) {
    if (!hasSpellSlot) {
        ReactionResult result;
        result.kind = ReactionKind::Shield;
        result.description = "no spell slot for Shield";
        return result;
    }
    if (!registry_.useReaction(caster)) {
        return spent(ReactionKind::Shield, caster);
    }

    ReactionResult result;
    result.success = true;
    result.kind = ReactionKind::Shield;
    result.acBonus = kShieldAcBonus;
    const int32_t newAc = currentAc + kShieldAcBonus;
    result.attackNowMisses = !incomingCritical && incomingAttackTotal < newAc;
    if (incomingCritical) {
        result.description = "Shield raises AC to " + std::to_string(newAc) +
                             ", the critical hit still lands";
    } else {
        result.description = "Shield raises AC to " + std::to_string(newAc) +
                             (result.attackNowMisses ? ", the attack misses"
                                                     : ", the attack still hits");
    }
    return result;
}

ReactionResult ReactionResolver::uncannyDodge(CombatantId rogue, int32_t incomingDamage) {
    if (!registry_.useReaction(rogue)) {
        return spent(ReactionKind::UncannyDodge, rogue);
    }
    const int32_t damage = std::max(0, incomingDamage);
    const int32_t taken = damage / 2;

    ReactionResult result;
    result.success = true;
    result.kind = ReactionKind::UncannyDodge;
    result.damagePrevented = damage - taken;
    result.description = "Uncanny Dodge: takes " + std::to_string(taken) + " instead of " +
                         std::to_string(damage);
    return result;
}

} // namespace tcc::reactions
