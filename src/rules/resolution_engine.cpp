/// @file resolution_engine.cpp
/// @brief ResolutionEngine implementation.

#include "tcc/rules/resolution_engine.hpp"

#include <algorithm>

#include "tcc/foundation/game_logger.hpp"
#include "tcc/rules/combat_math.hpp"

namespace tcc::rules {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::LogCategory;

namespace {

constexpr int32_t kMinCritRange = 2;
constexpr int32_t kMaxCritRange = 20;

} // namespace

ResolutionEngine::ResolutionEngine(std::shared_ptr<const RulesRegistry> registry,
                                   RandomSource& source)
    : registry_(registry ? std::move(registry)
                         : RulesRegistry::withConfig(RulesConfig{})),
      dice_(source) {}

D20Outcome ResolutionEngine::rollD20(int32_t modifier, bool advantage, bool disadvantage) {
    return dice_.rollD20(modifier, advantage, disadvantage);
}

GameResult<DamageOutcome> ResolutionEngine::rollDamage(std::string_view notation,
                                                       int32_t extraModifier, bool critical) {
    return dice_.rollDamage(notation, extraModifier, critical);
}

GameResult<AttackOutcome> ResolutionEngine::resolveAttack(const AttackRequest& request) {
    // Reject bad notation before any die is rolled.
    auto terms = Dice::parseDiceNotation(request.damageNotation);
    if (!terms) {
        TCC_LOG_WARN(LogCategory::Rules, terms.error().describe());
        return GameResult<AttackOutcome>::err(terms.error());
    }

    AttackOutcome out;
    out.targetDefense = request.targetDefense;
    out.attackRoll = dice_.rollD20(request.attackBonus, request.advantage, request.disadvantage);

    const int32_t critRange = std::clamp(request.critRange, kMinCritRange, kMaxCritRange);
    const int32_t natural = out.attackRoll.baseRoll;

    if (out.attackRoll.natural1) {
        out.criticalMiss = true;
        return GameResult<AttackOutcome>::ok(std::move(out));
    }

    bool critical = false;
    if (natural >= critRange) {
        out.hit = true;
        critical = true;
    } else {
        out.hit = out.attackRoll.total >= request.targetDefense;
        critical = out.hit && request.autoCrit;
    }

    if (!out.hit) {
        return GameResult<AttackOutcome>::ok(std::move(out));
    }

    // Only rolled criticals are player-only; autoCrit (e.g. against a
    // paralyzed target) applies to every attacker.
    if (critical && !request.autoCrit && registry_->config().playerOnlyCriticals &&
        !request.attackerIsPlayer) {
        critical = false;
    }
    out.criticalHit = critical;

    auto damage = dice_.rollDamage(request.damageNotation, request.damageModifier, critical);
    if (!damage) {
        return GameResult<AttackOutcome>::err(damage.error());
    }
    out.damage = std::move(damage).value();
    out.damageType = request.damageType;

    if (critical) {
        TCC_LOG_INFO(LogCategory::Rules,
                     "critical hit: natural " + std::to_string(natural) + " for " +
                         std::to_string(out.damage->total) + " damage");
    }
    return GameResult<AttackOutcome>::ok(std::move(out));
}

SavingThrowOutcome ResolutionEngine::resolveSavingThrow(const SaveRequest& request) {
    SavingThrowOutcome out;
    out.dc = request.dc;

    if (request.autoFail || request.autoSucceed) {
        // Synthetic face; not a natural roll.
        const int32_t face = request.autoFail ? 1 : 20;
        out.roll.rolls.push_back(face);
        out.roll.baseRoll = face;
        out.roll.modifier = request.modifier;
        out.roll.total = face + request.modifier;
        out.success = !request.autoFail;
        return out;
    }

    out.roll = dice_.rollD20(request.modifier, request.advantage, request.disadvantage);
    out.success = out.roll.total >= request.dc;
    return out;
}

GameResult<AttackOutcome> ResolutionEngine::resolveWeaponAttack(std::string_view weaponId,
                                                                const AttackerProfile& attacker,
                                                                int32_t targetDefense,
                                                                bool advantage,
                                                                bool disadvantage) {
    const WeaponDescriptor* weapon = registry_->weapon(weaponId);
    if (weapon == nullptr) {
        return GameResult<AttackOutcome>::err(
            GameError(ErrorCode::UnknownWeapon, "unknown weapon: " + std::string(weaponId)));
    }

    int32_t abilityMod = attacker.strengthModifier;
    int32_t bonus = 0;
    if (weapon->ranged) {
        abilityMod = attacker.dexterityModifier;
        bonus = CombatMath::rangedAttackBonus(attacker.dexterityModifier,
                                              attacker.proficiencyBonus, attacker.proficient);
    } else {
        if (weapon->finesse) {
            abilityMod = std::max(attacker.strengthModifier, attacker.dexterityModifier);
        }
        bonus = CombatMath::meleeAttackBonus(attacker.strengthModifier,
                                             attacker.proficiencyBonus, attacker.proficient,
                                             weapon->finesse, attacker.dexterityModifier);
    }

    AttackRequest request;
    request.attackBonus = bonus;
    request.targetDefense = targetDefense;
    request.damageNotation = weapon->damageNotation;
    request.damageModifier = abilityMod;
    request.damageType = weapon->damageType;
    request.advantage = advantage;
    request.disadvantage = disadvantage;
    request.critRange = attacker.critRange;
    request.attackerIsPlayer = attacker.isPlayer;
    return resolveAttack(request);
}

D20Outcome ResolutionEngine::rollAbilityCheck(int32_t modifier, bool advantage,
                                              bool disadvantage) {
    return dice_.rollD20(modifier, advantage, disadvantage);
}

int32_t ResolutionEngine::rollInitiative(int32_t dexterityModifier) {
    return dice_.rollD20(dexterityModifier).total;
}

} // namespace tcc::rules
