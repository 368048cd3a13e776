#pragma once

/// @file resolution_engine.hpp
/// @brief Attack, saving-throw and check resolution.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "tcc/foundation/game_result.hpp"
#include "tcc/rules/dice.hpp"
#include "tcc/rules/rules_registry.hpp"

namespace tcc::rules {

struct AttackRequest {
    int32_t attackBonus = 0;
    int32_t targetDefense = 10;
    std::string damageNotation;
    int32_t damageModifier = 0;
    std::string damageType;
    bool advantage = false;
    bool disadvantage = false;
    int32_t critRange = 20;         ///< Lowest natural roll that crits
    bool autoCrit = false;          ///< Any hit crits, even under player-only criticals
    bool attackerIsPlayer = true;
};

struct AttackOutcome {
    bool hit = false;
    bool criticalHit = false;       ///< Damage dice were doubled
    bool criticalMiss = false;
    D20Outcome attackRoll;
    int32_t targetDefense = 0;
    std::optional<DamageOutcome> damage;
    std::optional<std::string> damageType;

    [[nodiscard]] int32_t totalDamage() const noexcept {
        return hit && damage ? damage->total : 0;
    }
};

struct SaveRequest {
    int32_t modifier = 0;
    int32_t dc = 10;
    bool advantage = false;
    bool disadvantage = false;
    bool autoFail = false;
    bool autoSucceed = false;
};

struct SavingThrowOutcome {
    bool success = false;
    D20Outcome roll;
    int32_t dc = 0;
};

/// Stat snapshot used by resolveWeaponAttack().
struct AttackerProfile {
    int32_t strengthModifier = 0;
    int32_t dexterityModifier = 0;
    int32_t proficiencyBonus = 2;
    bool proficient = true;
    bool isPlayer = true;
    int32_t critRange = 20;
};

/// Resolves every dice-driven action against a shared RulesRegistry.
///
/// Holds the registry by shared ownership and the RandomSource by
/// reference; the source must outlive the engine.
class ResolutionEngine {
public:
    ResolutionEngine(std::shared_ptr<const RulesRegistry> registry, RandomSource& source);

    [[nodiscard]] const RulesRegistry& registry() const noexcept { return *registry_; }
    [[nodiscard]] Dice& dice() noexcept { return dice_; }

    D20Outcome rollD20(int32_t modifier = 0, bool advantage = false, bool disadvantage = false);

    GameResult<DamageOutcome> rollDamage(std::string_view notation, int32_t extraModifier = 0,
                                         bool critical = false);

    /// A natural 1 always misses. A natural roll at or above critRange
    /// (clamped to [2, 20]) always hits and crits, except that with
    /// playerOnlyCriticals a non-player's critical deals ordinary damage
    /// and is not reported as a critical.
    ///
    /// @return InvalidDiceNotation / InvalidDieSize for bad damage text.
    GameResult<AttackOutcome> resolveAttack(const AttackRequest& request);

    /// autoFail / autoSucceed skip the roll but still report a die face
    /// (1 and 20) so the record reads consistently.
    SavingThrowOutcome resolveSavingThrow(const SaveRequest& request);

    /// Attack with a registered weapon; ability modifier and proficiency
    /// come from @p attacker, finesse picks the better of STR and DEX,
    /// ranged weapons use DEX.
    ///
    /// @return UnknownWeapon if @p weaponId is not registered.
    GameResult<AttackOutcome> resolveWeaponAttack(std::string_view weaponId,
                                                  const AttackerProfile& attacker,
                                                  int32_t targetDefense,
                                                  bool advantage = false,
                                                  bool disadvantage = false);

    D20Outcome rollAbilityCheck(int32_t modifier, bool advantage = false,
                                bool disadvantage = false);

    /// d20 + Dexterity modifier.
    int32_t rollInitiative(int32_t dexterityModifier);

private:
    std::shared_ptr<const RulesRegistry> registry_;
    Dice dice_;
};

} // namespace tcc::rules
