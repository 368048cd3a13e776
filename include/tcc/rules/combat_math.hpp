#pragma once

/// @file combat_math.hpp
/// @brief Deterministic combat arithmetic: HP changes, modifiers, AC.
///
/// Nothing here rolls dice. Inputs that would be caller bugs (negative
/// damage, negative healing) are clamped to zero.

#include <cstdint>
#include <optional>
#include <string_view>

#include "tcc/foundation/game_result.hpp"

namespace tcc::rules {

using foundation::GameResult;

/// How a creature is affected by one damage type.
struct DamageTraits {
    bool resistance = false;
    bool vulnerability = false;
    bool immunity = false;
};

struct DamageApplication {
    int32_t newHp = 0;
    int32_t actualDamage = 0;  ///< After immunity / resistance / vulnerability
    bool unconscious = false;  ///< newHp == 0
    int32_t overflow = 0;      ///< Damage left over past 0 HP, for massive damage
};

struct HealingApplication {
    int32_t newHp = 0;
    int32_t actualHealing = 0;
};

/// Parsed armor-class formula from rule data.
///
/// | Text                          | base | addsDex | dexCap | shield |
/// |-------------------------------|------|---------|--------|--------|
/// | "16"                          | 16   | no      | -      | no     |
/// | "11 + Dex modifier"           | 11   | yes     | -      | no     |
/// | "12 + Dex modifier (max 2)"   | 12   | yes     | 2      | no     |
/// | "+2"                          | 2    | no      | -      | yes    |
struct ArmorClassFormula {
    int32_t base = 10;
    bool addsDex = true;
    std::optional<int32_t> dexCap;
    bool shield = false;

    bool operator==(const ArmorClassFormula&) const = default;
};

class CombatMath {
public:
    CombatMath() = delete;

    /// Immunity zeroes the damage; resistance halves it (floor) and
    /// vulnerability doubles it; both together cancel. HP floors at 0.
    [[nodiscard]] static DamageApplication applyDamage(int32_t currentHp, int32_t maxHp,
                                                       int32_t damage,
                                                       const DamageTraits& traits = {});

    /// Healing caps at @p maxHp.
    [[nodiscard]] static HealingApplication applyHealing(int32_t currentHp, int32_t maxHp,
                                                         int32_t healing);

    /// floor((score - 10) / 2).
    [[nodiscard]] static constexpr int32_t abilityModifier(int32_t score) noexcept {
        const int32_t diff = score - 10;
        return diff >= 0 ? diff / 2 : -((1 - diff) / 2);
    }

    /// +2 at levels 1-4 rising by one every four levels; levels below 1
    /// count as 1.
    [[nodiscard]] static constexpr int32_t proficiencyBonus(int32_t level) noexcept {
        return level < 1 ? 2 : 2 + (level - 1) / 4;
    }

    /// Total AC from a body-armor formula, an optional shield and flat bonuses.
    [[nodiscard]] static int32_t armorClass(const ArmorClassFormula& armor,
                                            int32_t dexModifier,
                                            const std::optional<ArmorClassFormula>& shield = {},
                                            int32_t otherBonuses = 0);

    /// Parse an armor-class string. Unrecognised text is InvalidArmorClass.
    static GameResult<ArmorClassFormula> parseArmorClass(std::string_view text);

    [[nodiscard]] static constexpr int32_t spellSaveDc(int32_t abilityMod,
                                                       int32_t proficiency) noexcept {
        return 8 + proficiency + abilityMod;
    }

    [[nodiscard]] static constexpr int32_t spellAttackBonus(int32_t abilityMod,
                                                            int32_t proficiency) noexcept {
        return proficiency + abilityMod;
    }

    /// Finesse weapons use the better of Strength and Dexterity.
    [[nodiscard]] static int32_t meleeAttackBonus(int32_t strMod, int32_t proficiency,
                                                  bool proficient = true,
                                                  bool finesse = false,
                                                  int32_t dexMod = 0,
                                                  int32_t otherBonuses = 0);

    [[nodiscard]] static int32_t rangedAttackBonus(int32_t dexMod, int32_t proficiency,
                                                   bool proficient = true,
                                                   int32_t otherBonuses = 0);
};

} // namespace tcc::rules
