/// @file combat_math.cpp
/// @brief CombatMath implementation.

#include "tcc/rules/combat_math.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace tcc::rules {

using foundation::ErrorCode;
using foundation::GameError;

namespace {

// Consumes a run of digits from the front of @p text.
bool takeNumber(std::string_view& text, int32_t& out) {
    std::size_t len = 0;
    while (len < text.size() && std::isdigit(static_cast<unsigned char>(text[len]))) {
        ++len;
    }
    if (len == 0) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + len, out);
    if (ec != std::errc()) {
        return false;
    }
    text.remove_prefix(len);
    return true;
}

bool takeLiteral(std::string_view& text, std::string_view literal) {
    if (text.substr(0, literal.size()) != literal) {
        return false;
    }
    text.remove_prefix(literal.size());
    return true;
}

} // namespace

DamageApplication CombatMath::applyDamage(int32_t currentHp, int32_t maxHp, int32_t damage,
                                          const DamageTraits& traits) {
    DamageApplication out;
    const int32_t hp = std::clamp(currentHp, 0, std::max(0, maxHp));
    const int32_t incoming = std::max(0, damage);

    int32_t actual = incoming;
    if (traits.immunity) {
        actual = 0;
    } else if (traits.resistance && !traits.vulnerability) {
        actual = incoming / 2;
    } else if (traits.vulnerability && !traits.resistance) {
        actual = incoming * 2;
    }

    out.actualDamage = actual;
    out.newHp = std::max(0, hp - actual);
    out.overflow = std::max(0, actual - hp);
    out.unconscious = out.newHp == 0;
    return out;
}

HealingApplication CombatMath::applyHealing(int32_t currentHp, int32_t maxHp, int32_t healing) {
    HealingApplication out;
    const int32_t cap = std::max(0, maxHp);
    const int32_t hp = std::clamp(currentHp, 0, cap);
    out.newHp = std::min(cap, hp + std::max(0, healing));
    out.actualHealing = out.newHp - hp;
    return out;
}

int32_t CombatMath::armorClass(const ArmorClassFormula& armor, int32_t dexModifier,
                               const std::optional<ArmorClassFormula>& shield,
                               int32_t otherBonuses) {
    int32_t dex = 0;
    if (armor.addsDex) {
        dex = armor.dexCap ? std::min(dexModifier, *armor.dexCap) : dexModifier;
    }
    const int32_t shieldBonus = shield ? shield->base : 0;
    return armor.base + dex + shieldBonus + otherBonuses;
}

GameResult<ArmorClassFormula> CombatMath::parseArmorClass(std::string_view text) {
    std::string compact;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    auto invalid = [&]() {
        return GameResult<ArmorClassFormula>::err(
            GameError(ErrorCode::InvalidArmorClass,
                      "Unrecognised armor class '" + std::string(text) + "'"));
    };

    std::string_view rest(compact);
    ArmorClassFormula formula;

    if (takeLiteral(rest, "+")) {
        if (!takeNumber(rest, formula.base) || !rest.empty()) {
            return invalid();
        }
        formula.addsDex = false;
        formula.shield = true;
        return GameResult<ArmorClassFormula>::ok(formula);
    }

    if (!takeNumber(rest, formula.base)) {
        return invalid();
    }
    if (rest.empty()) {
        formula.addsDex = false;
        return GameResult<ArmorClassFormula>::ok(formula);
    }
    if (!takeLiteral(rest, "+dexmodifier")) {
        return invalid();
    }
    formula.addsDex = true;
    if (rest.empty()) {
        return GameResult<ArmorClassFormula>::ok(formula);
    }

    int32_t cap = 0;
    if (!takeLiteral(rest, "(max") || !takeNumber(rest, cap) || !takeLiteral(rest, ")") ||
        !rest.empty()) {
        return invalid();
    }
    formula.dexCap = cap;
    return GameResult<ArmorClassFormula>::ok(formula);
}

int32_t CombatMath::meleeAttackBonus(int32_t strMod, int32_t proficiency, bool proficient,
                                     bool finesse, int32_t dexMod, int32_t otherBonuses) {
    const int32_t ability = finesse ? std::max(strMod, dexMod) : strMod;
    return ability + (proficient ? proficiency : 0) + otherBonuses;
}

int32_t CombatMath::rangedAttackBonus(int32_t dexMod, int32_t proficiency, bool proficient,
                                      int32_t otherBonuses) {
    return dexMod + (proficient ? proficiency : 0) + otherBonuses;
}

} // namespace tcc::rules
