/// @file exhaustion.cpp
/// @brief Exhaustion level transitions and the cumulative effect table.

#include "tcc/status/exhaustion.hpp"

#include <algorithm>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::status {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::LogCategory;

namespace {

// Out-of-range levels are caller bugs; pull them back into [0, 6].
int32_t clampLevel(int32_t level) {
    const int32_t clamped = std::clamp(level, 0, Exhaustion::kMaxLevel);
    if (clamped != level) {
        TCC_LOG_WARN(LogCategory::Status, "exhaustion level clamped from " +
                                              std::to_string(level) + " to " +
                                              std::to_string(clamped));
    }
    return clamped;
}

} // namespace

ExhaustionChange Exhaustion::gain(const ExhaustionState& state, int32_t levels) {
    ExhaustionChange change;
    change.oldLevel = clampLevel(state.level);
    // Compare against the headroom so a huge @p levels cannot overflow.
    const int32_t headroom = kMaxLevel - change.oldLevel;
    change.state.level = change.oldLevel + std::clamp(levels, 0, headroom);
    change.levelsChanged = change.state.level - change.oldLevel;
    change.died = change.state.level >= kMaxLevel;

    if (change.died) {
        change.message = "creature has died from exhaustion";
        if (change.levelsChanged > 0) {
            TCC_LOG_INFO(LogCategory::Status, change.message);
        }
    } else if (change.levelsChanged > 0) {
        change.message = "gained " + std::to_string(change.levelsChanged) +
                         " exhaustion level(s), now at level " +
                         std::to_string(change.state.level);
    } else {
        change.message = "exhaustion unchanged at level " + std::to_string(change.state.level);
    }
    return change;
}

ExhaustionChange Exhaustion::reduce(const ExhaustionState& state, int32_t levels) {
    ExhaustionChange change;
    change.oldLevel = clampLevel(state.level);
    change.state.level = change.oldLevel;

    if (change.oldLevel >= kMaxLevel) {
        change.died = true;
        change.message = "exhaustion death cannot be reduced";
        return change;
    }

    change.state.level = change.oldLevel - std::clamp(levels, 0, change.oldLevel);
    change.levelsChanged = change.oldLevel - change.state.level;
    if (change.state.level == 0 && change.levelsChanged > 0) {
        change.message = "fully recovered from exhaustion";
    } else if (change.levelsChanged > 0) {
        change.message = "reduced exhaustion to level " + std::to_string(change.state.level);
    } else {
        change.message = "no exhaustion to reduce";
    }
    return change;
}

ExhaustionChange Exhaustion::recoverOnRest(const ExhaustionState& state, bool hasFoodAndDrink) {
    if (!hasFoodAndDrink) {
        ExhaustionChange change;
        change.oldLevel = clampLevel(state.level);
        change.state.level = change.oldLevel;
        change.died = change.oldLevel >= kMaxLevel;
        change.message = "no recovery without food and drink";
        return change;
    }
    return reduce(state, 1);
}

ExhaustionModifiers Exhaustion::modifiers(int32_t level) noexcept {
    ExhaustionModifiers mods;
    mods.disadvantageOnAbilityChecks = level >= 1;
    mods.disadvantageOnAttacks = level >= 3;
    mods.disadvantageOnSaves = level >= 3;
    if (level >= 5) {
        mods.speedDivisor = 0;
    } else if (level >= 2) {
        mods.speedDivisor = 2;
    }
    mods.maxHpDivisor = level >= 4 ? 2 : 1;
    mods.dead = level >= kMaxLevel;
    return mods;
}

bool Exhaustion::hasDisadvantage(int32_t level, RollKind kind) noexcept {
    const auto mods = modifiers(level);
    switch (kind) {
        case RollKind::AbilityCheck: return mods.disadvantageOnAbilityChecks;
        case RollKind::AttackRoll:   return mods.disadvantageOnAttacks;
        case RollKind::SavingThrow:  return mods.disadvantageOnSaves;
    }
    return false;
}

int32_t Exhaustion::applySpeed(int32_t level, int32_t baseSpeed) noexcept {
    const auto mods = modifiers(level);
    if (mods.speedDivisor == 0) {
        return 0;
    }
    return std::max(0, baseSpeed) / mods.speedDivisor;
}

int32_t Exhaustion::applyMaxHp(int32_t level, int32_t baseMaxHp) noexcept {
    const auto mods = modifiers(level);
    return std::max(1, baseMaxHp / mods.maxHpDivisor);
}

std::string_view Exhaustion::describe(int32_t level) noexcept {
    switch (std::clamp(level, 0, kMaxLevel)) {
        case 0: return "Not exhausted";
        case 1: return "Disadvantage on ability checks";
        case 2: return "Disadvantage on ability checks, speed halved";
        case 3: return "Disadvantage on ability checks, attacks, and saves; speed halved";
        case 4: return "Disadvantage on ability checks, attacks, and saves; speed halved; "
                       "max HP halved";
        case 5: return "Disadvantage on ability checks, attacks, and saves; speed 0; "
                       "max HP halved";
        default: return "Death";
    }
}

GameResult<ExhaustionState> Exhaustion::validate(const ExhaustionState& state) {
    if (state.level < 0 || state.level > kMaxLevel) {
        return GameResult<ExhaustionState>::err(
            GameError(ErrorCode::CorruptState,
                      "exhaustion level out of range: " + std::to_string(state.level)));
    }
    return GameResult<ExhaustionState>::ok(state);
}

} // namespace tcc::status
