/// @file death_saves.cpp
/// @brief DeathSaves implementation.

#include "tcc/status/death_saves.hpp"

#include <algorithm>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::status {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::LogCategory;

namespace {

DeathSaveState resetCounters(DeathSaveState state) {
    state.successes = 0;
    state.failures = 0;
    return state;
}

std::string tally(const DeathSaveState& state) {
    return std::to_string(state.successes) + " successes, " +
           std::to_string(state.failures) + " failures";
}

// Adds failures and marks the state dead on the third.
DeathSaveState addFailures(DeathSaveState state, int32_t count) {
    state.failures = std::clamp(state.failures + count, 0, DeathSaves::kMaxMarks);
    if (state.failures >= DeathSaves::kMaxMarks) {
        state.dead = true;
        state.stable = false;
    }
    return state;
}

} // namespace

std::string_view deathSaveOutcomeName(DeathSaveOutcome outcome) noexcept {
    switch (outcome) {
        case DeathSaveOutcome::Continue:   return "continue";
        case DeathSaveOutcome::Stabilized: return "stabilized";
        case DeathSaveOutcome::Revived:    return "revived";
        case DeathSaveOutcome::Dead:       return "dead";
    }
    return "unknown";
}

std::string_view dyingStatusName(DyingStatus status) noexcept {
    switch (status) {
        case DyingStatus::Dying:  return "dying";
        case DyingStatus::Stable: return "stable";
        case DyingStatus::Dead:   return "dead";
    }
    return "unknown";
}

// ── Death saving throws ─────────────────────────────────────────────────

DeathSaveResult DeathSaves::applyRoll(const DeathSaveState& input,
                                      const rules::D20Outcome& roll) {
    const DeathSaveState state = normalize(input);
    DeathSaveResult result;
    result.roll = roll;
    result.state = state;

    if (state.dead) {
        result.outcome = DeathSaveOutcome::Dead;
        result.description = "creature is already dead";
        return result;
    }
    if (state.stable) {
        result.outcome = DeathSaveOutcome::Stabilized;
        result.description = "creature is stable and makes no death saves";
        return result;
    }

    if (roll.natural20) {
        result.state = resetCounters(state);
        result.success = true;
        result.outcome = DeathSaveOutcome::Revived;
        result.description = "natural 20: regains 1 HP and consciousness";
        TCC_LOG_INFO(LogCategory::Status, result.description);
        return result;
    }

    if (roll.natural1) {
        result.state = addFailures(state, 2);
        result.description = "natural 1: two failures (" + tally(result.state) + ")";
    } else if (roll.total >= kSaveDc) {
        result.success = true;
        result.state.successes = std::min(kMaxMarks, state.successes + 1);
        if (result.state.successes >= kMaxMarks) {
            result.state = resetCounters(result.state);
            result.state.stable = true;
            result.outcome = DeathSaveOutcome::Stabilized;
            result.description = "third success: creature is stable";
            TCC_LOG_INFO(LogCategory::Status, result.description);
            return result;
        }
        result.description = "death save succeeded (" + tally(result.state) + ")";
    } else {
        result.state = addFailures(state, 1);
        result.description = "death save failed (" + tally(result.state) + ")";
    }

    if (result.state.dead) {
        result.outcome = DeathSaveOutcome::Dead;
        result.description = "third failure: creature has died";
        TCC_LOG_INFO(LogCategory::Status, result.description);
    }
    return result;
}

DeathSaveResult DeathSaves::roll(const DeathSaveState& state, rules::Dice& dice,
                                 int32_t modifier, bool advantage, bool disadvantage) {
    return applyRoll(state, dice.rollD20(modifier, advantage, disadvantage));
}

// ── Damage and healing at 0 HP ──────────────────────────────────────────

DamageWhileDyingResult DeathSaves::takeDamage(const DeathSaveState& input, bool critical) {
    const DeathSaveState state = normalize(input);
    DamageWhileDyingResult result;
    result.state = state;
    if (state.dead) {
        result.died = true;
        result.description = "creature is already dead";
        return result;
    }

    result.failuresAdded = critical ? 2 : 1;
    DeathSaveState next = state;
    next.stable = false;
    result.state = addFailures(next, result.failuresAdded);
    result.died = result.state.dead;
    result.description = result.died
        ? "damage at 0 HP: creature has died"
        : "damage at 0 HP: " + std::to_string(result.failuresAdded) + " failure(s) (" +
              tally(result.state) + ")";
    return result;
}

DamageWhileDyingResult DeathSaves::takeDamage(const DeathSaveState& state, bool critical,
                                              int32_t overflow, int32_t maxHp,
                                              const rules::RulesConfig& rules) {
    if (state.dead || !isMassiveDamage(overflow, maxHp, rules)) {
        return takeDamage(state, critical);
    }

    DamageWhileDyingResult result;
    result.state = resetCounters(state);
    result.state.failures = kMaxMarks;
    result.state.stable = false;
    result.state.dead = true;
    result.died = true;
    result.massiveDamage = true;
    result.description = "massive damage: " + std::to_string(overflow) +
                         " past 0 HP against " + std::to_string(maxHp) +
                         " max HP, creature dies outright";
    TCC_LOG_INFO(LogCategory::Status, result.description);
    return result;
}

HealWhileDyingResult DeathSaves::heal(const DeathSaveState& state, int32_t amount) {
    HealWhileDyingResult result;
    result.state = state;
    if (state.dead) {
        result.description = "cannot heal: creature is dead";
        return result;
    }
    result.state = DeathSaveState{};
    result.regainedConsciousness = true;
    result.description = "healed for " + std::to_string(std::max(0, amount)) +
                         " HP, creature regains consciousness";
    return result;
}

// ── Stabilization ───────────────────────────────────────────────────────

StabilizationResult DeathSaves::stabilize(const DeathSaveState& input,
                                          const StabilizationMethod& method) {
    const DeathSaveState state = normalize(input);
    StabilizationResult result;
    result.state = state;
    if (state.dead) {
        result.description = "cannot stabilize a dead creature";
        return result;
    }
    if (state.stable) {
        result.success = true;
        result.description = "creature is already stable";
        return result;
    }

    if (const auto* automatic = std::get_if<AutomaticStabilization>(&method)) {
        result.success = true;
        result.description = automatic->source + " stabilizes the creature";
    } else {
        const auto& check = std::get<MedicineCheck>(method);
        result.success = check.total >= kMedicineDc;
        result.description = "Medicine check " + std::to_string(check.total) + " vs DC " +
                             std::to_string(kMedicineDc) +
                             (result.success ? ": creature is stable"
                                             : ": creature is still dying");
    }

    if (result.success) {
        result.state = resetCounters(state);
        result.state.stable = true;
    }
    return result;
}

rules::D20Outcome DeathSaves::rollMedicineCheck(rules::Dice& dice, int32_t wisdomModifier,
                                                int32_t proficiencyBonus, bool proficient) {
    return dice.rollD20(wisdomModifier + (proficient ? proficiencyBonus : 0));
}

// ── Inspection ──────────────────────────────────────────────────────────

DeathSaveSummary DeathSaves::status(const DeathSaveState& input) {
    const DeathSaveState state = normalize(input);
    DeathSaveSummary summary;
    summary.successes = state.successes;
    summary.failures = state.failures;
    if (state.dead) {
        summary.status = DyingStatus::Dead;
        summary.description = "dead";
    } else if (state.stable) {
        summary.status = DyingStatus::Stable;
        summary.description = "unconscious but stable";
    } else if (state.successes == 0 && state.failures == 0) {
        summary.description = "dying: no death saves yet";
    } else {
        summary.status = DyingStatus::Dying;
        summary.description = "dying: " + tally(state);
    }
    return summary;
}

DeathSaveState DeathSaves::normalize(const DeathSaveState& state) {
    DeathSaveState out = state;
    out.successes = std::clamp(state.successes, 0, kMaxMarks);
    out.failures = std::clamp(state.failures, 0, kMaxMarks);
    if (out != state) {
        TCC_LOG_WARN(LogCategory::Status, "death save counters clamped from (" + tally(state) +
                                              ") to (" + tally(out) + ")");
    }
    return out;
}

GameResult<DeathSaveState> DeathSaves::validate(const DeathSaveState& state) {
    const bool successesOk = state.successes >= 0 && state.successes < kMaxMarks;
    const int32_t failureCap = state.dead ? kMaxMarks : kMaxMarks - 1;
    const bool failuresOk = state.failures >= 0 && state.failures <= failureCap;
    if (!successesOk || !failuresOk || (state.dead && state.stable)) {
        return GameResult<DeathSaveState>::err(
            GameError(ErrorCode::CorruptState, "invalid death save state: " + tally(state)));
    }
    return GameResult<DeathSaveState>::ok(state);
}

} // namespace tcc::status
