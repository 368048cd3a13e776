#pragma once

/// @file death_saves.hpp
/// @brief Death saving throw state machine for creatures at 0 HP.
///
/// States: Dying(successes, failures) -> {Dying, Stable, Revived, Dead}.
/// Every transition is a pure function returning the next state and a
/// result record; the caller owns and stores the state.

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "tcc/foundation/game_result.hpp"
#include "tcc/rules/dice.hpp"
#include "tcc/rules/rules_config.hpp"

namespace tcc::status {

using foundation::GameResult;

/// Persisted death save counters.
///
/// Invariant: successes and failures stay in [0, 3]; once dead is set the
/// state never changes again.
struct DeathSaveState {
    int32_t successes = 0;
    int32_t failures = 0;
    bool stable = false;
    bool dead = false;

    bool operator==(const DeathSaveState&) const = default;
};

enum class DeathSaveOutcome : uint8_t {
    Continue,    ///< Still dying
    Stabilized,  ///< Third success
    Revived,     ///< Natural 20; caller restores at least 1 HP
    Dead
};

enum class DyingStatus : uint8_t {
    Dying,
    Stable,
    Dead
};

[[nodiscard]] std::string_view deathSaveOutcomeName(DeathSaveOutcome outcome) noexcept;
[[nodiscard]] std::string_view dyingStatusName(DyingStatus status) noexcept;

struct DeathSaveResult {
    DeathSaveState state;
    DeathSaveOutcome outcome = DeathSaveOutcome::Continue;
    rules::D20Outcome roll;
    bool success = false;
    std::string description;
};

struct DamageWhileDyingResult {
    DeathSaveState state;
    int32_t failuresAdded = 0;
    bool died = false;
    bool massiveDamage = false;  ///< Killed outright rather than by failures
    std::string description;
};

struct HealWhileDyingResult {
    DeathSaveState state;
    bool regainedConsciousness = false;
    std::string description;
};

/// Stabilization without a roll (Spare the Dying, a healer's kit).
struct AutomaticStabilization {
    std::string source = "healer_kit";
};

/// A Medicine check that was rolled elsewhere.
struct MedicineCheck {
    int32_t total = 0;
};

using StabilizationMethod = std::variant<AutomaticStabilization, MedicineCheck>;

struct StabilizationResult {
    DeathSaveState state;
    bool success = false;
    std::string description;
};

struct DeathSaveSummary {
    DyingStatus status = DyingStatus::Dying;
    int32_t successes = 0;
    int32_t failures = 0;
    std::string description;
};

/// Death save transitions.
///
/// Example:
/// @code
///   DeathSaveState state;
///   auto saved = DeathSaves::roll(state, dice);
///   state = saved.state;
///   if (saved.outcome == DeathSaveOutcome::Revived) {
///       hp = 1;
///   }
/// @endcode
///
/// Thread safety: None (stateless; the caller serializes access to the state).
class DeathSaves {
public:
    static constexpr int32_t kSaveDc = 10;
    static constexpr int32_t kMedicineDc = 10;
    static constexpr int32_t kMaxMarks = 3;

    DeathSaves() = delete;

    /// Apply an already-rolled d20. A natural 20 revives, a natural 1
    /// counts as two failures, otherwise total >= 10 is a success.
    /// Dead and stable states are returned unchanged. Out-of-range
    /// counters are normalized first, as in every transition.
    [[nodiscard]] static DeathSaveResult applyRoll(const DeathSaveState& state,
                                                   const rules::D20Outcome& roll);

    [[nodiscard]] static DeathSaveResult roll(const DeathSaveState& state, rules::Dice& dice,
                                              int32_t modifier = 0, bool advantage = false,
                                              bool disadvantage = false);

    /// One automatic failure, two on a critical hit. Reopens a stable
    /// creature's dying state.
    [[nodiscard]] static DamageWhileDyingResult takeDamage(const DeathSaveState& state,
                                                           bool critical);

    /// takeDamage() plus the massive damage rule: when @p rules enable it
    /// and @p overflow reaches @p maxHp, the creature dies outright.
    [[nodiscard]] static DamageWhileDyingResult takeDamage(const DeathSaveState& state,
                                                           bool critical, int32_t overflow,
                                                           int32_t maxHp,
                                                           const rules::RulesConfig& rules);

    /// Any healing ends dying; the dead stay dead.
    [[nodiscard]] static HealWhileDyingResult heal(const DeathSaveState& state,
                                                   int32_t amount);

    [[nodiscard]] static StabilizationResult stabilize(const DeathSaveState& state,
                                                       const StabilizationMethod& method);

    /// Wisdom (Medicine) check; proficiency adds @p proficiencyBonus.
    [[nodiscard]] static rules::D20Outcome rollMedicineCheck(rules::Dice& dice,
                                                             int32_t wisdomModifier,
                                                             int32_t proficiencyBonus,
                                                             bool proficient);

    /// Damage past 0 HP equal to or above max HP kills outright.
    [[nodiscard]] static constexpr bool isMassiveDamage(int32_t overflow,
                                                        int32_t maxHp) noexcept {
        return maxHp > 0 && overflow >= maxHp;
    }

    /// As above, but always false when massiveDamageInstantDeath is off.
    [[nodiscard]] static constexpr bool isMassiveDamage(int32_t overflow, int32_t maxHp,
                                                        const rules::RulesConfig& rules) noexcept {
        return rules.massiveDamageInstantDeath && isMassiveDamage(overflow, maxHp);
    }

    [[nodiscard]] static DeathSaveSummary status(const DeathSaveState& state);

    /// Clamp counters into [0, 3]; logs when anything had to change.
    [[nodiscard]] static DeathSaveState normalize(const DeathSaveState& state);

    /// Reject persisted state with out-of-range counters (CorruptState).
    [[nodiscard]] static GameResult<DeathSaveState> validate(const DeathSaveState& state);
};

} // namespace tcc::status
