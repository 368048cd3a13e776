#pragma once

/// @file exhaustion.hpp
/// @brief Six-level exhaustion with cumulative effects.
///
/// | Level | Adds                                   |
/// |-------|----------------------------------------|
/// | 1     | Disadvantage on ability checks         |
/// | 2     | Speed halved                           |
/// | 3     | Disadvantage on attack rolls and saves |
/// | 4     | Hit point maximum halved               |
/// | 5     | Speed 0                                |
/// | 6     | Death (terminal)                       |

#include <cstdint>
#include <string>
#include <string_view>

#include "tcc/foundation/game_result.hpp"

namespace tcc::status {

using foundation::GameResult;

struct ExhaustionState {
    int32_t level = 0;

    bool operator==(const ExhaustionState&) const = default;
};

enum class RollKind : uint8_t {
    AbilityCheck,
    AttackRoll,
    SavingThrow
};

/// All effects active at a level, accumulated over every lower level.
struct ExhaustionModifiers {
    bool disadvantageOnAbilityChecks = false;
    bool disadvantageOnAttacks = false;
    bool disadvantageOnSaves = false;
    int32_t speedDivisor = 1;   ///< 1, 2, or 0 meaning speed is 0
    int32_t maxHpDivisor = 1;   ///< 1 or 2
    bool dead = false;
};

struct ExhaustionChange {
    ExhaustionState state;
    int32_t oldLevel = 0;
    int32_t levelsChanged = 0;  ///< Always non-negative
    bool died = false;
    std::string message;
};

/// Thread safety: None (stateless).
class Exhaustion {
public:
    static constexpr int32_t kMaxLevel = 6;

    Exhaustion() = delete;

    /// Raise by @p levels, clamped at 6. Negative input counts as 0.
    [[nodiscard]] static ExhaustionChange gain(const ExhaustionState& state, int32_t levels = 1);

    /// Lower by @p levels, clamped at 0. Level 6 cannot be reduced.
    [[nodiscard]] static ExhaustionChange reduce(const ExhaustionState& state,
                                                 int32_t levels = 1);

    /// Long rest: one level, only with food and drink.
    [[nodiscard]] static ExhaustionChange recoverOnRest(const ExhaustionState& state,
                                                        bool hasFoodAndDrink);

    [[nodiscard]] static ExhaustionModifiers modifiers(int32_t level) noexcept;

    [[nodiscard]] static bool hasDisadvantage(int32_t level, RollKind kind) noexcept;

    [[nodiscard]] static int32_t applySpeed(int32_t level, int32_t baseSpeed) noexcept;

    /// Halved max HP never drops below 1.
    [[nodiscard]] static int32_t applyMaxHp(int32_t level, int32_t baseMaxHp) noexcept;

    [[nodiscard]] static std::string_view describe(int32_t level) noexcept;

    [[nodiscard]] static GameResult<ExhaustionState> validate(const ExhaustionState& state);
};

} // namespace tcc::status
