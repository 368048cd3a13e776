#pragma once

/// @file dice.hpp
/// @brief Dice notation, d20 rolls and damage rolls.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tcc/foundation/game_result.hpp"
#include "tcc/rules/random_source.hpp"

namespace tcc::rules {

using foundation::GameResult;

/// One parsed group of a notation string.
///
/// A negative count subtracts the group. A pure flat notation ("5")
/// parses to a single {0, 0, 5} term.
struct DiceTerm {
    int32_t count = 0;
    int32_t sides = 0;
    int32_t flat = 0;

    bool operator==(const DiceTerm&) const = default;
};

/// A d20 roll after advantage / disadvantage selection.
struct D20Outcome {
    std::vector<int32_t> rolls;  ///< Two faces only with uncancelled adv/dis
    int32_t modifier = 0;
    int32_t total = 0;
    int32_t baseRoll = 0;        ///< Face the total was built from
    bool advantage = false;      ///< Effective, after cancellation
    bool disadvantage = false;
    bool natural20 = false;      ///< Judged on baseRoll, ignoring modifier
    bool natural1 = false;

    /// Outcome of a single known face, e.g. for replaying a persisted roll.
    [[nodiscard]] static D20Outcome fromFace(int32_t face, int32_t modifier = 0);
};

struct DamageOutcome {
    std::vector<int32_t> rolls;  ///< Signed faces, in notation order
    int32_t flatModifier = 0;    ///< Notation flats plus the extra modifier
    int32_t total = 0;           ///< max(1, sum(rolls) + flatModifier)
    std::string notation;
    bool critical = false;       ///< Dice count was doubled
};

/// Dice roller bound to a RandomSource.
///
/// Example:
/// @code
///   SeededRandomSource rng(42);
///   Dice dice(rng);
///   auto hit = dice.rollD20(5, true, false);
///   auto dmg = dice.rollDamage("2d6+3", 0, hit.natural20);
/// @endcode
class Dice {
public:
    static constexpr int32_t kMaxDiceCount = 100;
    /// Bound on each flat term and on their running sum.
    static constexpr int32_t kMaxFlatModifier = 10000;

    explicit Dice(RandomSource& source) : source_(&source) {}

    /// @return a face in [1, sides], or InvalidDieSize when sides < 1.
    GameResult<int32_t> rollDie(int32_t sides);

    /// Advantage and disadvantage together cancel to a single die.
    D20Outcome rollD20(int32_t modifier = 0, bool advantage = false, bool disadvantage = false);

    /// On a critical every dice group rolls twice as many dice; flats are
    /// not doubled. The total is floored at 1.
    GameResult<DamageOutcome> rollDamage(std::string_view notation,
                                         int32_t extraModifier = 0,
                                         bool critical = false);

    /// Parse "2d6+3", "1d8 + 1d6", "d20", "3d4-1", "5".
    ///
    /// Case-insensitive; spaces are ignored. Flat terms are summed onto
    /// the last dice group. Fails with InvalidDiceNotation on malformed
    /// text or a die count outside [1, 100], and with InvalidDieSize on a
    /// die other than d2, d3, d4, d6, d8, d10, d12, d20, d100.
    static GameResult<std::vector<DiceTerm>> parseDiceNotation(std::string_view notation);

    [[nodiscard]] static bool isSupportedDieSize(int32_t sides) noexcept;

    [[nodiscard]] RandomSource& source() noexcept { return *source_; }

private:
    RandomSource* source_;
};

} // namespace tcc::rules
