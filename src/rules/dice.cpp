/// @file dice.cpp
/// @brief Dice implementation.

#include "tcc/rules/dice.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::rules {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::LogCategory;

namespace {

constexpr std::array<int32_t, 9> kSupportedDice = {2, 3, 4, 6, 8, 10, 12, 20, 100};

GameError notationError(std::string_view notation, std::string_view detail) {
    return GameError(ErrorCode::InvalidDiceNotation,
                     "Invalid dice notation '" + std::string(notation) + "': " +
                         std::string(detail),
                     std::string(notation));
}

// Parses an unsigned decimal that fills @p text entirely.
bool parseNumber(std::string_view text, int32_t& out) {
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

} // namespace

// ── D20Outcome ─────────────────────────────────────────────────────────

D20Outcome D20Outcome::fromFace(int32_t face, int32_t modifier) {
    D20Outcome out;
    out.rolls.push_back(face);
    out.baseRoll = face;
    out.modifier = modifier;
    out.total = face + modifier;
    out.natural20 = face == 20;
    out.natural1 = face == 1;
    return out;
}

// ── Dice ───────────────────────────────────────────────────────────────

bool Dice::isSupportedDieSize(int32_t sides) noexcept {
    return std::find(kSupportedDice.begin(), kSupportedDice.end(), sides) !=
           kSupportedDice.end();
}

GameResult<int32_t> Dice::rollDie(int32_t sides) {
    if (sides < 1) {
        return GameResult<int32_t>::err(
            GameError(ErrorCode::InvalidDieSize, "Invalid die: d" + std::to_string(sides)));
    }
    return GameResult<int32_t>::ok(source_->roll(sides));
}

D20Outcome Dice::rollD20(int32_t modifier, bool advantage, bool disadvantage) {
    if (advantage && disadvantage) {
        advantage = false;
        disadvantage = false;
    }

    D20Outcome out;
    out.rolls.push_back(source_->roll(20));
    if (advantage || disadvantage) {
        out.rolls.push_back(source_->roll(20));
    }

    if (advantage) {
        out.baseRoll = std::max(out.rolls[0], out.rolls[1]);
    } else if (disadvantage) {
        out.baseRoll = std::min(out.rolls[0], out.rolls[1]);
    } else {
        out.baseRoll = out.rolls[0];
    }

    out.modifier = modifier;
    out.total = out.baseRoll + modifier;
    out.advantage = advantage;
    out.disadvantage = disadvantage;
    out.natural20 = out.baseRoll == 20;
    out.natural1 = out.baseRoll == 1;
    return out;
}

GameResult<std::vector<DiceTerm>> Dice::parseDiceNotation(std::string_view notation) {
    using Result = GameResult<std::vector<DiceTerm>>;

    std::string text;
    text.reserve(notation.size());
    for (char c : notation) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            text.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (text.empty()) {
        return Result::err(notationError(notation, "empty"));
    }

    std::vector<DiceTerm> terms;
    int32_t flatSum = 0;
    std::size_t pos = 0;

    while (pos < text.size()) {
        int32_t sign = 1;
        if (text[pos] == '+' || text[pos] == '-') {
            sign = text[pos] == '-' ? -1 : 1;
            ++pos;
        }
        const std::size_t end = text.find_first_of("+-", pos);
        const std::string_view token =
            std::string_view(text).substr(pos, end == std::string::npos ? std::string::npos
                                                                        : end - pos);
        if (token.empty()) {
            return Result::err(notationError(notation, "dangling operator"));
        }

        const std::size_t d = token.find('d');
        if (d == std::string_view::npos) {
            int32_t flat = 0;
            if (!parseNumber(token, flat)) {
                return Result::err(notationError(notation, "bad term '" + std::string(token) + "'"));
            }
            if (flat > kMaxFlatModifier) {
                return Result::err(notationError(notation, "flat modifier out of range"));
            }
            flatSum += sign * flat;
            if (flatSum > kMaxFlatModifier || flatSum < -kMaxFlatModifier) {
                return Result::err(notationError(notation, "flat modifier out of range"));
            }
        } else {
            int32_t count = 1;
            int32_t sides = 0;
            if (d > 0 && !parseNumber(token.substr(0, d), count)) {
                return Result::err(notationError(notation, "bad term '" + std::string(token) + "'"));
            }
            if (!parseNumber(token.substr(d + 1), sides)) {
                return Result::err(notationError(notation, "bad term '" + std::string(token) + "'"));
            }
            if (count < 1 || count > kMaxDiceCount) {
                return Result::err(notationError(notation, "die count out of range"));
            }
            if (!isSupportedDieSize(sides)) {
                return Result::err(GameError(ErrorCode::InvalidDieSize,
                                             "Unsupported die size d" + std::to_string(sides) +
                                                 " in '" + std::string(notation) + "'",
                                             std::string(notation)));
            }
            terms.push_back(DiceTerm{sign * count, sides, 0});
        }

        pos = end == std::string::npos ? text.size() : end;
    }

    if (terms.empty()) {
        terms.push_back(DiceTerm{0, 0, flatSum});
    } else {
        terms.back().flat = flatSum;
    }
    return Result::ok(std::move(terms));
}

GameResult<DamageOutcome> Dice::rollDamage(std::string_view notation, int32_t extraModifier,
                                           bool critical) {
    auto outcome = parseDiceNotation(notation).map([&](const std::vector<DiceTerm>& terms) {
        DamageOutcome out;
        out.notation = std::string(notation);
        out.critical = critical;
        out.flatModifier = extraModifier;

        int32_t sum = 0;
        for (const auto& term : terms) {
            out.flatModifier += term.flat;
            if (term.sides == 0) {
                continue;
            }
            const int32_t sign = term.count < 0 ? -1 : 1;
            const int32_t dice = std::abs(term.count) * (critical ? 2 : 1);
            for (int32_t i = 0; i < dice; ++i) {
                const int32_t face = sign * source_->roll(term.sides);
                out.rolls.push_back(face);
                sum += face;
            }
        }
        out.total = std::max(1, sum + out.flatModifier);
        return out;
    });

    if (!outcome) {
        TCC_LOG_WARN(LogCategory::Rules, outcome.error().describe());
    }
    return outcome;
}

} // namespace tcc::rules
