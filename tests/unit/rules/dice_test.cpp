#include <gtest/gtest.h>

#include "support/scripted_random_source.hpp"
#include "tcc/rules/dice.hpp"

using namespace tcc::rules;
using tcc::foundation::ErrorCode;
using tcc::test::ScriptedRandomSource;

// ---------------------------------------------------------------------------
// Notation parsing
// ---------------------------------------------------------------------------

TEST(DiceNotationTest, SingleGroupWithFlat) {
    auto terms = Dice::parseDiceNotation("2d6+3");
    ASSERT_TRUE(terms.hasValue());
    ASSERT_EQ(terms.value().size(), 1u);
    EXPECT_EQ(terms.value()[0], (DiceTerm{2, 6, 3}));
}

TEST(DiceNotationTest, MultipleGroupsAndSpaces) {
    auto terms = Dice::parseDiceNotation("1d8 + 1d6");
    ASSERT_TRUE(terms.hasValue());
    ASSERT_EQ(terms.value().size(), 2u);
    EXPECT_EQ(terms.value()[0], (DiceTerm{1, 8, 0}));
    EXPECT_EQ(terms.value()[1], (DiceTerm{1, 6, 0}));
}

TEST(DiceNotationTest, ImplicitCountAndCase) {
    auto terms = Dice::parseDiceNotation("D20");
    ASSERT_TRUE(terms.hasValue());
    EXPECT_EQ(terms.value()[0], (DiceTerm{1, 20, 0}));
}

TEST(DiceNotationTest, NegativeFlatAndSubtractedGroup) {
    auto minus = Dice::parseDiceNotation("3d4-1");
    ASSERT_TRUE(minus.hasValue());
    EXPECT_EQ(minus.value()[0], (DiceTerm{3, 4, -1}));

    auto subtracted = Dice::parseDiceNotation("1d6-1d4");
    ASSERT_TRUE(subtracted.hasValue());
    ASSERT_EQ(subtracted.value().size(), 2u);
    EXPECT_EQ(subtracted.value()[1], (DiceTerm{-1, 4, 0}));
}

TEST(DiceNotationTest, PureFlat) {
    auto terms = Dice::parseDiceNotation("5");
    ASSERT_TRUE(terms.hasValue());
    ASSERT_EQ(terms.value().size(), 1u);
    EXPECT_EQ(terms.value()[0], (DiceTerm{0, 0, 5}));
}

TEST(DiceNotationTest, MalformedNotation) {
    for (const char* text : {"", "abc", "2d", "2d6+", "0d6", "101d6", "1d6x"}) {
        auto terms = Dice::parseDiceNotation(text);
        ASSERT_TRUE(terms.hasError()) << text;
        EXPECT_EQ(terms.error().code(), ErrorCode::InvalidDiceNotation) << text;
    }
}

TEST(DiceNotationTest, FlatModifierOutOfRange) {
    for (const char* text : {"2147483647+1", "1d6+10001", "-10001", "5000+5000+1"}) {
        auto terms = Dice::parseDiceNotation(text);
        ASSERT_TRUE(terms.hasError()) << text;
        EXPECT_EQ(terms.error().code(), ErrorCode::InvalidDiceNotation) << text;
    }

    auto edge = Dice::parseDiceNotation("1d6+10000");
    ASSERT_TRUE(edge.hasValue());
    EXPECT_EQ(edge.value().back().flat, Dice::kMaxFlatModifier);
}

TEST(DiceNotationTest, UnsupportedDieSize) {
    auto terms = Dice::parseDiceNotation("2d7");
    ASSERT_TRUE(terms.hasError());
    EXPECT_EQ(terms.error().code(), ErrorCode::InvalidDieSize);
    const auto* offending = terms.error().context<std::string>();
    ASSERT_NE(offending, nullptr);
    EXPECT_EQ(*offending, "2d7");

    EXPECT_TRUE(Dice::isSupportedDieSize(100));
    EXPECT_FALSE(Dice::isSupportedDieSize(1));
}

// ---------------------------------------------------------------------------
// Single dice and d20
// ---------------------------------------------------------------------------

TEST(DiceRollTest, RollDieRejectsZeroSides) {
    ScriptedRandomSource rng{4};
    Dice dice(rng);

    auto bad = dice.rollDie(0);
    ASSERT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().code(), ErrorCode::InvalidDieSize);
    EXPECT_EQ(rng.calls(), 0u);

    auto good = dice.rollDie(6);
    ASSERT_TRUE(good.hasValue());
    EXPECT_EQ(good.value(), 4);
}

TEST(DiceRollTest, AdvantageTakesHigher) {
    ScriptedRandomSource rng{5, 17};
    Dice dice(rng);
    auto roll = dice.rollD20(2, true, false);
    EXPECT_EQ(roll.rolls.size(), 2u);
    EXPECT_EQ(roll.baseRoll, 17);
    EXPECT_EQ(roll.total, 19);
    EXPECT_TRUE(roll.advantage);
}

TEST(DiceRollTest, DisadvantageTakesLower) {
    ScriptedRandomSource rng{5, 17};
    Dice dice(rng);
    auto roll = dice.rollD20(0, false, true);
    EXPECT_EQ(roll.baseRoll, 5);
    EXPECT_TRUE(roll.disadvantage);
}

TEST(DiceRollTest, AdvantageAndDisadvantageCancel) {
    ScriptedRandomSource rng{5, 17};
    Dice dice(rng);
    auto roll = dice.rollD20(0, true, true);
    EXPECT_EQ(roll.rolls.size(), 1u);
    EXPECT_EQ(roll.baseRoll, 5);
    EXPECT_FALSE(roll.advantage);
    EXPECT_FALSE(roll.disadvantage);
    EXPECT_EQ(rng.calls(), 1u);
}

TEST(DiceRollTest, NaturalsIgnoreModifier) {
    ScriptedRandomSource rng{20, 1};
    Dice dice(rng);

    auto high = dice.rollD20(-5);
    EXPECT_TRUE(high.natural20);
    EXPECT_EQ(high.total, 15);

    auto low = dice.rollD20(30);
    EXPECT_TRUE(low.natural1);
    EXPECT_EQ(low.total, 31);
}

TEST(DiceRollTest, FromFace) {
    auto roll = D20Outcome::fromFace(20, 3);
    EXPECT_TRUE(roll.natural20);
    EXPECT_EQ(roll.total, 23);
    EXPECT_EQ(roll.rolls.size(), 1u);
}

// ---------------------------------------------------------------------------
// Damage
// ---------------------------------------------------------------------------

TEST(DamageRollTest, SumsDiceAndFlats) {
    ScriptedRandomSource rng{4, 5};
    Dice dice(rng);
    auto dmg = dice.rollDamage("2d6+3");
    ASSERT_TRUE(dmg.hasValue());
    EXPECT_EQ(dmg.value().rolls, (std::vector<int32_t>{4, 5}));
    EXPECT_EQ(dmg.value().flatModifier, 3);
    EXPECT_EQ(dmg.value().total, 12);
    EXPECT_EQ(dmg.value().notation, "2d6+3");
    EXPECT_FALSE(dmg.value().critical);
}

TEST(DamageRollTest, CriticalDoublesDiceNotFlats) {
    ScriptedRandomSource rng{1, 2, 3, 4};
    Dice dice(rng);
    auto dmg = dice.rollDamage("2d6+3", 0, true);
    ASSERT_TRUE(dmg.hasValue());
    EXPECT_EQ(dmg.value().rolls.size(), 4u);
    EXPECT_EQ(dmg.value().total, 13);
    EXPECT_TRUE(dmg.value().critical);
}

TEST(DamageRollTest, CriticalRangeWithSeededSource) {
    SeededRandomSource rng(1234);
    Dice dice(rng);
    for (int i = 0; i < 200; ++i) {
        auto dmg = dice.rollDamage("2d6+3", 0, true);
        ASSERT_TRUE(dmg.hasValue());
        EXPECT_EQ(dmg.value().rolls.size(), 4u);
        EXPECT_GE(dmg.value().total, 7);
        EXPECT_LE(dmg.value().total, 27);
    }
}

TEST(DamageRollTest, ExtraModifierAndSubtractedDice) {
    ScriptedRandomSource rng{3, 6, 2};
    Dice dice(rng);

    auto plus = dice.rollDamage("1d4", 2);
    ASSERT_TRUE(plus.hasValue());
    EXPECT_EQ(plus.value().total, 5);

    auto minus = dice.rollDamage("1d8-1d4");
    ASSERT_TRUE(minus.hasValue());
    EXPECT_EQ(minus.value().rolls, (std::vector<int32_t>{6, -2}));
    EXPECT_EQ(minus.value().total, 4);
}

TEST(DamageRollTest, TotalIsAtLeastOne) {
    ScriptedRandomSource rng{1};
    Dice dice(rng);
    auto dmg = dice.rollDamage("1d4-5");
    ASSERT_TRUE(dmg.hasValue());
    EXPECT_EQ(dmg.value().total, 1);
}

TEST(DamageRollTest, FlatDamageRollsNothing) {
    ScriptedRandomSource rng{6};
    Dice dice(rng);
    auto dmg = dice.rollDamage("5", 0, true);
    ASSERT_TRUE(dmg.hasValue());
    EXPECT_TRUE(dmg.value().rolls.empty());
    EXPECT_EQ(dmg.value().total, 5);
    EXPECT_EQ(rng.calls(), 0u);
}

TEST(DamageRollTest, BadNotationPropagates) {
    ScriptedRandomSource rng{6};
    Dice dice(rng);
    auto dmg = dice.rollDamage("2d7");
    ASSERT_TRUE(dmg.hasError());
    EXPECT_EQ(dmg.error().code(), ErrorCode::InvalidDieSize);
}

TEST(SeededRandomSourceTest, SameSeedSameSequence) {
    SeededRandomSource a(7);
    SeededRandomSource b(7);
    for (int i = 0; i < 20; ++i) {
        const int32_t face = a.roll(20);
        EXPECT_EQ(face, b.roll(20));
        EXPECT_GE(face, 1);
        EXPECT_LE(face, 20);
    }
    EXPECT_EQ(a.roll(1), 1);
}
