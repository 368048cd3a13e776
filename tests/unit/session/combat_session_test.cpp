#include <gtest/gtest.h>

#include "support/mock_logger.hpp"
#include "support/scripted_random_source.hpp"
#include "tcc/foundation/game_logger.hpp"
#include "tcc/session/combat_session.hpp"

using namespace tcc::session;
using tcc::foundation::ErrorCode;
using tcc::grid::GridPos;
using tcc::grid::MoverState;
using tcc::grid::TerrainKind;

namespace {

const CombatantId kHero{1};
const CombatantId kOrc{2};
const CombatantId kCleric{3};

CombatantSetup team(uint32_t t) {
    CombatantSetup setup;
    setup.team = t;
    return setup;
}

} // namespace

class CombatSessionTest : public ::testing::Test {
protected:
    CombatSession session_{SessionId(7)};
};

// ---------------------------------------------------------------------------
// Membership
// ---------------------------------------------------------------------------

TEST_F(CombatSessionTest, AddPlacesAndRegisters) {
    ASSERT_TRUE(session_.addCombatant(kHero, {1, 1}).hasValue());

    EXPECT_TRUE(session_.contains(kHero));
    EXPECT_EQ(session_.combatantCount(), 1u);
    EXPECT_EQ(session_.grid().occupant({1, 1}), kHero);
    EXPECT_TRUE(session_.reactions().hasReaction(kHero));
    ASSERT_NE(session_.status(kHero), nullptr);
    EXPECT_EQ(session_.status(kHero)->exhaustion.level, 0);

    ASSERT_EQ(session_.events().size(), 1u);
    EXPECT_EQ(session_.events()[0].kind, CombatEventKind::CombatantJoined);
    EXPECT_EQ(session_.events()[0].combatant, kHero);
    EXPECT_EQ(session_.events()[0].detail, "at (1,1)");
}

TEST_F(CombatSessionTest, AddRejectsBadPlacement) {
    session_.grid().setTerrain({3, 3}, TerrainKind::Impassable);
    ASSERT_TRUE(session_.addCombatant(kHero, {1, 1}).hasValue());

    EXPECT_EQ(session_.addCombatant(CombatantId(), {0, 0}).error().code(),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(session_.addCombatant(kHero, {2, 2}).error().code(),
              ErrorCode::CombatantAlreadyPresent);
    EXPECT_EQ(session_.addCombatant(kOrc, {8, 0}).error().code(), ErrorCode::OutOfBounds);
    EXPECT_EQ(session_.addCombatant(kOrc, {1, 1}).error().code(), ErrorCode::CellOccupied);
    EXPECT_EQ(session_.addCombatant(kOrc, {3, 3}).error().code(), ErrorCode::CellNotPassable);

    EXPECT_FALSE(session_.contains(kOrc));
    EXPECT_FALSE(session_.reactions().isRegistered(kOrc));
    EXPECT_EQ(session_.events().size(), 1u);
}

TEST_F(CombatSessionTest, RemoveClearsEverything) {
    session_.addCombatant(kHero, {1, 1});
    session_.addCombatant(kOrc, {5, 5}, team(1));
    ASSERT_TRUE(session_.setInitiativeOrder({kHero, kOrc}).hasValue());

    ASSERT_TRUE(session_.removeCombatant(kOrc).hasValue());
    EXPECT_FALSE(session_.contains(kOrc));
    EXPECT_FALSE(session_.grid().occupant({5, 5}).has_value());
    EXPECT_FALSE(session_.reactions().isRegistered(kOrc));
    EXPECT_EQ(session_.status(kOrc), nullptr);
    EXPECT_EQ(session_.initiativeOrder(), (std::vector<CombatantId>{kHero}));
    EXPECT_EQ(session_.events().back().kind, CombatEventKind::CombatantLeft);

    EXPECT_EQ(session_.removeCombatant(kOrc).error().code(), ErrorCode::CombatantNotFound);
}

TEST_F(CombatSessionTest, RemovingCurrentCombatantKeepsOrderFlowing) {
    session_.addCombatant(kHero, {0, 0});
    session_.addCombatant(kOrc, {5, 5}, team(1));
    session_.addCombatant(kCleric, {0, 2});
    session_.setInitiativeOrder({kHero, kOrc, kCleric});

    EXPECT_EQ(session_.beginNextTurn().value(), kHero);
    ASSERT_TRUE(session_.removeCombatant(kHero).hasValue());
    EXPECT_FALSE(session_.currentCombatant().has_value());

    EXPECT_EQ(session_.beginNextTurn().value(), kOrc);
    EXPECT_EQ(session_.beginNextTurn().value(), kCleric);
    EXPECT_EQ(session_.beginNextTurn().value(), kOrc);
    EXPECT_EQ(session_.round(), 2u);
}

// ---------------------------------------------------------------------------
// Turns
// ---------------------------------------------------------------------------

TEST_F(CombatSessionTest, TurnsCycleAndCountRounds) {
    session_.addCombatant(kHero, {0, 0});
    session_.addCombatant(kOrc, {5, 5}, team(1));
    ASSERT_TRUE(session_.setInitiativeOrder({kOrc, kHero}).hasValue());
    EXPECT_EQ(session_.round(), 0u);

    EXPECT_EQ(session_.beginNextTurn().value(), kOrc);
    EXPECT_EQ(session_.round(), 1u);
    EXPECT_EQ(session_.currentCombatant(), kOrc);
    EXPECT_EQ(session_.beginNextTurn().value(), kHero);
    EXPECT_EQ(session_.round(), 1u);
    EXPECT_EQ(session_.beginNextTurn().value(), kOrc);
    EXPECT_EQ(session_.round(), 2u);

    const auto& last = session_.events().back();
    EXPECT_EQ(last.kind, CombatEventKind::TurnStarted);
    EXPECT_EQ(last.detail, "round 2");
    EXPECT_EQ(last.round, 2u);
}

TEST_F(CombatSessionTest, InitiativeValidation) {
    session_.addCombatant(kHero, {0, 0});
    EXPECT_EQ(session_.setInitiativeOrder({kHero, kOrc}).error().code(),
              ErrorCode::CombatantNotFound);
    EXPECT_EQ(session_.setInitiativeOrder({kHero, kHero}).error().code(),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(session_.beginNextTurn().error().code(), ErrorCode::InvalidArgument);
}

TEST_F(CombatSessionTest, TurnStartRestoresReaction) {
    session_.addCombatant(kHero, {0, 0});
    session_.addCombatant(kOrc, {5, 5}, team(1));
    session_.setInitiativeOrder({kHero, kOrc});
    session_.beginNextTurn();

    EXPECT_TRUE(session_.useReaction(kOrc).value());
    EXPECT_FALSE(session_.useReaction(kOrc).value());
    EXPECT_FALSE(session_.reactions().hasReaction(kOrc));

    session_.beginNextTurn();
    EXPECT_TRUE(session_.reactions().hasReaction(kOrc));
    EXPECT_EQ(session_.useReaction(CombatantId(42)).error().code(),
              ErrorCode::CombatantNotFound);
}

// ---------------------------------------------------------------------------
// Movement
// ---------------------------------------------------------------------------

TEST_F(CombatSessionTest, MovementSpendsTurnBudget) {
    session_.addCombatant(kHero, {0, 0});
    session_.setInitiativeOrder({kHero});
    EXPECT_EQ(session_.movementRemaining(), 0);
    session_.beginNextTurn();
    EXPECT_EQ(session_.movementRemaining(), 30);

    auto first = session_.moveCombatant(kHero, {3, 0});
    ASSERT_TRUE(first.hasValue());
    EXPECT_TRUE(first.value().path.success);
    EXPECT_EQ(first.value().movementRemaining, 15);
    EXPECT_EQ(session_.events().back().detail, "(0,0) -> (3,0) for 15ft");

    auto second = session_.moveCombatant(kHero, {6, 0});
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(second.value().movementRemaining, 0);
    EXPECT_EQ(session_.movementRemaining(), 0);

    auto third = session_.moveCombatant(kHero, {7, 0});
    ASSERT_TRUE(third.hasValue());
    EXPECT_FALSE(third.value().path.success);
    EXPECT_EQ(third.value().path.reason, "No path found");
    EXPECT_EQ(session_.grid().findCombatant(kHero), (GridPos{6, 0}));

    session_.beginNextTurn();
    EXPECT_EQ(session_.round(), 2u);
    EXPECT_EQ(session_.movementRemaining(), 30);
}

TEST_F(CombatSessionTest, MoveRequiresOwnTurn) {
    session_.addCombatant(kHero, {0, 0});
    session_.addCombatant(kOrc, {5, 5}, team(1));
    session_.setInitiativeOrder({kHero, kOrc});
    session_.beginNextTurn();

    EXPECT_EQ(session_.moveCombatant(kOrc, {5, 6}).error().code(),
              ErrorCode::NotCombatantsTurn);
    EXPECT_EQ(session_.moveCombatant(CombatantId(9), {1, 1}).error().code(),
              ErrorCode::CombatantNotFound);
}

TEST_F(CombatSessionTest, SpeedOverridesAndExhaustion) {
    CombatantSetup slow;
    slow.speedFeet = 20;
    session_.addCombatant(kHero, {0, 0}, slow);
    session_.setInitiativeOrder({kHero});
    session_.beginNextTurn();
    EXPECT_EQ(session_.movementRemaining(), 20);

    ASSERT_TRUE(session_.setExhaustionState(kHero, {2}).hasValue());
    EXPECT_EQ(session_.movementRemaining(), 10);

    auto tooFar = session_.moveCombatant(kHero, {3, 0});
    ASSERT_TRUE(tooFar.hasValue());
    EXPECT_FALSE(tooFar.value().path.success);
    EXPECT_EQ(session_.grid().findCombatant(kHero), (GridPos{0, 0}));

    auto fast = session_.moveCombatant(kHero, {3, 0}, 40);
    ASSERT_TRUE(fast.hasValue());
    EXPECT_TRUE(fast.value().path.success);
    EXPECT_EQ(fast.value().movementRemaining, 5);
}

TEST_F(CombatSessionTest, LeavingEnemyReachReportsOpportunityAttack) {
    session_.addCombatant(kHero, {1, 1});
    session_.addCombatant(kOrc, {2, 2}, team(1));
    session_.addCombatant(kCleric, {2, 0});
    session_.setInitiativeOrder({kHero, kOrc, kCleric});
    session_.beginNextTurn();

    auto moved = session_.moveCombatant(kHero, {0, 4});
    ASSERT_TRUE(moved.hasValue());
    ASSERT_TRUE(moved.value().path.success);
    EXPECT_EQ(moved.value().opportunityAttackers, (std::vector<CombatantId>{kOrc}));
    EXPECT_TRUE(moved.value().polearmAttackers.empty());
}

TEST_F(CombatSessionTest, DisengageAndSpentReactionSuppressTriggers) {
    session_.addCombatant(kHero, {1, 1});
    session_.addCombatant(kOrc, {2, 2}, team(1));
    session_.setInitiativeOrder({kHero, kOrc});
    session_.beginNextTurn();

    MoverState disengaged;
    disengaged.disengaged = true;
    auto careful = session_.moveCombatant(kHero, {0, 0}, disengaged);
    ASSERT_TRUE(careful.hasValue());
    EXPECT_TRUE(careful.value().opportunityAttackers.empty());

    session_.moveCombatant(kHero, {1, 1});
    session_.useReaction(kOrc);
    auto reckless = session_.moveCombatant(kHero, {0, 0});
    ASSERT_TRUE(reckless.hasValue());
    ASSERT_TRUE(reckless.value().path.success);
    EXPECT_TRUE(reckless.value().opportunityAttackers.empty());
}

TEST_F(CombatSessionTest, EnteringPolearmReach) {
    CombatantSetup guard = team(1);
    guard.reachFeet = 10;
    guard.polearmMaster = true;
    session_.addCombatant(kHero, {7, 4});
    session_.addCombatant(kOrc, {4, 4}, guard);
    session_.setInitiativeOrder({kHero, kOrc});
    session_.beginNextTurn();

    auto moved = session_.moveCombatant(kHero, {6, 4});
    ASSERT_TRUE(moved.hasValue());
    EXPECT_EQ(moved.value().polearmAttackers, (std::vector<CombatantId>{kOrc}));
    EXPECT_TRUE(moved.value().opportunityAttackers.empty());
}

// ---------------------------------------------------------------------------
// Reactions and status
// ---------------------------------------------------------------------------

TEST_F(CombatSessionTest, ResolveOpportunityAttack) {
    session_.addCombatant(kHero, {1, 1});
    session_.addCombatant(kOrc, {2, 2}, team(1));

    tcc::test::ScriptedRandomSource rng{15, 6};
    tcc::rules::ResolutionEngine engine(
        tcc::rules::RulesRegistry::withConfig(tcc::rules::RulesConfig{}), rng);

    tcc::rules::AttackRequest axe;
    axe.attackBonus = 5;
    axe.targetDefense = 12;
    axe.damageNotation = "1d8";
    axe.damageModifier = 2;

    auto result = session_.resolveOpportunityAttack(kOrc, kHero, axe, engine);
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().success);
    EXPECT_EQ(result.value().damageDealt, 8);
    EXPECT_FALSE(session_.reactions().hasReaction(kOrc));
    EXPECT_EQ(session_.events().back().kind, CombatEventKind::ReactionUsed);
    EXPECT_EQ(session_.events().back().combatant, kOrc);

    auto again = session_.resolveOpportunityAttack(kOrc, kHero, axe, engine);
    ASSERT_TRUE(again.hasValue());
    EXPECT_FALSE(again.value().success);

    EXPECT_EQ(session_.resolveOpportunityAttack(kOrc, kCleric, axe, engine).error().code(),
              ErrorCode::CombatantNotFound);
}

TEST_F(CombatSessionTest, ReadiedAction) {
    session_.addCombatant(kHero, {1, 1});
    tcc::reactions::ReadiedAction readied{tcc::reactions::ReactionTrigger::EnemyEntersReach,
                                          "attack", std::nullopt};
    ASSERT_TRUE(session_.setReadiedAction(kHero, readied).hasValue());
    EXPECT_EQ(session_.reactions().readiedAction(kHero), readied);
    EXPECT_EQ(session_.setReadiedAction(kOrc, readied).error().code(),
              ErrorCode::CombatantNotFound);
}

TEST_F(CombatSessionTest, StatusUpdatesAreValidated) {
    session_.addCombatant(kHero, {1, 1});

    tcc::status::DeathSaveState saves;
    saves.successes = 1;
    saves.failures = 2;
    ASSERT_TRUE(session_.setDeathSaveState(kHero, saves).hasValue());
    EXPECT_EQ(session_.status(kHero)->deathSaves, saves);

    saves.failures = 4;
    EXPECT_EQ(session_.setDeathSaveState(kHero, saves).error().code(), ErrorCode::CorruptState);
    EXPECT_EQ(session_.status(kHero)->deathSaves.failures, 2);

    EXPECT_EQ(session_.setExhaustionState(kHero, {9}).error().code(), ErrorCode::CorruptState);
    EXPECT_EQ(session_.setExhaustionState(kOrc, {1}).error().code(),
              ErrorCode::CombatantNotFound);
}

TEST_F(CombatSessionTest, DamageWhileDyingHonoursMassiveDamageRule) {
    session_.addCombatant(kHero, {1, 1});
    session_.addCombatant(kOrc, {2, 2}, team(1));

    tcc::rules::RulesConfig lenient;
    lenient.massiveDamageInstantDeath = false;

    auto survived = session_.damageWhileDying(kHero, false, 30, 20, lenient);
    ASSERT_TRUE(survived.hasValue());
    EXPECT_FALSE(survived.value().died);
    EXPECT_FALSE(survived.value().massiveDamage);
    EXPECT_EQ(session_.status(kHero)->deathSaves.failures, 1);

    auto killed = session_.damageWhileDying(kOrc, false, 30, 20, tcc::rules::RulesConfig{});
    ASSERT_TRUE(killed.hasValue());
    EXPECT_TRUE(killed.value().died);
    EXPECT_TRUE(killed.value().massiveDamage);
    EXPECT_TRUE(session_.status(kOrc)->deathSaves.dead);
    EXPECT_TRUE(session_.contains(kOrc));
    EXPECT_EQ(session_.events().back().kind, CombatEventKind::CombatantDied);
    EXPECT_EQ(session_.events().back().detail, "from massive damage");

    EXPECT_EQ(session_.damageWhileDying(kCleric, false, 0, 10, lenient).error().code(),
              ErrorCode::CombatantNotFound);
}

// ---------------------------------------------------------------------------
// Teardown
// ---------------------------------------------------------------------------

TEST_F(CombatSessionTest, EndClearsAndLocksSession) {
    session_.addCombatant(kHero, {1, 1});
    session_.addCombatant(kOrc, {2, 2}, team(1));
    session_.setInitiativeOrder({kHero, kOrc});
    session_.beginNextTurn();

    ASSERT_TRUE(session_.end().hasValue());
    EXPECT_TRUE(session_.hasEnded());
    EXPECT_EQ(session_.combatantCount(), 0u);
    EXPECT_FALSE(session_.grid().occupant({1, 1}).has_value());
    EXPECT_FALSE(session_.grid().occupant({2, 2}).has_value());
    EXPECT_EQ(session_.reactions().size(), 0u);
    EXPECT_TRUE(session_.initiativeOrder().empty());
    EXPECT_EQ(session_.events().back().kind, CombatEventKind::CombatEnded);
    EXPECT_EQ(session_.events().back().detail, "after round 1");

    EXPECT_EQ(session_.end().error().code(), ErrorCode::CombatEnded);
    EXPECT_EQ(session_.addCombatant(kHero, {0, 0}).error().code(), ErrorCode::CombatEnded);
    EXPECT_EQ(session_.beginNextTurn().error().code(), ErrorCode::CombatEnded);
    EXPECT_EQ(session_.moveCombatant(kHero, {0, 0}).error().code(), ErrorCode::CombatEnded);
    EXPECT_EQ(session_.useReaction(kHero).error().code(), ErrorCode::CombatEnded);
}

TEST(CombatEventKindTest, Names) {
    EXPECT_EQ(combatEventKindName(CombatEventKind::CombatantJoined), "combatant_joined");
    EXPECT_EQ(combatEventKindName(CombatEventKind::ReactionUsed), "reaction_used");
    EXPECT_EQ(combatEventKindName(CombatEventKind::CombatantDied), "combatant_died");
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

class CombatSessionLogTest : public tcc::test::LoggerCaptureTest {
protected:
    tcc::foundation::ScopedLogLevel verbose_{tcc::foundation::LogCategory::Session,
                                             tcc::foundation::LogLevel::Debug};
};

TEST_F(CombatSessionLogTest, EventsCarrySessionContext) {
    CombatSession session(SessionId(7));
    session.addCombatant(kHero, {1, 1});
    session.end();

    EXPECT_TRUE(mockLogger_->contains(
        "[Session] combatant_joined at (1,1) {combatant_id=1, session_id=7}"));
    EXPECT_TRUE(mockLogger_->contains("[Session] combat_ended after round 0 {session_id=7}"));
}
