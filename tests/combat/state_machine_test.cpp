#include <gtest/gtest.h>

#include "support/MatchFixture.h"

using TestData::hold;
using TestData::press;

TEST_F(MatchTest, HoldingBackEntersBlocking) {
  step({}, hold(false, true));
  EXPECT_EQ(combat(1).state, CombatState::Blocking);
  EXPECT_TRUE(combat(1).blocking);
  step();
  EXPECT_EQ(combat(1).state, CombatState::Neutral);
  EXPECT_FALSE(combat(1).blocking);
}

TEST_F(MatchTest, WalkingMovesByWalkSpeed) {
  place(300.0F, 900.0F);
  step(hold(false, true));
  EXPECT_FLOAT_EQ(engine->transform(0).pos.x, 303.0F);
  step(hold(true, false));
  EXPECT_FLOAT_EQ(engine->transform(0).pos.x, 300.0F);
  step(hold(false, true, true));
  EXPECT_FLOAT_EQ(engine->transform(0).pos.x, 300.0F);
  EXPECT_TRUE(combat(0).crouching);
}

TEST_F(MatchTest, FightersCannotOverlap) {
  place(600.0F, 610.0F);
  step(hold(false, true), hold(true, false));
  const float gap = engine->transform(1).pos.x - engine->transform(0).pos.x;
  EXPECT_GE(gap, config.stage.pushWidth - 0.01F);
}

TEST_F(MatchTest, StageEdgesClampPosition) {
  place(40.0F, 900.0F);
  for (int i = 0; i < 20; ++i) {
    step(hold(true, false));
  }
  EXPECT_GE(engine->transform(0).pos.x, config.stage.pushWidth * 0.5F);
}

TEST_F(MatchTest, NormalRunsStartupActiveRecovery) {
  step(press(Button::LP));
  EXPECT_EQ(combat(0).state, CombatState::Attacking);
  EXPECT_EQ(combat(0).moveFrame, 1);
  idle(6);
  EXPECT_EQ(combat(0).state, CombatState::Attacking);
  step();
  EXPECT_EQ(combat(0).state, CombatState::Neutral);
  EXPECT_EQ(combat(0).activeMove, nullptr);
}

TEST_F(MatchTest, AttackingFighterIgnoresNewButtons) {
  step(press(Button::HP));
  step(press(Button::LP));
  ASSERT_NE(combat(0).activeMove, nullptr);
  EXPECT_EQ(combat(0).activeMove->name, "hp");
}

TEST_F(MatchTest, HitstunReturnsToNeutral) {
  step(press(Button::LP));
  idle(2);
  ASSERT_EQ(combat(1).state, CombatState::Hitstun);
  EXPECT_EQ(combat(1).advantage, -combat(0).advantage);
  idle(10);
  EXPECT_EQ(combat(1).state, CombatState::Hitstun);
  idle(10);
  EXPECT_EQ(combat(1).state, CombatState::Neutral);
  EXPECT_EQ(combat(1).hitstun, 0);
}

TEST_F(MatchTest, KnockdownRecovers) {
  step(TestData::throwInput());
  step();
  ASSERT_EQ(combat(1).state, CombatState::Knockdown);
  idle(config.stun.knockdownFrames + 1);
  EXPECT_EQ(combat(1).state, CombatState::Neutral);
  EXPECT_TRUE(world.registry.get<HurtboxData>(world.fighter(1)).vulnerable);
}

TEST_F(MatchTest, FacingFollowsOpponent) {
  EXPECT_EQ(fighter(0).facingX, 1);
  EXPECT_EQ(fighter(1).facingX, -1);
  place(800.0F, 300.0F);
  step();
  EXPECT_EQ(fighter(0).facingX, -1);
  EXPECT_EQ(fighter(1).facingX, 1);
}

TEST_F(MatchTest, ResetRoundRestoresEverything) {
  fighter(1).health = 50;
  step(press(Button::LP));
  idle(2);
  ASSERT_TRUE(engine->roundOver());

  engine->resetRound();
  EXPECT_FALSE(engine->roundOver());
  EXPECT_EQ(world.winner, -1);
  for (int slot = 0; slot < 2; ++slot) {
    EXPECT_EQ(combat(slot).state, CombatState::Neutral);
    EXPECT_EQ(combat(slot).comboCount, 0);
    EXPECT_FLOAT_EQ(combat(slot).meter, 0.0F);
    EXPECT_EQ(fighter(slot).health, fighter(slot).maxHealth);
  }
  EXPECT_TRUE(world.registry.view<HitboxData>().empty());
  EXPECT_LT(engine->transform(0).pos.x, engine->transform(1).pos.x);
}

TEST_F(MatchTest, DealDamageNeverGoesNegative) {
  EXPECT_EQ(engine->dealDamage(1, 5000, DamageType::Normal), 1000);
  EXPECT_EQ(fighter(1).health, 0);
  EXPECT_EQ(engine->dealDamage(1, 10, DamageType::Normal), 0);
  EXPECT_EQ(engine->dealDamage(0, -5, DamageType::Normal), 0);
  EXPECT_EQ(fighter(0).health, 1000);
}

TEST_F(MatchTest, ArmedParryCanBeCancelledIntoANormal) {
  step(TestData::tap(false, true));
  ASSERT_EQ(combat(0).state, CombatState::Parrying);
  step(press(Button::LP));
  EXPECT_EQ(combat(0).state, CombatState::Attacking);
  EXPECT_EQ(combat(0).parryWindow, 0);
}

TEST_F(MatchTest, EndMatchDestroysFighters) {
  step(press(Button::LP));
  engine->endMatch();
  EXPECT_FALSE(engine->started());
  EXPECT_TRUE(world.registry.view<PlayerCombatData>().empty());
  EXPECT_TRUE(world.registry.view<HitboxData>().empty());
  EXPECT_EQ(world.fighter(0), kInvalidEntity);

  // Ticking a finished match is a no-op.
  step(press(Button::LP));
  EXPECT_TRUE(events.hits.empty());
}
