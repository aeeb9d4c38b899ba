#include <gtest/gtest.h>

#include "support/MatchFixture.h"

using TestData::press;

TEST_F(MatchTest, NormalConnectsOnFirstActiveFrame) {
  step(press(Button::LP));
  step();
  EXPECT_TRUE(events.hits.empty());
  step();
  ASSERT_EQ(events.hits.size(), 1U);
  EXPECT_EQ(events.hits[0].attacker, 0);
  EXPECT_EQ(events.hits[0].defender, 1);
  EXPECT_EQ(events.hits[0].damage, 100);
  EXPECT_EQ(fighter(1).health, 900);
  EXPECT_EQ(combat(1).state, CombatState::Hitstun);
}

TEST_F(MatchTest, HitboxNeverHitsTheSameTargetTwice) {
  step(press(Button::LP));
  idle(10);
  EXPECT_EQ(events.hits.size(), 1U);
  EXPECT_EQ(fighter(1).health, 900);
}

TEST_F(MatchTest, OutOfRangeAttackWhiffs) {
  place(400.0F, 800.0F);
  step(press(Button::LP));
  idle(10);
  EXPECT_TRUE(events.hits.empty());
  EXPECT_EQ(combat(0).state, CombatState::Neutral);
}

TEST_F(MatchTest, SimultaneousNormalsTrade) {
  step(press(Button::LP), press(Button::LP));
  idle(3);
  ASSERT_EQ(events.hits.size(), 2U);
  EXPECT_EQ(fighter(0).health, 900);
  EXPECT_EQ(fighter(1).health, 900);
}

TEST_F(MatchTest, HitDuringStartupIsCounterHit) {
  step(press(Button::LP), press(Button::HP));
  idle(2);
  ASSERT_EQ(events.hits.size(), 1U);
  EXPECT_EQ(events.hits[0].damage, 125);
  ASSERT_FALSE(events.damage.empty());
  EXPECT_EQ(events.damage.back().type, DamageType::Counter);
  // The interrupted move never becomes active.
  idle(10);
  EXPECT_EQ(events.hits.size(), 1U);
}

TEST_F(MatchTest, StandingBlockStopsMidAttack) {
  step(press(Button::LP), TestData::hold(false, true));
  step({}, TestData::hold(false, true));
  step({}, TestData::hold(false, true));
  ASSERT_EQ(events.blocks.size(), 1U);
  EXPECT_TRUE(events.hits.empty());
  EXPECT_EQ(combat(1).state, CombatState::Blockstun);
  EXPECT_EQ(fighter(1).health, 990);  // 10% chip
}

TEST_F(MatchTest, LowHitsStandingBlocker) {
  const InputSnapshot back = TestData::hold(false, true);
  step(press(Button::LK), back);
  step({}, back);
  step({}, back);
  EXPECT_EQ(events.hits.size(), 1U);
  EXPECT_TRUE(events.blocks.empty());
}

TEST_F(MatchTest, CrouchingBlockStopsLow) {
  const InputSnapshot downBack = TestData::hold(false, true, true);
  step(press(Button::LK), downBack);
  step({}, downBack);
  step({}, downBack);
  EXPECT_TRUE(events.hits.empty());
  EXPECT_EQ(events.blocks.size(), 1U);
}

TEST_F(MatchTest, HighHitsCrouchingBlocker) {
  const InputSnapshot downBack = TestData::hold(false, true, true);
  step(press(Button::MP), downBack);
  step({}, downBack);
  step({}, downBack);
  EXPECT_EQ(events.hits.size(), 1U);
  EXPECT_TRUE(events.blocks.empty());
}

TEST_F(MatchTest, ChipDamageCanBeCappedBelowKo) {
  config.block.chipRatio = 0.05F;
  fighter(1).health = 10;
  const InputSnapshot back = TestData::hold(false, true);
  step(press(Button::LP), back);
  step({}, back);
  step({}, back);
  ASSERT_EQ(events.blocks.size(), 1U);
  EXPECT_EQ(events.blocks[0].damage, 5);
  EXPECT_EQ(fighter(1).health, 5);
  EXPECT_TRUE(events.kos.empty());
  EXPECT_EQ(combat(1).state, CombatState::Blockstun);
}

TEST_F(MatchTest, ChipKoRespectsConfig) {
  fighter(1).health = 3;
  config.block.chipKo = false;
  const InputSnapshot back = TestData::hold(false, true);
  step(press(Button::LP), back);
  step({}, back);
  step({}, back);
  EXPECT_EQ(fighter(1).health, 1);
  EXPECT_TRUE(events.kos.empty());

  idle(30);
  config.block.chipKo = true;
  step(press(Button::LP), back);
  step({}, back);
  step({}, back);
  EXPECT_EQ(fighter(1).health, 0);
  ASSERT_EQ(events.kos.size(), 1U);
  EXPECT_EQ(events.kos[0].winner, 0);
}

TEST_F(MatchTest, KoEndsTheRound) {
  fighter(1).health = 50;
  step(press(Button::LP));
  idle(2);
  ASSERT_EQ(events.kos.size(), 1U);
  EXPECT_EQ(events.kos[0].winner, 0);
  EXPECT_EQ(events.kos[0].loser, 1);
  EXPECT_TRUE(engine->roundOver());
  EXPECT_EQ(world.winner, 0);
  EXPECT_EQ(combat(1).state, CombatState::KO);
  EXPECT_EQ(fighter(1).health, 0);

  idle(10);
  step(press(Button::LP));
  idle(5);
  EXPECT_EQ(events.hits.size(), 1U);
  EXPECT_EQ(events.kos.size(), 1U);
}

TEST_F(MatchTest, ThrowConnectsAndKnocksDown) {
  step(TestData::throwInput());
  step();
  ASSERT_EQ(events.hits.size(), 1U);
  EXPECT_EQ(events.hits[0].damage, 120);
  EXPECT_EQ(combat(1).state, CombatState::Knockdown);
}

TEST_F(MatchTest, TechBreaksThrow) {
  step(TestData::throwInput(), TestData::techInput());
  step();
  EXPECT_TRUE(events.hits.empty());
  ASSERT_EQ(events.techs.size(), 1U);
  EXPECT_EQ(events.techs[0].defender, 1);
  EXPECT_EQ(fighter(1).health, 1000);
}

TEST_F(MatchTest, ThrowCannotGrabStunnedDefender) {
  step(press(Button::LP));
  idle(2);
  ASSERT_EQ(combat(1).state, CombatState::Hitstun);
  idle(5);
  step(TestData::throwInput());
  step();
  EXPECT_EQ(events.hits.size(), 1U);
}

TEST_F(MatchTest, KnockedDownFighterIsInvulnerable) {
  step(TestData::throwInput());
  step();
  ASSERT_EQ(combat(1).state, CombatState::Knockdown);
  idle(12);
  ASSERT_EQ(combat(0).state, CombatState::Neutral);
  step(press(Button::LP));
  idle(3);
  EXPECT_EQ(events.hits.size(), 1U);
  EXPECT_FALSE(world.registry.get<HurtboxData>(world.fighter(1)).vulnerable);
}

TEST_F(MatchTest, InvulnerableStartupBeatsNormal) {
  const MoveDef* uppercut = p2.moves.find("uppercut");
  ASSERT_NE(uppercut, nullptr);
  engine->executeSpecialMove(1, *uppercut);
  step(press(Button::LP));
  idle(3);
  // P1's jab met frames 1-4 of the uppercut; the uppercut's own box then lands.
  ASSERT_EQ(events.hits.size(), 1U);
  EXPECT_EQ(events.hits[0].attacker, 1);
  EXPECT_EQ(fighter(1).health, 1000);
}

TEST_F(MatchTest, ProjectileTravelsAndHitsOnce) {
  place(300.0F, 700.0F);
  const MoveDef* fireball = p1.moves.find("fireball");
  ASSERT_NE(fireball, nullptr);
  engine->executeSpecialMove(0, *fireball);
  idle(60);
  ASSERT_EQ(events.hits.size(), 1U);
  EXPECT_EQ(events.hits[0].damage, 80);
  EXPECT_TRUE(world.registry.view<HitboxData>().empty());
}
