#include <gtest/gtest.h>

#include "combat/Parry.h"
#include "support/MatchFixture.h"

using TestData::press;

namespace {

PlayerCombatData defenderIn(CombatState state, int parryWindow) {
  PlayerCombatData c{};
  c.state = state;
  c.parryWindow = parryWindow;
  return c;
}

}  // namespace

TEST(ParryCheckTest, OpenWindowInNeutralIsNormalParry) {
  const CombatConfig::Parry cfg{};
  EXPECT_EQ(checkParry(defenderIn(CombatState::Neutral, 5), cfg), ParryResult::Normal);
  EXPECT_EQ(checkParry(defenderIn(CombatState::Parrying, 1), cfg), ParryResult::Normal);
  EXPECT_EQ(checkParry(defenderIn(CombatState::Blocking, 7), cfg), ParryResult::Normal);
}

TEST(ParryCheckTest, ClosedWindowNeverParries) {
  const CombatConfig::Parry cfg{};
  EXPECT_EQ(checkParry(defenderIn(CombatState::Neutral, 0), cfg), ParryResult::None);
  EXPECT_EQ(checkParry(defenderIn(CombatState::Blockstun, 0), cfg), ParryResult::None);
}

TEST(ParryCheckTest, RedParryNeedsTightTimingInBlockstun) {
  const CombatConfig::Parry cfg{};
  EXPECT_EQ(checkParry(defenderIn(CombatState::Blockstun, 2), cfg), ParryResult::Red);
  EXPECT_EQ(checkParry(defenderIn(CombatState::Blockstun, 1), cfg), ParryResult::Red);
  // Too early for red is not downgraded to a normal parry.
  EXPECT_EQ(checkParry(defenderIn(CombatState::Blockstun, 3), cfg), ParryResult::None);
}

TEST(ParryCheckTest, DisabledSwitchesWin) {
  CombatConfig::Parry cfg{};
  cfg.redEnabled = false;
  EXPECT_EQ(checkParry(defenderIn(CombatState::Blockstun, 1), cfg), ParryResult::None);
  cfg.enabled = false;
  EXPECT_EQ(checkParry(defenderIn(CombatState::Neutral, 5), cfg), ParryResult::None);
}

TEST(ParryCheckTest, AttemptNeedsRecoveryAndAnOpenState) {
  PlayerCombatData c = defenderIn(CombatState::Neutral, 0);
  EXPECT_TRUE(canAttemptParry(c));
  c.parryRecovery = 3;
  EXPECT_FALSE(canAttemptParry(c));
  c.parryRecovery = 0;
  c.state = CombatState::Hitstun;
  EXPECT_FALSE(canAttemptParry(c));
  c.state = CombatState::Attacking;
  EXPECT_FALSE(canAttemptParry(c));
  c.state = CombatState::Blockstun;
  EXPECT_TRUE(canAttemptParry(c));
}

TEST_F(MatchTest, ForwardTapParriesIncomingHit) {
  // P2 faces left, so forward is left.
  step(press(Button::LP), TestData::tap(true, false));
  EXPECT_EQ(combat(1).state, CombatState::Parrying);
  idle(2);
  ASSERT_EQ(events.parries.size(), 1U);
  EXPECT_EQ(events.parries[0].type, ParryType::Normal);
  EXPECT_TRUE(events.hits.empty());
  EXPECT_TRUE(events.blocks.empty());
  EXPECT_EQ(fighter(1).health, 1000);
  EXPECT_EQ(combat(1).advantage, config.parry.advantage);
  EXPECT_EQ(combat(0).advantage, -config.parry.advantage);
  EXPECT_GT(combat(1).parryRecovery, 0);
}

TEST_F(MatchTest, ParryTakesPrecedenceOverBlock) {
  const InputSnapshot back = TestData::hold(false, true);
  combat(1).parryWindow = 7;
  step(press(Button::LP), back);
  step({}, back);
  step({}, back);
  ASSERT_EQ(events.parries.size(), 1U);
  EXPECT_TRUE(events.blocks.empty());
}

TEST_F(MatchTest, ParryWindowExpires) {
  step({}, TestData::tap(true, false));
  idle(10);
  EXPECT_EQ(combat(1).state, CombatState::Neutral);
  step(press(Button::LP));
  idle(2);
  EXPECT_TRUE(events.parries.empty());
  EXPECT_EQ(events.hits.size(), 1U);
}

TEST_F(MatchTest, RedParryDuringBlockstun) {
  const InputSnapshot back = TestData::hold(false, true);
  step(press(Button::LP), back);
  for (int i = 0; i < 7; ++i) {
    step({}, back);
  }
  ASSERT_EQ(events.blocks.size(), 1U);
  ASSERT_EQ(combat(1).state, CombatState::Blockstun);

  fighter(1).health = 900;
  step(press(Button::LP), back);
  step({}, back);
  combat(1).parryWindow = 2;
  step({}, back);
  ASSERT_EQ(events.parries.size(), 1U);
  EXPECT_EQ(events.parries[0].type, ParryType::Red);
  EXPECT_EQ(combat(1).advantage, config.parry.redAdvantage);
  EXPECT_EQ(fighter(1).health, 900 + config.parry.healthGain);
  EXPECT_EQ(events.blocks.size(), 1U);
}

TEST_F(MatchTest, EarlyParryInBlockstunStillBlocks) {
  const InputSnapshot back = TestData::hold(false, true);
  step(press(Button::LP), back);
  for (int i = 0; i < 7; ++i) {
    step({}, back);
  }
  step(press(Button::LP), back);
  step({}, back);
  combat(1).parryWindow = 3;
  step({}, back);
  EXPECT_TRUE(events.parries.empty());
  EXPECT_EQ(events.blocks.size(), 2U);
}

TEST_F(MatchTest, ForwardTapInBlockstunRedParriesLateHit) {
  const InputSnapshot back = TestData::hold(false, true);
  step(press(Button::LP), back);
  for (int i = 0; i < 7; ++i) {
    step({}, back);
  }
  ASSERT_EQ(combat(1).state, CombatState::Blockstun);

  step({}, TestData::tap(true, false));
  EXPECT_EQ(combat(1).state, CombatState::Blockstun);
  EXPECT_EQ(combat(1).parryWindow, config.parry.window - 1);
  step({}, back);
  step({}, back);
  step(press(Button::LP), back);
  step({}, back);
  step({}, back);

  ASSERT_EQ(events.parries.size(), 1U);
  EXPECT_EQ(events.parries[0].type, ParryType::Red);
  EXPECT_EQ(events.blocks.size(), 1U);
  EXPECT_EQ(combat(1).advantage, config.parry.redAdvantage);
}

TEST_F(MatchTest, ForwardTapInBlockstunTooEarlyBlocks) {
  const InputSnapshot back = TestData::hold(false, true);
  step(press(Button::LP), back);
  for (int i = 0; i < 7; ++i) {
    step({}, back);
  }
  ASSERT_EQ(combat(1).state, CombatState::Blockstun);

  step({}, TestData::tap(true, false));
  step(press(Button::LP), back);
  step({}, back);

  EXPECT_TRUE(events.parries.empty());
  EXPECT_EQ(events.blocks.size(), 2U);
  EXPECT_TRUE(events.hits.empty());
}

TEST_F(MatchTest, ParryRewardsMeter) {
  combat(1).parryWindow = 7;
  step(press(Button::LP));
  idle(2);
  ASSERT_EQ(events.parries.size(), 1U);
  EXPECT_GE(combat(1).meter, config.parry.meterGain);
}
