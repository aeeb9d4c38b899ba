#include <gtest/gtest.h>

#include "combat/DamageScaling.h"

TEST(DamageScalingTest, FirstHitsAreUnscaled) {
  const CombatConfig::Scaling cfg{};
  EXPECT_EQ(scaledDamage(100, 0, cfg), 100);
  EXPECT_EQ(scaledDamage(100, 1, cfg), 100);
  EXPECT_EQ(scaledDamage(100, 2, cfg), 100);
}

TEST(DamageScalingTest, ScalingStartsAfterThreshold) {
  const CombatConfig::Scaling cfg{};
  EXPECT_EQ(scaledDamage(100, 3, cfg), 90);
  EXPECT_EQ(scaledDamage(100, 4, cfg), 81);
  EXPECT_EQ(scaledDamage(100, 5, cfg), 72);
}

TEST(DamageScalingTest, FactorNeverIncreasesWithinCombo) {
  const CombatConfig::Scaling cfg{};
  double prev = scalingFactor(0, cfg);
  for (int n = 1; n < 60; ++n) {
    const double f = scalingFactor(n, cfg);
    EXPECT_LE(f, prev) << "combo count " << n;
    prev = f;
  }
}

TEST(DamageScalingTest, FactorIsFlooredAtMinimum) {
  const CombatConfig::Scaling cfg{};
  EXPECT_DOUBLE_EQ(scalingFactor(40, cfg), static_cast<double>(cfg.minimum));
  EXPECT_EQ(scaledDamage(100, 40, cfg), 10);
}

TEST(DamageScalingTest, DisabledScalingKeepsFullDamage) {
  CombatConfig::Scaling cfg{};
  cfg.enabled = false;
  EXPECT_EQ(scaledDamage(100, 10, cfg), 100);
}

TEST(DamageScalingTest, ZeroDamageStaysZero) {
  const CombatConfig::Scaling cfg{};
  EXPECT_EQ(scaledDamage(0, 5, cfg), 0);
}

TEST(DamageScalingTest, StunFallsBackToConfig) {
  const CombatConfig::Stun cfg{};
  AttackData a{};
  EXPECT_EQ(hitstunFrames(a, cfg), 14);
  EXPECT_EQ(blockstunFrames(a, cfg), 8);
  a.hitstun = 20;
  a.blockstun = 11;
  EXPECT_EQ(hitstunFrames(a, cfg), 20);
  EXPECT_EQ(blockstunFrames(a, cfg), 11);
}

TEST(DamageScalingTest, ChipIsFractionOfDamage) {
  const CombatConfig::Block cfg{};
  AttackData a{};
  a.damage = 80;
  EXPECT_EQ(chipDamage(a, cfg), 8);
  a.damage = 5;
  EXPECT_EQ(chipDamage(a, cfg), 0);
}
