#include <gtest/gtest.h>

#include "core/FixedStep.h"

TEST(FixedStepTest, OneTickPerStep) {
  FixedStep clock(60);
  EXPECT_EQ(clock.advance(clock.stepSeconds()), 1);
  EXPECT_EQ(clock.advance(0.0F), 0);
  EXPECT_EQ(clock.advance(-1.0F), 0);
}

TEST(FixedStepTest, AccumulatesPartialSteps) {
  FixedStep clock(60);
  const float half = clock.stepSeconds() * 0.5F;
  EXPECT_EQ(clock.advance(half), 0);
  EXPECT_NEAR(clock.alpha(), 0.5F, 1e-4F);
  EXPECT_EQ(clock.advance(half), 1);
  EXPECT_NEAR(clock.alpha(), 0.0F, 1e-4F);
}

TEST(FixedStepTest, LongFramesAreClampedAndCapped) {
  FixedStep clock(60);
  EXPECT_EQ(clock.advance(5.0F), FixedStep::kMaxStepsPerFrame);
  // At most one step of backlog survives the cap.
  EXPECT_EQ(clock.advance(0.0F), 1);
  EXPECT_EQ(clock.advance(0.0F), 0);
}

TEST(FixedStepTest, NextNumbersTicks) {
  FixedStep clock(30);
  const TimeStep a = clock.next();
  const TimeStep b = clock.next();
  EXPECT_EQ(a.frame, 0U);
  EXPECT_EQ(b.frame, 1U);
  EXPECT_FLOAT_EQ(a.dt, 1.0F / 30.0F);
  EXPECT_EQ(clock.frame(), 2U);

  clock.reset();
  EXPECT_EQ(clock.frame(), 0U);
  EXPECT_FLOAT_EQ(clock.alpha(), 0.0F);
}

TEST(FixedStepTest, InvalidRateFallsBackToOneHertz) {
  const FixedStep clock(0);
  EXPECT_FLOAT_EQ(clock.stepSeconds(), 1.0F);
}

TEST(TimeTest, MillisecondsRoundToNearestFrame) {
  EXPECT_EQ(msToFrames(250, 60), 15);
  EXPECT_EQ(msToFrames(8, 60), 0);
  EXPECT_EQ(msToFrames(9, 60), 1);
  EXPECT_EQ(msToFrames(-5, 60), 0);
  EXPECT_EQ(msToFrames(100, 0), 0);
}
