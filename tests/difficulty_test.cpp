#include <gtest/gtest.h>

#include "game/systems/difficulty.h"

using game::DifficultyCurve;

TEST(DifficultyCurveTest, DefaultSteps) {
  DifficultyCurve curve;
  EXPECT_EQ(curve.TickIntervalMs(0), 150);
  EXPECT_EQ(curve.TickIntervalMs(49), 150);
  EXPECT_EQ(curve.TickIntervalMs(50), 145);
  EXPECT_EQ(curve.TickIntervalMs(100), 140);
  EXPECT_EQ(curve.TickIntervalMs(1000), 50);
  EXPECT_EQ(curve.TickIntervalMs(100000), 50);
}

TEST(DifficultyCurveTest, NonIncreasingAndFloored) {
  DifficultyCurve curve;
  int prev = curve.TickIntervalMs(0);
  for (int score = 0; score <= 20000; score += 10) {
    const int interval = curve.TickIntervalMs(score);
    EXPECT_LE(interval, prev);
    EXPECT_GE(interval, curve.min_ms);
    prev = interval;
  }
}

TEST(DifficultyCurveTest, NeverNonPositive) {
  DifficultyCurve curve;
  curve.base_ms = 20;
  curve.step_ms = 100;
  curve.min_ms = 0;
  EXPECT_GE(curve.TickIntervalMs(1000000), 1);
}

TEST(DifficultyCurveTest, CustomCurve) {
  DifficultyCurve curve;
  curve.base_ms = 200;
  curve.step_ms = 20;
  curve.points_per_step = 100;
  curve.min_ms = 80;
  EXPECT_EQ(curve.TickIntervalMs(99), 200);
  EXPECT_EQ(curve.TickIntervalMs(100), 180);
  EXPECT_EQ(curve.TickIntervalMs(10000), 80);
}
