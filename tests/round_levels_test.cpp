// round_levels_test.cpp — tests for round-number levels and level blending

#include <gtest/gtest.h>

#include "indicators/round_levels.hpp"

#include <cmath>
#include <limits>

class RoundLevelsTest : public ::testing::Test {};

TEST_F(RoundLevelsTest, AutoStepIsOneSignificantDigitOfOnePercent) {
    EXPECT_NEAR(indicators::auto_round_step(65000.0), 700.0, 1e-9);
    EXPECT_NEAR(indicators::auto_round_step(100.0), 1.0, 1e-12);
    EXPECT_NEAR(indicators::auto_round_step(5.12), 0.05, 1e-12);
}

TEST_F(RoundLevelsTest, AutoStepStaysPositiveForLowPrices) {
    EXPECT_NEAR(indicators::auto_round_step(4.0), 0.04, 1e-12);
    EXPECT_NEAR(indicators::auto_round_step(0.35), 0.004, 1e-12);
}

TEST_F(RoundLevelsTest, AutoStepOfNonPositivePriceIsZero) {
    EXPECT_DOUBLE_EQ(indicators::auto_round_step(0.0), 0.0);
    EXPECT_DOUBLE_EQ(indicators::auto_round_step(-3.0), 0.0);
}

TEST_F(RoundLevelsTest, ExplicitSteps) {
    auto lv = indicators::round_levels(101.3, 1.0, 5.0);
    EXPECT_DOUBLE_EQ(lv.minor_below, 101.0);
    EXPECT_DOUBLE_EQ(lv.minor_above, 102.0);
    EXPECT_DOUBLE_EQ(lv.major_below, 100.0);
    EXPECT_DOUBLE_EQ(lv.major_above, 105.0);
}

TEST_F(RoundLevelsTest, MajorDefaultsToFiveTimesBase) {
    auto lv = indicators::round_levels(101.3, 1.0);
    EXPECT_DOUBLE_EQ(lv.major_below, 100.0);
    EXPECT_DOUBLE_EQ(lv.major_above, 105.0);
}

TEST_F(RoundLevelsTest, NearestLevelsAreStrict) {
    auto lv = indicators::round_levels(101.3, 1.0, 5.0);
    EXPECT_DOUBLE_EQ(lv.nearest_below(101.3), 101.0);
    EXPECT_DOUBLE_EQ(lv.nearest_above(101.3), 102.0);
}

TEST_F(RoundLevelsTest, PriceOnALevelHasNoLevelBelow) {
    // 100 is both the minor and major floor, neither strictly below.
    auto lv = indicators::round_levels(100.0, 1.0, 5.0);
    EXPECT_TRUE(std::isnan(lv.nearest_below(100.0)));
    EXPECT_DOUBLE_EQ(lv.nearest_above(100.0), 101.0);
}

TEST_F(RoundLevelsTest, BlendIsWeightedAverage) {
    EXPECT_DOUBLE_EQ(indicators::blend_level(90.0, 100.0, 0.5), 95.0);
    EXPECT_DOUBLE_EQ(indicators::blend_level(90.0, 100.0, 0.0), 90.0);
    EXPECT_DOUBLE_EQ(indicators::blend_level(90.0, 100.0, 1.0), 100.0);
}

TEST_F(RoundLevelsTest, BlendWithoutRoundLevelKeepsBarLevel) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_DOUBLE_EQ(indicators::blend_level(90.0, nan, 0.5), 90.0);
}
