// rate_estimator_test.cpp — Tests for the Wilson score interval

#include <gtest/gtest.h>

#include "analysis/rate_estimator.hpp"

TEST(RateEstimatorTest, NoDataYieldsZeros) {
    auto g = estimate_rate(0, 0);
    EXPECT_EQ(g.sessions, 0);
    EXPECT_DOUBLE_EQ(g.rate, 0.0);
    EXPECT_DOUBLE_EQ(g.ci_lower, 0.0);
    EXPECT_DOUBLE_EQ(g.ci_upper, 0.0);
}

TEST(RateEstimatorTest, HalfOfHundred) {
    auto g = estimate_rate(50, 100);
    EXPECT_DOUBLE_EQ(g.rate, 0.5);
    EXPECT_NEAR(g.ci_lower, 0.40383, 1e-4);
    EXPECT_NEAR(g.ci_upper, 0.59617, 1e-4);
}

TEST(RateEstimatorTest, ZeroConversionsKeepsLowerAtZero) {
    auto g = estimate_rate(0, 10);
    EXPECT_DOUBLE_EQ(g.rate, 0.0);
    EXPECT_DOUBLE_EQ(g.ci_lower, 0.0);
    EXPECT_NEAR(g.ci_upper, 0.27753, 1e-4);
}

TEST(RateEstimatorTest, AllConvertedKeepsUpperAtOne) {
    auto g = estimate_rate(10, 10);
    EXPECT_DOUBLE_EQ(g.rate, 1.0);
    EXPECT_DOUBLE_EQ(g.ci_upper, 1.0);
    EXPECT_LT(g.ci_lower, 1.0);
}

TEST(RateEstimatorTest, BoundsBracketRate) {
    for (int n : {1, 7, 50, 333}) {
        for (int k = 0; k <= n; k += (n / 5 > 0 ? n / 5 : 1)) {
            auto g = estimate_rate(k, n);
            EXPECT_LE(0.0, g.ci_lower);
            EXPECT_LE(g.ci_lower, g.rate);
            EXPECT_LE(g.rate, g.ci_upper);
            EXPECT_LE(g.ci_upper, 1.0);
        }
    }
}

TEST(RateEstimatorTest, WidthShrinksWithSampleSize) {
    auto small = estimate_rate(20, 100);
    auto large = estimate_rate(200, 1000);
    EXPECT_LT(large.ci_upper - large.ci_lower, small.ci_upper - small.ci_lower);
}

TEST(RateEstimatorTest, HigherConfidenceIsWider) {
    auto c90 = estimate_rate(30, 100, 0.90);
    auto c99 = estimate_rate(30, 100, 0.99);
    EXPECT_GT(c99.ci_upper - c99.ci_lower, c90.ci_upper - c90.ci_lower);
}

TEST(RateEstimatorTest, InvalidInputsThrow) {
    EXPECT_THROW(estimate_rate(5, 3), std::invalid_argument);
    EXPECT_THROW(estimate_rate(-1, 3), std::invalid_argument);
    EXPECT_THROW(estimate_rate(1, 3, 1.0), std::invalid_argument);
}
