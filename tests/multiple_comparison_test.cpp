// multiple_comparison_test.cpp — Tests for Holm-Bonferroni correction

#include <gtest/gtest.h>

#include "analysis/multiple_comparison.hpp"

#include <vector>

// ===========================================================================
// holm_bonferroni_correct
// ===========================================================================

TEST(HolmBonferroniTest, StepDownWithMonotoneAdjustment) {
    auto c = holm_bonferroni_correct({0.01, 0.04, 0.03});
    ASSERT_EQ(c.size(), 3u);
    EXPECT_NEAR(c[0], 0.03, 1e-12);
    EXPECT_NEAR(c[2], 0.06, 1e-12);
    // 0.04 * 1 would be 0.04; the running max lifts it to 0.06.
    EXPECT_NEAR(c[1], 0.06, 1e-12);
}

TEST(HolmBonferroniTest, ClampsAtOne) {
    auto c = holm_bonferroni_correct({0.6, 0.9});
    EXPECT_DOUBLE_EQ(c[0], 1.0);
    EXPECT_DOUBLE_EQ(c[1], 1.0);
}

TEST(HolmBonferroniTest, SingleTestUnchanged) {
    auto c = holm_bonferroni_correct({0.02});
    EXPECT_DOUBLE_EQ(c[0], 0.02);
}

TEST(HolmBonferroniTest, EmptyInput) {
    EXPECT_TRUE(holm_bonferroni_correct({}).empty());
}

TEST(HolmBonferroniTest, NeverBelowRaw) {
    std::vector<double> raw = {0.001, 0.2, 0.049, 0.5, 0.0101};
    auto c = holm_bonferroni_correct(raw);
    for (size_t i = 0; i < raw.size(); ++i) EXPECT_GE(c[i], raw[i]);
}

TEST(HolmBonferroniTest, TiesKeepInputOrder) {
    auto c = holm_bonferroni_correct({0.02, 0.02});
    EXPECT_DOUBLE_EQ(c[0], 0.04);
    EXPECT_DOUBLE_EQ(c[1], 0.04);
}

// ===========================================================================
// surviving_tests
// ===========================================================================

TEST(SurvivingTestsTest, ReturnsRejectingIndices) {
    auto survivors = surviving_tests({0.001, 0.2, 0.049, 0.05});
    ASSERT_EQ(survivors.size(), 2u);
    EXPECT_EQ(survivors[0], 0u);
    EXPECT_EQ(survivors[1], 2u);
}

TEST(SurvivingTestsTest, CorrectionCanRemoveSurvivors) {
    // 0.03 alone survives; corrected against two others it does not.
    EXPECT_EQ(surviving_tests(holm_bonferroni_correct({0.03})).size(), 1u);
    EXPECT_TRUE(surviving_tests(holm_bonferroni_correct({0.03, 0.4, 0.6})).empty());
}
