// segment_breakdown_test.cpp — Tests for funnel, summary and group-by views

#include <gtest/gtest.h>

#include "analysis/segment_breakdown.hpp"
#include "test_helpers.hpp"

#include <vector>

namespace {

using test_helpers::append_group;
using test_helpers::make_crisis_record;
using test_helpers::make_record;

}  // anonymous namespace

// ===========================================================================
// Funnel
// ===========================================================================

class FunnelTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 6 decided (3 converted), 4 pending, 3 crisis
        append_group(records_, "d", Treatment::A, 6, 3);
        for (int i = 0; i < 4; ++i) {
            records_.push_back(make_record("p" + std::to_string(i), Treatment::B, std::nullopt));
        }
        for (int i = 0; i < 3; ++i) records_.push_back(make_crisis_record("c" + std::to_string(i)));
    }
    std::vector<InteractionRecord> records_;
};

TEST_F(FunnelTest, CountsEveryStage) {
    auto f = SegmentAggregator{}.funnel(records_);
    EXPECT_EQ(f.total_sessions, 13);
    EXPECT_EQ(f.experiment_sessions, 10);
    EXPECT_EQ(f.crisis_excluded, 3);
    EXPECT_EQ(f.conversions, 3);
    EXPECT_EQ(f.pending_decisions, 4);
}

TEST_F(FunnelTest, TotalSplitsIntoExperimentAndCrisis) {
    auto f = SegmentAggregator{}.funnel(records_);
    EXPECT_EQ(f.total_sessions, f.experiment_sessions + f.crisis_excluded);
}

TEST_F(FunnelTest, FunnelIgnoresPendingPolicy) {
    auto f = SegmentAggregator(AnalysisConfig::PendingPolicy::EXCLUDE).funnel(records_);
    EXPECT_EQ(f.experiment_sessions, 10);
    EXPECT_EQ(f.pending_decisions, 4);
}

TEST(FunnelEmptyTest, AllZeros) {
    auto f = SegmentAggregator{}.funnel({});
    EXPECT_EQ(f.total_sessions, 0);
    EXPECT_EQ(f.conversions, 0);
}

// ===========================================================================
// Summary
// ===========================================================================

TEST(SummaryTest, RatesPerTreatment) {
    std::vector<InteractionRecord> records;
    append_group(records, "a", Treatment::A, 10, 2);
    append_group(records, "b", Treatment::B, 10, 4);
    records.push_back(make_crisis_record("c"));
    auto s = SegmentAggregator{}.summary(records);
    EXPECT_EQ(s.total_sessions, 21);
    EXPECT_EQ(s.total_conversions, 6);
    EXPECT_DOUBLE_EQ(s.overall_rate, 0.3);
    EXPECT_DOUBLE_EQ(s.rate_a, 0.2);
    EXPECT_DOUBLE_EQ(s.rate_b, 0.4);
}

TEST(SummaryTest, MissingArmHasZeroRate) {
    std::vector<InteractionRecord> records;
    append_group(records, "a", Treatment::A, 4, 1);
    auto s = SegmentAggregator{}.summary(records);
    EXPECT_DOUBLE_EQ(s.rate_b, 0.0);
}

// ===========================================================================
// Severity × treatment
// ===========================================================================

TEST(SeverityBreakdownTest, AlwaysSixCellsInOrder) {
    std::vector<InteractionRecord> records;
    append_group(records, "s", Treatment::B, 4, 3, Severity::SEVERE);
    auto cells = SegmentAggregator{}.by_severity_and_treatment(records);
    ASSERT_EQ(cells.size(), 6u);
    EXPECT_EQ(cells[0].severity, Severity::MILD);
    EXPECT_EQ(cells[0].treatment, Treatment::A);
    EXPECT_EQ(cells[1].treatment, Treatment::B);
    EXPECT_EQ(cells[2].severity, Severity::MODERATE);
    EXPECT_EQ(cells[5].severity, Severity::SEVERE);
    EXPECT_EQ(cells[5].treatment, Treatment::B);
    EXPECT_EQ(cells[5].sessions, 4);
    EXPECT_DOUBLE_EQ(cells[5].rate, 0.75);
    EXPECT_EQ(cells[0].sessions, 0);
    EXPECT_DOUBLE_EQ(cells[0].rate, 0.0);
}

TEST(SeverityBreakdownTest, CrisisRowsNotCounted) {
    std::vector<InteractionRecord> records;
    records.push_back(make_crisis_record("c"));
    auto cells = SegmentAggregator{}.by_severity_and_treatment(records);
    for (const auto& c : cells) EXPECT_EQ(c.sessions, 0);
}

TEST(SeverityBreakdownTest, ExcludePolicyDropsPending) {
    std::vector<InteractionRecord> records;
    append_group(records, "m", Treatment::A, 2, 1, Severity::MILD);
    records.push_back(make_record("p", Treatment::A, std::nullopt, Severity::MILD));
    auto counted = SegmentAggregator{}.by_severity_and_treatment(records);
    auto excluded = SegmentAggregator(AnalysisConfig::PendingPolicy::EXCLUDE)
                        .by_severity_and_treatment(records);
    EXPECT_EQ(counted[0].sessions, 3);
    EXPECT_EQ(excluded[0].sessions, 2);
    EXPECT_DOUBLE_EQ(excluded[0].rate, 0.5);
}

// ===========================================================================
// Referral source
// ===========================================================================

TEST(ReferralBreakdownTest, SortedBySessionsThenName) {
    std::vector<InteractionRecord> records;
    append_group(records, "e", Treatment::A, 3, 1, Severity::MILD, "email_campaign");
    append_group(records, "g", Treatment::B, 5, 2, Severity::MILD, "google_search");
    append_group(records, "d", Treatment::A, 3, 0, Severity::MILD, "direct");
    auto rows = SegmentAggregator{}.by_referral_source(records);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].referral_source, "google_search");
    EXPECT_EQ(rows[1].referral_source, "direct");
    EXPECT_EQ(rows[2].referral_source, "email_campaign");
    EXPECT_DOUBLE_EQ(rows[0].rate, 0.4);
}

TEST(ReferralBreakdownTest, CoversExperimentRowsOnly) {
    std::vector<InteractionRecord> records;
    append_group(records, "g", Treatment::B, 2, 1, Severity::MILD, "google_search");
    auto crisis = make_crisis_record("c");
    crisis.referral_source = "tiktok_ads";
    records.push_back(crisis);
    auto rows = SegmentAggregator{}.by_referral_source(records);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].referral_source, "google_search");
}

// ===========================================================================
// Treatment profiles
// ===========================================================================

TEST(TreatmentProfileTest, AveragesPerArm) {
    std::vector<InteractionRecord> records;
    records.push_back(make_record("a1", Treatment::A, true, Severity::MILD));       // 0.2
    records.push_back(make_record("a2", Treatment::A, false, Severity::SEVERE));     // -0.6
    records.push_back(make_record("a3", Treatment::A, std::nullopt, Severity::MODERATE));
    records[1].decision_latency_ms = 8000;
    auto profiles = SegmentAggregator{}.treatment_profiles(records);
    ASSERT_EQ(profiles.size(), 2u);
    const auto& a = profiles[0];
    EXPECT_EQ(a.treatment, Treatment::A);
    EXPECT_EQ(a.sessions, 3);
    EXPECT_EQ(a.decided, 2);
    EXPECT_NEAR(a.avg_sentiment, (0.2 - 0.6 - 0.2) / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(a.avg_response_latency_ms, 120.0);
    EXPECT_DOUBLE_EQ(a.avg_decision_latency_ms, 6000.0);
    EXPECT_EQ(profiles[1].sessions, 0);
    EXPECT_DOUBLE_EQ(profiles[1].avg_sentiment, 0.0);
}
