// synthetic_population_test.cpp — Tests for the seeded demo population

#include <gtest/gtest.h>

#include "analysis/experiment_analyzer.hpp"
#include "store/event_store.hpp"
#include "synth/synthetic_population.hpp"

#include <set>
#include <string>
#include <vector>

TEST(SyntheticPopulationTest, DefaultSizeAndValidRows) {
    auto records = SyntheticPopulation{}.generate();
    ASSERT_EQ(records.size(), 500u);
    for (const auto& r : records) {
        EXPECT_NO_THROW(record::validate(r)) << r.session_id;
    }
}

TEST(SyntheticPopulationTest, SessionIdsUnique) {
    auto records = SyntheticPopulation{}.generate();
    std::set<std::string> ids;
    for (const auto& r : records) ids.insert(r.session_id);
    EXPECT_EQ(ids.size(), records.size());
    EXPECT_NO_THROW(InMemoryEventStore{records});
}

TEST(SyntheticPopulationTest, SameSeedSamePopulation) {
    auto a = SyntheticPopulation{}.generate();
    auto b = SyntheticPopulation{}.generate();
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].session_id, b[i].session_id);
        EXPECT_DOUBLE_EQ(a[i].sentiment_score, b[i].sentiment_score);
        EXPECT_EQ(a[i].converted, b[i].converted);
    }
}

TEST(SyntheticPopulationTest, DifferentSeedDiffers) {
    SyntheticConfig cfg;
    cfg.seed = 43;
    auto a = SyntheticPopulation{}.generate();
    auto b = SyntheticPopulation{cfg}.generate();
    EXPECT_NE(a.front().session_id, b.front().session_id);
}

TEST(SyntheticPopulationTest, SentimentMatchesSeverityForExperimentRows) {
    for (const auto& r : SyntheticPopulation{}.generate()) {
        if (!r.in_experiment()) continue;
        EXPECT_EQ(severity::classify(r.sentiment_score), r.severity) << r.sentiment_score;
        EXPECT_GE(r.sentiment_score, -0.8);
        EXPECT_LT(r.sentiment_score, 1.0);
    }
}

TEST(SyntheticPopulationTest, TimestampsInsideWindow) {
    for (const auto& r : SyntheticPopulation{}.generate()) {
        EXPECT_GE(r.timestamp, "2026-01-01T00:00:00Z");
        EXPECT_LE(r.timestamp, "2026-01-16T00:00:00Z");
    }
}

TEST(SyntheticPopulationTest, CrisisRateExtremes) {
    SyntheticConfig none;
    none.crisis_rate = 0.0;
    for (const auto& r : SyntheticPopulation{none}.generate()) {
        EXPECT_FALSE(r.is_crisis_excluded());
    }
    SyntheticConfig all;
    all.crisis_rate = 1.0;
    all.num_records = 100;
    for (const auto& r : SyntheticPopulation{all}.generate()) {
        EXPECT_TRUE(r.is_crisis_excluded());
        EXPECT_FALSE(r.converted.has_value());
    }
}

TEST(SyntheticPopulationTest, PendingRateLeavesRowsUndecided) {
    SyntheticConfig cfg;
    cfg.pending_rate = 1.0;
    cfg.crisis_rate = 0.0;
    cfg.num_records = 100;
    for (const auto& r : SyntheticPopulation{cfg}.generate()) {
        EXPECT_FALSE(r.converted.has_value());
        EXPECT_FALSE(r.decision_latency_ms.has_value());
    }
}

TEST(SyntheticPopulationTest, LatenciesWithinRanges) {
    for (const auto& r : SyntheticPopulation{}.generate()) {
        EXPECT_GE(r.response_latency_ms, 50);
        EXPECT_LE(r.response_latency_ms, 500);
        if (r.decision_latency_ms) {
            EXPECT_GE(*r.decision_latency_ms, 1000);
            EXPECT_LE(*r.decision_latency_ms, 30000);
        }
    }
}

TEST(SyntheticPopulationTest, LargePopulationFavorsEmpathetic) {
    SyntheticConfig cfg;
    cfg.num_records = 5000;
    auto records = SyntheticPopulation{cfg}.generate();
    auto result = ExperimentAnalyzer{}.analyze(records);
    EXPECT_GT(result.group_b.rate, result.group_a.rate);
    EXPECT_EQ(result.recommendation, Recommendation::ADOPT_B);
}

TEST(SyntheticPopulationTest, InvalidConfigThrows) {
    SyntheticConfig cfg;
    cfg.num_records = -1;
    EXPECT_THROW(SyntheticPopulation{cfg}, std::invalid_argument);
    SyntheticConfig window;
    window.end_epoch = window.start_epoch - 1;
    EXPECT_THROW(SyntheticPopulation{window}, std::invalid_argument);
}
