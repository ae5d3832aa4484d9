// event_store_test.cpp — Tests for record validation and the in-memory store

#include <gtest/gtest.h>

#include "store/event_store.hpp"
#include "test_helpers.hpp"

#include <string>
#include <thread>
#include <vector>

namespace {

using test_helpers::make_crisis_record;
using test_helpers::make_record;

}  // anonymous namespace

// ===========================================================================
// record::validate
// ===========================================================================

TEST(RecordValidateTest, WellFormedRowsPass) {
    EXPECT_NO_THROW(record::validate(make_record("a", Treatment::A, true)));
    EXPECT_NO_THROW(record::validate(make_record("p", Treatment::B, std::nullopt)));
    EXPECT_NO_THROW(record::validate(make_crisis_record("c")));
}

TEST(RecordValidateTest, CrisisRowWithTreatmentRejected) {
    auto r = make_crisis_record("c");
    r.assigned_treatment = Treatment::A;
    EXPECT_THROW(record::validate(r), std::invalid_argument);
}

TEST(RecordValidateTest, ExperimentRowWithoutTreatmentRejected) {
    auto r = make_record("a", Treatment::A, std::nullopt);
    r.assigned_treatment.reset();
    EXPECT_THROW(record::validate(r), std::invalid_argument);
}

TEST(RecordValidateTest, CrisisRowWithOutcomeRejected) {
    auto r = make_crisis_record("c");
    r.converted = false;
    EXPECT_THROW(record::validate(r), std::invalid_argument);
}

TEST(RecordValidateTest, UnknownExclusionReasonRejected) {
    auto r = make_record("a", Treatment::A, true);
    r.exclusion_reason = "bot_traffic";
    EXPECT_THROW(record::validate(r), std::invalid_argument);
}

TEST(RecordValidateTest, EmptyIdAndNegativeLatencyRejected) {
    EXPECT_THROW(record::validate(make_record("", Treatment::A, true)), std::invalid_argument);
    auto r = make_record("a", Treatment::A, true);
    r.response_latency_ms = -1;
    EXPECT_THROW(record::validate(r), std::invalid_argument);
}

TEST(RecordFromAnalysisTest, CrisisResultBecomesExcludedRow) {
    AnalysisResult result;
    result.sentiment_score = -0.9;
    result.severity = Severity::SEVERE;
    result.is_crisis = true;
    auto r = record::from_analysis(result, "s1", "2026-01-02T03:04:05Z", 42, "referral");
    EXPECT_TRUE(r.is_crisis_excluded());
    EXPECT_FALSE(r.in_experiment());
    EXPECT_FALSE(r.converted.has_value());
    EXPECT_EQ(r.response_latency_ms, 42);
    EXPECT_EQ(r.referral_source, "referral");
    EXPECT_NO_THROW(record::validate(r));
}

TEST(RecordFromAnalysisTest, ExperimentResultStartsPending) {
    AnalysisResult result;
    result.sentiment_score = 0.3;
    result.assigned_treatment = Treatment::B;
    auto r = record::from_analysis(result, "s2", "2026-01-02T03:04:05Z", 10, "direct");
    EXPECT_TRUE(r.in_experiment());
    EXPECT_FALSE(r.converted.has_value());
    EXPECT_FALSE(r.decision_latency_ms.has_value());
}

// ===========================================================================
// InMemoryEventStore
// ===========================================================================

class EventStoreTest : public ::testing::Test {
protected:
    InMemoryEventStore store_;
};

TEST_F(EventStoreTest, AppendReturnsSequentialRowIds) {
    EXPECT_EQ(store_.append(make_record("a", Treatment::A, std::nullopt)), 1u);
    EXPECT_EQ(store_.append(make_crisis_record("c")), 2u);
    EXPECT_EQ(store_.size(), 2u);
}

TEST_F(EventStoreTest, QueryPreservesAppendOrder) {
    store_.append(make_record("first", Treatment::A, true));
    store_.append(make_record("second", Treatment::B, false));
    auto all = store_.query_all();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].session_id, "first");
    EXPECT_EQ(all[1].session_id, "second");
}

TEST_F(EventStoreTest, DuplicateSessionRejected) {
    store_.append(make_record("a", Treatment::A, std::nullopt));
    EXPECT_THROW(store_.append(make_record("a", Treatment::B, std::nullopt)),
                 std::invalid_argument);
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(EventStoreTest, InvalidRecordNotStored) {
    auto bad = make_crisis_record("c");
    bad.assigned_treatment = Treatment::B;
    EXPECT_THROW(store_.append(bad), std::invalid_argument);
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(EventStoreTest, UpdateOutcomeFillsDecision) {
    store_.append(make_record("a", Treatment::A, std::nullopt));
    store_.update_outcome("a", true, 5300);
    auto r = store_.query_all().front();
    ASSERT_TRUE(r.converted.has_value());
    EXPECT_TRUE(*r.converted);
    EXPECT_EQ(r.decision_latency_ms, 5300);
}

TEST_F(EventStoreTest, OutcomeAppliesOnce) {
    store_.append(make_record("a", Treatment::A, std::nullopt));
    store_.update_outcome("a", false, 1200);
    EXPECT_THROW(store_.update_outcome("a", true, 900), std::runtime_error);
    EXPECT_FALSE(*store_.query_all().front().converted);
}

TEST_F(EventStoreTest, OutcomeForUnknownSessionRejected) {
    EXPECT_THROW(store_.update_outcome("missing", true, 10), std::runtime_error);
}

TEST_F(EventStoreTest, OutcomeForCrisisSessionRejected) {
    store_.append(make_crisis_record("c"));
    EXPECT_THROW(store_.update_outcome("c", true, 10), std::runtime_error);
}

TEST_F(EventStoreTest, NegativeDecisionLatencyRejected) {
    store_.append(make_record("a", Treatment::A, std::nullopt));
    EXPECT_THROW(store_.update_outcome("a", true, -5), std::invalid_argument);
    EXPECT_FALSE(store_.query_all().front().converted.has_value());
}

TEST_F(EventStoreTest, SnapshotIsIndependentCopy) {
    store_.append(make_record("a", Treatment::A, std::nullopt));
    auto before = store_.query_all();
    store_.update_outcome("a", true, 100);
    EXPECT_FALSE(before.front().converted.has_value());
}

TEST_F(EventStoreTest, ConcurrentAppendsAllLand) {
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 250;
    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([this, t] {
            for (int i = 0; i < PER_THREAD; ++i) {
                store_.append(make_record("t" + std::to_string(t) + "-" + std::to_string(i),
                                          Treatment::A, std::nullopt));
            }
        });
    }
    for (auto& w : workers) w.join();
    EXPECT_EQ(store_.size(), static_cast<size_t>(THREADS * PER_THREAD));
}

TEST(EventStoreSeedTest, SeedRowsAreValidated) {
    std::vector<InteractionRecord> seed = {make_record("a", Treatment::A, true),
                                           make_record("a", Treatment::B, true)};
    EXPECT_THROW(InMemoryEventStore{seed}, std::invalid_argument);
}
