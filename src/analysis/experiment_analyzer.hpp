#pragma once

#include "analysis/analysis_config.hpp"
#include "analysis/rate_estimator.hpp"
#include "analysis/segment_breakdown.hpp"
#include "analysis/segment_significance.hpp"
#include "analysis/statistical_tests.hpp"
#include "store/event_store.hpp"
#include "store/interaction_record.hpp"

#include <cmath>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Recommendation — decision policy over (is_significant, sign of lift)
// ---------------------------------------------------------------------------
enum class Recommendation { ADOPT_B, KEEP_A, CONTINUE_COLLECTING };

namespace recommendation {

// Zero lift with a significant result falls through to CONTINUE_COLLECTING.
inline Recommendation decide(bool is_significant, double relative_lift) {
    if (is_significant && relative_lift > 0.0) return Recommendation::ADOPT_B;
    if (is_significant && relative_lift < 0.0) return Recommendation::KEEP_A;
    return Recommendation::CONTINUE_COLLECTING;
}

inline std::string message(Recommendation r) {
    switch (r) {
        case Recommendation::ADOPT_B:
            return "Variant B (Empathetic) significantly outperforms Variant A. "
                   "Recommend rolling out Empathetic responses.";
        case Recommendation::KEEP_A:
            return "Variant A (Clinical) significantly outperforms Variant B. "
                   "Recommend keeping Clinical responses.";
        case Recommendation::CONTINUE_COLLECTING:
            return "No statistically significant difference detected. "
                   "Continue experiment to gather more data.";
    }
    return "";
}

inline std::string to_string(Recommendation r) {
    switch (r) {
        case Recommendation::ADOPT_B:             return "ADOPT_B";
        case Recommendation::KEEP_A:              return "KEEP_A";
        case Recommendation::CONTINUE_COLLECTING: return "CONTINUE_COLLECTING";
    }
    return "UNKNOWN";
}

}  // namespace recommendation

// ---------------------------------------------------------------------------
// ExperimentResult — A/B comparison over one population snapshot
// ---------------------------------------------------------------------------
struct ExperimentResult {
    GroupStat group_a;
    GroupStat group_b;
    double relative_lift = 0.0;
    double lift_ci_lower = 0.0;
    double lift_ci_upper = 0.0;
    double z_statistic = 0.0;
    double p_value = 1.0;
    bool is_significant = false;
    Recommendation recommendation = Recommendation::CONTINUE_COLLECTING;
};

// Everything the dashboard needs from one snapshot.
struct ExperimentReport {
    ExperimentResult result;
    FunnelCounts funnel;
    SummaryStats summary;
    std::vector<SeverityCell> severity_breakdown;
    std::vector<ReferralRow> referral_breakdown;
    std::vector<TreatmentProfile> treatment_profiles;
    std::vector<SegmentTest> severity_tests;
};

// ---------------------------------------------------------------------------
// ExperimentAnalyzer — read-only batch computation over a record snapshot
// ---------------------------------------------------------------------------
class ExperimentAnalyzer {
public:
    ExperimentAnalyzer() = default;
    explicit ExperimentAnalyzer(const AnalysisConfig& config) : config_(config) {}

    ExperimentResult analyze(const std::vector<InteractionRecord>& records) const {
        int n_a = 0, k_a = 0, n_b = 0, k_b = 0;
        for (const auto& r : records) {
            if (!r.in_experiment()) continue;
            if (!analysis::counts_as_trial(r, config_.pending_policy)) continue;
            bool conv = analysis::counts_as_conversion(r);
            if (*r.assigned_treatment == Treatment::A) {
                ++n_a;
                if (conv) ++k_a;
            } else {
                ++n_b;
                if (conv) ++k_b;
            }
        }

        ExperimentResult res;
        res.group_a = estimate_rate(k_a, n_a, config_.confidence);
        res.group_b = estimate_rate(k_b, n_b, config_.confidence);

        res.relative_lift = (res.group_a.rate > 0.0)
            ? (res.group_b.rate - res.group_a.rate) / res.group_a.rate
            : 0.0;
        compute_lift_interval(res);

        auto test = two_proportion_z_test(k_a, n_a, k_b, n_b, config_.alternative);
        res.z_statistic = test.statistic;
        res.p_value = test.p_value;
        res.is_significant = is_significant(test.p_value);
        res.recommendation = recommendation::decide(res.is_significant, res.relative_lift);
        return res;
    }

    ExperimentResult analyze(const EventStore& store) const {
        return analyze(store.query_all());
    }

    ExperimentReport report(const std::vector<InteractionRecord>& records) const {
        SegmentAggregator agg(config_.pending_policy);
        ExperimentReport rep;
        rep.result = analyze(records);
        rep.funnel = agg.funnel(records);
        rep.summary = agg.summary(records);
        rep.severity_breakdown = agg.by_severity_and_treatment(records);
        rep.referral_breakdown = agg.by_referral_source(records);
        rep.treatment_profiles = agg.treatment_profiles(records);
        rep.severity_tests = test_by_severity(rep.severity_breakdown, config_.alternative);
        return rep;
    }

    const AnalysisConfig& config() const { return config_; }

private:
    AnalysisConfig config_;

    void compute_lift_interval(ExperimentResult& res) const {
        const auto& a = res.group_a;
        const auto& b = res.group_b;
        if (config_.lift_interval == AnalysisConfig::LiftInterval::DELTA_METHOD &&
            a.conversions > 0 && b.conversions > 0) {
            // Var(log RR) ≈ (1 - p_a)/k_a + (1 - p_b)/k_b
            double se = std::sqrt((1.0 - a.rate) / a.conversions +
                                  (1.0 - b.rate) / b.conversions);
            double z = detail::normal_quantile(1.0 - (1.0 - config_.confidence) / 2.0);
            double log_rr = std::log(b.rate / a.rate);
            res.lift_ci_lower = std::exp(log_rr - z * se) - 1.0;
            res.lift_ci_upper = std::exp(log_rr + z * se) - 1.0;
            return;
        }
        // Approximation: fixed band around the point estimate, no coverage
        // guarantee.
        res.lift_ci_lower = res.relative_lift - config_.lift_band_half_width;
        res.lift_ci_upper = res.relative_lift + config_.lift_band_half_width;
    }
};
