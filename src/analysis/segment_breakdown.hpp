#pragma once

#include "analysis/analysis_config.hpp"
#include "store/interaction_record.hpp"
#include "triage/severity.hpp"
#include "triage/treatment.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// View rows (defined at global scope since reports and tests use them directly)
// ---------------------------------------------------------------------------

// total_sessions == experiment_sessions + crisis_excluded for any snapshot.
struct FunnelCounts {
    int total_sessions = 0;
    int experiment_sessions = 0;
    int conversions = 0;
    int crisis_excluded = 0;
    int pending_decisions = 0;
};

struct SummaryStats {
    int total_sessions = 0;
    int total_conversions = 0;
    double overall_rate = 0.0;
    double rate_a = 0.0;
    double rate_b = 0.0;
};

struct SeverityCell {
    Severity severity = Severity::MILD;
    Treatment treatment = Treatment::A;
    int sessions = 0;
    int conversions = 0;
    double rate = 0.0;
};

struct ReferralRow {
    std::string referral_source;
    int sessions = 0;
    int conversions = 0;
    double rate = 0.0;
};

struct TreatmentProfile {
    Treatment treatment = Treatment::A;
    int sessions = 0;
    int decided = 0;
    double avg_sentiment = 0.0;
    double avg_response_latency_ms = 0.0;
    double avg_decision_latency_ms = 0.0;  // over rows with a recorded decision
};

namespace segment {

inline double safe_rate(int conversions, int sessions) {
    return sessions > 0 ? static_cast<double>(conversions) / sessions : 0.0;
}

}  // namespace segment

// ---------------------------------------------------------------------------
// SegmentAggregator — group-by views over a record snapshot
//
// Funnel counts cover every row. The rate views cover the in-experiment
// subset and respect the pending policy.
// ---------------------------------------------------------------------------
class SegmentAggregator {
public:
    SegmentAggregator() = default;
    explicit SegmentAggregator(AnalysisConfig::PendingPolicy policy) : policy_(policy) {}

    FunnelCounts funnel(const std::vector<InteractionRecord>& records) const {
        FunnelCounts f;
        for (const auto& r : records) {
            ++f.total_sessions;
            if (r.is_crisis_excluded()) {
                ++f.crisis_excluded;
                continue;
            }
            ++f.experiment_sessions;
            if (analysis::counts_as_conversion(r)) ++f.conversions;
            if (!r.converted.has_value()) ++f.pending_decisions;
        }
        return f;
    }

    SummaryStats summary(const std::vector<InteractionRecord>& records) const {
        SummaryStats s;
        s.total_sessions = static_cast<int>(records.size());
        int n = 0, n_a = 0, k_a = 0, n_b = 0, k_b = 0;
        for (const auto& r : records) {
            if (!sampled(r)) continue;
            bool conv = analysis::counts_as_conversion(r);
            ++n;
            if (conv) ++s.total_conversions;
            if (*r.assigned_treatment == Treatment::A) {
                ++n_a;
                if (conv) ++k_a;
            } else {
                ++n_b;
                if (conv) ++k_b;
            }
        }
        s.overall_rate = segment::safe_rate(s.total_conversions, n);
        s.rate_a = segment::safe_rate(k_a, n_a);
        s.rate_b = segment::safe_rate(k_b, n_b);
        return s;
    }

    // All six cells, ordered by severity then treatment; empty cells keep
    // rate 0.
    std::vector<SeverityCell> by_severity_and_treatment(
            const std::vector<InteractionRecord>& records) const {
        std::map<std::pair<Severity, Treatment>, std::pair<int, int>> counts;
        for (const auto& r : records) {
            if (!sampled(r)) continue;
            auto& c = counts[{r.severity, *r.assigned_treatment}];
            ++c.first;
            if (analysis::counts_as_conversion(r)) ++c.second;
        }

        std::vector<SeverityCell> cells;
        cells.reserve(6);
        for (Severity s : severity::ALL) {
            for (Treatment t : treatment::ALL) {
                SeverityCell cell;
                cell.severity = s;
                cell.treatment = t;
                auto it = counts.find({s, t});
                if (it != counts.end()) {
                    cell.sessions = it->second.first;
                    cell.conversions = it->second.second;
                }
                cell.rate = segment::safe_rate(cell.conversions, cell.sessions);
                cells.push_back(cell);
            }
        }
        return cells;
    }

    // Descending by sessions; ties broken by source name.
    std::vector<ReferralRow> by_referral_source(
            const std::vector<InteractionRecord>& records) const {
        std::map<std::string, ReferralRow> rows;
        for (const auto& r : records) {
            if (!sampled(r)) continue;
            auto& row = rows[r.referral_source];
            row.referral_source = r.referral_source;
            ++row.sessions;
            if (analysis::counts_as_conversion(r)) ++row.conversions;
        }

        std::vector<ReferralRow> out;
        out.reserve(rows.size());
        for (auto& [source, row] : rows) {
            row.rate = segment::safe_rate(row.conversions, row.sessions);
            out.push_back(row);
        }
        std::stable_sort(out.begin(), out.end(), [](const ReferralRow& a, const ReferralRow& b) {
            return a.sessions > b.sessions;
        });
        return out;
    }

    std::vector<TreatmentProfile> treatment_profiles(
            const std::vector<InteractionRecord>& records) const {
        std::vector<TreatmentProfile> out;
        for (Treatment t : treatment::ALL) {
            TreatmentProfile p;
            p.treatment = t;
            double sentiment_sum = 0.0;
            double response_sum = 0.0;
            double decision_sum = 0.0;
            int decision_n = 0;
            for (const auto& r : records) {
                if (!sampled(r) || *r.assigned_treatment != t) continue;
                ++p.sessions;
                sentiment_sum += r.sentiment_score;
                response_sum += static_cast<double>(r.response_latency_ms);
                if (r.converted.has_value()) ++p.decided;
                if (r.decision_latency_ms) {
                    decision_sum += static_cast<double>(*r.decision_latency_ms);
                    ++decision_n;
                }
            }
            if (p.sessions > 0) {
                p.avg_sentiment = sentiment_sum / p.sessions;
                p.avg_response_latency_ms = response_sum / p.sessions;
            }
            if (decision_n > 0) p.avg_decision_latency_ms = decision_sum / decision_n;
            out.push_back(p);
        }
        return out;
    }

private:
    AnalysisConfig::PendingPolicy policy_ = AnalysisConfig::PendingPolicy::COUNT_AS_NON_CONVERSION;

    bool sampled(const InteractionRecord& r) const {
        return r.in_experiment() && analysis::counts_as_trial(r, policy_);
    }
};
