#pragma once

#include "analysis/statistical_tests.hpp"
#include "store/interaction_record.hpp"

// ---------------------------------------------------------------------------
// AnalysisConfig — conventions applied by every experiment view
// ---------------------------------------------------------------------------
struct AnalysisConfig {
    // How a decision-pending row (converted unset) enters rates.
    enum class PendingPolicy { COUNT_AS_NON_CONVERSION, EXCLUDE };

    // FIXED_BAND is a constant ± band around the lift point estimate. It is
    // an approximation, not a statistical interval. DELTA_METHOD uses the
    // log relative-risk standard error.
    enum class LiftInterval { FIXED_BAND, DELTA_METHOD };

    double confidence = 0.95;
    Alternative alternative = Alternative::LARGER;
    PendingPolicy pending_policy = PendingPolicy::COUNT_AS_NON_CONVERSION;
    LiftInterval lift_interval = LiftInterval::FIXED_BAND;
    double lift_band_half_width = 0.15;
};

namespace analysis {

// Whether the row contributes a trial under the pending policy.
inline bool counts_as_trial(const InteractionRecord& r, AnalysisConfig::PendingPolicy policy) {
    if (policy == AnalysisConfig::PendingPolicy::EXCLUDE) return r.converted.has_value();
    return true;
}

inline bool counts_as_conversion(const InteractionRecord& r) {
    return r.converted.value_or(false);
}

}  // namespace analysis
