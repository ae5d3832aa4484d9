#pragma once

#include "analysis/multiple_comparison.hpp"
#include "analysis/segment_breakdown.hpp"
#include "analysis/statistical_tests.hpp"
#include "triage/severity.hpp"

#include <cstddef>
#include <vector>

// ---------------------------------------------------------------------------
// SegmentTest — A/B test inside one severity bucket, with the p-value
// corrected across all buckets tested together.
// ---------------------------------------------------------------------------
struct SegmentTest {
    Severity severity = Severity::MILD;
    double rate_a = 0.0;
    double rate_b = 0.0;
    double z_statistic = 0.0;
    double raw_p_value = 1.0;
    double corrected_p_value = 1.0;
    bool survives_correction = false;
    int sample_count = 0;
};

// One test per severity bucket from the severity × treatment cells.
inline std::vector<SegmentTest> test_by_severity(const std::vector<SeverityCell>& cells,
                                                 Alternative alternative = Alternative::LARGER) {
    std::vector<SegmentTest> tests;
    for (Severity s : severity::ALL) {
        const SeverityCell* a = nullptr;
        const SeverityCell* b = nullptr;
        for (const auto& c : cells) {
            if (c.severity != s) continue;
            if (c.treatment == Treatment::A) a = &c;
            else b = &c;
        }
        SegmentTest t;
        t.severity = s;
        int k_a = a ? a->conversions : 0, n_a = a ? a->sessions : 0;
        int k_b = b ? b->conversions : 0, n_b = b ? b->sessions : 0;
        t.rate_a = segment::safe_rate(k_a, n_a);
        t.rate_b = segment::safe_rate(k_b, n_b);
        t.sample_count = n_a + n_b;
        auto r = two_proportion_z_test(k_a, n_a, k_b, n_b, alternative);
        t.z_statistic = r.statistic;
        t.raw_p_value = r.p_value;
        tests.push_back(t);
    }

    std::vector<double> raw;
    raw.reserve(tests.size());
    for (const auto& t : tests) raw.push_back(t.raw_p_value);
    auto corrected = holm_bonferroni_correct(raw);
    for (size_t i = 0; i < tests.size(); ++i) tests[i].corrected_p_value = corrected[i];
    for (size_t i : surviving_tests(corrected)) tests[i].survives_correction = true;
    return tests;
}
