#pragma once

#include "analysis/statistical_tests.hpp"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <vector>

// ---------------------------------------------------------------------------
// Holm-Bonferroni step-down correction
//
// The i-th smallest of m p-values is scaled by (m - i), capped at 1, and
// carried up to the running maximum so the adjusted sequence never
// decreases. Output is in input order.
// ---------------------------------------------------------------------------
inline std::vector<double> holm_bonferroni_correct(const std::vector<double>& raw) {
    const size_t m = raw.size();
    std::vector<size_t> ascending(m);
    std::iota(ascending.begin(), ascending.end(), 0);
    std::stable_sort(ascending.begin(), ascending.end(),
                     [&](size_t a, size_t b) { return raw[a] < raw[b]; });

    std::vector<double> corrected(m, 1.0);
    double floor = 0.0;
    for (size_t step = 0; step < m; ++step) {
        size_t idx = ascending[step];
        double scaled = raw[idx] * static_cast<double>(m - step);
        floor = std::max(floor, std::min(1.0, scaled));
        corrected[idx] = floor;
    }
    return corrected;
}

// Indices whose corrected p-value rejects at SIGNIFICANCE_ALPHA.
inline std::vector<size_t> surviving_tests(const std::vector<double>& corrected) {
    std::vector<size_t> out;
    for (size_t i = 0; i < corrected.size(); ++i) {
        if (is_significant(corrected[i])) out.push_back(i);
    }
    return out;
}
