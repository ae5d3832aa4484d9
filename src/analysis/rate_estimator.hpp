#pragma once

#include "analysis/statistical_tests.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

// ---------------------------------------------------------------------------
// GroupStat — conversion summary for one group of trials
// ---------------------------------------------------------------------------
struct GroupStat {
    int sessions = 0;
    int conversions = 0;
    double rate = 0.0;
    double ci_lower = 0.0;
    double ci_upper = 0.0;
};

// ---------------------------------------------------------------------------
// Wilson score interval for a binomial proportion
//
//   z      = Φ⁻¹(1 - α/2)
//   center = (k + z²/2) / (n + z²)
//   half   = z sqrt(p̂(1-p̂)/n + z²/(4n²)) / (1 + z²/n)
//
// Stays inside [0, 1] and behaves near 0 and 1, unlike the Wald interval.
// n = 0 is "no data yet" and yields all zeros.
// ---------------------------------------------------------------------------
inline GroupStat estimate_rate(int conversions, int sessions, double confidence = 0.95) {
    if (sessions < 0 || conversions < 0 || conversions > sessions) {
        throw std::invalid_argument("estimate_rate requires 0 <= conversions <= sessions");
    }
    if (!(confidence > 0.0 && confidence < 1.0)) {
        throw std::invalid_argument("estimate_rate requires 0 < confidence < 1");
    }

    GroupStat g;
    g.sessions = sessions;
    g.conversions = conversions;
    if (sessions == 0) return g;

    double n = static_cast<double>(sessions);
    double p = conversions / n;
    double alpha = 1.0 - confidence;
    double z = detail::normal_quantile(1.0 - alpha / 2.0);
    double z2 = z * z;

    double center = (conversions + z2 / 2.0) / (n + z2);
    double half = z * std::sqrt(p * (1.0 - p) / n + z2 / (4.0 * n * n)) / (1.0 + z2 / n);

    g.rate = p;
    // Clamp away rounding at k = 0 and k = n, where one bound equals p exactly.
    g.ci_lower = std::min(p, std::max(0.0, center - half));
    g.ci_upper = std::max(p, std::min(1.0, center + half));
    return g;
}
