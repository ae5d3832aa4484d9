#pragma once

#include "analysis/statistical_tests.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

// ---------------------------------------------------------------------------
// PowerConfig — planning inputs for the A/B comparison
// ---------------------------------------------------------------------------
struct PowerConfig {
    double alpha = SIGNIFICANCE_ALPHA;
    double power = 0.80;
    Alternative alternative = Alternative::LARGER;
};

// ---------------------------------------------------------------------------
// PowerAnalyzer — sample size and power for a two-proportion z-test
//
// With p̄ = (p1 + p2)/2:
//   n = (z_α sqrt(2 p̄ q̄) + z_β sqrt(p1 q1 + p2 q2))² / (p2 - p1)²   per arm
//   power = Φ((|p2 - p1| sqrt(n) - z_α sqrt(2 p̄ q̄)) / sqrt(p1 q1 + p2 q2))
// ---------------------------------------------------------------------------
class PowerAnalyzer {
public:
    PowerAnalyzer() = default;
    explicit PowerAnalyzer(const PowerConfig& config) : config_(config) {
        if (!(config_.alpha > 0.0 && config_.alpha < 1.0) ||
            !(config_.power > 0.0 && config_.power < 1.0)) {
            throw std::invalid_argument("PowerConfig requires alpha and power in (0, 1)");
        }
    }

    // Sessions per arm to detect B = baseline × (1 + relative_lift). Throws
    // when the requirement does not fit in int64_t.
    int64_t min_sample_size_per_arm(double baseline_rate, double relative_lift) const {
        double p1 = baseline_rate;
        double p2 = baseline_rate * (1.0 + relative_lift);
        check_rates(p1, p2);

        double p_bar = (p1 + p2) / 2.0;
        double null_sd = std::sqrt(2.0 * p_bar * (1.0 - p_bar));
        double alt_sd = std::sqrt(p1 * (1.0 - p1) + p2 * (1.0 - p2));
        double z_alpha = z_from_alpha();
        double z_beta = detail::normal_quantile(config_.power);

        double num = z_alpha * null_sd + z_beta * alt_sd;
        double delta = p2 - p1;
        double n = std::ceil((num * num) / (delta * delta));
        if (!std::isfinite(n) || n >= MAX_SAMPLE_SIZE) {
            throw std::invalid_argument("Relative lift too small: required sample size "
                                        "per arm is out of range");
        }
        return static_cast<int64_t>(n);
    }

    // Power reached with n sessions per arm.
    double compute_power(int64_t sessions_per_arm, double rate_a, double rate_b) const {
        check_rates(rate_a, rate_b);
        if (sessions_per_arm <= 0) return 0.0;

        double p_bar = (rate_a + rate_b) / 2.0;
        double null_sd = std::sqrt(2.0 * p_bar * (1.0 - p_bar));
        double alt_sd = std::sqrt(rate_a * (1.0 - rate_a) + rate_b * (1.0 - rate_b));
        double z = (std::abs(rate_b - rate_a) * std::sqrt(static_cast<double>(sessions_per_arm)) -
                    z_from_alpha() * null_sd) / alt_sd;
        return detail::normal_cdf(z);
    }

    const PowerConfig& config() const { return config_; }

private:
    // 2^62, exactly representable and well inside int64_t.
    static constexpr double MAX_SAMPLE_SIZE = 4611686018427387904.0;

    PowerConfig config_;

    // One-tailed: z for α (0.05 → 1.645). Two-tailed: z for α/2 (0.05 → 1.960).
    double z_from_alpha() const {
        double tail = (config_.alternative == Alternative::LARGER)
            ? config_.alpha
            : config_.alpha / 2.0;
        return detail::normal_quantile(1.0 - tail);
    }

    static void check_rates(double p1, double p2) {
        if (!(p1 > 0.0 && p1 < 1.0) || !(p2 > 0.0 && p2 < 1.0)) {
            throw std::invalid_argument("Power analysis requires both rates in (0, 1)");
        }
        if (p1 == p2) {
            throw std::invalid_argument("Power analysis requires distinct rates");
        }
    }
};
