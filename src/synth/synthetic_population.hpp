#pragma once

#include "intake/intake.hpp"
#include "store/interaction_record.hpp"
#include "time_utils.hpp"
#include "triage/severity.hpp"
#include "triage/treatment.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// SyntheticConfig — demo population parameters
//
// Defaults reproduce the demo dataset: B converts better than A, most of all
// for severe sessions, and ~2% of sessions trip the crisis protocol.
// ---------------------------------------------------------------------------
struct SyntheticConfig {
    int num_records = 500;
    uint32_t seed = 42;
    int64_t start_epoch = time_utils::EPOCH_2026_01_01;
    int64_t end_epoch = time_utils::EPOCH_2026_01_01 + 15 * time_utils::SEC_PER_DAY;
    double crisis_rate = 0.02;
    double pending_rate = 0.0;  // non-crisis sessions left undecided

    std::array<double, 3> severity_weights = {0.30, 0.45, 0.25};  // mild, moderate, severe

    // [treatment][severity]
    std::array<std::array<double, 3>, 2> conversion_rates = {{
        {0.12, 0.18, 0.22},
        {0.15, 0.25, 0.35},
    }};

    std::vector<std::pair<std::string, double>> referral_weights = {
        {"google_search", 0.30},
        {"facebook_ads", 0.20},
        {"instagram_ads", 0.15},
        {"direct", 0.15},
        {"referral", 0.10},
        {"email_campaign", 0.05},
        {"tiktok_ads", 0.05},
    };
};

// ---------------------------------------------------------------------------
// SyntheticPopulation — seeded generator of InteractionRecords
//
// Every generated row satisfies record::validate(). Non-crisis sentiment is
// drawn inside its severity bucket and above the crisis threshold, so each
// row is one the triage engine could have produced.
// ---------------------------------------------------------------------------
class SyntheticPopulation {
public:
    explicit SyntheticPopulation(const SyntheticConfig& config = SyntheticConfig{})
        : config_(config), rng_(config.seed) {
        if (config_.num_records < 0) {
            throw std::invalid_argument("num_records must be >= 0");
        }
        if (config_.end_epoch < config_.start_epoch) {
            throw std::invalid_argument("end_epoch must not precede start_epoch");
        }
        if (config_.referral_weights.empty()) {
            throw std::invalid_argument("referral_weights must not be empty");
        }
    }

    std::vector<InteractionRecord> generate() {
        std::vector<InteractionRecord> records;
        records.reserve(static_cast<size_t>(config_.num_records));
        for (int i = 0; i < config_.num_records; ++i) {
            records.push_back(chance(config_.crisis_rate) ? crisis_row() : experiment_row());
        }
        return records;
    }

private:
    SyntheticConfig config_;
    std::mt19937 rng_;

    struct SentimentParams { double mean, sd, lo, hi; };

    static SentimentParams sentiment_params(Severity s) {
        switch (s) {
            case Severity::MILD:     return {0.1, 0.25, 0.0, 1.0};
            case Severity::MODERATE: return {-0.3, 0.20, -0.5, 0.0};
            case Severity::SEVERE:   return {-0.6, 0.15, -0.8, -0.5};
        }
        return {0.0, 0.0, 0.0, 0.0};
    }

    static size_t index(Severity s) {
        switch (s) {
            case Severity::MILD:     return 0;
            case Severity::MODERATE: return 1;
            case Severity::SEVERE:   return 2;
        }
        return 0;
    }

    bool chance(double p) {
        return std::bernoulli_distribution(std::clamp(p, 0.0, 1.0))(rng_);
    }

    double uniform(double lo, double hi) {
        return std::uniform_real_distribution<double>(lo, hi)(rng_);
    }

    // Normal(mean, sd) restricted to [lo, hi); falls back to uniform after
    // repeated rejection.
    double truncated_normal(const SentimentParams& p) {
        std::normal_distribution<double> dist(p.mean, p.sd);
        for (int attempt = 0; attempt < 100; ++attempt) {
            double v = dist(rng_);
            if (v >= p.lo && v < p.hi) return v;
        }
        return uniform(p.lo, p.hi);
    }

    // Triangular(lo, mode, hi) via a piecewise linear density.
    double triangular(double lo, double mode, double hi) {
        std::array<double, 3> knots = {lo, mode, hi};
        std::array<double, 3> density = {0.0, 1.0, 0.0};
        std::piecewise_linear_distribution<double> dist(knots.begin(), knots.end(),
                                                        density.begin());
        return dist(rng_);
    }

    InteractionRecord base_row() {
        InteractionRecord r;
        r.session_id = intake::generate_session_id(rng_);
        std::uniform_int_distribution<int64_t> ts(config_.start_epoch, config_.end_epoch);
        r.timestamp = time_utils::to_iso8601(ts(rng_));
        r.response_latency_ms = response_latency();
        r.referral_source = referral_source();
        return r;
    }

    InteractionRecord crisis_row() {
        InteractionRecord r = base_row();
        double score = std::normal_distribution<double>(-0.6, 0.15)(rng_) - 0.3;
        r.sentiment_score = std::clamp(score, -1.0, 1.0);
        r.severity = severity::classify(r.sentiment_score);
        r.exclusion_reason = exclusion_reason::CRISIS_PROTOCOL;
        return r;
    }

    InteractionRecord experiment_row() {
        InteractionRecord r = base_row();

        const auto& w = config_.severity_weights;
        std::discrete_distribution<int> pick_severity(w.begin(), w.end());
        r.severity = severity::ALL[pick_severity(rng_)];
        r.sentiment_score = truncated_normal(sentiment_params(r.severity));

        Treatment t = chance(0.5) ? Treatment::B : Treatment::A;
        r.assigned_treatment = t;

        if (chance(config_.pending_rate)) return r;

        size_t ti = (t == Treatment::A) ? 0 : 1;
        bool converted = chance(config_.conversion_rates[ti][index(r.severity)]);
        r.converted = converted;
        r.decision_latency_ms = decision_latency(r.severity, converted);
        return r;
    }

    int64_t response_latency() {
        if (chance(0.95)) return static_cast<int64_t>(uniform(50.0, 200.0));
        return static_cast<int64_t>(uniform(200.0, 500.0));
    }

    // More severe sessions deliberate longer. Conversions cluster toward the
    // upper middle; non-conversions are either a quick bounce or a long
    // deliberation.
    int64_t decision_latency(Severity s, bool converted) {
        double lo = 0.0, hi = 0.0;
        switch (s) {
            case Severity::MILD:     lo = 3000.0; hi = 8000.0; break;
            case Severity::MODERATE: lo = 5000.0; hi = 15000.0; break;
            case Severity::SEVERE:   lo = 8000.0; hi = 25000.0; break;
        }
        if (converted) return static_cast<int64_t>(triangular(lo, hi * 0.7, hi));
        if (chance(0.4)) return static_cast<int64_t>(uniform(1000.0, lo));
        return static_cast<int64_t>(uniform(lo, hi * 1.2));
    }

    std::string referral_source() {
        std::vector<double> weights;
        weights.reserve(config_.referral_weights.size());
        for (const auto& [name, weight] : config_.referral_weights) weights.push_back(weight);
        std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
        return config_.referral_weights[pick(rng_)].first;
    }
};
