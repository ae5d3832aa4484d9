#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>

// ---------------------------------------------------------------------------
// Treatment — the two response styles under test
// ---------------------------------------------------------------------------
enum class Treatment { A, B };

namespace treatment {

inline std::string to_string(Treatment t) {
    switch (t) {
        case Treatment::A: return "A_CLINICAL";
        case Treatment::B: return "B_EMPATHETIC";
    }
    return "UNKNOWN";
}

inline std::optional<Treatment> parse(const std::string& s) {
    if (s == "A_CLINICAL" || s == "A") return Treatment::A;
    if (s == "B_EMPATHETIC" || s == "B") return Treatment::B;
    return std::nullopt;
}

constexpr Treatment ALL[] = {Treatment::A, Treatment::B};

}  // namespace treatment

// ---------------------------------------------------------------------------
// TreatmentAssigner — source of independent fair A/B draws
// ---------------------------------------------------------------------------
class TreatmentAssigner {
public:
    virtual ~TreatmentAssigner() = default;
    virtual Treatment assign() = 0;
};

// Fixed 50/50 split. The engine is shared across requests, so draws are
// serialized; each call is still an independent Bernoulli(0.5) trial.
class RandomTreatmentAssigner : public TreatmentAssigner {
public:
    RandomTreatmentAssigner() : rng_(std::random_device{}()) {}
    explicit RandomTreatmentAssigner(uint32_t seed) : rng_(seed) {}

    Treatment assign() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return coin_(rng_) ? Treatment::B : Treatment::A;
    }

private:
    std::mutex mutex_;
    std::mt19937 rng_;
    std::bernoulli_distribution coin_{0.5};
};
