#pragma once

#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// Severity — coarse three-level bucket derived from a sentiment score
// ---------------------------------------------------------------------------
enum class Severity { MILD, MODERATE, SEVERE };

namespace severity {

constexpr double SEVERE_BELOW = -0.5;
constexpr double MODERATE_BELOW = 0.0;

// score < -0.5 → SEVERE, -0.5 <= score < 0 → MODERATE, score >= 0 → MILD.
inline Severity classify(double sentiment_score) {
    if (sentiment_score < SEVERE_BELOW) return Severity::SEVERE;
    if (sentiment_score < MODERATE_BELOW) return Severity::MODERATE;
    return Severity::MILD;
}

inline std::string to_string(Severity s) {
    switch (s) {
        case Severity::MILD:     return "mild";
        case Severity::MODERATE: return "moderate";
        case Severity::SEVERE:   return "severe";
    }
    return "unknown";
}

inline std::optional<Severity> parse(const std::string& s) {
    if (s == "mild") return Severity::MILD;
    if (s == "moderate") return Severity::MODERATE;
    if (s == "severe") return Severity::SEVERE;
    return std::nullopt;
}

constexpr Severity ALL[] = {Severity::MILD, Severity::MODERATE, Severity::SEVERE};

}  // namespace severity
