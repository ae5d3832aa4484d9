#pragma once

#include "triage/severity.hpp"
#include "triage/treatment.hpp"
#include "triage/triage_engine.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace exclusion_reason {
    inline const std::string CRISIS_PROTOCOL = "crisis_protocol";
}  // namespace exclusion_reason

// ---------------------------------------------------------------------------
// InteractionRecord — persisted form of one triage session
//
// converted: nullopt = decision pending, true/false = decided.
// exclusion_reason == "crisis_protocol" exactly when assigned_treatment is
// empty.
// ---------------------------------------------------------------------------
struct InteractionRecord {
    std::string session_id;
    std::string timestamp;  // ISO-8601 UTC
    double sentiment_score = 0.0;
    Severity severity = Severity::MILD;
    std::optional<Treatment> assigned_treatment;
    int64_t response_latency_ms = 0;
    std::optional<int64_t> decision_latency_ms;
    std::optional<bool> converted;
    std::optional<std::string> exclusion_reason;
    std::string referral_source = "direct";

    bool is_crisis_excluded() const {
        return exclusion_reason && *exclusion_reason == exclusion_reason::CRISIS_PROTOCOL;
    }

    bool in_experiment() const {
        return !exclusion_reason && assigned_treatment.has_value();
    }
};

namespace record {

// Throws std::invalid_argument when the record breaks the schema.
inline void validate(const InteractionRecord& r) {
    if (r.session_id.empty()) {
        throw std::invalid_argument("InteractionRecord requires a session_id");
    }
    if (r.exclusion_reason && *r.exclusion_reason != exclusion_reason::CRISIS_PROTOCOL) {
        throw std::invalid_argument("Unknown exclusion_reason '" + *r.exclusion_reason +
                                    "' for session " + r.session_id);
    }
    if (r.is_crisis_excluded() == r.assigned_treatment.has_value()) {
        throw std::invalid_argument(
            "Session " + r.session_id +
            ": crisis exclusion and treatment assignment must be mutually exclusive");
    }
    if (r.converted.has_value() && r.is_crisis_excluded()) {
        throw std::invalid_argument("Session " + r.session_id +
                                    ": crisis-excluded sessions carry no outcome");
    }
    if (r.response_latency_ms < 0 || (r.decision_latency_ms && *r.decision_latency_ms < 0)) {
        throw std::invalid_argument("Session " + r.session_id + ": latencies must be >= 0");
    }
}

// Builds the row the caller appends after rendering a triage decision.
inline InteractionRecord from_analysis(const AnalysisResult& result,
                                       const std::string& session_id,
                                       const std::string& timestamp,
                                       int64_t response_latency_ms,
                                       const std::string& referral_source) {
    InteractionRecord r;
    r.session_id = session_id;
    r.timestamp = timestamp;
    r.sentiment_score = result.sentiment_score;
    r.severity = result.severity;
    r.assigned_treatment = result.assigned_treatment;
    r.response_latency_ms = response_latency_ms;
    r.referral_source = referral_source;
    if (result.is_crisis) {
        r.exclusion_reason = exclusion_reason::CRISIS_PROTOCOL;
    }
    return r;
}

}  // namespace record
