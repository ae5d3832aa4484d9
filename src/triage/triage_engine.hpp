#pragma once

#include "triage/response_catalog.hpp"
#include "triage/safety_override.hpp"
#include "triage/sentiment_scorer.hpp"
#include "triage/severity.hpp"
#include "triage/treatment.hpp"

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// Terminal states of a single triage pass:
//   SCORED → CLASSIFIED → { CRISIS_TERMINAL | EXPERIMENT_TERMINAL }
enum class TriageState { SCORED, CLASSIFIED, CRISIS_TERMINAL, EXPERIMENT_TERMINAL };

// ---------------------------------------------------------------------------
// AnalysisResult — one triage decision
//
// assigned_treatment is set iff !is_crisis; response_text is non-empty iff
// !is_crisis; crisis_resources is set iff is_crisis.
// ---------------------------------------------------------------------------
struct AnalysisResult {
    double sentiment_score = 0.0;
    Severity severity = Severity::MILD;
    bool is_crisis = false;
    std::optional<Treatment> assigned_treatment;
    std::string response_text;
    std::optional<std::string> crisis_resources;
    TriageState state = TriageState::SCORED;
};

// ---------------------------------------------------------------------------
// TriageEngine — request-scoped decision over injected collaborators
//
// Holds no per-request state. The scorer and assigner are borrowed and must
// outlive the engine; concurrent triage() calls are safe as long as the
// scorer is.
// ---------------------------------------------------------------------------
class TriageEngine {
public:
    TriageEngine(const SentimentScorer& scorer,
                 TreatmentAssigner& assigner,
                 SafetyOverrideDetector detector = SafetyOverrideDetector{},
                 ResponseCatalog catalog = ResponseCatalog{})
        : scorer_(scorer),
          assigner_(assigner),
          detector_(std::move(detector)),
          catalog_(std::move(catalog)) {}

    // Scores the text through the injected scorer. Scorer exceptions
    // propagate to the caller.
    AnalysisResult triage(const std::string& text) const {
        return triage_scored(text, scorer_.score(text));
    }

    // Runs the decision with a score computed upstream.
    AnalysisResult triage_scored(const std::string& text, double sentiment_score) const {
        if (std::isnan(sentiment_score) || sentiment_score < -1.0 || sentiment_score > 1.0) {
            throw std::invalid_argument("Sentiment score must lie in [-1, 1], got " +
                                        std::to_string(sentiment_score));
        }

        AnalysisResult result;
        result.sentiment_score = sentiment_score;
        result.state = TriageState::SCORED;

        result.severity = severity::classify(sentiment_score);
        result.state = TriageState::CLASSIFIED;

        if (detector_.should_override(text, sentiment_score)) {
            result.is_crisis = true;
            result.crisis_resources = CRISIS_RESOURCES;
            result.state = TriageState::CRISIS_TERMINAL;
            return result;
        }

        Treatment t = assigner_.assign();
        result.assigned_treatment = t;
        result.response_text = catalog_.select(t, result.severity);
        result.state = TriageState::EXPERIMENT_TERMINAL;
        return result;
    }

    const SafetyOverrideDetector& detector() const { return detector_; }
    const ResponseCatalog& catalog() const { return catalog_; }

private:
    const SentimentScorer& scorer_;
    TreatmentAssigner& assigner_;
    SafetyOverrideDetector detector_;
    ResponseCatalog catalog_;
};
