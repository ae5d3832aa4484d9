#pragma once

#include <string>

// ---------------------------------------------------------------------------
// SentimentScorer — external capability returning a score in [-1, 1]
// ---------------------------------------------------------------------------
class SentimentScorer {
public:
    virtual ~SentimentScorer() = default;
    virtual double score(const std::string& text) const = 0;
};

// Returns the same pre-computed score for every text. Used when the score
// arrives from upstream (CLI flag, request payload).
class FixedSentimentScorer : public SentimentScorer {
public:
    explicit FixedSentimentScorer(double value) : value_(value) {}

    double score(const std::string&) const override { return value_; }

private:
    double value_;
};
