#pragma once

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SafetyOverrideConfig — crisis detection thresholds and phrase list
// ---------------------------------------------------------------------------
struct SafetyOverrideConfig {
    double sentiment_threshold = -0.8;  // strictly below fires
    std::vector<std::string> keywords = default_keywords();

    static std::vector<std::string> default_keywords() {
        return {
            "hurt myself",
            "end it",
            "end it all",
            "suicide",
            "suicidal",
            "kill myself",
            "killing myself",
            "don't want to live",
            "dont want to live",
            "no reason to live",
            "better off dead",
            "can't go on",
            "cant go on",
            "want to die",
            "wish i was dead",
            "take my life",
            "end my life",
        };
    }
};

namespace safety {

inline std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// One phrase per line. Blank lines and lines starting with '#' are skipped;
// surrounding whitespace is trimmed and phrases are lowercased.
inline std::vector<std::string> load_keywords(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open keyword file: " + path);
    }
    std::vector<std::string> keywords;
    std::string line;
    while (std::getline(in, line)) {
        auto first = line.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) continue;
        auto last = line.find_last_not_of(" \t\r\n");
        std::string phrase = line.substr(first, last - first + 1);
        if (phrase[0] == '#') continue;
        keywords.push_back(to_lower(phrase));
    }
    if (keywords.empty()) {
        throw std::runtime_error("Keyword file contains no phrases: " + path);
    }
    return keywords;
}

}  // namespace safety

// ---------------------------------------------------------------------------
// SafetyOverrideDetector — decides whether the experiment must be bypassed
//
// Fires when the score is below the threshold OR the lowercased text
// contains any configured phrase (plain substring, not tokenized).
// ---------------------------------------------------------------------------
class SafetyOverrideDetector {
public:
    SafetyOverrideDetector() : SafetyOverrideDetector(SafetyOverrideConfig{}) {}

    explicit SafetyOverrideDetector(const SafetyOverrideConfig& config)
        : threshold_(config.sentiment_threshold) {
        keywords_.reserve(config.keywords.size());
        for (const auto& k : config.keywords) {
            if (k.empty()) {
                throw std::invalid_argument("Safety keyword must not be empty");
            }
            keywords_.push_back(safety::to_lower(k));
        }
    }

    bool sentiment_trips(double sentiment_score) const {
        return sentiment_score < threshold_;
    }

    bool keyword_trips(const std::string& text) const {
        std::string lowered = safety::to_lower(text);
        for (const auto& k : keywords_) {
            if (lowered.find(k) != std::string::npos) return true;
        }
        return false;
    }

    bool should_override(const std::string& text, double sentiment_score) const {
        return sentiment_trips(sentiment_score) || keyword_trips(text);
    }

    double threshold() const { return threshold_; }
    const std::vector<std::string>& keywords() const { return keywords_; }

private:
    double threshold_;
    std::vector<std::string> keywords_;
};
