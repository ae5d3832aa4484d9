#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <random>
#include <set>
#include <string>

// ---------------------------------------------------------------------------
// Intake — normalization done by the calling layer before triage
// ---------------------------------------------------------------------------
namespace intake {

constexpr size_t MIN_INPUT_LENGTH = 5;
constexpr size_t MAX_INPUT_LENGTH = 5000;

inline const std::string DEFAULT_REFERRAL = "direct";

inline const std::set<std::string>& valid_referral_sources() {
    static const std::set<std::string> sources = {
        "google_search", "facebook_ads", "instagram_ads", "direct",
        "referral", "email_campaign", "tiktok_ads", "organic", "other",
    };
    return sources;
}

struct InputCheck {
    bool ok = false;
    std::string reason;
};

inline std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

inline InputCheck check_input_text(const std::string& text) {
    std::string t = trim(text);
    if (t.empty()) {
        return {false, "Please share how you're feeling before continuing."};
    }
    if (t.size() < MIN_INPUT_LENGTH) {
        return {false, "Please share at least " + std::to_string(MIN_INPUT_LENGTH) +
                       " characters."};
    }
    if (t.size() > MAX_INPUT_LENGTH) {
        return {false, "Your message is too long (max " + std::to_string(MAX_INPUT_LENGTH) +
                       " characters)."};
    }
    return {true, ""};
}

// Anything outside the whitelist is attributed to "direct".
inline std::string normalize_referral_source(const std::string& raw) {
    std::string s = trim(raw);
    if (valid_referral_sources().count(s)) return s;
    return DEFAULT_REFERRAL;
}

// Random (version 4) UUID, lowercase hex.
template <typename Rng>
std::string generate_session_id(Rng& rng) {
    std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFFFFu);
    uint32_t w[4] = {dist(rng), dist(rng), dist(rng), dist(rng)};
    w[1] = (w[1] & 0xFFFF0FFFu) | 0x00004000u;  // version 4
    w[2] = (w[2] & 0x3FFFFFFFu) | 0x80000000u;  // RFC 4122 variant
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%04x%08x",
                  w[0], w[1] >> 16, w[1] & 0xFFFFu, w[2] >> 16, w[2] & 0xFFFFu, w[3]);
    return buf;
}

inline std::string generate_session_id() {
    static thread_local std::mt19937 rng(std::random_device{}());
    return generate_session_id(rng);
}

}  // namespace intake
