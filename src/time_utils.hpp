#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

// ---------------------------------------------------------------------------
// Wall-clock helpers for record timestamps (UTC, second resolution)
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr int64_t SEC_PER_DAY = 86'400;
constexpr int64_t MS_PER_SEC  = 1'000;
// 2026-01-01T00:00:00Z
constexpr int64_t EPOCH_2026_01_01 = 1'767'225'600;

inline std::string to_iso8601(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

inline int64_t now_epoch_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline std::string now_iso8601() {
    return to_iso8601(now_epoch_seconds());
}

// Milliseconds elapsed since `start` on the steady clock.
inline int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

}  // namespace time_utils
