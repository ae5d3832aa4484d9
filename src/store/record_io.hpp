#pragma once

#include "analysis/experiment_analyzer.hpp"
#include "store/interaction_record.hpp"
#include "triage/severity.hpp"
#include "triage/treatment.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace record_io {

// ===========================================================================
// CSV snapshot — one row per InteractionRecord, nullable columns left empty
// ===========================================================================

inline const std::string CSV_HEADER =
    "session_id,timestamp,sentiment_score,severity,assigned_treatment,"
    "response_latency_ms,decision_latency_ms,converted,exclusion_reason,referral_source";

constexpr size_t CSV_COLUMNS = 10;

inline std::string csv_field(const std::string& s, const char* column) {
    if (s.find_first_of(",\r\n\"") != std::string::npos) {
        throw std::runtime_error(std::string("CSV field '") + column +
                                 "' contains a delimiter: " + s);
    }
    return s;
}

inline std::string format_row(const InteractionRecord& r) {
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10);
    ss << csv_field(r.session_id, "session_id");
    ss << "," << csv_field(r.timestamp, "timestamp");
    ss << "," << r.sentiment_score;
    ss << "," << severity::to_string(r.severity);
    ss << "," << (r.assigned_treatment ? treatment::to_string(*r.assigned_treatment) : "");
    ss << "," << r.response_latency_ms;
    ss << ",";
    if (r.decision_latency_ms) ss << *r.decision_latency_ms;
    ss << ",";
    if (r.converted) ss << (*r.converted ? 1 : 0);
    ss << "," << (r.exclusion_reason ? csv_field(*r.exclusion_reason, "exclusion_reason") : "");
    ss << "," << csv_field(r.referral_source, "referral_source");
    return ss.str();
}

inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> cols;
    std::string col;
    std::istringstream ss(line);
    while (std::getline(ss, col, ',')) {
        while (!col.empty() && (col.back() == '\r' || col.back() == '\n')) col.pop_back();
        cols.push_back(col);
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == ',') cols.emplace_back();
    return cols;
}

inline InteractionRecord parse_row(const std::string& line, size_t line_no) {
    auto cols = split_csv_line(line);
    if (cols.size() != CSV_COLUMNS) {
        throw std::runtime_error("CSV line " + std::to_string(line_no) + ": expected " +
                                 std::to_string(CSV_COLUMNS) + " columns, got " +
                                 std::to_string(cols.size()));
    }
    auto fail = [&](const std::string& what) {
        return std::runtime_error("CSV line " + std::to_string(line_no) + ": " + what);
    };

    InteractionRecord r;
    try {
        r.session_id = cols[0];
        r.timestamp = cols[1];
        r.sentiment_score = std::stod(cols[2]);

        auto sev = severity::parse(cols[3]);
        if (!sev) throw fail("unknown severity '" + cols[3] + "'");
        r.severity = *sev;

        if (!cols[4].empty()) {
            auto t = treatment::parse(cols[4]);
            if (!t) throw fail("unknown treatment '" + cols[4] + "'");
            r.assigned_treatment = *t;
        }
        r.response_latency_ms = std::stoll(cols[5]);
        if (!cols[6].empty()) r.decision_latency_ms = std::stoll(cols[6]);
        if (!cols[7].empty()) {
            if (cols[7] != "0" && cols[7] != "1") throw fail("converted must be 0, 1 or empty");
            r.converted = (cols[7] == "1");
        }
        if (!cols[8].empty()) r.exclusion_reason = cols[8];
        r.referral_source = cols[9];
    } catch (const std::invalid_argument&) {
        throw fail("malformed number");
    } catch (const std::out_of_range&) {
        throw fail("number out of range");
    }

    // Same invariant the store enforces on append.
    try {
        record::validate(r);
    } catch (const std::invalid_argument& e) {
        throw fail(e.what());
    }
    return r;
}

inline void write_csv(const std::string& path, const std::vector<InteractionRecord>& records) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        throw std::runtime_error("Output directory does not exist: " + parent.string());
    }
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    out << CSV_HEADER << "\n";
    for (const auto& r : records) out << format_row(r) << "\n";
}

inline std::vector<InteractionRecord> read_csv(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    std::string line;
    if (!std::getline(in, line)) return {};
    while (!line.empty() && line.back() == '\r') line.pop_back();
    if (line != CSV_HEADER) {
        throw std::runtime_error("Unexpected CSV header in " + path);
    }

    std::vector<InteractionRecord> records;
    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        records.push_back(parse_row(line, line_no));
    }
    return records;
}

// ===========================================================================
// JSON — analysis output
// ===========================================================================

// Quotes, backslashes and every control character below 0x20 are escaped.
inline std::string json_escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

inline void write_group(std::ostringstream& ss, const GroupStat& g) {
    ss << "{\"sessions\":" << g.sessions
       << ",\"conversions\":" << g.conversions
       << ",\"rate\":" << g.rate
       << ",\"ci_lower\":" << g.ci_lower
       << ",\"ci_upper\":" << g.ci_upper << "}";
}

inline std::string to_json(const ExperimentResult& r) {
    std::ostringstream ss;
    ss << std::setprecision(10);
    ss << "{";
    ss << "\"treatment_a\":";
    write_group(ss, r.group_a);
    ss << ",\"treatment_b\":";
    write_group(ss, r.group_b);
    ss << ",\"relative_lift\":" << r.relative_lift;
    ss << ",\"lift_ci_lower\":" << r.lift_ci_lower;
    ss << ",\"lift_ci_upper\":" << r.lift_ci_upper;
    ss << ",\"z_statistic\":" << r.z_statistic;
    ss << ",\"p_value\":" << r.p_value;
    ss << ",\"is_significant\":" << (r.is_significant ? "true" : "false");
    ss << ",\"recommendation\":\"" << recommendation::to_string(r.recommendation) << "\"";
    ss << ",\"recommendation_message\":\""
       << json_escape(recommendation::message(r.recommendation)) << "\"";
    ss << "}";
    return ss.str();
}

inline std::string to_json(const ExperimentReport& rep) {
    std::ostringstream ss;
    ss << std::setprecision(10);
    ss << "{";
    ss << "\"result\":" << to_json(rep.result);

    const auto& f = rep.funnel;
    ss << ",\"funnel\":{\"total_sessions\":" << f.total_sessions
       << ",\"experiment_sessions\":" << f.experiment_sessions
       << ",\"conversions\":" << f.conversions
       << ",\"crisis_excluded\":" << f.crisis_excluded
       << ",\"pending_decisions\":" << f.pending_decisions << "}";

    const auto& s = rep.summary;
    ss << ",\"summary\":{\"total_sessions\":" << s.total_sessions
       << ",\"total_conversions\":" << s.total_conversions
       << ",\"overall_rate\":" << s.overall_rate
       << ",\"rate_a\":" << s.rate_a
       << ",\"rate_b\":" << s.rate_b << "}";

    ss << ",\"severity_breakdown\":[";
    for (size_t i = 0; i < rep.severity_breakdown.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& c = rep.severity_breakdown[i];
        ss << "{\"severity\":\"" << severity::to_string(c.severity) << "\""
           << ",\"treatment\":\"" << treatment::to_string(c.treatment) << "\""
           << ",\"sessions\":" << c.sessions
           << ",\"conversions\":" << c.conversions
           << ",\"rate\":" << c.rate << "}";
    }
    ss << "]";

    ss << ",\"referral_breakdown\":[";
    for (size_t i = 0; i < rep.referral_breakdown.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& r = rep.referral_breakdown[i];
        ss << "{\"referral_source\":\"" << json_escape(r.referral_source) << "\""
           << ",\"sessions\":" << r.sessions
           << ",\"conversions\":" << r.conversions
           << ",\"rate\":" << r.rate << "}";
    }
    ss << "]";

    ss << ",\"treatment_profiles\":[";
    for (size_t i = 0; i < rep.treatment_profiles.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& p = rep.treatment_profiles[i];
        ss << "{\"treatment\":\"" << treatment::to_string(p.treatment) << "\""
           << ",\"sessions\":" << p.sessions
           << ",\"decided\":" << p.decided
           << ",\"avg_sentiment\":" << p.avg_sentiment
           << ",\"avg_response_latency_ms\":" << p.avg_response_latency_ms
           << ",\"avg_decision_latency_ms\":" << p.avg_decision_latency_ms << "}";
    }
    ss << "]";

    ss << ",\"severity_tests\":[";
    for (size_t i = 0; i < rep.severity_tests.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& t = rep.severity_tests[i];
        ss << "{\"severity\":\"" << severity::to_string(t.severity) << "\""
           << ",\"rate_a\":" << t.rate_a
           << ",\"rate_b\":" << t.rate_b
           << ",\"z_statistic\":" << t.z_statistic
           << ",\"raw_p_value\":" << t.raw_p_value
           << ",\"corrected_p_value\":" << t.corrected_p_value
           << ",\"survives_correction\":" << (t.survives_correction ? "true" : "false")
           << ",\"sample_count\":" << t.sample_count << "}";
    }
    ss << "]";

    ss << "}";
    return ss.str();
}

}  // namespace record_io
