// experiment_report.cpp — A/B experiment analysis over a record snapshot
// Reads InteractionRecords from .csv or .parquet, runs ExperimentAnalyzer,
// prints the comparison, funnel, segment views and a sample-size estimate,
// and optionally writes the full report as JSON.

#include "analysis/analysis_config.hpp"
#include "analysis/experiment_analyzer.hpp"
#include "analysis/power_analysis.hpp"
#include "store/parquet_record_io.hpp"
#include "store/record_io.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --input <path> [options]\n"
              << "\n"
              << "  --input            Record snapshot (.csv or .parquet)\n"
              << "  --confidence       Interval confidence level (default 0.95)\n"
              << "  --two-sided        Two-sided test instead of 'B exceeds A'\n"
              << "  --exclude-pending  Drop undecided sessions instead of counting them\n"
              << "                     as non-conversions\n"
              << "  --lift-interval    band (default) or delta\n"
              << "  --target-lift      Relative lift for the sample-size estimate (default 0.20)\n"
              << "  --json             Write the full report as JSON to this path\n";
}

std::vector<InteractionRecord> load_records(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (ext == ".parquet") return parquet_io::read_parquet(path);
    if (ext == ".csv") return record_io::read_csv(path);
    throw std::invalid_argument("Unsupported input format '" + ext +
                                "'. Use .csv or .parquet extension.");
}

void print_group(const char* label, const GroupStat& g) {
    std::printf("  %s: %d sessions, %d conversions, rate %.1f%% (CI %.1f%% - %.1f%%)\n",
                label, g.sessions, g.conversions, g.rate * 100.0,
                g.ci_lower * 100.0, g.ci_upper * 100.0);
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string input_path;
    std::string json_path;
    std::string lift_interval = "band";
    double target_lift = 0.20;
    AnalysisConfig cfg;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--input" && i + 1 < argc) {
                input_path = argv[++i];
            } else if (arg == "--confidence" && i + 1 < argc) {
                cfg.confidence = std::stod(argv[++i]);
            } else if (arg == "--two-sided") {
                cfg.alternative = Alternative::TWO_SIDED;
            } else if (arg == "--exclude-pending") {
                cfg.pending_policy = AnalysisConfig::PendingPolicy::EXCLUDE;
            } else if (arg == "--lift-interval" && i + 1 < argc) {
                lift_interval = argv[++i];
            } else if (arg == "--target-lift" && i + 1 < argc) {
                target_lift = std::stod(argv[++i]);
            } else if (arg == "--json" && i + 1 < argc) {
                json_path = argv[++i];
            } else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        return 1;
    }

    if (input_path.empty()) {
        std::cerr << "Missing required argument: --input\n";
        print_usage(argv[0]);
        return 1;
    }
    if (lift_interval == "band") {
        cfg.lift_interval = AnalysisConfig::LiftInterval::FIXED_BAND;
    } else if (lift_interval == "delta") {
        cfg.lift_interval = AnalysisConfig::LiftInterval::DELTA_METHOD;
    } else {
        std::cerr << "Invalid --lift-interval '" << lift_interval << "' (band or delta)\n";
        return 1;
    }

    try {
        auto records = load_records(input_path);
        std::cout << "Loaded " << records.size() << " records from " << input_path << "\n\n";

        ExperimentAnalyzer analyzer(cfg);
        auto report = analyzer.report(records);
        const auto& r = report.result;

        std::cout << "=== A/B Result ===\n";
        print_group("A (Clinical)  ", r.group_a);
        print_group("B (Empathetic)", r.group_b);
        std::printf("  Relative lift: %+.1f%% (%s %+.1f%% to %+.1f%%)\n",
                    r.relative_lift * 100.0,
                    cfg.lift_interval == AnalysisConfig::LiftInterval::FIXED_BAND
                        ? "approx. band" : "delta-method CI",
                    r.lift_ci_lower * 100.0, r.lift_ci_upper * 100.0);
        std::printf("  z = %.3f, p = %.4f (%s) -> %s\n", r.z_statistic, r.p_value,
                    cfg.alternative == Alternative::LARGER ? "one-sided" : "two-sided",
                    r.is_significant ? "significant" : "not significant");
        std::cout << "  " << recommendation::message(r.recommendation) << "\n\n";

        const auto& f = report.funnel;
        std::cout << "=== Funnel ===\n";
        std::printf("  Total sessions:      %d\n", f.total_sessions);
        std::printf("  In experiment:       %d\n", f.experiment_sessions);
        std::printf("  Converted:           %d\n", f.conversions);
        std::printf("  Crisis excluded:     %d\n", f.crisis_excluded);
        std::printf("  Pending decisions:   %d\n\n", f.pending_decisions);

        std::cout << "=== Severity x Treatment ===\n";
        for (const auto& c : report.severity_breakdown) {
            std::printf("  %-8s %-12s %4d sessions, %3d conversions, %.1f%%\n",
                        severity::to_string(c.severity).c_str(),
                        treatment::to_string(c.treatment).c_str(),
                        c.sessions, c.conversions, c.rate * 100.0);
        }

        std::cout << "\n=== Severity segment tests (Holm-Bonferroni) ===\n";
        for (const auto& t : report.severity_tests) {
            std::printf("  %-8s A=%.1f%% B=%.1f%% z=%.3f p=%.4f p_holm=%.4f %s\n",
                        severity::to_string(t.severity).c_str(),
                        t.rate_a * 100.0, t.rate_b * 100.0, t.z_statistic,
                        t.raw_p_value, t.corrected_p_value,
                        t.survives_correction ? "SIGNIFICANT" : "");
        }

        std::cout << "\n=== Referral sources ===\n";
        for (const auto& row : report.referral_breakdown) {
            std::printf("  %-16s %4d sessions, %3d conversions, %.1f%%\n",
                        row.referral_source.c_str(), row.sessions, row.conversions,
                        row.rate * 100.0);
        }

        std::cout << "\n=== Treatment profiles ===\n";
        for (const auto& p : report.treatment_profiles) {
            std::printf("  %-12s avg sentiment %.3f, response %.0f ms, decision %.0f ms"
                        " (%d of %d decided)\n",
                        treatment::to_string(p.treatment).c_str(), p.avg_sentiment,
                        p.avg_response_latency_ms, p.avg_decision_latency_ms,
                        p.decided, p.sessions);
        }

        double baseline = r.group_a.rate;
        double target_rate = baseline * (1.0 + target_lift);
        if (baseline > 0.0 && baseline < 1.0 && target_rate < 1.0 && target_lift != 0.0) {
            PowerConfig pcfg;
            pcfg.alternative = cfg.alternative;
            PowerAnalyzer power(pcfg);
            int64_t needed = power.min_sample_size_per_arm(baseline, target_lift);
            int have = std::min(r.group_a.sessions, r.group_b.sessions);
            std::cout << "\n=== Sample size ===\n";
            std::printf("  To detect %+.0f%% lift over %.1f%% at 80%% power: %lld sessions per arm"
                        " (have %d)\n",
                        target_lift * 100.0, baseline * 100.0,
                        static_cast<long long>(needed), have);
            std::printf("  Power at current size: %.1f%%\n",
                        power.compute_power(have, baseline, target_rate) * 100.0);
        }

        if (!json_path.empty()) {
            std::ofstream out(json_path);
            if (!out.is_open()) {
                throw std::runtime_error("Cannot open output file: " + json_path);
            }
            out << record_io::to_json(report) << "\n";
            std::cout << "\nReport written to " << json_path << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
