// synth_population.cpp — Demo dataset generator
// Writes a seeded synthetic InteractionRecord population to .csv or .parquet
// so experiment_report can be exercised without live traffic.

#include "analysis/experiment_analyzer.hpp"
#include "store/event_store.hpp"
#include "store/parquet_record_io.hpp"
#include "store/record_io.hpp"
#include "synth/synthetic_population.hpp"

#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --output <path> [options]\n"
              << "\n"
              << "  --output        Output file path (.csv or .parquet)\n"
              << "  --records       Number of sessions (default 500)\n"
              << "  --seed          Generator seed (default 42)\n"
              << "  --crisis-rate   Fraction of sessions tripping the crisis protocol (default 0.02)\n"
              << "  --pending-rate  Fraction of experiment sessions left undecided (default 0)\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string output_path;
    SyntheticConfig cfg;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--records" && i + 1 < argc) {
                cfg.num_records = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                cfg.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--crisis-rate" && i + 1 < argc) {
                cfg.crisis_rate = std::stod(argv[++i]);
            } else if (arg == "--pending-rate" && i + 1 < argc) {
                cfg.pending_rate = std::stod(argv[++i]);
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

    if (output_path.empty()) {
        std::cerr << "Missing required argument: --output\n";
        print_usage(argv[0]);
        return 1;
    }

    bool use_parquet = false;
    {
        std::string ext = std::filesystem::path(output_path).extension().string();
        if (ext == ".parquet") {
            use_parquet = true;
        } else if (ext != ".csv") {
            std::cerr << "Unsupported output format. Use .csv or .parquet extension.\n";
            return 1;
        }
    }

    try {
        std::printf("Generating %d synthetic sessions (seed %u)...\n", cfg.num_records, cfg.seed);
        SyntheticPopulation population(cfg);

        // Route through the store so every row passes the same validation as
        // live traffic.
        InMemoryEventStore store(population.generate());
        auto records = store.query_all();

        if (use_parquet) {
            parquet_io::write_parquet(output_path, records);
        } else {
            record_io::write_csv(output_path, records);
        }

        auto summary = SegmentAggregator{}.summary(records);
        auto funnel = SegmentAggregator{}.funnel(records);
        std::printf("\nCrisis protocol triggered: %d\n", funnel.crisis_excluded);
        std::printf("Variant A conversion rate: %.1f%%\n", summary.rate_a * 100.0);
        std::printf("Variant B conversion rate: %.1f%%\n", summary.rate_b * 100.0);
        if (summary.rate_a > 0.0) {
            std::printf("Relative lift (B vs A):    %+.1f%%\n",
                        (summary.rate_b - summary.rate_a) / summary.rate_a * 100.0);
        }
        std::cout << "\nWrote " << records.size() << " records to " << output_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
