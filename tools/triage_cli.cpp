// triage_cli.cpp — Runs one triage decision from the command line
//
// Takes the text and its pre-computed sentiment score, prints the decision,
// and optionally appends the resulting InteractionRecord to a CSV store.
// With --record-outcome it instead applies a later accept/decline decision
// to a stored session.

#include "intake/intake.hpp"
#include "store/event_store.hpp"
#include "store/interaction_record.hpp"
#include "store/record_io.hpp"
#include "time_utils.hpp"
#include "triage/safety_override.hpp"
#include "triage/sentiment_scorer.hpp"
#include "triage/triage_engine.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --text <text> --score <s> [options]\n"
              << "       " << prog << " --record-outcome <session_id> --converted <0|1>"
              << " --decision-ms <ms> --store <file.csv>\n"
              << "\n"
              << "  --text            User input text\n"
              << "  --score           Pre-computed sentiment score in [-1, 1]\n"
              << "  --keywords        Safety phrase file (one per line)\n"
              << "  --store           CSV record store to append to / update\n"
              << "  --referral        Referral source (unknown values become 'direct')\n"
              << "  --session-id      Session id (default: random UUID)\n"
              << "  --seed            Seed for the treatment assigner\n"
              << "  --record-outcome  Session id whose outcome is being recorded\n"
              << "  --converted       1 if the user accepted the next step, else 0\n"
              << "  --decision-ms     Time from response shown to decision\n";
}

std::shared_ptr<InMemoryEventStore> load_store(const std::string& path) {
    if (std::filesystem::exists(path)) {
        return std::make_shared<InMemoryEventStore>(record_io::read_csv(path));
    }
    return std::make_shared<InMemoryEventStore>();
}

int record_outcome(const std::string& store_path, const std::string& session_id,
                   const std::string& converted_str, const std::string& decision_ms_str) {
    if (store_path.empty() || converted_str.empty() || decision_ms_str.empty()) {
        std::cerr << "--record-outcome requires --store, --converted and --decision-ms\n";
        return 1;
    }
    if (converted_str != "0" && converted_str != "1") {
        std::cerr << "--converted must be 0 or 1\n";
        return 1;
    }
    auto store = load_store(store_path);
    store->update_outcome(session_id, converted_str == "1", std::stoll(decision_ms_str));
    record_io::write_csv(store_path, store->query_all());
    std::cout << "Recorded outcome for " << session_id << ": "
              << (converted_str == "1" ? "converted" : "declined") << "\n";
    return 0;
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string text;
    std::string score_str;
    std::string keywords_path;
    std::string store_path;
    std::string referral = intake::DEFAULT_REFERRAL;
    std::string session_id;
    std::string seed_str;
    std::string outcome_session;
    std::string converted_str;
    std::string decision_ms_str;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--text" && i + 1 < argc) {
            text = argv[++i];
        } else if (arg == "--score" && i + 1 < argc) {
            score_str = argv[++i];
        } else if (arg == "--keywords" && i + 1 < argc) {
            keywords_path = argv[++i];
        } else if (arg == "--store" && i + 1 < argc) {
            store_path = argv[++i];
        } else if (arg == "--referral" && i + 1 < argc) {
            referral = argv[++i];
        } else if (arg == "--session-id" && i + 1 < argc) {
            session_id = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            seed_str = argv[++i];
        } else if (arg == "--record-outcome" && i + 1 < argc) {
            outcome_session = argv[++i];
        } else if (arg == "--converted" && i + 1 < argc) {
            converted_str = argv[++i];
        } else if (arg == "--decision-ms" && i + 1 < argc) {
            decision_ms_str = argv[++i];
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        if (!outcome_session.empty()) {
            return record_outcome(store_path, outcome_session, converted_str, decision_ms_str);
        }

        if (score_str.empty()) {
            std::cerr << "Missing required argument: --score\n";
            print_usage(argv[0]);
            return 1;
        }
        auto check = intake::check_input_text(text);
        if (!check.ok) {
            std::cerr << "Rejected input: " << check.reason << "\n";
            return 1;
        }

        SafetyOverrideConfig safety_cfg;
        if (!keywords_path.empty()) {
            safety_cfg.keywords = safety::load_keywords(keywords_path);
        }

        std::unique_ptr<TreatmentAssigner> assigner;
        if (seed_str.empty()) {
            assigner = std::make_unique<RandomTreatmentAssigner>();
        } else {
            assigner = std::make_unique<RandomTreatmentAssigner>(
                static_cast<uint32_t>(std::stoul(seed_str)));
        }

        FixedSentimentScorer scorer(std::stod(score_str));
        TriageEngine engine(scorer, *assigner, SafetyOverrideDetector(safety_cfg));

        auto started = std::chrono::steady_clock::now();
        AnalysisResult result = engine.triage(intake::trim(text));
        int64_t response_ms = time_utils::elapsed_ms(started);

        if (session_id.empty()) session_id = intake::generate_session_id();

        std::printf("Session:   %s\n", session_id.c_str());
        std::printf("Sentiment: %.3f\n", result.sentiment_score);
        std::printf("Severity:  %s\n", severity::to_string(result.severity).c_str());
        std::printf("Crisis:    %s\n", result.is_crisis ? "yes" : "no");
        if (result.is_crisis) {
            std::cout << "\n" << *result.crisis_resources;
        } else {
            std::printf("Treatment: %s\n\n", treatment::to_string(*result.assigned_treatment).c_str());
            std::cout << result.response_text << "\n";
        }

        if (!store_path.empty()) {
            auto store = load_store(store_path);
            auto rec = record::from_analysis(result, session_id, time_utils::now_iso8601(),
                                             response_ms, intake::normalize_referral_source(referral));
            uint64_t row = store->append(rec);
            record_io::write_csv(store_path, store->query_all());
            std::cout << "\nLogged as row " << row << " in " << store_path << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
