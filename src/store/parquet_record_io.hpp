#pragma once

#include "store/interaction_record.hpp"
#include "triage/severity.hpp"
#include "triage/treatment.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Parquet snapshot of InteractionRecords
//
// Same columns as the CSV snapshot. Nullable fields are Arrow nulls;
// converted is BOOLEAN, latencies INT64, sentiment DOUBLE, the rest UTF8.
// ---------------------------------------------------------------------------
namespace parquet_io {

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

inline std::shared_ptr<arrow::Schema> record_schema() {
    return arrow::schema({
        arrow::field("session_id", arrow::utf8(), false),
        arrow::field("timestamp", arrow::utf8(), false),
        arrow::field("sentiment_score", arrow::float64(), false),
        arrow::field("severity", arrow::utf8(), false),
        arrow::field("assigned_treatment", arrow::utf8(), true),
        arrow::field("response_latency_ms", arrow::int64(), false),
        arrow::field("decision_latency_ms", arrow::int64(), true),
        arrow::field("converted", arrow::boolean(), true),
        arrow::field("exclusion_reason", arrow::utf8(), true),
        arrow::field("referral_source", arrow::utf8(), false),
    });
}

inline void write_parquet(const std::string& path, const std::vector<InteractionRecord>& records) {
    arrow::StringBuilder session_ids, timestamps, severities, treatments, exclusions, referrals;
    arrow::DoubleBuilder sentiments;
    arrow::Int64Builder response_latencies, decision_latencies;
    arrow::BooleanBuilder converted;

    for (const auto& r : records) {
        check(session_ids.Append(r.session_id), "append session_id");
        check(timestamps.Append(r.timestamp), "append timestamp");
        check(sentiments.Append(r.sentiment_score), "append sentiment_score");
        check(severities.Append(severity::to_string(r.severity)), "append severity");
        check(r.assigned_treatment
                  ? treatments.Append(treatment::to_string(*r.assigned_treatment))
                  : treatments.AppendNull(),
              "append assigned_treatment");
        check(response_latencies.Append(r.response_latency_ms), "append response_latency_ms");
        check(r.decision_latency_ms ? decision_latencies.Append(*r.decision_latency_ms)
                                    : decision_latencies.AppendNull(),
              "append decision_latency_ms");
        check(r.converted ? converted.Append(*r.converted) : converted.AppendNull(),
              "append converted");
        check(r.exclusion_reason ? exclusions.Append(*r.exclusion_reason)
                                 : exclusions.AppendNull(),
              "append exclusion_reason");
        check(referrals.Append(r.referral_source), "append referral_source");
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays(10);
    check(session_ids.Finish(&arrays[0]), "finish session_id");
    check(timestamps.Finish(&arrays[1]), "finish timestamp");
    check(sentiments.Finish(&arrays[2]), "finish sentiment_score");
    check(severities.Finish(&arrays[3]), "finish severity");
    check(treatments.Finish(&arrays[4]), "finish assigned_treatment");
    check(response_latencies.Finish(&arrays[5]), "finish response_latency_ms");
    check(decision_latencies.Finish(&arrays[6]), "finish decision_latency_ms");
    check(converted.Finish(&arrays[7]), "finish converted");
    check(exclusions.Finish(&arrays[8]), "finish exclusion_reason");
    check(referrals.Finish(&arrays[9]), "finish referral_source");

    auto table = arrow::Table::Make(record_schema(), arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk = std::max<int64_t>(1, static_cast<int64_t>(records.size()));
    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, chunk, props),
          "Failed to write Parquet " + path);
    check(outfile->Close(), "close " + path);
}

namespace detail {

template <typename ArrayT>
std::shared_ptr<ArrayT> column(const arrow::Table& table, const std::string& name) {
    auto col = table.GetColumnByName(name);
    if (!col) {
        throw std::runtime_error("Parquet snapshot is missing column '" + name + "'");
    }
    if (col->num_chunks() == 0) return nullptr;
    auto arr = std::dynamic_pointer_cast<ArrayT>(col->chunk(0));
    if (!arr) {
        throw std::runtime_error("Parquet column '" + name + "' has an unexpected type");
    }
    return arr;
}

}  // namespace detail

inline std::vector<InteractionRecord> read_parquet(const std::string& path) {
    auto open_result = arrow::io::ReadableFile::Open(path);
    if (!open_result.ok()) {
        throw std::runtime_error("Cannot open Parquet input file: " + path);
    }

    auto reader_result = parquet::arrow::OpenFile(open_result.ValueOrDie(),
                                                  arrow::default_memory_pool());
    if (!reader_result.ok()) {
        throw std::runtime_error("Not a Parquet file: " + path + " (" +
                                 reader_result.status().ToString() + ")");
    }
    auto reader = reader_result.MoveValueUnsafe();

    std::shared_ptr<arrow::Table> raw;
    check(reader->ReadTable(&raw), "read " + path);
    auto combined = raw->CombineChunks(arrow::default_memory_pool());
    if (!combined.ok()) {
        throw std::runtime_error("combine chunks: " + combined.status().ToString());
    }
    const arrow::Table& table = **combined;

    std::vector<InteractionRecord> records;
    if (table.num_rows() == 0) return records;

    auto session_ids = detail::column<arrow::StringArray>(table, "session_id");
    auto timestamps  = detail::column<arrow::StringArray>(table, "timestamp");
    auto sentiments  = detail::column<arrow::DoubleArray>(table, "sentiment_score");
    auto severities  = detail::column<arrow::StringArray>(table, "severity");
    auto treatments  = detail::column<arrow::StringArray>(table, "assigned_treatment");
    auto responses   = detail::column<arrow::Int64Array>(table, "response_latency_ms");
    auto decisions   = detail::column<arrow::Int64Array>(table, "decision_latency_ms");
    auto converted   = detail::column<arrow::BooleanArray>(table, "converted");
    auto exclusions  = detail::column<arrow::StringArray>(table, "exclusion_reason");
    auto referrals   = detail::column<arrow::StringArray>(table, "referral_source");

    records.reserve(static_cast<size_t>(table.num_rows()));
    for (int64_t i = 0; i < table.num_rows(); ++i) {
        InteractionRecord r;
        r.session_id = session_ids->GetString(i);
        r.timestamp = timestamps->GetString(i);
        r.sentiment_score = sentiments->Value(i);

        auto sev = severity::parse(severities->GetString(i));
        if (!sev) {
            throw std::runtime_error("Row " + std::to_string(i) + ": unknown severity");
        }
        r.severity = *sev;

        if (!treatments->IsNull(i)) {
            auto t = treatment::parse(treatments->GetString(i));
            if (!t) {
                throw std::runtime_error("Row " + std::to_string(i) + ": unknown treatment");
            }
            r.assigned_treatment = *t;
        }
        r.response_latency_ms = responses->Value(i);
        if (!decisions->IsNull(i)) r.decision_latency_ms = decisions->Value(i);
        if (!converted->IsNull(i)) r.converted = converted->Value(i);
        if (!exclusions->IsNull(i)) r.exclusion_reason = exclusions->GetString(i);
        r.referral_source = referrals->GetString(i);
        try {
            record::validate(r);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("Row " + std::to_string(i) + ": " + e.what());
        }
        records.push_back(std::move(r));
    }
    return records;
}

}  // namespace parquet_io
