#pragma once

#include "store/interaction_record.hpp"

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// ---------------------------------------------------------------------------
// EventStore — append / single outcome update / snapshot query
// ---------------------------------------------------------------------------
class EventStore {
public:
    virtual ~EventStore() = default;

    // Returns the row identifier assigned to the record.
    virtual uint64_t append(const InteractionRecord& record) = 0;

    virtual void update_outcome(const std::string& session_id, bool converted,
                                int64_t decision_latency_ms) = 0;

    // Snapshot of every record in append order.
    virtual std::vector<InteractionRecord> query_all() const = 0;
};

// ---------------------------------------------------------------------------
// InMemoryEventStore — process-local store, operations serialized by a mutex
// ---------------------------------------------------------------------------
class InMemoryEventStore : public EventStore {
public:
    InMemoryEventStore() = default;

    explicit InMemoryEventStore(const std::vector<InteractionRecord>& seed) {
        for (const auto& r : seed) append(r);
    }

    uint64_t append(const InteractionRecord& record) override {
        record::validate(record);
        std::lock_guard<std::mutex> lock(mutex_);
        if (index_.count(record.session_id)) {
            throw std::invalid_argument("Duplicate session_id: " + record.session_id);
        }
        index_[record.session_id] = records_.size();
        records_.push_back(record);
        return static_cast<uint64_t>(records_.size());  // 1-based row id
    }

    // Applies the outcome exactly once. Unknown, crisis-excluded and
    // already-decided sessions are rejected.
    void update_outcome(const std::string& session_id, bool converted,
                        int64_t decision_latency_ms) override {
        if (decision_latency_ms < 0) {
            throw std::invalid_argument("decision_latency_ms must be >= 0");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(session_id);
        if (it == index_.end()) {
            throw std::runtime_error("Unknown session_id: " + session_id);
        }
        auto& r = records_[it->second];
        if (r.is_crisis_excluded()) {
            throw std::runtime_error("Session " + session_id +
                                     " is excluded from the experiment");
        }
        if (r.converted.has_value()) {
            throw std::runtime_error("Outcome already recorded for session " + session_id);
        }
        r.converted = converted;
        r.decision_latency_ms = decision_latency_ms;
    }

    std::vector<InteractionRecord> query_all() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<InteractionRecord> records_;
    std::unordered_map<std::string, size_t> index_;
};
