#pragma once

#include "experiment/experiment.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RawEvent — one timestamped usage event for one analysis unit
// ---------------------------------------------------------------------------
struct RawEvent {
    std::string unit_id;
    std::string branch;
    uint64_t ts = 0;          // UTC nanoseconds
    std::string event_name;
    double value = 1.0;
};

// ---------------------------------------------------------------------------
// EventQuery — time-bounded, unit-scoped request. Range is [begin_ts, end_ts).
// ---------------------------------------------------------------------------
struct EventQuery {
    std::string experiment_id;
    std::string window_key;               // label for diagnostics
    std::set<std::string> unit_ids;
    std::set<std::string> event_names;    // empty = all events
    uint64_t begin_ts = 0;
    uint64_t end_ts = 0;

    bool matches(const RawEvent& e) const {
        if (e.ts < begin_ts || e.ts >= end_ts) return false;
        if (!unit_ids.count(e.unit_id)) return false;
        return event_names.empty() || event_names.count(e.event_name) > 0;
    }
};

// ---------------------------------------------------------------------------
// RawDataSource — read-only queryable dataset. Implementations throw
// DataSourceError when the store is unreachable or malformed. Must be safe to
// call concurrently.
// ---------------------------------------------------------------------------
class RawDataSource {
public:
    virtual ~RawDataSource() = default;

    virtual std::vector<AnalysisUnitRecord> enrollments(const Experiment& experiment) = 0;
    virtual std::vector<RawEvent> query_events(const EventQuery& query) = 0;
};
