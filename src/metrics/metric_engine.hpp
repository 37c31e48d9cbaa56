#pragma once

#include "core/errors.hpp"
#include "core/logging.hpp"
#include "data/raw_data_source.hpp"
#include "experiment/analysis_window.hpp"
#include "experiment/experiment.hpp"
#include "experiment/window_policy.hpp"
#include "metrics/metric_definition.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

// ---------------------------------------------------------------------------
// MetricRow — one (unit, branch, metric) value for one window.
// has_data == false is the explicit "no data" marker.
// ---------------------------------------------------------------------------
struct MetricRow {
    std::string unit_id;
    std::string branch;
    std::string metric;
    double value = 0.0;
    bool has_data = true;

    bool operator==(const MetricRow& o) const {
        return unit_id == o.unit_id && branch == o.branch && metric == o.metric &&
               has_data == o.has_data && value == o.value;
    }
};

namespace metric_engine {

inline bool uses_event_values(Aggregation a) {
    return a == Aggregation::SUM || a == Aggregation::MEAN || a == Aggregation::MAX;
}

// Collapse one unit's qualifying events; nullopt when there are none.
inline std::optional<double> aggregate(Aggregation aggregation,
                                       const std::vector<const RawEvent*>& events) {
    if (events.empty()) return std::nullopt;

    switch (aggregation) {
        case Aggregation::ANY:
            return 1.0;
        case Aggregation::COUNT:
            return static_cast<double>(events.size());
        case Aggregation::SUM: {
            double sum = 0.0;
            for (const auto* e : events) sum += e->value;
            return sum;
        }
        case Aggregation::MEAN: {
            double sum = 0.0;
            for (const auto* e : events) sum += e->value;
            return sum / static_cast<double>(events.size());
        }
        case Aggregation::MAX: {
            double mx = events.front()->value;
            for (const auto* e : events) mx = std::max(mx, e->value);
            return mx;
        }
        case Aggregation::DISTINCT_DAYS: {
            std::set<int> days;
            for (const auto* e : events) days.insert(time_utils::ns_to_date(e->ts));
            return static_cast<double>(days.size());
        }
    }
    return std::nullopt;
}

// Whether a unit's window interval is fully observed by the data horizon.
inline bool unit_in_window(const AnalysisWindow& window, const WindowBounds& bounds,
                           uint64_t enrollment_ts, uint64_t horizon_ts) {
    if (window.is_overall()) return enrollment_ts < horizon_ts;
    return bounds.end_ts <= horizon_ts;
}

// Units counted in a window, in input order.
inline std::vector<AnalysisUnitRecord> units_in_window(const Experiment& experiment,
                                                       const AnalysisWindow& window,
                                                       int as_of_date,
                                                       const std::vector<AnalysisUnitRecord>& units) {
    const uint64_t horizon_ts = data_horizon_ns(experiment, as_of_date);
    std::vector<AnalysisUnitRecord> out;
    for (const auto& u : units) {
        auto bounds = window_bounds(window, u.enrollment_ts, horizon_ts);
        if (unit_in_window(window, bounds, u.enrollment_ts, horizon_ts)) out.push_back(u);
    }
    return out;
}

struct IncludedUnit {
    const AnalysisUnitRecord* record;
    WindowBounds bounds;
};

// Units of one window (sorted by unit_id) and the single event query that
// covers them; no query when the window has no units or no metrics.
struct WindowScope {
    std::vector<IncludedUnit> units;
    std::optional<EventQuery> query;
};

// Validates enrollments and builds the window's query without running it.
// `units` must outlive the returned scope.
inline WindowScope scope_window(const Experiment& experiment, const AnalysisWindow& window,
                                int as_of_date, const std::vector<AnalysisUnitRecord>& units,
                                const std::vector<MetricDefinition>& metrics) {
    const uint64_t horizon_ts = data_horizon_ns(experiment, as_of_date);

    WindowScope scope;
    std::set<std::string> seen_ids;
    for (const auto& u : units) {
        if (!seen_ids.insert(u.unit_id).second) {
            throw DataSourceError("Duplicate enrollment for unit '" + u.unit_id + "'");
        }
        if (!experiment.has_branch(u.branch)) {
            throw DataSourceError("Unit '" + u.unit_id + "' enrolled in unknown branch '" +
                                  u.branch + "'");
        }
        auto bounds = window_bounds(window, u.enrollment_ts, horizon_ts);
        if (unit_in_window(window, bounds, u.enrollment_ts, horizon_ts)) {
            scope.units.push_back({&u, bounds});
        }
    }

    std::sort(scope.units.begin(), scope.units.end(),
              [](const IncludedUnit& a, const IncludedUnit& b) {
                  return a.record->unit_id < b.record->unit_id;
              });

    if (scope.units.empty() || metrics.empty()) return scope;

    EventQuery query;
    query.experiment_id = experiment.id;
    query.window_key = window.key();
    query.begin_ts = scope.units.front().bounds.begin_ts;
    query.end_ts = scope.units.front().bounds.end_ts;
    for (const auto& iu : scope.units) {
        query.unit_ids.insert(iu.record->unit_id);
        query.begin_ts = std::min(query.begin_ts, iu.bounds.begin_ts);
        query.end_ts = std::max(query.end_ts, iu.bounds.end_ts);
    }
    for (const auto& m : metrics) query.event_names.insert(m.rule().event_name);
    scope.query = std::move(query);
    return scope;
}

}  // namespace metric_engine

// ---------------------------------------------------------------------------
// compute_metrics — join enrollments with raw events for one window.
//
// Units whose window interval is not complete by the data horizon are
// excluded entirely. Events are attributed only within each unit's own
// interval. Output is sorted by (unit_id, metric order) and is a pure function
// of the inputs. Any data-source failure fails the whole window.
// ---------------------------------------------------------------------------
inline std::vector<MetricRow> compute_metrics(const Experiment& experiment,
                                              const AnalysisWindow& window,
                                              int as_of_date,
                                              const std::vector<AnalysisUnitRecord>& units,
                                              RawDataSource& source,
                                              const std::vector<MetricDefinition>& metrics) {
    auto scope = metric_engine::scope_window(experiment, window, as_of_date, units, metrics);
    const auto& included = scope.units;
    if (!scope.query) {
        analysis_log::logger()->debug("{} {}: no units in window", experiment.id, window.key());
        return {};
    }
    const EventQuery& query = *scope.query;

    std::vector<RawEvent> events;
    try {
        events = source.query_events(query);
    } catch (const DataSourceError&) {
        throw;
    } catch (const std::exception& e) {
        throw DataSourceError("Event query failed for " + experiment.id + " " + window.key() +
                              ": " + e.what());
    }

    // unit index -> event name -> events inside the unit's interval
    std::unordered_map<std::string, size_t> index_of;
    index_of.reserve(included.size());
    for (size_t i = 0; i < included.size(); ++i) index_of[included[i].record->unit_id] = i;

    std::vector<std::map<std::string, std::vector<const RawEvent*>>> by_unit(included.size());
    for (const auto& e : events) {
        auto it = index_of.find(e.unit_id);
        if (it == index_of.end()) {
            throw DataSourceError("Event for unit '" + e.unit_id + "' outside query scope in " +
                                  window.key());
        }
        const auto& iu = included[it->second];
        if (!e.branch.empty() && e.branch != iu.record->branch) {
            throw DataSourceError("Branch mismatch for unit '" + e.unit_id + "': enrolled in '" +
                                  iu.record->branch + "', event reports '" + e.branch + "'");
        }
        if (!iu.bounds.contains(e.ts)) continue;
        by_unit[it->second][e.event_name].push_back(&e);
    }

    static const std::vector<const RawEvent*> no_events;

    std::vector<MetricRow> rows;
    rows.reserve(included.size() * metrics.size());
    for (size_t i = 0; i < included.size(); ++i) {
        const auto& unit = *included[i].record;
        for (const auto& m : metrics) {
            const auto& rule = m.rule();
            auto ev_it = by_unit[i].find(rule.event_name);
            const auto& unit_events = ev_it == by_unit[i].end() ? no_events : ev_it->second;

            if (metric_engine::uses_event_values(rule.aggregation)) {
                for (const auto* e : unit_events) {
                    if (!std::isfinite(e->value)) {
                        throw DataSourceError("Malformed value for event '" + e->event_name +
                                              "' of unit '" + unit.unit_id + "' in " +
                                              window.key());
                    }
                }
            }

            MetricRow row;
            row.unit_id = unit.unit_id;
            row.branch = unit.branch;
            row.metric = m.name;

            auto agg = metric_engine::aggregate(rule.aggregation, unit_events);
            if (agg.has_value()) {
                row.value = *agg;
                if (m.statistical_type() == StatisticalType::BINARY) {
                    row.value = *agg > 0.0 ? 1.0 : 0.0;
                }
            } else if (m.missing_value() == MissingValue::ZERO) {
                row.value = 0.0;
            } else {
                row.has_data = false;
            }
            rows.push_back(std::move(row));
        }
    }

    analysis_log::logger()->debug("{} {}: {} units, {} events, {} metric rows",
                                  experiment.id, window.key(), included.size(),
                                  events.size(), rows.size());
    return rows;
}
