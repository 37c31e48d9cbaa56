#pragma once

#include "core/errors.hpp"
#include "metrics/metric_definition.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// MetricRegistry — declarative metric definitions keyed by unique name
// ---------------------------------------------------------------------------
class MetricRegistry {
public:
    MetricRegistry() = default;

    // Validates and registers; duplicate names are a ConfigError.
    void add(const MetricDefinition& metric) {
        metric.validate();
        if (metrics_.count(metric.name)) {
            throw ConfigError("Metric '" + metric.name + "' is already registered");
        }
        metrics_.emplace(metric.name, metric);
    }

    // Registers or overrides an existing definition of the same name.
    void add_or_replace(const MetricDefinition& metric) {
        metric.validate();
        metrics_[metric.name] = metric;
    }

    bool contains(const std::string& name) const { return metrics_.count(name) > 0; }

    const MetricDefinition* find(const std::string& name) const {
        auto it = metrics_.find(name);
        return it == metrics_.end() ? nullptr : &it->second;
    }

    const MetricDefinition& get(const std::string& name) const {
        const auto* m = find(name);
        if (!m) throw ConfigError("Unknown metric: " + name);
        return *m;
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(metrics_.size());
        for (const auto& [name, _] : metrics_) out.push_back(name);
        return out;
    }

    size_t size() const { return metrics_.size(); }

    // Resolve requested names in request order. Repeated names collapse to one.
    std::vector<MetricDefinition> resolve(const std::vector<std::string>& names) const {
        std::vector<MetricDefinition> out;
        std::set<std::string> seen;
        for (const auto& n : names) {
            if (!seen.insert(n).second) continue;
            out.push_back(get(n));
        }
        return out;
    }

private:
    std::map<std::string, MetricDefinition> metrics_;
};

// ---------------------------------------------------------------------------
// Built-in metric catalogue
// ---------------------------------------------------------------------------
inline MetricRegistry default_metric_registry() {
    MetricRegistry r;

    auto retained = MetricDefinition::binary("retained", "session");
    retained.description = "Unit had at least one session in the window";
    r.add(retained);

    auto unenroll = MetricDefinition::binary("unenroll", "unenroll");
    unenroll.description = "Unit left the experiment during the window";
    r.add(unenroll);

    auto active_hours = MetricDefinition::continuous("active_hours", "active_hours");
    active_hours.description = "Total active hours";
    r.add(active_hours);

    auto median_session = MetricDefinition::continuous(
        "median_session_length", "session_length", Aggregation::MEAN, Summary::MEDIAN);
    median_session.description = "Median of per-unit mean session length";
    r.add(median_session);

    auto search_count = MetricDefinition::count("search_count", "search");
    search_count.description = "Number of searches";
    r.add(search_count);

    auto uri_count = MetricDefinition::count("uri_count", "uri_count", Aggregation::SUM);
    uri_count.description = "Number of URIs loaded";
    r.add(uri_count);

    auto days_of_use = MetricDefinition::count("days_of_use", "session", Aggregation::DISTINCT_DAYS);
    days_of_use.description = "Distinct UTC days with a session";
    r.add(days_of_use);

    return r;
}
