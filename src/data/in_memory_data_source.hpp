#pragma once

#include "core/errors.hpp"
#include "data/raw_data_source.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// InMemoryDataSource — vector-backed dataset for tests and embedding.
// Enrollments are stored per experiment id.
// ---------------------------------------------------------------------------
class InMemoryDataSource : public RawDataSource {
public:
    // Called before every event query; may throw to simulate an outage.
    using QueryHook = std::function<void(const EventQuery&)>;

    InMemoryDataSource() = default;

    void add_unit(const std::string& experiment_id, AnalysisUnitRecord unit) {
        std::lock_guard<std::mutex> lock(mutex_);
        units_[experiment_id].push_back(std::move(unit));
    }

    void add_event(RawEvent event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }

    void set_query_hook(QueryHook hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = std::move(hook);
    }

    void clear_query_hook() { set_query_hook(nullptr); }

    void set_unreachable(bool unreachable) { unreachable_ = unreachable; }

    int query_count() const { return query_count_.load(); }

    std::vector<AnalysisUnitRecord> enrollments(const Experiment& experiment) override {
        if (unreachable_) {
            throw DataSourceError("In-memory source unreachable");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = units_.find(experiment.id);
        if (it == units_.end()) return {};
        return it->second;
    }

    std::vector<RawEvent> query_events(const EventQuery& query) override {
        ++query_count_;
        if (unreachable_) {
            throw DataSourceError("In-memory source unreachable");
        }
        QueryHook hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hook = hook_;
        }
        if (hook) hook(query);

        std::vector<RawEvent> out;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& e : events_) {
            if (query.matches(e)) out.push_back(e);
        }
        return out;
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::vector<AnalysisUnitRecord>> units_;
    std::vector<RawEvent> events_;
    QueryHook hook_;
    std::atomic<bool> unreachable_{false};
    std::atomic<int> query_count_{0};
};
