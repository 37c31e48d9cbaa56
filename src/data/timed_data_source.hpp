#pragma once

#include "core/errors.hpp"
#include "core/logging.hpp"
#include "data/raw_data_source.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// TimedDataSource — per-query timeout decorator.
//
// Each call runs on a thread owned by the decorator; if it has not completed
// within the timeout a DataSourceError is raised and the late result is
// discarded. Abandoned calls stay registered until they return, at most
// max_in_flight at a time, and the destructor joins them all.
// ---------------------------------------------------------------------------
class TimedDataSource : public RawDataSource {
public:
    TimedDataSource(std::shared_ptr<RawDataSource> inner, std::chrono::milliseconds timeout,
                    size_t max_in_flight = 16)
        : inner_(std::move(inner)), timeout_(timeout), max_in_flight_(max_in_flight) {
        if (!inner_) throw ConfigError("TimedDataSource requires a data source");
        if (timeout_.count() <= 0) throw ConfigError("query timeout must be positive");
        if (max_in_flight_ == 0) throw ConfigError("max_in_flight must be >= 1");
    }

    TimedDataSource(const TimedDataSource&) = delete;
    TimedDataSource& operator=(const TimedDataSource&) = delete;

    std::vector<AnalysisUnitRecord> enrollments(const Experiment& experiment) override {
        auto inner = inner_;
        return call_with_timeout<std::vector<AnalysisUnitRecord>>(
            [inner, experiment]() { return inner->enrollments(experiment); },
            "enrollments for " + experiment.id);
    }

    std::vector<RawEvent> query_events(const EventQuery& query) override {
        auto inner = inner_;
        return call_with_timeout<std::vector<RawEvent>>(
            [inner, query]() { return inner->query_events(query); },
            "events for " + query.experiment_id + " " + query.window_key);
    }

    std::chrono::milliseconds timeout() const { return timeout_; }

    // Calls started and not yet returned, including abandoned ones.
    size_t in_flight() {
        std::lock_guard<std::mutex> lock(mutex_);
        reap_locked();
        return calls_.size();
    }

private:
    struct Call {
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread thread;
    };

    void reap_locked() {
        calls_.remove_if([](const Call& c) { return c.done->load(); });
    }

    template <typename Result, typename Fn>
    Result call_with_timeout(Fn fn, const std::string& what) {
        auto promise = std::make_shared<std::promise<Result>>();
        auto future = promise->get_future();
        auto done = std::make_shared<std::atomic<bool>>(false);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            reap_locked();
            if (calls_.size() >= max_in_flight_) {
                throw DataSourceError("Too many stalled queries (" +
                                      std::to_string(calls_.size()) + "): " + what);
            }
            calls_.push_back({done, std::jthread([promise, done, fn = std::move(fn)]() mutable {
                                  // done is set before the caller can observe the result.
                                  try {
                                      Result result = fn();
                                      done->store(true);
                                      promise->set_value(std::move(result));
                                  } catch (...) {
                                      done->store(true);
                                      promise->set_exception(std::current_exception());
                                  }
                              })});
        }

        if (future.wait_for(timeout_) != std::future_status::ready) {
            analysis_log::logger()->warn("Query timed out after {} ms: {}",
                                         timeout_.count(), what);
            throw DataSourceError("Query timed out after " + std::to_string(timeout_.count()) +
                                  " ms: " + what);
        }
        return future.get();
    }

    std::shared_ptr<RawDataSource> inner_;
    std::chrono::milliseconds timeout_;
    size_t max_in_flight_;
    std::mutex mutex_;
    std::list<Call> calls_;  // destroyed first; each jthread joins
};
