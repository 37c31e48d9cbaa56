#pragma once

#include "core/errors.hpp"
#include "core/logging.hpp"
#include "data/raw_data_source.hpp"
#include "data/timed_data_source.hpp"
#include "experiment/analysis_window.hpp"
#include "experiment/experiment.hpp"
#include "experiment/window_policy.hpp"
#include "export/result_sink.hpp"
#include "export/statistical_result.hpp"
#include "metrics/metric_engine.hpp"
#include "metrics/metric_registry.hpp"
#include "orchestration/worker_pool.hpp"
#include "stats/treatment_engine.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Run / window state
// ---------------------------------------------------------------------------
enum class RunPhase {
    PENDING,
    WINDOWS_RESOLVED,
    COMPUTING,
    TREATMENT_APPLIED,
    ASSEMBLED,
    EXPORTED,
    FAILED
};

enum class WindowState { PENDING, EXPORTED, FAILED, SKIPPED_FINAL, CANCELLED };

enum class RunStatus { SUCCEEDED, PARTIAL_FAILURE, FAILED_ALL, NOTHING_DUE, CANCELLED };

inline std::string run_phase_name(RunPhase p) {
    switch (p) {
        case RunPhase::PENDING:           return "PENDING";
        case RunPhase::WINDOWS_RESOLVED:  return "WINDOWS_RESOLVED";
        case RunPhase::COMPUTING:         return "COMPUTING";
        case RunPhase::TREATMENT_APPLIED: return "TREATMENT_APPLIED";
        case RunPhase::ASSEMBLED:         return "ASSEMBLED";
        case RunPhase::EXPORTED:          return "EXPORTED";
        case RunPhase::FAILED:            return "FAILED";
    }
    return "UNKNOWN";
}

inline std::string window_state_name(WindowState s) {
    switch (s) {
        case WindowState::PENDING:       return "PENDING";
        case WindowState::EXPORTED:      return "EXPORTED";
        case WindowState::FAILED:        return "FAILED";
        case WindowState::SKIPPED_FINAL: return "SKIPPED_FINAL";
        case WindowState::CANCELLED:     return "CANCELLED";
    }
    return "UNKNOWN";
}

inline std::string run_status_name(RunStatus s) {
    switch (s) {
        case RunStatus::SUCCEEDED:       return "SUCCEEDED";
        case RunStatus::PARTIAL_FAILURE: return "PARTIAL_FAILURE";
        case RunStatus::FAILED_ALL:      return "FAILED_ALL";
        case RunStatus::NOTHING_DUE:     return "NOTHING_DUE";
        case RunStatus::CANCELLED:       return "CANCELLED";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// WindowReport — outcome of one due window
// ---------------------------------------------------------------------------
struct WindowReport {
    DueWindow due;
    WindowState state = WindowState::PENDING;
    std::vector<RunPhase> phases;
    std::string error_kind;       // exception class name when FAILED
    std::string error;
    size_t result_count = 0;
};

// ---------------------------------------------------------------------------
// RunReport — outcome of one run(experiment, as_of_date)
// ---------------------------------------------------------------------------
struct RunReport {
    std::string experiment_id;
    int as_of_date = 0;
    RunStatus status = RunStatus::NOTHING_DUE;
    std::vector<RunPhase> phases;
    std::vector<WindowReport> windows;

    const WindowReport* find(const AnalysisWindow& window) const {
        for (const auto& w : windows) {
            if (w.due.window == window) return &w;
        }
        return nullptr;
    }

    int count(WindowState state) const {
        int n = 0;
        for (const auto& w : windows) {
            if (w.state == state) ++n;
        }
        return n;
    }
};

// ---------------------------------------------------------------------------
// RunPlan — what run() would do, resolved without computing or exporting
// ---------------------------------------------------------------------------
struct PlannedWindow {
    DueWindow due;
    bool skip_final = false;
    size_t unit_count = 0;
    std::optional<EventQuery> query;   // empty when the window has no units
};

struct RunPlan {
    std::string experiment_id;
    int as_of_date = 0;
    std::vector<std::string> metrics;
    size_t enrolled_units = 0;
    std::vector<PlannedWindow> windows;
};

// ---------------------------------------------------------------------------
// RunOrchestrator — Window Policy -> compute_metrics -> TreatmentEngine ->
// ResultSink, one independent task per due window.
// ---------------------------------------------------------------------------
class RunOrchestrator {
public:
    RunOrchestrator(std::shared_ptr<RawDataSource> source,
                    std::shared_ptr<ResultSink> sink,
                    MetricRegistry registry,
                    const AnalysisConfig& config)
        : config_(validated(config)),
          source_(std::make_shared<TimedDataSource>(std::move(source), config_.query_timeout,
                                                    2 * worker_count(config_))),
          sink_(std::move(sink)),
          registry_(std::move(registry)),
          engine_(config_),
          pool_(worker_count(config_)),
          gate_(config_.max_concurrent_resampling) {
        if (!sink_) throw ConfigError("RunOrchestrator requires a result sink");
    }

    const AnalysisConfig& config() const { return config_; }
    const ResamplingGate& resampling_gate() const { return gate_; }

    RunReport run(const Experiment& experiment, int as_of_date,
                  const CancellationToken* cancel = nullptr) {
        RunReport report;
        report.experiment_id = experiment.id;
        report.as_of_date = as_of_date;
        report.phases.push_back(RunPhase::PENDING);

        // Fatal before any window is attempted.
        experiment.validate();
        if (!time_utils::is_valid_date(as_of_date)) {
            throw ConfigError("Invalid as-of date " + std::to_string(as_of_date));
        }
        const std::vector<MetricDefinition> metrics = registry_.resolve(experiment.metrics);

        auto due = due_windows(experiment, as_of_date);
        report.phases.push_back(RunPhase::WINDOWS_RESOLVED);
        analysis_log::logger()->info("Run {} as of {}: {} windows due", experiment.id,
                                     time_utils::date_to_string(as_of_date), due.size());

        if (due.empty()) {
            report.status = RunStatus::NOTHING_DUE;
            return report;
        }

        report.windows.resize(due.size());
        std::vector<std::future<void>> pending;
        for (size_t i = 0; i < due.size(); ++i) {
            WindowReport& wr = report.windows[i];
            wr.due = due[i];
            if (due[i].is_final && sink_->has_final(experiment.id, due[i].window)) {
                wr.state = WindowState::SKIPPED_FINAL;
                continue;
            }
            // Each task writes only its own pre-sized slot.
            pending.push_back(pool_.submit([this, &experiment, &metrics, as_of_date, cancel, &wr] {
                process_window(experiment, as_of_date, metrics, cancel, wr);
            }));
        }
        // Every task references this frame; wait for all before rethrowing.
        std::exception_ptr escaped;
        for (auto& f : pending) {
            try {
                f.get();
            } catch (...) {
                if (!escaped) escaped = std::current_exception();
            }
        }
        if (escaped) std::rethrow_exception(escaped);

        report.status = aggregate_status(report);
        int exported = report.count(WindowState::EXPORTED);
        if (exported > 0) {
            report.phases.push_back(RunPhase::ASSEMBLED);
            report.phases.push_back(RunPhase::EXPORTED);
        }
        if (report.status == RunStatus::FAILED_ALL) report.phases.push_back(RunPhase::FAILED);

        analysis_log::logger()->info("Run {} as of {}: {} ({} exported, {} failed, {} skipped, {} cancelled)",
                                     experiment.id, time_utils::date_to_string(as_of_date),
                                     run_status_name(report.status), exported,
                                     report.count(WindowState::FAILED),
                                     report.count(WindowState::SKIPPED_FINAL),
                                     report.count(WindowState::CANCELLED));
        return report;
    }

    // Dry run: validates the experiment, resolves metrics and due windows,
    // reads enrollments and builds each window's event query without issuing
    // it. Nothing is written to the sink.
    RunPlan plan(const Experiment& experiment, int as_of_date) {
        experiment.validate();
        if (!time_utils::is_valid_date(as_of_date)) {
            throw ConfigError("Invalid as-of date " + std::to_string(as_of_date));
        }
        const std::vector<MetricDefinition> metrics = registry_.resolve(experiment.metrics);

        RunPlan plan;
        plan.experiment_id = experiment.id;
        plan.as_of_date = as_of_date;
        for (const auto& m : metrics) plan.metrics.push_back(m.name);

        auto due = due_windows(experiment, as_of_date);
        if (due.empty()) {
            analysis_log::logger()->info("Plan {} as of {}: nothing due", experiment.id,
                                         time_utils::date_to_string(as_of_date));
            return plan;
        }

        const auto units = source_->enrollments(experiment);
        plan.enrolled_units = units.size();
        for (const auto& d : due) {
            PlannedWindow pw;
            pw.due = d;
            pw.skip_final = d.is_final && sink_->has_final(experiment.id, d.window);
            if (!pw.skip_final) {
                auto scope = metric_engine::scope_window(experiment, d.window, as_of_date, units,
                                                         metrics);
                pw.unit_count = scope.units.size();
                pw.query = std::move(scope.query);
            }
            if (pw.query) {
                analysis_log::logger()->info(
                    "Plan {} {}: {} units, {} event names, ts [{}, {})", experiment.id,
                    d.window.key(), pw.unit_count, pw.query->event_names.size(),
                    pw.query->begin_ts, pw.query->end_ts);
            } else {
                analysis_log::logger()->info("Plan {} {}: {}", experiment.id, d.window.key(),
                                             pw.skip_final ? "final table exists, skipped"
                                                           : "no units");
            }
            plan.windows.push_back(std::move(pw));
        }
        return plan;
    }

    // Runs every date from the day after start through min(end + 1, today).
    std::vector<RunReport> run_backfill(const Experiment& experiment, int today,
                                        const CancellationToken* cancel = nullptr) {
        experiment.validate();
        std::vector<RunReport> reports;
        for (int date : run_dates(experiment, today)) {
            if (cancel && cancel->is_cancelled()) break;
            reports.push_back(run(experiment, date, cancel));
        }
        return reports;
    }

    static RunStatus aggregate_status(const RunReport& report) {
        if (report.windows.empty()) return RunStatus::NOTHING_DUE;
        int exported = report.count(WindowState::EXPORTED);
        int failed = report.count(WindowState::FAILED);
        if (report.count(WindowState::CANCELLED) > 0) return RunStatus::CANCELLED;
        if (failed == 0) return RunStatus::SUCCEEDED;
        if (exported == 0) return RunStatus::FAILED_ALL;
        return RunStatus::PARTIAL_FAILURE;
    }

private:
    static const AnalysisConfig& validated(const AnalysisConfig& config) {
        config.validate();
        return config;
    }

    static size_t worker_count(const AnalysisConfig& config) {
        if (config.max_workers > 0) return static_cast<size_t>(config.max_workers);
        return std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    std::vector<StatisticalResult> treat_window(const Experiment& experiment,
                                                const AnalysisWindow& window,
                                                const std::vector<AnalysisUnitRecord>& window_units,
                                                const std::vector<MetricRow>& rows,
                                                const std::vector<MetricDefinition>& metrics) {
        std::vector<std::string> segments = {"all"};
        segments.insert(segments.end(), experiment.segments.begin(), experiment.segments.end());

        std::vector<StatisticalResult> results;
        ResamplingGate::Permit permit(gate_);
        for (const auto& segment : segments) {
            auto ctx = TreatmentContext::for_experiment(experiment, window, segment);

            std::vector<AnalysisUnitRecord> seg_units;
            std::set<std::string> seg_ids;
            for (const auto& u : window_units) {
                if (segment == "all" || u.segments.count(segment)) {
                    seg_units.push_back(u);
                    seg_ids.insert(u.unit_id);
                }
            }

            auto counts = engine_.enrollment_counts(seg_units, ctx);
            results.insert(results.end(), counts.begin(), counts.end());

            std::vector<MetricRow> seg_rows;
            if (segment == "all") {
                seg_rows = rows;
            } else {
                for (const auto& r : rows) {
                    if (seg_ids.count(r.unit_id)) seg_rows.push_back(r);
                }
            }

            for (const auto& metric : metrics) {
                auto treated = engine_.apply_treatment(seg_rows, metric, ctx);
                results.insert(results.end(), treated.begin(), treated.end());
            }
        }
        return results;
    }

    void process_window(const Experiment& experiment, int as_of_date,
                        const std::vector<MetricDefinition>& metrics,
                        const CancellationToken* cancel, WindowReport& wr) {
        const AnalysisWindow& window = wr.due.window;
        if (cancel && cancel->is_cancelled()) {
            wr.state = WindowState::CANCELLED;
            return;
        }

        auto fail = [&](const std::string& kind, const std::string& what) {
            wr.state = WindowState::FAILED;
            wr.error_kind = kind;
            wr.error = what;
            wr.phases.push_back(RunPhase::FAILED);
            analysis_log::logger()->error("{} {} failed ({}): {}", experiment.id, window.key(),
                                          kind, what);
        };

        try {
            wr.phases.push_back(RunPhase::COMPUTING);
            std::vector<AnalysisUnitRecord> units;
            try {
                units = source_->enrollments(experiment);
            } catch (const DataSourceError&) {
                throw;
            } catch (const std::exception& e) {
                throw DataSourceError(std::string("Enrollment query failed: ") + e.what());
            }
            auto rows = compute_metrics(experiment, window, as_of_date, units, *source_, metrics);
            auto window_units = metric_engine::units_in_window(experiment, window, as_of_date, units);

            auto results = treat_window(experiment, window, window_units, rows, metrics);
            wr.phases.push_back(RunPhase::TREATMENT_APPLIED);

            ResultTable table;
            table.experiment_id = experiment.id;
            table.window = window;
            table.as_of_date = as_of_date;
            table.is_final = wr.due.is_final;
            table.results = std::move(results);
            wr.result_count = table.results.size();
            wr.phases.push_back(RunPhase::ASSEMBLED);

            sink_->replace_window(table);
            wr.phases.push_back(RunPhase::EXPORTED);
            wr.state = WindowState::EXPORTED;
            analysis_log::logger()->info("{} {}: exported {} results to {}{}", experiment.id,
                                         window.key(), wr.result_count, table.name(),
                                         table.is_final ? " (final)" : "");
        } catch (const DataSourceError& e) {
            fail("DataSourceError", e.what());
        } catch (const StatisticalComputationError& e) {
            fail("StatisticalComputationError", e.what());
        } catch (const ExportError& e) {
            fail("ExportError", e.what());
        } catch (const std::exception& e) {
            fail("Error", e.what());
        }
    }

    AnalysisConfig config_;
    std::shared_ptr<RawDataSource> source_;
    std::shared_ptr<ResultSink> sink_;
    MetricRegistry registry_;
    TreatmentEngine engine_;
    WorkerPool pool_;
    ResamplingGate gate_;
};
