// experiment_analysis.cpp — CLI entry point for windowed experiment analysis
//
// Resolves the windows due for an experiment as of a date, computes metrics from
// Parquet enrollments/events, applies bootstrap treatments and writes one result
// table per window (Parquet or JSON).
//
// Usage: ./experiment_analysis --experiment <id> --start <date> --branches a,b
//            --enrollments <path> --events <path> --output-dir <dir> [options]

#include "core/errors.hpp"
#include "core/logging.hpp"
#include "data/parquet_data_source.hpp"
#include "experiment/experiment.hpp"
#include "export/parquet_result_writer.hpp"
#include "export/result_json.hpp"
#include "metrics/metric_registry.hpp"
#include "orchestration/run_orchestrator.hpp"
#include "time_utils.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

int today_utc() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
    return time_utils::ns_to_date(static_cast<uint64_t>(ns));
}

int exit_code(RunStatus status) {
    switch (status) {
        case RunStatus::SUCCEEDED:
        case RunStatus::NOTHING_DUE:
            return 0;
        case RunStatus::PARTIAL_FAILURE:
            return 2;
        default:
            return 1;
    }
}

void print_report(const RunReport& report) {
    std::cout << report.experiment_id << " as of "
              << time_utils::date_to_string(report.as_of_date) << ": "
              << run_status_name(report.status) << "\n";
    for (const auto& w : report.windows) {
        std::cout << "  " << w.due.window.key() << (w.due.is_final ? " [final]" : "")
                  << "  " << window_state_name(w.state);
        if (w.state == WindowState::EXPORTED) {
            std::cout << "  results=" << w.result_count;
        } else if (w.state == WindowState::FAILED) {
            std::cout << "  " << w.error_kind << ": " << w.error;
        }
        std::cout << "\n";
    }
}

void print_plan(const RunPlan& plan) {
    std::cout << plan.experiment_id << " as of " << time_utils::date_to_string(plan.as_of_date)
              << ": " << plan.windows.size() << " windows due, " << plan.enrolled_units
              << " enrolled units (dry run)\n";
    for (const auto& w : plan.windows) {
        std::cout << "  " << w.due.window.key() << (w.due.is_final ? " [final]" : "");
        if (w.skip_final) {
            std::cout << "  SKIPPED_FINAL";
        } else if (w.query) {
            std::cout << "  units=" << w.unit_count << "  events="
                      << (w.query->event_names.empty() ? std::string("*")
                                                       : std::to_string(w.query->event_names.size()))
                      << "  ts=[" << w.query->begin_ts << ", " << w.query->end_ts << ")";
        } else {
            std::cout << "  no units";
        }
        std::cout << "\n";
    }
}

}  // namespace

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --experiment <id> --start <date> --branches <a,b,...>"
                 " --enrollments <path> --events <path> --output-dir <dir> [options]\n"
              << "\n"
              << "  --experiment    Experiment id\n"
              << "  --start         Enrollment start date (YYYY-MM-DD or YYYYMMDD)\n"
              << "  --end           Last live day, inclusive (optional)\n"
              << "  --branches      Comma-separated branch names (>= 2)\n"
              << "  --control       Control branch for comparisons (optional)\n"
              << "  --metrics       Comma-separated metric names (default: all built-in)\n"
              << "  --segments      Comma-separated segment names (optional)\n"
              << "  --min-units     Minimum qualifying units per branch (default: 0)\n"
              << "  --enrollments   Enrollments Parquet file\n"
              << "  --events        Events Parquet file\n"
              << "  --as-of         As-of date (default: today, UTC)\n"
              << "  --backfill      Run every date from start+1 through --as-of\n"
              << "  --dry-run       Validate and print the due windows and queries; write nothing\n"
              << "  --output-dir    Directory for result tables\n"
              << "  --format        parquet (default) or json\n"
              << "  --resamples     Bootstrap resamples (default: 1000)\n"
              << "  --confidence    Confidence level (default: 0.95)\n"
              << "  --seed          Master seed (default: 0)\n"
              << "  --workers       Worker threads, 0 = all cores (default: 0)\n"
              << "  --max-resampling  Concurrent resampling tasks (default: 2)\n"
              << "  --timeout-ms    Per-query timeout in ms (default: 60000)\n"
              << "  --log-level     trace, debug, info, warn, error (default: info)\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string experiment_id;
    std::string start_str;
    std::string end_str;
    std::string branches_str;
    std::string control;
    std::string metrics_str;
    std::string segments_str;
    std::string min_units_str;
    std::string enrollments_path;
    std::string events_path;
    std::string as_of_str;
    std::string output_dir;
    std::string format = "parquet";
    std::string log_level = "info";
    bool backfill = false;
    bool dry_run = false;
    AnalysisConfig config;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--experiment" && i + 1 < argc) {
                experiment_id = argv[++i];
            } else if (arg == "--start" && i + 1 < argc) {
                start_str = argv[++i];
            } else if (arg == "--end" && i + 1 < argc) {
                end_str = argv[++i];
            } else if (arg == "--branches" && i + 1 < argc) {
                branches_str = argv[++i];
            } else if (arg == "--control" && i + 1 < argc) {
                control = argv[++i];
            } else if (arg == "--metrics" && i + 1 < argc) {
                metrics_str = argv[++i];
            } else if (arg == "--segments" && i + 1 < argc) {
                segments_str = argv[++i];
            } else if (arg == "--min-units" && i + 1 < argc) {
                min_units_str = argv[++i];
            } else if (arg == "--enrollments" && i + 1 < argc) {
                enrollments_path = argv[++i];
            } else if (arg == "--events" && i + 1 < argc) {
                events_path = argv[++i];
            } else if (arg == "--as-of" && i + 1 < argc) {
                as_of_str = argv[++i];
            } else if (arg == "--output-dir" && i + 1 < argc) {
                output_dir = argv[++i];
            } else if (arg == "--format" && i + 1 < argc) {
                format = argv[++i];
            } else if (arg == "--resamples" && i + 1 < argc) {
                config.num_resamples = std::stoi(argv[++i]);
            } else if (arg == "--confidence" && i + 1 < argc) {
                config.confidence_level = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                config.master_seed = std::stoull(argv[++i]);
            } else if (arg == "--workers" && i + 1 < argc) {
                config.max_workers = std::stoi(argv[++i]);
            } else if (arg == "--max-resampling" && i + 1 < argc) {
                config.max_concurrent_resampling = std::stoi(argv[++i]);
            } else if (arg == "--timeout-ms" && i + 1 < argc) {
                config.query_timeout = std::chrono::milliseconds(std::stoll(argv[++i]));
            } else if (arg == "--log-level" && i + 1 < argc) {
                log_level = argv[++i];
            } else if (arg == "--backfill") {
                backfill = true;
            } else if (arg == "--dry-run") {
                dry_run = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    // Validate required args
    for (const auto& [name, value] : std::vector<std::pair<std::string, std::string>>{
             {"--experiment", experiment_id}, {"--start", start_str},
             {"--branches", branches_str}, {"--enrollments", enrollments_path},
             {"--events", events_path}, {"--output-dir", output_dir}}) {
        if (value.empty()) {
            std::cerr << "Missing required argument: " << name << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }
    if (format != "parquet" && format != "json") {
        std::cerr << "Unsupported format '" << format << "'. Use parquet or json.\n";
        return 1;
    }

    analysis_log::set_level(log_level);

    try {
        Experiment experiment;
        experiment.id = experiment_id;
        experiment.start_date = time_utils::parse_date(start_str);
        if (!end_str.empty()) experiment.end_date = time_utils::parse_date(end_str);
        experiment.branches = split_list(branches_str);
        if (!control.empty()) experiment.control_branch = control;
        experiment.segments = split_list(segments_str);

        MetricRegistry registry = default_metric_registry();
        experiment.metrics = metrics_str.empty() ? registry.names() : split_list(metrics_str);
        if (!min_units_str.empty()) {
            int min_units = std::stoi(min_units_str);
            for (const auto& name : registry.names()) {
                MetricDefinition m = registry.get(name);
                m.min_unit_count = min_units;
                registry.add_or_replace(m);
            }
        }

        int as_of = as_of_str.empty() ? today_utc() : time_utils::parse_date(as_of_str);

        auto source = std::make_shared<ParquetDataSource>(
            ParquetSourceConfig{enrollments_path, events_path});
        std::shared_ptr<ResultSink> sink;
        if (format == "json") {
            sink = std::make_shared<JsonResultWriter>(output_dir);
        } else {
            sink = std::make_shared<ParquetResultWriter>(output_dir);
        }

        RunOrchestrator orchestrator(source, sink, registry, config);

        std::cout << "Experiment " << experiment.id << ": "
                  << experiment.branches.size() << " branches, "
                  << experiment.metrics.size() << " metrics, start "
                  << time_utils::date_to_string(experiment.start_date) << "\n";

        if (dry_run) {
            print_plan(orchestrator.plan(experiment, as_of));
            return 0;
        }

        if (!backfill) {
            auto report = orchestrator.run(experiment, as_of);
            print_report(report);
            return exit_code(report.status);
        }

        auto reports = orchestrator.run_backfill(experiment, as_of);
        int worst = 0;
        for (const auto& report : reports) {
            print_report(report);
            int code = exit_code(report.status);
            if (code == 1) {
                worst = 1;
            } else if (code == 2 && worst == 0) {
                worst = 2;
            }
        }
        std::cout << "\nBackfilled " << reports.size() << " dates\n";
        return worst;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
