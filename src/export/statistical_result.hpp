#pragma once

#include "experiment/analysis_window.hpp"
#include "experiment/experiment.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Bumped only for incompatible changes; columns are only ever added.
constexpr int SCHEMA_VERSION = 1;

enum class ResultStatus { OK, INSUFFICIENT_DATA };

inline std::string result_status_name(ResultStatus s) {
    switch (s) {
        case ResultStatus::OK:                return "OK";
        case ResultStatus::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
    }
    return "UNKNOWN";
}

inline ResultStatus parse_result_status(const std::string& s) {
    if (s == "OK") return ResultStatus::OK;
    if (s == "INSUFFICIENT_DATA") return ResultStatus::INSUFFICIENT_DATA;
    throw std::invalid_argument("Unknown result status: " + s);
}

// ---------------------------------------------------------------------------
// StatisticalResult — one exported row. Per-branch rows have an empty
// comparison; comparison rows name the control in comparison_to_branch.
// ---------------------------------------------------------------------------
struct StatisticalResult {
    std::string metric;
    std::string statistic;
    std::optional<double> parameter;       // e.g. 0.9 for a 90th percentile
    std::string branch;
    std::string comparison;                // "", "difference", "relative_uplift"
    std::string comparison_to_branch;
    WindowKind window_kind = WindowKind::DAY;
    int window_index = 0;
    std::string segment = "all";
    std::optional<double> point;
    std::optional<double> lower;
    std::optional<double> upper;
    double ci_width = 0.0;                 // confidence level of [lower, upper]
    int64_t sample_size = 0;
    ResultStatus status = ResultStatus::OK;

    bool has_interval() const { return lower.has_value() && upper.has_value(); }
    bool is_comparison() const { return !comparison.empty(); }

    bool operator==(const StatisticalResult& o) const {
        return metric == o.metric && statistic == o.statistic && parameter == o.parameter &&
               branch == o.branch && comparison == o.comparison &&
               comparison_to_branch == o.comparison_to_branch &&
               window_kind == o.window_kind && window_index == o.window_index &&
               segment == o.segment && point == o.point && lower == o.lower &&
               upper == o.upper && ci_width == o.ci_width && sample_size == o.sample_size &&
               status == o.status;
    }
};

inline std::string table_name(const std::string& experiment_id, const AnalysisWindow& window) {
    return "statistics_" + normalize_name(experiment_id) + "_" + window.key();
}

// ---------------------------------------------------------------------------
// ResultTable — the complete result set for one (experiment, window)
// ---------------------------------------------------------------------------
struct ResultTable {
    std::string experiment_id;
    AnalysisWindow window;
    int as_of_date = 0;
    int schema_version = SCHEMA_VERSION;
    bool is_final = false;
    std::vector<StatisticalResult> results;

    std::string name() const { return table_name(experiment_id, window); }
};
