#pragma once

#include "core/errors.hpp"
#include "metrics/metric_definition.hpp"
#include "stats/bootstrap.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Pre-treatments applied to a continuous metric's per-unit values before
// resampling. Missing values are already removed by the caller.
// ---------------------------------------------------------------------------
namespace pre_treatment {

// Drop values strictly above the (1 - fraction) quantile.
inline std::vector<double> censor_highest(std::vector<double> values, double fraction) {
    if (fraction <= 0.0 || values.empty()) return values;
    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    double threshold = bootstrap::sorted_quantile(sorted, 1.0 - fraction);
    values.erase(std::remove_if(values.begin(), values.end(),
                                [threshold](double v) { return v > threshold; }),
                 values.end());
    return values;
}

// x -> log(1 + x); values <= -1 have no logarithm.
inline std::vector<double> log1p_transform(std::vector<double> values, const std::string& metric) {
    for (auto& v : values) {
        if (v <= -1.0) {
            throw StatisticalComputationError("Log transform of " + std::to_string(v) +
                                              " in metric '" + metric + "'");
        }
        v = std::log1p(v);
    }
    return values;
}

inline std::vector<double> apply(const ContinuousMetric& metric, const std::string& name,
                                 std::vector<double> values) {
    values = censor_highest(std::move(values), metric.censor_highest_fraction);
    if (metric.log_transform) values = log1p_transform(std::move(values), name);
    return values;
}

}  // namespace pre_treatment
