#pragma once

#include "core/errors.hpp"
#include "core/logging.hpp"
#include "experiment/analysis_window.hpp"
#include "experiment/experiment.hpp"
#include "export/statistical_result.hpp"
#include "metrics/metric_definition.hpp"
#include "metrics/metric_engine.hpp"
#include "stats/bootstrap.hpp"
#include "stats/pre_treatment.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// AnalysisConfig — process-wide analysis settings, passed explicitly
// ---------------------------------------------------------------------------
struct AnalysisConfig {
    int num_resamples = 1000;
    double confidence_level = 0.95;
    uint64_t master_seed = 0;
    int max_workers = 0;                   // 0 = hardware concurrency
    int max_concurrent_resampling = 2;
    std::chrono::milliseconds query_timeout{60000};
    bool relative_uplift = true;

    void validate() const {
        if (num_resamples < 1) {
            throw ConfigError("num_resamples must be >= 1, got " + std::to_string(num_resamples));
        }
        if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
            throw ConfigError("confidence_level must be in (0, 1)");
        }
        if (max_workers < 0) throw ConfigError("max_workers must be >= 0");
        if (max_concurrent_resampling < 1) {
            throw ConfigError("max_concurrent_resampling must be >= 1");
        }
        if (query_timeout.count() <= 0) throw ConfigError("query_timeout must be positive");
    }
};

// ---------------------------------------------------------------------------
// TreatmentContext — identifies the result set being produced
// ---------------------------------------------------------------------------
struct TreatmentContext {
    std::string experiment_id;
    std::vector<std::string> branches;
    std::optional<std::string> control_branch;
    AnalysisWindow window;
    std::string segment = "all";

    static TreatmentContext for_experiment(const Experiment& experiment,
                                           const AnalysisWindow& window,
                                           const std::string& segment = "all") {
        return {experiment.id, experiment.branches, experiment.control_branch, window, segment};
    }
};

// ---------------------------------------------------------------------------
// TreatmentEngine — seeded percentile bootstrap per branch, plus
// element-wise comparisons of each branch against the control.
// ---------------------------------------------------------------------------
class TreatmentEngine {
public:
    explicit TreatmentEngine(const AnalysisConfig& config) : config_(config) {
        config_.validate();
    }

    const AnalysisConfig& config() const { return config_; }

    uint64_t seed_for(const TreatmentContext& ctx, const std::string& metric,
                      const std::string& branch) const {
        return bootstrap::derive_seed(config_.master_seed,
                                      {ctx.experiment_id, ctx.window.key(), ctx.segment,
                                       metric, branch});
    }

    std::vector<StatisticalResult> apply_treatment(const std::vector<MetricRow>& rows,
                                                   const MetricDefinition& metric,
                                                   const TreatmentContext& ctx) const {
        std::map<std::string, std::vector<double>> values_by_branch;
        std::map<std::string, int64_t> qualifying_by_branch;
        for (const auto& b : ctx.branches) {
            values_by_branch[b] = {};
            qualifying_by_branch[b] = 0;
        }

        const StatisticalType type = metric.statistical_type();
        for (const auto& row : rows) {
            if (row.metric != metric.name || !row.has_data) continue;
            auto it = values_by_branch.find(row.branch);
            if (it == values_by_branch.end()) continue;
            it->second.push_back(row.value);
            if (type == StatisticalType::CONTINUOUS || row.value != 0.0) {
                ++qualifying_by_branch[row.branch];
            }
        }

        std::vector<StatisticalResult> results;
        std::map<std::string, BranchEstimate> estimates;

        for (const auto& branch : ctx.branches) {
            BranchEstimate est = estimate_branch(values_by_branch[branch],
                                                 qualifying_by_branch[branch], metric, ctx, branch);
            StatisticalResult r = base_result(metric, ctx);
            r.branch = branch;
            r.sample_size = est.sample_size;
            if (est.suppressed) {
                r.status = ResultStatus::INSUFFICIENT_DATA;
            } else {
                auto ci = bootstrap::percentile_interval(est.distribution, config_.confidence_level);
                r.point = ci.point;
                r.lower = ci.lower;
                r.upper = ci.upper;
            }
            results.push_back(r);
            estimates.emplace(branch, std::move(est));
        }

        if (!ctx.control_branch.has_value()) return results;

        const std::string& control = *ctx.control_branch;
        auto control_it = estimates.find(control);
        if (control_it == estimates.end()) {
            throw ConfigError("Control branch '" + control + "' is not a branch of " +
                              ctx.experiment_id);
        }
        const BranchEstimate& ctrl = control_it->second;

        for (const auto& branch : ctx.branches) {
            if (branch == control) continue;
            const BranchEstimate& trt = estimates.at(branch);

            StatisticalResult diff = base_result(metric, ctx);
            diff.branch = branch;
            diff.comparison = "difference";
            diff.comparison_to_branch = control;
            diff.sample_size = trt.sample_size;

            StatisticalResult uplift = diff;
            uplift.comparison = "relative_uplift";

            if (trt.suppressed || ctrl.suppressed) {
                diff.status = ResultStatus::INSUFFICIENT_DATA;
                results.push_back(diff);
                if (config_.relative_uplift) {
                    uplift.status = ResultStatus::INSUFFICIENT_DATA;
                    results.push_back(uplift);
                }
                continue;
            }

            const size_t n = trt.distribution.size();
            std::vector<double> differences(n);
            for (size_t i = 0; i < n; ++i) {
                differences[i] = trt.distribution[i] - ctrl.distribution[i];
            }
            auto ci = bootstrap::percentile_interval(differences, config_.confidence_level);
            diff.point = ci.point;
            diff.lower = ci.lower;
            diff.upper = ci.upper;
            results.push_back(diff);

            if (!config_.relative_uplift) continue;
            bool control_nonzero = std::all_of(ctrl.distribution.begin(), ctrl.distribution.end(),
                                               [](double v) { return v != 0.0; });
            if (!control_nonzero) {
                analysis_log::logger()->debug(
                    "{} {} {}: relative uplift of '{}' omitted, control resample is zero",
                    ctx.experiment_id, ctx.window.key(), metric.name, branch);
                continue;
            }
            std::vector<double> ratios(n);
            for (size_t i = 0; i < n; ++i) {
                ratios[i] = trt.distribution[i] / ctrl.distribution[i] - 1.0;
            }
            auto rci = bootstrap::percentile_interval(ratios, config_.confidence_level);
            uplift.point = rci.point;
            uplift.lower = rci.lower;
            uplift.upper = rci.upper;
            results.push_back(uplift);
        }
        return results;
    }

    // Enrolled unit counts per branch ("identity" rows); zero for empty branches.
    std::vector<StatisticalResult> enrollment_counts(const std::vector<AnalysisUnitRecord>& units,
                                                     const TreatmentContext& ctx) const {
        std::map<std::string, int64_t> counts;
        for (const auto& b : ctx.branches) counts[b] = 0;
        for (const auto& u : units) {
            auto it = counts.find(u.branch);
            if (it != counts.end()) ++it->second;
        }

        std::vector<StatisticalResult> out;
        for (const auto& b : ctx.branches) {
            StatisticalResult r;
            r.metric = "identity";
            r.statistic = "count";
            r.branch = b;
            r.window_kind = ctx.window.kind;
            r.window_index = ctx.window.index;
            r.segment = ctx.segment;
            r.point = static_cast<double>(counts[b]);
            r.sample_size = counts[b];
            out.push_back(r);
        }
        return out;
    }

private:
    struct BranchEstimate {
        bool suppressed = false;
        int64_t sample_size = 0;
        std::vector<double> distribution;
    };

    static std::string statistic_name(const MetricDefinition& metric) {
        if (const auto* c = std::get_if<ContinuousMetric>(&metric.kind)) {
            switch (c->summary) {
                case Summary::MEAN:       return "mean";
                case Summary::MEDIAN:     return "median";
                case Summary::PERCENTILE: return "percentile";
            }
        }
        if (metric.statistical_type() == StatisticalType::BINARY) return "binomial";
        return "mean";
    }

    static std::optional<double> statistic_parameter(const MetricDefinition& metric) {
        if (const auto* c = std::get_if<ContinuousMetric>(&metric.kind)) {
            if (c->summary == Summary::PERCENTILE) return c->quantile;
        }
        return std::nullopt;
    }

    static bootstrap::StatisticFn statistic_fn(const MetricDefinition& metric) {
        if (const auto* c = std::get_if<ContinuousMetric>(&metric.kind)) {
            switch (c->summary) {
                case Summary::MEAN:       return bootstrap::mean_statistic();
                case Summary::MEDIAN:     return bootstrap::quantile_statistic(0.5);
                case Summary::PERCENTILE: return bootstrap::quantile_statistic(c->quantile);
            }
        }
        return bootstrap::mean_statistic();
    }

    StatisticalResult base_result(const MetricDefinition& metric,
                                  const TreatmentContext& ctx) const {
        StatisticalResult r;
        r.metric = metric.name;
        r.statistic = statistic_name(metric);
        r.parameter = statistic_parameter(metric);
        r.window_kind = ctx.window.kind;
        r.window_index = ctx.window.index;
        r.segment = ctx.segment;
        r.ci_width = config_.confidence_level;
        return r;
    }

    bool collapsed(const std::vector<double>& distribution) const {
        auto ci = bootstrap::percentile_interval(distribution, config_.confidence_level);
        return ci.lower == ci.upper;
    }

    std::string describe(const TreatmentContext& ctx, const std::string& metric,
                         const std::string& branch, uint64_t seed) const {
        std::ostringstream ss;
        ss << "experiment=" << ctx.experiment_id << " window=" << ctx.window.key()
           << " segment=" << ctx.segment << " metric=" << metric << " branch=" << branch
           << " seed=" << seed;
        return ss.str();
    }

    BranchEstimate estimate_branch(const std::vector<double>& raw_values, int64_t qualifying,
                                   const MetricDefinition& metric, const TreatmentContext& ctx,
                                   const std::string& branch) const {
        BranchEstimate est;
        est.sample_size = static_cast<int64_t>(raw_values.size());
        const uint64_t seed = seed_for(ctx, metric.name, branch);

        if (!bootstrap::all_finite(raw_values)) {
            analysis_log::logger()->error("Non-finite metric value: {}",
                                          describe(ctx, metric.name, branch, seed));
            throw StatisticalComputationError("Non-finite metric value (" +
                                              describe(ctx, metric.name, branch, seed) + ")");
        }

        if (qualifying < metric.min_unit_count) {
            analysis_log::logger()->warn(
                "Insufficient data: {} qualifying units < {} ({})", qualifying,
                metric.min_unit_count, describe(ctx, metric.name, branch, seed));
            est.suppressed = true;
            return est;
        }

        std::vector<double> values = raw_values;
        if (const auto* c = std::get_if<ContinuousMetric>(&metric.kind)) {
            values = pre_treatment::apply(*c, metric.name, std::move(values));
        }
        if (values.empty()) {
            analysis_log::logger()->warn("Insufficient data: no observations ({})",
                                         describe(ctx, metric.name, branch, seed));
            est.suppressed = true;
            return est;
        }

        est.distribution = bootstrap::resample(values, config_.num_resamples, seed,
                                               statistic_fn(metric));
        if (!bootstrap::all_finite(est.distribution)) {
            throw StatisticalComputationError("Non-finite bootstrap statistic (" +
                                              describe(ctx, metric.name, branch, seed) + ")");
        }

        // A degenerate interval is only valid for a zero-variance sample.
        if (collapsed(est.distribution) && !bootstrap::is_constant(values)) {
            analysis_log::logger()->debug(
                "Bootstrap collapsed on non-constant sample, smoothing ({})",
                describe(ctx, metric.name, branch, seed));
            est.distribution = bootstrap::smoothed_resample(values, config_.num_resamples, seed,
                                                            statistic_fn(metric));
            if (!bootstrap::all_finite(est.distribution) || collapsed(est.distribution)) {
                throw StatisticalComputationError("Degenerate bootstrap interval (" +
                                                  describe(ctx, metric.name, branch, seed) + ")");
            }
        }
        return est;
    }

    AnalysisConfig config_;
};
