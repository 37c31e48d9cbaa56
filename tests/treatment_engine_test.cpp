// treatment_engine_test.cpp — tests for per-branch bootstrap estimates,
// comparisons against the control, minimum-unit suppression and seeding.

#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "experiment/analysis_window.hpp"
#include "export/statistical_result.hpp"
#include "metrics/metric_definition.hpp"
#include "stats/treatment_engine.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

using test_helpers::binary_rows;
using test_helpers::continuous_rows;
using test_helpers::make_row;

AnalysisConfig small_config(uint64_t seed = 7) {
    AnalysisConfig c;
    c.num_resamples = 300;
    c.confidence_level = 0.9;
    c.master_seed = seed;
    return c;
}

TreatmentContext two_branch_context() {
    return TreatmentContext::for_experiment(test_helpers::make_experiment(), AnalysisWindow::day(1));
}

std::vector<MetricRow> concat(std::vector<MetricRow> a, const std::vector<MetricRow>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

const StatisticalResult* find_result(const std::vector<StatisticalResult>& results,
                                     const std::string& branch,
                                     const std::string& comparison = "") {
    for (const auto& r : results) {
        if (r.branch == branch && r.comparison == comparison) return &r;
    }
    return nullptr;
}

std::vector<double> spread_values(int n, double scale) {
    std::vector<double> v;
    for (int i = 0; i < n; ++i) v.push_back(scale * static_cast<double>((i * 37) % 101) / 10.0);
    return v;
}

}  // namespace

class TreatmentEngineTest : public ::testing::Test {
protected:
    TreatmentEngine engine_{small_config()};
    TreatmentContext ctx_ = two_branch_context();
};

// ===========================================================================
// 1. Per-branch rows
// ===========================================================================
TEST_F(TreatmentEngineTest, OneRowPerBranchThenComparisons) {
    auto metric = MetricDefinition::binary("retained", "session");
    auto rows = concat(binary_rows("control", "retained", 8, 10),
                       binary_rows("treatment", "retained", 6, 10));
    auto results = engine_.apply_treatment(rows, metric, ctx_);

    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].branch, "control");
    EXPECT_FALSE(results[0].is_comparison());
    EXPECT_EQ(results[1].branch, "treatment");
    EXPECT_EQ(results[2].comparison, "difference");
    EXPECT_EQ(results[2].comparison_to_branch, "control");
    EXPECT_EQ(results[3].comparison, "relative_uplift");
}

TEST_F(TreatmentEngineTest, BinaryEstimateShape) {
    auto metric = MetricDefinition::binary("retained", "session");
    auto rows = concat(binary_rows("control", "retained", 4, 10),
                       binary_rows("treatment", "retained", 6, 10));
    auto results = engine_.apply_treatment(rows, metric, ctx_);

    const auto* ctrl = find_result(results, "control");
    ASSERT_NE(ctrl, nullptr);
    EXPECT_EQ(ctrl->metric, "retained");
    EXPECT_EQ(ctrl->statistic, "binomial");
    EXPECT_FALSE(ctrl->parameter.has_value());
    EXPECT_EQ(ctrl->window_kind, WindowKind::DAY);
    EXPECT_EQ(ctrl->window_index, 1);
    EXPECT_EQ(ctrl->segment, "all");
    EXPECT_EQ(ctrl->sample_size, 10);
    EXPECT_DOUBLE_EQ(ctrl->ci_width, 0.9);
    EXPECT_EQ(ctrl->status, ResultStatus::OK);
    ASSERT_TRUE(ctrl->has_interval());
    EXPECT_LE(*ctrl->lower, *ctrl->point);
    EXPECT_LE(*ctrl->point, *ctrl->upper);
    EXPECT_GE(*ctrl->lower, 0.0);
    EXPECT_LE(*ctrl->upper, 1.0);
}

TEST_F(TreatmentEngineTest, ZeroVarianceGivesDegenerateInterval) {
    auto metric = MetricDefinition::binary("retained", "session");
    auto rows = concat(binary_rows("control", "retained", 10, 10),
                       binary_rows("treatment", "retained", 10, 10));
    auto results = engine_.apply_treatment(rows, metric, ctx_);

    for (const auto& r : results) {
        ASSERT_TRUE(r.has_interval()) << r.branch << " " << r.comparison;
        EXPECT_DOUBLE_EQ(*r.lower, *r.point);
        EXPECT_DOUBLE_EQ(*r.point, *r.upper);
    }
    EXPECT_DOUBLE_EQ(*find_result(results, "control")->point, 1.0);
    EXPECT_DOUBLE_EQ(*find_result(results, "treatment", "difference")->point, 0.0);
    EXPECT_DOUBLE_EQ(*find_result(results, "treatment", "relative_uplift")->point, 0.0);
}

TEST_F(TreatmentEngineTest, SkewedMedianKeepsNonDegenerateInterval) {
    auto metric = MetricDefinition::continuous("len", "session_length", Aggregation::MEAN,
                                               Summary::MEDIAN);
    std::vector<double> values = {1, 1, 1, 1, 1, 1, 1, 1, 1, 5};
    auto rows = concat(continuous_rows("control", "len", values),
                       continuous_rows("treatment", "len", values));
    TreatmentEngine engine{AnalysisConfig{}};
    auto results = engine.apply_treatment(rows, metric, ctx_);

    for (const auto* r : {find_result(results, "control"), find_result(results, "treatment"),
                          find_result(results, "treatment", "difference")}) {
        ASSERT_NE(r, nullptr);
        ASSERT_TRUE(r->has_interval());
        EXPECT_LT(*r->lower, *r->upper);
        EXPECT_LE(*r->lower, *r->point);
        EXPECT_LE(*r->point, *r->upper);
    }

    auto again = engine.apply_treatment(rows, metric, ctx_);
    EXPECT_EQ(*find_result(again, "control")->lower, *find_result(results, "control")->lower);
}

TEST_F(TreatmentEngineTest, ContinuousStatisticNames) {
    auto mean = MetricDefinition::continuous("hours", "active_hours");
    auto median = MetricDefinition::continuous("len", "session_length", Aggregation::MEAN,
                                               Summary::MEDIAN);
    auto p90 = MetricDefinition::continuous("p90", "session_length", Aggregation::MAX,
                                            Summary::PERCENTILE);
    std::get<ContinuousMetric>(p90.kind).quantile = 0.9;

    auto values = spread_values(20, 1.0);
    for (auto* m : {&mean, &median, &p90}) {
        auto rows = concat(continuous_rows("control", m->name, values),
                           continuous_rows("treatment", m->name, values));
        auto results = engine_.apply_treatment(rows, *m, ctx_);
        ASSERT_FALSE(results.empty());
        if (m == &mean) EXPECT_EQ(results[0].statistic, "mean");
        if (m == &median) EXPECT_EQ(results[0].statistic, "median");
        if (m == &p90) {
            EXPECT_EQ(results[0].statistic, "percentile");
            ASSERT_TRUE(results[0].parameter.has_value());
            EXPECT_DOUBLE_EQ(*results[0].parameter, 0.9);
        }
    }
}

TEST_F(TreatmentEngineTest, CountMetricUsesMean) {
    auto metric = MetricDefinition::count("searches", "search");
    std::vector<MetricRow> rows;
    for (int i = 0; i < 10; ++i) {
        rows.push_back(make_row("c" + std::to_string(i), "control", "searches", i % 3));
        rows.push_back(make_row("t" + std::to_string(i), "treatment", "searches", i % 4));
    }
    auto results = engine_.apply_treatment(rows, metric, ctx_);
    EXPECT_EQ(results[0].statistic, "mean");
    EXPECT_GT(*find_result(results, "treatment")->point, 0.0);
}

TEST_F(TreatmentEngineTest, NoDataRowsAreNotObservations) {
    auto metric = MetricDefinition::continuous("hours", "active_hours");
    auto rows = concat(continuous_rows("control", "hours", {1.0, 2.0, 3.0}),
                       continuous_rows("treatment", "hours", {4.0, 5.0}));
    rows.push_back(make_row("t-x", "treatment", "hours", 0.0, false));
    auto results = engine_.apply_treatment(rows, metric, ctx_);
    EXPECT_EQ(find_result(results, "treatment")->sample_size, 2);
    EXPECT_GE(*find_result(results, "treatment")->lower, 4.0);
}

TEST_F(TreatmentEngineTest, RowsOfOtherMetricsIgnored) {
    auto metric = MetricDefinition::binary("retained", "session");
    auto rows = concat(binary_rows("control", "retained", 5, 10),
                       binary_rows("treatment", "unenroll", 5, 10));
    auto results = engine_.apply_treatment(rows, metric, ctx_);
    EXPECT_EQ(find_result(results, "control")->sample_size, 10);
    EXPECT_EQ(find_result(results, "treatment")->status, ResultStatus::INSUFFICIENT_DATA);
}

// ===========================================================================
// 2. Suppression
// ===========================================================================
TEST_F(TreatmentEngineTest, BelowMinimumUnitsSuppressesBranchAndComparisons) {
    auto metric = MetricDefinition::binary("retained", "session", 5);
    auto rows = concat(binary_rows("control", "retained", 3, 10),
                       binary_rows("treatment", "retained", 6, 10));
    auto results = engine_.apply_treatment(rows, metric, ctx_);

    const auto* ctrl = find_result(results, "control");
    ASSERT_NE(ctrl, nullptr);
    EXPECT_EQ(ctrl->status, ResultStatus::INSUFFICIENT_DATA);
    EXPECT_FALSE(ctrl->point.has_value());
    EXPECT_FALSE(ctrl->has_interval());
    EXPECT_EQ(ctrl->sample_size, 10);

    const auto* trt = find_result(results, "treatment");
    EXPECT_EQ(trt->status, ResultStatus::OK);
    EXPECT_TRUE(trt->has_interval());

    for (const char* cmp : {"difference", "relative_uplift"}) {
        const auto* r = find_result(results, "treatment", cmp);
        ASSERT_NE(r, nullptr) << cmp;
        EXPECT_EQ(r->status, ResultStatus::INSUFFICIENT_DATA);
        EXPECT_FALSE(r->point.has_value());
    }
}

TEST_F(TreatmentEngineTest, ThresholdIsInclusive) {
    auto metric = MetricDefinition::binary("retained", "session", 5);
    auto rows = concat(binary_rows("control", "retained", 5, 10),
                       binary_rows("treatment", "retained", 5, 10));
    auto results = engine_.apply_treatment(rows, metric, ctx_);
    for (const auto& r : results) EXPECT_EQ(r.status, ResultStatus::OK);
}

TEST_F(TreatmentEngineTest, EmptyBranchIsInsufficient) {
    auto metric = MetricDefinition::continuous("hours", "active_hours");
    auto rows = continuous_rows("control", "hours", {1.0, 2.0});
    auto results = engine_.apply_treatment(rows, metric, ctx_);
    const auto* trt = find_result(results, "treatment");
    EXPECT_EQ(trt->status, ResultStatus::INSUFFICIENT_DATA);
    EXPECT_EQ(trt->sample_size, 0);
}

// ===========================================================================
// 3. Comparisons
// ===========================================================================
TEST_F(TreatmentEngineTest, NoControlMeansNoComparisons) {
    ctx_.control_branch.reset();
    auto metric = MetricDefinition::binary("retained", "session");
    auto rows = concat(binary_rows("control", "retained", 4, 10),
                       binary_rows("treatment", "retained", 6, 10));
    auto results = engine_.apply_treatment(rows, metric, ctx_);
    ASSERT_EQ(results.size(), 2u);
    for (const auto& r : results) EXPECT_FALSE(r.is_comparison());
}

TEST_F(TreatmentEngineTest, EveryTreatmentBranchComparedToControl) {
    ctx_.branches = {"control", "a", "b"};
    auto metric = MetricDefinition::binary("retained", "session");
    auto rows = concat(binary_rows("control", "retained", 8, 10),
                       concat(binary_rows("a", "retained", 6, 10),
                              binary_rows("b", "retained", 2, 10)));
    auto results = engine_.apply_treatment(rows, metric, ctx_);
    ASSERT_EQ(results.size(), 7u);
    EXPECT_NE(find_result(results, "a", "difference"), nullptr);
    EXPECT_NE(find_result(results, "b", "relative_uplift"), nullptr);
    EXPECT_EQ(find_result(results, "control", "difference"), nullptr);
}

TEST_F(TreatmentEngineTest, DifferenceSignFollowsEffect) {
    auto metric = MetricDefinition::continuous("hours", "active_hours");
    auto rows = concat(continuous_rows("control", "hours", spread_values(40, 1.0)),
                       continuous_rows("treatment", "hours", spread_values(40, 3.0)));
    auto results = engine_.apply_treatment(rows, metric, ctx_);
    const auto* diff = find_result(results, "treatment", "difference");
    ASSERT_TRUE(diff->has_interval());
    EXPECT_GT(*diff->lower, 0.0);
    const auto* uplift = find_result(results, "treatment", "relative_uplift");
    ASSERT_NE(uplift, nullptr);
    EXPECT_GT(*uplift->lower, 0.0);
}

TEST_F(TreatmentEngineTest, RelativeUpliftOmittedForZeroControl) {
    auto metric = MetricDefinition::binary("retained", "session");
    auto rows = concat(binary_rows("control", "retained", 0, 10),
                       binary_rows("treatment", "retained", 6, 10));
    auto results = engine_.apply_treatment(rows, metric, ctx_);
    EXPECT_NE(find_result(results, "treatment", "difference"), nullptr);
    EXPECT_EQ(find_result(results, "treatment", "relative_uplift"), nullptr);
}

TEST_F(TreatmentEngineTest, RelativeUpliftCanBeDisabled) {
    auto config = small_config();
    config.relative_uplift = false;
    TreatmentEngine engine(config);
    auto metric = MetricDefinition::binary("retained", "session");
    auto rows = concat(binary_rows("control", "retained", 4, 10),
                       binary_rows("treatment", "retained", 6, 10));
    auto results = engine.apply_treatment(rows, metric, ctx_);
    EXPECT_EQ(results.size(), 3u);
    EXPECT_EQ(find_result(results, "treatment", "relative_uplift"), nullptr);
}

TEST_F(TreatmentEngineTest, UnknownControlIsConfigError) {
    ctx_.control_branch = "placebo";
    auto metric = MetricDefinition::binary("retained", "session");
    EXPECT_THROW(engine_.apply_treatment(binary_rows("control", "retained", 1, 2), metric, ctx_),
                 ConfigError);
}

// ===========================================================================
// 4. Determinism and errors
// ===========================================================================
TEST_F(TreatmentEngineTest, RerunIsBitIdentical) {
    auto metric = MetricDefinition::continuous("hours", "active_hours");
    auto rows = concat(continuous_rows("control", "hours", spread_values(30, 1.0)),
                       continuous_rows("treatment", "hours", spread_values(30, 1.2)));
    auto a = engine_.apply_treatment(rows, metric, ctx_);
    TreatmentEngine other(small_config());
    auto b = other.apply_treatment(rows, metric, ctx_);
    EXPECT_EQ(a, b);
}

TEST_F(TreatmentEngineTest, MasterSeedChangesEstimates) {
    auto metric = MetricDefinition::continuous("hours", "active_hours");
    auto rows = concat(continuous_rows("control", "hours", spread_values(30, 1.0)),
                       continuous_rows("treatment", "hours", spread_values(30, 1.2)));
    TreatmentEngine other(small_config(8));
    auto a = engine_.apply_treatment(rows, metric, ctx_);
    auto b = other.apply_treatment(rows, metric, ctx_);
    EXPECT_NE(a, b);
}

TEST_F(TreatmentEngineTest, SeedDependsOnContext) {
    auto seg = ctx_;
    seg.segment = "mobile";
    EXPECT_NE(engine_.seed_for(ctx_, "retained", "control"),
              engine_.seed_for(seg, "retained", "control"));
    EXPECT_NE(engine_.seed_for(ctx_, "retained", "control"),
              engine_.seed_for(ctx_, "retained", "treatment"));
    EXPECT_EQ(engine_.seed_for(ctx_, "retained", "control"),
              engine_.seed_for(two_branch_context(), "retained", "control"));
}

TEST_F(TreatmentEngineTest, NonFiniteValueIsStatisticalError) {
    auto metric = MetricDefinition::continuous("hours", "active_hours");
    auto rows = continuous_rows("control", "hours", {1.0, std::numeric_limits<double>::infinity()});
    EXPECT_THROW(engine_.apply_treatment(rows, metric, ctx_), StatisticalComputationError);
}

TEST_F(TreatmentEngineTest, StatisticalErrorNamesSeed) {
    auto metric = MetricDefinition::continuous("hours", "active_hours");
    auto rows = continuous_rows("control", "hours", {std::nan("")});
    try {
        engine_.apply_treatment(rows, metric, ctx_);
        FAIL() << "expected StatisticalComputationError";
    } catch (const StatisticalComputationError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("seed=" + std::to_string(engine_.seed_for(ctx_, "hours", "control"))),
                  std::string::npos);
        EXPECT_NE(what.find("window=day_1"), std::string::npos);
    }
}

TEST_F(TreatmentEngineTest, LogTransformOfInvalidValueIsStatisticalError) {
    auto metric = MetricDefinition::continuous("delta", "delta");
    std::get<ContinuousMetric>(metric.kind).log_transform = true;
    auto rows = continuous_rows("control", "delta", {-2.0, 1.0});
    EXPECT_THROW(engine_.apply_treatment(rows, metric, ctx_), StatisticalComputationError);
}

// ===========================================================================
// 5. Enrollment counts
// ===========================================================================
TEST_F(TreatmentEngineTest, EnrollmentCountsIncludeEmptyBranches) {
    auto units = test_helpers::make_units({"control"}, 3);
    auto results = engine_.enrollment_counts(units, ctx_);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].metric, "identity");
    EXPECT_EQ(results[0].statistic, "count");
    EXPECT_EQ(results[0].branch, "control");
    EXPECT_DOUBLE_EQ(*results[0].point, 3.0);
    EXPECT_EQ(results[0].sample_size, 3);
    EXPECT_EQ(results[1].branch, "treatment");
    EXPECT_DOUBLE_EQ(*results[1].point, 0.0);
    EXPECT_EQ(results[1].sample_size, 0);
}

// ===========================================================================
// 6. AnalysisConfig
// ===========================================================================
class AnalysisConfigTest : public ::testing::Test {};

TEST_F(AnalysisConfigTest, DefaultsAreValid) {
    AnalysisConfig c;
    EXPECT_NO_THROW(c.validate());
    EXPECT_EQ(c.num_resamples, 1000);
    EXPECT_DOUBLE_EQ(c.confidence_level, 0.95);
}

TEST_F(AnalysisConfigTest, InvalidValuesRejected) {
    AnalysisConfig c;
    c.num_resamples = 0;
    EXPECT_THROW(c.validate(), ConfigError);

    c = AnalysisConfig{};
    c.confidence_level = 1.0;
    EXPECT_THROW(c.validate(), ConfigError);

    c = AnalysisConfig{};
    c.max_concurrent_resampling = 0;
    EXPECT_THROW(c.validate(), ConfigError);

    c = AnalysisConfig{};
    c.query_timeout = std::chrono::milliseconds(0);
    EXPECT_THROW(c.validate(), ConfigError);

    c = AnalysisConfig{};
    c.num_resamples = -5;
    EXPECT_THROW(TreatmentEngine{c}, ConfigError);
}
