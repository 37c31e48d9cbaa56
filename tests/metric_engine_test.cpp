// metric_engine_test.cpp — tests for compute_metrics: window membership,
// per-unit interval attribution, aggregation kinds, missing-value markers,
// determinism and whole-window failure on data-source errors.

#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "data/in_memory_data_source.hpp"
#include "experiment/analysis_window.hpp"
#include "metrics/metric_definition.hpp"
#include "metrics/metric_engine.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

using test_helpers::make_event;
using test_helpers::make_experiment;
using test_helpers::make_unit;
using test_helpers::ts_at;

const MetricRow* find_row(const std::vector<MetricRow>& rows, const std::string& unit,
                          const std::string& metric) {
    for (const auto& r : rows) {
        if (r.unit_id == unit && r.metric == metric) return &r;
    }
    return nullptr;
}

}  // namespace

class MetricEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        exp_ = make_experiment();
        units_ = {
            make_unit("u1", "control", ts_at(20240101)),
            make_unit("u2", "treatment", ts_at(20240101)),
            make_unit("u3", "treatment", ts_at(20240101, 6)),
        };
        for (const auto& u : units_) source_.add_unit(exp_.id, u);

        metrics_ = {
            MetricDefinition::binary("retained", "session"),
            MetricDefinition::count("searches", "search"),
            MetricDefinition::continuous("hours", "active_hours"),
        };
    }

    Experiment exp_;
    std::vector<AnalysisUnitRecord> units_;
    InMemoryDataSource source_;
    std::vector<MetricDefinition> metrics_;
};

// ===========================================================================
// 1. Row shape and aggregation
// ===========================================================================
TEST_F(MetricEngineTest, OneRowPerUnitAndMetric) {
    auto rows = compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics_);
    EXPECT_EQ(rows.size(), units_.size() * metrics_.size());
}

TEST_F(MetricEngineTest, SortedByUnitThenMetricOrder) {
    auto rows = compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics_);
    ASSERT_EQ(rows.size(), 9u);
    EXPECT_EQ(rows[0].unit_id, "u1");
    EXPECT_EQ(rows[0].metric, "retained");
    EXPECT_EQ(rows[1].metric, "searches");
    EXPECT_EQ(rows[2].metric, "hours");
    EXPECT_EQ(rows[3].unit_id, "u2");
    EXPECT_EQ(rows[8].unit_id, "u3");
}

TEST_F(MetricEngineTest, BinaryAnyAndZeroDefault) {
    source_.add_event(make_event("u1", "control", ts_at(20240101, 5), "session"));
    source_.add_event(make_event("u1", "control", ts_at(20240101, 9), "session"));
    auto rows = compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics_);

    const auto* u1 = find_row(rows, "u1", "retained");
    ASSERT_NE(u1, nullptr);
    EXPECT_TRUE(u1->has_data);
    EXPECT_DOUBLE_EQ(u1->value, 1.0);
    EXPECT_EQ(u1->branch, "control");

    const auto* u2 = find_row(rows, "u2", "retained");
    ASSERT_NE(u2, nullptr);
    EXPECT_TRUE(u2->has_data);
    EXPECT_DOUBLE_EQ(u2->value, 0.0);
}

TEST_F(MetricEngineTest, CountAggregation) {
    for (int h = 1; h <= 3; ++h) {
        source_.add_event(make_event("u2", "treatment", ts_at(20240101, h), "search"));
    }
    auto rows = compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics_);
    EXPECT_DOUBLE_EQ(find_row(rows, "u2", "searches")->value, 3.0);
    EXPECT_DOUBLE_EQ(find_row(rows, "u1", "searches")->value, 0.0);
}

TEST_F(MetricEngineTest, ContinuousSumAndNoDataMarker) {
    source_.add_event(make_event("u1", "control", ts_at(20240101, 2), "active_hours", 1.5));
    source_.add_event(make_event("u1", "control", ts_at(20240101, 3), "active_hours", 2.0));
    auto rows = compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics_);

    const auto* u1 = find_row(rows, "u1", "hours");
    EXPECT_TRUE(u1->has_data);
    EXPECT_DOUBLE_EQ(u1->value, 3.5);

    // Absence is distinguishable from a true zero.
    const auto* u2 = find_row(rows, "u2", "hours");
    EXPECT_FALSE(u2->has_data);
}

TEST_F(MetricEngineTest, MeanAndMaxAggregations) {
    std::vector<MetricDefinition> metrics = {
        MetricDefinition::continuous("mean_len", "session_length", Aggregation::MEAN),
        MetricDefinition::continuous("max_len", "session_length", Aggregation::MAX),
    };
    source_.add_event(make_event("u1", "control", ts_at(20240101, 1), "session_length", 2.0));
    source_.add_event(make_event("u1", "control", ts_at(20240101, 2), "session_length", 6.0));
    auto rows = compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics);
    EXPECT_DOUBLE_EQ(find_row(rows, "u1", "mean_len")->value, 4.0);
    EXPECT_DOUBLE_EQ(find_row(rows, "u1", "max_len")->value, 6.0);
}

TEST_F(MetricEngineTest, DistinctDaysOverWeek) {
    std::vector<MetricDefinition> metrics = {
        MetricDefinition::count("days_of_use", "session", Aggregation::DISTINCT_DAYS),
    };
    source_.add_event(make_event("u1", "control", ts_at(20240101, 1), "session"));
    source_.add_event(make_event("u1", "control", ts_at(20240101, 8), "session"));
    source_.add_event(make_event("u1", "control", ts_at(20240103, 1), "session"));
    source_.add_event(make_event("u1", "control", ts_at(20240107, 23), "session"));
    auto rows = compute_metrics(exp_, AnalysisWindow::week(1), 20240108, units_, source_, metrics);
    EXPECT_DOUBLE_EQ(find_row(rows, "u1", "days_of_use")->value, 3.0);
}

// ===========================================================================
// 2. Window membership and per-unit intervals
// ===========================================================================
TEST_F(MetricEngineTest, EventsOutsideUnitIntervalIgnored) {
    source_.add_event(make_event("u1", "control", ts_at(20240102, 1), "session"));
    auto day1 = compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics_);
    auto day2 = compute_metrics(exp_, AnalysisWindow::day(2), 20240103, units_, source_, metrics_);
    EXPECT_DOUBLE_EQ(find_row(day1, "u1", "retained")->value, 0.0);
    EXPECT_DOUBLE_EQ(find_row(day2, "u1", "retained")->value, 1.0);
}

TEST_F(MetricEngineTest, IntervalIsRelativeToEnrollment) {
    // u3 enrolled at 06:00; an event at 03:00 next day is still in its day 1.
    source_.add_event(make_event("u3", "treatment", ts_at(20240102, 3), "session"));
    auto rows = compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics_);
    EXPECT_DOUBLE_EQ(find_row(rows, "u3", "retained")->value, 1.0);
}

TEST_F(MetricEngineTest, UnitsWithIncompleteWindowExcluded) {
    // Horizon 2024-01-02 00:00: u3's day 1 ends at 2024-01-02 06:00.
    auto rows = compute_metrics(exp_, AnalysisWindow::day(1), 20240102, units_, source_, metrics_);
    EXPECT_NE(find_row(rows, "u1", "retained"), nullptr);
    EXPECT_EQ(find_row(rows, "u3", "retained"), nullptr);
    EXPECT_EQ(rows.size(), 2u * metrics_.size());
}

TEST_F(MetricEngineTest, OverallCoversEnrollmentToHorizon) {
    source_.add_event(make_event("u1", "control", ts_at(20240104, 1), "search"));
    source_.add_event(make_event("u1", "control", ts_at(20240101, 1), "search"));
    source_.add_event(make_event("u1", "control", ts_at(20240105, 1), "search"));  // past horizon
    auto rows = compute_metrics(exp_, AnalysisWindow::overall(), 20240105, units_, source_, metrics_);
    EXPECT_DOUBLE_EQ(find_row(rows, "u1", "searches")->value, 2.0);
}

TEST_F(MetricEngineTest, OverallExcludesUnitsEnrolledAtOrAfterHorizon) {
    auto units = units_;
    units.push_back(make_unit("late", "control", ts_at(20240110)));
    auto rows = compute_metrics(exp_, AnalysisWindow::overall(), 20240105, units, source_, metrics_);
    EXPECT_EQ(find_row(rows, "late", "retained"), nullptr);
}

TEST_F(MetricEngineTest, QueryIsUnitScopedAndTimeBounded) {
    EventQuery seen;
    source_.set_query_hook([&seen](const EventQuery& q) { seen = q; });
    compute_metrics(exp_, AnalysisWindow::day(2), 20240104, units_, source_, metrics_);

    EXPECT_EQ(seen.window_key, "day_2");
    EXPECT_EQ(seen.unit_ids, (std::set<std::string>{"u1", "u2", "u3"}));
    EXPECT_EQ(seen.event_names, (std::set<std::string>{"session", "search", "active_hours"}));
    EXPECT_EQ(seen.begin_ts, ts_at(20240102));
    EXPECT_EQ(seen.end_ts, ts_at(20240103, 6));
}

TEST_F(MetricEngineTest, NoUnitsMeansNoQuery) {
    auto rows = compute_metrics(exp_, AnalysisWindow::day(1), 20240101, units_, source_, metrics_);
    EXPECT_TRUE(rows.empty());
    EXPECT_EQ(source_.query_count(), 0);
}

TEST_F(MetricEngineTest, UnitsInWindowHelperMatchesEngine) {
    auto included = metric_engine::units_in_window(exp_, AnalysisWindow::day(1), 20240102, units_);
    ASSERT_EQ(included.size(), 2u);
    EXPECT_EQ(included[0].unit_id, "u1");
    EXPECT_EQ(included[1].unit_id, "u2");
}

// ===========================================================================
// 3. Determinism
// ===========================================================================
TEST_F(MetricEngineTest, IdenticalInputsGiveIdenticalRows) {
    source_.add_event(make_event("u1", "control", ts_at(20240101, 2), "active_hours", 0.1));
    source_.add_event(make_event("u1", "control", ts_at(20240101, 3), "active_hours", 0.2));
    source_.add_event(make_event("u2", "treatment", ts_at(20240101, 3), "search"));
    auto a = compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics_);
    auto b = compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics_);
    EXPECT_EQ(a, b);
}

TEST_F(MetricEngineTest, InputOrderDoesNotMatter) {
    auto reversed = std::vector<AnalysisUnitRecord>(units_.rbegin(), units_.rend());
    auto a = compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics_);
    auto b = compute_metrics(exp_, AnalysisWindow::day(1), 20240103, reversed, source_, metrics_);
    EXPECT_EQ(a, b);
}

// ===========================================================================
// 4. Failures fail the whole window
// ===========================================================================
TEST_F(MetricEngineTest, SourceExceptionBecomesDataSourceError) {
    source_.set_query_hook([](const EventQuery&) {
        throw std::runtime_error("connection reset");
    });
    EXPECT_THROW(compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics_),
                 DataSourceError);
}

TEST_F(MetricEngineTest, UnreachableSource) {
    source_.set_unreachable(true);
    EXPECT_THROW(compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics_),
                 DataSourceError);
}

TEST_F(MetricEngineTest, BranchMismatchIsDataSourceError) {
    source_.add_event(make_event("u1", "treatment", ts_at(20240101, 1), "session"));
    EXPECT_THROW(compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics_),
                 DataSourceError);
}

TEST_F(MetricEngineTest, NonFiniteValueForValueAggregation) {
    source_.add_event(make_event("u1", "control", ts_at(20240101, 1), "active_hours",
                                 std::numeric_limits<double>::quiet_NaN()));
    EXPECT_THROW(compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics_),
                 DataSourceError);
}

TEST_F(MetricEngineTest, NonFiniteValueIgnoredByCountingAggregations) {
    std::vector<MetricDefinition> metrics = {MetricDefinition::binary("retained", "session")};
    source_.add_event(make_event("u1", "control", ts_at(20240101, 1), "session",
                                 std::numeric_limits<double>::quiet_NaN()));
    auto rows = compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units_, source_, metrics);
    EXPECT_DOUBLE_EQ(find_row(rows, "u1", "retained")->value, 1.0);
}

TEST_F(MetricEngineTest, UnknownBranchEnrollment) {
    auto units = units_;
    units.push_back(make_unit("u9", "placebo", ts_at(20240101)));
    EXPECT_THROW(compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units, source_, metrics_),
                 DataSourceError);
}

TEST_F(MetricEngineTest, DuplicateEnrollment) {
    auto units = units_;
    units.push_back(make_unit("u1", "control", ts_at(20240101)));
    EXPECT_THROW(compute_metrics(exp_, AnalysisWindow::day(1), 20240103, units, source_, metrics_),
                 DataSourceError);
}
