#pragma once

#include "experiment/analysis_window.hpp"
#include "experiment/experiment.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

// ---------------------------------------------------------------------------
// Window Policy — pure mapping (experiment, as-of date) -> due windows.
//
// Data horizon H = min(as_of, end_date + 1). With E = whole days from start to
// H, DAY k is due for k in [1, E], WEEK k once 7k <= E, GROWTH k once 28k <= E,
// OVERALL once E > 0. H is non-decreasing in as_of, so the due set never
// shrinks as as_of advances.
// ---------------------------------------------------------------------------

// Exclusive upper date of data considered complete for a run.
inline int data_horizon_date(const Experiment& experiment, int as_of_date) {
    if (experiment.end_date.has_value()) {
        return std::min(as_of_date, time_utils::add_days(*experiment.end_date, 1));
    }
    return as_of_date;
}

inline uint64_t data_horizon_ns(const Experiment& experiment, int as_of_date) {
    return time_utils::date_to_midnight_ns(data_horizon_date(experiment, as_of_date));
}

inline int64_t elapsed_days(const Experiment& experiment, int as_of_date) {
    return time_utils::days_between(experiment.start_date,
                                    data_horizon_date(experiment, as_of_date));
}

// Overall results are final once the end date has passed.
inline bool overall_is_final(const Experiment& experiment, int as_of_date) {
    return experiment.end_date.has_value() && as_of_date > *experiment.end_date;
}

inline std::vector<DueWindow> due_windows(const Experiment& experiment, int as_of_date) {
    std::vector<DueWindow> due;
    if (as_of_date <= experiment.start_date) return due;

    int64_t elapsed = elapsed_days(experiment, as_of_date);
    if (elapsed <= 0) return due;

    for (WindowKind kind : {WindowKind::DAY, WindowKind::WEEK, WindowKind::GROWTH}) {
        int64_t completed = elapsed / window_period_days(kind);
        for (int64_t k = 1; k <= completed; ++k) {
            due.push_back({AnalysisWindow{kind, static_cast<int>(k)}, false});
        }
    }

    due.push_back({AnalysisWindow::overall(), overall_is_final(experiment, as_of_date)});
    return due;
}

// Backfill dates: start+1 .. min(end+1, today), inclusive.
inline std::vector<int> run_dates(const Experiment& experiment, int today) {
    std::vector<int> dates;
    int last = today;
    if (experiment.end_date.has_value()) {
        last = std::min(last, time_utils::add_days(*experiment.end_date, 1));
    }
    for (int d = time_utils::add_days(experiment.start_date, 1); d <= last;
         d = time_utils::add_days(d, 1)) {
        dates.push_back(d);
    }
    return dates;
}
