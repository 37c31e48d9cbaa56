#pragma once

#include "time_utils.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <tuple>

// ---------------------------------------------------------------------------
// WindowKind — period family of an analysis window
// ---------------------------------------------------------------------------
enum class WindowKind { DAY, WEEK, GROWTH, OVERALL };

constexpr int OVERALL_INDEX = 0;

inline std::string window_kind_name(WindowKind kind) {
    switch (kind) {
        case WindowKind::DAY:     return "day";
        case WindowKind::WEEK:    return "week";
        case WindowKind::GROWTH:  return "growth";
        case WindowKind::OVERALL: return "overall";
    }
    return "unknown";
}

inline WindowKind parse_window_kind(const std::string& name) {
    if (name == "day") return WindowKind::DAY;
    if (name == "week") return WindowKind::WEEK;
    if (name == "growth") return WindowKind::GROWTH;
    if (name == "overall") return WindowKind::OVERALL;
    throw std::invalid_argument("Unknown window kind: " + name);
}

// Period length in days; 0 for OVERALL (open-ended).
inline int window_period_days(WindowKind kind) {
    switch (kind) {
        case WindowKind::DAY:     return 1;
        case WindowKind::WEEK:    return 7;
        case WindowKind::GROWTH:  return 28;
        case WindowKind::OVERALL: return 0;
    }
    return 0;
}

// ---------------------------------------------------------------------------
// AnalysisWindow — (kind, 1-based period index) or (OVERALL, OVERALL_INDEX)
// ---------------------------------------------------------------------------
struct AnalysisWindow {
    WindowKind kind = WindowKind::DAY;
    int index = 1;

    static AnalysisWindow day(int k) { return {WindowKind::DAY, k}; }
    static AnalysisWindow week(int k) { return {WindowKind::WEEK, k}; }
    static AnalysisWindow growth(int k) { return {WindowKind::GROWTH, k}; }
    static AnalysisWindow overall() { return {WindowKind::OVERALL, OVERALL_INDEX}; }

    bool is_overall() const { return kind == WindowKind::OVERALL; }

    // Stable key, e.g. "day_3", "week_1", "overall_0".
    std::string key() const {
        return window_kind_name(kind) + "_" + std::to_string(index);
    }

    bool operator==(const AnalysisWindow& o) const {
        return kind == o.kind && index == o.index;
    }
    bool operator!=(const AnalysisWindow& o) const { return !(*this == o); }
    bool operator<(const AnalysisWindow& o) const {
        return std::tie(kind, index) < std::tie(o.kind, o.index);
    }
};

// ---------------------------------------------------------------------------
// DueWindow — a window that should be (re)computed for a given as-of date
// ---------------------------------------------------------------------------
struct DueWindow {
    AnalysisWindow window;
    bool is_final = false;

    bool operator==(const DueWindow& o) const {
        return window == o.window && is_final == o.is_final;
    }
};

// ---------------------------------------------------------------------------
// WindowBounds — half-open per-unit interval [begin_ts, end_ts)
// ---------------------------------------------------------------------------
struct WindowBounds {
    uint64_t begin_ts = 0;
    uint64_t end_ts = 0;

    bool contains(uint64_t ts) const { return ts >= begin_ts && ts < end_ts; }
};

// Periodic windows: [enroll + (k-1)*L, enroll + k*L). Overall: [enroll, horizon).
inline WindowBounds window_bounds(const AnalysisWindow& window, uint64_t enrollment_ts,
                                  uint64_t horizon_ts) {
    if (window.is_overall()) {
        return {enrollment_ts, horizon_ts};
    }
    uint64_t len = static_cast<uint64_t>(window_period_days(window.kind)) * time_utils::NS_PER_DAY;
    uint64_t k = static_cast<uint64_t>(window.index);
    return {enrollment_ts + (k - 1) * len, enrollment_ts + k * len};
}
