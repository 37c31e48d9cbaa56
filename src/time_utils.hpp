#pragma once

#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Time constants and utilities for YYYYMMDD dates and UTC nanosecond timestamps
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr uint64_t NS_PER_SEC  = 1'000'000'000ULL;
constexpr uint64_t NS_PER_HOUR = 3600ULL * NS_PER_SEC;
constexpr uint64_t NS_PER_DAY  = 24ULL * NS_PER_HOUR;

// Days since 1970-01-01 for a proleptic Gregorian civil date (Hinnant's algorithm).
constexpr int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

// Inverse of days_from_civil, returned as a YYYYMMDD integer.
constexpr int civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;
    const int64_t m = mp < 10 ? mp + 3 : mp - 9;
    const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return static_cast<int>(y * 10000 + m * 100 + d);
}

inline bool is_valid_date(int date) {
    int y = date / 10000, m = (date / 100) % 100, d = date % 100;
    if (y < 1970 || m < 1 || m > 12 || d < 1) return false;
    // Round-trip rejects days past the end of the month.
    return civil_from_days(days_from_civil(y, m, d)) == date;
}

inline int64_t date_to_days(int date) {
    if (!is_valid_date(date)) {
        throw std::invalid_argument("Invalid YYYYMMDD date: " + std::to_string(date));
    }
    return days_from_civil(date / 10000, (date / 100) % 100, date % 100);
}

inline int days_to_date(int64_t days) {
    return civil_from_days(days);
}

inline int add_days(int date, int64_t n) {
    return days_to_date(date_to_days(date) + n);
}

// Signed number of days from `from` to `to`.
inline int64_t days_between(int from, int to) {
    return date_to_days(to) - date_to_days(from);
}

// 00:00:00 UTC of the given date.
inline uint64_t date_to_midnight_ns(int date) {
    return static_cast<uint64_t>(date_to_days(date)) * NS_PER_DAY;
}

inline int ns_to_date(uint64_t ts) {
    return days_to_date(static_cast<int64_t>(ts / NS_PER_DAY));
}

inline std::string date_to_string(int date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date / 10000, (date / 100) % 100, date % 100);
    return buf;
}

// Accepts "YYYYMMDD" or "YYYY-MM-DD".
inline int parse_date(const std::string& s) {
    std::string digits;
    for (char c : s) {
        if (c == '-') continue;
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid date string: " + s);
        }
        digits += c;
    }
    if (digits.size() != 8) {
        throw std::invalid_argument("Invalid date string: " + s);
    }
    int date = std::stoi(digits);
    if (!is_valid_date(date)) {
        throw std::invalid_argument("Invalid date string: " + s);
    }
    return date;
}

}  // namespace time_utils
