#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace bootstrap {

constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

inline uint64_t fnv1a_64(const std::string& data, uint64_t hash = FNV_OFFSET_BASIS) {
    for (unsigned char c : data) {
        hash ^= c;
        hash *= FNV_PRIME;
    }
    return hash;
}

// Seed for one resampling stream. Parts are separated by a unit separator so
// ("ab", "c") and ("a", "bc") hash differently.
inline uint64_t derive_seed(uint64_t master_seed, const std::vector<std::string>& parts) {
    uint64_t hash = FNV_OFFSET_BASIS;
    for (int i = 0; i < 8; ++i) {
        hash ^= static_cast<unsigned char>((master_seed >> (8 * i)) & 0xFF);
        hash *= FNV_PRIME;
    }
    for (const auto& p : parts) {
        hash = fnv1a_64(p, hash);
        hash ^= 0x1F;
        hash *= FNV_PRIME;
    }
    return hash;
}

// Linear-interpolated quantile of already sorted data.
inline double sorted_quantile(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) throw std::invalid_argument("quantile of empty sample");
    if (!(q >= 0.0 && q <= 1.0)) throw std::invalid_argument("quantile must be in [0, 1]");
    if (sorted.size() == 1) return sorted.front();

    double pos = q * static_cast<double>(sorted.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(pos));
    size_t hi = std::min(lo + 1, sorted.size() - 1);
    double frac = pos - static_cast<double>(lo);
    if (sorted[lo] == sorted[hi]) return sorted[lo];
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

// Sorts in place.
inline double quantile(std::vector<double>& values, double q) {
    std::sort(values.begin(), values.end());
    return sorted_quantile(values, q);
}

inline double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

// Statistic evaluated on one resample; may reorder its argument.
using StatisticFn = std::function<double(std::vector<double>&)>;

inline StatisticFn mean_statistic() {
    return [](std::vector<double>& v) { return mean(v); };
}

inline StatisticFn quantile_statistic(double q) {
    return [q](std::vector<double>& v) { return quantile(v, q); };
}

// ---------------------------------------------------------------------------
// resample — draw num_resamples samples with replacement and evaluate the
// statistic on each. Same (values, seed) always yields the same sequence.
// ---------------------------------------------------------------------------
inline std::vector<double> resample(const std::vector<double>& values, int num_resamples,
                                    uint64_t seed, const StatisticFn& statistic) {
    if (values.empty()) throw std::invalid_argument("cannot resample an empty sample");
    if (num_resamples < 1) throw std::invalid_argument("num_resamples must be >= 1");

    std::mt19937_64 rng(seed);
    const uint64_t n = values.size();
    std::vector<double> sample(values.size());
    std::vector<double> stats;
    stats.reserve(static_cast<size_t>(num_resamples));

    for (int r = 0; r < num_resamples; ++r) {
        for (size_t i = 0; i < sample.size(); ++i) {
            sample[i] = values[rng() % n];
        }
        stats.push_back(statistic(sample));
    }
    return stats;
}

inline bool is_constant(const std::vector<double>& values) {
    return std::adjacent_find(values.begin(), values.end(), std::not_equal_to<double>()) ==
           values.end();
}

inline double sample_stddev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double m = mean(values);
    double ss = 0.0;
    for (double v : values) ss += (v - m) * (v - m);
    return std::sqrt(ss / static_cast<double>(values.size() - 1));
}

// Silverman's rule-of-thumb kernel bandwidth.
inline double smoothing_bandwidth(const std::vector<double>& values) {
    return 1.06 * sample_stddev(values) * std::pow(static_cast<double>(values.size()), -0.2);
}

// ---------------------------------------------------------------------------
// smoothed_resample — like resample, but each drawn value is perturbed by
// Gaussian noise of width smoothing_bandwidth(values). Used when the plain
// bootstrap of a quantile collapses on a non-constant sample.
// ---------------------------------------------------------------------------
inline std::vector<double> smoothed_resample(const std::vector<double>& values,
                                             int num_resamples, uint64_t seed,
                                             const StatisticFn& statistic) {
    if (values.empty()) throw std::invalid_argument("cannot resample an empty sample");
    if (num_resamples < 1) throw std::invalid_argument("num_resamples must be >= 1");

    const double h = smoothing_bandwidth(values);
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> noise(0.0, 1.0);
    const uint64_t n = values.size();
    std::vector<double> sample(values.size());
    std::vector<double> stats;
    stats.reserve(static_cast<size_t>(num_resamples));

    for (int r = 0; r < num_resamples; ++r) {
        for (size_t i = 0; i < sample.size(); ++i) {
            sample[i] = values[rng() % n] + h * noise(rng);
        }
        stats.push_back(statistic(sample));
    }
    return stats;
}

// ---------------------------------------------------------------------------
// PercentileInterval — point = median of the bootstrap distribution,
// bounds = (1-c)/2 and (1+c)/2 quantiles
// ---------------------------------------------------------------------------
struct PercentileInterval {
    double point = 0.0;
    double lower = 0.0;
    double upper = 0.0;
};

inline PercentileInterval percentile_interval(std::vector<double> distribution, double confidence) {
    if (!(confidence > 0.0 && confidence < 1.0)) {
        throw std::invalid_argument("confidence level must be in (0, 1)");
    }
    std::sort(distribution.begin(), distribution.end());

    PercentileInterval ci;
    ci.lower = sorted_quantile(distribution, (1.0 - confidence) / 2.0);
    ci.upper = sorted_quantile(distribution, (1.0 + confidence) / 2.0);
    ci.point = sorted_quantile(distribution, 0.5);
    // Interpolation rounding must not push the point outside its bounds.
    ci.lower = std::min(ci.lower, ci.point);
    ci.upper = std::max(ci.upper, ci.point);
    return ci;
}

inline bool all_finite(const std::vector<double>& values) {
    return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

}  // namespace bootstrap
