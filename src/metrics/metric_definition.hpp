#pragma once

#include "core/errors.hpp"

#include <cmath>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

// ---------------------------------------------------------------------------
// Enumerations
// ---------------------------------------------------------------------------
enum class StatisticalType { BINARY, CONTINUOUS, COUNT };

// How a unit's qualifying events collapse to one scalar.
enum class Aggregation { ANY, COUNT, SUM, MEAN, MAX, DISTINCT_DAYS };

// What a unit with no qualifying events contributes.
enum class MissingValue { ZERO, NO_DATA };

// Statistic bootstrapped for continuous metrics.
enum class Summary { MEAN, MEDIAN, PERCENTILE };

inline std::string statistical_type_name(StatisticalType t) {
    switch (t) {
        case StatisticalType::BINARY:     return "binary";
        case StatisticalType::CONTINUOUS: return "continuous";
        case StatisticalType::COUNT:      return "count";
    }
    return "unknown";
}

inline std::string aggregation_name(Aggregation a) {
    switch (a) {
        case Aggregation::ANY:           return "any";
        case Aggregation::COUNT:         return "count";
        case Aggregation::SUM:           return "sum";
        case Aggregation::MEAN:          return "mean";
        case Aggregation::MAX:           return "max";
        case Aggregation::DISTINCT_DAYS: return "distinct_days";
    }
    return "unknown";
}

// ANY/COUNT/DISTINCT_DAYS have a natural zero; value aggregates do not.
inline MissingValue default_missing_value(Aggregation a) {
    switch (a) {
        case Aggregation::ANY:
        case Aggregation::COUNT:
        case Aggregation::DISTINCT_DAYS:
            return MissingValue::ZERO;
        default:
            return MissingValue::NO_DATA;
    }
}

// ---------------------------------------------------------------------------
// AggregationRule — event filter + aggregation kind
// ---------------------------------------------------------------------------
struct AggregationRule {
    std::string event_name;
    Aggregation aggregation = Aggregation::ANY;
};

// ---------------------------------------------------------------------------
// Metric variants. Each carries its aggregation rule; the variant tag is the
// statistical type and selects the treatment.
// ---------------------------------------------------------------------------
struct BinaryMetric {
    AggregationRule rule;
};

struct ContinuousMetric {
    AggregationRule rule;
    Summary summary = Summary::MEAN;
    double quantile = 0.5;                 // used when summary == PERCENTILE
    double censor_highest_fraction = 0.0;  // drop this top fraction before resampling
    bool log_transform = false;            // resample log(1 + x)
};

struct CountMetric {
    AggregationRule rule;
};

using MetricKind = std::variant<BinaryMetric, ContinuousMetric, CountMetric>;

// ---------------------------------------------------------------------------
// MetricDefinition
// ---------------------------------------------------------------------------
struct MetricDefinition {
    std::string name;
    std::string description;
    MetricKind kind = BinaryMetric{};
    std::optional<MissingValue> missing;  // unset -> default for the aggregation
    int min_unit_count = 0;               // 0 disables suppression

    StatisticalType statistical_type() const {
        return std::visit([](const auto& k) -> StatisticalType {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, BinaryMetric>) return StatisticalType::BINARY;
            else if constexpr (std::is_same_v<T, ContinuousMetric>) return StatisticalType::CONTINUOUS;
            else return StatisticalType::COUNT;
        }, kind);
    }

    const AggregationRule& rule() const {
        return std::visit([](const auto& k) -> const AggregationRule& { return k.rule; }, kind);
    }

    MissingValue missing_value() const {
        return missing.value_or(default_missing_value(rule().aggregation));
    }

    void validate() const {
        if (name.empty()) {
            throw ConfigError("Metric name must not be empty");
        }
        if (rule().event_name.empty()) {
            throw ConfigError("Metric '" + name + "' has no event name");
        }
        if (min_unit_count < 0) {
            throw ConfigError("Metric '" + name + "' has negative min_unit_count");
        }
        if (const auto* c = std::get_if<ContinuousMetric>(&kind)) {
            if (c->summary == Summary::PERCENTILE && !(c->quantile > 0.0 && c->quantile < 1.0)) {
                throw ConfigError("Metric '" + name + "' percentile must be in (0, 1)");
            }
            if (!(c->censor_highest_fraction >= 0.0 && c->censor_highest_fraction < 1.0)) {
                throw ConfigError("Metric '" + name + "' censor fraction must be in [0, 1)");
            }
        }
        if (const auto* c = std::get_if<CountMetric>(&kind)) {
            if (c->rule.aggregation == Aggregation::MEAN || c->rule.aggregation == Aggregation::MAX) {
                throw ConfigError("Count metric '" + name + "' cannot use " +
                                  aggregation_name(c->rule.aggregation) + " aggregation");
            }
        }
    }

    // Convenience constructors.
    static MetricDefinition binary(const std::string& name, const std::string& event_name,
                                   int min_unit_count = 0) {
        MetricDefinition m;
        m.name = name;
        m.kind = BinaryMetric{{event_name, Aggregation::ANY}};
        m.min_unit_count = min_unit_count;
        return m;
    }

    static MetricDefinition count(const std::string& name, const std::string& event_name,
                                  Aggregation aggregation = Aggregation::COUNT,
                                  int min_unit_count = 0) {
        MetricDefinition m;
        m.name = name;
        m.kind = CountMetric{{event_name, aggregation}};
        m.min_unit_count = min_unit_count;
        return m;
    }

    static MetricDefinition continuous(const std::string& name, const std::string& event_name,
                                       Aggregation aggregation = Aggregation::SUM,
                                       Summary summary = Summary::MEAN,
                                       int min_unit_count = 0) {
        MetricDefinition m;
        m.name = name;
        ContinuousMetric c;
        c.rule = {event_name, aggregation};
        c.summary = summary;
        m.kind = c;
        m.min_unit_count = min_unit_count;
        return m;
    }
};
