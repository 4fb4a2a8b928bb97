#pragma once

#include "metric.h"
#include "metric_extractor.h"
#include "upload_request.h"
#include <cstdint>
#include <limits>
#include <map>
#include <variant>
#include <vector>

namespace metricpub {

// Groups observations of one metric reported with one dimension set
struct MetricAggregatorKey {
    MetricDefinition metric;
    std::vector<Dimension> dimensions;

    MetricAggregatorKey(MetricDefinition m, std::vector<Dimension> dims)
        : metric(std::move(m)), dimensions(std::move(dims)) {}

    bool operator==(const MetricAggregatorKey& other) const {
        return metric == other.metric && dimensions == other.dimensions;
    }
    bool operator!=(const MetricAggregatorKey& other) const { return !(*this == other); }
};

struct MetricAggregatorKeyHash {
    size_t operator()(const MetricAggregatorKey& key) const;
};

// Duration metrics are reported in milliseconds, everything else is unitless
Unit unit_for(ValueType value_type);

// Running min/max/sum/count of every value added
class SummaryMetricAggregator {
public:
    void add_value(double value);

    double min() const { return min_; }
    double max() const { return max_; }
    double sum() const { return sum_; }
    uint64_t count() const { return count_; }

    // Throws std::logic_error if no value was ever added
    MetricDatum make_datum(const MetricAggregatorKey& key, Unit unit,
                           Clock::time_point time_bucket) const;

private:
    double min_ = std::numeric_limits<double>::infinity();
    double max_ = -std::numeric_limits<double>::infinity();
    double sum_ = 0.0;
    uint64_t count_ = 0;
};

// Exact histogram: every distinct value with its number of occurrences
class DetailedMetricAggregator {
public:
    using ValueCounts = std::map<double, uint64_t>;

    void add_value(double value);

    const ValueCounts& value_counts() const { return value_counts_; }
    size_t size() const { return value_counts_.size(); }

    // Emit up to max_entries histogram entries starting at `next`; advances `next`
    // past the emitted entries.
    MetricDatum make_datum(const MetricAggregatorKey& key, Unit unit,
                           Clock::time_point time_bucket,
                           ValueCounts::const_iterator& next, size_t max_entries) const;

private:
    ValueCounts value_counts_;
};

// Aggregator of one key. The variant is chosen once, when the key is first seen.
class MetricAggregator {
public:
    using State = std::variant<SummaryMetricAggregator, DetailedMetricAggregator>;

    MetricAggregator(MetricAggregatorKey key, bool detailed);

    const MetricAggregatorKey& key() const { return key_; }
    Unit unit() const { return unit_; }
    const State& state() const { return state_; }
    bool is_detailed() const { return std::holds_alternative<DetailedMetricAggregator>(state_); }

    void add_value(double value);

private:
    MetricAggregatorKey key_;
    Unit unit_;
    State state_;
};

} // namespace metricpub
