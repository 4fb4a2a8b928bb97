#include "metric_aggregator.h"
#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>

namespace metricpub {

namespace {

void hash_combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

} // namespace

size_t MetricAggregatorKeyHash::operator()(const MetricAggregatorKey& key) const {
    size_t h = 0;
    hash_combine(h, std::hash<std::string>{}(key.metric.name));
    hash_combine(h, std::hash<int>{}(static_cast<int>(key.metric.value_type)));
    for (const auto& dimension : key.dimensions) {
        hash_combine(h, std::hash<std::string>{}(dimension.name));
        hash_combine(h, std::hash<std::string>{}(dimension.value));
    }
    return h;
}

Unit unit_for(ValueType value_type) {
    return value_type == ValueType::DURATION ? Unit::MILLISECONDS : Unit::NONE;
}

void SummaryMetricAggregator::add_value(double value) {
    min_ = std::min(min_, value);
    max_ = std::max(max_, value);
    sum_ += value;
    if (!std::isfinite(sum_)) {
        // Saturate on overflow, the inputs themselves are always finite
        sum_ = std::copysign(std::numeric_limits<double>::max(), sum_);
    }
    ++count_;
}

MetricDatum SummaryMetricAggregator::make_datum(const MetricAggregatorKey& key, Unit unit,
                                                Clock::time_point time_bucket) const {
    if (count_ == 0) {
        throw std::logic_error("Summary aggregator for " + key.metric.name + " has no values");
    }

    MetricDatum datum;
    datum.metric_name = key.metric.name;
    datum.dimensions = key.dimensions;
    datum.unit = unit;
    datum.timestamp = time_bucket;
    datum.statistic_values = StatisticSet{min_, max_, sum_, static_cast<double>(count_)};
    return datum;
}

void DetailedMetricAggregator::add_value(double value) {
    ++value_counts_[value];
}

MetricDatum DetailedMetricAggregator::make_datum(const MetricAggregatorKey& key, Unit unit,
                                                 Clock::time_point time_bucket,
                                                 ValueCounts::const_iterator& next,
                                                 size_t max_entries) const {
    MetricDatum datum;
    datum.metric_name = key.metric.name;
    datum.dimensions = key.dimensions;
    datum.unit = unit;
    datum.timestamp = time_bucket;

    for (size_t emitted = 0; emitted < max_entries && next != value_counts_.end(); ++emitted, ++next) {
        datum.values.push_back(next->first);
        datum.counts.push_back(static_cast<double>(next->second));
    }
    return datum;
}

MetricAggregator::MetricAggregator(MetricAggregatorKey key, bool detailed)
    : key_(std::move(key)), unit_(unit_for(key_.metric.value_type)) {
    if (detailed) {
        state_.emplace<DetailedMetricAggregator>();
    }
}

void MetricAggregator::add_value(double value) {
    std::visit([value](auto& aggregator) { aggregator.add_value(value); }, state_);
}

} // namespace metricpub
