#pragma once

#include "metric.h"
#include "metric_aggregator.h"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace metricpub {

// Settings shared by the store and the aggregation facade
struct AggregationConfig {
    std::set<std::string> dimensions;
    std::set<MetricCategory> metric_categories{MetricCategory::ALL};
    MetricLevel metric_level = MetricLevel::INFO;
    std::set<std::string> detailed_metrics;
};

// Aggregators grouped by one-minute time bucket. Not thread-safe.
class TimeBucketedMetrics {
public:
    using Bucket = std::unordered_map<MetricAggregatorKey, MetricAggregator, MetricAggregatorKeyHash>;
    using Buckets = std::map<Clock::time_point, Bucket>;

    explicit TimeBucketedMetrics(AggregationConfig config);

    void add_metrics(const MetricCollection& collection);

    const Buckets& buckets() const { return buckets_; }
    bool empty() const { return buckets_.empty(); }
    void reset();

    static Clock::time_point bucket_for(Clock::time_point time);

    // Numeric value of a record, or nullopt when the record is filtered out or its
    // value cannot be summarized
    std::optional<double> value_for(const MetricRecord& record) const;

private:
    bool has_reported_category(const MetricRecord& record) const;

    AggregationConfig config_;
    bool categories_contain_all_;
    Buckets buckets_;
};

} // namespace metricpub
