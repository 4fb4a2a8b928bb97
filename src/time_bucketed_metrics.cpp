#include "time_bucketed_metrics.h"
#include "metric_extractor.h"
#include <cmath>

namespace metricpub {

TimeBucketedMetrics::TimeBucketedMetrics(AggregationConfig config)
    : config_(std::move(config)),
      categories_contain_all_(config_.metric_categories.count(MetricCategory::ALL) > 0) {
}

Clock::time_point TimeBucketedMetrics::bucket_for(Clock::time_point time) {
    return std::chrono::time_point_cast<Clock::duration>(
        std::chrono::floor<std::chrono::minutes>(time));
}

void TimeBucketedMetrics::add_metrics(const MetricCollection& collection) {
    auto dimensions = extract_dimensions(collection, config_.dimensions);
    Bucket* bucket = nullptr;

    for (const MetricRecord* record : extract_all_records(collection)) {
        auto value = value_for(*record);
        if (!value) {
            continue;
        }

        // Buckets are created only once something is about to land in them
        if (bucket == nullptr) {
            bucket = &buckets_[bucket_for(collection.creation_time())];
        }

        MetricAggregatorKey key(record->metric, dimensions);
        auto it = bucket->find(key);
        if (it == bucket->end()) {
            bool detailed = config_.detailed_metrics.count(record->metric.name) > 0;
            MetricAggregator aggregator(key, detailed);
            it = bucket->emplace(std::move(key), std::move(aggregator)).first;
        }
        it->second.add_value(*value);
    }
}

void TimeBucketedMetrics::reset() {
    buckets_.clear();
}

std::optional<double> TimeBucketedMetrics::value_for(const MetricRecord& record) const {
    if (!has_reported_category(record) || !level_includes(config_.metric_level, record.metric.level)) {
        return std::nullopt;
    }

    std::optional<double> result;
    switch (record.metric.value_type) {
        case ValueType::DURATION:
            if (const auto* d = std::get_if<std::chrono::nanoseconds>(&record.value)) {
                result = static_cast<double>(std::chrono::floor<std::chrono::milliseconds>(*d).count());
            }
            break;
        case ValueType::INTEGER:
            if (const auto* i = std::get_if<int64_t>(&record.value)) {
                result = static_cast<double>(*i);
            }
            break;
        case ValueType::DOUBLE:
            if (const auto* v = std::get_if<double>(&record.value)) {
                result = *v;
            }
            break;
        case ValueType::STRING:
        case ValueType::BOOLEAN:
            break;
    }

    // NaN and infinities cannot be histogram keys and are rejected by the store
    if (result && !std::isfinite(*result)) {
        return std::nullopt;
    }
    return result;
}

bool TimeBucketedMetrics::has_reported_category(const MetricRecord& record) const {
    if (categories_contain_all_) {
        return true;
    }
    for (auto category : record.metric.categories) {
        if (config_.metric_categories.count(category) > 0) {
            return true;
        }
    }
    return false;
}

} // namespace metricpub
