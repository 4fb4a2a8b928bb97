#pragma once

#include "metric.h"
#include "time_bucketed_metrics.h"
#include "upload_request.h"
#include <string>
#include <vector>

namespace metricpub {

// Aggregates metric collections and turns them into size-bounded upload requests.
//
// Not thread-safe: add_collection() and get_requests() must be serialized by the
// caller. MetricPublisher funnels every call through its single executor thread.
class MetricCollectionAggregator {
public:
    static constexpr size_t MAX_METRIC_DATA_PER_REQUEST = 20;
    static constexpr size_t MAX_VALUES_PER_REQUEST = 300;

    MetricCollectionAggregator(std::string namespace_name, AggregationConfig config);

    // Fold one collection tree into the current time buckets. Records of disabled
    // categories or levels and values that cannot be summarized are ignored.
    void add_collection(const MetricCollection& collection);

    // Build upload requests for everything aggregated so far, then reset.
    // This is a destructive read: a second call without add_collection() in
    // between returns an empty list.
    std::vector<UploadRequest> get_requests();

    const std::string& namespace_name() const { return namespace_; }

private:
    std::string namespace_;
    TimeBucketedMetrics time_bucketed_metrics_;
};

} // namespace metricpub
