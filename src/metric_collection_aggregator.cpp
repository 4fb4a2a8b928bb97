#include "metric_collection_aggregator.h"
#include <algorithm>

namespace metricpub {

namespace {

// Packs data into requests, opening a new request whenever the item or value
// budget of the current one is used up.
class RequestBuilder {
public:
    explicit RequestBuilder(const std::string& namespace_name) : namespace_(namespace_name) {}

    // Values that still fit into the current request, after rolling over to a new
    // request if the current one is full
    size_t reserve_slot() {
        if (current_.metric_data.size() >= MetricCollectionAggregator::MAX_METRIC_DATA_PER_REQUEST ||
            values_in_request_ >= MetricCollectionAggregator::MAX_VALUES_PER_REQUEST) {
            close_request();
        }
        return MetricCollectionAggregator::MAX_VALUES_PER_REQUEST - values_in_request_;
    }

    void add(MetricDatum datum, size_t value_count) {
        values_in_request_ += value_count;
        current_.metric_data.push_back(std::move(datum));
    }

    std::vector<UploadRequest> finish() {
        if (!current_.empty()) {
            close_request();
        }
        return std::move(requests_);
    }

private:
    void close_request() {
        current_.namespace_name = namespace_;
        requests_.push_back(std::move(current_));
        current_ = UploadRequest{};
        values_in_request_ = 0;
    }

    const std::string& namespace_;
    std::vector<UploadRequest> requests_;
    UploadRequest current_;
    size_t values_in_request_ = 0;
};

struct DatumEmitter {
    RequestBuilder& builder;
    const MetricAggregator& aggregator;
    Clock::time_point time_bucket;

    void operator()(const SummaryMetricAggregator& summary) const {
        builder.reserve_slot();
        builder.add(summary.make_datum(aggregator.key(), aggregator.unit(), time_bucket), 1);
    }

    void operator()(const DetailedMetricAggregator& detailed) const {
        auto next = detailed.value_counts().begin();
        while (next != detailed.value_counts().end()) {
            size_t budget = builder.reserve_slot();
            auto datum = detailed.make_datum(aggregator.key(), aggregator.unit(), time_bucket, next, budget);
            size_t added = datum.values.size();
            builder.add(std::move(datum), added);
        }
    }
};

} // namespace

MetricCollectionAggregator::MetricCollectionAggregator(std::string namespace_name, AggregationConfig config)
    : namespace_(std::move(namespace_name)), time_bucketed_metrics_(std::move(config)) {
}

void MetricCollectionAggregator::add_collection(const MetricCollection& collection) {
    time_bucketed_metrics_.add_metrics(collection);
}

std::vector<UploadRequest> MetricCollectionAggregator::get_requests() {
    RequestBuilder builder(namespace_);

    for (const auto& [time_bucket, bucket] : time_bucketed_metrics_.buckets()) {
        for (const auto& entry : bucket) {
            const MetricAggregator& aggregator = entry.second;
            std::visit(DatumEmitter{builder, aggregator, time_bucket}, aggregator.state());
        }
    }

    auto requests = builder.finish();
    time_bucketed_metrics_.reset();
    return requests;
}

} // namespace metricpub
