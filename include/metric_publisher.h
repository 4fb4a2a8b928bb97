#pragma once

#include "core_metrics.h"
#include "metric.h"
#include "metric_collection_aggregator.h"
#include "metric_uploader.h"
#include "serial_executor.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace metricpub {

enum class SinkMode {
    FILE_BASED,  // Use partitioned file queue
    KAFKA        // Use Kafka message queue
};

struct PublisherConfig {
    std::string namespace_name = "MetricPub/Client";
    std::chrono::milliseconds flush_interval = std::chrono::minutes(1);
    size_t metric_queue_size = 1000;

    std::set<std::string> dimensions{core_metrics::SERVICE_ID.name, core_metrics::OPERATION_NAME.name};
    std::set<MetricCategory> metric_categories{MetricCategory::ALL};
    MetricLevel metric_level = MetricLevel::INFO;
    std::set<std::string> detailed_metrics;

    // Requests beyond this many per flush are dropped
    size_t max_upload_calls_per_flush = 10;
    std::chrono::milliseconds upload_timeout = std::chrono::seconds(5);
    std::chrono::milliseconds shutdown_timeout = std::chrono::seconds(5);

    // Transport created by the publisher when none is injected
    SinkMode sink = SinkMode::FILE_BASED;
    std::string queue_path = "metric_queue";
    int num_partitions = 4;
    std::string kafka_brokers = "localhost:9092";
    std::string kafka_topic = "metrics";
};

// Aggregates published collections on a single background thread and uploads
// the aggregates every flush interval.
class MetricPublisher {
public:
    // Creates and owns the uploader described by config.sink; it is closed with the publisher
    explicit MetricPublisher(PublisherConfig config);

    // Uses an injected uploader; the caller keeps ownership and closes it
    MetricPublisher(PublisherConfig config, std::shared_ptr<MetricUploader> uploader);

    ~MetricPublisher();

    MetricPublisher(const MetricPublisher&) = delete;
    MetricPublisher& operator=(const MetricPublisher&) = delete;

    // Never blocks. The collection is dropped with a warning if the queue is full.
    void publish(MetricCollection collection);

    // Trigger a flush now instead of waiting for the timer
    void flush();

    // Stop the timer, flush once more, wait for in-flight work (bounded by
    // shutdown_timeout) and close the uploader if this publisher owns it
    void close();

    const PublisherConfig& config() const { return config_; }

    size_t get_published_requests() const { return published_requests_; }
    size_t get_failed_requests() const { return failed_requests_; }
    size_t get_dropped_requests() const { return dropped_requests_; }
    size_t get_dropped_collections() const { return dropped_collections_; }
    size_t get_flush_count() const { return flush_count_; }

    static std::shared_ptr<MetricUploader> create_uploader(const PublisherConfig& config);

private:
    struct PendingUpload {
        std::vector<std::future<void>> results;
        std::chrono::steady_clock::time_point deadline;
    };

    void start();
    void timer_loop();
    void submit_flush();
    void flush_metrics();
    void reporter_loop();
    void report(PendingUpload& pending);

    PublisherConfig config_;
    std::shared_ptr<MetricUploader> uploader_;
    bool close_uploader_;

    // Touched only from the executor thread
    MetricCollectionAggregator aggregator_;
    std::unique_ptr<SerialExecutor> executor_;

    std::thread timer_thread_;
    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool timer_running_ = true;

    std::deque<PendingUpload> pending_uploads_;
    std::mutex reporter_mutex_;
    std::condition_variable reporter_cv_;
    bool reporter_running_ = true;
    std::thread reporter_thread_;

    std::atomic<size_t> published_requests_{0};
    std::atomic<size_t> failed_requests_{0};
    std::atomic<size_t> dropped_requests_{0};
    std::atomic<size_t> dropped_collections_{0};
    std::atomic<size_t> flush_count_{0};
    std::atomic<bool> closed_{false};
};

} // namespace metricpub
