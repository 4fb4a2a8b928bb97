#include "metric_publisher.h"
#include "kafka_uploader.h"
#include "partitioned_file_uploader.h"
#include <iostream>
#include <stdexcept>

namespace metricpub {

namespace {

AggregationConfig aggregation_config(const PublisherConfig& config) {
    AggregationConfig result;
    result.dimensions = config.dimensions;
    result.metric_categories = config.metric_categories;
    result.metric_level = config.metric_level;
    result.detailed_metrics = config.detailed_metrics;
    return result;
}

} // namespace

std::shared_ptr<MetricUploader> MetricPublisher::create_uploader(const PublisherConfig& config) {
    if (config.sink == SinkMode::KAFKA) {
        return std::make_shared<KafkaUploader>(config.kafka_brokers, config.kafka_topic, config.shutdown_timeout);
    }
    return std::make_shared<PartitionedFileUploader>(config.queue_path, config.num_partitions);
}

MetricPublisher::MetricPublisher(PublisherConfig config)
    : config_(std::move(config)),
      uploader_(create_uploader(config_)),
      close_uploader_(true),
      aggregator_(config_.namespace_name, aggregation_config(config_)) {
    start();
}

MetricPublisher::MetricPublisher(PublisherConfig config, std::shared_ptr<MetricUploader> uploader)
    : config_(std::move(config)),
      uploader_(std::move(uploader)),
      close_uploader_(false),
      aggregator_(config_.namespace_name, aggregation_config(config_)) {
    if (!uploader_) {
        throw std::invalid_argument("MetricPublisher requires an uploader");
    }
    start();
}

MetricPublisher::~MetricPublisher() {
    close();
}

void MetricPublisher::start() {
    if (config_.flush_interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Flush interval must be positive");
    }

    executor_ = std::make_unique<SerialExecutor>("metric-publisher", config_.metric_queue_size);
    reporter_thread_ = std::thread(&MetricPublisher::reporter_loop, this);
    timer_thread_ = std::thread(&MetricPublisher::timer_loop, this);

    std::cout << "[PUBLISHER] Started: namespace=" << config_.namespace_name
              << ", flush_interval=" << config_.flush_interval.count() << "ms"
              << ", queue_size=" << config_.metric_queue_size << "\n";
}

void MetricPublisher::publish(MetricCollection collection) {
    bool accepted = executor_->try_submit([this, collection = std::move(collection)]() {
        aggregator_.add_collection(collection);
    });

    if (accepted) {
        return;
    }
    dropped_collections_++;

    // The executor also rejects once close() has started, that is not a full queue
    if (!executor_->is_accepting()) {
        std::cerr << "[PUBLISHER] Request metrics have been dropped because the publisher is closed\n";
    } else {
        std::cerr << "[PUBLISHER] Request metrics have been dropped because the metric queue is full\n";
    }
}

void MetricPublisher::flush() {
    if (!closed_) {
        submit_flush();
    }
}

void MetricPublisher::timer_loop() {
    std::unique_lock<std::mutex> lock(timer_mutex_);
    auto next_flush = std::chrono::steady_clock::now() + config_.flush_interval;

    while (timer_running_) {
        if (timer_cv_.wait_until(lock, next_flush, [this] { return !timer_running_; })) {
            break;
        }
        next_flush += config_.flush_interval;

        lock.unlock();
        submit_flush();
        lock.lock();
    }
}

void MetricPublisher::submit_flush() {
    // A skipped flush would let the store grow without bound, so keep retrying
    while (!executor_->try_submit([this]() { flush_metrics(); })) {
        if (!executor_->is_accepting()) {
            std::cerr << "[PUBLISHER] Flush not scheduled, executor is shut down\n";
            return;
        }
        std::this_thread::yield();
    }
}

void MetricPublisher::flush_metrics() {
    flush_count_++;
    std::vector<UploadRequest> requests = aggregator_.get_requests();
    if (requests.empty()) {
        return;
    }

    if (requests.size() > config_.max_upload_calls_per_flush) {
        size_t dropped = requests.size() - config_.max_upload_calls_per_flush;
        dropped_requests_ += dropped;
        std::cerr << "[PUBLISHER] Dropping " << dropped << " of " << requests.size()
                  << " requests, at most " << config_.max_upload_calls_per_flush
                  << " uploads are made per flush\n";
        requests.resize(config_.max_upload_calls_per_flush);
    }

    PendingUpload pending;
    pending.deadline = std::chrono::steady_clock::now() + config_.upload_timeout;
    pending.results.reserve(requests.size());

    for (const auto& request : requests) {
        try {
            pending.results.push_back(uploader_->upload(request));
        } catch (const std::exception&) {
            std::promise<void> failed;
            failed.set_exception(std::current_exception());
            pending.results.push_back(failed.get_future());
        }
    }

    {
        std::lock_guard<std::mutex> lock(reporter_mutex_);
        pending_uploads_.push_back(std::move(pending));
    }
    reporter_cv_.notify_one();
}

void MetricPublisher::reporter_loop() {
    std::unique_lock<std::mutex> lock(reporter_mutex_);

    while (true) {
        reporter_cv_.wait(lock, [this] { return !pending_uploads_.empty() || !reporter_running_; });
        if (pending_uploads_.empty()) {
            break;
        }

        PendingUpload pending = std::move(pending_uploads_.front());
        pending_uploads_.pop_front();

        lock.unlock();
        report(pending);
        lock.lock();
    }
}

void MetricPublisher::report(PendingUpload& pending) {
    size_t failures = 0;
    std::string sample_failure;

    for (auto& result : pending.results) {
        if (result.wait_until(pending.deadline) != std::future_status::ready) {
            if (failures++ == 0) {
                sample_failure = "upload timed out";
            }
            continue;
        }
        try {
            result.get();
        } catch (const std::exception& e) {
            if (failures++ == 0) {
                sample_failure = e.what();
            }
        }
    }

    size_t total = pending.results.size();
    failed_requests_ += failures;
    published_requests_ += total - failures;

    if (failures == 0) {
        std::cout << "[PUBLISHER] Published " << total << " requests.\n";
    } else {
        std::cerr << "[PUBLISHER] " << failures << " out of " << total
                  << " requests failed to publish. One failure reason: " << sample_failure << "\n";
    }
}

void MetricPublisher::close() {
    if (closed_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        timer_running_ = false;
    }
    timer_cv_.notify_all();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }

    // Final flush for whatever was aggregated since the last tick
    submit_flush();

    if (!executor_->shutdown(config_.shutdown_timeout)) {
        std::cerr << "[PUBLISHER] Pending metric tasks did not finish within "
                  << config_.shutdown_timeout.count() << "ms\n";
    }
    executor_->shutdown_now();

    // Every queued upload has a deadline, so this join is bounded
    {
        std::lock_guard<std::mutex> lock(reporter_mutex_);
        reporter_running_ = false;
    }
    reporter_cv_.notify_all();
    if (reporter_thread_.joinable()) {
        reporter_thread_.join();
    }

    if (close_uploader_) {
        uploader_->close();
    }

    std::cout << "[PUBLISHER] Closed: published=" << published_requests_
              << ", failed=" << failed_requests_
              << ", dropped_collections=" << dropped_collections_ << "\n";
}

} // namespace metricpub
