#pragma once

#include "metric_uploader.h"
#include <librdkafka/rdkafkacpp.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace metricpub {

// Uploads requests as JSON messages to a Kafka topic, keyed by namespace.
// Each upload future completes from the delivery report of its message.
class KafkaUploader : public MetricUploader {
public:
    KafkaUploader(const std::string& brokers, const std::string& topic,
                  std::chrono::milliseconds close_timeout = std::chrono::milliseconds(5000));
    ~KafkaUploader() override;

    std::future<void> upload(const UploadRequest& request) override;

    // Flush outstanding messages, purge whatever did not make it in time and stop polling
    void close() override;

    int get_message_count() const { return delivered_count_; }
    const std::string& get_brokers() const { return brokers_; }
    const std::string& get_topic() const { return topic_; }

private:
    class DeliveryReporter : public RdKafka::DeliveryReportCb {
    public:
        explicit DeliveryReporter(KafkaUploader& uploader) : uploader_(uploader) {}
        void dr_cb(RdKafka::Message& message) override;

    private:
        KafkaUploader& uploader_;
    };

    using DeliveryPromise = std::promise<void>;

    // Background polling thread serving delivery reports
    void poll_loop();

    RdKafka::ErrorCode produce(const std::string& key, const std::string& payload, void* opaque);

    // Complete and free a promise that is still outstanding. Returns false if it was
    // already completed, e.g. failed by close() before its report arrived.
    bool complete(DeliveryPromise* promise, std::exception_ptr error);

    // Fail every promise whose delivery report never arrived
    void fail_outstanding(const std::string& reason);

    std::string brokers_;
    std::string topic_;
    std::chrono::milliseconds close_timeout_;

    std::atomic<int> delivered_count_{0};
    DeliveryReporter delivery_reporter_;

    // Promises handed to librdkafka as message opaques and not yet completed
    std::unordered_set<DeliveryPromise*> outstanding_;
    std::mutex outstanding_mutex_;
    std::unique_ptr<RdKafka::Producer> producer_;
    std::mutex mutex_;

    std::thread poll_thread_;
    std::atomic<bool> poll_running_{false};
    std::atomic<bool> closed_{false};
};

} // namespace metricpub
