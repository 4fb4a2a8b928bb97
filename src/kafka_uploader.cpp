#include "kafka_uploader.h"
#include <iostream>
#include <stdexcept>

namespace metricpub {

void KafkaUploader::DeliveryReporter::dr_cb(RdKafka::Message& message) {
    auto* promise = static_cast<DeliveryPromise*>(message.msg_opaque());
    if (promise == nullptr) {
        return;
    }

    if (message.err() == RdKafka::ERR_NO_ERROR) {
        if (uploader_.complete(promise, nullptr)) {
            uploader_.delivered_count_++;
        }
    } else {
        uploader_.complete(promise, std::make_exception_ptr(
            std::runtime_error("Kafka delivery failed: " + message.errstr())));
    }
}

bool KafkaUploader::complete(DeliveryPromise* promise, std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(outstanding_mutex_);
        if (outstanding_.erase(promise) == 0) {
            return false;
        }
    }

    if (error) {
        promise->set_exception(error);
    } else {
        promise->set_value();
    }
    delete promise;
    return true;
}

void KafkaUploader::fail_outstanding(const std::string& reason) {
    std::unordered_set<DeliveryPromise*> remaining;
    {
        std::lock_guard<std::mutex> lock(outstanding_mutex_);
        remaining.swap(outstanding_);
    }

    for (DeliveryPromise* promise : remaining) {
        promise->set_exception(std::make_exception_ptr(std::runtime_error(reason)));
        delete promise;
    }
    if (!remaining.empty()) {
        std::cerr << "Kafka uploader failed " << remaining.size() << " undelivered uploads: " << reason << "\n";
    }
}

KafkaUploader::KafkaUploader(const std::string& brokers, const std::string& topic,
                             std::chrono::milliseconds close_timeout)
    : brokers_(brokers), topic_(topic), close_timeout_(close_timeout),
      delivery_reporter_(*this) {

    std::string errstr;
    std::unique_ptr<RdKafka::Conf> conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));

    if (conf->set("bootstrap.servers", brokers, errstr) != RdKafka::Conf::CONF_OK) {
        throw std::runtime_error("Failed to set bootstrap.servers: " + errstr);
    }
    if (conf->set("dr_cb", &delivery_reporter_, errstr) != RdKafka::Conf::CONF_OK) {
        throw std::runtime_error("Failed to set delivery report callback: " + errstr);
    }

    // Requests arrive pre-batched, only a short linger is needed
    conf->set("linger.ms", "5", errstr);
    conf->set("compression.type", "lz4", errstr);

    // Transport-level retries
    conf->set("message.send.max.retries", "10", errstr);
    conf->set("retry.backoff.ms", "100", errstr);
    conf->set("request.required.acks", "1", errstr);

    producer_.reset(RdKafka::Producer::create(conf.get(), errstr));
    if (!producer_) {
        throw std::runtime_error("Failed to create producer: " + errstr);
    }

    poll_running_ = true;
    poll_thread_ = std::thread(&KafkaUploader::poll_loop, this);

    std::cout << "Kafka uploader initialized: brokers=" << brokers
              << ", topic=" << topic << "\n";
}

KafkaUploader::~KafkaUploader() {
    close();
}

std::future<void> KafkaUploader::upload(const UploadRequest& request) {
    std::promise<void> rejected;
    if (closed_) {
        rejected.set_exception(std::make_exception_ptr(std::runtime_error("Kafka uploader is closed")));
        return rejected.get_future();
    }

    auto* promise = new DeliveryPromise();
    std::future<void> result = promise->get_future();
    {
        std::lock_guard<std::mutex> lock(outstanding_mutex_);
        outstanding_.insert(promise);
    }

    std::string message = to_json(request);
    RdKafka::ErrorCode err = produce(request.namespace_name, message, promise);

    if (err == RdKafka::ERR__QUEUE_FULL) {
        // Queue is full - this is rare. Try once more with a brief wait
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        err = produce(request.namespace_name, message, promise);
    }

    if (err != RdKafka::ERR_NO_ERROR) {
        // Not enqueued, so no delivery report will ever arrive for this promise
        complete(promise, std::make_exception_ptr(
            std::runtime_error("Failed to produce message: " + RdKafka::err2str(err))));
    }
    return result;
}

RdKafka::ErrorCode KafkaUploader::produce(const std::string& key, const std::string& payload, void* opaque) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!producer_) {
        return RdKafka::ERR__STATE;
    }

    // RK_MSG_COPY means librdkafka copies the payload, so we can return immediately
    return producer_->produce(
        topic_,
        RdKafka::Topic::PARTITION_UA,
        RdKafka::Producer::RK_MSG_COPY,
        const_cast<char*>(payload.data()), payload.size(),
        key.empty() ? nullptr : key.data(), key.size(),
        0,
        opaque
    );
}

void KafkaUploader::poll_loop() {
    while (poll_running_) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (producer_) {
            // Blocking poll, wakes up on callbacks or after 100ms
            producer_->poll(100);
        }
    }
}

void KafkaUploader::close() {
    if (closed_.exchange(true)) {
        return;
    }

    poll_running_ = false;
    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!producer_) {
        return;
    }

    RdKafka::ErrorCode err = producer_->flush(static_cast<int>(close_timeout_.count()));
    if (err != RdKafka::ERR_NO_ERROR) {
        std::cerr << "Failed to flush Kafka uploader: " << RdKafka::err2str(err)
                  << ", purging " << producer_->outq_len() << " pending messages\n";
        err = producer_->purge(RdKafka::Producer::PURGE_QUEUE | RdKafka::Producer::PURGE_INFLIGHT);
        if (err != RdKafka::ERR_NO_ERROR) {
            std::cerr << "Failed to purge Kafka uploader: " << RdKafka::err2str(err) << "\n";
        }
    }

    // Serve the delivery reports of purged messages so their futures fail
    int polls = 0;
    while (producer_->outq_len() > 0 && polls < 100) {
        producer_->poll(100);
        polls++;
    }
    if (producer_->outq_len() > 0) {
        std::cerr << "Warning: Kafka uploader has " << producer_->outq_len()
                  << " messages still in queue at shutdown, purging again\n";
        err = producer_->purge(RdKafka::Producer::PURGE_QUEUE | RdKafka::Producer::PURGE_INFLIGHT |
                               RdKafka::Producer::PURGE_NON_BLOCKING);
        if (err != RdKafka::ERR_NO_ERROR) {
            std::cerr << "Failed to purge Kafka uploader: " << RdKafka::err2str(err) << "\n";
        }
        producer_->poll(0);
    }

    producer_.reset();

    // Reports that never arrived would otherwise leave their futures pending forever
    fail_outstanding("Kafka uploader closed before delivery was confirmed");

    std::cout << "Kafka uploader closed. Total delivered: " << delivered_count_ << " messages.\n";
}

} // namespace metricpub
