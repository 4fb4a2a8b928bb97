#include "core_metrics.h"
#include "metric_publisher.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace cm = metricpub::core_metrics;

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

// One simulated client call: a top-level "ApiCall" collection with one child per attempt
metricpub::MetricCollection simulate_api_call(std::mt19937& rng) {
    static const std::vector<std::pair<std::string, std::string>> operations = {
        {"DynamoDB", "GetItem"}, {"DynamoDB", "PutItem"}, {"DynamoDB", "Query"},
        {"S3", "GetObject"}, {"S3", "PutObject"}, {"Sqs", "SendMessage"},
    };

    std::uniform_int_distribution<size_t> pick_operation(0, operations.size() - 1);
    std::uniform_int_distribution<int> attempt_count(1, 3);
    std::lognormal_distribution<double> latency_ms(3.0, 0.6);
    std::uniform_int_distribution<int> pool(0, 50);

    const auto& [service, operation] = operations[pick_operation(rng)];
    int attempts = attempt_count(rng);

    metricpub::MetricCollector call("ApiCall");
    call.report_metric(cm::SERVICE_ID, service);
    call.report_metric(cm::OPERATION_NAME, operation);
    call.report_metric(cm::RETRY_COUNT, attempts - 1);
    call.report_metric(cm::API_CALL_SUCCESSFUL, true);

    double total_ms = 0.0;
    for (int i = 0; i < attempts; ++i) {
        auto& attempt = call.create_child("ApiCallAttempt");
        double attempt_ms = latency_ms(rng);
        total_ms += attempt_ms;

        attempt.report_metric(cm::SERVICE_CALL_DURATION,
                              std::chrono::duration_cast<std::chrono::nanoseconds>(
                                  std::chrono::duration<double, std::milli>(attempt_ms)));
        attempt.report_metric(cm::HTTP_STATUS_CODE, i + 1 < attempts ? 503 : 200);
        attempt.report_metric(cm::AWS_REQUEST_ID, "req-" + std::to_string(rng()));

        auto& http = attempt.create_child("HttpClient");
        http.report_metric(cm::HTTP_CLIENT_NAME, "curl");
        http.report_metric(cm::MAX_CONCURRENCY, 50);
        int leased = pool(rng);
        http.report_metric(cm::LEASED_CONCURRENCY, leased);
        http.report_metric(cm::AVAILABLE_CONCURRENCY, 50 - leased);
    }

    call.report_metric(cm::API_CALL_DURATION,
                       std::chrono::duration_cast<std::chrono::nanoseconds>(
                           std::chrono::duration<double, std::milli>(total_ms)));
    return call.collect();
}

int main(int argc, char* argv[]) {
    // Usage: ./metricpub_loadgen [mode] [duration_seconds] [flush_seconds] [calls_per_second] [kafka_brokers] [topic]
    // Example: ./metricpub_loadgen file 120 10 500
    // Example: ./metricpub_loadgen kafka 0 60 1000 localhost:9092 metrics   (0 = run until Ctrl+C)

    metricpub::PublisherConfig config;
    int duration_seconds = 0;
    int calls_per_second = 200;
    const int num_threads = 4;

    try {
        if (argc > 1) {
            std::string mode_arg = argv[1];
            if (mode_arg == "kafka") {
                config.sink = metricpub::SinkMode::KAFKA;
            } else if (mode_arg != "file") {
                std::cerr << "Unknown mode: " << mode_arg << ". Use 'file' or 'kafka'\n";
                return 1;
            }
        }
        if (argc > 2) {
            duration_seconds = std::stoi(argv[2]);
        }
        if (argc > 3) {
            config.flush_interval = std::chrono::seconds(std::stoi(argv[3]));
        }
        if (argc > 4) {
            calls_per_second = std::stoi(argv[4]);
        }
        if (argc > 5) {
            config.kafka_brokers = argv[5];
        }
        if (argc > 6) {
            config.kafka_topic = argv[6];
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    }

    config.detailed_metrics = {cm::API_CALL_DURATION.name};

    std::cout << "Starting metric load generator: " << calls_per_second << " calls/s on "
              << num_threads << " threads\n";
    std::cout << "Using sink: " << (config.sink == metricpub::SinkMode::FILE_BASED ? "file-based" : "kafka") << "\n";
    if (config.sink == metricpub::SinkMode::KAFKA) {
        std::cout << "Kafka brokers: " << config.kafka_brokers << ", topic: " << config.kafka_topic << "\n";
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        metricpub::MetricPublisher publisher(config);

        std::vector<std::thread> clients;
        for (int t = 0; t < num_threads; ++t) {
            clients.emplace_back([&publisher, calls_per_second, num_threads, t]() {
                std::mt19937 rng(static_cast<unsigned>(t) * 7919u + 17u);
                auto pause = std::chrono::microseconds(1000000LL * num_threads / std::max(calls_per_second, 1));
                while (running) {
                    publisher.publish(simulate_api_call(rng));
                    std::this_thread::sleep_for(pause);
                }
            });
        }

        auto started = std::chrono::steady_clock::now();
        while (running) {
            std::this_thread::sleep_for(std::chrono::seconds(1));

            std::cout << "[STATS] published_requests=" << publisher.get_published_requests()
                      << " failed_requests=" << publisher.get_failed_requests()
                      << " dropped_collections=" << publisher.get_dropped_collections() << "\n";

            if (duration_seconds > 0 &&
                std::chrono::steady_clock::now() - started >= std::chrono::seconds(duration_seconds)) {
                running = false;
            }
        }

        for (auto& client : clients) {
            client.join();
        }

        std::cout << "Shutting down gracefully..." << std::endl;
        publisher.close();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
