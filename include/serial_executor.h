#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace metricpub {

// Runs submitted tasks one at a time, in submission order, on a single worker
// thread. The queue is bounded: submissions beyond capacity are rejected.
class SerialExecutor {
public:
    using Task = std::function<void()>;

    SerialExecutor(std::string name, size_t capacity);
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    // False if the queue is full or the executor is shutting down
    bool try_submit(Task task);

    // Stop accepting tasks and wait up to `timeout` for the queue to drain.
    // Returns true if every accepted task ran.
    bool shutdown(std::chrono::milliseconds timeout);

    // Discard queued tasks and join the worker. The task currently running, if any,
    // is allowed to finish.
    void shutdown_now();

    size_t pending() const;
    size_t capacity() const { return capacity_; }
    bool is_accepting() const { return accepting_; }

private:
    void worker_loop();

    std::string name_;
    size_t capacity_;

    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    bool busy_ = false;

    std::atomic<bool> accepting_{true};
    std::atomic<bool> running_{true};
    std::thread worker_thread_;
};

} // namespace metricpub
