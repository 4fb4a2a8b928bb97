#include "serial_executor.h"
#include <iostream>

namespace metricpub {

SerialExecutor::SerialExecutor(std::string name, size_t capacity)
    : name_(std::move(name)), capacity_(capacity) {
    worker_thread_ = std::thread(&SerialExecutor::worker_loop, this);
}

SerialExecutor::~SerialExecutor() {
    shutdown_now();
}

bool SerialExecutor::try_submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!accepting_ || tasks_.size() >= capacity_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

bool SerialExecutor::shutdown(std::chrono::milliseconds timeout) {
    accepting_ = false;

    std::unique_lock<std::mutex> lock(queue_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return tasks_.empty() && !busy_; });
}

void SerialExecutor::shutdown_now() {
    accepting_ = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
        size_t discarded = tasks_.size();
        std::queue<Task>().swap(tasks_);
        if (discarded > 0) {
            std::cerr << "[" << name_ << "] Discarded " << discarded << " pending tasks at shutdown\n";
        }
    }
    queue_cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

size_t SerialExecutor::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

void SerialExecutor::worker_loop() {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    while (running_) {
        // Wait for tasks or shutdown signal
        queue_cv_.wait(lock, [this] {
            return !tasks_.empty() || !running_;
        });

        while (!tasks_.empty() && running_) {
            Task task = std::move(tasks_.front());
            tasks_.pop();
            busy_ = true;

            // Release lock while the task runs
            lock.unlock();
            try {
                task();
            } catch (const std::exception& e) {
                std::cerr << "[" << name_ << "] Task failed: " << e.what() << "\n";
            }
            lock.lock();

            busy_ = false;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

} // namespace metricpub
