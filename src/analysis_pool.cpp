#include "analysis_pool.hpp"
#include <iostream>

AnalysisPool::AnalysisPool(size_t worker_count, size_t queue_limit)
    : queue_limit_(queue_limit == 0 ? 1 : queue_limit), running_(true) {
    if (worker_count == 0) {
        worker_count = 1;
    }
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back(&AnalysisPool::workerLoop, this);
    }
    std::cout << "Analysis pool started with " << worker_count << " workers (queue limit "
              << queue_limit_ << ")" << std::endl;
}

AnalysisPool::~AnalysisPool() {
    shutdown();
}

void AnalysisPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    available_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t AnalysisPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void AnalysisPool::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            throw ServiceBusyError("Analysis pool is shutting down");
        }
        if (queue_.size() >= queue_limit_) {
            std::cerr << "Analysis queue full (" << queue_.size() << " pending), rejecting frame" << std::endl;
            throw ServiceBusyError("Frame analysis queue is full, retry later");
        }
        queue_.push_back(std::move(job));
    }
    available_.notify_one();
}

void AnalysisPool::workerLoop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            available_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        job();
    }
}
