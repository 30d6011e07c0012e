#ifndef ANALYSIS_POOL_HPP
#define ANALYSIS_POOL_HPP

#include "interview_errors.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// Fixed set of worker threads draining a bounded job queue.
//
// submit() throws ServiceBusyError instead of growing the queue past its
// limit. Exceptions thrown by a job surface through its future.
class AnalysisPool {
public:
    AnalysisPool(size_t worker_count, size_t queue_limit);
    ~AnalysisPool();

    AnalysisPool(const AnalysisPool&) = delete;
    AnalysisPool& operator=(const AnalysisPool&) = delete;

    template <typename F>
    auto submit(F&& job) -> std::future<decltype(job())> {
        using Result = decltype(job());
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(job));
        std::future<Result> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    void shutdown();

    size_t workerCount() const { return workers_.size(); }
    size_t queueLimit() const { return queue_limit_; }
    size_t pending() const;

private:
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    size_t queue_limit_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::atomic<bool> running_;

    void enqueue(std::function<void()> job);
    void workerLoop();
};

#endif // ANALYSIS_POOL_HPP
