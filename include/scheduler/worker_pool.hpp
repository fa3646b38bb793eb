#pragma once

/**
 * WorkerPool - fixed set of threads draining a job queue
 *
 * Jobs submitted after shutdown() are rejected. shutdown() lets queued and
 * running jobs finish, then joins every thread.
 */

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace tradefinder {
namespace scheduler {

class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(size_t thread_count) {
        if (thread_count == 0)
            thread_count = 1;
        threads_.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            threads_.emplace_back([this]() { worker_loop(); });
        }
    }

    ~WorkerPool() { shutdown(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once the pool is shutting down
    bool submit(Job job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
                return false;
            jobs_.push_back(std::move(job));
        }
        cv_.notify_one();
        return true;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ && threads_.empty())
                return;
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& t : threads_) {
            if (t.joinable())
                t.join();
        }
        threads_.clear();
    }

    size_t size() const { return threads_.size(); }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    std::vector<std::thread> threads_;
    bool stopping_ = false;

    void worker_loop() {
        for (;;) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
                if (jobs_.empty())
                    return; // stopping and drained
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            job();
        }
    }
};

}  // namespace scheduler
}  // namespace tradefinder
