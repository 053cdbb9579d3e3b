/*
 * ScriptCell C++ - Thread Pool Implementation
 */
#include <scriptcell/core/thread_pool.hpp>
#include <scriptcell/core/logger.hpp>

#include <exception>

namespace scriptcell {

ThreadPool::ThreadPool(size_t num_threads, size_t max_queued)
    : max_queued_(max_queued)
    , active_(0)
    , stopping_(false) {
    if (num_threads == 0) num_threads = 1;
    for (size_t i = 0; i < num_threads; ++i) {
        threads_.push_back(std::thread(&ThreadPool::worker_loop, this));
    }
    LOG_DEBUG("[ThreadPool] Started %zu threads", num_threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(Task task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        space_cv_.wait(lock, [this]() {
            return stopping_ || max_queued_ == 0 || queue_.size() < max_queued_;
        });
        if (stopping_) return false;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

size_t ThreadPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + active_;
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && threads_.empty()) return;
        stopping_ = true;
    }
    cv_.notify_all();
    space_cv_.notify_all();

    for (size_t i = 0; i < threads_.size(); ++i) {
        if (threads_[i].joinable()) {
            threads_[i].join();
        }
    }
    threads_.clear();
}

void ThreadPool::worker_loop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;   // stopping and drained
            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }
        space_cv_.notify_one();

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("[ThreadPool] Task failed: %s", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
    }
}

} // namespace scriptcell
