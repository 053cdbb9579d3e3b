/*
 * ScriptCell C++ - Thread Pool
 *
 * Fixed set of worker threads draining a FIFO task queue. Used by the
 * request server to run several executions at once; each task blocks on
 * its own sandbox worker process. A bounded queue makes enqueue() wait,
 * which holds the server back from reading further requests.
 */
#ifndef scriptcell_CORE_THREAD_POOL_HPP
#define scriptcell_CORE_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace scriptcell {

class ThreadPool {
public:
    typedef std::function<void()> Task;

    // max_queued == 0 leaves the queue unbounded
    explicit ThreadPool(size_t num_threads, size_t max_queued = 0);
    ~ThreadPool();

    // Queue a task, waiting while the queue is full. Returns false once
    // shutdown has begun.
    bool enqueue(Task task);

    // Tasks queued or running
    size_t pending() const;

    // Stop accepting tasks, finish the queued ones, join all threads
    void shutdown();

    size_t size() const { return threads_.size(); }

private:
    ThreadPool(const ThreadPool&);
    ThreadPool& operator=(const ThreadPool&);

    void worker_loop();

    std::vector<std::thread> threads_;
    std::deque<Task> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable space_cv_;
    size_t max_queued_;
    size_t active_;
    bool stopping_;
};

} // namespace scriptcell

#endif // scriptcell_CORE_THREAD_POOL_HPP
