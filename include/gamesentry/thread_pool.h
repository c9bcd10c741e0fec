#pragma once

#include <thread>
#include <vector>
#include <queue>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <exception>

namespace gamesentry {

// Fixed-size worker pool used for fire-and-forget notification delivery
class ThreadPool {
public:
    using ErrorHandler = std::function<void(std::exception_ptr)>;

    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Queue a task; returns false once the pool has been shut down
    bool submit_detached(std::function<void()> task);

    size_t queue_size() const;
    size_t active_tasks() const { return active_tasks_.load(); }
    size_t completed_tasks() const { return completed_tasks_.load(); }
    size_t thread_count() const { return workers_.size(); }
    bool is_running() const { return !stop_.load(); }

    // Block until the queue is drained and no task is running
    void wait_all();

    // Stop accepting tasks, finish queued ones and join the workers
    void shutdown();

    // Receives exceptions escaping a task. Without a handler they go to std::cerr.
    void set_error_handler(ErrorHandler handler);

private:
    void worker_thread();
    void report_exception(std::exception_ptr error);

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::condition_variable completion_condition_;

    std::mutex error_handler_mutex_;
    ErrorHandler error_handler_;

    std::atomic<bool> stop_{false};
    std::atomic<size_t> active_tasks_{0};
    std::atomic<size_t> completed_tasks_{0};
};

} // namespace gamesentry
