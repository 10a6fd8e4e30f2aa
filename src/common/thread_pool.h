#pragma once

/// @file thread_pool.h
/// @brief Fixed-size worker pool used to run analyses off the caller's thread

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace reviewscope {

class ThreadPool {
public:
    /// @param num_threads Worker count; 0 selects hardware concurrency
    explicit ThreadPool(size_t num_threads = 0);

    /// @brief Drains queued tasks, then joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Queue a callable and obtain a future for its result
    /// @throws std::runtime_error if the pool is shutting down
    template <typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    size_t Size() const { return workers_.size(); }

    /// @brief Queued plus running tasks
    size_t PendingTasks() const;

    /// @brief Block until the queue is empty and no task is running
    void Wait();

    bool IsStopped() const { return stop_.load(std::memory_order_acquire); }

private:
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable task_available_;
    std::condition_variable idle_;

    std::atomic<bool> stop_{false};
    size_t active_tasks_ = 0;  // guarded by mutex_
};

template <typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using ResultType = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<ResultType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<ResultType> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_.load(std::memory_order_acquire)) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    task_available_.notify_one();
    return result;
}

}  // namespace reviewscope
