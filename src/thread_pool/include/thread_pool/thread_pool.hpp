#pragma once

#include "mpmc/blocking_queue.hpp"
#include "thread_pool/config.hpp"
#include "thread_pool/fwd.hpp"
#include "thread_pool/logger.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <type_traits>
#include <vector>

namespace thread_pool {
// Fixed-size worker pool over a bounded blocking queue
class ThreadPool {
public:
    explicit ThreadPool(std::size_t threads_count, std::size_t queue_cap = 1024);
    explicit ThreadPool(const ThreadPoolConfig& cfg);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    void Start();
    // Graceful drains queued tasks; Force cancels them. Joins all workers.
    void Stop(StopMode mode = StopMode::Graceful);

    // Fire-and-forget; returns false when the pool rejects the task
    bool Post(std::function<void()> f);
    template <typename Func, typename... Args>
    auto Submit(Func&& f, Args&&... args) -> std::future<std::invoke_result_t<Func, Args...>>;

    // State queries
    bool Running() const noexcept;
    std::size_t Pending() const noexcept;
    std::size_t ActiveTasks() const noexcept;
    std::size_t Threads() const noexcept;
    PoolState State() const noexcept;
    QueueFullPolicy GetQueueFullPolicy() const noexcept;

    Statistics GetStatistics() const noexcept;
private:
    void WorkerLoop();
    void SetState(PoolState new_state) noexcept;
    bool Enqueue(TaskPtr task);

    template <class R>
    static std::future<R> BrokenFuture(std::exception_ptr eptr);
private:
    std::atomic<PoolState> state_{PoolState::CREATED};
    BlockingQueue<TaskPtr> queue_;
    std::vector<std::thread> workers_;
    std::size_t threads_{0};
    QueueFullPolicy policy_{QueueFullPolicy::Block};
    std::mutex lifecycle_mtx_;  // serializes Start/Stop

    // Statistics
    std::atomic<std::size_t> active_{0};
    std::atomic<std::size_t> submitted_{0};
    std::atomic<std::size_t> completed_{0};
    std::atomic<std::size_t> failed_{0};
    std::atomic<std::size_t> cancelled_{0};
    std::atomic<std::size_t> rejected_{0};
};

template <class R>
inline std::future<R> ThreadPool::BrokenFuture(std::exception_ptr eptr) {
    std::promise<R> promise;
    promise.set_exception(std::move(eptr));
    return promise.get_future();
}

template <typename Func, typename... Args>
auto ThreadPool::Submit(Func&& f, Args&&... args) -> std::future<std::invoke_result_t<Func, Args...>> {
    using Return = std::invoke_result_t<Func, Args...>;

    // Package into a closure
    auto bound = [ff = std::forward<Func>(f),
                    tup = std::make_tuple(std::forward<Args>(args)...)]() mutable -> Return
    {
        return std::apply(std::move(ff), std::move(tup));
    };

    auto task_ptr = std::make_unique<FutureTask<Return>>(
        typename FutureTask<Return>::Func(std::move(bound)));
    std::future<Return> fut = task_ptr->GetFuture();

    if (!Enqueue(std::move(task_ptr))) {
        TP_LOG_WARN("Submit rejected: pool state={} pending={}", State(), Pending());
        return BrokenFuture<Return>(
            std::make_exception_ptr(std::runtime_error("ThreadPool::Submit: task rejected")));
    }
    return fut;
}
}
