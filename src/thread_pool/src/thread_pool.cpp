#include "thread_pool/thread_pool.hpp"

#include <algorithm>

namespace thread_pool {

ThreadPool::ThreadPool(std::size_t threads_count, std::size_t queue_cap)
    : queue_(queue_cap), threads_(std::max<std::size_t>(1, threads_count)) {}

ThreadPool::ThreadPool(const ThreadPoolConfig& cfg)
    : queue_(cfg.queue_cap), threads_(std::max<std::size_t>(1, cfg.threads)), policy_(cfg.queue_policy) {}

ThreadPool::~ThreadPool() {
    Stop(StopMode::Graceful);
}

void ThreadPool::Start() {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    if (state_.load(std::memory_order_acquire) != PoolState::CREATED) {
        TP_LOG_WARN("Start ignored: pool state={}", State());
        return;
    }
    workers_.reserve(threads_);
    for (std::size_t i = 0; i < threads_; ++i) {
        workers_.emplace_back([this] { WorkerLoop(); });
    }
    SetState(PoolState::RUNNING);
    TP_LOG_INFO("ThreadPool started: threads={} queue_cap={} policy={}",
                threads_, queue_.Capacity(), policy_);
}

void ThreadPool::Stop(StopMode mode) {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    const auto current = state_.load(std::memory_order_acquire);
    if (current == PoolState::STOPPED) {
        return;
    }
    if (current == PoolState::CREATED) {
        queue_.Close();
        SetState(PoolState::STOPPED);
        return;
    }

    SetState(mode == StopMode::Force ? PoolState::FORCE_STOPPING : PoolState::SHUTTING_DOWN);
    queue_.Close();
    if (mode == StopMode::Force) {
        auto dropped = queue_.Clear();
        auto eptr = std::make_exception_ptr(std::runtime_error("force stopped"));
        for (auto& task : dropped) {
            task->Cancel(eptr);
        }
        cancelled_.fetch_add(dropped.size(), std::memory_order_relaxed);
        if (!dropped.empty()) {
            TP_LOG_WARN("ThreadPool force stop cancelled {} queued tasks", dropped.size());
        }
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    SetState(PoolState::STOPPED);
    TP_LOG_INFO("ThreadPool stopped: mode={} completed={} failed={}",
                mode, completed_.load(), failed_.load());
}

bool ThreadPool::Post(std::function<void()> f) {
    if (!Enqueue(std::make_unique<SimpleTask>(std::move(f)))) {
        TP_LOG_WARN("Post rejected: pool state={} pending={}", State(), Pending());
        return false;
    }
    return true;
}

bool ThreadPool::Enqueue(TaskPtr task) {
    if (state_.load(std::memory_order_acquire) != PoolState::RUNNING) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    const bool pushed = policy_ == QueueFullPolicy::Block
        ? queue_.WaitPush(std::move(task))
        : queue_.TryPush(std::move(task));
    if (!pushed) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    submitted_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void ThreadPool::WorkerLoop() {
    for (;;) {
        auto task = queue_.WaitPop();
        if (!task) {
            return;  // closed and drained
        }
        active_.fetch_add(1, std::memory_order_relaxed);
        (*task)->Execute();
        if ((*task)->Success()) {
            completed_.fetch_add(1, std::memory_order_relaxed);
        } else {
            failed_.fetch_add(1, std::memory_order_relaxed);
        }
        active_.fetch_sub(1, std::memory_order_relaxed);
    }
}

void ThreadPool::SetState(PoolState new_state) noexcept {
    state_.store(new_state, std::memory_order_release);
}

bool ThreadPool::Running() const noexcept {
    return state_.load(std::memory_order_acquire) == PoolState::RUNNING;
}

std::size_t ThreadPool::Pending() const noexcept {
    return queue_.Size();
}

std::size_t ThreadPool::ActiveTasks() const noexcept {
    return active_.load(std::memory_order_relaxed);
}

std::size_t ThreadPool::Threads() const noexcept {
    return threads_;
}

PoolState ThreadPool::State() const noexcept {
    return state_.load(std::memory_order_acquire);
}

QueueFullPolicy ThreadPool::GetQueueFullPolicy() const noexcept {
    return policy_;
}

Statistics ThreadPool::GetStatistics() const noexcept {
    Statistics stats;
    stats.statistic_total_submitted = submitted_.load(std::memory_order_relaxed);
    stats.statistic_total_completed = completed_.load(std::memory_order_relaxed);
    stats.statistic_total_failed = failed_.load(std::memory_order_relaxed);
    stats.statistic_total_cancelled = cancelled_.load(std::memory_order_relaxed);
    stats.statistic_total_rejected = rejected_.load(std::memory_order_relaxed);
    stats.statistic_pending_tasks = Pending();
    stats.statistic_active_tasks = ActiveTasks();
    return stats;
}

}
