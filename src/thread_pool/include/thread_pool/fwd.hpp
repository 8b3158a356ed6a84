#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <fmt/format.h>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <type_traits>

namespace spdlog {
class logger;
}

namespace thread_pool {
enum class PoolState {
    CREATED = 0,
    RUNNING,
    SHUTTING_DOWN,  // No longer accepts new tasks; drains queued tasks, then STOPPED.
    FORCE_STOPPING, // No longer accepts new tasks; cancels queued tasks, then STOPPED.
    STOPPED,        // All workers joined
};

enum class StopMode {
    Graceful,
    Force,
};

enum class QueueFullPolicy {
    Block,    // Block the submitter until space is available
    Discard,  // Reject the task
};

using LoggerPtr = std::shared_ptr<spdlog::logger>;

struct ThreadPoolConfig {
    std::size_t     queue_cap{1024};                       // Task queue capacity
    std::size_t     threads{4};                            // Worker thread count
    QueueFullPolicy queue_policy{QueueFullPolicy::Block};  // Backpressure policy
};

// Counter snapshot taken by ThreadPool::GetStatistics
struct Statistics {
    std::uint64_t statistic_total_submitted{0};
    std::uint64_t statistic_total_completed{0};
    std::uint64_t statistic_total_failed{0};
    std::uint64_t statistic_total_cancelled{0};
    std::uint64_t statistic_total_rejected{0};
    std::size_t   statistic_pending_tasks{0};
    std::size_t   statistic_active_tasks{0};
};

class TaskBase {
public:
    virtual ~TaskBase() = default;
    virtual void Execute() noexcept = 0;
    virtual bool Success() const noexcept {
        return true;
    }
    virtual void Cancel(std::exception_ptr eptr) noexcept = 0;
};

// Task with a result delivered through a future
template <typename T>
class FutureTask : public TaskBase {
public:
    using Func = std::function<T()>;

    explicit FutureTask(Func f) : f_(std::move(f)) {}

    std::future<T> GetFuture() {
        return promise_.get_future();
    }

    void Execute() noexcept override {
        if (done_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        try {
            if constexpr (std::is_void_v<T>) {
                f_();
                promise_.set_value();
            } else {
                promise_.set_value(f_());
            }
            ok_.store(true, std::memory_order_release);
        } catch (...) {
            try {
                promise_.set_exception(std::current_exception());
            } catch (const std::future_error&) {}
        }
    }

    bool Success() const noexcept override {
        return ok_.load(std::memory_order_acquire);
    }

    void Cancel(std::exception_ptr eptr) noexcept override {
        if (done_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        if (!eptr) {
            eptr = std::make_exception_ptr(std::runtime_error("task cancelled"));
        }
        try {
            promise_.set_exception(std::move(eptr));
        } catch (const std::future_error&) {}
    }
private:
    Func f_;
    std::promise<T> promise_;
    std::atomic<bool> ok_{false};
    std::atomic<bool> done_{false};
};

// Fire-and-forget task (used by Post)
class SimpleTask : public TaskBase {
public:
    using Func = std::function<void()>;

    explicit SimpleTask(Func f) : f_(std::move(f)) {}

    void Execute() noexcept override {
        if (done_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        try {
            f_();
            ok_.store(true, std::memory_order_release);
        } catch (const std::exception&) {
            ok_.store(false, std::memory_order_release);
        }
    }

    bool Success() const noexcept override {
        return ok_.load(std::memory_order_acquire);
    }

    void Cancel(std::exception_ptr) noexcept override {
        done_.store(true, std::memory_order_release);
    }

private:
    Func f_;
    std::atomic<bool> ok_{false};
    std::atomic<bool> done_{false};
};

using TaskPtr = std::unique_ptr<TaskBase>;

class ThreadPool;

inline std::string_view Name(PoolState state) noexcept {
    switch (state) {
        case PoolState::CREATED: return "CREATED";
        case PoolState::RUNNING: return "RUNNING";
        case PoolState::SHUTTING_DOWN: return "SHUTTING_DOWN";
        case PoolState::FORCE_STOPPING: return "FORCE_STOPPING";
        case PoolState::STOPPED: return "STOPPED";
    }
    return "UNKNOWN";
}

inline std::string_view Name(QueueFullPolicy policy) noexcept {
    return policy == QueueFullPolicy::Block ? "Block" : "Discard";
}

inline std::string_view Name(StopMode mode) noexcept {
    return mode == StopMode::Force ? "Force" : "Graceful";
}
}

namespace fmt {

// Log arguments of the pool's enum types print by name
template <>
struct formatter<thread_pool::PoolState> : formatter<std::string_view> {
    auto format(thread_pool::PoolState v, format_context& ctx) const {
        return formatter<std::string_view>::format(thread_pool::Name(v), ctx);
    }
};

template <>
struct formatter<thread_pool::QueueFullPolicy> : formatter<std::string_view> {
    auto format(thread_pool::QueueFullPolicy v, format_context& ctx) const {
        return formatter<std::string_view>::format(thread_pool::Name(v), ctx);
    }
};

template <>
struct formatter<thread_pool::StopMode> : formatter<std::string_view> {
    auto format(thread_pool::StopMode v, format_context& ctx) const {
        return formatter<std::string_view>::format(thread_pool::Name(v), ctx);
    }
};

}
