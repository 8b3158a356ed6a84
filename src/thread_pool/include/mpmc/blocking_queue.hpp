#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace thread_pool {

enum class PopResult {
    Item,     // An item was taken
    Timeout,  // Deadline passed with the queue empty
    Closed,   // Queue closed and drained
};

// Bounded MPMC queue guarded by one mutex. After Close() pushes fail and
// pops keep returning the remaining items before reporting Closed.
template <typename T>
class BlockingQueue {
public:
    explicit BlockingQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    // Non-blocking push; fails when full or closed
    bool TryPush(T&& item) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_ || items_.size() >= capacity_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    // Blocks while full; fails only when closed
    bool WaitPush(T&& item) {
        {
            std::unique_lock<std::mutex> lk(mtx_);
            not_full_.wait(lk, [this] { return closed_ || items_.size() < capacity_; });
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    // Blocks until an item is available; nullopt once closed and drained
    std::optional<T> WaitPop() {
        std::unique_lock<std::mutex> lk(mtx_);
        not_empty_.wait(lk, [this] { return closed_ || !items_.empty(); });
        return PopLocked(lk);
    }

    template <typename Clock, typename Duration>
    PopResult WaitPopUntil(T& out, const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lk(mtx_);
        if (!not_empty_.wait_until(lk, deadline, [this] { return closed_ || !items_.empty(); })) {
            return PopResult::Timeout;
        }
        auto item = PopLocked(lk);
        if (!item) {
            return PopResult::Closed;
        }
        out = std::move(*item);
        return PopResult::Item;
    }

    std::optional<T> TryPop() {
        std::unique_lock<std::mutex> lk(mtx_);
        return PopLocked(lk);
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool Closed() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return items_.size();
    }

    std::size_t Capacity() const noexcept {
        return capacity_;
    }

    // Drops queued items and hands them back to the caller
    std::deque<T> Clear() {
        std::deque<T> drained;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            drained.swap(items_);
        }
        not_full_.notify_all();
        return drained;
    }

private:
    std::optional<T> PopLocked(std::unique_lock<std::mutex>& lk) {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        lk.unlock();
        not_full_.notify_one();
        return item;
    }

    const std::size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_{false};
};

}
