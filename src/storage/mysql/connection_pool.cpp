#include "storage/mysql/connection_pool.hpp"

#include <utility>

namespace relay {
namespace storage {

ConnectionPool::ConnectionPool(Options options) : options_(std::move(options)) {}

ConnectionPool::Lease::Lease(ConnectionPool* owner, std::unique_ptr<Connection> connection)
    : owner_(owner), connection_(std::move(connection)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)), connection_(std::move(other.connection_)) {}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        owner_ = std::exchange(other.owner_, nullptr);
        connection_ = std::move(other.connection_);
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    Release();
}

void ConnectionPool::Lease::Release() noexcept {
    if (owner_ != nullptr && connection_) {
        owner_->GiveBack(std::move(connection_));
    }
    owner_ = nullptr;
}

std::unique_ptr<Connection> ConnectionPool::TakeIdleLocked() {
    // 后进先出, 优先复用最近归还的连接
    auto connection = std::move(idle_.back());
    idle_.pop_back();
    return connection;
}

common::StatusOr<ConnectionPool::Lease> ConnectionPool::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (idle_.empty() && opened_ >= options_.pool_size) {
        const bool ready = returned_.wait_for(lock, options_.acquire_timeout, [this] {
            return !idle_.empty() || opened_ < options_.pool_size;
        });
        if (!ready) {
            return common::Status::Unavailable("Acquire connection timeout");
        }
    }
    if (!idle_.empty()) {
        return common::StatusOr<Lease>(Lease(this, TakeIdleLocked()));
    }

    // 占住名额后在锁外建连
    ++opened_;
    lock.unlock();
    auto created = Connection::Create(options_);
    if (!created.IsOk()) {
        lock.lock();
        --opened_;
        returned_.notify_one();
        return created.GetStatus();
    }
    return common::StatusOr<Lease>(Lease(this, std::move(created.Value())));
}

common::Status ConnectionPool::Warmup() {
    auto lease = Acquire();
    return lease.IsOk() ? common::Status::OK() : lease.GetStatus();
}

std::size_t ConnectionPool::IdleConnections() {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

void ConnectionPool::GiveBack(std::unique_ptr<Connection> connection) {
    const bool alive = connection->Ping();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (alive) {
            idle_.push_back(std::move(connection));
        } else {
            --opened_;
        }
    }
    returned_.notify_one();
}

}
}
