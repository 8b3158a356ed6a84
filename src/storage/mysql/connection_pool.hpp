#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/connection.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace relay {
namespace storage {

// 固定上限的 MySQL 连接池, 连接按需创建
class ConnectionPool {
public:
    explicit ConnectionPool(Options options);

    // 借出的连接, 析构时归还
    class Lease {
    public:
        Lease() = default;
        Lease(ConnectionPool* owner, std::unique_ptr<Connection> connection);
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        Connection* operator->() noexcept { return connection_.get(); }
        Connection& operator*() noexcept { return *connection_; }
        MYSQL* Raw() const noexcept { return connection_ ? connection_->Raw() : nullptr; }
        explicit operator bool() const noexcept { return connection_ != nullptr; }

    private:
        void Release() noexcept;

        ConnectionPool* owner_ = nullptr;
        std::unique_ptr<Connection> connection_;
    };

    // 取一条连接; 池满时最多等待 acquire_timeout
    common::StatusOr<Lease> Acquire();
    // 启动探测, 建立的连接留在池中
    common::Status Warmup();

    std::size_t IdleConnections();
    const Options& GetOptions() const noexcept { return options_; }

private:
    std::unique_ptr<Connection> TakeIdleLocked();
    void GiveBack(std::unique_ptr<Connection> connection);

    Options options_;
    std::mutex mutex_;
    std::condition_variable returned_;
    std::vector<std::unique_ptr<Connection>> idle_;
    std::size_t opened_ = 0;
};

}
}
