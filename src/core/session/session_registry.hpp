#pragma once

#include "core/session/session.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace relay {
namespace core {

// 进程内唯一的账号 -> 会话映射, 每个账号最多一条记录
class SessionRegistry {
public:
    // 持有期间独占一个账号; 最后一个持有者释放时回收该账号的互斥量
    class AccountGuard {
    public:
        AccountGuard(SessionRegistry& registry, std::string account_id, std::shared_ptr<std::mutex> mutex);
        ~AccountGuard();

        AccountGuard(const AccountGuard&) = delete;
        AccountGuard& operator=(const AccountGuard&) = delete;

    private:
        SessionRegistry& registry_;
        std::string account_id_;
        std::shared_ptr<std::mutex> mutex_;
    };

    // 串行化同一账号的 init / disconnect / 销毁
    AccountGuard LockAccount(const std::string& account_id);
    std::size_t LockCount() const;

    std::shared_ptr<Session> Find(const std::string& account_id) const;
    // 调用方需持有账号锁; 账号已有会话时返回 false
    bool Install(const std::shared_ptr<Session>& session);
    // 仅当当前记录就是 expected 时删除
    bool Remove(const std::string& account_id, const Session* expected);

    std::vector<std::shared_ptr<Session>> Snapshot() const;
    std::size_t Size() const;
    std::size_t CountInState(ConnectionState state, const std::string& exclude_account = "") const;

private:
    void ReleaseAccountLock(const std::string& account_id, std::shared_ptr<std::mutex> held);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

}
}
