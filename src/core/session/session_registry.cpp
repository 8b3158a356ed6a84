#include "core/session/session_registry.hpp"

namespace relay {
namespace core {

SessionRegistry::AccountGuard::AccountGuard(SessionRegistry& registry,
                                            std::string account_id,
                                            std::shared_ptr<std::mutex> mutex)
    : registry_(registry), account_id_(std::move(account_id)), mutex_(std::move(mutex)) {
    mutex_->lock();
}

SessionRegistry::AccountGuard::~AccountGuard() {
    mutex_->unlock();
    registry_.ReleaseAccountLock(account_id_, std::move(mutex_));
}

SessionRegistry::AccountGuard SessionRegistry::LockAccount(const std::string& account_id) {
    std::shared_ptr<std::mutex> mutex;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = locks_[account_id];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        mutex = slot;
    }
    // 在 mutex_ 之外等待账号锁
    return AccountGuard(*this, account_id, std::move(mutex));
}

void SessionRegistry::ReleaseAccountLock(const std::string& account_id, std::shared_ptr<std::mutex> held) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(account_id);
    // 表项与 held 之外没有其他引用, 说明无人持有也无人等待
    if (it != locks_.end() && it->second == held && held.use_count() == 2) {
        locks_.erase(it);
    }
}

std::size_t SessionRegistry::LockCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.size();
}

std::shared_ptr<Session> SessionRegistry::Find(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(account_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

bool SessionRegistry::Install(const std::shared_ptr<Session>& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.emplace(session->AccountId(), session).second;
}

bool SessionRegistry::Remove(const std::string& account_id, const Session* expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(account_id);
    if (it == sessions_.end() || it->second.get() != expected) {
        return false;
    }
    sessions_.erase(it);
    return true;
}

std::vector<std::shared_ptr<Session>> SessionRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Session>> sessions;
    sessions.reserve(sessions_.size());
    for (const auto& [account_id, session] : sessions_) {
        sessions.push_back(session);
    }
    return sessions;
}

std::size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::size_t SessionRegistry::CountInState(ConnectionState state, const std::string& exclude_account) const {
    std::size_t count = 0;
    for (const auto& session : Snapshot()) {
        if (session->AccountId() != exclude_account && session->State() == state) {
            ++count;
        }
    }
    return count;
}

}
}
