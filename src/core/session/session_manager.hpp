#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/auth/auth_store.hpp"
#include "core/session/session.hpp"
#include "core/session/session_registry.hpp"
#include "core/session/types.hpp"
#include "events/event_relay.hpp"
#include "events/pairing_renderer.hpp"
#include "transport/transport.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace relay {
namespace core {

// 会话生命周期管理: 状态机, 准入控制, 重连退避与销毁
class SessionManager {
public:
    SessionManager(common::SessionsConfig config,
                   std::shared_ptr<AuthStore> auth_store,
                   std::shared_ptr<transport::TransportFactory> transport_factory,
                   std::shared_ptr<events::PairingRenderer> renderer,
                   std::shared_ptr<events::EventRelay> relay);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    common::StatusOr<InitResult> Init(const std::string& account_id);
    SessionStatus Status(const std::string& account_id) const;
    common::StatusOr<std::string> Send(const std::string& account_id,
                                       const std::string& destination,
                                       const std::string& content);
    common::StatusOr<std::vector<ConversationSummary>> ListConversations(const std::string& account_id);
    common::StatusOr<std::vector<MessageSummary>> ListMessages(const std::string& account_id,
                                                               const std::string& conversation_id,
                                                               int limit);
    // 未知账号也视为成功
    common::Status Disconnect(const std::string& account_id);

    // 回收非 Open / Connecting 的会话, 返回回收数量
    std::size_t SweepStranded();
    // 停止所有驱动线程, 保留凭证
    void Shutdown();

    // 健康检查计数
    std::size_t ActiveSessions() const;
    std::size_t OpenSessions() const;
    std::size_t PendingPairings() const;
    const common::SessionsConfig& Config() const {
        return config_;
    }

private:
    using SessionPtr = std::shared_ptr<Session>;

    common::Status ConnectTransport(const SessionPtr& session);
    common::Status StartDriver(SessionPtr session);
    // 要求会话处于 Open 并返回其传输
    common::StatusOr<std::shared_ptr<transport::Transport>> RequireOpen(const std::string& account_id) const;
    void RunDriver(SessionPtr session);

    // 事件处理, 返回 false 表示驱动线程应退出
    bool HandleEvent(const SessionPtr& session, transport::TransportEvent& event);
    bool OnPairingCode(const SessionPtr& session, const transport::PairingCodeEvent& event);
    bool OnOpened(const SessionPtr& session, const transport::ConnectionOpenedEvent& event);
    bool OnClosed(const SessionPtr& session, const transport::ConnectionClosedEvent& event);
    bool Reconnect(const SessionPtr& session);
    bool StillOwned(const SessionPtr& session) const;

    void Teardown(const SessionPtr& session, TeardownReason reason);
    // 调用方持有账号锁
    void TeardownLocked(const SessionPtr& session, TeardownReason reason);

    std::chrono::milliseconds ReconnectDelay(int attempt) const;

private:
    const common::SessionsConfig config_;
    std::shared_ptr<AuthStore> auth_store_;
    std::shared_ptr<transport::TransportFactory> transport_factory_;
    std::shared_ptr<events::PairingRenderer> renderer_;
    std::shared_ptr<events::EventRelay> relay_;

    SessionRegistry registry_;
    std::atomic<std::uint64_t> next_generation_{0};
    std::atomic<bool> shutting_down_{false};
    std::shared_mutex admission_mutex_;  // Init 持共享锁, Shutdown 持独占锁

    // 驱动线程为 detach 模式, 通过计数等待退出
    std::mutex drivers_mutex_;
    std::condition_variable drivers_cv_;
    std::size_t active_drivers_ = 0;
};

}
}
