#pragma once

#include "common/status_or.hpp"
#include "core/session/types.hpp"
#include "events/contact_directory.hpp"
#include "mpmc/blocking_queue.hpp"
#include "transport/transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace relay {
namespace core {

// 带连接代次的传输事件, 代次过期的事件直接丢弃
struct SessionEvent {
    std::uint64_t epoch = 0;
    transport::TransportEvent event;
};

using EventChannel = thread_pool::BlockingQueue<SessionEvent>;
using InitOutcome = common::StatusOr<InitResult>;

// 单个账号的会话记录, 所有字段由内部互斥量保护
class Session {
public:
    using Clock = std::chrono::steady_clock;

    Session(std::string account_id, std::uint64_t generation, std::size_t queue_capacity);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& AccountId() const {
        return account_id_;
    }
    std::uint64_t Generation() const {
        return generation_;
    }
    std::chrono::system_clock::time_point CreatedAt() const {
        return created_at_;
    }

    ConnectionState State() const;
    // 当前状态等于 expected 时切换到 desired
    bool CompareAndSetState(ConnectionState expected, ConnectionState desired);

    std::string Identity() const;
    void SetIdentity(std::string identity);

    // 仅在 PairingPending 下生效, 每个配对码重新计时
    bool SetPairingArtifact(PairingArtifact artifact, Clock::time_point deadline);
    std::optional<PairingArtifact> Artifact() const;
    std::optional<Clock::time_point> PairingDeadline() const;
    void ClearPairing();

    int ReconnectAttempts() const;
    int IncrementReconnectAttempts();
    void ResetReconnectAttempts();

    // 安装新的传输并返回新代次, 旧传输经 previous 交还; 已销毁时返回空
    std::optional<std::uint64_t> InstallTransport(std::shared_ptr<transport::Transport> next,
                                                  std::shared_ptr<transport::Transport>& previous);
    std::shared_ptr<transport::Transport> CurrentTransport() const;
    std::uint64_t TransportEpoch() const;

    const std::shared_ptr<EventChannel>& Channel() const {
        return channel_;
    }
    const std::shared_ptr<events::ContactDirectory>& Contacts() const {
        return contacts_;
    }

    // init 调用的一次性结果, 只有第一次 Resolve 生效
    std::future<InitOutcome> TakeInitFuture();
    bool ResolveInit(InitOutcome outcome);
    bool InitResolved() const;

    // 销毁入口: 只有第一个调用者返回 true 并拿到传输
    bool BeginTeardown(std::shared_ptr<transport::Transport>& transport);
    bool TornDown() const;
    // 销毁完成后的终态
    void MarkClosed();

    // 可取消的等待; 返回 true 表示已请求停止
    bool WaitForStop(std::chrono::milliseconds delay);
    bool StopRequested() const;

private:
    const std::string account_id_;
    const std::uint64_t generation_;
    const std::chrono::system_clock::time_point created_at_;

    mutable std::mutex mutex_;
    std::condition_variable stop_cv_;
    ConnectionState state_ = ConnectionState::kConnecting;
    std::string identity_;
    std::optional<PairingArtifact> artifact_;
    std::optional<Clock::time_point> pairing_deadline_;
    int reconnect_attempts_ = 0;
    std::shared_ptr<transport::Transport> transport_;
    std::uint64_t transport_epoch_ = 0;
    bool torn_down_ = false;
    bool init_resolved_ = false;
    std::promise<InitOutcome> init_promise_;

    std::shared_ptr<EventChannel> channel_;
    std::shared_ptr<events::ContactDirectory> contacts_;
};

}
}
