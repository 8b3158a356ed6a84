#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace relay {
namespace core {

enum class ConnectionState {
    kConnecting,
    kPairingPending,
    kOpen,
    kClosing,
    kClosed,
};

inline const char* ConnectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::kConnecting:
            return "connecting";
        case ConnectionState::kPairingPending:
            return "pairing_pending";
        case ConnectionState::kOpen:
            return "open";
        case ConnectionState::kClosing:
            return "closing";
        case ConnectionState::kClosed:
            return "closed";
    }
    return "unknown";
}

// 仅在 PairingPending 状态下存在
struct PairingArtifact {
    std::string account_id;
    std::string rendered_code;
    std::chrono::system_clock::time_point expiry_deadline;
};

struct InitResult {
    bool connected = false;
    std::string identity;                   // 已连接时的自身 id
    std::optional<PairingArtifact> artifact;
    int pairing_timeout_seconds = 0;
};

struct SessionStatus {
    bool connected = false;
    std::optional<ConnectionState> state;   // 无会话时为空
    std::string identity;
    std::optional<PairingArtifact> artifact;
};

struct ConversationSummary {
    std::string id;
    std::string name;
    bool is_group = false;
    std::int64_t last_activity = 0;
    int unread = 0;
};

struct MessageSummary {
    std::string id;
    std::string body;
    std::int64_t timestamp = 0;
    bool from_me = false;
    bool has_media = false;
    std::string from;
    std::string to;                         // 仅自己发出的消息有值
};

// 会话销毁原因, 决定是否登出及是否删除凭证
enum class TeardownReason {
    kDisconnect,
    kReplace,
    kSweep,
    kPairingExpired,
    kLoggedOut,
    kReconnectExhausted,
    kInitFailed,
    kShutdown,
};

inline const char* TeardownReasonName(TeardownReason reason) {
    switch (reason) {
        case TeardownReason::kDisconnect:
            return "disconnect";
        case TeardownReason::kReplace:
            return "replace";
        case TeardownReason::kSweep:
            return "sweep";
        case TeardownReason::kPairingExpired:
            return "pairing_expired";
        case TeardownReason::kLoggedOut:
            return "logged_out";
        case TeardownReason::kReconnectExhausted:
            return "reconnect_exhausted";
        case TeardownReason::kInitFailed:
            return "init_failed";
        case TeardownReason::kShutdown:
            return "shutdown";
    }
    return "unknown";
}

}
}
