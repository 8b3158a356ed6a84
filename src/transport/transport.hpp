#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace relay {
namespace transport {

enum class MediaKind {
    kImage,
    kVideo,
    kAudio,
    kDocument,
    kSticker,
};

// 媒体附件描述, 字节内容需通过 Transport::DownloadMedia 获取
struct MediaAttachment {
    MediaKind kind = MediaKind::kImage;
    std::string mime_type;
    std::string caption;
    std::string file_name;
    int duration_seconds = 0;   // 仅音频有效
    bool push_to_talk = false;  // 语音消息
};

// 被引用消息的上下文
struct QuotedMessage {
    std::string id;
    std::string participant;
    std::string text;
};

struct MessageContent {
    std::string text;
    std::optional<MediaAttachment> media;
    std::optional<QuotedMessage> quoted;
};

struct InboundMessage {
    std::string id;
    std::string remote_id;     // 会话 id (个人或群组)
    std::string participant;   // 群消息的发送成员
    bool from_me = false;
    std::string push_name;
    std::int64_t timestamp = 0;
    std::optional<MessageContent> content;  // 协议消息没有内容
};

struct Contact {
    std::string id;
    std::string routable_id;  // 别名 id 对应的真实 id, 可为空
    std::string name;
    std::string notify;
    std::string verified_name;
};

struct Conversation {
    std::string id;
    std::string name;
    bool is_group = false;
    std::int64_t last_activity = 0;
    int unread = 0;
};

enum class DeliveryClass {
    kNotify,  // 实时消息
    kAppend,  // 历史回填
};

// ---- 连接事件 ----
struct PairingCodeEvent {
    std::string code;
};

struct ConnectionOpenedEvent {
    std::string self_id;
};

struct ConnectionClosedEvent {
    int status_code = 0;
    std::string message;
    bool logged_out = false;  // 用户主动登出, 不可恢复
};

struct MessagesEvent {
    DeliveryClass delivery = DeliveryClass::kNotify;
    std::vector<InboundMessage> messages;
};

struct CredentialsChangedEvent {
    std::string blob;
};

struct ContactsUpsertEvent {
    std::vector<Contact> contacts;
};

struct ContactsUpdateEvent {
    std::vector<Contact> contacts;
};

using TransportEvent = std::variant<PairingCodeEvent,
                                    ConnectionOpenedEvent,
                                    ConnectionClosedEvent,
                                    MessagesEvent,
                                    CredentialsChangedEvent,
                                    ContactsUpsertEvent,
                                    ContactsUpdateEvent>;

// 事件回调; Close() 返回后不会再被调用
using EventSink = std::function<void(TransportEvent)>;

// 单个账号的一次协议连接
class Transport {
public:
    virtual ~Transport() = default;

    // 非阻塞: 发起连接, 后续结果全部经 sink 投递
    virtual common::Status Connect(const std::optional<std::string>& credentials, EventSink sink) = 0;
    // 返回消息 id
    virtual common::StatusOr<std::string> SendText(const std::string& destination, const std::string& text) = 0;
    virtual common::Status Logout() = 0;
    virtual void Close() = 0;
    virtual std::string SelfId() const = 0;

    virtual common::StatusOr<std::string> DownloadMedia(const InboundMessage& message) = 0;
    virtual common::StatusOr<std::vector<Conversation>> ListConversations() = 0;
    virtual common::StatusOr<std::vector<InboundMessage>> ListMessages(const std::string& conversation_id,
                                                                        int limit) = 0;
};

// 每次连接尝试创建一个新的 Transport
class TransportFactory {
public:
    virtual ~TransportFactory() = default;
    virtual std::shared_ptr<Transport> Create(const std::string& account_id) = 0;
};

}
}
