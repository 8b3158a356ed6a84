#pragma once

#include "events/contact_directory.hpp"
#include "transport/transport.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace relay {
namespace events {

enum class MessageKind {
    kText,
    kMedia,
    kVoice,
    kSticker,
    kReply,
};

const char* MessageKindName(MessageKind kind);

struct Classification {
    MessageKind kind = MessageKind::kText;
    std::string media_type;  // image / video / audio / ptt / document / sticker, 文本为空
};

struct QuotedExcerpt {
    std::string id;
    std::string body;
    std::string from;
};

// 转发给 webhook 的规范化消息
struct NormalizedMessage {
    std::string id;
    std::string from;                        // 解析后的会话对端
    std::string to;
    std::optional<std::string> participant;  // 群消息发送成员
    std::string body;
    std::int64_t timestamp = 0;
    bool has_media = false;
    std::string contact_name;
    bool is_group = false;
    std::optional<std::string> sender_name;
    bool from_me = false;
    Classification classification;
    std::string mime_type;

    // 媒体上传成功后填充
    std::optional<std::string> media_url;
    std::optional<std::string> media_filename;
    std::optional<QuotedExcerpt> quoted;
    std::optional<int> voice_duration;
};

// 分类顺序: image, video, audio(ptt 为语音), document, sticker, reply, text
Classification Classify(const transport::MessageContent& content);

// 文本或图片/视频/文档的说明文字
std::string ExtractText(const transport::MessageContent& content);

// 图片, 视频, 音频, 文档; 消息列表的 has_media 不计贴纸
bool IsFileMedia(const transport::MessageContent& content);

// 返回 std::nullopt 表示消息不需要转发
std::optional<NormalizedMessage> Normalize(const transport::InboundMessage& message,
                                           const std::string& self_id,
                                           const ContactDirectory& directory);

// <prefix>-<message id>-<unix ms>.<ext>, ext 取 mime 子类型, 缺省为 bin
std::string MediaObjectKey(const std::string& prefix,
                           const std::string& message_id,
                           std::int64_t unix_ms,
                           const std::string& mime_type);

nlohmann::json ToWebhookPayload(const NormalizedMessage& message,
                                const std::string& account_id,
                                const std::string& source);

}
}
