#include "events/message_normalizer.hpp"

#include "events/identity.hpp"

#include <algorithm>

namespace relay {
namespace events {

namespace {

constexpr const char* kStatusBroadcast = "status@broadcast";
constexpr std::size_t kQuotedExcerptLength = 100;
constexpr const char* kDefaultMime = "application/octet-stream";

std::string MediaLabel(const std::string& media_type) {
    if (media_type == "image") {
        return "📷 Imagen";
    }
    if (media_type == "video") {
        return "🎥 Video";
    }
    if (media_type == "audio") {
        return "🎵 Audio";
    }
    if (media_type == "document") {
        return "📄 Documento";
    }
    return "📎 Archivo multimedia";
}

std::string BodyFor(const Classification& classification, const transport::MessageContent& content) {
    switch (classification.kind) {
        case MessageKind::kVoice:
            return "🎤 Nota de voz";
        case MessageKind::kSticker:
            return "🎨 Sticker";
        case MessageKind::kMedia: {
            auto body = MediaLabel(classification.media_type);
            const auto caption = ExtractText(content);
            if (!caption.empty()) {
                body += ": " + caption;
            }
            return body;
        }
        case MessageKind::kText:
        case MessageKind::kReply:
            break;
    }
    return ExtractText(content);
}

// UTF-8 安全的前 n 个字符
std::string Utf8Prefix(const std::string& text, std::size_t count) {
    std::size_t chars = 0;
    std::size_t i = 0;
    while (i < text.size() && chars < count) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t width = 1;
        if (lead >= 0xF0) {
            width = 4;
        } else if (lead >= 0xE0) {
            width = 3;
        } else if (lead >= 0xC0) {
            width = 2;
        }
        i += width;
        ++chars;
    }
    return text.substr(0, std::min(i, text.size()));
}

bool CarriesMediaKind(const Classification& classification) {
    return classification.kind == MessageKind::kMedia
        || classification.kind == MessageKind::kVoice
        || classification.kind == MessageKind::kSticker;
}

}

const char* MessageKindName(MessageKind kind) {
    switch (kind) {
        case MessageKind::kText:
            return "text";
        case MessageKind::kMedia:
            return "media";
        case MessageKind::kVoice:
            return "voice";
        case MessageKind::kSticker:
            return "sticker";
        case MessageKind::kReply:
            return "reply";
    }
    return "text";
}

Classification Classify(const transport::MessageContent& content) {
    if (content.media) {
        using transport::MediaKind;
        switch (content.media->kind) {
            case MediaKind::kImage:
                return {MessageKind::kMedia, "image"};
            case MediaKind::kVideo:
                return {MessageKind::kMedia, "video"};
            case MediaKind::kAudio:
                return content.media->push_to_talk ? Classification{MessageKind::kVoice, "ptt"}
                                                   : Classification{MessageKind::kMedia, "audio"};
            case MediaKind::kDocument:
                return {MessageKind::kMedia, "document"};
            case MediaKind::kSticker:
                return {MessageKind::kSticker, "sticker"};
        }
    }
    if (content.quoted) {
        return {MessageKind::kReply, ""};
    }
    return {MessageKind::kText, ""};
}

std::string ExtractText(const transport::MessageContent& content) {
    if (!content.text.empty()) {
        return content.text;
    }
    if (content.media) {
        using transport::MediaKind;
        const auto kind = content.media->kind;
        if (kind == MediaKind::kImage || kind == MediaKind::kVideo || kind == MediaKind::kDocument) {
            return content.media->caption;
        }
    }
    return "";
}

bool IsFileMedia(const transport::MessageContent& content) {
    return content.media && content.media->kind != transport::MediaKind::kSticker;
}

std::optional<NormalizedMessage> Normalize(const transport::InboundMessage& message,
                                           const std::string& self_id,
                                           const ContactDirectory& directory) {
    if (message.remote_id.empty() || message.remote_id == kStatusBroadcast || !message.content) {
        return std::nullopt;
    }
    const auto& content = *message.content;

    NormalizedMessage normalized;
    normalized.id = message.id;
    normalized.from_me = message.from_me;
    normalized.timestamp = message.timestamp;
    normalized.from = ResolveCounterparty(message.remote_id, directory);
    normalized.to = message.from_me ? message.remote_id : self_id;
    normalized.is_group = IsGroupId(message.remote_id);

    if (normalized.is_group) {
        if (!message.participant.empty()) {
            normalized.participant = message.participant;
        }
        normalized.contact_name = GroupName(message.remote_id, directory);
        if (normalized.participant && !message.from_me) {
            normalized.sender_name = ContactName(*normalized.participant, directory, message.push_name);
        }
    } else {
        normalized.contact_name = ContactName(normalized.from, directory, message.push_name);
    }

    normalized.classification = Classify(content);
    normalized.has_media = CarriesMediaKind(normalized.classification);
    normalized.body = BodyFor(normalized.classification, content);
    if (content.media) {
        normalized.mime_type = content.media->mime_type.empty() ? kDefaultMime : content.media->mime_type;
    }

    if (normalized.classification.kind == MessageKind::kReply && content.quoted) {
        QuotedExcerpt quoted;
        quoted.id = content.quoted->id;
        quoted.body = Utf8Prefix(content.quoted->text, kQuotedExcerptLength);
        quoted.from = content.quoted->participant.empty() ? message.remote_id : content.quoted->participant;
        normalized.quoted = std::move(quoted);
    }
    if (normalized.classification.kind == MessageKind::kVoice && content.media->duration_seconds > 0) {
        normalized.voice_duration = content.media->duration_seconds;
    }
    return normalized;
}

std::string MediaObjectKey(const std::string& prefix,
                           const std::string& message_id,
                           std::int64_t unix_ms,
                           const std::string& mime_type) {
    std::string extension;
    const auto slash = mime_type.find('/');
    if (slash != std::string::npos) {
        extension = mime_type.substr(slash + 1);
        extension = extension.substr(0, extension.find(';'));
    }
    if (extension.empty()) {
        extension = "bin";
    }
    return prefix + "-" + message_id + "-" + std::to_string(unix_ms) + "." + extension;
}

nlohmann::json ToWebhookPayload(const NormalizedMessage& message,
                                const std::string& account_id,
                                const std::string& source) {
    using nlohmann::json;
    const json participant = message.participant ? json(*message.participant) : json(nullptr);

    json metadata{
        {"timestamp", message.timestamp},
        {"from", message.from},
        {"participant", participant},
        {"source", source},
        {"from_me", message.from_me},
    };
    if (message.sender_name) {
        metadata["sender_name"] = *message.sender_name;
    }
    if (message.has_media) {
        metadata["media_type"] = message.classification.media_type;
        if (message.media_url) {
            metadata["media_url"] = *message.media_url;
            metadata["media_filename"] = message.media_filename.value_or("");
        }
    }
    if (message.quoted) {
        metadata["quoted_message"] = {
            {"id", message.quoted->id.empty() ? json(nullptr) : json(message.quoted->id)},
            {"body", message.quoted->body},
            {"from", message.quoted->from},
        };
    }
    if (message.classification.kind == MessageKind::kVoice) {
        metadata["voice_duration"] = message.voice_duration ? json(*message.voice_duration) : json(nullptr);
    }

    return json{
        {"agent_id", account_id},
        {"from", message.from},
        {"to", message.to},
        {"participant", participant},
        {"body", message.body},
        {"timestamp", message.timestamp},
        {"has_media", message.has_media},
        {"contact_name", message.contact_name},
        {"is_group", message.is_group},
        {"sender_name", message.sender_name ? json(*message.sender_name) : json(nullptr)},
        {"from_me", message.from_me},
        {"message_type", MessageKindName(message.classification.kind)},
        {"message_metadata", metadata},
    };
}

}
}
