#include "events/event_relay.hpp"

#include "common/logger.hpp"
#include "events/identity.hpp"
#include "thread_pool/thread_pool.hpp"

#include <chrono>

namespace relay {
namespace events {

EventRelay::EventRelay(std::shared_ptr<WebhookClient> webhook,
                       std::shared_ptr<AssetStorageClient> assets,
                       thread_pool::ThreadPool* pool,
                       std::string source,
                       std::string key_prefix)
    : webhook_(std::move(webhook)),
      assets_(std::move(assets)),
      pool_(pool),
      source_(std::move(source)),
      key_prefix_(std::move(key_prefix)) {}

void EventRelay::Dispatch(std::function<void()> work) {
    if (pool_ && pool_->Post(work)) {
        return;
    }
    if (pool_) {
        RELAY_LOG_WARN("Relay pool rejected task, running inline");
    }
    work();
}

void EventRelay::RelayMessages(const RelayContext& context, const transport::MessagesEvent& event) {
    if (event.delivery != transport::DeliveryClass::kNotify) {
        RELAY_LOG_DEBUG("Skipping {} backfilled messages for {}", event.messages.size(), context.account_id);
        return;
    }
    for (const auto& message : event.messages) {
        Dispatch([this, context, message] {
            auto status = ProcessMessage(context, message);
            if (!status.IsOk()) {
                RELAY_LOG_ERROR("Relay of message {} for {} failed: {}",
                                message.id, context.account_id, status.Message());
            }
        });
    }
}

void EventRelay::NotifyConnected(const std::string& account_id, const std::string& identity) {
    if (!webhook_) {
        return;
    }
    Dispatch([this, account_id, identity] {
        auto status = webhook_->NotifyConnected(account_id, JidToPhone(identity));
        if (!status.IsOk()) {
            RELAY_LOG_ERROR("Failed to notify connection of {}: {}", account_id, status.Message());
        } else {
            RELAY_LOG_INFO("Connection of {} notified", account_id);
        }
    });
}

common::Status EventRelay::ProcessMessage(const RelayContext& context, const transport::InboundMessage& message) {
    static const ContactDirectory kEmptyDirectory;
    const auto& directory = context.contacts ? *context.contacts : kEmptyDirectory;
    auto normalized = Normalize(message, context.self_id, directory);
    if (!normalized) {
        return common::Status::OK();
    }
    RELAY_LOG_INFO("Message {} {} {} ({})", normalized->from_me ? "SENT" : "RECEIVED",
                   normalized->from_me ? "to" : "from", normalized->contact_name, JidToPhone(normalized->from));

    if (normalized->has_media && !normalized->from_me) {
        AttachMedia(context, message, *normalized);
    }

    if (!webhook_) {
        return common::Status::FailedPrecondition("Webhook client not configured");
    }
    auto status = webhook_->Deliver(ToWebhookPayload(*normalized, context.account_id, source_));
    if (!status.IsOk()) {
        failed_.fetch_add(1);
        return status;
    }
    delivered_.fetch_add(1);
    RELAY_LOG_INFO("Webhook sent ({}, type: {})", normalized->from_me ? "outgoing" : "incoming",
                   MessageKindName(normalized->classification.kind));
    return common::Status::OK();
}

void EventRelay::AttachMedia(const RelayContext& context,
                             const transport::InboundMessage& message,
                             NormalizedMessage& normalized) {
    if (!context.transport || !assets_) {
        RELAY_LOG_WARN("Media for message {} not uploaded: no transport or storage", message.id);
        return;
    }
    auto bytes = context.transport->DownloadMedia(message);
    if (!bytes.IsOk()) {
        RELAY_LOG_ERROR("Error downloading media {}: {}", message.id, bytes.GetStatus().Message());
        return;
    }
    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const auto key = MediaObjectKey(key_prefix_, message.id, now_ms, normalized.mime_type);
    auto url = assets_->Upload(key, normalized.mime_type, bytes.Value());
    if (!url.IsOk()) {
        RELAY_LOG_ERROR("Failed to upload media {}: {}", key, url.GetStatus().Message());
        return;
    }
    normalized.media_url = url.Value();
    normalized.media_filename = key;
    RELAY_LOG_INFO("Media uploaded: {}", url.Value());
}

}
}
