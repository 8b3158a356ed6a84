#include "events/webhook_client.hpp"

#include "common/logger.hpp"

namespace relay {
namespace events {

namespace {

constexpr const char* kFunctionsPath = "/functions/v1/";
constexpr std::size_t kMaxLoggedBody = 512;

std::string BearerHeader(const std::string& secret) {
    return "Bearer " + secret;
}

std::string Truncate(const std::string& body) {
    return body.size() <= kMaxLoggedBody ? body : body.substr(0, kMaxLoggedBody) + "...";
}

}

std::string DeriveStorageBaseUrl(const std::string& configured, const std::string& webhook_url) {
    std::string base = configured;
    if (base.empty()) {
        const auto pos = webhook_url.find(kFunctionsPath);
        if (pos != std::string::npos) {
            base = webhook_url.substr(0, pos);
        }
    }
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base;
}

WebhookClient::WebhookClient(std::shared_ptr<http::HttpClient> http, common::WebhookConfig config)
    : http_(std::move(http)), config_(std::move(config)) {}

common::Status WebhookClient::Deliver(const nlohmann::json& payload) {
    if (config_.url.empty()) {
        return common::Status::FailedPrecondition("Webhook url not configured");
    }
    http::HttpRequest request;
    request.url = config_.url;
    request.content_type = "application/json";
    request.headers.emplace_back("Authorization", BearerHeader(config_.secret));
    request.body = payload.dump();
    request.timeout = std::chrono::milliseconds(config_.timeout_ms);

    auto response = http_->Post(request);
    if (!response.IsOk()) {
        return response.GetStatus();
    }
    if (!response.Value().Ok()) {
        return common::Status::Unavailable("Webhook error " + std::to_string(response.Value().status) + ": "
                                           + Truncate(response.Value().body));
    }
    return common::Status::OK();
}

common::Status WebhookClient::NotifyConnected(const std::string& account_id, const std::string& phone_number) {
    if (config_.connect_notify_url.empty()) {
        RELAY_LOG_DEBUG("Connect notify url not configured, skipping notification for {}", account_id);
        return common::Status::OK();
    }
    nlohmann::json body{
        {"action", "connected"},
        {"agent_id", account_id},
        {"phone_number", phone_number},
        {"session_id", account_id},
    };
    http::HttpRequest request;
    request.url = config_.connect_notify_url;
    request.content_type = "application/json";
    request.body = body.dump();
    request.timeout = std::chrono::milliseconds(config_.timeout_ms);

    auto response = http_->Post(request);
    if (!response.IsOk()) {
        return response.GetStatus();
    }
    if (!response.Value().Ok()) {
        return common::Status::Unavailable("Connect notification failed " + std::to_string(response.Value().status)
                                           + ": " + Truncate(response.Value().body));
    }
    return common::Status::OK();
}

AssetStorageClient::AssetStorageClient(std::shared_ptr<http::HttpClient> http,
                                       common::AssetStorageConfig config,
                                       std::string bearer_secret,
                                       const std::string& webhook_url)
    : http_(std::move(http)),
      config_(std::move(config)),
      bearer_secret_(std::move(bearer_secret)),
      base_url_(DeriveStorageBaseUrl(config_.base_url, webhook_url)) {}

common::StatusOr<std::string> AssetStorageClient::Upload(const std::string& key,
                                                         const std::string& content_type,
                                                         const std::string& bytes) {
    if (base_url_.empty()) {
        return common::Status::FailedPrecondition("Asset storage url not configured");
    }
    http::HttpRequest request;
    request.url = base_url_ + "/storage/v1/object/" + config_.bucket + "/" + key;
    request.content_type = content_type;
    request.headers.emplace_back("Authorization", BearerHeader(bearer_secret_));
    request.body = bytes;
    request.timeout = std::chrono::milliseconds(config_.timeout_ms);

    auto response = http_->Post(request);
    if (!response.IsOk()) {
        return response.GetStatus();
    }
    if (!response.Value().Ok()) {
        return common::Status::Unavailable("Media upload failed " + std::to_string(response.Value().status) + ": "
                                           + Truncate(response.Value().body));
    }
    return common::StatusOr<std::string>(base_url_ + "/storage/v1/object/public/" + config_.bucket + "/" + key);
}

}
}
