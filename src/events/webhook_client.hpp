#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "http/http_client.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace relay {
namespace events {

// webhook 回调, 至多一次投递, 不重试
class WebhookClient {
public:
    WebhookClient(std::shared_ptr<http::HttpClient> http, common::WebhookConfig config);

    common::Status Deliver(const nlohmann::json& payload);
    // 连接成功通知, 未配置地址时跳过
    common::Status NotifyConnected(const std::string& account_id, const std::string& phone_number);

    const common::WebhookConfig& Config() const {
        return config_;
    }

private:
    std::shared_ptr<http::HttpClient> http_;
    common::WebhookConfig config_;
};

// 媒体对象存储: POST {base}/storage/v1/object/{bucket}/{key}
class AssetStorageClient {
public:
    AssetStorageClient(std::shared_ptr<http::HttpClient> http,
                       common::AssetStorageConfig config,
                       std::string bearer_secret,
                       const std::string& webhook_url);

    // 成功时返回公开访问地址
    common::StatusOr<std::string> Upload(const std::string& key,
                                         const std::string& content_type,
                                         const std::string& bytes);

    const std::string& BaseUrl() const {
        return base_url_;
    }

private:
    std::shared_ptr<http::HttpClient> http_;
    common::AssetStorageConfig config_;
    std::string bearer_secret_;
    std::string base_url_;
};

// 未配置 base_url 时从 webhook 地址推导 (去掉 /functions/v1/ 之后的部分)
std::string DeriveStorageBaseUrl(const std::string& configured, const std::string& webhook_url);

}
}
