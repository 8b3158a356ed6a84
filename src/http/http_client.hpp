#pragma once

#include "common/status_or.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace relay {
namespace http {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string content_type;
    std::string body;
    std::chrono::milliseconds timeout{10000};
};

struct HttpResponse {
    int status = 0;
    std::string body;

    bool Ok() const {
        return status >= 200 && status < 300;
    }
};

// 出站 HTTP 调用 (webhook, 媒体上传)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    // 网络层失败返回错误; 非 2xx 响应仍视为成功返回, 由调用方判断
    virtual common::StatusOr<HttpResponse> Post(const HttpRequest& request) = 0;
};

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string target;
};

// 只支持 http / https 绝对地址
common::StatusOr<ParsedUrl> ParseUrl(const std::string& url);

}
}
