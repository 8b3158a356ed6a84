#pragma once

#include "http/http_client.hpp"

#include <boost/asio/ssl/context.hpp>

namespace relay {
namespace http {

// Boost.Beast 同步客户端, 每个请求独立的 io_context
class BeastHttpClient : public HttpClient {
public:
    // verify_peer 为 false 时跳过证书校验 (仅用于本地联调)
    explicit BeastHttpClient(bool verify_peer = true);

    common::StatusOr<HttpResponse> Post(const HttpRequest& request) override;

private:
    boost::asio::ssl::context ssl_ctx_;
};

}
}
