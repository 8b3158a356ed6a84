#include "http/beast_http_client.hpp"

#include "common/logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>

namespace relay {
namespace http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr int kHttpVersion = 11;
constexpr const char* kUserAgent = "relay_server/1.0";

common::Status NetworkError(const std::string& stage, const std::string& url, const beast::error_code& ec) {
    return common::Status::Unavailable(stage + " " + url + " failed: " + ec.message());
}

bhttp::request<bhttp::string_body> BuildRequest(const ParsedUrl& url, const HttpRequest& request) {
    bhttp::request<bhttp::string_body> req{bhttp::verb::post, url.target, kHttpVersion};
    req.set(bhttp::field::host, url.host);
    req.set(bhttp::field::user_agent, kUserAgent);
    if (!request.content_type.empty()) {
        req.set(bhttp::field::content_type, request.content_type);
    }
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();
    return req;
}

// 逐步执行异步操作, 超时由 tcp_stream 的 expires_after 负责
template <typename Stream>
common::StatusOr<HttpResponse> Exchange(net::io_context& ioc,
                                        Stream& stream,
                                        const std::string& url,
                                        bhttp::request<bhttp::string_body>& req,
                                        std::chrono::milliseconds timeout) {
    beast::error_code ec;
    beast::get_lowest_layer(stream).expires_after(timeout);
    bhttp::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
    ioc.run();
    ioc.restart();
    if (ec) {
        return NetworkError("write", url, ec);
    }

    beast::flat_buffer buffer;
    bhttp::response<bhttp::string_body> res;
    beast::get_lowest_layer(stream).expires_after(timeout);
    bhttp::async_read(stream, buffer, res, [&ec](beast::error_code e, std::size_t) { ec = e; });
    ioc.run();
    ioc.restart();
    if (ec) {
        return NetworkError("read", url, ec);
    }

    HttpResponse response;
    response.status = static_cast<int>(res.result_int());
    response.body = std::move(res.body());
    return common::StatusOr<HttpResponse>(std::move(response));
}

}

common::StatusOr<ParsedUrl> ParseUrl(const std::string& url) {
    ParsedUrl parsed;
    std::string rest;
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return common::Status::InvalidArgument("URL without scheme: " + url);
    }
    std::string scheme = url.substr(0, scheme_end);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme == "https") {
        parsed.tls = true;
        parsed.port = "443";
    } else if (scheme == "http") {
        parsed.port = "80";
    } else {
        return common::Status::InvalidArgument("Unsupported URL scheme: " + scheme);
    }
    rest = url.substr(scheme_end + 3);

    const auto path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    parsed.target = path_start == std::string::npos ? "/" : rest.substr(path_start);
    if (!parsed.target.empty() && parsed.target.front() == '?') {
        parsed.target.insert(parsed.target.begin(), '/');
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        parsed.port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return common::Status::InvalidArgument("URL without host: " + url);
    }
    parsed.host = authority;
    return common::StatusOr<ParsedUrl>(std::move(parsed));
}

BeastHttpClient::BeastHttpClient(bool verify_peer) : ssl_ctx_(ssl::context::tls_client) {
    if (verify_peer) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    } else {
        ssl_ctx_.set_verify_mode(ssl::verify_none);
    }
}

common::StatusOr<HttpResponse> BeastHttpClient::Post(const HttpRequest& request) {
    auto parsed = ParseUrl(request.url);
    if (!parsed.IsOk()) {
        return parsed.GetStatus();
    }
    const auto& url = parsed.Value();

    net::io_context ioc;
    beast::error_code ec;
    tcp::resolver resolver(ioc);
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(url.host, url.port,
        [&ec, &endpoints](beast::error_code e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
        });
    ioc.run();
    ioc.restart();
    if (ec) {
        return NetworkError("resolve", request.url, ec);
    }

    auto req = BuildRequest(url, request);
    if (!url.tls) {
        beast::tcp_stream stream(ioc);
        stream.expires_after(request.timeout);
        stream.async_connect(endpoints, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        ioc.run();
        ioc.restart();
        if (ec) {
            return NetworkError("connect", request.url, ec);
        }
        auto result = Exchange(ioc, stream, request.url, req, request.timeout);
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return result;
    }

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx_);
    // SNI
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        ec = beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return NetworkError("sni", request.url, ec);
    }
    stream.set_verify_callback(ssl::host_name_verification(url.host));

    auto& lowest = beast::get_lowest_layer(stream);
    lowest.expires_after(request.timeout);
    lowest.async_connect(endpoints, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    ioc.run();
    ioc.restart();
    if (ec) {
        return NetworkError("connect", request.url, ec);
    }

    lowest.expires_after(request.timeout);
    stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) { ec = e; });
    ioc.run();
    ioc.restart();
    if (ec) {
        return NetworkError("handshake", request.url, ec);
    }

    auto result = Exchange(ioc, stream, request.url, req, request.timeout);
    // 对端直接断开 TLS 很常见, 关闭阶段的错误不影响结果
    lowest.expires_after(request.timeout);
    stream.async_shutdown([&ec](beast::error_code e) { ec = e; });
    ioc.run();
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        RELAY_LOG_DEBUG("TLS shutdown for {} ended with {}", request.url, ec.message());
    }
    return result;
}

}
}
