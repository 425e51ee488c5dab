//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/HttpClient.cpp
// Purpose: Coroutine-based outbound HTTP/HTTPS requests using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcpgw/HttpClient.hpp"

namespace mcpgw {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        parts.scheme = "http";
    }
    std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.target = "/";
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.target = url.substr(slash);
    }
    std::size_t colon = hostPort.rfind(':');
    std::size_t bracket = hostPort.find(']');
    if (colon == std::string::npos || (bracket != std::string::npos && colon < bracket)) {
        parts.host = hostPort;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    if (!parts.host.empty() && parts.host.front() == '[' && parts.host.back() == ']') {
        parts.host = parts.host.substr(1, parts.host.size() - 2);
    }
    return parts;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y){
        return std::tolower(x) == std::tolower(y);
    });
}
} // namespace

bool HttpClient::SameOrigin(const std::string& a, const std::string& b) {
    const UrlParts x = parseUrl(a);
    const UrlParts y = parseUrl(b);
    return iequals(x.scheme, y.scheme) && iequals(x.host, y.host) && x.port == y.port && !x.host.empty();
}

std::optional<std::string> HttpReply::Header(const std::string& name) const {
    for (const auto& [k, v] : headers) {
        if (iequals(k, name)) {
            return v;
        }
    }
    return std::nullopt;
}

class HttpClient::Impl {
public:
    HttpClient::Options opts;

    explicit Impl(const HttpClient::Options& o) : opts(o) {}

    http::request<http::string_body> buildRequest(const HttpRequestSpec& spec, const UrlParts& u) const {
        http::verb verb = http::string_to_verb(spec.method);
        if (verb == http::verb::unknown) {
            verb = http::verb::get;
        }
        http::request<http::string_body> req{verb, u.target, 11};
        req.set(http::field::host, u.host);
        req.set(http::field::user_agent, opts.userAgent);
        req.set(http::field::connection, "close");
        for (const auto& [k, v] : spec.headers) {
            req.set(k, v);
        }
        if (!spec.body.empty() || verb == http::verb::post || verb == http::verb::put || verb == http::verb::patch) {
            req.body() = spec.body;
            req.prepare_payload();
        }
        return req;
    }

    static HttpReply toReply(http::response<http::string_body>& res) {
        HttpReply reply;
        reply.status = static_cast<int>(res.result_int());
        for (const auto& field : res) {
            reply.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
        }
        reply.body = std::move(res.body());
        return reply;
    }

    net::awaitable<HttpReply> coExecute(HttpRequestSpec spec) {
        UrlParts u = parseUrl(spec.url);
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
        auto req = buildRequest(spec, u);
        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;

        if (u.scheme == "https") {
            ssl::context ctx(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(ctx.native_handle(), TLS1_3_VERSION);
            if (!opts.caFile.empty()) {
                ctx.load_verify_file(opts.caFile);
            } else {
                ctx.set_default_verify_paths();
            }
            ctx.set_verify_mode(ssl::verify_peer);

            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, ctx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
                LOG_WARN("HttpClient: failed to set SNI hostname {}", u.host);
            }
            (void)::SSL_set1_host(stream.native_handle(), u.host.c_str());
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.shutdown(ec);
        } else {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);
            stream.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
        co_return toReply(res);
    }
};

HttpClient::HttpClient() : HttpClient(Options{}) {}

HttpClient::HttpClient(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {}

HttpClient::~HttpClient() = default;

OutboundResult<HttpReply> HttpClient::Execute(const HttpRequestSpec& request) {
    FUNC_SCOPE();
    net::io_context ioc;
    auto fut = net::co_spawn(ioc, pImpl->coExecute(request), net::use_future);
    ioc.run();
    try {
        HttpReply reply = fut.get();
        if (reply.status >= 200 && reply.status < 400) {
            return OutboundResult<HttpReply>::Ok(std::move(reply));
        }
        LOG_DEBUG("HttpClient: {} {} -> {}", request.method, request.url, reply.status);
        return OutboundResult<HttpReply>::Fail(
            OutboundFailure::FromStatus(reply.status, reply.body, reply.Header("Retry-After")));
    } catch (const boost::system::system_error& e) {
        LOG_DEBUG("HttpClient: {} {} failed: {}", request.method, request.url, e.what());
        return OutboundResult<HttpReply>::Fail(OutboundFailure::ConnectionFailure(e.what()));
    }
}

HttpReply HttpClient::ExecuteWithRetry(const HttpRequestSpec& request, const RetryOptions& retry,
                                       const Sleeper& sleeper) {
    return RetryWithBackoff([&]() { return Execute(request); }, retry, sleeper);
}

} // namespace mcpgw
