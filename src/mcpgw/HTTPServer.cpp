//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/HTTPServer.cpp
// Purpose: HTTP/HTTPS front end for the Gateway using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "logging/Logger.h"
#include "mcpgw/Gateway.hpp"
#include "mcpgw/HTTPServer.hpp"

#include <openssl/ssl.h>

namespace mcpgw {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

std::string lowerCase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

GatewayRequest toGatewayRequest(const http::request<http::string_body>& req) {
    GatewayRequest out;
    out.method = std::string(req.method_string());
    out.target = std::string(req.target());
    for (const auto& field : req) {
        out.headers[lowerCase(std::string(field.name_string()))] = std::string(field.value());
    }
    out.body = req.body();
    return out;
}

} // namespace

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    Gateway& gateway;
    std::atomic<bool> running{false};
    std::atomic<unsigned short> boundPort{0};

    net::io_context ioc;
    net::thread_pool workers;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::vector<std::thread> ioThreads;

    HTTPServer::ErrorHandler errorHandler;

    Impl(const HTTPServer::Options& o, Gateway& gw)
        : opts(o), gateway(gw), workers(o.workerThreads == 0 ? 1 : o.workerThreads) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        stop();
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    void stop() {
        running.store(false);
        if (acceptor) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
        ioc.stop();
        for (auto& t : ioThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        ioThreads.clear();
        workers.stop();
        workers.join();
    }

    void bind() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty() ||
            !std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; }) ||
            opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("HTTPServer invalid port: '" + opts.port + "'");
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
        LOG_INFO("HTTPServer: listening on {}://{}:{}", opts.scheme, opts.address, boundPort.load());
    }

    // Gateway::Handle blocks on backend calls, so it runs on the worker pool.
    net::awaitable<GatewayReply> handle(GatewayRequest request) {
        co_return co_await net::co_spawn(
            workers,
            [this, request = std::move(request)]() -> net::awaitable<GatewayReply> {
                try {
                    co_return gateway.Handle(request);
                } catch (const std::exception& e) {
                    LOG_ERROR("HTTPServer: handler failed for {} {}: {}", request.method, request.target, e.what());
                    GatewayReply reply;
                    reply.status = 500;
                    reply.body = std::string("{\"error\":\"Internal server error\"}");
                    co_return reply;
                }
            },
            net::use_awaitable);
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req,
                                                   const GatewayReply& reply) {
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.result(static_cast<unsigned>(reply.status));
        if (!reply.contentType.empty()) {
            res.set(http::field::content_type, reply.contentType);
        }
        for (const auto& [name, value] : reply.headers) {
            res.set(name, value);
        }
        res.keep_alive(false);
        res.body() = reply.body;
        res.prepare_payload();
        return res;
    }

    // Writes the header and replayed events, then keeps forwarding new events until the window closes.
    // The body is delimited by connection close.
    template <class Stream>
    net::awaitable<void> streamEvents(Stream& stream, const http::request<http::string_body>& req,
                                      const GatewayReply& reply) {
        http::response<http::empty_body> res{http::status::ok, req.version()};
        res.result(static_cast<unsigned>(reply.status));
        res.set(http::field::content_type, reply.contentType);
        for (const auto& [name, value] : reply.headers) {
            res.set(name, value);
        }
        res.keep_alive(false);
        http::response_serializer<http::empty_body> sr{res};
        co_await http::async_write_header(stream, sr, net::use_awaitable);
        if (!reply.body.empty()) {
            co_await net::async_write(stream, net::buffer(reply.body), net::use_awaitable);
        }

        const auto deadline = std::chrono::steady_clock::now() + reply.streamWindow;
        uint64_t lastId = reply.lastEventId;
        net::steady_timer timer(co_await net::this_coro::executor);
        while (running.load()) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                break;
            }
            std::string chunk;
            for (const auto& event : reply.eventStream->ReplayFrom(lastId)) {
                chunk += Gateway::FormatSseEvent(event);
                lastId = event.id;
            }
            if (!chunk.empty()) {
                co_await net::async_write(stream, net::buffer(chunk), net::use_awaitable);
                continue;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            timer.expires_after(std::min(opts.ssePollInterval, remaining));
            co_await timer.async_wait(net::use_awaitable);
        }
        LOG_DEBUG("HTTPServer: event stream closed after id {}", lastId);
    }

    template <class Stream>
    net::awaitable<void> serve(Stream& stream) {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        co_await http::async_read(stream, buffer, req, net::use_awaitable);
        LOG_DEBUG("HTTPServer: {} {}", std::string(req.method_string()), std::string(req.target()));
        GatewayReply reply = co_await handle(toGatewayRequest(req));
        if (reply.eventStream) {
            co_await streamEvents(stream, req, reply);
        } else {
            auto res = makeResponse(req, reply);
            co_await http::async_write(stream, res, net::use_awaitable);
        }
    }

    void sessionFailed(const char* kind, const std::exception& e) {
        if (!running.load()) {
            LOG_DEBUG("HTTPServer {} session suppressed during shutdown: {}", kind, e.what());
        } else {
            setError(std::string("HTTPServer ") + kind + " session error: " + e.what());
        }
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            co_await serve(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            sessionFailed("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serve(tls);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            sessionFailed("TLS", e);
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                LOG_DEBUG("HTTPServer accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts, Gateway& gateway)
    : pImpl(std::make_unique<Impl>(opts, gateway)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        pImpl->setError(std::string("HTTPServer bind failed: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    const unsigned int threads = pImpl->opts.ioThreads == 0 ? 1 : pImpl->opts.ioThreads;
    for (unsigned int i = 0; i < threads; ++i) {
        pImpl->ioThreads.emplace_back([this]() {
            try {
                pImpl->ioc.run();
            } catch (const std::exception& e) {
                pImpl->setError(std::string("HTTPServer I/O thread error: ") + e.what());
            }
        });
    }
    ready.set_value();
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->stop();
    LOG_INFO("HTTPServer: stopped");
    done.set_value();
    return fut;
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

unsigned short HTTPServer::BoundPort() const {
    return pImpl->boundPort.load();
}

} // namespace mcpgw
