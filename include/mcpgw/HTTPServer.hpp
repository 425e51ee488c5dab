//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS front end for the Gateway using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace mcpgw {

class Gateway;

class HTTPServer {
public:
    //======================================================================================================
    // Options
    // Fields:
    //   address/port: Bind address and port ("0" picks an ephemeral port, see BoundPort())
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   ioThreads: Threads running the socket I/O
    //   workerThreads: Threads running Gateway::Handle (backend calls block)
    //   ssePollInterval: How often an open event stream checks its buffer for new events
    //======================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"8080"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        unsigned int ioThreads{2};
        unsigned int workerThreads{8};
        std::chrono::milliseconds ssePollInterval{200};
    };

    using ErrorHandler = std::function<void(const std::string&)>;

    HTTPServer(const Options& opts, Gateway& gateway);
    ~HTTPServer();

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    //======================================================================================================
    // Binds the listener and starts the accept loop on background I/O threads.
    // Returns:
    //   Future that becomes ready once the server is accepting, or holds the bind/TLS setup error.
    //======================================================================================================
    std::future<void> Start();

    // Closes the acceptor, stops the I/O context and joins every thread.
    std::future<void> Stop();

    void SetErrorHandler(ErrorHandler handler);

    // Port actually bound after Start() (0 before).
    unsigned short BoundPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpgw
