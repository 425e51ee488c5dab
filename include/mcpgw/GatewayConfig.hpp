//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayConfig.hpp
// Purpose: Runtime options for the gateway (pool, sessions, health, rate limits, retry, HTTP front end)
//==========================================================================================================

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "mcpgw/RetryPolicy.hpp"

namespace mcpgw {

//==========================================================================================================
// GatewayConfig
// Purpose: Every recognized option with its default. Values come from MCPGW_* environment variables
//          (FromEnvironment) and/or "key=value" override strings (ApplyOverrides).
// Recognized keys:
//   pool.max_size, pool.ttl_seconds, session.ttl_seconds, session.max_sessions_per_key,
//   health.probe_interval, health.failure_threshold, health.check_interval, health.max_restarts,
//   process.request_timeout_ms, process.handshake_timeout_ms,
//   rate_limit.default_rpm, rate_limit.<tenant>, retry.max_retries, retry.base_delay, retry.max_delay,
//   events.capacity, enable_server_pool, enable_session_management, enable_rate_limiting,
//   listen (host:port), scheme (http|https), cert, key, sse.window_seconds, api_base, connectors
//==========================================================================================================
struct GatewayConfig {
    std::size_t poolMaxSize{5000};
    std::chrono::seconds poolTtl{1800};
    std::chrono::seconds sessionTtl{1800};
    std::size_t maxSessionsPerKey{10};

    std::chrono::seconds healthCallInterval{30};
    int failureThreshold{3};
    std::chrono::seconds healthCheckInterval{30};
    int maxRestarts{3};
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds handshakeTimeout{10000};

    int defaultRpm{100};
    std::map<std::string, int> tenantRpm;

    RetryOptions retry;

    std::size_t eventBufferCapacity{100};

    bool enableServerPool{true};
    bool enableSessionManagement{true};
    bool enableRateLimiting{true};

    std::string listenAddress{"127.0.0.1"};
    std::string listenPort{"8080"};
    std::string scheme{"http"};
    std::string certFile;
    std::string keyFile;
    std::chrono::seconds sseWindow{15};

    std::optional<std::string> apiBase;
    std::string connectorsFile;

    // Defaults overlaid with MCPGW_* variables. Malformed values are logged and ignored.
    static GatewayConfig FromEnvironment();

    // Applies "key=value" tokens separated by ';' or whitespace. Unknown keys and malformed values are
    // logged and skipped. Returns the number of tokens applied.
    std::size_t ApplyOverrides(const std::string& text);

    // Applies one option. Returns false for unknown keys or malformed values.
    bool Set(const std::string& key, const std::string& value);
};

} // namespace mcpgw
