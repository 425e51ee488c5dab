//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayConfig.cpp
// Purpose: Environment and override-string parsing for GatewayConfig
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpgw/GatewayConfig.hpp"

namespace mcpgw {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<long long> parseInt(const std::string& s, long long minValue) {
    long long v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size() || v < minValue) {
        return std::nullopt;
    }
    return v;
}

std::optional<double> parseDouble(const std::string& s) {
    if (s.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !(v >= 0.0)) {
        return std::nullopt;
    }
    return v;
}

std::optional<bool> parseBool(const std::string& s) {
    const std::string v = lower(s);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

template <typename Target>
bool assignInt(const std::string& value, long long minValue, Target& target) {
    auto v = parseInt(value, minValue);
    if (!v.has_value()) {
        return false;
    }
    target = static_cast<Target>(*v);
    return true;
}

template <typename Duration>
bool assignDuration(const std::string& value, long long minValue, Duration& target) {
    auto v = parseInt(value, minValue);
    if (!v.has_value()) {
        return false;
    }
    target = Duration(*v);
    return true;
}

// MCPGW_* variable -> override key
struct EnvBinding {
    const char* envName;
    const char* key;
};

constexpr EnvBinding kEnvBindings[] = {
    {"MCPGW_POOL_MAX_SIZE", "pool.max_size"},
    {"MCPGW_POOL_TTL_SECONDS", "pool.ttl_seconds"},
    {"MCPGW_SESSION_TTL_SECONDS", "session.ttl_seconds"},
    {"MCPGW_MAX_SESSIONS_PER_KEY", "session.max_sessions_per_key"},
    {"MCPGW_PROBE_INTERVAL", "health.probe_interval"},
    {"MCPGW_FAILURE_THRESHOLD", "health.failure_threshold"},
    {"MCPGW_HEALTH_CHECK_INTERVAL", "health.check_interval"},
    {"MCPGW_MAX_RESTARTS", "health.max_restarts"},
    {"MCPGW_REQUEST_TIMEOUT_MS", "process.request_timeout_ms"},
    {"MCPGW_HANDSHAKE_TIMEOUT_MS", "process.handshake_timeout_ms"},
    {"MCPGW_RATE_LIMIT_RPM", "rate_limit.default_rpm"},
    {"MCPGW_RETRY_MAX_RETRIES", "retry.max_retries"},
    {"MCPGW_RETRY_BASE_DELAY", "retry.base_delay"},
    {"MCPGW_RETRY_MAX_DELAY", "retry.max_delay"},
    {"MCPGW_EVENT_BUFFER_CAPACITY", "events.capacity"},
    {"MCPGW_ENABLE_SERVER_POOL", "enable_server_pool"},
    {"MCPGW_ENABLE_SESSION_MANAGEMENT", "enable_session_management"},
    {"MCPGW_ENABLE_RATE_LIMITING", "enable_rate_limiting"},
    {"MCPGW_LISTEN", "listen"},
    {"MCPGW_SCHEME", "scheme"},
    {"MCPGW_TLS_CERT", "cert"},
    {"MCPGW_TLS_KEY", "key"},
    {"MCPGW_SSE_WINDOW_SECONDS", "sse.window_seconds"},
    {"MCPGW_API_BASE", "api_base"},
    {"MCPGW_CONNECTORS_FILE", "connectors"},
};

} // namespace

GatewayConfig GatewayConfig::FromEnvironment() {
    GatewayConfig cfg;
    for (const auto& binding : kEnvBindings) {
        auto value = GetEnvOptional(binding.envName);
        if (!value.has_value()) {
            continue;
        }
        if (!cfg.Set(binding.key, *value)) {
            LOG_WARN("GatewayConfig: ignoring malformed {}='{}'", binding.envName, *value);
        }
    }
    // MCPGW_CONFIG carries the same grammar as --config
    const std::string extra = GetEnvOrDefault("MCPGW_CONFIG", "");
    if (!extra.empty()) {
        cfg.ApplyOverrides(extra);
    }
    return cfg;
}

std::size_t GatewayConfig::ApplyOverrides(const std::string& text) {
    std::string normalized = text;
    std::replace(normalized.begin(), normalized.end(), ';', ' ');
    std::istringstream ss(normalized);
    std::string token;
    std::size_t applied = 0;
    while (ss >> token) {
        auto eq = token.find('=');
        if (eq == std::string::npos || eq == 0) {
            LOG_WARN("GatewayConfig: ignoring override '{}' (expected key=value)", token);
            continue;
        }
        const std::string key = token.substr(0, eq);
        const std::string value = token.substr(eq + 1);
        if (Set(key, value)) {
            ++applied;
        } else {
            LOG_WARN("GatewayConfig: ignoring override {}='{}'", key, value);
        }
    }
    return applied;
}

bool GatewayConfig::Set(const std::string& rawKey, const std::string& value) {
    const std::string key = lower(rawKey);
    if (key == "pool.max_size") return assignInt(value, 1, poolMaxSize);
    if (key == "pool.ttl_seconds") return assignDuration(value, 0, poolTtl);
    if (key == "session.ttl_seconds") return assignDuration(value, 0, sessionTtl);
    if (key == "session.max_sessions_per_key") return assignInt(value, 1, maxSessionsPerKey);
    if (key == "health.probe_interval") return assignDuration(value, 0, healthCallInterval);
    if (key == "health.failure_threshold") return assignInt(value, 1, failureThreshold);
    if (key == "health.check_interval") return assignDuration(value, 0, healthCheckInterval);
    if (key == "health.max_restarts") return assignInt(value, 0, maxRestarts);
    if (key == "process.request_timeout_ms") return assignDuration(value, 1, requestTimeout);
    if (key == "process.handshake_timeout_ms") return assignDuration(value, 1, handshakeTimeout);
    if (key == "rate_limit.default_rpm") return assignInt(value, 1, defaultRpm);
    if (key.rfind("rate_limit.", 0) == 0) {
        // Tenant slugs keep their original case
        const std::string tenant = rawKey.substr(std::string("rate_limit.").size());
        int rpm = 0;
        if (tenant.empty() || !assignInt(value, 1, rpm)) {
            return false;
        }
        tenantRpm[tenant] = rpm;
        return true;
    }
    if (key == "retry.max_retries") return assignInt(value, 0, retry.maxRetries);
    if (key == "retry.base_delay" || key == "retry.max_delay") {
        auto v = parseDouble(value);
        if (!v.has_value()) {
            return false;
        }
        (key == "retry.base_delay" ? retry.baseDelaySeconds : retry.maxDelaySeconds) = *v;
        return true;
    }
    if (key == "events.capacity") return assignInt(value, 1, eventBufferCapacity);
    if (key == "enable_server_pool" || key == "enable_session_management" || key == "enable_rate_limiting") {
        auto b = parseBool(value);
        if (!b.has_value()) {
            return false;
        }
        if (key == "enable_server_pool") enableServerPool = *b;
        else if (key == "enable_session_management") enableSessionManagement = *b;
        else enableRateLimiting = *b;
        return true;
    }
    if (key == "listen") {
        auto colon = value.rfind(':');
        if (colon == std::string::npos) {
            return false;
        }
        std::string host = value.substr(0, colon);
        std::string port = value.substr(colon + 1);
        if (!host.empty() && host.front() == '[' && host.back() == ']') {
            host = host.substr(1, host.size() - 2);
        }
        auto portNum = parseInt(port, 0);
        if (host.empty() || !portNum.has_value() || *portNum > 65535) {
            return false;
        }
        listenAddress = host;
        listenPort = port;
        return true;
    }
    if (key == "scheme") {
        const std::string s = lower(value);
        if (s != "http" && s != "https") {
            return false;
        }
        scheme = s;
        return true;
    }
    if (key == "cert") { certFile = value; return true; }
    if (key == "key") { keyFile = value; return true; }
    if (key == "sse.window_seconds") return assignDuration(value, 0, sseWindow);
    if (key == "api_base") {
        if (value.empty()) apiBase.reset(); else apiBase = value;
        return true;
    }
    if (key == "connectors") { connectorsFile = value; return true; }
    return false;
}

} // namespace mcpgw
