//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_gateway_config.cpp
// Purpose: Tests for gateway option defaults, overrides and MCPGW_* environment loading
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>

#include "mcpgw/GatewayConfig.hpp"

using namespace mcpgw;
using namespace std::chrono_literals;

TEST(GatewayConfig, Defaults) {
    GatewayConfig cfg;
    EXPECT_EQ(cfg.poolMaxSize, 5000u);
    EXPECT_EQ(cfg.poolTtl, 1800s);
    EXPECT_EQ(cfg.sessionTtl, 1800s);
    EXPECT_EQ(cfg.maxSessionsPerKey, 10u);
    EXPECT_EQ(cfg.healthCallInterval, 30s);
    EXPECT_EQ(cfg.failureThreshold, 3);
    EXPECT_EQ(cfg.maxRestarts, 3);
    EXPECT_EQ(cfg.defaultRpm, 100);
    EXPECT_EQ(cfg.retry.maxRetries, 3);
    EXPECT_DOUBLE_EQ(cfg.retry.baseDelaySeconds, 1.0);
    EXPECT_DOUBLE_EQ(cfg.retry.maxDelaySeconds, 30.0);
    EXPECT_EQ(cfg.eventBufferCapacity, 100u);
    EXPECT_TRUE(cfg.enableServerPool);
    EXPECT_TRUE(cfg.enableSessionManagement);
    EXPECT_TRUE(cfg.enableRateLimiting);
    EXPECT_EQ(cfg.scheme, "http");
}

TEST(GatewayConfig, SetParsesEachKind) {
    GatewayConfig cfg;
    EXPECT_TRUE(cfg.Set("pool.max_size", "12"));
    EXPECT_EQ(cfg.poolMaxSize, 12u);
    EXPECT_TRUE(cfg.Set("SESSION.TTL_SECONDS", "60"));
    EXPECT_EQ(cfg.sessionTtl, 60s);
    EXPECT_TRUE(cfg.Set("process.request_timeout_ms", "1500"));
    EXPECT_EQ(cfg.requestTimeout, 1500ms);
    EXPECT_TRUE(cfg.Set("retry.base_delay", "0.25"));
    EXPECT_DOUBLE_EQ(cfg.retry.baseDelaySeconds, 0.25);
    EXPECT_TRUE(cfg.Set("enable_server_pool", "off"));
    EXPECT_FALSE(cfg.enableServerPool);
    EXPECT_TRUE(cfg.Set("rate_limit.AcmeCorp", "7"));
    EXPECT_EQ(cfg.tenantRpm.at("AcmeCorp"), 7);
    EXPECT_TRUE(cfg.Set("listen", "[::1]:9443"));
    EXPECT_EQ(cfg.listenAddress, "::1");
    EXPECT_EQ(cfg.listenPort, "9443");
    EXPECT_TRUE(cfg.Set("scheme", "HTTPS"));
    EXPECT_EQ(cfg.scheme, "https");
    EXPECT_TRUE(cfg.Set("api_base", "http://gw.local"));
    EXPECT_EQ(cfg.apiBase, std::optional<std::string>("http://gw.local"));
    EXPECT_TRUE(cfg.Set("api_base", ""));
    EXPECT_FALSE(cfg.apiBase.has_value());
}

TEST(GatewayConfig, SetRejectsBadValues) {
    GatewayConfig cfg;
    EXPECT_FALSE(cfg.Set("pool.max_size", "0"));
    EXPECT_FALSE(cfg.Set("pool.max_size", "12abc"));
    EXPECT_FALSE(cfg.Set("rate_limit.default_rpm", "-5"));
    EXPECT_FALSE(cfg.Set("rate_limit.", "5"));
    EXPECT_FALSE(cfg.Set("retry.max_delay", "soon"));
    EXPECT_FALSE(cfg.Set("enable_rate_limiting", "maybe"));
    EXPECT_FALSE(cfg.Set("listen", "localhost"));
    EXPECT_FALSE(cfg.Set("listen", "localhost:99999"));
    EXPECT_FALSE(cfg.Set("scheme", "ftp"));
    EXPECT_FALSE(cfg.Set("no.such.key", "1"));
    // Rejected values leave defaults untouched
    EXPECT_EQ(cfg.poolMaxSize, 5000u);
    EXPECT_EQ(cfg.defaultRpm, 100);
    EXPECT_EQ(cfg.scheme, "http");
}

TEST(GatewayConfig, ApplyOverridesSkipsBadTokens) {
    GatewayConfig cfg;
    EXPECT_EQ(cfg.ApplyOverrides("pool.max_size=3; session.max_sessions_per_key=2 bogus =x events.capacity=0"), 2u);
    EXPECT_EQ(cfg.poolMaxSize, 3u);
    EXPECT_EQ(cfg.maxSessionsPerKey, 2u);
    EXPECT_EQ(cfg.eventBufferCapacity, 100u);
}

TEST(GatewayConfig, FromEnvironment) {
    ::setenv("MCPGW_POOL_MAX_SIZE", "42", 1);
    ::setenv("MCPGW_ENABLE_RATE_LIMITING", "false", 1);
    ::setenv("MCPGW_RETRY_MAX_RETRIES", "not-a-number", 1);
    ::setenv("MCPGW_CONFIG", "rate_limit.acme=5;health.max_restarts=1", 1);
    GatewayConfig cfg = GatewayConfig::FromEnvironment();
    ::unsetenv("MCPGW_POOL_MAX_SIZE");
    ::unsetenv("MCPGW_ENABLE_RATE_LIMITING");
    ::unsetenv("MCPGW_RETRY_MAX_RETRIES");
    ::unsetenv("MCPGW_CONFIG");

    EXPECT_EQ(cfg.poolMaxSize, 42u);
    EXPECT_FALSE(cfg.enableRateLimiting);
    EXPECT_EQ(cfg.retry.maxRetries, 3);
    EXPECT_EQ(cfg.tenantRpm.at("acme"), 5);
    EXPECT_EQ(cfg.maxRestarts, 1);
}
