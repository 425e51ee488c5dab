//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_connector_registry.cpp
// Purpose: Tests for connector resolution, tenant wildcards and registry file parsing
//==========================================================================================================

#include <gtest/gtest.h>

#include <sstream>

#include "mcpgw/ConnectorRegistry.hpp"
#include "mcpgw/NativeBackend.hpp"
#include "mcpgw/errors/Errors.h"

using namespace mcpgw;

TEST(ConnectorRegistry, EchoIsAvailableByDefault) {
    StaticConnectorRegistry registry;
    registry.RegisterNative("acme", "demo", "echo");
    auto def = registry.Resolve("acme", "demo");
    ASSERT_TRUE(def.has_value());
    EXPECT_EQ(def->kind, BackendKind::Native);
    EXPECT_EQ(def->nativeName, "echo");
    ASSERT_TRUE(static_cast<bool>(def->nativeFactory));
    auto backend = def->nativeFactory();
    ASSERT_NE(backend, nullptr);
    EXPECT_TRUE(backend->Initialize());
    EXPECT_FALSE(registry.Resolve("acme", "other").has_value());
}

TEST(ConnectorRegistry, UnknownNativeNameThrows) {
    StaticConnectorRegistry registry;
    EXPECT_THROW(registry.RegisterNative("acme", "x", "does-not-exist"), errors::GatewayError);
    registry.RegisterNativeFactory("custom", []() -> std::shared_ptr<IBackend> {
        return std::make_shared<NativeBackend>("custom");
    });
    EXPECT_NO_THROW(registry.RegisterNative("acme", "x", "custom"));
}

TEST(ConnectorRegistry, TenantEntryBeatsWildcard) {
    StaticConnectorRegistry registry;
    registry.RegisterNative(StaticConnectorRegistry::AnyTenant, "github", "echo");
    LaunchSpec spec;
    spec.command = {"npx", "@acme/github-mcp"};
    registry.RegisterExternal("acme", "github", spec);

    auto acme = registry.Resolve("acme", "github");
    ASSERT_TRUE(acme.has_value());
    EXPECT_EQ(acme->kind, BackendKind::Subprocess);
    EXPECT_EQ(acme->launch.command.front(), "npx");

    auto other = registry.Resolve("globex", "github");
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(other->kind, BackendKind::Native);
    // The resolved definition names the requesting tenant
    EXPECT_EQ(other->tenantId, "globex");
}

TEST(ConnectorRegistry, LoadFromStream) {
    std::istringstream in(
        "# tenants and their connectors\n"
        "\n"
        "*     echo     native:echo\n"
        "acme  github   [\"npx\", \"@acme/github-mcp\", \"--flag=a b\"]   /srv/github\n"
        "acme  time     [\"uvx\",\"mcp-server-time\"]\n"
        "acme  broken   [\"npx\"\n"
        "acme  unknown  native:nope\n"
        "acme  weird    something-else\n"
        "lonely\n");
    StaticConnectorRegistry registry;
    EXPECT_EQ(registry.LoadFromStream(in), 3u);
    EXPECT_EQ(registry.Size(), 3u);

    auto github = registry.Resolve("acme", "github");
    ASSERT_TRUE(github.has_value());
    EXPECT_EQ(github->launch.command,
              (std::vector<std::string>{"npx", "@acme/github-mcp", "--flag=a b"}));
    EXPECT_EQ(github->launch.runtimeType, "external_nodejs");
    EXPECT_EQ(github->launch.workingDir, std::optional<std::string>("/srv/github"));

    auto time = registry.Resolve("acme", "time");
    ASSERT_TRUE(time.has_value());
    EXPECT_EQ(time->launch.runtimeType, "external_python");
    EXPECT_FALSE(time->launch.workingDir.has_value());

    EXPECT_TRUE(registry.Resolve("someone", "echo").has_value());
    EXPECT_FALSE(registry.Resolve("acme", "broken").has_value());
}

TEST(ConnectorRegistry, LoadFromMissingFileThrowsNotFound) {
    StaticConnectorRegistry registry;
    try {
        registry.LoadFromFile("/nonexistent/mcpgw/connectors.txt");
        FAIL() << "expected GatewayError";
    } catch (const errors::GatewayError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::NotFound);
    }
}
