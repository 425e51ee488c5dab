//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_gateway.cpp
// Purpose: Route-level tests for the gateway: sessions, admission, event replay and stateless mode
//==========================================================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <future>
#include <thread>

#include "mcpgw/Gateway.hpp"

using namespace mcpgw;

namespace {

const char* kRoute = "/api/v1/acme/connectors/echo/mcp";

std::shared_ptr<StaticConnectorRegistry> echoRegistry() {
    auto registry = std::make_shared<StaticConnectorRegistry>();
    registry->RegisterNative(StaticConnectorRegistry::AnyTenant, "echo", "echo");
    return registry;
}

GatewayRequest post(const std::string& body, const std::string& target = kRoute) {
    GatewayRequest req;
    req.method = "POST";
    req.target = target;
    req.headers["content-type"] = "application/json";
    req.body = body;
    return req;
}

std::optional<std::string> replyHeader(const GatewayReply& reply, const std::string& name) {
    for (const auto& [k, v] : reply.headers) {
        if (k == name) {
            return v;
        }
    }
    return std::nullopt;
}

const char* kInitialize =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-06-18","capabilities":{},"clientInfo":{"name":"t","version":"1"}}})";

// JSON-lines MCP server whose "slow" tool answers from a background subshell after a second, so a second
// request can complete on the same process while the first is still pending.
const char* kSlowToolServer = R"SH(
while IFS= read -r line; do
  id=$(printf '%s' "$line" | sed -n 's/.*"id":\([^,}]*\).*/\1/p')
  method=$(printf '%s' "$line" | sed -n 's/.*"method":"\([^"]*\)".*/\1/p')
  [ -z "$id" ] && continue
  case "$method" in
    initialize)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"protocolVersion":"2024-11-05","capabilities":{},"serverInfo":{"name":"sh-slow","version":"1"}}}\n' "$id" ;;
    resources/list)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"resources":[]}}\n' "$id" ;;
    tools/list)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"tools":[{"name":"slow","inputSchema":{"type":"object"}}]}}\n' "$id" ;;
    tools/call)
      ( sleep 1; printf '{"jsonrpc":"2.0","id":%s,"result":{"content":[{"type":"text","text":"slow done"}]}}\n' "$id" ) & ;;
    *)
      printf '{"jsonrpc":"2.0","id":%s,"error":{"code":-32601,"message":"Method not found"}}\n' "$id" ;;
  esac
done
)SH";

class GatewayTest : public ::testing::Test {
protected:
    GatewayTest() : gateway(config(), echoRegistry()) {}

    static GatewayConfig config() {
        GatewayConfig cfg;
        cfg.healthCheckInterval = std::chrono::seconds(3600);
        cfg.tenantRpm["slow"] = 1;
        return cfg;
    }

    std::string initialize() {
        GatewayReply reply = gateway.Handle(post(kInitialize));
        EXPECT_EQ(reply.status, 200);
        auto id = replyHeader(reply, "Mcp-Session-Id");
        EXPECT_TRUE(id.has_value());
        return id.value_or("");
    }

    GatewayReply postInSession(const std::string& sessionId, const std::string& body) {
        GatewayRequest req = post(body);
        req.headers[Gateway::SessionHeader] = sessionId;
        return gateway.Handle(req);
    }

    Gateway gateway;
};

} // namespace

TEST(GatewayRoutes, ParseRoute) {
    auto route = Gateway::ParseRoute("/api/v1/acme/connectors/github/mcp?x=1");
    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(route->tenantId, "acme");
    EXPECT_EQ(route->connectorId, "github");
    EXPECT_FALSE(Gateway::ParseRoute("/api/v1/acme/connectors/github").has_value());
    EXPECT_FALSE(Gateway::ParseRoute("/api/v2/acme/connectors/github/mcp").has_value());
    EXPECT_FALSE(Gateway::ParseRoute("/").has_value());
}

TEST(GatewayRoutes, FormatSseEvent) {
    BufferedEvent event{7, "notifications/message", JSONValue(std::string("hi"))};
    EXPECT_EQ(Gateway::FormatSseEvent(event), "id: 7\nevent: notifications/message\ndata: \"hi\"\n\n");
}

TEST_F(GatewayTest, InitializeCreatesSession) {
    GatewayReply reply = gateway.Handle(post(kInitialize));
    ASSERT_EQ(reply.status, 200);
    EXPECT_EQ(reply.contentType, "application/json");
    auto sessionId = replyHeader(reply, "Mcp-Session-Id");
    ASSERT_TRUE(sessionId.has_value());
    EXPECT_EQ(sessionId->size(), 32u);

    JSONValue body = ParseJSON(reply.body);
    const JSONValue* result = FindField(body, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(GetStringField(*result, "protocolVersion"), std::optional<std::string>("2025-06-18"));

    auto entry = gateway.Sessions().GetSession(*sessionId);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->tenantId, "acme");
    EXPECT_EQ(entry->protocolVersion, std::optional<std::string>("2025-06-18"));
    EXPECT_EQ(gateway.Pool().Size(), 1u);
}

TEST_F(GatewayTest, CallsWithinSession) {
    std::string sessionId = initialize();

    GatewayReply ack = postInSession(sessionId, R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    EXPECT_EQ(ack.status, 202);
    EXPECT_TRUE(ack.body.empty());

    GatewayReply call = postInSession(
        sessionId, R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})");
    ASSERT_EQ(call.status, 200);
    EXPECT_NE(call.body.find("hi"), std::string::npos);
    EXPECT_FALSE(replyHeader(call, "Mcp-Session-Id").has_value());

    GatewayReply unknown = postInSession(
        sessionId, R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"nope","arguments":{}}})");
    ASSERT_EQ(unknown.status, 200);
    JSONValue body = ParseJSON(unknown.body);
    const JSONValue* err = FindField(body, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(GetIntField(*err, "code"), std::optional<int64_t>(JSONRPCErrorCodes::MethodNotFound));
}

TEST_F(GatewayTest, BatchesAndNotifications) {
    std::string sessionId = initialize();
    EXPECT_EQ(postInSession(sessionId, "[]").body, "[]");

    GatewayReply onlyNotifications = postInSession(
        sessionId, R"([{"jsonrpc":"2.0","method":"notifications/initialized"},{"jsonrpc":"2.0","method":"notifications/cancelled","params":{}}])");
    EXPECT_EQ(onlyNotifications.status, 202);

    GatewayReply mixed = postInSession(
        sessionId, R"([{"jsonrpc":"2.0","id":5,"method":"ping"},{"jsonrpc":"2.0","method":"notifications/initialized"}])");
    ASSERT_EQ(mixed.status, 200);
    JSONValue arr = ParseJSON(mixed.body);
    ASSERT_TRUE(arr.isArray());
    EXPECT_EQ(std::get<JSONValue::Array>(arr.value).size(), 1u);
}

TEST_F(GatewayTest, CallsBeforeInitializeAreRejected) {
    GatewayReply reply = gateway.Handle(post(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})"));
    ASSERT_EQ(reply.status, 200);
    JSONValue body = ParseJSON(reply.body);
    const JSONValue* err = FindField(body, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(GetIntField(*err, "code"), std::optional<int64_t>(JSONRPCErrorCodes::ServerNotInitialized));
    EXPECT_FALSE(replyHeader(reply, "Mcp-Session-Id").has_value());
    EXPECT_EQ(gateway.Sessions().ActiveSessionCount(), 0u);
}

TEST_F(GatewayTest, UnknownRoutesAndConnectors) {
    EXPECT_EQ(gateway.Handle(post(kInitialize, "/api/v1/acme/mcp")).status, 404);
    GatewayReply reply = gateway.Handle(post(kInitialize, "/api/v1/acme/connectors/nope/mcp"));
    EXPECT_EQ(reply.status, 404);
    EXPECT_NE(reply.body.find("Connector not found"), std::string::npos);
}

TEST_F(GatewayTest, UnknownSessionIs404) {
    GatewayReply reply = postInSession("0123456789abcdef0123456789abcdef", R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(reply.status, 404);
    JSONValue body = ParseJSON(reply.body);
    const JSONValue* err = FindField(body, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(GetIntField(*err, "code"), std::optional<int64_t>(JSONRPCErrorCodes::SessionExpired));
}

TEST_F(GatewayTest, SessionIsBoundToItsRoute) {
    std::string sessionId = initialize();
    GatewayRequest req = post(R"({"jsonrpc":"2.0","id":1,"method":"ping"})", "/api/v1/globex/connectors/echo/mcp");
    req.headers[Gateway::SessionHeader] = sessionId;
    EXPECT_EQ(gateway.Handle(req).status, 404);
}

TEST_F(GatewayTest, RateLimitedTenantGets429) {
    const std::string slowRoute = "/api/v1/slow/connectors/echo/mcp";
    EXPECT_EQ(gateway.Handle(post(kInitialize, slowRoute)).status, 200);
    GatewayReply limited = gateway.Handle(post(kInitialize, slowRoute));
    EXPECT_EQ(limited.status, 429);
    auto retryAfter = replyHeader(limited, "Retry-After");
    ASSERT_TRUE(retryAfter.has_value());
    EXPECT_GE(std::stoi(*retryAfter), 1);
    EXPECT_NE(limited.body.find("retry_after"), std::string::npos);
    // Other tenants are unaffected
    EXPECT_EQ(gateway.Handle(post(kInitialize)).status, 200);
}

TEST_F(GatewayTest, EventStreamReplaysAfterLastEventId) {
    std::string sessionId = initialize();
    for (const char* text : {"one", "two", "three"}) {
        std::string body = std::string(R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"announce","arguments":{"text":")") +
                           text + R"("}}})";
        ASSERT_EQ(postInSession(sessionId, body).status, 200);
    }

    GatewayRequest get;
    get.method = "GET";
    get.target = kRoute;
    get.headers[Gateway::SessionHeader] = sessionId;
    get.headers[Gateway::LastEventIdHeader] = "1";
    GatewayReply stream = gateway.Handle(get);
    ASSERT_EQ(stream.status, 200);
    EXPECT_EQ(stream.contentType, "text/event-stream");
    EXPECT_EQ(stream.body.find("\"one\""), std::string::npos);
    EXPECT_NE(stream.body.find("id: 2\nevent: notifications/message\n"), std::string::npos);
    EXPECT_NE(stream.body.find("\"three\""), std::string::npos);
    EXPECT_EQ(stream.lastEventId, 3u);
    ASSERT_NE(stream.eventStream, nullptr);
    EXPECT_EQ(stream.streamWindow, gateway.Config().sseWindow);

    get.headers.erase(Gateway::SessionHeader);
    EXPECT_EQ(gateway.Handle(get).status, 400);
}

TEST_F(GatewayTest, DeleteClosesSession) {
    std::string sessionId = initialize();
    GatewayRequest del;
    del.method = "DELETE";
    del.target = kRoute;
    del.headers[Gateway::SessionHeader] = sessionId;
    EXPECT_EQ(gateway.Handle(del).status, 204);
    EXPECT_EQ(gateway.Handle(del).status, 404);
    EXPECT_EQ(postInSession(sessionId, R"({"jsonrpc":"2.0","id":1,"method":"ping"})").status, 404);
}

TEST_F(GatewayTest, OtherMethodsAre405) {
    GatewayRequest put = post("{}");
    put.method = "PUT";
    GatewayReply reply = gateway.Handle(put);
    EXPECT_EQ(reply.status, 405);
    EXPECT_EQ(replyHeader(reply, "Allow"), std::optional<std::string>("GET, POST, DELETE"));
}

TEST_F(GatewayTest, ShutdownAnswers503) {
    std::string sessionId = initialize();
    gateway.Shutdown();
    EXPECT_EQ(gateway.Sessions().ActiveSessionCount(), 0u);
    EXPECT_EQ(gateway.Handle(post(kInitialize)).status, 503);
}

TEST(GatewayStateless, WorksWithoutSessionsOrPool) {
    GatewayConfig cfg;
    cfg.healthCheckInterval = std::chrono::seconds(3600);
    cfg.enableSessionManagement = false;
    cfg.enableServerPool = false;
    cfg.enableRateLimiting = false;
    Gateway gateway(cfg, echoRegistry());

    GatewayReply reply = gateway.Handle(post(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})"));
    ASSERT_EQ(reply.status, 200);
    EXPECT_NE(reply.body.find("\"echo\""), std::string::npos);
    EXPECT_FALSE(replyHeader(reply, "Mcp-Session-Id").has_value());
    EXPECT_EQ(gateway.Pool().Size(), 0u);

    GatewayRequest get;
    get.method = "GET";
    get.target = kRoute;
    EXPECT_EQ(gateway.Handle(get).status, 400);

    for (int i = 0; i < 150; ++i) {
        ASSERT_EQ(gateway.Handle(post(R"({"jsonrpc":"2.0","id":1,"method":"ping"})")).status, 200);
    }
}

TEST(GatewayStateless, OverlappingRequestsShareOneProcessWithoutPool) {
    const auto dir = std::filesystem::temp_directory_path() / "mcpgw-gw-overlap";
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "server.sh") << kSlowToolServer;

    auto registry = std::make_shared<StaticConnectorRegistry>();
    LaunchSpec spec;
    spec.command = {"/bin/sh", (dir / "server.sh").string()};
    spec.runtimeType = "external_custom";
    registry->RegisterExternal("acme", "slow", spec);

    GatewayConfig cfg;
    cfg.healthCheckInterval = std::chrono::seconds(3600);
    cfg.requestTimeout = std::chrono::milliseconds(5000);
    cfg.handshakeTimeout = std::chrono::milliseconds(2000);
    cfg.enableSessionManagement = false;
    cfg.enableServerPool = false;
    cfg.enableRateLimiting = false;
    Gateway gateway(cfg, registry);
    const std::string route = "/api/v1/acme/connectors/slow/mcp";

    auto pending = std::async(std::launch::async, [&]() {
        return gateway.Handle(
            post(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"slow","arguments":{}}})", route));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    // Finishes (and closes its backend) while the slow call is still waiting on the same process
    GatewayReply quick = gateway.Handle(post(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})", route));
    ASSERT_EQ(quick.status, 200);
    EXPECT_NE(quick.body.find("\"slow\""), std::string::npos);
    EXPECT_EQ(gateway.Processes().Count(), 1u);

    GatewayReply slow = pending.get();
    ASSERT_EQ(slow.status, 200);
    EXPECT_NE(slow.body.find("slow done"), std::string::npos) << slow.body;
    EXPECT_EQ(slow.body.find("\"error\""), std::string::npos) << slow.body;

    // The last release stops the process
    EXPECT_EQ(gateway.Processes().Count(), 0u);
    EXPECT_EQ(gateway.Processes().Leases("acme", "slow"), 0);

    gateway.Shutdown();
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST_F(GatewayTest, UnknownTenantsDoNotGrowTheLimiter) {
    for (int i = 0; i < 10000; ++i) {
        const std::string target = "/api/v1/ghost-" + std::to_string(i) + "/connectors/nope/mcp";
        ASSERT_EQ(gateway.Handle(post(kInitialize, target)).status, 404);
    }
    EXPECT_EQ(gateway.Limiter().BucketCount(), 0u);

    EXPECT_EQ(gateway.Handle(post(kInitialize)).status, 200);
    EXPECT_EQ(gateway.Limiter().BucketCount(), 1u);
}
