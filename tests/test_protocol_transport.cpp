//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_protocol_transport.cpp
// Purpose: Tests for JSON-RPC envelope handling, batches, version negotiation and backend routing
//==========================================================================================================

#include <gtest/gtest.h>

#include "mcpgw/NativeBackend.hpp"
#include "mcpgw/ProtocolTransport.hpp"

using namespace mcpgw;

namespace {

std::shared_ptr<IBackend> echo() {
    auto b = MakeEchoBackend();
    b->Initialize();
    return b;
}

JSONValue reply(ProtocolTransport& transport, const std::string& body, const std::shared_ptr<IBackend>& backend) {
    auto out = transport.HandleMessage(body, backend);
    EXPECT_TRUE(out.has_value()) << body;
    return out.has_value() ? ParseJSON(*out) : JSONValue();
}

int64_t errorCode(const JSONValue& response) {
    const JSONValue* err = FindField(response, "error");
    if (err == nullptr) return 0;
    return GetIntField(*err, "code").value_or(0);
}

const std::string kInit =
    "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{\"protocolVersion\":\"2025-06-18\"}}";

} // namespace

TEST(ProtocolTransport, NegotiateProtocolVersion) {
    EXPECT_EQ(ProtocolTransport::NegotiateProtocolVersion("2025-06-18"), std::optional<std::string>("2025-06-18"));
    EXPECT_EQ(ProtocolTransport::NegotiateProtocolVersion("2024-11-05"), std::optional<std::string>("2024-11-05"));
    // Newer than anything known: newest supported
    EXPECT_EQ(ProtocolTransport::NegotiateProtocolVersion("2099-01-01"), std::optional<std::string>("2025-06-18"));
    // Between two supported versions: the older neighbour
    EXPECT_EQ(ProtocolTransport::NegotiateProtocolVersion("2025-05-01"), std::optional<std::string>("2025-03-26"));
    EXPECT_FALSE(ProtocolTransport::NegotiateProtocolVersion("2023-01-01").has_value());
}

TEST(ProtocolTransport, InitializeReportsVersionAndCapabilities) {
    ProtocolTransport transport("acme", "echo");
    EXPECT_EQ(transport.CurrentState(), ProtocolTransport::State::Uninitialized);
    JSONValue r = reply(transport, kInit, echo());
    const JSONValue* result = FindField(r, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(GetStringField(*result, "protocolVersion"), std::optional<std::string>("2025-06-18"));
    ASSERT_NE(FindField(*result, "capabilities"), nullptr);
    EXPECT_NE(FindField(*FindField(*result, "capabilities"), "tools"), nullptr);
    EXPECT_EQ(GetStringField(*FindField(*result, "serverInfo"), "name"), std::optional<std::string>("echo"));
    EXPECT_TRUE(transport.IsInitialized());
    EXPECT_EQ(transport.NegotiatedVersion(), std::optional<std::string>("2025-06-18"));
}

TEST(ProtocolTransport, MissingVersionDefaultsAndUnsupportedIsRejected) {
    ProtocolTransport defaults("acme", "echo");
    JSONValue r = reply(defaults, "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}", echo());
    EXPECT_EQ(GetStringField(*FindField(r, "result"), "protocolVersion"),
              std::optional<std::string>(ProtocolTransport::DefaultProtocolVersion));

    ProtocolTransport old("acme", "echo");
    JSONValue rejected = reply(old,
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"initialize\",\"params\":{\"protocolVersion\":\"2020-01-01\"}}",
        echo());
    EXPECT_EQ(errorCode(rejected), JSONRPCErrorCodes::InvalidParams);
    const JSONValue* data = FindField(*FindField(rejected, "error"), "data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(GetStringField(*data, "requested"), std::optional<std::string>("2020-01-01"));
    EXPECT_FALSE(old.IsInitialized());
}

TEST(ProtocolTransport, CallsBeforeInitializeAreRejected) {
    ProtocolTransport transport("acme", "echo");
    auto backend = echo();
    JSONValue r = reply(transport, "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/list\"}", backend);
    EXPECT_EQ(errorCode(r), JSONRPCErrorCodes::ServerNotInitialized);
    // ping is allowed in any state
    JSONValue pong = reply(transport, "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}", backend);
    EXPECT_NE(FindField(pong, "result"), nullptr);

    ProtocolTransport relaxed("acme", "echo", ProtocolTransport::Options{false});
    JSONValue ok = reply(relaxed, "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"tools/list\"}", backend);
    EXPECT_NE(FindField(ok, "result"), nullptr);
}

TEST(ProtocolTransport, RoutesToBackendAndMapsErrors) {
    ProtocolTransport transport("acme", "echo");
    auto backend = echo();
    reply(transport, kInit, backend);

    JSONValue call = reply(transport,
        "{\"jsonrpc\":\"2.0\",\"id\":\"c1\",\"method\":\"tools/call\","
        "\"params\":{\"name\":\"echo\",\"arguments\":{\"text\":\"hi\"}}}", backend);
    EXPECT_EQ(GetStringField(call, "id"), std::optional<std::string>("c1"));
    ASSERT_NE(FindField(call, "result"), nullptr);

    JSONValue unknownTool = reply(transport,
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"missing\"}}", backend);
    EXPECT_EQ(errorCode(unknownTool), JSONRPCErrorCodes::MethodNotFound);

    JSONValue unknownMethod = reply(transport, "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"bogus/method\"}", backend);
    EXPECT_EQ(errorCode(unknownMethod), JSONRPCErrorCodes::MethodNotFound);

    JSONValue noBackend = reply(transport, "{\"jsonrpc\":\"2.0\",\"id\":4,\"method\":\"tools/list\"}", nullptr);
    EXPECT_EQ(errorCode(noBackend), JSONRPCErrorCodes::BackendUnavailable);
    EXPECT_EQ(GetStringField(*FindField(noBackend, "error"), "message"),
              std::optional<std::string>("Backend unavailable"));
}

TEST(ProtocolTransport, ResourceUrisAreFlattenedInResults) {
    ProtocolTransport transport("acme", "echo");
    auto backend = echo();
    reply(transport, kInit, backend);
    JSONValue r = reply(transport, "{\"jsonrpc\":\"2.0\",\"id\":5,\"method\":\"resources/list\"}", backend);
    const auto& list = std::get<JSONValue::Array>(FindField(*FindField(r, "result"), "resources")->value);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(GetStringField(*list[0], "uri"), std::optional<std::string>("mem://notes/readme"));
}

TEST(ProtocolTransport, EnvelopeValidation) {
    ProtocolTransport transport("acme", "echo");
    auto backend = echo();
    EXPECT_EQ(errorCode(reply(transport, "{not json", backend)), JSONRPCErrorCodes::ParseError);
    EXPECT_EQ(errorCode(reply(transport, "42", backend)), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(errorCode(reply(transport, "{\"jsonrpc\":\"1.0\",\"id\":1,\"method\":\"ping\"}", backend)),
              JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(errorCode(reply(transport, "{\"jsonrpc\":\"2.0\",\"id\":1}", backend)),
              JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(errorCode(reply(transport, "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":7}", backend)),
              JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(errorCode(reply(transport, "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\",\"params\":3}", backend)),
              JSONRPCErrorCodes::InvalidParams);
    JSONValue badId = reply(transport, "{\"jsonrpc\":\"2.0\",\"id\":{\"x\":1},\"method\":\"ping\"}", backend);
    EXPECT_EQ(errorCode(badId), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_TRUE(FindField(badId, "id")->isNull());
}

TEST(ProtocolTransport, NotificationsAndClientResponsesProduceNoReply) {
    ProtocolTransport transport("acme", "echo");
    auto backend = echo();
    EXPECT_FALSE(transport.HandleMessage("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}", backend).has_value());
    EXPECT_FALSE(transport.HandleMessage("{\"jsonrpc\":\"2.0\",\"id\":null,\"method\":\"tools/list\"}", backend).has_value());
    EXPECT_FALSE(transport.HandleMessage("{\"jsonrpc\":\"2.0\",\"id\":9,\"result\":{}}", backend).has_value());
}

TEST(ProtocolTransport, Batches) {
    ProtocolTransport transport("acme", "echo");
    auto backend = echo();
    EXPECT_EQ(transport.HandleMessage("[]", backend), std::optional<std::string>("[]"));
    EXPECT_FALSE(transport.HandleMessage(
        "[{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"},"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/cancelled\"}]", backend).has_value());

    JSONValue mixed = reply(transport,
        "[" + kInit + ","
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"},"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"},"
        "17]", backend);
    ASSERT_TRUE(mixed.isArray());
    const auto& items = std::get<JSONValue::Array>(mixed.value);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_NE(FindField(*items[0], "result"), nullptr);
    // Batch entries run in order, so tools/list sees the initialized state
    EXPECT_NE(FindField(*items[1], "result"), nullptr);
    EXPECT_EQ(errorCode(*items[2]), JSONRPCErrorCodes::InvalidRequest);
}

TEST(ProtocolTransport, UserTokenMethodAndClose) {
    ProtocolTransport transport("acme", "echo");
    auto backend = echo();
    reply(transport, kInit, backend);
    JSONValue set = reply(transport,
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"auth/setUserToken\",\"params\":{\"token\":\"tok\"}}", backend);
    EXPECT_NE(FindField(set, "result"), nullptr);
    EXPECT_EQ(backend->UserToken(), std::optional<std::string>("tok"));

    transport.Close();
    EXPECT_EQ(transport.CurrentState(), ProtocolTransport::State::Closed);
    JSONValue closed = reply(transport, "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}", backend);
    EXPECT_EQ(errorCode(closed), JSONRPCErrorCodes::InvalidRequest);
}
