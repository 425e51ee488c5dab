//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_native_backend.cpp
// Purpose: Tests for in-process backends: tool dispatch, resources, prompts, notifications, fetch tool
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

#include "mcpgw/HttpClient.hpp"
#include "mcpgw/NativeBackend.hpp"
#include "mcpgw/errors/Errors.h"

using namespace mcpgw;
using errors::ErrorCategory;
using errors::GatewayError;

namespace {

namespace net = boost::asio;
using tcp = net::ip::tcp;

// Loopback HTTP/1.1 server that records the request head of each connection and answers 200 "ok".
class CapturingServer {
public:
    explicit CapturingServer(int connections)
        : expected(connections), acceptor(io, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
        worker = std::thread([this]() {
            for (int i = 0; i < expected; ++i) {
                tcp::socket sock(io);
                boost::system::error_code ec;
                acceptor.accept(sock, ec);
                ++served;
                if (ec) {
                    continue;
                }
                net::streambuf buf;
                net::read_until(sock, buf, "\r\n\r\n", ec);
                if (!ec) {
                    std::lock_guard<std::mutex> lock(m);
                    heads.emplace_back(net::buffers_begin(buf.data()), net::buffers_end(buf.data()));
                }
                const std::string reply =
                    "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok";
                net::write(sock, net::buffer(reply), ec);
                sock.shutdown(tcp::socket::shutdown_both, ec);
            }
        });
    }

    ~CapturingServer() {
        // Unblock accept() for connections the test never made
        while (served.load() < expected) {
            net::io_context ctx;
            tcp::socket s(ctx);
            boost::system::error_code ec;
            s.connect(acceptor.local_endpoint(), ec);
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        worker.join();
    }

    unsigned short Port() const { return acceptor.local_endpoint().port(); }

    std::vector<std::string> Heads() {
        std::lock_guard<std::mutex> lock(m);
        return heads;
    }

private:
    int expected;
    std::atomic<int> served{0};
    net::io_context io;
    tcp::acceptor acceptor;
    std::thread worker;
    std::mutex m;
    std::vector<std::string> heads;
};

JSONValue callParams(const std::string& tool, JSONValue::Object args) {
    JSONValue::Object p;
    SetField(p, "name", JSONValue(tool));
    SetField(p, "arguments", JSONValue(args));
    return JSONValue(p);
}

std::string firstText(const JSONValue& result) {
    const JSONValue* content = FindField(result, "content");
    if (content == nullptr || !content->isArray()) return {};
    const auto& items = std::get<JSONValue::Array>(content->value);
    if (items.empty()) return {};
    return GetStringField(*items[0], "text").value_or("");
}

bool isErrorResult(const JSONValue& result) {
    const JSONValue* flag = FindField(result, "isError");
    return flag != nullptr && std::holds_alternative<bool>(flag->value) && std::get<bool>(flag->value);
}

ErrorCategory categoryOf(std::future<JSONValue> fut) {
    try {
        fut.get();
    } catch (const GatewayError& e) {
        return e.category();
    }
    ADD_FAILURE() << "expected GatewayError";
    return ErrorCategory::Internal;
}

} // namespace

TEST(NativeBackend, EchoToolsListAndCall) {
    auto backend = MakeEchoBackend();
    ASSERT_TRUE(backend->Initialize());
    EXPECT_EQ(backend->Kind(), BackendKind::Native);

    JSONValue list = backend->Send("tools/list", std::nullopt).get();
    const JSONValue* tools = FindField(list, "tools");
    ASSERT_NE(tools, nullptr);
    std::vector<std::string> names;
    for (const auto& t : std::get<JSONValue::Array>(tools->value)) {
        names.push_back(GetStringField(*t, "name").value_or(""));
        EXPECT_NE(FindField(*t, "inputSchema"), nullptr);
    }
    EXPECT_NE(std::find(names.begin(), names.end(), "echo"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "add"), names.end());

    JSONValue::Object echoArgs;
    SetField(echoArgs, "text", JSONValue("hello"));
    EXPECT_EQ(firstText(backend->Send("tools/call", callParams("echo", echoArgs)).get()), "hello");

    JSONValue::Object addArgs;
    SetField(addArgs, "a", JSONValue(static_cast<int64_t>(2)));
    SetField(addArgs, "b", JSONValue(3.5));
    EXPECT_EQ(firstText(backend->Send("tools/call", callParams("add", addArgs)).get()), "5.5");
}

TEST(NativeBackend, ProtocolErrorsComeThroughTheFuture) {
    auto backend = MakeEchoBackend();
    backend->Initialize();
    EXPECT_EQ(categoryOf(backend->Send("tools/call", callParams("nope", {}))), ErrorCategory::MethodNotFound);
    EXPECT_EQ(categoryOf(backend->Send("sampling/createMessage", std::nullopt)), ErrorCategory::MethodNotFound);
    EXPECT_EQ(categoryOf(backend->Send("tools/call", callParams("echo", {}))), ErrorCategory::InvalidParams);

    JSONValue::Object p;
    SetField(p, "name", JSONValue("echo"));
    SetField(p, "arguments", JSONValue("not-an-object"));
    EXPECT_EQ(categoryOf(backend->Send("tools/call", JSONValue(p))), ErrorCategory::InvalidParams);
}

TEST(NativeBackend, ThrowingToolBecomesErrorResult) {
    NativeBackend backend("t");
    backend.RegisterTool({"boom", "always fails", JSONValue()},
                         [](const JSONValue&) -> JSONValue { throw std::runtime_error("kaput"); });
    backend.Initialize();
    JSONValue result = backend.Send("tools/call", callParams("boom", {})).get();
    EXPECT_TRUE(isErrorResult(result));
    EXPECT_EQ(firstText(result), "Error: kaput");
}

TEST(NativeBackend, RegisteringSameToolNameReplacesHandler) {
    NativeBackend backend("t");
    backend.RegisterTool({"v", "", JSONValue()}, [](const JSONValue&) { return MakeTextToolResult("one"); });
    backend.RegisterTool({"v", "", JSONValue()}, [](const JSONValue&) { return MakeTextToolResult("two"); });
    JSONValue list = backend.Send("tools/list", std::nullopt).get();
    EXPECT_EQ(std::get<JSONValue::Array>(FindField(list, "tools")->value).size(), 1u);
    EXPECT_EQ(firstText(backend.Send("tools/call", callParams("v", {})).get()), "two");
}

TEST(NativeBackend, ResourcesAcceptStringOrStructuredUri) {
    auto backend = MakeEchoBackend();
    backend->Initialize();

    JSONValue list = backend->Send("resources/list", std::nullopt).get();
    const auto& resources = std::get<JSONValue::Array>(FindField(list, "resources")->value);
    ASSERT_EQ(resources.size(), 1u);
    // Backends report structured URIs; flattening is the transport's job
    EXPECT_TRUE(FindField(*resources[0], "uri")->isObject());

    JSONValue::Object byString;
    SetField(byString, "uri", JSONValue("mem://notes/readme"));
    JSONValue read = backend->Send("resources/read", JSONValue(byString)).get();
    const auto& contents = std::get<JSONValue::Array>(FindField(read, "contents")->value);
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(GetStringField(*contents[0], "text"), std::optional<std::string>("mcpgw in-process notes"));

    JSONValue::Object byValue;
    SetField(byValue, "uri", *FindField(*resources[0], "uri"));
    EXPECT_NO_THROW(backend->Send("resources/read", JSONValue(byValue)).get());

    JSONValue::Object missing;
    SetField(missing, "uri", JSONValue("mem://notes/other"));
    EXPECT_EQ(categoryOf(backend->Send("resources/read", JSONValue(missing))), ErrorCategory::InvalidParams);

    JSONValue templates = backend->Send("resources/templates/list", std::nullopt).get();
    const auto& tlist = std::get<JSONValue::Array>(FindField(templates, "resourceTemplates")->value);
    ASSERT_EQ(tlist.size(), 1u);
    EXPECT_EQ(GetStringField(*tlist[0], "uriTemplate"), std::optional<std::string>("mem://notes/{name}"));
}

TEST(NativeBackend, PromptRequiresDeclaredArguments) {
    auto backend = MakeEchoBackend();
    backend->Initialize();
    JSONValue::Object noArgs;
    SetField(noArgs, "name", JSONValue("greet"));
    EXPECT_EQ(categoryOf(backend->Send("prompts/get", JSONValue(noArgs))), ErrorCategory::InvalidParams);

    JSONValue::Object args;
    SetField(args, "name", JSONValue("Ada"));
    JSONValue prompt = backend->Send("prompts/get", callParams("greet", args)).get();
    const auto& messages = std::get<JSONValue::Array>(FindField(prompt, "messages")->value);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(GetStringField(*FindField(*messages[0], "content"), "text"),
              std::optional<std::string>("Say hello to Ada"));
}

TEST(NativeBackend, UserTokenOverlayLatestWins) {
    auto backend = MakeEchoBackend();
    backend->Initialize();
    EXPECT_EQ(firstText(backend->Send("tools/call", callParams("whoami", {})).get()), "anonymous");
    backend->SetUserToken("first");
    backend->SetUserToken("second");
    EXPECT_EQ(firstText(backend->Send("tools/call", callParams("whoami", {})).get()), "token:second");
}

TEST(NativeBackend, NotificationsReachTheSink) {
    auto backend = MakeEchoBackend();
    backend->Initialize();
    std::vector<std::string> seen;
    backend->SetNotificationSink([&](const std::string& method, const JSONValue& params) {
        seen.push_back(method + ":" + GetStringField(params, "data").value_or(""));
    });
    JSONValue::Object args;
    SetField(args, "text", JSONValue("deploy done"));
    backend->Send("tools/call", callParams("announce", args)).get();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "notifications/message:deploy done");
}

TEST(NativeBackend, ClosedBackendRejectsCalls) {
    auto backend = MakeEchoBackend();
    backend->Initialize();
    backend->Close();
    EXPECT_TRUE(backend->IsClosed());
    EXPECT_FALSE(backend->Initialize());
    EXPECT_EQ(categoryOf(backend->Send("tools/list", std::nullopt)), ErrorCategory::BackendUnavailable);
}

TEST(HttpFetchBackend, UnreachableUpstreamIsReportedAsToolError) {
    HttpClient::Options copts;
    copts.connectTimeoutMs = 500;
    copts.readTimeoutMs = 500;
    auto client = std::make_shared<HttpClient>(copts);
    std::vector<double> delays;
    auto backend = MakeHttpFetchBackend(client, RetryOptions{2, 0.01, 0.05},
                                        [&](double s) { delays.push_back(s); });
    backend->Initialize();

    JSONValue::Object args;
    // Port 1 on loopback refuses connections
    SetField(args, "url", JSONValue("http://127.0.0.1:1/"));
    JSONValue result = backend->Send("tools/call", callParams("http_get", args)).get();
    EXPECT_TRUE(isErrorResult(result));
    EXPECT_EQ(firstText(result).rfind("UpstreamTimeout", 0), 0u);
    EXPECT_EQ(delays.size(), 2u);
}

TEST(HttpFetchBackend, SameOriginComparesSchemeHostAndPort) {
    EXPECT_TRUE(HttpClient::SameOrigin("http://API.example.com/v1/x", "http://api.example.com"));
    EXPECT_TRUE(HttpClient::SameOrigin("https://api.example.com:443/a", "https://api.example.com/"));
    EXPECT_FALSE(HttpClient::SameOrigin("http://api.example.com/a", "https://api.example.com/a"));
    EXPECT_FALSE(HttpClient::SameOrigin("http://api.example.com:8080/a", "http://api.example.com/a"));
    EXPECT_FALSE(HttpClient::SameOrigin("http://evil.example.net/a", "http://api.example.com"));
}

TEST(HttpFetchBackend, UserTokenOnlyGoesToTheApiOrigin) {
    CapturingServer server(2);
    const std::string origin = "http://127.0.0.1:" + std::to_string(server.Port());
    HttpClient::Options copts;
    copts.connectTimeoutMs = 2000;
    copts.readTimeoutMs = 2000;
    auto client = std::make_shared<HttpClient>(copts);
    auto noSleep = [](double) {};

    auto trusted = MakeHttpFetchBackend(client, RetryOptions{0, 0.01, 0.05}, noSleep, origin);
    trusted->SetUserToken("tok-123");
    trusted->Initialize();
    JSONValue::Object args;
    SetField(args, "url", JSONValue(origin + "/inside"));
    JSONValue inside = trusted->Send("tools/call", callParams("http_get", args)).get();
    EXPECT_FALSE(isErrorResult(inside)) << firstText(inside);

    auto elsewhere = MakeHttpFetchBackend(client, RetryOptions{0, 0.01, 0.05}, noSleep,
                                          std::string("http://api.example.com"));
    elsewhere->SetUserToken("tok-123");
    elsewhere->Initialize();
    SetField(args, "url", JSONValue(origin + "/outside"));
    JSONValue outside = elsewhere->Send("tools/call", callParams("http_get", args)).get();
    EXPECT_FALSE(isErrorResult(outside)) << firstText(outside);

    auto heads = server.Heads();
    ASSERT_EQ(heads.size(), 2u);
    EXPECT_NE(heads[0].find("/inside"), std::string::npos);
    EXPECT_NE(heads[0].find("Bearer tok-123"), std::string::npos);
    EXPECT_NE(heads[1].find("/outside"), std::string::npos);
    EXPECT_EQ(heads[1].find("Bearer"), std::string::npos);
}
