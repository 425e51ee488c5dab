//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NativeBackend.hpp
// Purpose: In-process backend serving registered tools, resources and prompts
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mcpgw/Backend.hpp"
#include "mcpgw/ResourceUri.hpp"
#include "mcpgw/RetryPolicy.hpp"

namespace mcpgw {

struct ToolDefinition {
    std::string name;
    std::string description;
    JSONValue inputSchema;
};

struct ResourceDefinition {
    ResourceUri uri;
    std::string name;
    std::string description;
    std::string mimeType{"text/plain"};
};

struct PromptArgument {
    std::string name;
    std::string description;
    bool required{false};
};

struct PromptDefinition {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;
};

// Tool handlers receive the call arguments (an object, possibly empty) and return a tool result
// object ({"content": [...]}). Throwing errors::GatewayError reports a protocol error; any other
// exception becomes a result with isError set.
using ToolHandler = std::function<JSONValue(const JSONValue& arguments)>;
using ResourceReader = std::function<std::string(const ResourceUri& uri)>;
using PromptHandler = std::function<JSONValue(const JSONValue& arguments)>;

// {"content":[{"type":"text","text":text}]}
JSONValue MakeTextToolResult(const std::string& text, bool isError = false);

class NativeBackend : public IBackend {
public:
    explicit NativeBackend(std::string name);
    ~NativeBackend() override;

    void RegisterTool(const ToolDefinition& tool, ToolHandler handler);
    void RegisterResource(const ResourceDefinition& resource, ResourceReader reader);
    // Parameterized resources listed by resources/templates/list ("uriTemplate" form).
    void RegisterResourceTemplate(const std::string& uriTemplate, const std::string& name,
                                  const std::string& description);
    void RegisterPrompt(const PromptDefinition& prompt, PromptHandler handler);

    bool Initialize() override;
    std::future<JSONValue> Send(const std::string& method, const std::optional<JSONValue>& params) override;
    void SetUserToken(const std::string& token) override;
    std::optional<std::string> UserToken() const override;
    void SetNotificationSink(BackendNotificationSink sink) override;

    // Forwards a server-initiated notification to the registered sink (no-op without one).
    void EmitNotification(const std::string& method, const JSONValue& params);

    void Close() override;
    BackendKind Kind() const override { return BackendKind::Native; }

    const std::string& Name() const { return name; }
    bool IsClosed() const;

private:
    JSONValue dispatch(const std::string& method, const JSONValue& params);
    JSONValue listTools() const;
    JSONValue callTool(const JSONValue& params);
    JSONValue listResources() const;
    JSONValue readResource(const JSONValue& params);
    JSONValue listResourceTemplates() const;
    JSONValue listPrompts() const;
    JSONValue getPrompt(const JSONValue& params);

    struct ToolEntry { ToolDefinition def; ToolHandler handler; };
    struct ResourceEntry { ResourceDefinition def; ResourceReader reader; };
    struct TemplateEntry { std::string uriTemplate; std::string name; std::string description; };
    struct PromptEntry { PromptDefinition def; PromptHandler handler; };

    std::string name;
    mutable std::mutex mutex;
    std::vector<ToolEntry> tools;
    std::vector<ResourceEntry> resources;
    std::vector<TemplateEntry> templates;
    std::vector<PromptEntry> prompts;
    std::optional<std::string> userToken;
    BackendNotificationSink sink;
    bool initialized{false};
    bool closed{false};
};

// In-process demo backend: tools echo/add/whoami, resource mem://notes/readme, prompt greet.
std::shared_ptr<NativeBackend> MakeEchoBackend();

class HttpClient;

// In-process backend exposing tool http_get(url, headers?), performed through HttpClient with retry/backoff.
// The user token is sent as a Bearer header only to URLs on the same origin as tokenOrigin; without a
// tokenOrigin it is never sent.
std::shared_ptr<NativeBackend> MakeHttpFetchBackend(std::shared_ptr<HttpClient> client, const RetryOptions& retry,
                                                    Sleeper sleeper = DefaultSleeper(),
                                                    std::optional<std::string> tokenOrigin = std::nullopt);

} // namespace mcpgw
