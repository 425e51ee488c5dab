//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NativeBackend.cpp
// Purpose: In-process backend implementation
//==========================================================================================================

#include <algorithm>
#include <exception>
#include <format>

#include "logging/Logger.h"
#include "mcpgw/NativeBackend.hpp"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {

using errors::ErrorCategory;
using errors::GatewayError;

namespace {

JSONValue emptyObject() {
    return JSONValue(JSONValue::Object{});
}

JSONValue argumentsOf(const JSONValue& params) {
    const JSONValue* args = FindField(params, "arguments");
    if (args == nullptr || args->isNull()) {
        return emptyObject();
    }
    if (!args->isObject()) {
        throw GatewayError(ErrorCategory::InvalidParams, "arguments must be an object");
    }
    return *args;
}

} // namespace

JSONValue MakeTextToolResult(const std::string& text, bool isError) {
    JSONValue::Object item;
    SetField(item, "type", JSONValue("text"));
    SetField(item, "text", JSONValue(text));
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(item));
    JSONValue::Object result;
    SetField(result, "content", JSONValue(content));
    if (isError) {
        SetField(result, "isError", JSONValue(true));
    }
    return JSONValue(result);
}

NativeBackend::NativeBackend(std::string n) : name(std::move(n)) {}

NativeBackend::~NativeBackend() = default;

void NativeBackend::RegisterTool(const ToolDefinition& tool, ToolHandler handler) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = std::find_if(tools.begin(), tools.end(), [&](const ToolEntry& e){ return e.def.name == tool.name; });
    if (it != tools.end()) {
        it->def = tool;
        it->handler = std::move(handler);
        return;
    }
    tools.push_back(ToolEntry{tool, std::move(handler)});
}

void NativeBackend::RegisterResource(const ResourceDefinition& resource, ResourceReader reader) {
    std::lock_guard<std::mutex> lock(mutex);
    resources.push_back(ResourceEntry{resource, std::move(reader)});
}

void NativeBackend::RegisterResourceTemplate(const std::string& uriTemplate, const std::string& templateName,
                                             const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex);
    templates.push_back(TemplateEntry{uriTemplate, templateName, description});
}

void NativeBackend::RegisterPrompt(const PromptDefinition& prompt, PromptHandler handler) {
    std::lock_guard<std::mutex> lock(mutex);
    prompts.push_back(PromptEntry{prompt, std::move(handler)});
}

bool NativeBackend::Initialize() {
    std::lock_guard<std::mutex> lock(mutex);
    if (closed) {
        return false;
    }
    initialized = true;
    LOG_DEBUG("NativeBackend '{}' initialized ({} tools, {} resources, {} prompts)",
              name, tools.size(), resources.size(), prompts.size());
    return true;
}

std::future<JSONValue> NativeBackend::Send(const std::string& method, const std::optional<JSONValue>& params) {
    FUNC_SCOPE();
    std::promise<JSONValue> promise;
    auto fut = promise.get_future();
    try {
        promise.set_value(dispatch(method, params.value_or(emptyObject())));
    } catch (const GatewayError&) {
        promise.set_exception(std::current_exception());
    } catch (const std::exception& e) {
        LOG_ERROR("NativeBackend '{}': {} failed: {}", name, method, e.what());
        promise.set_exception(std::make_exception_ptr(GatewayError(ErrorCategory::Internal, e.what())));
    }
    return fut;
}

void NativeBackend::SetUserToken(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex);
    userToken = token;
}

std::optional<std::string> NativeBackend::UserToken() const {
    std::lock_guard<std::mutex> lock(mutex);
    return userToken;
}

void NativeBackend::SetNotificationSink(BackendNotificationSink s) {
    std::lock_guard<std::mutex> lock(mutex);
    sink = std::move(s);
}

void NativeBackend::EmitNotification(const std::string& method, const JSONValue& params) {
    BackendNotificationSink target;
    {
        std::lock_guard<std::mutex> lock(mutex);
        target = sink;
    }
    if (target) {
        target(method, params);
    }
}

void NativeBackend::Close() {
    std::lock_guard<std::mutex> lock(mutex);
    closed = true;
    sink = nullptr;
}

bool NativeBackend::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

JSONValue NativeBackend::dispatch(const std::string& method, const JSONValue& params) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            throw GatewayError(ErrorCategory::BackendUnavailable, "backend '" + name + "' is closed");
        }
    }
    if (method == "tools/list") return listTools();
    if (method == "tools/call") return callTool(params);
    if (method == "resources/list") return listResources();
    if (method == "resources/read") return readResource(params);
    if (method == "resources/templates/list") return listResourceTemplates();
    if (method == "prompts/list") return listPrompts();
    if (method == "prompts/get") return getPrompt(params);
    if (method == "ping") return emptyObject();
    throw GatewayError(ErrorCategory::MethodNotFound, "Method not found: " + method);
}

JSONValue NativeBackend::listTools() const {
    std::lock_guard<std::mutex> lock(mutex);
    JSONValue::Array list;
    for (const auto& t : tools) {
        JSONValue::Object o;
        SetField(o, "name", JSONValue(t.def.name));
        SetField(o, "description", JSONValue(t.def.description));
        SetField(o, "inputSchema", t.def.inputSchema.isNull() ? emptyObject() : t.def.inputSchema);
        list.push_back(std::make_shared<JSONValue>(o));
    }
    JSONValue::Object result;
    SetField(result, "tools", JSONValue(list));
    return JSONValue(result);
}

JSONValue NativeBackend::callTool(const JSONValue& params) {
    auto toolName = GetStringField(params, "name");
    if (!toolName.has_value()) {
        throw GatewayError(ErrorCategory::InvalidParams, "tools/call requires a string 'name'");
    }
    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = std::find_if(tools.begin(), tools.end(), [&](const ToolEntry& e){ return e.def.name == *toolName; });
        if (it == tools.end()) {
            throw GatewayError(ErrorCategory::MethodNotFound, "Unknown tool: " + *toolName);
        }
        handler = it->handler;
    }
    JSONValue args = argumentsOf(params);
    try {
        return handler(args);
    } catch (const GatewayError&) {
        throw;
    } catch (const std::exception& e) {
        LOG_WARN("NativeBackend '{}': tool '{}' failed: {}", name, *toolName, e.what());
        return MakeTextToolResult(std::string("Error: ") + e.what(), true);
    }
}

JSONValue NativeBackend::listResources() const {
    std::lock_guard<std::mutex> lock(mutex);
    JSONValue::Array list;
    for (const auto& r : resources) {
        JSONValue::Object o;
        SetField(o, "uri", r.def.uri.ToValue());
        SetField(o, "name", JSONValue(r.def.name));
        if (!r.def.description.empty()) {
            SetField(o, "description", JSONValue(r.def.description));
        }
        SetField(o, "mimeType", JSONValue(r.def.mimeType));
        list.push_back(std::make_shared<JSONValue>(o));
    }
    JSONValue::Object result;
    SetField(result, "resources", JSONValue(list));
    return JSONValue(result);
}

JSONValue NativeBackend::readResource(const JSONValue& params) {
    std::optional<ResourceUri> requested;
    if (auto text = GetStringField(params, "uri")) {
        requested = ResourceUri::Parse(*text);
    } else if (const JSONValue* v = FindField(params, "uri")) {
        requested = ResourceUri::FromValue(*v);
    }
    if (!requested.has_value()) {
        throw GatewayError(ErrorCategory::InvalidParams, "resources/read requires a valid 'uri'");
    }
    ResourceDefinition def;
    ResourceReader reader;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = std::find_if(resources.begin(), resources.end(),
                               [&](const ResourceEntry& e){ return e.def.uri == *requested; });
        if (it == resources.end()) {
            throw GatewayError(ErrorCategory::InvalidParams, "Resource not found: " + requested->ToString());
        }
        def = it->def;
        reader = it->reader;
    }
    JSONValue::Object item;
    SetField(item, "uri", def.uri.ToValue());
    SetField(item, "mimeType", JSONValue(def.mimeType));
    SetField(item, "text", JSONValue(reader(def.uri)));
    JSONValue::Array contents;
    contents.push_back(std::make_shared<JSONValue>(item));
    JSONValue::Object result;
    SetField(result, "contents", JSONValue(contents));
    return JSONValue(result);
}

JSONValue NativeBackend::listResourceTemplates() const {
    std::lock_guard<std::mutex> lock(mutex);
    JSONValue::Array list;
    for (const auto& t : templates) {
        JSONValue::Object o;
        SetField(o, "uriTemplate", JSONValue(t.uriTemplate));
        SetField(o, "name", JSONValue(t.name));
        SetField(o, "description", JSONValue(t.description));
        list.push_back(std::make_shared<JSONValue>(o));
    }
    JSONValue::Object result;
    SetField(result, "resourceTemplates", JSONValue(list));
    return JSONValue(result);
}

JSONValue NativeBackend::listPrompts() const {
    std::lock_guard<std::mutex> lock(mutex);
    JSONValue::Array list;
    for (const auto& p : prompts) {
        JSONValue::Array args;
        for (const auto& a : p.def.arguments) {
            JSONValue::Object ao;
            SetField(ao, "name", JSONValue(a.name));
            SetField(ao, "description", JSONValue(a.description));
            SetField(ao, "required", JSONValue(a.required));
            args.push_back(std::make_shared<JSONValue>(ao));
        }
        JSONValue::Object o;
        SetField(o, "name", JSONValue(p.def.name));
        SetField(o, "description", JSONValue(p.def.description));
        SetField(o, "arguments", JSONValue(args));
        list.push_back(std::make_shared<JSONValue>(o));
    }
    JSONValue::Object result;
    SetField(result, "prompts", JSONValue(list));
    return JSONValue(result);
}

JSONValue NativeBackend::getPrompt(const JSONValue& params) {
    auto promptName = GetStringField(params, "name");
    if (!promptName.has_value()) {
        throw GatewayError(ErrorCategory::InvalidParams, "prompts/get requires a string 'name'");
    }
    PromptDefinition def;
    PromptHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = std::find_if(prompts.begin(), prompts.end(), [&](const PromptEntry& e){ return e.def.name == *promptName; });
        if (it == prompts.end()) {
            throw GatewayError(ErrorCategory::InvalidParams, "Unknown prompt: " + *promptName);
        }
        def = it->def;
        handler = it->handler;
    }
    JSONValue args = argumentsOf(params);
    for (const auto& a : def.arguments) {
        if (a.required && FindField(args, a.name) == nullptr) {
            throw GatewayError(ErrorCategory::InvalidParams,
                               std::format("Missing required argument '{}' for prompt '{}'", a.name, def.name));
        }
    }
    return handler(args);
}

} // namespace mcpgw
