//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EchoBackend.cpp
// Purpose: Built-in in-process demo backend ("native:echo")
//==========================================================================================================

#include <format>

#include "mcpgw/NativeBackend.hpp"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {

namespace {

JSONValue stringProperty(const std::string& description) {
    JSONValue::Object p;
    SetField(p, "type", JSONValue("string"));
    SetField(p, "description", JSONValue(description));
    return JSONValue(p);
}

JSONValue numberProperty() {
    JSONValue::Object p;
    SetField(p, "type", JSONValue("number"));
    return JSONValue(p);
}

JSONValue objectSchema(JSONValue::Object props, const std::vector<std::string>& requiredNames) {
    JSONValue::Array required;
    for (const auto& n : requiredNames) {
        required.push_back(std::make_shared<JSONValue>(n));
    }
    JSONValue::Object schema;
    SetField(schema, "type", JSONValue("object"));
    SetField(schema, "properties", JSONValue(props));
    SetField(schema, "required", JSONValue(required));
    return JSONValue(schema);
}

double numberArg(const JSONValue& args, const std::string& key) {
    const JSONValue* v = FindField(args, key);
    if (v != nullptr) {
        if (const auto* i = std::get_if<int64_t>(&v->value)) return static_cast<double>(*i);
        if (const auto* d = std::get_if<double>(&v->value)) return *d;
    }
    throw errors::GatewayError(errors::ErrorCategory::InvalidParams, "Missing numeric argument: " + key);
}

} // namespace

std::shared_ptr<NativeBackend> MakeEchoBackend() {
    auto backend = std::make_shared<NativeBackend>("echo");
    std::weak_ptr<NativeBackend> weak = backend;

    JSONValue::Object echoProps;
    SetField(echoProps, "text", stringProperty("Text to echo back"));
    backend->RegisterTool({"echo", "Echo the given text", objectSchema(echoProps, {"text"})},
        [](const JSONValue& args) {
            auto text = GetStringField(args, "text");
            if (!text.has_value()) {
                throw errors::GatewayError(errors::ErrorCategory::InvalidParams, "Missing required argument: text");
            }
            return MakeTextToolResult(*text);
        });

    JSONValue::Object addProps;
    SetField(addProps, "a", numberProperty());
    SetField(addProps, "b", numberProperty());
    backend->RegisterTool({"add", "Add two numbers", objectSchema(addProps, {"a", "b"})},
        [](const JSONValue& args) {
            return MakeTextToolResult(std::format("{}", numberArg(args, "a") + numberArg(args, "b")));
        });

    backend->RegisterTool({"whoami", "Report whether a user token is bound", objectSchema({}, {})},
        [weak](const JSONValue&) {
            std::optional<std::string> token;
            if (auto self = weak.lock()) {
                token = self->UserToken();
            }
            return MakeTextToolResult(token.has_value() ? "token:" + *token : "anonymous");
        });

    JSONValue::Object announceProps;
    SetField(announceProps, "text", stringProperty("Message to publish"));
    backend->RegisterTool({"announce", "Publish a log notification to connected sessions",
                           objectSchema(announceProps, {"text"})},
        [weak](const JSONValue& args) {
            std::string text = GetStringField(args, "text").value_or("");
            if (auto self = weak.lock()) {
                JSONValue::Object params;
                SetField(params, "level", JSONValue("info"));
                SetField(params, "data", JSONValue(text));
                self->EmitNotification("notifications/message", JSONValue(params));
            }
            return MakeTextToolResult("announced");
        });

    ResourceUri readme{"mem", "notes", std::nullopt, "/readme", std::nullopt, std::nullopt};
    backend->RegisterResource({readme, "readme", "Gateway notes", "text/plain"},
        [](const ResourceUri&) { return std::string("mcpgw in-process notes"); });
    backend->RegisterResourceTemplate("mem://notes/{name}", "note", "Named note");

    backend->RegisterPrompt({"greet", "Greeting prompt", {{"name", "Who to greet", true}}},
        [](const JSONValue& args) {
            JSONValue::Object content;
            SetField(content, "type", JSONValue("text"));
            SetField(content, "text", JSONValue("Say hello to " + GetStringField(args, "name").value_or("")));
            JSONValue::Object message;
            SetField(message, "role", JSONValue("user"));
            SetField(message, "content", JSONValue(content));
            JSONValue::Array messages;
            messages.push_back(std::make_shared<JSONValue>(message));
            JSONValue::Object result;
            SetField(result, "messages", JSONValue(messages));
            return JSONValue(result);
        });
    return backend;
}

} // namespace mcpgw
