//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpFetchBackend.cpp
// Purpose: Built-in in-process backend ("native:fetch") making outbound HTTP calls with retry/backoff
//==========================================================================================================

#include <format>

#include "logging/Logger.h"
#include "mcpgw/HttpClient.hpp"
#include "mcpgw/NativeBackend.hpp"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {

std::shared_ptr<NativeBackend> MakeHttpFetchBackend(std::shared_ptr<HttpClient> client, const RetryOptions& retry,
                                                    Sleeper sleeper, std::optional<std::string> tokenOrigin) {
    auto backend = std::make_shared<NativeBackend>("fetch");

    JSONValue::Object urlProp;
    SetField(urlProp, "type", JSONValue("string"));
    SetField(urlProp, "description", JSONValue("http:// or https:// URL"));
    JSONValue::Object headersProp;
    SetField(headersProp, "type", JSONValue("object"));
    JSONValue::Object props;
    SetField(props, "url", JSONValue(urlProp));
    SetField(props, "headers", JSONValue(headersProp));
    JSONValue::Array required;
    required.push_back(std::make_shared<JSONValue>("url"));
    JSONValue::Object schema;
    SetField(schema, "type", JSONValue("object"));
    SetField(schema, "properties", JSONValue(props));
    SetField(schema, "required", JSONValue(required));

    std::weak_ptr<NativeBackend> weak = backend;
    backend->RegisterTool({"http_get", "Fetch a URL with GET", JSONValue(schema)},
        [client, retry, sleeper, tokenOrigin, weak](const JSONValue& args) {
            auto url = GetStringField(args, "url");
            if (!url.has_value()) {
                throw errors::GatewayError(errors::ErrorCategory::InvalidParams, "Missing required argument: url");
            }
            HttpRequestSpec request;
            request.url = *url;
            if (const JSONValue* headers = FindField(args, "headers"); headers != nullptr && headers->isObject()) {
                for (const auto& [name, value] : std::get<JSONValue::Object>(headers->value)) {
                    if (value && value->isString()) {
                        request.headers.emplace_back(name, std::get<std::string>(value->value));
                    }
                }
            }
            auto self = weak.lock();
            if (self && tokenOrigin.has_value() && HttpClient::SameOrigin(*url, *tokenOrigin)) {
                if (auto token = self->UserToken()) {
                    request.headers.emplace_back("Authorization", "Bearer " + *token);
                }
            } else if (self && self->UserToken().has_value()) {
                LOG_DEBUG("fetch: not forwarding the user token to {}", *url);
            }
            try {
                HttpReply reply = client->ExecuteWithRetry(request, retry, sleeper);
                std::string contentType = reply.Header("Content-Type").value_or("unknown");
                return MakeTextToolResult(std::format("HTTP {} ({})\n{}", reply.status, contentType,
                                                      errors::bodyExcerpt(reply.body)));
            } catch (const errors::GatewayError& e) {
                LOG_WARN("fetch: GET {} failed ({}): {}", *url, errors::categoryName(e.category()), e.what());
                std::string text = std::format("{}: {}", errors::categoryName(e.category()), e.what());
                if (e.retryAfter.has_value()) {
                    text += std::format(" (retry after {}s)", *e.retryAfter);
                }
                return MakeTextToolResult(text, true);
            }
        });
    return backend;
}

} // namespace mcpgw
