//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolTransport.cpp
// Purpose: JSON-RPC envelope validation, batching, version negotiation and backend dispatch
//==========================================================================================================

#include <algorithm>
#include <unordered_set>

#include "logging/Logger.h"
#include "mcpgw/ProtocolTransport.hpp"
#include "mcpgw/ResourceUri.hpp"
#include "mcpgw/errors/Errors.h"
#include "mcpgw/version.h"

namespace mcpgw {

using errors::ErrorCategory;
using errors::GatewayError;

namespace {

// Methods forwarded to the bound backend unchanged.
const std::unordered_set<std::string>& routedMethods() {
    static const std::unordered_set<std::string> methods = {
        "tools/list",
        "tools/call",
        "resources/list",
        "resources/read",
        "resources/templates/list",
        "resources/subscribe",
        "resources/unsubscribe",
        "prompts/list",
        "prompts/get",
        "completion/complete"
    };
    return methods;
}

JSONValue errorEnvelope(const std::optional<JSONRPCId>& id, int code, const std::string& message) {
    return CreateErrorResponse(id.value_or(JSONRPCId(nullptr)), code, message)->ToValue();
}

} // namespace

const std::vector<std::string>& ProtocolTransport::SupportedVersions() {
    static const std::vector<std::string> versions = {"2025-06-18", "2025-03-26", "2024-11-05"};
    return versions;
}

std::optional<std::string> ProtocolTransport::NegotiateProtocolVersion(const std::string& requested) {
    const auto& versions = SupportedVersions();
    if (std::find(versions.begin(), versions.end(), requested) != versions.end()) {
        return requested;
    }
    for (const auto& v : versions) {
        if (v < requested) {
            return v;
        }
    }
    return std::nullopt;
}

ProtocolTransport::ProtocolTransport(std::string tenant, std::string connector)
    : ProtocolTransport(std::move(tenant), std::move(connector), Options{}) {}

ProtocolTransport::ProtocolTransport(std::string tenant, std::string connector, const Options& o)
    : tenantId(std::move(tenant)), connectorId(std::move(connector)), opts(o) {}

void ProtocolTransport::Close() {
    std::lock_guard<std::mutex> lock(mutex);
    state = State::Closed;
}

ProtocolTransport::State ProtocolTransport::CurrentState() const {
    std::lock_guard<std::mutex> lock(mutex);
    return state;
}

std::optional<std::string> ProtocolTransport::NegotiatedVersion() const {
    std::lock_guard<std::mutex> lock(mutex);
    return negotiatedVersion;
}

std::optional<std::string> ProtocolTransport::HandleMessage(const std::string& body,
                                                            const std::shared_ptr<IBackend>& backend) {
    FUNC_SCOPE();
    JSONValue document;
    try {
        document = ParseJSON(body);
    } catch (const std::exception& e) {
        LOG_DEBUG("ProtocolTransport [{}:{}]: parse error: {}", tenantId, connectorId, e.what());
        return SerializeJSON(errorEnvelope(std::nullopt, JSONRPCErrorCodes::ParseError, "Parse error"));
    }

    if (document.isArray()) {
        const auto& items = std::get<JSONValue::Array>(document.value);
        if (items.empty()) {
            return std::string("[]");
        }
        JSONValue::Array replies;
        for (const auto& item : items) {
            auto reply = handleOne(item ? *item : JSONValue(), backend);
            if (reply.has_value()) {
                replies.push_back(std::make_shared<JSONValue>(std::move(*reply)));
            }
        }
        if (replies.empty()) {
            return std::nullopt;
        }
        return SerializeJSON(JSONValue(std::move(replies)));
    }

    auto reply = handleOne(document, backend);
    if (!reply.has_value()) {
        return std::nullopt;
    }
    return SerializeJSON(*reply);
}

std::optional<JSONValue> ProtocolTransport::handleOne(const JSONValue& message, const std::shared_ptr<IBackend>& backend) {
    if (!message.isObject()) {
        return errorEnvelope(std::nullopt, JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
    }

    std::optional<JSONRPCId> id;
    if (const JSONValue* idField = FindField(message, "id"); idField != nullptr && !idField->isNull()) {
        id = IdFromValue(*idField);
        if (!id.has_value()) {
            return errorEnvelope(std::nullopt, JSONRPCErrorCodes::InvalidRequest, "Invalid Request: id must be a string or number");
        }
    }

    if (GetStringField(message, "jsonrpc").value_or("") != "2.0") {
        return errorEnvelope(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request: jsonrpc must be \"2.0\"");
    }

    const JSONValue* methodField = FindField(message, "method");
    if (methodField == nullptr) {
        if (FindField(message, "result") != nullptr || FindField(message, "error") != nullptr) {
            LOG_DEBUG("ProtocolTransport [{}:{}]: accepted client response", tenantId, connectorId);
            return std::nullopt;
        }
        return errorEnvelope(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request: missing method");
    }
    if (!methodField->isString()) {
        return errorEnvelope(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request: method must be a string");
    }
    const std::string& method = std::get<std::string>(methodField->value);

    JSONValue params{JSONValue::Object{}};
    if (const JSONValue* p = FindField(message, "params"); p != nullptr && !p->isNull()) {
        if (!p->isObject() && !p->isArray()) {
            if (!id.has_value()) {
                return std::nullopt;
            }
            return errorEnvelope(id, JSONRPCErrorCodes::InvalidParams, "Invalid params");
        }
        params = *p;
    }

    if (!id.has_value()) {
        handleNotification(method);
        return std::nullopt;
    }

    try {
        JSONValue result = FlattenResourceUris(dispatch(method, params, backend));
        return JSONRPCResponse(*id, std::move(result)).ToValue();
    } catch (const GatewayError& e) {
        LOG_DEBUG("ProtocolTransport [{}:{}]: {} failed: {}", tenantId, connectorId, method, e.what());
        return errors::makeErrorResponse(*id, e)->ToValue();
    } catch (const std::exception& e) {
        LOG_ERROR("ProtocolTransport [{}:{}]: {} raised: {}", tenantId, connectorId, method, e.what());
        return errorEnvelope(id, JSONRPCErrorCodes::InternalError, "Internal error");
    }
}

JSONValue ProtocolTransport::dispatch(const std::string& method, const JSONValue& params,
                                      const std::shared_ptr<IBackend>& backend) {
    const State current = CurrentState();
    if (current == State::Closed) {
        throw GatewayError(ErrorCategory::InvalidMessage, "Transport closed");
    }
    if (method == "initialize") {
        return handleInitialize(params);
    }
    if (method == "ping") {
        return JSONValue(JSONValue::Object{});
    }
    if (opts.requireInitialize && current != State::Initialized) {
        throw GatewayError(ErrorCategory::InvalidMessage, JSONRPCErrorCodes::ServerNotInitialized, "Server not initialized");
    }
    if (method == "logging/setLevel") {
        auto level = GetStringField(params, "level");
        if (!level.has_value()) {
            throw GatewayError(ErrorCategory::InvalidParams, "Missing required parameter: level");
        }
        LOG_DEBUG("ProtocolTransport [{}:{}]: client log level {}", tenantId, connectorId, *level);
        return JSONValue(JSONValue::Object{});
    }
    if (method == "auth/setUserToken") {
        auto token = GetStringField(params, "token");
        if (!token.has_value()) {
            throw GatewayError(ErrorCategory::InvalidParams, "Missing required parameter: token");
        }
        if (!backend) {
            throw GatewayError(ErrorCategory::BackendUnavailable, "No backend bound");
        }
        backend->SetUserToken(*token);
        return JSONValue(JSONValue::Object{});
    }
    if (routedMethods().count(method) == 0) {
        throw GatewayError(ErrorCategory::MethodNotFound, "Method not found: " + method);
    }
    if (!backend) {
        throw GatewayError(ErrorCategory::BackendUnavailable, "No backend bound");
    }
    return backend->Send(method, params).get();
}

JSONValue ProtocolTransport::handleInitialize(const JSONValue& params) {
    std::string requested = DefaultProtocolVersion;
    if (const JSONValue* pv = FindField(params, "protocolVersion"); pv != nullptr && !pv->isNull()) {
        if (!pv->isString()) {
            throw GatewayError(ErrorCategory::UnsupportedProtocolVersion, "Unsupported protocolVersion");
        }
        requested = std::get<std::string>(pv->value);
    }
    auto negotiated = NegotiateProtocolVersion(requested);
    if (!negotiated.has_value()) {
        JSONValue::Array supported;
        for (const auto& v : SupportedVersions()) {
            supported.push_back(std::make_shared<JSONValue>(v));
        }
        JSONValue::Object data;
        SetField(data, "requested", JSONValue(requested));
        SetField(data, "supported", JSONValue(std::move(supported)));
        LOG_WARN("ProtocolTransport [{}:{}]: unsupported protocolVersion '{}'", tenantId, connectorId, requested);
        throw GatewayError(ErrorCategory::UnsupportedProtocolVersion, JSONRPCErrorCodes::InvalidParams,
                           "Unsupported protocolVersion", JSONValue(std::move(data)));
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        negotiatedVersion = negotiated;
        state = State::Initialized;
    }
    LOG_INFO("ProtocolTransport [{}:{}]: initialized (requested {}, negotiated {})", tenantId, connectorId,
             requested, *negotiated);

    JSONValue::Object serverInfo;
    serverInfo["name"] = std::make_shared<JSONValue>(connectorId);
    serverInfo["version"] = std::make_shared<JSONValue>(getVersionString());
    JSONValue::Object result;
    result["protocolVersion"] = std::make_shared<JSONValue>(*negotiated);
    result["capabilities"] = std::make_shared<JSONValue>(serverCapabilities());
    result["serverInfo"] = std::make_shared<JSONValue>(serverInfo);
    return JSONValue(result);
}

JSONValue ProtocolTransport::serverCapabilities() const {
    JSONValue::Object caps;
    JSONValue::Object toolsObj;
    toolsObj["listChanged"] = std::make_shared<JSONValue>(true);
    caps["tools"] = std::make_shared<JSONValue>(toolsObj);
    JSONValue::Object resourcesObj;
    resourcesObj["subscribe"] = std::make_shared<JSONValue>(true);
    resourcesObj["listChanged"] = std::make_shared<JSONValue>(true);
    caps["resources"] = std::make_shared<JSONValue>(resourcesObj);
    JSONValue::Object promptsObj;
    promptsObj["listChanged"] = std::make_shared<JSONValue>(true);
    caps["prompts"] = std::make_shared<JSONValue>(promptsObj);
    caps["logging"] = std::make_shared<JSONValue>(JSONValue::Object{});
    return JSONValue(caps);
}

void ProtocolTransport::handleNotification(const std::string& method) {
    if (method == "notifications/initialized") {
        LOG_DEBUG("ProtocolTransport [{}:{}]: client initialized", tenantId, connectorId);
        return;
    }
    LOG_DEBUG("ProtocolTransport [{}:{}]: notification {}", tenantId, connectorId, method);
}

} // namespace mcpgw
