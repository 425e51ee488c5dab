//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message routing
//========================================================================================================

#include <optional>
#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "mcpgw/JsonRpcMessageRouter.h"

namespace mcpgw {

namespace {

class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const JSONValue& message) override {
        if (!message.isObject()) {
            return MessageKind::Unknown;
        }
        if (FindField(message, "result") != nullptr || FindField(message, "error") != nullptr) {
            return MessageKind::Response;
        }
        if (GetStringField(message, "method").has_value()) {
            const JSONValue* id = FindField(message, "id");
            if (id != nullptr && !id->isNull()) {
                return MessageKind::Request;
            }
            return MessageKind::Notification;
        }
        return MessageKind::Unknown;
    }

    std::optional<std::string> route(
        const std::string& frame,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) override {
        JSONValue message;
        try {
            message = ParseJSON(frame);
        } catch (const std::runtime_error& e) {
            // Servers occasionally print diagnostics on stdout
            LOG_DEBUG("Router: dropping non-JSON frame ({}): {}", e.what(), frame);
            if (handlers.errorHandler) {
                handlers.errorHandler("Router: non-JSON frame");
            }
            return std::nullopt;
        }

        switch (classify(message)) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.Deserialize(frame)) {
                    resolve(std::move(response));
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.Deserialize(frame)) {
                    break;
                }
                std::unique_ptr<JSONRPCResponse> resp;
                if (handlers.requestHandler) {
                    try {
                        resp = handlers.requestHandler(request);
                    } catch (const std::exception& e) {
                        LOG_ERROR("Request handler exception: {}", e.what());
                        resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
                    }
                }
                if (!resp) {
                    resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                               "Method not found: " + request.method);
                }
                resp->id = request.id;
                return resp->Serialize();
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (notification.Deserialize(frame)) {
                    if (handlers.notificationHandler) {
                        handlers.notificationHandler(std::move(notification));
                    }
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Unknown:
                break;
        }

        LOG_WARN("Router: unrecognized JSON-RPC message: {}", frame);
        if (handlers.errorHandler) {
            handlers.errorHandler("Router: unrecognized JSON-RPC message");
        }
        return std::nullopt;
    }
};

} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace mcpgw
