//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Classification and dispatch of JSON-RPC messages read from a backend process
//========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {

struct RouterHandlers {
    // Requests initiated by the peer. Must return a response (an error response is fine).
    std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)> requestHandler;
    std::function<void(JSONRPCNotification&&)> notificationHandler;
    std::function<void(const std::string&)> errorHandler;
};

using ResponseResolver = std::function<void(JSONRPCResponse&&)>;

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classify a parsed JSON-RPC message without invoking handlers.
    virtual MessageKind classify(const JSONValue& message) = 0;

    // Routes one frame. If a response should be written back (for requests), returns the serialized
    // response payload; for responses and notifications returns std::nullopt. Frames that are not
    // JSON-RPC are reported to the error handler and dropped.
    virtual std::optional<std::string> route(
        const std::string& frame,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) = 0;
};

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace mcpgw
