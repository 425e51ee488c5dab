//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Backend.hpp
// Purpose: Capability interface shared by in-process and subprocess backends
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <optional>
#include <string>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {

enum class BackendKind {
    Native,
    Subprocess
};

inline const char* backendKindName(BackendKind kind) {
    return kind == BackendKind::Native ? "native" : "subprocess";
}

// Server-initiated notification forwarded by a backend (method, params).
using BackendNotificationSink = std::function<void(const std::string&, const JSONValue&)>;

//==========================================================================================================
// IBackend
// Purpose: One initialized backend handle. Handles are owned by the ServerPool; everything else holds
//          them by reference or weakly.
//==========================================================================================================
class IBackend {
public:
    virtual ~IBackend() = default;

    // Prepares the backend for calls. Returns false when the backend cannot serve requests.
    virtual bool Initialize() = 0;

    //======================================================================================================
    // Send
    // Purpose: Issues one protocol call.
    // Returns:
    //   Future holding the call's result value. Failures are delivered as errors::GatewayError through
    //   the future.
    //======================================================================================================
    virtual std::future<JSONValue> Send(const std::string& method, const std::optional<JSONValue>& params) = 0;

    // Overlays the per-request user token; the latest token wins.
    virtual void SetUserToken(const std::string& token) = 0;
    virtual std::optional<std::string> UserToken() const = 0;

    virtual void SetNotificationSink(BackendNotificationSink sink) = 0;

    virtual void Close() = 0;
    virtual BackendKind Kind() const = 0;
};

} // namespace mcpgw
