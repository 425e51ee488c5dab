//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolTransport.hpp
// Purpose: Per-(tenant, connector) JSON-RPC message handler with protocol version negotiation
//==========================================================================================================

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mcpgw/Backend.hpp"
#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {

//==========================================================================================================
// ProtocolTransport
// Purpose: Decodes one HTTP body (single message or batch), validates the JSON-RPC envelope, negotiates
//          the protocol version on initialize and dispatches every other method to the bound backend.
// State machine:
//   Uninitialized -> Initialized (successful initialize) -> Closed (Close()).
//   Calls other than initialize/ping fail with -32002 before initialize when requireInitialize is set.
// Notes:
//   Decode and dispatch errors never escape as exceptions; they become JSON-RPC error responses.
//==========================================================================================================
class ProtocolTransport {
public:
    enum class State {
        Uninitialized,
        Initialized,
        Closed
    };

    struct Options {
        bool requireInitialize{true};
    };

    static constexpr const char* DefaultProtocolVersion = "2024-11-05";

    // Supported protocol versions, newest first.
    static const std::vector<std::string>& SupportedVersions();

    //======================================================================================================
    // NegotiateProtocolVersion
    // Purpose: Exact match when supported; otherwise the newest supported version older than the
    //          requested one. ISO dates compare correctly as strings.
    // Returns:
    //   std::nullopt when the request is older than every supported version.
    //======================================================================================================
    static std::optional<std::string> NegotiateProtocolVersion(const std::string& requested);

    ProtocolTransport(std::string tenantId, std::string connectorId);
    ProtocolTransport(std::string tenantId, std::string connectorId, const Options& opts);

    //======================================================================================================
    // HandleMessage
    // Returns:
    //   The serialized response body, or std::nullopt when nothing is to be sent back (notifications,
    //   client responses, or a batch made only of those).
    //======================================================================================================
    std::optional<std::string> HandleMessage(const std::string& body, const std::shared_ptr<IBackend>& backend);

    void Close();

    State CurrentState() const;
    bool IsInitialized() const { return CurrentState() == State::Initialized; }
    std::optional<std::string> NegotiatedVersion() const;
    const std::string& TenantId() const { return tenantId; }
    const std::string& ConnectorId() const { return connectorId; }

private:
    std::optional<JSONValue> handleOne(const JSONValue& message, const std::shared_ptr<IBackend>& backend);
    JSONValue dispatch(const std::string& method, const JSONValue& params, const std::shared_ptr<IBackend>& backend);
    JSONValue handleInitialize(const JSONValue& params);
    void handleNotification(const std::string& method);
    JSONValue serverCapabilities() const;

    std::string tenantId;
    std::string connectorId;
    Options opts;

    mutable std::mutex mutex;
    State state{State::Uninitialized};
    std::optional<std::string> negotiatedVersion;
};

} // namespace mcpgw
