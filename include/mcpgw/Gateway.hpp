//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Gateway.hpp
// Purpose: Top-level server context: routes MCP HTTP requests through admission, sessions, pool and
//          transport
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "mcpgw/ConnectorRegistry.hpp"
#include "mcpgw/EventBuffer.hpp"
#include "mcpgw/GatewayConfig.hpp"
#include "mcpgw/ProcessManager.hpp"
#include "mcpgw/RateLimiter.hpp"
#include "mcpgw/ServerPool.hpp"
#include "mcpgw/SessionManager.hpp"

namespace mcpgw {

struct GatewayRequest {
    std::string method;   // POST | GET | DELETE | ...
    std::string target;   // path with optional query
    std::map<std::string, std::string> headers;  // lowercase names
    std::string body;

    std::optional<std::string> Header(const std::string& lowercaseName) const;
};

struct GatewayReply {
    int status{200};
    std::vector<std::pair<std::string, std::string>> headers;
    std::string contentType{"application/json"};
    std::string body;

    // Set for event-stream replies: the front end keeps streaming events after lastEventId from this
    // buffer until streamWindow elapses.
    std::shared_ptr<EventBuffer> eventStream;
    uint64_t lastEventId{0};
    std::chrono::milliseconds streamWindow{0};
};

struct McpRoute {
    std::string tenantId;
    std::string connectorId;
};

//==========================================================================================================
// Gateway
// Purpose: Owns the runtime components (created from GatewayConfig, no global state) and implements the
//          /api/v1/{tenant}/connectors/{connector}/mcp routes independent of the HTTP library.
// Routes:
//   POST   JSON-RPC body -> 200 JSON | 202 (no body). initialize without a session creates one and returns
//          Mcp-Session-Id.
//   GET    Server-Sent Events for the session (replay after Last-Event-ID, then live events).
//   DELETE Closes the session (204).
//==========================================================================================================
class Gateway {
public:
    static constexpr const char* SessionHeader = "mcp-session-id";
    static constexpr const char* LastEventIdHeader = "last-event-id";

    Gateway(const GatewayConfig& config, std::shared_ptr<IConnectorRegistry> registry);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    GatewayReply Handle(const GatewayRequest& request);

    // Opportunistic sweep of expired pool entries, sessions and orphaned event buffers.
    void RunMaintenance();

    // Drains sessions, pool and processes. Handle() answers 503 afterwards.
    void Shutdown();

    static std::optional<McpRoute> ParseRoute(const std::string& target);
    static std::string FormatSseEvent(const BufferedEvent& event);

    const GatewayConfig& Config() const { return config; }
    RateLimiter& Limiter() { return rateLimiter; }
    ServerPool& Pool() { return *pool; }
    SessionManager& Sessions() { return sessions; }
    ProcessManager& Processes() { return processManager; }
    EventBufferManager& EventBuffers() { return eventBuffers; }

private:
    GatewayReply handlePost(const GatewayRequest& request, const McpRoute& route,
                            const ConnectorDefinition& definition);
    GatewayReply handleGet(const GatewayRequest& request, const McpRoute& route);
    GatewayReply handleDelete(const GatewayRequest& request, const McpRoute& route);

    std::shared_ptr<IBackend> buildBackend(const ConnectorDefinition& definition,
                                           const std::optional<std::string>& userToken);
    std::shared_ptr<IBackend> acquireBackend(const McpRoute& route, const ConnectorDefinition& definition,
                                             const std::optional<std::string>& userToken);
    std::optional<SessionEntry> lookupSession(const std::string& sessionId, const McpRoute& route);
    void dropSession(const std::string& sessionId);
    void publish(const std::string& tenantId, const std::string& connectorId, const std::string& method,
                 const JSONValue& params);

    static GatewayReply jsonReply(int status, const JSONValue& body);
    static GatewayReply sessionNotFound();

    GatewayConfig config;
    std::shared_ptr<IConnectorRegistry> registry;

    // Declared before the pool and sessions: subprocess backends release their leases through it on close.
    ProcessManager processManager;
    RateLimiter rateLimiter;
    EventBufferManager eventBuffers;
    SessionManager sessions;
    std::unique_ptr<ServerPool> pool;

    // Backends owned per session when the server pool is disabled.
    std::mutex unpooledMutex;
    std::unordered_map<std::string, std::shared_ptr<IBackend>> unpooled;
};

} // namespace mcpgw
