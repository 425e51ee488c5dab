//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Gateway.cpp
// Purpose: HTTP-independent request routing for the MCP gateway
//==========================================================================================================

#include <charconv>
#include <format>
#include <sstream>
#include <unordered_set>

#include "logging/Logger.h"
#include "mcpgw/Gateway.hpp"
#include "mcpgw/SubprocessBackend.hpp"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {

using errors::GatewayError;

namespace {

ProcessManager::Options processOptions(const GatewayConfig& cfg) {
    ProcessManager::Options o;
    o.healthCallInterval = cfg.healthCallInterval;
    o.failureThreshold = cfg.failureThreshold;
    o.checkInterval = cfg.healthCheckInterval;
    o.maxRestarts = cfg.maxRestarts;
    o.connector.requestTimeout = cfg.requestTimeout;
    o.connector.handshakeTimeout = cfg.handshakeTimeout;
    o.apiBase = cfg.apiBase;
    return o;
}

SessionManager::Options sessionOptions(const GatewayConfig& cfg) {
    SessionManager::Options o;
    o.ttl = cfg.sessionTtl;
    o.maxSessionsPerKey = cfg.maxSessionsPerKey;
    return o;
}

std::string pathOf(const std::string& target) {
    auto q = target.find('?');
    return (q == std::string::npos) ? target : target.substr(0, q);
}

JSONValue messageBody(const std::string& message) {
    JSONValue::Object obj;
    obj["error"] = std::make_shared<JSONValue>(message);
    return JSONValue(obj);
}

std::optional<std::string> bearerToken(const GatewayRequest& request) {
    auto auth = request.Header("authorization");
    if (!auth.has_value()) {
        return std::nullopt;
    }
    const std::string prefix = "Bearer ";
    if (auth->size() <= prefix.size() || auth->compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    return auth->substr(prefix.size());
}

} // namespace

std::optional<std::string> GatewayRequest::Header(const std::string& lowercaseName) const {
    auto it = headers.find(lowercaseName);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

Gateway::Gateway(const GatewayConfig& cfg, std::shared_ptr<IConnectorRegistry> reg)
    : config(cfg),
      registry(std::move(reg)),
      processManager(processOptions(cfg)),
      rateLimiter(cfg.defaultRpm),
      eventBuffers(cfg.eventBufferCapacity),
      sessions(sessionOptions(cfg)) {
    for (const auto& [tenant, rpm] : config.tenantRpm) {
        rateLimiter.SetTenantLimit(tenant, rpm);
    }
    ServerPool::Options poolOpts;
    poolOpts.maxSize = config.poolMaxSize;
    poolOpts.ttl = config.poolTtl;
    pool = std::make_unique<ServerPool>(
        [this](const std::string& tenantId, const std::string& connectorId, const std::optional<std::string>& token)
            -> std::shared_ptr<IBackend> {
            auto definition = registry->Resolve(tenantId, connectorId);
            if (!definition.has_value()) {
                return nullptr;
            }
            return buildBackend(*definition, token);
        },
        poolOpts);
    LOG_INFO("Gateway: pool={} sessions={} rate_limit={} (default {} rpm)", config.enableServerPool,
             config.enableSessionManagement, config.enableRateLimiting, config.defaultRpm);
}

Gateway::~Gateway() {
    Shutdown();
}

std::optional<McpRoute> Gateway::ParseRoute(const std::string& target) {
    std::vector<std::string> segments;
    std::stringstream ss(pathOf(target));
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    if (segments.size() != 6 || segments[0] != "api" || segments[1] != "v1" || segments[3] != "connectors" ||
        segments[5] != "mcp") {
        return std::nullopt;
    }
    return McpRoute{segments[2], segments[4]};
}

std::string Gateway::FormatSseEvent(const BufferedEvent& event) {
    return std::format("id: {}\nevent: {}\ndata: {}\n\n", event.id, event.type, SerializeJSON(event.payload));
}

GatewayReply Gateway::jsonReply(int status, const JSONValue& body) {
    GatewayReply reply;
    reply.status = status;
    reply.body = SerializeJSON(body);
    return reply;
}

GatewayReply Gateway::sessionNotFound() {
    return jsonReply(404, CreateErrorResponse(nullptr, JSONRPCErrorCodes::SessionExpired,
                                              "Session not found or expired")->ToValue());
}

GatewayReply Gateway::Handle(const GatewayRequest& request) {
    FUNC_SCOPE();
    if (pool->IsShutdown()) {
        return jsonReply(503, messageBody("Gateway is shutting down"));
    }
    auto route = ParseRoute(request.target);
    if (!route.has_value()) {
        return jsonReply(404, messageBody("Not found"));
    }

    auto definition = registry->Resolve(route->tenantId, route->connectorId);
    if (!definition.has_value()) {
        return jsonReply(404, messageBody("Connector not found"));
    }

    // Unresolved routes are rejected before the limiter creates a bucket
    if (config.enableRateLimiting) {
        if (auto tenant = RateLimiter::ExtractTenantSlug(pathOf(request.target))) {
            auto decision = rateLimiter.TryAcquire(*tenant);
            if (!decision.allowed) {
                LOG_WARN("Gateway: rate limit exceeded for tenant {}", *tenant);
                JSONValue body = messageBody("Rate limit exceeded");
                std::get<JSONValue::Object>(body.value)["retry_after"] =
                    std::make_shared<JSONValue>(decision.retryAfterSeconds);
                GatewayReply reply = jsonReply(429, body);
                reply.headers.emplace_back("Retry-After",
                                           std::to_string(RateLimiter::RetryAfterHeaderValue(decision.retryAfterSeconds)));
                return reply;
            }
        }
    }

    try {
        if (request.method == "POST") {
            return handlePost(request, *route, *definition);
        }
        if (request.method == "GET") {
            return handleGet(request, *route);
        }
        if (request.method == "DELETE") {
            return handleDelete(request, *route);
        }
    } catch (const GatewayError& e) {
        LOG_ERROR("Gateway: {} {} failed: {}", request.method, request.target, e.what());
        return jsonReply(503, errors::makeErrorResponse(nullptr, e)->ToValue());
    }
    GatewayReply reply = jsonReply(405, messageBody("Method not allowed"));
    reply.headers.emplace_back("Allow", "GET, POST, DELETE");
    return reply;
}

std::shared_ptr<IBackend> Gateway::buildBackend(const ConnectorDefinition& definition,
                                                const std::optional<std::string>& userToken) {
    std::shared_ptr<IBackend> backend;
    if (definition.kind == BackendKind::Native) {
        backend = definition.nativeFactory ? definition.nativeFactory() : nullptr;
        if (backend && userToken.has_value()) {
            backend->SetUserToken(*userToken);
        }
    } else {
        backend = std::make_shared<SubprocessBackend>(processManager, definition.tenantId, definition.connectorId,
                                                      definition.launch, userToken);
    }
    if (backend) {
        const std::string tenantId = definition.tenantId;
        const std::string connectorId = definition.connectorId;
        backend->SetNotificationSink([this, tenantId, connectorId](const std::string& method, const JSONValue& params) {
            publish(tenantId, connectorId, method, params);
        });
    }
    return backend;
}

std::shared_ptr<IBackend> Gateway::acquireBackend(const McpRoute& route, const ConnectorDefinition& definition,
                                                  const std::optional<std::string>& userToken) {
    if (config.enableServerPool) {
        return pool->GetOrCreate(route.tenantId, route.connectorId, userToken);
    }
    auto backend = buildBackend(definition, userToken);
    if (backend && !backend->Initialize()) {
        LOG_WARN("Gateway: backend {}:{} failed to initialize", route.tenantId, route.connectorId);
        backend->Close();
        return nullptr;
    }
    return backend;
}

std::optional<SessionEntry> Gateway::lookupSession(const std::string& sessionId, const McpRoute& route) {
    if (!config.enableSessionManagement) {
        return std::nullopt;
    }
    auto entry = sessions.GetSession(sessionId);
    if (!entry.has_value()) {
        dropSession(sessionId);
        return std::nullopt;
    }
    if (entry->tenantId != route.tenantId || entry->connectorId != route.connectorId) {
        LOG_WARN("Gateway: session {} does not belong to {}:{}", sessionId, route.tenantId, route.connectorId);
        return std::nullopt;
    }
    return entry;
}

void Gateway::dropSession(const std::string& sessionId) {
    eventBuffers.Remove(sessionId);
    std::shared_ptr<IBackend> owned;
    {
        std::lock_guard<std::mutex> lock(unpooledMutex);
        auto it = unpooled.find(sessionId);
        if (it != unpooled.end()) {
            owned = std::move(it->second);
            unpooled.erase(it);
        }
    }
    if (owned) {
        owned->Close();
    }
}

GatewayReply Gateway::handlePost(const GatewayRequest& request, const McpRoute& route,
                                 const ConnectorDefinition& definition) {
    const auto token = bearerToken(request);
    const auto sessionId = request.Header(SessionHeader);

    std::shared_ptr<IBackend> backend;
    std::shared_ptr<ProtocolTransport> transport;
    bool stateless = false;
    if (sessionId.has_value() && config.enableSessionManagement) {
        auto entry = lookupSession(*sessionId, route);
        if (!entry.has_value()) {
            return sessionNotFound();
        }
        backend = entry->backend.lock();
        if (!backend) {
            return sessionNotFound();
        }
        transport = entry->transport;
        if (token.has_value()) {
            backend->SetUserToken(*token);
        }
    } else {
        backend = acquireBackend(route, definition, token);
        if (!backend) {
            return jsonReply(503, CreateErrorResponse(nullptr, JSONRPCErrorCodes::BackendUnavailable,
                                                      "Backend unavailable")->ToValue());
        }
        ProtocolTransport::Options transportOpts;
        transportOpts.requireInitialize = config.enableSessionManagement;
        transport = std::make_shared<ProtocolTransport>(route.tenantId, route.connectorId, transportOpts);
        stateless = true;
    }

    auto out = transport->HandleMessage(request.body, backend);
    GatewayReply reply;
    if (out.has_value()) {
        reply.status = 200;
        reply.body = std::move(*out);
    } else {
        reply.status = 202;
        reply.contentType.clear();
    }

    if (stateless) {
        bool retained = false;
        if (config.enableSessionManagement && transport->IsInitialized()) {
            std::string newId = sessions.CreateSession(route.tenantId, route.connectorId, backend, transport,
                                                       transport->NegotiatedVersion());
            (void)eventBuffers.GetOrCreate(newId);
            reply.headers.emplace_back("Mcp-Session-Id", newId);
            if (!config.enableServerPool) {
                std::lock_guard<std::mutex> lock(unpooledMutex);
                unpooled[newId] = backend;
                retained = true;
            }
        }
        if (!config.enableServerPool && !retained) {
            backend->Close();
        }
    }
    return reply;
}

GatewayReply Gateway::handleGet(const GatewayRequest& request, const McpRoute& route) {
    if (!config.enableSessionManagement) {
        return jsonReply(400, messageBody("Event streams require session management"));
    }
    auto sessionId = request.Header(SessionHeader);
    if (!sessionId.has_value()) {
        return jsonReply(400, messageBody("Missing Mcp-Session-Id header"));
    }
    if (!lookupSession(*sessionId, route).has_value()) {
        return sessionNotFound();
    }

    uint64_t lastEventId = 0;
    if (auto header = request.Header(LastEventIdHeader)) {
        uint64_t parsed = 0;
        auto [ptr, ec] = std::from_chars(header->data(), header->data() + header->size(), parsed);
        if (ec == std::errc() && ptr == header->data() + header->size()) {
            lastEventId = parsed;
        } else {
            LOG_DEBUG("Gateway: ignoring malformed Last-Event-ID '{}'", *header);
        }
    }

    auto buffer = eventBuffers.GetOrCreate(*sessionId);
    GatewayReply reply;
    reply.status = 200;
    reply.contentType = "text/event-stream";
    reply.headers.emplace_back("Cache-Control", "no-cache");
    reply.lastEventId = lastEventId;
    for (const auto& event : buffer->ReplayFrom(lastEventId)) {
        reply.body += FormatSseEvent(event);
        reply.lastEventId = event.id;
    }
    reply.eventStream = buffer;
    reply.streamWindow = config.sseWindow;
    return reply;
}

GatewayReply Gateway::handleDelete(const GatewayRequest& request, const McpRoute& route) {
    auto sessionId = request.Header(SessionHeader);
    if (!sessionId.has_value()) {
        return jsonReply(400, messageBody("Missing Mcp-Session-Id header"));
    }
    if (!lookupSession(*sessionId, route).has_value() || !sessions.CloseSession(*sessionId)) {
        return sessionNotFound();
    }
    dropSession(*sessionId);
    LOG_INFO("Gateway: session {} closed", *sessionId);
    GatewayReply reply;
    reply.status = 204;
    reply.contentType.clear();
    return reply;
}

void Gateway::publish(const std::string& tenantId, const std::string& connectorId, const std::string& method,
                      const JSONValue& params) {
    JSONValue payload = ParseJSON(JSONRPCNotification(method, params).Serialize());
    auto ids = sessions.SessionsForKey(tenantId, connectorId);
    for (const auto& id : ids) {
        eventBuffers.GetOrCreate(id)->Append(method, payload);
    }
    LOG_DEBUG("Gateway: {} from {}:{} buffered for {} session(s)", method, tenantId, connectorId, ids.size());
}

void Gateway::RunMaintenance() {
    FUNC_SCOPE();
    std::size_t poolReaped = pool->ReapExpired();
    std::size_t sessionsReaped = sessions.ReapExpired();
    auto ids = sessions.ListSessionIds();
    std::unordered_set<std::string> active(ids.begin(), ids.end());
    std::size_t buffersDropped = eventBuffers.CleanupSessions(active);
    std::size_t bucketsPruned = rateLimiter.PruneIdle();

    std::vector<std::shared_ptr<IBackend>> orphaned;
    {
        std::lock_guard<std::mutex> lock(unpooledMutex);
        for (auto it = unpooled.begin(); it != unpooled.end();) {
            if (active.count(it->first) == 0) {
                orphaned.push_back(std::move(it->second));
                it = unpooled.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& backend : orphaned) {
        backend->Close();
    }
    if (poolReaped + sessionsReaped + buffersDropped + bucketsPruned + orphaned.size() > 0) {
        LOG_DEBUG("Gateway: maintenance reaped pool={} sessions={} buffers={} buckets={} unpooled={}", poolReaped,
                  sessionsReaped, buffersDropped, bucketsPruned, orphaned.size());
    }
}

void Gateway::Shutdown() {
    FUNC_SCOPE();
    if (pool->IsShutdown()) {
        return;
    }
    LOG_INFO("Gateway: shutting down");
    sessions.Shutdown();
    pool->Shutdown();
    std::unordered_map<std::string, std::shared_ptr<IBackend>> owned;
    {
        std::lock_guard<std::mutex> lock(unpooledMutex);
        owned.swap(unpooled);
    }
    for (auto& [id, backend] : owned) {
        backend->Close();
    }
    processManager.TerminateAll();
    (void)eventBuffers.CleanupSessions({});
}

} // namespace mcpgw
