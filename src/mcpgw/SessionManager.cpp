//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.cpp
// Purpose: Session creation, lazy TTL expiry and per-key caps
//==========================================================================================================

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <format>

#include "logging/Logger.h"
#include "mcpgw/SessionManager.hpp"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {

using errors::ErrorCategory;
using errors::GatewayError;

SessionManager::SessionManager() : SessionManager(Options{}) {}

SessionManager::SessionManager(const Options& o, ClockFn clk) : opts(o), clock(std::move(clk)) {
    if (!clock) {
        clock = []() { return Clock::now(); };
    }
}

std::string SessionManager::GenerateSessionId() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw GatewayError(ErrorCategory::Internal,
                           std::format("RAND_bytes failed (openssl error {})", ERR_get_error()));
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string id;
    id.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        id.push_back(kHex[b >> 4]);
        id.push_back(kHex[b & 0x0F]);
    }
    return id;
}

bool SessionManager::expired(const SessionEntry& entry, Clock::time_point now) const {
    return now - entry.lastAccess > opts.ttl;
}

bool SessionManager::removeLocked(const std::string& sessionId) {
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
        return false;
    }
    if (it->second.transport) {
        it->second.transport->Close();
    }
    sessions.erase(it);
    return true;
}

std::string SessionManager::CreateSession(const std::string& tenantId, const std::string& connectorId,
                                          const std::shared_ptr<IBackend>& backend,
                                          std::shared_ptr<ProtocolTransport> transport,
                                          const std::optional<std::string>& protocolVersion) {
    FUNC_SCOPE();
    std::string sessionId = GenerateSessionId();
    std::lock_guard<std::mutex> lock(mutex);
    if (shutdown) {
        throw GatewayError(ErrorCategory::SessionExpired, "Session manager is shut down");
    }

    std::vector<const SessionEntry*> sameKey;
    for (const auto& [id, entry] : sessions) {
        if (entry.tenantId == tenantId && entry.connectorId == connectorId) {
            sameKey.push_back(&entry);
        }
    }
    if (opts.maxSessionsPerKey > 0 && sameKey.size() >= opts.maxSessionsPerKey) {
        std::sort(sameKey.begin(), sameKey.end(),
                  [](const SessionEntry* a, const SessionEntry* b) { return a->sequence < b->sequence; });
        std::size_t excess = sameKey.size() - opts.maxSessionsPerKey + 1;
        std::vector<std::string> victims;
        for (std::size_t i = 0; i < excess; ++i) {
            victims.push_back(sameKey[i]->sessionId);
        }
        for (const auto& victim : victims) {
            LOG_INFO("SessionManager: evicting oldest session {} for {}:{}", victim, tenantId, connectorId);
            removeLocked(victim);
        }
    }

    const auto now = clock();
    SessionEntry entry;
    entry.sessionId = sessionId;
    entry.tenantId = tenantId;
    entry.connectorId = connectorId;
    entry.backend = backend;
    entry.transport = std::move(transport);
    entry.protocolVersion = protocolVersion;
    entry.createdAt = now;
    entry.lastAccess = now;
    entry.sequence = nextSequence++;
    sessions.emplace(sessionId, std::move(entry));
    LOG_DEBUG("SessionManager: created session {} for {}:{}", sessionId, tenantId, connectorId);
    return sessionId;
}

std::optional<SessionEntry> SessionManager::GetSession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
        return std::nullopt;
    }
    const auto now = clock();
    if (expired(it->second, now)) {
        LOG_DEBUG("SessionManager: session {} expired", sessionId);
        removeLocked(sessionId);
        return std::nullopt;
    }
    if (it->second.backend.expired()) {
        LOG_DEBUG("SessionManager: session {} lost its backend", sessionId);
        removeLocked(sessionId);
        return std::nullopt;
    }
    it->second.lastAccess = now;
    return it->second;
}

bool SessionManager::CloseSession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex);
    return removeLocked(sessionId);
}

std::size_t SessionManager::ReapExpired() {
    std::lock_guard<std::mutex> lock(mutex);
    const auto now = clock();
    std::vector<std::string> victims;
    for (const auto& [id, entry] : sessions) {
        if (expired(entry, now) || entry.backend.expired()) {
            victims.push_back(id);
        }
    }
    for (const auto& id : victims) {
        removeLocked(id);
    }
    return victims.size();
}

void SessionManager::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex);
    shutdown = true;
    for (auto& [id, entry] : sessions) {
        if (entry.transport) {
            entry.transport->Close();
        }
    }
    LOG_INFO("SessionManager: shut down, dropping {} session(s)", sessions.size());
    sessions.clear();
}

std::size_t SessionManager::ActiveSessionCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    const auto now = clock();
    std::size_t count = 0;
    for (const auto& [id, entry] : sessions) {
        if (!expired(entry, now) && !entry.backend.expired()) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> SessionManager::ListSessionIds() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> ids;
    ids.reserve(sessions.size());
    for (const auto& [id, entry] : sessions) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> SessionManager::SessionsForKey(const std::string& tenantId,
                                                        const std::string& connectorId) const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> ids;
    for (const auto& [id, entry] : sessions) {
        if (entry.tenantId == tenantId && entry.connectorId == connectorId) {
            ids.push_back(id);
        }
    }
    return ids;
}

bool SessionManager::IsShutdown() const {
    std::lock_guard<std::mutex> lock(mutex);
    return shutdown;
}

} // namespace mcpgw
