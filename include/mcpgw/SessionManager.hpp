//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.hpp
// Purpose: Client-visible sessions bound to a transport and a (weakly held) backend
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpgw/Backend.hpp"
#include "mcpgw/ProtocolTransport.hpp"

namespace mcpgw {

struct SessionEntry {
    std::string sessionId;
    std::string tenantId;
    std::string connectorId;
    // The pool owns the backend; a session never extends its lifetime.
    std::weak_ptr<IBackend> backend;
    std::shared_ptr<ProtocolTransport> transport;
    std::optional<std::string> protocolVersion;
    std::chrono::steady_clock::time_point createdAt;
    std::chrono::steady_clock::time_point lastAccess;
    // Creation order; eviction under the per-key cap removes the lowest value.
    uint64_t sequence{0};
};

//==========================================================================================================
// SessionManager
// Purpose: Maps 128-bit random session ids to their (tenant, connector, backend, version).
// Notes:
//   - Expiry is lazy: GetSession removes and misses entries idle for longer than ttl, or whose backend
//     is gone. ReapExpired sweeps opportunistically.
//   - Creating a session past maxSessionsPerKey evicts the oldest session of that key by creation order.
//==========================================================================================================
class SessionManager {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    struct Options {
        std::chrono::milliseconds ttl{std::chrono::seconds(1800)};
        std::size_t maxSessionsPerKey{10};
    };

    SessionManager();
    explicit SessionManager(const Options& opts, ClockFn clock = nullptr);

    // 32 lowercase hex characters from a cryptographic RNG.
    static std::string GenerateSessionId();

    //======================================================================================================
    // CreateSession
    // Returns:
    //   The new session id.
    // Throws:
    //   errors::GatewayError (SessionExpired) after Shutdown().
    //======================================================================================================
    std::string CreateSession(const std::string& tenantId, const std::string& connectorId,
                              const std::shared_ptr<IBackend>& backend,
                              std::shared_ptr<ProtocolTransport> transport,
                              const std::optional<std::string>& protocolVersion = std::nullopt);

    // Returns a copy of the entry (lastAccess refreshed), or std::nullopt on a miss.
    std::optional<SessionEntry> GetSession(const std::string& sessionId);

    // Returns true when a session was removed.
    bool CloseSession(const std::string& sessionId);

    std::size_t ReapExpired();
    void Shutdown();

    // Sessions that are neither expired nor bound to a released backend.
    std::size_t ActiveSessionCount() const;
    std::vector<std::string> ListSessionIds() const;
    std::vector<std::string> SessionsForKey(const std::string& tenantId, const std::string& connectorId) const;
    bool IsShutdown() const;

private:
    bool expired(const SessionEntry& entry, Clock::time_point now) const;
    bool removeLocked(const std::string& sessionId);

    Options opts;
    ClockFn clock;

    mutable std::mutex mutex;
    std::unordered_map<std::string, SessionEntry> sessions;
    uint64_t nextSequence{1};
    bool shutdown{false};
};

} // namespace mcpgw
