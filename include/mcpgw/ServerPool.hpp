//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerPool.hpp
// Purpose: LRU+TTL cache of initialized backend handles keyed by (tenant, connector)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpgw/Backend.hpp"

namespace mcpgw {

// Builds an uninitialized handle. Returning nullptr or throwing is treated as a failed creation.
using BackendFactory = std::function<std::shared_ptr<IBackend>(const std::string& tenantId,
                                                               const std::string& connectorId,
                                                               const std::optional<std::string>& userToken)>;

//==========================================================================================================
// ServerPool
// Purpose: Hands out the same initialized backend for repeated calls on a key.
// Notes:
//   - Entries expire when now - createdAt > ttl (checked on lookup, counted as a miss).
//   - At capacity, the least recently accessed entry is evicted synchronously before inserting.
//   - Initialization runs outside the pool lock; concurrent first callers for a key share one attempt.
//   - Evicted, expired and invalidated handles are Close()d outside the lock.
//==========================================================================================================
class ServerPool {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    struct Options {
        std::size_t maxSize{5000};
        std::chrono::milliseconds ttl{std::chrono::seconds(1800)};
    };

    ServerPool(BackendFactory factory, const Options& opts, ClockFn clock = nullptr);
    ~ServerPool();

    ServerPool(const ServerPool&) = delete;
    ServerPool& operator=(const ServerPool&) = delete;

    //======================================================================================================
    // GetOrCreate
    // Returns:
    //   The pooled handle (userToken overlaid on hits), or nullptr when creation or Initialize() failed.
    // Throws:
    //   errors::GatewayError (BackendUnavailable) after Shutdown().
    //======================================================================================================
    std::shared_ptr<IBackend> GetOrCreate(const std::string& tenantId, const std::string& connectorId,
                                          const std::optional<std::string>& userToken = std::nullopt);

    void Invalidate(const std::string& tenantId, const std::string& connectorId);
    void InvalidateTenant(const std::string& tenantId);

    // Removes every expired entry. Returns the number removed.
    std::size_t ReapExpired();

    // Closes every handle; later GetOrCreate calls throw.
    void Shutdown();

    std::size_t Size() const;
    uint64_t Hits() const;
    uint64_t Misses() const;
    bool IsShutdown() const;

    static std::string MakeKey(const std::string& tenantId, const std::string& connectorId);

private:
    struct Entry {
        std::string tenantId;
        std::shared_ptr<IBackend> backend;
        Clock::time_point createdAt;
        Clock::time_point lastAccess;
        std::list<std::string>::iterator lruPos;
    };

    bool expired(const Entry& entry, Clock::time_point now) const;
    // Caller holds mutex. Returns the removed handle so it can be closed after unlocking.
    std::shared_ptr<IBackend> removeLocked(const std::string& key);
    std::shared_ptr<IBackend> create(const std::string& tenantId, const std::string& connectorId,
                                     const std::optional<std::string>& userToken);
    static void closeAll(std::vector<std::shared_ptr<IBackend>>& handles);

    BackendFactory factory;
    Options opts;
    ClockFn clock;

    mutable std::mutex mutex;
    std::unordered_map<std::string, Entry> entries;
    // Most recently accessed key at the front.
    std::list<std::string> lru;
    std::unordered_map<std::string, std::shared_future<std::shared_ptr<IBackend>>> inFlight;
    uint64_t hits{0};
    uint64_t misses{0};
    bool shutdown{false};
};

} // namespace mcpgw
