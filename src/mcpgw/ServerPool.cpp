//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerPool.cpp
// Purpose: Backend handle pool with single-flight creation, LRU eviction and TTL expiry
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpgw/ServerPool.hpp"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {

using errors::ErrorCategory;
using errors::GatewayError;

ServerPool::ServerPool(BackendFactory f, const Options& o, ClockFn clk)
    : factory(std::move(f)), opts(o), clock(std::move(clk)) {
    if (!clock) {
        clock = []() { return Clock::now(); };
    }
}

ServerPool::~ServerPool() {
    Shutdown();
}

std::string ServerPool::MakeKey(const std::string& tenantId, const std::string& connectorId) {
    return tenantId + ":" + connectorId;
}

bool ServerPool::expired(const Entry& entry, Clock::time_point now) const {
    return now - entry.createdAt > opts.ttl;
}

std::shared_ptr<IBackend> ServerPool::removeLocked(const std::string& key) {
    auto it = entries.find(key);
    if (it == entries.end()) {
        return nullptr;
    }
    std::shared_ptr<IBackend> backend = std::move(it->second.backend);
    lru.erase(it->second.lruPos);
    entries.erase(it);
    return backend;
}

void ServerPool::closeAll(std::vector<std::shared_ptr<IBackend>>& handles) {
    for (auto& h : handles) {
        if (!h) {
            continue;
        }
        try {
            h->Close();
        } catch (const std::exception& e) {
            LOG_WARN("ServerPool: error closing backend: {}", e.what());
        }
    }
    handles.clear();
}

std::shared_ptr<IBackend> ServerPool::create(const std::string& tenantId, const std::string& connectorId,
                                             const std::optional<std::string>& userToken) {
    try {
        std::shared_ptr<IBackend> backend = factory ? factory(tenantId, connectorId, userToken) : nullptr;
        if (!backend) {
            LOG_WARN("ServerPool: no backend available for {}:{}", tenantId, connectorId);
            return nullptr;
        }
        if (!backend->Initialize()) {
            LOG_WARN("ServerPool: backend for {}:{} failed to initialize; not cached", tenantId, connectorId);
            backend->Close();
            return nullptr;
        }
        return backend;
    } catch (const std::exception& e) {
        LOG_ERROR("ServerPool: creating backend for {}:{} failed: {}", tenantId, connectorId, e.what());
        return nullptr;
    }
}

std::shared_ptr<IBackend> ServerPool::GetOrCreate(const std::string& tenantId, const std::string& connectorId,
                                                  const std::optional<std::string>& userToken) {
    FUNC_SCOPE();
    const std::string key = MakeKey(tenantId, connectorId);
    std::vector<std::shared_ptr<IBackend>> toClose;
    std::shared_ptr<IBackend> hit;
    std::shared_future<std::shared_ptr<IBackend>> pending;
    std::promise<std::shared_ptr<IBackend>> ours;
    bool creator = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (shutdown) {
            throw GatewayError(ErrorCategory::BackendUnavailable, "Server pool is shut down");
        }
        const auto now = clock();
        auto it = entries.find(key);
        if (it != entries.end()) {
            if (!expired(it->second, now)) {
                ++hits;
                it->second.lastAccess = now;
                lru.splice(lru.begin(), lru, it->second.lruPos);
                hit = it->second.backend;
            } else {
                LOG_DEBUG("ServerPool: entry {} expired", key);
                toClose.push_back(removeLocked(key));
            }
        }
        if (!hit) {
            auto f = inFlight.find(key);
            if (f != inFlight.end()) {
                pending = f->second;
            } else {
                creator = true;
                ++misses;
                pending = ours.get_future().share();
                inFlight.emplace(key, pending);
            }
        }
    }
    closeAll(toClose);

    if (hit) {
        if (userToken.has_value()) {
            hit->SetUserToken(*userToken);
        }
        return hit;
    }

    if (!creator) {
        std::shared_ptr<IBackend> shared = pending.get();
        {
            // A failed shared creation is a miss for every caller that waited on it
            std::lock_guard<std::mutex> lock(mutex);
            if (shared) {
                ++hits;
            } else {
                ++misses;
            }
        }
        if (shared && userToken.has_value()) {
            shared->SetUserToken(*userToken);
        }
        return shared;
    }

    std::shared_ptr<IBackend> backend = create(tenantId, connectorId, userToken);
    bool closedMeanwhile = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        inFlight.erase(key);
        if (backend && shutdown) {
            closedMeanwhile = true;
            toClose.push_back(backend);
            backend = nullptr;
        } else if (backend) {
            while (!entries.empty() && entries.size() >= opts.maxSize) {
                const std::string victim = lru.back();
                LOG_DEBUG("ServerPool: evicting least recently used {}", victim);
                toClose.push_back(removeLocked(victim));
            }
            const auto now = clock();
            lru.push_front(key);
            entries[key] = Entry{tenantId, backend, now, now, lru.begin()};
        }
    }
    ours.set_value(backend);
    closeAll(toClose);
    if (closedMeanwhile) {
        throw GatewayError(ErrorCategory::BackendUnavailable, "Server pool is shut down");
    }
    return backend;
}

void ServerPool::Invalidate(const std::string& tenantId, const std::string& connectorId) {
    std::vector<std::shared_ptr<IBackend>> toClose;
    {
        std::lock_guard<std::mutex> lock(mutex);
        toClose.push_back(removeLocked(MakeKey(tenantId, connectorId)));
    }
    closeAll(toClose);
}

void ServerPool::InvalidateTenant(const std::string& tenantId) {
    std::vector<std::shared_ptr<IBackend>> toClose;
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::string> keys;
        for (const auto& [key, entry] : entries) {
            if (entry.tenantId == tenantId) {
                keys.push_back(key);
            }
        }
        for (const auto& key : keys) {
            toClose.push_back(removeLocked(key));
        }
    }
    LOG_DEBUG("ServerPool: invalidated {} entries for tenant {}", toClose.size(), tenantId);
    closeAll(toClose);
}

std::size_t ServerPool::ReapExpired() {
    std::vector<std::shared_ptr<IBackend>> toClose;
    {
        std::lock_guard<std::mutex> lock(mutex);
        const auto now = clock();
        std::vector<std::string> keys;
        for (const auto& [key, entry] : entries) {
            if (expired(entry, now)) {
                keys.push_back(key);
            }
        }
        for (const auto& key : keys) {
            toClose.push_back(removeLocked(key));
        }
    }
    std::size_t removed = toClose.size();
    closeAll(toClose);
    return removed;
}

void ServerPool::Shutdown() {
    std::vector<std::shared_ptr<IBackend>> toClose;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (shutdown) {
            return;
        }
        shutdown = true;
        for (auto& [key, entry] : entries) {
            toClose.push_back(std::move(entry.backend));
        }
        entries.clear();
        lru.clear();
    }
    LOG_INFO("ServerPool: shut down, closing {} backend(s)", toClose.size());
    closeAll(toClose);
}

std::size_t ServerPool::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}

uint64_t ServerPool::Hits() const {
    std::lock_guard<std::mutex> lock(mutex);
    return hits;
}

uint64_t ServerPool::Misses() const {
    std::lock_guard<std::mutex> lock(mutex);
    return misses;
}

bool ServerPool::IsShutdown() const {
    std::lock_guard<std::mutex> lock(mutex);
    return shutdown;
}

} // namespace mcpgw
