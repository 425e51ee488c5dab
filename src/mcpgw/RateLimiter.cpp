//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RateLimiter.cpp
// Purpose: Token bucket arithmetic and per-tenant bucket bookkeeping
//==========================================================================================================

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <vector>

#include "logging/Logger.h"
#include "mcpgw/RateLimiter.hpp"

namespace mcpgw {

TokenBucket::TokenBucket(double cap, double rate, Clock::time_point now)
    : capacity(cap), refillRate(rate), tokens(cap), lastRefill(now) {}

void TokenBucket::refill(Clock::time_point now) {
    if (now <= lastRefill) {
        return;
    }
    const double elapsed = std::chrono::duration<double>(now - lastRefill).count();
    tokens = std::min(capacity, tokens + elapsed * refillRate);
    lastRefill = now;
}

bool TokenBucket::TryConsume(std::optional<Clock::time_point> now) {
    refill(now.value_or(Clock::now()));
    if (tokens >= 1.0) {
        tokens -= 1.0;
        return true;
    }
    return false;
}

double TokenBucket::TimeUntilToken() const {
    if (tokens >= 1.0) {
        return 0.0;
    }
    if (refillRate <= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return (1.0 - tokens) / refillRate;
}

double TokenBucket::AvailableAt(Clock::time_point now) const {
    if (now <= lastRefill) {
        return tokens;
    }
    const double elapsed = std::chrono::duration<double>(now - lastRefill).count();
    return std::min(capacity, tokens + elapsed * refillRate);
}

RateLimiter::RateLimiter(int rpm) : defaultRpm(rpm > 0 ? rpm : 1) {
    if (rpm <= 0) {
        LOG_WARN("RateLimiter: non-positive default rpm {} clamped to 1", rpm);
    }
}

TokenBucket RateLimiter::makeBucket(int rpm, TokenBucket::Clock::time_point now) const {
    return TokenBucket(static_cast<double>(rpm), static_cast<double>(rpm) / 60.0, now);
}

RateLimiter::Decision RateLimiter::TryAcquire(const std::string& tenant,
                                              std::optional<TokenBucket::Clock::time_point> now) {
    const auto ts = now.value_or(TokenBucket::Clock::now());
    std::lock_guard<std::mutex> lock(mutex);
    auto it = buckets.find(tenant);
    if (it == buckets.end()) {
        auto lim = tenantLimits.find(tenant);
        const int rpm = (lim != tenantLimits.end()) ? lim->second : defaultRpm;
        it = buckets.emplace(tenant, makeBucket(rpm, ts)).first;
    }
    Decision d;
    if (it->second.TryConsume(ts)) {
        return d;
    }
    d.allowed = false;
    d.retryAfterSeconds = it->second.TimeUntilToken();
    LOG_DEBUG("RateLimiter: tenant {} throttled (retry after {:.3f}s)", tenant, d.retryAfterSeconds);
    return d;
}

void RateLimiter::SetTenantLimit(const std::string& tenant, int rpm) {
    if (rpm <= 0) {
        throw std::invalid_argument("rate limit rpm must be positive");
    }
    std::lock_guard<std::mutex> lock(mutex);
    tenantLimits[tenant] = rpm;
    // The next TryAcquire recreates the bucket at full capacity for the new rate
    buckets.erase(tenant);
    LOG_INFO("RateLimiter: tenant {} limit set to {} rpm", tenant, rpm);
}

int RateLimiter::LimitFor(const std::string& tenant) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = tenantLimits.find(tenant);
    return (it != tenantLimits.end()) ? it->second : defaultRpm;
}

std::size_t RateLimiter::BucketCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return buckets.size();
}

std::size_t RateLimiter::PruneIdle(std::optional<TokenBucket::Clock::time_point> now) {
    const auto ts = now.value_or(TokenBucket::Clock::now());
    std::lock_guard<std::mutex> lock(mutex);
    std::size_t removed = 0;
    for (auto it = buckets.begin(); it != buckets.end();) {
        if (it->second.AvailableAt(ts) >= it->second.Capacity()) {
            it = buckets.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::optional<std::string> RateLimiter::ExtractTenantSlug(const std::string& path) {
    if (path.find("/connectors/") == std::string::npos || path.find("/mcp") == std::string::npos) {
        return std::nullopt;
    }
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            slash = path.size();
        }
        parts.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        if (parts[i] == "v1" && !parts[i + 1].empty()) {
            return parts[i + 1];
        }
    }
    return std::nullopt;
}

int RateLimiter::RetryAfterHeaderValue(double retryAfterSeconds) {
    if (retryAfterSeconds < 0.0) {
        retryAfterSeconds = 0.0;
    }
    return static_cast<int>(retryAfterSeconds) + 1;
}

} // namespace mcpgw
