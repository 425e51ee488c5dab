//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RateLimiter.hpp
// Purpose: Per-tenant token-bucket admission control
//==========================================================================================================

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mcpgw {

//==========================================================================================================
// TokenBucket
// Purpose: Classic token bucket. Tokens refill continuously at refillRate per second and are clamped to
//          capacity on every refill. Not thread-safe on its own; RateLimiter serializes access.
//==========================================================================================================
class TokenBucket {
public:
    using Clock = std::chrono::steady_clock;

    TokenBucket(double capacity, double refillRate, Clock::time_point now = Clock::now());

    //======================================================================================================
    // Refills for the time elapsed since the last refill, then consumes one token when at least one is
    // available.
    // Args:
    //   now: Observation time (defaults to Clock::now()). Times earlier than the last refill add nothing.
    // Returns:
    //   true when a token was consumed.
    //======================================================================================================
    bool TryConsume(std::optional<Clock::time_point> now = std::nullopt);

    // Seconds until one whole token is available at the current refill rate (0 when one is available now).
    double TimeUntilToken() const;

    // Tokens that would be available at `now`, without consuming or advancing the refill clock.
    double AvailableAt(Clock::time_point now) const;

    double Tokens() const { return tokens; }
    double Capacity() const { return capacity; }
    double RefillRate() const { return refillRate; }

private:
    void refill(Clock::time_point now);

    double capacity;
    double refillRate;
    double tokens;
    Clock::time_point lastRefill;
};

//==========================================================================================================
// RateLimiter
// Purpose: One lazily created bucket per tenant. Capacity equals the tenant's requests-per-minute and the
//          refill rate is rpm/60 tokens per second.
//==========================================================================================================
class RateLimiter {
public:
    struct Decision {
        bool allowed{true};
        double retryAfterSeconds{0.0};
    };

    explicit RateLimiter(int defaultRpm = 100);

    Decision TryAcquire(const std::string& tenant,
                        std::optional<TokenBucket::Clock::time_point> now = std::nullopt);

    // Replaces the tenant's bucket with a full one at the new rate. Throws std::invalid_argument when rpm <= 0.
    void SetTenantLimit(const std::string& tenant, int rpm);

    int LimitFor(const std::string& tenant) const;
    int DefaultRpm() const { return defaultRpm; }
    std::size_t BucketCount() const;

    // Drops buckets that have refilled to capacity. A dropped bucket is recreated full on the next
    // TryAcquire, so admission decisions are unchanged. Returns the number removed.
    std::size_t PruneIdle(std::optional<TokenBucket::Clock::time_point> now = std::nullopt);

    //======================================================================================================
    // ExtractTenantSlug
    // Purpose: Attributes a request path to a tenant. Only /api/v1/{tenant}/connectors/{id}/mcp style paths
    //          (containing both "/connectors/" and "/mcp") are attributed; the tenant is the segment after
    //          "v1".
    // Returns:
    //   The tenant slug, or nullopt when the path bypasses rate limiting.
    //======================================================================================================
    static std::optional<std::string> ExtractTenantSlug(const std::string& path);

    // Whole seconds for the Retry-After header of a 429 response.
    static int RetryAfterHeaderValue(double retryAfterSeconds);

private:
    TokenBucket makeBucket(int rpm, TokenBucket::Clock::time_point now) const;

    int defaultRpm;
    mutable std::mutex mutex;
    std::unordered_map<std::string, TokenBucket> buckets;
    std::unordered_map<std::string, int> tenantLimits;
};

} // namespace mcpgw
