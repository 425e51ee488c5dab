//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RetryPolicy.hpp
// Purpose: Classification-driven retry with exponential backoff and full jitter for outbound calls
//==========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "logging/Logger.h"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {

//==========================================================================================================
// FailureKind
// Purpose: Classification tag the retry loop dispatches on.
//   RetryableHttp: 429, 500, 502, 503, 504
//   Auth:          401, 403 (never retried)
//   NotFound:      404 (never retried)
//   OtherHttp:     any other non-success status (never retried)
//   Connection:    no HTTP response at all (connect/read failure or timeout; retried)
//==========================================================================================================
enum class FailureKind {
    RetryableHttp,
    Auth,
    NotFound,
    OtherHttp,
    Connection
};

FailureKind ClassifyStatus(int status);

struct OutboundFailure {
    FailureKind kind{FailureKind::Connection};
    int status{0};
    std::optional<std::string> retryAfter; // raw Retry-After header value
    std::string body;
    std::string detail;

    static OutboundFailure FromStatus(int status, std::string body = {},
                                      std::optional<std::string> retryAfter = std::nullopt);
    static OutboundFailure ConnectionFailure(std::string detail);
};

//==========================================================================================================
// OutboundResult
// Purpose: Either the value produced by an outbound call or the classified failure.
//==========================================================================================================
template <typename T>
class OutboundResult {
public:
    using value_type = T;

    static OutboundResult Ok(T value) { return OutboundResult(std::move(value)); }
    static OutboundResult Fail(OutboundFailure failure) { return OutboundResult(std::move(failure)); }

    bool ok() const { return std::holds_alternative<T>(state); }
    T& value() { return std::get<T>(state); }
    const T& value() const { return std::get<T>(state); }
    const OutboundFailure& failure() const { return std::get<OutboundFailure>(state); }

private:
    explicit OutboundResult(T value) : state(std::move(value)) {}
    explicit OutboundResult(OutboundFailure failure) : state(std::move(failure)) {}

    std::variant<T, OutboundFailure> state;
};

struct RetryOptions {
    int maxRetries{3};
    double baseDelaySeconds{1.0};
    double maxDelaySeconds{30.0};
};

// Blocks the calling task for the given number of seconds.
using Sleeper = std::function<void(double)>;
// Returns a uniformly distributed value in [0, upper].
using JitterSource = std::function<double(double)>;

Sleeper DefaultSleeper();
JitterSource DefaultJitter();

// Parses a Retry-After header holding a non-negative number of seconds.
std::optional<double> ParseRetryAfter(const std::optional<std::string>& header);

//==========================================================================================================
// ComputeBackoffDelay
// Purpose: Delay before the retry following a failed attempt (0-based).
// Returns:
//   min(Retry-After, maxDelay) when the failure carries a parseable Retry-After, otherwise
//   jitter(min(maxDelay, baseDelay * 2^attempt)).
//==========================================================================================================
double ComputeBackoffDelay(const OutboundFailure& failure, int attempt, const RetryOptions& opts,
                           const JitterSource& jitter);

// Terminal error for a failure that will not be retried (again).
errors::GatewayError ToTerminalError(const OutboundFailure& failure);

//==========================================================================================================
// RetryWithBackoff
// Purpose: Invokes call() up to maxRetries + 1 times.
// Args:
//   call: Callable returning OutboundResult<T>.
//   opts: Retry bounds and delays.
//   sleeper/jitter: Injectable for deterministic tests.
// Returns:
//   The first successful value. Throws errors::GatewayError classified from the last failure otherwise.
//==========================================================================================================
template <typename Fn>
auto RetryWithBackoff(Fn&& call, const RetryOptions& opts = RetryOptions{},
                      const Sleeper& sleeper = DefaultSleeper(),
                      const JitterSource& jitter = DefaultJitter())
    -> typename std::invoke_result_t<Fn&>::value_type {
    const int maxRetries = opts.maxRetries < 0 ? 0 : opts.maxRetries;
    for (int attempt = 0;; ++attempt) {
        auto result = call();
        if (result.ok()) {
            return std::move(result.value());
        }
        const OutboundFailure& failure = result.failure();
        const bool retryable = failure.kind == FailureKind::RetryableHttp || failure.kind == FailureKind::Connection;
        if (!retryable || attempt >= maxRetries) {
            if (retryable) {
                LOG_WARN("Outbound call failed after {} attempts (status={} detail={})", attempt + 1, failure.status, failure.detail);
            }
            throw ToTerminalError(failure);
        }
        const double delay = ComputeBackoffDelay(failure, attempt, opts, jitter);
        LOG_INFO("Outbound call attempt {} failed (status={} detail={}); retrying in {:.3f}s",
                 attempt + 1, failure.status, failure.detail, delay);
        sleeper(delay);
    }
}

} // namespace mcpgw
