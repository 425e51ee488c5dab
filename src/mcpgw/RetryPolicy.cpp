//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RetryPolicy.cpp
// Purpose: Status classification, backoff arithmetic and terminal error mapping
//==========================================================================================================

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cctype>
#include <format>
#include <mutex>
#include <random>
#include <thread>

#include "mcpgw/RetryPolicy.hpp"

namespace mcpgw {

using errors::ErrorCategory;
using errors::GatewayError;

FailureKind ClassifyStatus(int status) {
    switch (status) {
        case 429: case 500: case 502: case 503: case 504:
            return FailureKind::RetryableHttp;
        case 401: case 403:
            return FailureKind::Auth;
        case 404:
            return FailureKind::NotFound;
        default:
            return FailureKind::OtherHttp;
    }
}

OutboundFailure OutboundFailure::FromStatus(int status, std::string body, std::optional<std::string> retryAfter) {
    OutboundFailure f;
    f.kind = ClassifyStatus(status);
    f.status = status;
    f.body = std::move(body);
    f.retryAfter = std::move(retryAfter);
    f.detail = std::format("HTTP {}", status);
    return f;
}

OutboundFailure OutboundFailure::ConnectionFailure(std::string detail) {
    OutboundFailure f;
    f.kind = FailureKind::Connection;
    f.detail = std::move(detail);
    return f;
}

Sleeper DefaultSleeper() {
    return [](double seconds) {
        if (seconds > 0.0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
        }
    };
}

JitterSource DefaultJitter() {
    return [](double upper) {
        static std::mutex mtx;
        static std::mt19937_64 gen{std::random_device{}()};
        if (upper <= 0.0) {
            return 0.0;
        }
        std::lock_guard<std::mutex> lock(mtx);
        std::uniform_real_distribution<double> dist(0.0, upper);
        return dist(gen);
    };
}

std::optional<double> ParseRetryAfter(const std::optional<std::string>& header) {
    if (!header.has_value()) {
        return std::nullopt;
    }
    std::string v = *header;
    v.erase(0, v.find_first_not_of(" \t"));
    v.erase(v.find_last_not_of(" \t") + 1);
    if (v.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        double seconds = std::stod(v, &used);
        if (used != v.size() || !std::isfinite(seconds) || seconds < 0.0) {
            return std::nullopt;
        }
        return seconds;
    } catch (const std::logic_error&) {
        // HTTP-date and other non-numeric forms fall back to jittered backoff
        return std::nullopt;
    }
}

double ComputeBackoffDelay(const OutboundFailure& failure, int attempt, const RetryOptions& opts,
                           const JitterSource& jitter) {
    if (auto ra = ParseRetryAfter(failure.retryAfter)) {
        return std::min(*ra, opts.maxDelaySeconds);
    }
    const double exponential = opts.baseDelaySeconds * std::pow(2.0, static_cast<double>(attempt));
    return jitter(std::min(opts.maxDelaySeconds, exponential));
}

GatewayError ToTerminalError(const OutboundFailure& failure) {
    switch (failure.kind) {
        case FailureKind::Auth: {
            GatewayError e(ErrorCategory::AuthenticationFailure, std::format("Authentication failed (HTTP {})", failure.status));
            e.statusCode = failure.status;
            return e;
        }
        case FailureKind::NotFound: {
            GatewayError e(ErrorCategory::NotFound, "Resource not found (HTTP 404)");
            e.statusCode = failure.status;
            return e;
        }
        case FailureKind::Connection: {
            return GatewayError(ErrorCategory::UpstreamTimeout, std::format("Upstream unreachable: {}", failure.detail));
        }
        case FailureKind::RetryableHttp:
            if (failure.status == 429) {
                GatewayError e(ErrorCategory::RateLimited, "Upstream rate limit exceeded");
                e.statusCode = failure.status;
                e.retryAfter = ParseRetryAfter(failure.retryAfter);
                return e;
            }
            [[fallthrough]];
        case FailureKind::OtherHttp:
            break;
    }
    GatewayError e(ErrorCategory::UpstreamAPIError, std::format("Upstream API error (HTTP {})", failure.status));
    e.statusCode = failure.status;
    e.responseBody = errors::bodyExcerpt(failure.body);
    return e;
}

} // namespace mcpgw
