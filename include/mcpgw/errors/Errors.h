//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Gateway error taxonomy, typed exception and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {
namespace errors {

// Classification of every failure the runtime surfaces to a caller.
enum class ErrorCategory {
    InvalidMessage,
    UnsupportedProtocolVersion,
    BackendUnavailable,
    AuthenticationFailure,
    NotFound,
    RateLimited,
    UpstreamAPIError,
    UpstreamTimeout,
    SessionExpired,
    MethodNotFound,
    InvalidParams,
    Internal
};

inline const char* categoryName(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::InvalidMessage: return "InvalidMessage";
        case ErrorCategory::UnsupportedProtocolVersion: return "UnsupportedProtocolVersion";
        case ErrorCategory::BackendUnavailable: return "BackendUnavailable";
        case ErrorCategory::AuthenticationFailure: return "AuthenticationFailure";
        case ErrorCategory::NotFound: return "NotFound";
        case ErrorCategory::RateLimited: return "RateLimited";
        case ErrorCategory::UpstreamAPIError: return "UpstreamAPIError";
        case ErrorCategory::UpstreamTimeout: return "UpstreamTimeout";
        case ErrorCategory::SessionExpired: return "SessionExpired";
        case ErrorCategory::MethodNotFound: return "MethodNotFound";
        case ErrorCategory::InvalidParams: return "InvalidParams";
        case ErrorCategory::Internal: return "Internal";
    }
    return "Internal";
}

//==========================================================================================================
// GatewayError
// Purpose: Typed exception thrown by synchronous operations and stored into futures by asynchronous ones.
// Fields:
//   category: Taxonomy bucket used by callers to decide how to react.
//   rpcCode: JSON-RPC error code to report (defaults from category; overridden for backend-supplied errors).
//   statusCode: HTTP status of the failing outbound call, when there was one.
//   retryAfter: Seconds advertised by an upstream Retry-After header (RateLimited only).
//   responseBody: First 500 bytes of the upstream response body (UpstreamAPIError only).
//   data: Optional structured error payload forwarded from a backend.
//==========================================================================================================
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorCategory category, const std::string& message);
    GatewayError(ErrorCategory category, int rpcCode, const std::string& message,
                 std::optional<JSONValue> data = std::nullopt);

    ErrorCategory category() const { return category_; }
    int rpcCode() const { return rpcCode_; }

    std::optional<int> statusCode;
    std::optional<double> retryAfter;
    std::optional<std::string> responseBody;
    std::optional<JSONValue> data;

private:
    ErrorCategory category_;
    int rpcCode_;
};

// Default JSON-RPC code for a category.
int rpcCodeForCategory(ErrorCategory category);

// Map a JSON-RPC numeric error code to the closest ErrorCategory.
ErrorCategory errorCategoryFromCode(int code);

// Typed view of a JSON-RPC error object { code, message, data? }.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Internal};
};

// Convert a JSON-RPC error object to McpError. Returns std::nullopt when the shape is invalid.
std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal);

// Error object for a GatewayError. BackendUnavailable never leaks its message to clients.
JSONValue makeErrorValue(const GatewayError& err);

// Convenience: Create a JSONRPCResponse error from a GatewayError and id.
std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const GatewayError& err);

// Truncates a response body to the excerpt length carried by UpstreamAPIError.
std::string bodyExcerpt(const std::string& body);

} // namespace errors
} // namespace mcpgw
