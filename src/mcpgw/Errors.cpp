//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: GatewayError construction and JSON-RPC error mapping
//==========================================================================================================

#include "mcpgw/errors/Errors.h"

namespace mcpgw {
namespace errors {

namespace {
constexpr std::size_t BodyExcerptLength = 500;
}

GatewayError::GatewayError(ErrorCategory category, const std::string& message)
    : std::runtime_error(message), category_(category), rpcCode_(rpcCodeForCategory(category)) {}

GatewayError::GatewayError(ErrorCategory category, int rpcCode, const std::string& message,
                           std::optional<JSONValue> dataValue)
    : std::runtime_error(message), data(std::move(dataValue)), category_(category), rpcCode_(rpcCode) {}

int rpcCodeForCategory(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::InvalidMessage: return JSONRPCErrorCodes::InvalidRequest;
        case ErrorCategory::UnsupportedProtocolVersion: return JSONRPCErrorCodes::InvalidParams;
        case ErrorCategory::InvalidParams: return JSONRPCErrorCodes::InvalidParams;
        case ErrorCategory::MethodNotFound: return JSONRPCErrorCodes::MethodNotFound;
        case ErrorCategory::BackendUnavailable: return JSONRPCErrorCodes::BackendUnavailable;
        case ErrorCategory::SessionExpired: return JSONRPCErrorCodes::SessionExpired;
        case ErrorCategory::AuthenticationFailure:
        case ErrorCategory::NotFound:
        case ErrorCategory::RateLimited:
        case ErrorCategory::UpstreamAPIError:
        case ErrorCategory::UpstreamTimeout:
        case ErrorCategory::Internal:
            return JSONRPCErrorCodes::InternalError;
    }
    return JSONRPCErrorCodes::InternalError;
}

ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::InvalidMessage;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::InvalidMessage;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::MethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::InvalidParams;
        case JSONRPCErrorCodes::SessionExpired: return ErrorCategory::SessionExpired;
        case JSONRPCErrorCodes::BackendUnavailable: return ErrorCategory::BackendUnavailable;
        default: return ErrorCategory::Internal;
    }
}

std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetIntField(errVal, "code");
    auto message = GetStringField(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(*code);
    e.message = *message;
    if (const JSONValue* d = FindField(errVal, "data")) {
        e.data = *d;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

JSONValue makeErrorValue(const GatewayError& err) {
    if (err.category() == ErrorCategory::BackendUnavailable) {
        return CreateErrorObject(err.rpcCode(), "Backend unavailable");
    }
    return CreateErrorObject(err.rpcCode(), err.what(), err.data);
}

std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const GatewayError& err) {
    auto resp = std::make_unique<JSONRPCResponse>();
    resp->id = id;
    resp->error = makeErrorValue(err);
    return resp;
}

std::string bodyExcerpt(const std::string& body) {
    return body.size() > BodyExcerptLength ? body.substr(0, BodyExcerptLength) : body;
}

} // namespace errors
} // namespace mcpgw
