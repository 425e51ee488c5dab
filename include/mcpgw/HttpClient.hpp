//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpClient.hpp
// Purpose: Outbound HTTP/HTTPS client (Boost.Beast, TLS 1.3 only for HTTPS) returning classified results
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "mcpgw/RetryPolicy.hpp"

namespace mcpgw {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequestSpec {
    std::string method{"GET"};
    std::string url;           // http[s]://host[:port]/path?query
    HeaderList headers;
    std::string body;
};

struct HttpReply {
    int status{0};
    HeaderList headers;
    std::string body;

    // Case-insensitive header lookup.
    std::optional<std::string> Header(const std::string& name) const;
};

//==========================================================================================================
// HttpClient
// Purpose: Performs one request per Execute call on a private io_context.
//          2xx/3xx replies are successes; other statuses become OutboundFailure::FromStatus (carrying the
//          Retry-After header); resolve/connect/read errors and timeouts become Connection failures.
//==========================================================================================================
class HttpClient {
public:
    struct Options {
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{30000};
        std::string caFile;            // optional trust bundle for https
        std::string userAgent{"mcpgw"};
    };

    HttpClient();
    explicit HttpClient(const Options& opts);
    ~HttpClient();

    OutboundResult<HttpReply> Execute(const HttpRequestSpec& request);

    // True when both URLs share scheme, host (case-insensitive) and effective port.
    static bool SameOrigin(const std::string& a, const std::string& b);

    //======================================================================================================
    // ExecuteWithRetry
    // Purpose: Execute wrapped in RetryWithBackoff.
    // Returns:
    //   Successful reply. Throws errors::GatewayError on terminal failure.
    //======================================================================================================
    HttpReply ExecuteWithRetry(const HttpRequestSpec& request, const RetryOptions& retry = RetryOptions{},
                               const Sleeper& sleeper = DefaultSleeper());

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpgw
