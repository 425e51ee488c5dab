//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceUri.hpp
// Purpose: Structured resource URI and its conversion to the plain string form sent on the wire
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {

struct ResourceUri {
    std::string scheme;
    std::string host;
    std::optional<int> port;
    std::string path;
    std::optional<std::string> query;
    std::optional<std::string> fragment;

    std::string ToString() const;

    // Object form {"scheme","host","port","path","query","fragment"} as produced by in-process backends.
    JSONValue ToValue() const;

    // Accepts "scheme://host[:port]/path[?query][#fragment]" and "scheme:opaque". Returns nullopt
    // when no scheme is present.
    static std::optional<ResourceUri> Parse(const std::string& text);

    // Reads the object form. Requires a string "scheme"; other members are optional.
    static std::optional<ResourceUri> FromValue(const JSONValue& value);
};

bool operator==(const ResourceUri& a, const ResourceUri& b);

//==========================================================================================================
// FlattenResourceUris
// Purpose: Replaces every structured URI object found under a "uri" key with its string form. Walks
//          objects and arrays recursively so nested content lists are covered as well.
//==========================================================================================================
JSONValue FlattenResourceUris(const JSONValue& value);

} // namespace mcpgw
