//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceUri.cpp
// Purpose: Structured resource URI parsing and flattening
//==========================================================================================================

#include <cctype>
#include <memory>

#include "mcpgw/ResourceUri.hpp"

namespace mcpgw {

std::string ResourceUri::ToString() const {
    std::string out = scheme + ":";
    bool hierarchical = !host.empty() || path.empty() || path.front() == '/';
    if (hierarchical) {
        out += "//";
        out += host;
        if (port.has_value()) {
            out += ":" + std::to_string(*port);
        }
    }
    out += path;
    if (query.has_value()) {
        out += "?" + *query;
    }
    if (fragment.has_value()) {
        out += "#" + *fragment;
    }
    return out;
}

JSONValue ResourceUri::ToValue() const {
    JSONValue::Object o;
    SetField(o, "scheme", JSONValue(scheme));
    SetField(o, "host", JSONValue(host));
    SetField(o, "port", port.has_value() ? JSONValue(static_cast<int64_t>(*port)) : JSONValue(nullptr));
    SetField(o, "path", JSONValue(path));
    SetField(o, "query", query.has_value() ? JSONValue(*query) : JSONValue(nullptr));
    SetField(o, "fragment", fragment.has_value() ? JSONValue(*fragment) : JSONValue(nullptr));
    return JSONValue(o);
}

std::optional<ResourceUri> ResourceUri::Parse(const std::string& text) {
    std::size_t colon = text.find(':');
    if (colon == std::string::npos || colon == 0) {
        return std::nullopt;
    }
    ResourceUri uri;
    uri.scheme = text.substr(0, colon);
    for (unsigned char c : uri.scheme) {
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return std::nullopt;
        }
    }
    std::string rest = text.substr(colon + 1);

    std::size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        uri.fragment = rest.substr(hash + 1);
        rest.erase(hash);
    }
    std::size_t qmark = rest.find('?');
    if (qmark != std::string::npos) {
        uri.query = rest.substr(qmark + 1);
        rest.erase(qmark);
    }

    if (rest.rfind("//", 0) == 0) {
        rest.erase(0, 2);
        std::size_t slash = rest.find('/');
        std::string authority = (slash == std::string::npos) ? rest : rest.substr(0, slash);
        uri.path = (slash == std::string::npos) ? std::string() : rest.substr(slash);
        std::size_t portSep = authority.rfind(':');
        if (portSep != std::string::npos && authority.find(']') == std::string::npos) {
            std::string portText = authority.substr(portSep + 1);
            bool digits = !portText.empty();
            for (unsigned char c : portText) {
                digits = digits && std::isdigit(c);
            }
            if (digits && portText.size() <= 5) {
                uri.port = std::stoi(portText);
                authority.erase(portSep);
            }
        }
        uri.host = authority;
    } else {
        uri.path = rest;
    }
    return uri;
}

std::optional<ResourceUri> ResourceUri::FromValue(const JSONValue& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }
    auto scheme = GetStringField(value, "scheme");
    if (!scheme.has_value() || scheme->empty()) {
        return std::nullopt;
    }
    ResourceUri uri;
    uri.scheme = *scheme;
    uri.host = GetStringField(value, "host").value_or("");
    uri.path = GetStringField(value, "path").value_or("");
    if (auto port = GetIntField(value, "port")) {
        uri.port = static_cast<int>(*port);
    }
    uri.query = GetStringField(value, "query");
    uri.fragment = GetStringField(value, "fragment");
    return uri;
}

bool operator==(const ResourceUri& a, const ResourceUri& b) {
    return a.scheme == b.scheme && a.host == b.host && a.port == b.port && a.path == b.path &&
           a.query == b.query && a.fragment == b.fragment;
}

namespace {

JSONValue flatten(const JSONValue& value, bool underUriKey) {
    if (underUriKey) {
        if (auto uri = ResourceUri::FromValue(value)) {
            return JSONValue(uri->ToString());
        }
    }
    if (const auto* obj = std::get_if<JSONValue::Object>(&value.value)) {
        JSONValue::Object out;
        for (const auto& [key, member] : *obj) {
            out[key] = std::make_shared<JSONValue>(member ? flatten(*member, key == "uri") : JSONValue(nullptr));
        }
        return JSONValue(out);
    }
    if (const auto* arr = std::get_if<JSONValue::Array>(&value.value)) {
        JSONValue::Array out;
        out.reserve(arr->size());
        for (const auto& item : *arr) {
            out.push_back(std::make_shared<JSONValue>(item ? flatten(*item, false) : JSONValue(nullptr)));
        }
        return JSONValue(out);
    }
    return value;
}

} // namespace

JSONValue FlattenResourceUris(const JSONValue& value) {
    return flatten(value, false);
}

} // namespace mcpgw
