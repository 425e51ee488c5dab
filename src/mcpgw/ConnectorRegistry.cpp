//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectorRegistry.cpp
// Purpose: Static connector registry and its text loader
//==========================================================================================================

#include <cctype>
#include <fstream>
#include <sstream>

#include "logging/Logger.h"
#include "mcpgw/ConnectorRegistry.hpp"
#include "mcpgw/NativeBackend.hpp"
#include "mcpgw/ProcessManager.hpp"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {

using errors::ErrorCategory;
using errors::GatewayError;

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    std::size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Index one past the ']' closing the array that starts at text[0], honoring JSON strings.
std::optional<std::size_t> arrayEnd(const std::string& text) {
    int depth = 0;
    bool inString = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (inString) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }
        if (c == '"') {
            inString = true;
        } else if (c == '[') {
            ++depth;
        } else if (c == ']') {
            if (--depth == 0) {
                return i + 1;
            }
        }
    }
    return std::nullopt;
}

} // namespace

StaticConnectorRegistry::StaticConnectorRegistry() {
    nativeFactories["echo"] = []() -> std::shared_ptr<IBackend> { return MakeEchoBackend(); };
}

void StaticConnectorRegistry::RegisterNativeFactory(const std::string& name, NativeBackendFactory factory) {
    std::lock_guard<std::mutex> lock(mutex);
    nativeFactories[name] = std::move(factory);
}

void StaticConnectorRegistry::RegisterNative(const std::string& tenantId, const std::string& connectorId,
                                             const std::string& name) {
    NativeBackendFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = nativeFactories.find(name);
        if (it == nativeFactories.end()) {
            throw GatewayError(ErrorCategory::NotFound, "Unknown native connector: " + name);
        }
        factory = it->second;
    }
    RegisterNative(tenantId, connectorId, name, std::move(factory));
}

void StaticConnectorRegistry::RegisterNative(const std::string& tenantId, const std::string& connectorId,
                                             const std::string& name, NativeBackendFactory factory) {
    ConnectorDefinition def;
    def.tenantId = tenantId;
    def.connectorId = connectorId;
    def.kind = BackendKind::Native;
    def.nativeName = name;
    def.nativeFactory = std::move(factory);
    std::lock_guard<std::mutex> lock(mutex);
    entries[{tenantId, connectorId}] = std::move(def);
}

void StaticConnectorRegistry::RegisterExternal(const std::string& tenantId, const std::string& connectorId,
                                               LaunchSpec spec) {
    ConnectorDefinition def;
    def.tenantId = tenantId;
    def.connectorId = connectorId;
    def.kind = BackendKind::Subprocess;
    def.launch = std::move(spec);
    std::lock_guard<std::mutex> lock(mutex);
    entries[{tenantId, connectorId}] = std::move(def);
}

std::optional<ConnectorDefinition> StaticConnectorRegistry::Resolve(const std::string& tenantId,
                                                                    const std::string& connectorId) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find({tenantId, connectorId});
    if (it == entries.end()) {
        it = entries.find({AnyTenant, connectorId});
    }
    if (it == entries.end()) {
        return std::nullopt;
    }
    ConnectorDefinition def = it->second;
    def.tenantId = tenantId;
    return def;
}

std::size_t StaticConnectorRegistry::LoadFromStream(std::istream& in) {
    FUNC_SCOPE();
    std::size_t added = 0;
    std::size_t lineNo = 0;
    std::string raw;
    while (std::getline(in, raw)) {
        ++lineNo;
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        std::istringstream ls(line);
        std::string tenant;
        std::string connector;
        if (!(ls >> tenant >> connector)) {
            LOG_WARN("ConnectorRegistry: line {}: expected '<tenant> <connector> <definition>'", lineNo);
            continue;
        }
        std::string rest;
        std::getline(ls, rest);
        rest = trim(rest);
        try {
            if (rest.rfind("native:", 0) == 0) {
                RegisterNative(tenant, connector, trim(rest.substr(7)));
            } else if (!rest.empty() && rest[0] == '[') {
                auto end = arrayEnd(rest);
                if (!end.has_value()) {
                    LOG_WARN("ConnectorRegistry: line {}: unterminated runtime command", lineNo);
                    continue;
                }
                std::optional<std::string> cwd;
                std::string tail = trim(rest.substr(*end));
                if (!tail.empty()) {
                    cwd = tail;
                }
                RegisterExternal(tenant, connector,
                                 ProcessManager::ResolveLaunchSpec(rest.substr(0, *end), std::nullopt, cwd));
            } else {
                LOG_WARN("ConnectorRegistry: line {}: unrecognized definition '{}'", lineNo, rest);
                continue;
            }
            ++added;
        } catch (const GatewayError& e) {
            LOG_WARN("ConnectorRegistry: line {}: {}", lineNo, e.what());
        }
    }
    LOG_INFO("ConnectorRegistry: loaded {} connector(s)", added);
    return added;
}

std::size_t StaticConnectorRegistry::LoadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw GatewayError(ErrorCategory::NotFound, "Cannot open connector registry file: " + path);
    }
    return LoadFromStream(in);
}

std::size_t StaticConnectorRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}

} // namespace mcpgw
