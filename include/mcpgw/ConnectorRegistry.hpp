//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectorRegistry.hpp
// Purpose: Resolves (tenant, connector) to a native backend factory or an external launch spec
//==========================================================================================================

#pragma once

#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "mcpgw/Backend.hpp"
#include "mcpgw/ProcessConnector.hpp"

namespace mcpgw {

using NativeBackendFactory = std::function<std::shared_ptr<IBackend>()>;

struct ConnectorDefinition {
    std::string tenantId;
    std::string connectorId;
    BackendKind kind{BackendKind::Native};
    // Native connectors
    std::string nativeName;
    NativeBackendFactory nativeFactory;
    // External connectors
    LaunchSpec launch;
};

class IConnectorRegistry {
public:
    virtual ~IConnectorRegistry() = default;
    virtual std::optional<ConnectorDefinition> Resolve(const std::string& tenantId,
                                                       const std::string& connectorId) const = 0;
};

//==========================================================================================================
// StaticConnectorRegistry
// Purpose: In-memory registry. Entries registered for tenant "*" match any tenant that has no entry of
//          its own for the connector.
// File format (LoadFromStream/LoadFromFile), one connector per line, '#' starts a comment:
//   <tenant> <connector> native:<name>
//   <tenant> <connector> ["cmd","arg",...] [working-dir]
//==========================================================================================================
class StaticConnectorRegistry : public IConnectorRegistry {
public:
    static constexpr const char* AnyTenant = "*";

    StaticConnectorRegistry();

    // Names usable as native:<name> in registry files. "echo" is registered by default.
    void RegisterNativeFactory(const std::string& name, NativeBackendFactory factory);

    void RegisterNative(const std::string& tenantId, const std::string& connectorId, const std::string& name);
    void RegisterNative(const std::string& tenantId, const std::string& connectorId, const std::string& name,
                        NativeBackendFactory factory);
    void RegisterExternal(const std::string& tenantId, const std::string& connectorId, LaunchSpec spec);

    std::optional<ConnectorDefinition> Resolve(const std::string& tenantId,
                                               const std::string& connectorId) const override;

    //======================================================================================================
    // LoadFromStream
    // Purpose: Adds entries from registry text. Malformed lines are logged and skipped.
    // Returns:
    //   Number of entries added.
    //======================================================================================================
    std::size_t LoadFromStream(std::istream& in);

    // Throws errors::GatewayError (NotFound) when the file cannot be opened.
    std::size_t LoadFromFile(const std::string& path);

    std::size_t Size() const;

private:
    mutable std::mutex mutex;
    std::map<std::string, NativeBackendFactory> nativeFactories;
    std::map<std::pair<std::string, std::string>, ConnectorDefinition> entries;
};

} // namespace mcpgw
