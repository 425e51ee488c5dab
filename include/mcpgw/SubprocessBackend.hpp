//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SubprocessBackend.hpp
// Purpose: IBackend that forwards calls to an external connector process via the ProcessManager
//==========================================================================================================

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "mcpgw/Backend.hpp"
#include "mcpgw/ProcessManager.hpp"

namespace mcpgw {

//==========================================================================================================
// SubprocessBackend
// Purpose: Every Send() goes through ProcessManager::GetOrCreate, so an unhealthy or exited process is
//          replaced on the next access. Each backend holds one lease on its key; Close() (or destruction)
//          releases it and the process stops only when no other backend still holds a lease.
// Notes:
//   The user token is handed to the process environment at spawn time; a new token applies to the next
//   process started for this key.
//==========================================================================================================
class SubprocessBackend : public IBackend {
public:
    SubprocessBackend(ProcessManager& manager, std::string tenantId, std::string connectorId, LaunchSpec spec,
                      std::optional<std::string> userToken = std::nullopt);
    ~SubprocessBackend() override;

    bool Initialize() override;
    std::future<JSONValue> Send(const std::string& method, const std::optional<JSONValue>& params) override;
    void SetUserToken(const std::string& token) override;
    std::optional<std::string> UserToken() const override;
    void SetNotificationSink(BackendNotificationSink sink) override;
    void Close() override;
    BackendKind Kind() const override { return BackendKind::Subprocess; }

    const LaunchSpec& Spec() const { return spec; }

private:
    std::shared_ptr<ProcessConnector> acquire();

    struct SinkSlot {
        std::mutex mutex;
        BackendNotificationSink sink;
    };

    ProcessManager& manager;
    std::string tenantId;
    std::string connectorId;
    LaunchSpec spec;

    mutable std::mutex mutex;
    std::optional<std::string> userToken;
    std::weak_ptr<ProcessConnector> wired;
    bool closed{false};
    std::shared_ptr<SinkSlot> sinkSlot{std::make_shared<SinkSlot>()};
};

} // namespace mcpgw
