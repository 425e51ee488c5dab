//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SubprocessBackend.cpp
// Purpose: IBackend over a supervised connector process
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpgw/SubprocessBackend.hpp"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {

using errors::ErrorCategory;
using errors::GatewayError;

SubprocessBackend::SubprocessBackend(ProcessManager& mgr, std::string tenant, std::string connector, LaunchSpec s,
                                     std::optional<std::string> token)
    : manager(mgr), tenantId(std::move(tenant)), connectorId(std::move(connector)), spec(std::move(s)),
      userToken(std::move(token)) {
    manager.Retain(tenantId, connectorId);
}

SubprocessBackend::~SubprocessBackend() {
    Close();
}

std::shared_ptr<ProcessConnector> SubprocessBackend::acquire() {
    std::optional<std::string> token;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            throw GatewayError(ErrorCategory::BackendUnavailable, "Backend closed");
        }
        token = userToken;
    }
    auto connector = manager.GetOrCreate(tenantId, connectorId, spec, token);

    std::lock_guard<std::mutex> lock(mutex);
    if (wired.lock() != connector) {
        // New process (first use or restart): route its notifications to our sink
        std::shared_ptr<SinkSlot> slot = sinkSlot;
        connector->SetNotificationSink([slot](const JSONRPCNotification& note) {
            BackendNotificationSink target;
            {
                std::lock_guard<std::mutex> sinkLock(slot->mutex);
                target = slot->sink;
            }
            if (target) {
                target(note.method, note.params.value_or(JSONValue(JSONValue::Object{})));
            }
        });
        wired = connector;
    }
    return connector;
}

bool SubprocessBackend::Initialize() {
    FUNC_SCOPE();
    try {
        (void)acquire();
        return true;
    } catch (const GatewayError& e) {
        LOG_WARN("SubprocessBackend: {}:{} failed to initialize: {}", tenantId, connectorId, e.what());
        return false;
    }
}

std::future<JSONValue> SubprocessBackend::Send(const std::string& method, const std::optional<JSONValue>& params) {
    try {
        return acquire()->SendRequest(method, params);
    } catch (const GatewayError&) {
        std::promise<JSONValue> failed;
        failed.set_exception(std::current_exception());
        return failed.get_future();
    }
}

void SubprocessBackend::SetUserToken(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex);
    userToken = token;
}

std::optional<std::string> SubprocessBackend::UserToken() const {
    std::lock_guard<std::mutex> lock(mutex);
    return userToken;
}

void SubprocessBackend::SetNotificationSink(BackendNotificationSink sink) {
    std::lock_guard<std::mutex> lock(sinkSlot->mutex);
    sinkSlot->sink = std::move(sink);
}

void SubprocessBackend::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return;
        }
        closed = true;
        wired.reset();
    }
    LOG_DEBUG("SubprocessBackend: releasing {}:{}", tenantId, connectorId);
    manager.Release(tenantId, connectorId);
}

} // namespace mcpgw
