//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessManager.cpp
// Purpose: Lazy creation, health probing and restart-on-failure for connector processes
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <format>
#include <vector>

#include "logging/Logger.h"
#include "mcpgw/ProcessManager.hpp"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {

using errors::ErrorCategory;
using errors::GatewayError;

namespace {

std::string trimmed(const std::string& s) {
    auto notSpace = [](unsigned char c){ return !std::isspace(c); };
    auto b = std::find_if(s.begin(), s.end(), notSpace);
    auto e = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (b < e) ? std::string(b, e) : std::string();
}

std::string executableName(const std::string& token) {
    std::string t = trimmed(token);
    std::size_t slash = t.rfind('/');
    return (slash == std::string::npos) ? t : t.substr(slash + 1);
}

std::pair<std::string, std::string> splitKey(const std::string& key) {
    std::size_t colon = key.find(':');
    if (colon == std::string::npos) {
        return {key, std::string()};
    }
    return {key.substr(0, colon), key.substr(colon + 1)};
}

} // namespace

const char* processStatusName(ProcessStatus status) {
    switch (status) {
        case ProcessStatus::Running: return "RUNNING";
        case ProcessStatus::Stopped: return "STOPPED";
        case ProcessStatus::Error: return "ERROR";
        case ProcessStatus::Restarting: return "RESTARTING";
    }
    return "STOPPED";
}

ProcessManager::ProcessManager() : ProcessManager(Options{}) {}

ProcessManager::ProcessManager(const Options& o, StatusSink sink, ClockFn clk)
    : opts(o), statusSink(std::move(sink)), clock(std::move(clk)) {
    if (!clock) {
        clock = []() { return Clock::now(); };
    }
}

ProcessManager::~ProcessManager() {
    TerminateAll();
}

LaunchSpec ProcessManager::ResolveLaunchSpec(const std::string& runtimeCommandJson,
                                             const std::optional<std::string>& declaredRuntimeType,
                                             const std::optional<std::string>& packagePath) {
    if (trimmed(runtimeCommandJson).empty()) {
        throw GatewayError(ErrorCategory::InvalidParams, "runtime_command is required for external MCP connectors");
    }
    JSONValue parsed;
    try {
        parsed = ParseJSON(runtimeCommandJson);
    } catch (const std::exception&) {
        throw GatewayError(ErrorCategory::InvalidParams, "Invalid runtime_command JSON: " + runtimeCommandJson);
    }
    if (!parsed.isArray()) {
        throw GatewayError(ErrorCategory::InvalidParams, "runtime_command must be a JSON array of strings");
    }
    LaunchSpec spec;
    for (const auto& item : std::get<JSONValue::Array>(parsed.value)) {
        if (!item || !item->isString()) {
            throw GatewayError(ErrorCategory::InvalidParams, "runtime_command must be a JSON array of strings");
        }
        spec.command.push_back(std::get<std::string>(item->value));
    }
    if (spec.command.empty()) {
        throw GatewayError(ErrorCategory::InvalidParams, "runtime_command is required for external MCP connectors");
    }
    if (trimmed(spec.command.front()).empty()) {
        throw GatewayError(ErrorCategory::InvalidParams, "runtime_command must start with a non-empty executable name");
    }
    spec.runtimeType = InferRuntimeType(spec.command.front(), declaredRuntimeType);
    if (packagePath.has_value() && !trimmed(*packagePath).empty()) {
        spec.workingDir = trimmed(*packagePath);
    }
    return spec;
}

std::string ProcessManager::InferRuntimeType(const std::string& executable, const std::optional<std::string>& declared) {
    std::string name = executableName(executable);
    if (name == "npx" || name == "node") {
        return "external_nodejs";
    }
    if (name == "uvx" || name == "python" || name == "python3" || name == "pip") {
        return "external_python";
    }
    if (declared.has_value() && !declared->empty()) {
        return *declared;
    }
    return "external_custom";
}

std::string ProcessManager::MakeKey(const std::string& tenantId, const std::string& connectorId) {
    return tenantId + ":" + connectorId;
}

std::shared_ptr<std::mutex> ProcessManager::keyMutex(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex);
    auto& m = keyMutexes[key];
    if (!m) {
        m = std::make_shared<std::mutex>();
    }
    return m;
}

std::shared_ptr<ProcessConnector> ProcessManager::GetOrCreate(const std::string& tenantId, const std::string& connectorId,
                                                              const LaunchSpec& spec,
                                                              const std::optional<std::string>& oauthToken) {
    FUNC_SCOPE();
    if (IsShutdown()) {
        throw GatewayError(ErrorCategory::BackendUnavailable, "Process manager is shut down");
    }
    const std::string key = MakeKey(tenantId, connectorId);
    auto km = keyMutex(key);
    std::lock_guard<std::mutex> keyLock(*km);

    std::shared_ptr<ProcessConnector> existing = Find(tenantId, connectorId);
    if (existing) {
        if (IsHealthy(key, *existing)) {
            return existing;
        }
        LOG_WARN("ProcessManager: {} is unhealthy; restarting", key);
        terminateLocked(tenantId, connectorId);
    }
    auto connector = startLocked(tenantId, connectorId, spec, oauthToken);
    ensureHealthLoop();
    return connector;
}

std::shared_ptr<ProcessConnector> ProcessManager::startLocked(const std::string& tenantId, const std::string& connectorId,
                                                              const LaunchSpec& spec,
                                                              const std::optional<std::string>& oauthToken) {
    const std::string key = MakeKey(tenantId, connectorId);
    auto connector = std::make_shared<ProcessConnector>(spec, opts.connector);
    LaunchContext ctx{tenantId, connectorId, oauthToken, opts.apiBase};
    try {
        connector->Start(ctx);
    } catch (const GatewayError& e) {
        LOG_ERROR("ProcessManager: failed to start {}: {}", key, e.what());
        updateStatus(tenantId, connectorId, StatusUpdate{ProcessStatus::Error, std::nullopt, std::string(e.what()),
                                                         std::nullopt, spec.runtimeType});
        throw;
    }
    bool stopped = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopped = shutdown;
        if (!stopped) {
            processes[key] = Managed{connector, spec, oauthToken};
            health[key] = HealthState{};
        }
    }
    if (stopped) {
        // TerminateAll raced with the start; do not leave an orphan process behind
        connector->Stop();
        throw GatewayError(ErrorCategory::BackendUnavailable, "Process manager is shut down");
    }
    LOG_INFO("ProcessManager: {} running (pid={})", key, connector->Pid().value_or(-1));
    updateStatus(tenantId, connectorId, StatusUpdate{ProcessStatus::Running, connector->Pid(), std::nullopt,
                                                     std::nullopt, spec.runtimeType});
    return connector;
}

std::shared_ptr<ProcessConnector> ProcessManager::Find(const std::string& tenantId, const std::string& connectorId) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = processes.find(MakeKey(tenantId, connectorId));
    return (it == processes.end()) ? nullptr : it->second.connector;
}

void ProcessManager::Terminate(const std::string& tenantId, const std::string& connectorId) {
    FUNC_SCOPE();
    const std::string key = MakeKey(tenantId, connectorId);
    {
        auto km = keyMutex(key);
        std::lock_guard<std::mutex> keyLock(*km);
        terminateLocked(tenantId, connectorId);
    }
    forgetKey(key);
}

void ProcessManager::Retain(const std::string& tenantId, const std::string& connectorId) {
    std::lock_guard<std::mutex> lock(mutex);
    ++leases[MakeKey(tenantId, connectorId)];
}

void ProcessManager::Release(const std::string& tenantId, const std::string& connectorId) {
    const std::string key = MakeKey(tenantId, connectorId);
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = leases.find(key);
        if (it == leases.end()) {
            return;
        }
        if (--it->second > 0) {
            return;
        }
    }
    {
        auto km = keyMutex(key);
        std::lock_guard<std::mutex> keyLock(*km);
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = leases.find(key);
            if (it != leases.end()) {
                if (it->second > 0) {
                    return;
                }
                leases.erase(it);
            }
        }
        LOG_DEBUG("ProcessManager: last lease on {} released", key);
        terminateLocked(tenantId, connectorId);
    }
    forgetKey(key);
}

int ProcessManager::Leases(const std::string& tenantId, const std::string& connectorId) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = leases.find(MakeKey(tenantId, connectorId));
    return (it == leases.end()) ? 0 : it->second;
}

// Drops bookkeeping for a key with no running process. The lock entry goes only when nobody else holds it.
void ProcessManager::forgetKey(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex);
    if (processes.count(key) != 0) {
        return;
    }
    statuses.erase(key);
    health.erase(key);
    auto it = keyMutexes.find(key);
    if (it != keyMutexes.end() && it->second.use_count() == 1) {
        keyMutexes.erase(it);
    }
}

void ProcessManager::terminateLocked(const std::string& tenantId, const std::string& connectorId) {
    const std::string key = MakeKey(tenantId, connectorId);
    std::shared_ptr<ProcessConnector> connector;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = processes.find(key);
        if (it == processes.end()) {
            return;
        }
        connector = it->second.connector;
        processes.erase(it);
        health.erase(key);
    }
    connector->Stop();
    LOG_INFO("ProcessManager: {} terminated", key);
    updateStatus(tenantId, connectorId, StatusUpdate{ProcessStatus::Stopped, std::nullopt, std::nullopt,
                                                     std::nullopt, std::nullopt});
}

void ProcessManager::TerminateAll() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(mutex);
        shutdown = true;
    }
    {
        std::lock_guard<std::mutex> lock(loopMutex);
        loopCv.notify_all();
    }
    if (loopThread.joinable()) {
        loopThread.join();
    }
    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& [key, managed] : processes) {
            keys.push_back(key);
        }
    }
    for (const auto& key : keys) {
        auto [tenantId, connectorId] = splitKey(key);
        Terminate(tenantId, connectorId);
    }
}

bool ProcessManager::healthCall(IHealthTarget& target) {
    try {
        (void)target.Call("resources/list", std::nullopt);
        return true;
    } catch (const GatewayError& e) {
        LOG_DEBUG("ProcessManager: resources/list health call failed ({}); trying tools/list", e.what());
    }
    try {
        (void)target.Call("tools/list", std::nullopt);
        return true;
    } catch (const GatewayError& e) {
        LOG_DEBUG("ProcessManager: tools/list health call failed: {}", e.what());
    }
    return false;
}

bool ProcessManager::IsHealthy(const std::string& key, IHealthTarget& target) {
    if (target.HasExited()) {
        LOG_WARN("ProcessManager: {} has exited", key);
        return false;
    }
    const auto now = clock();
    {
        std::lock_guard<std::mutex> lock(mutex);
        HealthState& state = health[key];
        if (state.lastHealthCall.has_value() && now - *state.lastHealthCall < opts.healthCallInterval) {
            return state.consecutiveFailures < opts.failureThreshold;
        }
        state.lastHealthCall = now;
    }
    const bool ok = healthCall(target);
    std::lock_guard<std::mutex> lock(mutex);
    HealthState& state = health[key];
    if (ok) {
        state.consecutiveFailures = 0;
    } else {
        ++state.consecutiveFailures;
        LOG_WARN("ProcessManager: {} health call failed ({} consecutive)", key, state.consecutiveFailures);
    }
    return state.consecutiveFailures < opts.failureThreshold;
}

void ProcessManager::RunHealthCheckOnce() {
    FUNC_SCOPE();
    std::vector<std::pair<std::string, std::shared_ptr<ProcessConnector>>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& [key, managed] : processes) {
            snapshot.emplace_back(key, managed.connector);
        }
    }
    for (const auto& [key, connector] : snapshot) {
        if (IsShutdown()) {
            return;
        }
        auto [tenantId, connectorId] = splitKey(key);
        if (IsHealthy(key, *connector)) {
            updateStatus(tenantId, connectorId, StatusUpdate{ProcessStatus::Running, connector->Pid(), std::nullopt,
                                                             std::nullopt, std::nullopt});
            continue;
        }

        auto km = keyMutex(key);
        std::lock_guard<std::mutex> keyLock(*km);
        std::optional<Managed> managed;
        int restartCount = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = processes.find(key);
            // Replaced or removed by another caller while we were probing
            if (it == processes.end() || it->second.connector != connector) {
                continue;
            }
            managed = it->second;
            auto st = statuses.find(key);
            restartCount = (st == statuses.end()) ? 0 : st->second.restartCount;
        }

        if (restartCount >= opts.maxRestarts) {
            LOG_ERROR("ProcessManager: {} reached the restart limit ({})", key, opts.maxRestarts);
            updateStatus(tenantId, connectorId, StatusUpdate{ProcessStatus::Error, std::nullopt,
                                                             std::format("Max restart limit reached ({})", opts.maxRestarts),
                                                             std::nullopt, std::nullopt});
            terminateLocked(tenantId, connectorId);
            continue;
        }

        terminateLocked(tenantId, connectorId);
        updateStatus(tenantId, connectorId, StatusUpdate{ProcessStatus::Restarting, std::nullopt, std::nullopt,
                                                         restartCount + 1, std::nullopt});
        try {
            (void)startLocked(tenantId, connectorId, managed->spec, managed->oauthToken);
        } catch (const GatewayError& e) {
            updateStatus(tenantId, connectorId, StatusUpdate{ProcessStatus::Error, std::nullopt,
                                                             std::string("Restart failed: ") + e.what(),
                                                             restartCount + 1, std::nullopt});
            terminateLocked(tenantId, connectorId);
        }
    }
}

void ProcessManager::ensureHealthLoop() {
    if (opts.checkInterval.count() <= 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(loopMutex);
    if (loopThread.joinable() || IsShutdown()) {
        return;
    }
    loopThread = std::thread([this]() { healthLoop(); });
}

void ProcessManager::healthLoop() {
    LOG_DEBUG("ProcessManager: health loop started (interval={}ms)", opts.checkInterval.count());
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(loopMutex);
            loopCv.wait_for(lock, opts.checkInterval, [this]() { return IsShutdown(); });
        }
        if (IsShutdown()) {
            break;
        }
        try {
            RunHealthCheckOnce();
        } catch (const std::exception& e) {
            LOG_ERROR("ProcessManager: error in health check loop: {}", e.what());
        }
    }
    LOG_DEBUG("ProcessManager: health loop stopped");
}

void ProcessManager::updateStatus(const std::string& tenantId, const std::string& connectorId,
                                  const StatusUpdate& update) {
    ProcessStatusRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex);
        const std::string key = MakeKey(tenantId, connectorId);
        auto [it, inserted] = statuses.try_emplace(key);
        ProcessStatusRecord& rec = it->second;
        if (inserted) {
            rec.tenantId = tenantId;
            rec.connectorId = connectorId;
        }
        rec.status = update.status;
        if (update.pid.has_value()) {
            rec.pid = update.pid;
        }
        if (update.errorMessage.has_value()) {
            rec.errorMessage = update.errorMessage;
        }
        if (update.restartCount.has_value()) {
            rec.restartCount = *update.restartCount;
        }
        if (update.runtimeType.has_value()) {
            rec.runtimeType = *update.runtimeType;
        }
        if (update.status == ProcessStatus::Running) {
            rec.lastHealthCheck = std::chrono::system_clock::now();
        }
        snapshot = rec;
    }
    LOG_DEBUG("ProcessManager: status {}:{} -> {}", tenantId, connectorId, processStatusName(update.status));
    if (statusSink) {
        statusSink(snapshot);
    }
}

std::size_t ProcessManager::Count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return processes.size();
}

bool ProcessManager::IsShutdown() const {
    std::lock_guard<std::mutex> lock(mutex);
    return shutdown;
}

std::optional<ProcessStatusRecord> ProcessManager::LastStatus(const std::string& tenantId,
                                                              const std::string& connectorId) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = statuses.find(MakeKey(tenantId, connectorId));
    if (it == statuses.end()) {
        return std::nullopt;
    }
    return it->second;
}

int ProcessManager::ConsecutiveFailures(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = health.find(key);
    return (it == health.end()) ? 0 : it->second.consecutiveFailures;
}

} // namespace mcpgw
