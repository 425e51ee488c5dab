//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessManager.hpp
// Purpose: Supervises external connector processes keyed by (tenant, connector)
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include "mcpgw/ProcessConnector.hpp"

namespace mcpgw {

enum class ProcessStatus {
    Running,
    Stopped,
    Error,
    Restarting
};

const char* processStatusName(ProcessStatus status);

//==========================================================================================================
// ProcessStatusRecord
// Purpose: Observable runtime status of one connector process, handed to the StatusSink after every
//          state transition. Storage is the sink's concern.
//==========================================================================================================
struct ProcessStatusRecord {
    std::string tenantId;
    std::string connectorId;
    ProcessStatus status{ProcessStatus::Stopped};
    std::optional<int> pid;
    std::string runtimeType;
    int restartCount{0};
    std::optional<std::chrono::system_clock::time_point> lastHealthCheck;
    std::optional<std::string> errorMessage;
};

using StatusSink = std::function<void(const ProcessStatusRecord&)>;

class ProcessManager {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    struct Options {
        std::chrono::milliseconds healthCallInterval{std::chrono::seconds(30)};
        int failureThreshold{3};
        // Zero disables the background health loop (RunHealthCheckOnce still works).
        std::chrono::milliseconds checkInterval{std::chrono::seconds(30)};
        int maxRestarts{3};
        ProcessConnector::Options connector;
        std::optional<std::string> apiBase;
    };

    ProcessManager();
    explicit ProcessManager(const Options& opts, StatusSink sink = nullptr, ClockFn clock = nullptr);
    ~ProcessManager();

    ProcessManager(const ProcessManager&) = delete;
    ProcessManager& operator=(const ProcessManager&) = delete;

    //======================================================================================================
    // ResolveLaunchSpec
    // Purpose: Builds a LaunchSpec from a connector's stored runtime command (JSON array of strings).
    // Args:
    //   runtimeCommandJson: e.g. ["npx","@modelcontextprotocol/server-everything"]
    //   declaredRuntimeType: Runtime type recorded on the connector, if any
    //   packagePath: Working directory; blank values mean "none"
    // Throws:
    //   errors::GatewayError (InvalidParams) when the command is missing, not a string array, or has a
    //   blank executable.
    //======================================================================================================
    static LaunchSpec ResolveLaunchSpec(const std::string& runtimeCommandJson,
                                        const std::optional<std::string>& declaredRuntimeType,
                                        const std::optional<std::string>& packagePath);

    // npx|node -> external_nodejs, uvx|python|python3|pip -> external_python, else declared or external_custom.
    static std::string InferRuntimeType(const std::string& executable, const std::optional<std::string>& declared);

    static std::string MakeKey(const std::string& tenantId, const std::string& connectorId);

    //======================================================================================================
    // GetOrCreate
    // Purpose: Returns the running connector for the key when it is healthy; otherwise terminates it and
    //          starts a fresh process. Starts the background health loop on first use.
    // Throws:
    //   errors::GatewayError (BackendUnavailable) when the manager is shut down or the process fails to
    //   start. The failure is reported to the StatusSink as ERROR first.
    //======================================================================================================
    std::shared_ptr<ProcessConnector> GetOrCreate(const std::string& tenantId, const std::string& connectorId,
                                                  const LaunchSpec& spec,
                                                  const std::optional<std::string>& oauthToken = std::nullopt);

    std::shared_ptr<ProcessConnector> Find(const std::string& tenantId, const std::string& connectorId) const;

    // Stops the key's process regardless of outstanding leases and drops its status and lock entries.
    void Terminate(const std::string& tenantId, const std::string& connectorId);

    //======================================================================================================
    // Retain / Release
    // Purpose: Per-key use count shared by every backend talking to the same process. Release terminates
    //          the process only when the count drops to zero; a Retain that lands before the termination
    //          takes the key lock keeps the process alive.
    //======================================================================================================
    void Retain(const std::string& tenantId, const std::string& connectorId);
    void Release(const std::string& tenantId, const std::string& connectorId);
    int Leases(const std::string& tenantId, const std::string& connectorId) const;

    // Stops the health loop and every process. Later GetOrCreate calls fail.
    void TerminateAll();

    //======================================================================================================
    // IsHealthy
    // Purpose: Exit detection first, then a rate-limited health call (resources/list, falling back to
    //          tools/list). Unhealthy once consecutive health call failures reach failureThreshold.
    //======================================================================================================
    bool IsHealthy(const std::string& key, IHealthTarget& target);

    // One pass of the health loop: restarts unhealthy processes up to maxRestarts.
    void RunHealthCheckOnce();

    std::size_t Count() const;
    bool IsShutdown() const;
    std::optional<ProcessStatusRecord> LastStatus(const std::string& tenantId, const std::string& connectorId) const;
    int ConsecutiveFailures(const std::string& key) const;

private:
    struct Managed {
        std::shared_ptr<ProcessConnector> connector;
        LaunchSpec spec;
        std::optional<std::string> oauthToken;
    };

    struct HealthState {
        std::optional<Clock::time_point> lastHealthCall;
        int consecutiveFailures{0};
    };

    std::shared_ptr<std::mutex> keyMutex(const std::string& key);
    std::shared_ptr<ProcessConnector> startLocked(const std::string& tenantId, const std::string& connectorId,
                                                  const LaunchSpec& spec, const std::optional<std::string>& oauthToken);
    void terminateLocked(const std::string& tenantId, const std::string& connectorId);
    void forgetKey(const std::string& key);
    bool healthCall(IHealthTarget& target);
    void ensureHealthLoop();
    void healthLoop();

    struct StatusUpdate {
        ProcessStatus status;
        std::optional<int> pid;
        std::optional<std::string> errorMessage;
        std::optional<int> restartCount;
        std::optional<std::string> runtimeType;
    };
    void updateStatus(const std::string& tenantId, const std::string& connectorId, const StatusUpdate& update);

    Options opts;
    StatusSink statusSink;
    ClockFn clock;

    mutable std::mutex mutex;
    std::unordered_map<std::string, Managed> processes;
    std::unordered_map<std::string, HealthState> health;
    std::unordered_map<std::string, ProcessStatusRecord> statuses;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> keyMutexes;
    std::unordered_map<std::string, int> leases;
    bool shutdown{false};

    std::mutex loopMutex;
    std::condition_variable loopCv;
    std::thread loopThread;
};

} // namespace mcpgw
