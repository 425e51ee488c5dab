//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessConnector.hpp
// Purpose: Owns one external backend process speaking JSON-RPC over its stdin/stdout
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "logging/Logger.h"
#include "mcpgw/ContentFramer.h"
#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {

//==========================================================================================================
// LaunchSpec
// Purpose: Resolved launch command for an external connector.
// Fields:
//   command: argv, first element is the executable (looked up on PATH when it has no '/')
//   runtimeType: external_nodejs | external_python | external_custom | declared type
//   workingDir: Optional working directory for the child
//   env: Extra environment entries (connector runtime env)
//   configuration: Connector configuration, exported as CONFIG_<KEY>
//==========================================================================================================
struct LaunchSpec {
    std::vector<std::string> command;
    std::string runtimeType{"external_custom"};
    std::optional<std::string> workingDir;
    std::map<std::string, std::string> env;
    std::map<std::string, std::string> configuration;
};

struct LaunchContext {
    std::string tenantId;
    std::string connectorId;
    std::optional<std::string> oauthToken;
    std::optional<std::string> apiBase;
};

//==========================================================================================================
// IHealthTarget
// Purpose: What the process health check needs from a connector.
//==========================================================================================================
class IHealthTarget {
public:
    virtual ~IHealthTarget() = default;

    // True once the process has exited (non-null return code).
    virtual bool HasExited() = 0;

    // Issues a protocol call and waits for its result. Throws errors::GatewayError on failure.
    virtual JSONValue Call(const std::string& method, const std::optional<JSONValue>& params) = 0;
};

// Maps one stderr line of a backend process to the severity it is re-logged at.
Logger::Level ClassifyStderrLine(const std::string& line);

class ProcessConnector : public IHealthTarget {
public:
    struct Options {
        std::chrono::milliseconds requestTimeout{30000};
        std::chrono::milliseconds handshakeTimeout{10000};
        std::chrono::milliseconds startupGrace{200};
        std::chrono::milliseconds stopTimeout{5000};
        std::size_t maxFrameBytes{1024 * 1024};
    };

    using NotificationSink = std::function<void(const JSONRPCNotification&)>;

    static constexpr std::size_t StderrRingSize = 50;
    static constexpr std::size_t StderrTailLines = 20;

    explicit ProcessConnector(LaunchSpec spec);
    ProcessConnector(LaunchSpec spec, const Options& opts);
    ~ProcessConnector() override;

    ProcessConnector(const ProcessConnector&) = delete;
    ProcessConnector& operator=(const ProcessConnector&) = delete;

    //======================================================================================================
    // Start
    // Purpose: Spawns the process, verifies it survives the startup grace period, and performs the
    //          initialize handshake (JSON lines first, then Content-Length framing).
    // Throws:
    //   errors::GatewayError (BackendUnavailable) on spawn, startup or handshake failure. The process is
    //   stopped before the error is thrown.
    //======================================================================================================
    void Start(const LaunchContext& ctx);

    //======================================================================================================
    // Stop
    // Purpose: Closes stdin, sends SIGTERM, waits up to stopTimeout, then SIGKILLs and reaps the process.
    //          Every pending request is failed with "Process terminated".
    //======================================================================================================
    void Stop();

    bool IsRunning();
    bool IsInitialized() const;
    std::optional<int> Pid() const;
    std::optional<int> ExitCode();
    FramingMode Framing() const;
    std::size_t PendingCount() const;
    const LaunchSpec& Spec() const;
    const LaunchContext& Context() const;

    // Last lines captured from stderr (at most StderrRingSize are retained).
    std::vector<std::string> StderrTail(std::size_t lines = StderrTailLines) const;

    //======================================================================================================
    // SendRequest
    // Purpose: Writes a request with a fresh decimal string id and tracks it until its response arrives,
    //          its deadline passes or the process goes away.
    // Returns:
    //   Future with the response's result. Errors (backend JSON-RPC errors, timeouts, termination) are
    //   delivered as errors::GatewayError through the future.
    //======================================================================================================
    std::future<JSONValue> SendRequest(const std::string& method, const std::optional<JSONValue>& params,
                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Fire-and-forget notification. Throws errors::GatewayError when the process is not writable.
    void SendNotification(const std::string& method, const std::optional<JSONValue>& params = std::nullopt);

    void SetNotificationSink(NotificationSink sink);

    // IHealthTarget
    bool HasExited() override;
    JSONValue Call(const std::string& method, const std::optional<JSONValue>& params) override;

    JSONValue ListTools();
    JSONValue CallTool(const std::string& name, const JSONValue& arguments);
    JSONValue ListResources();
    JSONValue ReadResource(const std::string& uri);

    // Inserts the auto-confirm flag for npx-style launchers.
    static std::vector<std::string> BuildArgv(const std::vector<std::string>& command);

    //======================================================================================================
    // BuildEnvironment
    // Purpose: Child environment: base, then spec.env, then the injected tenant/connector/token entries
    //          and CONFIG_<KEY> values. uvx launchers get a scratch HOME/XDG_CACHE_HOME/UV_CACHE_DIR when
    //          the base HOME is missing or not writable.
    //======================================================================================================
    static std::map<std::string, std::string> BuildEnvironment(const LaunchSpec& spec, const LaunchContext& ctx,
                                                               const std::map<std::string, std::string>& base);

    // Current process environment as a map.
    static std::map<std::string, std::string> CurrentEnvironment();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpgw
