//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcpgw_server entry point: loads configuration and connectors, serves the gateway over HTTP(S)
//==========================================================================================================

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpgw/ConnectorRegistry.hpp"
#include "mcpgw/Gateway.hpp"
#include "mcpgw/GatewayConfig.hpp"
#include "mcpgw/HTTPServer.hpp"
#include "mcpgw/HttpClient.hpp"
#include "mcpgw/NativeBackend.hpp"
#include "mcpgw/errors/Errors.h"
#include "mcpgw/version.h"

using namespace mcpgw;

//==========================================================================================================
// Parses --key=value command-line options.
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static void printUsage() {
    std::cout << "Usage: mcpgw_server [options]\n"
              << "  --config=<k=v;k=v>     configuration overrides (same keys as MCPGW_CONFIG)\n"
              << "  --listen=<host:port>   bind address (default 127.0.0.1:8080)\n"
              << "  --scheme=<http|https>  https requires --cert and --key (TLS 1.3 only)\n"
              << "  --cert=<pem> --key=<pem>\n"
              << "  --connectors=<file>    connector definitions\n"
              << "  --log-level=<level>    DEBUG|INFO|WARN|ERROR (default MCPGW_LOG_LEVEL or INFO)\n"
              << "  --log-file=<path>\n"
              << "  --version\n";
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage();
        return 0;
    }
    if (hasFlag(argc, argv, "--version")) {
        std::cout << "mcpgw " << getVersionString() << std::endl;
        return 0;
    }

    Logger::setLogLevelFromString(getArgValue(argc, argv, "--log-level")
                                      .value_or(GetEnvOrDefault("MCPGW_LOG_LEVEL", "INFO")));
    auto logFile = getArgValue(argc, argv, "--log-file");
    if (!logFile.has_value()) {
        logFile = GetEnvOptional("MCPGW_LOG_FILE");
    }
    if (logFile.has_value()) {
        Logger::setLogFile(*logFile);
    }

    GatewayConfig config = GatewayConfig::FromEnvironment();
    if (auto overrides = getArgValue(argc, argv, "--config")) {
        config.ApplyOverrides(*overrides);
    }
    for (const char* key : {"listen", "scheme", "cert", "key", "connectors"}) {
        if (auto v = getArgValue(argc, argv, std::string("--") + key)) {
            if (!config.Set(key, *v)) {
                LOG_ERROR("Invalid --{} value '{}'", key, *v);
                return 2;
            }
        }
    }

    auto registry = std::make_shared<StaticConnectorRegistry>();
    auto httpClient = std::make_shared<HttpClient>();
    const RetryOptions retry = config.retry;
    const std::optional<std::string> apiBase = config.apiBase;
    registry->RegisterNativeFactory("fetch", [httpClient, retry, apiBase]() -> std::shared_ptr<IBackend> {
        return MakeHttpFetchBackend(httpClient, retry, DefaultSleeper(), apiBase);
    });
    if (!config.connectorsFile.empty()) {
        try {
            std::size_t loaded = registry->LoadFromFile(config.connectorsFile);
            LOG_INFO("Loaded {} connector(s) from {}", loaded, config.connectorsFile);
        } catch (const errors::GatewayError& e) {
            LOG_ERROR("Cannot load connectors: {}", e.what());
            return 1;
        }
    } else {
        LOG_WARN("No connectors file configured; only the built-in echo connector is available");
        registry->RegisterNative(StaticConnectorRegistry::AnyTenant, "echo", "echo");
    }

    Gateway gateway(config, registry);

    HTTPServer::Options httpOpts;
    httpOpts.address = config.listenAddress;
    httpOpts.port = config.listenPort;
    httpOpts.scheme = config.scheme;
    httpOpts.certFile = config.certFile;
    httpOpts.keyFile = config.keyFile;

    std::unique_ptr<HTTPServer> server;
    try {
        server = std::make_unique<HTTPServer>(httpOpts, gateway);
        server->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start HTTP server: {}", e.what());
        return 1;
    }
    LOG_INFO("mcpgw {} serving /api/v1/{{tenant}}/connectors/{{connector}}/mcp on {}://{}:{}", getVersionString(),
             config.scheme, config.listenAddress, server->BoundPort());

    // SIGINT/SIGTERM end the maintenance loop below
    std::mutex stopMutex;
    std::condition_variable stopCv;
    bool stopRequested = false;
    boost::asio::io_context signalIo;
    boost::asio::signal_set signals(signalIo, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}, shutting down", signo);
        }
        std::lock_guard<std::mutex> lock(stopMutex);
        stopRequested = true;
        stopCv.notify_all();
    });
    std::thread signalThread([&signalIo]() { signalIo.run(); });

    const auto maintenanceInterval = std::chrono::seconds(30);
    {
        std::unique_lock<std::mutex> lock(stopMutex);
        while (!stopCv.wait_for(lock, maintenanceInterval, [&] { return stopRequested; })) {
            lock.unlock();
            gateway.RunMaintenance();
            lock.lock();
        }
    }

    server->Stop().get();
    gateway.Shutdown();
    signalIo.stop();
    signalThread.join();
    LOG_INFO("mcpgw stopped");
    return 0;
}
