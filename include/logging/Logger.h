//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logger with runtime level filtering, UTC timestamps, optional log file and colored
//          labels. Subprocess stderr is re-logged through logAt at a level chosen per line.
//==========================================================================================================
#pragma once

#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <errno.h>
#include <format>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include "env/EnvVars.h"

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL
};

class Logger {
public:
    enum class Level {
        DEBUG = 0,
        INFO  = 1,
        WARN  = 2,
        ERROR = 3
    };

    // Case-insensitive. Unknown strings map to INFO.
    static Level levelFromString(const std::string& lvl) {
        std::string s;
        s.reserve(lvl.size());
        for (char c : lvl) {
            s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
        }
        if (s == "DEBUG" || s == "TRACE") return Level::DEBUG;
        if (s == "WARN" || s == "WARNING") return Level::WARN;
        if (s == "ERROR" || s == "CRITICAL" || s == "FATAL") return Level::ERROR;
        return Level::INFO;
    }

    static LogLevel toLogLevel(Level level) {
        switch (level) {
            case Level::DEBUG: return LogLevel::LOG_DEBUG_LEVEL;
            case Level::INFO:  return LogLevel::LOG_INFO_LEVEL;
            case Level::WARN:  return LogLevel::LOG_WARN_LEVEL;
            case Level::ERROR: return LogLevel::LOG_ERROR_LEVEL;
        }
        return LogLevel::LOG_INFO_LEVEL;
    }

    static const char* levelLabel(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO";
            case Level::WARN:  return "WARN";
            case Level::ERROR: return "ERROR";
        }
        return "INFO";
    }

    // Variadic logging using C++20 std::vformat with runtime format strings
    template <typename... Args>
    static void logf(const char* level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            buffer = std::format("Format error: {}", e.what());
        }
        log(level, buffer, file, line);
    }

    // Emits a pre-formatted message at a dynamic level.
    static void logAt(Level level, const std::string& msg, const char* file, unsigned int line) {
        if (sLogLevel <= toLogLevel(level)) {
            log(levelLabel(level), msg, file, line);
        }
    }

    static void setLogLevel(LogLevel level) {
        sLogLevel = level;
    }

    static void setLogLevelFromString(const std::string& lvl) {
        sLogLevel = toLogLevel(levelFromString(lvl));
    }

    static void setLogFile(const std::string& filePath) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        if (sLogFile.is_open()) {
            sLogFile.close();
        }
        sLogFile.open(filePath, std::ios::out | std::ios::app);
        if (!sLogFile.is_open()) {
            std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
            return;
        }
        sLogFile << "\n=== Log opened at " << timestamp() << " ===\n";
        sLogFile.flush();
    }

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line) {
        // MCPGW_LOG_COLOR=0 disables ANSI label colors; MCPGW_LOG_STDERR=1 moves output to stderr
        static const bool colorEnabled = envFlag("MCPGW_LOG_COLOR", true);
        static const bool useStderr = envFlag("MCPGW_LOG_STDERR", false);

        std::string label = level;
        if (colorEnabled) {
            const char* color = (::strncmp(level, "ERROR", 5) == 0) ? "\033[38;5;88m"
                              : (::strncmp(level, "WARN", 4) == 0)  ? "\033[33m"
                                                                     : "\033[35m";
            label = std::format("{}{}\033[0m", color, level);
        }
        const std::string stamp = timestamp();
        const std::string consoleLine = std::format("{} [{}] {}:{}: {}\n", stamp, label, baseName(file), line, msg);

        std::lock_guard<std::mutex> lock(sLogMutex);
        (useStderr ? std::cerr : std::cout) << consoleLine << std::flush;
        if (sLogFile.is_open()) {
            sLogFile << std::format("{} [{}] {}:{}: {}\n", stamp, level, baseName(file), line, msg);
            sLogFile.flush();
        }
    }

    static LogLevel sLogLevel;

private:
    static bool envFlag(const char* name, bool defaultValue) {
        auto v = GetEnvOptional(name);
        if (!v.has_value()) {
            return defaultValue;
        }
        return *v == "1" || *v == "true" || *v == "TRUE" || *v == "yes";
    }

    static const char* baseName(const char* path) {
        const char* slash = std::strrchr(path, '/');
        return slash ? slash + 1 : path;
    }

    // UTC, millisecond precision
    static std::string timestamp() {
        const auto now = std::chrono::system_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm buf{};
        ::gmtime_r(&t, &buf);
        char text[32];
        std::strftime(text, sizeof(text), "%Y-%m-%dT%H:%M:%S", &buf);
        return std::format("{}.{:03}Z", text, ms);
    }

    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

// Definitions of the static members are in Logger.cpp

#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)

// Scope-based entry/exit tracing, compiled in only for _DEBUG builds
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
