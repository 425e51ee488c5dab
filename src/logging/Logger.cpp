//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger static state. The initial level honors MCPGW_LOG_LEVEL so libraries and tests that never
//          call setLogLevel still filter.
//==========================================================================================================

#include "logging/Logger.h"

LogLevel Logger::sLogLevel = Logger::toLogLevel(Logger::levelFromString(GetEnvOrDefault("MCPGW_LOG_LEVEL", "INFO")));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
