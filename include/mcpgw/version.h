//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the mcpgw gateway runtime (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcpgw {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns "MAJOR.MINOR.PATCH"; reported as serverInfo.version and clientInfo.version.
//==========================================================================================================
std::string getVersionString();

// Name reported as clientInfo.name to subprocess backends.
constexpr const char* kClientName = "mcpgw";

} // namespace mcpgw
