//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the mcpstdio server library (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcpstdio {

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

// "MAJOR.MINOR.PATCH"; also the default serverInfo.version.
std::string getVersionString();

} // namespace mcpstdio
