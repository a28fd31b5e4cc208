//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version reported as the client identity in the initialize handshake.
//==========================================================================================================
#pragma once

#include <string>

#ifndef MCPPOOL_VERSION_MAJOR
#  define MCPPOOL_VERSION_MAJOR 1
#  define MCPPOOL_VERSION_MINOR 0
#  define MCPPOOL_VERSION_PATCH 0
#endif

namespace mcppool {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Version components as configured by the build.
VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string ("MAJOR.MINOR.PATCH"), used as clientInfo.version.
//==========================================================================================================
std::string getVersionString();

} // namespace mcppool
