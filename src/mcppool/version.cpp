//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers backed by the build-time version macros.
//==========================================================================================================
#include "mcppool/version.h"

#include <fmt/format.h>

namespace mcppool {

VersionInfo getVersion() {
    return VersionInfo{MCPPOOL_VERSION_MAJOR, MCPPOOL_VERSION_MINOR, MCPPOOL_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace mcppool
