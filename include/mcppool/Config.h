//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server configuration document model, loader and per-session tunables
//==========================================================================================================

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "mcppool/Protocol.h"
#include "mcppool/errors/Errors.h"

namespace mcppool {

//==========================================================================================================
// ServerConfig
// Purpose: One entry of the configuration document; immutable after load.
// Fields:
//   name: Unique key (the entry's key in the "servers" map).
//   command: Executable, resolved through PATH when it contains no '/'.
//   args: Argument list passed after the command.
//   env: Overrides merged on top of the host environment.
//   disabled: Entry is never started when true.
//==========================================================================================================
struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool disabled = false;
};

//==========================================================================================================
// PoolConfig
// Purpose: Whole configuration document, servers ordered by name.
//==========================================================================================================
struct PoolConfig {
    std::map<std::string, ServerConfig> servers;
};

//==========================================================================================================
// ParsePoolConfig
// Purpose: Parses a configuration document.
// Notes:
//   Reads the top-level "servers" map, falling back to "mcpServers". Entries without a non-empty
//   string "command" are skipped with a warning; wrongly typed fields fail the whole document.
// Returns:
//   PoolConfig or ErrorCode::ConfigError.
//==========================================================================================================
Result<PoolConfig> ParsePoolConfig(const std::string& text);

//==========================================================================================================
// LoadPoolConfig
// Purpose: Reads and parses the configuration document at path.
//==========================================================================================================
Result<PoolConfig> LoadPoolConfig(const std::string& path);

//==========================================================================================================
// SessionOptions
// Purpose: Per-session tunables shared by every Session created by a pool.
// Fields:
//   initializeTimeout: Wait for the initialize result (default 30s).
//   listToolsTimeout: Wait for each tools/list attempt (default 10s).
//   callToolTimeout: Wait for tools/call (default 180s).
//   terminateGrace: SIGTERM to SIGKILL grace period on close (default 3s).
//   clientInfo / capabilities / protocolVersion: Declared in the initialize request.
//==========================================================================================================
struct SessionOptions {
    std::chrono::milliseconds initializeTimeout{30000};
    std::chrono::milliseconds listToolsTimeout{10000};
    std::chrono::milliseconds callToolTimeout{180000};
    std::chrono::milliseconds terminateGrace{3000};
    Implementation clientInfo;
    ClientCapabilities capabilities;
    std::string protocolVersion{PROTOCOL_VERSION};

    SessionOptions();

    //==========================================================================================================
    // FromEnvironment
    // Purpose: Defaults overridden by MCPPOOL_INITIALIZE_TIMEOUT_MS, MCPPOOL_LIST_TOOLS_TIMEOUT_MS,
    //          MCPPOOL_CALL_TOOL_TIMEOUT_MS and MCPPOOL_TERMINATE_GRACE_MS.
    //==========================================================================================================
    static SessionOptions FromEnvironment();
};

} // namespace mcppool
