//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PoolManager.h
// Purpose: Named registry of server sessions with aggregate tool operations and restart policy
//==========================================================================================================

#pragma once

#include <sys/types.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcppool/Config.h"
#include "mcppool/ServerStateStore.hpp"
#include "mcppool/Session.h"
#include "mcppool/StdioSession.hpp"

namespace mcppool {

//==========================================================================================================
// ServerKind
// Purpose: What the last tools/list revealed about a server.
//==========================================================================================================
enum class ServerKind {
    ToolsProvider,  // listed at least one tool
    NoTools,        // listed successfully, but nothing
    Error,          // listing failed
    Unknown         // never listed, or not running
};

inline const char* ServerKindToString(ServerKind k) {
    switch (k) {
        case ServerKind::ToolsProvider: return "tools_provider";
        case ServerKind::NoTools: return "no_tools";
        case ServerKind::Error: return "error";
        case ServerKind::Unknown: return "unknown";
    }
    return "unknown";
}

//==========================================================================================================
// ServerStatus
// Purpose: Status snapshot of one configured server.
//==========================================================================================================
struct ServerStatus {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool running{false};
    bool enabled{false};            // runtime toggle and not disabled in the configuration
    std::vector<Tool> tools;        // most recently observed tool list
    ServerKind kind{ServerKind::Unknown};
    std::string note;
    uint64_t reconnects{0};
    std::optional<pid_t> pid;
};

//==========================================================================================================
// PoolManager
// Purpose: Loads the configuration, starts one session per enabled server and dispatches tool calls by
//          server name.
// Notes:
//   - All operations are thread-safe; the registry is guarded by a mutex and lifecycle operations
//     (start, stop, restart) are serialized.
//   - CallTool recovers from connection loss with at most one Reconnect() and one retry per call.
//   - Construct one instance at startup and pass it by reference; there is no global instance.
//==========================================================================================================
class PoolManager {
public:
    explicit PoolManager(IServerStateStore& stateStore,
                         SessionOptions options = SessionOptions::FromEnvironment(),
                         std::shared_ptr<ISessionFactory> factory = std::make_shared<StdioSessionFactory>());
    ~PoolManager();

    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    //==========================================================================================================
    // StartAll
    // Purpose: Loads the configuration document and starts, concurrently, every server that is neither
    //          disabled in the configuration nor disabled in the state store. Servers already running keep
    //          their sessions. Failed servers are logged and left out of the registry.
    // Returns:
    //   true when the configuration loaded and at least one server is running afterwards.
    //==========================================================================================================
    bool StartAll(const std::string& configPath);
    bool StartAll(const PoolConfig& config);

    //==========================================================================================================
    // GetAllTools
    // Purpose: Lists tools of every live session. Servers that fail or list nothing are omitted and their
    //          status records why.
    //==========================================================================================================
    std::map<std::string, std::vector<Tool>> GetAllTools();

    //==========================================================================================================
    // CallTool
    // Purpose: Calls tool on server. A session whose process is gone, or a call that loses the connection,
    //          gets exactly one reconnect followed by one retry.
    // Returns:
    //   The tool result, ErrorCode::UnknownServer for names not in the registry, or the terminal failure.
    //==========================================================================================================
    Result<JSONValue> CallTool(const std::string& server, const std::string& tool,
                               const std::optional<JSONValue>& arguments = std::nullopt);

    // Closes every session and empties the registry. Runtime state is left untouched.
    void StopAll();

    //==========================================================================================================
    // StartServer / StopServer / RestartServer
    // Purpose: User-driven lifecycle by name. Start and stop persist the enabled flag; restart does not.
    // Returns:
    //   StartServer: true when the server is running afterwards (already running is a no-op success).
    //   StopServer: always true; stopping a server that is not running is a no-op.
    //   RestartServer: result of the start that follows the stop.
    //==========================================================================================================
    bool StartServer(const std::string& name);
    bool StopServer(const std::string& name);
    bool RestartServer(const std::string& name);

    // Snapshot for every configured server. A running server whose tools were never listed is queried first.
    std::map<std::string, ServerStatus> GetStatus();

    std::vector<std::string> RunningServers() const;
    bool IsRunning(const std::string& name) const;
    std::shared_ptr<ISession> GetSession(const std::string& name) const;
    PoolConfig GetConfig() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcppool
