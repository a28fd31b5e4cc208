//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioSession.hpp
// Purpose: Session speaking newline-delimited JSON-RPC over a spawned child's stdio
//==========================================================================================================
#pragma once

#include <memory>

#include "mcppool/Session.h"

namespace mcppool {

//==========================================================================================================
// StdioSession
// Purpose: Composes ServerProcess, ResponseReader and RequestCorrelator for one configured server.
// Notes:
//   - Request ids are "req-<n>" from a counter that is never reset, so ids stay unique across reconnects.
//   - Calls may be issued concurrently; their lines are written whole and responses are matched by id.
//==========================================================================================================
class StdioSession : public ISession {
public:
    StdioSession(ServerConfig config, SessionOptions options);
    ~StdioSession() override;

    StdioSession(const StdioSession&) = delete;
    StdioSession& operator=(const StdioSession&) = delete;

    /////////////////////////////////////////// ISession ///////////////////////////////////////////
    const ServerConfig& Config() const override;
    Status Start() override;
    Result<InitializeResult> Initialize() override;
    Result<std::vector<Tool>> ListTools() override;
    Result<JSONValue> CallTool(const std::string& name,
                               const std::optional<JSONValue>& arguments = std::nullopt) override;
    Status Reconnect() override;
    void Close() override;
    SessionState State() const override;
    bool IsAlive() override;
    uint64_t ReconnectCount() const override;
    std::optional<pid_t> ProcessId() const override;

    // Requests currently awaiting a response on the live connection.
    std::size_t PendingRequestCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StdioSessionFactory
// Purpose: Default factory used by the pool.
//==========================================================================================================
class StdioSessionFactory : public ISessionFactory {
public:
    std::unique_ptr<ISession> CreateSession(const ServerConfig& config, const SessionOptions& options) override;
};

} // namespace mcppool
