//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: Per-server client session interface and factory
//==========================================================================================================

#pragma once

#include <sys/types.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcppool/Config.h"
#include "mcppool/Protocol.h"
#include "mcppool/errors/Errors.h"

namespace mcppool {

//==========================================================================================================
// SessionState
// Purpose: Created -> Started -> Initialized <-> Disconnected; Closed is terminal and reachable from any
//          state. Initialized -> Disconnected happens when a liveness check before a send finds the
//          process gone; Disconnected -> Initialized only through a successful Reconnect().
//==========================================================================================================
enum class SessionState {
    Created,
    Started,
    Initialized,
    Disconnected,
    Closed
};

inline const char* SessionStateToString(SessionState s) {
    switch (s) {
        case SessionState::Created: return "created";
        case SessionState::Started: return "started";
        case SessionState::Initialized: return "initialized";
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

//==========================================================================================================
// ISession
// Purpose: Client of one tool-provider server. Every operation reports failure through its return value;
//          none throws.
//==========================================================================================================
class ISession {
public:
    virtual ~ISession() = default;

    virtual const ServerConfig& Config() const = 0;

    //==========================================================================================================
    // Start
    // Purpose: Spawns the server process and its response reader. No-op when already started.
    //==========================================================================================================
    virtual Status Start() = 0;

    //==========================================================================================================
    // Initialize
    // Purpose: Performs the initialize handshake and sends notifications/initialized.
    // Notes:
    //   A failed handshake terminates the process and leaves the session Disconnected.
    //==========================================================================================================
    virtual Result<InitializeResult> Initialize() = 0;

    //==========================================================================================================
    // ListTools
    // Purpose: tools/list without params; retried once with {} when the server answers -32602.
    // Returns:
    //   The advertised tools; empty when the result has no "tools" field.
    //==========================================================================================================
    virtual Result<std::vector<Tool>> ListTools() = 0;

    //==========================================================================================================
    // CallTool
    // Purpose: tools/call with { name, arguments }; absent arguments are sent as {}.
    // Returns:
    //   The result payload of the response.
    //==========================================================================================================
    virtual Result<JSONValue> CallTool(const std::string& name,
                                       const std::optional<JSONValue>& arguments = std::nullopt) = 0;

    //==========================================================================================================
    // Reconnect
    // Purpose: Terminates any current process, then Start() and Initialize() again.
    //==========================================================================================================
    virtual Status Reconnect() = 0;

    //==========================================================================================================
    // Close
    // Purpose: Fails outstanding requests, terminates the process and stops the reader. Idempotent.
    //==========================================================================================================
    virtual void Close() = 0;

    virtual SessionState State() const = 0;

    // Initialized and the process is still running; a dead process moves the session to Disconnected.
    virtual bool IsAlive() = 0;

    virtual uint64_t ReconnectCount() const = 0;
    virtual std::optional<pid_t> ProcessId() const = 0;
};

//==========================================================================================================
// ISessionFactory
// Purpose: Creates sessions for the pool; replaced in tests.
//==========================================================================================================
class ISessionFactory {
public:
    virtual ~ISessionFactory() = default;
    virtual std::unique_ptr<ISession> CreateSession(const ServerConfig& config, const SessionOptions& options) = 0;
};

} // namespace mcppool
