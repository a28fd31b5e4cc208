//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerProcess.hpp
// Purpose: Spawned child process owning the stdio pipes of one tool-provider server
//==========================================================================================================
#pragma once

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "mcppool/Config.h"
#include "mcppool/errors/Errors.h"

namespace mcppool {

//==========================================================================================================
// ServerProcess
// Purpose: Owns one child process started from a ServerConfig, the write end of its stdin, the read end
//          of its stdout and a worker that drains its stderr into the log.
// Notes:
//   - Concurrent WriteLine calls are serialized; a line is never interleaved with another.
//   - The stdout descriptor is non-blocking and meant to be consumed by exactly one ResponseReader.
//   - Terminate() is idempotent and also runs from the destructor.
//==========================================================================================================
class ServerProcess {
public:
    ~ServerProcess();

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    //==========================================================================================================
    // Spawn
    // Purpose: Starts config.command with config.args and the host environment merged with config.env.
    // Returns:
    //   The running process, or ErrorCode::SpawnError when the pipes, fork or exec failed.
    //==========================================================================================================
    static Result<std::unique_ptr<ServerProcess>> Spawn(const ServerConfig& config);

    //==========================================================================================================
    // WriteLine
    // Purpose: Writes one message followed by '\n' to the child's stdin.
    // Returns:
    //   ErrorCode::BrokenPipe when stdin is closed or the child stopped reading.
    //==========================================================================================================
    Status WriteLine(const std::string& line);

    // Exit status once the child has exited (128 + signal number when killed by a signal).
    std::optional<int> ExitCode();

    bool IsAlive() { return !ExitCode().has_value(); }

    pid_t Pid() const;
    int StdoutFd() const;
    const std::string& Name() const;

    // Closes the write end of the child's stdin; further writes fail with BrokenPipe.
    void CloseStdin();

    //==========================================================================================================
    // Terminate
    // Purpose: Closes stdin, sends SIGTERM, waits up to grace for the child to exit, then sends SIGKILL and
    //          reaps it. Stops the stderr drain worker.
    //==========================================================================================================
    void Terminate(std::chrono::milliseconds grace);

private:
    ServerProcess();

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcppool
