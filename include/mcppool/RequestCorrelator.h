//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.h
// Purpose: Thread-safe request id to response mapping with bounded, notify-based waits
//==========================================================================================================

#pragma once

#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "mcppool/JSONRPCTypes.h"
#include "mcppool/errors/Errors.h"

namespace mcppool {

//==========================================================================================================
// RequestCorrelator
// Purpose: Holds one promise per outstanding request. The reader deposits responses; callers wait on the
//          matching future. An entry lives until Await() collects its outcome or gives up on it.
// Notes:
//   - Register() must precede the write of the request so an immediate response is never lost.
//   - A response for an unknown (never registered, timed out or already answered) id is discarded.
//==========================================================================================================
class RequestCorrelator {
public:
    RequestCorrelator() = default;
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    //==========================================================================================================
    // Register
    // Purpose: Creates the pending slot for id.
    // Returns:
    //   ErrorCode::InvalidResponse when id is already outstanding, ErrorCode::Closed after Close().
    //==========================================================================================================
    Status Register(const std::string& id);

    //==========================================================================================================
    // Deposit
    // Purpose: Delivers a response to the waiter registered under id.
    // Returns:
    //   true when a waiter received it, false when it was discarded.
    //==========================================================================================================
    bool Deposit(const std::string& id, JSONRPCResponse response);

    //==========================================================================================================
    // Await
    // Purpose: Blocks until the response for id arrives, the timeout elapses or the correlator is closed.
    // Returns:
    //   The response (which may itself carry a JSON-RPC error), ErrorCode::Timeout with the entry pruned,
    //   or the error passed to Close().
    //==========================================================================================================
    Result<JSONRPCResponse> Await(const std::string& id, std::chrono::milliseconds timeout);

    // Removes a pending entry without waiting (used when the request could not be sent).
    void Abandon(const std::string& id);

    // Fails every unanswered request with reason and rejects further registrations.
    void Close(const Error& reason);

    // Requests still waiting for an answer.
    std::size_t PendingCount() const;
    bool IsPending(const std::string& id) const;
    bool IsClosed() const;

private:
    using Outcome = Result<JSONRPCResponse>;

    struct Pending {
        std::promise<Outcome> promise;
        std::shared_future<Outcome> future;
        std::chrono::steady_clock::time_point created;
        bool settled{false};
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Pending> pending_;
    std::optional<Error> closedReason_;
};

} // namespace mcppool
