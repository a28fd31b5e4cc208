//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseReader.hpp
// Purpose: Background worker turning a child's stdout into correlated JSON-RPC responses
//==========================================================================================================
#pragma once

#include <functional>
#include <memory>
#include <string>

#include "mcppool/RequestCorrelator.h"
#include "mcppool/errors/Errors.h"

namespace mcppool {

//==========================================================================================================
// ResponseReader
// Purpose: Reads newline-delimited messages from a non-blocking descriptor on its own thread.
// Notes:
//   - Lines that are not JSON are logged at DEBUG and dropped.
//   - Responses are deposited into the correlator; server-initiated requests are answered through the
//     reply writer (ping gets an empty result, anything else -32601); notifications are logged.
//   - When the stream reaches EOF the correlator is closed with ErrorCode::ProcessDied; Stop() leaves
//     the correlator open.
//==========================================================================================================
class ResponseReader {
public:
    using ReplyWriter = std::function<Status(const std::string&)>;

    ResponseReader(std::string name, int fd, std::shared_ptr<RequestCorrelator> correlator);
    ~ResponseReader();

    ResponseReader(const ResponseReader&) = delete;
    ResponseReader& operator=(const ResponseReader&) = delete;

    // Must be set before Start().
    void SetReplyWriter(ReplyWriter writer);

    //==========================================================================================================
    // Starts the reader thread.
    // Returns:
    //   false when the wake descriptor could not be created or the reader already ran.
    //==========================================================================================================
    bool Start();

    //==========================================================================================================
    // Stops and joins the reader thread. Idempotent.
    //==========================================================================================================
    void Stop();

    bool IsRunning() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct ResponseReaderTestHooks;
};

struct ResponseReaderTestHooks {
    // Consumes every complete line in buffer, leaving a trailing partial line in place.
    static void drainLines(ResponseReader& r, std::string& buffer);
};

} // namespace mcppool
