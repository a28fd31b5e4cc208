//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, result wrappers and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "mcppool/JSONRPCTypes.h"

namespace mcppool {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,
    Unknown
};

// Protocol-level error as carried in a JSON-RPC error response.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<McpError> populated when shape is valid.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    if (!std::holds_alternative<JSONValue::Object>(errVal.value)) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(errVal.value);
    auto itCode = obj.find("code");
    auto itMsg = obj.find("message");
    if (itCode == obj.end() || itMsg == obj.end()) {
        return std::nullopt;
    }
    if (!itCode->second || !itMsg->second) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(itCode->second->value) ||
        !std::holds_alternative<std::string>(itMsg->second->value)) {
        return std::nullopt;
    }
    int code = static_cast<int>(std::get<int64_t>(itCode->second->value));
    std::string message = std::get<std::string>(itMsg->second->value);

    std::optional<JSONValue> data;
    auto itData = obj.find("data");
    if (itData != obj.end() && itData->second) {
        data = *(itData->second);
    }

    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
//
// Args:
//   response: JSONRPCResponse that may contain an error object.
//
// Returns:
//   std::optional<McpError> when response.IsError() and shape is valid.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

} // namespace errors

//==========================================================================================================
// ErrorCode
// Purpose: Failure taxonomy for process, session and pool operations.
//==========================================================================================================
enum class ErrorCode {
    SpawnError,      // child process could not be created
    BrokenPipe,      // write to a closed stdin pipe
    ProtocolError,   // well-formed JSON-RPC error response
    Timeout,         // no response within the operation window
    ProcessDied,     // child exited before or while a request was outstanding
    NotInitialized,  // session has not completed the initialize handshake
    Closed,          // session was closed while the request was pending
    UnknownServer,   // no server with that name is configured or running
    ConfigError,     // configuration document unreadable or malformed
    InvalidResponse  // response arrived but its shape is unusable
};

inline const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SpawnError: return "spawn error";
        case ErrorCode::BrokenPipe: return "broken pipe";
        case ErrorCode::ProtocolError: return "protocol error";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::ProcessDied: return "process died";
        case ErrorCode::NotInitialized: return "not initialized";
        case ErrorCode::Closed: return "closed";
        case ErrorCode::UnknownServer: return "unknown server";
        case ErrorCode::ConfigError: return "config error";
        case ErrorCode::InvalidResponse: return "invalid response";
    }
    return "unknown";
}

//==========================================================================================================
// Error
// Purpose: Failure value returned by every public operation; never thrown.
// Fields:
//   code: Taxonomy entry.
//   message: Human-readable cause for logs.
//   protocol: Decoded JSON-RPC error when code == ProtocolError.
//==========================================================================================================
struct Error {
    ErrorCode code{ErrorCode::ProtocolError};
    std::string message;
    std::optional<errors::McpError> protocol;

    Error() = default;
    Error(ErrorCode c, std::string msg, std::optional<errors::McpError> p = std::nullopt)
        : code(c), message(std::move(msg)), protocol(std::move(p)) {}

    // Connection loss is the only class of failure the pool recovers from.
    bool IsConnectionLoss() const { return code == ErrorCode::ProcessDied || code == ErrorCode::BrokenPipe; }

    std::string ToString() const {
        std::string s = ErrorCodeToString(code);
        if (!message.empty()) {
            s += ": ";
            s += message;
        }
        return s;
    }
};

//==========================================================================================================
// Result
// Purpose: Value-or-Error return type.
//==========================================================================================================
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() {
        if (!ok()) throw std::logic_error("Result::value() on error: " + error().ToString());
        return std::get<T>(data_);
    }
    const T& value() const {
        if (!ok()) throw std::logic_error("Result::value() on error: " + error().ToString());
        return std::get<T>(data_);
    }
    const Error& error() const {
        if (ok()) throw std::logic_error("Result::error() on success");
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    static Result<void> Ok() { return Result<void>(); }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const {
        if (ok()) throw std::logic_error("Result::error() on success");
        return *error_;
    }

private:
    std::optional<Error> error_;
};

using Status = Result<void>;

} // namespace mcppool
