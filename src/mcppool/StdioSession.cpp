//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioSession.cpp
// Purpose: Handshake, tool listing, tool calls and reconnection for one stdio server
//==========================================================================================================

#include <atomic>
#include <mutex>

#include "logging/Logger.h"
#include "mcppool/RequestCorrelator.h"
#include "mcppool/ResponseReader.hpp"
#include "mcppool/ServerProcess.hpp"
#include "mcppool/StdioSession.hpp"

namespace mcppool {

namespace {
// Everything tied to one spawned process; replaced wholesale on reconnect
struct Connection {
    std::shared_ptr<ServerProcess> process;
    std::shared_ptr<RequestCorrelator> correlator;
    std::unique_ptr<ResponseReader> reader;
};

std::string describeExit(const std::optional<int>& code) {
    return code.has_value() ? std::to_string(code.value()) : std::string("unknown");
}
} // namespace

class StdioSession::Impl {
public:
    ServerConfig config;
    SessionOptions options;

    std::mutex lifecycleMutex;      // serializes Start/Initialize/Reconnect/Close
    mutable std::mutex stateMutex;  // guards state, conn, serverInfo
    SessionState state{SessionState::Created};
    std::shared_ptr<Connection> conn;
    std::optional<InitializeResult> initResult;

    std::atomic<uint64_t> requestCounter{0};
    std::atomic<uint64_t> reconnects{0};

    Impl(ServerConfig c, SessionOptions o) : config(std::move(c)), options(std::move(o)) {}

    std::string nextRequestId() { return "req-" + std::to_string(++requestCounter); }

    // Detaches the current connection under the state lock; the caller tears it down outside it.
    std::shared_ptr<Connection> detachConnection(SessionState next) {
        std::lock_guard<std::mutex> lk(stateMutex);
        auto old = std::move(conn);
        conn.reset();
        state = next;
        return old;
    }

    void teardown(const std::shared_ptr<Connection>& c, const Error& reason) {
        if (!c) {
            return;
        }
        c->correlator->Close(reason);
        c->process->Terminate(options.terminateGrace);
        c->reader->Stop();
    }

    //==========================================================================================================
    // Returns the live connection, checking process liveness first. A dead process moves the session to
    // Disconnected.
    //==========================================================================================================
    Result<std::shared_ptr<Connection>> activeConnection(bool requireInitialized) {
        std::lock_guard<std::mutex> lk(stateMutex);
        switch (state) {
            case SessionState::Closed:
                return Error(ErrorCode::Closed, "session '" + config.name + "' is closed");
            case SessionState::Disconnected:
                return Error(ErrorCode::ProcessDied, "session '" + config.name + "' is disconnected");
            case SessionState::Created:
                return Error(ErrorCode::NotInitialized, "session '" + config.name + "' was not started");
            case SessionState::Started:
                if (requireInitialized) {
                    return Error(ErrorCode::NotInitialized, "session '" + config.name + "' is not initialized");
                }
                break;
            case SessionState::Initialized:
                break;
        }
        if (!conn) {
            return Error(ErrorCode::NotInitialized, "session '" + config.name + "' has no process");
        }
        auto exit = conn->process->ExitCode();
        if (exit.has_value()) {
            state = SessionState::Disconnected;
            LOG_WARN("[{}] server process exited (status {}); session disconnected", config.name, exit.value());
            return Error(ErrorCode::ProcessDied,
                         fmt::format("server '{}' exited with status {}", config.name, exit.value()));
        }
        return Result<std::shared_ptr<Connection>>(conn);
    }

    // Marks the session disconnected after a connection loss observed on c.
    void noteConnectionLoss(const std::shared_ptr<Connection>& c, const Error& err) {
        if (!err.IsConnectionLoss()) {
            return;
        }
        std::lock_guard<std::mutex> lk(stateMutex);
        if (conn == c && state == SessionState::Initialized) {
            LOG_WARN("[{}] connection lost ({}); session disconnected", config.name, err.ToString());
            state = SessionState::Disconnected;
        }
    }

    Result<JSONRPCResponse> sendRequest(const std::shared_ptr<Connection>& c, const std::string& method,
                                        std::optional<JSONValue> params, std::chrono::milliseconds timeout) {
        const std::string id = nextRequestId();
        Status reg = c->correlator->Register(id);
        if (!reg) {
            return reg.error();
        }
        JSONRPCRequest request(id, method, std::move(params));
        LOG_DEBUG("[{}] sending {} ({})", config.name, method, id);
        Status written = c->process->WriteLine(request.Serialize());
        if (!written) {
            c->correlator->Abandon(id);
            Error err = written.error();
            // A write failure on a dead child is reported as ProcessDied
            if (!c->process->IsAlive()) {
                err = Error(ErrorCode::ProcessDied, fmt::format("server '{}' exited with status {}", config.name,
                                                                describeExit(c->process->ExitCode())));
            }
            return err;
        }
        return c->correlator->Await(id, timeout);
    }

    // Extracts the result payload, mapping JSON-RPC error responses to ErrorCode::ProtocolError.
    Result<JSONValue> unwrap(Result<JSONRPCResponse> response, const std::string& method) {
        if (!response) {
            return response.error();
        }
        const JSONRPCResponse& resp = response.value();
        if (resp.IsError()) {
            auto decoded = errors::mcpErrorFromResponse(resp);
            if (!decoded.has_value()) {
                return Error(ErrorCode::InvalidResponse, method + ": malformed error object");
            }
            return Error(ErrorCode::ProtocolError,
                         fmt::format("{} failed: {} ({})", method, decoded->message, decoded->code), decoded);
        }
        if (!resp.result.has_value()) {
            return Error(ErrorCode::InvalidResponse, method + ": response has neither result nor error");
        }
        return resp.result.value();
    }

    Status start() {
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            if (state == SessionState::Closed) {
                return Error(ErrorCode::Closed, "session '" + config.name + "' is closed");
            }
            if (conn && (state == SessionState::Started || state == SessionState::Initialized)) {
                return Status::Ok();
            }
        }

        auto spawned = ServerProcess::Spawn(config);
        if (!spawned) {
            return spawned.error();
        }
        auto c = std::make_shared<Connection>();
        c->process = std::shared_ptr<ServerProcess>(std::move(spawned.value()));
        c->correlator = std::make_shared<RequestCorrelator>();
        c->reader = std::make_unique<ResponseReader>(config.name, c->process->StdoutFd(), c->correlator);
        std::weak_ptr<ServerProcess> weakProcess = c->process;
        c->reader->SetReplyWriter([weakProcess](const std::string& line) -> Status {
            if (auto p = weakProcess.lock()) {
                return p->WriteLine(line);
            }
            return Error(ErrorCode::BrokenPipe, "process released");
        });
        if (!c->reader->Start()) {
            c->process->Terminate(options.terminateGrace);
            return Error(ErrorCode::SpawnError, "failed to start response reader for '" + config.name + "'");
        }

        std::lock_guard<std::mutex> lk(stateMutex);
        conn = std::move(c);
        state = SessionState::Started;
        return Status::Ok();
    }

    Result<InitializeResult> initialize() {
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            if (state == SessionState::Initialized && initResult.has_value()) {
                return initResult.value();
            }
        }
        auto active = activeConnection(false);
        if (!active) {
            return active.error();
        }
        auto c = active.value();

        JSONValue::Object paramsObj;
        paramsObj["protocolVersion"] = std::make_shared<JSONValue>(options.protocolVersion);
        paramsObj["capabilities"] = std::make_shared<JSONValue>(SerializeClientCapabilities(options.capabilities));
        JSONValue::Object ci;
        ci["name"] = std::make_shared<JSONValue>(options.clientInfo.name);
        ci["version"] = std::make_shared<JSONValue>(options.clientInfo.version);
        paramsObj["clientInfo"] = std::make_shared<JSONValue>(ci);

        LOG_INFO("[{}] initializing (protocol {})", config.name, options.protocolVersion);
        auto result = unwrap(sendRequest(c, Methods::Initialize, JSONValue{paramsObj}, options.initializeTimeout),
                             Methods::Initialize);
        Result<InitializeResult> outcome = finishInitialize(c, std::move(result));
        if (!outcome) {
            LOG_ERROR("[{}] initialize failed: {}", config.name, outcome.error().ToString());
            teardown(detachConnection(SessionState::Disconnected), outcome.error());
        }
        return outcome;
    }

    Result<InitializeResult> finishInitialize(const std::shared_ptr<Connection>& c, Result<JSONValue> result) {
        if (!result) {
            return result.error();
        }
        const JSONValue& payload = result.value();
        if (!payload.IsObject()) {
            return Error(ErrorCode::InvalidResponse, "initialize result is not an object");
        }
        InitializeResult init;
        if (const JSONValue* pv = payload.Find("protocolVersion"); pv != nullptr && pv->IsString()) {
            init.protocolVersion = std::get<std::string>(pv->value);
        }
        if (const JSONValue* si = payload.Find("serverInfo"); si != nullptr && si->IsObject()) {
            if (const JSONValue* n = si->Find("name"); n != nullptr && n->IsString()) {
                init.serverInfo.name = std::get<std::string>(n->value);
            }
            if (const JSONValue* v = si->Find("version"); v != nullptr && v->IsString()) {
                init.serverInfo.version = std::get<std::string>(v->value);
            }
        }
        if (const JSONValue* caps = payload.Find("capabilities"); caps != nullptr) {
            init.capabilities = *caps;
        }
        if (!init.protocolVersion.empty() && init.protocolVersion != options.protocolVersion) {
            LOG_WARN("[{}] server negotiated protocol {} (requested {})", config.name, init.protocolVersion,
                     options.protocolVersion);
        }

        JSONRPCNotification initialized(Methods::Initialized);
        Status sent = c->process->WriteLine(initialized.Serialize());
        if (!sent) {
            return sent.error();
        }

        std::lock_guard<std::mutex> lk(stateMutex);
        if (conn != c) {
            return Error(ErrorCode::Closed, "session '" + config.name + "' was closed during initialize");
        }
        state = SessionState::Initialized;
        initResult = init;
        LOG_INFO("[{}] initialized (server {} {})", config.name,
                 init.serverInfo.name.empty() ? std::string("<unnamed>") : init.serverInfo.name,
                 init.serverInfo.version);
        return init;
    }

    Result<std::vector<Tool>> listTools() {
        auto active = activeConnection(true);
        if (!active) {
            return active.error();
        }
        auto c = active.value();
        auto result = unwrap(sendRequest(c, Methods::ListTools, std::nullopt, options.listToolsTimeout),
                             Methods::ListTools);
        if (!result && result.error().code == ErrorCode::ProtocolError && result.error().protocol.has_value() &&
            result.error().protocol->code == JSONRPCErrorCodes::InvalidParams) {
            LOG_INFO("[{}] tools/list rejected without params; retrying with {{}}", config.name);
            auto retry = activeConnection(true);
            if (!retry) {
                return retry.error();
            }
            c = retry.value();
            result = unwrap(sendRequest(c, Methods::ListTools, JSONValue{JSONValue::Object{}},
                                        options.listToolsTimeout),
                            Methods::ListTools);
        }
        if (!result) {
            noteConnectionLoss(c, result.error());
            return result.error();
        }

        const JSONValue& payload = result.value();
        if (!payload.IsObject()) {
            return Error(ErrorCode::InvalidResponse, "tools/list result is not an object");
        }
        std::vector<Tool> tools;
        const JSONValue* list = payload.Find("tools");
        if (list == nullptr || list->IsNull()) {
            LOG_INFO("[{}] server provides no tools", config.name);
            return tools;
        }
        if (!list->IsArray()) {
            return Error(ErrorCode::InvalidResponse, "tools/list \"tools\" is not a list");
        }
        for (const auto& item : std::get<JSONValue::Array>(list->value)) {
            auto tool = item ? ParseTool(*item) : std::nullopt;
            if (!tool.has_value()) {
                LOG_WARN("[{}] skipping malformed tool descriptor", config.name);
                continue;
            }
            tools.push_back(std::move(tool.value()));
        }
        LOG_DEBUG("[{}] {} tool(s) listed", config.name, tools.size());
        return tools;
    }

    Result<JSONValue> callTool(const std::string& name, const std::optional<JSONValue>& arguments) {
        auto active = activeConnection(true);
        if (!active) {
            return active.error();
        }
        auto c = active.value();

        JSONValue::Object params;
        params["name"] = std::make_shared<JSONValue>(name);
        params["arguments"] = std::make_shared<JSONValue>(arguments.value_or(JSONValue{JSONValue::Object{}}));

        LOG_INFO("[{}] calling tool '{}'", config.name, name);
        auto result = unwrap(sendRequest(c, Methods::CallTool, JSONValue{params}, options.callToolTimeout),
                             Methods::CallTool);
        if (!result) {
            LOG_WARN("[{}] tool '{}' failed: {}", config.name, name, result.error().ToString());
            noteConnectionLoss(c, result.error());
            return result.error();
        }
        if (const JSONValue* isError = result.value().Find("isError");
            isError != nullptr && std::holds_alternative<bool>(isError->value) && std::get<bool>(isError->value)) {
            LOG_WARN("[{}] tool '{}' reported an error result", config.name, name);
        }
        return result;
    }
};

StdioSession::StdioSession(ServerConfig config, SessionOptions options)
    : pImpl(std::make_unique<Impl>(std::move(config), std::move(options))) {}

StdioSession::~StdioSession() {
    Close();
}

const ServerConfig& StdioSession::Config() const { return pImpl->config; }

Status StdioSession::Start() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    return pImpl->start();
}

Result<InitializeResult> StdioSession::Initialize() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    return pImpl->initialize();
}

Result<std::vector<Tool>> StdioSession::ListTools() {
    FUNC_SCOPE();
    return pImpl->listTools();
}

Result<JSONValue> StdioSession::CallTool(const std::string& name, const std::optional<JSONValue>& arguments) {
    FUNC_SCOPE();
    return pImpl->callTool(name, arguments);
}

Status StdioSession::Reconnect() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    {
        std::lock_guard<std::mutex> slk(pImpl->stateMutex);
        if (pImpl->state == SessionState::Closed) {
            return Error(ErrorCode::Closed, "session '" + pImpl->config.name + "' is closed");
        }
        pImpl->initResult.reset();
    }
    ++pImpl->reconnects;
    LOG_INFO("[{}] reconnecting (attempt {})", pImpl->config.name, pImpl->reconnects.load());
    pImpl->teardown(pImpl->detachConnection(SessionState::Disconnected),
                    Error(ErrorCode::ProcessDied, "session '" + pImpl->config.name + "' is reconnecting"));

    Status started = pImpl->start();
    if (!started) {
        LOG_ERROR("[{}] reconnect failed: {}", pImpl->config.name, started.error().ToString());
        std::lock_guard<std::mutex> slk(pImpl->stateMutex);
        pImpl->state = SessionState::Disconnected;
        return started;
    }
    auto init = pImpl->initialize();
    if (!init) {
        return init.error();
    }
    return Status::Ok();
}

void StdioSession::Close() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    bool wasClosed;
    {
        std::lock_guard<std::mutex> slk(pImpl->stateMutex);
        wasClosed = (pImpl->state == SessionState::Closed);
    }
    auto old = pImpl->detachConnection(SessionState::Closed);
    if (!wasClosed) {
        LOG_INFO("[{}] closing session", pImpl->config.name);
    }
    pImpl->teardown(old, Error(ErrorCode::Closed, "session '" + pImpl->config.name + "' was closed"));
}

SessionState StdioSession::State() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->state;
}

bool StdioSession::IsAlive() {
    return pImpl->activeConnection(true).ok();
}

uint64_t StdioSession::ReconnectCount() const { return pImpl->reconnects.load(); }

std::optional<pid_t> StdioSession::ProcessId() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    if (!pImpl->conn) {
        return std::nullopt;
    }
    return pImpl->conn->process->Pid();
}

std::size_t StdioSession::PendingRequestCount() const {
    std::shared_ptr<Connection> c;
    {
        std::lock_guard<std::mutex> lk(pImpl->stateMutex);
        c = pImpl->conn;
    }
    return c ? c->correlator->PendingCount() : 0;
}

std::unique_ptr<ISession> StdioSessionFactory::CreateSession(const ServerConfig& config,
                                                            const SessionOptions& options) {
    FUNC_SCOPE();
    return std::make_unique<StdioSession>(config, options);
}

} // namespace mcppool
