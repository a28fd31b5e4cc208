//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PoolManager.cpp
// Purpose: Server registry, aggregate tool listing, tool dispatch with reconnect, status snapshots
//==========================================================================================================

#include <future>
#include <mutex>

#include "logging/Logger.h"
#include "mcppool/PoolManager.h"

namespace mcppool {

namespace {
constexpr const char* kNoteToolsNormal = "provides tools normally";
constexpr const char* kNoteNoTools = "provides no tools";
constexpr const char* kNoteListError = "error querying tools";
constexpr const char* kNoteRunning = "running";
constexpr const char* kNoteStopped = "stopped";

struct Entry {
    std::shared_ptr<ISession> session;
    std::shared_ptr<std::mutex> recoveryMutex = std::make_shared<std::mutex>();
};

struct ToolObservation {
    std::vector<Tool> tools;
    ServerKind kind{ServerKind::Unknown};
    std::string note;
};
} // namespace

class PoolManager::Impl {
public:
    IServerStateStore& stateStore;
    SessionOptions options;
    std::shared_ptr<ISessionFactory> factory;

    std::mutex lifecycleMutex;         // serializes StartAll/StopAll/Start/Stop/Restart
    mutable std::mutex registryMutex;  // guards config, registry, observations
    PoolConfig config;
    std::map<std::string, Entry> registry;
    std::map<std::string, ToolObservation> observations;

    Impl(IServerStateStore& store, SessionOptions opts, std::shared_ptr<ISessionFactory> f)
        : stateStore(store), options(std::move(opts)), factory(std::move(f)) {}

    std::optional<ServerConfig> findConfig(const std::string& name) const {
        std::lock_guard<std::mutex> lk(registryMutex);
        auto it = config.servers.find(name);
        if (it == config.servers.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<Entry> findEntry(const std::string& name) const {
        std::lock_guard<std::mutex> lk(registryMutex);
        auto it = registry.find(name);
        if (it == registry.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void recordTools(const std::string& name, const Result<std::vector<Tool>>& listed) {
        ToolObservation obs;
        if (!listed) {
            obs.kind = ServerKind::Error;
            obs.note = kNoteListError;
        } else if (listed.value().empty()) {
            obs.kind = ServerKind::NoTools;
            obs.note = kNoteNoTools;
        } else {
            obs.tools = listed.value();
            obs.kind = ServerKind::ToolsProvider;
            obs.note = kNoteToolsNormal;
        }
        std::lock_guard<std::mutex> lk(registryMutex);
        if (registry.count(name) != 0) {
            observations[name] = std::move(obs);
        }
    }

    //==========================================================================================================
    // Lists tools on every live session concurrently and records what each one reported.
    //==========================================================================================================
    std::vector<std::pair<std::string, Result<std::vector<Tool>>>> listLive(
        const std::vector<std::pair<std::string, std::shared_ptr<ISession>>>& sessions) {
        std::vector<std::pair<std::string, std::future<Result<std::vector<Tool>>>>> queries;
        for (const auto& [name, session] : sessions) {
            if (!session->IsAlive()) {
                LOG_DEBUG("Skipping '{}' in tool listing: not live", name);
                continue;
            }
            queries.emplace_back(name, std::async(std::launch::async, [session = session]() {
                return session->ListTools();
            }));
        }
        std::vector<std::pair<std::string, Result<std::vector<Tool>>>> listed;
        for (auto& [name, fut] : queries) {
            Result<std::vector<Tool>> r = fut.get();
            recordTools(name, r);
            listed.emplace_back(name, std::move(r));
        }
        return listed;
    }

    //==========================================================================================================
    // Creates, starts and initializes a session. A failure closes it; the caller registers only successes.
    //==========================================================================================================
    std::shared_ptr<ISession> launch(const ServerConfig& sc) {
        std::shared_ptr<ISession> session = factory->CreateSession(sc, options);
        if (!session) {
            LOG_ERROR("[{}] session factory returned no session", sc.name);
            return nullptr;
        }
        Status started = session->Start();
        if (!started) {
            LOG_ERROR("[{}] failed to start: {}", sc.name, started.error().ToString());
            session->Close();
            return nullptr;
        }
        auto init = session->Initialize();
        if (!init) {
            LOG_ERROR("[{}] failed to initialize: {}", sc.name, init.error().ToString());
            session->Close();
            return nullptr;
        }
        return session;
    }

    bool startServerLocked(const std::string& name, bool persist) {
        auto sc = findConfig(name);
        if (!sc.has_value()) {
            LOG_ERROR("Cannot start unknown server '{}'", name);
            return false;
        }
        if (sc->disabled) {
            LOG_WARN("Server '{}' is disabled in the configuration", name);
            return false;
        }

        std::shared_ptr<ISession> stale;
        if (auto existing = findEntry(name); existing.has_value()) {
            if (existing->session->IsAlive()) {
                LOG_DEBUG("Server '{}' already running", name);
                if (persist && !stateStore.SetServerEnabled(name, true)) {
                    LOG_WARN("Server '{}' is running but its enabled state could not be saved", name);
                }
                return true;
            }
            std::lock_guard<std::mutex> lk(registryMutex);
            stale = existing->session;
            registry.erase(name);
        }
        if (stale) {
            LOG_INFO("Replacing dead session for '{}'", name);
            stale->Close();
        }

        auto session = launch(sc.value());
        if (!session) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lk(registryMutex);
            Entry e;
            e.session = session;
            registry[name] = std::move(e);
            observations.erase(name);
        }
        if (persist && !stateStore.SetServerEnabled(name, true)) {
            LOG_WARN("Server '{}' started but its enabled state could not be saved", name);
        }
        LOG_INFO("Server '{}' started", name);
        return true;
    }

    void stopServerLocked(const std::string& name, bool persist) {
        std::shared_ptr<ISession> session;
        {
            std::lock_guard<std::mutex> lk(registryMutex);
            auto it = registry.find(name);
            if (it != registry.end()) {
                session = it->second.session;
                registry.erase(it);
            }
            observations.erase(name);
        }
        if (session) {
            session->Close();
            LOG_INFO("Server '{}' stopped", name);
        } else {
            LOG_DEBUG("Server '{}' is not running", name);
        }
        if (persist && findConfig(name).has_value() && !stateStore.SetServerEnabled(name, false)) {
            LOG_WARN("Server '{}' stopped but its disabled state could not be saved", name);
        }
    }

    //==========================================================================================================
    // One reconnect on behalf of a failing call. Concurrent callers share a single attempt: whoever
    // finds the session alive after taking the recovery lock skips the reconnect.
    //==========================================================================================================
    Status recover(const std::string& name, const Entry& entry) {
        std::lock_guard<std::mutex> lk(*entry.recoveryMutex);
        if (entry.session->IsAlive()) {
            return Status::Ok();
        }
        LOG_WARN("Server '{}' is not live; reconnecting", name);
        Status st = entry.session->Reconnect();
        if (!st) {
            LOG_ERROR("Server '{}' reconnect failed: {}", name, st.error().ToString());
            ToolObservation obs;
            obs.kind = ServerKind::Error;
            obs.note = kNoteListError;
            std::lock_guard<std::mutex> rl(registryMutex);
            observations[name] = std::move(obs);
        } else {
            LOG_INFO("Server '{}' reconnected", name);
        }
        return st;
    }
};

PoolManager::PoolManager(IServerStateStore& stateStore, SessionOptions options,
                         std::shared_ptr<ISessionFactory> factory)
    : pImpl(std::make_unique<Impl>(stateStore, std::move(options), std::move(factory))) {}

PoolManager::~PoolManager() {
    StopAll();
}

bool PoolManager::StartAll(const std::string& configPath) {
    FUNC_SCOPE();
    auto loaded = LoadPoolConfig(configPath);
    if (!loaded) {
        LOG_ERROR("Failed to load MCP configuration {}: {}", configPath, loaded.error().ToString());
        return false;
    }
    return StartAll(loaded.value());
}

bool PoolManager::StartAll(const PoolConfig& config) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    {
        std::lock_guard<std::mutex> rl(pImpl->registryMutex);
        pImpl->config = config;
    }

    std::vector<std::pair<std::string, std::future<std::shared_ptr<ISession>>>> launches;
    for (const auto& [name, sc] : config.servers) {
        if (sc.disabled) {
            LOG_INFO("Server '{}' is disabled in the configuration", name);
            continue;
        }
        if (!pImpl->stateStore.IsServerEnabled(name)) {
            LOG_INFO("Server '{}' is disabled; not starting", name);
            continue;
        }
        if (auto existing = pImpl->findEntry(name); existing.has_value() && existing->session->IsAlive()) {
            continue;
        }
        launches.emplace_back(name, std::async(std::launch::async, [impl = pImpl.get(), sc = sc]() {
            return impl->launch(sc);
        }));
    }

    for (auto& [name, fut] : launches) {
        std::shared_ptr<ISession> session = fut.get();
        if (!session) {
            continue;
        }
        std::shared_ptr<ISession> replaced;
        {
            std::lock_guard<std::mutex> rl(pImpl->registryMutex);
            auto it = pImpl->registry.find(name);
            if (it != pImpl->registry.end()) {
                replaced = it->second.session;
            }
            Entry e;
            e.session = session;
            pImpl->registry[name] = std::move(e);
            pImpl->observations.erase(name);
        }
        if (replaced) {
            replaced->Close();
        }
    }

    const auto running = RunningServers();
    LOG_INFO("MCP pool: {} of {} configured server(s) running", running.size(), config.servers.size());
    return !running.empty();
}

std::map<std::string, std::vector<Tool>> PoolManager::GetAllTools() {
    FUNC_SCOPE();
    std::vector<std::pair<std::string, std::shared_ptr<ISession>>> sessions;
    {
        std::lock_guard<std::mutex> lk(pImpl->registryMutex);
        for (const auto& [name, entry] : pImpl->registry) {
            sessions.emplace_back(name, entry.session);
        }
    }

    std::map<std::string, std::vector<Tool>> all;
    for (auto& [name, listed] : pImpl->listLive(sessions)) {
        if (!listed) {
            LOG_WARN("Server '{}': {}: {}", name, kNoteListError, listed.error().ToString());
            continue;
        }
        if (listed.value().empty()) {
            LOG_INFO("Server '{}' {}", name, kNoteNoTools);
            continue;
        }
        all[name] = listed.value();
    }
    return all;
}

Result<JSONValue> PoolManager::CallTool(const std::string& server, const std::string& tool,
                                        const std::optional<JSONValue>& arguments) {
    FUNC_SCOPE();
    auto entry = pImpl->findEntry(server);
    if (!entry.has_value()) {
        LOG_ERROR("Tool execution failed: server '{}' is not running", server);
        return Error(ErrorCode::UnknownServer, "server '" + server + "' is not running");
    }

    bool reconnected = false;
    if (!entry->session->IsAlive()) {
        reconnected = true;
        Status st = pImpl->recover(server, entry.value());
        if (!st) {
            LOG_ERROR("Tool execution failed: {}", st.error().ToString());
            return st.error();
        }
    }

    auto result = entry->session->CallTool(tool, arguments);
    if (!result && result.error().IsConnectionLoss() && !reconnected) {
        Status st = pImpl->recover(server, entry.value());
        if (!st) {
            LOG_ERROR("Tool execution failed: {}", st.error().ToString());
            return st.error();
        }
        result = entry->session->CallTool(tool, arguments);
    }
    if (!result) {
        LOG_ERROR("Tool execution failed: {}/{}: {}", server, tool, result.error().ToString());
    }
    return result;
}

void PoolManager::StopAll() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    std::map<std::string, Entry> registry;
    {
        std::lock_guard<std::mutex> rl(pImpl->registryMutex);
        registry.swap(pImpl->registry);
        pImpl->observations.clear();
    }
    if (registry.empty()) {
        return;
    }
    std::vector<std::future<void>> closing;
    for (auto& [name, entry] : registry) {
        closing.push_back(std::async(std::launch::async, [session = entry.session]() { session->Close(); }));
    }
    for (auto& f : closing) {
        f.get();
    }
    LOG_INFO("MCP pool: stopped {} server(s)", registry.size());
}

bool PoolManager::StartServer(const std::string& name) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    return pImpl->startServerLocked(name, true);
}

bool PoolManager::StopServer(const std::string& name) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    pImpl->stopServerLocked(name, true);
    return true;
}

bool PoolManager::RestartServer(const std::string& name) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    LOG_INFO("Restarting server '{}'", name);
    pImpl->stopServerLocked(name, false);
    return pImpl->startServerLocked(name, false);
}

std::map<std::string, ServerStatus> PoolManager::GetStatus() {
    FUNC_SCOPE();
    // Servers never listed since they started are asked once here
    std::vector<std::pair<std::string, std::shared_ptr<ISession>>> unobserved;
    {
        std::lock_guard<std::mutex> lk(pImpl->registryMutex);
        for (const auto& [name, entry] : pImpl->registry) {
            if (pImpl->observations.count(name) == 0) {
                unobserved.emplace_back(name, entry.session);
            }
        }
    }
    if (!unobserved.empty()) {
        pImpl->listLive(unobserved);
    }

    PoolConfig cfg;
    std::map<std::string, Entry> registry;
    std::map<std::string, ToolObservation> observations;
    {
        std::lock_guard<std::mutex> lk(pImpl->registryMutex);
        cfg = pImpl->config;
        registry = pImpl->registry;
        observations = pImpl->observations;
    }

    std::map<std::string, ServerStatus> out;
    for (const auto& [name, sc] : cfg.servers) {
        ServerStatus st;
        st.command = sc.command;
        st.args = sc.args;
        st.env = sc.env;
        st.enabled = !sc.disabled && pImpl->stateStore.IsServerEnabled(name);

        auto it = registry.find(name);
        if (it != registry.end()) {
            st.running = it->second.session->IsAlive();
            st.reconnects = it->second.session->ReconnectCount();
            st.pid = it->second.session->ProcessId();
        }
        auto ob = observations.find(name);
        if (ob != observations.end()) {
            st.tools = ob->second.tools;
        }
        if (!st.running) {
            st.kind = ServerKind::Unknown;
            st.note = kNoteStopped;
        } else if (ob != observations.end()) {
            st.kind = ob->second.kind;
            st.note = ob->second.note;
        } else {
            st.note = kNoteRunning;
        }
        out.emplace(name, std::move(st));
    }
    return out;
}

std::vector<std::string> PoolManager::RunningServers() const {
    std::vector<std::pair<std::string, std::shared_ptr<ISession>>> sessions;
    {
        std::lock_guard<std::mutex> lk(pImpl->registryMutex);
        for (const auto& [name, entry] : pImpl->registry) {
            sessions.emplace_back(name, entry.session);
        }
    }
    std::vector<std::string> names;
    for (auto& [name, session] : sessions) {
        if (session->IsAlive()) {
            names.push_back(name);
        }
    }
    return names;
}

bool PoolManager::IsRunning(const std::string& name) const {
    auto entry = pImpl->findEntry(name);
    return entry.has_value() && entry->session->IsAlive();
}

std::shared_ptr<ISession> PoolManager::GetSession(const std::string& name) const {
    auto entry = pImpl->findEntry(name);
    return entry.has_value() ? entry->session : nullptr;
}

PoolConfig PoolManager::GetConfig() const {
    std::lock_guard<std::mutex> lk(pImpl->registryMutex);
    return pImpl->config;
}

} // namespace mcppool
