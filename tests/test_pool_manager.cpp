//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_pool_manager.cpp
// Purpose: GoogleTests for the multi-server pool: startup, aggregation, dispatch, recovery and lifecycle
//==========================================================================================================

#include <gtest/gtest.h>

#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <set>
#include <thread>

#include "mcppool/PoolManager.h"

#ifndef MCPPOOL_MOCK_SERVER_PATH
#error "MCPPOOL_MOCK_SERVER_PATH must name the mock server executable"
#endif

using namespace mcppool;

namespace {
ServerConfig mockServer(const std::string& name, std::vector<std::string> flags = {}) {
    ServerConfig cfg;
    cfg.name = name;
    cfg.command = MCPPOOL_MOCK_SERVER_PATH;
    cfg.args = std::move(flags);
    return cfg;
}

SessionOptions testOptions() {
    SessionOptions opts;
    opts.initializeTimeout = std::chrono::seconds(10);
    opts.listToolsTimeout = std::chrono::seconds(10);
    opts.callToolTimeout = std::chrono::seconds(10);
    opts.terminateGrace = std::chrono::milliseconds(500);
    return opts;
}

// tools: full tool set; quiet: lists nothing; off: disabled in config; broken: cannot be spawned
PoolConfig mixedConfig() {
    PoolConfig cfg;
    cfg.servers["tools"] = mockServer("tools");
    cfg.servers["quiet"] = mockServer("quiet", {"--no-tools-field"});
    auto off = mockServer("off");
    off.disabled = true;
    cfg.servers["off"] = off;
    ServerConfig broken;
    broken.name = "broken";
    broken.command = "/no/such/mcp-server";
    cfg.servers["broken"] = broken;
    return cfg;
}

std::vector<std::string> sorted(std::vector<std::string> v) {
    std::sort(v.begin(), v.end());
    return v;
}

void waitUntilDead(const std::shared_ptr<ISession>& session) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (session->IsAlive() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

JSONValue echoArgs(const std::string& text) {
    JSONValue::Object o;
    o["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{o};
}
} // namespace

TEST(PoolManager, StartAllStartsEnabledServersOnly) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    EXPECT_TRUE(pool.StartAll(mixedConfig()));

    EXPECT_EQ(sorted(pool.RunningServers()), (std::vector<std::string>{"quiet", "tools"}));
    EXPECT_TRUE(pool.IsRunning("tools"));
    EXPECT_FALSE(pool.IsRunning("off"));
    EXPECT_FALSE(pool.IsRunning("broken"));
    EXPECT_EQ(pool.GetSession("broken"), nullptr);
    ASSERT_NE(pool.GetSession("tools"), nullptr);
    EXPECT_EQ(pool.GetSession("tools")->State(), SessionState::Initialized);
    EXPECT_EQ(pool.GetConfig().servers.size(), 4u);
}

TEST(PoolManager, StartAllFailsWhenNothingStarts) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    PoolConfig cfg;
    ServerConfig broken;
    broken.name = "broken";
    broken.command = "/no/such/mcp-server";
    cfg.servers["broken"] = broken;
    cfg.servers["refuser"] = mockServer("refuser", {"--init-error"});
    EXPECT_FALSE(pool.StartAll(cfg));
    EXPECT_TRUE(pool.RunningServers().empty());
}

TEST(PoolManager, StartAllFromConfigFile) {
    auto path = std::filesystem::temp_directory_path() /
                ("mcppool_pool_" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << "{\"mcpServers\": {\"fromfile\": {\"command\": \"" << MCPPOOL_MOCK_SERVER_PATH
            << "\", \"args\": [\"--tools\", \"one,two\"]}}}";
    }
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    EXPECT_TRUE(pool.StartAll(path.string()));
    std::filesystem::remove(path);

    auto all = pool.GetAllTools();
    ASSERT_EQ(all.count("fromfile"), 1u);
    EXPECT_EQ(all["fromfile"].size(), 2u);

    EXPECT_FALSE(pool.StartAll("/no/such/config.json"));
}

TEST(PoolManager, FileStoreDefaultsToDisabled) {
    auto statePath = std::filesystem::temp_directory_path() /
                     ("mcppool_pool_state_" + std::to_string(::getpid()) + ".json");
    std::filesystem::remove(statePath);
    JsonFileServerStateStore store(statePath.string());
    PoolManager pool(store, testOptions());
    EXPECT_FALSE(pool.StartAll(mixedConfig()));

    // Enabling through the pool persists the flag
    EXPECT_TRUE(pool.StartServer("tools"));
    EXPECT_TRUE(pool.IsRunning("tools"));
    JsonFileServerStateStore reopened(statePath.string());
    EXPECT_TRUE(reopened.IsServerEnabled("tools"));
    pool.StopAll();
    std::filesystem::remove(statePath);
}

TEST(PoolManager, RuntimeDisabledServerIsSkipped) {
    InMemoryServerStateStore store;
    ASSERT_TRUE(store.SetServerEnabled("quiet", false));
    PoolManager pool(store, testOptions());
    EXPECT_TRUE(pool.StartAll(mixedConfig()));
    EXPECT_EQ(pool.RunningServers(), (std::vector<std::string>{"tools"}));

    auto status = pool.GetStatus();
    EXPECT_FALSE(status.at("quiet").enabled);
    EXPECT_FALSE(status.at("quiet").running);
}

TEST(PoolManager, GetAllToolsOmitsEmptyAndFailingServers) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    auto cfg = mixedConfig();
    cfg.servers["failing"] = mockServer("failing", {"--list-error", "-32603"});
    ASSERT_TRUE(pool.StartAll(cfg));
    EXPECT_TRUE(pool.IsRunning("failing"));

    auto all = pool.GetAllTools();
    EXPECT_EQ(all.size(), 1u);
    ASSERT_EQ(all.count("tools"), 1u);
    EXPECT_EQ(all["tools"].size(), 6u);
    EXPECT_EQ(all.count("quiet"), 0u);
    EXPECT_EQ(all.count("failing"), 0u);

    auto status = pool.GetStatus();
    EXPECT_EQ(status.at("tools").kind, ServerKind::ToolsProvider);
    EXPECT_EQ(status.at("tools").note, "provides tools normally");
    EXPECT_EQ(status.at("tools").tools.size(), 6u);
    EXPECT_EQ(status.at("quiet").kind, ServerKind::NoTools);
    EXPECT_EQ(status.at("quiet").note, "provides no tools");
    EXPECT_EQ(status.at("failing").kind, ServerKind::Error);
    EXPECT_EQ(status.at("failing").note, "error querying tools");
}

TEST(PoolManager, StatusCoversEveryConfiguredServer) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    ASSERT_TRUE(pool.StartAll(mixedConfig()));
    auto status = pool.GetStatus();
    ASSERT_EQ(status.size(), 4u);

    const auto& tools = status.at("tools");
    EXPECT_TRUE(tools.running);
    EXPECT_TRUE(tools.enabled);
    EXPECT_EQ(tools.command, MCPPOOL_MOCK_SERVER_PATH);
    EXPECT_TRUE(tools.pid.has_value());
    EXPECT_EQ(tools.reconnects, 0u);

    const auto& off = status.at("off");
    EXPECT_FALSE(off.running);
    EXPECT_FALSE(off.enabled);
    EXPECT_EQ(off.kind, ServerKind::Unknown);
    EXPECT_EQ(off.note, "stopped");

    const auto& broken = status.at("broken");
    EXPECT_FALSE(broken.running);
    EXPECT_TRUE(broken.enabled);
    EXPECT_EQ(broken.note, "stopped");
    EXPECT_FALSE(broken.pid.has_value());
    EXPECT_STREQ(ServerKindToString(broken.kind), "unknown");
}

TEST(PoolManager, CallToolDispatchesByServerName) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    ASSERT_TRUE(pool.StartAll(mixedConfig()));

    auto r = pool.CallTool("tools", "echo", echoArgs("hello"));
    ASSERT_TRUE(r.ok()) << r.error().ToString();
    EXPECT_EQ(SerializeJSON(*r.value().Find("echo")), "{\"text\":\"hello\"}");

    auto unknown = pool.CallTool("nope", "echo");
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error().code, ErrorCode::UnknownServer);

    auto off = pool.CallTool("off", "echo");
    ASSERT_FALSE(off.ok());
    EXPECT_EQ(off.error().code, ErrorCode::UnknownServer);

    auto badTool = pool.CallTool("tools", "no_such_tool");
    ASSERT_FALSE(badTool.ok());
    EXPECT_EQ(badTool.error().code, ErrorCode::ProtocolError);
    EXPECT_EQ(pool.GetSession("tools")->ReconnectCount(), 0u);
}

TEST(PoolManager, CallToolRecoversFromDeadProcess) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    ASSERT_TRUE(pool.StartAll(mixedConfig()));
    auto session = pool.GetSession("tools");
    auto pid = session->ProcessId();
    ASSERT_TRUE(pid.has_value());

    ASSERT_EQ(::kill(pid.value(), SIGKILL), 0);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (session->IsAlive() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_FALSE(session->IsAlive());

    auto r = pool.CallTool("tools", "echo", echoArgs("again"));
    ASSERT_TRUE(r.ok()) << r.error().ToString();
    EXPECT_EQ(session->ReconnectCount(), 1u);
    ASSERT_TRUE(session->ProcessId().has_value());
    EXPECT_NE(session->ProcessId().value(), pid.value());
    EXPECT_EQ(pool.GetStatus().at("tools").reconnects, 1u);
}

TEST(PoolManager, CallToolRecoversAfterServerExitsBetweenCalls) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    ASSERT_TRUE(pool.StartAll(mixedConfig()));

    auto first = pool.CallTool("tools", "exit_after_reply");
    ASSERT_TRUE(first.ok()) << first.error().ToString();

    auto second = pool.CallTool("tools", "echo", echoArgs("after exit"));
    ASSERT_TRUE(second.ok()) << second.error().ToString();
    EXPECT_EQ(pool.GetSession("tools")->ReconnectCount(), 1u);
}

TEST(PoolManager, CrashingCallIsRetriedExactlyOnce) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    ASSERT_TRUE(pool.StartAll(mixedConfig()));

    auto r = pool.CallTool("tools", "crash");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ProcessDied);
    EXPECT_EQ(pool.GetSession("tools")->ReconnectCount(), 1u);

    // The next call gets its own recovery
    auto next = pool.CallTool("tools", "echo");
    ASSERT_TRUE(next.ok()) << next.error().ToString();
    EXPECT_EQ(pool.GetSession("tools")->ReconnectCount(), 2u);
}

TEST(PoolManager, FailedReconnectIsTerminal) {
    auto marker = std::filesystem::temp_directory_path() /
                  ("mcppool_init_once_pool_" + std::to_string(::getpid()));
    std::filesystem::remove(marker);
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    PoolConfig cfg;
    cfg.servers["once"] = mockServer("once", {"--init-once", marker.string()});
    ASSERT_TRUE(pool.StartAll(cfg));
    auto session = pool.GetSession("once");
    ASSERT_NE(session, nullptr);

    // The crash triggers one reconnect; the new process refuses to initialize
    auto r = pool.CallTool("once", "crash");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ProtocolError);
    EXPECT_EQ(session->ReconnectCount(), 1u);
    EXPECT_EQ(session->State(), SessionState::Disconnected);
    EXPECT_FALSE(pool.IsRunning("once"));
    EXPECT_FALSE(pool.GetStatus().at("once").running);

    // Each later call gets exactly one more attempt
    auto next = pool.CallTool("once", "echo");
    ASSERT_FALSE(next.ok());
    EXPECT_EQ(session->ReconnectCount(), 2u);
    std::filesystem::remove(marker);
}

TEST(PoolManager, ConcurrentCallsShareOneReconnect) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    ASSERT_TRUE(pool.StartAll(mixedConfig()));
    auto session = pool.GetSession("tools");
    auto pid = session->ProcessId();
    ASSERT_TRUE(pid.has_value());
    ASSERT_EQ(::kill(pid.value(), SIGKILL), 0);
    waitUntilDead(session);
    ASSERT_FALSE(session->IsAlive());

    constexpr int N = 6;
    std::vector<std::future<Result<JSONValue>>> calls;
    for (int i = 0; i < N; ++i) {
        calls.push_back(std::async(std::launch::async, [&pool, i]() {
            return pool.CallTool("tools", "echo", echoArgs("after-kill-" + std::to_string(i)));
        }));
    }
    for (int i = 0; i < N; ++i) {
        auto r = calls[i].get();
        ASSERT_TRUE(r.ok()) << r.error().ToString();
        EXPECT_EQ(std::get<std::string>(r.value().Find("echo")->Find("text")->value),
                  "after-kill-" + std::to_string(i));
    }
    EXPECT_EQ(session->ReconnectCount(), 1u);
}

TEST(PoolManager, LifecycleChangesRaceWithCalls) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    ASSERT_TRUE(pool.StartAll(mixedConfig()));

    const std::set<ErrorCode> expected{ErrorCode::UnknownServer, ErrorCode::Closed, ErrorCode::ProcessDied,
                                       ErrorCode::BrokenPipe, ErrorCode::NotInitialized};
    std::atomic<bool> done{false};
    auto caller = [&]() {
        int failures = 0;
        while (!done.load()) {
            auto r = pool.CallTool("tools", "echo", echoArgs("race"));
            if (!r.ok()) {
                EXPECT_EQ(expected.count(r.error().code), 1u) << r.error().ToString();
                ++failures;
            }
        }
        return failures;
    };
    auto lister = [&]() {
        while (!done.load()) {
            auto all = pool.GetAllTools();
            EXPECT_LE(all.size(), 1u);
            EXPECT_EQ(pool.GetStatus().size(), 4u);
        }
    };

    auto c1 = std::async(std::launch::async, caller);
    auto c2 = std::async(std::launch::async, caller);
    auto l1 = std::async(std::launch::async, lister);
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(pool.StopServer("tools"));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        EXPECT_TRUE(pool.RestartServer("tools"));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    done = true;
    c1.get();
    c2.get();
    l1.get();

    ASSERT_TRUE(pool.IsRunning("tools"));
    auto r = pool.CallTool("tools", "echo", echoArgs("settled"));
    ASSERT_TRUE(r.ok()) << r.error().ToString();
}

TEST(PoolManager, StartAllDoesNotWaitForToolListing) {
    InMemoryServerStateStore store;
    auto opts = testOptions();
    opts.listToolsTimeout = std::chrono::seconds(4);
    PoolManager pool(store, opts);
    PoolConfig cfg;
    cfg.servers["slowlist"] = mockServer("slowlist", {"--list-hang"});

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(pool.StartAll(cfg));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
    EXPECT_TRUE(pool.IsRunning("slowlist"));
}

TEST(PoolManager, StatusObservesToolsOnFirstRequest) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    ASSERT_TRUE(pool.StartAll(mixedConfig()));

    auto status = pool.GetStatus();
    EXPECT_EQ(status.at("tools").kind, ServerKind::ToolsProvider);
    EXPECT_EQ(status.at("tools").tools.size(), 6u);
    EXPECT_EQ(status.at("quiet").kind, ServerKind::NoTools);
    EXPECT_EQ(status.at("quiet").note, "provides no tools");
}

TEST(PoolManager, TimeoutIsNotRetried) {
    InMemoryServerStateStore store;
    auto opts = testOptions();
    opts.callToolTimeout = std::chrono::milliseconds(200);
    PoolManager pool(store, opts);
    ASSERT_TRUE(pool.StartAll(mixedConfig()));

    auto r = pool.CallTool("tools", "hang");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    EXPECT_EQ(pool.GetSession("tools")->ReconnectCount(), 0u);
    EXPECT_TRUE(pool.IsRunning("tools"));
}

TEST(PoolManager, ConcurrentCallsAcrossServers) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    auto cfg = mixedConfig();
    cfg.servers["second"] = mockServer("second");
    ASSERT_TRUE(pool.StartAll(cfg));

    std::vector<std::future<Result<JSONValue>>> calls;
    for (int i = 0; i < 6; ++i) {
        const std::string server = (i % 2 == 0) ? "tools" : "second";
        calls.push_back(std::async(std::launch::async, [&pool, server, i]() {
            return pool.CallTool(server, "echo", echoArgs("call-" + std::to_string(i)));
        }));
    }
    for (int i = 0; i < 6; ++i) {
        auto r = calls[i].get();
        ASSERT_TRUE(r.ok()) << r.error().ToString();
        EXPECT_EQ(std::get<std::string>(r.value().Find("echo")->Find("text")->value), "call-" + std::to_string(i));
    }
}

TEST(PoolManager, StartStopRestartByName) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    ASSERT_TRUE(pool.StartAll(mixedConfig()));

    EXPECT_TRUE(pool.StopServer("tools"));
    EXPECT_FALSE(pool.IsRunning("tools"));
    EXPECT_FALSE(store.IsServerEnabled("tools"));
    EXPECT_TRUE(pool.StopServer("tools"));
    auto afterStop = pool.CallTool("tools", "echo");
    ASSERT_FALSE(afterStop.ok());
    EXPECT_EQ(afterStop.error().code, ErrorCode::UnknownServer);

    // Unknown names are accepted but never recorded
    EXPECT_TRUE(pool.StopServer("nope"));
    EXPECT_EQ(store.GetAllStates().count("nope"), 0u);

    EXPECT_TRUE(pool.StartServer("tools"));
    EXPECT_TRUE(pool.IsRunning("tools"));
    EXPECT_TRUE(store.IsServerEnabled("tools"));
    auto pid = pool.GetSession("tools")->ProcessId();

    // Already running: no new process
    EXPECT_TRUE(pool.StartServer("tools"));
    EXPECT_EQ(pool.GetSession("tools")->ProcessId(), pid);

    EXPECT_TRUE(pool.RestartServer("tools"));
    EXPECT_TRUE(pool.IsRunning("tools"));
    EXPECT_NE(pool.GetSession("tools")->ProcessId(), pid);
    EXPECT_TRUE(store.IsServerEnabled("tools"));

    EXPECT_FALSE(pool.StartServer("off"));
    EXPECT_FALSE(pool.StartServer("nope"));
    EXPECT_FALSE(pool.StartServer("broken"));
    EXPECT_FALSE(pool.IsRunning("broken"));
}

TEST(PoolManager, RestartDoesNotPersist) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    ASSERT_TRUE(pool.StartAll(mixedConfig()));
    EXPECT_TRUE(pool.RestartServer("quiet"));
    EXPECT_TRUE(store.GetAllStates().empty());
}

TEST(PoolManager, StopAllClosesEverything) {
    InMemoryServerStateStore store;
    PoolManager pool(store, testOptions());
    ASSERT_TRUE(pool.StartAll(mixedConfig()));
    auto session = pool.GetSession("tools");
    ASSERT_NE(session, nullptr);

    pool.StopAll();
    EXPECT_TRUE(pool.RunningServers().empty());
    EXPECT_EQ(session->State(), SessionState::Closed);
    auto r = pool.CallTool("tools", "echo");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::UnknownServer);
    // Runtime state is untouched by StopAll
    EXPECT_TRUE(store.GetAllStates().empty());

    pool.StopAll();
    EXPECT_TRUE(pool.StartAll(mixedConfig()));
    EXPECT_TRUE(pool.IsRunning("tools"));
}
