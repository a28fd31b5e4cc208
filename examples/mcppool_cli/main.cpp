//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Command-line front end for the MCP server pool
//==========================================================================================================

#include <csignal>
#include <cstdlib>
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <thread>

#include "logging/Logger.h"
#include "mcppool/PoolManager.h"
#include "mcppool/ServerStateStore.hpp"
#include "mcppool/version.h"

using namespace mcppool;

static std::atomic<bool> gInterrupted{false};

static void handleSig(int) {
    gInterrupted.store(true);
}

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--config")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            std::string k = a.substr(0, eq);
            std::string v = a.substr(eq + 1);
            if (k == key) {
                return v;
            }
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static void printUsage() {
    std::cerr << "mcppool_cli " << getVersionString() << "\n"
              << "usage: mcppool_cli --config=<mcp.json> [--state=<state.json>] [--enable-all]\n"
              << "                   [--list] [--status] [--call=<server>/<tool> [--args=<json>]]\n"
              << "                   [--log-level=DEBUG|INFO|WARN|ERROR] [--log-file=<path>]\n";
}

static JSONValue toolsToJSON(const std::vector<Tool>& tools) {
    JSONValue::Array arr;
    for (const auto& t : tools) {
        arr.push_back(std::make_shared<JSONValue>(ToolToJSON(t)));
    }
    return JSONValue{arr};
}

static JSONValue statusToJSON(const std::map<std::string, ServerStatus>& status) {
    JSONValue::Object root;
    for (const auto& [name, st] : status) {
        JSONValue::Object o;
        o["command"] = std::make_shared<JSONValue>(st.command);
        JSONValue::Array args;
        for (const auto& a : st.args) {
            args.push_back(std::make_shared<JSONValue>(a));
        }
        o["args"] = std::make_shared<JSONValue>(args);
        JSONValue::Object env;
        for (const auto& [k, v] : st.env) {
            env[k] = std::make_shared<JSONValue>(v);
        }
        o["env"] = std::make_shared<JSONValue>(env);
        o["status"] = std::make_shared<JSONValue>(std::string(st.running ? "running" : "stopped"));
        o["enabled"] = std::make_shared<JSONValue>(st.enabled);
        o["tools"] = std::make_shared<JSONValue>(toolsToJSON(st.tools));
        o["server_type"] = std::make_shared<JSONValue>(std::string(ServerKindToString(st.kind)));
        o["note"] = std::make_shared<JSONValue>(st.note);
        o["reconnects"] = std::make_shared<JSONValue>(static_cast<int64_t>(st.reconnects));
        if (st.pid.has_value()) {
            o["pid"] = std::make_shared<JSONValue>(static_cast<int64_t>(st.pid.value()));
        }
        root[name] = std::make_shared<JSONValue>(o);
    }
    return JSONValue{root};
}

int main(int argc, char** argv) {
    // Stdout carries results only
    ::setenv("MCPPOOL_LOG_STDERR", "1", 0);
    if (auto lvl = getArgValue(argc, argv, "--log-level"); lvl.has_value()) {
        Logger::setLogLevel(Logger::toLogLevel(Logger::levelFromString(lvl.value())));
    }
    if (auto logFile = getArgValue(argc, argv, "--log-file"); logFile.has_value()) {
        if (!Logger::setLogFile(logFile.value())) {
            return 2;
        }
    }
    FUNC_SCOPE();

    auto configPath = getArgValue(argc, argv, "--config");
    if (!configPath.has_value() || hasFlag(argc, argv, "--help")) {
        printUsage();
        return 2;
    }

    std::optional<std::pair<std::string, std::string>> call;
    std::optional<JSONValue> callArgs;
    if (auto target = getArgValue(argc, argv, "--call"); target.has_value()) {
        auto slash = target->find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 >= target->size()) {
            std::cerr << "--call expects <server>/<tool>\n";
            return 2;
        }
        call = std::make_pair(target->substr(0, slash), target->substr(slash + 1));
        if (auto a = getArgValue(argc, argv, "--args"); a.has_value()) {
            try {
                callArgs = ParseJSON(a.value());
            } catch (const std::exception& e) {
                std::cerr << "--args is not valid JSON: " << e.what() << "\n";
                return 2;
            }
        }
    }

    std::unique_ptr<IServerStateStore> store;
    if (hasFlag(argc, argv, "--enable-all")) {
        store = std::make_unique<InMemoryServerStateStore>(true);
    } else {
        store = std::make_unique<JsonFileServerStateStore>(
            getArgValue(argc, argv, "--state").value_or("mcp_server_state.json"));
    }

    ::signal(SIGINT, handleSig);
    ::signal(SIGTERM, handleSig);

    PoolManager pool(*store, SessionOptions::FromEnvironment());

    auto work = std::async(std::launch::async, [&]() -> int {
        if (!pool.StartAll(configPath.value())) {
            LOG_ERROR("No MCP server started from {}", configPath.value());
            return 1;
        }
        int rc = 0;
        if (hasFlag(argc, argv, "--list")) {
            JSONValue::Object out;
            for (const auto& [server, tools] : pool.GetAllTools()) {
                out[server] = std::make_shared<JSONValue>(toolsToJSON(tools));
            }
            std::cout << SerializeJSON(JSONValue{out}) << std::endl;
        }
        if (call.has_value()) {
            auto result = pool.CallTool(call->first, call->second, callArgs);
            if (result) {
                std::cout << SerializeJSON(result.value()) << std::endl;
            } else {
                std::cerr << "tool execution failed: " << result.error().ToString() << std::endl;
                rc = 1;
            }
        }
        if (hasFlag(argc, argv, "--status")) {
            std::cout << SerializeJSON(statusToJSON(pool.GetStatus())) << std::endl;
        }
        return rc;
    });

    while (work.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (gInterrupted.load()) {
            LOG_WARN("Interrupted; stopping all servers");
            pool.StopAll();
            break;
        }
    }
    int rc = work.get();
    pool.StopAll();
    return gInterrupted.load() ? 130 : rc;
}
