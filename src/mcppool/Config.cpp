//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Configuration document parsing and environment-driven session tunables
//==========================================================================================================

#include <fstream>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcppool/Config.h"
#include "mcppool/version.h"

namespace mcppool {

namespace {
Error configError(const std::string& msg) {
    return Error(ErrorCode::ConfigError, msg);
}

void applyEnvTimeout(const char* name, std::chrono::milliseconds& target) {
    if (GetEnvOrDefault(name, "").empty()) {
        return;
    }
    auto v = GetEnvUint64(name);
    if (!v.has_value() || v.value() == 0) {
        LOG_WARN("Ignoring malformed {}={}", name, GetEnvOrDefault(name, ""));
        return;
    }
    target = std::chrono::milliseconds(static_cast<int64_t>(v.value()));
}
} // namespace

SessionOptions::SessionOptions()
    : clientInfo("mcppool", getVersionString()),
      capabilities(DefaultClientCapabilities()) {}

SessionOptions SessionOptions::FromEnvironment() {
    SessionOptions opts;
    applyEnvTimeout("MCPPOOL_INITIALIZE_TIMEOUT_MS", opts.initializeTimeout);
    applyEnvTimeout("MCPPOOL_LIST_TOOLS_TIMEOUT_MS", opts.listToolsTimeout);
    applyEnvTimeout("MCPPOOL_CALL_TOOL_TIMEOUT_MS", opts.callToolTimeout);
    applyEnvTimeout("MCPPOOL_TERMINATE_GRACE_MS", opts.terminateGrace);
    return opts;
}

Result<PoolConfig> ParsePoolConfig(const std::string& text) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = ParseJSON(text);
    } catch (const std::exception& e) {
        return configError(std::string("invalid JSON: ") + e.what());
    }
    if (!doc.IsObject()) {
        return configError("top-level value must be an object");
    }

    const JSONValue* servers = doc.Find("servers");
    if (servers == nullptr) {
        servers = doc.Find("mcpServers");
    }
    PoolConfig config;
    if (servers == nullptr) {
        LOG_WARN("Configuration has no \"servers\" map");
        return config;
    }
    if (!servers->IsObject()) {
        return configError("\"servers\" must be an object");
    }

    for (const auto& [name, entryPtr] : std::get<JSONValue::Object>(servers->value)) {
        if (!entryPtr || !entryPtr->IsObject()) {
            return configError("server '" + name + "' must be an object");
        }
        const JSONValue& entry = *entryPtr;

        ServerConfig sc;
        sc.name = name;

        const JSONValue* command = entry.Find("command");
        if (command == nullptr || !command->IsString() || std::get<std::string>(command->value).empty()) {
            LOG_WARN("Skipping server '{}': missing command", name);
            continue;
        }
        sc.command = std::get<std::string>(command->value);

        if (const JSONValue* args = entry.Find("args"); args != nullptr && !args->IsNull()) {
            if (!args->IsArray()) {
                return configError("server '" + name + "': \"args\" must be a list of strings");
            }
            for (const auto& a : std::get<JSONValue::Array>(args->value)) {
                if (!a || !a->IsString()) {
                    return configError("server '" + name + "': \"args\" must be a list of strings");
                }
                sc.args.push_back(std::get<std::string>(a->value));
            }
        }

        if (const JSONValue* env = entry.Find("env"); env != nullptr && !env->IsNull()) {
            if (!env->IsObject()) {
                return configError("server '" + name + "': \"env\" must be a string map");
            }
            for (const auto& [k, v] : std::get<JSONValue::Object>(env->value)) {
                if (!v || !v->IsString()) {
                    return configError("server '" + name + "': env value for '" + k + "' must be a string");
                }
                sc.env[k] = std::get<std::string>(v->value);
            }
        }

        if (const JSONValue* disabled = entry.Find("disabled"); disabled != nullptr && !disabled->IsNull()) {
            if (!std::holds_alternative<bool>(disabled->value)) {
                return configError("server '" + name + "': \"disabled\" must be a boolean");
            }
            sc.disabled = std::get<bool>(disabled->value);
        }

        config.servers.emplace(name, std::move(sc));
    }
    LOG_DEBUG("Parsed configuration with {} server(s)", config.servers.size());
    return config;
}

Result<PoolConfig> LoadPoolConfig(const std::string& path) {
    FUNC_SCOPE();
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return configError("cannot open " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    LOG_INFO("Loading MCP server configuration: {}", path);
    return ParsePoolConfig(ss.str());
}

} // namespace mcppool
