//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants used by the stdio client
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace mcppool {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol revision announced in the initialize handshake
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct PromptsCapability {
    bool listChanged = false;
};

// Capabilities declared by this client in the initialize request
struct ClientCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::optional<PromptsCapability> prompts;
};

// Default declaration: tools/resources/prompts change notifications and resource subscriptions.
inline ClientCapabilities DefaultClientCapabilities() {
    ClientCapabilities caps;
    caps.tools = ToolsCapability{true};
    caps.resources = ResourcesCapability{true, true};
    caps.prompts = PromptsCapability{true};
    return caps;
}

JSONValue SerializeClientCapabilities(const ClientCapabilities& caps);

// Result of a successful initialize handshake
struct InitializeResult {
    std::string protocolVersion;
    Implementation serverInfo;
    JSONValue capabilities;  // raw capabilities object as sent by the server
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
//==========================================================================================================
// Tool
// Purpose: Descriptor of one callable operation exposed by a server (tools/list item).
// Fields:
//   name, description: Identity as advertised.
//   inputSchema: JSON-schema-like object with "properties" and "required".
//==========================================================================================================
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

// Parses one tools/list item; returns std::nullopt when it is not an object with a string name.
std::optional<Tool> ParseTool(const JSONValue& item);

// Serializes a descriptor back to its wire shape { name, description, inputSchema }.
JSONValue ToolToJSON(const Tool& tool);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* Ping = "ping";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
}

} // namespace mcppool
