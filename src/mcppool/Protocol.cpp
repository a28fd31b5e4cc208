//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Conversions between protocol structures and their JSON wire shapes
//==========================================================================================================

#include "mcppool/Protocol.h"

namespace mcppool {

JSONValue SerializeClientCapabilities(const ClientCapabilities& caps) {
    JSONValue::Object obj;

    if (caps.tools.has_value()) {
        JSONValue::Object t;
        t["listChanged"] = std::make_shared<JSONValue>(caps.tools->listChanged);
        obj["tools"] = std::make_shared<JSONValue>(t);
    }
    if (caps.resources.has_value()) {
        JSONValue::Object r;
        r["subscribe"] = std::make_shared<JSONValue>(caps.resources->subscribe);
        r["listChanged"] = std::make_shared<JSONValue>(caps.resources->listChanged);
        obj["resources"] = std::make_shared<JSONValue>(r);
    }
    if (caps.prompts.has_value()) {
        JSONValue::Object p;
        p["listChanged"] = std::make_shared<JSONValue>(caps.prompts->listChanged);
        obj["prompts"] = std::make_shared<JSONValue>(p);
    }

    return JSONValue{obj};
}

std::optional<Tool> ParseTool(const JSONValue& item) {
    if (!std::holds_alternative<JSONValue::Object>(item.value)) {
        return std::nullopt;
    }
    const JSONValue* name = item.Find("name");
    if (name == nullptr || !name->IsString()) {
        return std::nullopt;
    }
    Tool tool;
    tool.name = std::get<std::string>(name->value);
    const JSONValue* desc = item.Find("description");
    if (desc != nullptr && desc->IsString()) {
        tool.description = std::get<std::string>(desc->value);
    }
    const JSONValue* schema = item.Find("inputSchema");
    if (schema != nullptr) {
        tool.inputSchema = *schema;
    } else {
        // Servers may omit the schema; expose an empty object schema
        JSONValue::Object empty;
        empty["type"] = std::make_shared<JSONValue>(std::string("object"));
        empty["properties"] = std::make_shared<JSONValue>(JSONValue::Object{});
        tool.inputSchema = JSONValue{empty};
    }
    return tool;
}

JSONValue ToolToJSON(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    return JSONValue{obj};
}

} // namespace mcppool
