//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerStateStore.cpp
// Purpose: In-memory and JSON-file runtime state stores
//==========================================================================================================

#include <cstdio>
#include <fstream>
#include <sstream>

#include "logging/Logger.h"
#include "mcppool/JSONRPCTypes.h"
#include "mcppool/ServerStateStore.hpp"

namespace mcppool {

//------------------------------------------------------------------------------------------------------
// InMemoryServerStateStore
//------------------------------------------------------------------------------------------------------
bool InMemoryServerStateStore::IsServerEnabled(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = states_.find(name);
    return (it != states_.end()) ? it->second : defaultEnabled_;
}

bool InMemoryServerStateStore::SetServerEnabled(const std::string& name, bool enabled) {
    std::lock_guard<std::mutex> lk(mutex_);
    states_[name] = enabled;
    return true;
}

std::map<std::string, bool> InMemoryServerStateStore::GetAllStates() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return states_;
}

//------------------------------------------------------------------------------------------------------
// JsonFileServerStateStore
//------------------------------------------------------------------------------------------------------
JsonFileServerStateStore::JsonFileServerStateStore(std::string path, bool defaultEnabled)
    : path_(std::move(path)), defaultEnabled_(defaultEnabled) {
    Reload();
}

void JsonFileServerStateStore::Reload() {
    FUNC_SCOPE();
    std::map<std::string, bool> loaded;
    std::ifstream in(path_, std::ios::in | std::ios::binary);
    if (in.is_open()) {
        std::ostringstream ss;
        ss << in.rdbuf();
        try {
            JSONValue doc = ParseJSON(ss.str());
            if (doc.IsObject()) {
                for (const auto& [k, v] : std::get<JSONValue::Object>(doc.value)) {
                    if (v && std::holds_alternative<bool>(v->value)) {
                        loaded[k] = std::get<bool>(v->value);
                    } else {
                        LOG_WARN("State file {}: ignoring non-boolean entry '{}'", path_, k);
                    }
                }
            } else {
                LOG_WARN("State file {} is not a JSON object; starting empty", path_);
            }
        } catch (const std::exception& e) {
            LOG_WARN("Failed to load server state from {}: {}", path_, e.what());
        }
    }
    std::lock_guard<std::mutex> lk(mutex_);
    states_ = std::move(loaded);
}

bool JsonFileServerStateStore::IsServerEnabled(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = states_.find(name);
    return (it != states_.end()) ? it->second : defaultEnabled_;
}

bool JsonFileServerStateStore::SetServerEnabled(const std::string& name, bool enabled) {
    std::lock_guard<std::mutex> lk(mutex_);
    states_[name] = enabled;
    return saveLocked();
}

std::map<std::string, bool> JsonFileServerStateStore::GetAllStates() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return states_;
}

bool JsonFileServerStateStore::saveLocked() const {
    // Written to a sibling temp file and renamed so readers never see a torn file
    std::ostringstream oss;
    oss << "{\n";
    bool first = true;
    for (const auto& [k, v] : states_) {
        if (!first) oss << ",\n";
        first = false;
        oss << "  " << SerializeJSON(JSONValue(k)) << ": " << (v ? "true" : "false");
    }
    oss << "\n}\n";

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out.is_open()) {
            LOG_ERROR("Failed to save server state: cannot open {}", tmp);
            return false;
        }
        out << oss.str();
        out.flush();
        if (!out.good()) {
            LOG_ERROR("Failed to save server state: write to {} failed", tmp);
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        LOG_ERROR("Failed to save server state: rename to {} failed (errno={})", path_, errno);
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

} // namespace mcppool
