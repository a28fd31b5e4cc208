//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerStateStore.hpp
// Purpose: Persisted user-driven enabled/disabled flag per server name
//==========================================================================================================
#pragma once

#include <map>
#include <mutex>
#include <string>

namespace mcppool {

//==========================================================================================================
// IServerStateStore
// Purpose: Narrow key-value interface through which the pool reads and writes runtime toggles.
//          Independent of ServerConfig::disabled.
//==========================================================================================================
class IServerStateStore {
public:
    virtual ~IServerStateStore() = default;

    //==========================================================================================================
    // Returns whether the user has enabled the server; unknown names use the store's default.
    //==========================================================================================================
    virtual bool IsServerEnabled(const std::string& name) const = 0;

    //==========================================================================================================
    // Records the flag for the server and persists it.
    // Returns:
    //   false when the change could not be persisted (the in-memory value is still updated).
    //==========================================================================================================
    virtual bool SetServerEnabled(const std::string& name, bool enabled) = 0;

    // Snapshot of every recorded flag.
    virtual std::map<std::string, bool> GetAllStates() const = 0;
};

//==========================================================================================================
// InMemoryServerStateStore
// Purpose: Non-persistent store for embedding and tests.
//==========================================================================================================
class InMemoryServerStateStore : public IServerStateStore {
public:
    explicit InMemoryServerStateStore(bool defaultEnabled = true) : defaultEnabled_(defaultEnabled) {}

    bool IsServerEnabled(const std::string& name) const override;
    bool SetServerEnabled(const std::string& name, bool enabled) override;
    std::map<std::string, bool> GetAllStates() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, bool> states_;
    bool defaultEnabled_;
};

//==========================================================================================================
// JsonFileServerStateStore
// Purpose: File-backed store. The file holds a JSON object { "<server>": true|false, ... } and is
//          rewritten on every change. A missing file is an empty state; an unreadable one is logged and
//          treated as empty.
// Args:
//   path: Location of the state file.
//   defaultEnabled: Answer for names with no recorded flag (false matches the desktop app's behaviour,
//                   where servers stay off until the user enables them).
//==========================================================================================================
class JsonFileServerStateStore : public IServerStateStore {
public:
    explicit JsonFileServerStateStore(std::string path, bool defaultEnabled = false);

    bool IsServerEnabled(const std::string& name) const override;
    bool SetServerEnabled(const std::string& name, bool enabled) override;
    std::map<std::string, bool> GetAllStates() const override;

    // Re-reads the file, replacing the in-memory state.
    void Reload();

    const std::string& Path() const { return path_; }

private:
    bool saveLocked() const;

    std::string path_;
    bool defaultEnabled_;
    mutable std::mutex mutex_;
    std::map<std::string, bool> states_;
};

} // namespace mcppool
