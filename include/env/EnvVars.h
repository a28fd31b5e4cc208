//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables and snapshot the process environment.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

extern "C" char** environ;

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    return std::getenv(name) ? std::string(std::getenv(name)) : defaultValue;
}

//==========================================================================================================
// GetEnvUint64
// Purpose: Parses an unsigned integer environment variable.
// Returns:
//   The parsed value, or std::nullopt when unset, empty or malformed.
//==========================================================================================================
inline std::optional<uint64_t> GetEnvUint64(const char* name) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty() || v[0] == '-') {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        unsigned long long parsed = std::stoull(v, &used);
        if (used != v.size()) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(parsed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

//==========================================================================================================
// SnapshotEnvironment
// Purpose: Copies the current process environment into a name -> value map.
//==========================================================================================================
inline std::map<std::string, std::string> SnapshotEnvironment() {
    std::map<std::string, std::string> out;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        out[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return out;
}
