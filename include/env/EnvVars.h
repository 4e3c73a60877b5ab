//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set and non-empty) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return defaultValue;
    }
    return std::string(v);
}

//==========================================================================================================
// IsEnvSet
// Purpose: True when the variable exists, even if empty (NO_COLOR semantics).
//==========================================================================================================
inline bool IsEnvSet(const char* name) {
    return name != nullptr && *name != '\0' && std::getenv(name) != nullptr;
}

//==========================================================================================================
// GetEnvSizeOrDefault
// Purpose: Parses a positive decimal size from the environment.
// Returns:
//   The parsed value, or defaultValue when unset, non-numeric, or zero.
//==========================================================================================================
inline std::size_t GetEnvSizeOrDefault(const char* name, std::size_t defaultValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty() || raw.size() > 18) {
        return defaultValue;
    }
    std::size_t v = 0;
    for (char c : raw) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return defaultValue;
        }
        v = v * 10 + static_cast<std::size_t>(c - '0');
    }
    return v == 0 ? defaultValue : v;
}
