//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables with defaults and numeric/boolean parsing.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
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
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// ParseUint64
// Purpose: Parses a decimal unsigned integer; rejects signs, blanks and trailing garbage.
// Returns:
//   true and sets out on success; false otherwise (out untouched).
//==========================================================================================================
inline bool ParseUint64(const std::string& s, uint64_t& out) {
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front()))) {
        return false;
    }
    try {
        std::size_t used = 0;
        unsigned long long v = std::stoull(s, &used, 10);
        if (used != s.size()) {
            return false;
        }
        out = static_cast<uint64_t>(v);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

//==========================================================================================================
// GetEnvUint64OrDefault
// Purpose: Reads a numeric environment variable; unset or unparsable values yield defaultValue.
//==========================================================================================================
inline uint64_t GetEnvUint64OrDefault(const char* name, uint64_t defaultValue) {
    uint64_t v = 0;
    return ParseUint64(GetEnvOrDefault(name, ""), v) ? v : defaultValue;
}

// Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
inline bool GetEnvBoolOrDefault(const char* name, bool defaultValue) {
    std::string v = GetEnvOrDefault(name, "");
    for (auto& c : v) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return defaultValue;
}
