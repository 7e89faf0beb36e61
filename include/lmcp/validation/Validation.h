//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validation.h
// Purpose: Strictness switch for client-side argument and tool checks
//==========================================================================================================

#pragma once

#include <cctype>
#include <optional>
#include <string>

namespace lmcp {
namespace validation {

// Strict: missing required parameters and unknown tools fail before anything is sent.
// Off: the same problems are logged and the call is sent anyway.
enum class ValidationMode {
    Off = 0,
    Strict = 1,
};

// Utility to convert to/from string for docs/config friendliness
inline const char* toString(ValidationMode mode) {
    switch (mode) {
        case ValidationMode::Strict: return "Strict";
        case ValidationMode::Off:
        default: return "Off";
    }
}

inline std::optional<ValidationMode> parseMode(const std::string& s) {
    std::string v; v.reserve(s.size());
    for (char c : s) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "strict") return ValidationMode::Strict;
    if (v == "off" || v == "lenient") return ValidationMode::Off;
    return std::nullopt;
}

} // namespace validation
} // namespace lmcp
