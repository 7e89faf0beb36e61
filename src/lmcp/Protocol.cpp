//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Helpers for protocol value types
//==========================================================================================================

#include "lmcp/Protocol.h"

namespace lmcp {

std::string ToolResult::Text() const {
    if (const auto* s = std::get_if<std::string>(&content.value)) {
        return *s;
    }
    std::string out;
    const auto* items = std::get_if<JSONValue::Array>(&content.value);
    if (items == nullptr) {
        return out;
    }
    bool first = true;
    for (const auto& item : *items) {
        if (!item) continue;
        auto type = GetString(*item, "type");
        auto text = GetString(*item, "text");
        if (type && *type == "text" && text) {
            if (!first) out.push_back('\n');
            out += *text;
            first = false;
        }
    }
    return out;
}

bool operator==(const ToolResult& a, const ToolResult& b) {
    return a.content == b.content && a.structuredContent == b.structuredContent && a.raw == b.raw;
}

} // namespace lmcp
