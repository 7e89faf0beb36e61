//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol data structures and constants shared by the client components
//==========================================================================================================

#pragma once

#include "lmcp/JSONRPCTypes.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lmcp {
//==========================================================================================================
// Protocol types and constants
// Purpose: Shared protocol structures and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol revision announced during initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo / serverInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

//==========================================================================================================
// ServerInfo
// Purpose: What the server reported in its initialize response.
// Fields:
//   implementation: serverInfo {name, version}; "unknown" when omitted.
//   protocolVersion: Revision the server agreed to.
//   capabilities: Raw capabilities object.
//   instructions: Optional usage hint from the server.
//==========================================================================================================
struct ServerInfo {
    Implementation implementation;
    std::string protocolVersion;
    JSONValue capabilities;
    std::optional<std::string> instructions;

    bool HasCapability(const std::string& name) const { return capabilities.find(name) != nullptr; }
};

///////////////////////////////////////// Descriptors ///////////////////////////////////////////
struct ParameterSpec {
    std::string type;          // JSON schema type name, empty when unspecified
    bool required{false};
    std::string description;
};

//==========================================================================================================
// ToolDescriptor
// Purpose: Immutable description of one invocable tool.
// Fields:
//   name, description: As reported by the server.
//   parameters: name -> {type, required, description}; ordered for stable rendering.
//   inputSchema: Raw schema JSON as received (object form).
//==========================================================================================================
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::map<std::string, ParameterSpec> parameters;
    JSONValue inputSchema;

    std::vector<std::string> RequiredParameters() const {
        std::vector<std::string> out;
        for (const auto& [param, spec] : parameters) {
            if (spec.required) out.push_back(param);
        }
        return out;
    }
};

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
};

//==========================================================================================================
// ToolResult
// Purpose: Unwrapped successful tools/call result.
// Fields:
//   content: The content member (usually an array of {type, text|data|...} items).
//   structuredContent: Present when the server supplied it.
//   raw: The full result object.
//==========================================================================================================
struct ToolResult {
    JSONValue content;
    std::optional<JSONValue> structuredContent;
    JSONValue raw;

    // Concatenation of text items (newline-joined); a string content is returned as-is.
    std::string Text() const;
};

bool operator==(const ToolResult& a, const ToolResult& b);

///////////////////////////////////////// Methods ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* ResourceListChanged = "notifications/resources/list_changed";
}

} // namespace lmcp
