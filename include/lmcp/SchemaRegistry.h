//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaRegistry.h
// Purpose: Per-connection cache of tool and resource descriptors plus argument validation
//==========================================================================================================

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "lmcp/JSONRPCTypes.h"
#include "lmcp/Protocol.h"
#include "lmcp/validation/Validation.h"

namespace lmcp {

class ProtocolClient;

//==========================================================================================================
// SchemaRegistry
// Purpose: Holds the descriptors last discovered on one connection.
// Notes:
//   - Discovery replaces the cached set wholesale; readers never observe a partial refresh.
//   - Lookups are pure cache reads and never touch the wire.
//==========================================================================================================
class SchemaRegistry {
public:
    // Upper bound on tools/list and resources/list pages followed in one discovery.
    static constexpr std::size_t kMaxDiscoveryPages = 1000;

    SchemaRegistry() = default;
    SchemaRegistry(const SchemaRegistry&) = delete;
    SchemaRegistry& operator=(const SchemaRegistry&) = delete;

    ////////////////////////////////////////// Discovery //////////////////////////////////////////
    //==========================================================================================================
    // Issues tools/list (following nextCursor), parses every entry and replaces the cache.
    // Returns:
    //   The discovered descriptors in server order.
    // Throws:
    //   DiscoveryError for malformed entries or duplicate names (cache untouched); client errors propagate.
    //==========================================================================================================
    std::vector<ToolDescriptor> DiscoverTools(ProtocolClient& client);

    // resources/list counterpart of DiscoverTools.
    std::vector<ResourceDescriptor> DiscoverResources(ProtocolClient& client);

    ////////////////////////////////////////// Lookups //////////////////////////////////////////
    std::optional<ToolDescriptor> GetTool(const std::string& name) const;
    std::optional<ResourceDescriptor> GetResource(const std::string& uri) const;
    std::vector<ToolDescriptor> Tools() const;
    std::vector<ResourceDescriptor> Resources() const;

    // True once a tool discovery result is cached (even an empty one).
    bool HasTools() const;

    // Drops every cached descriptor.
    void Invalidate();

    ////////////////////////////////////////// Parsing / validation //////////////////////////////////////////
    //==========================================================================================================
    // ParseToolDescriptor
    // Purpose: Builds a descriptor from either {name, description, inputSchema:{properties, required}} or the
    //          flat {name, description, parameters:{p:{type, required, description}}} form.
    // Throws:
    //   DiscoveryError naming the problem, with the offending entry as payload.
    //==========================================================================================================
    static ToolDescriptor ParseToolDescriptor(const JSONValue& entry);
    static ResourceDescriptor ParseResourceDescriptor(const JSONValue& entry);

    //==========================================================================================================
    // ValidateArguments
    // Purpose: Checks args against a descriptor before anything is sent.
    // Throws:
    //   ValidationError when args is not an object.
    //   MissingParameterError for the first absent required parameter (Strict only; Off logs and passes).
    // Notes:
    //   Keys the descriptor does not declare pass through.
    //==========================================================================================================
    static void ValidateArguments(const ToolDescriptor& descriptor, const JSONValue& args,
                                  validation::ValidationMode mode);

private:
    mutable std::mutex mutex_;
    std::optional<std::vector<ToolDescriptor>> tools_;
    std::map<std::string, std::size_t> toolIndex_;
    std::vector<ResourceDescriptor> resources_;
    std::map<std::string, std::size_t> resourceIndex_;
};

} // namespace lmcp
