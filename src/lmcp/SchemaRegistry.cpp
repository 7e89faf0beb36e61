//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaRegistry.cpp
// Purpose: Tool/resource discovery, descriptor parsing and argument validation
//==========================================================================================================

#include <set>
#include <utility>

#include "logging/Logger.h"
#include "lmcp/ProtocolClient.h"
#include "lmcp/SchemaRegistry.h"
#include "lmcp/errors/Errors.h"

namespace lmcp {

using namespace lmcp::errors;

namespace {

// Follows nextCursor and returns the concatenated entries of every page.
std::vector<JSONValue> collectPages(ProtocolClient& client, const char* method, const char* member) {
    std::vector<JSONValue> entries;
    std::optional<std::string> cursor;
    std::set<std::string> seenCursors;
    for (std::size_t page = 0;; ++page) {
        if (page >= SchemaRegistry::kMaxDiscoveryPages) {
            throw DiscoveryError(fmt::format("{} did not finish within {} pages", method,
                                             SchemaRegistry::kMaxDiscoveryPages));
        }
        std::optional<JSONValue> params;
        if (cursor) {
            params = MakeObject({{"cursor", JSONValue(*cursor)}});
        }
        JSONValue result = client.CallMethod(method, std::move(params));

        const JSONValue* list = result.isArray() ? &result : result.find(member);
        if (list == nullptr || !list->isArray()) {
            throw DiscoveryError(fmt::format("{} result has no '{}' array", method, member), result);
        }
        for (const auto& item : std::get<JSONValue::Array>(list->value)) {
            entries.push_back(item ? *item : JSONValue());
        }

        cursor = GetString(result, "nextCursor");
        if (!cursor || cursor->empty()) {
            break;
        }
        if (!seenCursors.insert(*cursor).second) {
            throw DiscoveryError(fmt::format("{} returned cursor '{}' twice", method, *cursor), result);
        }
        LOG_DEBUG("{} page {} done, continuing at cursor {}", method, page + 1, *cursor);
    }
    return entries;
}

ParameterSpec parseProperty(const std::string& tool, const std::string& name, const JSONValue& prop,
                            const JSONValue& entry) {
    if (!prop.isObject()) {
        throw DiscoveryError(fmt::format("Parameter '{}' of tool '{}' is not an object", name, tool), entry);
    }
    ParameterSpec spec;
    if (auto type = GetString(prop, "type")) {
        spec.type = *type;
    }
    spec.description = GetString(prop, "description").value_or("");
    spec.required = GetBool(prop, "required").value_or(false);
    return spec;
}

} // namespace

ToolDescriptor SchemaRegistry::ParseToolDescriptor(const JSONValue& entry) {
    if (!entry.isObject()) {
        throw DiscoveryError("Tool entry is not an object", entry);
    }
    auto name = GetString(entry, "name");
    if (!name || name->empty()) {
        throw DiscoveryError("Tool entry lacks a string name", entry);
    }

    ToolDescriptor desc;
    desc.name = *name;
    desc.description = GetString(entry, "description").value_or("");

    if (const JSONValue* schema = entry.find("inputSchema")) {
        if (!schema->isObject()) {
            throw DiscoveryError(fmt::format("inputSchema of tool '{}' is not an object", desc.name), entry);
        }
        if (const JSONValue* props = schema->find("properties")) {
            if (!props->isObject()) {
                throw DiscoveryError(fmt::format("inputSchema.properties of tool '{}' is not an object", desc.name),
                                     entry);
            }
            for (const auto& [param, prop] : std::get<JSONValue::Object>(props->value)) {
                desc.parameters[param] = parseProperty(desc.name, param, prop ? *prop : JSONValue(), entry);
            }
        }
        if (const JSONValue* required = schema->find("required")) {
            if (!required->isArray()) {
                throw DiscoveryError(fmt::format("inputSchema.required of tool '{}' is not an array", desc.name),
                                     entry);
            }
            for (const auto& item : std::get<JSONValue::Array>(required->value)) {
                if (!item || !item->isString()) {
                    throw DiscoveryError(
                        fmt::format("inputSchema.required of tool '{}' holds a non-string", desc.name), entry);
                }
                desc.parameters[std::get<std::string>(item->value)].required = true;
            }
        }
        desc.inputSchema = *schema;
        return desc;
    }

    // Flat form; synthesize the equivalent object schema
    JSONValue::Object properties;
    JSONValue::Array required;
    if (const JSONValue* params = entry.find("parameters")) {
        if (!params->isObject()) {
            throw DiscoveryError(fmt::format("parameters of tool '{}' is not an object", desc.name), entry);
        }
        for (const auto& [param, prop] : std::get<JSONValue::Object>(params->value)) {
            ParameterSpec spec = parseProperty(desc.name, param, prop ? *prop : JSONValue(), entry);
            JSONValue::Object p;
            if (!spec.type.empty()) p["type"] = std::make_shared<JSONValue>(spec.type);
            if (!spec.description.empty()) p["description"] = std::make_shared<JSONValue>(spec.description);
            properties[param] = std::make_shared<JSONValue>(std::move(p));
            if (spec.required) required.push_back(std::make_shared<JSONValue>(param));
            desc.parameters[param] = std::move(spec);
        }
    }
    desc.inputSchema = MakeObject({
        {"type", JSONValue("object")},
        {"properties", JSONValue(std::move(properties))},
        {"required", JSONValue(std::move(required))}
    });
    return desc;
}

ResourceDescriptor SchemaRegistry::ParseResourceDescriptor(const JSONValue& entry) {
    if (!entry.isObject()) {
        throw DiscoveryError("Resource entry is not an object", entry);
    }
    auto uri = GetString(entry, "uri");
    if (!uri || uri->empty()) {
        throw DiscoveryError("Resource entry lacks a string uri", entry);
    }
    ResourceDescriptor desc;
    desc.uri = *uri;
    desc.name = GetString(entry, "name").value_or(*uri);
    desc.description = GetString(entry, "description");
    desc.mimeType = GetString(entry, "mimeType");
    return desc;
}

std::vector<ToolDescriptor> SchemaRegistry::DiscoverTools(ProtocolClient& client) {
    FUNC_SCOPE();
    std::vector<ToolDescriptor> tools;
    std::map<std::string, std::size_t> index;
    for (const auto& entry : collectPages(client, Methods::ListTools, "tools")) {
        ToolDescriptor desc = ParseToolDescriptor(entry);
        if (!index.emplace(desc.name, tools.size()).second) {
            throw DiscoveryError(fmt::format("Server listed tool '{}' more than once", desc.name), entry);
        }
        tools.push_back(std::move(desc));
    }
    LOG_INFO("Discovered {} tool(s) on {}", tools.size(), client.SessionId());
    std::lock_guard<std::mutex> lock(mutex_);
    tools_ = tools;
    toolIndex_ = std::move(index);
    return tools;
}

std::vector<ResourceDescriptor> SchemaRegistry::DiscoverResources(ProtocolClient& client) {
    FUNC_SCOPE();
    std::vector<ResourceDescriptor> resources;
    std::map<std::string, std::size_t> index;
    for (const auto& entry : collectPages(client, Methods::ListResources, "resources")) {
        ResourceDescriptor desc = ParseResourceDescriptor(entry);
        if (!index.emplace(desc.uri, resources.size()).second) {
            throw DiscoveryError(fmt::format("Server listed resource '{}' more than once", desc.uri), entry);
        }
        resources.push_back(std::move(desc));
    }
    LOG_INFO("Discovered {} resource(s) on {}", resources.size(), client.SessionId());
    std::lock_guard<std::mutex> lock(mutex_);
    resources_ = resources;
    resourceIndex_ = std::move(index);
    return resources;
}

std::optional<ToolDescriptor> SchemaRegistry::GetTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = toolIndex_.find(name);
    if (!tools_ || it == toolIndex_.end()) {
        return std::nullopt;
    }
    return (*tools_)[it->second];
}

std::optional<ResourceDescriptor> SchemaRegistry::GetResource(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = resourceIndex_.find(uri);
    if (it == resourceIndex_.end()) {
        return std::nullopt;
    }
    return resources_[it->second];
}

std::vector<ToolDescriptor> SchemaRegistry::Tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.value_or(std::vector<ToolDescriptor>{});
}

std::vector<ResourceDescriptor> SchemaRegistry::Resources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_;
}

bool SchemaRegistry::HasTools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.has_value();
}

void SchemaRegistry::Invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_.reset();
    toolIndex_.clear();
    resources_.clear();
    resourceIndex_.clear();
}

void SchemaRegistry::ValidateArguments(const ToolDescriptor& descriptor, const JSONValue& args,
                                       validation::ValidationMode mode) {
    if (!args.isObject()) {
        throw ValidationError(fmt::format("Arguments for tool '{}' must be a JSON object", descriptor.name));
    }
    for (const auto& param : descriptor.RequiredParameters()) {
        if (args.find(param) != nullptr) {
            continue;
        }
        if (mode == validation::ValidationMode::Strict) {
            throw MissingParameterError(descriptor.name, param);
        }
        LOG_WARN("Tool '{}' called without required parameter '{}'", descriptor.name, param);
    }
}

} // namespace lmcp
