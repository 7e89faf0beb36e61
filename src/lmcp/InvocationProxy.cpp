//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InvocationProxy.cpp
// Purpose: InvocationProxy implementation
//==========================================================================================================

#include "logging/Logger.h"
#include "lmcp/InvocationProxy.h"
#include "lmcp/async/FutureAwaitable.h"
#include "lmcp/errors/Errors.h"

namespace lmcp {

using namespace lmcp::errors;

namespace {

// Descriptor for the tool, discovering first when nothing is cached yet.
std::optional<ToolDescriptor> resolveTool(Connection& connection, ProtocolClient& client, const std::string& toolName) {
    SchemaRegistry& registry = connection.Schemas();
    if (!registry.HasTools() && client.Options().autoDiscover) {
        LOG_DEBUG("No cached tools for connection {}; discovering", connection.Id());
        registry.DiscoverTools(client);
    }
    return registry.GetTool(toolName);
}

} // namespace

ToolResult InvocationProxy::UnwrapResult(const std::string& toolName, const JSONValue& result) {
    if (!result.isObject()) {
        throw ProtocolError(JSONRPCErrorCodes::InternalError,
                            fmt::format("tools/call result for '{}' is not an object", toolName));
    }

    if (const JSONValue* err = result.find("error")) {
        if (err->isObject()) {
            auto message = GetString(*err, "message").value_or("Tool reported an error");
            throw ToolExecutionError(toolName, message, GetInt(*err, "code"), *err);
        }
        if (err->isString()) {
            throw ToolExecutionError(toolName, std::get<std::string>(err->value), std::nullopt, result);
        }
    }

    ToolResult out;
    if (const JSONValue* content = result.find("content")) {
        out.content = *content;
    } else {
        out.content = JSONValue(JSONValue::Array{});
    }
    if (const JSONValue* structured = result.find("structuredContent")) {
        out.structuredContent = *structured;
    }
    out.raw = result;

    if (GetBool(result, "isError").value_or(false)) {
        std::string message = out.Text();
        if (message.empty()) message = "Tool reported an error";
        throw ToolExecutionError(toolName, message, std::nullopt, result);
    }
    return out;
}

async::Task<ToolResult> InvocationProxy::coInvoke(std::shared_ptr<Connection> connection, std::string toolName,
                                                  JSONValue args) {
    std::shared_ptr<ProtocolClient> client = connection->Client();
    const auto mode = client->Options().validationMode;

    auto descriptor = resolveTool(*connection, *client, toolName);
    if (descriptor) {
        SchemaRegistry::ValidateArguments(*descriptor, args, mode);
    } else if (mode == validation::ValidationMode::Strict) {
        throw ToolNotFoundError(toolName);
    } else {
        LOG_WARN("Tool '{}' is not in the discovered set; sending unvalidated", toolName);
        if (!args.isObject()) {
            throw ValidationError(fmt::format("Arguments for tool '{}' must be a JSON object", toolName));
        }
    }

    JSONValue params = MakeObject({{"name", JSONValue(toolName)}, {"arguments", args}});
    JSONValue result;
    try {
        result = co_await async::makeFutureAwaitable(client->CallMethodAsync(Methods::CallTool, std::move(params)));
    } catch (const ProtocolError& e) {
        if (JSONRPCErrorCodes::IsReserved(e.Code())) {
            throw;
        }
        throw ToolExecutionError(toolName, e.what(), e.Code(), e.Payload());
    }
    co_return UnwrapResult(toolName, result);
}

std::future<ToolResult> InvocationProxy::InvokeAsync(std::shared_ptr<Connection> connection, std::string toolName,
                                                     JSONValue args) const {
    if (!connection) {
        throw std::invalid_argument("InvokeAsync requires a connection");
    }
    return coInvoke(std::move(connection), std::move(toolName), std::move(args)).toFuture();
}

ToolResult InvocationProxy::Invoke(const std::shared_ptr<Connection>& connection, const std::string& toolName,
                                   const JSONValue& args) const {
    return InvokeAsync(connection, toolName, args).get();
}

JSONValue InvocationProxy::ReadResource(const std::shared_ptr<Connection>& connection, const std::string& uri) const {
    if (!connection) {
        throw std::invalid_argument("ReadResource requires a connection");
    }
    JSONValue result = connection->Client()->CallMethod(Methods::ReadResource, MakeObject({{"uri", JSONValue(uri)}}));
    if (!result.isObject()) {
        throw ProtocolError(JSONRPCErrorCodes::InternalError,
                            fmt::format("resources/read result for '{}' is not an object", uri));
    }
    return result;
}

} // namespace lmcp
