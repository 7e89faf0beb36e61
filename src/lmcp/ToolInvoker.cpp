//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolInvoker.cpp
// Purpose: ToolInvoker implementation and default pipeline assembly
//==========================================================================================================

#include "logging/Logger.h"
#include "lmcp/ToolInvoker.h"

namespace lmcp {

std::shared_ptr<middleware::MiddlewarePipeline> MakeDefaultPipeline(const DefaultPipelineOptions& options) {
    auto pipeline = std::make_shared<middleware::MiddlewarePipeline>();
    pipeline->Add(std::make_shared<middleware::LoggingInterceptor>(options.logging));
    if (options.metrics) {
        pipeline->Add(options.metrics);
    }
    pipeline->Add(std::make_shared<middleware::RetryInterceptor>(options.retry, options.sleeper));
    pipeline->Add(std::make_shared<middleware::CacheInterceptor>(options.cache));
    return pipeline;
}

ToolInvoker::ToolInvoker(ConnectionManager& manager, std::shared_ptr<middleware::MiddlewarePipeline> pipeline,
                         bool autoReconnect)
    : manager_(manager),
      pipeline_(pipeline ? std::move(pipeline) : std::make_shared<middleware::MiddlewarePipeline>()),
      autoReconnect_(autoReconnect) {}

std::shared_ptr<Connection> ToolInvoker::ensureReady(ConnectionId id) {
    auto connection = manager_.Get(id);
    if (autoReconnect_ && connection->State() != ConnectionState::Ready) {
        LOG_WARN("Connection {} is {}; reconnecting", id, toString(connection->State()));
        manager_.Reconnect(id);
    }
    return connection;
}

ToolResult ToolInvoker::Invoke(ConnectionId id, const std::string& toolName, const JSONValue& args,
                               const InvokeOptions& options) {
    // Fail fast on unknown ids instead of inside the pipeline
    (void)manager_.Get(id);

    middleware::MiddlewareContext ctx;
    ctx.connectionId = id;
    ctx.toolName = toolName;
    ctx.arguments = args;
    ctx.bypassCache = options.bypassCache;

    return pipeline_->Execute(ctx, [this](middleware::MiddlewareContext& c) {
        auto connection = ensureReady(c.connectionId);
        return proxy_.Invoke(connection, c.toolName, c.arguments);
    });
}

std::future<ToolResult> ToolInvoker::InvokeAsync(ConnectionId id, std::string toolName, JSONValue args,
                                                 InvokeOptions options) {
    return std::async(std::launch::async, [this, id, toolName = std::move(toolName), args = std::move(args), options]() {
        return Invoke(id, toolName, args, options);
    });
}

std::vector<ToolDescriptor> ToolInvoker::DiscoverTools(ConnectionId id) {
    auto connection = ensureReady(id);
    return connection->Schemas().DiscoverTools(*connection->Client());
}

std::vector<ResourceDescriptor> ToolInvoker::DiscoverResources(ConnectionId id) {
    auto connection = ensureReady(id);
    return connection->Schemas().DiscoverResources(*connection->Client());
}

JSONValue ToolInvoker::ReadResource(ConnectionId id, const std::string& uri) {
    return proxy_.ReadResource(ensureReady(id), uri);
}

} // namespace lmcp
