//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolInvoker.h
// Purpose: Facade running tool calls through the middleware pipeline on managed connections
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "lmcp/ConnectionManager.h"
#include "lmcp/InvocationProxy.h"
#include "lmcp/middleware/CacheInterceptor.h"
#include "lmcp/middleware/LoggingInterceptor.h"
#include "lmcp/middleware/MetricsInterceptor.h"
#include "lmcp/middleware/Middleware.h"
#include "lmcp/middleware/RetryInterceptor.h"

namespace lmcp {

struct InvokeOptions {
    bool bypassCache{false};
};

//==========================================================================================================
// DefaultPipelineOptions
// Purpose: Inputs to MakeDefaultPipeline. A null metrics pointer leaves metrics out.
//==========================================================================================================
struct DefaultPipelineOptions {
    middleware::LoggingOptions logging;
    middleware::RetryPolicy retry;
    middleware::CacheOptions cache;
    std::shared_ptr<middleware::MetricsInterceptor> metrics;
    middleware::RetryInterceptor::Sleeper sleeper;
};

// logging -> [metrics] -> retry -> cache (outermost first).
std::shared_ptr<middleware::MiddlewarePipeline> MakeDefaultPipeline(const DefaultPipelineOptions& options = {});

//==========================================================================================================
// ToolInvoker
// Purpose: Invoke(id, tool, args) = pipeline around InvocationProxy on the manager's connection.
// Notes:
//   With autoReconnect, a connection found not Ready at the start of an attempt is reconnected once per
//   attempt before the call (so retries after a lost connection go to a fresh server).
//==========================================================================================================
class ToolInvoker {
public:
    ToolInvoker(ConnectionManager& manager, std::shared_ptr<middleware::MiddlewarePipeline> pipeline = nullptr,
                bool autoReconnect = false);

    ToolResult Invoke(ConnectionId id, const std::string& toolName, const JSONValue& args,
                      const InvokeOptions& options = {});

    // Runs Invoke on a worker thread.
    std::future<ToolResult> InvokeAsync(ConnectionId id, std::string toolName, JSONValue args,
                                        InvokeOptions options = {});

    // Refreshes and returns the connection's tool list.
    std::vector<ToolDescriptor> DiscoverTools(ConnectionId id);
    std::vector<ResourceDescriptor> DiscoverResources(ConnectionId id);
    JSONValue ReadResource(ConnectionId id, const std::string& uri);

    middleware::MiddlewarePipeline& Pipeline() { return *pipeline_; }
    const InvocationProxy& Proxy() const { return proxy_; }

private:
    std::shared_ptr<Connection> ensureReady(ConnectionId id);

    ConnectionManager& manager_;
    std::shared_ptr<middleware::MiddlewarePipeline> pipeline_;
    InvocationProxy proxy_;
    bool autoReconnect_;
};

} // namespace lmcp
