//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Middleware.h
// Purpose: Invocation context, interceptor interface and the ordered pipeline that chains them
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "lmcp/Connection.h"
#include "lmcp/JSONRPCTypes.h"
#include "lmcp/Protocol.h"

namespace lmcp {
namespace middleware {

//==========================================================================================================
// MiddlewareContext
// Purpose: State of one logical invocation, shared by every interceptor and every retry attempt.
// Fields:
//   connectionId, toolName, arguments: What is being invoked.
//   attempt: 1-based attempt number (advanced by the retry interceptor).
//   startedAt / elapsed: Set by MiddlewarePipeline::Execute around the whole chain.
//   result: Final result once the chain succeeded.
//   bypassCache: Skip cache lookup (the fresh result still refreshes the entry).
//   cacheHit: Set by the cache interceptor when the result came from cache.
//==========================================================================================================
struct MiddlewareContext {
    ConnectionId connectionId{0};
    std::string toolName;
    JSONValue arguments;
    unsigned int attempt{1};
    std::chrono::steady_clock::time_point startedAt{};
    std::chrono::milliseconds elapsed{0};
    std::optional<ToolResult> result;
    bool bypassCache{false};
    bool cacheHit{false};
};

// Continuation handed to each interceptor; calling it runs the rest of the chain.
using Next = std::function<ToolResult(MiddlewareContext&)>;

//==========================================================================================================
// IInterceptor
// Purpose: One stage of the pipeline. Intercept may adjust ctx, short-circuit by returning without
//          calling next, post-process the result, or translate exceptions.
//==========================================================================================================
class IInterceptor {
public:
    virtual ~IInterceptor() = default;
    virtual std::string Name() const = 0;
    virtual ToolResult Intercept(MiddlewareContext& ctx, const Next& next) = 0;
};

//==========================================================================================================
// MiddlewarePipeline
// Purpose: Ordered interceptor chain; the first added is outermost.
// Notes:
//   Add/Remove are safe while Execute runs elsewhere; an Execute in flight keeps the chain it started with.
//==========================================================================================================
class MiddlewarePipeline {
public:
    void Add(std::shared_ptr<IInterceptor> interceptor);
    // Removes every interceptor with this name; returns whether one was removed.
    bool Remove(const std::string& name);
    std::vector<std::string> Names() const;
    std::size_t Size() const;

    //==========================================================================================================
    // Execute
    // Purpose: Runs ctx through every interceptor, then terminal.
    // Returns:
    //   The result; also stored in ctx.result. ctx.elapsed is set on success and failure.
    //==========================================================================================================
    ToolResult Execute(MiddlewareContext& ctx, const Next& terminal) const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<IInterceptor>> interceptors_;
};

} // namespace middleware
} // namespace lmcp
