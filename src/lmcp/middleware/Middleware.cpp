//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Middleware.cpp
// Purpose: MiddlewarePipeline implementation
//==========================================================================================================

#include <algorithm>
#include <stdexcept>

#include "lmcp/middleware/Middleware.h"

namespace lmcp {
namespace middleware {

namespace {

using Chain = std::vector<std::shared_ptr<IInterceptor>>;

ToolResult runFrom(const Chain& chain, std::size_t index, MiddlewareContext& ctx, const Next& terminal) {
    if (index == chain.size()) {
        return terminal(ctx);
    }
    Next next = [&chain, index, &terminal](MiddlewareContext& c) {
        return runFrom(chain, index + 1, c, terminal);
    };
    return chain[index]->Intercept(ctx, next);
}

} // namespace

void MiddlewarePipeline::Add(std::shared_ptr<IInterceptor> interceptor) {
    if (!interceptor) {
        throw std::invalid_argument("MiddlewarePipeline::Add requires an interceptor");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    interceptors_.push_back(std::move(interceptor));
}

bool MiddlewarePipeline::Remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto before = interceptors_.size();
    interceptors_.erase(std::remove_if(interceptors_.begin(), interceptors_.end(),
                                       [&name](const auto& i) { return i->Name() == name; }),
                        interceptors_.end());
    return interceptors_.size() != before;
}

std::vector<std::string> MiddlewarePipeline::Names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(interceptors_.size());
    for (const auto& i : interceptors_) {
        names.push_back(i->Name());
    }
    return names;
}

std::size_t MiddlewarePipeline::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interceptors_.size();
}

ToolResult MiddlewarePipeline::Execute(MiddlewareContext& ctx, const Next& terminal) const {
    Chain chain;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        chain = interceptors_;
    }
    ctx.startedAt = std::chrono::steady_clock::now();
    const auto stamp = [&ctx]() {
        ctx.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - ctx.startedAt);
    };
    try {
        ToolResult result = runFrom(chain, 0, ctx, terminal);
        stamp();
        ctx.result = result;
        return result;
    } catch (...) {
        stamp();
        throw;
    }
}

} // namespace middleware
} // namespace lmcp
