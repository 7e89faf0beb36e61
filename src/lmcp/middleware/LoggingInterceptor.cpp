//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LoggingInterceptor.cpp
// Purpose: LoggingInterceptor implementation
//==========================================================================================================

#include <algorithm>

#include "lmcp/errors/Errors.h"
#include "lmcp/middleware/LoggingInterceptor.h"

namespace lmcp {
namespace middleware {

namespace {

long long sinceMs(std::chrono::steady_clock::time_point t0) {
    return static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count());
}

} // namespace

LoggingInterceptor::LoggingInterceptor(LoggingOptions options) : options_(options) {}

std::string LoggingInterceptor::Truncate(const std::string& text, std::size_t maxChars) {
    if (text.size() <= maxChars) {
        return text;
    }
    return fmt::format("{}...({} more)", text.substr(0, maxChars), text.size() - maxChars);
}

ToolResult LoggingInterceptor::Intercept(MiddlewareContext& ctx, const Next& next) {
    const auto failLevel = std::max(options_.level, LogLevel::LOG_WARN_LEVEL);
    if (Logger::isEnabled(options_.level)) {
        Logger::logAt(options_.level, "-> {} on connection {} args={}", __FILE__, __LINE__, ctx.toolName,
                      ctx.connectionId, Truncate(SerializeJSON(ctx.arguments), options_.maxArgumentChars));
    }
    const auto t0 = std::chrono::steady_clock::now();
    try {
        ToolResult result = next(ctx);
        Logger::logAt(options_.level, "<- {} ok in {} ms (attempt {}{})", __FILE__, __LINE__, ctx.toolName,
                      sinceMs(t0), ctx.attempt, ctx.cacheHit ? ", cached" : "");
        return result;
    } catch (const errors::LmcpError& e) {
        Logger::logAt(failLevel, "<- {} failed in {} ms: {} ({})", __FILE__, __LINE__, ctx.toolName, sinceMs(t0),
                      e.KindName(), e.what());
        throw;
    } catch (const std::exception& e) {
        Logger::logAt(failLevel, "<- {} failed in {} ms: {}", __FILE__, __LINE__, ctx.toolName, sinceMs(t0),
                      e.what());
        throw;
    }
}

} // namespace middleware
} // namespace lmcp
