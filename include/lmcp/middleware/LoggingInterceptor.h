//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LoggingInterceptor.h
// Purpose: Logs start, duration and outcome of every invocation
//==========================================================================================================

#pragma once

#include "logging/Logger.h"
#include "lmcp/middleware/Middleware.h"

namespace lmcp {
namespace middleware {

struct LoggingOptions {
    LogLevel level{LogLevel::LOG_INFO_LEVEL};  // start/success lines; failures always log at WARN or above
    std::size_t maxArgumentChars{1000};        // serialized arguments beyond this are truncated
};

class LoggingInterceptor : public IInterceptor {
public:
    explicit LoggingInterceptor(LoggingOptions options = {});

    std::string Name() const override { return "logging"; }
    ToolResult Intercept(MiddlewareContext& ctx, const Next& next) override;

    // Serialized arguments cut to maxChars with a "...(N more)" suffix.
    static std::string Truncate(const std::string& text, std::size_t maxChars);

private:
    LoggingOptions options_;
};

} // namespace middleware
} // namespace lmcp
