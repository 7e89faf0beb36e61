//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MetricsInterceptor.h
// Purpose: In-process invocation counters and latency figures
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>

#include "lmcp/middleware/Middleware.h"

namespace lmcp {
namespace middleware {

struct ToolMetrics {
    uint64_t calls{0};
    uint64_t successes{0};
    uint64_t failures{0};
    uint64_t cacheHits{0};
    std::chrono::milliseconds totalDuration{0};
};

//==========================================================================================================
// MetricsSnapshot
// Fields:
//   failuresByKind: ErrorKind name (e.g. "TimeoutError") -> count; non-lmcp exceptions count as "Unknown".
//   averageDuration / p95Duration: Over all calls / over the most recent kMaxSamples calls.
//==========================================================================================================
struct MetricsSnapshot {
    uint64_t calls{0};
    uint64_t successes{0};
    uint64_t failures{0};
    uint64_t cacheHits{0};
    std::map<std::string, uint64_t> failuresByKind;
    std::chrono::milliseconds totalDuration{0};
    std::chrono::milliseconds averageDuration{0};
    std::chrono::milliseconds p95Duration{0};
    std::map<std::string, ToolMetrics> perTool;
};

class MetricsInterceptor : public IInterceptor {
public:
    static constexpr std::size_t kMaxSamples = 1024;

    std::string Name() const override { return "metrics"; }
    ToolResult Intercept(MiddlewareContext& ctx, const Next& next) override;

    MetricsSnapshot Snapshot() const;
    void Reset();

private:
    void record(const MiddlewareContext& ctx, std::chrono::milliseconds duration, const char* failureKind);

    mutable std::mutex mutex_;
    MetricsSnapshot totals_;
    std::deque<std::chrono::milliseconds> samples_;
};

} // namespace middleware
} // namespace lmcp
