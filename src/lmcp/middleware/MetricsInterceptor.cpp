//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MetricsInterceptor.cpp
// Purpose: MetricsInterceptor implementation
//==========================================================================================================

#include <algorithm>
#include <vector>

#include "lmcp/errors/Errors.h"
#include "lmcp/middleware/MetricsInterceptor.h"

namespace lmcp {
namespace middleware {

namespace {

std::chrono::milliseconds since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
}

} // namespace

ToolResult MetricsInterceptor::Intercept(MiddlewareContext& ctx, const Next& next) {
    const auto t0 = std::chrono::steady_clock::now();
    try {
        ToolResult result = next(ctx);
        record(ctx, since(t0), nullptr);
        return result;
    } catch (const errors::LmcpError& e) {
        record(ctx, since(t0), e.KindName());
        throw;
    } catch (const std::exception&) {
        record(ctx, since(t0), "Unknown");
        throw;
    }
}

void MetricsInterceptor::record(const MiddlewareContext& ctx, std::chrono::milliseconds duration,
                                const char* failureKind) {
    std::lock_guard<std::mutex> lock(mutex_);
    ToolMetrics& tool = totals_.perTool[ctx.toolName];
    ++totals_.calls;
    ++tool.calls;
    totals_.totalDuration += duration;
    tool.totalDuration += duration;
    if (failureKind) {
        ++totals_.failures;
        ++tool.failures;
        ++totals_.failuresByKind[failureKind];
    } else {
        ++totals_.successes;
        ++tool.successes;
        if (ctx.cacheHit) {
            ++totals_.cacheHits;
            ++tool.cacheHits;
        }
    }
    samples_.push_back(duration);
    if (samples_.size() > kMaxSamples) {
        samples_.pop_front();
    }
}

MetricsSnapshot MetricsInterceptor::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MetricsSnapshot s = totals_;
    if (s.calls > 0) {
        s.averageDuration = std::chrono::milliseconds(s.totalDuration.count() / static_cast<int64_t>(s.calls));
    }
    if (!samples_.empty()) {
        std::vector<std::chrono::milliseconds> sorted(samples_.begin(), samples_.end());
        std::sort(sorted.begin(), sorted.end());
        // Nearest-rank percentile
        const std::size_t rank = (sorted.size() * 95 + 99) / 100;
        s.p95Duration = sorted[std::max<std::size_t>(rank, 1) - 1];
    }
    return s;
}

void MetricsInterceptor::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    totals_ = MetricsSnapshot{};
    samples_.clear();
}

} // namespace middleware
} // namespace lmcp
