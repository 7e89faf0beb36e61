//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RetryInterceptor.cpp
// Purpose: RetryInterceptor implementation
//==========================================================================================================

#include <algorithm>
#include <cmath>
#include <thread>

#include "logging/Logger.h"
#include "lmcp/errors/Errors.h"
#include "lmcp/middleware/RetryInterceptor.h"

namespace lmcp {
namespace middleware {

RetryInterceptor::RetryInterceptor(RetryPolicy policy, Sleeper sleeper, JitterSource jitter)
    : policy_(policy), sleeper_(std::move(sleeper)), jitter_(std::move(jitter)), rng_(std::random_device{}()) {
    if (policy_.maxAttempts == 0) {
        policy_.maxAttempts = 1;
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::chrono::milliseconds RetryInterceptor::BackoffDelay(const RetryPolicy& policy, unsigned int attempt,
                                                         double jitterFactor) {
    const double exponent = static_cast<double>(attempt > 0 ? attempt - 1 : 0);
    const double raw = static_cast<double>(policy.baseDelay.count()) * std::pow(policy.multiplier, exponent);
    const double capped = std::min(raw, static_cast<double>(policy.maxDelay.count()));
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped * jitterFactor));
}

double RetryInterceptor::nextJitter() {
    if (!policy_.jitter) {
        return 1.0;
    }
    if (jitter_) {
        return jitter_();
    }
    std::lock_guard<std::mutex> lock(rngMutex_);
    std::uniform_real_distribution<double> dist(0.5, 1.0);
    return dist(rng_);
}

ToolResult RetryInterceptor::Intercept(MiddlewareContext& ctx, const Next& next) {
    for (unsigned int attempt = 1;; ++attempt) {
        ctx.attempt = attempt;
        try {
            return next(ctx);
        } catch (const errors::LmcpError& e) {
            if (!e.IsTransient()) {
                throw;
            }
            if (attempt >= policy_.maxAttempts) {
                LOG_ERROR("{} failed {} time(s), giving up: {}", ctx.toolName, attempt, e.what());
                throw errors::RetryExhaustedError(attempt, std::current_exception(), e.what(), e.Kind());
            }
            const auto delay = BackoffDelay(policy_, attempt, nextJitter());
            LOG_WARN("{} attempt {}/{} failed ({}); retrying in {} ms", ctx.toolName, attempt,
                     policy_.maxAttempts, e.KindName(), delay.count());
            sleeper_(delay);
        }
    }
}

} // namespace middleware
} // namespace lmcp
