//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RetryInterceptor.h
// Purpose: Retries transient failures with capped exponential backoff and jitter
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <random>

#include "lmcp/middleware/Middleware.h"

namespace lmcp {
namespace middleware {

//==========================================================================================================
// RetryPolicy
// Fields:
//   maxAttempts: Total attempts including the first.
//   baseDelay, multiplier, maxDelay: delay(n) = min(baseDelay * multiplier^(n-1), maxDelay) after attempt n.
//   jitter: Scale each delay by a factor drawn from [0.5, 1.0).
//==========================================================================================================
struct RetryPolicy {
    unsigned int maxAttempts{3};
    std::chrono::milliseconds baseDelay{1000};
    double multiplier{2.0};
    std::chrono::milliseconds maxDelay{60000};
    bool jitter{true};
};

//==========================================================================================================
// RetryInterceptor
// Purpose: Re-runs the rest of the chain when it fails with a transient LmcpError (transport closed,
//          connection lost or closed, timeout). Everything else propagates on the first failure.
// Throws:
//   RetryExhaustedError carrying the attempt count and the last failure once maxAttempts is reached.
//==========================================================================================================
class RetryInterceptor : public IInterceptor {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using JitterSource = std::function<double()>;

    explicit RetryInterceptor(RetryPolicy policy = {}, Sleeper sleeper = nullptr, JitterSource jitter = nullptr);

    std::string Name() const override { return "retry"; }
    ToolResult Intercept(MiddlewareContext& ctx, const Next& next) override;

    const RetryPolicy& Policy() const { return policy_; }

    // Delay after the given failed attempt (1-based) for a jitter factor in [0.5, 1.0].
    static std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, unsigned int attempt, double jitterFactor);

private:
    double nextJitter();

    RetryPolicy policy_;
    Sleeper sleeper_;
    JitterSource jitter_;
    std::mutex rngMutex_;
    std::mt19937 rng_;
};

} // namespace middleware
} // namespace lmcp
