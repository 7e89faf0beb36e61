//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CacheInterceptor.cpp
// Purpose: CacheInterceptor implementation
//==========================================================================================================

#include "logging/Logger.h"
#include "lmcp/middleware/CacheInterceptor.h"

namespace lmcp {
namespace middleware {

CacheInterceptor::CacheInterceptor(CacheOptions options, Clock clock)
    : options_(options), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = []() { return std::chrono::steady_clock::now(); };
    }
}

std::string CacheInterceptor::MakeKey(ConnectionId connection, const std::string& toolName, const JSONValue& args) {
    return fmt::format("{}\x1f{}\x1f{}", connection, toolName, CanonicalJSON(args));
}

std::optional<ToolResult> CacheInterceptor::lookup(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++stats_.misses;
        return std::nullopt;
    }
    if (clock_() >= it->second.expiresAt) {
        lru_.erase(it->second.lruPos);
        entries_.erase(it);
        ++stats_.expirations;
        ++stats_.misses;
        return std::nullopt;
    }
    lru_.splice(lru_.begin(), lru_, it->second.lruPos);
    ++stats_.hits;
    return it->second.result;
}

void CacheInterceptor::store(const std::string& key, const MiddlewareContext& ctx, const ToolResult& result) {
    if (options_.maxEntries == 0 || options_.ttl.count() <= 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto expiresAt = clock_() + options_.ttl;
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.result = result;
        it->second.expiresAt = expiresAt;
        lru_.splice(lru_.begin(), lru_, it->second.lruPos);
    } else {
        while (entries_.size() >= options_.maxEntries && !lru_.empty()) {
            entries_.erase(lru_.back());
            lru_.pop_back();
            ++stats_.evictions;
        }
        lru_.push_front(key);
        entries_.emplace(key, Entry{ctx.connectionId, ctx.toolName, result, expiresAt, lru_.begin()});
    }
    ++stats_.stores;
}

ToolResult CacheInterceptor::Intercept(MiddlewareContext& ctx, const Next& next) {
    const std::string key = MakeKey(ctx.connectionId, ctx.toolName, ctx.arguments);
    if (!ctx.bypassCache) {
        if (auto cached = lookup(key)) {
            LOG_DEBUG("Cache hit for {} on connection {}", ctx.toolName, ctx.connectionId);
            ctx.cacheHit = true;
            return *cached;
        }
    }
    ToolResult result = next(ctx);
    store(key, ctx, result);
    return result;
}

std::size_t CacheInterceptor::Invalidate(ConnectionId connection, const std::optional<std::string>& toolName) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.connection == connection && (!toolName || it->second.toolName == *toolName)) {
            lru_.erase(it->second.lruPos);
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void CacheInterceptor::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
}

CacheStats CacheInterceptor::Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s = stats_;
    s.entries = entries_.size();
    return s;
}

std::size_t CacheInterceptor::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace middleware
} // namespace lmcp
