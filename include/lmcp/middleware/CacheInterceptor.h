//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CacheInterceptor.h
// Purpose: TTL + LRU cache of successful tool results keyed by (connection, tool, canonical args)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "lmcp/middleware/Middleware.h"

namespace lmcp {
namespace middleware {

struct CacheOptions {
    std::chrono::milliseconds ttl{std::chrono::seconds(300)};
    std::size_t maxEntries{1000};   // least recently used entry is evicted beyond this; 0 disables storing
};

struct CacheStats {
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t stores{0};
    uint64_t evictions{0};
    uint64_t expirations{0};
    std::size_t entries{0};
};

//==========================================================================================================
// CacheInterceptor
// Purpose: Returns an unexpired cached result without calling next; otherwise calls next and stores
//          the result on success. Failures are never cached.
// Notes:
//   Argument order inside objects does not affect the key (canonical JSON).
//==========================================================================================================
class CacheInterceptor : public IInterceptor {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit CacheInterceptor(CacheOptions options = {}, Clock clock = nullptr);

    std::string Name() const override { return "cache"; }
    ToolResult Intercept(MiddlewareContext& ctx, const Next& next) override;

    // Drops entries of one connection (optionally one tool); returns the number removed.
    std::size_t Invalidate(ConnectionId connection, const std::optional<std::string>& toolName = std::nullopt);
    void Clear();
    CacheStats Stats() const;
    std::size_t Size() const;

    static std::string MakeKey(ConnectionId connection, const std::string& toolName, const JSONValue& args);

private:
    struct Entry {
        ConnectionId connection;
        std::string toolName;
        ToolResult result;
        std::chrono::steady_clock::time_point expiresAt;
        std::list<std::string>::iterator lruPos;
    };

    std::optional<ToolResult> lookup(const std::string& key);
    void store(const std::string& key, const MiddlewareContext& ctx, const ToolResult& result);

    CacheOptions options_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> lru_;    // front = most recently used
    CacheStats stats_;
};

} // namespace middleware
} // namespace lmcp
