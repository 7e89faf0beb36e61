//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionManager.h
// Purpose: Registry of open connections with per-descriptor open serialization and orderly teardown
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lmcp/ClientOptions.h"
#include "lmcp/Connection.h"
#include "lmcp/LaunchDescriptor.h"
#include "lmcp/Transport.h"

namespace lmcp {

struct HealthStatus {
    enum class Status {
        Healthy,
        Unhealthy
    };
    Status status{Status::Unhealthy};
    std::chrono::system_clock::time_point lastCheck{};
    std::string detail;

    bool IsHealthy() const { return status == Status::Healthy; }
};

// Outcome of CloseAll: how many connections were closed and which ones reported a failure.
struct CloseReport {
    std::size_t closed{0};
    std::vector<std::pair<ConnectionId, std::string>> failures;

    bool Ok() const { return failures.empty(); }
};

//==========================================================================================================
// ConnectionManager
// Purpose: Owns every Connection opened through it.
// Notes:
//   - Opens for the same LaunchDescriptor::Key() are serialized; different descriptors open in parallel.
//   - Connection ids are never reused by one manager.
//   - The destructor closes everything (CloseAll) and logs failures.
//==========================================================================================================
class ConnectionManager {
public:
    explicit ConnectionManager(ClientOptions options = ClientOptions::FromEnvironment(),
                               std::shared_ptr<ITransportFactory> factory = nullptr);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    //==========================================================================================================
    // Open
    // Purpose: Starts the server, runs the handshake and registers the connection.
    // Throws:
    //   LaunchError, HandshakeError; nothing stays registered or running on failure.
    //==========================================================================================================
    ConnectionId Open(const LaunchDescriptor& descriptor);

    // Throws UnknownConnectionError when id is not registered.
    std::shared_ptr<Connection> Get(ConnectionId id) const;
    // nullptr when id is not registered.
    std::shared_ptr<Connection> Find(ConnectionId id) const;
    std::vector<ConnectionId> List() const;
    std::size_t Size() const;

    //==========================================================================================================
    // Close
    // Purpose: Unregisters and closes one connection; its pending requests fail with ConnectionLostError.
    // Throws:
    //   UnknownConnectionError; transport close failures (the connection is unregistered regardless).
    //==========================================================================================================
    void Close(ConnectionId id);

    // Closes every connection, collecting failures instead of throwing.
    CloseReport CloseAll();

    //==========================================================================================================
    // Reconnect
    // Purpose: Replaces the connection's transport and client under the same id. Cached schemas are
    //          dropped; request ids continue from the previous client.
    //==========================================================================================================
    ServerInfo Reconnect(ConnectionId id);

    // State check followed by a ping round trip. Never throws for a registered id.
    HealthStatus CheckHealth(ConnectionId id, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    const ClientOptions& Options() const { return options_; }

private:
    std::shared_ptr<std::mutex> descriptorLock(const std::string& key);

    const ClientOptions options_;
    std::shared_ptr<ITransportFactory> factory_;
    std::atomic<ConnectionId> nextId_{1};

    mutable std::mutex mutex_;
    std::map<ConnectionId, std::shared_ptr<Connection>> connections_;

    std::mutex locksMutex_;
    std::map<std::string, std::weak_ptr<std::mutex>> descriptorLocks_;
};

} // namespace lmcp
