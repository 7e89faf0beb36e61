//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.h
// Purpose: One managed connection: identity, launch descriptor, protocol client and schema cache
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include "lmcp/ClientOptions.h"
#include "lmcp/LaunchDescriptor.h"
#include "lmcp/ProtocolClient.h"
#include "lmcp/SchemaRegistry.h"
#include "lmcp/Transport.h"

namespace lmcp {

using ConnectionId = std::uint64_t;

//==========================================================================================================
// Connection
// Purpose: Binds a ConnectionId to the ProtocolClient currently serving it.
// Notes:
//   - Reopen swaps in a fresh client; request ids continue from where the previous client stopped.
//   - The schema registry is invalidated on reopen and on list_changed notifications.
//==========================================================================================================
class Connection {
public:
    Connection(ConnectionId id, LaunchDescriptor descriptor, ClientOptions options);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    //==========================================================================================================
    // Starts the peer on the transport and completes the handshake.
    // Throws:
    //   LaunchError, HandshakeError; nothing is left running on failure.
    //==========================================================================================================
    ServerInfo Open(std::unique_ptr<ITransport> transport);

    // Closes the current client (if any), drops cached schemas and opens again on the new transport.
    ServerInfo Reopen(std::unique_ptr<ITransport> transport);

    void Close();

    ConnectionId Id() const { return id_; }
    const LaunchDescriptor& Descriptor() const { return descriptor_; }
    std::chrono::system_clock::time_point CreatedAt() const { return createdAt_; }
    const ClientOptions& Options() const { return options_; }

    ConnectionState State() const;
    int64_t NextRequestId() const;
    std::optional<ServerInfo> GetServerInfo() const;

    // Current client. Throws ConnectionClosedError when the connection was never opened.
    std::shared_ptr<ProtocolClient> Client() const;

    SchemaRegistry& Schemas() { return registry_; }
    const SchemaRegistry& Schemas() const { return registry_; }

private:
    ServerInfo openLocked(std::unique_ptr<ITransport> transport);

    const ConnectionId id_;
    const LaunchDescriptor descriptor_;
    const ClientOptions options_;
    const std::chrono::system_clock::time_point createdAt_;

    std::mutex openMutex_;
    mutable std::mutex mutex_;
    std::shared_ptr<ProtocolClient> client_;
    int64_t nextRequestId_{1};
    SchemaRegistry registry_;
};

} // namespace lmcp
