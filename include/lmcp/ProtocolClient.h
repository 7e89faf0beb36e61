//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolClient.h
// Purpose: JSON-RPC client over one transport: handshake, request correlation and the reader loop
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "lmcp/ClientOptions.h"
#include "lmcp/JSONRPCTypes.h"
#include "lmcp/LaunchDescriptor.h"
#include "lmcp/Protocol.h"
#include "lmcp/Transport.h"

namespace lmcp {

//==========================================================================================================
// ConnectionState
// Purpose: Lifecycle of a ProtocolClient.
//   Disconnected -> Connecting -> Handshaking -> Ready -> Closing -> Closed
//   Any state may drop straight to Closed when the transport dies. A failed handshake returns to
//   Disconnected.
//==========================================================================================================
enum class ConnectionState {
    Disconnected,
    Connecting,
    Handshaking,
    Ready,
    Closing,
    Closed
};

const char* toString(ConnectionState state);

//==========================================================================================================
// ProtocolClient
// Purpose: Speaks JSON-RPC 2.0 over an ITransport it owns.
// Notes:
//   - One reader thread per client is the sole consumer of ITransport::Receive.
//   - Any number of callers may have requests outstanding; responses are matched purely by id.
//   - Request ids start at firstRequestId and are never reused by this client.
//==========================================================================================================
class ProtocolClient {
public:
    using NotificationHandler = std::function<void(const JSONRPCNotification&)>;

    ProtocolClient(std::unique_ptr<ITransport> transport, ClientOptions options = ClientOptions(),
                   int64_t firstRequestId = 1);
    ~ProtocolClient();

    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    ////////////////////////////////////////// Lifecycle //////////////////////////////////////////
    //==========================================================================================================
    // Opens the transport for the descriptor and starts the reader loop.
    // Throws:
    //   LaunchError (state returns to Disconnected); ConnectionClosedError when not Disconnected.
    //==========================================================================================================
    void Connect(const LaunchDescriptor& descriptor);

    //==========================================================================================================
    // Runs initialize / notifications/initialized and moves the client to Ready.
    // Returns:
    //   ServerInfo reported by the server.
    // Throws:
    //   HandshakeError (Timeout | Malformed | Rejected | TransportFailure); the transport is closed and
    //   the state is Disconnected afterwards.
    //==========================================================================================================
    ServerInfo Handshake();

    //==========================================================================================================
    // Fails every pending request with ConnectionLostError, closes the transport and stops the reader.
    // Idempotent. When called from a notification handler the reader is not waited for.
    // Throws:
    //   Whatever the transport's Close threw, after the client reached Closed.
    //==========================================================================================================
    void Close();

    ////////////////////////////////////////// Requests //////////////////////////////////////////
    //==========================================================================================================
    // Sends a request and blocks for its result.
    // Args:
    //   method: JSON-RPC method name.
    //   params: Optional params value.
    //   timeout: Per-call deadline; defaults to ClientOptions::requestTimeout (zero means none).
    // Throws:
    //   ConnectionClosedError (not Ready), TimeoutError, ConnectionLostError, TransportClosedError,
    //   ProtocolError (server answered with a JSON-RPC error).
    //==========================================================================================================
    JSONValue CallMethod(const std::string& method, std::optional<JSONValue> params = std::nullopt,
                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Same as CallMethod; every failure is delivered through the future.
    std::future<JSONValue> CallMethodAsync(const std::string& method, std::optional<JSONValue> params = std::nullopt,
                                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Fire-and-forget notification. Throws ConnectionClosedError when not Ready.
    void Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    // Round trip of the ping method.
    void Ping(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    ////////////////////////////////////////// Notifications //////////////////////////////////////////
    // Handlers run on the reader thread; exceptions they throw are logged.
    void SetNotificationHandler(const std::string& method, NotificationHandler handler);
    void RemoveNotificationHandler(const std::string& method);
    void SetDefaultNotificationHandler(NotificationHandler handler);

    ////////////////////////////////////////// Introspection //////////////////////////////////////////
    ConnectionState State() const;
    std::size_t PendingCount() const;
    // Id the next request will carry.
    int64_t NextRequestId() const;
    std::optional<ServerInfo> GetServerInfo() const;
    std::string SessionId() const;
    const ClientOptions& Options() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;   // shared with the reader thread so a detached reader outlives the client
};

} // namespace lmcp
