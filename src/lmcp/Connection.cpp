//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.cpp
// Purpose: Connection lifecycle and client replacement on reconnect
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "lmcp/Connection.h"
#include "lmcp/errors/Errors.h"

namespace lmcp {

Connection::Connection(ConnectionId id, LaunchDescriptor descriptor, ClientOptions options)
    : id_(id),
      descriptor_(std::move(descriptor)),
      options_(std::move(options)),
      createdAt_(std::chrono::system_clock::now()) {}

Connection::~Connection() {
    try {
        Close();
    } catch (const std::exception& e) {
        LOG_WARN("Connection {} did not close cleanly: {}", id_, e.what());
    }
}

ServerInfo Connection::Open(std::unique_ptr<ITransport> transport) {
    std::lock_guard<std::mutex> openLock(openMutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (client_ && client_->State() == ConnectionState::Ready) {
            throw errors::ConnectionClosedError(fmt::format("Connection {} is already open", id_));
        }
    }
    return openLocked(std::move(transport));
}

ServerInfo Connection::Reopen(std::unique_ptr<ITransport> transport) {
    std::lock_guard<std::mutex> openLock(openMutex_);
    std::shared_ptr<ProtocolClient> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = client_;
    }
    int64_t resumeAt = 1;
    if (previous) {
        try {
            previous->Close();
        } catch (const std::exception& e) {
            LOG_WARN("Connection {}: closing the previous client failed: {}", id_, e.what());
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (previous) {
            nextRequestId_ = std::max(nextRequestId_, previous->NextRequestId());
        }
        resumeAt = nextRequestId_;
    }
    registry_.Invalidate();
    LOG_INFO("Reconnecting connection {} ({}) from request id {}", id_, descriptor_.ToString(), resumeAt);
    return openLocked(std::move(transport));
}

ServerInfo Connection::openLocked(std::unique_ptr<ITransport> transport) {
    int64_t firstId = 1;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (client_) {
            nextRequestId_ = std::max(nextRequestId_, client_->NextRequestId());
        }
        firstId = nextRequestId_;
    }

    auto client = std::make_shared<ProtocolClient>(std::move(transport), options_, firstId);
    const auto invalidate = [this](const JSONRPCNotification& n) {
        LOG_INFO("Connection {}: {} received, dropping cached schemas", id_, n.method);
        registry_.Invalidate();
    };
    client->SetNotificationHandler(Methods::ToolListChanged, invalidate);
    client->SetNotificationHandler(Methods::ResourceListChanged, invalidate);

    ServerInfo info;
    try {
        client->Connect(descriptor_);
        info = client->Handshake();
    } catch (const errors::LmcpError&) {
        std::lock_guard<std::mutex> lock(mutex_);
        nextRequestId_ = client->NextRequestId();
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    client_ = std::move(client);
    return info;
}

void Connection::Close() {
    std::shared_ptr<ProtocolClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client = client_;
    }
    if (client) {
        client->Close();
    }
}

ConnectionState Connection::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_ ? client_->State() : ConnectionState::Disconnected;
}

int64_t Connection::NextRequestId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_ ? client_->NextRequestId() : nextRequestId_;
}

std::optional<ServerInfo> Connection::GetServerInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_ ? client_->GetServerInfo() : std::nullopt;
}

std::shared_ptr<ProtocolClient> Connection::Client() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_) {
        throw errors::ConnectionClosedError(fmt::format("Connection {} has not been opened", id_));
    }
    return client_;
}

} // namespace lmcp
