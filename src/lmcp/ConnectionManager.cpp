//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionManager.cpp
// Purpose: ConnectionManager implementation
//==========================================================================================================

#include "logging/Logger.h"
#include "lmcp/ConnectionManager.h"
#include "lmcp/ProcessTransport.hpp"
#include "lmcp/errors/Errors.h"

namespace lmcp {

using namespace lmcp::errors;

ConnectionManager::ConnectionManager(ClientOptions options, std::shared_ptr<ITransportFactory> factory)
    : options_(std::move(options)), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = std::make_shared<ProcessTransportFactory>();
    }
}

ConnectionManager::~ConnectionManager() {
    CloseReport report = CloseAll();
    for (const auto& [id, why] : report.failures) {
        LOG_WARN("Connection {} failed to close during shutdown: {}", id, why);
    }
}

std::shared_ptr<std::mutex> ConnectionManager::descriptorLock(const std::string& key) {
    std::lock_guard<std::mutex> lock(locksMutex_);
    for (auto it = descriptorLocks_.begin(); it != descriptorLocks_.end();) {
        it = it->second.expired() ? descriptorLocks_.erase(it) : std::next(it);
    }
    auto& slot = descriptorLocks_[key];
    auto m = slot.lock();
    if (!m) {
        m = std::make_shared<std::mutex>();
        slot = m;
    }
    return m;
}

ConnectionId ConnectionManager::Open(const LaunchDescriptor& descriptor) {
    FUNC_SCOPE();
    auto serial = descriptorLock(descriptor.Key());
    std::lock_guard<std::mutex> openLock(*serial);

    const ConnectionId id = nextId_.fetch_add(1);
    auto connection = std::make_shared<Connection>(id, descriptor, options_);
    const ServerInfo info = connection->Open(factory_->CreateTransport(descriptor));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.emplace(id, connection);
    }
    LOG_INFO("Opened connection {} to {} ({})", id, info.implementation.name, descriptor.ToString());
    return id;
}

std::shared_ptr<Connection> ConnectionManager::Find(ConnectionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    return it == connections_.end() ? nullptr : it->second;
}

std::shared_ptr<Connection> ConnectionManager::Get(ConnectionId id) const {
    auto connection = Find(id);
    if (!connection) {
        throw UnknownConnectionError(id);
    }
    return connection;
}

std::vector<ConnectionId> ConnectionManager::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConnectionId> ids;
    ids.reserve(connections_.size());
    for (const auto& [id, connection] : connections_) {
        ids.push_back(id);
    }
    return ids;
}

std::size_t ConnectionManager::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void ConnectionManager::Close(ConnectionId id) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            throw UnknownConnectionError(id);
        }
        connection = std::move(it->second);
        connections_.erase(it);
    }
    LOG_INFO("Closing connection {}", id);
    connection->Close();
}

CloseReport ConnectionManager::CloseAll() {
    std::map<ConnectionId, std::shared_ptr<Connection>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(connections_);
    }
    CloseReport report;
    for (auto& [id, connection] : drained) {
        try {
            connection->Close();
        } catch (const std::exception& e) {
            report.failures.emplace_back(id, e.what());
        }
        ++report.closed;
    }
    if (report.closed > 0) {
        LOG_INFO("Closed {} connection(s), {} failure(s)", report.closed, report.failures.size());
    }
    return report;
}

ServerInfo ConnectionManager::Reconnect(ConnectionId id) {
    FUNC_SCOPE();
    auto connection = Get(id);
    auto serial = descriptorLock(connection->Descriptor().Key());
    std::lock_guard<std::mutex> openLock(*serial);
    return connection->Reopen(factory_->CreateTransport(connection->Descriptor()));
}

HealthStatus ConnectionManager::CheckHealth(ConnectionId id, std::optional<std::chrono::milliseconds> timeout) {
    auto connection = Get(id);
    HealthStatus health;
    health.lastCheck = std::chrono::system_clock::now();

    const ConnectionState state = connection->State();
    if (state != ConnectionState::Ready) {
        health.detail = fmt::format("connection is {}", toString(state));
        return health;
    }
    try {
        const auto t0 = std::chrono::steady_clock::now();
        connection->Client()->Ping(timeout);
        const auto rtt = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
        health.status = HealthStatus::Status::Healthy;
        health.detail = fmt::format("ping {} ms", rtt.count());
    } catch (const LmcpError& e) {
        health.detail = fmt::format("ping failed: {} ({})", e.what(), e.KindName());
    }
    return health;
}

} // namespace lmcp
