//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <random>
#include <string>

#include "logging/Logger.h"
#include "lmcp/InMemoryTransport.hpp"
#include "lmcp/errors/Errors.h"

namespace lmcp {

class InMemoryTransport::Impl {
public:
    std::string sessionId;
    std::string descriptorText;
    std::atomic<bool> closed{false};
    std::atomic<bool> failOnClose{false};
    std::atomic<std::size_t> sentCount{0};

    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::deque<std::string> messageQueue;
    bool peerClosed{false};

    std::mutex peerMutex;
    std::weak_ptr<Impl> peer;

    std::mutex observerMutex;
    SendObserver observer;

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    std::shared_ptr<Impl> lockPeer() {
        std::lock_guard<std::mutex> lock(peerMutex);
        return peer.lock();
    }

    void deliver(std::string message) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            messageQueue.push_back(std::move(message));
        }
        queueCondition.notify_one();
    }

    void onPeerClosed() {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            peerClosed = true;
        }
        queueCondition.notify_all();
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_shared<Impl>()) {}

InMemoryTransport::~InMemoryTransport() {
    pImpl->failOnClose = false;
    Close();
}

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    auto left = std::make_unique<InMemoryTransport>();
    auto right = std::make_unique<InMemoryTransport>();
    {
        std::lock_guard<std::mutex> lock(left->pImpl->peerMutex);
        left->pImpl->peer = right->pImpl;
    }
    {
        std::lock_guard<std::mutex> lock(right->pImpl->peerMutex);
        right->pImpl->peer = left->pImpl;
    }
    return { std::move(left), std::move(right) };
}

void InMemoryTransport::Open(const LaunchDescriptor& descriptor) {
    FUNC_SCOPE();
    if (pImpl->closed) {
        throw errors::LaunchError("In-memory transport was already closed");
    }
    pImpl->descriptorText = descriptor.ToString();
    LOG_DEBUG("InMemoryTransport {} opened for {}", pImpl->sessionId, pImpl->descriptorText);
}

void InMemoryTransport::Close() {
    FUNC_SCOPE();
    if (!pImpl->closed.exchange(true)) {
        if (auto peer = pImpl->lockPeer()) {
            peer->onPeerClosed();
        }
        {
            std::lock_guard<std::mutex> lock(pImpl->queueMutex);
            pImpl->peerClosed = true;
        }
        pImpl->queueCondition.notify_all();
        if (pImpl->failOnClose) {
            throw errors::TransportClosedError("Simulated close failure on " + pImpl->sessionId);
        }
    }
}

bool InMemoryTransport::IsAlive() const {
    if (pImpl->closed) return false;
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return !pImpl->peerClosed;
}

std::string InMemoryTransport::GetSessionId() const {
    return pImpl->sessionId;
}

void InMemoryTransport::Send(const std::string& message) {
    if (pImpl->closed) {
        throw errors::TransportClosedError("In-memory transport is closed");
    }
    auto peer = pImpl->lockPeer();
    if (!peer || peer->closed) {
        throw errors::TransportClosedError("In-memory peer is closed");
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->observerMutex);
        if (pImpl->observer) {
            pImpl->observer(message);
        }
    }
    LOG_DEBUG("InMemoryTransport {} -> {}", pImpl->sessionId, message);
    peer->deliver(message);
    ++pImpl->sentCount;
}

ReceiveResult InMemoryTransport::Receive(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    pImpl->queueCondition.wait_for(lock, timeout, [this]() {
        return !pImpl->messageQueue.empty() || pImpl->peerClosed;
    });
    if (!pImpl->messageQueue.empty()) {
        std::string msg = std::move(pImpl->messageQueue.front());
        pImpl->messageQueue.pop_front();
        return ReceiveResult::Message(std::move(msg));
    }
    if (pImpl->peerClosed) {
        return ReceiveResult::Eof(pImpl->closed ? "transport closed" : "peer closed");
    }
    return ReceiveResult::TimedOut();
}

void InMemoryTransport::SetSendObserver(SendObserver observer) {
    std::lock_guard<std::mutex> lock(pImpl->observerMutex);
    pImpl->observer = std::move(observer);
}

void InMemoryTransport::SetFailOnClose(bool fail) {
    pImpl->failOnClose = fail;
}

std::size_t InMemoryTransport::SentCount() const {
    return pImpl->sentCount.load();
}

} // namespace lmcp
