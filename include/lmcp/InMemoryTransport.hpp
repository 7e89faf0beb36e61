//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory transport for tests and embedding
//==========================================================================================================
#pragma once

#include "lmcp/Transport.h"
#include <functional>
#include <memory>
#include <utility>

namespace lmcp {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process transport used for tests and embedding. Messages sent on one endpoint are
//          received by its paired endpoint; closing either endpoint delivers Eof to the other.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    ~InMemoryTransport() override;

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two paired transports wired to each other in-memory.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    // Open only marks the endpoint live; the descriptor is recorded for diagnostics.
    void Open(const LaunchDescriptor& descriptor) override;
    void Close() override;
    bool IsAlive() const override;
    std::string GetSessionId() const override;
    void Send(const std::string& message) override;
    ReceiveResult Receive(std::chrono::milliseconds timeout) override;

    ////////////////////////////////////////// test hooks //////////////////////////////////////////
    // Observes every outbound message before delivery (runs on the sending thread).
    using SendObserver = std::function<void(const std::string&)>;
    void SetSendObserver(SendObserver observer);

    // Makes Close() throw after closing (used to exercise best-effort shutdown paths).
    void SetFailOnClose(bool fail);

    // Number of messages successfully sent from this endpoint.
    std::size_t SentCount() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace lmcp
