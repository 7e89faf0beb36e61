//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Message-level transport interface between the protocol client and a tool server
//==========================================================================================================

#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>

#include "lmcp/LaunchDescriptor.h"

namespace lmcp {

//==========================================================================================================
// ReceiveResult
// Purpose: Outcome of ITransport::Receive.
// Fields:
//   status: Message (payload holds one decoded frame), Eof (peer closed its output or the transport
//           was closed), Timeout (nothing arrived in time), FramingError (inbound stream is corrupt;
//           detail describes why, the transport delivers nothing further).
//==========================================================================================================
struct ReceiveResult {
    enum class Status {
        Message,
        Eof,
        Timeout,
        FramingError
    };
    Status status{Status::Timeout};
    std::string payload;
    std::string detail;

    static ReceiveResult Message(std::string p) { return { Status::Message, std::move(p), {} }; }
    static ReceiveResult Eof(std::string why = {}) { return { Status::Eof, {}, std::move(why) }; }
    static ReceiveResult TimedOut() { return { Status::Timeout, {}, {} }; }
    static ReceiveResult Framing(std::string why) { return { Status::FramingError, {}, std::move(why) }; }
};

//==========================================================================================================
// Transport interface
// Purpose: Owns one peer (normally a child process) and moves whole framed messages.
// Notes:
//   - Send may be called from any thread; writes are serialized and one message is written as a unit.
//   - Receive has a single consumer (the protocol client's reader loop).
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the peer described by the descriptor.
    // Args:
    //   descriptor: Executable, arguments, working directory and environment overrides.
    // Throws:
    //   LaunchError when the peer cannot be started.
    //==========================================================================================================
    virtual void Open(const LaunchDescriptor& descriptor) = 0;

    //==========================================================================================================
    // Terminates the peer and releases OS resources. Idempotent; never throws for an already closed transport.
    //==========================================================================================================
    virtual void Close() = 0;

    //==========================================================================================================
    // True while open, not closed and the peer has not exited.
    //==========================================================================================================
    virtual bool IsAlive() const = 0;

    //==========================================================================================================
    // Diagnostic identifier (e.g., "pid-1234" or "memory-5678").
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message I/O ///////////////////////////////////////////
    //==========================================================================================================
    // Frames and writes one message.
    // Args:
    //   message: Serialized JSON text without framing.
    // Throws:
    //   TransportClosedError when the peer exited or the stream is closed.
    //==========================================================================================================
    virtual void Send(const std::string& message) = 0;

    // Receives nullptr once the message was written, or the write failure.
    using WriteCompletion = std::function<void(std::exception_ptr)>;

    //==========================================================================================================
    // Queues one message and returns without waiting for it to reach the peer.
    // Args:
    //   message: Serialized JSON text without framing.
    //   onComplete: Invoked exactly once, possibly on another thread, with the write outcome.
    // Throws:
    //   TransportClosedError when the message cannot be queued (onComplete is then not invoked).
    // Notes:
    //   The default writes through Send(), so it only suits transports whose Send never blocks.
    //==========================================================================================================
    virtual void SendAsync(const std::string& message, WriteCompletion onComplete) {
        Send(message);
        if (onComplete) onComplete(nullptr);
    }

    //==========================================================================================================
    // Waits for the next decoded message.
    // Args:
    //   timeout: Longest time to wait.
    // Returns:
    //   ReceiveResult (Message | Eof | Timeout | FramingError). Messages received before the peer closed
    //   its output are delivered before Eof.
    //==========================================================================================================
    virtual ReceiveResult Receive(std::chrono::milliseconds timeout) = 0;
};

//==========================================================================================================
// Transport factory interface
// Purpose: Creates unopened transports; the connection manager calls Open with the descriptor.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance for the given descriptor (not yet opened).
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const LaunchDescriptor& descriptor) = 0;
};

} // namespace lmcp
