//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: Child-process transport: fork/exec a tool server and exchange framed messages over its pipes
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "lmcp/ContentFramer.h"
#include "lmcp/Transport.h"

namespace lmcp {

//==========================================================================================================
// ProcessTransportOptions
// Purpose: Tunables for ProcessTransport.
// Fields:
//   framing: Newline (MCP stdio default) or ContentLength.
//   maxFrameBytes: Largest accepted inbound frame; larger frames are a fatal framing error.
//   closeGracePeriod: Time between SIGTERM and SIGKILL during Close().
//   writeTimeout: Upper bound for writing one frame; on expiry stdin is abandoned and every queued
//                 write fails. Zero waits indefinitely.
//   writeQueueMaxBytes: Backpressure cap on bytes queued but not yet written.
//   stderrMode: Log (each line logged), Discard, or Inherit (child shares our stderr).
//==========================================================================================================
struct ProcessTransportOptions {
    enum class StderrMode {
        Log,
        Discard,
        Inherit
    };

    FramingMode framing{FramingMode::Newline};
    std::size_t maxFrameBytes{4 * 1024 * 1024};
    std::chrono::milliseconds closeGracePeriod{5000};
    std::chrono::milliseconds writeTimeout{0};
    std::size_t writeQueueMaxBytes{8 * 1024 * 1024};
    StderrMode stderrMode{StderrMode::Log};

    // Defaults overridden by LMCP_FRAMING, LMCP_MAX_FRAME_BYTES, LMCP_CLOSE_GRACE_MS, LMCP_WRITE_TIMEOUT_MS.
    static ProcessTransportOptions FromEnvironment();

    //==========================================================================================================
    // ParseConfig
    // Purpose: Applies "key=value" pairs separated by ';' or whitespace on top of base
    //          (default-constructed options when omitted).
    // Keys:
    //   framing, max_frame_bytes, close_grace_ms, write_timeout_ms, write_queue_max_bytes, stderr.
    // Notes:
    //   Unknown keys and unparsable values are logged and ignored.
    //==========================================================================================================
    static ProcessTransportOptions ParseConfig(const std::string& config);
    static ProcessTransportOptions ParseConfig(const std::string& config, ProcessTransportOptions base);
};

//==========================================================================================================
// ProcessTransport
// Purpose: ITransport over a child process's stdin/stdout. Pipe I/O runs on a private Boost.Asio
//          io_context thread; Send() blocks until its frame is written, SendAsync() only queues it;
//          Receive() waits on a queue.
//==========================================================================================================
class ProcessTransport : public ITransport {
public:
    explicit ProcessTransport(ProcessTransportOptions options = ProcessTransportOptions{});
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    void Open(const LaunchDescriptor& descriptor) override;
    void Close() override;
    bool IsAlive() const override;
    std::string GetSessionId() const override;
    void Send(const std::string& message) override;
    void SendAsync(const std::string& message, WriteCompletion onComplete) override;
    ReceiveResult Receive(std::chrono::milliseconds timeout) override;

    // OS process id of the child, or -1 before Open.
    int GetPid() const;

    // Exit status as reported by waitpid once the child was reaped.
    std::optional<int> GetExitStatus() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

class ProcessTransportFactory : public ITransportFactory {
public:
    explicit ProcessTransportFactory(ProcessTransportOptions options = ProcessTransportOptions::FromEnvironment());

    // Builds a factory from a "key=value;..." string layered over environment defaults.
    static std::shared_ptr<ProcessTransportFactory> FromConfig(const std::string& config);

    std::unique_ptr<ITransport> CreateTransport(const LaunchDescriptor& descriptor) override;

    const ProcessTransportOptions& Options() const { return options; }

private:
    ProcessTransportOptions options;
};

} // namespace lmcp
