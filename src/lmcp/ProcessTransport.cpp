//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: fork/exec child-process transport with Boost.Asio pipe I/O
//==========================================================================================================

#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "lmcp/ProcessTransport.hpp"
#include "lmcp/errors/Errors.h"

extern char** environ;

namespace lmcp {

namespace net = boost::asio;
using errors::LaunchError;
using errors::TransportClosedError;

namespace {

std::once_flag gSigpipeOnce;

// Writes to a pipe whose reader died must surface as EPIPE, not kill the process.
void ignoreSigpipe() {
    std::call_once(gSigpipeOnce, []() { ::signal(SIGPIPE, SIG_IGN); });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct PipePair {
    int read{-1};
    int write{-1};
    ~PipePair() { closeFd(read); closeFd(write); }
    void open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            const int err = errno;
            throw LaunchError(std::string("pipe2 failed: ") + std::strerror(err), err);
        }
        read = fds[0];
        write = fds[1];
    }
    int releaseRead() { int fd = read; read = -1; return fd; }
    int releaseWrite() { int fd = write; write = -1; return fd; }
};

bool isExecutableFile(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

// PATH lookup happens in the parent so a missing executable is reported before forking.
std::optional<std::string> resolveExecutable(const std::string& command, const std::string& pathVar) {
    if (command.empty()) {
        return std::nullopt;
    }
    if (command.find('/') != std::string::npos) {
        return isExecutableFile(command) ? std::optional<std::string>(command) : std::nullopt;
    }
    std::size_t start = 0;
    while (start <= pathVar.size()) {
        std::size_t end = pathVar.find(':', start);
        if (end == std::string::npos) end = pathVar.size();
        std::string dir = pathVar.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + command;
        if (isExecutableFile(candidate)) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        const auto eq = entry.find('=');
        const std::string key = entry.substr(0, eq);
        if (overrides.find(key) == overrides.end()) {
            env.push_back(std::move(entry));
        }
    }
    for (const auto& [k, v] : overrides) {
        env.push_back(k + "=" + v);
    }
    return env;
}

// Child side of fork(): only async-signal-safe calls from here on.
void moveFdTo(int src, int dst) {
    if (src == dst) {
        ::fcntl(dst, F_SETFD, 0);
    } else {
        ::dup2(src, dst);
    }
}

enum ChildStage : int { StageChdir = 1, StageExec = 2 };

[[noreturn]] void reportChildFailure(int errFd, int stage) {
    int msg[2] = { stage, errno };
    ssize_t ignored = ::write(errFd, msg, sizeof(msg));
    (void)ignored;
    ::_exit(127);
}

} // namespace

//==========================================================================================================
// ProcessTransportOptions
//==========================================================================================================
ProcessTransportOptions ProcessTransportOptions::FromEnvironment() {
    ProcessTransportOptions o;
    const std::string framing = GetEnvOrDefault("LMCP_FRAMING", "");
    if (!framing.empty()) {
        if (auto mode = parseFramingMode(framing)) {
            o.framing = *mode;
        } else {
            LOG_WARN("Ignoring unknown LMCP_FRAMING value: {}", framing);
        }
    }
    o.maxFrameBytes = static_cast<std::size_t>(GetEnvUint64OrDefault("LMCP_MAX_FRAME_BYTES", o.maxFrameBytes));
    o.closeGracePeriod = std::chrono::milliseconds(
        GetEnvUint64OrDefault("LMCP_CLOSE_GRACE_MS", static_cast<uint64_t>(o.closeGracePeriod.count())));
    o.writeTimeout = std::chrono::milliseconds(
        GetEnvUint64OrDefault("LMCP_WRITE_TIMEOUT_MS", static_cast<uint64_t>(o.writeTimeout.count())));
    return o;
}

ProcessTransportOptions ProcessTransportOptions::ParseConfig(const std::string& config) {
    return ParseConfig(config, ProcessTransportOptions{});
}

ProcessTransportOptions ProcessTransportOptions::ParseConfig(const std::string& config, ProcessTransportOptions base) {
    ProcessTransportOptions o = base;
    std::string token;
    for (std::size_t i = 0; i < config.size();) {
        // Skip separators and spaces
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        token = config.substr(start, i - start);
        const auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("Ignoring transport option without value: {}", token);
            continue;
        }
        const auto key = token.substr(0, eq);
        const auto val = token.substr(eq + 1);
        uint64_t v = 0;
        if (key == "framing") {
            if (auto mode = parseFramingMode(val)) o.framing = *mode;
            else LOG_WARN("Unknown framing '{}'", val);
        } else if (key == "max_frame_bytes" && ParseUint64(val, v)) {
            o.maxFrameBytes = static_cast<std::size_t>(v);
        } else if (key == "close_grace_ms" && ParseUint64(val, v)) {
            o.closeGracePeriod = std::chrono::milliseconds(v);
        } else if (key == "write_timeout_ms" && ParseUint64(val, v)) {
            o.writeTimeout = std::chrono::milliseconds(v);
        } else if (key == "write_queue_max_bytes" && ParseUint64(val, v)) {
            o.writeQueueMaxBytes = static_cast<std::size_t>(v);
        } else if (key == "stderr") {
            if (val == "log") o.stderrMode = StderrMode::Log;
            else if (val == "discard") o.stderrMode = StderrMode::Discard;
            else if (val == "inherit") o.stderrMode = StderrMode::Inherit;
            else LOG_WARN("Unknown stderr mode '{}'", val);
        } else {
            LOG_WARN("Ignoring transport option {}={}", key, val);
        }
    }
    return o;
}

//==========================================================================================================
// ProcessTransport::Impl
//==========================================================================================================
class ProcessTransport::Impl {
public:
    struct PendingWrite {
        std::string frame;
        std::promise<void> done;
        ITransport::WriteCompletion onComplete;
        std::atomic<bool> settled{false};

        void settle(std::exception_ptr e = nullptr) {
            if (settled.exchange(true)) return;
            if (e) done.set_exception(e); else done.set_value();
            if (onComplete) onComplete(e);
        }
    };

    // Touched only on the io thread.
    struct WriteLimitState {
        bool finished{false};
        bool expired{false};
    };

    ProcessTransportOptions options;
    std::unique_ptr<IContentFramer> decoder;
    std::unique_ptr<IContentFramer> encoder;

    net::io_context ioc;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    std::unique_ptr<net::posix::stream_descriptor> stdinPipe;
    std::unique_ptr<net::posix::stream_descriptor> stdoutPipe;
    std::unique_ptr<net::posix::stream_descriptor> stderrPipe;
    std::thread ioThread;

    std::string descriptorText;
    pid_t pid{-1};
    mutable std::mutex procMutex;
    mutable std::optional<int> exitStatus;

    std::atomic<bool> opened{false};
    std::atomic<bool> closed{false};
    std::mutex closeMutex;

    // Inbound side (filled by the io thread, drained by Receive)
    std::mutex inMutex;
    std::condition_variable inCv;
    std::deque<ReceiveResult> inbound;
    bool eof{false};
    std::string eofReason;
    std::string readBuffer;

    // Outbound side
    std::mutex writeMutex;
    std::deque<std::shared_ptr<PendingWrite>> writeQueue;
    std::shared_ptr<PendingWrite> inFlight;
    std::size_t queuedBytes{0};
    bool writing{false};
    bool writeFailed{false};
    std::string writeError;

    explicit Impl(ProcessTransportOptions opts)
        : options(std::move(opts)),
          decoder(MakeFramer(options.framing, options.maxFrameBytes)),
          encoder(MakeFramer(options.framing, options.maxFrameBytes)) {}

    //////////////////////////////////////// process lifecycle ////////////////////////////////////////
    void spawn(const LaunchDescriptor& d) {
        FUNC_SCOPE();
        ignoreSigpipe();
        descriptorText = d.ToString();

        std::string pathVar = GetEnvOrDefault("PATH", "/usr/local/bin:/usr/bin:/bin");
        auto pathOverride = d.environment.find("PATH");
        if (pathOverride != d.environment.end()) {
            pathVar = pathOverride->second;
        }
        const auto executable = resolveExecutable(d.command, pathVar);
        if (!executable) {
            throw LaunchError("Executable not found or not executable: " + d.command, ENOENT);
        }
        if (!d.workingDirectory.empty()) {
            struct stat st{};
            if (::stat(d.workingDirectory.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
                throw LaunchError("Working directory does not exist: " + d.workingDirectory, ENOTDIR);
            }
        }

        // Everything the child needs is prepared before fork()
        std::vector<std::string> argvStorage;
        argvStorage.push_back(d.command);
        argvStorage.insert(argvStorage.end(), d.args.begin(), d.args.end());
        std::vector<char*> argv;
        for (auto& a : argvStorage) argv.push_back(a.data());
        argv.push_back(nullptr);
        std::vector<std::string> envStorage = buildEnvironment(d.environment);
        std::vector<char*> envp;
        for (auto& e : envStorage) envp.push_back(e.data());
        envp.push_back(nullptr);
        const char* cwd = d.workingDirectory.empty() ? nullptr : d.workingDirectory.c_str();
        const bool captureStderr = options.stderrMode != ProcessTransportOptions::StderrMode::Inherit;

        PipePair toChild, fromChild, errFromChild, execStatus;
        toChild.open();
        fromChild.open();
        if (captureStderr) errFromChild.open();
        execStatus.open();

        const pid_t child = ::fork();
        if (child < 0) {
            const int err = errno;
            throw LaunchError(std::string("fork failed: ") + std::strerror(err), err);
        }
        if (child == 0) {
            moveFdTo(toChild.read, STDIN_FILENO);
            moveFdTo(fromChild.write, STDOUT_FILENO);
            if (captureStderr) moveFdTo(errFromChild.write, STDERR_FILENO);
            if (cwd != nullptr && ::chdir(cwd) != 0) {
                reportChildFailure(execStatus.write, StageChdir);
            }
            ::execve(executable->c_str(), argv.data(), envp.data());
            reportChildFailure(execStatus.write, StageExec);
        }

        pid = child;
        closeFd(toChild.read);
        closeFd(fromChild.write);
        closeFd(errFromChild.write);
        closeFd(execStatus.write);

        // A successful execve closes the CLOEXEC status pipe, so read() sees EOF
        int msg[2] = {0, 0};
        ssize_t n = -1;
        do {
            n = ::read(execStatus.read, msg, sizeof(msg));
        } while (n < 0 && errno == EINTR);
        if (n == static_cast<ssize_t>(sizeof(msg))) {
            int status = 0;
            ::waitpid(pid, &status, 0);
            exitStatus = status;
            const char* stage = msg[0] == StageChdir ? "chdir" : "execve";
            throw LaunchError(std::string(stage) + " failed for " + descriptorText + ": " + std::strerror(msg[1]), msg[1]);
        }

        stdinPipe = std::make_unique<net::posix::stream_descriptor>(ioc, toChild.releaseWrite());
        stdoutPipe = std::make_unique<net::posix::stream_descriptor>(ioc, fromChild.releaseRead());
        if (captureStderr) {
            stderrPipe = std::make_unique<net::posix::stream_descriptor>(ioc, errFromChild.releaseRead());
        }
        LOG_INFO("Started tool server pid={} cmd={}", pid, descriptorText);
    }

    // True once the child has exited (and was reaped).
    bool reapNonBlocking() const {
        std::lock_guard<std::mutex> lock(procMutex);
        if (exitStatus.has_value()) return true;
        if (pid <= 0) return false;
        int status = 0;
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            exitStatus = status;
            return true;
        }
        if (r < 0 && errno == ECHILD) {
            exitStatus = -1;
            return true;
        }
        return false;
    }

    void reapBlocking() {
        std::lock_guard<std::mutex> lock(procMutex);
        if (exitStatus.has_value() || pid <= 0) return;
        int status = 0;
        pid_t r = -1;
        do {
            r = ::waitpid(pid, &status, 0);
        } while (r < 0 && errno == EINTR);
        exitStatus = (r == pid) ? status : -1;
    }

    void terminateChild() {
        if (reapNonBlocking()) return;
        ::kill(pid, SIGTERM);
        const auto deadline = std::chrono::steady_clock::now() + options.closeGracePeriod;
        while (std::chrono::steady_clock::now() < deadline) {
            if (reapNonBlocking()) {
                LOG_DEBUG("Tool server pid={} exited after SIGTERM", pid);
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        LOG_WARN("Tool server pid={} ignored SIGTERM for {} ms; sending SIGKILL", pid, options.closeGracePeriod.count());
        ::kill(pid, SIGKILL);
        reapBlocking();
    }

    //////////////////////////////////////// inbound ////////////////////////////////////////
    void finishInbound(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(inMutex);
            if (!eof) {
                eof = true;
                eofReason = reason;
            }
        }
        inCv.notify_all();
    }

    // Returns false when the stream became unusable.
    bool drainFrames() {
        while (true) {
            auto r = decoder->tryDecodeEx(readBuffer);
            switch (r.status) {
                case IContentFramer::DecodeStatus::Ok: {
                    readBuffer.erase(0, r.bytesConsumed);
                    {
                        std::lock_guard<std::mutex> lock(inMutex);
                        inbound.push_back(ReceiveResult::Message(std::move(*r.payload)));
                    }
                    inCv.notify_one();
                    break;
                }
                case IContentFramer::DecodeStatus::Skipped:
                    readBuffer.erase(0, r.bytesConsumed);
                    break;
                case IContentFramer::DecodeStatus::Incomplete:
                    return true;
                case IContentFramer::DecodeStatus::InvalidHeader:
                case IContentFramer::DecodeStatus::BodyTooLarge: {
                    const std::string why = r.status == IContentFramer::DecodeStatus::BodyTooLarge
                        ? "inbound frame exceeds " + std::to_string(options.maxFrameBytes) + " bytes"
                        : std::string("invalid frame header");
                    LOG_ERROR("Framing error from {}: {}", descriptorText, why);
                    {
                        std::lock_guard<std::mutex> lock(inMutex);
                        inbound.push_back(ReceiveResult::Framing(why));
                    }
                    finishInbound("framing error: " + why);
                    return false;
                }
            }
        }
    }

    net::awaitable<void> readStdout() {
        std::array<char, 64 * 1024> chunk{};
        while (true) {
            boost::system::error_code ec;
            const std::size_t n = co_await stdoutPipe->async_read_some(
                net::buffer(chunk), net::redirect_error(net::use_awaitable, ec));
            if (n > 0) {
                readBuffer.append(chunk.data(), n);
                if (!drainFrames()) co_return;
            }
            if (ec) {
                finishInbound(ec == net::error::eof ? "server closed its output" : "read failed: " + ec.message());
                co_return;
            }
        }
    }

    net::awaitable<void> readStderr() {
        std::array<char, 8 * 1024> chunk{};
        std::string pending;
        while (true) {
            boost::system::error_code ec;
            const std::size_t n = co_await stderrPipe->async_read_some(
                net::buffer(chunk), net::redirect_error(net::use_awaitable, ec));
            if (n > 0 && options.stderrMode == ProcessTransportOptions::StderrMode::Log) {
                pending.append(chunk.data(), n);
                std::size_t eol;
                while ((eol = pending.find('\n')) != std::string::npos) {
                    LOG_INFO("[server pid={}] {}", pid, pending.substr(0, eol));
                    pending.erase(0, eol + 1);
                }
                if (pending.size() > options.maxFrameBytes) {
                    pending.clear();
                }
            }
            if (ec) {
                if (!pending.empty()) {
                    LOG_INFO("[server pid={}] {}", pid, pending);
                }
                co_return;
            }
        }
    }

    //////////////////////////////////////// outbound ////////////////////////////////////////
    // Queues one frame for the writer coroutine; throws TransportClosedError when that is impossible.
    // Completion handler for spawned coroutines; they report failures through state, so this only logs.
    auto logCompletion(const char* what) {
        return [this, what](std::exception_ptr e) {
            if (!e) return;
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                LOG_ERROR("{} coroutine for {} failed: {}", what, descriptorText, ex.what());
            }
            finishInbound(std::string(what) + " failed");
        };
    }

    std::future<void> enqueue(const std::string& message, ITransport::WriteCompletion onComplete) {
        if (!opened || closed) {
            throw TransportClosedError("Transport is not open");
        }
        if (reapNonBlocking()) {
            throw TransportClosedError("Tool server process has exited");
        }
        auto pw = std::make_shared<PendingWrite>();
        pw->onComplete = std::move(onComplete);
        std::future<void> done = pw->done.get_future();
        std::lock_guard<std::mutex> lock(writeMutex);
        if (writeFailed) {
            throw TransportClosedError(writeError);
        }
        pw->frame = encoder->encode(message);
        if (queuedBytes + pw->frame.size() > options.writeQueueMaxBytes) {
            throw TransportClosedError("Write queue limit exceeded (" +
                                       std::to_string(options.writeQueueMaxBytes) + " bytes)");
        }
        queuedBytes += pw->frame.size();
        writeQueue.push_back(pw);
        if (!writing) {
            writing = true;
            net::co_spawn(ioc, writeLoop(), logCompletion("writer"));
        }
        return done;
    }

    void failWrites(const std::string& why) {
        std::deque<std::shared_ptr<PendingWrite>> failed;
        {
            std::lock_guard<std::mutex> lock(writeMutex);
            writeFailed = true;
            if (writeError.empty()) writeError = why;
            writing = false;
            failed.swap(writeQueue);
            if (inFlight) failed.push_front(std::move(inFlight));
            inFlight.reset();
            queuedBytes = 0;
        }
        for (auto& w : failed) {
            w->settle(std::make_exception_ptr(TransportClosedError(why)));
        }
    }

    net::awaitable<void> writeLoop() {
        while (true) {
            std::shared_ptr<PendingWrite> next;
            {
                std::lock_guard<std::mutex> lock(writeMutex);
                if (writeQueue.empty()) {
                    writing = false;
                    co_return;
                }
                next = writeQueue.front();
                writeQueue.pop_front();
                queuedBytes -= next->frame.size();
                inFlight = next;
            }
            boost::system::error_code ec;
            // Shared with the timer handler, which may still be queued after this write finished
            auto limitState = std::make_shared<WriteLimitState>();
            if (!stdinPipe || !stdinPipe->is_open()) {
                ec = net::error::bad_descriptor;
            } else {
                net::steady_timer limit(ioc);
                if (options.writeTimeout.count() > 0) {
                    limit.expires_after(options.writeTimeout);
                    limit.async_wait([this, limitState](const boost::system::error_code& tec) {
                        if (tec || limitState->finished || !stdinPipe) return;
                        limitState->expired = true;
                        boost::system::error_code ignored;
                        stdinPipe->cancel(ignored);
                    });
                }
                co_await net::async_write(*stdinPipe, net::buffer(next->frame),
                                          net::redirect_error(net::use_awaitable, ec));
                limitState->finished = true;
                limit.cancel();
            }
            if (ec) {
                const std::string why = limitState->expired
                    ? "timed out writing to server stdin after " + std::to_string(options.writeTimeout.count()) + " ms"
                    : "write to server stdin failed: " + ec.message();
                LOG_WARN("Write to {} failed: {}", descriptorText, why);
                // A partially written frame would corrupt the stream, so the input side is abandoned
                boost::system::error_code ignored;
                if (stdinPipe) stdinPipe->close(ignored);
                failWrites(why);
                co_return;
            }
            {
                std::lock_guard<std::mutex> lock(writeMutex);
                inFlight.reset();
            }
            next->settle();
        }
    }

    void closeStdinOnIoThread() {
        net::post(ioc, [this]() {
            boost::system::error_code ec;
            if (stdinPipe && stdinPipe->is_open()) {
                stdinPipe->close(ec);
            }
        });
    }
};

//==========================================================================================================
// ProcessTransport
//==========================================================================================================
ProcessTransport::ProcessTransport(ProcessTransportOptions options)
    : pImpl(std::make_unique<Impl>(std::move(options))) {}

ProcessTransport::~ProcessTransport() {
    try {
        Close();
    } catch (const std::exception& e) {
        LOG_ERROR("ProcessTransport close during destruction failed: {}", e.what());
    }
}

void ProcessTransport::Open(const LaunchDescriptor& descriptor) {
    FUNC_SCOPE();
    if (pImpl->closed) {
        throw LaunchError("Transport was already closed");
    }
    if (pImpl->opened.exchange(true)) {
        throw LaunchError("Transport is already open");
    }
    try {
        pImpl->spawn(descriptor);
    } catch (...) {
        pImpl->opened = false;
        throw;
    }
    pImpl->work.emplace(net::make_work_guard(pImpl->ioc));
    net::co_spawn(pImpl->ioc, pImpl->readStdout(), pImpl->logCompletion("stdout reader"));
    if (pImpl->stderrPipe) {
        net::co_spawn(pImpl->ioc, pImpl->readStderr(), pImpl->logCompletion("stderr reader"));
    }
    pImpl->ioThread = std::thread([this]() {
        pImpl->ioc.run();
    });
}

void ProcessTransport::Close() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> closeLock(pImpl->closeMutex);
    if (pImpl->closed.exchange(true)) {
        return;
    }
    if (pImpl->opened) {
        // EOF on stdin first; servers that honour it exit before SIGTERM matters
        pImpl->closeStdinOnIoThread();
        pImpl->terminateChild();
        pImpl->work.reset();
        pImpl->ioc.stop();
        if (pImpl->ioThread.joinable()) {
            pImpl->ioThread.join();
        }
        pImpl->failWrites("transport closed");
        boost::system::error_code ec;
        if (pImpl->stdinPipe) pImpl->stdinPipe->close(ec);
        if (pImpl->stdoutPipe) pImpl->stdoutPipe->close(ec);
        if (pImpl->stderrPipe) pImpl->stderrPipe->close(ec);
        LOG_INFO("Closed tool server pid={} status={}", pImpl->pid, GetExitStatus().value_or(-1));
    }
    pImpl->finishInbound("transport closed");
}

bool ProcessTransport::IsAlive() const {
    return pImpl->opened && !pImpl->closed && !pImpl->reapNonBlocking();
}

std::string ProcessTransport::GetSessionId() const {
    return "pid-" + std::to_string(pImpl->pid);
}

int ProcessTransport::GetPid() const {
    return static_cast<int>(pImpl->pid);
}

std::optional<int> ProcessTransport::GetExitStatus() const {
    std::lock_guard<std::mutex> lock(pImpl->procMutex);
    return pImpl->exitStatus;
}

void ProcessTransport::Send(const std::string& message) {
    FUNC_SCOPE();
    std::future<void> done = pImpl->enqueue(message, nullptr);
    try {
        done.get();
    } catch (const std::future_error&) {
        throw TransportClosedError("Transport closed before the message was written");
    }
}

void ProcessTransport::SendAsync(const std::string& message, WriteCompletion onComplete) {
    // Outcome is reported through onComplete
    (void)pImpl->enqueue(message, std::move(onComplete));
}

ReceiveResult ProcessTransport::Receive(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(pImpl->inMutex);
    if (!pImpl->opened && pImpl->inbound.empty()) {
        return ReceiveResult::Eof("transport not open");
    }
    pImpl->inCv.wait_for(lock, timeout, [this]() { return !pImpl->inbound.empty() || pImpl->eof; });
    if (!pImpl->inbound.empty()) {
        ReceiveResult r = std::move(pImpl->inbound.front());
        pImpl->inbound.pop_front();
        return r;
    }
    if (pImpl->eof) {
        return ReceiveResult::Eof(pImpl->eofReason);
    }
    return ReceiveResult::TimedOut();
}

//==========================================================================================================
// ProcessTransportFactory
//==========================================================================================================
ProcessTransportFactory::ProcessTransportFactory(ProcessTransportOptions options)
    : options(std::move(options)) {}

std::shared_ptr<ProcessTransportFactory> ProcessTransportFactory::FromConfig(const std::string& config) {
    return std::make_shared<ProcessTransportFactory>(
        ProcessTransportOptions::ParseConfig(config, ProcessTransportOptions::FromEnvironment()));
}

std::unique_ptr<ITransport> ProcessTransportFactory::CreateTransport(const LaunchDescriptor& descriptor) {
    (void)descriptor;
    return std::make_unique<ProcessTransport>(options);
}

} // namespace lmcp
