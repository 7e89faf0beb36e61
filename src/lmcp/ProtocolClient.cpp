//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolClient.cpp
// Purpose: ProtocolClient implementation
//==========================================================================================================
#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "logging/Logger.h"
#include "lmcp/ProtocolClient.h"
#include "lmcp/errors/Errors.h"

namespace lmcp {

using namespace lmcp::errors;
using Clock = std::chrono::steady_clock;

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Handshaking: return "Handshaking";
        case ConnectionState::Ready: return "Ready";
        case ConnectionState::Closing: return "Closing";
        case ConnectionState::Closed: return "Closed";
    }
    return "Unknown";
}

namespace {

constexpr std::size_t kLogPreviewChars = 200;

std::string preview(const std::string& s) {
    if (s.size() <= kLogPreviewChars) return s;
    return s.substr(0, kLogPreviewChars) + "...";
}

// Builds ServerInfo from an initialize result; throws HandshakeError(Malformed).
ServerInfo parseServerInfo(const JSONValue& result) {
    if (!result.isObject()) {
        throw HandshakeError(HandshakeError::Reason::Malformed, "initialize result is not an object", result);
    }
    ServerInfo info;
    auto version = GetString(result, "protocolVersion");
    if (!version) {
        throw HandshakeError(HandshakeError::Reason::Malformed,
                             "initialize result lacks a string protocolVersion", result);
    }
    info.protocolVersion = *version;

    info.capabilities = JSONValue(JSONValue::Object{});
    if (const JSONValue* caps = result.find("capabilities")) {
        if (!caps->isObject()) {
            throw HandshakeError(HandshakeError::Reason::Malformed,
                                 "initialize result capabilities is not an object", result);
        }
        info.capabilities = *caps;
    }

    info.implementation = Implementation("unknown", "unknown");
    if (const JSONValue* impl = result.find("serverInfo")) {
        if (auto name = GetString(*impl, "name")) info.implementation.name = *name;
        if (auto ver = GetString(*impl, "version")) info.implementation.version = *ver;
    }
    info.instructions = GetString(result, "instructions");
    return info;
}

} // namespace

class ProtocolClient::Impl : public std::enable_shared_from_this<ProtocolClient::Impl> {
public:
    struct PendingRequest {
        std::string method;
        Clock::time_point submitted;
        std::optional<Clock::time_point> deadline;
        std::promise<JSONValue> promise;
    };

    std::unique_ptr<ITransport> transport;
    ClientOptions options;
    std::atomic<int64_t> nextId;
    std::string descriptorText;

    mutable std::mutex stateMutex;
    ConnectionState state{ConnectionState::Disconnected};
    std::optional<ServerInfo> serverInfo;

    mutable std::mutex pendingMutex;
    std::unordered_map<std::string, PendingRequest> pending;
    bool accepting{false};

    std::mutex handlersMutex;
    std::unordered_map<std::string, NotificationHandler> handlers;
    NotificationHandler defaultHandler;

    std::mutex closeMutex;
    std::jthread reader;

    Impl(std::unique_ptr<ITransport> t, ClientOptions opts, int64_t firstId)
        : transport(std::move(t)), options(std::move(opts)), nextId(firstId) {}

    ConnectionState getState() const {
        std::lock_guard<std::mutex> lock(stateMutex);
        return state;
    }

    void setState(ConnectionState s) {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (state != s) {
            LOG_DEBUG("Client {}: {} -> {}", descriptorText, toString(state), toString(s));
            state = s;
        }
    }

    std::future<JSONValue> startRequest(const std::string& method, std::optional<JSONValue> params,
                                        std::chrono::milliseconds timeout);
    void failPending(const std::string& key, std::exception_ptr failure);
    void failAllPending(const std::string& reason);
    void sweepDeadlines();
    void readerLoop(std::stop_token st);
    void handleFrame(const std::string& payload);
    void handleResponse(const JSONValue& msg);
    void handleServerRequest(const JSONValue& msg);
    void dispatchNotification(const JSONValue& msg);
    void onTransportLost(const std::string& reason);
    std::exception_ptr shutdown(ConnectionState finalState, const std::string& reason);
};

//==========================================================================================================
// Registers the pending entry before writing so a fast response always finds it. The write is only
// queued: a server that stops reading cannot hold the caller past its deadline.
//==========================================================================================================
std::future<JSONValue> ProtocolClient::Impl::startRequest(const std::string& method, std::optional<JSONValue> params,
                                                          std::chrono::milliseconds timeout) {
    const int64_t id = nextId.fetch_add(1);
    JSONRPCRequest request(JSONRPCId{id}, method, std::move(params));
    const std::string key = IdKey(request.id);

    PendingRequest entry;
    entry.method = method;
    entry.submitted = Clock::now();
    if (timeout.count() > 0) {
        entry.deadline = entry.submitted + timeout;
    }
    auto fut = entry.promise.get_future();
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        if (!accepting) {
            throw ConnectionClosedError(fmt::format("Cannot send '{}': connection is {}", method,
                                                    toString(getState())));
        }
        pending.emplace(key, std::move(entry));
    }

    std::weak_ptr<Impl> weak = weak_from_this();
    try {
        transport->SendAsync(request.Serialize(), [weak, key](std::exception_ptr failure) {
            if (!failure) return;
            if (auto self = weak.lock()) self->failPending(key, failure);
        });
    } catch (const LmcpError&) {
        std::lock_guard<std::mutex> lock(pendingMutex);
        pending.erase(key);
        throw;
    }
    LOG_DEBUG("Queued request id={} method={}", id, method);
    return fut;
}

void ProtocolClient::Impl::failPending(const std::string& key, std::exception_ptr failure) {
    std::optional<PendingRequest> entry;
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        auto it = pending.find(key);
        if (it == pending.end()) return;
        entry.emplace(std::move(it->second));
        pending.erase(it);
    }
    LOG_DEBUG("Request {} {} could not be written", key, entry->method);
    entry->promise.set_exception(failure);
}

void ProtocolClient::Impl::failAllPending(const std::string& reason) {
    std::unordered_map<std::string, PendingRequest> drained;
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        accepting = false;
        drained.swap(pending);
    }
    if (!drained.empty()) {
        LOG_DEBUG("Failing {} pending request(s): {}", drained.size(), reason);
    }
    for (auto& [key, entry] : drained) {
        entry.promise.set_exception(std::make_exception_ptr(
            ConnectionLostError(fmt::format("{} (request {} {})", reason, entry.method, key))));
    }
}

void ProtocolClient::Impl::sweepDeadlines() {
    std::vector<PendingRequest> expired;
    const auto now = Clock::now();
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        for (auto it = pending.begin(); it != pending.end();) {
            if (it->second.deadline && *it->second.deadline <= now) {
                expired.push_back(std::move(it->second));
                it = pending.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& entry : expired) {
        const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.submitted);
        LOG_WARN("Request {} timed out after {} ms", entry.method, waited.count());
        entry.promise.set_exception(std::make_exception_ptr(
            TimeoutError(fmt::format("Request '{}' timed out after {} ms", entry.method, waited.count()))));
    }
}

void ProtocolClient::Impl::readerLoop(std::stop_token st) {
    LOG_DEBUG("Reader loop started for {}", descriptorText);
    while (!st.stop_requested()) {
        ReceiveResult r;
        try {
            r = transport->Receive(options.readerPollInterval);
        } catch (const std::exception& e) {
            if (!st.stop_requested()) onTransportLost(fmt::format("Receive failed: {}", e.what()));
            return;
        }
        switch (r.status) {
            case ReceiveResult::Status::Message:
                handleFrame(r.payload);
                break;
            case ReceiveResult::Status::Timeout:
                break;
            case ReceiveResult::Status::Eof:
                if (!st.stop_requested()) {
                    onTransportLost(r.detail.empty() ? std::string("Server closed the connection")
                                                     : "Server closed the connection: " + r.detail);
                }
                return;
            case ReceiveResult::Status::FramingError:
                if (!st.stop_requested()) onTransportLost("Framing error: " + r.detail);
                return;
        }
        sweepDeadlines();
    }
}

void ProtocolClient::Impl::handleFrame(const std::string& payload) {
    JSONValue msg;
    try {
        msg = ParseJSON(payload);
    } catch (const JSONParseError& e) {
        LOG_WARN("Dropping invalid JSON frame ({}): {}", e.what(), preview(payload));
        return;
    }
    switch (ClassifyMessage(msg)) {
        case MessageKind::Response:
            handleResponse(msg);
            break;
        case MessageKind::Request:
            handleServerRequest(msg);
            break;
        case MessageKind::Notification:
            dispatchNotification(msg);
            break;
        case MessageKind::Unknown:
            LOG_WARN("Dropping unrecognized message: {}", preview(payload));
            break;
    }
}

void ProtocolClient::Impl::handleResponse(const JSONValue& msg) {
    JSONRPCResponse response;
    if (!response.FromJSON(msg)) {
        LOG_WARN("Dropping malformed response: {}", preview(SerializeJSON(msg)));
        return;
    }
    const std::string key = IdKey(response.id);
    std::optional<PendingRequest> entry;
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        auto it = pending.find(key);
        if (it != pending.end()) {
            entry.emplace(std::move(it->second));
            pending.erase(it);
        }
    }
    if (!entry) {
        LOG_WARN("Dropping response for unknown or expired request id {}", key);
        return;
    }

    if (response.error) {
        auto rpc = rpcErrorFromErrorValue(*response.error);
        if (!rpc) {
            rpc = RpcError{JSONRPCErrorCodes::InternalError, "Malformed error object in response",
                           *response.error, ErrorCategory::JsonRpcInternal};
        }
        LOG_DEBUG("Request {} {} failed: {} ({})", key, entry->method, rpc->message, rpc->code);
        entry->promise.set_exception(std::make_exception_ptr(ProtocolError(std::move(*rpc))));
        return;
    }
    entry->promise.set_value(response.result.value_or(JSONValue()));
}

void ProtocolClient::Impl::handleServerRequest(const JSONValue& msg) {
    JSONRPCRequest request;
    if (!request.FromJSON(msg)) {
        LOG_WARN("Dropping malformed server request: {}", preview(SerializeJSON(msg)));
        return;
    }
    std::string reply;
    if (request.method == Methods::Ping) {
        reply = JSONRPCResponse(request.id, JSONValue(JSONValue::Object{})).Serialize();
    } else {
        LOG_DEBUG("Rejecting server request '{}'", request.method);
        reply = CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                    "Method not found: " + request.method)->Serialize();
    }
    // Queued so a server that stops reading cannot stall the reader thread
    const std::string method = request.method;
    try {
        transport->SendAsync(reply, [method](std::exception_ptr failure) {
            if (!failure) return;
            try {
                std::rethrow_exception(failure);
            } catch (const std::exception& e) {
                LOG_WARN("Could not answer server request '{}': {}", method, e.what());
            }
        });
    } catch (const LmcpError& e) {
        LOG_WARN("Could not answer server request '{}': {}", request.method, e.what());
    }
}

void ProtocolClient::Impl::dispatchNotification(const JSONValue& msg) {
    JSONRPCNotification notification;
    if (!notification.FromJSON(msg)) {
        LOG_WARN("Dropping malformed notification: {}", preview(SerializeJSON(msg)));
        return;
    }
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex);
        auto it = handlers.find(notification.method);
        handler = (it != handlers.end()) ? it->second : defaultHandler;
    }
    if (!handler) {
        LOG_DEBUG("Ignoring notification {}", notification.method);
        return;
    }
    try {
        handler(notification);
    } catch (const std::exception& e) {
        LOG_ERROR("Notification handler for {} threw: {}", notification.method, e.what());
    }
}

//==========================================================================================================
// Reader-side failure path. Does not touch closeMutex: Close() may hold it while joining the reader.
//==========================================================================================================
void ProtocolClient::Impl::onTransportLost(const std::string& reason) {
    LOG_WARN("Connection to {} lost: {}", descriptorText, reason);
    // State first so a caller woken by the failure already observes Closed
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (state != ConnectionState::Closing) {
            state = ConnectionState::Closed;
        }
    }
    failAllPending(reason);
    try {
        transport->Close();
    } catch (const std::exception& e) {
        LOG_WARN("Closing transport after loss failed: {}", e.what());
    }
}

//==========================================================================================================
// Returns the transport's close failure (if any) after every other step has run.
//==========================================================================================================
std::exception_ptr ProtocolClient::Impl::shutdown(ConnectionState finalState, const std::string& reason) {
    std::lock_guard<std::mutex> closeLock(closeMutex);
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (state == finalState && !reader.joinable()) {
            return nullptr;
        }
        state = ConnectionState::Closing;
    }
    failAllPending(reason);
    if (reader.joinable()) {
        reader.request_stop();
    }
    std::exception_ptr closeError;
    try {
        transport->Close();
    } catch (const std::exception& e) {
        LOG_WARN("Transport close for {} failed: {}", descriptorText, e.what());
        closeError = std::current_exception();
    }
    if (reader.joinable()) {
        if (reader.get_id() == std::this_thread::get_id()) {
            reader.detach();
        } else {
            reader.join();
        }
    }
    setState(finalState);
    return closeError;
}

////////////////////////////////////////// ProtocolClient //////////////////////////////////////////

ProtocolClient::ProtocolClient(std::unique_ptr<ITransport> transport, ClientOptions options, int64_t firstRequestId)
    : pImpl(std::make_shared<Impl>(std::move(transport), std::move(options), firstRequestId)) {
    if (!pImpl->transport) {
        throw std::invalid_argument("ProtocolClient requires a transport");
    }
}

ProtocolClient::~ProtocolClient() {
    // Close failures were already logged by shutdown
    (void)pImpl->shutdown(ConnectionState::Closed, "Client destroyed");
}

void ProtocolClient::Connect(const LaunchDescriptor& descriptor) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        if (pImpl->state != ConnectionState::Disconnected) {
            throw ConnectionClosedError(fmt::format("Connect requires a disconnected client (state: {})",
                                                    toString(pImpl->state)));
        }
        pImpl->state = ConnectionState::Connecting;
    }
    pImpl->descriptorText = descriptor.ToString();
    try {
        pImpl->transport->Open(descriptor);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start {}: {}", pImpl->descriptorText, e.what());
        pImpl->setState(ConnectionState::Disconnected);
        throw;
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->pendingMutex);
        pImpl->accepting = true;
    }
    std::lock_guard<std::mutex> closeLock(pImpl->closeMutex);
    pImpl->reader = std::jthread([impl = pImpl](std::stop_token st) { impl->readerLoop(st); });
}

ServerInfo ProtocolClient::Handshake() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        if (pImpl->state != ConnectionState::Connecting) {
            throw ConnectionClosedError(fmt::format("Handshake requires a connecting client (state: {})",
                                                    toString(pImpl->state)));
        }
        pImpl->state = ConnectionState::Handshaking;
    }

    const auto fail = [this](HandshakeError::Reason reason, const std::string& message,
                             std::optional<JSONValue> payload = std::nullopt) {
        LOG_ERROR("Handshake with {} failed ({}): {}", pImpl->descriptorText, HandshakeError::toString(reason), message);
        (void)pImpl->shutdown(ConnectionState::Disconnected, "Handshake failed: " + message);
        return HandshakeError(reason, message, std::move(payload));
    };

    ServerInfo info;
    try {
        JSONValue params = MakeObject({
            {"protocolVersion", JSONValue(PROTOCOL_VERSION)},
            {"capabilities", pImpl->options.capabilities},
            {"clientInfo", MakeObject({
                {"name", JSONValue(pImpl->options.clientInfo.name)},
                {"version", JSONValue(pImpl->options.clientInfo.version)}
            })}
        });
        JSONValue result = pImpl->startRequest(Methods::Initialize, std::move(params),
                                               pImpl->options.handshakeTimeout).get();
        info = parseServerInfo(result);
        pImpl->transport->Send(JSONRPCNotification(Methods::Initialized).Serialize());
    } catch (const HandshakeError& e) {
        throw fail(e.GetReason(), e.what(), e.Payload());
    } catch (const TimeoutError& e) {
        throw fail(HandshakeError::Reason::Timeout, e.what());
    } catch (const ProtocolError& e) {
        throw fail(HandshakeError::Reason::Rejected,
                   fmt::format("Server rejected initialize: {} ({})", e.what(), e.Code()),
                   makeErrorValue(e.Rpc()));
    } catch (const LmcpError& e) {
        throw fail(HandshakeError::Reason::TransportFailure, e.what());
    }

    if (info.protocolVersion != PROTOCOL_VERSION) {
        LOG_WARN("Server {} negotiated protocol {} (requested {})", info.implementation.name,
                 info.protocolVersion, PROTOCOL_VERSION);
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        if (pImpl->state == ConnectionState::Handshaking) {
            pImpl->serverInfo = info;
            pImpl->state = ConnectionState::Ready;
        }
    }
    if (State() != ConnectionState::Ready) {
        throw fail(HandshakeError::Reason::TransportFailure, "Connection dropped during handshake");
    }
    LOG_INFO("Connected to {} {} via {}", info.implementation.name, info.implementation.version,
             pImpl->descriptorText);
    return info;
}

void ProtocolClient::Close() {
    FUNC_SCOPE();
    if (auto closeError = pImpl->shutdown(ConnectionState::Closed, "Connection closed by client")) {
        std::rethrow_exception(closeError);
    }
}

JSONValue ProtocolClient::CallMethod(const std::string& method, std::optional<JSONValue> params,
                                     std::optional<std::chrono::milliseconds> timeout) {
    return CallMethodAsync(method, std::move(params), timeout).get();
}

std::future<JSONValue> ProtocolClient::CallMethodAsync(const std::string& method, std::optional<JSONValue> params,
                                                       std::optional<std::chrono::milliseconds> timeout) {
    try {
        const ConnectionState s = State();
        if (s != ConnectionState::Ready) {
            throw ConnectionClosedError(fmt::format("Cannot call '{}': connection is {}", method, toString(s)));
        }
        return pImpl->startRequest(method, std::move(params), timeout.value_or(pImpl->options.requestTimeout));
    } catch (const LmcpError&) {
        std::promise<JSONValue> failed;
        failed.set_exception(std::current_exception());
        return failed.get_future();
    }
}

void ProtocolClient::Notify(const std::string& method, std::optional<JSONValue> params) {
    const ConnectionState s = State();
    if (s != ConnectionState::Ready) {
        throw ConnectionClosedError(fmt::format("Cannot notify '{}': connection is {}", method, toString(s)));
    }
    pImpl->transport->Send(JSONRPCNotification(method, std::move(params)).Serialize());
}

void ProtocolClient::Ping(std::optional<std::chrono::milliseconds> timeout) {
    (void)CallMethod(Methods::Ping, std::nullopt, timeout);
}

void ProtocolClient::SetNotificationHandler(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->handlers[method] = std::move(handler);
}

void ProtocolClient::RemoveNotificationHandler(const std::string& method) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->handlers.erase(method);
}

void ProtocolClient::SetDefaultNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->defaultHandler = std::move(handler);
}

ConnectionState ProtocolClient::State() const {
    return pImpl->getState();
}

std::size_t ProtocolClient::PendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->pendingMutex);
    return pImpl->pending.size();
}

int64_t ProtocolClient::NextRequestId() const {
    return pImpl->nextId.load();
}

std::optional<ServerInfo> ProtocolClient::GetServerInfo() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->serverInfo;
}

std::string ProtocolClient::SessionId() const {
    return pImpl->transport->GetSessionId();
}

const ClientOptions& ProtocolClient::Options() const {
    return pImpl->options;
}

} // namespace lmcp
