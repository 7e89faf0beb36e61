//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FakeToolServer.h
// Purpose: Scripted in-memory tool server for ProtocolClient / registry / proxy tests
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "lmcp/InMemoryTransport.hpp"
#include "lmcp/LaunchDescriptor.h"
#include "lmcp/Transport.h"
#include "lmcp/JSONRPCTypes.h"
#include "lmcp/Protocol.h"
#include "lmcp/errors/Errors.h"

namespace lmcp {
namespace testing {

//==========================================================================================================
// FakeToolServer
// Purpose: Serves the far end of an InMemoryTransport pair on its own thread.
// Notes:
//   - Handlers return the result value; throwing errors::ProtocolError replies with that JSON-RPC error;
//     throwing NoReply sends nothing (for timeout tests).
//   - initialize, ping and tools/list have defaults; tools/list serves SetTools().
//==========================================================================================================
class FakeToolServer {
public:
    struct NoReply {};
    using Handler = std::function<JSONValue(const JSONRPCRequest&)>;

    FakeToolServer() {
        auto pair = InMemoryTransport::CreatePair();
        clientEnd_ = std::move(pair.first);
        serverEnd_ = std::move(pair.second);
        tools_ = JSONValue(JSONValue::Array{});
        On(Methods::Initialize, [](const JSONRPCRequest&) {
            return MakeObject({
                {"protocolVersion", JSONValue(PROTOCOL_VERSION)},
                {"capabilities", MakeObject({{"tools", MakeObject({{"listChanged", JSONValue(true)}})}})},
                {"serverInfo", MakeObject({{"name", JSONValue("fake")}, {"version", JSONValue("0.0.1")}})}
            });
        });
        On(Methods::Ping, [](const JSONRPCRequest&) { return MakeObject(); });
        On(Methods::ListTools, [this](const JSONRPCRequest&) {
            std::lock_guard<std::mutex> lock(mutex_);
            return MakeObject({{"tools", tools_}});
        });
        worker_ = std::jthread([this](std::stop_token st) { serve(st); });
    }

    ~FakeToolServer() {
        worker_.request_stop();
        if (worker_.joinable()) worker_.join();
        serverEnd_->Close();
    }

    FakeToolServer(const FakeToolServer&) = delete;
    FakeToolServer& operator=(const FakeToolServer&) = delete;

    // Hands the client end to the code under test (callable once).
    std::unique_ptr<ITransport> TakeClientTransport() { return std::move(clientEnd_); }

    // Makes the client end's Close() throw once (call before TakeClientTransport).
    void FailClientClose() { clientEnd_->SetFailOnClose(true); }

    void On(const std::string& method, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[method] = std::move(handler);
    }

    void SetTools(JSONValue tools) {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_ = std::move(tools);
    }

    int Count(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(method);
        return it == counts_.end() ? 0 : it->second;
    }

    std::optional<JSONRPCRequest> LastRequest(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_.find(method);
        if (it == last_.end()) return std::nullopt;
        return it->second;
    }

    // Every message the client sent, in order (raw JSON text).
    std::vector<std::string> Received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    // Waits until `method` has been seen at least n times.
    bool WaitForCount(const std::string& method, int n,
                      std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() {
            auto it = counts_.find(method);
            return it != counts_.end() && it->second >= n;
        });
    }

    void SendRaw(const std::string& text) { serverEnd_->Send(text); }

    void Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt) {
        serverEnd_->Send(JSONRPCNotification(method, std::move(params)).Serialize());
    }

    // Answers a request later (e.g. after a handler threw NoReply).
    void Reply(const JSONRPCId& id, JSONValue result) {
        serverEnd_->Send(JSONRPCResponse(id, std::move(result)).Serialize());
    }

    // Closes the server end; the client observes Eof.
    void Disconnect() { serverEnd_->Close(); }

    InMemoryTransport& ServerEnd() { return *serverEnd_; }

    // Responses the client sent back (answers to server-initiated requests).
    std::vector<JSONValue> Responses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return responses_;
    }

private:
    void serve(std::stop_token st) {
        while (!st.stop_requested()) {
            ReceiveResult r = serverEnd_->Receive(std::chrono::milliseconds(20));
            if (r.status == ReceiveResult::Status::Eof) return;
            if (r.status != ReceiveResult::Status::Message) continue;
            handle(r.payload);
        }
    }

    void handle(const std::string& text) {
        JSONValue msg;
        try {
            msg = ParseJSON(text);
        } catch (const JSONParseError&) {
            return;
        }
        std::string method = GetString(msg, "method").value_or("");
        const MessageKind kind = ClassifyMessage(msg);
        Handler handler;
        JSONRPCRequest req;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back(text);
            if (kind == MessageKind::Response) {
                ++counts_["<response>"];
                responses_.push_back(msg);
                cv_.notify_all();
                return;
            }
            if (kind != MessageKind::Request) {
                ++counts_[method];
                cv_.notify_all();
                return;
            }
            if (!req.FromJSON(msg)) return;
            last_[method] = req;
            auto it = handlers_.find(method);
            if (it != handlers_.end()) handler = it->second;
        }

        // Requests are counted once their handler has run and before the reply goes out
        std::optional<std::string> reply;
        if (!handler) {
            reply = CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + method)
                        ->Serialize();
        } else {
            try {
                reply = JSONRPCResponse(req.id, handler(req)).Serialize();
            } catch (const NoReply&) {
                // scripted silence
            } catch (const errors::ProtocolError& e) {
                reply = JSONRPCResponse(req.id, errors::makeErrorValue(e.Rpc()), true).Serialize();
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++counts_[method];
            cv_.notify_all();
        }
        if (reply) send(*reply);
    }

    void send(const std::string& text) {
        try {
            serverEnd_->Send(text);
        } catch (const errors::TransportClosedError&) {
            // client went away mid-reply
        }
    }

    std::unique_ptr<InMemoryTransport> clientEnd_;
    std::unique_ptr<InMemoryTransport> serverEnd_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Handler> handlers_;
    std::map<std::string, int> counts_;
    std::map<std::string, JSONRPCRequest> last_;
    std::vector<std::string> received_;
    std::vector<JSONValue> responses_;
    JSONValue tools_;
    std::jthread worker_;
};

//==========================================================================================================
// FakeServerFactory
// Purpose: ITransportFactory that starts a fresh FakeToolServer per transport (one per Open/Reconnect).
//          The configure hook scripts each server before its client end is handed out.
//==========================================================================================================
class FakeServerFactory : public ITransportFactory {
public:
    using Configure = std::function<void(FakeToolServer&, std::size_t index)>;

    explicit FakeServerFactory(Configure configure = nullptr) : configure_(std::move(configure)) {}

    std::unique_ptr<ITransport> CreateTransport(const LaunchDescriptor&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        servers_.push_back(std::make_unique<FakeToolServer>());
        FakeToolServer& server = *servers_.back();
        if (configure_) configure_(server, servers_.size() - 1);
        return server.TakeClientTransport();
    }

    // Server behind the n-th created transport.
    FakeToolServer& Server(std::size_t n) {
        std::lock_guard<std::mutex> lock(mutex_);
        return *servers_.at(n);
    }

    std::size_t Created() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return servers_.size();
    }

private:
    Configure configure_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<FakeToolServer>> servers_;
};

// Tool entry in the MCP inputSchema shape.
inline JSONValue MakeToolJson(const std::string& name, std::vector<std::string> required = {},
                              std::vector<std::string> optional = {}) {
    JSONValue::Object props;
    JSONValue::Array req;
    for (const auto& r : required) {
        props[r] = std::make_shared<JSONValue>(MakeObject({{"type", JSONValue("string")}}));
        req.push_back(std::make_shared<JSONValue>(r));
    }
    for (const auto& o : optional) {
        props[o] = std::make_shared<JSONValue>(MakeObject({{"type", JSONValue("string")}}));
    }
    return MakeObject({
        {"name", JSONValue(name)},
        {"description", JSONValue(name + " tool")},
        {"inputSchema", MakeObject({
            {"type", JSONValue("object")},
            {"properties", JSONValue(std::move(props))},
            {"required", JSONValue(std::move(req))}
        })}
    });
}

inline JSONValue TextResult(const std::string& text) {
    return MakeObject({{"content", MakeArray({MakeObject({{"type", JSONValue("text")}, {"text", JSONValue(text)}})})}});
}

} // namespace testing
} // namespace lmcp
