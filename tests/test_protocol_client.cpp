//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_protocol_client.cpp
// Purpose: ProtocolClient handshake, request correlation, timeouts and shutdown over an in-memory server
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "lmcp/ProtocolClient.h"
#include "lmcp/errors/Errors.h"
#include "support/FakeToolServer.h"

using namespace lmcp;
using lmcp::testing::FakeToolServer;

namespace {

ClientOptions fastOptions() {
    ClientOptions o;
    o.handshakeTimeout = std::chrono::milliseconds(500);
    o.requestTimeout = std::chrono::seconds(2);
    o.readerPollInterval = std::chrono::milliseconds(10);
    return o;
}

std::unique_ptr<ProtocolClient> connectClient(FakeToolServer& server, ClientOptions options = fastOptions(),
                                              int64_t firstId = 1) {
    auto client = std::make_unique<ProtocolClient>(server.TakeClientTransport(), options, firstId);
    client->Connect(LaunchDescriptor::FromCommandLine("fake-server"));
    client->Handshake();
    return client;
}

bool waitForState(const ProtocolClient& client, ConnectionState state,
                  std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (client.State() == state) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return client.State() == state;
}

} // namespace

TEST(ProtocolClient, RequiresTransport) {
    EXPECT_THROW(ProtocolClient(nullptr), std::invalid_argument);
}

TEST(ProtocolClient, HandshakeReachesReady) {
    FakeToolServer server;
    auto client = std::make_unique<ProtocolClient>(server.TakeClientTransport(), fastOptions());
    EXPECT_EQ(client->State(), ConnectionState::Disconnected);
    client->Connect(LaunchDescriptor::FromCommandLine("fake-server"));
    EXPECT_EQ(client->State(), ConnectionState::Connecting);

    ServerInfo info = client->Handshake();
    EXPECT_EQ(client->State(), ConnectionState::Ready);
    EXPECT_EQ(info.implementation.name, "fake");
    EXPECT_EQ(info.implementation.version, "0.0.1");
    EXPECT_EQ(info.protocolVersion, PROTOCOL_VERSION);
    EXPECT_TRUE(info.HasCapability("tools"));
    ASSERT_TRUE(client->GetServerInfo().has_value());
    EXPECT_EQ(client->GetServerInfo()->implementation.name, "fake");

    auto init = server.LastRequest(Methods::Initialize);
    ASSERT_TRUE(init.has_value());
    ASSERT_TRUE(init->params.has_value());
    EXPECT_EQ(GetString(*init->params, "protocolVersion"), std::optional<std::string>(PROTOCOL_VERSION));
    const JSONValue* clientInfo = init->params->find("clientInfo");
    ASSERT_NE(clientInfo, nullptr);
    EXPECT_EQ(GetString(*clientInfo, "name"), std::optional<std::string>("lmcp"));
    EXPECT_TRUE(server.WaitForCount(Methods::Initialized, 1));
}

TEST(ProtocolClient, HandshakeTimeout) {
    FakeToolServer server;
    server.On(Methods::Initialize, [](const JSONRPCRequest&) -> JSONValue { throw FakeToolServer::NoReply{}; });
    ClientOptions o = fastOptions();
    o.handshakeTimeout = std::chrono::milliseconds(100);
    ProtocolClient client(server.TakeClientTransport(), o);
    client.Connect(LaunchDescriptor::FromCommandLine("fake-server"));
    try {
        client.Handshake();
        FAIL() << "expected HandshakeError";
    } catch (const errors::HandshakeError& e) {
        EXPECT_EQ(e.GetReason(), errors::HandshakeError::Reason::Timeout);
    }
    EXPECT_EQ(client.State(), ConnectionState::Disconnected);
    EXPECT_EQ(client.PendingCount(), 0u);
}

TEST(ProtocolClient, HandshakeRejectedCarriesServerError) {
    FakeToolServer server;
    server.On(Methods::Initialize, [](const JSONRPCRequest&) -> JSONValue {
        throw errors::ProtocolError(JSONRPCErrorCodes::InvalidRequest, "unsupported protocol");
    });
    ProtocolClient client(server.TakeClientTransport(), fastOptions());
    client.Connect(LaunchDescriptor::FromCommandLine("fake-server"));
    try {
        client.Handshake();
        FAIL() << "expected HandshakeError";
    } catch (const errors::HandshakeError& e) {
        EXPECT_EQ(e.GetReason(), errors::HandshakeError::Reason::Rejected);
        ASSERT_TRUE(e.Payload().has_value());
        EXPECT_EQ(GetInt(*e.Payload(), "code"), std::optional<int64_t>(JSONRPCErrorCodes::InvalidRequest));
    }
    EXPECT_EQ(client.State(), ConnectionState::Disconnected);
}

TEST(ProtocolClient, HandshakeMalformedResult) {
    FakeToolServer server;
    server.On(Methods::Initialize, [](const JSONRPCRequest&) {
        return MakeObject({{"capabilities", MakeObject()}});
    });
    ProtocolClient client(server.TakeClientTransport(), fastOptions());
    client.Connect(LaunchDescriptor::FromCommandLine("fake-server"));
    try {
        client.Handshake();
        FAIL() << "expected HandshakeError";
    } catch (const errors::HandshakeError& e) {
        EXPECT_EQ(e.GetReason(), errors::HandshakeError::Reason::Malformed);
    }
    EXPECT_EQ(client.State(), ConnectionState::Disconnected);
    EXPECT_EQ(server.Count(Methods::Initialized), 0);
}

TEST(ProtocolClient, HandshakeTransportFailureWhenServerDrops) {
    FakeToolServer server;
    server.On(Methods::Initialize, [&server](const JSONRPCRequest&) -> JSONValue {
        server.Disconnect();
        throw FakeToolServer::NoReply{};
    });
    ProtocolClient client(server.TakeClientTransport(), fastOptions());
    client.Connect(LaunchDescriptor::FromCommandLine("fake-server"));
    try {
        client.Handshake();
        FAIL() << "expected HandshakeError";
    } catch (const errors::HandshakeError& e) {
        EXPECT_EQ(e.GetReason(), errors::HandshakeError::Reason::TransportFailure);
    }
    EXPECT_EQ(client.State(), ConnectionState::Disconnected);
}

TEST(ProtocolClient, MissingServerInfoDefaultsToUnknown) {
    FakeToolServer server;
    server.On(Methods::Initialize, [](const JSONRPCRequest&) {
        return MakeObject({{"protocolVersion", JSONValue("1999-01-01")}});
    });
    auto client = connectClient(server);
    auto info = client->GetServerInfo();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->implementation.name, "unknown");
    EXPECT_EQ(info->protocolVersion, "1999-01-01");
    EXPECT_TRUE(info->capabilities.isObject());
}

TEST(ProtocolClient, LifecycleMisuseIsRejected) {
    FakeToolServer server;
    ProtocolClient client(server.TakeClientTransport(), fastOptions());
    EXPECT_THROW(client.Handshake(), errors::ConnectionClosedError);
    EXPECT_THROW(client.CallMethod("tools/list"), errors::ConnectionClosedError);
    auto fut = client.CallMethodAsync("tools/list");
    EXPECT_THROW(fut.get(), errors::ConnectionClosedError);
    EXPECT_THROW(client.Notify("x"), errors::ConnectionClosedError);

    client.Connect(LaunchDescriptor::FromCommandLine("fake-server"));
    EXPECT_THROW(client.Connect(LaunchDescriptor::FromCommandLine("fake-server")), errors::ConnectionClosedError);
}

TEST(ProtocolClient, RequestIdsStartAtFirstRequestId) {
    FakeToolServer server;
    auto client = connectClient(server, fastOptions(), 100);
    auto init = server.LastRequest(Methods::Initialize);
    ASSERT_TRUE(init.has_value());
    EXPECT_EQ(IdKey(init->id), "i:100");
    EXPECT_EQ(client->NextRequestId(), 101);

    client->Ping();
    auto ping = server.LastRequest(Methods::Ping);
    ASSERT_TRUE(ping.has_value());
    EXPECT_EQ(IdKey(ping->id), "i:101");
}

TEST(ProtocolClient, ConcurrentCallsCorrelateById) {
    FakeToolServer server;
    server.On("test/echo", [](const JSONRPCRequest& req) { return req.params.value_or(JSONValue()); });
    auto client = connectClient(server);

    std::vector<std::future<JSONValue>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(client->CallMethodAsync("test/echo", MakeObject({{"n", JSONValue(i)}})));
    }
    for (int i = 0; i < 20; ++i) {
        ASSERT_EQ(futures[i].wait_for(std::chrono::seconds(2)), std::future_status::ready);
        EXPECT_EQ(GetInt(futures[i].get(), "n"), std::optional<int64_t>(i));
    }
    EXPECT_EQ(client->PendingCount(), 0u);
}

TEST(ProtocolClient, OutOfOrderRepliesReachTheirCallers) {
    FakeToolServer server;
    std::mutex idsMutex;
    std::vector<JSONRPCId> held;
    server.On("test/hold", [&](const JSONRPCRequest& req) -> JSONValue {
        std::lock_guard<std::mutex> lock(idsMutex);
        held.push_back(req.id);
        throw FakeToolServer::NoReply{};
    });
    auto client = connectClient(server);

    auto first = client->CallMethodAsync("test/hold");
    auto second = client->CallMethodAsync("test/hold");
    ASSERT_TRUE(server.WaitForCount("test/hold", 2));
    std::vector<JSONRPCId> ids;
    {
        std::lock_guard<std::mutex> lock(idsMutex);
        ids = held;
    }
    ASSERT_EQ(ids.size(), 2u);
    server.Reply(ids[1], JSONValue("second"));
    server.Reply(ids[0], JSONValue("first"));

    ASSERT_EQ(first.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ASSERT_EQ(second.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(first.get(), JSONValue("first"));
    EXPECT_EQ(second.get(), JSONValue("second"));
}

TEST(ProtocolClient, TimeoutRemovesPendingAndDropsLateReply) {
    FakeToolServer server;
    std::mutex idMutex;
    std::optional<JSONRPCId> heldId;
    server.On("test/never", [&](const JSONRPCRequest& req) -> JSONValue {
        std::lock_guard<std::mutex> lock(idMutex);
        heldId = req.id;
        throw FakeToolServer::NoReply{};
    });
    auto client = connectClient(server);

    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_THROW(client->CallMethod("test/never", std::nullopt, std::chrono::milliseconds(100)), errors::TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(2));
    EXPECT_EQ(client->PendingCount(), 0u);

    std::optional<JSONRPCId> id;
    {
        std::lock_guard<std::mutex> lock(idMutex);
        id = heldId;
    }
    ASSERT_TRUE(id.has_value());
    server.Reply(*id, JSONValue("too late"));
    EXPECT_NO_THROW(client->Ping());
    EXPECT_EQ(client->State(), ConnectionState::Ready);
}

TEST(ProtocolClient, ServerErrorBecomesProtocolError) {
    FakeToolServer server;
    server.On("test/fail", [](const JSONRPCRequest&) -> JSONValue {
        throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "bad params");
    });
    auto client = connectClient(server);
    try {
        client->CallMethod("test/fail");
        FAIL() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_EQ(e.Code(), JSONRPCErrorCodes::InvalidParams);
        EXPECT_EQ(e.Category(), errors::ErrorCategory::JsonRpcInvalidParams);
        EXPECT_STREQ(e.what(), "bad params");
    }
    EXPECT_THROW(client->CallMethod("no/such/method"), errors::ProtocolError);
}

TEST(ProtocolClient, AnswersServerInitiatedRequests) {
    FakeToolServer server;
    auto client = connectClient(server);
    server.SendRaw(R"({"jsonrpc":"2.0","id":"srv-1","method":"ping"})");
    server.SendRaw(R"({"jsonrpc":"2.0","id":"srv-2","method":"sampling/createMessage","params":{}})");
    ASSERT_TRUE(server.WaitForCount("<response>", 2));

    auto responses = server.Responses();
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(GetString(responses[0], "id"), std::optional<std::string>("srv-1"));
    ASSERT_NE(responses[0].find("result"), nullptr);
    EXPECT_EQ(*responses[0].find("result"), MakeObject());
    EXPECT_EQ(GetString(responses[1], "id"), std::optional<std::string>("srv-2"));
    ASSERT_NE(responses[1].find("error"), nullptr);
    EXPECT_EQ(GetInt(*responses[1].find("error"), "code"), std::optional<int64_t>(JSONRPCErrorCodes::MethodNotFound));
}

TEST(ProtocolClient, DispatchesNotificationsToHandlers) {
    FakeToolServer server;
    auto client = connectClient(server);

    std::promise<std::string> specific;
    std::promise<std::string> fallback;
    client->SetNotificationHandler("notifications/message", [&](const JSONRPCNotification& n) {
        specific.set_value(GetString(n.params.value_or(JSONValue()), "text").value_or(""));
    });
    client->SetDefaultNotificationHandler([&](const JSONRPCNotification& n) { fallback.set_value(n.method); });

    server.Notify("notifications/message", MakeObject({{"text", JSONValue("hi")}}));
    server.Notify("notifications/other");

    auto f1 = specific.get_future();
    auto f2 = fallback.get_future();
    ASSERT_EQ(f1.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ASSERT_EQ(f2.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(f1.get(), "hi");
    EXPECT_EQ(f2.get(), "notifications/other");
}

TEST(ProtocolClient, ThrowingHandlerAndGarbageFramesDoNotStopReader) {
    FakeToolServer server;
    auto client = connectClient(server);
    std::atomic<int> calls{0};
    client->SetNotificationHandler("notifications/boom", [&](const JSONRPCNotification&) {
        ++calls;
        throw std::runtime_error("handler failure");
    });

    server.Notify("notifications/boom");
    server.SendRaw("this is not json");
    server.SendRaw(R"({"jsonrpc":"2.0","id":999,"result":{}})");
    server.SendRaw(R"([1,2,3])");

    EXPECT_NO_THROW(client->Ping());
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(client->State(), ConnectionState::Ready);

    client->RemoveNotificationHandler("notifications/boom");
    server.Notify("notifications/boom");
    EXPECT_NO_THROW(client->Ping());
    EXPECT_EQ(calls.load(), 1);
}

TEST(ProtocolClient, CloseFailsPendingWithConnectionLost) {
    FakeToolServer server;
    server.On("test/never", [](const JSONRPCRequest&) -> JSONValue { throw FakeToolServer::NoReply{}; });
    auto client = connectClient(server);

    auto fut = client->CallMethodAsync("test/never", std::nullopt, std::chrono::milliseconds(0));
    ASSERT_TRUE(server.WaitForCount("test/never", 1));
    client->Close();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_THROW(fut.get(), errors::ConnectionLostError);
    EXPECT_EQ(client->State(), ConnectionState::Closed);
    EXPECT_THROW(client->CallMethod("tools/list"), errors::ConnectionClosedError);
    EXPECT_NO_THROW(client->Close());
}

TEST(ProtocolClient, CloseReportsTransportCloseFailure) {
    FakeToolServer server;
    auto transport = server.TakeClientTransport();
    static_cast<InMemoryTransport&>(*transport).SetFailOnClose(true);
    ProtocolClient client(std::move(transport), fastOptions());
    client.Connect(LaunchDescriptor::FromCommandLine("fake-server"));
    client.Handshake();
    EXPECT_THROW(client.Close(), errors::TransportClosedError);
    EXPECT_EQ(client.State(), ConnectionState::Closed);
}

TEST(ProtocolClient, ServerExitFailsPendingAndClosesClient) {
    FakeToolServer server;
    server.On("test/never", [](const JSONRPCRequest&) -> JSONValue { throw FakeToolServer::NoReply{}; });
    auto client = connectClient(server);

    auto fut = client->CallMethodAsync("test/never");
    ASSERT_TRUE(server.WaitForCount("test/never", 1));
    server.Disconnect();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_THROW(fut.get(), errors::ConnectionLostError);
    EXPECT_TRUE(waitForState(*client, ConnectionState::Closed));
    EXPECT_THROW(client->Ping(), errors::ConnectionClosedError);
}

TEST(ProtocolClient, CloseFromNotificationHandler) {
    FakeToolServer server;
    auto client = connectClient(server);
    std::promise<void> closed;
    client->SetNotificationHandler("notifications/bye", [&](const JSONRPCNotification&) {
        client->Close();
        closed.set_value();
    });
    server.Notify("notifications/bye");
    auto f = closed.get_future();
    ASSERT_EQ(f.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(client->State(), ConnectionState::Closed);
    client.reset();
}

TEST(ProtocolClient, NotifySendsWithoutId) {
    FakeToolServer server;
    auto client = connectClient(server);
    client->Notify("notifications/cancelled", MakeObject({{"requestId", JSONValue(5)}}));
    ASSERT_TRUE(server.WaitForCount("notifications/cancelled", 1));
    EXPECT_FALSE(server.LastRequest("notifications/cancelled").has_value());
}
