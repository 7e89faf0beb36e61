//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the error taxonomy and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include "lmcp/JSONRPCTypes.h"
#include "lmcp/errors/Errors.h"

using namespace lmcp;

TEST(Errors, CategoryMapping) {
    using errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequestId), ErrorCategory::McpInvalidRequestId);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotAllowed), ErrorCategory::McpMethodNotAllowed);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ResourceNotFound), ErrorCategory::McpResourceNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolNotFound), ErrorCategory::McpToolNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::PromptNotFound), ErrorCategory::McpPromptNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, FromErrorValue_Valid) {
    JSONValue errVal = MakeObject({
        {"code", JSONValue(JSONRPCErrorCodes::MethodNotFound)},
        {"message", JSONValue("Method not found")},
        {"data", MakeObject({{"foo", JSONValue("bar")}})}
    });
    auto parsed = errors::rpcErrorFromErrorValue(errVal);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(parsed->message, std::string("Method not found"));
    EXPECT_EQ(parsed->category, errors::ErrorCategory::JsonRpcMethodNotFound);
    ASSERT_TRUE(parsed->data.has_value());
    EXPECT_EQ(GetString(*parsed->data, "foo"), std::optional<std::string>("bar"));
}

TEST(Errors, FromErrorValue_InvalidShape) {
    EXPECT_FALSE(errors::rpcErrorFromErrorValue(JSONValue(nullptr)).has_value());
    EXPECT_FALSE(errors::rpcErrorFromErrorValue(MakeObject({{"message", JSONValue("m")}})).has_value());
    EXPECT_FALSE(errors::rpcErrorFromErrorValue(MakeObject({{"code", JSONValue(-1)}})).has_value());
    EXPECT_FALSE(errors::rpcErrorFromErrorValue(MakeObject({
        {"code", JSONValue("-32601")}, {"message", JSONValue(123)}
    })).has_value());
}

TEST(Errors, MakeErrorValue_RoundTrip) {
    errors::RpcError e;
    e.code = JSONRPCErrorCodes::ResourceNotFound;
    e.message = "missing";
    e.data = MakeObject({{"uri", JSONValue("mem://x")}});

    auto parsed = errors::rpcErrorFromErrorValue(errors::makeErrorValue(e));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, e.code);
    EXPECT_EQ(parsed->message, e.message);
    ASSERT_TRUE(parsed->data.has_value());
    EXPECT_EQ(*parsed->data, *e.data);
}

TEST(Errors, TransientKinds) {
    EXPECT_TRUE(errors::TimeoutError("t").IsTransient());
    EXPECT_TRUE(errors::ConnectionLostError("l").IsTransient());
    EXPECT_TRUE(errors::ConnectionClosedError("c").IsTransient());
    EXPECT_TRUE(errors::TransportClosedError("x").IsTransient());

    EXPECT_FALSE(errors::ValidationError("v").IsTransient());
    EXPECT_FALSE(errors::MissingParameterError("echo", "message").IsTransient());
    EXPECT_FALSE(errors::ToolNotFoundError("nope").IsTransient());
    EXPECT_FALSE(errors::ToolExecutionError("echo", "boom").IsTransient());
    EXPECT_FALSE(errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "bad").IsTransient());
    EXPECT_FALSE(errors::LaunchError("no such file").IsTransient());
    EXPECT_FALSE(errors::HandshakeError(errors::HandshakeError::Reason::Timeout, "slow").IsTransient());
}

TEST(Errors, MissingParameterIsAValidationError) {
    errors::MissingParameterError e("echo", "message");
    EXPECT_EQ(e.Kind(), errors::ErrorKind::MissingParameter);
    EXPECT_STREQ(e.KindName(), "MissingParameterError");
    EXPECT_EQ(e.ToolName(), "echo");
    EXPECT_EQ(e.Parameter(), "message");
    EXPECT_NE(std::string(e.what()).find("message"), std::string::npos);

    const errors::ValidationError& base = e;
    EXPECT_EQ(base.Kind(), errors::ErrorKind::MissingParameter);
}

TEST(Errors, ProtocolErrorCarriesRpcDetails) {
    errors::RpcError rpc{JSONRPCErrorCodes::ToolNotFound, "gone", JSONValue("detail"),
                         errors::ErrorCategory::McpToolNotFound};
    errors::ProtocolError e(rpc);
    EXPECT_EQ(e.Code(), JSONRPCErrorCodes::ToolNotFound);
    EXPECT_EQ(e.Category(), errors::ErrorCategory::McpToolNotFound);
    EXPECT_STREQ(e.what(), "gone");
    ASSERT_TRUE(e.Payload().has_value());
    EXPECT_EQ(*e.Payload(), JSONValue("detail"));
}

TEST(Errors, RetryExhaustedRethrowsLastFailure) {
    std::exception_ptr last = std::make_exception_ptr(errors::TimeoutError("slow server"));
    errors::RetryExhaustedError e(3, last, "slow server", errors::ErrorKind::Timeout);
    EXPECT_EQ(e.Attempts(), 3u);
    EXPECT_EQ(e.LastKind(), errors::ErrorKind::Timeout);
    EXPECT_NE(std::string(e.what()).find("3 attempts"), std::string::npos);
    EXPECT_THROW(e.RethrowLast(), errors::TimeoutError);
}

TEST(Errors, HandshakeReasonNames) {
    using R = errors::HandshakeError::Reason;
    EXPECT_STREQ(errors::HandshakeError::toString(R::Timeout), "timeout");
    EXPECT_STREQ(errors::HandshakeError::toString(R::Malformed), "malformed-response");
    EXPECT_STREQ(errors::HandshakeError::toString(R::Rejected), "server-rejected");
    EXPECT_STREQ(errors::HandshakeError::toString(R::TransportFailure), "transport-failure");
}
