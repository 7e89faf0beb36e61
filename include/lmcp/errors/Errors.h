//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Exception taxonomy for lmcp plus JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include "lmcp/JSONRPCTypes.h"

namespace lmcp {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,
    Unknown
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int64_t code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Typed view of a JSON-RPC error object.
struct RpcError {
    int64_t code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Convert a JSON-RPC error object (shape: { code, message, data? }) to RpcError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<RpcError> rpcErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetInt(errVal, "code");
    auto message = GetString(errVal, "message");
    if (!code || !message) {
        return std::nullopt;
    }
    RpcError e;
    e.code = *code;
    e.message = std::move(*message);
    if (const JSONValue* data = errVal.find("data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Create a JSONValue error object from a typed RpcError.
inline JSONValue makeErrorValue(const RpcError& err) {
    return CreateErrorObject(static_cast<int>(err.code), err.message, err.data);
}

//==========================================================================================================
// ErrorKind
// Purpose: Discriminator carried by every LmcpError so callers can render specific messages.
//==========================================================================================================
enum class ErrorKind {
    Launch,
    Handshake,
    TransportClosed,
    ConnectionLost,
    ConnectionClosed,
    Timeout,
    Discovery,
    Validation,
    MissingParameter,
    ToolNotFound,
    ToolExecution,
    Protocol,
    RetryExhausted,
    UnknownConnection
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Launch: return "LaunchError";
        case ErrorKind::Handshake: return "HandshakeError";
        case ErrorKind::TransportClosed: return "TransportClosedError";
        case ErrorKind::ConnectionLost: return "ConnectionLostError";
        case ErrorKind::ConnectionClosed: return "ConnectionClosedError";
        case ErrorKind::Timeout: return "TimeoutError";
        case ErrorKind::Discovery: return "DiscoveryError";
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::MissingParameter: return "MissingParameterError";
        case ErrorKind::ToolNotFound: return "ToolNotFoundError";
        case ErrorKind::ToolExecution: return "ToolExecutionError";
        case ErrorKind::Protocol: return "ProtocolError";
        case ErrorKind::RetryExhausted: return "RetryExhaustedError";
        case ErrorKind::UnknownConnection: return "UnknownConnectionError";
    }
    return "LmcpError";
}

//==========================================================================================================
// LmcpError
// Purpose: Root of the lmcp exception hierarchy.
// Fields:
//   kind: ErrorKind discriminator.
//   payload: Optional structured data (server error data, offending schema, ...).
// Notes:
//   IsTransient() reports failures attributable to process/connection state, which the retry
//   interceptor may retry. Everything else is deterministic.
//==========================================================================================================
class LmcpError : public std::runtime_error {
public:
    LmcpError(ErrorKind kind, const std::string& message, std::optional<JSONValue> payload = std::nullopt)
        : std::runtime_error(message), kind_(kind), payload_(std::move(payload)) {}

    ErrorKind Kind() const noexcept { return kind_; }
    const char* KindName() const noexcept { return toString(kind_); }
    const std::optional<JSONValue>& Payload() const noexcept { return payload_; }

    bool IsTransient() const noexcept {
        switch (kind_) {
            case ErrorKind::TransportClosed:
            case ErrorKind::ConnectionLost:
            case ErrorKind::ConnectionClosed:
            case ErrorKind::Timeout:
                return true;
            default:
                return false;
        }
    }

private:
    ErrorKind kind_;
    std::optional<JSONValue> payload_;
};

// The tool server process could not be started.
class LaunchError : public LmcpError {
public:
    LaunchError(const std::string& message, int sysErrno = 0)
        : LmcpError(ErrorKind::Launch, message), sysErrno_(sysErrno) {}
    int SysErrno() const noexcept { return sysErrno_; }
private:
    int sysErrno_;
};

class HandshakeError : public LmcpError {
public:
    enum class Reason {
        Timeout,
        Malformed,
        Rejected,
        TransportFailure
    };

    HandshakeError(Reason reason, const std::string& message, std::optional<JSONValue> payload = std::nullopt)
        : LmcpError(ErrorKind::Handshake, message, std::move(payload)), reason_(reason) {}

    Reason GetReason() const noexcept { return reason_; }

    static const char* toString(Reason r) {
        switch (r) {
            case Reason::Timeout: return "timeout";
            case Reason::Malformed: return "malformed-response";
            case Reason::Rejected: return "server-rejected";
            case Reason::TransportFailure: return "transport-failure";
        }
        return "unknown";
    }

private:
    Reason reason_;
};

class TransportClosedError : public LmcpError {
public:
    explicit TransportClosedError(const std::string& message)
        : LmcpError(ErrorKind::TransportClosed, message) {}
};

class ConnectionLostError : public LmcpError {
public:
    explicit ConnectionLostError(const std::string& message)
        : LmcpError(ErrorKind::ConnectionLost, message) {}
};

// Raised immediately when a call is attempted on a connection that is not Ready.
class ConnectionClosedError : public LmcpError {
public:
    explicit ConnectionClosedError(const std::string& message)
        : LmcpError(ErrorKind::ConnectionClosed, message) {}
};

class TimeoutError : public LmcpError {
public:
    explicit TimeoutError(const std::string& message)
        : LmcpError(ErrorKind::Timeout, message) {}
};

class DiscoveryError : public LmcpError {
public:
    DiscoveryError(const std::string& message, std::optional<JSONValue> offending = std::nullopt)
        : LmcpError(ErrorKind::Discovery, message, std::move(offending)) {}
};

class ValidationError : public LmcpError {
public:
    explicit ValidationError(const std::string& message, ErrorKind kind = ErrorKind::Validation)
        : LmcpError(kind, message) {}
};

class MissingParameterError : public ValidationError {
public:
    MissingParameterError(const std::string& toolName, const std::string& parameter)
        : ValidationError("Missing required parameter '" + parameter + "' for tool '" + toolName + "'",
                          ErrorKind::MissingParameter),
          toolName_(toolName), parameter_(parameter) {}

    const std::string& ToolName() const noexcept { return toolName_; }
    const std::string& Parameter() const noexcept { return parameter_; }

private:
    std::string toolName_;
    std::string parameter_;
};

class ToolNotFoundError : public LmcpError {
public:
    explicit ToolNotFoundError(const std::string& toolName)
        : LmcpError(ErrorKind::ToolNotFound, "Tool '" + toolName + "' is not exposed by the server"),
          toolName_(toolName) {}
    const std::string& ToolName() const noexcept { return toolName_; }
private:
    std::string toolName_;
};

// The server ran the tool and the tool failed.
class ToolExecutionError : public LmcpError {
public:
    ToolExecutionError(const std::string& toolName, const std::string& message,
                       std::optional<int64_t> code = std::nullopt,
                       std::optional<JSONValue> payload = std::nullopt)
        : LmcpError(ErrorKind::ToolExecution, message, std::move(payload)),
          toolName_(toolName), code_(code) {}

    const std::string& ToolName() const noexcept { return toolName_; }
    const std::optional<int64_t>& Code() const noexcept { return code_; }

private:
    std::string toolName_;
    std::optional<int64_t> code_;
};

// JSON-RPC level failure reported by the server (error member of a response).
class ProtocolError : public LmcpError {
public:
    explicit ProtocolError(RpcError err)
        : LmcpError(ErrorKind::Protocol, err.message, err.data), rpc_(std::move(err)) {}
    ProtocolError(int64_t code, const std::string& message)
        : ProtocolError(RpcError{code, message, std::nullopt, errorCategoryFromCode(code)}) {}

    int64_t Code() const noexcept { return rpc_.code; }
    ErrorCategory Category() const noexcept { return rpc_.category; }
    const RpcError& Rpc() const noexcept { return rpc_; }

private:
    RpcError rpc_;
};

class RetryExhaustedError : public LmcpError {
public:
    RetryExhaustedError(unsigned int attempts, std::exception_ptr last, const std::string& lastMessage,
                        ErrorKind lastKind)
        : LmcpError(ErrorKind::RetryExhausted,
                    "Gave up after " + std::to_string(attempts) + " attempts: " + lastMessage),
          attempts_(attempts), last_(std::move(last)), lastKind_(lastKind) {}

    unsigned int Attempts() const noexcept { return attempts_; }
    ErrorKind LastKind() const noexcept { return lastKind_; }
    // Rethrows the final underlying failure.
    [[noreturn]] void RethrowLast() const { std::rethrow_exception(last_); }

private:
    unsigned int attempts_;
    std::exception_ptr last_;
    ErrorKind lastKind_;
};

class UnknownConnectionError : public LmcpError {
public:
    explicit UnknownConnectionError(uint64_t id)
        : LmcpError(ErrorKind::UnknownConnection, "No open connection with id " + std::to_string(id)) {}
};

} // namespace errors
} // namespace lmcp
