//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InvocationProxy.h
// Purpose: Turns (toolName, args) into a validated tools/call and unwraps the result
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <string>

#include "lmcp/Connection.h"
#include "lmcp/JSONRPCTypes.h"
#include "lmcp/Protocol.h"
#include "lmcp/async/Task.h"

namespace lmcp {

//==========================================================================================================
// InvocationProxy
// Purpose: Dynamic dispatch of tool calls over a Connection.
// Notes:
//   Validation strictness and auto-discovery come from the connection's ClientOptions.
//   Error mapping:
//     - result {isError:true} or {error:{code,message}}            -> ToolExecutionError
//     - JSON-RPC error outside -32768..-32000                       -> ToolExecutionError
//     - JSON-RPC error inside the reserved range                    -> ProtocolError (unchanged)
//     - transport / connection failures                             -> propagated unchanged
//==========================================================================================================
class InvocationProxy {
public:
    //==========================================================================================================
    // Invoke
    // Purpose: Blocking tool call.
    // Throws:
    //   ToolNotFoundError (Strict), ValidationError / MissingParameterError, ToolExecutionError,
    //   ProtocolError, TimeoutError, ConnectionLostError, ConnectionClosedError, TransportClosedError.
    //==========================================================================================================
    ToolResult Invoke(const std::shared_ptr<Connection>& connection, const std::string& toolName,
                      const JSONValue& args) const;

    // Coroutine-backed variant; every failure is delivered through the future.
    std::future<ToolResult> InvokeAsync(std::shared_ptr<Connection> connection, std::string toolName,
                                        JSONValue args) const;

    // resources/read for one uri; returns the result object ({contents:[...]}).
    JSONValue ReadResource(const std::shared_ptr<Connection>& connection, const std::string& uri) const;

    // Converts a tools/call result into a ToolResult or throws ToolExecutionError / ProtocolError.
    static ToolResult UnwrapResult(const std::string& toolName, const JSONValue& result);

private:
    static async::Task<ToolResult> coInvoke(std::shared_ptr<Connection> connection, std::string toolName,
                                            JSONValue args);
};

} // namespace lmcp
