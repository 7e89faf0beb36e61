//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: echo_server.cpp
// Purpose: Newline-framed stdio tool server used by the end-to-end tests
//==========================================================================================================

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <limits.h>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "lmcp/JSONRPCTypes.h"
#include "lmcp/Protocol.h"

using namespace lmcp;

namespace {

std::mutex gOutMutex;
std::atomic<int> gToolCalls{0};

void writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(gOutMutex);
    std::cout << line << '\n';
    std::cout.flush();
}

JSONValue textContent(const std::string& text) {
    return MakeObject({{"content", MakeArray({MakeObject({{"type", JSONValue("text")}, {"text", JSONValue(text)}})})}});
}

JSONValue toolEntry(const std::string& name, const std::string& description, JSONValue properties,
                    std::vector<std::string> required) {
    JSONValue::Array req;
    for (auto& r : required) req.push_back(std::make_shared<JSONValue>(r));
    return MakeObject({
        {"name", JSONValue(name)},
        {"description", JSONValue(description)},
        {"inputSchema", MakeObject({
            {"type", JSONValue("object")},
            {"properties", std::move(properties)},
            {"required", JSONValue(std::move(req))}
        })}
    });
}

JSONValue listTools() {
    JSONValue stringProp = MakeObject({{"type", JSONValue("string")}});
    JSONValue intProp = MakeObject({{"type", JSONValue("integer")}});
    return MakeObject({{"tools", MakeArray({
        toolEntry("echo", "Returns the message", MakeObject({{"message", stringProp}}), {"message"}),
        toolEntry("sleep", "Waits ms milliseconds", MakeObject({{"ms", intProp}}), {"ms"}),
        toolEntry("pid", "Returns the server process id", MakeObject(), {}),
        toolEntry("calls", "Number of tools/call requests seen", MakeObject(), {}),
        toolEntry("env", "Returns an environment variable", MakeObject({{"name", stringProp}}), {"name"}),
        toolEntry("cwd", "Returns the working directory", MakeObject(), {}),
        toolEntry("fail", "Always reports a tool error", MakeObject(), {}),
        toolEntry("stall", "Stops reading stdin for ms milliseconds", MakeObject({{"ms", intProp}}), {"ms"})
    })}});
}

void reply(const JSONRPCId& id, JSONValue result) {
    writeLine(JSONRPCResponse(id, std::move(result)).Serialize());
}

void replyError(const JSONRPCId& id, int code, const std::string& message) {
    writeLine(CreateErrorResponse(id, code, message)->Serialize());
}

void callTool(const JSONRPCRequest& req) {
    ++gToolCalls;
    const JSONValue params = req.params.value_or(JSONValue());
    const std::string name = GetString(params, "name").value_or("");
    const JSONValue* argsPtr = params.find("arguments");
    const JSONValue args = argsPtr ? *argsPtr : JSONValue(JSONValue::Object{});

    if (name == "echo") {
        reply(req.id, textContent(GetString(args, "message").value_or("")));
    } else if (name == "sleep") {
        const int64_t ms = GetInt(args, "ms").value_or(0);
        JSONRPCId id = req.id;
        std::thread([id, ms]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            reply(id, textContent("slept " + std::to_string(ms)));
        }).detach();
    } else if (name == "stall") {
        const int64_t ms = GetInt(args, "ms").value_or(0);
        reply(req.id, textContent("stalling " + std::to_string(ms)));
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    } else if (name == "pid") {
        reply(req.id, textContent(std::to_string(::getpid())));
    } else if (name == "calls") {
        reply(req.id, textContent(std::to_string(gToolCalls.load())));
    } else if (name == "env") {
        const char* v = std::getenv(GetString(args, "name").value_or("").c_str());
        reply(req.id, textContent(v ? v : ""));
    } else if (name == "cwd") {
        char buf[PATH_MAX];
        reply(req.id, textContent(::getcwd(buf, sizeof(buf)) ? buf : ""));
    } else if (name == "fail") {
        JSONValue result = textContent("boom");
        std::get<JSONValue::Object>(result.value)["isError"] = std::make_shared<JSONValue>(true);
        reply(req.id, std::move(result));
    } else {
        replyError(req.id, JSONRPCErrorCodes::InvalidParams, "Unknown tool: " + name);
    }
}

void handleRequest(const JSONRPCRequest& req) {
    if (req.method == Methods::Initialize) {
        reply(req.id, MakeObject({
            {"protocolVersion", JSONValue(PROTOCOL_VERSION)},
            {"capabilities", MakeObject({{"tools", MakeObject()}, {"resources", MakeObject()}})},
            {"serverInfo", MakeObject({{"name", JSONValue("echo-server")}, {"version", JSONValue("1.0.0")}})}
        }));
    } else if (req.method == Methods::Ping) {
        reply(req.id, MakeObject());
    } else if (req.method == Methods::ListTools) {
        reply(req.id, listTools());
    } else if (req.method == Methods::CallTool) {
        callTool(req);
    } else if (req.method == Methods::ListResources) {
        reply(req.id, MakeObject({{"resources", MakeArray({MakeObject({
            {"uri", JSONValue("memo://greeting")},
            {"name", JSONValue("greeting")},
            {"mimeType", JSONValue("text/plain")}
        })})}}));
    } else if (req.method == Methods::ReadResource) {
        const std::string uri = GetString(req.params.value_or(JSONValue()), "uri").value_or("");
        if (uri != "memo://greeting") {
            replyError(req.id, JSONRPCErrorCodes::ResourceNotFound, "No such resource: " + uri);
            return;
        }
        reply(req.id, MakeObject({{"contents", MakeArray({MakeObject({
            {"uri", JSONValue(uri)}, {"mimeType", JSONValue("text/plain")}, {"text", JSONValue("hello")}
        })})}}));
    } else {
        replyError(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
    }
}

} // namespace

int main() {
    std::cerr << "echo-server starting" << std::endl;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        JSONValue msg;
        try {
            msg = ParseJSON(line);
        } catch (const JSONParseError& e) {
            writeLine(CreateErrorResponse(JSONRPCId{nullptr}, JSONRPCErrorCodes::ParseError, e.what())->Serialize());
            continue;
        }
        if (ClassifyMessage(msg) != MessageKind::Request) {
            continue;
        }
        JSONRPCRequest req;
        if (req.FromJSON(msg)) {
            handleRequest(req);
        }
    }
    std::cerr << "echo-server stdin closed" << std::endl;
    return 0;
}
