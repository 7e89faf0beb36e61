//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Command-line tool client: list, call and read against a stdio tool server
//==========================================================================================================

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "logging/Logger.h"
#include "lmcp/ConnectionManager.h"
#include "lmcp/Formatter.h"
#include "lmcp/ToolInvoker.h"
#include "lmcp/version.h"

using namespace lmcp;

namespace {

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--server")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

std::vector<std::string> getArgValues(int argc, char** argv, const std::string& key) {
    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind(key + "=", 0) == 0) {
            out.push_back(a.substr(key.size() + 1));
        }
    }
    return out;
}

std::vector<std::string> positionals(int argc, char** argv) {
    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) != 0) out.push_back(a);
    }
    return out;
}

class TextFormatter : public IResultFormatter {
public:
    std::string FormatResult(const ToolResult& result) override {
        std::string text = result.Text();
        if (!text.empty()) {
            return text;
        }
        if (result.structuredContent) {
            return SerializeJSON(*result.structuredContent);
        }
        return SerializeJSON(result.content);
    }

    std::string FormatError(const errors::LmcpError& error) override {
        std::string out = fmt::format("{}: {}", error.KindName(), error.what());
        if (const auto* missing = dynamic_cast<const errors::MissingParameterError*>(&error)) {
            out += fmt::format("\n  add the '{}' argument", missing->Parameter());
        } else if (const auto* exhausted = dynamic_cast<const errors::RetryExhaustedError*>(&error)) {
            out += fmt::format("\n  last failure kind: {}", errors::toString(exhausted->LastKind()));
        }
        return out;
    }
};

void printUsage() {
    std::cerr << "lmcp_tool_client " << getVersionString() << "\n"
              << "Usage: lmcp_tool_client --server=\"<command line>\" [--cwd=<dir>] [--env=KEY=VALUE]... <command>\n"
              << "Commands:\n"
              << "  list                       list tools\n"
              << "  call <tool> [json-args]    invoke a tool (args default to {})\n"
              << "  resources                  list resources\n"
              << "  read <uri>                 read a resource\n"
              << "  ping                       check the server responds\n";
}

std::string describeTool(const ToolDescriptor& tool) {
    std::string line = tool.name;
    std::string params;
    for (const auto& [name, spec] : tool.parameters) {
        if (!params.empty()) params += ", ";
        params += name + (spec.required ? "" : "?");
        if (!spec.type.empty()) params += ": " + spec.type;
    }
    line += "(" + params + ")";
    if (!tool.description.empty()) line += "  " + tool.description;
    return line;
}

int run(int argc, char** argv, IResultFormatter& formatter) {
    auto server = getArgValue(argc, argv, "--server");
    auto args = positionals(argc, argv);
    if (!server || args.empty()) {
        printUsage();
        return 2;
    }

    LaunchDescriptor descriptor = LaunchDescriptor::FromCommandLine(*server);
    if (auto cwd = getArgValue(argc, argv, "--cwd")) {
        descriptor.workingDirectory = *cwd;
    }
    for (const auto& kv : getArgValues(argc, argv, "--env")) {
        auto eq = kv.find('=');
        if (eq == std::string::npos) {
            std::cerr << "Ignoring --env without '=': " << kv << "\n";
            continue;
        }
        descriptor.environment[kv.substr(0, eq)] = kv.substr(eq + 1);
    }

    ConnectionManager manager;
    ToolInvoker invoker(manager, MakeDefaultPipeline());
    const ConnectionId id = manager.Open(descriptor);

    const std::string& command = args[0];
    if (command == "list") {
        for (const auto& tool : invoker.DiscoverTools(id)) {
            std::cout << describeTool(tool) << "\n";
        }
    } else if (command == "call" && args.size() >= 2) {
        JSONValue callArgs = args.size() >= 3 ? ParseJSON(args[2]) : JSONValue(JSONValue::Object{});
        std::cout << formatter.FormatResult(invoker.Invoke(id, args[1], callArgs)) << "\n";
    } else if (command == "resources") {
        for (const auto& res : invoker.DiscoverResources(id)) {
            std::cout << res.uri << "  " << res.name << (res.mimeType ? "  [" + *res.mimeType + "]" : "") << "\n";
        }
    } else if (command == "read" && args.size() >= 2) {
        std::cout << SerializeJSON(invoker.ReadResource(id, args[1])) << "\n";
    } else if (command == "ping") {
        HealthStatus health = manager.CheckHealth(id);
        std::cout << (health.IsHealthy() ? "healthy: " : "unhealthy: ") << health.detail << "\n";
        return health.IsHealthy() ? 0 : 1;
    } else {
        printUsage();
        return 2;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevel(LogLevel::LOG_WARN_LEVEL);
    Logger::configureFromEnvironment();

    TextFormatter formatter;
    try {
        return run(argc, argv, formatter);
    } catch (const errors::LmcpError& e) {
        std::cerr << formatter.FormatError(e) << "\n";
    } catch (const JSONParseError& e) {
        std::cerr << "Invalid JSON arguments: " << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
    }
    return 1;
}
