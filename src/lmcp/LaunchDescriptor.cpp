//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LaunchDescriptor.cpp
// Purpose: LaunchDescriptor identity, rendering and command-line parsing
//==========================================================================================================

#include <stdexcept>

#include "lmcp/JSONRPCTypes.h"
#include "lmcp/LaunchDescriptor.h"

namespace lmcp {

namespace {
std::string quoteIfNeeded(const std::string& s) {
    if (!s.empty() && s.find_first_of(" \t\"'\\$") == std::string::npos) {
        return s;
    }
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''"; else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}
} // namespace

std::string LaunchDescriptor::Key() const {
    // JSON keeps the key unambiguous for arguments containing separators
    JSONValue::Array argv;
    argv.push_back(std::make_shared<JSONValue>(command));
    for (const auto& a : args) argv.push_back(std::make_shared<JSONValue>(a));
    JSONValue::Object env;
    for (const auto& [k, v] : environment) env[k] = std::make_shared<JSONValue>(v);
    JSONValue key = MakeObject({
        {"argv", JSONValue(std::move(argv))},
        {"cwd", JSONValue(workingDirectory)},
        {"env", JSONValue(std::move(env))},
    });
    return CanonicalJSON(key);
}

std::string LaunchDescriptor::ToString() const {
    std::string out = quoteIfNeeded(command);
    for (const auto& a : args) {
        out.push_back(' ');
        out += quoteIfNeeded(a);
    }
    if (!workingDirectory.empty()) {
        out += " (cwd=" + workingDirectory + ")";
    }
    return out;
}

LaunchDescriptor LaunchDescriptor::FromCommandLine(const std::string& commandLine) {
    std::vector<std::string> words;
    std::string current;
    bool inWord = false;
    char quote = '\0';
    for (std::size_t i = 0; i < commandLine.size(); ++i) {
        const char c = commandLine[i];
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else if (c == '\\' && quote == '"' && i + 1 < commandLine.size()) {
                current.push_back(commandLine[++i]);
            } else {
                current.push_back(c);
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            inWord = true;
        } else if (c == '\\' && i + 1 < commandLine.size()) {
            current.push_back(commandLine[++i]);
            inWord = true;
        } else if (c == ' ' || c == '\t' || c == '\n') {
            if (inWord) {
                words.push_back(std::move(current));
                current.clear();
                inWord = false;
            }
        } else {
            current.push_back(c);
            inWord = true;
        }
    }
    if (quote != '\0') {
        throw std::invalid_argument("Unterminated quote in command line: " + commandLine);
    }
    if (inWord) {
        words.push_back(std::move(current));
    }
    if (words.empty()) {
        throw std::invalid_argument("Empty command line");
    }
    LaunchDescriptor d;
    d.command = words.front();
    d.args.assign(words.begin() + 1, words.end());
    return d;
}

bool operator==(const LaunchDescriptor& a, const LaunchDescriptor& b) {
    return a.command == b.command && a.args == b.args &&
           a.workingDirectory == b.workingDirectory && a.environment == b.environment;
}

} // namespace lmcp
