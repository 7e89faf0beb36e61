//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LaunchDescriptor.h
// Purpose: Value describing how to start a tool server process
//==========================================================================================================

#pragma once

#include <map>
#include <string>
#include <vector>

namespace lmcp {

//==========================================================================================================
// LaunchDescriptor
// Purpose: Executable, arguments, working directory and environment overrides for one tool server.
// Fields:
//   command: Executable path or a name resolved against PATH.
//   args: Arguments (argv[1..]).
//   workingDirectory: Directory to start in; empty inherits the caller's.
//   environment: Variables added to (or replacing entries of) the inherited environment.
//==========================================================================================================
struct LaunchDescriptor {
    std::string command;
    std::vector<std::string> args;
    std::string workingDirectory;
    std::map<std::string, std::string> environment;

    // Stable identity string; equal descriptors produce equal keys.
    std::string Key() const;

    // Shell-like rendering for logs.
    std::string ToString() const;

    //==========================================================================================================
    // FromCommandLine
    // Purpose: Splits a command line on whitespace honoring single/double quotes and backslash escapes.
    // Args:
    //   commandLine: e.g. "npx -y @modelcontextprotocol/server-filesystem '/tmp/my dir'".
    // Returns:
    //   Descriptor with command = first word, args = the rest.
    // Throws:
    //   std::invalid_argument on empty input or an unterminated quote.
    //==========================================================================================================
    static LaunchDescriptor FromCommandLine(const std::string& commandLine);
};

bool operator==(const LaunchDescriptor& a, const LaunchDescriptor& b);

} // namespace lmcp
