//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version and the client identity sent in initialize
//==========================================================================================================
#pragma once

#include <string>

#include "lmcp/Protocol.h"

namespace lmcp {

// Name reported as clientInfo.name unless ClientOptions overrides it.
constexpr const char* kClientName = "lmcp";

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version of the lmcp library, taken from the build.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;

    // "MAJOR.MINOR.PATCH"
    std::string ToString() const;

    bool AtLeast(int otherMajor, int otherMinor = 0, int otherPatch = 0) const;
};

VersionInfo getVersion();
std::string getVersionString();

//==========================================================================================================
// DefaultClientInfo
// Purpose: Implementation {kClientName, getVersionString()} used as ClientOptions::clientInfo.
//==========================================================================================================
Implementation DefaultClientInfo();

} // namespace lmcp
