//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers; the numbers come from the CMake project version
//==========================================================================================================
#include "lmcp/version.h"

#include <tuple>

#include <fmt/format.h>

#ifndef LMCP_VERSION_MAJOR
#error "LMCP_VERSION_MAJOR, LMCP_VERSION_MINOR and LMCP_VERSION_PATCH are set by the build"
#endif

namespace lmcp {

std::string VersionInfo::ToString() const {
    return fmt::format("{}.{}.{}", major, minor, patch);
}

bool VersionInfo::AtLeast(int otherMajor, int otherMinor, int otherPatch) const {
    return std::tie(major, minor, patch) >= std::tie(otherMajor, otherMinor, otherPatch);
}

VersionInfo getVersion() {
    return VersionInfo{LMCP_VERSION_MAJOR, LMCP_VERSION_MINOR, LMCP_VERSION_PATCH};
}

std::string getVersionString() {
    return getVersion().ToString();
}

Implementation DefaultClientInfo() {
    return Implementation(kClientName, getVersionString());
}

} // namespace lmcp
