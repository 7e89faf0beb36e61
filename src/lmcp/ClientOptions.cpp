//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientOptions.cpp
// Purpose: ClientOptions defaults and environment overrides
//==========================================================================================================

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "lmcp/ClientOptions.h"
#include "lmcp/version.h"

namespace lmcp {

ClientOptions::ClientOptions()
    : clientInfo(DefaultClientInfo()),
      capabilities(JSONValue::Object{}) {}

ClientOptions ClientOptions::FromEnvironment() {
    ClientOptions o;
    o.handshakeTimeout = std::chrono::milliseconds(
        GetEnvUint64OrDefault("LMCP_HANDSHAKE_TIMEOUT_MS", static_cast<uint64_t>(o.handshakeTimeout.count())));
    o.requestTimeout = std::chrono::milliseconds(
        GetEnvUint64OrDefault("LMCP_REQUEST_TIMEOUT_MS", static_cast<uint64_t>(o.requestTimeout.count())));
    const std::string mode = GetEnvOrDefault("LMCP_VALIDATION", "");
    if (!mode.empty()) {
        if (auto parsed = validation::parseMode(mode)) {
            o.validationMode = *parsed;
        } else {
            LOG_WARN("Ignoring unknown LMCP_VALIDATION value: {}", mode);
        }
    }
    o.autoDiscover = GetEnvBoolOrDefault("LMCP_AUTO_DISCOVER", o.autoDiscover);
    return o;
}

} // namespace lmcp
