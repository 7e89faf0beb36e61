//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientOptions.h
// Purpose: Per-connection client configuration with environment overrides
//==========================================================================================================

#pragma once

#include <chrono>

#include "lmcp/JSONRPCTypes.h"
#include "lmcp/Protocol.h"
#include "lmcp/validation/Validation.h"

namespace lmcp {

//==========================================================================================================
// ClientOptions
// Purpose: Settings shared by ProtocolClient, SchemaRegistry and InvocationProxy.
// Fields:
//   clientInfo: Announced in initialize; version defaults to the library version.
//   capabilities: Client capabilities object sent in initialize.
//   handshakeTimeout: Bound on the initialize round trip.
//   requestTimeout: Default per-call deadline; zero disables the deadline.
//   readerPollInterval: Reader loop wake-up period; also the deadline sweep granularity.
//   validationMode: Strict (default) rejects missing required parameters client-side.
//   autoDiscover: Invocation proxy discovers tools when the registry is empty.
//==========================================================================================================
struct ClientOptions {
    Implementation clientInfo;
    JSONValue capabilities;
    std::chrono::milliseconds handshakeTimeout{30000};
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds readerPollInterval{50};
    validation::ValidationMode validationMode{validation::ValidationMode::Strict};
    bool autoDiscover{true};

    ClientOptions();

    //==========================================================================================================
    // FromEnvironment
    // Purpose: Defaults overridden by LMCP_HANDSHAKE_TIMEOUT_MS, LMCP_REQUEST_TIMEOUT_MS, LMCP_VALIDATION,
    //          LMCP_AUTO_DISCOVER.
    //==========================================================================================================
    static ClientOptions FromEnvironment();
};

} // namespace lmcp
