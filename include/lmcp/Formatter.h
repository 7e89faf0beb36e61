//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Formatter.h
// Purpose: Rendering seam for results and errors; the library itself never prints
//==========================================================================================================

#pragma once

#include <string>

#include "lmcp/Protocol.h"
#include "lmcp/errors/Errors.h"

namespace lmcp {

//==========================================================================================================
// IResultFormatter
// Purpose: Supplied by the embedding application (CLI, UI) to turn results and typed errors into text.
//==========================================================================================================
class IResultFormatter {
public:
    virtual ~IResultFormatter() = default;
    virtual std::string FormatResult(const ToolResult& result) = 0;
    virtual std::string FormatError(const errors::LmcpError& error) = 0;
};

} // namespace lmcp
