//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NewlineFramer.cpp
// Purpose: Newline-delimited JSON framer (the MCP stdio default)
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "lmcp/ContentFramer.h"

namespace lmcp {

namespace {
class NewlineFramer : public IContentFramer {
public:
    explicit NewlineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    // Serialized JSON never contains a raw newline, so the payload is written as-is.
    std::string encode(const std::string& payload) override {
        std::string frame;
        frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::size_t eol = buffer.find('\n');
        if (eol == std::string::npos) {
            if (buffer.size() > maxLineLength) {
                LOG_WARN("Inbound line exceeds {} bytes without a terminator", maxLineLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        std::size_t len = eol;
        if (len > 0 && buffer[len - 1] == '\r') {
            --len;
        }
        if (len > maxLineLength) {
            LOG_WARN("Inbound line of {} bytes exceeds limit {}", len, maxLineLength);
            return { DecodeStatus::BodyTooLarge, std::nullopt, eol + 1 };
        }
        if (buffer.find_first_not_of(" \t\r", 0) >= len) {
            return { DecodeStatus::Skipped, std::nullopt, eol + 1 };
        }
        return { DecodeStatus::Ok, buffer.substr(0, len), eol + 1 };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        while (true) {
            DecodeResult r = tryDecodeEx(buffer);
            if (r.status == DecodeStatus::Skipped) {
                buffer.erase(0, r.bytesConsumed);
                continue;
            }
            if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
                buffer.erase(0, r.bytesConsumed);
                return r.payload;
            }
            return std::nullopt;
        }
    }

private:
    std::size_t maxLineLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength) {
    return std::make_unique<NewlineFramer>(maxLineLength);
}

} // namespace lmcp
