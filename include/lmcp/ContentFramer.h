//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for message framing on process pipes (newline-delimited and Content-Length)
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace lmcp {

enum class FramingMode {
    Newline,
    ContentLength
};

inline const char* toString(FramingMode mode) {
    return mode == FramingMode::ContentLength ? "content-length" : "newline";
}

// Accepts "newline"/"ndjson"/"line" and "content-length"/"lsp"; anything else yields nullopt.
std::optional<FramingMode> parseFramingMode(const std::string& s);

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge,
        Skipped
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes to drop from the buffer (Ok, Skipped, and error statuses)
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 1024 * 1024);
std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength = 4 * 1024 * 1024);
std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode, std::size_t maxFrameBytes);

} // namespace lmcp
