//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length framer for servers speaking LSP-style headers on stdio
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "lmcp/ContentFramer.h"

namespace lmcp {

namespace {
class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        static const std::string sep = "\r\n\r\n";
        const std::size_t headerEnd = buffer.find(sep);
        if (headerEnd == std::string::npos) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerAndSep = headerEnd + sep.size();

        std::size_t pos = 0;
        std::size_t contentLength = 0;
        bool haveLength = false;
        while (pos < headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            const std::string line = buffer.substr(pos, eol - pos);
            pos = eol + 2;
            const auto colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string name = line.substr(0, colon);
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            if (name != "content-length") {
                continue; // Content-Type and friends are tolerated
            }
            std::string value = line.substr(colon + 1);
            value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); }));
            value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
            uint64_t v64 = 0;
            if (!ParseUint64(value, v64)) {
                LOG_WARN("Invalid Content-Length header: {}", value);
                return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
            }
            if (v64 > maxContentLength || v64 > std::numeric_limits<std::size_t>::max() - headerAndSep) {
                LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
            }
            contentLength = static_cast<std::size_t>(v64);
            haveLength = true;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }

        const std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        return { DecodeStatus::Ok, buffer.substr(headerAndSep, contentLength), frameTotal };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            buffer.erase(0, r.bytesConsumed);
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxContentLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

std::optional<FramingMode> parseFramingMode(const std::string& s) {
    std::string v; v.reserve(s.size());
    for (char c : s) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "newline" || v == "ndjson" || v == "line") return FramingMode::Newline;
    if (v == "content-length" || v == "contentlength" || v == "lsp") return FramingMode::ContentLength;
    return std::nullopt;
}

std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode, std::size_t maxFrameBytes) {
    if (mode == FramingMode::ContentLength) {
        return MakeContentLengthFramer(maxFrameBytes);
    }
    return MakeNewlineFramer(maxFrameBytes);
}

} // namespace lmcp
