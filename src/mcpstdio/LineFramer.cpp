//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.cpp
// Purpose: Newline-delimited framer for the stdio transport
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "mcpstdio/ContentFramer.h"

namespace mcpstdio {

namespace {
class LineFramer : public IContentFramer {
public:
    explicit LineFramer(std::size_t maxLen) : maxFrameBytes(maxLen) {}

    std::string encode(const std::string& payload) override {
        if (payload.find_first_of("\r\n") != std::string::npos) {
            throw std::invalid_argument("frame payload contains a line terminator");
        }
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t eol = buffer.find('\n');

        if (discardingLine) {
            if (eol == std::string::npos) {
                return { DecodeStatus::Incomplete, std::nullopt, buffer.size() };
            }
            discardingLine = false;
            return { DecodeStatus::Skip, std::nullopt, eol + 1 };
        }

        if (eol == std::string::npos) {
            // Allow one extra byte for a trailing '\r' that will be stripped
            if (buffer.size() > maxFrameBytes + 1) {
                LOG_WARN("Inbound line exceeds {} bytes; discarding until end of line", maxFrameBytes);
                discardingLine = true;
                return { DecodeStatus::TooLarge, std::nullopt, buffer.size() };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }

        std::size_t len = eol;
        if (len > 0 && buffer[len - 1] == '\r') {
            --len;
        }
        if (len > maxFrameBytes) {
            LOG_WARN("Inbound line of {} bytes exceeds limit {}", len, maxFrameBytes);
            return { DecodeStatus::TooLarge, std::nullopt, eol + 1 };
        }
        const bool blank = std::all_of(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(len),
                                       [](unsigned char c){ return c == ' ' || c == '\t' || c == '\r'; });
        if (blank) {
            return { DecodeStatus::Skip, std::nullopt, eol + 1 };
        }
        return { DecodeStatus::Ok, std::make_optional(buffer.substr(0, len)), eol + 1 };
    }

    bool discarding() const override { return discardingLine; }

private:
    std::size_t maxFrameBytes;
    bool discardingLine{false};
};
} // namespace

std::unique_ptr<IContentFramer> MakeLineFramer(std::size_t maxFrameBytes) {
    return std::make_unique<LineFramer>(maxFrameBytes);
}

} // namespace mcpstdio
