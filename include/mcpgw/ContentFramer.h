//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for message framing over subprocess pipes (JSON lines and Content-Length)
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>
#include <vector>

namespace mcpgw {

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes to drop from the front of the buffer (also set for errors)
    };
    virtual std::string encode(const std::string& payload) = 0;
    // Removes and returns the first complete frame; leaves the buffer untouched otherwise.
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

// Wire framing used on a subprocess's stdin/stdout.
enum class FramingMode {
    JsonLines,
    ContentLength
};

const char* framingName(FramingMode mode);

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 1024 * 1024);
std::unique_ptr<IContentFramer> MakeJsonLinesFramer(std::size_t maxLineLength = 1024 * 1024);
std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode, std::size_t maxLength = 1024 * 1024);

//========================================================================================================
// SniffFraming
// Purpose: Decides how to decode the front of an inbound buffer.
// Returns:
//   ContentLength when the buffer starts with a "Content-Length" header (case-insensitive, leading
//   whitespace ignored), JsonLines for any other content, nullopt while too little has arrived to tell.
//========================================================================================================
std::optional<FramingMode> SniffFraming(const std::string& buffer);

//==========================================================================================================
// DrainFrames
// Purpose: Extracts every complete frame from the front of a growing read buffer. The framing of each
//          frame is sniffed independently; unparseable or oversized frames are dropped with a warning.
// Args:
//   buffer: Accumulated bytes. Consumed frames are erased; a partial trailing frame is left in place.
//   maxFrameBytes: Largest accepted payload.
// Returns:
//   Payloads in arrival order.
//==========================================================================================================
std::vector<std::string> DrainFrames(std::string& buffer, std::size_t maxFrameBytes = 1024 * 1024);

} // namespace mcpgw
