//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramers.cpp
// Purpose: Content-Length (CRLF or LF header terminator) and newline-delimited JSON framers
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcpgw/ContentFramer.h"

namespace mcpgw {

namespace {
const std::string kHeaderName = "content-length";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        // Either terminator is accepted; whichever occurs first ends the header block.
        std::size_t crlf = buffer.find("\r\n\r\n");
        std::size_t lf = buffer.find("\n\n");
        std::size_t headerEnd = std::string::npos;
        std::size_t sepLen = 0;
        if (crlf != std::string::npos && (lf == std::string::npos || crlf < lf)) {
            headerEnd = crlf; sepLen = 4;
        } else if (lf != std::string::npos) {
            headerEnd = lf; sepLen = 2;
        }
        if (headerEnd == std::string::npos) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerAndSep = headerEnd + sepLen;

        std::size_t pos = 0;
        std::size_t contentLength = 0;
        bool haveLength = false;
        while (pos < headerEnd) {
            std::size_t eol = buffer.find('\n', pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            std::string line = buffer.substr(pos, eol - pos);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            auto colon = line.find(':');
            if (colon != std::string::npos) {
                std::string name = toLower(line.substr(0, colon));
                name.erase(0, name.find_first_not_of(" \t"));
                std::string value = line.substr(colon + 1);
                value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); }));
                value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
                if (name == kHeaderName) {
                    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; })) {
                        LOG_WARN("Invalid Content-Length header: {}", value);
                        return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
                    }
                    try {
                        unsigned long long v64 = std::stoull(value);
                        if (v64 > maxContentLength || v64 > std::numeric_limits<std::size_t>::max()) {
                            LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                            return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
                        }
                        contentLength = static_cast<std::size_t>(v64);
                        haveLength = true;
                    } catch (const std::out_of_range&) {
                        LOG_WARN("Content-Length out of range: {}", value);
                        return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
                    }
                }
            }
            pos = eol + 1;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }

        if (contentLength > std::numeric_limits<std::size_t>::max() - headerAndSep) {
            LOG_WARN("Frame size overflow detected (header={}, len={})", headerAndSep, contentLength);
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }
        std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }

        std::string payload = buffer.substr(headerAndSep, contentLength);
        return { DecodeStatus::Ok, std::make_optional(std::move(payload)), frameTotal };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
                buffer.erase(0, r.bytesConsumed);
            }
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxContentLength;
};

class JsonLinesFramer : public IContentFramer {
public:
    explicit JsonLinesFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t pos = 0;
        while (true) {
            std::size_t eol = buffer.find('\n', pos);
            if (eol == std::string::npos) {
                if (buffer.size() - pos > maxLineLength) {
                    LOG_WARN("JSON line exceeds limits (buffered={}, max={})", buffer.size() - pos, maxLineLength);
                    return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
                }
                // Blank lines seen so far may be dropped by the caller
                return { DecodeStatus::Incomplete, std::nullopt, pos };
            }
            std::string line = buffer.substr(pos, eol - pos);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            bool blank = std::all_of(line.begin(), line.end(), [](unsigned char ch){ return std::isspace(ch) != 0; });
            if (blank) {
                pos = eol + 1;
                continue;
            }
            if (line.size() > maxLineLength) {
                LOG_WARN("JSON line exceeds limits (len={}, max={})", line.size(), maxLineLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, eol + 1 };
            }
            return { DecodeStatus::Ok, std::make_optional(std::move(line)), eol + 1 };
        }
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
    std::size_t maxLineLength;
};
} // namespace

const char* framingName(FramingMode mode) {
    return mode == FramingMode::ContentLength ? "content_length" : "json_lines";
}

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

std::unique_ptr<IContentFramer> MakeJsonLinesFramer(std::size_t maxLineLength) {
    return std::make_unique<JsonLinesFramer>(maxLineLength);
}

std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode, std::size_t maxLength) {
    if (mode == FramingMode::ContentLength) {
        return MakeContentLengthFramer(maxLength);
    }
    return MakeJsonLinesFramer(maxLength);
}

std::optional<FramingMode> SniffFraming(const std::string& buffer) {
    std::size_t start = buffer.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    const std::size_t available = buffer.size() - start;
    const std::size_t prefixLen = std::min(available, kHeaderName.size());
    std::string head = toLower(buffer.substr(start, prefixLen));
    if (head != kHeaderName.substr(0, prefixLen)) {
        return FramingMode::JsonLines;
    }
    if (prefixLen < kHeaderName.size()) {
        return std::nullopt;
    }
    return FramingMode::ContentLength;
}

std::vector<std::string> DrainFrames(std::string& buffer, std::size_t maxFrameBytes) {
    std::vector<std::string> frames;
    auto contentLength = MakeContentLengthFramer(maxFrameBytes);
    auto jsonLines = MakeJsonLinesFramer(maxFrameBytes);
    while (!buffer.empty()) {
        auto mode = SniffFraming(buffer);
        if (!mode.has_value()) {
            break;
        }
        IContentFramer* framer = jsonLines.get();
        if (*mode == FramingMode::ContentLength) {
            // Separators left over from a previous frame precede the header
            buffer.erase(0, buffer.find_first_not_of(" \t\r\n"));
            framer = contentLength.get();
        }
        auto r = framer->tryDecodeEx(buffer);
        if (r.status == IContentFramer::DecodeStatus::Ok) {
            buffer.erase(0, r.bytesConsumed);
            frames.push_back(std::move(*r.payload));
            continue;
        }
        if (r.status == IContentFramer::DecodeStatus::Incomplete) {
            if (r.bytesConsumed > 0) {
                buffer.erase(0, r.bytesConsumed);
            }
            break;
        }
        LOG_WARN("Dropping undecodable {} frame ({} bytes)", framingName(*mode), r.bytesConsumed);
        if (r.bytesConsumed == 0) {
            std::size_t eol = buffer.find('\n');
            r.bytesConsumed = (eol == std::string::npos) ? buffer.size() : eol + 1;
        }
        buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
    }
    return frames;
}

} // namespace mcpgw
