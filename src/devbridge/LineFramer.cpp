//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.cpp
// Purpose: Newline-delimited framer with oversize-line resynchronization
//========================================================================================================

#include "devbridge/LineFramer.h"
#include "logging/Logger.h"

namespace devbridge {

LineFramer::LineFramer(std::size_t maxLineBytes) : maxLineBytes(maxLineBytes) {}

std::vector<std::string> LineFramer::Feed(std::string_view chunk) {
    std::vector<std::string> lines;
    std::size_t pos = 0;
    while (pos < chunk.size()) {
        std::size_t nl = chunk.find('\n', pos);
        std::string_view piece = (nl == std::string_view::npos) ? chunk.substr(pos) : chunk.substr(pos, nl - pos);

        if (discarding) {
            currentDiscard += piece.size();
            if (nl == std::string_view::npos) {
                return lines;
            }
            finishDiscard();
            pos = nl + 1;
            continue;
        }

        if (buffer.size() + piece.size() > maxLineBytes) {
            currentDiscard = buffer.size() + piece.size();
            buffer.clear();
            if (nl == std::string_view::npos) {
                discarding = true;
                return lines;
            }
            finishDiscard();
            pos = nl + 1;
            continue;
        }

        buffer.append(piece.data(), piece.size());
        if (nl == std::string_view::npos) {
            return lines;
        }
        pos = nl + 1;

        if (!buffer.empty() && buffer.back() == '\r') {
            buffer.pop_back();
        }
        if (!buffer.empty()) {
            lines.push_back(std::move(buffer));
        }
        buffer.clear();
    }
    return lines;
}

void LineFramer::finishDiscard() {
    LOG_WARN("Discarded oversized input line of {} bytes (limit {}); a request on it gets no reply",
             currentDiscard, maxLineBytes);
    discardedBytes += currentDiscard;
    currentDiscard = 0;
    discarding = false;
    ++discardedLines;
}

std::string LineFramer::Encode(const std::string& payload) {
    std::string frame;
    frame.reserve(payload.size() + 1);
    frame.append(payload);
    frame.push_back('\n');
    return frame;
}

} // namespace devbridge
