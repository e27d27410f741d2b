//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.h
// Purpose: Newline-delimited framing for the stdio channel
//========================================================================================================

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace devbridge {

//========================================================================================================
// LineFramer
// Purpose: Accumulates arbitrary byte chunks and yields complete lines.
//   - '\n' terminates a frame; one trailing '\r' is stripped.
//   - Blank lines are ignored.
//   - A partial line is carried across chunks.
//   - A line longer than maxLineBytes is discarded in full; framing resumes after its newline.
//     The line is counted and logged once its newline arrives.
//========================================================================================================
class LineFramer {
public:
    explicit LineFramer(std::size_t maxLineBytes = 1024 * 1024);

    // Feed a chunk and return every line completed by it, in order.
    std::vector<std::string> Feed(std::string_view chunk);

    // Append the frame terminator.
    static std::string Encode(const std::string& payload);

    std::size_t BufferedBytes() const { return buffer.size(); }
    std::size_t DiscardedLines() const { return discardedLines; }
    std::size_t DiscardedBytes() const { return discardedBytes; }

private:
    void finishDiscard();

    std::size_t maxLineBytes;
    std::string buffer;
    bool discarding{false};
    std::size_t discardedLines{0};
    std::size_t discardedBytes{0};
    std::size_t currentDiscard{0};
};

} // namespace devbridge
