//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseDeduplicator.h
// Purpose: Bounded memory of answered request ids used to suppress duplicate responses
//========================================================================================================

#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <unordered_set>

#include "devbridge/JSONRPCTypes.h"

namespace devbridge {

class ResponseDeduplicator {
public:
    explicit ResponseDeduplicator(std::size_t capacity = 4096);

    // Records the id as answered. Returns false when it was already recorded (duplicate).
    bool MarkAnswered(const JSONRPCId& id);

    // Clears the answered mark for an id so that a new request reusing it can be answered again.
    void Forget(const JSONRPCId& id);

    // Inspects a serialized frame; returns false when it is a response whose id was already answered.
    // Frames that are not responses (or cannot be parsed) always pass.
    bool AdmitFrame(const std::string& frame);

    std::size_t Size() const { return order.size(); }

private:
    std::size_t capacity;
    std::deque<std::string> order;
    std::unordered_set<std::string> answered;
};

} // namespace devbridge
