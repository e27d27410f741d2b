//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseDeduplicator.cpp
// Purpose: Sliding-window duplicate response suppression keyed by type-tagged id
//========================================================================================================

#include "devbridge/ResponseDeduplicator.h"
#include "logging/Logger.h"

namespace devbridge {

ResponseDeduplicator::ResponseDeduplicator(std::size_t capacity) : capacity(capacity == 0 ? 1 : capacity) {}

bool ResponseDeduplicator::MarkAnswered(const JSONRPCId& id) {
    std::string key = IdToKey(id);
    if (answered.count(key) > 0) {
        LOG_WARN("Suppressing duplicate response for id {}", IdToString(id));
        return false;
    }
    answered.insert(key);
    order.push_back(std::move(key));
    while (order.size() > capacity) {
        answered.erase(order.front());
        order.pop_front();
    }
    return true;
}

void ResponseDeduplicator::Forget(const JSONRPCId& id) {
    std::string key = IdToKey(id);
    if (answered.erase(key) == 0) {
        return;
    }
    for (auto it = order.begin(); it != order.end(); ++it) {
        if (*it == key) {
            order.erase(it);
            break;
        }
    }
}

bool ResponseDeduplicator::AdmitFrame(const std::string& frame) {
    JSONValue doc;
    try {
        doc = ParseJSON(frame);
    } catch (const JSONParseError& e) {
        LOG_DEBUG("Passing through unparseable frame: {}", e.what());
        return true;
    }
    if (FindMember(doc, "method") != nullptr) {
        return true;
    }
    if (FindMember(doc, "result") == nullptr && FindMember(doc, "error") == nullptr) {
        return true;
    }
    const JSONValue* idVal = FindMember(doc, "id");
    if (idVal == nullptr || idVal->isNull()) {
        return true;
    }
    auto id = IdFromValue(*idVal);
    if (!id.has_value()) {
        return true;
    }
    return MarkAnswered(id.value());
}

} // namespace devbridge
