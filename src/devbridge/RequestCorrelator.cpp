//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.cpp
// Purpose: Pending-request table with per-request timers and exactly-once completion
//==========================================================================================================

#include "devbridge/RequestCorrelator.hpp"
#include "logging/Logger.h"

#include <boost/asio/error.hpp>

namespace devbridge {
namespace net = boost::asio;

RequestCorrelator::RequestCorrelator(net::io_context& ioc, IPeerChannel& channel,
                                     std::chrono::milliseconds requestTimeout)
    : ioc(ioc), channel(channel), requestTimeout(requestTimeout) {}

RequestCorrelator::~RequestCorrelator() {
    for (auto& [id, entry] : pending) {
        if (entry.timer) {
            entry.timer->cancel();
        }
    }
}

std::optional<PeerRequestId> RequestCorrelator::Send(const std::string& name, const JSONValue& arguments,
                                                     Completion completion) {
    FUNC_SCOPE();
    if (!channel.IsConnected()) {
        LOG_WARN("Tool call '{}' rejected: no peer connected", name);
        PeerReply reply;
        reply.error = errors::makePeerError(errors::ErrorCategory::PeerNotConnected, "Not connected to plugin");
        completion(std::move(reply));
        return std::nullopt;
    }

    PeerRequestId id{nextId++};

    JSONValue::Object msg;
    msg["id"] = std::make_shared<JSONValue>(id.value);
    msg["name"] = std::make_shared<JSONValue>(name);
    msg["arguments"] = std::make_shared<JSONValue>(arguments);
    msg["jsonrpc"] = std::make_shared<JSONValue>("2.0");
    const std::string frame = SerializeJSON(JSONValue(std::move(msg)));

    PendingRequest entry;
    entry.toolName = name;
    entry.createdAt = std::chrono::steady_clock::now();
    entry.timer = std::make_unique<net::steady_timer>(ioc, requestTimeout);
    entry.completion = std::move(completion);

    std::weak_ptr<RequestCorrelator> weak = weak_from_this();
    entry.timer->async_wait([weak, id](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (auto self = weak.lock()) {
            self->onTimeout(id);
        }
    });
    pending.emplace(id, std::move(entry));

    if (!channel.Send(frame)) {
        LOG_WARN("Peer refused request {} ({})", id.value, name);
        PeerReply reply;
        reply.error = errors::makePeerError(errors::ErrorCategory::PeerDisconnected, "Connection to plugin closed");
        complete(id, std::move(reply));
        return std::nullopt;
    }
    LOG_DEBUG("Forwarded request {} ({}) to peer; {} pending", id.value, name, pending.size());
    return id;
}

void RequestCorrelator::complete(PeerRequestId id, PeerReply reply) {
    auto it = pending.find(id);
    if (it == pending.end()) {
        return;
    }
    Completion completion = std::move(it->second.completion);
    if (it->second.timer) {
        it->second.timer->cancel();
    }
    pending.erase(it);
    if (completion) {
        completion(std::move(reply));
    }
}

void RequestCorrelator::onTimeout(PeerRequestId id) {
    auto it = pending.find(id);
    if (it == pending.end()) {
        return;
    }
    LOG_WARN("Request {} ({}) timed out after {} ms", id.value, it->second.toolName, requestTimeout.count());
    PeerReply reply;
    const auto seconds = requestTimeout.count() / 1000;
    std::string message = (requestTimeout.count() % 1000 == 0)
        ? "Request timed out after " + std::to_string(seconds) + (seconds == 1 ? " second" : " seconds")
        : "Request timed out after " + std::to_string(requestTimeout.count()) + " ms";
    reply.error = errors::makePeerError(errors::ErrorCategory::PeerTimeout, message);
    complete(id, std::move(reply));
}

void RequestCorrelator::OnPeerMessage(const std::string& frame) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = ParseJSON(frame);
    } catch (const JSONParseError& e) {
        LOG_WARN("Dropping unparseable peer frame: {}", e.what());
        return;
    }
    const JSONValue* idVal = FindMember(doc, "id");
    if (idVal == nullptr || !idVal->isInteger()) {
        LOG_WARN("Dropping peer frame without integer id");
        return;
    }
    PeerRequestId id{std::get<int64_t>(idVal->value)};
    if (pending.find(id) == pending.end()) {
        LOG_WARN("Dropping response for unknown or expired request {}", id.value);
        return;
    }

    PeerReply reply;
    if (const JSONValue* err = FindMember(doc, "error"); err != nullptr && !err->isNull()) {
        std::string message = "Peer reported an error";
        if (const JSONValue* m = FindMember(*err, "message"); m != nullptr && m->isString()) {
            message = std::get<std::string>(m->value);
        } else if (err->isString()) {
            message = std::get<std::string>(err->value);
        }
        LOG_DEBUG("Request {} failed at peer: {}", id.value, message);
        reply.error = errors::makePeerError(errors::ErrorCategory::PeerRejected, message);
    } else if (const JSONValue* res = FindMember(doc, "result"); res != nullptr) {
        reply.result = *res;
    } else {
        reply.result = JSONValue(nullptr);
    }
    complete(id, std::move(reply));
}

void RequestCorrelator::RejectAll(const std::string& reason) {
    FUNC_SCOPE();
    if (pending.empty()) {
        return;
    }
    LOG_WARN("Rejecting {} pending request(s): {}", pending.size(), reason);
    std::vector<PeerRequestId> ids;
    ids.reserve(pending.size());
    for (const auto& [id, entry] : pending) {
        ids.push_back(id);
    }
    for (const auto& id : ids) {
        PeerReply reply;
        reply.error = errors::makePeerError(errors::ErrorCategory::PeerDisconnected,
                                            "Connection to plugin closed");
        complete(id, std::move(reply));
    }
}

std::optional<std::chrono::milliseconds> RequestCorrelator::OldestPendingAge() const {
    if (pending.empty()) {
        return std::nullopt;
    }
    auto now = std::chrono::steady_clock::now();
    auto oldest = now;
    for (const auto& [id, entry] : pending) {
        if (entry.createdAt < oldest) {
            oldest = entry.createdAt;
        }
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - oldest);
}

std::vector<PeerRequestId> RequestCorrelator::StaleRequests(std::chrono::milliseconds olderThan) const {
    std::vector<PeerRequestId> out;
    auto now = std::chrono::steady_clock::now();
    for (const auto& [id, entry] : pending) {
        if (now - entry.createdAt > olderThan) {
            out.push_back(id);
        }
    }
    return out;
}

} // namespace devbridge
