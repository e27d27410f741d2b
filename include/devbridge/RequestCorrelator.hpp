//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.hpp
// Purpose: Matches asynchronous peer responses to outbound tool calls (pending table + timeouts)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "devbridge/JSONRPCTypes.h"
#include "devbridge/PeerChannel.h"
#include "devbridge/errors/Errors.h"

namespace devbridge {

//==========================================================================================================
// PeerRequestId
// Purpose: Identifier of an outbound peer request. Distinct from client JSONRPCId so the two can never
//          be mixed up at compile time.
//==========================================================================================================
struct PeerRequestId {
    int64_t value{0};

    bool operator==(const PeerRequestId& other) const { return value == other.value; }
    bool operator!=(const PeerRequestId& other) const { return value != other.value; }
};

struct PeerRequestIdHash {
    std::size_t operator()(const PeerRequestId& id) const noexcept { return std::hash<int64_t>{}(id.value); }
};

//==========================================================================================================
// PeerReply
// Purpose: Outcome of one peer call. Exactly one of result/error is set.
//==========================================================================================================
struct PeerReply {
    std::optional<JSONValue> result;
    std::optional<errors::BridgeError> error;

    bool ok() const { return !error.has_value(); }
};

//==========================================================================================================
// RequestCorrelator
// Purpose: Owns the pending-request table. Ids start at 1 per instance. Each entry is removed before its
//          completion runs, so a response, timeout or disconnect resolves it at most once.
// Notes:
//   - Must be owned by std::shared_ptr; timeout handlers hold a weak reference.
//   - Not thread-safe; all calls happen on the io_context thread.
//==========================================================================================================
class RequestCorrelator : public std::enable_shared_from_this<RequestCorrelator> {
public:
    using Completion = std::function<void(PeerReply)>;

    RequestCorrelator(boost::asio::io_context& ioc, IPeerChannel& channel,
                      std::chrono::milliseconds requestTimeout = std::chrono::milliseconds(15000));
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    //==========================================================================================================
    // Send
    // Purpose: Forwards a tool call to the peer as {"id","name","arguments","jsonrpc":"2.0"}.
    // Args:
    //   name: Tool name.
    //   arguments: Tool arguments object.
    //   completion: Invoked exactly once with the result, a peer error, a timeout or a disconnect.
    // Returns:
    //   The assigned id, or std::nullopt when the call failed immediately (completion already invoked
    //   with PeerNotConnected or PeerDisconnected; no pending entry remains).
    //==========================================================================================================
    std::optional<PeerRequestId> Send(const std::string& name, const JSONValue& arguments, Completion completion);

    //==========================================================================================================
    // OnPeerMessage
    // Purpose: Routes one inbound peer frame to its pending entry. Unknown, late or malformed frames are
    //          logged and dropped.
    //==========================================================================================================
    void OnPeerMessage(const std::string& frame);

    //==========================================================================================================
    // RejectAll
    // Purpose: Completes every pending entry with PeerDisconnected before returning; the table is empty.
    //==========================================================================================================
    void RejectAll(const std::string& reason);

    std::size_t PendingCount() const { return pending.size(); }

    // Age of the oldest pending request, if any.
    std::optional<std::chrono::milliseconds> OldestPendingAge() const;

    // Ids of pending requests older than the given age.
    std::vector<PeerRequestId> StaleRequests(std::chrono::milliseconds olderThan) const;

private:
    struct PendingRequest {
        std::string toolName;
        std::chrono::steady_clock::time_point createdAt;
        std::unique_ptr<boost::asio::steady_timer> timer;
        Completion completion;
    };

    // Erases the entry then invokes its completion.
    void complete(PeerRequestId id, PeerReply reply);
    void onTimeout(PeerRequestId id);

    boost::asio::io_context& ioc;
    IPeerChannel& channel;
    std::chrono::milliseconds requestTimeout;
    int64_t nextId{1};
    std::unordered_map<PeerRequestId, PendingRequest, PeerRequestIdHash> pending;
};

} // namespace devbridge
