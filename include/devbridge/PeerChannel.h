//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PeerChannel.h
// Purpose: Abstraction of the single downstream peer connection as seen by the correlator
//==========================================================================================================

#pragma once

#include <string>

namespace devbridge {

//==========================================================================================================
// IPeerChannel
// Purpose: Minimal outbound view of the peer. Implemented by PeerListener; tests substitute fakes.
//==========================================================================================================
class IPeerChannel {
public:
    virtual ~IPeerChannel() = default;

    //==========================================================================================================
    // Indicates whether a peer is currently attached.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Queues one text frame for the current peer.
    // Args:
    //   frame: Serialized JSON payload.
    // Returns:
    //   false when no peer is attached or the connection is already closing.
    //==========================================================================================================
    virtual bool Send(const std::string& frame) = 0;
};

} // namespace devbridge
