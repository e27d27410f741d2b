//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PeerListener.hpp
// Purpose: Coroutine-based WebSocket listener owning the single downstream peer (Boost.Beast)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/io_context.hpp>

#include "devbridge/PeerChannel.h"
#include "devbridge/PortAllocator.hpp"
#include "devbridge/PortStore.hpp"

namespace devbridge {

class PeerListener : public IPeerChannel {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   allocator: Bind host, port range and bind retry policy.
    //   pingInterval: Liveness sweep period. A peer that missed one pong is terminated on the next sweep.
    //   recreateDelay: Wait before recreating the acceptor after an accept error.
    //==========================================================================================================
    struct Options {
        PortAllocator::Options allocator;
        std::chrono::milliseconds pingInterval{5000};
        std::chrono::milliseconds recreateDelay{2000};
    };

    using MessageHandler = std::function<void(const std::string& frame)>;
    using DisconnectHandler = std::function<void(const std::string& reason)>;
    using ListeningHandler = std::function<void(uint16_t port)>;
    using FatalErrorHandler = std::function<void(const std::string& error)>;

    PeerListener(boost::asio::io_context& ioc, Options opts, std::shared_ptr<IPortStore> store);
    ~PeerListener();

    PeerListener(const PeerListener&) = delete;
    PeerListener& operator=(const PeerListener&) = delete;

    //==========================================================================================================
    // Spawns the accept loop and the liveness sweep on the io_context. Returns immediately.
    //==========================================================================================================
    void Start();

    //==========================================================================================================
    // Closes the acceptor and every session, cancels timers. The current peer's disconnect handler fires.
    //==========================================================================================================
    void Stop();

    bool IsConnected() const override;
    bool Send(const std::string& frame) override;

    // Port of the open acceptor, std::nullopt while not listening.
    std::optional<uint16_t> BoundPort() const;
    bool IsListening() const;

    // Time the current peer completed its handshake.
    std::optional<std::chrono::steady_clock::time_point> PeerConnectedAt() const;

    //==========================================================================================================
    // Handler registration. All handlers run on the io_context thread.
    //   MessageHandler: every text frame from the current peer.
    //   DisconnectHandler: exactly once per session that leaves the current slot (close, error, liveness
    //                      timeout, supersession, Stop).
    //   ListeningHandler: each time an acceptor starts listening.
    //   FatalErrorHandler: the allocator gave up (bind sweeps exhausted or invalid host).
    //==========================================================================================================
    void SetMessageHandler(MessageHandler handler);
    void SetDisconnectHandler(DisconnectHandler handler);
    void SetListeningHandler(ListeningHandler handler);
    void SetFatalErrorHandler(FatalErrorHandler handler);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace devbridge
