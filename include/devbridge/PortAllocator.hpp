//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PortAllocator.hpp
// Purpose: Picks and binds a listening port from a bounded range, persisting the chosen value
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>

#include "devbridge/PortStore.hpp"

namespace devbridge {

class PortAllocator {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   host: Bind address (IPv4 or IPv6 literal).
    //   portMin/portMax: Inclusive candidate range.
    //   bindRetryDelay: Wait before retrying a candidate that failed for a reason other than "in use".
    //   sweepRetryDelay: Wait between full sweeps of an exhausted range.
    //   maxSweeps: Number of sweeps before giving up (0 = unlimited).
    //==========================================================================================================
    struct Options {
        std::string host{"127.0.0.1"};
        uint16_t portMin{27125};
        uint16_t portMax{27135};
        std::chrono::milliseconds bindRetryDelay{2000};
        std::chrono::milliseconds sweepRetryDelay{5000};
        unsigned int maxSweeps{0};
    };

    PortAllocator(Options opts, std::shared_ptr<IPortStore> store);

    //==========================================================================================================
    // CandidateOrder
    // Purpose: The hint first when it lies within [min,max], then the remaining range ascending.
    //==========================================================================================================
    static std::vector<uint16_t> CandidateOrder(uint16_t portMin, uint16_t portMax, std::optional<uint16_t> hint);

    //==========================================================================================================
    // Acquire
    // Purpose: Binds and listens on the first available candidate, sweeping the range until success.
    // Returns:
    //   An open, listening acceptor. The chosen port is persisted only after listen succeeded.
    //   Throws errors::BindExhaustedError when maxSweeps is reached, errors::ConfigError on a bad host.
    //==========================================================================================================
    boost::asio::awaitable<std::unique_ptr<boost::asio::ip::tcp::acceptor>> Acquire();

    // Port bound by the most recent successful Acquire.
    std::optional<uint16_t> CurrentPort() const { return currentPort; }

    // Ports attempted during the most recent Acquire, in order (retries appear twice).
    const std::vector<uint16_t>& Attempts() const { return attempts; }

private:
    Options opts;
    std::shared_ptr<IPortStore> store;
    std::optional<uint16_t> currentPort;
    std::vector<uint16_t> attempts;
};

} // namespace devbridge
