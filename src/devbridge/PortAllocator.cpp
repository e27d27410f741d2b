//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PortAllocator.cpp
// Purpose: Coroutine-based bind/listen sweep over the configured port range
//==========================================================================================================

#include "devbridge/PortAllocator.hpp"
#include "devbridge/errors/Errors.h"
#include "logging/Logger.h"

#include <boost/asio/use_awaitable.hpp>

namespace devbridge {
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

std::unique_ptr<tcp::acceptor> tryBind(const net::any_io_executor& ex, const tcp::endpoint& ep,
                                       boost::system::error_code& ec) {
    auto acceptor = std::make_unique<tcp::acceptor>(ex);
    acceptor->open(ep.protocol(), ec);
    if (ec) return nullptr;
    acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
    if (ec) return nullptr;
    acceptor->bind(ep, ec);
    if (ec) return nullptr;
    acceptor->listen(net::socket_base::max_listen_connections, ec);
    if (ec) return nullptr;
    return acceptor;
}

} // namespace

PortAllocator::PortAllocator(Options opts, std::shared_ptr<IPortStore> store)
    : opts(std::move(opts)), store(std::move(store)) {}

std::vector<uint16_t> PortAllocator::CandidateOrder(uint16_t portMin, uint16_t portMax, std::optional<uint16_t> hint) {
    std::vector<uint16_t> order;
    if (portMin > portMax) {
        return order;
    }
    order.reserve(static_cast<std::size_t>(portMax - portMin) + 1);
    const bool hintInRange = hint.has_value() && hint.value() >= portMin && hint.value() <= portMax;
    if (hintInRange) {
        order.push_back(hint.value());
    }
    for (uint32_t p = portMin; p <= portMax; ++p) {
        if (hintInRange && p == hint.value()) continue;
        order.push_back(static_cast<uint16_t>(p));
    }
    return order;
}

net::awaitable<std::unique_ptr<tcp::acceptor>> PortAllocator::Acquire() {
    auto ex = co_await net::this_coro::executor;
    boost::system::error_code addrEc;
    auto address = net::ip::make_address(opts.host, addrEc);
    if (addrEc) {
        throw errors::ConfigError("Invalid bind host '" + opts.host + "': " + addrEc.message());
    }

    attempts.clear();
    unsigned int sweeps = 0;
    for (;;) {
        std::optional<uint16_t> hint;
        if (store) {
            hint = store->Load();
            if (hint.has_value() && (hint.value() < opts.portMin || hint.value() > opts.portMax)) {
                LOG_WARN("Persisted port {} outside range {}-{}; ignoring", hint.value(), opts.portMin, opts.portMax);
            }
        }

        for (uint16_t port : CandidateOrder(opts.portMin, opts.portMax, hint)) {
            for (int attempt = 0; attempt < 2; ++attempt) {
                attempts.push_back(port);
                boost::system::error_code ec;
                auto acceptor = tryBind(ex, tcp::endpoint(address, port), ec);
                if (!ec && acceptor) {
                    currentPort = port;
                    if (store && !store->Save(port)) {
                        LOG_WARN("Could not persist port {}; continuing", port);
                    }
                    LOG_INFO("Listening on {}:{}", opts.host, port);
                    co_return acceptor;
                }
                if (ec == net::error::address_in_use) {
                    LOG_DEBUG("Port {} in use, trying next", port);
                    break;
                }
                LOG_WARN("Bind to {}:{} failed: {}", opts.host, port, ec.message());
                if (attempt == 0) {
                    net::steady_timer delay(ex, opts.bindRetryDelay);
                    co_await delay.async_wait(net::use_awaitable);
                }
            }
        }

        ++sweeps;
        if (opts.maxSweeps != 0 && sweeps >= opts.maxSweeps) {
            throw errors::BindExhaustedError("No port available in range " + std::to_string(opts.portMin) + "-" +
                                             std::to_string(opts.portMax) + " after " + std::to_string(sweeps) +
                                             " sweep(s)");
        }
        LOG_WARN("All ports in range {}-{} unavailable; retrying in {} ms",
                 opts.portMin, opts.portMax, opts.sweepRetryDelay.count());
        net::steady_timer delay(ex, opts.sweepRetryDelay);
        co_await delay.async_wait(net::use_awaitable);
    }
}

} // namespace devbridge
