//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_port_allocator.cpp
// Purpose: Tests for candidate ordering and bind sweeps
//==========================================================================================================

#include <gtest/gtest.h>

#include <exception>
#include <memory>
#include <optional>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>

#include "devbridge/PortAllocator.hpp"
#include "devbridge/errors/Errors.h"

using namespace devbridge;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

class MemoryPortStore : public IPortStore {
public:
    std::optional<uint16_t> Load() override { ++loads; return stored; }
    bool Save(uint16_t port) override { stored = port; ++saves; return true; }

    std::optional<uint16_t> stored;
    int loads{0};
    int saves{0};
};

// Lets the kernel pick a free loopback port and returns it after closing the socket.
uint16_t freeLoopbackPort() {
    net::io_context ioc;
    tcp::acceptor probe(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    return probe.local_endpoint().port();
}

bool portIsFree(uint16_t port) {
    net::io_context ioc;
    tcp::acceptor probe(ioc);
    boost::system::error_code ec;
    probe.open(tcp::v4(), ec);
    probe.bind(tcp::endpoint(net::ip::make_address("127.0.0.1"), port), ec);
    return !ec;
}

struct AcquireOutcome {
    std::unique_ptr<tcp::acceptor> acceptor;
    std::exception_ptr error;
};

AcquireOutcome runAcquire(net::io_context& ioc, PortAllocator& allocator) {
    AcquireOutcome outcome;
    net::co_spawn(ioc, allocator.Acquire(),
                  [&outcome](std::exception_ptr ep, std::unique_ptr<tcp::acceptor> acceptor) {
                      outcome.error = ep;
                      outcome.acceptor = std::move(acceptor);
                  });
    ioc.run_for(std::chrono::seconds(10));
    return outcome;
}

PortAllocator::Options fastOptions(uint16_t portMin, uint16_t portMax) {
    PortAllocator::Options opts;
    opts.host = "127.0.0.1";
    opts.portMin = portMin;
    opts.portMax = portMax;
    opts.bindRetryDelay = std::chrono::milliseconds(10);
    opts.sweepRetryDelay = std::chrono::milliseconds(10);
    return opts;
}

} // namespace

TEST(PortAllocatorOrder, HintFirstThenAscending) {
    auto order = PortAllocator::CandidateOrder(100, 103, 102);
    std::vector<uint16_t> expected{102, 100, 101, 103};
    EXPECT_EQ(order, expected);
}

TEST(PortAllocatorOrder, OutOfRangeHintIsIgnored) {
    auto order = PortAllocator::CandidateOrder(100, 102, 99);
    std::vector<uint16_t> expected{100, 101, 102};
    EXPECT_EQ(order, expected);
    EXPECT_EQ(PortAllocator::CandidateOrder(100, 102, std::nullopt), expected);
}

TEST(PortAllocatorOrder, InvertedRangeIsEmpty) {
    EXPECT_TRUE(PortAllocator::CandidateOrder(200, 100, std::nullopt).empty());
}

TEST(PortAllocatorOrder, FullRangeEndsAtMaxPort) {
    auto order = PortAllocator::CandidateOrder(65534, 65535, std::nullopt);
    std::vector<uint16_t> expected{65534, 65535};
    EXPECT_EQ(order, expected);
}

TEST(PortAllocatorAcquire, BindsHintAndPersistsIt) {
    const uint16_t port = freeLoopbackPort();
    auto store = std::make_shared<MemoryPortStore>();
    store->stored = port;

    net::io_context ioc;
    PortAllocator allocator(fastOptions(port, port), store);
    auto outcome = runAcquire(ioc, allocator);

    ASSERT_FALSE(outcome.error);
    ASSERT_TRUE(outcome.acceptor);
    EXPECT_EQ(outcome.acceptor->local_endpoint().port(), port);
    EXPECT_EQ(allocator.CurrentPort(), std::optional<uint16_t>(port));
    EXPECT_EQ(store->saves, 1);
    EXPECT_EQ(store->stored, std::optional<uint16_t>(port));
}

TEST(PortAllocatorAcquire, SkipsBusyPort) {
    net::io_context ioc;
    tcp::acceptor busy(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    const uint16_t busyPort = busy.local_endpoint().port();
    if (busyPort == 65535 || !portIsFree(static_cast<uint16_t>(busyPort + 1))) {
        GTEST_SKIP() << "Neighbouring port unavailable";
    }
    const uint16_t next = static_cast<uint16_t>(busyPort + 1);

    auto store = std::make_shared<MemoryPortStore>();
    store->stored = busyPort;
    PortAllocator allocator(fastOptions(busyPort, next), store);
    auto outcome = runAcquire(ioc, allocator);

    ASSERT_FALSE(outcome.error);
    ASSERT_TRUE(outcome.acceptor);
    EXPECT_EQ(outcome.acceptor->local_endpoint().port(), next);
    EXPECT_EQ(store->stored, std::optional<uint16_t>(next));
    ASSERT_GE(allocator.Attempts().size(), 2u);
    EXPECT_EQ(allocator.Attempts().front(), busyPort);
}

TEST(PortAllocatorAcquire, GivesUpAfterMaxSweeps) {
    net::io_context ioc;
    tcp::acceptor busy(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    const uint16_t busyPort = busy.local_endpoint().port();

    auto store = std::make_shared<MemoryPortStore>();
    auto opts = fastOptions(busyPort, busyPort);
    opts.maxSweeps = 2;
    PortAllocator allocator(opts, store);
    auto outcome = runAcquire(ioc, allocator);

    ASSERT_TRUE(outcome.error);
    EXPECT_THROW(std::rethrow_exception(outcome.error), errors::BindExhaustedError);
    EXPECT_EQ(store->saves, 0);
    EXPECT_EQ(store->loads, 2);
}

TEST(PortAllocatorAcquire, InvalidHostIsConfigError) {
    net::io_context ioc;
    auto opts = fastOptions(27125, 27125);
    opts.host = "not-an-address";
    PortAllocator allocator(opts, std::make_shared<MemoryPortStore>());
    auto outcome = runAcquire(ioc, allocator);
    ASSERT_TRUE(outcome.error);
    EXPECT_THROW(std::rethrow_exception(outcome.error), errors::ConfigError);
}

TEST(PortAllocatorAcquire, SecondAcquisitionTriesOnlyPersistedPort) {
    const uint16_t port = freeLoopbackPort();
    if (port == 65535) {
        GTEST_SKIP() << "Need a port with a neighbour";
    }
    auto store = std::make_shared<MemoryPortStore>();
    auto opts = fastOptions(port, static_cast<uint16_t>(port + 1));

    {
        net::io_context ioc;
        PortAllocator first(opts, store);
        auto outcome = runAcquire(ioc, first);
        ASSERT_TRUE(outcome.acceptor);
        ASSERT_TRUE(store->stored.has_value());
    }
    const uint16_t persisted = store->stored.value();

    net::io_context ioc;
    PortAllocator second(opts, store);
    auto outcome = runAcquire(ioc, second);
    ASSERT_TRUE(outcome.acceptor);
    EXPECT_EQ(outcome.acceptor->local_endpoint().port(), persisted);
    std::vector<uint16_t> expected{persisted};
    EXPECT_EQ(second.Attempts(), expected);
}
