//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_end_to_end.cpp
// Purpose: Runs the devbridge executable (bridge and supervisor roles) against a WebSocket test peer
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "devbridge/ChildProcess.hpp"
#include "devbridge/JSONRPCTypes.h"
#include "devbridge/LineFramer.h"
#include "devbridge/PidFile.hpp"
#include "devbridge/PortStore.hpp"
#include "devbridge/StdioChannel.hpp"

#ifndef DEVBRIDGE_BINARY
#error "DEVBRIDGE_BINARY must name the devbridge executable"
#endif

using namespace devbridge;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace fs = std::filesystem;
using tcp = net::ip::tcp;

namespace {

uint16_t freeLoopbackPort() {
    net::io_context ioc;
    tcp::acceptor probe(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    return probe.local_endpoint().port();
}

bool runUntil(net::io_context& ioc, const std::function<bool()>& done,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done() && std::chrono::steady_clock::now() < deadline) {
        if (ioc.stopped()) {
            ioc.restart();
        }
        ioc.run_one_for(std::chrono::milliseconds(10));
    }
    return done();
}

// Echo peer: answers every request with {"id": <id>, "result": {"echo": <name>}}.
net::awaitable<void> echoPeer(std::shared_ptr<websocket::stream<beast::tcp_stream>> ws, uint16_t port,
                              std::shared_ptr<bool> connected) {
    beast::error_code ec;
    tcp::endpoint ep(net::ip::make_address("127.0.0.1"), port);
    co_await beast::get_lowest_layer(*ws).async_connect(ep, net::redirect_error(net::use_awaitable, ec));
    if (!ec) {
        co_await ws->async_handshake("127.0.0.1", "/", net::redirect_error(net::use_awaitable, ec));
    }
    if (ec) {
        co_return;
    }
    *connected = true;
    for (;;) {
        beast::flat_buffer buffer;
        co_await ws->async_read(buffer, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            break;
        }
        JSONValue request = ParseJSON(beast::buffers_to_string(buffer.data()));
        JSONValue::Object result;
        result["echo"] = std::make_shared<JSONValue>(*FindMember(request, "name"));
        JSONValue::Object reply;
        reply["id"] = std::make_shared<JSONValue>(*FindMember(request, "id"));
        reply["result"] = std::make_shared<JSONValue>(std::move(result));
        std::string text = SerializeJSON(JSONValue(std::move(reply)));
        ws->text(true);
        co_await ws->async_write(net::buffer(text), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            break;
        }
    }
    co_return;
}

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::signal(SIGPIPE, SIG_IGN);
        stateDir = fs::temp_directory_path() / ("devbridge_e2e_" + std::to_string(::getpid()) + "_" +
                                                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(stateDir);
        port = freeLoopbackPort();
    }

    void TearDown() override {
        io.reset();
        if (child && child->Running()) {
            child->Signal(SIGKILL);
            waitForExit(std::chrono::seconds(5));
        }
        child.reset();
        std::error_code ec;
        fs::remove_all(stateDir, ec);
    }

    void launch(bool supervised, const std::vector<std::string>& extra = {}) {
        std::vector<std::string> args{"devbridge"};
        if (!supervised) {
            args.emplace_back("--no-supervisor");
        }
        args.push_back("--state-dir=" + stateDir.string());
        args.push_back("--port-min=" + std::to_string(port));
        args.push_back("--port-max=" + std::to_string(port));
        args.emplace_back("--request-timeout-ms=3000");
        args.emplace_back("--restart-delay-ms=100");
        args.emplace_back("--bind-retry-delay-ms=100");
        args.emplace_back("--sweep-retry-delay-ms=200");
        args.insert(args.end(), extra.begin(), extra.end());
        child = ChildProcess::Spawn(DEVBRIDGE_BINARY, args);
        io = std::make_unique<StdioChannel>(ioc, child->StdoutFd(), child->StdinFd());
        io->Start([this](std::string_view chunk) {
            for (auto& line : framer.Feed(chunk)) {
                responses.push_back(ParseJSON(line));
            }
        }, [this] { outputClosed = true; });
    }

    void send(const std::string& line) {
        ASSERT_TRUE(io->WriteLine(line));
    }

    // Waits for the response carrying the given numeric or string id.
    std::optional<JSONValue> responseFor(const JSONRPCId& id, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        std::optional<JSONValue> found;
        runUntil(ioc, [&] {
            for (const auto& r : responses) {
                const JSONValue* rid = FindMember(r, "id");
                if (rid != nullptr && IdFromValue(*rid) == std::optional<JSONRPCId>(id)) {
                    found = r;
                    return true;
                }
            }
            return false;
        }, timeout);
        return found;
    }

    std::optional<int> waitForExit(std::chrono::seconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (auto status = child->TryReap(); status.has_value()) {
                return status;
            }
            if (ioc.stopped()) {
                ioc.restart();
            }
            ioc.run_for(std::chrono::milliseconds(10));
        }
        return std::nullopt;
    }

    std::shared_ptr<bool> connectPeer() {
        auto connected = std::make_shared<bool>(false);
        auto ws = std::make_shared<websocket::stream<beast::tcp_stream>>(ioc);
        net::co_spawn(ioc, echoPeer(ws, port, connected), net::detached);
        return connected;
    }

    static std::string errorMessage(const JSONValue& response) {
        const JSONValue* err = FindMember(response, "error");
        if (err == nullptr) {
            return std::string();
        }
        return std::get<std::string>(FindMember(*err, "message")->value);
    }

    net::io_context ioc;
    fs::path stateDir;
    uint16_t port{0};
    std::unique_ptr<ChildProcess> child;
    std::unique_ptr<StdioChannel> io;
    LineFramer framer;
    std::vector<JSONValue> responses;
    bool outputClosed{false};
};

} // namespace

TEST_F(EndToEndTest, BridgeForwardsToolCallsToPeer) {
    launch(false);
    send(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    auto init = responseFor(JSONRPCId{int64_t{1}});
    ASSERT_TRUE(init.has_value());
    const JSONValue* serverInfo = FindMember(*FindMember(init.value(), "result"), "serverInfo");
    ASSERT_NE(serverInfo, nullptr);
    EXPECT_EQ(std::get<std::string>(FindMember(*serverInfo, "name")->value), "devbridge");

    send(R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"query_elements","arguments":{"selector":"a"}}})");
    auto early = responseFor(JSONRPCId{int64_t{2}});
    ASSERT_TRUE(early.has_value());
    EXPECT_EQ(errorMessage(early.value()), "Not connected to plugin");

    FilePortStore store((stateDir / "active_port.txt").string());
    ASSERT_TRUE(runUntil(ioc, [&] { return store.Load() == std::optional<uint16_t>(port); }));

    auto connected = connectPeer();
    ASSERT_TRUE(runUntil(ioc, [&] { return *connected; }));

    // The listener registers the peer just after the handshake completes
    std::optional<JSONValue> reply;
    for (int attempt = 0; attempt < 20; ++attempt) {
        const std::string id = "call-" + std::to_string(attempt);
        send(R"({"jsonrpc":"2.0","id":")" + id +
             R"(","method":"tools/call","params":{"name":"get_console_logs","arguments":{"limit":5}}})");
        reply = responseFor(JSONRPCId{id});
        ASSERT_TRUE(reply.has_value());
        if (errorMessage(reply.value()) != "Not connected to plugin") {
            break;
        }
        runUntil(ioc, [] { return false; }, std::chrono::milliseconds(50));
    }
    ASSERT_TRUE(reply.has_value());
    const JSONValue* result = FindMember(reply.value(), "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(std::get<std::string>(FindMember(*result, "echo")->value), "get_console_logs");

    io->Stop();
    child->CloseStdin();
    auto status = waitForExit(std::chrono::seconds(10));
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(ChildProcess::DescribeStatus(status.value()), "exited with code 0");
}

TEST_F(EndToEndTest, SupervisorRestartsKilledBridge) {
    launch(true);
    send(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    ASSERT_TRUE(responseFor(JSONRPCId{int64_t{1}}).has_value());

    const std::string bridgePidPath = (stateDir / "bridge.pid").string();
    const std::string supervisorPidPath = (stateDir / "supervisor.pid").string();
    ASSERT_TRUE(runUntil(ioc, [&] { return PidFile::Read(bridgePidPath).has_value(); }));
    EXPECT_EQ(PidFile::Read(supervisorPidPath), std::optional<pid_t>(child->Pid()));
    const pid_t firstBridge = PidFile::Read(bridgePidPath).value();
    ASSERT_EQ(::kill(firstBridge, SIGKILL), 0);

    ASSERT_TRUE(runUntil(ioc, [&] {
        auto current = PidFile::Read(bridgePidPath);
        return current.has_value() && current.value() != firstBridge;
    }));

    send(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    auto listed = responseFor(JSONRPCId{int64_t{2}});
    ASSERT_TRUE(listed.has_value());
    EXPECT_NE(FindMember(listed.value(), "result"), nullptr);

    child->Signal(SIGTERM);
    auto status = waitForExit(std::chrono::seconds(10));
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(ChildProcess::DescribeStatus(status.value()), "exited with code 0");
    EXPECT_FALSE(fs::exists(supervisorPidPath));
    EXPECT_FALSE(fs::exists(bridgePidPath));
}

TEST_F(EndToEndTest, ShutdownDuringCooldownStartsNoFurtherBridge) {
    launch(true, {"--restart-ceiling=1", "--restart-cooldown-ms=60000"});
    send(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    ASSERT_TRUE(responseFor(JSONRPCId{int64_t{1}}).has_value());

    const std::string bridgePidPath = (stateDir / "bridge.pid").string();
    const std::string supervisorPidPath = (stateDir / "supervisor.pid").string();
    ASSERT_TRUE(runUntil(ioc, [&] { return PidFile::Read(bridgePidPath).has_value(); }));
    const pid_t firstBridge = PidFile::Read(bridgePidPath).value();
    ASSERT_EQ(::kill(firstBridge, SIGKILL), 0);

    // First crash is within budget and restarts after the short delay
    ASSERT_TRUE(runUntil(ioc, [&] {
        auto current = PidFile::Read(bridgePidPath);
        return current.has_value() && current.value() != firstBridge;
    }));
    const pid_t secondBridge = PidFile::Read(bridgePidPath).value();
    ASSERT_EQ(::kill(secondBridge, SIGKILL), 0);

    // Second crash exhausts the budget; the restart waits for the cooldown
    ASSERT_TRUE(runUntil(ioc, [&] { return !fs::exists(bridgePidPath); }));
    runUntil(ioc, [] { return false; }, std::chrono::milliseconds(1000));
    EXPECT_FALSE(fs::exists(bridgePidPath));

    child->Signal(SIGTERM);
    auto status = waitForExit(std::chrono::seconds(10));
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(ChildProcess::DescribeStatus(status.value()), "exited with code 0");
    EXPECT_FALSE(fs::exists(bridgePidPath));
    EXPECT_FALSE(fs::exists(supervisorPidPath));
}
