//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Minimal websocket peer for manual testing: connects to the bridge and echoes tool calls back
//==========================================================================================================

#include "devbridge/Config.h"
#include "devbridge/JSONRPCTypes.h"
#include "devbridge/PortStore.hpp"
#include "logging/Logger.h"
#include "env/EnvVars.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

using namespace devbridge;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

//==========================================================================================================
// Builds the echo reply for one peer request: {"id": <id>, "result": {"tool": name, "arguments": args}}.
// Requests carrying "fail": true in their arguments are answered with an error instead.
//==========================================================================================================
static std::optional<std::string> buildReply(const std::string& frame) {
    JSONValue request;
    try {
        request = ParseJSON(frame);
    } catch (const JSONParseError& e) {
        LOG_WARN("Ignoring malformed frame: {}", e.what());
        return std::nullopt;
    }
    const JSONValue* id = FindMember(request, "id");
    const JSONValue* name = FindMember(request, "name");
    if (id == nullptr || name == nullptr) {
        LOG_WARN("Ignoring frame without id or name");
        return std::nullopt;
    }
    const JSONValue* args = FindMember(request, "arguments");

    JSONValue::Object reply;
    reply["id"] = std::make_shared<JSONValue>(*id);
    const JSONValue* fail = args != nullptr ? FindMember(*args, "fail") : nullptr;
    if (fail != nullptr && std::holds_alternative<bool>(fail->value) && std::get<bool>(fail->value)) {
        JSONValue::Object error;
        error["message"] = std::make_shared<JSONValue>(std::string("echo peer asked to fail"));
        reply["error"] = std::make_shared<JSONValue>(std::move(error));
    } else {
        JSONValue::Object result;
        result["tool"] = std::make_shared<JSONValue>(*name);
        result["arguments"] = std::make_shared<JSONValue>(args != nullptr ? *args : JSONValue(JSONValue::Object{}));
        reply["result"] = std::make_shared<JSONValue>(std::move(result));
    }
    return SerializeJSON(JSONValue(std::move(reply)));
}

static net::awaitable<void> runPeer(std::string host, uint16_t port) {
    auto executor = co_await net::this_coro::executor;
    tcp::resolver resolver(executor);
    websocket::stream<beast::tcp_stream> ws(executor);

    auto endpoints = co_await resolver.async_resolve(host, std::to_string(port), net::use_awaitable);
    beast::get_lowest_layer(ws).expires_after(std::chrono::seconds(10));
    co_await beast::get_lowest_layer(ws).async_connect(endpoints, net::use_awaitable);
    beast::get_lowest_layer(ws).expires_never();
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    co_await ws.async_handshake(host + ":" + std::to_string(port), "/", net::use_awaitable);
    LOG_INFO("Connected to bridge at {}:{}", host, port);

    for (;;) {
        beast::flat_buffer buffer;
        boost::system::error_code ec;
        co_await ws.async_read(buffer, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec == websocket::error::closed) {
                LOG_INFO("Bridge closed the connection");
            } else {
                LOG_WARN("Read failed: {}", ec.message());
            }
            break;
        }
        std::string frame = beast::buffers_to_string(buffer.data());
        LOG_DEBUG("<- {}", frame);
        if (auto reply = buildReply(frame); reply.has_value()) {
            LOG_DEBUG("-> {}", reply.value());
            ws.text(true);
            co_await ws.async_write(net::buffer(reply.value()), net::use_awaitable);
        }
    }
    co_return;
}

int main(int argc, char** argv) {
    Logger::setLogLevelFromString(GetEnvOrDefault("DEVBRIDGE_LOG_LEVEL", "INFO"));
    Logger::setProcessTag("[peer]");

    std::string host = GetArgValue(argc, argv, "--host").value_or("127.0.0.1");
    std::optional<uint16_t> port;
    if (auto p = GetArgValue(argc, argv, "--port"); p.has_value()) {
        try {
            int v = std::stoi(p.value());
            if (v > 0 && v <= 65535) {
                port = static_cast<uint16_t>(v);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Invalid --port '{}': {}", p.value(), e.what());
            return 1;
        }
    } else {
        std::string stateDir = GetArgValue(argc, argv, "--state-dir").value_or(
            GetEnvOrDefault("DEVBRIDGE_STATE_DIR", DefaultStateDir()));
        FilePortStore store(stateDir + "/active_port.txt");
        port = store.Load();
        if (port.has_value()) {
            LOG_INFO("Using port {} from {}", port.value(), store.Path());
        }
    }
    if (!port.has_value()) {
        LOG_ERROR("No port given and no active port recorded; pass --port=N");
        return 1;
    }

    net::io_context ioc;
    int exitCode = 0;
    net::co_spawn(ioc, runPeer(host, port.value()), [&exitCode](std::exception_ptr ep) {
        if (!ep) {
            return;
        }
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            LOG_ERROR("Peer failed: {}", e.what());
            exitCode = 1;
        }
    });
    ioc.run();
    return exitCode;
}
