//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Bridge.cpp
// Purpose: Bridge composition, signal handling and periodic health reporting
//==========================================================================================================

#include "devbridge/Bridge.hpp"
#include "devbridge/PeerListener.hpp"
#include "devbridge/PortStore.hpp"
#include "devbridge/ProtocolTranslator.hpp"
#include "devbridge/RequestCorrelator.hpp"
#include "devbridge/StdioChannel.hpp"
#include "logging/Logger.h"

#include <csignal>
#include <unistd.h>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace devbridge {
namespace net = boost::asio;

namespace {

PeerListener::Options listenerOptions(const BridgeConfig& config) {
    PeerListener::Options opts;
    opts.allocator.host = config.bindHost;
    opts.allocator.portMin = config.portMin;
    opts.allocator.portMax = config.portMax;
    opts.allocator.bindRetryDelay = config.bindRetryDelay;
    opts.allocator.sweepRetryDelay = config.sweepRetryDelay;
    opts.allocator.maxSweeps = config.maxBindSweeps;
    opts.pingInterval = config.pingInterval;
    opts.recreateDelay = config.listenerRecreateDelay;
    return opts;
}

} // namespace

class Bridge::Impl {
public:
    BridgeConfig config;
    net::io_context ioc;
    StdioChannel stdio;
    PeerListener listener;
    std::shared_ptr<RequestCorrelator> correlator;
    ProtocolTranslator translator;
    net::signal_set signals;
    net::steady_timer healthTimer;
    bool stopping{false};
    int exitCode{0};

    explicit Impl(const BridgeConfig& cfg)
        : config(cfg),
          stdio(ioc, STDIN_FILENO, STDOUT_FILENO),
          listener(ioc, listenerOptions(cfg), std::make_shared<FilePortStore>(cfg.PortFilePath())),
          correlator(std::make_shared<RequestCorrelator>(ioc, listener, cfg.requestTimeout)),
          translator(*correlator,
                     [this](const std::string& frame) {
                         if (!stdio.WriteLine(frame)) {
                             LOG_ERROR("Failed to write response to stdout");
                         }
                     },
                     ProtocolTranslator::Options{cfg.maxLineBytes, 4096}),
          signals(ioc, SIGINT, SIGTERM, SIGHUP),
          healthTimer(ioc) {}

    void shutdown(const std::string& reason) {
        if (stopping) {
            return;
        }
        stopping = true;
        LOG_INFO("Bridge stopping: {}", reason);
        correlator->RejectAll("bridge shutting down");
        listener.Stop();
        stdio.Stop();
        boost::system::error_code ec;
        signals.cancel(ec);
        healthTimer.cancel();
        ioc.stop();
    }

    void logHealth() {
        auto port = listener.BoundPort();
        LOG_INFO("Health: peer={} pending={} port={} listening={}",
                 listener.IsConnected() ? "connected" : "none",
                 correlator->PendingCount(),
                 port.has_value() ? std::to_string(port.value()) : std::string("-"),
                 listener.IsListening() ? "yes" : "no");
        auto stale = correlator->StaleRequests(config.staleRequestAge);
        if (!stale.empty()) {
            auto oldest = correlator->OldestPendingAge();
            LOG_WARN("{} request(s) pending longer than {} ms (oldest {} ms)", stale.size(),
                     config.staleRequestAge.count(), oldest.has_value() ? oldest->count() : 0);
        }
    }

    static net::awaitable<void> healthLoop(Impl* self) {
        while (!self->stopping) {
            boost::system::error_code ec;
            self->healthTimer.expires_after(self->config.healthInterval);
            co_await self->healthTimer.async_wait(net::redirect_error(net::use_awaitable, ec));
            if (ec || self->stopping) {
                break;
            }
            self->logHealth();
        }
        co_return;
    }

    int run() {
        listener.SetMessageHandler([this](const std::string& frame) {
            correlator->OnPeerMessage(frame);
        });
        listener.SetDisconnectHandler([this](const std::string& reason) {
            correlator->RejectAll(reason);
        });
        listener.SetListeningHandler([this](uint16_t port) {
            LOG_INFO("Waiting for plugin on ws://{}:{}", config.bindHost, port);
        });
        listener.SetFatalErrorHandler([this](const std::string& error) {
            exitCode = 1;
            shutdown("listener failed: " + error);
        });

        signals.async_wait([this](const boost::system::error_code& ec, int signo) {
            if (ec) {
                return;
            }
            shutdown(std::string("received signal ") + std::to_string(signo));
        });

        stdio.Start(
            [this](std::string_view chunk) { translator.OnInput(chunk); },
            [this]() { shutdown("stdin closed"); });

        listener.Start();
        net::co_spawn(ioc, healthLoop(this), net::detached);

        LOG_INFO("Bridge started (pid {}, ports {}-{})", ::getpid(), config.portMin, config.portMax);
        ioc.run();
        LOG_INFO("Bridge stopped with exit code {}", exitCode);
        return exitCode;
    }
};

Bridge::Bridge(const BridgeConfig& config) : pImpl(std::make_unique<Impl>(config)) {}

Bridge::~Bridge() = default;

int Bridge::Run() {
    return pImpl->run();
}

} // namespace devbridge
