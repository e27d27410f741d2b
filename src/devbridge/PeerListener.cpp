//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/devbridge/PeerListener.cpp
// Purpose: WebSocket acceptor, single-peer session management and ping/pong liveness (Boost.Beast)
//==========================================================================================================

#include <deque>
#include <set>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "devbridge/PeerListener.hpp"
#include "logging/Logger.h"

namespace devbridge {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

//==========================================================================================================
// PeerSession
// Purpose: One upgraded WebSocket connection. Outbound frames (text, ping, close) share a queue so that
//          at most one write operation is in flight on the stream.
//==========================================================================================================
struct PeerSession {
    struct Outbound {
        enum class Kind { Text, Ping, Close };
        Kind kind;
        std::string payload;
    };

    explicit PeerSession(tcp::socket socket, uint64_t serial)
        : ws(std::move(socket)), serial(serial) {}

    websocket::stream<beast::tcp_stream> ws;
    uint64_t serial;
    bool alive{true};
    bool closing{false};
    bool writing{false};
    std::deque<Outbound> queue;
    std::chrono::steady_clock::time_point connectedAt{};
    std::chrono::steady_clock::time_point lastPong{};

    void closeSocket() {
        beast::error_code ec;
        beast::get_lowest_layer(ws).socket().shutdown(tcp::socket::shutdown_both, ec);
        beast::get_lowest_layer(ws).socket().close(ec);
    }
};

} // namespace

class PeerListener::Impl : public std::enable_shared_from_this<PeerListener::Impl> {
public:
    net::io_context& ioc;
    PeerListener::Options opts;
    PortAllocator allocator;
    bool running{false};

    std::unique_ptr<tcp::acceptor> acceptor;
    net::steady_timer livenessTimer;
    net::steady_timer recreateTimer;

    std::shared_ptr<PeerSession> current;
    std::set<std::shared_ptr<PeerSession>> sessions;
    uint64_t sessionCounter{0};

    PeerListener::MessageHandler messageHandler;
    PeerListener::DisconnectHandler disconnectHandler;
    PeerListener::ListeningHandler listeningHandler;
    PeerListener::FatalErrorHandler fatalErrorHandler;

    Impl(net::io_context& ioc, PeerListener::Options o, std::shared_ptr<IPortStore> store)
        : ioc(ioc), opts(std::move(o)), allocator(opts.allocator, std::move(store)),
          livenessTimer(ioc), recreateTimer(ioc) {}

    bool isListening() const {
        return acceptor && acceptor->is_open();
    }

    //======================================================================================================
    // Write queue
    //======================================================================================================
    void enqueue(const std::shared_ptr<PeerSession>& s, PeerSession::Outbound item) {
        s->queue.push_back(std::move(item));
        if (!s->writing) {
            s->writing = true;
            net::co_spawn(ioc, writeLoop(shared_from_this(), s), net::detached);
        }
    }

    static net::awaitable<void> writeLoop(std::shared_ptr<Impl> self, std::shared_ptr<PeerSession> s) {
        while (!s->queue.empty()) {
            PeerSession::Outbound item = std::move(s->queue.front());
            s->queue.pop_front();
            beast::error_code ec;
            switch (item.kind) {
                case PeerSession::Outbound::Kind::Text:
                    s->ws.text(true);
                    co_await s->ws.async_write(net::buffer(item.payload), net::redirect_error(net::use_awaitable, ec));
                    break;
                case PeerSession::Outbound::Kind::Ping:
                    co_await s->ws.async_ping(websocket::ping_data{}, net::redirect_error(net::use_awaitable, ec));
                    break;
                case PeerSession::Outbound::Kind::Close:
                    co_await s->ws.async_close(websocket::close_code::normal, net::redirect_error(net::use_awaitable, ec));
                    s->closeSocket();
                    break;
            }
            if (ec) {
                if (ec != net::error::operation_aborted && ec != websocket::error::closed) {
                    LOG_WARN("Peer session #{} write failed: {}", s->serial, ec.message());
                }
                s->queue.clear();
                self->terminate(s, "write failed: " + ec.message());
                break;
            }
        }
        s->writing = false;
        co_return;
    }

    //======================================================================================================
    // Session lifecycle
    //======================================================================================================

    // Removes the session from the current slot and fires the disconnect handler. No-op for a
    // session that is not current, so each session is reported at most once.
    void detach(const std::shared_ptr<PeerSession>& s, const std::string& reason) {
        if (!s || current != s) {
            return;
        }
        current.reset();
        LOG_INFO("Peer #{} disconnected: {}", s->serial, reason);
        if (disconnectHandler) {
            try {
                disconnectHandler(reason);
            } catch (const std::exception& e) {
                LOG_ERROR("Disconnect handler threw: {}", e.what());
            }
        }
    }

    void terminate(const std::shared_ptr<PeerSession>& s, const std::string& reason) {
        detach(s, reason);
        s->closing = true;
        s->closeSocket();
    }

    void install(const std::shared_ptr<PeerSession>& s) {
        if (current) {
            auto previous = current;
            LOG_INFO("Peer #{} superseded by new connection #{}", previous->serial, s->serial);
            detach(previous, "superseded by a new connection");
            previous->closing = true;
            enqueue(previous, PeerSession::Outbound{PeerSession::Outbound::Kind::Close, {}});
        }
        s->connectedAt = std::chrono::steady_clock::now();
        s->lastPong = s->connectedAt;
        s->alive = true;
        current = s;
        beast::error_code ec;
        auto remote = beast::get_lowest_layer(s->ws).socket().remote_endpoint(ec);
        LOG_INFO("Peer #{} connected from {}", s->serial, ec ? std::string("unknown") : remote.address().to_string());
    }

    static net::awaitable<void> sessionLoop(std::shared_ptr<Impl> self, tcp::socket socket) {
        auto s = std::make_shared<PeerSession>(std::move(socket), ++self->sessionCounter);
        self->sessions.insert(s);
        try {
            s->ws.set_option(websocket::stream_base::timeout{
                std::chrono::seconds(30), websocket::stream_base::none(), false});
            std::weak_ptr<PeerSession> weak = s;
            s->ws.control_callback([weak](websocket::frame_type kind, beast::string_view) {
                if (kind != websocket::frame_type::pong) return;
                if (auto locked = weak.lock()) {
                    locked->alive = true;
                    locked->lastPong = std::chrono::steady_clock::now();
                }
            });

            beast::error_code ec;
            co_await s->ws.async_accept(net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                LOG_WARN("WebSocket handshake failed: {}", ec.message());
                s->closeSocket();
                self->sessions.erase(s);
                co_return;
            }
            if (!self->running) {
                s->closeSocket();
                self->sessions.erase(s);
                co_return;
            }
            self->install(s);

            beast::flat_buffer buffer;
            std::string reason;
            for (;;) {
                co_await s->ws.async_read(buffer, net::redirect_error(net::use_awaitable, ec));
                if (ec) {
                    if (ec == websocket::error::closed) {
                        reason = "closed by peer";
                    } else if (ec == net::error::operation_aborted && s->closing) {
                        reason = "connection terminated";
                    } else {
                        reason = ec.message();
                    }
                    break;
                }
                std::string frame = beast::buffers_to_string(buffer.data());
                buffer.consume(buffer.size());
                if (self->current != s) {
                    LOG_DEBUG("Dropping frame from detached peer #{}", s->serial);
                    continue;
                }
                if (self->messageHandler) {
                    try {
                        self->messageHandler(frame);
                    } catch (const std::exception& e) {
                        LOG_ERROR("Peer message handler threw: {}", e.what());
                    }
                }
            }
            self->detach(s, reason);
            s->closeSocket();
        } catch (const std::exception& e) {
            LOG_ERROR("Peer session #{} error: {}", s->serial, e.what());
            self->detach(s, e.what());
            s->closeSocket();
        }
        self->sessions.erase(s);
        co_return;
    }

    //======================================================================================================
    // Accept loop
    //======================================================================================================
    static net::awaitable<void> acceptLoop(std::shared_ptr<Impl> self) {
        std::string fatal;
        while (self->running) {
            if (!self->isListening()) {
                try {
                    self->acceptor = co_await self->allocator.Acquire();
                } catch (const std::exception& e) {
                    fatal = e.what();
                }
                if (!fatal.empty()) {
                    break;
                }
                if (!self->running) {
                    beast::error_code closeEc;
                    self->acceptor->close(closeEc);
                    break;
                }
                if (self->listeningHandler) {
                    self->listeningHandler(self->allocator.CurrentPort().value_or(0));
                }
            }

            beast::error_code ec;
            tcp::socket socket = co_await self->acceptor->async_accept(net::redirect_error(net::use_awaitable, ec));
            if (!self->running) {
                break;
            }
            if (ec) {
                LOG_WARN("Accept failed: {}; recreating listener in {} ms", ec.message(),
                         self->opts.recreateDelay.count());
                beast::error_code closeEc;
                self->acceptor->close(closeEc);
                self->acceptor.reset();
                self->recreateTimer.expires_after(self->opts.recreateDelay);
                co_await self->recreateTimer.async_wait(net::redirect_error(net::use_awaitable, ec));
                continue;
            }
            net::co_spawn(self->ioc, sessionLoop(self, std::move(socket)), net::detached);
        }
        if (!fatal.empty()) {
            LOG_ERROR("Listener cannot bind: {}", fatal);
            if (self->fatalErrorHandler) {
                self->fatalErrorHandler(fatal);
            }
        }
        co_return;
    }

    //======================================================================================================
    // Liveness sweep
    //======================================================================================================
    static net::awaitable<void> livenessLoop(std::shared_ptr<Impl> self) {
        while (self->running) {
            beast::error_code ec;
            self->livenessTimer.expires_after(self->opts.pingInterval);
            co_await self->livenessTimer.async_wait(net::redirect_error(net::use_awaitable, ec));
            if (!self->running) {
                break;
            }
            auto s = self->current;
            if (!s) {
                continue;
            }
            if (!s->alive) {
                LOG_WARN("Peer #{} missed pong; terminating", s->serial);
                self->terminate(s, "liveness timeout");
                continue;
            }
            s->alive = false;
            self->enqueue(s, PeerSession::Outbound{PeerSession::Outbound::Kind::Ping, {}});
        }
        co_return;
    }

    void start() {
        if (running) {
            return;
        }
        running = true;
        net::co_spawn(ioc, acceptLoop(shared_from_this()), net::detached);
        net::co_spawn(ioc, livenessLoop(shared_from_this()), net::detached);
    }

    void stop() {
        if (!running) {
            return;
        }
        running = false;
        livenessTimer.cancel();
        recreateTimer.cancel();
        if (acceptor) {
            beast::error_code ec;
            acceptor->close(ec);
        }
        if (current) {
            auto s = current;
            terminate(s, "listener stopped");
        }
        for (const auto& s : sessions) {
            s->closing = true;
            s->closeSocket();
        }
    }
};

PeerListener::PeerListener(net::io_context& ioc, Options opts, std::shared_ptr<IPortStore> store)
    : pImpl(std::make_shared<Impl>(ioc, std::move(opts), std::move(store))) {}

PeerListener::~PeerListener() {
    pImpl->stop();
}

void PeerListener::Start() {
    pImpl->start();
}

void PeerListener::Stop() {
    pImpl->stop();
}

bool PeerListener::IsConnected() const {
    return pImpl->current != nullptr;
}

bool PeerListener::Send(const std::string& frame) {
    auto s = pImpl->current;
    if (!s || s->closing) {
        return false;
    }
    pImpl->enqueue(s, PeerSession::Outbound{PeerSession::Outbound::Kind::Text, frame});
    return true;
}

std::optional<uint16_t> PeerListener::BoundPort() const {
    if (!pImpl->isListening()) {
        return std::nullopt;
    }
    return pImpl->allocator.CurrentPort();
}

bool PeerListener::IsListening() const {
    return pImpl->isListening();
}

std::optional<std::chrono::steady_clock::time_point> PeerListener::PeerConnectedAt() const {
    if (!pImpl->current) {
        return std::nullopt;
    }
    return pImpl->current->connectedAt;
}

void PeerListener::SetMessageHandler(MessageHandler handler) {
    pImpl->messageHandler = std::move(handler);
}

void PeerListener::SetDisconnectHandler(DisconnectHandler handler) {
    pImpl->disconnectHandler = std::move(handler);
}

void PeerListener::SetListeningHandler(ListeningHandler handler) {
    pImpl->listeningHandler = std::move(handler);
}

void PeerListener::SetFatalErrorHandler(FatalErrorHandler handler) {
    pImpl->fatalErrorHandler = std::move(handler);
}

} // namespace devbridge
