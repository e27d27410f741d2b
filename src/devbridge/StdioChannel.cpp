//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioChannel.cpp
// Purpose: posix::stream_descriptor based reader with a blocking-thread fallback, synchronous writer
//==========================================================================================================

#include "devbridge/StdioChannel.hpp"
#include "logging/Logger.h"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace devbridge {
namespace net = boost::asio;

namespace {
constexpr std::size_t ReadChunkSize = 64 * 1024;
}

class StdioChannel::Impl : public std::enable_shared_from_this<StdioChannel::Impl> {
public:
    net::io_context& ioc;
    int inputFd;
    int outputFd;
    net::posix::stream_descriptor input;
    std::thread readerThread;
    std::atomic<bool> stopped{false};
    bool eofReported{false};

    StdioChannel::InputHandler onInput;
    StdioChannel::EofHandler onEof;

    Impl(net::io_context& ioc, int inFd, int outFd)
        : ioc(ioc), inputFd(inFd), outputFd(outFd), input(ioc) {}

    ~Impl() {
        if (readerThread.joinable()) {
            readerThread.detach();
        }
    }

    void deliver(std::string_view chunk) {
        if (stopped.load() || !onInput) {
            return;
        }
        try {
            onInput(chunk);
        } catch (const std::exception& e) {
            LOG_ERROR("Input handler threw: {}", e.what());
        }
    }

    void reportEof() {
        if (stopped.load() || eofReported) {
            return;
        }
        eofReported = true;
        if (onEof) {
            onEof();
        }
    }

    static net::awaitable<void> readLoop(std::shared_ptr<Impl> self) {
        std::vector<char> buf(ReadChunkSize);
        for (;;) {
            boost::system::error_code ec;
            std::size_t n = co_await self->input.async_read_some(net::buffer(buf), net::redirect_error(net::use_awaitable, ec));
            if (n > 0) {
                self->deliver(std::string_view(buf.data(), n));
            }
            if (ec) {
                if (ec == net::error::eof) {
                    LOG_DEBUG("Input fd {} reached end of file", self->inputFd);
                } else if (ec != net::error::operation_aborted) {
                    LOG_WARN("Read from fd {} failed: {}", self->inputFd, ec.message());
                }
                break;
            }
        }
        self->reportEof();
        co_return;
    }

    // Blocking fallback for descriptors epoll refuses (regular files)
    void startReaderThread(int fd) {
        std::weak_ptr<Impl> weak = shared_from_this();
        readerThread = std::thread([weak, fd, &ioc = this->ioc]() {
            std::vector<char> buf(ReadChunkSize);
            for (;;) {
                ssize_t n = ::read(fd, buf.data(), buf.size());
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n <= 0) {
                    if (n < 0) {
                        LOG_WARN("Read from fd {} failed: {}", fd, std::strerror(errno));
                    }
                    break;
                }
                std::string chunk(buf.data(), static_cast<std::size_t>(n));
                net::post(ioc, [weak, chunk = std::move(chunk)]() {
                    if (auto self = weak.lock()) {
                        self->deliver(chunk);
                    }
                });
                if (auto self = weak.lock(); !self || self->stopped.load()) {
                    break;
                }
            }
            ::close(fd);
            net::post(ioc, [weak]() {
                if (auto self = weak.lock()) {
                    self->reportEof();
                }
            });
        });
    }

    void start() {
        int fd = ::fcntl(inputFd, F_DUPFD_CLOEXEC, 0);
        if (fd < 0) {
            LOG_ERROR("Cannot duplicate fd {}: {}", inputFd, std::strerror(errno));
            net::post(ioc, [self = shared_from_this()]() { self->reportEof(); });
            return;
        }
        boost::system::error_code ec;
        input.assign(fd, ec);
        if (ec) {
            LOG_DEBUG("fd {} not pollable ({}); using reader thread", inputFd, ec.message());
            startReaderThread(fd);
            return;
        }
        net::co_spawn(ioc, readLoop(shared_from_this()), net::detached);
    }

    void stop() {
        stopped.store(true);
        boost::system::error_code ec;
        input.cancel(ec);
        input.close(ec);
    }
};

StdioChannel::StdioChannel(net::io_context& ioc, int inputFd, int outputFd)
    : pImpl(std::make_shared<Impl>(ioc, inputFd, outputFd)) {}

StdioChannel::~StdioChannel() {
    pImpl->stop();
    // The fallback reader only serves regular files, so it always reaches end of file.
    if (pImpl->readerThread.joinable()) {
        pImpl->readerThread.join();
    }
}

void StdioChannel::Start(InputHandler onInput, EofHandler onEof) {
    pImpl->onInput = std::move(onInput);
    pImpl->onEof = std::move(onEof);
    pImpl->start();
}

void StdioChannel::Stop() {
    pImpl->stop();
}

bool StdioChannel::Write(std::string_view bytes, std::size_t& written) {
    written = 0;
    if (pImpl->outputFd < 0) {
        return false;
    }
    return WriteAll(pImpl->outputFd, bytes.data(), bytes.size(), &written);
}

bool StdioChannel::Write(std::string_view bytes) {
    std::size_t written = 0;
    return Write(bytes, written);
}

bool StdioChannel::WriteLine(const std::string& frame) {
    std::string line;
    line.reserve(frame.size() + 1);
    line.append(frame);
    line.push_back('\n');
    return Write(line);
}

bool StdioChannel::WriteAll(int fd, const char* data, std::size_t len, std::size_t* writtenOut) {
    std::size_t written = 0;
    if (writtenOut != nullptr) {
        *writtenOut = 0;
    }
    while (written < len) {
        ssize_t n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                struct pollfd pfd{fd, POLLOUT, 0};
                ::poll(&pfd, 1, 1000);
                continue;
            }
            LOG_WARN("Write to fd {} failed after {} of {} byte(s): {}", fd, written, len, std::strerror(errno));
            return false;
        }
        written += static_cast<std::size_t>(n);
        if (writtenOut != nullptr) {
            *writtenOut = written;
        }
    }
    return true;
}

} // namespace devbridge
