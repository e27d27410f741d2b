//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioChannel.hpp
// Purpose: Reactor-driven reader and synchronous writer over a pair of file descriptors
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/io_context.hpp>

namespace devbridge {

//==========================================================================================================
// StdioChannel
// Purpose: Reads chunks from an input descriptor on the io_context and writes complete buffers to an
//          output descriptor. Used for the process's own stdin/stdout and, in the supervisor, for the
//          pipes to the child.
// Notes:
//   - The input descriptor is duplicated; closing the channel never closes the caller's descriptor.
//   - When the descriptor cannot be registered with the reactor (regular files), a blocking reader
//     thread posts chunks onto the io_context instead.
//   - Writes are synchronous and complete before returning, so each frame is flushed immediately.
//==========================================================================================================
class StdioChannel {
public:
    using InputHandler = std::function<void(std::string_view chunk)>;
    using EofHandler = std::function<void()>;

    StdioChannel(boost::asio::io_context& ioc, int inputFd, int outputFd);
    ~StdioChannel();

    StdioChannel(const StdioChannel&) = delete;
    StdioChannel& operator=(const StdioChannel&) = delete;

    //==========================================================================================================
    // Starts reading. onInput receives every chunk in order; onEof fires once when the input reaches end
    // of file or fails (not after Stop()).
    //==========================================================================================================
    void Start(InputHandler onInput, EofHandler onEof);

    // Stops reading. Pending reads are cancelled without firing onEof.
    void Stop();

    // Writes all bytes. Returns false when the output descriptor is closed or fails; written then holds
    // the number of bytes accepted before the failure.
    bool Write(std::string_view bytes, std::size_t& written);
    bool Write(std::string_view bytes);

    // Writes the frame followed by '\n' in a single call.
    bool WriteLine(const std::string& frame);

    // Loops over ::write until every byte is written or an error other than EINTR/EAGAIN occurs.
    // When writtenOut is given it receives the count of bytes accepted by the descriptor.
    static bool WriteAll(int fd, const char* data, std::size_t len, std::size_t* writtenOut = nullptr);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace devbridge
