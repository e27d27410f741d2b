//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Bridge.hpp
// Purpose: The bridge process: stdio translator, request correlator and WebSocket peer listener
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "devbridge/Config.h"

namespace devbridge {

//==========================================================================================================
// Bridge
// Purpose: Wires StdioChannel -> ProtocolTranslator -> RequestCorrelator -> PeerListener on a single
//          io_context and runs it on the calling thread.
// Lifecycle:
//   - Run() blocks until stdin reaches end of file, a termination signal arrives, or the listener gives up
//     binding. Pending requests are answered with a disconnect error before Run() returns.
//   - Returns the process exit code: 0 for a graceful stop, 1 when the listener could not bind.
//==========================================================================================================
class Bridge {
public:
    explicit Bridge(const BridgeConfig& config);
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    int Run();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace devbridge
