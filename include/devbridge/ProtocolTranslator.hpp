//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolTranslator.hpp
// Purpose: Newline-delimited JSON-RPC front end: validation, local methods and tool call forwarding
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "devbridge/JSONRPCTypes.h"
#include "devbridge/LineFramer.h"
#include "devbridge/RequestCorrelator.hpp"
#include "devbridge/ResponseDeduplicator.h"
#include "devbridge/errors/Errors.h"

namespace devbridge {

class ProtocolTranslator {
public:
    // Receives one serialized frame (without the trailing newline) to be written to the client.
    using FrameSink = std::function<void(const std::string& frame)>;

    struct Options {
        std::size_t maxLineBytes{1024 * 1024};
        std::size_t dedupWindow{4096};
    };

    ProtocolTranslator(RequestCorrelator& correlator, FrameSink sink, Options opts);
    ProtocolTranslator(RequestCorrelator& correlator, FrameSink sink);

    //==========================================================================================================
    // OnInput
    // Purpose: Feeds raw stdin bytes; every completed line is handled in order.
    //==========================================================================================================
    void OnInput(std::string_view chunk);

    //==========================================================================================================
    // OnLine
    // Purpose: Handles one complete frame. Produces at most one response (tools/call responds later,
    //          when the correlator completes).
    //==========================================================================================================
    void OnLine(const std::string& line);

    std::size_t ResponsesWritten() const { return responsesWritten; }

private:
    void dispatch(const JSONRPCId& id, const std::string& method, const JSONValue* params);
    void handleNotification(const std::string& method);
    void handleToolCall(const JSONRPCId& id, const JSONValue* params);

    JSONValue initializeResult() const;
    JSONValue listToolsResult() const;

    void sendResult(const JSONRPCId& id, JSONValue result);
    void sendError(const JSONRPCId& id, const errors::BridgeError& error);
    void emit(const JSONRPCResponse& response);

    RequestCorrelator& correlator;
    FrameSink sink;
    LineFramer framer;
    ResponseDeduplicator dedup;
    std::size_t responsesWritten{0};
};

} // namespace devbridge
