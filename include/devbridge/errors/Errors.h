//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed bridge errors, peer failure categories and startup exceptions
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "devbridge/JSONRPCTypes.h"

namespace devbridge {
namespace errors {

// Categorization of JSON-RPC protocol errors and peer-derived failures.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    PeerNotConnected,
    PeerTimeout,
    PeerDisconnected,
    PeerRejected,
    Unknown
};

// Typed error representation carried through completions and onto the stdio channel.
struct BridgeError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        default: return ErrorCategory::Unknown;
    }
}

// Wire name of a peer failure category ("not_connected", "timeout", ...).
// Returns an empty string for protocol categories.
inline std::string peerKindName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::PeerNotConnected: return "not_connected";
        case ErrorCategory::PeerTimeout: return "timeout";
        case ErrorCategory::PeerDisconnected: return "disconnected";
        case ErrorCategory::PeerRejected: return "peer_error";
        default: return std::string();
    }
}

// Build a peer failure. Peer errors always surface as InternalError with data {"kind": ...}.
//
// Args:
//   category: One of the Peer* categories.
//   message: Human-readable reason forwarded to the client.
//
// Returns:
//   BridgeError ready to be written as a JSON-RPC error object.
inline BridgeError makePeerError(ErrorCategory category, std::string message) {
    BridgeError e;
    e.code = JSONRPCErrorCodes::InternalError;
    e.message = std::move(message);
    e.category = category;
    JSONValue::Object data;
    data["kind"] = std::make_shared<JSONValue>(peerKindName(category));
    e.data = JSONValue(std::move(data));
    return e;
}

// Build a protocol error for the given JSON-RPC code.
inline BridgeError makeProtocolError(int code, std::string message) {
    BridgeError e;
    e.code = code;
    e.message = std::move(message);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Create a JSONValue error object from a typed BridgeError.
inline JSONValue makeErrorValue(const BridgeError& e) {
    return CreateErrorObject(e.code, e.message, e.data);
}

//==========================================================================================================
// Startup exceptions. Caught in main, logged, process exits with code 1.
//==========================================================================================================
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class BindExhaustedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SpawnError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace errors
} // namespace devbridge
