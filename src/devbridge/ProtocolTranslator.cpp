//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolTranslator.cpp
// Purpose: Request validation and dispatch for the stdio JSON-RPC channel
//==========================================================================================================

#include "devbridge/ProtocolTranslator.hpp"
#include "devbridge/Protocol.h"
#include "devbridge/version.h"
#include "logging/Logger.h"

namespace devbridge {

ProtocolTranslator::ProtocolTranslator(RequestCorrelator& correlator, FrameSink sink, Options opts)
    : correlator(correlator), sink(std::move(sink)), framer(opts.maxLineBytes), dedup(opts.dedupWindow) {}

ProtocolTranslator::ProtocolTranslator(RequestCorrelator& correlator, FrameSink sink)
    : ProtocolTranslator(correlator, std::move(sink), Options{}) {}

void ProtocolTranslator::OnInput(std::string_view chunk) {
    for (const auto& line : framer.Feed(chunk)) {
        OnLine(line);
    }
}

void ProtocolTranslator::OnLine(const std::string& line) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = ParseJSON(line);
    } catch (const JSONParseError& e) {
        LOG_WARN("Dropping malformed frame: {}", e.what());
        return;
    }
    if (!doc.isObject()) {
        LOG_WARN("Dropping frame that is not a JSON object");
        return;
    }

    const JSONValue* idVal = FindMember(doc, "id");
    std::optional<JSONRPCId> id;
    if (idVal != nullptr) {
        id = IdFromValue(*idVal);
        if (!id.has_value()) {
            LOG_WARN("Dropping frame with invalid id type");
            return;
        }
    }

    const JSONValue* versionVal = FindMember(doc, "jsonrpc");
    const JSONValue* methodVal = FindMember(doc, "method");
    const bool versionOk = versionVal != nullptr && versionVal->isString() &&
                           std::get<std::string>(versionVal->value) == "2.0";
    const bool methodOk = methodVal != nullptr && methodVal->isString();
    if (!versionOk || !methodOk) {
        if (id.has_value()) {
            LOG_WARN("Invalid request from client (id {})", IdToString(id.value()));
            sendError(id.value(), errors::makeProtocolError(JSONRPCErrorCodes::InvalidRequest, "Invalid Request"));
        } else {
            LOG_WARN("Dropping invalid frame without id");
        }
        return;
    }

    const std::string& method = std::get<std::string>(methodVal->value);
    if (!id.has_value()) {
        handleNotification(method);
        return;
    }

    // A new request may legitimately reuse an id answered earlier.
    dedup.Forget(id.value());
    try {
        dispatch(id.value(), method, FindMember(doc, "params"));
    } catch (const std::exception& e) {
        LOG_ERROR("Error handling '{}' (id {}): {}", method, IdToString(id.value()), e.what());
        sendError(id.value(), errors::makeProtocolError(JSONRPCErrorCodes::InternalError, e.what()));
    }
}

void ProtocolTranslator::handleNotification(const std::string& method) {
    if (method == Methods::Initialized) {
        LOG_INFO("Client initialized");
    } else {
        LOG_DEBUG("Ignoring notification '{}'", method);
    }
}

void ProtocolTranslator::dispatch(const JSONRPCId& id, const std::string& method, const JSONValue* params) {
    LOG_DEBUG("Handling '{}' (id {})", method, IdToString(id));
    if (method == Methods::Initialize) {
        sendResult(id, initializeResult());
    } else if (method == Methods::Initialized || method == Methods::Ping) {
        sendResult(id, JSONValue(JSONValue::Object{}));
    } else if (method == Methods::ListTools) {
        sendResult(id, listToolsResult());
    } else if (method == Methods::CallTool) {
        handleToolCall(id, params);
    } else if (method == Methods::ListResources) {
        JSONValue::Object result;
        result["resources"] = std::make_shared<JSONValue>(JSONValue::Array{});
        sendResult(id, JSONValue(std::move(result)));
    } else if (method == Methods::ListResourceTemplates) {
        JSONValue::Object result;
        result["resourceTemplates"] = std::make_shared<JSONValue>(JSONValue::Array{});
        sendResult(id, JSONValue(std::move(result)));
    } else {
        sendError(id, errors::makeProtocolError(JSONRPCErrorCodes::MethodNotFound, "Unknown method: " + method));
    }
}

void ProtocolTranslator::handleToolCall(const JSONRPCId& id, const JSONValue* params) {
    const JSONValue* nameVal = params != nullptr ? FindMember(*params, "name") : nullptr;
    if (nameVal == nullptr || !nameVal->isString()) {
        sendError(id, errors::makeProtocolError(JSONRPCErrorCodes::InvalidParams, "Missing or invalid tool name"));
        return;
    }
    JSONValue arguments{JSONValue::Object{}};
    if (const JSONValue* argsVal = FindMember(*params, "arguments"); argsVal != nullptr && !argsVal->isNull()) {
        if (!argsVal->isObject()) {
            sendError(id, errors::makeProtocolError(JSONRPCErrorCodes::InvalidParams, "Tool arguments must be an object"));
            return;
        }
        arguments = *argsVal;
    }
    const std::string& name = std::get<std::string>(nameVal->value);
    LOG_INFO("Forwarding tool call '{}' (id {})", name, IdToString(id));

    // The client id stays in this closure; the peer only ever sees the correlator's id.
    correlator.Send(name, arguments, [this, id](PeerReply reply) {
        if (reply.error.has_value()) {
            sendError(id, reply.error.value());
        } else {
            sendResult(id, reply.result.has_value() ? std::move(reply.result.value()) : JSONValue(nullptr));
        }
    });
}

JSONValue ProtocolTranslator::initializeResult() const {
    JSONValue::Object capabilities;
    capabilities["tools"] = std::make_shared<JSONValue>(JSONValue::Object{});

    JSONValue::Object serverInfo;
    serverInfo["name"] = std::make_shared<JSONValue>(SERVER_NAME);
    serverInfo["version"] = std::make_shared<JSONValue>(getVersionString());

    JSONValue::Object result;
    result["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
    result["capabilities"] = std::make_shared<JSONValue>(std::move(capabilities));
    result["serverInfo"] = std::make_shared<JSONValue>(std::move(serverInfo));
    return JSONValue(std::move(result));
}

JSONValue ProtocolTranslator::listToolsResult() const {
    JSONValue::Array tools;
    for (const auto& tool : BuiltinTools()) {
        tools.push_back(std::make_shared<JSONValue>(ToolToValue(tool)));
    }
    JSONValue::Object result;
    result["tools"] = std::make_shared<JSONValue>(std::move(tools));
    return JSONValue(std::move(result));
}

void ProtocolTranslator::sendResult(const JSONRPCId& id, JSONValue result) {
    emit(JSONRPCResponse(id, std::move(result)));
}

void ProtocolTranslator::sendError(const JSONRPCId& id, const errors::BridgeError& error) {
    emit(JSONRPCResponse(id, errors::makeErrorValue(error), true));
}

void ProtocolTranslator::emit(const JSONRPCResponse& response) {
    if (!std::holds_alternative<std::nullptr_t>(response.id) && !dedup.MarkAnswered(response.id)) {
        return;
    }
    ++responsesWritten;
    sink(response.Serialize());
}

} // namespace devbridge
