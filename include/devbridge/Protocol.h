//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP-facing protocol constants, method names and the fixed tool catalog
//==========================================================================================================

#pragma once

#include "devbridge/JSONRPCTypes.h"
#include <string>
#include <vector>

namespace devbridge {
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP protocol revision announced in the initialize reply
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Name reported in serverInfo
constexpr const char* SERVER_NAME = "devbridge";

///////////////////////////////////////// Methods ///////////////////////////////////////////
// Method names handled on the stdio channel
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ListResourceTemplates = "resources/templates/list";
    constexpr const char* Ping = "ping";
}

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool descriptor as advertised by tools/list
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

//==========================================================================================================
// BuiltinTools
// Purpose: The fixed catalog forwarded to the peer: query_elements, get_computed_styles, get_console_logs.
//==========================================================================================================
const std::vector<Tool>& BuiltinTools();

//==========================================================================================================
// ToolToValue
// Purpose: Serializes a tool descriptor to {name, description, inputSchema}.
//==========================================================================================================
JSONValue ToolToValue(const Tool& tool);

} // namespace devbridge
