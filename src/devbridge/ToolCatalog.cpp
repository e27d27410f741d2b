//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCatalog.cpp
// Purpose: Builds the fixed tool catalog and its JSON Schema descriptors
//==========================================================================================================

#include "devbridge/Protocol.h"

namespace devbridge {

namespace {

// {"type":"object","properties":{<prop>:{"type":<type>,"description":<desc>[,"default":...]}},"required":[...]}
JSONValue singlePropertySchema(const std::string& prop, const std::string& type,
                               const std::string& description, bool required,
                               const std::optional<JSONValue>& defaultValue = std::nullopt) {
    JSONValue::Object propSchema;
    propSchema["type"] = std::make_shared<JSONValue>(type);
    propSchema["description"] = std::make_shared<JSONValue>(description);
    if (defaultValue.has_value()) {
        propSchema["default"] = std::make_shared<JSONValue>(defaultValue.value());
    }

    JSONValue::Object properties;
    properties[prop] = std::make_shared<JSONValue>(std::move(propSchema));

    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    schema["properties"] = std::make_shared<JSONValue>(std::move(properties));
    if (required) {
        JSONValue::Array req;
        req.push_back(std::make_shared<JSONValue>(prop));
        schema["required"] = std::make_shared<JSONValue>(std::move(req));
    }
    return JSONValue(std::move(schema));
}

} // namespace

const std::vector<Tool>& BuiltinTools() {
    static const std::vector<Tool> tools = {
        Tool("query_elements", "Query DOM elements using CSS selectors",
             singlePropertySchema("selector", "string", "CSS selector to find elements", true)),
        Tool("get_computed_styles", "Get computed styles for an element",
             singlePropertySchema("selector", "string", "CSS selector to target element", true)),
        Tool("get_console_logs", "Get recent console logs",
             singlePropertySchema("limit", "number", "Maximum number of logs to retrieve", false,
                                  JSONValue(static_cast<int64_t>(100)))),
    };
    return tools;
}

JSONValue ToolToValue(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    return JSONValue(std::move(obj));
}

} // namespace devbridge
