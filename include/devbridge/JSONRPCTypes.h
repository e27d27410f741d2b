//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model, strict parser/serializer and JSON-RPC 2.0 message types
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace devbridge {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isInteger() const { return std::holds_alternative<int64_t>(value); }
    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
};

//==========================================================================================================
// JSONParseError
// Purpose: Raised by ParseJSON for malformed input. what() carries the reason and byte offset.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// ParseJSON
// Purpose: Strictly parses a complete JSON document (trailing non-whitespace is an error).
// Args:
//   text: UTF-8 JSON text.
// Returns:
//   The parsed JSONValue. Throws JSONParseError on malformed input.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact serialization (no insignificant whitespace, never contains a raw newline).
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// FindMember
// Purpose: Looks up a key in an object value.
// Returns:
//   Pointer to the member value, or nullptr when the value is not an object or the key is absent.
//==========================================================================================================
const JSONValue* FindMember(const JSONValue& object, const std::string& key);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Converts an id to a type-tagged key ("s:abc", "n:1", "null") so 1 and "1" never collide.
std::string IdToKey(const JSONRPCId& id);

// Human-readable rendering for logs.
std::string IdToString(const JSONRPCId& id);

// Interprets a JSON value as an id. std::nullopt when the value is not a string, integer or null.
std::optional<JSONRPCId> IdFromValue(const JSONValue& value);

JSONValue IdToValue(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response written to the client, carrying either result or error.
//==========================================================================================================
struct JSONRPCResponse {
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    // One line of canonical JSON: {"jsonrpc":"2.0","id":...,"result"|"error":...}
    std::string Serialize() const;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC 2.0 error codes used on the stdio channel.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

} // namespace devbridge
