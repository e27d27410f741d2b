//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_parser.cpp
// Purpose: Tests for the strict JSON parser, serializer and JSON-RPC id helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "devbridge/JSONRPCTypes.h"

using namespace devbridge;

TEST(JSONParser, ParsesNestedDocument) {
    JSONValue doc = ParseJSON(R"({"a":[1,2.5,"x",true,null],"b":{"c":-7}})");
    ASSERT_TRUE(doc.isObject());
    const JSONValue* a = FindMember(doc, "a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->isArray());
    const auto& arr = std::get<JSONValue::Array>(a->value);
    ASSERT_EQ(arr.size(), 5u);
    EXPECT_EQ(std::get<int64_t>(arr[0]->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(arr[1]->value), 2.5);
    EXPECT_EQ(std::get<std::string>(arr[2]->value), "x");
    EXPECT_TRUE(std::get<bool>(arr[3]->value));
    EXPECT_TRUE(arr[4]->isNull());
    const JSONValue* c = FindMember(*FindMember(doc, "b"), "c");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(std::get<int64_t>(c->value), -7);
}

TEST(JSONParser, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON("{"), JSONParseError);
    EXPECT_THROW(ParseJSON("{\"a\":}"), JSONParseError);
    EXPECT_THROW(ParseJSON("[1,2,]"), JSONParseError);
    EXPECT_THROW(ParseJSON("{} trailing"), JSONParseError);
    EXPECT_THROW(ParseJSON(""), JSONParseError);
    EXPECT_THROW(ParseJSON("not json"), JSONParseError);
}

TEST(JSONParser, RejectsExcessiveNesting) {
    std::string deep(300, '[');
    deep.append(300, ']');
    EXPECT_THROW(ParseJSON(deep), JSONParseError);
}

TEST(JSONParser, DecodesEscapesAndSurrogatePairs) {
    JSONValue v = ParseJSON(R"("line\nbreak \u00e9 \ud83d\ude00")");
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(std::get<std::string>(v.value), "line\nbreak \xC3\xA9 \xF0\x9F\x98\x80");
    EXPECT_THROW(ParseJSON(R"("\ud83d")"), JSONParseError);
}

TEST(JSONParser, LargeIntegerFallsBackToDouble) {
    JSONValue v = ParseJSON("123456789012345678901234567890");
    EXPECT_TRUE(std::holds_alternative<double>(v.value));
}

TEST(JSONSerializer, EscapesControlCharactersAndNeverEmitsNewline) {
    std::string out = SerializeJSON(JSONValue(std::string("a\nb\x01")));
    EXPECT_EQ(out, "\"a\\nb\\u0001\"");
    EXPECT_EQ(out.find('\n'), std::string::npos);
}

TEST(JSONSerializer, ParsesBackWhatItWrites) {
    const std::string text = R"({"k":[1,"two",{"three":3}]})";
    EXPECT_EQ(SerializeJSON(ParseJSON(text)), text);
}

TEST(JSONRPCIds, KeysDistinguishNumberFromString) {
    EXPECT_EQ(IdToKey(JSONRPCId{int64_t{1}}), "n:1");
    EXPECT_EQ(IdToKey(JSONRPCId{std::string("1")}), "s:1");
    EXPECT_EQ(IdToKey(JSONRPCId{nullptr}), "null");
    EXPECT_NE(IdToKey(JSONRPCId{int64_t{1}}), IdToKey(JSONRPCId{std::string("1")}));
}

TEST(JSONRPCIds, FromValueAcceptsOnlyValidIdTypes) {
    EXPECT_TRUE(IdFromValue(JSONValue(int64_t{5})).has_value());
    EXPECT_TRUE(IdFromValue(JSONValue(std::string("abc"))).has_value());
    EXPECT_TRUE(IdFromValue(JSONValue(nullptr)).has_value());
    EXPECT_FALSE(IdFromValue(JSONValue(true)).has_value());
    EXPECT_FALSE(IdFromValue(JSONValue(JSONValue::Object{})).has_value());
}

TEST(JSONRPCResponse, SerializesResultAndError) {
    JSONRPCResponse ok(JSONRPCId{int64_t{3}}, JSONValue(JSONValue::Object{}));
    EXPECT_EQ(ok.Serialize(), R"({"jsonrpc":"2.0","id":3,"result":{}})");

    JSONRPCResponse err(JSONRPCId{std::string("q")}, CreateErrorObject(JSONRPCErrorCodes::MethodNotFound, "nope"), true);
    JSONValue doc = ParseJSON(err.Serialize());
    const JSONValue* e = FindMember(doc, "error");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(std::get<int64_t>(FindMember(*e, "code")->value), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(std::get<std::string>(FindMember(*e, "message")->value), "nope");
    EXPECT_EQ(FindMember(doc, "result"), nullptr);
}
