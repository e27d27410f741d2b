//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_response_deduplicator.cpp
// Purpose: Tests for duplicate response suppression
//==========================================================================================================

#include <gtest/gtest.h>

#include "devbridge/ResponseDeduplicator.h"

using namespace devbridge;

TEST(ResponseDeduplicator, SecondAnswerForSameIdIsRejected) {
    ResponseDeduplicator dedup;
    EXPECT_TRUE(dedup.MarkAnswered(JSONRPCId{int64_t{7}}));
    EXPECT_FALSE(dedup.MarkAnswered(JSONRPCId{int64_t{7}}));
    EXPECT_TRUE(dedup.MarkAnswered(JSONRPCId{std::string("7")}));
}

TEST(ResponseDeduplicator, ForgetAllowsIdReuse) {
    ResponseDeduplicator dedup;
    ASSERT_TRUE(dedup.MarkAnswered(JSONRPCId{std::string("a")}));
    dedup.Forget(JSONRPCId{std::string("a")});
    EXPECT_EQ(dedup.Size(), 0u);
    EXPECT_TRUE(dedup.MarkAnswered(JSONRPCId{std::string("a")}));
}

TEST(ResponseDeduplicator, OldestEntriesAgeOut) {
    ResponseDeduplicator dedup(2);
    ASSERT_TRUE(dedup.MarkAnswered(JSONRPCId{int64_t{1}}));
    ASSERT_TRUE(dedup.MarkAnswered(JSONRPCId{int64_t{2}}));
    ASSERT_TRUE(dedup.MarkAnswered(JSONRPCId{int64_t{3}}));
    EXPECT_EQ(dedup.Size(), 2u);
    EXPECT_TRUE(dedup.MarkAnswered(JSONRPCId{int64_t{1}}));
    EXPECT_FALSE(dedup.MarkAnswered(JSONRPCId{int64_t{3}}));
}

TEST(ResponseDeduplicator, AdmitFrameOnlyFiltersResponses) {
    ResponseDeduplicator dedup;
    const std::string response = R"({"jsonrpc":"2.0","id":4,"result":{}})";
    EXPECT_TRUE(dedup.AdmitFrame(response));
    EXPECT_FALSE(dedup.AdmitFrame(response));

    const std::string notification = R"({"jsonrpc":"2.0","method":"notifications/message"})";
    EXPECT_TRUE(dedup.AdmitFrame(notification));
    EXPECT_TRUE(dedup.AdmitFrame(notification));

    const std::string nullIdError = R"({"jsonrpc":"2.0","id":null,"error":{"code":-32600,"message":"x"}})";
    EXPECT_TRUE(dedup.AdmitFrame(nullIdError));
    EXPECT_TRUE(dedup.AdmitFrame(nullIdError));

    EXPECT_TRUE(dedup.AdmitFrame("garbage"));
}
