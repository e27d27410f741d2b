//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_port_store.cpp
// Purpose: Tests for the persisted port hint file
//==========================================================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include "devbridge/PortStore.hpp"

using namespace devbridge;
namespace fs = std::filesystem;

namespace {
class PortStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("devbridge_portstore_" + std::to_string(::getpid()) + "_" +
                                           ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
    void writeRaw(const std::string& text) {
        fs::create_directories(dir);
        std::ofstream out(dir / "active_port.txt");
        out << text;
    }
    fs::path dir;
};
}

TEST_F(PortStoreTest, MissingFileYieldsNothing) {
    FilePortStore store((dir / "active_port.txt").string());
    EXPECT_FALSE(store.Load().has_value());
}

TEST_F(PortStoreTest, SaveCreatesDirectoryAndLoadReadsBack) {
    FilePortStore store((dir / "nested" / "active_port.txt").string());
    ASSERT_TRUE(store.Save(27130));
    auto port = store.Load();
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(port.value(), 27130);
    // No temp file is left behind
    std::size_t entries = 0;
    for (const auto& e : fs::directory_iterator(dir / "nested")) {
        (void)e;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(PortStoreTest, TrailingWhitespaceIsAccepted) {
    writeRaw("27127 \n");
    FilePortStore store((dir / "active_port.txt").string());
    ASSERT_TRUE(store.Load().has_value());
    EXPECT_EQ(store.Load().value(), 27127);
}

TEST_F(PortStoreTest, GarbageAndOutOfRangeAreIgnored) {
    FilePortStore store((dir / "active_port.txt").string());
    writeRaw("abc");
    EXPECT_FALSE(store.Load().has_value());
    writeRaw("70000");
    EXPECT_FALSE(store.Load().has_value());
    writeRaw("0");
    EXPECT_FALSE(store.Load().has_value());
    writeRaw("");
    EXPECT_FALSE(store.Load().has_value());
}
