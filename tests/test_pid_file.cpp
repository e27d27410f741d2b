//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_pid_file.cpp
// Purpose: Tests for pid files and stale instance cleanup
//==========================================================================================================

#include <gtest/gtest.h>

#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

#include "devbridge/PidFile.hpp"

using namespace devbridge;
namespace fs = std::filesystem;

namespace {
class PidFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("devbridge_pid_" + std::to_string(::getpid()) + "_" +
                                           ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
    std::string path(const std::string& name) const { return (dir / name).string(); }
    fs::path dir;
};
}

TEST_F(PidFileTest, WriteReadAndRemove) {
    PidFile file(path("bridge.pid"));
    ASSERT_TRUE(file.Write(4242));
    EXPECT_EQ(PidFile::Read(path("bridge.pid")), std::optional<pid_t>(4242));
    file.Remove();
    EXPECT_FALSE(fs::exists(path("bridge.pid")));
}

TEST_F(PidFileTest, RemoveLeavesFileOwnedByAnotherInstance) {
    {
        PidFile file(path("supervisor.pid"));
        ASSERT_TRUE(file.Write(100));
        std::ofstream(path("supervisor.pid"), std::ios::trunc) << 200 << '\n';
    }
    EXPECT_TRUE(fs::exists(path("supervisor.pid")));
    EXPECT_EQ(PidFile::Read(path("supervisor.pid")), std::optional<pid_t>(200));
}

TEST_F(PidFileTest, ReadRejectsGarbage) {
    fs::create_directories(dir);
    std::ofstream(path("x.pid")) << "hello";
    EXPECT_FALSE(PidFile::Read(path("x.pid")).has_value());
    std::ofstream(path("y.pid")) << "-5";
    EXPECT_FALSE(PidFile::Read(path("y.pid")).has_value());
    EXPECT_FALSE(PidFile::Read(path("missing.pid")).has_value());
}

TEST(ProcessProbe, SelfIsAliveAndNamed) {
    EXPECT_TRUE(ProcessAlive(::getpid()));
    EXPECT_FALSE(ProcessName(::getpid()).empty());
    EXPECT_FALSE(ProcessAlive(0));
}

TEST_F(PidFileTest, StaleFileForDeadProcessIsRemovedWithoutSignal) {
    pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        ::_exit(0);
    }
    int status = 0;
    ASSERT_EQ(::waitpid(child, &status, 0), child);

    fs::create_directories(dir);
    std::ofstream(path("bridge.pid")) << child << '\n';
    EXPECT_FALSE(TerminateStaleInstance(path("bridge.pid")));
    EXPECT_FALSE(fs::exists(path("bridge.pid")));
}

TEST_F(PidFileTest, OwnPidIsNeverSignalled) {
    fs::create_directories(dir);
    std::ofstream(path("supervisor.pid")) << ::getpid() << '\n';
    EXPECT_FALSE(TerminateStaleInstance(path("supervisor.pid")));
    EXPECT_FALSE(fs::exists(path("supervisor.pid")));
}

TEST_F(PidFileTest, LiveInstanceWithSameNameIsTerminated) {
    pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        // Same executable image, so /proc/<pid>/comm matches the test process
        for (;;) {
            ::pause();
        }
    }
    fs::create_directories(dir);
    std::ofstream(path("bridge.pid")) << child << '\n';
    EXPECT_TRUE(TerminateStaleInstance(path("bridge.pid")));
    int status = 0;
    ASSERT_EQ(::waitpid(child, &status, 0), child);
    EXPECT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGTERM);
    EXPECT_FALSE(fs::exists(path("bridge.pid")));
}

TEST_F(PidFileTest, MissingFileIsNotAnError) {
    EXPECT_FALSE(TerminateStaleInstance(path("absent.pid")));
}
