//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_config.cpp
// Purpose: Tests for environment and argument configuration loading
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "devbridge/Config.h"
#include "devbridge/errors/Errors.h"

using namespace devbridge;

namespace {

// Sets an environment variable for the lifetime of the guard and restores the previous value.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name(name) {
        if (const char* prev = std::getenv(name); prev != nullptr) {
            previous = prev;
            hadPrevious = true;
        }
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() {
        if (hadPrevious) {
            ::setenv(name, previous.c_str(), 1);
        } else {
            ::unsetenv(name);
        }
    }
private:
    const char* name;
    std::string previous;
    bool hadPrevious{false};
};

// Owns mutable argv storage for the argument parsers.
class Args {
public:
    Args(std::initializer_list<std::string> items) : storage(items) {
        for (auto& s : storage) {
            pointers.push_back(s.data());
        }
    }
    int argc() const { return static_cast<int>(pointers.size()); }
    char** argv() { return pointers.data(); }
private:
    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

} // namespace

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    ScopedEnv stateDir("DEVBRIDGE_STATE_DIR", "/tmp/devbridge-config-test");
    Config c = LoadConfigFromEnvironment();
    EXPECT_EQ(c.bridge.portMin, 27125);
    EXPECT_EQ(c.bridge.portMax, 27135);
    EXPECT_EQ(c.bridge.bindHost, "127.0.0.1");
    EXPECT_EQ(c.bridge.requestTimeout.count(), 15000);
    EXPECT_EQ(c.bridge.pingInterval.count(), 5000);
    EXPECT_EQ(c.supervisor.restartCeiling, 5u);
    EXPECT_EQ(c.supervisor.restartCooldown.count(), 60000);
    EXPECT_EQ(c.supervisor.restartDelay.count(), 2000);
    EXPECT_EQ(c.bridge.PortFilePath(), "/tmp/devbridge-config-test/active_port.txt");
    EXPECT_EQ(c.supervisor.SupervisorPidPath(), "/tmp/devbridge-config-test/supervisor.pid");
    EXPECT_EQ(c.supervisor.BridgePidPath(), "/tmp/devbridge-config-test/bridge.pid");
}

TEST(ConfigTest, EnvironmentOverridesDefaults) {
    ScopedEnv portMin("DEVBRIDGE_PORT_MIN", "28000");
    ScopedEnv portMax("DEVBRIDGE_PORT_MAX", "28010");
    ScopedEnv timeout("DEVBRIDGE_REQUEST_TIMEOUT_MS", "2500");
    ScopedEnv dedup("DEVBRIDGE_SUPERVISOR_DEDUP", "true");
    Config c = LoadConfigFromEnvironment();
    EXPECT_EQ(c.bridge.portMin, 28000);
    EXPECT_EQ(c.bridge.portMax, 28010);
    EXPECT_EQ(c.bridge.requestTimeout.count(), 2500);
    EXPECT_TRUE(c.supervisor.dedup);
}

TEST(ConfigTest, ArgumentsOverrideEnvironment) {
    ScopedEnv portMin("DEVBRIDGE_PORT_MIN", "28000");
    Args args{"devbridge", "--child", "--port-min=29000", "--port-max=29005", "--state-dir=/tmp/x"};
    Config c = LoadConfig(args.argc(), args.argv());
    EXPECT_EQ(c.bridge.portMin, 29000);
    EXPECT_EQ(c.bridge.portMax, 29005);
    EXPECT_EQ(c.bridge.stateDir, "/tmp/x");
    EXPECT_EQ(c.supervisor.stateDir, "/tmp/x");
}

TEST(ConfigTest, InvalidValuesThrow) {
    {
        ScopedEnv bad("DEVBRIDGE_PORT_MIN", "abc");
        EXPECT_THROW(LoadConfigFromEnvironment(), errors::ConfigError);
    }
    {
        ScopedEnv bad("DEVBRIDGE_PORT_MAX", "70000");
        EXPECT_THROW(LoadConfigFromEnvironment(), errors::ConfigError);
    }
    {
        ScopedEnv bad("DEVBRIDGE_REQUEST_TIMEOUT_MS", "0");
        EXPECT_THROW(LoadConfigFromEnvironment(), errors::ConfigError);
    }
    {
        ScopedEnv bad("DEVBRIDGE_SUPERVISOR_DEDUP", "maybe");
        EXPECT_THROW(LoadConfigFromEnvironment(), errors::ConfigError);
    }
    {
        ScopedEnv bad("DEVBRIDGE_MAX_BIND_SWEEPS", "4294967296");
        EXPECT_THROW(LoadConfigFromEnvironment(), errors::ConfigError);
    }
    {
        ScopedEnv bad("DEVBRIDGE_REQUEST_TIMEOUT_MS", "99999999999999999999999");
        EXPECT_THROW(LoadConfigFromEnvironment(), errors::ConfigError);
    }
}

TEST(ConfigTest, OutOfRangeNumbersAreRejectedInsteadOfWrapping) {
    {
        Args args{"devbridge", "--restart-ceiling=4294967296"};
        EXPECT_THROW(LoadConfig(args.argc(), args.argv()), errors::ConfigError);
    }
    {
        Args args{"devbridge", "--request-timeout-ms=9223372036854775808"};
        EXPECT_THROW(LoadConfig(args.argc(), args.argv()), errors::ConfigError);
    }
    {
        Args args{"devbridge", "--restart-cooldown-ms=2147483648"};
        EXPECT_THROW(LoadConfig(args.argc(), args.argv()), errors::ConfigError);
    }
    Args largest{"devbridge", "--restart-ceiling=4294967295", "--request-timeout-ms=2147483647"};
    Config config = LoadConfig(largest.argc(), largest.argv());
    EXPECT_EQ(config.supervisor.restartCeiling, 4294967295u);
    EXPECT_EQ(config.bridge.requestTimeout.count(), 2147483647);
}

TEST(ConfigTest, InvertedPortRangeFailsValidation) {
    Args args{"devbridge", "--port-min=30010", "--port-max=30000"};
    EXPECT_THROW(LoadConfig(args.argc(), args.argv()), errors::ConfigError);
}

TEST(ConfigTest, UnknownOptionsAndBareFlagsAreIgnored) {
    Args args{"devbridge", "--no-supervisor", "--frobnicate=1", "--log-level=DEBUG"};
    Config c = LoadConfig(args.argc(), args.argv());
    EXPECT_EQ(c.logLevel, "DEBUG");
}

TEST(ConfigTest, FlagAndValueHelpers) {
    Args args{"devbridge", "--child", "--host=::1"};
    EXPECT_TRUE(HasFlag(args.argc(), args.argv(), "--child"));
    EXPECT_FALSE(HasFlag(args.argc(), args.argv(), "--version"));
    EXPECT_EQ(GetArgValue(args.argc(), args.argv(), "--host"), std::optional<std::string>("::1"));
    EXPECT_FALSE(GetArgValue(args.argc(), args.argv(), "--port").has_value());
}
