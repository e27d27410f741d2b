//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: devbridge entry point (supervisor by default, bridge with --child or --no-supervisor)
//==========================================================================================================

#include "devbridge/Bridge.hpp"
#include "devbridge/Config.h"
#include "devbridge/Protocol.h"
#include "devbridge/Supervisor.hpp"
#include "devbridge/errors/Errors.h"
#include "devbridge/version.h"
#include "logging/Logger.h"

#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include <climits>
#include <unistd.h>

using namespace devbridge;

//==========================================================================================================
// Resolves the path of the running executable so the supervisor can spawn itself as the bridge.
// Returns:
//   /proc/self/exe target, or argv[0] when the link cannot be read
//==========================================================================================================
static std::string selfExecutable(const char* argv0) {
    char buf[PATH_MAX];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) {
        LOG_WARN("readlink(/proc/self/exe) failed; falling back to {}", argv0);
        return std::string(argv0);
    }
    return std::string(buf, static_cast<std::size_t>(n));
}

//==========================================================================================================
// Builds the child's argv: argv[0], --child, then every original argument except the role flags.
//==========================================================================================================
static std::vector<std::string> childArguments(int argc, char** argv) {
    std::vector<std::string> args;
    args.emplace_back(argv[0]);
    args.emplace_back("--child");
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--child" || a == "--no-supervisor") {
            continue;
        }
        args.push_back(std::move(a));
    }
    return args;
}

int main(int argc, char** argv) {
    // Writes to a closed pipe must surface as EPIPE, not terminate the process
    std::signal(SIGPIPE, SIG_IGN);

    if (HasFlag(argc, argv, "--version")) {
        std::cout << SERVER_NAME << " " << getVersionString() << std::endl;
        return 0;
    }

    const bool childRole = HasFlag(argc, argv, "--child");
    const bool unsupervised = HasFlag(argc, argv, "--no-supervisor");
    Logger::setProcessTag(childRole || unsupervised ? "[bridge]" : "[supervisor]");

    Config config;
    try {
        config = LoadConfig(argc, argv);
    } catch (const errors::ConfigError& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return 1;
    }
    Logger::setLogLevelFromString(config.logLevel);
    if (!config.logFile.empty()) {
        Logger::setLogFile(config.logFile);
    }

    try {
        if (childRole || unsupervised) {
            LOG_INFO("devbridge {} starting bridge (state dir {})", getVersionString(), config.bridge.stateDir);
            Bridge bridge(config.bridge);
            return bridge.Run();
        }
        LOG_INFO("devbridge {} starting supervisor (state dir {})", getVersionString(), config.supervisor.stateDir);
        Supervisor supervisor(config.supervisor, selfExecutable(argv[0]), childArguments(argc, argv));
        return supervisor.Run();
    } catch (const errors::BindExhaustedError& e) {
        LOG_ERROR("Listener gave up: {}", e.what());
    } catch (const errors::SpawnError& e) {
        LOG_ERROR("Cannot start bridge: {}", e.what());
    } catch (const errors::ConfigError& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Unhandled error: {}", e.what());
    }
    return 1;
}
