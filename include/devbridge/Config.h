//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Runtime configuration for the bridge and supervisor (environment + --key=value overrides)
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace devbridge {

//==========================================================================================================
// BridgeConfig
// Purpose: Settings for the child bridge process (listener, correlator, translator).
//==========================================================================================================
struct BridgeConfig {
    uint16_t portMin{27125};
    uint16_t portMax{27135};
    std::string bindHost{"127.0.0.1"};
    std::string stateDir;
    std::chrono::milliseconds requestTimeout{15000};
    std::chrono::milliseconds pingInterval{5000};
    std::chrono::milliseconds bindRetryDelay{2000};
    std::chrono::milliseconds sweepRetryDelay{5000};
    std::chrono::milliseconds listenerRecreateDelay{2000};
    std::chrono::milliseconds healthInterval{30000};
    // Pending requests older than this are reported by the health check
    std::chrono::milliseconds staleRequestAge{10000};
    unsigned int maxBindSweeps{0};  // 0 = unlimited
    // Longer stdin lines are dropped whole; a request on such a line is never answered.
    std::size_t maxLineBytes{1024 * 1024};

    std::string PortFilePath() const { return stateDir + "/active_port.txt"; }
};

//==========================================================================================================
// SupervisorConfig
// Purpose: Settings for the outer supervisor (restart budget, lock files, relay options).
//==========================================================================================================
struct SupervisorConfig {
    std::string stateDir;
    unsigned int restartCeiling{5};
    std::chrono::milliseconds restartCooldown{60000};
    std::chrono::milliseconds restartDelay{2000};
    std::chrono::milliseconds healthInterval{10000};
    std::chrono::milliseconds childKillTimeout{3000};
    bool dedup{false};

    std::string SupervisorPidPath() const { return stateDir + "/supervisor.pid"; }
    std::string BridgePidPath() const { return stateDir + "/bridge.pid"; }
};

//==========================================================================================================
// Config
// Purpose: Complete process configuration. Both roles load the same values so a child started
//          with the supervisor's arguments sees identical settings.
//==========================================================================================================
struct Config {
    BridgeConfig bridge;
    SupervisorConfig supervisor;
    std::string logLevel{"INFO"};
    std::string logFile;
};

//==========================================================================================================
// DefaultStateDir
// Purpose: $HOME/.devbridge, or /tmp/devbridge when HOME is unset.
//==========================================================================================================
std::string DefaultStateDir();

//==========================================================================================================
// LoadConfigFromEnvironment
// Purpose: Builds a Config from DEVBRIDGE_* environment variables over built-in defaults.
// Returns:
//   Populated Config. Throws errors::ConfigError on an unparseable or out-of-range value.
//==========================================================================================================
Config LoadConfigFromEnvironment();

//==========================================================================================================
// ApplyArgumentOverrides
// Purpose: Applies --key=value arguments (e.g. --port-min=27200) on top of an existing Config.
// Args:
//   config: Config to modify.
//   argc/argv: Process arguments. Bare flags (--child, --version) are skipped; unknown keys are logged.
// Returns:
//   (none). Throws errors::ConfigError on invalid values.
//==========================================================================================================
void ApplyArgumentOverrides(Config& config, int argc, char** argv);

//==========================================================================================================
// ValidateConfig
// Purpose: Cross-field checks (port range ordering, non-zero intervals). Throws errors::ConfigError.
//==========================================================================================================
void ValidateConfig(const Config& config);

//==========================================================================================================
// LoadConfig
// Purpose: Environment, then argument overrides, then validation.
//==========================================================================================================
Config LoadConfig(int argc, char** argv);

// Returns true when the bare flag (e.g. "--child") appears among the arguments.
bool HasFlag(int argc, char** argv, const std::string& flag);

// Returns the value of a --key=value argument when present.
std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key);

} // namespace devbridge
