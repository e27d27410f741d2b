//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Environment/argument driven configuration loading and validation
//==========================================================================================================

#include "devbridge/Config.h"
#include "devbridge/errors/Errors.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <functional>
#include <limits>
#include <vector>

namespace devbridge {

namespace {

using errors::ConfigError;

unsigned long long parseUnsigned(const std::string& name, const std::string& text) {
    unsigned long long value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last) {
        throw ConfigError("Invalid value for " + name + ": '" + text + "' (expected a non-negative integer)");
    }
    return value;
}

// Rejects values that would not survive narrowing to the target field.
unsigned long long parseBounded(const std::string& name, const std::string& text, unsigned long long maxValue) {
    auto v = parseUnsigned(name, text);
    if (v > maxValue) {
        throw ConfigError("Invalid value for " + name + ": " + text + " (at most " + std::to_string(maxValue) + ")");
    }
    return v;
}

// Durations feed steady_clock arithmetic in nanoseconds; keep them well clear of overflow.
constexpr unsigned long long kMaxDurationMs = static_cast<unsigned long long>(std::numeric_limits<int32_t>::max());

uint16_t parsePort(const std::string& name, const std::string& text) {
    auto v = parseUnsigned(name, text);
    if (v == 0 || v > 65535) {
        throw ConfigError("Invalid value for " + name + ": " + text + " (expected 1-65535)");
    }
    return static_cast<uint16_t>(v);
}

std::chrono::milliseconds parsePositiveMs(const std::string& name, const std::string& text) {
    auto v = parseBounded(name, text, kMaxDurationMs);
    if (v == 0) {
        throw ConfigError("Invalid value for " + name + ": must be greater than zero");
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(v));
}

bool parseBool(const std::string& name, const std::string& text) {
    if (IsTruthy(text)) return true;
    if (text == "0" || text == "false" || text == "FALSE" || text == "no" || text == "NO" ||
        text == "off" || text == "OFF") {
        return false;
    }
    throw ConfigError("Invalid value for " + name + ": '" + text + "' (expected a boolean)");
}

struct Setting {
    const char* envName;
    std::function<void(Config&, const std::string& name, const std::string& value)> apply;
};

// Single table drives both environment variables and CLI keys.
const std::vector<Setting>& settings() {
    static const std::vector<Setting> table = {
        {"DEVBRIDGE_PORT_MIN", [](Config& c, const std::string& n, const std::string& v) { c.bridge.portMin = parsePort(n, v); }},
        {"DEVBRIDGE_PORT_MAX", [](Config& c, const std::string& n, const std::string& v) { c.bridge.portMax = parsePort(n, v); }},
        {"DEVBRIDGE_BIND_HOST", [](Config& c, const std::string&, const std::string& v) { c.bridge.bindHost = v; }},
        {"DEVBRIDGE_STATE_DIR", [](Config& c, const std::string&, const std::string& v) {
            c.bridge.stateDir = v;
            c.supervisor.stateDir = v;
        }},
        {"DEVBRIDGE_REQUEST_TIMEOUT_MS", [](Config& c, const std::string& n, const std::string& v) { c.bridge.requestTimeout = parsePositiveMs(n, v); }},
        {"DEVBRIDGE_PING_INTERVAL_MS", [](Config& c, const std::string& n, const std::string& v) { c.bridge.pingInterval = parsePositiveMs(n, v); }},
        {"DEVBRIDGE_BIND_RETRY_DELAY_MS", [](Config& c, const std::string& n, const std::string& v) { c.bridge.bindRetryDelay = parsePositiveMs(n, v); }},
        {"DEVBRIDGE_SWEEP_RETRY_DELAY_MS", [](Config& c, const std::string& n, const std::string& v) { c.bridge.sweepRetryDelay = parsePositiveMs(n, v); }},
        {"DEVBRIDGE_MAX_BIND_SWEEPS", [](Config& c, const std::string& n, const std::string& v) {
            c.bridge.maxBindSweeps = static_cast<unsigned int>(parseBounded(n, v, std::numeric_limits<unsigned int>::max()));
        }},
        {"DEVBRIDGE_LISTENER_RECREATE_DELAY_MS", [](Config& c, const std::string& n, const std::string& v) { c.bridge.listenerRecreateDelay = parsePositiveMs(n, v); }},
        {"DEVBRIDGE_HEALTH_INTERVAL_MS", [](Config& c, const std::string& n, const std::string& v) { c.bridge.healthInterval = parsePositiveMs(n, v); }},
        {"DEVBRIDGE_MAX_LINE_BYTES", [](Config& c, const std::string& n, const std::string& v) {
            auto bytes = parseBounded(n, v, std::numeric_limits<std::size_t>::max());
            if (bytes == 0) {
                throw ConfigError("Invalid value for " + n + ": must be greater than zero");
            }
            c.bridge.maxLineBytes = static_cast<std::size_t>(bytes);
        }},
        {"DEVBRIDGE_RESTART_CEILING", [](Config& c, const std::string& n, const std::string& v) {
            auto ceiling = parseBounded(n, v, std::numeric_limits<unsigned int>::max());
            if (ceiling == 0) {
                throw ConfigError("Invalid value for " + n + ": must be greater than zero");
            }
            c.supervisor.restartCeiling = static_cast<unsigned int>(ceiling);
        }},
        {"DEVBRIDGE_RESTART_COOLDOWN_MS", [](Config& c, const std::string& n, const std::string& v) { c.supervisor.restartCooldown = parsePositiveMs(n, v); }},
        {"DEVBRIDGE_RESTART_DELAY_MS", [](Config& c, const std::string& n, const std::string& v) { c.supervisor.restartDelay = parsePositiveMs(n, v); }},
        {"DEVBRIDGE_SUPERVISOR_HEALTH_INTERVAL_MS", [](Config& c, const std::string& n, const std::string& v) { c.supervisor.healthInterval = parsePositiveMs(n, v); }},
        {"DEVBRIDGE_CHILD_KILL_TIMEOUT_MS", [](Config& c, const std::string& n, const std::string& v) { c.supervisor.childKillTimeout = parsePositiveMs(n, v); }},
        {"DEVBRIDGE_SUPERVISOR_DEDUP", [](Config& c, const std::string& n, const std::string& v) { c.supervisor.dedup = parseBool(n, v); }},
        {"DEVBRIDGE_LOG_LEVEL", [](Config& c, const std::string&, const std::string& v) { c.logLevel = v; }},
        {"DEVBRIDGE_LOG_FILE", [](Config& c, const std::string&, const std::string& v) { c.logFile = v; }},
    };
    return table;
}

// DEVBRIDGE_PORT_MIN -> --port-min
std::string cliKeyFor(const std::string& envName) {
    static const std::string prefix = "DEVBRIDGE_";
    std::string key = "--";
    for (size_t i = prefix.size(); i < envName.size(); ++i) {
        char c = envName[i];
        key.push_back(c == '_' ? '-' : static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    }
    return key;
}

} // namespace

std::string DefaultStateDir() {
    std::string home = GetEnvOrDefault("HOME", "");
    if (home.empty()) {
        return "/tmp/devbridge";
    }
    return home + "/.devbridge";
}

Config LoadConfigFromEnvironment() {
    FUNC_SCOPE();
    Config config;
    config.bridge.stateDir = DefaultStateDir();
    config.supervisor.stateDir = config.bridge.stateDir;
    for (const auto& s : settings()) {
        std::string value = GetEnvOrDefault(s.envName, "");
        if (!value.empty()) {
            s.apply(config, s.envName, value);
        }
    }
    return config;
}

void ApplyArgumentOverrides(Config& config, int argc, char** argv) {
    FUNC_SCOPE();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (a.rfind("--", 0) != 0 || eq == std::string::npos) {
            continue;
        }
        std::string k = a.substr(0, eq);
        std::string v = a.substr(eq + 1);
        bool known = false;
        for (const auto& s : settings()) {
            if (cliKeyFor(s.envName) == k) {
                s.apply(config, k, v);
                known = true;
                break;
            }
        }
        if (!known) {
            LOG_WARN("Ignoring unknown option: {}", k);
        }
    }
}

void ValidateConfig(const Config& config) {
    if (config.bridge.portMin > config.bridge.portMax) {
        throw ConfigError("Invalid port range: " + std::to_string(config.bridge.portMin) + "-" +
                          std::to_string(config.bridge.portMax));
    }
    if (config.bridge.bindHost.empty()) {
        throw ConfigError("Bind host must not be empty");
    }
    if (config.bridge.stateDir.empty()) {
        throw ConfigError("State directory must not be empty");
    }
}

Config LoadConfig(int argc, char** argv) {
    Config config = LoadConfigFromEnvironment();
    ApplyArgumentOverrides(config, argc, argv);
    ValidateConfig(config);
    return config;
}

bool HasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

} // namespace devbridge
