//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Supervisor.hpp
// Purpose: Outer process that runs the bridge as a child, relays stdio and restarts it on crashes
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "devbridge/Config.h"

namespace devbridge {

enum class SupervisorPhase {
    Starting,
    Running,
    Restarting,
    CoolingDown,
    ShuttingDown,
    Stopped
};

const char* ToString(SupervisorPhase phase);

//==========================================================================================================
// Supervisor
// Purpose: Spawns `executable childArgs...` with piped stdin/stdout and relays bytes in both directions
//          unchanged. Unexpected child exits are restarted under a RestartPolicy; a termination signal or
//          end of stdin shuts everything down.
// Lock files:
//   supervisor.pid (this process) and bridge.pid (the running child) in the state directory. Stale files
//   from a previous instance are cleaned up before the first spawn.
// Exit codes:
//   0 after a signal or end of stdin, 1 when the first spawn fails.
//==========================================================================================================
class Supervisor {
public:
    Supervisor(const SupervisorConfig& config, std::string executable, std::vector<std::string> childArgs);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    int Run();

    SupervisorPhase Phase() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace devbridge
