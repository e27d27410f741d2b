//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.hpp
// Purpose: fork/exec of the bridge child with stdin/stdout pipes (stderr inherited)
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace devbridge {

class ChildProcess {
public:
    //==========================================================================================================
    // Spawn
    // Purpose: Starts `executable` with `args` (args[0] is argv[0]). The child's stdin and stdout are pipes
    //          owned by the returned object; stderr is shared with the parent.
    // Returns:
    //   The running child. Throws errors::SpawnError when pipe() or fork() fails. An exec failure makes the
    //   child exit with status 127.
    //==========================================================================================================
    static std::unique_ptr<ChildProcess> Spawn(const std::string& executable, const std::vector<std::string>& args);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t Pid() const { return pid; }
    int StdinFd() const { return stdinFd; }
    int StdoutFd() const { return stdoutFd; }
    bool Running() const { return !exitStatus.has_value(); }
    std::optional<int> ExitStatus() const { return exitStatus; }

    // Non-blocking waitpid. Returns the raw wait status once the child has exited.
    std::optional<int> TryReap();

    // Closes the write end of the child's stdin so the child sees end of file.
    void CloseStdin();

    // Sends a signal if the child is still running.
    void Signal(int signo);

    // Human-readable description of a wait status ("exited with code 1", "killed by signal 9").
    static std::string DescribeStatus(int status);

private:
    ChildProcess(pid_t pid, int stdinFd, int stdoutFd);

    pid_t pid;
    int stdinFd;
    int stdoutFd;
    std::optional<int> exitStatus;
};

} // namespace devbridge
