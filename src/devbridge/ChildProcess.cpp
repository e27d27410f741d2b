//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.cpp
// Purpose: Child process spawning and reaping
//==========================================================================================================

#include "devbridge/ChildProcess.hpp"
#include "devbridge/errors/Errors.h"
#include "logging/Logger.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace devbridge {

ChildProcess::ChildProcess(pid_t pid, int stdinFd, int stdoutFd)
    : pid(pid), stdinFd(stdinFd), stdoutFd(stdoutFd) {}

ChildProcess::~ChildProcess() {
    if (Running()) {
        Signal(SIGKILL);
        int status = 0;
        ::waitpid(pid, &status, 0);
    }
    if (stdinFd >= 0) ::close(stdinFd);
    if (stdoutFd >= 0) ::close(stdoutFd);
}

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const std::string& executable, const std::vector<std::string>& args) {
    int inPipe[2]{-1, -1};
    int outPipe[2]{-1, -1};
    if (::pipe2(inPipe, O_CLOEXEC) != 0) {
        throw errors::SpawnError(std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(inPipe[0]);
        ::close(inPipe[1]);
        throw errors::SpawnError(std::string("pipe() failed: ") + std::strerror(err));
    }

    // Built before fork: only async-signal-safe calls happen in the child.
    std::vector<std::string> argStorage = args;
    if (argStorage.empty()) {
        argStorage.push_back(executable);
    }
    std::vector<char*> argv;
    argv.reserve(argStorage.size() + 1);
    for (auto& a : argStorage) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(inPipe[0]);
        ::close(inPipe[1]);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        throw errors::SpawnError(std::string("fork() failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::execv(executable.c_str(), argv.data());
        ::_exit(127);
    }

    ::close(inPipe[0]);
    ::close(outPipe[1]);
    LOG_INFO("Spawned bridge child pid {}", pid);
    return std::unique_ptr<ChildProcess>(new ChildProcess(pid, inPipe[1], outPipe[0]));
}

std::optional<int> ChildProcess::TryReap() {
    if (!Running()) {
        return exitStatus;
    }
    int status = 0;
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
        exitStatus = status;
        return exitStatus;
    }
    if (r < 0 && errno == ECHILD) {
        // Already reaped elsewhere; report as an abnormal exit
        LOG_WARN("Child pid {} vanished without status", pid);
        exitStatus = -1;
        return exitStatus;
    }
    return std::nullopt;
}

void ChildProcess::CloseStdin() {
    if (stdinFd >= 0) {
        ::close(stdinFd);
        stdinFd = -1;
    }
}

void ChildProcess::Signal(int signo) {
    if (!Running()) {
        return;
    }
    if (::kill(pid, signo) != 0 && errno != ESRCH) {
        LOG_WARN("kill({}, {}) failed: {}", pid, signo, std::strerror(errno));
    }
}

std::string ChildProcess::DescribeStatus(int status) {
    if (status < 0) {
        return "unknown status";
    }
    if (WIFEXITED(status)) {
        return "exited with code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "status " + std::to_string(status);
}

} // namespace devbridge
