//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PidFile.cpp
// Purpose: Pid file persistence and stale-process detection via /proc
//==========================================================================================================

#include "devbridge/PidFile.hpp"
#include "logging/Logger.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace devbridge {

PidFile::PidFile(std::string path) : path(std::move(path)) {}

PidFile::~PidFile() {
    Remove();
}

bool PidFile::Write(pid_t pid) {
    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            LOG_WARN("Cannot create directory for {}: {}", path, ec.message());
            return false;
        }
    }
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        LOG_WARN("Cannot write pid file {}: {}", path, std::strerror(errno));
        return false;
    }
    out << pid << '\n';
    out.flush();
    if (!out.good()) {
        LOG_WARN("Failed writing pid file {}", path);
        return false;
    }
    written = pid;
    return true;
}

void PidFile::Remove() {
    if (!written.has_value()) {
        return;
    }
    auto current = Read(path);
    if (current.has_value() && current.value() == written.value()) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            LOG_WARN("Cannot remove pid file {}: {}", path, ec.message());
        }
    }
    written.reset();
}

std::optional<pid_t> PidFile::Read(const std::string& path) {
    std::ifstream in(path);
    long long pid = 0;
    if (in >> pid && pid > 0) {
        return static_cast<pid_t>(pid);
    }
    return std::nullopt;
}

bool ProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

std::string ProcessName(pid_t pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/comm");
    std::string name;
    std::getline(in, name);
    return name;
}

bool TerminateStaleInstance(const std::string& pidFilePath) {
    auto pid = PidFile::Read(pidFilePath);
    bool signalled = false;
    if (pid.has_value()) {
        const pid_t self = ::getpid();
        if (pid.value() == self) {
            LOG_DEBUG("Pid file {} refers to this process", pidFilePath);
        } else if (!ProcessAlive(pid.value())) {
            LOG_INFO("Removing stale pid file {} (pid {} not running)", pidFilePath, pid.value());
        } else if (ProcessName(pid.value()) != ProcessName(self)) {
            LOG_WARN("Pid {} from {} belongs to another program; not signalling", pid.value(), pidFilePath);
        } else if (::kill(pid.value(), SIGTERM) == 0) {
            LOG_INFO("Sent SIGTERM to previous instance pid {} ({})", pid.value(), pidFilePath);
            signalled = true;
        } else {
            LOG_WARN("Failed to signal pid {}: {}", pid.value(), std::strerror(errno));
        }
    }
    std::error_code ec;
    std::filesystem::remove(pidFilePath, ec);
    return signalled;
}

} // namespace devbridge
