//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PidFile.hpp
// Purpose: Lock-file helpers (pid files) and stale-instance cleanup
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <sys/types.h>

namespace devbridge {

//==========================================================================================================
// PidFile
// Purpose: Owns one pid file. Write() records a pid; the file is removed by Remove() or on destruction,
//          but only while it still contains the pid this object wrote.
//==========================================================================================================
class PidFile {
public:
    explicit PidFile(std::string path);
    ~PidFile();

    PidFile(const PidFile&) = delete;
    PidFile& operator=(const PidFile&) = delete;

    // Writes the pid (creating the parent directory). Returns false on I/O failure.
    bool Write(pid_t pid);
    void Remove();

    const std::string& Path() const { return path; }

    // Reads a pid file. std::nullopt when missing or not a positive integer.
    static std::optional<pid_t> Read(const std::string& path);

private:
    std::string path;
    std::optional<pid_t> written;
};

// True when a process with this pid exists (including ones we may not signal).
bool ProcessAlive(pid_t pid);

// Short process name from /proc/<pid>/comm, empty when unavailable.
std::string ProcessName(pid_t pid);

//==========================================================================================================
// TerminateStaleInstance
// Purpose: Best-effort cleanup of a previous instance recorded in a pid file. Sends SIGTERM only when the
//          process is alive, is not this process, and has the same process name as this process. The
//          pid file is removed afterwards. A missing file is not an error.
// Returns:
//   true when a signal was sent.
//==========================================================================================================
bool TerminateStaleInstance(const std::string& pidFilePath);

} // namespace devbridge
