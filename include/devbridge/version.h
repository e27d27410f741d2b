//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for devbridge (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace devbridge {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

//==========================================================================================================
// getVersion
// Purpose: Returns the semantic version components of the bridge.
// Returns:
//   VersionInfo {major, minor, patch}
//==========================================================================================================
VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the version as "MAJOR.MINOR.PATCH" (reported by --version and in serverInfo).
//==========================================================================================================
std::string getVersionString();

} // namespace devbridge
