//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PortStore.cpp
// Purpose: File-backed port persistence with atomic rename
//==========================================================================================================

#include "devbridge/PortStore.hpp"
#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace devbridge {

FilePortStore::FilePortStore(std::string path) : path(std::move(path)) {}

std::optional<uint16_t> FilePortStore::Load() {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    std::string text = ss.str();
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    if (text.empty() || text.size() > 5) {
        LOG_WARN("Ignoring unparseable persisted port in {}", path);
        return std::nullopt;
    }
    unsigned long value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            LOG_WARN("Ignoring unparseable persisted port in {}: '{}'", path, text);
            return std::nullopt;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value == 0 || value > 65535) {
        LOG_WARN("Ignoring out-of-range persisted port in {}: {}", path, value);
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

bool FilePortStore::Save(uint16_t port) {
    std::error_code ec;
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            LOG_WARN("Cannot create directory for port file {}: {}", path, ec.message());
            return false;
        }
    }
    const std::string tmp = path + ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            LOG_WARN("Cannot open temp port file {} (errno={})", tmp, errno);
            return false;
        }
        out << port << '\n';
        out.flush();
        if (!out.good()) {
            LOG_WARN("Failed writing temp port file {}", tmp);
            out.close();
            std::remove(tmp.c_str());
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        LOG_WARN("Failed to rename {} over {}: {}", tmp, path, std::strerror(errno));
        std::remove(tmp.c_str());
        return false;
    }
    LOG_DEBUG("Persisted port {} to {}", port, path);
    return true;
}

} // namespace devbridge
