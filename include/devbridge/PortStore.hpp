//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PortStore.hpp
// Purpose: Persistence of the last successfully bound listening port
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace devbridge {

//==========================================================================================================
// IPortStore
// Purpose: Storage seam for the persisted port hint.
//==========================================================================================================
class IPortStore {
public:
    virtual ~IPortStore() = default;

    // Returns the stored port, or std::nullopt when absent or unreadable.
    virtual std::optional<uint16_t> Load() = 0;

    // Persists the port. Returns false on failure (callers log and continue).
    virtual bool Save(uint16_t port) = 0;
};

//==========================================================================================================
// FilePortStore
// Purpose: Stores the port as decimal text. Save writes "<path>.tmp.<pid>" and renames it over the
//          target so readers never see a partially written value. The parent directory is created
//          on demand.
//==========================================================================================================
class FilePortStore : public IPortStore {
public:
    explicit FilePortStore(std::string path);

    std::optional<uint16_t> Load() override;
    bool Save(uint16_t port) override;

    const std::string& Path() const { return path; }

private:
    std::string path;
};

} // namespace devbridge
