//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RestartPolicy.cpp
// Purpose: Restart budget bookkeeping (ceiling per cooldown window)
//==========================================================================================================

#include "devbridge/RestartPolicy.hpp"
#include "logging/Logger.h"

namespace devbridge {

RestartPolicy::RestartPolicy(Options opts) : opts(opts) {}

RestartPolicy::Decision RestartPolicy::OnUnexpectedExit(Clock::time_point now) {
    if (lastRestartAt.has_value() && now - lastRestartAt.value() >= opts.cooldown) {
        LOG_DEBUG("Restart budget replenished after quiet period");
        restartCount = 0;
        windowStart.reset();
    }

    if (restartCount >= opts.ceiling) {
        auto windowEnd = windowStart.value_or(now) + opts.cooldown;
        auto wait = windowEnd > now
            ? std::chrono::duration_cast<std::chrono::milliseconds>(windowEnd - now)
            : std::chrono::milliseconds(0);
        return Decision{Decision::Action::DeferUntilCooldown, wait};
    }

    if (restartCount == 0) {
        windowStart = now;
    }
    ++restartCount;
    lastRestartAt = now;
    return Decision{Decision::Action::RestartAfterDelay, opts.delay};
}

void RestartPolicy::ResetAfterCooldown() {
    restartCount = 0;
    windowStart.reset();
    lastRestartAt.reset();
}

} // namespace devbridge
