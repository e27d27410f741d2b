//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RestartPolicy.hpp
// Purpose: Restart-rate throttle for the supervised bridge (pure logic, caller supplies the clock)
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>

namespace devbridge {

class RestartPolicy {
public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        unsigned int ceiling{5};
        std::chrono::milliseconds cooldown{60000};
        std::chrono::milliseconds delay{2000};
    };

    struct Decision {
        enum class Action { RestartAfterDelay, DeferUntilCooldown };
        Action action;
        std::chrono::milliseconds wait;
    };

    explicit RestartPolicy(Options opts);

    //==========================================================================================================
    // OnUnexpectedExit
    // Purpose: Decides how to react to a child exit at time `now`.
    //   - The count resets when the last restart is at least `cooldown` old.
    //   - Below the ceiling the restart is counted and happens after `delay`.
    //   - At the ceiling the restart waits until `cooldown` has elapsed since the window's first restart.
    //     The caller then invokes ResetAfterCooldown() and starts the child.
    //==========================================================================================================
    Decision OnUnexpectedExit(Clock::time_point now);

    // Clears the budget after a deferred restart.
    void ResetAfterCooldown();

    unsigned int RestartCount() const { return restartCount; }
    std::optional<Clock::time_point> LastRestartAt() const { return lastRestartAt; }
    std::optional<Clock::time_point> WindowStart() const { return windowStart; }

private:
    Options opts;
    unsigned int restartCount{0};
    std::optional<Clock::time_point> lastRestartAt;
    std::optional<Clock::time_point> windowStart;
};

} // namespace devbridge
