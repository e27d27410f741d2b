//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Supervisor.cpp
// Purpose: Supervisor state machine, stdio relay, lock files and restart scheduling
//==========================================================================================================

#include "devbridge/Supervisor.hpp"
#include "devbridge/ChildProcess.hpp"
#include "devbridge/LineFramer.h"
#include "devbridge/PidFile.hpp"
#include "devbridge/ResponseDeduplicator.h"
#include "devbridge/RestartPolicy.hpp"
#include "devbridge/StdioChannel.hpp"
#include "devbridge/errors/Errors.h"
#include "logging/Logger.h"

#include <csignal>
#include <unistd.h>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace devbridge {
namespace net = boost::asio;

const char* ToString(SupervisorPhase phase) {
    switch (phase) {
        case SupervisorPhase::Starting: return "starting";
        case SupervisorPhase::Running: return "running";
        case SupervisorPhase::Restarting: return "restarting";
        case SupervisorPhase::CoolingDown: return "cooling-down";
        case SupervisorPhase::ShuttingDown: return "shutting-down";
        case SupervisorPhase::Stopped: return "stopped";
    }
    return "unknown";
}

class Supervisor::Impl {
public:
    SupervisorConfig config;
    std::string executable;
    std::vector<std::string> childArgs;

    net::io_context ioc;
    net::signal_set termSignals;
    net::signal_set childSignals;
    net::steady_timer restartTimer;
    net::steady_timer killTimer;
    net::steady_timer healthTimer;

    StdioChannel parentIo;
    std::unique_ptr<ChildProcess> child;
    std::unique_ptr<StdioChannel> childIo;
    bool childOutputDone{true};
    std::string pendingInput;

    std::unique_ptr<LineFramer> outputFramer;
    ResponseDeduplicator dedup;

    RestartPolicy policy;
    SupervisorPhase phase{SupervisorPhase::Starting};
    PidFile supervisorPid;
    PidFile bridgePid;
    bool shutdownRequested{false};
    bool finished{false};
    int exitCode{0};

    Impl(const SupervisorConfig& cfg, std::string exe, std::vector<std::string> args)
        : config(cfg), executable(std::move(exe)), childArgs(std::move(args)),
          termSignals(ioc, SIGINT, SIGTERM, SIGHUP), childSignals(ioc, SIGCHLD),
          restartTimer(ioc), killTimer(ioc), healthTimer(ioc),
          parentIo(ioc, STDIN_FILENO, STDOUT_FILENO),
          policy(RestartPolicy::Options{cfg.restartCeiling, cfg.restartCooldown, cfg.restartDelay}),
          supervisorPid(cfg.SupervisorPidPath()), bridgePid(cfg.BridgePidPath()) {}

    void setPhase(SupervisorPhase next) {
        if (phase != next) {
            LOG_DEBUG("Supervisor phase {} -> {}", ToString(phase), ToString(next));
            phase = next;
        }
    }

    bool childRunning() const {
        return child && child->Running();
    }

    //======================================================================================================
    // Child lifecycle
    //======================================================================================================
    void startChild() {
        childIo.reset();
        child.reset();
        child = ChildProcess::Spawn(executable, childArgs);
        if (!bridgePid.Write(child->Pid())) {
            LOG_WARN("Could not record bridge pid");
        }
        if (config.dedup) {
            outputFramer = std::make_unique<LineFramer>();
        }
        childOutputDone = false;
        childIo = std::make_unique<StdioChannel>(ioc, child->StdoutFd(), child->StdinFd());
        childIo->Start(
            [this](std::string_view chunk) { onChildOutput(chunk); },
            [this]() {
                childOutputDone = true;
                finishIfDone();
            });
        setPhase(SupervisorPhase::Running);
        if (!pendingInput.empty()) {
            LOG_INFO("Delivering {} buffered byte(s) to new child", pendingInput.size());
            std::string buffered;
            buffered.swap(pendingInput);
            relayToChild(buffered);
        }
    }

    void startChildOrReschedule() {
        if (shutdownRequested) {
            return;
        }
        try {
            startChild();
        } catch (const errors::SpawnError& e) {
            LOG_ERROR("Failed to restart bridge: {}", e.what());
            scheduleRestart();
        }
    }

    void scheduleRestart() {
        setPhase(SupervisorPhase::Restarting);
        auto decision = policy.OnUnexpectedExit(RestartPolicy::Clock::now());
        if (decision.action == RestartPolicy::Decision::Action::DeferUntilCooldown) {
            setPhase(SupervisorPhase::CoolingDown);
            LOG_WARN("Restart limit of {} reached; next restart in {} ms", config.restartCeiling, decision.wait.count());
            restartTimer.expires_after(decision.wait);
            restartTimer.async_wait([this](const boost::system::error_code& ec) {
                if (ec || shutdownRequested) {
                    return;
                }
                policy.ResetAfterCooldown();
                LOG_INFO("Cooldown elapsed; restarting bridge");
                startChildOrReschedule();
            });
            return;
        }
        LOG_INFO("Restarting bridge in {} ms (restart {} of {})", decision.wait.count(), policy.RestartCount(),
                 config.restartCeiling);
        restartTimer.expires_after(decision.wait);
        restartTimer.async_wait([this](const boost::system::error_code& ec) {
            if (ec || shutdownRequested) {
                return;
            }
            startChildOrReschedule();
        });
    }

    void onChildExit(int status) {
        LOG_WARN("Bridge pid {} {}", child->Pid(), ChildProcess::DescribeStatus(status));
        bridgePid.Remove();
        if (shutdownRequested) {
            killTimer.cancel();
            finishIfDone();
            return;
        }
        scheduleRestart();
    }

    void reapChild() {
        if (!childRunning()) {
            return;
        }
        if (auto status = child->TryReap(); status.has_value()) {
            onChildExit(status.value());
        }
    }

    //======================================================================================================
    // Relay
    //======================================================================================================
    void relayToChild(std::string_view chunk) {
        std::size_t written = 0;
        if (childRunning() && childIo && childIo->Write(chunk, written)) {
            return;
        }
        // Bytes the old child accepted are not replayed to its successor.
        std::string_view rest = chunk.substr(written);
        pendingInput.append(rest.data(), rest.size());
        LOG_DEBUG("Buffered {} byte(s) while bridge unavailable", rest.size());
    }

    void onChildOutput(std::string_view chunk) {
        if (!outputFramer) {
            if (!parentIo.Write(chunk)) {
                LOG_ERROR("Failed to relay {} byte(s) to stdout", chunk.size());
            }
            return;
        }
        for (const auto& line : outputFramer->Feed(chunk)) {
            if (dedup.AdmitFrame(line) && !parentIo.WriteLine(line)) {
                LOG_ERROR("Failed to relay frame to stdout");
            }
        }
    }

    //======================================================================================================
    // Shutdown
    //======================================================================================================
    void shutdown(const std::string& reason) {
        if (shutdownRequested) {
            return;
        }
        shutdownRequested = true;
        setPhase(SupervisorPhase::ShuttingDown);
        LOG_INFO("Supervisor shutting down: {}", reason);
        restartTimer.cancel();
        healthTimer.cancel();
        parentIo.Stop();
        if (childRunning()) {
            child->CloseStdin();
            child->Signal(SIGTERM);
            armKillTimer();
        } else {
            finish();
        }
    }

    void armKillTimer() {
        killTimer.expires_after(config.childKillTimeout);
        killTimer.async_wait([this](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            if (childRunning()) {
                LOG_WARN("Bridge pid {} ignored SIGTERM; sending SIGKILL", child->Pid());
                child->Signal(SIGKILL);
                armKillTimer();
                return;
            }
            finish();
        });
    }

    void finishIfDone() {
        if (!shutdownRequested || childRunning()) {
            return;
        }
        if (!childOutputDone) {
            // Remaining output is drained by the reader; the kill timer bounds the wait
            armKillTimer();
            return;
        }
        finish();
    }

    void finish() {
        if (finished) {
            return;
        }
        finished = true;
        setPhase(SupervisorPhase::Stopped);
        bridgePid.Remove();
        supervisorPid.Remove();
        boost::system::error_code ec;
        termSignals.cancel(ec);
        childSignals.cancel(ec);
        restartTimer.cancel();
        killTimer.cancel();
        healthTimer.cancel();
        if (childIo) {
            childIo->Stop();
        }
        ioc.stop();
    }

    //======================================================================================================
    // Signals and health
    //======================================================================================================
    void waitTermSignal() {
        termSignals.async_wait([this](const boost::system::error_code& ec, int signo) {
            if (ec) {
                return;
            }
            shutdown(std::string("received signal ") + std::to_string(signo));
        });
    }

    void waitChildSignal() {
        childSignals.async_wait([this](const boost::system::error_code& ec, int) {
            if (ec) {
                return;
            }
            reapChild();
            if (!finished) {
                waitChildSignal();
            }
        });
    }

    static net::awaitable<void> healthLoop(Impl* self) {
        while (!self->shutdownRequested) {
            boost::system::error_code ec;
            self->healthTimer.expires_after(self->config.healthInterval);
            co_await self->healthTimer.async_wait(net::redirect_error(net::use_awaitable, ec));
            if (ec || self->shutdownRequested) {
                break;
            }
            LOG_INFO("Supervisor health: phase={} child={} restarts={}", ToString(self->phase),
                     self->childRunning() ? std::to_string(self->child->Pid()) : std::string("none"),
                     self->policy.RestartCount());
            if (self->childRunning() && !ProcessAlive(self->child->Pid())) {
                LOG_WARN("Bridge pid {} is gone without an exit notification", self->child->Pid());
            }
            self->reapChild();
        }
        co_return;
    }

    int run() {
        TerminateStaleInstance(config.SupervisorPidPath());
        TerminateStaleInstance(config.BridgePidPath());
        if (!supervisorPid.Write(::getpid())) {
            LOG_WARN("Could not record supervisor pid");
        }

        waitTermSignal();
        waitChildSignal();

        try {
            startChild();
        } catch (const errors::SpawnError& e) {
            LOG_ERROR("Failed to start bridge: {}", e.what());
            supervisorPid.Remove();
            return 1;
        }

        parentIo.Start(
            [this](std::string_view chunk) { relayToChild(chunk); },
            [this]() { shutdown("stdin closed"); });
        net::co_spawn(ioc, healthLoop(this), net::detached);

        LOG_INFO("Supervisor started (pid {})", ::getpid());
        ioc.run();
        LOG_INFO("Supervisor stopped");
        return exitCode;
    }
};

Supervisor::Supervisor(const SupervisorConfig& config, std::string executable, std::vector<std::string> childArgs)
    : pImpl(std::make_unique<Impl>(config, std::move(executable), std::move(childArgs))) {}

Supervisor::~Supervisor() = default;

int Supervisor::Run() {
    return pImpl->run();
}

SupervisorPhase Supervisor::Phase() const {
    return pImpl->phase;
}

} // namespace devbridge
