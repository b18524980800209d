// ────────────────────────  control_loop.cpp  (C++17)  ───────────────────────
#include "control_loop.hpp"
#include "log.hpp"
#include "pid_file.hpp"
#include "reconciler.hpp"
#include "registry.hpp"
#include "worker.hpp"

#include <signal.h>

namespace stream_runner {

ControlLoop::ControlLoop(Registry& registry, Reconciler& reconciler, Loader loader,
                         PidFile* pidFile)
    : registry_(registry), reconciler_(reconciler), loader_(std::move(loader)),
      pidFile_(pidFile), signals_(io_, SIGHUP, SIGINT, SIGTERM) {}

void ControlLoop::loadInitial()
{
    reconciler_.apply(loader_());
}

bool ControlLoop::reload()
{
    std::vector<StreamConfig> desired;
    try {
        desired = loader_();
    } catch (const ConfigError& e) {
        SR_LOG_ERROR("config reload failed: " << e.what());
        return false;
    }
    reconciler_.apply(desired);
    SR_LOG_INFO("config reloaded successfully");
    return true;
}

void ControlLoop::shutdown()
{
    {
        auto tx = registry_.edit();
        for (auto& [id, w] : tx.workers()) {
            SR_LOG_INFO("stopping worker " << id);
            w->stop();
        }
        tx.workers().clear();
    }
    if (pidFile_) pidFile_->release();
}

bool ControlLoop::dispatch(int signo)
{
    switch (signo) {
    case SIGHUP:
        SR_LOG_INFO("received SIGHUP, reloading config");
        reload();
        return true;
    case SIGINT:
    case SIGTERM:
        SR_LOG_INFO("received signal " << signo << ", shutting down");
        shutdown();
        return false;
    default:
        SR_LOG_DEBUG("ignoring signal " << signo);
        return true;
    }
}

void ControlLoop::arm()
{
    signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        if (dispatch(signo)) arm();
        else io_.stop();
    });
}

void ControlLoop::run()
{
    arm();
    io_.run();
}

} // namespace stream_runner
