// ────────────────────────────  watchdog.hpp  (C++17)  ───────────────────────
#ifndef STREAM_RUNNER_WATCHDOG_HPP
#define STREAM_RUNNER_WATCHDOG_HPP

#include "periodic.hpp"

#include <chrono>
#include <cstddef>

namespace stream_runner {

class Registry;

struct WatchdogOptions {
    std::chrono::milliseconds grace    = std::chrono::seconds(10);
    std::chrono::milliseconds interval = std::chrono::seconds(5);
    std::chrono::milliseconds settle   = std::chrono::seconds(1);
};

// ─────────────────────────────  Watchdog  ─────────────────────────────
/*
 *  Force-kills (and so reaps) every worker that is not live.  It never
 *  starts anything: the worker's own loop relaunches after its backoff.
 */
class Watchdog {
public:
    Watchdog(Registry& registry, WatchdogOptions opts = {})
        : registry_(registry), opts_(opts) {}

    void start();
    void stop();

    // One pass; returns how many workers were force-killed.
    std::size_t runOnce();

private:
    Registry&       registry_;
    WatchdogOptions opts_;
    PeriodicTask    task_;
};

} // namespace stream_runner

#endif
