// ──────────────────────────  watchdog.cpp  (C++17)  ─────────────────────────
#include "watchdog.hpp"
#include "log.hpp"
#include "registry.hpp"
#include "worker.hpp"

namespace stream_runner {

void Watchdog::start()
{
    task_.start(opts_.grace, opts_.interval, [this]{ runOnce(); });
}

void Watchdog::stop()
{
    task_.stop();
}

std::size_t Watchdog::runOnce()
{
    std::size_t n = 0;
    for (auto& w : registry_.snapshot()) {
        if (w->isRunning()) continue;
        SR_LOG_WARN("[" << w->id() << "] worker not running (" << w->status() << "), force kill");
        w->forceKill();
        ++n;
        if (!task_.sleep(opts_.settle)) break;
    }
    return n;
}

} // namespace stream_runner
