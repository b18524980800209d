// ──────────────────────────  periodic.cpp  (C++17)  ─────────────────────────
#include "periodic.hpp"

namespace stream_runner {

void PeriodicTask::start(duration initialDelay, duration interval, std::function<void()> fn)
{
    if (th_.joinable()) return;
    {
        std::lock_guard<std::mutex> lk(mu_);
        quit_ = false;
    }
    th_ = std::thread([this, initialDelay, interval, fn = std::move(fn)] {
        if (!sleep(initialDelay)) return;
        do {
            fn();
        } while (sleep(interval));
    });
}

void PeriodicTask::stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        quit_ = true;
    }
    cv_.notify_all();
    if (th_.joinable()) th_.join();
}

bool PeriodicTask::sleep(duration d)
{
    std::unique_lock<std::mutex> lk(mu_);
    return !cv_.wait_for(lk, d, [this]{ return quit_; });
}

} // namespace stream_runner
