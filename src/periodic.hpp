// ────────────────────────────  periodic.hpp  (C++17)  ───────────────────────
#ifndef STREAM_RUNNER_PERIODIC_HPP
#define STREAM_RUNNER_PERIODIC_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace stream_runner {

// A background thread that runs `fn` after an initial delay and then once
// per interval until stop().  Waits are interruptible.
class PeriodicTask {
public:
    using duration = std::chrono::milliseconds;

    PeriodicTask() = default;
    ~PeriodicTask() { stop(); }

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start(duration initialDelay, duration interval, std::function<void()> fn);
    void stop();

    // Sleeps for `d`; returns false if stop() was requested meanwhile.
    bool sleep(duration d);


private:
    std::mutex              mu_;
    std::condition_variable cv_;
    bool                    quit_ = false;
    std::thread             th_;
};

} // namespace stream_runner

#endif
