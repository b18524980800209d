// ─────────────────────────────  worker.hpp  (C++17)  ────────────────────────
#ifndef STREAM_RUNNER_WORKER_HPP
#define STREAM_RUNNER_WORKER_HPP

#include "config.hpp"
#include "process.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace stream_runner {

class LineTimestampWriter;
class Sink;

// ──────────────────────────────  Worker  ──────────────────────────────
/*
 *  Supervises one relay: launch, capture stdout/stderr through two
 *  LineTimestampWriters, reap, back off, launch again, until stop().
 *
 *  start()/stop()/reconfigure() are driven by one controlling thread at a
 *  time (the Reconciler or ControlLoop, under the Registry's exclusive
 *  lock).  forceKill() and isRunning() may be called from anywhere.
 */
class Worker {
public:
    enum class State { idle, starting, running, backoff, stopped };

    Worker(StreamConfig cfg, RelayOptions opts, Launcher& launcher, Sink& sink);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Spawns the supervision thread; no-op if it is already running.
    void start();

    // Teardown: no further launches, kill the child, join the thread.
    void stop();

    // SIGKILL the process group (falling back to the pid) and reap.
    // Leaves the supervision loop alone, so it relaunches after backoff.
    void forceKill();

    bool isRunning() const;

    // Only valid while stopped; the id must not change.
    void reconfigure(StreamConfig cfg);

    const std::string&        id() const { return id_; }
    StreamConfig              config() const;
    State                     state() const;
    std::string               status() const;
    pid_t                     pid() const;
    std::optional<ExitStatus> lastExit() const;

    std::atomic_uint32_t starts{0}, launches{0}, kills{0};

private:
    void run();
    void backoff(std::unique_lock<std::mutex>& lk);
    void pump(boost::process::pipe& pipe, LineTimestampWriter& writer, const char* which,
              const std::atomic_bool& exited);

    const std::string  id_;
    const RelayOptions opts_;
    Launcher&          launcher_;
    Sink&              sink_;

    mutable std::mutex             mu_;
    std::condition_variable        cv_;
    StreamConfig                   cfg_;
    std::shared_ptr<ProcessHandle> child_;
    bool                           alive_    = false;
    bool                           stopping_ = false;
    State                          state_    = State::idle;
    std::optional<ExitStatus>      lastExit_;
    std::thread                    thread_;
};

const char* stateName(Worker::State s);

} // namespace stream_runner

#endif
