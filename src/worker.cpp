// ───────────────────────────  worker.cpp  (C++17)  ──────────────────────────
#include "worker.hpp"
#include "line_writer.hpp"
#include "log.hpp"

#include <cerrno>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include <poll.h>

namespace stream_runner {

// ───────────────────────────  constants  ────────────────────────────
static constexpr int CAPTURE_POLL_MS = 100;
static constexpr int DRAIN_MS        = 500;

const char* stateName(Worker::State s)
{
    switch (s) {
    case Worker::State::idle:     return "idle";
    case Worker::State::starting: return "starting";
    case Worker::State::running:  return "running";
    case Worker::State::backoff:  return "backoff";
    case Worker::State::stopped:  return "stopped";
    }
    return "?";
}

Worker::Worker(StreamConfig cfg, RelayOptions opts, Launcher& launcher, Sink& sink)
    : id_(cfg.id), opts_(std::move(opts)), launcher_(launcher), sink_(sink),
      cfg_(std::move(cfg)) {}

Worker::~Worker()
{
    stop();
}

void Worker::start()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (thread_.joinable()) return;
    stopping_ = false;
    thread_ = std::thread(&Worker::run, this);
    state_  = State::starting;
    ++starts;
}

void Worker::stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopping_ = true;
    }
    cv_.notify_all();
    forceKill();
    if (thread_.joinable()) thread_.join();

    std::lock_guard<std::mutex> lk(mu_);
    state_ = State::stopped;
}

void Worker::forceKill()
{
    std::lock_guard<std::mutex> lk(mu_);
    ++kills;
    if (!child_) {
        alive_ = false;
        return;
    }

    const pid_t pid = child_->pid();
    SR_LOG_INFO("[" << id_ << "] force killing process group " << pid);
    if (auto ec = child_->terminateGroup()) {
        SR_LOG_WARN("[" << id_ << "] group kill failed (" << ec.message() << "), trying direct kill");
        if (auto ec2 = child_->terminateDirect())
            SR_LOG_WARN("[" << id_ << "] direct kill also failed: " << ec2.message());
    }

    const ExitStatus st = child_->reap();
    if (st.error && st.error != std::errc::no_child_process)
        SR_LOG_WARN("[" << id_ << "] reap of pid " << pid << " failed: " << st.error.message());

    child_.reset();
    alive_ = false;
}

bool Worker::isRunning() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return alive_;
}

void Worker::reconfigure(StreamConfig cfg)
{
    if (cfg.id != id_)
        throw std::invalid_argument("worker '" + id_ + "' cannot be renamed to '" + cfg.id + "'");
    std::lock_guard<std::mutex> lk(mu_);
    if (thread_.joinable())
        throw std::logic_error("worker '" + id_ + "' reconfigured while running");
    cfg_ = std::move(cfg);
}

StreamConfig Worker::config() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return cfg_;
}

Worker::State Worker::state() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

std::string Worker::status() const
{
    return stateName(state());
}

pid_t Worker::pid() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return child_ ? child_->pid() : -1;
}

std::optional<ExitStatus> Worker::lastExit() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return lastExit_;
}

void Worker::backoff(std::unique_lock<std::mutex>& lk)
{
    if (stopping_) return;
    state_ = State::backoff;
    cv_.wait_for(lk, opts_.backoff, [this]{ return stopping_; });
}

void Worker::pump(boost::process::pipe& pipe, LineTimestampWriter& writer, const char* which,
                  const std::atomic_bool& exited)
{
    using clock = std::chrono::steady_clock;
    std::optional<clock::time_point> deadline;
    char buf[4096];
    try {
        for (;;) {
            // A descendant that left the group may hold the write end open
            // forever; after the exit only drain for a bounded time.
            if (exited && !deadline) deadline = clock::now() + std::chrono::milliseconds(DRAIN_MS);
            if (deadline && clock::now() >= *deadline) {
                SR_LOG_WARN("[" << id_ << "] " << which << " still open after exit, closing it");
                break;
            }

            pollfd pfd{pipe.native_source(), POLLIN, 0};
            const int r = ::poll(&pfd, 1, CAPTURE_POLL_MS);
            if (r == -1) {
                if (errno == EINTR) continue;
                throw std::system_error(errno, std::generic_category(), "poll");
            }
            if (r == 0) continue;

            const int n = pipe.read(buf, static_cast<int>(sizeof buf));
            if (n <= 0) break;
            writer.write(std::string_view(buf, static_cast<std::size_t>(n)));
        }
    } catch (const std::system_error& e) {
        SR_LOG_WARN("[" << id_ << "] failed to copy " << which << ": " << e.what());
    }
    pipe.close();
}

void Worker::run()
{
    std::unique_lock<std::mutex> lk(mu_);
    while (!stopping_) {
        state_ = State::starting;

        // Launch under the lock: stop() either sees the new child or we
        // see stopping_ first.
        std::optional<LaunchedChild> child;
        try {
            child.emplace(launcher_.launch(relayArguments(opts_, cfg_)));
        } catch (const std::exception& e) {
            SR_LOG_ERROR("[" << id_ << "] failed to start relay: " << e.what());
            backoff(lk);
            continue;
        }

        auto handle = child->handle;
        child_ = handle;
        alive_ = true;
        state_ = State::running;
        ++launches;
        SR_LOG_INFO("[" << id_ << "] relay started, pid " << handle->pid());
        lk.unlock();

        LineTimestampWriter outW(id_, sink_), errW(id_, sink_);
        std::atomic_bool exited{false};
        std::thread thOut, thErr;
        try {
            thOut = std::thread(&Worker::pump, this, std::ref(child->out), std::ref(outW), "stdout",
                                std::cref(exited));
            thErr = std::thread(&Worker::pump, this, std::ref(child->err), std::ref(errW), "stderr",
                                std::cref(exited));
        } catch (const std::system_error& e) {
            SR_LOG_ERROR("[" << id_ << "] cannot start output capture: " << e.what());
            if (auto ec = handle->terminateGroup())
                SR_LOG_WARN("[" << id_ << "] group kill failed: " << ec.message());
        }

        const ExitStatus st = handle->reap();
        exited = true;
        if (thOut.joinable()) thOut.join();
        if (thErr.joinable()) thErr.join();

        lk.lock();
        if (child_ == handle) child_.reset();   // forceKill() may have beaten us
        alive_    = false;
        lastExit_ = st;
        handle.reset();
        child.reset();

        if (!st.success())
            SR_LOG_ERROR("[" << id_ << "] relay " << st.describe());
        else
            SR_LOG_INFO("[" << id_ << "] relay " << st.describe());
        if (!stopping_)
            SR_LOG_INFO("[" << id_ << "] stream ended, retry in " << opts_.backoff.count() << "ms");
        backoff(lk);
    }
    state_ = State::stopped;
}

} // namespace stream_runner
