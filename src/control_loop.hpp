// ──────────────────────────  control_loop.hpp  (C++17)  ─────────────────────
#ifndef STREAM_RUNNER_CONTROL_LOOP_HPP
#define STREAM_RUNNER_CONTROL_LOOP_HPP

#include "config.hpp"

#include <functional>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

namespace stream_runner {

class PidFile;
class Reconciler;
class Registry;

// ────────────────────────────  ControlLoop  ───────────────────────────
/*
 *  SIGHUP reloads the stream set, SIGINT/SIGTERM shut everything down.
 *  The signal_set is armed on construction so nothing delivered during
 *  startup falls through to the default action.
 */
class ControlLoop {
public:
    using Loader = std::function<std::vector<StreamConfig>()>;

    ControlLoop(Registry& registry, Reconciler& reconciler, Loader loader,
                PidFile* pidFile = nullptr);

    // Startup reconcile; ConfigError propagates and nothing is started.
    void loadInitial();

    // false if loading failed; the running set is then left untouched.
    bool reload();

    // Stop every worker, empty the registry, drop the pid file.
    void shutdown();

    // Returns false once the loop should end.
    bool dispatch(int signo);

    // Blocks until SIGINT or SIGTERM has been handled.
    void run();

private:
    void arm();

    Registry&   registry_;
    Reconciler& reconciler_;
    Loader      loader_;
    PidFile*    pidFile_;

    boost::asio::io_context io_;
    boost::asio::signal_set signals_;
};

} // namespace stream_runner

#endif
