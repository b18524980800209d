// ────────────────────────────  process.hpp  (C++17)  ────────────────────────
#ifndef STREAM_RUNNER_PROCESS_HPP
#define STREAM_RUNNER_PROCESS_HPP

#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <sys/types.h>

#include <boost/process/pipe.hpp>

namespace stream_runner {

struct RelayOptions;
struct StreamConfig;

// How a reaped child ended.  `error` is set when waitpid itself failed,
// e.g. ECHILD because somebody else reaped it first.
struct ExitStatus {
    int             code   = 0;
    int             signal = 0;
    bool            core   = false;
    std::error_code error;

    bool        success() const { return !error && signal == 0 && code == 0; }
    std::string describe() const;

    static ExitStatus fromWait(int status);
};

// ───────────────────────────  ProcessHandle  ──────────────────────────
/*
 *  Owned handle of one launched relay and its process group.  Worker::
 *  forceKill() is the only place that composes these.  reap() blocks until
 *  the child is gone and takes the rest of its process group with it; it is
 *  safe to call from several threads and only the first call actually
 *  waits, the others get the cached status.  After reap() both terminate
 *  calls fail with ESRCH.
 */
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    virtual pid_t           pid() const = 0;
    virtual std::error_code terminateGroup() = 0;
    virtual std::error_code terminateDirect() = 0;
    virtual ExitStatus      reap() = 0;
};

struct LaunchedChild {
    std::shared_ptr<ProcessHandle> handle;
    boost::process::pipe           out;
    boost::process::pipe           err;
};

class Launcher {
public:
    virtual ~Launcher() = default;

    // argv[0] is the program.  Throws std::system_error (pipe creation,
    // program lookup, fork/exec) on failure.
    virtual LaunchedChild launch(const std::vector<std::string>& argv) = 0;
};

// Boost.Process launcher: own process group, stdin from /dev/null,
// close-on-exec capture pipes.
class ChildLauncher : public Launcher {
public:
    LaunchedChild launch(const std::vector<std::string>& argv) override;
};

// <program> -rw_timeout <us> -i <source> -c copy -f <container> <destination>
std::vector<std::string> relayArguments(const RelayOptions& opts, const StreamConfig& cfg);

// Runs `<program> -version` and returns the first line it prints.
// Throws std::runtime_error if the program cannot be found or run.
std::string checkRelayProgram(const std::string& program);

} // namespace stream_runner

#endif
