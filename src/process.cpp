// ──────────────────────────  process.cpp  (C++17)  ──────────────────────────
#include "process.hpp"
#include "config.hpp"
#include "log.hpp"

#include <atomic>
#include <cerrno>
#include <mutex>
#include <stdexcept>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>

#include <boost/algorithm/string.hpp>
#include <boost/process.hpp>

namespace stream_runner {

namespace bp = boost::process;

ExitStatus ExitStatus::fromWait(int status)
{
    ExitStatus r;
    if (WIFSIGNALED(status)) {
        r.signal = WTERMSIG(status);
        r.core   = WCOREDUMP(status);
    } else if (WIFEXITED(status)) {
        r.code = WEXITSTATUS(status);
    }
    return r;
}

std::string ExitStatus::describe() const
{
    if (error)      return "wait failed: " + error.message();
    if (signal)     return "died from signal " + std::to_string(signal) + (core ? " (core dumped)" : "");
    if (code == 0)  return "exited with success";
    return "exited with status " + std::to_string(code);
}

// ────────────────────────────  ChildHandle  ───────────────────────────
namespace {

class ChildHandle final : public ProcessHandle {
public:
    ChildHandle(const boost::filesystem::path& exe, const std::vector<std::string>& args,
                bp::pipe& out, bp::pipe& err)
        : child_(bp::exe = exe, bp::args = args,
                 bp::std_out > out, bp::std_err > err, bp::std_in < bp::null,
                 group_),
          pid_(child_.id()) {}

    pid_t pid() const override { return pid_; }

    // Both refuse once the leader is reaped: its pid and pgid may have been
    // handed to another process since.
    std::error_code terminateGroup() override {
        std::lock_guard<std::mutex> lk(killMu_);
        if (reaped_ || !group_.valid()) return std::make_error_code(std::errc::no_such_process);
        std::error_code ec;
        group_.terminate(ec);                   // killpg(SIGKILL)
        return ec;
    }

    std::error_code terminateDirect() override {
        std::lock_guard<std::mutex> lk(killMu_);
        if (reaped_) return std::make_error_code(std::errc::no_such_process);
        if (::kill(pid_, SIGKILL) == -1)
            return std::error_code(errno, std::generic_category());
        return {};
    }

    // Waits for the leader without reaping it, kills whatever is left of
    // its group while the zombie still pins the pgid, then collects it.
    ExitStatus reap() override {
        std::lock_guard<std::mutex> lk(reapMu_);
        if (reaped_) return status_;

        siginfo_t info{};
        int rc;
        while ((rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT)) == -1
               && errno == EINTR) {}
        const std::error_code waitErr = rc == -1 ? std::error_code(errno, std::generic_category())
                                                 : std::error_code();

        std::lock_guard<std::mutex> klk(killMu_);
        if (!waitErr && group_.valid()) {
            std::error_code ec;
            group_.terminate(ec);
            if (ec && ec != std::errc::no_such_process)
                SR_LOG_WARN("killpg(" << pid_ << ") after exit failed: " << ec.message());
        }
        group_.detach();

        if (waitErr) {
            status_.error = waitErr;
        } else {
            std::error_code ec;
            child_.wait(ec);
            if (ec) status_.error = ec;
            else    status_ = ExitStatus::fromWait(child_.native_exit_code());
        }
        reaped_ = true;
        return status_;
    }

private:
    bp::group  group_;
    bp::child  child_;
    const pid_t pid_;

    std::mutex        killMu_, reapMu_;
    std::atomic_bool  reaped_{false};
    ExitStatus        status_;
};

void setCloexec(int fd)
{
    if (fd >= 0 && ::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1)
        throw std::system_error(errno, std::generic_category(), "fcntl(FD_CLOEXEC) failed");
}

boost::filesystem::path resolveProgram(const std::string& program)
{
    if (program.find('/') != std::string::npos) return program;
    auto p = bp::search_path(program);
    if (p.empty())
        throw std::system_error(ENOENT, std::generic_category(), "program '" + program + "' not found");
    return p;
}

} // namespace

LaunchedChild ChildLauncher::launch(const std::vector<std::string>& argv)
{
    if (argv.empty()) throw std::invalid_argument("empty argument vector");

    // Pipes are created and flagged close-on-exec before any other thread
    // can fork, so a relay never inherits another worker's pipe ends.
    static std::mutex launchMu;
    std::lock_guard<std::mutex> lk(launchMu);

    LaunchedChild c;
    for (bp::pipe* p : {&c.out, &c.err}) {
        setCloexec(p->native_source());
        setCloexec(p->native_sink());
    }
    c.handle = std::make_shared<ChildHandle>(resolveProgram(argv.front()),
                                             std::vector<std::string>(argv.begin() + 1, argv.end()),
                                             c.out, c.err);
    return c;
}

std::vector<std::string> relayArguments(const RelayOptions& opts, const StreamConfig& cfg)
{
    return {opts.program,
            "-rw_timeout", std::to_string(opts.rwTimeout.count()),
            "-i", cfg.source,
            "-c", "copy",
            "-f", opts.container,
            cfg.destination};
}

std::string checkRelayProgram(const std::string& program)
{
    std::string first, line;
    int rc = 0;
    try {
        bp::ipstream is;
        bp::child c(bp::exe = resolveProgram(program), bp::args = std::vector<std::string>{"-version"},
                    bp::std_out > is, bp::std_err > bp::null, bp::std_in < bp::null);
        while (std::getline(is, line)) if (first.empty()) first = line;
        c.wait();
        rc = c.exit_code();
    } catch (const std::system_error& e) {
        throw std::runtime_error(program + " not found or not executable: " + e.what());
    }
    if (rc != 0)
        throw std::runtime_error(program + " -version exited with status " + std::to_string(rc));
    boost::algorithm::trim(first);
    return first;
}

} // namespace stream_runner
