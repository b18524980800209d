// ──────────────────────────  support.cpp  (C++17)  ──────────────────────────
#include "support.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>

#include <signal.h>

namespace fs = std::filesystem;

namespace test {

TempDir::TempDir()
{
    std::string tmpl = (fs::temp_directory_path() / "stream-runner-test-XXXXXX").string();
    if (!::mkdtemp(tmpl.data()))
        throw std::system_error(errno, std::generic_category(), "mkdtemp");
    path_ = tmpl;
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
}

fs::path writeStub(const TempDir& dir, const std::string& name, const std::string& body)
{
    const fs::path p = dir / name;
    {
        std::ofstream out(p);
        out << "#!/bin/sh\n" << body << "\n";
    }
    fs::permissions(p, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    return p;
}

std::string readFile(const fs::path& p)
{
    std::ifstream in(p);
    std::ostringstream os;
    os << in.rdbuf();
    return os.str();
}

bool waitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

bool processGone(pid_t pid)
{
    if (::kill(pid, 0) == -1 && errno == ESRCH) return true;
    // an orphaned zombie waits for whoever is pid 1 to reap it
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    std::string stat;
    if (!std::getline(in, stat)) return true;
    const auto paren = stat.rfind(')');
    return paren != std::string::npos && paren + 2 < stat.size() && stat[paren + 2] == 'Z';
}

pid_t readPid(const fs::path& p)
{
    pid_t pid = -1;
    waitFor([&] {
        std::ifstream in(p);
        return static_cast<bool>(in >> pid) && pid > 0;
    });
    return pid;
}

void StringSink::write(std::string_view data)
{
    std::lock_guard<std::mutex> lk(mu_);
    writes_.emplace_back(data);
}

std::vector<std::string> StringSink::writes() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return writes_;
}

std::string StringSink::text() const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::string r;
    for (auto& w : writes_) r += w;
    return r;
}

void FailingSink::write(std::string_view)
{
    throw std::system_error(EIO, std::generic_category(), "sink write failed");
}

} // namespace test
