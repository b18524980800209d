// ──────────────────────────  support.hpp  (C++17)  ──────────────────────────
#ifndef STREAM_RUNNER_TESTS_SUPPORT_HPP
#define STREAM_RUNNER_TESTS_SUPPORT_HPP

#include "sink.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

namespace test {

// Removes itself recursively on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

// Writes an executable /bin/sh script.  The relay arguments arrive as
// $1..$9: -rw_timeout <us> -i <source> -c copy -f <container> <destination>
std::filesystem::path writeStub(const TempDir& dir, const std::string& name, const std::string& body);

std::string readFile(const std::filesystem::path& p);

bool waitFor(const std::function<bool()>& pred,
             std::chrono::milliseconds timeout = std::chrono::seconds(5));

// true once `pid` no longer exists or is an unreaped zombie.
bool processGone(pid_t pid);

// Reads a pid written by a stub, waiting for the file to appear.
pid_t readPid(const std::filesystem::path& p);

class StringSink : public stream_runner::Sink {
public:
    void write(std::string_view data) override;

    std::vector<std::string> writes() const;
    std::string              text() const;

private:
    mutable std::mutex       mu_;
    std::vector<std::string> writes_;
};

class FailingSink : public stream_runner::Sink {
public:
    void write(std::string_view data) override;
};

} // namespace test

#endif
