// ──────────────────────────  pid_file.cpp  (C++17)  ─────────────────────────
#include "pid_file.hpp"
#include "log.hpp"
#include "sink.hpp"

#include <cerrno>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace stream_runner {

namespace fs = std::filesystem;

PidFile::PidFile(fs::path path)
    : path_(std::move(path))
{
    if (path_.has_parent_path()) fs::create_directories(path_.parent_path());

    const int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
        throw std::system_error(errno, std::generic_category(), "cannot write pid file " + path_.string());
    try {
        writeAll(fd, std::to_string(::getpid()) + "\n");
    } catch (...) {
        ::close(fd);
        ::unlink(path_.c_str());
        throw;
    }
    if (::close(fd) < 0)
        SR_LOG_WARN("failed to close pid file: " << std::generic_category().message(errno));
    held_ = true;
}

PidFile::~PidFile()
{
    release();
}

void PidFile::release()
{
    if (!held_) return;
    held_ = false;
    std::error_code ec;
    if (!fs::remove(path_, ec) && ec)
        SR_LOG_WARN("failed to remove pid file " << path_.string() << ": " << ec.message());
}

} // namespace stream_runner
