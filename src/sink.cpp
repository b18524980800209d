// ────────────────────────────  sink.cpp  (C++17)  ───────────────────────────
#include "sink.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace stream_runner {

void writeAll(int fd, std::string_view data)
{
    while (!data.empty()) {
        const ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "write failed");
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
}

LogFile::~LogFile()
{
    close();
}

int LogFile::openAppend(const std::filesystem::path& path)
{
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0)
        throw std::system_error(errno, std::generic_category(),
                                "cannot open log file " + path.string());
    return fd;
}

void LogFile::open(const std::filesystem::path& path)
{
    const int fd = openAppend(path);
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) ::close(fd_);
    fd_   = fd;
    path_ = path;
}

void LogFile::reopen()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (path_.empty()) return;
    const int fd = openAppend(path_);
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
}

void LogFile::close()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
}

void LogFile::write(std::string_view data)
{
    std::lock_guard<std::mutex> lk(mu_);
    writeAll(fd_ >= 0 ? fd_ : STDERR_FILENO, data);
}

bool LogFile::isOpen() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return fd_ >= 0;
}

} // namespace stream_runner
