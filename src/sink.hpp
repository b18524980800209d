// ─────────────────────────────  sink.hpp  (C++17)  ──────────────────────────
#ifndef STREAM_RUNNER_SINK_HPP
#define STREAM_RUNNER_SINK_HPP

#include <filesystem>
#include <mutex>
#include <string_view>

namespace stream_runner {

// Line-oriented byte sink. write() throws std::system_error on failure.
class Sink {
public:
    virtual ~Sink() = default;
    virtual void write(std::string_view data) = 0;
};

// ─────────────────────────────  LogFile  ────────────────────────────────
/*
 *  The process-wide "current log sink" cell.  Every write takes the same
 *  mutex as reopen(), so a rotation can swap the descriptor underneath
 *  running writers without any of them seeing a half-swapped handle.
 *  Until open() succeeds everything goes to stderr.
 */
class LogFile : public Sink {
public:
    LogFile() = default;
    ~LogFile() override;

    LogFile(const LogFile&) = delete;
    LogFile& operator=(const LogFile&) = delete;

    void open(const std::filesystem::path& path);
    void reopen();
    void close();

    void write(std::string_view data) override;

    bool isOpen() const;

private:
    static int openAppend(const std::filesystem::path& path);

    mutable std::mutex mu_;
    std::filesystem::path path_;
    int fd_ = -1;
};

// Writes everything in `data` to `fd`, retrying on EINTR and short writes.
void writeAll(int fd, std::string_view data);

} // namespace stream_runner

#endif
