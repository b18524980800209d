// ────────────────────────────  pid_file.hpp  (C++17)  ───────────────────────
#ifndef STREAM_RUNNER_PID_FILE_HPP
#define STREAM_RUNNER_PID_FILE_HPP

#include <filesystem>

namespace stream_runner {

// Writes "<pid>\n" on construction (creating the directory), removes the
// file on release() or destruction.  Throws std::system_error.
class PidFile {
public:
    explicit PidFile(std::filesystem::path path);
    ~PidFile();

    PidFile(const PidFile&) = delete;
    PidFile& operator=(const PidFile&) = delete;

    void release();

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    bool                  held_ = false;
};

} // namespace stream_runner

#endif
