// ──────────────────────────  log_rotator.hpp  (C++17)  ──────────────────────
#ifndef STREAM_RUNNER_LOG_ROTATOR_HPP
#define STREAM_RUNNER_LOG_ROTATOR_HPP

#include "periodic.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>

namespace stream_runner {

class LogFile;

struct RotationPolicy {
    std::filesystem::path path;
    std::uintmax_t        maxSize  = 100 * 1024 * 1024;
    unsigned              maxFiles = 5;
};

// `name.i` for generation i.
std::filesystem::path generationPath(const std::filesystem::path& path, unsigned i);

// If `policy.path` is at least maxSize bytes: name.(N-1) -> name.N, ...,
// name.1 -> name.2, name -> name.1.  Returns whether it rotated.
// Throws std::filesystem::filesystem_error.
bool rotateLog(const RotationPolicy& policy);

// ────────────────────────────  LogRotator  ────────────────────────────
class LogRotator {
public:
    LogRotator(RotationPolicy policy, LogFile& file,
               std::chrono::milliseconds interval = std::chrono::hours(1))
        : policy_(std::move(policy)), file_(file), interval_(interval) {}

    void start();
    void stop();

    // Rotates if needed and re-points `file` when the primary path was
    // rotated away or has vanished.  Failures are logged, never thrown.
    bool checkOnce();

private:
    RotationPolicy            policy_;
    LogFile&                  file_;
    std::chrono::milliseconds interval_;
    PeriodicTask              task_;
};

} // namespace stream_runner

#endif
