// ────────────────────────  log_rotator.cpp  (C++17)  ────────────────────────
#include "log_rotator.hpp"
#include "log.hpp"
#include "sink.hpp"

#include <system_error>

namespace stream_runner {

namespace fs = std::filesystem;

fs::path generationPath(const fs::path& path, unsigned i)
{
    return fs::path(path.string() + "." + std::to_string(i));
}

bool rotateLog(const RotationPolicy& policy)
{
    std::error_code ec;
    const auto size = fs::file_size(policy.path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) return false;
        throw fs::filesystem_error("cannot stat log file", policy.path, ec);
    }
    if (size < policy.maxSize) return false;

    for (unsigned i = policy.maxFiles; i-- > 1;) {
        const auto from = generationPath(policy.path, i);
        if (fs::exists(from)) fs::rename(from, generationPath(policy.path, i + 1));
    }
    fs::rename(policy.path, generationPath(policy.path, 1));
    return true;
}

void LogRotator::start()
{
    task_.start(interval_, interval_, [this]{ checkOnce(); });
}

void LogRotator::stop()
{
    task_.stop();
}

bool LogRotator::checkOnce()
{
    bool rotated = false;
    try {
        rotated = rotateLog(policy_);
    } catch (const fs::filesystem_error& e) {
        SR_LOG_ERROR("log rotation check failed: " << e.what());
        return false;
    }

    std::error_code ec;
    if (rotated || !fs::exists(policy_.path, ec)) {
        try {
            file_.reopen();
        } catch (const std::system_error& e) {
            SR_LOG_ERROR("cannot reopen log file after rotation: " << e.what());
            return rotated;
        }
        if (rotated) SR_LOG_INFO("log file rotated: " << policy_.path.string());
    }
    return rotated;
}

} // namespace stream_runner
