// ──────────────────────────────  log.hpp  (C++17)  ──────────────────────────
#ifndef STREAM_RUNNER_LOG_HPP
#define STREAM_RUNNER_LOG_HPP

#include <chrono>
#include <sstream>
#include <string>
#include <string_view>

namespace stream_runner {

class LogFile;

namespace log {

enum class Level { debug, info, warn, error };

void setLevel(Level l);
bool enabled(Level l);

// Throws ConfigError for anything but debug|info|warn|error.
Level parseLevel(const std::string& name);
const char* levelName(Level l);

// The process log sink; LogRotator reopens it after a rotation.
LogFile& output();

void write(Level l, std::string_view msg);

// "YYYY-MM-DD HH:MM:SS", local time, second precision.
std::string timestamp(std::chrono::system_clock::time_point t = std::chrono::system_clock::now());

} // namespace log
} // namespace stream_runner

#define SR_LOG(lvl, msg)                                                 \
    do {                                                                 \
        if (::stream_runner::log::enabled(lvl)) {                        \
            std::ostringstream sr_os_;                                   \
            sr_os_ << msg;                                               \
            ::stream_runner::log::write(lvl, sr_os_.str());              \
        }                                                                \
    } while (0)

#define SR_LOG_DEBUG(msg) SR_LOG(::stream_runner::log::Level::debug, msg)
#define SR_LOG_INFO(msg)  SR_LOG(::stream_runner::log::Level::info,  msg)
#define SR_LOG_WARN(msg)  SR_LOG(::stream_runner::log::Level::warn,  msg)
#define SR_LOG_ERROR(msg) SR_LOG(::stream_runner::log::Level::error, msg)

#endif
