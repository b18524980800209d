// ─────────────────────────────  config.hpp  (C++17)  ────────────────────────
#ifndef STREAM_RUNNER_CONFIG_HPP
#define STREAM_RUNNER_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

namespace stream_runner {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One relayed stream.  Identity is `id`; a change of either endpoint
// means the worker has to be relaunched.
struct StreamConfig {
    std::string id;
    std::string source;
    std::string destination;

    bool sameEndpoints(const StreamConfig& o) const {
        return source == o.source && destination == o.destination;
    }
};

// How the relay program is invoked; shared by all workers.
struct RelayOptions {
    std::string               program   = "ffmpeg";
    std::chrono::microseconds rwTimeout = std::chrono::microseconds(2000000);
    std::string               container = "flv";
    std::chrono::milliseconds backoff   = std::chrono::milliseconds(1000);
};

struct Settings {
    RelayOptions          relay;
    std::filesystem::path logFile  = "/var/log/stream-runner/stream.log";
    std::filesystem::path pidFile  = "/var/run/stream-runner.pid";
    std::uintmax_t        maxLogSize  = 100 * 1024 * 1024;
    unsigned              maxLogFiles = 5;
    std::chrono::seconds  rotateInterval   = std::chrono::hours(1);
    std::chrono::seconds  watchdogGrace    = std::chrono::seconds(10);
    std::chrono::seconds  watchdogInterval = std::chrono::seconds(5);
    std::string           logLevel = "info";
};

struct Config {
    Settings                  settings;
    std::vector<StreamConfig> streams;
};

constexpr const char* DEFAULT_CONFIG_PATH = "/etc/stream-runner/streams.ini";

// INI format: a [settings] section plus one section per stream, named by
// its id, with `source` and `destination` keys.  Throws ConfigError.
Config parseConfig(std::istream& in);
Config loadConfig(const std::filesystem::path& path);

} // namespace stream_runner

#endif
