// ────────────────────────────  log.cpp  (C++17)  ────────────────────────────
#include "log.hpp"
#include "config.hpp"
#include "sink.hpp"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <system_error>

#include <boost/algorithm/string.hpp>

namespace stream_runner {
namespace log {

namespace {
std::atomic<Level> LEVEL{Level::info};
}

void setLevel(Level l) { LEVEL = l; }
bool enabled(Level l) { return static_cast<int>(l) >= static_cast<int>(LEVEL.load()); }

const char* levelName(Level l)
{
    switch (l) {
    case Level::debug: return "DEBUG";
    case Level::info:  return "INFO";
    case Level::warn:  return "WARN";
    case Level::error: return "ERROR";
    }
    return "?";
}

Level parseLevel(const std::string& name)
{
    const std::string n = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    if (n == "debug") return Level::debug;
    if (n == "info")  return Level::info;
    if (n == "warn" || n == "warning") return Level::warn;
    if (n == "error") return Level::error;
    throw ConfigError("unknown log level '" + name + "'");
}

LogFile& output()
{
    static LogFile file;
    return file;
}

std::string timestamp(std::chrono::system_clock::time_point t)
{
    const std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    ::localtime_r(&tt, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return os.str();
}

void write(Level l, std::string_view msg)
{
    std::string line;
    line.reserve(msg.size() + 32);
    line += '[';
    line += timestamp();
    line += "] ";
    line += levelName(l);
    line += ' ';
    line += msg;
    line += '\n';
    try {
        output().write(line);
    } catch (const std::system_error& e) {
        std::cerr << line << "[log] write failed: " << e.what() << '\n';
    }
}

} // namespace log
} // namespace stream_runner
