// ───────────────────────────  config.cpp  (C++17)  ──────────────────────────
#include "config.hpp"
#include "log.hpp"

#include <fstream>

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace stream_runner {

namespace pt = boost::property_tree;

namespace {

template <typename T>
T number(const pt::ptree& s, const char* key, T def)
{
    auto node = s.get_child_optional(key);
    if (!node) return def;
    auto v = node->get_value_optional<T>();
    if (!v) throw ConfigError(std::string("settings.") + key + ": not a number");
    return *v;
}

std::string required(const pt::ptree& section, const std::string& id, const char* key)
{
    auto v = section.get_optional<std::string>(key);
    if (!v) throw ConfigError("stream '" + id + "': missing '" + key + "'");
    std::string s = boost::algorithm::trim_copy(*v);
    if (s.empty()) throw ConfigError("stream '" + id + "': empty '" + key + "'");
    return s;
}

Settings readSettings(const pt::ptree& s)
{
    Settings r;
    r.relay.program   = s.get<std::string>("program", r.relay.program);
    r.relay.container = s.get<std::string>("container", r.relay.container);
    r.relay.rwTimeout = std::chrono::microseconds(
        number<long long>(s, "rw_timeout_us", r.relay.rwTimeout.count()));
    r.relay.backoff   = std::chrono::milliseconds(
        number<long long>(s, "restart_delay_ms", r.relay.backoff.count()));

    r.logFile     = s.get<std::string>("log_file", r.logFile.string());
    r.pidFile     = s.get<std::string>("pid_file", r.pidFile.string());
    r.maxLogSize  = number<std::uintmax_t>(s, "max_log_size", r.maxLogSize);
    r.maxLogFiles = number<unsigned>(s, "max_log_files", r.maxLogFiles);
    r.rotateInterval   = std::chrono::seconds(
        number<long long>(s, "rotate_interval_s", r.rotateInterval.count()));
    r.watchdogGrace    = std::chrono::seconds(
        number<long long>(s, "watchdog_grace_s", r.watchdogGrace.count()));
    r.watchdogInterval = std::chrono::seconds(
        number<long long>(s, "watchdog_interval_s", r.watchdogInterval.count()));
    r.logLevel = s.get<std::string>("log_level", r.logLevel);
    log::parseLevel(r.logLevel);

    if (r.relay.program.empty()) throw ConfigError("settings.program: empty");
    if (r.maxLogFiles < 1)       throw ConfigError("settings.max_log_files: must be >= 1");
    if (r.rotateInterval.count() <= 0 || r.watchdogInterval.count() <= 0)
        throw ConfigError("settings: intervals must be positive");
    return r;
}

} // namespace

Config parseConfig(std::istream& in)
{
    pt::ptree tree;
    try {
        pt::ini_parser::read_ini(in, tree);
    } catch (const pt::ini_parser_error& e) {
        throw ConfigError(std::string("malformed config: ") + e.what());
    }

    Config cfg;
    for (auto& [name, section] : tree) {
        if (name == "settings") {
            cfg.settings = readSettings(section);
            continue;
        }
        const std::string id = boost::algorithm::trim_copy(name);
        if (id.empty()) throw ConfigError("stream with empty id");
        if (section.empty()) throw ConfigError("'" + id + "' is not a section");
        cfg.streams.push_back({id, required(section, id, "source"),
                               required(section, id, "destination")});
    }
    return cfg;
}

Config loadConfig(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot read config " + path.string());
    return parseConfig(in);
}

} // namespace stream_runner
