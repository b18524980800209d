// ──────────────────────────────  main.cpp  (C++17)  ─────────────────────────
/*
 *  stream-runner: keeps one relay process per configured stream alive,
 *  restarting it when it dies.  SIGHUP reloads the stream list,
 *  SIGINT/SIGTERM stop everything.
 */
#include "config.hpp"
#include "control_loop.hpp"
#include "log.hpp"
#include "log_rotator.hpp"
#include "pid_file.hpp"
#include "process.hpp"
#include "reconciler.hpp"
#include "registry.hpp"
#include "sink.hpp"
#include "watchdog.hpp"

#include <filesystem>
#include <iostream>
#include <memory>

#include <boost/program_options.hpp>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace stream_runner;

int main(int argc, char* argv[]) {
    namespace po = boost::program_options;
    try {
        po::options_description desc("stream-runner options");
        desc.add_options()
          ("config",   po::value<std::string>()->default_value(DEFAULT_CONFIG_PATH), "ini config")
          ("log-file", po::value<std::string>(), "override settings.log_file")
          ("pid-file", po::value<std::string>(), "override settings.pid_file")
          ("check",    po::bool_switch(), "validate the config, list streams and exit")
          ("debug",    po::bool_switch(), "debug logging")
          ("help", "help");
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) { std::cout << desc; return 0; }
        po::notify(vm);

        const fs::path configPath = vm["config"].as<std::string>();
        Config cfg = loadConfig(configPath);
        Settings& st = cfg.settings;
        if (vm.count("log-file")) st.logFile = vm["log-file"].as<std::string>();
        if (vm.count("pid-file")) st.pidFile = vm["pid-file"].as<std::string>();
        log::setLevel(vm["debug"].as<bool>() ? log::Level::debug : log::parseLevel(st.logLevel));

        if (vm["check"].as<bool>()) {
            for (auto& s : cfg.streams)
                std::cout << s.id << ": " << s.source << " -> " << s.destination << "\n";
            return 0;
        }

        std::cerr << "[*] relay detected: " << checkRelayProgram(st.relay.program) << "\n";

        // rotate before the log file is opened
        if (st.logFile.has_parent_path()) fs::create_directories(st.logFile.parent_path());
        RotationPolicy policy{st.logFile, st.maxLogSize, st.maxLogFiles};
        try {
            rotateLog(policy);
        } catch (const fs::filesystem_error& e) {
            std::cerr << "[!] log rotation failed: " << e.what() << "\n";
        }
        LogFile& logFile = log::output();
        logFile.open(st.logFile);

        PidFile pid(st.pidFile);
        SR_LOG_INFO("stream-runner starting, pid " << ::getpid());

        ChildLauncher launcher;
        Registry      registry;
        Reconciler    reconciler(registry, st.relay, launcher, logFile);
        ControlLoop   control(registry, reconciler,
                              [&]{ return loadConfig(configPath).streams; }, &pid);

        control.loadInitial();

        WatchdogOptions wd;
        wd.grace    = st.watchdogGrace;
        wd.interval = st.watchdogInterval;
        Watchdog   watchdog(registry, wd);
        LogRotator rotator(policy, logFile, st.rotateInterval);
        watchdog.start();
        rotator.start();

        control.run();

        watchdog.stop();
        rotator.stop();
        SR_LOG_INFO("stream-runner stopped");
    }
    catch (const std::exception& e) {
        if (log::output().isOpen()) SR_LOG_ERROR("Fatal: " << e.what());
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
