#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <filesystem>
#include <print>

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::println(stderr, "{} requires a path", arg);
                return 1;
            }
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: i3pm-daemon [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path (re-read on SIGHUP)");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {} (see --help)", arg);
            return 1;
        }
    }

    // The daemon changes to / once detached.
    if (!config_path.empty()) {
        std::error_code ec;
        auto abs = std::filesystem::absolute(config_path, ec);
        if (!ec) config_path = abs.string();
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    int ready_fd = -1;
    if (!foreground) {
        ready_fd = platform::daemonize();
    }

    if (verbose && foreground) {
        std::println(stderr, "[i3pm] Starting ({} rules, mark prefix '{}')", config.rules.size(),
                     config.marks.prefix);
    }

    LinuxEventLoop loop(std::move(config), config_path, verbose);
    bool started = loop.init();
    if (!started) {
        std::println(stderr, "Failed to initialize event loop");
    }
    if (ready_fd >= 0) platform::notify_ready(ready_fd, started);
    if (!started) return 1;

    loop.run();
    return 0;
}
