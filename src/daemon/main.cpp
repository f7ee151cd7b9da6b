#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/platform_paths.hpp"

#include <print>
#include <string>

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;
    std::string role;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--role" || arg == "-r") {
            if (i + 1 < argc) role = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: session-relay [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -r, --role ROLE     source, remote or both (overrides config)");
            std::println("  -h, --help          Show this help");
            return 0;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!role.empty()) config.role = role;

    auto problems = config.validate();
    if (!problems.empty()) {
        for (auto& p : problems) std::println(stderr, "[session-relay] config: {}", p);
        return 1;
    }

    std::string device_name = config.device_name.empty() ? platform::host_name() : config.device_name;

    if (!foreground) {
        if (auto daemon = platform::daemonize(); !daemon) {
            std::println(stderr, "[session-relay] cannot run in the background: {}", daemon.error());
            return 1;
        }
    }

    if (verbose && foreground) {
        std::println(stderr, "[session-relay] Starting as {} (role: {}, store: {})", device_name,
                     config.role, config.store.type);
    }

    LinuxEventLoop loop(std::move(config), std::move(device_name), verbose);
    if (!loop.init()) {
        std::println(stderr, "[session-relay] Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
