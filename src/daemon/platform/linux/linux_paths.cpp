#include "platform/platform_paths.hpp"

#include <climits>
#include <cstdlib>
#include <unistd.h>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/session-relay";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/session-relay";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/session-relay";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/session-relay";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/session-relay.sock";
    return "/tmp/session-relay.sock";
}

std::string host_name() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') return "unknown-host";
    return buf;
}

} // namespace platform
