#include "platform/client_paths.hpp"

#include <cstdlib>

namespace platform {

std::string default_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/session-relay.sock";
    return "/tmp/session-relay.sock";
}

} // namespace platform
