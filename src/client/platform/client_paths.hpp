#pragma once

#include <string>

namespace platform {

// Socket the daemon listens on; matches the daemon's ipc_endpoint().
std::string default_endpoint();

} // namespace platform
