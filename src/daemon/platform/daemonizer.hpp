#pragma once

#include <expected>
#include <string>

namespace platform {

// Double-fork into the background with a private umask and stdio on
// /dev/null. The working directory is kept for relative config paths.
// Parents exit and only the daemon returns. On error stderr is still
// attached, so the caller can report it.
std::expected<void, std::string> daemonize();

} // namespace platform
