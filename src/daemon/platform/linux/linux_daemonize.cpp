#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

std::unexpected<std::string> os_error(const char* what) {
    return std::unexpected(std::format("{} failed: {}", what, std::strerror(errno)));
}

// Returns in the child only.
std::expected<void, std::string> fork_and_leave_parent() {
    pid_t pid = fork();
    if (pid < 0) return os_error("fork()");
    if (pid > 0) _exit(0);
    return {};
}

} // namespace

std::expected<void, std::string> daemonize() {
    if (auto r = fork_and_leave_parent(); !r) return r;
    if (setsid() < 0) return os_error("setsid()");
    if (auto r = fork_and_leave_parent(); !r) return r;

    // Status, prompt and fallback files are read by hooks running as the
    // same user only.
    umask(077);

    int null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd < 0) return os_error("open(/dev/null)");
    for (int target : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        if (dup2(null_fd, target) < 0) {
            auto err = os_error("dup2()");
            close(null_fd);
            return err;
        }
    }
    if (null_fd > STDERR_FILENO) close(null_fd);
    return {};
}

} // namespace platform
