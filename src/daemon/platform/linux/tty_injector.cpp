#include "platform/linux/tty_injector.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {

InjectError from_errno(const std::string& what, int err) {
    auto kind = (err == EPERM || err == EACCES) ? InjectError::Kind::CapabilityDenied
                                                : InjectError::Kind::Failed;
    return InjectError{kind, what + ": " + std::strerror(err)};
}

} // namespace

TtyInjector::TtyInjector(bool submit) : submit_(submit) {}

std::expected<void, InjectError> TtyInjector::inject(const std::string& text,
                                                     std::optional<int> pid) {
    if (!pid) {
        return std::unexpected(
            InjectError{InjectError::Kind::Failed, "session has no process to type into"});
    }

    auto path = "/proc/" + std::to_string(*pid) + "/fd/0";
    int fd = ::open(path.c_str(), O_WRONLY | O_NOCTTY | O_CLOEXEC);
    if (fd < 0) return std::unexpected(from_errno("open " + path, errno));

    if (!::isatty(fd)) {
        ::close(fd);
        return std::unexpected(
            InjectError{InjectError::Kind::Failed, path + " is not a terminal"});
    }

    auto push = [fd](char c) { return ::ioctl(fd, TIOCSTI, &c) == 0; };

    for (char c : text) {
        if (!push(c)) {
            int err = errno;
            ::close(fd);
            return std::unexpected(from_errno("TIOCSTI", err));
        }
    }
    if (submit_ && !push('\r')) {
        int err = errno;
        ::close(fd);
        return std::unexpected(from_errno("TIOCSTI", err));
    }

    ::close(fd);
    return {};
}

std::string_view TtyInjector::remediation() const {
    return "Terminal injection is blocked. Enable it once with "
           "`sysctl dev.tty.legacy_tiocsti=1`, or set source.injection to \"wtype\".";
}
