#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::connect(const std::string& endpoint) {
    close();

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.empty() || endpoint.size() >= sizeof(addr.sun_path)) return false;
    std::memcpy(addr.sun_path, endpoint.data(), endpoint.size());

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    int rc;
    do {
        rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        ::close(fd);
        return false;
    }
    fd_ = fd;
    return true;
}

bool UnixSocketClient::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return false;

    std::string msg = cmd.dump();
    msg.push_back('\n');

    size_t off = 0;
    while (off < msg.size()) {
        ssize_t n = ::send(fd_, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += static_cast<size_t>(n);
    }
    return true;
}

bool UnixSocketClient::take_line(std::string& line) {
    auto pos = buf_.find('\n');
    if (pos == std::string::npos) return false;
    line.assign(buf_, 0, pos);
    buf_.erase(0, pos + 1);
    return true;
}

std::expected<nlohmann::json, IpcClient::RecvError> UnixSocketClient::recv(int timeout_ms) {
    using Clock = std::chrono::steady_clock;
    if (fd_ < 0) return std::unexpected(RecvError::NotConnected);

    // The whole call shares one deadline, however many reads a line takes.
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string line;

    while (!take_line(line)) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0) return std::unexpected(RecvError::Timeout);

        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ret < 0 && errno == EINTR) continue;
        if (ret == 0) return std::unexpected(RecvError::Timeout);
        if (ret < 0) return std::unexpected(RecvError::Closed);

        char chunk[4096];
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return std::unexpected(RecvError::Closed);
        buf_.append(chunk, static_cast<size_t>(n));
    }

    auto parsed = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) return std::unexpected(RecvError::BadJson);
    return parsed;
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buf_.clear();
}
