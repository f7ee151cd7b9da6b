#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;
using ReadResult = IpcServer::ReadResult;

namespace {

std::string tmp_socket_path() {
    return "/tmp/sr_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Polls the non-blocking server socket until something other than a partial
// line comes back.
ReadResult read_settled(UnixSocketServer& server, int fd, json& cmd) {
    auto res = ReadResult::Partial;
    for (int i = 0; i < 100 && res == ReadResult::Partial; ++i) {
        res = server.read_command(fd, cmd);
        if (res == ReadResult::Partial) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return res;
}

// Plain socket for writing byte sequences the client class never produces.
int raw_connect(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

bool raw_write(int fd, const std::string& bytes) {
    return ::send(fd, bytes.data(), bytes.size(), MSG_NOSIGNAL) ==
           static_cast<ssize_t>(bytes.size());
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        REQUIRE((std::filesystem::status(sock_path).permissions() &
                 std::filesystem::perms::group_all) == std::filesystem::perms::none);
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("ClientConnects") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("ConnectFailsWithoutServer") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect(sock_path));
        REQUIRE_FALSE(client.send({{"command", "status"}}));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"command", "status"}}));

        json received;
        REQUIRE(read_settled(server, client_fd, received) == ReadResult::Command);
        REQUIRE(received["command"] == "status");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"role", "source"}}));

        auto client_resp = client.recv(1000);
        REQUIRE(client_resp.has_value());
        REQUIRE((*client_resp)["role"] == "source");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("MultipleMessages") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send({{"command", "sessions"}, {"seq", i}}));

            json received;
            REQUIRE(read_settled(server, client_fd, received) == ReadResult::Command);
            REQUIRE(received["seq"] == i);

            REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"seq", i}}));

            auto client_resp = client.recv(1000);
            REQUIRE(client_resp.has_value());
            REQUIRE((*client_resp)["seq"] == i);
        }

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("SplitAndCoalescedLines") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(raw_write(raw, R"({"command":)"));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        json cmd;
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Partial);

        REQUIRE(raw_write(raw, "\"status\"}\n{\"command\":\"prompts\"}\n"));
        REQUIRE(read_settled(server, client_fd, cmd) == ReadResult::Command);
        REQUIRE(cmd["command"] == "status");

        // Second line is already buffered.
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Command);
        REQUIRE(cmd["command"] == "prompts");

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("InvalidLineKeepsTheConnection") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();

        REQUIRE(raw_write(raw, "not json\n{\"command\":\"status\"}\n"));
        json cmd;
        REQUIRE(read_settled(server, client_fd, cmd) == ReadResult::Invalid);
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Command);

        ::close(raw);
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();

        json cmd;
        REQUIRE(read_settled(server, client_fd, cmd) == ReadResult::Closed);

        server.close_client(client_fd);
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Closed);
        server.stop();
    }

    SECTION("ClientRecvTimesOut") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        REQUIRE(server.accept_client() >= 0);

        auto resp = client.recv(20);
        REQUIRE_FALSE(resp.has_value());
        REQUIRE(resp.error() == IpcClient::RecvError::Timeout);
        server.stop();
    }

    SECTION("ClientRecvReportsClosedAndMalformed") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.recv(20).error() == IpcClient::RecvError::NotConnected);
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(raw_write(client_fd, "{\"status\":\n"));
        REQUIRE(client.recv(1000).error() == IpcClient::RecvError::BadJson);

        server.close_client(client_fd);
        REQUIRE(client.recv(1000).error() == IpcClient::RecvError::Closed);
        client.close();
        server.stop();
    }

    SECTION("CallSurfacesDaemonErrors") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::jthread daemon([&] {
            json cmd;
            for (int i = 0; i < 2; ++i) {
                if (read_settled(server, client_fd, cmd) != ReadResult::Command) return;
                if (cmd["cmd"] == "respond") {
                    server.send_response(client_fd,
                                         {{"status", "error"}, {"message", "unknown prompt s1-9"}});
                } else {
                    server.send_response(client_fd, {{"status", "ok"}, {"role", "remote"}});
                }
            }
        });

        auto ok = client.call({{"cmd", "status"}}, 1000);
        REQUIRE(ok.has_value());
        REQUIRE((*ok)["role"] == "remote");

        auto failed = client.call({{"cmd", "respond"}, {"prompt_id", "s1-9"}, {"text", "y"}}, 1000);
        REQUIRE_FALSE(failed.has_value());
        REQUIRE(failed.error() == "daemon: unknown prompt s1-9");

        daemon.join();
        server.close_client(client_fd);
        client.close();
        server.stop();
    }
}
