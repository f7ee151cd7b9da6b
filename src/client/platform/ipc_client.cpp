#include "platform/ipc_client.hpp"

#include <format>
#include <utility>

const char* to_string(IpcClient::RecvError err) {
    switch (err) {
        case IpcClient::RecvError::NotConnected: return "not connected";
        case IpcClient::RecvError::Timeout: return "no response from daemon (timeout)";
        case IpcClient::RecvError::Closed: return "daemon closed the connection";
        case IpcClient::RecvError::BadJson: return "daemon sent a malformed response";
    }
    return "unknown";
}

std::expected<nlohmann::json, std::string> IpcClient::call(const nlohmann::json& cmd,
                                                           int timeout_ms) {
    if (!send(cmd)) return std::unexpected(std::string("failed to send command"));

    auto response = recv(timeout_ms);
    if (!response) return std::unexpected(std::string(to_string(response.error())));

    if (!response->is_object()) {
        return std::unexpected(std::string("daemon sent a malformed response"));
    }
    if (response->value("status", "") == "error") {
        return std::unexpected(
            std::format("daemon: {}", response->value("message", "unknown error")));
    }
    return *std::move(response);
}
