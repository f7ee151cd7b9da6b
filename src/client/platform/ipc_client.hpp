#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Line-delimited JSON connection to the relay daemon.
class IpcClient {
public:
    enum class RecvError { NotConnected, Timeout, Closed, BadJson };

    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    virtual std::expected<nlohmann::json, RecvError> recv(int timeout_ms) = 0;
    virtual void close() = 0;

    // Sends one command and waits for its response. A response whose status
    // is "error" comes back as the daemon's message.
    std::expected<nlohmann::json, std::string> call(const nlohmann::json& cmd, int timeout_ms);
};

const char* to_string(IpcClient::RecvError err);
