#pragma once

#include <nlohmann/json.hpp>
#include <string>

class IpcServer {
public:
    enum class ReadResult {
        Command,  // cmd holds one parsed request
        Partial,  // no complete line yet; keep the client
        Invalid,  // a line arrived but was not JSON
        Closed,   // peer hung up or errored
    };

    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    virtual ReadResult read_command(int client_fd, nlohmann::json& cmd) = 0;
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
