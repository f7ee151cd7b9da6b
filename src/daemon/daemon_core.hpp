#pragma once

#include "config.hpp"
#include "logger.hpp"
#include "platform/ipc_server.hpp"
#include "remote_monitor.hpp"
#include "source_agent.hpp"
#include "storage/history_db.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

// IPC command dispatch for whichever roles this daemon runs. Commands that
// wait on the store answer {"status":"pending"} at once; the real response
// is sent to the same client when the work completes.
class DaemonCore {
public:
    DaemonCore(const Config& config, const Logger& log, IpcServer& ipc, SourceAgent* source,
               RemoteMonitor* remote, HistoryDb* history);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    void start();
    void shutdown();

    // Entry point for one request line as read from a client. Anything that
    // is not a well-formed request object is answered with an error.
    nlohmann::json dispatch(const nlohmann::json& cmd, int client_fd);

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd,
                                  int client_fd);

    static bool is_pending(const nlohmann::json& response) {
        return response.value("status", "") == "pending";
    }

    void remove_waiting_client(int fd);
    size_t waiting_clients() const { return waiting_.size(); }

private:
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_sessions(const nlohmann::json& cmd);
    nlohmann::json handle_prompts(const nlohmann::json& cmd);
    nlohmann::json handle_respond(const nlohmann::json& cmd, int client_fd);
    nlohmann::json handle_sweep(const nlohmann::json& cmd, int client_fd);
    nlohmann::json handle_history(const nlohmann::json& cmd);

    uint64_t wait_for(int client_fd);
    void complete(uint64_t request, const nlohmann::json& response);

    const Config& config_;
    const Logger& log_;
    IpcServer& ipc_;
    SourceAgent* source_;
    RemoteMonitor* remote_;
    HistoryDb* history_;

    // request id -> client fd
    std::map<uint64_t, int> waiting_;
    uint64_t next_request_ = 1;
};
