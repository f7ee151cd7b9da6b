#include "daemon_core.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>

using json = nlohmann::json;

namespace {

json error(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

// Empty when absent; nullopt when present with another type.
std::optional<std::string> string_field(const json& cmd, const char* key) {
    auto it = cmd.find(key);
    if (it == cmd.end()) return std::string();
    if (!it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

DaemonCore::DaemonCore(const Config& config, const Logger& log, IpcServer& ipc,
                       SourceAgent* source, RemoteMonitor* remote, HistoryDb* history)
    : config_(config), log_(log), ipc_(ipc), source_(source), remote_(remote),
      history_(history) {}

DaemonCore::~DaemonCore() = default;

void DaemonCore::start() {
    if (source_) source_->start();
    if (remote_) remote_->start();
}

void DaemonCore::shutdown() {
    if (source_) source_->stop();
    if (remote_) remote_->stop();

    for (auto& [request, fd] : waiting_) {
        if (!ipc_.send_response(fd, error("daemon shutting down"))) {
            log_.debug("ipc: could not answer request {}", request);
        }
    }
    waiting_.clear();
}

json DaemonCore::dispatch(const json& cmd, int client_fd) {
    if (!cmd.is_object()) return error("request must be a JSON object");
    auto name = string_field(cmd, "cmd");
    if (!name) return error("cmd must be a string");

    try {
        return handle_command(*name, cmd, client_fd);
    } catch (const json::exception& e) {
        log_.warn("ipc: bad {} request: {}", *name, e.what());
        return error(std::string("bad request: ") + e.what());
    }
}

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd, int client_fd) {
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "sessions") return handle_sessions(cmd);
    if (cmd_str == "prompts") return handle_prompts(cmd);
    if (cmd_str == "respond") return handle_respond(cmd, client_fd);
    if (cmd_str == "sweep") return handle_sweep(cmd, client_fd);
    if (cmd_str == "history") return handle_history(cmd);
    return error("unknown command");
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    json resp = {{"status", "ok"}, {"role", config_.role}};
    if (source_) resp["source"] = source_->status_json();
    if (remote_) resp["remote"] = remote_->status_json();
    return resp;
}

json DaemonCore::handle_sessions(const json& /*cmd*/) {
    json list = json::array();

    if (remote_) {
        remote_->activate();
        for (const auto& s : remote_->sessions()) list.push_back(to_json(s));
        return {{"status", "ok"}, {"view", "remote"}, {"sessions", list}};
    }
    if (!source_) return error("no role is running");

    for (const auto& s : source_->local_sessions()) {
        json j = {
            {"id", s.id.str()},
            {"status", std::string(to_string(s.status))},
            {"project", s.project},
            {"timestamp", format_iso8601(s.observed_at)},
        };
        if (s.pid) j["pid"] = *s.pid;
        if (auto published = source_->pipeline().published_status(s.id)) {
            j["published"] = std::string(to_string(*published));
        }
        list.push_back(std::move(j));
    }
    return {{"status", "ok"}, {"view", "local"}, {"sessions", list}};
}

json DaemonCore::handle_prompts(const json& /*cmd*/) {
    if (!remote_) return error("prompts are listed by the remote role");

    remote_->activate();
    json list = json::array();
    for (const auto& p : remote_->pending_prompts()) list.push_back(to_json(p));
    return {{"status", "ok"}, {"prompts", list}};
}

json DaemonCore::handle_respond(const json& cmd, int client_fd) {
    if (!remote_) return error("respond needs the remote role");

    auto prompt_id = string_field(cmd, "prompt_id");
    auto text = string_field(cmd, "text");
    if (!prompt_id || !text) return error("prompt_id and text must be strings");
    if (prompt_id->empty()) return error("missing prompt_id");
    if (text->empty()) return error("missing text");

    auto request = wait_for(client_fd);
    remote_->submit_response(*prompt_id, *text,
                             [this, request](std::expected<PromptRecord, StoreError> res) {
                                 if (res) {
                                     complete(request, {{"status", "ok"}, {"prompt", to_json(*res)}});
                                 } else {
                                     complete(request, error(describe(res.error())));
                                 }
                             });
    return {{"status", "pending"}};
}

json DaemonCore::handle_sweep(const json& /*cmd*/, int client_fd) {
    if (!source_) return error("sweep needs the source role");

    auto request = wait_for(client_fd);
    // A refused sweep answers through the callback before this returns.
    source_->cleanup().run_now([this, request](const CleanupSweep::Outcome& out) {
        if (!out.ran && !out.error.empty()) {
            complete(request, error(out.error));
            return;
        }
        complete(request, {
                              {"status", "ok"},
                              {"ran", out.ran},
                              {"remote", out.remote},
                              {"stale", out.stale},
                              {"deleted", out.deleted},
                          });
    });
    return {{"status", "pending"}};
}

json DaemonCore::handle_history(const json& cmd) {
    if (!history_) return error("history is not available");

    int limit = 10;
    if (auto it = cmd.find("limit"); it != cmd.end()) {
        if (!it->is_number_integer() || it->get<int64_t>() <= 0) {
            return error("limit must be a positive integer");
        }
        limit = static_cast<int>(std::min<int64_t>(it->get<int64_t>(), 1000));
    }
    auto session = string_field(cmd, "session_id");
    if (!session) return error("session_id must be a string");

    auto entries =
        session->empty() ? history_->recent(limit) : history_->for_session(*session, limit);

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"prompt_id", e.prompt_id},
            {"session_id", e.session_id},
            {"project", e.project},
            {"text", e.response_text},
            {"from", e.responded_from},
            {"path", e.path},
        });
    }
    return resp;
}

uint64_t DaemonCore::wait_for(int client_fd) {
    auto request = next_request_++;
    waiting_[request] = client_fd;
    return request;
}

void DaemonCore::complete(uint64_t request, const json& response) {
    auto it = waiting_.find(request);
    if (it == waiting_.end()) {
        log_.debug("ipc: client of request {} went away", request);
        return;
    }
    if (!ipc_.send_response(it->second, response)) {
        log_.debug("ipc: could not answer request {}", request);
    }
    waiting_.erase(it);
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase_if(waiting_, [fd](const auto& entry) { return entry.second == fd; });
}
