#include "detector/status_files.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<Timestamp> read_timestamp(const json& j) {
    if (!j.contains("timestamp")) return std::nullopt;
    const auto& t = j["timestamp"];
    if (t.is_string()) return parse_iso8601(t.get<std::string>());
    if (t.is_number()) {
        return from_epoch_ms(static_cast<int64_t>(t.get<double>() * 1000.0));
    }
    return std::nullopt;
}

// Hooks write pid 0 when they could not find one.
std::optional<int> read_pid(const json& j) {
    if (!j.contains("pid") || !j["pid"].is_number_integer()) return std::nullopt;
    int pid = j["pid"].get<int>();
    if (pid <= 0) return std::nullopt;
    return pid;
}

std::optional<std::string> read_optional(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) return std::nullopt;
    auto value = j[key].get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

} // namespace

std::expected<StatusFile, std::string> parse_status_file(std::string_view content) {
    try {
        auto j = json::parse(content);
        if (!j.is_object()) return std::unexpected("status file is not an object");
        if (!j.contains("state") || !j["state"].is_string()) {
            return std::unexpected("status file has no state");
        }

        auto state_str = j["state"].get<std::string>();
        auto state = parse_status(state_str);
        if (!state) return std::unexpected("unknown state '" + state_str + "'");

        StatusFile status;
        status.state = *state;
        status.project = read_optional(j, "project").value_or("Unknown");
        status.timestamp = read_timestamp(j);
        status.pid = read_pid(j);
        return status;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::string format_status_file(const StatusFile& status) {
    json j = {
        {"state", std::string(to_string(status.state))},
        {"project", status.project},
        {"pid", status.pid.value_or(0)},
    };
    if (status.timestamp) j["timestamp"] = format_iso8601(*status.timestamp);
    return j.dump();
}

std::expected<PromptFile, std::string> parse_prompt_file(std::string_view content) {
    try {
        auto j = json::parse(content);
        if (!j.is_object()) return std::unexpected("prompt file is not an object");

        auto session_id = read_optional(j, "session_id");
        if (!session_id) return std::unexpected("prompt file has no session_id");

        PromptFile prompt;
        prompt.session_id = std::move(*session_id);
        prompt.project = read_optional(j, "project").value_or("Unknown");
        prompt.prompt_message = read_optional(j, "prompt_message").value_or("");
        prompt.notification_type = read_optional(j, "notification_type").value_or("idle_prompt");
        prompt.transcript_path = read_optional(j, "transcript_path");
        prompt.transcript_excerpt = read_optional(j, "transcript_excerpt");
        prompt.timestamp = read_timestamp(j);
        prompt.pid = read_pid(j);
        return prompt;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

StatusFileLayout::StatusFileLayout(std::string status_dir, std::string prefix,
                                   std::string fallback_dir)
    : status_dir_(std::move(status_dir)), prefix_(std::move(prefix)),
      fallback_dir_(std::move(fallback_dir)) {}

std::string StatusFileLayout::status_path(const SessionId& id) const {
    return (fs::path(status_dir_) / std::format("{}{}.json", prefix_, id.str())).string();
}

std::string StatusFileLayout::prompt_path(const SessionId& id) const {
    return (fs::path(status_dir_) / std::format("{}{}{}.json", prefix_, PROMPT_TAG, id.str()))
        .string();
}

std::string StatusFileLayout::response_path(const SessionId& id) const {
    return (fs::path(fallback_dir_) / std::format("{}{}{}.txt", prefix_, RESPONSE_TAG, id.str()))
        .string();
}

bool StatusFileLayout::is_status_file(std::string_view file_name) const {
    if (!file_name.starts_with(prefix_) || !file_name.ends_with(".json")) return false;
    auto rest = file_name.substr(prefix_.size());
    if (rest.starts_with(PROMPT_TAG) || rest.starts_with(RESPONSE_TAG)) return false;
    // "<prefix>.json" carries no id.
    return rest.size() > std::string_view(".json").size();
}

std::expected<std::string, std::string> read_text_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return std::unexpected("cannot open " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::expected<void, std::string> write_file_atomic(const std::string& path,
                                                   const std::string& content) {
    auto tmp = std::format("{}.tmp.{}", path, ::getpid());
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f.is_open()) {
            return std::unexpected(std::format("cannot write {}: {}", tmp, std::strerror(errno)));
        }
        f << content;
        if (!f.good()) return std::unexpected("write to " + tmp + " failed");
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return std::unexpected(std::format("cannot rename to {}: {}", path, ec.message()));
    }
    return {};
}
