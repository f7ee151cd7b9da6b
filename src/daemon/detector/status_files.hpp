#pragma once

#include "model/records.hpp"
#include "model/session_id.hpp"
#include "model/session_status.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

// Files the per-session hook writes into the status directory:
//
//   <prefix><id>.json          {"state","project","timestamp","pid"}
//   <prefix>prompt-<id>.json   the question the session is blocked on
//   <prefix>response-<id>.txt  fallback copy of a response (fallback dir)

struct StatusFile {
    SessionStatus state = SessionStatus::Idle;
    std::string project;
    std::optional<Timestamp> timestamp;
    std::optional<int> pid;
};

struct PromptFile {
    std::string session_id;
    std::string project;
    std::string prompt_message;
    std::string notification_type;
    std::optional<std::string> transcript_path;
    std::optional<std::string> transcript_excerpt;
    std::optional<Timestamp> timestamp;
    std::optional<int> pid;
};

// Accepts an ISO-8601 string or epoch seconds for "timestamp".
std::expected<StatusFile, std::string> parse_status_file(std::string_view content);
std::string format_status_file(const StatusFile& status);

std::expected<PromptFile, std::string> parse_prompt_file(std::string_view content);

class StatusFileLayout {
public:
    static constexpr std::string_view PROMPT_TAG = "prompt-";
    static constexpr std::string_view RESPONSE_TAG = "response-";

    StatusFileLayout(std::string status_dir, std::string prefix, std::string fallback_dir);

    std::string status_path(const SessionId& id) const;
    std::string prompt_path(const SessionId& id) const;
    std::string response_path(const SessionId& id) const;

    // True for "<prefix><id>.json" but not for prompt or response files.
    bool is_status_file(std::string_view file_name) const;

    const std::string& status_dir() const { return status_dir_; }
    const std::string& prefix() const { return prefix_; }

private:
    std::string status_dir_;
    std::string prefix_;
    std::string fallback_dir_;
};

std::expected<std::string, std::string> read_text_file(const std::string& path);

// Writes to a sibling temp file and renames it over the target.
std::expected<void, std::string> write_file_atomic(const std::string& path,
                                                   const std::string& content);
