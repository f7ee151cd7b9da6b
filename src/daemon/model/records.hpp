#pragma once

#include "model/session_status.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

int64_t to_epoch_ms(Timestamp t);
Timestamp from_epoch_ms(int64_t ms);
Timestamp to_timestamp(std::chrono::system_clock::time_point t);

namespace record_type {
inline constexpr char SESSION[] = "Session";
inline constexpr char PROMPT[] = "Prompt";
} // namespace record_type

// Store field names. Instants are stored as epoch milliseconds and
// "responded" as 0/1 so both range and equality predicates work on them.
namespace field {
inline constexpr char SESSION_ID[] = "sessionId";
inline constexpr char PROMPT_ID[] = "promptId";
inline constexpr char STATUS[] = "status";
inline constexpr char PROJECT[] = "project";
inline constexpr char TIMESTAMP[] = "timestamp";
inline constexpr char PID[] = "pid";
inline constexpr char SOURCE_DEVICE[] = "sourceDeviceName";
inline constexpr char PROMPT_MESSAGE[] = "promptMessage";
inline constexpr char NOTIFICATION_TYPE[] = "notificationType";
inline constexpr char TRANSCRIPT_PATH[] = "transcriptPath";
inline constexpr char TRANSCRIPT_EXCERPT[] = "transcriptExcerpt";
inline constexpr char RESPONDED[] = "responded";
inline constexpr char RESPONSE_TEXT[] = "responseText";
inline constexpr char RESPONDED_AT[] = "respondedAt";
inline constexpr char RESPONDED_FROM[] = "respondedFromDevice";
} // namespace field

struct SessionRecord {
    std::string id;
    SessionStatus status = SessionStatus::NotRunning;
    std::string project;
    Timestamp timestamp{};
    std::optional<int> pid;
    std::string source_device_name;

    bool operator==(const SessionRecord&) const = default;
};

struct PromptRecord {
    std::string id;
    std::string session_id;
    std::string project;
    std::string prompt_message;
    std::string notification_type;
    std::optional<std::string> transcript_path;
    std::optional<std::string> transcript_excerpt;
    Timestamp timestamp{};
    std::optional<int> pid;

    // Written once by whichever remote device answers.
    bool responded = false;
    std::optional<std::string> response_text;
    std::optional<Timestamp> responded_at;
    std::optional<std::string> responded_from_device;

    bool operator==(const PromptRecord&) const = default;
};

nlohmann::json to_fields(const SessionRecord& rec);
nlohmann::json to_fields(const PromptRecord& rec);

// Overwrites the session-owned fields of an existing field set, leaving any
// unknown fields other writers may have added.
void apply_fields(const SessionRecord& rec, nlohmann::json& fields);

// Sets the three response fields and the responded flag. Never clears it.
void apply_response(nlohmann::json& fields, const std::string& text, Timestamp at,
                    const std::string& device);

std::expected<SessionRecord, std::string> session_from_fields(const nlohmann::json& fields);
std::expected<PromptRecord, std::string> prompt_from_fields(const nlohmann::json& fields);

// JSON shape used over local IPC (snake_case, ISO-8601 instants).
nlohmann::json to_json(const SessionRecord& rec);
nlohmann::json to_json(const PromptRecord& rec);

std::string format_iso8601(Timestamp t);
std::optional<Timestamp> parse_iso8601(const std::string& text);
