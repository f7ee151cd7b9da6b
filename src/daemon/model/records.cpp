#include "model/records.hpp"

#include <cstdio>
#include <ctime>
#include <format>

using json = nlohmann::json;

int64_t to_epoch_ms(Timestamp t) {
    return t.time_since_epoch().count();
}

Timestamp from_epoch_ms(int64_t ms) {
    return Timestamp(std::chrono::milliseconds(ms));
}

Timestamp to_timestamp(std::chrono::system_clock::time_point t) {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(t);
}

namespace {

std::expected<std::string, std::string> require_string(const json& fields, const char* key) {
    auto it = fields.find(key);
    if (it == fields.end() || !it->is_string()) {
        return std::unexpected(std::format("missing or non-string field '{}'", key));
    }
    return it->get<std::string>();
}

std::expected<int64_t, std::string> require_int(const json& fields, const char* key) {
    auto it = fields.find(key);
    if (it == fields.end() || !it->is_number_integer()) {
        return std::unexpected(std::format("missing or non-integer field '{}'", key));
    }
    return it->get<int64_t>();
}

std::optional<std::string> optional_string(const json& fields, const char* key) {
    auto it = fields.find(key);
    if (it == fields.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<int64_t> optional_int(const json& fields, const char* key) {
    auto it = fields.find(key);
    if (it == fields.end() || !it->is_number_integer()) return std::nullopt;
    return it->get<int64_t>();
}

} // namespace

json to_fields(const SessionRecord& rec) {
    json fields = json::object();
    apply_fields(rec, fields);
    return fields;
}

void apply_fields(const SessionRecord& rec, json& fields) {
    fields[field::SESSION_ID] = rec.id;
    fields[field::STATUS] = std::string(to_string(rec.status));
    fields[field::PROJECT] = rec.project;
    fields[field::TIMESTAMP] = to_epoch_ms(rec.timestamp);
    fields[field::SOURCE_DEVICE] = rec.source_device_name;
    if (rec.pid) {
        fields[field::PID] = *rec.pid;
    }
}

json to_fields(const PromptRecord& rec) {
    json fields = {
        {field::PROMPT_ID, rec.id},
        {field::SESSION_ID, rec.session_id},
        {field::PROJECT, rec.project},
        {field::PROMPT_MESSAGE, rec.prompt_message},
        {field::NOTIFICATION_TYPE, rec.notification_type},
        {field::TIMESTAMP, to_epoch_ms(rec.timestamp)},
        {field::RESPONDED, rec.responded ? 1 : 0},
    };

    if (rec.transcript_path) fields[field::TRANSCRIPT_PATH] = *rec.transcript_path;
    if (rec.transcript_excerpt) fields[field::TRANSCRIPT_EXCERPT] = *rec.transcript_excerpt;
    if (rec.pid) fields[field::PID] = *rec.pid;
    if (rec.response_text) fields[field::RESPONSE_TEXT] = *rec.response_text;
    if (rec.responded_at) fields[field::RESPONDED_AT] = to_epoch_ms(*rec.responded_at);
    if (rec.responded_from_device) fields[field::RESPONDED_FROM] = *rec.responded_from_device;

    return fields;
}

void apply_response(json& fields, const std::string& text, Timestamp at,
                    const std::string& device) {
    fields[field::RESPONSE_TEXT] = text;
    fields[field::RESPONDED_AT] = to_epoch_ms(at);
    fields[field::RESPONDED_FROM] = device;
    fields[field::RESPONDED] = 1;
}

std::expected<SessionRecord, std::string> session_from_fields(const json& fields) {
    if (!fields.is_object()) return std::unexpected("record fields are not an object");

    auto id = require_string(fields, field::SESSION_ID);
    if (!id) return std::unexpected(id.error());
    auto status_str = require_string(fields, field::STATUS);
    if (!status_str) return std::unexpected(status_str.error());
    auto status = parse_status(*status_str);
    if (!status) return std::unexpected("unknown status '" + *status_str + "'");
    auto project = require_string(fields, field::PROJECT);
    if (!project) return std::unexpected(project.error());
    auto ts = require_int(fields, field::TIMESTAMP);
    if (!ts) return std::unexpected(ts.error());
    auto device = require_string(fields, field::SOURCE_DEVICE);
    if (!device) return std::unexpected(device.error());

    SessionRecord rec{
        .id = std::move(*id),
        .status = *status,
        .project = std::move(*project),
        .timestamp = from_epoch_ms(*ts),
        .pid = std::nullopt,
        .source_device_name = std::move(*device),
    };
    if (auto pid = optional_int(fields, field::PID)) {
        rec.pid = static_cast<int>(*pid);
    }
    return rec;
}

std::expected<PromptRecord, std::string> prompt_from_fields(const json& fields) {
    if (!fields.is_object()) return std::unexpected("record fields are not an object");

    auto id = require_string(fields, field::PROMPT_ID);
    if (!id) return std::unexpected(id.error());
    auto session_id = require_string(fields, field::SESSION_ID);
    if (!session_id) return std::unexpected(session_id.error());
    auto project = require_string(fields, field::PROJECT);
    if (!project) return std::unexpected(project.error());
    auto message = require_string(fields, field::PROMPT_MESSAGE);
    if (!message) return std::unexpected(message.error());
    auto type = require_string(fields, field::NOTIFICATION_TYPE);
    if (!type) return std::unexpected(type.error());
    auto ts = require_int(fields, field::TIMESTAMP);
    if (!ts) return std::unexpected(ts.error());

    PromptRecord rec;
    rec.id = std::move(*id);
    rec.session_id = std::move(*session_id);
    rec.project = std::move(*project);
    rec.prompt_message = std::move(*message);
    rec.notification_type = std::move(*type);
    rec.timestamp = from_epoch_ms(*ts);
    rec.transcript_path = optional_string(fields, field::TRANSCRIPT_PATH);
    rec.transcript_excerpt = optional_string(fields, field::TRANSCRIPT_EXCERPT);
    if (auto pid = optional_int(fields, field::PID)) rec.pid = static_cast<int>(*pid);

    rec.responded = optional_int(fields, field::RESPONDED).value_or(0) != 0;
    rec.response_text = optional_string(fields, field::RESPONSE_TEXT);
    if (auto at = optional_int(fields, field::RESPONDED_AT)) rec.responded_at = from_epoch_ms(*at);
    rec.responded_from_device = optional_string(fields, field::RESPONDED_FROM);

    return rec;
}

json to_json(const SessionRecord& rec) {
    json j = {
        {"id", rec.id},
        {"status", std::string(to_string(rec.status))},
        {"project", rec.project},
        {"timestamp", format_iso8601(rec.timestamp)},
        {"source_device", rec.source_device_name},
    };
    if (rec.pid) j["pid"] = *rec.pid;
    return j;
}

json to_json(const PromptRecord& rec) {
    json j = {
        {"id", rec.id},
        {"session_id", rec.session_id},
        {"project", rec.project},
        {"message", rec.prompt_message},
        {"notification_type", rec.notification_type},
        {"timestamp", format_iso8601(rec.timestamp)},
        {"responded", rec.responded},
    };
    if (rec.transcript_excerpt) j["transcript_excerpt"] = *rec.transcript_excerpt;
    if (rec.response_text) j["response_text"] = *rec.response_text;
    if (rec.responded_from_device) j["responded_from"] = *rec.responded_from_device;
    return j;
}

std::string format_iso8601(Timestamp t) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(t);
    return std::format("{:%FT%TZ}", secs);
}

std::optional<Timestamp> parse_iso8601(const std::string& text) {
    std::tm tm{};
    int frac = 0;
    int n = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d", &tm.tm_year, &tm.tm_mon,
                        &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &frac);
    if (n < 6) return std::nullopt;

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    time_t secs = ::timegm(&tm);
    if (secs == static_cast<time_t>(-1)) return std::nullopt;

    return from_epoch_ms(static_cast<int64_t>(secs) * 1000 + (n == 7 ? frac : 0));
}
