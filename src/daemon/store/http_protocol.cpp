#include "store/http_protocol.hpp"

#include <format>

using json = nlohmann::json;

namespace http_protocol {

namespace {

const char* op_name(PredicateOp op) {
    return op == PredicateOp::Equal ? "eq" : "gte";
}

std::optional<Subscription> subscription_from_json(const json& j) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string() ||
        !j.contains("recordType") || !j["recordType"].is_string()) {
        return std::nullopt;
    }
    Subscription sub;
    sub.id = j["id"].get<std::string>();
    sub.record_type = j["recordType"].get<std::string>();
    sub.fires_on_create = j.value("onCreate", true);
    sub.fires_on_update = j.value("onUpdate", true);
    sub.fires_on_delete = j.value("onDelete", true);
    sub.silent = j.value("silent", true);
    sub.alert_body = j.value("alertBody", "");
    return sub;
}

} // namespace

std::string url_encode(const std::string& text) {
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

std::string record_path(const std::string& type, const std::string& id) {
    return std::format("/v1/records/{}/{}", url_encode(type), url_encode(id));
}

std::string subscription_path(const std::string& id) {
    return "/v1/subscriptions/" + url_encode(id);
}

std::string changes_path(int64_t since, int wait_s) {
    return std::format("/v1/changes?since={}&wait={}", since, wait_s);
}

json encode_record(const Record& record) {
    json j = {{"fields", record.fields}};
    if (record.change_tag) j["changeTag"] = *record.change_tag;
    return j;
}

std::expected<Record, StoreError> decode_record(const std::string& body, const std::string& type) {
    try {
        auto j = json::parse(body);
        if (!j.contains("id") || !j["id"].is_string() || !j.contains("fields") ||
            !j["fields"].is_object()) {
            return std::unexpected(StoreError{StoreErrorKind::Malformed, "record without id/fields"});
        }
        Record rec;
        rec.type = type;
        rec.id = j["id"].get<std::string>();
        rec.fields = j["fields"];
        if (j.contains("changeTag") && j["changeTag"].is_number_unsigned()) {
            rec.change_tag = j["changeTag"].get<uint64_t>();
        }
        return rec;
    } catch (const json::exception& e) {
        return std::unexpected(StoreError{StoreErrorKind::Malformed,
                                          std::string("JSON parse error: ") + e.what()});
    }
}

json encode_query(const Query& query, const std::optional<std::string>& cursor) {
    json filters = json::array();
    for (const auto& p : query.predicates) {
        filters.push_back({{"field", p.field}, {"op", op_name(p.op)}, {"value", p.value}});
    }

    json j = {
        {"type", query.type},
        {"filters", filters},
        {"limit", query.limit},
    };
    if (!query.sort_field.empty()) {
        j["sort"] = {{"field", query.sort_field}, {"descending", query.descending}};
    }
    if (cursor) j["cursor"] = *cursor;
    return j;
}

std::expected<QueryPage, StoreError> decode_query_page(const std::string& body,
                                                       const std::string& type) {
    try {
        auto j = json::parse(body);
        if (!j.contains("records") || !j["records"].is_array()) {
            return std::unexpected(StoreError{StoreErrorKind::Malformed, "query page without records"});
        }

        QueryPage page;
        for (const auto& r : j["records"]) {
            Record rec;
            rec.type = type;
            if (r.contains("id") && r["id"].is_string()) rec.id = r["id"].get<std::string>();
            // A record whose fields are not an object is passed through as
            // null so the caller's decoder counts it as malformed.
            rec.fields = (r.contains("fields") && r["fields"].is_object()) ? r["fields"] : json();
            if (r.contains("changeTag") && r["changeTag"].is_number_unsigned()) {
                rec.change_tag = r["changeTag"].get<uint64_t>();
            }
            page.records.push_back(std::move(rec));
        }
        if (j.contains("cursor") && j["cursor"].is_string() &&
            !j["cursor"].get_ref<const std::string&>().empty()) {
            page.cursor = j["cursor"].get<std::string>();
        }
        return page;
    } catch (const json::exception& e) {
        return std::unexpected(StoreError{StoreErrorKind::Malformed,
                                          std::string("JSON parse error: ") + e.what()});
    }
}

json encode_subscription(const Subscription& sub) {
    return {
        {"id", sub.id},
        {"recordType", sub.record_type},
        {"onCreate", sub.fires_on_create},
        {"onUpdate", sub.fires_on_update},
        {"onDelete", sub.fires_on_delete},
        {"silent", sub.silent},
        {"alertBody", sub.alert_body},
    };
}

std::expected<std::vector<Subscription>, StoreError> decode_subscriptions(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.contains("subscriptions") || !j["subscriptions"].is_array()) {
            return std::unexpected(
                StoreError{StoreErrorKind::Malformed, "response without subscriptions"});
        }
        std::vector<Subscription> subs;
        for (const auto& s : j["subscriptions"]) {
            if (auto sub = subscription_from_json(s)) subs.push_back(std::move(*sub));
        }
        return subs;
    } catch (const json::exception& e) {
        return std::unexpected(StoreError{StoreErrorKind::Malformed,
                                          std::string("JSON parse error: ") + e.what()});
    }
}

std::expected<ChangeBatch, StoreError> decode_changes(const std::string& body) {
    try {
        auto j = json::parse(body);
        ChangeBatch batch;
        batch.next = j.value("next", int64_t{0});

        if (j.contains("changes") && j["changes"].is_array()) {
            for (const auto& c : j["changes"]) {
                auto reason = parse_change_reason(c.value("reason", ""));
                if (!reason) continue;
                batch.changes.push_back(ChangeNotification{
                    .subscription_id = c.value("subscriptionId", ""),
                    .record_type = c.value("recordType", ""),
                    .record_id = c.value("recordId", ""),
                    .reason = *reason,
                });
            }
        }
        return batch;
    } catch (const json::exception& e) {
        return std::unexpected(StoreError{StoreErrorKind::Malformed,
                                          std::string("JSON parse error: ") + e.what()});
    }
}

StoreError error_from_status(long status, const std::string& body) {
    std::string code;
    std::string message = body;
    try {
        auto j = json::parse(body);
        code = j.value("error", "");
        message = j.value("message", code);
    } catch (const json::exception&) {
        // Plain-text error page; keep the body as the message.
    }

    auto with_status = std::format("HTTP {}: {}", status, message);
    switch (status) {
        case 401:
        case 403:
        case 503:
            return {StoreErrorKind::Unavailable, with_status};
        case 404:
            return {code == "unknown_type" ? StoreErrorKind::UnknownType : StoreErrorKind::NotFound,
                    with_status};
        case 409:
            return {StoreErrorKind::Conflict, with_status};
        case 400:
        case 422:
            return {code == "not_queryable" ? StoreErrorKind::NotQueryable : StoreErrorKind::Malformed,
                    with_status};
        default:
            return {StoreErrorKind::Transport, with_status};
    }
}

} // namespace http_protocol
