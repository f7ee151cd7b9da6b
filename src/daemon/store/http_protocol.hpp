#pragma once

#include "store/record_store.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// JSON request and response bodies of the hosted record service. Kept apart
// from the curl transport so they can be tested without a server.
//
//   GET    /v1/account                    -> {"status":"available"}
//   GET    /v1/records/{type}/{id}        -> {"id","changeTag","fields"}
//   PUT    /v1/records/{type}/{id}        <- {"fields","changeTag"?}
//   DELETE /v1/records/{type}/{id}
//   POST   /v1/query                      <- {"type","filters","sort","limit","cursor"?}
//                                         -> {"records":[...],"cursor"?}
//   GET    /v1/subscriptions              -> {"subscriptions":[...]}
//   PUT    /v1/subscriptions/{id}
//   DELETE /v1/subscriptions/{id}
//   GET    /v1/changes?since=N&wait=S     -> {"changes":[...],"next":N}  (since=-1: head only)
//
// Errors come back as {"error":"<code>","message":"..."}.
namespace http_protocol {

struct ChangeBatch {
    std::vector<ChangeNotification> changes;
    int64_t next = 0;
};

std::string url_encode(const std::string& text);
std::string record_path(const std::string& type, const std::string& id);
std::string subscription_path(const std::string& id);
std::string changes_path(int64_t since, int wait_s);

nlohmann::json encode_record(const Record& record);
std::expected<Record, StoreError> decode_record(const std::string& body, const std::string& type);

nlohmann::json encode_query(const Query& query, const std::optional<std::string>& cursor);
std::expected<QueryPage, StoreError> decode_query_page(const std::string& body,
                                                       const std::string& type);

nlohmann::json encode_subscription(const Subscription& sub);
std::expected<std::vector<Subscription>, StoreError> decode_subscriptions(const std::string& body);

std::expected<ChangeBatch, StoreError> decode_changes(const std::string& body);

// Maps a non-2xx response onto the store error taxonomy.
StoreError error_from_status(long status, const std::string& body);

} // namespace http_protocol
