#include "store/http_store.hpp"

#include "store/http_protocol.hpp"

#include <chrono>
#include <curl/curl.h>
#include <print>

using json = nlohmann::json;

namespace {

constexpr auto RETRY_DELAY = std::chrono::seconds(5);

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Aborts a long poll once stop has been requested.
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

struct CurlRequest {
    long status = 0;
    std::string body;
    CURLcode result = CURLE_OK;
};

CurlRequest perform(const std::string& url, const std::string& token, const char* method,
                    const std::string& body, long timeout_s, std::stop_token* stop = nullptr) {
    CurlRequest out;

    CURL* curl = curl_easy_init();
    if (!curl) {
        out.result = CURLE_FAILED_INIT;
        return out;
    }

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (!body.empty()) headers = curl_slist_append(headers, "Content-Type: application/json");
    std::string auth;
    if (!token.empty()) {
        auth = "Authorization: Bearer " + token;
        headers = curl_slist_append(headers, auth.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    if (!body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (stop) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, stop);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    out.result = curl_easy_perform(curl);
    if (out.result == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return out;
}

} // namespace

HttpRecordStore::HttpRecordStore(std::string url, std::string token, long timeout_s)
    : url_(std::move(url)), token_(std::move(token)), timeout_s_(timeout_s) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    while (!url_.empty() && url_.back() == '/') url_.pop_back();
}

HttpRecordStore::~HttpRecordStore() {
    curl_global_cleanup();
}

std::expected<HttpRecordStore::Response, StoreError>
HttpRecordStore::request(const char* method, const std::string& path, const std::string& body) {
    auto res = perform(url_ + path, token_, method, body, timeout_s_);
    if (res.result != CURLE_OK) {
        return std::unexpected(StoreError{StoreErrorKind::Transport,
                                          std::string("curl error: ") +
                                              curl_easy_strerror(res.result)});
    }
    if (res.status < 200 || res.status >= 300) {
        return std::unexpected(http_protocol::error_from_status(res.status, res.body));
    }
    return Response{.status = res.status, .body = std::move(res.body)};
}

std::expected<void, StoreError> HttpRecordStore::check_account() {
    auto res = request("GET", "/v1/account");
    if (!res) return std::unexpected(res.error());

    try {
        auto j = json::parse(res->body);
        auto status = j.value("status", "");
        if (status != "available") {
            return std::unexpected(StoreError{StoreErrorKind::Unavailable, "account " + status});
        }
    } catch (const json::exception& e) {
        return std::unexpected(StoreError{StoreErrorKind::Malformed,
                                          std::string("JSON parse error: ") + e.what()});
    }
    return {};
}

std::expected<Record, StoreError> HttpRecordStore::fetch(const std::string& type,
                                                         const std::string& id) {
    auto res = request("GET", http_protocol::record_path(type, id));
    if (!res) return std::unexpected(res.error());
    return http_protocol::decode_record(res->body, type);
}

std::expected<Record, StoreError> HttpRecordStore::save(const Record& record) {
    auto body = http_protocol::encode_record(record).dump();
    auto res = request("PUT", http_protocol::record_path(record.type, record.id), body);
    if (!res) return std::unexpected(res.error());
    return http_protocol::decode_record(res->body, record.type);
}

std::expected<void, StoreError> HttpRecordStore::remove(const std::string& type,
                                                        const std::string& id) {
    auto res = request("DELETE", http_protocol::record_path(type, id));
    if (!res) return std::unexpected(res.error());
    return {};
}

std::expected<QueryPage, StoreError> HttpRecordStore::query(
    const Query& query, const std::optional<std::string>& cursor) {
    auto body = http_protocol::encode_query(query, cursor).dump();
    auto res = request("POST", "/v1/query", body);
    if (!res) return std::unexpected(res.error());
    return http_protocol::decode_query_page(res->body, query.type);
}

std::expected<std::vector<Subscription>, StoreError> HttpRecordStore::subscriptions() {
    auto res = request("GET", "/v1/subscriptions");
    if (!res) return std::unexpected(res.error());
    return http_protocol::decode_subscriptions(res->body);
}

std::expected<void, StoreError> HttpRecordStore::save_subscription(const Subscription& sub) {
    auto body = http_protocol::encode_subscription(sub).dump();
    auto res = request("PUT", http_protocol::subscription_path(sub.id), body);
    if (!res) return std::unexpected(res.error());
    return {};
}

std::expected<void, StoreError> HttpRecordStore::remove_subscription(const std::string& id) {
    auto res = request("DELETE", http_protocol::subscription_path(id));
    if (!res) return std::unexpected(res.error());
    return {};
}

HttpPushChannel::HttpPushChannel(std::string url, std::string token, int wait_s)
    : url_(std::move(url)), token_(std::move(token)), wait_s_(wait_s) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    while (!url_.empty() && url_.back() == '/') url_.pop_back();
}

HttpPushChannel::~HttpPushChannel() {
    stop();
    curl_global_cleanup();
}

bool HttpPushChannel::start(Handler handler) {
    if (thread_.joinable()) return true;
    handler_ = std::move(handler);
    thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
    return true;
}

void HttpPushChannel::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

void HttpPushChannel::run(std::stop_token stop) {
    // since=-1 asks for the current head of the feed without replaying history.
    bool primed = false;

    while (!stop.stop_requested()) {
        auto path = http_protocol::changes_path(primed ? since_ : -1, primed ? wait_s_ : 0);
        auto res = perform(url_ + path, token_, "GET", {}, wait_s_ + 10, &stop);
        if (stop.stop_requested()) break;

        std::expected<http_protocol::ChangeBatch, StoreError> batch =
            std::unexpected(StoreError{StoreErrorKind::Transport, "no response"});
        if (res.result != CURLE_OK) {
            batch = std::unexpected(StoreError{
                StoreErrorKind::Transport,
                std::string("curl error: ") + curl_easy_strerror(res.result)});
        } else if (res.status < 200 || res.status >= 300) {
            batch = std::unexpected(http_protocol::error_from_status(res.status, res.body));
        } else {
            batch = http_protocol::decode_changes(res.body);
        }

        if (!batch) {
            std::println(stderr, "store: change feed: {}", describe(batch.error()));
            auto until = std::chrono::steady_clock::now() + RETRY_DELAY;
            while (!stop.stop_requested() && std::chrono::steady_clock::now() < until) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            continue;
        }

        if (primed) {
            for (const auto& note : batch->changes) handler_(note);
        }
        since_ = batch->next;
        primed = true;
    }
}
