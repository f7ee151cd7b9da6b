#pragma once

#include "store/record_store.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

// Record store client for the hosted HTTP/JSON record service (see
// http_protocol.hpp). One curl easy handle per call, so it is safe from
// several worker threads.
class HttpRecordStore : public RecordStore {
public:
    HttpRecordStore(std::string url, std::string token, long timeout_s = 15);
    ~HttpRecordStore() override;

    std::expected<void, StoreError> check_account() override;
    std::expected<Record, StoreError> fetch(const std::string& type, const std::string& id) override;
    std::expected<Record, StoreError> save(const Record& record) override;
    std::expected<void, StoreError> remove(const std::string& type, const std::string& id) override;
    std::expected<QueryPage, StoreError> query(const Query& query,
                                               const std::optional<std::string>& cursor) override;
    std::expected<std::vector<Subscription>, StoreError> subscriptions() override;
    std::expected<void, StoreError> save_subscription(const Subscription& sub) override;
    std::expected<void, StoreError> remove_subscription(const std::string& id) override;

private:
    struct Response {
        long status = 0;
        std::string body;
    };

    std::expected<Response, StoreError> request(const char* method, const std::string& path,
                                                const std::string& body = {});

    std::string url_;
    std::string token_;
    long timeout_s_;
};

// Long-polls /v1/changes on its own thread.
class HttpPushChannel : public PushChannel {
public:
    HttpPushChannel(std::string url, std::string token, int wait_s = 25);
    ~HttpPushChannel() override;

    bool start(Handler handler) override;
    void stop() override;

private:
    void run(std::stop_token stop);

    std::string url_;
    std::string token_;
    int wait_s_;
    int64_t since_ = 0;
    Handler handler_;
    std::jthread thread_;
};
