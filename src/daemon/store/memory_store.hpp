#pragma once

#include "store/record_store.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

class MemoryPushChannel;

// Process-local record store. Backs the "memory" store type (both roles in
// one daemon) and the test suite. Mirrors the capability rules of a hosted
// store: queries may only filter or sort on indexed fields, and unfiltered
// queries need an explicit grant.
class MemoryRecordStore : public RecordStore {
public:
    struct Options {
        std::set<std::string> indexed_fields = {
            "timestamp", "sessionId", "responded", "respondedAt",
        };
        bool allow_unfiltered_queries = false;
    };

    struct Stats {
        uint64_t fetches = 0;
        uint64_t inserts = 0;
        uint64_t updates = 0;
        uint64_t removes = 0;
        uint64_t queries = 0;
    };

    MemoryRecordStore();
    explicit MemoryRecordStore(Options options);
    ~MemoryRecordStore() override;

    MemoryRecordStore(const MemoryRecordStore&) = delete;
    MemoryRecordStore& operator=(const MemoryRecordStore&) = delete;

    std::expected<void, StoreError> check_account() override;
    std::expected<Record, StoreError> fetch(const std::string& type, const std::string& id) override;
    std::expected<Record, StoreError> save(const Record& record) override;
    std::expected<void, StoreError> remove(const std::string& type, const std::string& id) override;
    std::expected<QueryPage, StoreError> query(const Query& query,
                                               const std::optional<std::string>& cursor) override;
    std::expected<std::vector<Subscription>, StoreError> subscriptions() override;
    std::expected<void, StoreError> save_subscription(const Subscription& sub) override;
    std::expected<void, StoreError> remove_subscription(const std::string& id) override;

    // Simulates the account signing out or the service going away.
    void set_available(bool available) { available_.store(available); }

    // Writes a raw field set, bypassing encoders. Used to plant bad data.
    void put_raw(const std::string& type, const std::string& id, nlohmann::json fields);

    size_t count(const std::string& type) const;
    Stats stats() const;

private:
    friend class MemoryPushChannel;

    void attach(MemoryPushChannel* channel);
    void detach(MemoryPushChannel* channel);
    void notify(const std::string& type, const std::string& id, ChangeReason reason);
    std::expected<void, StoreError> check_query(const Query& query) const;

    using Key = std::pair<std::string, std::string>;

    Options options_;
    std::atomic<bool> available_{true};

    mutable std::mutex mu_;
    std::map<Key, Record> records_;
    std::set<std::string> known_types_;
    std::map<std::string, Subscription> subscriptions_;
    uint64_t next_tag_ = 1;
    Stats stats_;

    std::mutex channels_mu_;
    std::vector<MemoryPushChannel*> channels_;
};

// Synchronous push channel for a MemoryRecordStore: the handler runs on the
// thread that performed the write.
class MemoryPushChannel : public PushChannel {
public:
    explicit MemoryPushChannel(MemoryRecordStore& store);
    ~MemoryPushChannel() override;

    MemoryPushChannel(const MemoryPushChannel&) = delete;
    MemoryPushChannel& operator=(const MemoryPushChannel&) = delete;

    bool start(Handler handler) override;
    void stop() override;

    // Drop deliveries instead of calling the handler (push is best effort).
    void set_dropping(bool dropping) { dropping_.store(dropping); }

private:
    friend class MemoryRecordStore;
    void deliver(const ChangeNotification& note);

    MemoryRecordStore& store_;
    std::mutex mu_;
    Handler handler_;
    std::atomic<bool> dropping_{false};
};
