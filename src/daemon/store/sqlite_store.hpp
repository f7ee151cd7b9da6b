#pragma once

#include "store/record_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <thread>

// Record store in a SQLite file. Several daemons (a source and one or more
// remote monitors on the same host or a shared mount) can open the same
// file; WAL mode plus a busy timeout serialise their writes. Every write
// appends to a change log that SqlitePushChannel tails.
class SqliteRecordStore : public RecordStore {
public:
    SqliteRecordStore();
    ~SqliteRecordStore() override;

    SqliteRecordStore(const SqliteRecordStore&) = delete;
    SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

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
    bool create_tables();
    bool type_known(const std::string& type);
    bool log_change(const std::string& type, const std::string& id, ChangeReason reason);
    StoreError db_error(const std::string& what) const;

    std::mutex mu_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* fetch_stmt_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* update_stmt_ = nullptr;
    sqlite3_stmt* delete_stmt_ = nullptr;
    sqlite3_stmt* change_stmt_ = nullptr;
    sqlite3_stmt* type_stmt_ = nullptr;
    sqlite3_stmt* add_type_stmt_ = nullptr;
};

// Tails the change log of a SqliteRecordStore file on its own connection and
// thread, matching rows against the registered subscriptions.
class SqlitePushChannel : public PushChannel {
public:
    explicit SqlitePushChannel(std::string path,
                               std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));
    ~SqlitePushChannel() override;

    SqlitePushChannel(const SqlitePushChannel&) = delete;
    SqlitePushChannel& operator=(const SqlitePushChannel&) = delete;

    bool start(Handler handler) override;
    void stop() override;

    // One poll step; returns the number of notifications delivered.
    size_t poll_once();

private:
    std::string path_;
    std::chrono::milliseconds poll_interval_;
    sqlite3* db_ = nullptr;
    int64_t last_seq_ = 0;
    Handler handler_;
    std::jthread thread_;
};
