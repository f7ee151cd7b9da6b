#pragma once

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

// One response routed into a local session.
struct DeliveryEntry {
    int64_t id = 0;
    std::string timestamp;
    std::string prompt_id;
    std::string session_id;
    std::string project;
    std::string response_text;
    std::string responded_from;
    std::string path; // "injected" or "fallback"
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();

    bool insert(const DeliveryEntry& entry);

    std::vector<DeliveryEntry> recent(int limit = 10);

    // Deliveries recorded for one session, newest first.
    std::vector<DeliveryEntry> for_session(const std::string& session_id, int limit = 10);

private:
    bool create_tables();
    std::vector<DeliveryEntry> read_rows(sqlite3_stmt* stmt);

    std::mutex mu_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* session_stmt_ = nullptr;
};
