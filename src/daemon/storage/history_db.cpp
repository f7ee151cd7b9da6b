#include "history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    std::lock_guard lock(mu_);

    // Ensure parent directory exists
    fs::path p(path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO responses (prompt_id, session_id, project, response_text, "
        "responded_from, path) VALUES (?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, prompt_id, session_id, project, response_text, "
        "responded_from, path FROM responses ORDER BY id DESC LIMIT ?";

    const char* session_sql =
        "SELECT id, timestamp, prompt_id, session_id, project, response_text, "
        "responded_from, path FROM responses WHERE session_id = ? ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, session_sql, -1, &session_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare session query failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

void HistoryDb::close() {
    std::lock_guard lock(mu_);
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (session_stmt_) { sqlite3_finalize(session_stmt_); session_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert(const DeliveryEntry& entry) {
    std::lock_guard lock(mu_);
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    sqlite3_bind_text(insert_stmt_, 1, entry.prompt_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, entry.session_id.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(3, entry.project);
    sqlite3_bind_text(insert_stmt_, 4, entry.response_text.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(5, entry.responded_from);
    sqlite3_bind_text(insert_stmt_, 6, entry.path.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<DeliveryEntry> HistoryDb::read_rows(sqlite3_stmt* stmt) {
    auto get_text = [](sqlite3_stmt* s, int col) -> std::string {
        auto* p = sqlite3_column_text(s, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    std::vector<DeliveryEntry> entries;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        DeliveryEntry e;
        e.id = sqlite3_column_int64(stmt, 0);
        e.timestamp = get_text(stmt, 1);
        e.prompt_id = get_text(stmt, 2);
        e.session_id = get_text(stmt, 3);
        e.project = get_text(stmt, 4);
        e.response_text = get_text(stmt, 5);
        e.responded_from = get_text(stmt, 6);
        e.path = get_text(stmt, 7);
        entries.push_back(std::move(e));
    }
    return entries;
}

std::vector<DeliveryEntry> HistoryDb::recent(int limit) {
    std::lock_guard lock(mu_);
    if (!recent_stmt_) return {};

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);
    return read_rows(recent_stmt_);
}

std::vector<DeliveryEntry> HistoryDb::for_session(const std::string& session_id, int limit) {
    std::lock_guard lock(mu_);
    if (!session_stmt_) return {};

    sqlite3_reset(session_stmt_);
    sqlite3_bind_text(session_stmt_, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(session_stmt_, 2, limit);
    return read_rows(session_stmt_);
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS responses (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            prompt_id TEXT NOT NULL,
            session_id TEXT NOT NULL,
            project TEXT,
            response_text TEXT NOT NULL,
            responded_from TEXT,
            path TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_responses_session ON responses (session_id);
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
