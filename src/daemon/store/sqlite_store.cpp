#include "store/sqlite_store.hpp"

#include "store/query_eval.hpp"

#include <charconv>
#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

// Statements are reset on scope exit so a failed step never leaves one busy.
struct StmtReset {
    sqlite3_stmt* stmt;
    ~StmtReset() {
        if (stmt) {
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }
    }
};

void bind_value(sqlite3_stmt* stmt, int idx, const json& value) {
    if (value.is_number_integer()) {
        sqlite3_bind_int64(stmt, idx, value.get<int64_t>());
    } else if (value.is_number()) {
        sqlite3_bind_double(stmt, idx, value.get<double>());
    } else if (value.is_boolean()) {
        sqlite3_bind_int(stmt, idx, value.get<bool>() ? 1 : 0);
    } else if (value.is_string()) {
        sqlite3_bind_text(stmt, idx, value.get_ref<const std::string&>().c_str(), -1,
                          SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

std::expected<Record, StoreError> read_record(sqlite3_stmt* stmt, const std::string& type) {
    Record rec;
    rec.type = type;
    rec.id = column_text(stmt, 0);
    rec.change_tag = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
    try {
        rec.fields = json::parse(column_text(stmt, 2));
    } catch (const json::exception& e) {
        return std::unexpected(StoreError{StoreErrorKind::Malformed,
                                          std::format("{}/{}: {}", type, rec.id, e.what())});
    }
    return rec;
}

} // namespace

SqliteRecordStore::SqliteRecordStore() = default;

SqliteRecordStore::~SqliteRecordStore() {
    close();
}

bool SqliteRecordStore::open(const std::string& path) {
    std::lock_guard lock(mu_);

    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::println(stderr, "store: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    struct Prepared {
        const char* sql;
        sqlite3_stmt** stmt;
    };
    const Prepared statements[] = {
        {"SELECT id, change_tag, fields FROM records WHERE type = ? AND id = ?", &fetch_stmt_},
        {"INSERT INTO records (type, id, change_tag, fields) VALUES (?, ?, 1, ?)", &insert_stmt_},
        {"UPDATE records SET fields = ?, change_tag = change_tag + 1 "
         "WHERE type = ? AND id = ? RETURNING change_tag", &update_stmt_},
        {"DELETE FROM records WHERE type = ? AND id = ?", &delete_stmt_},
        {"INSERT INTO changes (type, id, reason) VALUES (?, ?, ?)", &change_stmt_},
        {"SELECT 1 FROM record_types WHERE type = ?", &type_stmt_},
        {"INSERT OR IGNORE INTO record_types (type) VALUES (?)", &add_type_stmt_},
    };

    for (const auto& s : statements) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.stmt, nullptr) != SQLITE_OK) {
            std::println(stderr, "store: prepare failed: {} ({})", sqlite3_errmsg(db_), s.sql);
            return false;
        }
    }

    return true;
}

void SqliteRecordStore::close() {
    std::lock_guard lock(mu_);
    for (auto** stmt : {&fetch_stmt_, &insert_stmt_, &update_stmt_, &delete_stmt_,
                        &change_stmt_, &type_stmt_, &add_type_stmt_}) {
        if (*stmt) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
    }
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteRecordStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS records (
            type TEXT NOT NULL,
            id TEXT NOT NULL,
            change_tag INTEGER NOT NULL,
            fields TEXT NOT NULL,
            PRIMARY KEY (type, id)
        );
        CREATE TABLE IF NOT EXISTS record_types (
            type TEXT PRIMARY KEY
        );
        CREATE TABLE IF NOT EXISTS subscriptions (
            id TEXT PRIMARY KEY,
            record_type TEXT NOT NULL,
            options TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS changes (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            type TEXT NOT NULL,
            id TEXT NOT NULL,
            reason TEXT NOT NULL,
            at REAL NOT NULL DEFAULT (julianday('now'))
        );
        CREATE INDEX IF NOT EXISTS idx_records_timestamp
            ON records (type, json_extract(fields, '$.timestamp'));
        CREATE INDEX IF NOT EXISTS idx_records_session
            ON records (type, json_extract(fields, '$.sessionId'), json_extract(fields, '$.responded'));
        DELETE FROM changes WHERE at < julianday('now') - 1;
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "store: create tables failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

StoreError SqliteRecordStore::db_error(const std::string& what) const {
    int code = db_ ? sqlite3_errcode(db_) : SQLITE_CANTOPEN;
    auto kind = (code == SQLITE_BUSY || code == SQLITE_LOCKED || code == SQLITE_CANTOPEN)
                    ? StoreErrorKind::Unavailable
                    : StoreErrorKind::Transport;
    return StoreError{kind, what + ": " + (db_ ? sqlite3_errmsg(db_) : "database not open")};
}

std::expected<void, StoreError> SqliteRecordStore::check_account() {
    std::lock_guard lock(mu_);
    if (!db_) return std::unexpected(StoreError{StoreErrorKind::Unavailable, "database not open"});
    return {};
}

bool SqliteRecordStore::type_known(const std::string& type) {
    StmtReset guard{type_stmt_};
    sqlite3_bind_text(type_stmt_, 1, type.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(type_stmt_) == SQLITE_ROW;
}

bool SqliteRecordStore::log_change(const std::string& type, const std::string& id,
                                   ChangeReason reason) {
    StmtReset guard{change_stmt_};
    auto reason_str = std::string(to_string(reason));
    sqlite3_bind_text(change_stmt_, 1, type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(change_stmt_, 2, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(change_stmt_, 3, reason_str.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(change_stmt_) == SQLITE_DONE;
}

std::expected<Record, StoreError> SqliteRecordStore::fetch(const std::string& type,
                                                           const std::string& id) {
    std::lock_guard lock(mu_);
    if (!db_) return std::unexpected(StoreError{StoreErrorKind::Unavailable, "database not open"});

    StmtReset guard{fetch_stmt_};
    sqlite3_bind_text(fetch_stmt_, 1, type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(fetch_stmt_, 2, id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(fetch_stmt_);
    if (rc == SQLITE_DONE) {
        return std::unexpected(StoreError{StoreErrorKind::NotFound, type + "/" + id});
    }
    if (rc != SQLITE_ROW) return std::unexpected(db_error("fetch " + type + "/" + id));

    return read_record(fetch_stmt_, type);
}

std::expected<Record, StoreError> SqliteRecordStore::save(const Record& record) {
    std::lock_guard lock(mu_);
    if (!db_) return std::unexpected(StoreError{StoreErrorKind::Unavailable, "database not open"});

    auto body = record.fields.dump();
    Record stored = record;

    if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
        return std::unexpected(db_error("begin"));
    }
    auto rollback = [this] { sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr); };

    ChangeReason reason;
    if (!record.change_tag) {
        StmtReset guard{insert_stmt_};
        sqlite3_bind_text(insert_stmt_, 1, record.type.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(insert_stmt_, 2, record.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(insert_stmt_, 3, body.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(insert_stmt_);
        if (rc == SQLITE_CONSTRAINT) {
            rollback();
            return std::unexpected(StoreError{StoreErrorKind::Conflict,
                                              record.type + "/" + record.id + " already exists"});
        }
        if (rc != SQLITE_DONE) {
            auto err = db_error("insert " + record.type + "/" + record.id);
            rollback();
            return std::unexpected(err);
        }
        stored.change_tag = 1;
        reason = ChangeReason::Created;
    } else {
        StmtReset guard{update_stmt_};
        sqlite3_bind_text(update_stmt_, 1, body.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(update_stmt_, 2, record.type.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(update_stmt_, 3, record.id.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(update_stmt_);
        if (rc == SQLITE_DONE) {
            rollback();
            return std::unexpected(StoreError{StoreErrorKind::NotFound,
                                              record.type + "/" + record.id + " was deleted"});
        }
        if (rc != SQLITE_ROW) {
            auto err = db_error("update " + record.type + "/" + record.id);
            rollback();
            return std::unexpected(err);
        }
        stored.change_tag = static_cast<uint64_t>(sqlite3_column_int64(update_stmt_, 0));
        reason = ChangeReason::Updated;
    }

    {
        StmtReset guard{add_type_stmt_};
        sqlite3_bind_text(add_type_stmt_, 1, record.type.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(add_type_stmt_) != SQLITE_DONE) {
            auto err = db_error("register type " + record.type);
            rollback();
            return std::unexpected(err);
        }
    }

    if (!log_change(record.type, record.id, reason) ||
        sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        auto err = db_error("commit " + record.type + "/" + record.id);
        rollback();
        return std::unexpected(err);
    }
    return stored;
}

std::expected<void, StoreError> SqliteRecordStore::remove(const std::string& type,
                                                          const std::string& id) {
    std::lock_guard lock(mu_);
    if (!db_) return std::unexpected(StoreError{StoreErrorKind::Unavailable, "database not open"});

    StmtReset guard{delete_stmt_};
    sqlite3_bind_text(delete_stmt_, 1, type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(delete_stmt_, 2, id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(delete_stmt_) != SQLITE_DONE) {
        return std::unexpected(db_error("delete " + type + "/" + id));
    }
    if (sqlite3_changes(db_) == 0) {
        return std::unexpected(StoreError{StoreErrorKind::NotFound, type + "/" + id});
    }
    if (!log_change(type, id, ChangeReason::Deleted)) {
        // The delete stands; push receivers only miss this one notification.
        std::println(stderr, "store: logging delete of {}/{} failed: {}", type, id,
                     sqlite3_errmsg(db_));
    }
    return {};
}

std::expected<QueryPage, StoreError> SqliteRecordStore::query(
    const Query& query, const std::optional<std::string>& cursor) {
    for (const auto& p : query.predicates) {
        if (!is_valid_field_name(p.field)) {
            return std::unexpected(StoreError{StoreErrorKind::NotQueryable, "bad field " + p.field});
        }
    }
    if (!query.sort_field.empty() && !is_valid_field_name(query.sort_field)) {
        return std::unexpected(
            StoreError{StoreErrorKind::NotQueryable, "bad sort field " + query.sort_field});
    }

    int64_t offset = 0;
    if (cursor) {
        auto [ptr, ec] = std::from_chars(cursor->data(), cursor->data() + cursor->size(), offset);
        if (ec != std::errc{} || offset < 0) {
            return std::unexpected(StoreError{StoreErrorKind::Malformed, "bad cursor"});
        }
    }

    std::string sql = "SELECT id, change_tag, fields FROM records WHERE type = ?";
    for (const auto& p : query.predicates) {
        sql += std::format(" AND json_extract(fields, '$.{}') {} ?", p.field,
                           p.op == PredicateOp::Equal ? "=" : ">=");
    }
    if (!query.sort_field.empty()) {
        sql += std::format(" ORDER BY json_extract(fields, '$.{}') {}, id", query.sort_field,
                           query.descending ? "DESC" : "ASC");
    } else {
        sql += " ORDER BY id";
    }
    // One extra row tells us whether another page exists.
    int64_t limit = query.limit == 0 ? -1 : static_cast<int64_t>(query.limit) + 1;
    sql += " LIMIT ? OFFSET ?";

    std::lock_guard lock(mu_);
    if (!db_) return std::unexpected(StoreError{StoreErrorKind::Unavailable, "database not open"});
    if (!type_known(query.type)) {
        return std::unexpected(StoreError{StoreErrorKind::UnknownType,
                                          "record type " + query.type + " does not exist"});
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::unexpected(db_error("prepare query"));
    }

    int idx = 1;
    sqlite3_bind_text(stmt, idx++, query.type.c_str(), -1, SQLITE_TRANSIENT);
    for (const auto& p : query.predicates) {
        bind_value(stmt, idx++, p.value);
    }
    sqlite3_bind_int64(stmt, idx++, limit);
    sqlite3_bind_int64(stmt, idx++, offset);

    QueryPage page;
    bool more = false;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        if (query.limit != 0 && page.records.size() == query.limit) {
            more = true;
            break;
        }
        auto rec = read_record(stmt, query.type);
        if (!rec) {
            // Keep the row so the caller can count it; fields stay null.
            page.records.push_back(Record{.type = query.type,
                                          .id = column_text(stmt, 0),
                                          .fields = json(),
                                          .change_tag = std::nullopt});
            continue;
        }
        page.records.push_back(std::move(*rec));
    }
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        auto err = db_error("query " + query.type);
        sqlite3_finalize(stmt);
        return std::unexpected(err);
    }
    sqlite3_finalize(stmt);

    if (more) {
        page.cursor = std::to_string(offset + static_cast<int64_t>(page.records.size()));
    }
    return page;
}

std::expected<std::vector<Subscription>, StoreError> SqliteRecordStore::subscriptions() {
    std::lock_guard lock(mu_);
    if (!db_) return std::unexpected(StoreError{StoreErrorKind::Unavailable, "database not open"});

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT id, record_type, options FROM subscriptions ORDER BY id", -1,
                           &stmt, nullptr) != SQLITE_OK) {
        return std::unexpected(db_error("prepare subscriptions"));
    }

    std::vector<Subscription> subs;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Subscription sub;
        sub.id = column_text(stmt, 0);
        sub.record_type = column_text(stmt, 1);
        try {
            auto options = json::parse(column_text(stmt, 2));
            sub.fires_on_create = options.value("create", true);
            sub.fires_on_update = options.value("update", true);
            sub.fires_on_delete = options.value("delete", true);
            sub.silent = options.value("silent", true);
            sub.alert_body = options.value("alert_body", "");
        } catch (const json::exception& e) {
            std::println(stderr, "store: subscription {} has bad options: {}", sub.id, e.what());
            continue;
        }
        subs.push_back(std::move(sub));
    }
    sqlite3_finalize(stmt);
    return subs;
}

std::expected<void, StoreError> SqliteRecordStore::save_subscription(const Subscription& sub) {
    std::lock_guard lock(mu_);
    if (!db_) return std::unexpected(StoreError{StoreErrorKind::Unavailable, "database not open"});
    if (!type_known(sub.record_type)) {
        return std::unexpected(StoreError{StoreErrorKind::UnknownType,
                                          "record type " + sub.record_type + " does not exist"});
    }

    json options = {
        {"create", sub.fires_on_create},
        {"update", sub.fires_on_update},
        {"delete", sub.fires_on_delete},
        {"silent", sub.silent},
        {"alert_body", sub.alert_body},
    };
    auto options_str = options.dump();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_,
                           "INSERT OR REPLACE INTO subscriptions (id, record_type, options) "
                           "VALUES (?, ?, ?)",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return std::unexpected(db_error("prepare save subscription"));
    }
    sqlite3_bind_text(stmt, 1, sub.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, sub.record_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, options_str.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) return std::unexpected(db_error("save subscription " + sub.id));
    return {};
}

std::expected<void, StoreError> SqliteRecordStore::remove_subscription(const std::string& id) {
    std::lock_guard lock(mu_);
    if (!db_) return std::unexpected(StoreError{StoreErrorKind::Unavailable, "database not open"});

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM subscriptions WHERE id = ?", -1, &stmt, nullptr) !=
        SQLITE_OK) {
        return std::unexpected(db_error("prepare remove subscription"));
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) return std::unexpected(db_error("remove subscription " + id));
    if (sqlite3_changes(db_) == 0) {
        return std::unexpected(StoreError{StoreErrorKind::NotFound, "subscription " + id});
    }
    return {};
}

SqlitePushChannel::SqlitePushChannel(std::string path, std::chrono::milliseconds poll_interval)
    : path_(std::move(path)), poll_interval_(poll_interval) {}

SqlitePushChannel::~SqlitePushChannel() {
    stop();
}

bool SqlitePushChannel::start(Handler handler) {
    if (db_) return true;

    int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        std::println(stderr, "store: push channel cannot open {}: {}", path_, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);

    // Start from the current end of the log; older changes are already
    // reflected in whatever the first full fetch returns.
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COALESCE(MAX(seq), 0) FROM changes", -1, &stmt, nullptr) ==
        SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) last_seq_ = sqlite3_column_int64(stmt, 0);
        sqlite3_finalize(stmt);
    }

    handler_ = std::move(handler);
    thread_ = std::jthread([this](std::stop_token stop) {
        while (!stop.stop_requested()) {
            poll_once();
            std::this_thread::sleep_for(poll_interval_);
        }
    });
    return true;
}

void SqlitePushChannel::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

size_t SqlitePushChannel::poll_once() {
    if (!db_ || !handler_) return 0;

    const char* sql =
        "SELECT c.seq, c.type, c.id, c.reason, s.id, s.options FROM changes c "
        "JOIN subscriptions s ON s.record_type = c.type "
        "WHERE c.seq > ? ORDER BY c.seq";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        // Tables not created yet by any writer.
        return 0;
    }
    sqlite3_bind_int64(stmt, 1, last_seq_);

    std::vector<ChangeNotification> notes;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        last_seq_ = std::max(last_seq_, sqlite3_column_int64(stmt, 0));

        auto reason = parse_change_reason(column_text(stmt, 3));
        if (!reason) continue;

        Subscription sub;
        try {
            auto options = json::parse(column_text(stmt, 5));
            sub.fires_on_create = options.value("create", true);
            sub.fires_on_update = options.value("update", true);
            sub.fires_on_delete = options.value("delete", true);
        } catch (const json::exception&) {
            continue;
        }
        if (!sub.fires_on(*reason)) continue;

        notes.push_back(ChangeNotification{
            .subscription_id = column_text(stmt, 4),
            .record_type = column_text(stmt, 1),
            .record_id = column_text(stmt, 2),
            .reason = *reason,
        });
    }
    sqlite3_finalize(stmt);

    for (const auto& n : notes) handler_(n);
    return notes.size();
}
