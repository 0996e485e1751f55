#include "storage/history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    fs::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            std::println(stderr, "db: cannot create {}: {}", p.parent_path().string(), ec.message());
        }
    }

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    char* err = nullptr;
    if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err) != SQLITE_OK) {
        // In-memory databases refuse WAL; not fatal.
        std::println(stderr, "db: WAL unavailable: {}", err ? err : "unknown");
        sqlite3_free(err);
    }

    if (!create_tables()) {
        close();
        return false;
    }

    const char* insert_sql =
        "INSERT INTO sessions (device_id, args, duration, exit_code, end_reason) "
        "VALUES (?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, device_id, args, duration, exit_code, end_reason "
        "FROM sessions WHERE (?2 = '' OR device_id = ?2) ORDER BY id DESC LIMIT ?1";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    return true;
}

void HistoryDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert(const std::string& device_id, const std::vector<std::string>& args,
                       double duration, std::optional<int> exit_code,
                       const std::string& end_reason) {
    if (!insert_stmt_) return false;

    std::string args_text;
    for (const auto& a : args) {
        if (!args_text.empty()) args_text += ' ';
        args_text += a;
    }

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, device_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, args_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insert_stmt_, 3, duration);
    if (exit_code) sqlite3_bind_int(insert_stmt_, 4, *exit_code);
    else sqlite3_bind_null(insert_stmt_, 4);
    sqlite3_bind_text(insert_stmt_, 5, end_reason.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit, const std::string& device_id) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);
    sqlite3_bind_text(recent_stmt_, 2, device_id.c_str(), -1, SQLITE_TRANSIENT);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    int rc;
    while ((rc = sqlite3_step(recent_stmt_)) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.device_id = get_text(recent_stmt_, 2);
        e.args = get_text(recent_stmt_, 3);
        e.duration = sqlite3_column_double(recent_stmt_, 4);
        if (sqlite3_column_type(recent_stmt_, 5) != SQLITE_NULL) {
            e.exit_code = sqlite3_column_int(recent_stmt_, 5);
        }
        e.end_reason = get_text(recent_stmt_, 6);
        entries.push_back(std::move(e));
    }
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: query failed: {}", sqlite3_errmsg(db_));
    }

    return entries;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS sessions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            device_id TEXT NOT NULL,
            args TEXT NOT NULL,
            duration REAL,
            exit_code INTEGER,
            end_reason TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS sessions_device ON sessions(device_id);
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
