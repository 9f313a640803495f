#include "../include/snapshot_sink.hpp"
#include "../../../shared/cpp/swerve_proto/include/util.hpp"
#include <sqlite3.h>
#include <stdexcept>

using json = nlohmann::json;

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void bind_opt_text(sqlite3_stmt* st, int idx, const json& meta, const char* key) {
    if (meta.is_object() && meta.contains(key) && meta[key].is_string()) {
        bind_text(st, idx, meta[key].get<std::string>());
    } else {
        sqlite3_bind_null(st, idx);
    }
}

SqliteSnapshotSink::SqliteSnapshotSink(const std::string& db_path) : path_(db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite DB: " + db_path + " (" + msg + ")");
    }
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteSnapshotSink::~SqliteSnapshotSink() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteSnapshotSink::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS page_snapshots (\n"
         "  id TEXT PRIMARY KEY,\n"
         "  url TEXT,\n"
         "  title TEXT,\n"
         "  referrer TEXT,\n"
         "  user_agent TEXT,\n"
         "  html_content BLOB NOT NULL,\n"
         "  metadata TEXT,\n"
         "  captured_at TEXT,\n"
         "  chunk_count INTEGER,\n"
         "  byte_size INTEGER,\n"
         "  sha256 TEXT,\n"
         "  auth_token_used INTEGER DEFAULT 0,\n"
         "  processing_ms INTEGER,\n"
         "  created_at DATETIME DEFAULT CURRENT_TIMESTAMP\n"
         ");");
}

void SqliteSnapshotSink::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void SqliteSnapshotSink::prepare_statements() {
    const char* ins = "INSERT OR REPLACE INTO page_snapshots \n"
                      "(id, url, title, referrer, user_agent, html_content, metadata, captured_at, \n"
                      " chunk_count, byte_size, sha256, auth_token_used, processing_ms) \n"
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, ins, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare insert failed");
    }
    const char* cnt = "SELECT COUNT(*) FROM page_snapshots;";
    if (sqlite3_prepare_v2(db_, cnt, -1, &count_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare count failed");
    }
}

void SqliteSnapshotSink::close_statements() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (count_stmt_) { sqlite3_finalize(count_stmt_); count_stmt_ = nullptr; }
}

void SqliteSnapshotSink::deliver(const CompletedCapture& c) {
    std::lock_guard<std::mutex> lock(mtx_);
    const json& m = c.metadata;
    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    bind_text(insert_stmt_, 1, c.job_id);
    bind_opt_text(insert_stmt_, 2, m, "url");
    bind_opt_text(insert_stmt_, 3, m, "title");
    bind_opt_text(insert_stmt_, 4, m, "referrer");
    bind_opt_text(insert_stmt_, 5, m, "userAgent");
    sqlite3_bind_blob(insert_stmt_, 6, c.payload.data(), (int)c.payload.size(), SQLITE_TRANSIENT);
    bind_text(insert_stmt_, 7, m.is_null() ? std::string("{}") : m.dump());
    bind_opt_text(insert_stmt_, 8, m, "capturedAt");
    sqlite3_bind_int(insert_stmt_, 9, c.chunk_count);
    sqlite3_bind_int64(insert_stmt_, 10, (sqlite3_int64)c.payload.size());
    bind_text(insert_stmt_, 11, sha256_hex(c.payload));
    sqlite3_bind_int(insert_stmt_, 12, c.auth_token_used ? 1 : 0);
    sqlite3_bind_int64(insert_stmt_, 13, (sqlite3_int64)c.processing_ms);
    int rc = sqlite3_step(insert_stmt_);
    sqlite3_reset(insert_stmt_);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("insert snapshot failed: ") + sqlite3_errmsg(db_));
    }
}

long long SqliteSnapshotSink::count() {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(count_stmt_);
    long long n = 0;
    if (sqlite3_step(count_stmt_) == SQLITE_ROW) n = sqlite3_column_int64(count_stmt_, 0);
    sqlite3_reset(count_stmt_);
    return n;
}
