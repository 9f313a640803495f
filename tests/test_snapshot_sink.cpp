// tests/test_snapshot_sink.cpp
#include <filesystem>
#include <gtest/gtest.h>
#include <sqlite3.h>
#include <string>

#include "snapshot_sink.hpp"

struct TempDb
{
    std::filesystem::path path;
    explicit TempDb(const std::string &name)
    {
        path = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove(path);
    }
    ~TempDb()
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        std::filesystem::remove(path.string() + "-wal", ec);
        std::filesystem::remove(path.string() + "-shm", ec);
    }
};

// Reads html_content back through a separate connection.
static std::string stored_html(const std::string &path, const std::string &job_id)
{
    sqlite3 *db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK)
    {
        sqlite3_close(db);
        return "<open failed>";
    }
    sqlite3_stmt *stmt = nullptr;
    std::string   out;
    if (sqlite3_prepare_v2(db, "SELECT html_content FROM page_snapshots WHERE id = ?;", -1, &stmt, nullptr) == SQLITE_OK)
    {
        sqlite3_bind_text(stmt, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) == SQLITE_ROW)
        {
            const void *blob  = sqlite3_column_blob(stmt, 0);
            int         bytes = sqlite3_column_bytes(stmt, 0);
            if (blob && bytes > 0)
                out.assign(static_cast<const char *>(blob), static_cast<std::size_t>(bytes));
        }
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return out;
}

static CompletedCapture capture(const std::string &id, const std::string &bytes)
{
    CompletedCapture c;
    c.job_id      = id;
    c.payload     = bytes;
    c.chunk_count = 3;
    c.metadata    = {{"url", "http://example.com"}, {"title", "Example"}, {"capturedAt", "2024-01-01T00:00:00.000Z"}};
    return c;
}

TEST(SqliteSnapshotSink, StoresBinaryPayload)
{
    TempDb             db("swerve-sink-test.db");
    SqliteSnapshotSink sink(db.path.string());
    EXPECT_EQ(sink.count(), 0);

    std::string bytes("<html>\0\xFF</html>", 15);
    sink.deliver(capture("job_a", bytes));
    EXPECT_EQ(sink.count(), 1);
    EXPECT_EQ(stored_html(db.path.string(), "job_a"), bytes);
    EXPECT_EQ(stored_html(db.path.string(), "job_missing"), "");
    EXPECT_EQ(sink.describe(), db.path.string());
}

TEST(SqliteSnapshotSink, ReplacesSameJob)
{
    TempDb             db("swerve-sink-replace.db");
    SqliteSnapshotSink sink(db.path.string());
    sink.deliver(capture("job_b", "one"));
    sink.deliver(capture("job_b", "two"));
    EXPECT_EQ(sink.count(), 1);
    EXPECT_EQ(stored_html(db.path.string(), "job_b"), "two");
}

TEST(SqliteSnapshotSink, SurvivesReopen)
{
    TempDb db("swerve-sink-reopen.db");
    {
        SqliteSnapshotSink sink(db.path.string());
        sink.deliver(capture("job_c", "kept"));
    }
    SqliteSnapshotSink again(db.path.string());
    EXPECT_EQ(again.count(), 1);
    EXPECT_EQ(stored_html(db.path.string(), "job_c"), "kept");
}

TEST(SqliteSnapshotSink, BadPathThrows)
{
    EXPECT_THROW(SqliteSnapshotSink("/nonexistent-dir/for/swerve/test.db"), std::runtime_error);
}
