#pragma once
#include "job.hpp"
#include <mutex>
#include <string>

// Downstream consumer of reassembled captures.
class SnapshotSink {
public:
    virtual ~SnapshotSink() = default;
    virtual void deliver(const CompletedCapture& capture) = 0;
    virtual long long count() = 0;
    virtual std::string describe() const = 0;
};

class SqliteSnapshotSink : public SnapshotSink {
public:
    explicit SqliteSnapshotSink(const std::string& db_path);
    ~SqliteSnapshotSink() override;

    SqliteSnapshotSink(const SqliteSnapshotSink&) = delete;
    SqliteSnapshotSink& operator=(const SqliteSnapshotSink&) = delete;

    void deliver(const CompletedCapture& capture) override;
    long long count() override;
    std::string describe() const override { return path_; }

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();

    std::string path_;
    std::mutex mtx_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* count_stmt_ {nullptr};
};
