#pragma once
#include "job_store.hpp"
#include "snapshot_sink.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct HttpReply {
    int status{200};
    nlohmann::json body;
};

struct CollectorConfig {
    int port{3000};
    std::string db_path{"./data/swerve.db"}; // empty: keep captures in memory only
    std::string public_url;                 // base for trackUrl; derived from port when empty
    StoreLimits limits;
    std::chrono::seconds sweep_interval{10};
    std::size_t max_body_bytes{64 * 1024 * 1024};
};

CollectorConfig collector_config_from_env();

// HTTP-independent request handling for the collector; the server only
// routes bodies and headers here.
class IngestService {
public:
    IngestService(JobStore& store, SnapshotSink* sink, std::string public_url);

    // POST /ingest. `authorization` is the raw Authorization header.
    HttpReply ingest(const std::string& body, const std::string& authorization = {});
    // GET /jobs/:jobId
    HttpReply job_status(const std::string& job_id) const;
    HttpReply health() const;
    HttpReply info() const;
    HttpReply stats() const;

private:
    HttpReply on_chunk(const ChunkMessage& m, bool token_used);
    HttpReply on_finalization(const FinalizationMessage& m);
    // Hands a capture to the sink; a 500 reply when it refuses.
    std::optional<HttpReply> deliver(const CompletedCapture& c);
    std::string track_url(const std::string& job_id) const;

    JobStore& store_;
    SnapshotSink* sink_;
    std::string public_url_;
};

HttpReply error_reply(int status, const std::string& error, const std::string& message);
