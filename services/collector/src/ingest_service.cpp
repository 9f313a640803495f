#include "../include/ingest_service.hpp"
#include "../../../shared/cpp/swerve_proto/include/util.hpp"
#include <iostream>

using json = nlohmann::json;

HttpReply error_reply(int status, const std::string& error, const std::string& message) {
    return {status, json{{"error", error}, {"message", message}}};
}

CollectorConfig collector_config_from_env() {
    CollectorConfig cfg;
    cfg.port = (int)getenv_long_or("COLLECTOR_PORT", cfg.port);
    cfg.db_path = getenv_or("COLLECTOR_DB_PATH", cfg.db_path);
    cfg.public_url = getenv_or("COLLECTOR_PUBLIC_URL", "");
    cfg.limits.retention = std::chrono::seconds(getenv_long_or("COLLECTOR_RETENTION_S", cfg.limits.retention.count()));
    cfg.limits.incomplete_ttl =
        std::chrono::seconds(getenv_long_or("COLLECTOR_INCOMPLETE_TTL_S", cfg.limits.incomplete_ttl.count()));
    cfg.sweep_interval = std::chrono::seconds(getenv_long_or("COLLECTOR_SWEEP_S", cfg.sweep_interval.count()));
    return cfg;
}

IngestService::IngestService(JobStore& store, SnapshotSink* sink, std::string public_url)
    : store_(store), sink_(sink), public_url_(std::move(public_url)) {
    if (!public_url_.empty() && public_url_.back() == '/') public_url_.pop_back();
}

std::string IngestService::track_url(const std::string& job_id) const {
    return public_url_ + "/jobs/" + job_id;
}

HttpReply IngestService::ingest(const std::string& body, const std::string& authorization) {
    bool token_used = false;
    if (!authorization.empty()) {
        if (authorization.rfind("Bearer ", 0) != 0) {
            return error_reply(401, "Unauthorized", "Invalid or missing authentication token");
        }
        token_used = true;
    }

    try {
        IngestMessage msg = decode_message(body);
        if (auto* c = std::get_if<ChunkMessage>(&msg)) return on_chunk(*c, token_used);
        return on_finalization(std::get<FinalizationMessage>(msg));
    } catch (const ProtocolMismatchError& e) {
        std::cerr << "[collector] rejected message: " << e.what() << std::endl;
        return error_reply(400, "Bad Request", e.what());
    } catch (const JobNotFoundError& e) {
        return error_reply(404, "Not Found", e.what());
    }
}

std::optional<HttpReply> IngestService::deliver(const CompletedCapture& c) {
    if (!sink_) return std::nullopt;
    try {
        sink_->deliver(c);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] storing " << c.job_id << ": " << e.what() << std::endl;
        store_.release_delivery(c.job_id);
        return error_reply(500, "Internal Server Error", "Failed to store page snapshot");
    }
    store_.confirm_delivery(c.job_id);
    std::cout << "[collector] stored " << c.job_id << " (" << c.payload.size() << " bytes, sha256 "
              << sha256_hex(c.payload) << ")" << std::endl;
    return std::nullopt;
}

HttpReply IngestService::on_chunk(const ChunkMessage& m, bool token_used) {
    ChunkReceipt r = store_.accept_chunk(m, token_used);
    if (r.completed) {
        if (auto failed = deliver(*r.completed)) return *failed;
    }
    ChunkAck ack;
    ack.job_id = m.job_id;
    ack.track_url = track_url(m.job_id);
    ack.chunk_received = r.chunk_received;
    ack.total_chunks = r.total_chunks;
    ack.is_complete = r.is_complete;
    return {202, to_json(ack)};
}

HttpReply IngestService::on_finalization(const FinalizationMessage& m) {
    FinalizeReceipt r = store_.finalize(m);
    if (r.completed) {
        if (auto failed = deliver(*r.completed)) return *failed;
    }
    FinalizationAck ack;
    ack.job_id = m.job_id;
    ack.chunks_received = r.chunks_received;
    ack.total_expected = r.total_expected;
    return {200, to_json(ack)};
}

HttpReply IngestService::job_status(const std::string& job_id) const {
    auto s = store_.status(job_id);
    if (!s) return error_reply(404, "Not Found", "Job not found");
    return {200, json{
        {"jobId", s->id},
        {"status", job_state_name(s->state)},
        {"chunksReceived", s->chunks_received},
        {"totalExpected", s->expected_total},
        {"finalized", s->finalized},
        {"delivered", s->delivered},
        {"createdAt", s->created_iso}
    }};
}

HttpReply IngestService::health() const {
    return {200, json{{"status", "ok"}, {"activeJobs", store_.size()}, {"timestamp", iso8601_now()}}};
}

HttpReply IngestService::info() const {
    return {200, json{
        {"service", "Swerve Collector"},
        {"version", "1.0.0"},
        {"status", "running"},
        {"endpoints", {
            {"ingest", "POST /ingest"},
            {"track", "GET /jobs/:jobId"},
            {"health", "GET /health"},
            {"stats", "GET /stats"}
        }}
    }};
}

HttpReply IngestService::stats() const {
    json out = {{"activeJobs", store_.size()}};
    if (sink_) {
        try {
            out["totalSnapshots"] = sink_->count();
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] counting snapshots: " << e.what() << std::endl;
            return error_reply(500, "Internal Server Error", "Failed to read snapshot count");
        }
        out["database"] = sink_->describe();
    } else {
        out["totalSnapshots"] = 0;
        out["database"] = nullptr;
    }
    return {200, out};
}
