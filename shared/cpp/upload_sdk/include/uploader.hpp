#pragma once
#include "transport_selector.hpp"
#include "../../swerve_proto/include/chunker.hpp"
#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class UploadState { NotStarted, Sending, AllSent, Finalized, Failed, Cancelled };

const char* upload_state_name(UploadState s);

struct Progress {
    std::size_t completed{0};
    std::size_t total{0};
};

struct UploadOptions {
    std::size_t max_chunk_size{kDefaultChunkSize};
    std::string job_id;              // generated when empty
    std::string encoding{"base64"};  // "plain" only for payloads that are valid UTF-8
};

// Shared flag; copies observe the same cancellation.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct UploadReport {
    std::string job_id;
    UploadState state{UploadState::NotStarted};
    std::size_t total_chunks{0};
    std::size_t chunks_sent{0};
    std::size_t chunks_confirmed{0};   // acknowledged by the server over the direct tier
    bool finalization_confirmed{false}; // server reported every chunk received
    std::vector<Tier> tiers_used;      // one entry per message delivered, finalization included
    std::optional<SendResult> failure; // the send that ended the upload
    std::optional<std::size_t> failed_index; // chunk index, or nullopt for finalization
};

// One capture transfer. Each call to next() performs exactly one send, so the
// caller decides when (and whether) the following chunk goes out.
//
//   Upload up(selector, payload, meta);
//   while (auto p = up.next()) show(p->completed, p->total);
//   if (up.state() != UploadState::Finalized) ...
class Upload {
public:
    Upload(TransportSelector& selector, std::string payload, nlohmann::json metadata,
           UploadOptions opts = {}, CancellationToken token = {});

    // Sends the next chunk (or the finalization message) and returns the
    // progress after it; the finalization send reports total/total again.
    // Returns nullopt once the upload is terminal.
    std::optional<Progress> next();

    // Drains next().
    const UploadReport& run();

    UploadState state() const { return report_.state; }
    // Index of the next chunk to send while Sending.
    std::size_t current_index() const { return next_index_; }
    const std::string& job_id() const { return report_.job_id; }
    const UploadReport& report() const { return report_; }

private:
    std::optional<Progress> send_chunk();
    std::optional<Progress> send_finalization();
    void fail(SendResult res, std::optional<std::size_t> index);

    TransportSelector& selector_;
    std::string payload_;
    nlohmann::json metadata_;
    UploadOptions opts_;
    CancellationToken token_;
    std::vector<ByteRange> ranges_;
    std::size_t next_index_{0};
    UploadReport report_;
};
