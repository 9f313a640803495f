#include "../include/uploader.hpp"
#include "../../swerve_proto/include/util.hpp"
#include "../../swerve_proto/include/wire.hpp"
#include <iostream>

using json = nlohmann::json;

const char* upload_state_name(UploadState s) {
    switch (s) {
        case UploadState::NotStarted: return "NotStarted";
        case UploadState::Sending: return "Sending";
        case UploadState::AllSent: return "AllSent";
        case UploadState::Finalized: return "Finalized";
        case UploadState::Failed: return "Failed";
        case UploadState::Cancelled: return "Cancelled";
    }
    return "?";
}

Upload::Upload(TransportSelector& selector, std::string payload, json metadata,
               UploadOptions opts, CancellationToken token)
    : selector_(selector),
      payload_(std::move(payload)),
      metadata_(std::move(metadata)),
      opts_(std::move(opts)),
      token_(std::move(token)) {
    ranges_ = split_ranges(payload_.size(), opts_.max_chunk_size);
    report_.job_id = opts_.job_id.empty() ? gen_job_id() : opts_.job_id;
    report_.total_chunks = ranges_.size();
}

std::optional<Progress> Upload::next() {
    switch (report_.state) {
        case UploadState::Finalized:
        case UploadState::Failed:
        case UploadState::Cancelled:
            return std::nullopt;
        default:
            break;
    }
    if (token_.cancelled()) {
        report_.state = UploadState::Cancelled;
        std::cerr << "[swerve] upload " << report_.job_id << " cancelled after "
                  << report_.chunks_sent << "/" << report_.total_chunks << " chunks" << std::endl;
        return std::nullopt;
    }
    if (report_.state == UploadState::AllSent) return send_finalization();
    return send_chunk();
}

const UploadReport& Upload::run() {
    while (next()) {
    }
    return report_;
}

std::optional<Progress> Upload::send_chunk() {
    report_.state = UploadState::Sending;
    const std::size_t i = next_index_;
    const ByteRange& r = ranges_[i];

    ChunkMessage m;
    m.job_id = report_.job_id;
    m.metadata = metadata_;
    m.index = static_cast<int>(i);
    m.total = static_cast<int>(ranges_.size());
    m.is_last = i + 1 == ranges_.size();
    m.encoding = opts_.encoding;
    m.bytes = payload_.substr(r.offset, r.length);

    SendResult res = selector_.send(encode_message(m));
    if (!res.ok()) {
        fail(std::move(res), i);
        return std::nullopt;
    }

    report_.tiers_used.push_back(res.tier);
    if (res.confirmed) {
        try {
            ChunkAck ack = chunk_ack_from_json(json::parse(res.response_body));
            if (ack.chunk_received == m.index + 1 && ack.total_chunks == m.total) {
                ++report_.chunks_confirmed;
            } else {
                std::cerr << "[swerve] unexpected ack for chunk " << i << ": chunkReceived="
                          << ack.chunk_received << " totalChunks=" << ack.total_chunks << std::endl;
            }
        } catch (const json::exception& e) {
            std::cerr << "[swerve] unreadable ack for chunk " << i << ": " << e.what() << std::endl;
        }
    }

    ++report_.chunks_sent;
    ++next_index_;
    if (ranges_.size() == 1) {
        // A single chunk is the whole transfer; no finalization message.
        report_.state = UploadState::Finalized;
    } else if (next_index_ == ranges_.size()) {
        report_.state = UploadState::AllSent;
    }
    return Progress{report_.chunks_sent, report_.total_chunks};
}

std::optional<Progress> Upload::send_finalization() {
    FinalizationMessage m;
    m.job_id = report_.job_id;
    m.total = static_cast<int>(ranges_.size());
    SendResult res = selector_.send(encode_message(m));
    if (!res.ok()) {
        fail(std::move(res), std::nullopt);
        return std::nullopt;
    }
    report_.tiers_used.push_back(res.tier);
    if (res.confirmed) {
        try {
            FinalizationAck ack = finalization_ack_from_json(json::parse(res.response_body));
            if (ack.chunks_received == m.total && ack.total_expected == m.total) {
                report_.finalization_confirmed = true;
            } else {
                std::cerr << "[swerve] server holds " << ack.chunks_received << "/" << ack.total_expected
                          << " chunks of " << report_.job_id << " at finalization" << std::endl;
            }
        } catch (const json::exception& e) {
            std::cerr << "[swerve] unreadable finalization ack: " << e.what() << std::endl;
        }
    }
    report_.state = UploadState::Finalized;
    return Progress{report_.chunks_sent, report_.total_chunks};
}

void Upload::fail(SendResult res, std::optional<std::size_t> index) {
    std::cerr << "[swerve] upload " << report_.job_id << " failed at "
              << (index ? "chunk " + std::to_string(*index) : std::string("finalization"))
              << ": " << send_status_name(res.status) << "\n" << describe_attempts(res.attempts);
    report_.state = UploadState::Failed;
    report_.failed_index = index;
    report_.failure = std::move(res);
}
