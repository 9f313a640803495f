#pragma once
#include "job.hpp"
#include "../../../shared/cpp/swerve_proto/include/wire.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

// Finalization or status lookup for a job that was never seen or was evicted.
class JobNotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct StoreLimits {
    std::chrono::seconds retention{60};      // after Finalized
    std::chrono::seconds incomplete_ttl{1800}; // idle time before an unfinished job is dropped
};

struct ChunkReceipt {
    int chunk_received{0}; // index + 1
    int total_chunks{0};
    bool is_complete{false};
    // Set for the call that moved the job into Complete, and for a later
    // message when the previous delivery attempt failed.
    std::optional<CompletedCapture> completed;
};

struct FinalizeReceipt {
    int chunks_received{0};
    int total_expected{0};
    JobState state{JobState::Receiving};
    std::optional<CompletedCapture> completed; // as in ChunkReceipt
};

// Keyed registry of transfer jobs. The map lock is held only to find or
// insert a slot; every mutation of a job happens under that job's own lock.
class JobStore {
public:
    explicit JobStore(StoreLimits limits = {});

    // Throws ProtocolMismatchError when the total disagrees with the job.
    ChunkReceipt accept_chunk(const ChunkMessage& msg, bool auth_token_used = false);
    // Throws JobNotFoundError / ProtocolMismatchError.
    FinalizeReceipt finalize(const FinalizationMessage& msg);

    // Every capture handed out must be answered with one of these two.
    // A confirmed job drops its payload; a released one offers the capture
    // again on its next chunk or finalization.
    void confirm_delivery(const std::string& job_id);
    void release_delivery(const std::string& job_id);

    std::optional<JobStatus> status(const std::string& job_id) const;
    // Reassembled bytes, from Complete until delivery is confirmed.
    std::optional<std::string> payload(const std::string& job_id) const;

    // Drops finalized jobs past retention and unfinished jobs idle past the TTL.
    std::size_t sweep(Clock::time_point now = Clock::now());

    std::size_t size() const;
    std::vector<JobStatus> snapshot() const;

private:
    struct Slot {
        std::mutex mtx;
        Job job;
        bool evicted{false};
    };

    std::shared_ptr<Slot> find(const std::string& job_id) const;
    std::shared_ptr<Slot> find_or_create(const std::string& job_id);
    static JobStatus status_of(const Job& j);
    static void reassemble(Job& j, Clock::time_point now);
    static std::optional<CompletedCapture> take_capture(Job& j, Clock::time_point now);

    StoreLimits limits_;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> jobs_;
};
