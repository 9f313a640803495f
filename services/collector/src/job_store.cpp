#include "../include/job_store.hpp"
#include "../../../shared/cpp/swerve_proto/include/util.hpp"
#include <iostream>
#include <utility>

const char* job_state_name(JobState s) {
    switch (s) {
        case JobState::Receiving: return "receiving";
        case JobState::Complete: return "complete";
        case JobState::Finalized: return "finalized";
    }
    return "?";
}

JobStore::JobStore(StoreLimits limits) : limits_(limits) {}

std::shared_ptr<JobStore::Slot> JobStore::find(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = jobs_.find(job_id);
    return it == jobs_.end() ? nullptr : it->second;
}

std::shared_ptr<JobStore::Slot> JobStore::find_or_create(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& slot = jobs_[job_id];
    if (!slot) slot = std::make_shared<Slot>();
    return slot;
}

JobStatus JobStore::status_of(const Job& j) {
    JobStatus s;
    s.id = j.id;
    s.state = j.state;
    // Chunk bytes move into the payload on reassembly.
    s.chunks_received = j.state == JobState::Receiving ? static_cast<int>(j.chunks_by_index.size()) : j.expected_total;
    s.expected_total = j.expected_total;
    s.finalized = j.state == JobState::Finalized;
    s.delivered = j.delivered;
    s.created_iso = j.created_iso;
    return s;
}

void JobStore::reassemble(Job& j, Clock::time_point now) {
    std::size_t bytes = 0;
    for (const auto& kv : j.chunks_by_index) bytes += kv.second.size();
    j.payload.clear();
    j.payload.reserve(bytes);
    // std::map iterates in ascending index order regardless of arrival order.
    for (const auto& kv : j.chunks_by_index) j.payload += kv.second;
    j.chunks_by_index.clear();
    j.completed_at = now;
    j.state = JobState::Complete;
    if (j.finalization_requested) {
        j.state = JobState::Finalized;
        j.finalized_at = now;
    }
}

std::optional<CompletedCapture> JobStore::take_capture(Job& j, Clock::time_point now) {
    if (j.state == JobState::Receiving || j.delivered || j.delivery_in_flight) return std::nullopt;
    j.delivery_in_flight = true;

    CompletedCapture c;
    c.job_id = j.id;
    c.metadata = j.metadata;
    c.payload = j.payload;
    c.chunk_count = j.expected_total;
    c.auth_token_used = j.auth_token_used;
    c.processing_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(now - j.created_at).count());
    return c;
}

ChunkReceipt JobStore::accept_chunk(const ChunkMessage& msg, bool auth_token_used) {
    if (msg.total <= 0 || msg.index < 0 || msg.index >= msg.total) {
        throw ProtocolMismatchError("chunk " + std::to_string(msg.index) + " of " + std::to_string(msg.total) +
                                    " is out of range");
    }
    for (;;) {
        auto slot = find_or_create(msg.job_id);
        std::lock_guard<std::mutex> lock(slot->mtx);
        if (slot->evicted) continue; // lost a race with sweep(); look up again
        Job& j = slot->job;
        const auto now = Clock::now();

        if (j.expected_total == 0) {
            j.id = msg.job_id;
            j.expected_total = msg.total;
            j.metadata = msg.metadata;
            j.created_at = now;
            j.created_iso = iso8601_now();
        } else if (j.expected_total != msg.total) {
            throw ProtocolMismatchError("job " + msg.job_id + " expects " + std::to_string(j.expected_total) +
                                        " chunks, message says " + std::to_string(msg.total));
        }
        j.last_activity = now;
        j.auth_token_used = j.auth_token_used || auth_token_used;

        ChunkReceipt r;
        r.chunk_received = msg.index + 1;
        r.total_chunks = j.expected_total;
        if (j.state != JobState::Receiving) {
            std::cout << "[collector] late chunk " << msg.index << " for " << j.id << " (already "
                      << job_state_name(j.state) << "), ignored" << std::endl;
            r.is_complete = true;
            r.completed = take_capture(j, now);
            return r;
        }

        bool duplicate = j.chunks_by_index.count(msg.index) > 0;
        j.chunks_by_index[msg.index] = msg.bytes;
        std::cout << "[collector] chunk " << msg.index + 1 << "/" << j.expected_total << " for " << j.id
                  << (duplicate ? " (replaces earlier copy)" : "") << std::endl;

        if (static_cast<int>(j.chunks_by_index.size()) == j.expected_total) {
            reassemble(j, now);
            r.completed = take_capture(j, now);
            std::cout << "[collector] reassembled " << j.id << ": " << j.payload.size() << " bytes from "
                      << j.expected_total << " chunks" << (j.state == JobState::Finalized ? ", finalized" : "")
                      << std::endl;
        }
        r.is_complete = j.state != JobState::Receiving;
        return r;
    }
}

FinalizeReceipt JobStore::finalize(const FinalizationMessage& msg) {
    auto slot = find(msg.job_id);
    if (!slot) throw JobNotFoundError("Job not found: " + msg.job_id);
    std::lock_guard<std::mutex> lock(slot->mtx);
    if (slot->evicted || slot->job.expected_total == 0) throw JobNotFoundError("Job not found: " + msg.job_id);
    Job& j = slot->job;
    if (msg.total > 0 && msg.total != j.expected_total) {
        throw ProtocolMismatchError("job " + j.id + " expects " + std::to_string(j.expected_total) +
                                    " chunks, finalization says " + std::to_string(msg.total));
    }
    const auto now = Clock::now();
    j.last_activity = now;
    switch (j.state) {
        case JobState::Receiving:
            j.finalization_requested = true;
            std::cout << "[collector] finalization for " << j.id << " before all chunks ("
                      << j.chunks_by_index.size() << "/" << j.expected_total << "), deferred" << std::endl;
            break;
        case JobState::Complete:
            j.state = JobState::Finalized;
            j.finalized_at = now;
            std::cout << "[collector] finalized " << j.id << std::endl;
            break;
        case JobState::Finalized:
            break;
    }

    JobStatus s = status_of(j);
    FinalizeReceipt r;
    r.chunks_received = s.chunks_received;
    r.total_expected = s.expected_total;
    r.state = s.state;
    r.completed = take_capture(j, now);
    return r;
}

void JobStore::confirm_delivery(const std::string& job_id) {
    auto slot = find(job_id);
    if (!slot) return;
    std::lock_guard<std::mutex> lock(slot->mtx);
    Job& j = slot->job;
    j.delivery_in_flight = false;
    j.delivered = true;
    std::string().swap(j.payload);
}

void JobStore::release_delivery(const std::string& job_id) {
    auto slot = find(job_id);
    if (!slot) return;
    std::lock_guard<std::mutex> lock(slot->mtx);
    slot->job.delivery_in_flight = false;
}

std::optional<JobStatus> JobStore::status(const std::string& job_id) const {
    auto slot = find(job_id);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->mtx);
    if (slot->evicted || slot->job.expected_total == 0) return std::nullopt;
    return status_of(slot->job);
}

std::optional<std::string> JobStore::payload(const std::string& job_id) const {
    auto slot = find(job_id);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->mtx);
    if (slot->evicted || slot->job.state == JobState::Receiving || slot->job.delivered) return std::nullopt;
    return slot->job.payload;
}

std::size_t JobStore::sweep(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t removed = 0;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        Slot& s = *it->second;
        std::lock_guard<std::mutex> slot_lock(s.mtx);
        const Job& j = s.job;
        bool expired = false;
        if (j.expected_total == 0) {
            // Being created by accept_chunk right now.
            ++it;
            continue;
        }
        if (j.state == JobState::Finalized && j.finalized_at) {
            expired = now - *j.finalized_at >= limits_.retention;
        } else {
            expired = now - j.last_activity >= limits_.incomplete_ttl;
        }
        if (!expired) {
            ++it;
            continue;
        }
        if (j.state != JobState::Receiving && !j.delivered && !j.delivery_in_flight) {
            std::cerr << "[ERROR] evicting " << j.id << " before its capture was stored" << std::endl;
        } else {
            std::cout << "[collector] evicting " << (j.id.empty() ? it->first : j.id) << " ("
                      << job_state_name(j.state) << ")" << std::endl;
        }
        s.evicted = true;
        it = jobs_.erase(it);
        ++removed;
    }
    return removed;
}

std::size_t JobStore::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return jobs_.size();
}

std::vector<JobStatus> JobStore::snapshot() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        slots.reserve(jobs_.size());
        for (const auto& kv : jobs_) slots.push_back(kv.second);
    }
    std::vector<JobStatus> out;
    out.reserve(slots.size());
    for (const auto& s : slots) {
        std::lock_guard<std::mutex> lock(s->mtx);
        if (s->evicted || s->job.expected_total == 0) continue;
        out.push_back(status_of(s->job));
    }
    return out;
}
