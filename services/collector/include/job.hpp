#pragma once
#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using Clock = std::chrono::steady_clock;

// Monotonic: Receiving -> Complete -> Finalized.
enum class JobState { Receiving, Complete, Finalized };

const char* job_state_name(JobState s);

struct Job {
    std::string id;
    int expected_total{0};
    std::map<int, std::string> chunks_by_index; // at most one entry per index
    nlohmann::json metadata;                    // from the first chunk
    JobState state{JobState::Receiving};
    bool finalization_requested{false};
    bool auth_token_used{false};
    std::string payload;                        // reassembled bytes, dropped once delivered
    bool delivery_in_flight{false};             // capture handed out, sink has not answered yet
    bool delivered{false};
    std::string created_iso;
    Clock::time_point created_at{};
    Clock::time_point last_activity{};
    std::optional<Clock::time_point> completed_at;
    std::optional<Clock::time_point> finalized_at;
};

struct JobStatus {
    std::string id;
    JobState state{JobState::Receiving};
    int chunks_received{0};
    int expected_total{0};
    bool finalized{false};
    bool delivered{false};
    std::string created_iso;
};

// Handed to the downstream collaborator. Handed out again only after a
// failed delivery was reported back to the store.
struct CompletedCapture {
    std::string job_id;
    nlohmann::json metadata;
    std::string payload;
    int chunk_count{0};
    bool auth_token_used{false};
    long processing_ms{0};
};
