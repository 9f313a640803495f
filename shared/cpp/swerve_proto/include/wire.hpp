#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <variant>

inline constexpr const char* kWireVersion = "0";

// Bad shape, bad field values, or a total that disagrees with what the job
// already recorded. Answered with HTTP 400.
class ProtocolMismatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ChunkMessage {
    std::string job_id;
    nlohmann::json metadata = nlohmann::json::object();
    int index{0};
    int total{0};
    bool is_last{false};
    std::string encoding{"base64"}; // "base64" | "plain"
    std::string bytes;              // decoded chunk bytes
};

struct FinalizationMessage {
    std::string job_id;
    int total{0}; // 0 when the sender did not state it
};

using IngestMessage = std::variant<ChunkMessage, FinalizationMessage>;

struct ChunkAck {
    std::string job_id;
    std::string track_url;
    int chunk_received{0};
    int total_chunks{0};
    bool is_complete{false};
};

struct FinalizationAck {
    std::string job_id;
    std::string status{"finalized"};
    int chunks_received{0};
    int total_expected{0};
};

std::string encode_message(const IngestMessage& msg);
// Throws ProtocolMismatchError for anything that is not a well-formed message.
IngestMessage decode_message(const std::string& body);

nlohmann::json to_json(const ChunkAck& ack);
nlohmann::json to_json(const FinalizationAck& ack);
ChunkAck chunk_ack_from_json(const nlohmann::json& j);
FinalizationAck finalization_ack_from_json(const nlohmann::json& j);
