#include "../include/wire.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace {

json encode_chunk(const ChunkMessage& m) {
    std::string payload = m.encoding == "plain" ? m.bytes : base64_encode(m.bytes);
    return {
        {"version", kWireVersion},
        {"type", "chunk"},
        {"jobId", m.job_id},
        {"metadata", m.metadata.is_object() ? m.metadata : json::object()},
        {"transfer", {
            {"encoding", m.encoding},
            {"chunk", {
                {"index", m.index},
                {"count", m.total},
                {"total", m.total},
                {"isLast", m.is_last}
            }}
        }},
        {"payload", payload}
    };
}

json encode_finalization(const FinalizationMessage& m) {
    json chunk = json::object();
    if (m.total > 0) chunk["total"] = m.total;
    return {
        {"version", kWireVersion},
        {"type", "finalization"},
        {"jobId", m.job_id},
        {"transfer", {{"chunk", chunk}}}
    };
}

std::string require_job_id(const json& j) {
    if (!j.contains("jobId") || !j["jobId"].is_string()) {
        throw ProtocolMismatchError("Missing jobId");
    }
    auto id = j["jobId"].get<std::string>();
    if (id.empty()) throw ProtocolMismatchError("Missing jobId");
    return id;
}

// Non-negative int field of transfer.chunk; -1 when absent.
int chunk_field(const json& chunk, const char* key) {
    if (!chunk.contains(key)) return -1;
    const json& v = chunk[key];
    if (!v.is_number_integer()) throw ProtocolMismatchError(std::string("chunk.") + key + " must be an integer");
    bool in_range = v.is_number_unsigned()
                        ? v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                        : v.get<std::int64_t>() >= 0 && v.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) throw ProtocolMismatchError(std::string("chunk.") + key + " is out of range");
    return static_cast<int>(v.get<std::int64_t>());
}

ChunkMessage decode_chunk(const json& j) {
    ChunkMessage m;
    m.job_id = require_job_id(j);
    const json* chunk = nullptr;
    if (j.contains("transfer") && j["transfer"].is_object() && j["transfer"].contains("chunk")) {
        chunk = &j["transfer"]["chunk"];
    }
    if (!chunk || !chunk->is_object()) throw ProtocolMismatchError("Missing chunk information");

    m.index = chunk_field(*chunk, "index");
    if (m.index < 0) throw ProtocolMismatchError("chunk.index must be an integer");

    int count = chunk_field(*chunk, "count");
    int total = chunk_field(*chunk, "total");
    if (count > 0 && total > 0 && count != total) {
        throw ProtocolMismatchError("chunk.count and chunk.total disagree");
    }
    m.total = total > 0 ? total : count;
    if (m.total <= 0) throw ProtocolMismatchError("chunk.total must be positive");
    if (m.index >= m.total) {
        throw ProtocolMismatchError("chunk.index " + std::to_string(m.index) + " outside 0.." +
                                    std::to_string(m.total - 1));
    }
    m.is_last = chunk->value("isLast", m.index == m.total - 1);

    if (j.contains("metadata") && j["metadata"].is_object()) m.metadata = j["metadata"];

    m.encoding = j["transfer"].value("encoding", std::string("plain"));
    if (!j.contains("payload") || !j["payload"].is_string()) {
        throw ProtocolMismatchError("payload must be a string");
    }
    const auto& text = j["payload"].get_ref<const std::string&>();
    if (m.encoding == "base64") {
        try {
            m.bytes = base64_decode(text);
        } catch (const std::invalid_argument& e) {
            throw ProtocolMismatchError(std::string("payload: ") + e.what());
        }
    } else if (m.encoding == "plain") {
        m.bytes = text;
    } else {
        throw ProtocolMismatchError("unsupported transfer.encoding '" + m.encoding + "'");
    }
    return m;
}

FinalizationMessage decode_finalization(const json& j) {
    FinalizationMessage m;
    m.job_id = require_job_id(j);
    if (j.contains("transfer") && j["transfer"].is_object() && j["transfer"].contains("chunk")) {
        const auto& chunk = j["transfer"]["chunk"];
        if (chunk.is_object()) m.total = std::max(chunk_field(chunk, "total"), 0);
    }
    return m;
}

} // namespace

std::string encode_message(const IngestMessage& msg) {
    if (auto* c = std::get_if<ChunkMessage>(&msg)) return encode_chunk(*c).dump();
    return encode_finalization(std::get<FinalizationMessage>(msg)).dump();
}

IngestMessage decode_message(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ProtocolMismatchError(std::string("Invalid JSON: ") + e.what());
    }
    if (!j.is_object()) throw ProtocolMismatchError("Invalid payload structure");
    if (!j.contains("version")) throw ProtocolMismatchError("Invalid payload format");

    std::string type = j.contains("type") && j["type"].is_string() ? j["type"].get<std::string>() : "";
    try {
        if (type == "chunk") return decode_chunk(j);
        if (type == "finalization") return decode_finalization(j);
    } catch (const json::exception& e) {
        throw ProtocolMismatchError(std::string("Malformed message: ") + e.what());
    }
    throw ProtocolMismatchError(type.empty() ? "Missing message type" : "Unknown message type '" + type + "'");
}

json to_json(const ChunkAck& ack) {
    return {
        {"jobId", ack.job_id},
        {"trackUrl", ack.track_url},
        {"chunkReceived", ack.chunk_received},
        {"totalChunks", ack.total_chunks},
        {"isComplete", ack.is_complete}
    };
}

json to_json(const FinalizationAck& ack) {
    return {
        {"jobId", ack.job_id},
        {"status", ack.status},
        {"chunksReceived", ack.chunks_received},
        {"totalExpected", ack.total_expected}
    };
}

ChunkAck chunk_ack_from_json(const json& j) {
    ChunkAck ack;
    ack.job_id = j.at("jobId").get<std::string>();
    ack.track_url = j.value("trackUrl", std::string());
    ack.chunk_received = j.at("chunkReceived").get<int>();
    ack.total_chunks = j.at("totalChunks").get<int>();
    ack.is_complete = j.value("isComplete", false);
    return ack;
}

FinalizationAck finalization_ack_from_json(const json& j) {
    FinalizationAck ack;
    ack.job_id = j.at("jobId").get<std::string>();
    ack.status = j.value("status", std::string());
    ack.chunks_received = j.at("chunksReceived").get<int>();
    ack.total_expected = j.at("totalExpected").get<int>();
    return ack;
}
