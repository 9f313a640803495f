#include "../include/chunker.hpp"
#include <algorithm>
#include <stdexcept>

std::size_t chunk_count(std::size_t payload_size, std::size_t max_chunk_size) {
    if (max_chunk_size == 0) throw std::invalid_argument("max_chunk_size must be positive");
    if (payload_size == 0) return 1;
    return (payload_size + max_chunk_size - 1) / max_chunk_size;
}

std::vector<ByteRange> split_ranges(std::size_t payload_size, std::size_t max_chunk_size) {
    std::size_t n = chunk_count(payload_size, max_chunk_size);
    std::vector<ByteRange> out;
    out.reserve(n);
    if (payload_size == 0) {
        out.push_back({0, 0});
        return out;
    }
    for (std::size_t offset = 0; offset < payload_size; offset += max_chunk_size) {
        std::size_t len = std::min(max_chunk_size, payload_size - offset);
        out.push_back({offset, len});
    }
    return out;
}
