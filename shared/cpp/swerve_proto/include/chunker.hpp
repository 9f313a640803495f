#pragma once
#include <cstddef>
#include <vector>

inline constexpr std::size_t kDefaultChunkSize = 256 * 1024;

struct ByteRange {
    std::size_t offset{0};
    std::size_t length{0};
};

// ceil(payload_size / max_chunk_size), and 1 for an empty payload.
std::size_t chunk_count(std::size_t payload_size, std::size_t max_chunk_size);

// Contiguous ranges covering [0, payload_size) of the encoded byte stream,
// never a decoded character sequence. Every range but the last is exactly
// max_chunk_size long. Throws std::invalid_argument for a zero chunk size.
std::vector<ByteRange> split_ranges(std::size_t payload_size, std::size_t max_chunk_size);
