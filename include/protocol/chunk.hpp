#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace protocol {

constexpr std::size_t CHUNK_HEADER_SIZE = 4;

// Fixed 4-byte header in front of every chunk payload
struct ChunkHeader {
    uint16_t index;   // 2 bytes, big-endian, zero-based
    uint16_t total;   // 2 bytes, big-endian
};

// A chunk string as it travels through a QR image, with its parsed header
struct Chunk {
    ChunkHeader header;
    std::string text;
};

// Throws std::out_of_range if index or total does not fit in 16 bits.
std::array<uint8_t, CHUNK_HEADER_SIZE> encode_chunk_header(uint32_t index, uint32_t total);

// Returns nullopt if the buffer is shorter than the header. Does not check index < total.
std::optional<ChunkHeader> decode_chunk_header(const uint8_t* data, std::size_t size);
std::optional<ChunkHeader> decode_chunk_header(const std::vector<uint8_t>& buffer);

// Standard (padded) base64
std::string base64_encode(const uint8_t* data, std::size_t size);
std::string base64_encode(const std::vector<uint8_t>& data);
std::optional<std::vector<uint8_t>> base64_decode(const std::string& text);

// Header + payload, base64 encoded
std::string encode_chunk(uint32_t index, uint32_t total, const std::vector<uint8_t>& payload);

// Returns nullopt for anything that is not base64 or is too short to carry a header.
std::optional<Chunk> parse_chunk(const std::string& text);

} // namespace protocol
