#include "protocol/chunk.hpp"
#include "security.hpp"
#include <sodium.h>
#include <arpa/inet.h>
#include <cstring>
#include <stdexcept>

namespace protocol {

std::array<uint8_t, CHUNK_HEADER_SIZE> encode_chunk_header(uint32_t index, uint32_t total) {
    if (index > UINT16_MAX) {
        throw std::out_of_range("chunk index " + std::to_string(index) + " exceeds 16 bits");
    }
    if (total > UINT16_MAX) {
        throw std::out_of_range("chunk total " + std::to_string(total) + " exceeds 16 bits");
    }

    std::array<uint8_t, CHUNK_HEADER_SIZE> buffer;
    uint16_t idx = htons(static_cast<uint16_t>(index));
    uint16_t tot = htons(static_cast<uint16_t>(total));

    std::memcpy(buffer.data(), &idx, 2);
    std::memcpy(buffer.data() + 2, &tot, 2);

    return buffer;
}

std::optional<ChunkHeader> decode_chunk_header(const uint8_t* data, std::size_t size) {
    if (data == nullptr || size < CHUNK_HEADER_SIZE) {
        return std::nullopt;
    }

    uint16_t idx, tot;
    std::memcpy(&idx, data, 2);
    std::memcpy(&tot, data + 2, 2);

    ChunkHeader header;
    header.index = ntohs(idx);
    header.total = ntohs(tot);
    return header;
}

std::optional<ChunkHeader> decode_chunk_header(const std::vector<uint8_t>& buffer) {
    return decode_chunk_header(buffer.data(), buffer.size());
}

std::string base64_encode(const uint8_t* data, std::size_t size) {
    security::init_sodium();

    const int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string out(sodium_base64_ENCODED_LEN(size, variant), '\0');
    sodium_bin2base64(&out[0], out.size(), data, size, variant);
    out.resize(std::strlen(out.c_str()));
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& text) {
    security::init_sodium();

    std::vector<uint8_t> out(text.size() / 4 * 3 + 3);
    std::size_t out_len = 0;
    // Scanners sometimes hand back trailing line breaks; tolerate ASCII whitespace.
    int rc = sodium_base642bin(out.data(), out.size(), text.data(), text.size(),
                               " \t\r\n", &out_len, nullptr,
                               sodium_base64_VARIANT_ORIGINAL);
    if (rc != 0) {
        return std::nullopt;
    }
    out.resize(out_len);
    return out;
}

std::string encode_chunk(uint32_t index, uint32_t total, const std::vector<uint8_t>& payload) {
    auto header = encode_chunk_header(index, total);

    std::vector<uint8_t> buffer;
    buffer.reserve(CHUNK_HEADER_SIZE + payload.size());
    buffer.insert(buffer.end(), header.begin(), header.end());
    buffer.insert(buffer.end(), payload.begin(), payload.end());
    return base64_encode(buffer);
}

std::optional<Chunk> parse_chunk(const std::string& text) {
    auto bytes = base64_decode(text);
    if (!bytes) {
        return std::nullopt;
    }
    auto header = decode_chunk_header(*bytes);
    if (!header) {
        return std::nullopt;
    }
    return Chunk{*header, text};
}

} // namespace protocol
