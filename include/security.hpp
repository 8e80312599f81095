#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>

namespace security {

// Number of words in a verification phrase
constexpr std::size_t VERIFICATION_WORD_COUNT = 4;

constexpr std::size_t TRANSFER_KEY_SIZE = 32;
constexpr std::size_t CHUNK_NONCE_SIZE = 12;
constexpr std::size_t CHUNK_TAG_SIZE = 16;

// Header, nonce and tag that seal_chunk adds to each slice
constexpr std::size_t CHUNK_SEAL_OVERHEAD = 4 + CHUNK_NONCE_SIZE + CHUNK_TAG_SIZE;

// Bytes a version 40 QR code holds at level M in 8-bit mode
constexpr std::size_t QR_BYTE_CAPACITY = 2331;

// Largest plaintext slice whose sealed chunk, base64 encoded, fits in capacity bytes
constexpr std::size_t max_chunk_size_for(std::size_t capacity) {
    return capacity / 4 * 3 > CHUNK_SEAL_OVERHEAD ? capacity / 4 * 3 - CHUNK_SEAL_OVERHEAD : 0;
}

constexpr std::size_t MAX_CHUNK_SIZE = max_chunk_size_for(QR_BYTE_CAPACITY);
constexpr std::size_t DEFAULT_MAX_CHUNK_SIZE = 1700;

// Throws std::runtime_error if libsodium cannot be initialized
void init_sodium();

// 4 random pronounceable words separated by single spaces
std::string generate_verification_phrase();

// Exactly VERIFICATION_WORD_COUNT non-empty whitespace-separated tokens
bool is_valid_verification_code(const std::string& code);

// Tokens joined by single spaces
std::string normalize_verification_code(const std::string& code);

// Symmetric key for one transfer; wiped on destruction
class TransferKey {
public:
    TransferKey();
    ~TransferKey();
    TransferKey(const TransferKey& other);
    TransferKey& operator=(const TransferKey& other);

    const std::array<uint8_t, TRANSFER_KEY_SIZE>& bytes() const { return bytes_; }
    uint8_t* data() { return bytes_.data(); }

private:
    std::array<uint8_t, TRANSFER_KEY_SIZE> bytes_;
};

// Keyed BLAKE2b over the normalized phrase.
// Throws std::invalid_argument if the phrase has the wrong word count.
TransferKey derive_transfer_key(const std::string& phrase);

struct OpenedChunk {
    uint16_t index;
    uint16_t total;
    std::vector<uint8_t> plaintext;
};

// [2B index BE][2B total BE][12B nonce][ciphertext][16B tag]
// The header is authenticated as associated data.
std::vector<uint8_t> seal_chunk(const std::vector<uint8_t>& plaintext, const TransferKey& key,
                                uint16_t index, uint16_t total);

// Throws std::runtime_error on short input, wrong key or tampering
OpenedChunk open_chunk(const std::vector<uint8_t>& sealed, const TransferKey& key);

// An empty payload yields a single empty piece.
// Throws std::invalid_argument if max_size is zero.
std::vector<std::vector<uint8_t>> split_payload(const std::vector<uint8_t>& data, std::size_t max_size);

// Throws std::runtime_error on a zero total, an out-of-range index or missing pieces
std::vector<uint8_t> assemble_chunks(const std::vector<OpenedChunk>& chunks, uint16_t expected_total);

// Hash a master password with libsodium crypto_pwhash (Argon2id)
std::string hash_password(const std::string& password);

bool verify_password(const std::string& password, const std::string& expected_hash);

// BLAKE2b-256 as a hex string
std::string checksum_hex(const std::string& data);

// Overwrite then empty
void secure_clear(std::string& value);
void secure_clear(std::vector<uint8_t>& value);

} // namespace security
