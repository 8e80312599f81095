#include "security.hpp"
#include "protocol/chunk.hpp"
#include <sodium.h>
#include <sstream>
#include <iomanip>
#include <cstring>
#include <algorithm>
#include <stdexcept>

namespace security {

namespace {

const char CONSONANTS[] = "bdfghklmnprstvwz";
const char VOWELS[] = "aeiou";

// Context string used as the BLAKE2b key when deriving transfer keys
const char KDF_CONTEXT[] = "vaultbeam-qr-transfer-v1";

std::vector<std::string> split_words(const std::string& code) {
    std::vector<std::string> words;
    std::istringstream iss(code);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::string random_word() {
    std::string word;
    for (int i = 0; i < 5; ++i) {
        if (i % 2 == 0) {
            word += CONSONANTS[randombytes_uniform(sizeof(CONSONANTS) - 1)];
        } else {
            word += VOWELS[randombytes_uniform(sizeof(VOWELS) - 1)];
        }
    }
    return word;
}

} // namespace

void init_sodium() {
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

std::string generate_verification_phrase() {
    init_sodium();

    std::string phrase;
    for (std::size_t i = 0; i < VERIFICATION_WORD_COUNT; ++i) {
        if (i > 0) phrase += ' ';
        phrase += random_word();
    }
    return phrase;
}

bool is_valid_verification_code(const std::string& code) {
    return split_words(code).size() == VERIFICATION_WORD_COUNT;
}

std::string normalize_verification_code(const std::string& code) {
    std::string normalized;
    for (const auto& word : split_words(code)) {
        if (!normalized.empty()) normalized += ' ';
        normalized += word;
    }
    return normalized;
}

TransferKey::TransferKey() {
    bytes_.fill(0);
}

TransferKey::~TransferKey() {
    sodium_memzero(bytes_.data(), bytes_.size());
}

TransferKey::TransferKey(const TransferKey& other) : bytes_(other.bytes_) {}

TransferKey& TransferKey::operator=(const TransferKey& other) {
    bytes_ = other.bytes_;
    return *this;
}

TransferKey derive_transfer_key(const std::string& phrase) {
    init_sodium();

    auto words = split_words(phrase);
    if (words.size() != VERIFICATION_WORD_COUNT) {
        throw std::invalid_argument("verification phrase must contain exactly " +
                                    std::to_string(VERIFICATION_WORD_COUNT) + " words, got " +
                                    std::to_string(words.size()));
    }

    std::string normalized = normalize_verification_code(phrase);
    TransferKey key;
    crypto_generichash(key.data(), TRANSFER_KEY_SIZE,
                       reinterpret_cast<const unsigned char*>(normalized.data()), normalized.size(),
                       reinterpret_cast<const unsigned char*>(KDF_CONTEXT), sizeof(KDF_CONTEXT) - 1);
    secure_clear(normalized);
    return key;
}

std::vector<uint8_t> seal_chunk(const std::vector<uint8_t>& plaintext, const TransferKey& key,
                                uint16_t index, uint16_t total) {
    init_sodium();
    static_assert(CHUNK_NONCE_SIZE == crypto_aead_chacha20poly1305_ietf_NPUBBYTES, "nonce size");
    static_assert(CHUNK_TAG_SIZE == crypto_aead_chacha20poly1305_ietf_ABYTES, "tag size");

    auto header = protocol::encode_chunk_header(index, total);

    // Nonce: chunk index (2 bytes) || 10 random bytes
    std::array<uint8_t, CHUNK_NONCE_SIZE> nonce;
    std::memcpy(nonce.data(), header.data(), 2);
    randombytes_buf(nonce.data() + 2, nonce.size() - 2);

    std::vector<uint8_t> out(protocol::CHUNK_HEADER_SIZE + CHUNK_NONCE_SIZE +
                             plaintext.size() + CHUNK_TAG_SIZE);
    std::memcpy(out.data(), header.data(), header.size());
    std::memcpy(out.data() + header.size(), nonce.data(), nonce.size());

    unsigned long long cipher_len = 0;
    int rc = crypto_aead_chacha20poly1305_ietf_encrypt(
        out.data() + header.size() + nonce.size(), &cipher_len,
        plaintext.data(), plaintext.size(),
        header.data(), header.size(),
        nullptr, nonce.data(), key.bytes().data());
    if (rc != 0) {
        throw std::runtime_error("chunk encryption failed");
    }
    out.resize(header.size() + nonce.size() + cipher_len);
    return out;
}

OpenedChunk open_chunk(const std::vector<uint8_t>& sealed, const TransferKey& key) {
    init_sodium();

    const std::size_t min_size = protocol::CHUNK_HEADER_SIZE + CHUNK_NONCE_SIZE + CHUNK_TAG_SIZE;
    if (sealed.size() < min_size) {
        throw std::runtime_error("encrypted chunk too short: " + std::to_string(sealed.size()) +
                                 " bytes (minimum " + std::to_string(min_size) + ")");
    }

    auto header = protocol::decode_chunk_header(sealed);
    const uint8_t* nonce = sealed.data() + protocol::CHUNK_HEADER_SIZE;
    const uint8_t* cipher = nonce + CHUNK_NONCE_SIZE;
    std::size_t cipher_len = sealed.size() - protocol::CHUNK_HEADER_SIZE - CHUNK_NONCE_SIZE;

    OpenedChunk chunk;
    chunk.index = header->index;
    chunk.total = header->total;
    chunk.plaintext.resize(cipher_len - CHUNK_TAG_SIZE);

    unsigned long long plain_len = 0;
    int rc = crypto_aead_chacha20poly1305_ietf_decrypt(
        chunk.plaintext.data(), &plain_len, nullptr,
        cipher, cipher_len,
        sealed.data(), protocol::CHUNK_HEADER_SIZE,
        nonce, key.bytes().data());
    if (rc != 0) {
        throw std::runtime_error("chunk decryption failed (wrong key or tampered data)");
    }
    chunk.plaintext.resize(plain_len);
    return chunk;
}

std::vector<std::vector<uint8_t>> split_payload(const std::vector<uint8_t>& data, std::size_t max_size) {
    if (max_size == 0) {
        throw std::invalid_argument("max chunk size must be > 0");
    }

    std::vector<std::vector<uint8_t>> pieces;
    if (data.empty()) {
        pieces.emplace_back();
        return pieces;
    }
    for (std::size_t offset = 0; offset < data.size(); offset += max_size) {
        std::size_t len = std::min(max_size, data.size() - offset);
        pieces.emplace_back(data.begin() + offset, data.begin() + offset + len);
    }
    return pieces;
}

std::vector<uint8_t> assemble_chunks(const std::vector<OpenedChunk>& chunks, uint16_t expected_total) {
    if (expected_total == 0) {
        throw std::runtime_error("expected chunk total must be > 0");
    }

    std::vector<const OpenedChunk*> slots(expected_total, nullptr);
    for (const auto& chunk : chunks) {
        if (chunk.index >= expected_total) {
            throw std::runtime_error("chunk index " + std::to_string(chunk.index) +
                                     " out of range (total " + std::to_string(expected_total) + ")");
        }
        slots[chunk.index] = &chunk;
    }

    std::string missing;
    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (!slots[i]) {
            if (!missing.empty()) missing += ", ";
            missing += std::to_string(i);
        }
    }
    if (!missing.empty()) {
        throw std::runtime_error("missing chunks: " + missing);
    }

    std::vector<uint8_t> result;
    for (const auto* slot : slots) {
        result.insert(result.end(), slot->plaintext.begin(), slot->plaintext.end());
    }
    return result;
}

std::string hash_password(const std::string& password) {
    init_sodium();

    char hash[crypto_pwhash_STRBYTES];
    if (crypto_pwhash_str(hash, password.c_str(), password.size(),
                          crypto_pwhash_OPSLIMIT_INTERACTIVE,
                          crypto_pwhash_MEMLIMIT_INTERACTIVE) != 0) {
        throw std::runtime_error("password hashing failed (out of memory)");
    }
    return std::string(hash);
}

bool verify_password(const std::string& password, const std::string& expected_hash) {
    init_sodium();
    if (expected_hash.empty()) return false;
    return crypto_pwhash_str_verify(expected_hash.c_str(), password.c_str(), password.size()) == 0;
}

std::string checksum_hex(const std::string& data) {
    init_sodium();

    unsigned char hash[crypto_generichash_BYTES]; // 32 bytes
    crypto_generichash(hash, sizeof(hash),
                       reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                       nullptr, 0);

    std::ostringstream oss;
    for (size_t i = 0; i < sizeof(hash); ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

void secure_clear(std::string& value) {
    if (!value.empty()) {
        sodium_memzero(&value[0], value.size());
    }
    value.clear();
}

void secure_clear(std::vector<uint8_t>& value) {
    if (!value.empty()) {
        sodium_memzero(value.data(), value.size());
    }
    value.clear();
}

} // namespace security
