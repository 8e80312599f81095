#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <stdexcept>
#include "vault.hpp"
#include "security.hpp"

namespace transfer {

// Backend failure with a machine-readable code (AUTH_REQUIRED, INVALID_PASSWORD, ...)
class TransferError : public std::runtime_error {
public:
    TransferError(std::string code, const std::string& message)
        : std::runtime_error(message), code_(std::move(code)) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

struct PrepareRequest {
    std::vector<std::string> entry_ids;
    // Only set when a sensitive entry is selected
    std::optional<std::string> password;
};

struct PrepareResult {
    std::vector<std::string> chunks;     // one QR code each, in order
    std::string verification_code;
    std::size_t total_entries = 0;
    bool has_sensitive = false;
};

// Encrypts and chunks entries on the sending side; decrypts and imports on the receiving side.
// Both calls block and are run off the UI loop by the controllers.
class CryptoBackend {
public:
    virtual ~CryptoBackend() = default;

    virtual PrepareResult prepare(PrepareRequest request) = 0;

    // Returns the number of imported entries
    virtual std::size_t receive(const std::vector<std::string>& chunks,
                                const std::string& verification_code) = 0;
};

constexpr uint8_t TRANSFER_PAYLOAD_VERSION = 1;

// Reference backend over an EntryStore, built on libsodium.
// Throws std::invalid_argument if max_chunk_size is zero or above security::MAX_CHUNK_SIZE.
class VaultBackend : public CryptoBackend {
public:
    explicit VaultBackend(std::shared_ptr<vault::EntryStore> store,
                          std::size_t max_chunk_size = security::DEFAULT_MAX_CHUNK_SIZE);

    PrepareResult prepare(PrepareRequest request) override;
    std::size_t receive(const std::vector<std::string>& chunks,
                        const std::string& verification_code) override;

private:
    std::shared_ptr<vault::EntryStore> store_;
    std::size_t max_chunk_size_;
};

// JSON payload with a BLAKE2b checksum over the entries array
std::vector<uint8_t> serialize_transfer_payload(const std::vector<vault::Entry>& entries);

// Throws TransferError(IMPORT_FAILED) on a bad version, malformed JSON or checksum mismatch
std::vector<vault::Entry> parse_transfer_payload(const std::vector<uint8_t>& payload);

} // namespace transfer
