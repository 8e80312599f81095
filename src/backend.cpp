#include "backend.hpp"
#include "protocol/chunk.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

namespace transfer {

std::vector<uint8_t> serialize_transfer_payload(const std::vector<vault::Entry>& entries) {
    nlohmann::json entries_json = entries;
    nlohmann::json payload = {
        {"version", TRANSFER_PAYLOAD_VERSION},
        {"entries", entries_json},
        {"checksum", security::checksum_hex(entries_json.dump())},
    };
    std::string text = payload.dump();
    std::vector<uint8_t> bytes(text.begin(), text.end());
    security::secure_clear(text);
    return bytes;
}

std::vector<vault::Entry> parse_transfer_payload(const std::vector<uint8_t>& payload) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(payload.begin(), payload.end());
    } catch (const nlohmann::json::exception& e) {
        throw TransferError("IMPORT_FAILED", std::string("Import failed: invalid transfer payload: ") + e.what());
    }

    try {
        auto version = j.at("version").get<int>();
        if (version != TRANSFER_PAYLOAD_VERSION) {
            throw TransferError("IMPORT_FAILED",
                                "Import failed: unsupported transfer format version: " + std::to_string(version));
        }

        const auto& entries_json = j.at("entries");
        if (security::checksum_hex(entries_json.dump()) != j.at("checksum").get<std::string>()) {
            throw TransferError("IMPORT_FAILED",
                                "Import failed: transfer payload checksum mismatch, data may be corrupted");
        }
        return entries_json.get<std::vector<vault::Entry>>();
    } catch (const nlohmann::json::exception& e) {
        throw TransferError("IMPORT_FAILED", std::string("Import failed: invalid transfer payload: ") + e.what());
    }
}

VaultBackend::VaultBackend(std::shared_ptr<vault::EntryStore> store, std::size_t max_chunk_size)
    : store_(std::move(store)), max_chunk_size_(max_chunk_size) {
    if (max_chunk_size_ == 0 || max_chunk_size_ > security::MAX_CHUNK_SIZE) {
        throw std::invalid_argument("Chunk size " + std::to_string(max_chunk_size_) +
                                    " does not fit in a QR code (maximum " +
                                    std::to_string(security::MAX_CHUNK_SIZE) + ")");
    }
}

PrepareResult VaultBackend::prepare(PrepareRequest request) {
    if (request.entry_ids.empty()) {
        throw TransferError("INVALID_REQUEST", "No entries selected for transfer.");
    }

    // Step 1: resolve entries, note whether any are sensitive
    std::vector<vault::Entry> entries;
    bool has_sensitive = false;
    for (const auto& id : request.entry_ids) {
        auto entry = store_->get(id);
        if (!entry) {
            throw TransferError("ENTRY_NOT_FOUND", "Entry lookup failed: no entry with id " + id);
        }
        has_sensitive = has_sensitive || vault::is_sensitive(entry->type);
        entries.push_back(std::move(*entry));
    }

    // Step 2: re-authenticate for seed phrases and recovery codes
    if (has_sensitive) {
        if (!request.password) {
            throw TransferError("AUTH_REQUIRED",
                                "Password required to transfer seed phrases or recovery codes.");
        }
        bool ok = store_->verify_password(*request.password);
        security::secure_clear(*request.password);
        if (!ok) {
            throw TransferError("INVALID_PASSWORD", "Incorrect password.");
        }
    } else if (request.password) {
        security::secure_clear(*request.password);
    }

    // Step 3: serialize, derive a one-time key from a fresh phrase
    std::vector<uint8_t> payload = serialize_transfer_payload(entries);
    for (auto& entry : entries) {
        security::secure_clear(entry.secret);
    }

    PrepareResult result;
    result.verification_code = security::generate_verification_phrase();
    result.total_entries = entries.size();
    result.has_sensitive = has_sensitive;

    security::TransferKey key = security::derive_transfer_key(result.verification_code);

    // Step 4: chunk, seal and base64 each piece
    auto pieces = security::split_payload(payload, max_chunk_size_);
    security::secure_clear(payload);
    if (pieces.size() > UINT16_MAX) {
        throw TransferError("PAYLOAD_TOO_LARGE",
                            "Transfer needs " + std::to_string(pieces.size()) + " chunks (maximum 65535).");
    }

    auto total = static_cast<uint16_t>(pieces.size());
    result.chunks.reserve(pieces.size());
    for (std::size_t i = 0; i < pieces.size(); ++i) {
        auto sealed = security::seal_chunk(pieces[i], key, static_cast<uint16_t>(i), total);
        result.chunks.push_back(protocol::base64_encode(sealed));
        security::secure_clear(pieces[i]);
    }

    std::cout << "VaultBackend: prepared " << result.total_entries << " entries in "
              << result.chunks.size() << " chunks\n";
    return result;
}

std::size_t VaultBackend::receive(const std::vector<std::string>& chunks,
                                  const std::string& verification_code) {
    // Step 1: key from the phrase the operator typed
    security::TransferKey key;
    try {
        key = security::derive_transfer_key(verification_code);
    } catch (const std::invalid_argument& e) {
        throw TransferError("INVALID_CODE", std::string("Invalid verification code: ") + e.what());
    }

    // Step 2: decode and open every chunk
    std::vector<security::OpenedChunk> opened;
    opened.reserve(chunks.size());
    uint16_t total = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        auto sealed = protocol::base64_decode(chunks[i]);
        if (!sealed) {
            throw TransferError("INVALID_DATA", "Invalid base64 in chunk " + std::to_string(i));
        }
        try {
            opened.push_back(security::open_chunk(*sealed, key));
        } catch (const std::runtime_error& e) {
            throw TransferError("DECRYPTION_FAILED",
                                "Chunk " + std::to_string(i) + " decryption failed: " + e.what());
        }
        total = opened.back().total;
    }

    // Step 3: reassemble in index order
    std::vector<uint8_t> payload;
    try {
        payload = security::assemble_chunks(opened, total);
    } catch (const std::runtime_error& e) {
        throw TransferError("INCOMPLETE_TRANSFER", e.what());
    }
    for (auto& chunk : opened) {
        security::secure_clear(chunk.plaintext);
    }

    // Step 4: import
    auto entries = parse_transfer_payload(payload);
    security::secure_clear(payload);

    std::size_t imported = 0;
    try {
        imported = store_->import_entries(std::move(entries));
    } catch (const std::runtime_error& e) {
        throw TransferError("IMPORT_FAILED", std::string("Import failed: ") + e.what());
    }

    std::cout << "VaultBackend: imported " << imported << " entries\n";
    return imported;
}

} // namespace transfer
