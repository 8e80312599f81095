#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace protocol {

constexpr int TRANSFER_FILE_VERSION = 1;
constexpr const char* TRANSFER_FILE_EXTENSION = ".vaultbeam-transfer";

// On-disk transfer file. The verification phrase is never stored here.
struct TransferFile {
    int version;
    std::vector<std::string> chunks;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TransferFile, version, chunks)

// Writes the chunk strings verbatim and in order. Throws std::runtime_error on I/O failure.
void save_transfer_file(const std::string& path, const std::vector<std::string>& chunks);

// Throws std::runtime_error if the file is unreadable, malformed, of another
// version, or holds no chunks.
std::vector<std::string> load_transfer_file(const std::string& path);

} // namespace protocol
