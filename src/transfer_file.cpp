#include "protocol/transfer_file.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace protocol {

void save_transfer_file(const std::string& path, const std::vector<std::string>& chunks) {
    TransferFile file{TRANSFER_FILE_VERSION, chunks};
    nlohmann::json j = file;

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to create file: " + path);
    }
    out << j.dump(2) << "\n";
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write file: " + path);
    }
}

std::vector<std::string> load_transfer_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to read file: " + path);
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    TransferFile file;
    try {
        file = nlohmann::json::parse(contents.str()).get<TransferFile>();
    } catch (const nlohmann::json::exception&) {
        throw std::runtime_error("Invalid transfer file format. Expected a " +
                                 std::string(TRANSFER_FILE_EXTENSION) + " file.");
    }

    if (file.version != TRANSFER_FILE_VERSION) {
        throw std::runtime_error("Unsupported transfer file version: " + std::to_string(file.version) +
                                 ". Expected version " + std::to_string(TRANSFER_FILE_VERSION) + ".");
    }
    if (file.chunks.empty()) {
        throw std::runtime_error("Transfer file contains no data.");
    }
    return file.chunks;
}

} // namespace protocol
