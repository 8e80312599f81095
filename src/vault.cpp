#include "vault.hpp"
#include "security.hpp"
#include <sodium.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <stdexcept>
#include <cstdio>

namespace fs = std::filesystem;

namespace vault {

namespace {

struct VaultFile {
    std::string password_hash;
    std::vector<Entry> entries;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(VaultFile, password_hash, entries)

} // namespace

bool is_sensitive(EntryType type) {
    return type == EntryType::SEED_PHRASE || type == EntryType::RECOVERY_CODE;
}

const char* type_name(EntryType type) {
    switch (type) {
        case EntryType::TOTP: return "totp";
        case EntryType::HOTP: return "hotp";
        case EntryType::SEED_PHRASE: return "seed_phrase";
        case EntryType::RECOVERY_CODE: return "recovery_code";
        case EntryType::CREDENTIAL: return "credential";
        case EntryType::SECURE_NOTE: return "secure_note";
    }
    return "unknown";
}

std::string generate_entry_id() {
    security::init_sodium();

    unsigned char raw[8];
    randombytes_buf(raw, sizeof(raw));

    std::ostringstream oss;
    for (size_t i = 0; i < sizeof(raw); ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(raw[i]);
    }
    return oss.str();
}

EntryStore::EntryStore(std::string path) : path_(std::move(path)) {}

std::shared_ptr<EntryStore> EntryStore::load(const std::string& path) {
    auto store = std::make_shared<EntryStore>(path);
    if (!fs::exists(path)) {
        return store;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Could not open vault for reading: " + path);
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    try {
        auto file = nlohmann::json::parse(contents.str()).get<VaultFile>();
        store->password_hash_ = std::move(file.password_hash);
        store->entries_ = std::move(file.entries);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid vault file " + path + ": " + e.what());
    }
    return store;
}

void EntryStore::save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    write_locked(entries_);
}

void EntryStore::write_locked(const std::vector<Entry>& entries) const {
    if (path_.empty()) return;

    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }

    nlohmann::json j = VaultFile{password_hash_, entries};
    std::string part_file = path_ + ".part";
    {
        std::ofstream out(part_file, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Could not open vault for writing: " + part_file);
        }
        out << j.dump(2) << "\n";
        if (!out) {
            throw std::runtime_error("Failed to write vault: " + part_file);
        }
    }
    if (std::rename(part_file.c_str(), path_.c_str()) != 0) {
        throw std::runtime_error("Failed to rename temp file to: " + path_);
    }
}

std::vector<EntrySummary> EntryStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EntrySummary> summaries;
    summaries.reserve(entries_.size());
    for (const auto& entry : entries_) {
        summaries.push_back({entry.id, entry.type, entry.name, entry.issuer});
    }
    return summaries;
}

std::optional<Entry> EntryStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.id == id) return entry;
    }
    return std::nullopt;
}

std::size_t EntryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string EntryStore::add(Entry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entry.id.empty()) {
        entry.id = generate_entry_id();
    }
    std::string id = entry.id;
    entries_.push_back(std::move(entry));
    return id;
}

std::size_t EntryStore::import_entries(std::vector<Entry> entries) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Entry> merged = entries_;
    for (auto& entry : entries) {
        entry.id = generate_entry_id();
        merged.push_back(std::move(entry));
    }
    write_locked(merged);

    std::size_t imported = merged.size() - entries_.size();
    entries_ = std::move(merged);
    return imported;
}

void EntryStore::set_password(const std::string& password) {
    std::string hash = security::hash_password(password);
    std::lock_guard<std::mutex> lock(mutex_);
    password_hash_ = std::move(hash);
}

bool EntryStore::has_password() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !password_hash_.empty();
}

bool EntryStore::verify_password(const std::string& password) const {
    std::string hash;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hash = password_hash_;
    }
    return security::verify_password(password, hash);
}

} // namespace vault
