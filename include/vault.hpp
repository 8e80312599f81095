#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

namespace vault {

enum class EntryType {
    TOTP,
    HOTP,
    SEED_PHRASE,
    RECOVERY_CODE,
    CREDENTIAL,
    SECURE_NOTE
};

NLOHMANN_JSON_SERIALIZE_ENUM(EntryType, {
    {EntryType::TOTP, "totp"},
    {EntryType::HOTP, "hotp"},
    {EntryType::SEED_PHRASE, "seed_phrase"},
    {EntryType::RECOVERY_CODE, "recovery_code"},
    {EntryType::CREDENTIAL, "credential"},
    {EntryType::SECURE_NOTE, "secure_note"},
})

struct Entry {
    std::string id;
    EntryType type;
    std::string name;
    std::string issuer;
    std::string secret;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Entry, id, type, name, issuer, secret)

// What the selection list shows; never carries the secret
struct EntrySummary {
    std::string id;
    EntryType type;
    std::string name;
    std::string issuer;
};

// Seed phrases and recovery codes need the master password again before they leave the device
bool is_sensitive(EntryType type);

const char* type_name(EntryType type);

// 16 random hex characters
std::string generate_entry_id();

class EntryStore {
public:
    EntryStore() = default;
    explicit EntryStore(std::string path);

    // A missing file yields an empty store bound to that path.
    // Throws std::runtime_error on a malformed file.
    static std::shared_ptr<EntryStore> load(const std::string& path);

    // No-op for a store without a path
    void save() const;

    std::vector<EntrySummary> list() const;
    std::optional<Entry> get(const std::string& id) const;
    std::size_t size() const;

    // Assigns an id if the entry has none; returns the id
    std::string add(Entry entry);

    // All-or-nothing: every entry gets a fresh id, then the store is persisted
    std::size_t import_entries(std::vector<Entry> entries);

    void set_password(const std::string& password);
    bool has_password() const;
    bool verify_password(const std::string& password) const;

private:
    void write_locked(const std::vector<Entry>& entries) const;

    mutable std::mutex mutex_;
    std::string path_;
    std::string password_hash_;
    std::vector<Entry> entries_;
};

} // namespace vault
