#include "backend.hpp"
#include "protocol/chunk.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace transfer;
using testing_support::TempDir;

namespace {

class VaultBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = vault::EntryStore::load(dir_.file("source.json"));
        source_->set_password("master");
        totp_id_ = source_->add({"", vault::EntryType::TOTP, "GitHub", "github.com", "JBSWY3DPEHPK3PXP"});
        seed_id_ = source_->add({"", vault::EntryType::SEED_PHRASE, "Wallet", "", "abandon ability able about"});
        source_->save();

        target_ = vault::EntryStore::load(dir_.file("target.json"));
    }

    std::string error_code_of_prepare(VaultBackend& backend, PrepareRequest request) {
        try {
            backend.prepare(std::move(request));
        } catch (const TransferError& e) {
            return e.code();
        }
        return "";
    }

    std::string error_code_of_receive(VaultBackend& backend, const std::vector<std::string>& chunks,
                                      const std::string& code) {
        try {
            backend.receive(chunks, code);
        } catch (const TransferError& e) {
            return e.code();
        }
        return "";
    }

    TempDir dir_;
    std::shared_ptr<vault::EntryStore> source_;
    std::shared_ptr<vault::EntryStore> target_;
    std::string totp_id_;
    std::string seed_id_;
};

} // namespace

TEST_F(VaultBackendTest, MovesEntriesBetweenVaults) {
    VaultBackend sender(source_);
    PrepareResult prepared = sender.prepare({{totp_id_, seed_id_}, std::string("master")});

    EXPECT_EQ(prepared.total_entries, 2u);
    EXPECT_TRUE(prepared.has_sensitive);
    EXPECT_TRUE(security::is_valid_verification_code(prepared.verification_code));
    ASSERT_FALSE(prepared.chunks.empty());

    VaultBackend receiver(target_);
    EXPECT_EQ(receiver.receive(prepared.chunks, prepared.verification_code), 2u);

    auto imported = vault::EntryStore::load(dir_.file("target.json"));
    ASSERT_EQ(imported->size(), 2u);
    auto list = imported->list();
    auto wallet = std::find_if(list.begin(), list.end(), [](const vault::EntrySummary& s) {
        return s.name == "Wallet";
    });
    ASSERT_NE(wallet, list.end());
    EXPECT_NE(wallet->id, seed_id_);
    EXPECT_EQ(imported->get(wallet->id)->secret, "abandon ability able about");
}

TEST_F(VaultBackendTest, ManyChunksArriveInAnyOrder) {
    VaultBackend sender(source_, 16);
    PrepareResult prepared = sender.prepare({{totp_id_}, std::nullopt});
    ASSERT_GT(prepared.chunks.size(), 3u);

    for (std::size_t i = 0; i < prepared.chunks.size(); ++i) {
        auto chunk = protocol::parse_chunk(prepared.chunks[i]);
        ASSERT_TRUE(chunk.has_value());
        EXPECT_EQ(chunk->header.index, i);
        EXPECT_EQ(chunk->header.total, prepared.chunks.size());
    }

    std::vector<std::string> reversed(prepared.chunks.rbegin(), prepared.chunks.rend());
    VaultBackend receiver(target_);
    EXPECT_EQ(receiver.receive(reversed, prepared.verification_code), 1u);
}

TEST_F(VaultBackendTest, SensitiveEntriesNeedThePassword) {
    VaultBackend backend(source_);
    EXPECT_EQ(error_code_of_prepare(backend, {{seed_id_}, std::nullopt}), "AUTH_REQUIRED");
    EXPECT_EQ(error_code_of_prepare(backend, {{seed_id_}, std::string("wrong")}), "INVALID_PASSWORD");
    EXPECT_EQ(error_code_of_prepare(backend, {{totp_id_}, std::nullopt}), "");
}

TEST_F(VaultBackendTest, RejectsUnknownOrEmptySelection) {
    VaultBackend backend(source_);
    EXPECT_EQ(error_code_of_prepare(backend, {{"missing"}, std::nullopt}), "ENTRY_NOT_FOUND");
    EXPECT_EQ(error_code_of_prepare(backend, {{}, std::nullopt}), "INVALID_REQUEST");
}

TEST_F(VaultBackendTest, WrongPhraseFailsDecryption) {
    VaultBackend sender(source_);
    PrepareResult prepared = sender.prepare({{totp_id_}, std::nullopt});

    VaultBackend receiver(target_);
    EXPECT_EQ(error_code_of_receive(receiver, prepared.chunks, "alpha bravo charlie delta"),
              "DECRYPTION_FAILED");
    EXPECT_EQ(error_code_of_receive(receiver, prepared.chunks, "alpha bravo"), "INVALID_CODE");
    EXPECT_EQ(target_->size(), 0u);
}

TEST_F(VaultBackendTest, MissingChunkIsIncomplete) {
    VaultBackend sender(source_, 16);
    PrepareResult prepared = sender.prepare({{totp_id_}, std::nullopt});
    prepared.chunks.erase(prepared.chunks.begin() + 1);

    VaultBackend receiver(target_);
    EXPECT_EQ(error_code_of_receive(receiver, prepared.chunks, prepared.verification_code),
              "INCOMPLETE_TRANSFER");
}

TEST_F(VaultBackendTest, RejectsChunkSizeThatCannotFitAQrCode) {
    EXPECT_THROW(VaultBackend(source_, security::MAX_CHUNK_SIZE + 1), std::invalid_argument);
    EXPECT_THROW(VaultBackend(source_, 0), std::invalid_argument);
    EXPECT_NO_THROW(VaultBackend(source_, security::MAX_CHUNK_SIZE));
}

TEST_F(VaultBackendTest, GarbageChunkIsInvalidData) {
    VaultBackend receiver(target_);
    EXPECT_EQ(error_code_of_receive(receiver, {"@@not base64@@"}, "alpha bravo charlie delta"),
              "INVALID_DATA");
}

TEST(TransferPayloadTest, ChecksumMismatchIsRejected) {
    std::vector<vault::Entry> entries = {{"a", vault::EntryType::TOTP, "n", "i", "s"}};
    auto payload = serialize_transfer_payload(entries);

    auto j = nlohmann::json::parse(payload.begin(), payload.end());
    j["entries"][0]["secret"] = "tampered";
    std::string text = j.dump();
    std::vector<uint8_t> tampered(text.begin(), text.end());

    try {
        parse_transfer_payload(tampered);
        FAIL() << "expected checksum failure";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), "IMPORT_FAILED");
    }

    auto parsed = parse_transfer_payload(payload);
    ASSERT_EQ(parsed.size(), 1u);
    EXPECT_EQ(parsed[0].secret, "s");
}
