#include "protocol/transfer_file.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace protocol;
using testing_support::TempDir;

namespace {

void write_text(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

std::string load_error(const std::string& path) {
    try {
        load_transfer_file(path);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

} // namespace

TEST(TransferFileTest, KeepsChunksVerbatimAndInOrder) {
    TempDir dir;
    std::string path = dir.file(std::string("out") + TRANSFER_FILE_EXTENSION);
    std::vector<std::string> chunks = {"AAAAAQ==", "AAEAAg==", "third chunk, not even base64"};

    save_transfer_file(path, chunks);
    EXPECT_EQ(load_transfer_file(path), chunks);
}

TEST(TransferFileTest, WritesVersionedJson) {
    TempDir dir;
    std::string path = dir.file("out.json");
    save_transfer_file(path, {"abc"});

    std::ifstream in(path);
    auto j = nlohmann::json::parse(in);
    EXPECT_EQ(j.at("version").get<int>(), 1);
    EXPECT_EQ(j.at("chunks").size(), 1u);
    EXPECT_FALSE(j.contains("verification_code"));
}

TEST(TransferFileTest, MissingFile) {
    TempDir dir;
    EXPECT_EQ(load_error(dir.file("nope")).rfind("Failed to read file", 0), 0u);
}

TEST(TransferFileTest, NotATransferFile) {
    TempDir dir;
    std::string path = dir.file("bad");
    write_text(path, "hello");
    EXPECT_EQ(load_error(path).rfind("Invalid transfer file format", 0), 0u);

    write_text(path, R"({"chunks": ["a"]})");
    EXPECT_EQ(load_error(path).rfind("Invalid transfer file format", 0), 0u);
}

TEST(TransferFileTest, OtherVersion) {
    TempDir dir;
    std::string path = dir.file("v2");
    write_text(path, R"({"version": 2, "chunks": ["a"]})");
    EXPECT_EQ(load_error(path).rfind("Unsupported transfer file version", 0), 0u);
}

TEST(TransferFileTest, NoChunks) {
    TempDir dir;
    std::string path = dir.file("empty");
    write_text(path, R"({"version": 1, "chunks": []})");
    EXPECT_EQ(load_error(path), "Transfer file contains no data.");
}
