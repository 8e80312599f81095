#include "config.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>

using testing_support::TempDir;

TEST(ConfigTest, MissingFileGivesDefaults) {
    TempDir dir;
    auto cfg = config::load_config(dir.file("config.json"));
    EXPECT_EQ(cfg.frame_interval_ms, 400);
    EXPECT_EQ(cfg.scan_interval_ms, 100);
    EXPECT_EQ(cfg.max_chunk_size, security::DEFAULT_MAX_CHUNK_SIZE);
    EXPECT_EQ(cfg.camera_device, "/dev/video0");
    EXPECT_EQ(cfg.camera_width, 640);
    EXPECT_EQ(cfg.camera_height, 480);
    EXPECT_FALSE(cfg.vault_path.empty());
}

TEST(ConfigTest, FileOverridesSomeKeys) {
    TempDir dir;
    std::string path = dir.file("config.json");
    {
        std::ofstream out(path);
        out << R"({"frame_interval_ms": 250, "camera_device": "/dev/video2", "unknown": true})";
    }
    auto cfg = config::load_config(path);
    EXPECT_EQ(cfg.frame_interval_ms, 250);
    EXPECT_EQ(cfg.camera_device, "/dev/video2");
    EXPECT_EQ(cfg.scan_interval_ms, 100);
}

TEST(ConfigTest, MalformedFileThrows) {
    TempDir dir;
    std::string path = dir.file("config.json");
    {
        std::ofstream out(path);
        out << "{ broken";
    }
    EXPECT_THROW(config::load_config(path), std::runtime_error);

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"scan_interval_ms": 0})";
    }
    EXPECT_THROW(config::load_config(path), std::runtime_error);
}

TEST(ConfigTest, ChunkSizeMustFitAQrCode) {
    TempDir dir;
    std::string path = dir.file("config.json");
    {
        std::ofstream out(path);
        out << R"({"max_chunk_size": 1800})";
    }
    EXPECT_THROW(config::load_config(path), std::runtime_error);

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"max_chunk_size": 1714})";
    }
    EXPECT_EQ(config::load_config(path).max_chunk_size, security::MAX_CHUNK_SIZE);
}
