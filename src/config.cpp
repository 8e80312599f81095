#include "config.hpp"
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <iostream>

namespace fs = std::filesystem;

namespace config {

namespace {

fs::path xdg_dir(const char* variable, const char* fallback) {
    const char* value = std::getenv(variable);
    if (value && *value) {
        return fs::path(value);
    }
    const char* home = std::getenv("HOME");
    return fs::path(home ? home : ".") / fallback;
}

} // namespace

std::string default_config_path() {
    return (xdg_dir("XDG_CONFIG_HOME", ".config") / "vaultbeam" / "config.json").string();
}

std::string default_vault_path() {
    return (xdg_dir("XDG_DATA_HOME", ".local/share") / "vaultbeam" / "vault.json").string();
}

Config load_config(const std::string& path) {
    Config cfg;
    cfg.vault_path = default_vault_path();

    if (!fs::exists(path)) {
        return cfg;
    }

    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
        cfg.vault_path = j.value("vault_path", cfg.vault_path);
        cfg.frame_interval_ms = j.value("frame_interval_ms", cfg.frame_interval_ms);
        cfg.scan_interval_ms = j.value("scan_interval_ms", cfg.scan_interval_ms);
        cfg.max_chunk_size = j.value("max_chunk_size", cfg.max_chunk_size);
        cfg.camera_device = j.value("camera_device", cfg.camera_device);
        cfg.camera_width = j.value("camera_width", cfg.camera_width);
        cfg.camera_height = j.value("camera_height", cfg.camera_height);
        cfg.qr_scale = j.value("qr_scale", cfg.qr_scale);
        cfg.qr_margin = j.value("qr_margin", cfg.qr_margin);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }

    if (cfg.frame_interval_ms <= 0 || cfg.scan_interval_ms <= 0) {
        throw std::runtime_error("Invalid config file " + path + ": intervals must be positive");
    }
    if (cfg.max_chunk_size == 0 || cfg.max_chunk_size > security::MAX_CHUNK_SIZE) {
        throw std::runtime_error("Invalid config file " + path + ": max_chunk_size must be between 1 and " +
                                 std::to_string(security::MAX_CHUNK_SIZE));
    }

    std::cout << "Config: loaded " << path << "\n";
    return cfg;
}

} // namespace config
