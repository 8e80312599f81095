#pragma once

#include <string>
#include <cstddef>
#include <nlohmann/json.hpp>
#include "security.hpp"

namespace config {

struct Config {
    std::string vault_path;
    int frame_interval_ms = 400;
    int scan_interval_ms = 100;
    std::size_t max_chunk_size = security::DEFAULT_MAX_CHUNK_SIZE;
    std::string camera_device = "/dev/video0";
    int camera_width = 640;
    int camera_height = 480;
    int qr_scale = 6;
    int qr_margin = 4;
};

// $XDG_CONFIG_HOME/vaultbeam/config.json, falling back to ~/.config
std::string default_config_path();

// $XDG_DATA_HOME/vaultbeam/vault.json, falling back to ~/.local/share
std::string default_vault_path();

// Defaults overridden by whatever keys the file sets. A missing file yields
// the defaults; a malformed one throws std::runtime_error.
Config load_config(const std::string& path);

} // namespace config
