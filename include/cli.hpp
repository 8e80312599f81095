#pragma once

#include <string>
#include <vector>
#include "config.hpp"

namespace cli {

// Each command returns a process exit status

int run_list(const std::string& vault_path);

// Prompts for the master password on stdin when a sensitive entry is selected
int run_prepare(const config::Config& cfg, const std::string& vault_path,
                const std::string& out_path, const std::vector<std::string>& entry_ids);

int run_receive(const config::Config& cfg, const std::string& vault_path,
                const std::string& transfer_path, const std::string& phrase);

// Scans until every chunk has arrived; Ctrl+C acts as "done scanning"
int run_scan(const config::Config& cfg, const std::string& vault_path, const std::string& phrase);

} // namespace cli
