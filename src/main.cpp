#include <iostream>
#include <string>
#include <vector>
#include "cli.hpp"
#include "config.hpp"
#include "ui/main_window.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage:\n"
              << "  vaultbeam [--config FILE]\n"
              << "  vaultbeam list <vault.json>\n"
              << "  vaultbeam prepare [--config FILE] <vault.json> <out-file> <entry-id>...\n"
              << "  vaultbeam receive [--config FILE] <vault.json> <transfer-file> <w1> <w2> <w3> <w4>\n"
              << "  vaultbeam scan [--config FILE] <vault.json> <w1> <w2> <w3> <w4>\n";
}

std::string join_words(const std::vector<std::string>& words, size_t from) {
    std::string phrase;
    for (size_t i = from; i < words.size(); ++i) {
        if (!phrase.empty()) phrase += ' ';
        phrase += words[i];
    }
    return phrase;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string config_path = config::default_config_path();
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                print_usage();
                return 2;
            }
            config_path = args[i + 1];
            args.erase(args.begin() + i, args.begin() + i + 2);
            break;
        }
    }

    try {
        config::Config cfg = config::load_config(config_path);

        // No command → launch GUI
        if (args.empty()) {
            return ui::run_gui(cfg);
        }

        const std::string& command = args[0];
        if (command == "list" && args.size() == 2) {
            return cli::run_list(args[1]);
        } else if (command == "prepare" && args.size() >= 4) {
            std::vector<std::string> ids(args.begin() + 3, args.end());
            return cli::run_prepare(cfg, args[1], args[2], ids);
        } else if (command == "receive" && args.size() >= 4) {
            return cli::run_receive(cfg, args[1], args[2], join_words(args, 3));
        } else if (command == "scan" && args.size() >= 3) {
            return cli::run_scan(cfg, args[1], join_words(args, 2));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    print_usage();
    return 2;
}
