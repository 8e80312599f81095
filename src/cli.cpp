#include "cli.hpp"
#include "sender.hpp"
#include "receiver.hpp"
#include "security.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/signal_set.hpp>
#include <termios.h>
#include <unistd.h>
#include <csignal>
#include <iostream>

namespace cli {

namespace {

std::string read_password(const std::string& prompt) {
    std::cout << prompt << std::flush;

    termios old_attr{};
    bool is_tty = tcgetattr(STDIN_FILENO, &old_attr) == 0;
    if (is_tty) {
        termios no_echo = old_attr;
        no_echo.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &no_echo);
    }

    std::string password;
    std::getline(std::cin, password);

    if (is_tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &old_attr);
        std::cout << "\n";
    }
    return password;
}

void print_phrase(const std::string& phrase) {
    std::string line(phrase.size() + 4, '-');
    std::cout << "+" << line << "+\n";
    std::cout << "|  " << phrase << "  |\n";
    std::cout << "+" << line << "+\n";
}

struct Runtime {
    boost::asio::io_context io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
    transfer::AsioEventLoop loop;

    Runtime() : work(boost::asio::make_work_guard(io)), loop(io) {}

    void stop() {
        work.reset();
        io.stop();
    }
};

} // namespace

int run_list(const std::string& vault_path) {
    auto store = vault::EntryStore::load(vault_path);
    for (const auto& entry : store->list()) {
        std::cout << entry.id << "  " << vault::type_name(entry.type) << "  " << entry.name;
        if (!entry.issuer.empty()) std::cout << " (" << entry.issuer << ")";
        std::cout << "\n";
    }
    std::cout << store->size() << " entries\n";
    return 0;
}

int run_prepare(const config::Config& cfg, const std::string& vault_path,
                const std::string& out_path, const std::vector<std::string>& entry_ids) {
    auto store = vault::EntryStore::load(vault_path);
    auto backend = std::make_shared<transfer::VaultBackend>(store, cfg.max_chunk_size);
    auto codec = std::make_shared<media::ZbarQrCodec>(cfg.qr_scale, cfg.qr_margin);
    auto guard = std::make_shared<transfer::NoCaptureGuard>();

    Runtime rt;
    transfer::SenderCallbacks callbacks;
    callbacks.on_phase = [&rt](transfer::SenderPhase phase) {
        if (phase == transfer::SenderPhase::TRANSFER || phase == transfer::SenderPhase::ERROR) {
            rt.stop();
        }
    };

    transfer::SenderController sender(backend, codec, guard, rt.loop, callbacks,
                                      std::chrono::milliseconds(cfg.frame_interval_ms));
    sender.open(store->list());

    for (const auto& id : entry_ids) {
        if (!sender.toggle(id)) {
            std::cerr << "Unknown entry id: " << id << "\n";
            return 1;
        }
    }
    if (!sender.submit_selection()) {
        std::cerr << "No entries selected.\n";
        return 1;
    }
    if (sender.phase() == transfer::SenderPhase::AUTH) {
        if (!sender.submit_password(read_password("Master password: "))) {
            std::cerr << "A password is required to send seed phrases or recovery codes.\n";
            return 1;
        }
    }

    rt.io.run();

    if (sender.phase() != transfer::SenderPhase::TRANSFER) {
        std::cerr << "Error: " << sender.error_message() << "\n";
        return 1;
    }

    try {
        sender.save_to_file(out_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Prepared " << sender.total_entries() << " entries in "
              << sender.chunks().size() << " chunks.\n";
    std::cout << "Verification phrase (share it separately from the file):\n";
    print_phrase(sender.verification_code());
    sender.close();
    return 0;
}

int run_receive(const config::Config& cfg, const std::string& vault_path,
                const std::string& transfer_path, const std::string& phrase) {
    auto store = vault::EntryStore::load(vault_path);
    auto backend = std::make_shared<transfer::VaultBackend>(store, cfg.max_chunk_size);
    auto codec = std::make_shared<media::ZbarQrCodec>(cfg.qr_scale, cfg.qr_margin);
    auto camera = std::make_shared<media::V4l2Camera>(cfg.camera_device, cfg.camera_width, cfg.camera_height);

    Runtime rt;
    transfer::ReceiverCallbacks callbacks;
    callbacks.on_phase = [&rt](transfer::ReceiverPhase phase) {
        if (phase == transfer::ReceiverPhase::COMPLETE || phase == transfer::ReceiverPhase::ERROR) {
            rt.stop();
        }
    };

    transfer::ReceiverController receiver(backend, codec, camera, rt.loop, callbacks,
                                          std::chrono::milliseconds(cfg.scan_interval_ms));
    receiver.open();
    if (!receiver.set_verification_code(phrase)) {
        std::cerr << "The verification phrase must have exactly "
                  << security::VERIFICATION_WORD_COUNT << " words.\n";
        return 1;
    }

    receiver.load_file(transfer_path);
    if (receiver.phase() == transfer::ReceiverPhase::IMPORTING) {
        rt.io.run();
    }

    if (receiver.phase() != transfer::ReceiverPhase::COMPLETE) {
        std::cerr << "Error: " << receiver.error_message() << "\n";
        return 1;
    }
    std::cout << "Imported " << receiver.imported_count() << " entries into " << vault_path << "\n";
    return 0;
}

int run_scan(const config::Config& cfg, const std::string& vault_path, const std::string& phrase) {
    auto store = vault::EntryStore::load(vault_path);
    auto backend = std::make_shared<transfer::VaultBackend>(store, cfg.max_chunk_size);
    auto codec = std::make_shared<media::ZbarQrCodec>(cfg.qr_scale, cfg.qr_margin);
    auto camera = std::make_shared<media::V4l2Camera>(cfg.camera_device, cfg.camera_width, cfg.camera_height);

    Runtime rt;
    boost::asio::signal_set signals(rt.io, SIGINT, SIGTERM);

    transfer::ReceiverCallbacks callbacks;
    callbacks.on_phase = [&rt, &signals](transfer::ReceiverPhase phase) {
        if (phase == transfer::ReceiverPhase::COMPLETE || phase == transfer::ReceiverPhase::ERROR ||
            phase == transfer::ReceiverPhase::CAMERA_DENIED) {
            signals.cancel();
            rt.stop();
        }
    };
    callbacks.on_progress = [](std::size_t received, std::size_t total, std::size_t last) {
        std::cout << "Received chunk " << (last + 1) << " (" << received << "/" << total << ")\n";
    };

    transfer::ReceiverController receiver(backend, codec, camera, rt.loop, callbacks,
                                          std::chrono::milliseconds(cfg.scan_interval_ms));
    receiver.open();
    if (!receiver.set_verification_code(phrase)) {
        std::cerr << "The verification phrase must have exactly "
                  << security::VERIFICATION_WORD_COUNT << " words.\n";
        return 1;
    }

    if (!receiver.start_scanning()) {
        std::cerr << "Camera access is required to scan QR codes: " << receiver.error_message() << "\n";
        return 1;
    }

    signals.async_wait([&receiver](const boost::system::error_code& ec, int /*signo*/) {
        if (!ec) receiver.finish_scanning();
    });

    std::cout << "Scanning... press Ctrl+C when the sender has cycled through every code.\n";
    rt.io.run();

    if (receiver.phase() != transfer::ReceiverPhase::COMPLETE) {
        std::cerr << "Error: " << receiver.error_message() << "\n";
        return 1;
    }
    std::cout << "Imported " << receiver.imported_count() << " entries into " << vault_path << "\n";
    return 0;
}

} // namespace cli
