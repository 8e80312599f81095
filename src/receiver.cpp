#include "receiver.hpp"
#include "protocol/transfer_file.hpp"
#include "security.hpp"
#include <iostream>

namespace transfer {

// ─── ChunkAccumulator ───────────────────────────────────────────────────────

bool ChunkAccumulator::add(const protocol::Chunk& chunk) {
    const auto& header = chunk.header;
    if (header.total == 0 || header.index >= header.total) {
        return false;
    }
    if (total_ == 0) {
        total_ = header.total;
    } else if (header.total != total_) {
        return false;
    }
    return chunks_.emplace(header.index, chunk.text).second;
}

std::vector<std::string> ChunkAccumulator::ordered() const {
    std::vector<std::string> out;
    out.reserve(chunks_.size());
    for (const auto& [index, text] : chunks_) {
        out.push_back(text);
    }
    return out;
}

void ChunkAccumulator::clear() {
    chunks_.clear();
    total_ = 0;
}

// ─── ReceiverController ─────────────────────────────────────────────────────

const char* phase_name(ReceiverPhase phase) {
    switch (phase) {
        case ReceiverPhase::CODE: return "code";
        case ReceiverPhase::SCANNING: return "scanning";
        case ReceiverPhase::IMPORTING: return "importing";
        case ReceiverPhase::COMPLETE: return "complete";
        case ReceiverPhase::ERROR: return "error";
        case ReceiverPhase::CAMERA_DENIED: return "camera-denied";
        case ReceiverPhase::CLOSED: return "closed";
    }
    return "unknown";
}

ReceiverController::ReceiverController(std::shared_ptr<CryptoBackend> backend,
                                       std::shared_ptr<media::QrCodec> codec,
                                       std::shared_ptr<media::CameraFacility> camera,
                                       EventLoop& loop,
                                       ReceiverCallbacks callbacks,
                                       std::chrono::milliseconds scan_interval)
    : backend_(std::move(backend)),
      codec_(std::move(codec)),
      camera_(std::move(camera)),
      loop_(loop),
      callbacks_(std::move(callbacks)),
      scan_interval_(scan_interval),
      alive_(std::make_shared<bool>(true)) {}

ReceiverController::~ReceiverController() {
    callbacks_ = ReceiverCallbacks{};
    close();
}

void ReceiverController::open() {
    reset_session();
    set_phase(ReceiverPhase::CODE);
}

bool ReceiverController::set_verification_code(std::string code) {
    if (phase_ != ReceiverPhase::CODE) {
        security::secure_clear(code);
        return false;
    }
    security::secure_clear(verification_code_);
    verification_code_ = std::move(code);
    return code_valid();
}

bool ReceiverController::code_valid() const {
    return security::is_valid_verification_code(verification_code_);
}

bool ReceiverController::start_scanning() {
    if (phase_ != ReceiverPhase::CODE || !code_valid()) return false;

    try {
        stream_ = camera_->acquire();
    } catch (const std::exception& e) {
        std::cerr << "ReceiverController: camera unavailable: " << e.what() << "\n";
        stream_.reset();
        error_message_ = e.what();
        set_phase(ReceiverPhase::CAMERA_DENIED);
        return false;
    }

    accumulator_.clear();
    decoding_ = false;
    set_phase(ReceiverPhase::SCANNING);
    scan_timer_ = loop_.start_timer(scan_interval_, [this]() { tick(); });
    return true;
}

bool ReceiverController::load_file(const std::string& path) {
    if (phase_ != ReceiverPhase::CODE || !code_valid()) return false;

    std::vector<std::string> chunks;
    try {
        chunks = protocol::load_transfer_file(path);
    } catch (const std::exception& e) {
        std::cerr << "ReceiverController: " << e.what() << "\n";
        fail(e.what());
        return false;
    }

    std::cout << "ReceiverController: loaded " << chunks.size() << " chunks from " << path << "\n";
    begin_import(std::move(chunks));
    return true;
}

bool ReceiverController::accept_qr_data(const std::string& text) {
    if (phase_ != ReceiverPhase::SCANNING) return false;

    auto chunk = protocol::parse_chunk(text);
    if (!chunk || !accumulator_.add(*chunk)) {
        return false;
    }

    if (callbacks_.on_progress) {
        callbacks_.on_progress(accumulator_.size(), accumulator_.total(), chunk->header.index);
    }

    if (accumulator_.complete()) {
        std::cout << "ReceiverController: all " << accumulator_.total() << " chunks received\n";
        begin_import(accumulator_.ordered());
    }
    return true;
}

bool ReceiverController::finish_scanning() {
    if (phase_ != ReceiverPhase::SCANNING) return false;

    if (accumulator_.complete()) {
        begin_import(accumulator_.ordered());
        return true;
    }

    stop_camera();
    if (accumulator_.total() > 0) {
        fail("Incomplete transfer: received " + std::to_string(accumulator_.size()) + " of " +
             std::to_string(accumulator_.total()) + " QR codes.");
    } else {
        fail("No QR codes were scanned.");
    }
    return true;
}

bool ReceiverController::retry() {
    if (phase_ != ReceiverPhase::ERROR && phase_ != ReceiverPhase::CAMERA_DENIED) return false;
    reset_session();
    set_phase(ReceiverPhase::CODE);
    return true;
}

void ReceiverController::close() {
    reset_session();
    if (phase_ != ReceiverPhase::CLOSED) {
        set_phase(ReceiverPhase::CLOSED);
    }
}

void ReceiverController::set_phase(ReceiverPhase phase) {
    phase_ = phase;
    if (callbacks_.on_phase) callbacks_.on_phase(phase);
}

void ReceiverController::tick() {
    if (phase_ != ReceiverPhase::SCANNING || !stream_ || decoding_) return;

    auto frame = stream_->latest_frame();
    if (!frame || frame->empty()) return;

    decoding_ = true;
    std::weak_ptr<bool> alive = alive_;
    uint64_t generation = generation_;
    auto codec = codec_;
    auto* loop = &loop_;
    auto shared_frame = std::make_shared<media::Frame>(std::move(*frame));

    loop_.run_in_background([this, alive, generation, codec, loop, shared_frame]() {
        std::optional<std::string> text;
        try {
            text = codec->decode(*shared_frame);
        } catch (const std::exception& e) {
            std::cerr << "ReceiverController: decode failed: " << e.what() << "\n";
        }

        loop->post([this, alive, generation, text]() {
            auto token = alive.lock();
            if (!token || generation != generation_) return;
            decoding_ = false;
            if (text) {
                accept_qr_data(*text);
            }
        });
    });
}

void ReceiverController::begin_import(std::vector<std::string> chunks) {
    stop_camera();
    set_phase(ReceiverPhase::IMPORTING);

    std::weak_ptr<bool> alive = alive_;
    uint64_t generation = generation_;
    auto backend = backend_;
    auto* loop = &loop_;
    auto shared_chunks = std::make_shared<std::vector<std::string>>(std::move(chunks));
    auto code = std::make_shared<std::string>(security::normalize_verification_code(verification_code_));

    loop_.run_in_background([this, alive, generation, backend, loop, shared_chunks, code]() {
        std::optional<std::size_t> imported;
        std::string error;
        try {
            imported = backend->receive(*shared_chunks, *code);
        } catch (const std::exception& e) {
            error = e.what();
        }
        security::secure_clear(*code);

        loop->post([this, alive, generation, imported, error]() {
            auto token = alive.lock();
            if (!token || generation != generation_ || phase_ != ReceiverPhase::IMPORTING) {
                return;
            }
            if (imported) {
                imported_count_ = *imported;
                std::cout << "ReceiverController: imported " << imported_count_ << " entries\n";
                accumulator_.clear();
                security::secure_clear(verification_code_);
                set_phase(ReceiverPhase::COMPLETE);
            } else {
                std::cerr << "ReceiverController: import failed: " << error << "\n";
                fail(error);
            }
        });
    });
}

void ReceiverController::fail(const std::string& message) {
    error_message_ = message;
    set_phase(ReceiverPhase::ERROR);
}

void ReceiverController::stop_camera() {
    if (scan_timer_) {
        loop_.stop_timer(*scan_timer_);
        scan_timer_.reset();
    }
    if (stream_) {
        stream_->stop();
        stream_.reset();
    }
    decoding_ = false;
}

void ReceiverController::reset_session() {
    ++generation_;
    stop_camera();
    accumulator_.clear();
    security::secure_clear(verification_code_);
    imported_count_ = 0;
    error_message_.clear();
}

} // namespace transfer
