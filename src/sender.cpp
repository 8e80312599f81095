#include "sender.hpp"
#include "protocol/transfer_file.hpp"
#include "security.hpp"
#include <iostream>

namespace transfer {

namespace {

const media::Image EMPTY_IMAGE{};

} // namespace

const char* phase_name(SenderPhase phase) {
    switch (phase) {
        case SenderPhase::SELECT: return "select";
        case SenderPhase::AUTH: return "auth";
        case SenderPhase::PREPARING: return "preparing";
        case SenderPhase::TRANSFER: return "transfer";
        case SenderPhase::ERROR: return "error";
        case SenderPhase::CLOSED: return "closed";
    }
    return "unknown";
}

SenderController::SenderController(std::shared_ptr<CryptoBackend> backend,
                                   std::shared_ptr<media::QrCodec> codec,
                                   std::shared_ptr<CaptureGuard> guard,
                                   EventLoop& loop,
                                   SenderCallbacks callbacks,
                                   std::chrono::milliseconds frame_interval)
    : backend_(std::move(backend)),
      codec_(std::move(codec)),
      guard_(std::move(guard)),
      loop_(loop),
      callbacks_(std::move(callbacks)),
      frame_interval_(frame_interval),
      alive_(std::make_shared<bool>(true)) {}

SenderController::~SenderController() {
    // Callbacks may point into a UI that is already gone
    callbacks_ = SenderCallbacks{};
    close();
}

void SenderController::open(std::vector<vault::EntrySummary> entries) {
    clear_transfer();
    ++generation_;
    entries_ = std::move(entries);
    selected_.clear();
    error_message_.clear();
    set_phase(SenderPhase::SELECT);
}

bool SenderController::toggle(const std::string& id) {
    if (phase_ != SenderPhase::SELECT) return false;

    bool known = false;
    for (const auto& entry : entries_) {
        if (entry.id == id) {
            known = true;
            break;
        }
    }
    if (!known) return false;

    if (!selected_.erase(id)) {
        selected_.insert(id);
    }
    return true;
}

bool SenderController::toggle_all() {
    if (phase_ != SenderPhase::SELECT) return false;

    if (selected_.size() == entries_.size()) {
        selected_.clear();
    } else {
        for (const auto& entry : entries_) {
            selected_.insert(entry.id);
        }
    }
    return true;
}

bool SenderController::selection_requires_auth() const {
    for (const auto& entry : entries_) {
        if (selected_.count(entry.id) && vault::is_sensitive(entry.type)) {
            return true;
        }
    }
    return false;
}

bool SenderController::submit_selection() {
    if (phase_ != SenderPhase::SELECT || selected_.empty()) return false;

    if (selection_requires_auth()) {
        set_phase(SenderPhase::AUTH);
    } else {
        start_prepare(std::nullopt);
    }
    return true;
}

bool SenderController::submit_password(std::string password) {
    if (phase_ != SenderPhase::AUTH || password.empty()) {
        security::secure_clear(password);
        return false;
    }
    start_prepare(std::move(password));
    return true;
}

bool SenderController::back() {
    if (phase_ != SenderPhase::AUTH) return false;
    set_phase(SenderPhase::SELECT);
    return true;
}

bool SenderController::retry() {
    if (phase_ != SenderPhase::ERROR) return false;
    clear_transfer();
    error_message_.clear();
    set_phase(SenderPhase::SELECT);
    return true;
}

void SenderController::close() {
    ++generation_;
    clear_transfer();
    selected_.clear();
    error_message_.clear();
    if (phase_ != SenderPhase::CLOSED) {
        set_phase(SenderPhase::CLOSED);
    }
}

bool SenderController::save_to_file(const std::string& path) const {
    if (phase_ != SenderPhase::TRANSFER) return false;
    protocol::save_transfer_file(path, chunks_);
    std::cout << "SenderController: wrote " << chunks_.size() << " chunks to " << path << "\n";
    return true;
}

const media::Image& SenderController::current_frame() const {
    if (phase_ != SenderPhase::TRANSFER || current_index_ >= frames_.size()) {
        return EMPTY_IMAGE;
    }
    return frames_[current_index_];
}

void SenderController::set_phase(SenderPhase phase) {
    phase_ = phase;
    if (callbacks_.on_phase) callbacks_.on_phase(phase);
}

void SenderController::start_prepare(std::optional<std::string> password) {
    PrepareRequest request;
    request.entry_ids.assign(selected_.begin(), selected_.end());
    request.password = std::move(password);

    set_phase(SenderPhase::PREPARING);

    std::weak_ptr<bool> alive = alive_;
    uint64_t generation = generation_;
    auto backend = backend_;
    auto codec = codec_;
    auto* loop = &loop_;

    // request is owned by the worker from here on
    auto shared_request = std::make_shared<PrepareRequest>(std::move(request));

    loop_.run_in_background([this, alive, generation, backend, codec, loop, shared_request]() {
        auto outcome = std::make_shared<Outcome>();
        try {
            outcome->result = backend->prepare(*shared_request);
            for (const auto& chunk : outcome->result->chunks) {
                outcome->frames.push_back(codec->render(chunk));
            }
        } catch (const std::exception& e) {
            outcome->error = e.what();
            if (outcome->result) {
                security::secure_clear(outcome->result->verification_code);
                outcome->result.reset();
            }
            outcome->frames.clear();
        }
        if (shared_request->password) {
            security::secure_clear(*shared_request->password);
        }

        loop->post([this, alive, generation, outcome]() {
            auto token = alive.lock();
            if (!token || generation != generation_ || phase_ != SenderPhase::PREPARING) {
                if (outcome->result) {
                    security::secure_clear(outcome->result->verification_code);
                }
                return;
            }
            finish_prepare(outcome);
        });
    });
}

void SenderController::finish_prepare(std::shared_ptr<Outcome> outcome) {
    if (!outcome->result) {
        std::cerr << "SenderController: prepare failed: " << outcome->error << "\n";
        fail(outcome->error);
        return;
    }

    PrepareResult& result = *outcome->result;
    if (result.chunks.empty()) {
        fail("Backend returned no chunks.");
        security::secure_clear(result.verification_code);
        return;
    }

    verification_code_ = std::move(result.verification_code);
    chunks_ = std::move(result.chunks);
    frames_ = std::move(outcome->frames);
    total_entries_ = result.total_entries;
    has_sensitive_ = result.has_sensitive;
    current_index_ = 0;

    try {
        capture_protected_ = guard_ && guard_->set_protection(true);
    } catch (const std::exception& e) {
        std::cerr << "SenderController: capture protection failed: " << e.what() << "\n";
        capture_protected_ = false;
    }

    std::cout << "SenderController: showing " << chunks_.size() << " QR codes for "
              << total_entries_ << " entries\n";
    set_phase(SenderPhase::TRANSFER);
    show_frame();

    if (chunks_.size() > 1) {
        frame_timer_ = loop_.start_timer(frame_interval_, [this]() { advance_frame(); });
    }
}

void SenderController::fail(const std::string& message) {
    error_message_ = message;
    set_phase(SenderPhase::ERROR);
    if (callbacks_.on_error) callbacks_.on_error(message);
}

void SenderController::show_frame() {
    if (callbacks_.on_frame && current_index_ < frames_.size()) {
        callbacks_.on_frame(current_index_, frames_[current_index_]);
    }
}

void SenderController::advance_frame() {
    if (phase_ != SenderPhase::TRANSFER || chunks_.empty()) return;
    current_index_ = (current_index_ + 1) % chunks_.size();
    show_frame();
}

void SenderController::clear_transfer() {
    if (frame_timer_) {
        loop_.stop_timer(*frame_timer_);
        frame_timer_.reset();
    }
    if (capture_protected_) {
        try {
            guard_->set_protection(false);
        } catch (const std::exception& e) {
            std::cerr << "SenderController: failed to lift capture protection: " << e.what() << "\n";
        }
        capture_protected_ = false;
    }
    security::secure_clear(verification_code_);
    for (auto& chunk : chunks_) {
        security::secure_clear(chunk);
    }
    chunks_.clear();
    frames_.clear();
    current_index_ = 0;
    total_entries_ = 0;
    has_sensitive_ = false;
}

} // namespace transfer
