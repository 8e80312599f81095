#pragma once

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <chrono>
#include <optional>
#include <functional>
#include "backend.hpp"
#include "capture_guard.hpp"
#include "event_loop.hpp"
#include "media/qr_codec.hpp"
#include "vault.hpp"

namespace transfer {

constexpr std::chrono::milliseconds DEFAULT_FRAME_INTERVAL{400};

enum class SenderPhase {
    SELECT,
    AUTH,
    PREPARING,
    TRANSFER,
    ERROR,
    CLOSED
};

const char* phase_name(SenderPhase phase);

struct SenderCallbacks {
    std::function<void(SenderPhase)> on_phase;
    // Index of the chunk now on screen and its QR image
    std::function<void(std::size_t, const media::Image&)> on_frame;
    std::function<void(const std::string&)> on_error;
};

// Drives the sending side: entry selection, optional re-auth, one backend
// prepare call, then an animated QR sequence. All methods run on the loop thread.
class SenderController {
public:
    SenderController(std::shared_ptr<CryptoBackend> backend,
                     std::shared_ptr<media::QrCodec> codec,
                     std::shared_ptr<CaptureGuard> guard,
                     EventLoop& loop,
                     SenderCallbacks callbacks,
                     std::chrono::milliseconds frame_interval = DEFAULT_FRAME_INTERVAL);
    ~SenderController();

    SenderController(const SenderController&) = delete;
    SenderController& operator=(const SenderController&) = delete;

    // Starts a new session in SELECT with nothing selected
    void open(std::vector<vault::EntrySummary> entries);

    // SELECT only. Return false when the action does not apply.
    bool toggle(const std::string& id);
    bool toggle_all();
    bool submit_selection();

    // AUTH only; an empty password is rejected
    bool submit_password(std::string password);
    bool back();

    // ERROR -> SELECT
    bool retry();

    void close();

    // TRANSFER only. Throws std::runtime_error if the file cannot be written.
    bool save_to_file(const std::string& path) const;

    SenderPhase phase() const { return phase_; }
    const std::vector<vault::EntrySummary>& entries() const { return entries_; }
    const std::set<std::string>& selected() const { return selected_; }
    bool is_selected(const std::string& id) const { return selected_.count(id) > 0; }
    bool selection_requires_auth() const;

    const std::string& verification_code() const { return verification_code_; }
    const std::vector<std::string>& chunks() const { return chunks_; }
    std::size_t current_index() const { return current_index_; }
    std::size_t total_entries() const { return total_entries_; }
    bool has_sensitive() const { return has_sensitive_; }
    const std::string& error_message() const { return error_message_; }
    bool capture_protected() const { return capture_protected_; }

    // Empty outside TRANSFER
    const media::Image& current_frame() const;

private:
    struct Outcome {
        std::optional<PrepareResult> result;
        std::vector<media::Image> frames;
        std::string error;
    };

    void set_phase(SenderPhase phase);
    void start_prepare(std::optional<std::string> password);
    void finish_prepare(std::shared_ptr<Outcome> outcome);
    void fail(const std::string& message);
    void show_frame();
    void advance_frame();
    void clear_transfer();

    std::shared_ptr<CryptoBackend> backend_;
    std::shared_ptr<media::QrCodec> codec_;
    std::shared_ptr<CaptureGuard> guard_;
    EventLoop& loop_;
    SenderCallbacks callbacks_;
    std::chrono::milliseconds frame_interval_;

    SenderPhase phase_ = SenderPhase::CLOSED;
    std::vector<vault::EntrySummary> entries_;
    std::set<std::string> selected_;

    std::string verification_code_;
    std::vector<std::string> chunks_;
    std::vector<media::Image> frames_;
    std::size_t current_index_ = 0;
    std::size_t total_entries_ = 0;
    bool has_sensitive_ = false;
    std::string error_message_;
    bool capture_protected_ = false;

    std::optional<TimerId> frame_timer_;

    // Results of a prepare call that belongs to an older session are dropped
    uint64_t generation_ = 0;
    std::shared_ptr<bool> alive_;
};

} // namespace transfer
