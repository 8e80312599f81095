#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <chrono>
#include <optional>
#include <functional>
#include "backend.hpp"
#include "event_loop.hpp"
#include "media/camera.hpp"
#include "media/qr_codec.hpp"
#include "protocol/chunk.hpp"

namespace transfer {

constexpr std::chrono::milliseconds DEFAULT_SCAN_INTERVAL{100};

// Chunks seen so far, keyed by index. The first total and the first string
// for an index win; later conflicting copies are ignored.
class ChunkAccumulator {
public:
    // False for noise (total 0, index out of range), a mismatched total or a repeat
    bool add(const protocol::Chunk& chunk);

    std::size_t size() const { return chunks_.size(); }
    uint16_t total() const { return total_; }
    bool complete() const { return total_ > 0 && chunks_.size() == total_; }

    // Chunk strings by ascending index. Only meaningful once complete.
    std::vector<std::string> ordered() const;

    void clear();

private:
    std::map<uint16_t, std::string> chunks_;
    uint16_t total_ = 0;
};

enum class ReceiverPhase {
    CODE,
    SCANNING,
    IMPORTING,
    COMPLETE,
    ERROR,
    CAMERA_DENIED,
    CLOSED
};

const char* phase_name(ReceiverPhase phase);

struct ReceiverCallbacks {
    std::function<void(ReceiverPhase)> on_phase;
    // received, total, index of the chunk just accepted
    std::function<void(std::size_t, std::size_t, std::size_t)> on_progress;
};

// Drives the receiving side: phrase entry, camera scanning or file load,
// then one backend import call. All methods run on the loop thread.
class ReceiverController {
public:
    ReceiverController(std::shared_ptr<CryptoBackend> backend,
                       std::shared_ptr<media::QrCodec> codec,
                       std::shared_ptr<media::CameraFacility> camera,
                       EventLoop& loop,
                       ReceiverCallbacks callbacks,
                       std::chrono::milliseconds scan_interval = DEFAULT_SCAN_INTERVAL);
    ~ReceiverController();

    ReceiverController(const ReceiverController&) = delete;
    ReceiverController& operator=(const ReceiverController&) = delete;

    void open();

    // CODE only. Returns whether the phrase now has exactly four words.
    bool set_verification_code(std::string code);
    bool code_valid() const;

    // CODE with a valid phrase. Camera failure ends in CAMERA_DENIED.
    bool start_scanning();

    // CODE with a valid phrase. An unreadable file ends in ERROR.
    bool load_file(const std::string& path);

    // SCANNING only. Returns true if the text was a new chunk.
    bool accept_qr_data(const std::string& text);

    // Manual "done" while SCANNING
    bool finish_scanning();

    // ERROR or CAMERA_DENIED -> CODE
    bool retry();

    void close();

    ReceiverPhase phase() const { return phase_; }
    std::size_t received() const { return accumulator_.size(); }
    std::size_t total() const { return accumulator_.total(); }
    std::size_t imported_count() const { return imported_count_; }
    const std::string& error_message() const { return error_message_; }
    bool camera_active() const { return stream_ != nullptr; }

private:
    void set_phase(ReceiverPhase phase);
    void tick();
    void begin_import(std::vector<std::string> chunks);
    void fail(const std::string& message);
    void stop_camera();
    void reset_session();

    std::shared_ptr<CryptoBackend> backend_;
    std::shared_ptr<media::QrCodec> codec_;
    std::shared_ptr<media::CameraFacility> camera_;
    EventLoop& loop_;
    ReceiverCallbacks callbacks_;
    std::chrono::milliseconds scan_interval_;

    ReceiverPhase phase_ = ReceiverPhase::CLOSED;
    std::string verification_code_;
    ChunkAccumulator accumulator_;
    std::size_t imported_count_ = 0;
    std::string error_message_;

    std::unique_ptr<media::FrameSource> stream_;
    std::optional<TimerId> scan_timer_;
    bool decoding_ = false;

    uint64_t generation_ = 0;
    std::shared_ptr<bool> alive_;
};

} // namespace transfer
