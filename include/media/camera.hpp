#pragma once

#include <string>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>
#include <mutex>
#include <atomic>
#include <vector>
#include "media/image.hpp"

namespace media {

class CameraError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A running video stream
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Newest frame not yet returned, or nullopt if none is ready. Never blocks.
    virtual std::optional<Frame> latest_frame() = 0;

    // Stops all tracks and releases the device. Idempotent.
    virtual void stop() = 0;
};

class CameraFacility {
public:
    virtual ~CameraFacility() = default;

    // Throws CameraError if the camera is missing, busy or not permitted
    virtual std::unique_ptr<FrameSource> acquire() = 0;
};

// Video4Linux2 capture, YUYV negotiated, luma plane kept as the greyscale frame
class V4l2Camera : public CameraFacility {
public:
    V4l2Camera(std::string device, int width, int height);

    std::unique_ptr<FrameSource> acquire() override;

private:
    std::string device_;
    int width_;
    int height_;
};

class V4l2FrameSource : public FrameSource {
public:
    V4l2FrameSource(const std::string& device, int width, int height);
    ~V4l2FrameSource() override;

    V4l2FrameSource(const V4l2FrameSource&) = delete;
    V4l2FrameSource& operator=(const V4l2FrameSource&) = delete;

    std::optional<Frame> latest_frame() override;
    void stop() override;

private:
    struct MappedBuffer {
        void* start;
        size_t length;
    };

    void capture_loop();
    void release();

    int fd_ = -1;
    int width_ = 0;
    int height_ = 0;
    unsigned int bytes_per_line_ = 0;
    std::vector<MappedBuffer> buffers_;
    bool streaming_ = false;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex frame_mutex_;
    std::optional<Frame> latest_;
};

} // namespace media
