#include "media/camera.hpp"
#include <linux/videodev2.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace media {

namespace {

constexpr unsigned int BUFFER_COUNT = 4;
constexpr int POLL_TIMEOUT_MS = 200;

int xioctl(int fd, unsigned long request, void* arg) {
    int rc;
    do {
        rc = ioctl(fd, request, arg);
    } while (rc == -1 && errno == EINTR);
    return rc;
}

std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

V4l2Camera::V4l2Camera(std::string device, int width, int height)
    : device_(std::move(device)), width_(width), height_(height) {}

std::unique_ptr<FrameSource> V4l2Camera::acquire() {
    return std::make_unique<V4l2FrameSource>(device_, width_, height_);
}

V4l2FrameSource::V4l2FrameSource(const std::string& device, int width, int height) {
    fd_ = open(device.c_str(), O_RDWR | O_NONBLOCK);
    if (fd_ < 0) {
        throw CameraError(errno_text("Cannot open " + device));
    }

    try {
        v4l2_capability cap{};
        if (xioctl(fd_, VIDIOC_QUERYCAP, &cap) == -1) {
            throw CameraError(errno_text(device + " is not a V4L2 device"));
        }
        if (!(cap.capabilities & V4L2_CAP_VIDEO_CAPTURE) || !(cap.capabilities & V4L2_CAP_STREAMING)) {
            throw CameraError(device + " does not support streaming video capture");
        }

        v4l2_format fmt{};
        fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        fmt.fmt.pix.width = static_cast<unsigned int>(width);
        fmt.fmt.pix.height = static_cast<unsigned int>(height);
        fmt.fmt.pix.pixelformat = V4L2_PIX_FMT_YUYV;
        fmt.fmt.pix.field = V4L2_FIELD_NONE;
        if (xioctl(fd_, VIDIOC_S_FMT, &fmt) == -1) {
            throw CameraError(errno_text("VIDIOC_S_FMT failed"));
        }
        if (fmt.fmt.pix.pixelformat != V4L2_PIX_FMT_YUYV) {
            throw CameraError(device + " does not offer YUYV frames");
        }
        // The driver may pick a different size
        width_ = static_cast<int>(fmt.fmt.pix.width);
        height_ = static_cast<int>(fmt.fmt.pix.height);
        bytes_per_line_ = fmt.fmt.pix.bytesperline ? fmt.fmt.pix.bytesperline : fmt.fmt.pix.width * 2;

        v4l2_requestbuffers req{};
        req.count = BUFFER_COUNT;
        req.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        req.memory = V4L2_MEMORY_MMAP;
        if (xioctl(fd_, VIDIOC_REQBUFS, &req) == -1 || req.count == 0) {
            throw CameraError(errno_text("VIDIOC_REQBUFS failed"));
        }

        for (unsigned int i = 0; i < req.count; ++i) {
            v4l2_buffer buf{};
            buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
            buf.memory = V4L2_MEMORY_MMAP;
            buf.index = i;
            if (xioctl(fd_, VIDIOC_QUERYBUF, &buf) == -1) {
                throw CameraError(errno_text("VIDIOC_QUERYBUF failed"));
            }
            void* start = mmap(nullptr, buf.length, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, buf.m.offset);
            if (start == MAP_FAILED) {
                throw CameraError(errno_text("mmap failed"));
            }
            buffers_.push_back({start, buf.length});

            if (xioctl(fd_, VIDIOC_QBUF, &buf) == -1) {
                throw CameraError(errno_text("VIDIOC_QBUF failed"));
            }
        }

        v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        if (xioctl(fd_, VIDIOC_STREAMON, &type) == -1) {
            throw CameraError(errno_text("VIDIOC_STREAMON failed"));
        }
        streaming_ = true;
    } catch (const CameraError&) {
        release();
        throw;
    }

    running_ = true;
    thread_ = std::thread(&V4l2FrameSource::capture_loop, this);
    std::cout << "Camera started: " << device << " (" << width_ << "x" << height_ << ")\n";
}

V4l2FrameSource::~V4l2FrameSource() {
    stop();
}

std::optional<Frame> V4l2FrameSource::latest_frame() {
    std::lock_guard<std::mutex> lock(frame_mutex_);
    std::optional<Frame> frame;
    frame.swap(latest_);
    return frame;
}

void V4l2FrameSource::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (fd_ >= 0) {
        release();
        std::cout << "Camera stopped.\n";
    }
    std::lock_guard<std::mutex> lock(frame_mutex_);
    latest_.reset();
}

void V4l2FrameSource::release() {
    if (streaming_) {
        v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        if (xioctl(fd_, VIDIOC_STREAMOFF, &type) == -1) {
            std::cerr << "Camera: " << errno_text("VIDIOC_STREAMOFF failed") << "\n";
        }
        streaming_ = false;
    }
    for (const auto& buffer : buffers_) {
        munmap(buffer.start, buffer.length);
    }
    buffers_.clear();
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

void V4l2FrameSource::capture_loop() {
    while (running_) {
        pollfd pfd{fd_, POLLIN, 0};
        int rc = poll(&pfd, 1, POLL_TIMEOUT_MS);
        if (rc == -1) {
            if (errno == EINTR) continue;
            std::cerr << "Camera: " << errno_text("poll failed") << "\n";
            break;
        }
        if (rc == 0) continue;

        v4l2_buffer buf{};
        buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        buf.memory = V4L2_MEMORY_MMAP;
        if (xioctl(fd_, VIDIOC_DQBUF, &buf) == -1) {
            if (errno == EAGAIN) continue;
            std::cerr << "Camera: " << errno_text("VIDIOC_DQBUF failed") << "\n";
            break;
        }

        // YUYV: every even byte is luma
        Frame frame;
        frame.width = width_;
        frame.height = height_;
        frame.pixels.resize(static_cast<size_t>(width_) * height_);
        const auto* src = static_cast<const uint8_t*>(buffers_[buf.index].start);
        if (buf.bytesused >= bytes_per_line_ * static_cast<unsigned int>(height_)) {
            for (int y = 0; y < height_; ++y) {
                const uint8_t* row = src + static_cast<size_t>(y) * bytes_per_line_;
                uint8_t* dst = frame.pixels.data() + static_cast<size_t>(y) * width_;
                for (int x = 0; x < width_; ++x) {
                    dst[x] = row[x * 2];
                }
            }
            std::lock_guard<std::mutex> lock(frame_mutex_);
            latest_ = std::move(frame);
        }

        if (xioctl(fd_, VIDIOC_QBUF, &buf) == -1) {
            std::cerr << "Camera: " << errno_text("VIDIOC_QBUF failed") << "\n";
            break;
        }
    }
}

} // namespace media
