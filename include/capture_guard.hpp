#pragma once

namespace transfer {

// Best-effort OS toggle against screenshots and screen recording
class CaptureGuard {
public:
    virtual ~CaptureGuard() = default;

    // Returns true if protection was actually applied
    virtual bool set_protection(bool enabled) = 0;
};

// X11 and Wayland offer no per-window capture block; logs and reports "not applied"
class NoCaptureGuard : public CaptureGuard {
public:
    bool set_protection(bool enabled) override;
};

} // namespace transfer
