#include "capture_guard.hpp"
#include <iostream>

namespace transfer {

bool NoCaptureGuard::set_protection(bool enabled) {
    if (enabled) {
        std::cout << "CaptureGuard: screen capture protection is not available on this platform\n";
    }
    return false;
}

} // namespace transfer
