#pragma once

#include <string>
#include <optional>
#include "media/image.hpp"

namespace media {

class QrCodec {
public:
    virtual ~QrCodec() = default;

    // Throws std::runtime_error if the text cannot be encoded
    virtual Image render(const std::string& text) = 0;

    // nullopt when no QR code is found in the frame
    virtual std::optional<std::string> decode(const Frame& frame) = 0;
};

// libqrencode for rendering, ZBar for decoding
class ZbarQrCodec : public QrCodec {
public:
    explicit ZbarQrCodec(int scale = 6, int margin = 4);

    Image render(const std::string& text) override;
    std::optional<std::string> decode(const Frame& frame) override;

private:
    int scale_;
    int margin_;
};

} // namespace media
