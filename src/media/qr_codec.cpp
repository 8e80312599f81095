#include "media/qr_codec.hpp"
#include <qrencode.h>
#include <zbar.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace media {

ZbarQrCodec::ZbarQrCodec(int scale, int margin)
    : scale_(scale > 0 ? scale : 1), margin_(margin >= 0 ? margin : 0) {}

Image ZbarQrCodec::render(const std::string& text) {
    std::unique_ptr<QRcode, decltype(&QRcode_free)> qrcode(
        QRcode_encodeString(text.c_str(), 0, QR_ECLEVEL_M, QR_MODE_8, 1), &QRcode_free);
    if (!qrcode) {
        throw std::runtime_error("QR encoding failed for " + std::to_string(text.size()) +
                                 " bytes: " + std::strerror(errno));
    }

    const int modules = qrcode->width;
    Image image;
    image.width = (modules + 2 * margin_) * scale_;
    image.height = image.width;
    image.pixels.assign(static_cast<size_t>(image.width) * image.height, 0xFF);

    for (int my = 0; my < modules; ++my) {
        for (int mx = 0; mx < modules; ++mx) {
            bool dark = (qrcode->data[my * modules + mx] & 1) != 0;
            if (!dark) continue;
            int x0 = (mx + margin_) * scale_;
            int y0 = (my + margin_) * scale_;
            for (int y = y0; y < y0 + scale_; ++y) {
                std::memset(image.pixels.data() + static_cast<size_t>(y) * image.width + x0, 0x00, scale_);
            }
        }
    }
    return image;
}

std::optional<std::string> ZbarQrCodec::decode(const Frame& frame) {
    if (frame.empty() ||
        frame.pixels.size() < static_cast<size_t>(frame.width) * frame.height) {
        return std::nullopt;
    }

    zbar::Image zbar_image(frame.width, frame.height, "Y800",
                           frame.pixels.data(), static_cast<unsigned long>(frame.width) * frame.height);

    zbar::ImageScanner scanner;
    scanner.set_config(zbar::ZBAR_NONE, zbar::ZBAR_CFG_ENABLE, 0);
    scanner.set_config(zbar::ZBAR_QRCODE, zbar::ZBAR_CFG_ENABLE, 1);
    if (scanner.scan(zbar_image) <= 0) {
        return std::nullopt;
    }

    for (auto symbol = zbar_image.symbol_begin(); symbol != zbar_image.symbol_end(); ++symbol) {
        if (symbol->get_type() == zbar::ZBAR_QRCODE) {
            return symbol->get_data();
        }
    }
    return std::nullopt;
}

} // namespace media
