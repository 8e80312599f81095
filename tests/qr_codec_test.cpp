#include "media/qr_codec.hpp"
#include "protocol/chunk.hpp"
#include "security.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using media::ZbarQrCodec;

TEST(QrCodecTest, RendersSquareRasterWithQuietZone) {
    ZbarQrCodec codec(3, 4);
    auto image = codec.render("hello");
    ASSERT_FALSE(image.empty());
    EXPECT_EQ(image.width, image.height);
    EXPECT_EQ(image.pixels.size(), static_cast<size_t>(image.width) * image.height);
    // Top-left corner is margin, first finder module is dark
    EXPECT_EQ(image.pixels[0], 0xFF);
    EXPECT_EQ(image.pixels[static_cast<size_t>(4 * 3) * image.width + 4 * 3], 0x00);
}

TEST(QrCodecTest, DecodesWhatItRendered) {
    ZbarQrCodec codec;
    std::string text = protocol::encode_chunk(1, 3, {0x10, 0x20, 0x30, 0x40});

    auto decoded = codec.decode(codec.render(text));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, text);
}

TEST(QrCodecTest, FullSizeSealedChunkRendersAndDecodes) {
    ZbarQrCodec codec(4, 4);
    auto key = security::derive_transfer_key("alpha bravo charlie delta");
    std::vector<uint8_t> slice(security::DEFAULT_MAX_CHUNK_SIZE, 0xa5);
    std::string text = protocol::base64_encode(security::seal_chunk(slice, key, 0, 2));

    media::Image image;
    ASSERT_NO_THROW(image = codec.render(text));
    auto decoded = codec.decode(image);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, text);
}

TEST(QrCodecTest, LargestAllowedChunkStillRenders) {
    ZbarQrCodec codec(1, 0);
    auto key = security::derive_transfer_key("alpha bravo charlie delta");
    std::vector<uint8_t> slice(security::MAX_CHUNK_SIZE, 0x00);
    std::string text = protocol::base64_encode(security::seal_chunk(slice, key, 0, 1));
    EXPECT_NO_THROW(codec.render(text));
}

TEST(QrCodecTest, TextBeyondCapacityThrows) {
    ZbarQrCodec codec(1, 0);
    // Lowercase stays in 8-bit mode
    std::string text(security::QR_BYTE_CAPACITY + 1, 'a');
    EXPECT_THROW(codec.render(text), std::runtime_error);
}

TEST(QrCodecTest, BlankOrEmptyFrameDecodesToNothing) {
    ZbarQrCodec codec;
    media::Frame blank;
    blank.width = 64;
    blank.height = 48;
    blank.pixels.assign(64 * 48, 0xFF);
    EXPECT_FALSE(codec.decode(blank).has_value());

    EXPECT_FALSE(codec.decode(media::Frame{}).has_value());

    media::Frame truncated = blank;
    truncated.pixels.resize(10);
    EXPECT_FALSE(codec.decode(truncated).has_value());
}
