#include "protocol/chunk.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace protocol;

TEST(ChunkHeaderTest, EncodesIndexThenTotalBigEndian) {
    auto header = encode_chunk_header(0x0102, 0x0304);
    EXPECT_EQ(header[0], 0x01);
    EXPECT_EQ(header[1], 0x02);
    EXPECT_EQ(header[2], 0x03);
    EXPECT_EQ(header[3], 0x04);
}

TEST(ChunkHeaderTest, RoundTripsAtTheEdges) {
    const std::vector<std::pair<uint32_t, uint32_t>> cases = {
        {0, 1}, {0, 5}, {4, 5}, {255, 256}, {256, 300}, {0, 65535}, {65534, 65535},
    };
    for (const auto& [index, total] : cases) {
        auto bytes = encode_chunk_header(index, total);
        auto decoded = decode_chunk_header(bytes.data(), bytes.size());
        ASSERT_TRUE(decoded.has_value());
        EXPECT_EQ(decoded->index, index);
        EXPECT_EQ(decoded->total, total);
    }
}

TEST(ChunkHeaderTest, RejectsValuesWiderThanSixteenBits) {
    EXPECT_THROW(encode_chunk_header(65536, 1), std::out_of_range);
    EXPECT_THROW(encode_chunk_header(0, 65536), std::out_of_range);
    EXPECT_NO_THROW(encode_chunk_header(65535, 65535));
}

TEST(ChunkHeaderTest, ShortBufferDecodesToNothing) {
    std::vector<uint8_t> three = {0, 1, 0};
    EXPECT_FALSE(decode_chunk_header(three).has_value());
    EXPECT_FALSE(decode_chunk_header(nullptr, 4).has_value());
}

TEST(ChunkHeaderTest, DecodeDoesNotCheckIndexAgainstTotal) {
    auto bytes = encode_chunk_header(9, 3);
    auto decoded = decode_chunk_header(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->index, 9);
    EXPECT_EQ(decoded->total, 3);
}

TEST(Base64Test, EncodesStandardPaddedAlphabet) {
    std::vector<uint8_t> data = {0xfb, 0xff, 0x00};
    EXPECT_EQ(base64_encode(data), "+/8A");
    std::vector<uint8_t> two = {'h', 'i'};
    EXPECT_EQ(base64_encode(two), "aGk=");
}

TEST(Base64Test, GarbageIsNotAnError) {
    EXPECT_FALSE(base64_decode("not base64 at all!").has_value());
    EXPECT_FALSE(base64_decode("%%%%").has_value());
    auto empty = base64_decode("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(Base64Test, ToleratesTrailingNewline) {
    auto decoded = base64_decode("aGk=\n");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "hi");
}

TEST(ChunkTest, ParseRecoversHeaderAndKeepsText) {
    std::vector<uint8_t> payload = {1, 2, 3, 4, 5};
    std::string text = encode_chunk(2, 7, payload);

    auto chunk = parse_chunk(text);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->header.index, 2);
    EXPECT_EQ(chunk->header.total, 7);
    EXPECT_EQ(chunk->text, text);
}

TEST(ChunkTest, ParseRejectsNoise) {
    EXPECT_FALSE(parse_chunk("hello world").has_value());
    // Valid base64 but only two bytes
    EXPECT_FALSE(parse_chunk("AAE=").has_value());
}
