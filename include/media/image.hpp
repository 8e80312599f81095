#pragma once

#include <cstdint>
#include <vector>

namespace media {

// 8-bit greyscale raster, row-major, no padding
struct Image {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
};

// Camera frames use the same layout
using Frame = Image;

} // namespace media
