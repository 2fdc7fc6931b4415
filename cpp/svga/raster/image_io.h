#ifndef SVGA_RASTER_IMAGE_IO_H
#define SVGA_RASTER_IMAGE_IO_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace svga::raster {

// Straight (non-premultiplied) RGBA8, rows top to bottom, no padding.
struct RgbaImage {
    std::uint32_t width{0};
    std::uint32_t height{0};
    std::vector<std::uint8_t> pixels;

    static RgbaImage blank(std::uint32_t w, std::uint32_t h) {
        RgbaImage img;
        img.width = w;
        img.height = h;
        img.pixels.assign(static_cast<std::size_t>(w) * h * 4u, 0);
        return img;
    }

    bool valid() const noexcept {
        return width > 0 && height > 0 && pixels.size() == static_cast<std::size_t>(width) * height * 4u;
    }

    std::uint8_t* at(std::uint32_t x, std::uint32_t y) {
        return pixels.data() + (static_cast<std::size_t>(y) * width + x) * 4u;
    }
    const std::uint8_t* at(std::uint32_t x, std::uint32_t y) const {
        return pixels.data() + (static_cast<std::size_t>(y) * width + x) * 4u;
    }
};

enum class ImageFormat : std::uint8_t {
    Unknown = 0,
    Png = 1,
    Jpeg = 2,
};

ImageFormat sniffImageFormat(const std::uint8_t* src, std::size_t byteCount) noexcept;

// Decodes PNG (any bit depth, colour type or interlace) or baseline/progressive JPEG into
// RGBA8. Images larger than kMaxRasterDimension on either side are rejected.
bool decodeImage(const std::uint8_t* src, std::size_t byteCount, RgbaImage& out);

// 8-bit RGBA, non-interlaced, zlib level 6.
bool encodePng(const RgbaImage& image, std::vector<std::uint8_t>& out);

} // namespace svga::raster

#endif // SVGA_RASTER_IMAGE_IO_H
