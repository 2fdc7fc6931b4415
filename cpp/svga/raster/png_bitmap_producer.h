#ifndef SVGA_RASTER_PNG_BITMAP_PRODUCER_H
#define SVGA_RASTER_PNG_BITMAP_PRODUCER_H

#include "svga/raster/bitmap_producer.h"
#include "svga/raster/image_io.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace svga::raster {

// Colour stop of a diagonal (top-left to bottom-right) gradient. Offsets ascend in [0,1].
struct GradientStop {
    float offset;
    std::uint8_t r;
    std::uint8_t g;
    std::uint8_t b;
};

// Software BitmapProducer. Uploads may be PNG or JPEG; everything is drawn into RgbaImage
// buffers and written as PNG.
class PngBitmapProducer final : public BitmapProducer {
public:
    std::vector<std::uint8_t> renderPlaceholder(float width, float height) override;
    std::vector<std::uint8_t> renderShineBlock(float width, float height) override;
    std::vector<std::uint8_t> renderShineSilhouette(
        const std::vector<std::uint8_t>& baseRaster,
        float width,
        float height) override;
    std::vector<std::uint8_t> fitRaster(
        const std::vector<std::uint8_t>& raster,
        float width,
        float height) override;
    std::vector<std::uint8_t> normalizeRaster(const std::vector<std::uint8_t>& raster) override;
};

// Pixel helpers, exposed for tests.
std::uint32_t pixelExtent(float size) noexcept;
void fillDiagonalGradient(RgbaImage& img, const GradientStop* stops, std::size_t stopCount, bool keepAlpha);
RgbaImage scaleNearest(const RgbaImage& src, std::uint32_t width, std::uint32_t height);
void boxBlur(RgbaImage& img, int radius);
// Source-over of `src` onto `dst`; both must have the same size.
void compositeOver(RgbaImage& dst, const RgbaImage& src);

} // namespace svga::raster

#endif // SVGA_RASTER_PNG_BITMAP_PRODUCER_H
