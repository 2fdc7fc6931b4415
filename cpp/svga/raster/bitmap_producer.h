#pragma once

#include <cstdint>
#include <vector>

namespace svga::raster {

// Source of encoded raster bytes for synthesized layers. Sizes are in document units and
// rounded up to whole pixels by the implementation. An empty result means failure; callers
// substitute the fallback asset.
class BitmapProducer {
public:
    virtual ~BitmapProducer() = default;

    // Fully transparent image covering the layer rectangle.
    virtual std::vector<std::uint8_t> renderPlaceholder(float width, float height) = 0;

    // Opaque highlight block used as the shine image when the layer has no raster.
    virtual std::vector<std::uint8_t> renderShineBlock(float width, float height) = 0;

    // Highlight-tinted, feathered copy of `baseRaster` at the given size.
    virtual std::vector<std::uint8_t> renderShineSilhouette(
        const std::vector<std::uint8_t>& baseRaster,
        float width,
        float height) = 0;

    // Aspect-fit `raster` centred in a transparent width x height canvas.
    virtual std::vector<std::uint8_t> fitRaster(
        const std::vector<std::uint8_t>& raster,
        float width,
        float height) = 0;

    // Re-encode as 32-bit RGBA. Implementations return the input when they cannot read it.
    virtual std::vector<std::uint8_t> normalizeRaster(const std::vector<std::uint8_t>& raster) = 0;
};

} // namespace svga::raster
