#ifndef SVGA_SYNTH_LAYER_SYNTHESIZER_H
#define SVGA_SYNTH_LAYER_SYNTHESIZER_H

#include "svga/core/types.h"
#include "svga/model/document.h"
#include "svga/raster/bitmap_producer.h"

#include <cstdint>
#include <string>
#include <vector>

namespace svga {

// Procedural motion presets (bitmask)
enum class AnimationPreset : std::uint8_t {
    None  = 0,
    Pulse = 1 << 0,
    Float = 1 << 1,
    Shine = 1 << 2,
};

inline AnimationPreset operator|(AnimationPreset a, AnimationPreset b) {
    return static_cast<AnimationPreset>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}
inline AnimationPreset operator&(AnimationPreset a, AnimationPreset b) {
    return static_cast<AnimationPreset>(static_cast<std::uint8_t>(a) & static_cast<std::uint8_t>(b));
}
inline bool hasFlag(AnimationPreset flags, AnimationPreset flag) {
    return (static_cast<std::uint8_t>(flags) & static_cast<std::uint8_t>(flag)) != 0;
}

struct AnimationConfig {
    float cycles{1.0f};     // full oscillations over the movie
    float intensity{1.0f};  // amplitude multiplier
};

// Target rectangle in view-box units.
struct LayerRect {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};
};

struct LayerSpec {
    std::string keyName;
    LayerRect rect;
    AnimationPreset animations{AnimationPreset::None};
    AnimationConfig config;
};

// Encoded rasters for one layer, gathered before any frame is built.
struct LayerAssets {
    std::vector<std::uint8_t> mainRaster;
    std::vector<std::uint8_t> shineRaster;  // empty unless Shine is selected
    std::vector<RepairWarning> warnings;
};

// Band offsets are fractions of the layer width.
static constexpr float kShineBandOffsets[3] = {-0.05f, 0.0f, 0.05f};
static constexpr float kShineBandAlphas[3] = {0.3f, 0.9f, 0.3f};
static constexpr float kPulseAmplitude = 0.05f;
static constexpr float kFloatAmplitude = 6.0f;
static constexpr float kShineBandWidthRatio = 0.4f;

SvgaError validateLayerSpec(const LayerSpec& spec);

// Runs every producer call the layer needs. A custom raster, when non-empty, is the main
// image; otherwise a transparent placeholder is rendered. Producer failures are replaced by
// the fallback asset and reported in `out.warnings`.
SvgaError acquireLayerAssets(
    raster::BitmapProducer& producer,
    const LayerSpec& spec,
    const std::vector<std::uint8_t>* customRaster,
    LayerAssets& out);

// Pure. Copies `doc`, stores the rasters under the sanitized key (and key + "_shine"),
// appends the main sprite and, with Shine, the leading/center/trailing band sprites.
// Every new sprite has exactly doc.params.frames frames. `doc` is not modified.
SvgaError composeLayer(const Document& doc, const LayerSpec& spec, const LayerAssets& assets, Document& out);

// acquireLayerAssets followed by composeLayer.
SvgaError synthesizeLayer(
    raster::BitmapProducer& producer,
    const Document& doc,
    const LayerSpec& spec,
    const std::vector<std::uint8_t>* customRaster,
    Document& out,
    std::vector<RepairWarning>* warnings = nullptr);

// Frame i of the main sprite.
Frame mainFrameAt(const LayerRect& rect, AnimationPreset animations, const AnimationConfig& config, std::int32_t i, std::int32_t totalFrames);

// Parallelogram clip for one shine band at frame i, in layer-local coordinates.
std::string shineClipPath(
    float width,
    float height,
    const AnimationConfig& config,
    float bandOffset,
    std::int32_t i,
    std::int32_t totalFrames);

} // namespace svga

#endif // SVGA_SYNTH_LAYER_SYNTHESIZER_H
