#include "svga/synth/layer_synthesizer.h"
#include "svga/core/logging.h"
#include "svga/core/string_utils.h"

#include <cmath>
#include <utility>

namespace svga {

namespace {

constexpr double kTwoPi = 6.283185307179586;
constexpr double kTanThirtyDegrees = 0.5773502691896257;

bool finite(float v) { return std::isfinite(v); }

std::vector<std::uint8_t> orFallback(
    std::vector<std::uint8_t> bytes,
    const std::string& key,
    const char* what,
    std::vector<RepairWarning>& warnings) {
    if (!bytes.empty()) return bytes;
    SVGA_LOG_WARN("bitmap producer failed (%s) for %s; using fallback asset", what, key.c_str());
    warnings.push_back(RepairWarning{RepairKind::InvalidRasterData, key, std::string(what) + " failed"});
    return fallbackAssetBytes();
}

double frameProgress(std::int32_t i, std::int32_t totalFrames) {
    return totalFrames > 0 ? static_cast<double>(i) / static_cast<double>(totalFrames) : 0.0;
}

} // namespace

SvgaError validateLayerSpec(const LayerSpec& spec) {
    if (sanitizeKey(spec.keyName).empty()) return SvgaError::InvalidArgument;
    const AnimationConfig& cfg = spec.config;
    if (!finite(cfg.cycles) || cfg.cycles <= 0.0f) return SvgaError::InvalidArgument;
    if (!finite(cfg.intensity) || cfg.intensity <= 0.0f) return SvgaError::InvalidArgument;
    const LayerRect& r = spec.rect;
    if (!finite(r.x) || !finite(r.y) || !finite(r.width) || !finite(r.height)) return SvgaError::InvalidArgument;
    return SvgaError::Ok;
}

SvgaError acquireLayerAssets(
    raster::BitmapProducer& producer,
    const LayerSpec& spec,
    const std::vector<std::uint8_t>* customRaster,
    LayerAssets& out) {
    const SvgaError err = validateLayerSpec(spec);
    if (err != SvgaError::Ok) return err;

    LayerAssets assets;
    const std::string key = sanitizeKey(spec.keyName);
    const bool hasCustom = customRaster && !customRaster->empty();
    const float w = spec.rect.width;
    const float h = spec.rect.height;

    if (hasCustom) {
        assets.mainRaster = *customRaster;
    } else {
        assets.mainRaster = orFallback(producer.renderPlaceholder(w, h), key, "placeholder", assets.warnings);
    }

    if (hasFlag(spec.animations, AnimationPreset::Shine)) {
        const std::string shineKey = key + kShineKeySuffix;
        if (hasCustom) {
            assets.shineRaster = orFallback(
                producer.renderShineSilhouette(*customRaster, w, h), shineKey, "shine silhouette", assets.warnings);
        } else {
            assets.shineRaster = orFallback(producer.renderShineBlock(w, h), shineKey, "shine block", assets.warnings);
        }
    }

    out = std::move(assets);
    return SvgaError::Ok;
}

Frame mainFrameAt(
    const LayerRect& rect,
    AnimationPreset animations,
    const AnimationConfig& config,
    std::int32_t i,
    std::int32_t totalFrames) {
    Frame frame;
    if (rect.width <= 0.0f || rect.height <= 0.0f) {
        frame.alpha = 0.0f;
        return frame;
    }

    const double theta = frameProgress(i, totalFrames) * kTwoPi * config.cycles;
    const double wave = std::sin(theta);
    double scale = 1.0;
    double offsetY = 0.0;
    if (hasFlag(animations, AnimationPreset::Pulse)) scale *= 1.0 + wave * kPulseAmplitude * config.intensity;
    if (hasFlag(animations, AnimationPreset::Float)) offsetY += wave * kFloatAmplitude * config.intensity;

    frame.alpha = 1.0f;
    frame.layout = Layout{0.0f, 0.0f, rect.width, rect.height};
    frame.transform.a = static_cast<float>(scale);
    frame.transform.d = static_cast<float>(scale);
    frame.transform.tx = static_cast<float>(rect.x + rect.width * (1.0 - scale) / 2.0);
    frame.transform.ty = static_cast<float>(rect.y + rect.height * (1.0 - scale) / 2.0 + offsetY);
    return frame;
}

std::string shineClipPath(
    float width,
    float height,
    const AnimationConfig& config,
    float bandOffset,
    std::int32_t i,
    std::int32_t totalFrames) {
    const double w = width;
    const double h = height;
    const double progress = std::fmod(frameProgress(i, totalFrames) * config.cycles, 1.0);
    const double bandWidth = w * kShineBandWidthRatio * config.intensity;
    const double xOffset = h * kTanThirtyDegrees;

    const double startX = -bandWidth - xOffset;
    const double endX = w + bandWidth + xOffset;
    const double cx = startX + (endX - startX) * progress + bandOffset;

    const double x1 = cx + xOffset - bandWidth / 2.0;
    const double x2 = cx + xOffset + bandWidth / 2.0;
    const double x3 = cx - xOffset + bandWidth / 2.0;
    const double x4 = cx - xOffset - bandWidth / 2.0;
    const std::string hs = formatPathNumber(h);

    std::string d;
    d.reserve(96);
    d += "M ";
    d += formatPathNumber(x1);
    d += " 0 L ";
    d += formatPathNumber(x2);
    d += " 0 L ";
    d += formatPathNumber(x3);
    d += ' ';
    d += hs;
    d += " L ";
    d += formatPathNumber(x4);
    d += ' ';
    d += hs;
    d += " Z";
    return d;
}

SvgaError composeLayer(const Document& doc, const LayerSpec& spec, const LayerAssets& assets, Document& out) {
    const SvgaError err = validateLayerSpec(spec);
    if (err != SvgaError::Ok) return err;

    const bool shine = hasFlag(spec.animations, AnimationPreset::Shine);
    const std::string key = sanitizeKey(spec.keyName);
    const std::int32_t totalFrames = doc.params.frames > 0 ? doc.params.frames : 0;
    const LayerRect& rect = spec.rect;

    Document result = doc;
    result.images[key] = ImageAsset::fromBase64(base64Encode(assets.mainRaster));

    Sprite main;
    main.imageKey = key;
    main.frames.reserve(static_cast<std::size_t>(totalFrames));
    for (std::int32_t i = 0; i < totalFrames; ++i) {
        main.frames.push_back(mainFrameAt(rect, spec.animations, spec.config, i, totalFrames));
    }
    result.sprites.push_back(std::move(main));

    if (shine) {
        const std::string shineKey = key + kShineKeySuffix;
        result.images[shineKey] = ImageAsset::fromBase64(base64Encode(assets.shineRaster));

        for (std::size_t band = 0; band < 3; ++band) {
            const float offset = rect.width * kShineBandOffsets[band];
            Sprite sprite;
            sprite.imageKey = shineKey;
            sprite.frames.reserve(static_cast<std::size_t>(totalFrames));
            for (std::int32_t i = 0; i < totalFrames; ++i) {
                Frame frame;
                frame.alpha = kShineBandAlphas[band];
                frame.layout = Layout{0.0f, 0.0f, rect.width, rect.height};
                frame.transform.tx = rect.x;
                frame.transform.ty = rect.y;
                frame.clipPath = shineClipPath(rect.width, rect.height, spec.config, offset, i, totalFrames);
                sprite.frames.push_back(std::move(frame));
            }
            result.sprites.push_back(std::move(sprite));
        }
    }

    SVGA_LOG_DEBUG("composed layer %s: %d frames, %s", key.c_str(), totalFrames, shine ? "4 sprites" : "1 sprite");
    out = std::move(result);
    return SvgaError::Ok;
}

SvgaError synthesizeLayer(
    raster::BitmapProducer& producer,
    const Document& doc,
    const LayerSpec& spec,
    const std::vector<std::uint8_t>* customRaster,
    Document& out,
    std::vector<RepairWarning>* warnings) {
    LayerAssets assets;
    SvgaError err = acquireLayerAssets(producer, spec, customRaster, assets);
    if (err != SvgaError::Ok) return err;
    err = composeLayer(doc, spec, assets, out);
    if (err == SvgaError::Ok && warnings) {
        warnings->insert(warnings->end(), assets.warnings.begin(), assets.warnings.end());
    }
    return err;
}

} // namespace svga
