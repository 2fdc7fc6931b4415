#include "svga/raster/png_bitmap_producer.h"
#include "svga/core/logging.h"
#include "svga/core/types.h"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace svga::raster {

namespace {

constexpr GradientStop kShineBlockStops[] = {
    {0.0f, 0xFF, 0xFF, 0xFF},
    {0.3f, 0xFF, 0xF8, 0xE1},
    {0.5f, 0xFF, 0xFF, 0xFF},
    {0.7f, 0xFF, 0xF8, 0xE1},
    {1.0f, 0xFF, 0xFF, 0xFF},
};

constexpr GradientStop kSilhouetteStops[] = {
    {0.0f, 0xFF, 0xFF, 0xFF},
    {0.2f, 0xFF, 0xE0, 0x82},
    {0.5f, 0xFF, 0xFF, 0xFF},
    {0.8f, 0xFF, 0xE0, 0x82},
    {1.0f, 0xFF, 0xFF, 0xFF},
};

constexpr int kSilhouetteBlurRadius = 2;
constexpr int kShineBloomRadius = 4;

std::uint8_t lerpChannel(std::uint8_t a, std::uint8_t b, float t) {
    const float v = static_cast<float>(a) + (static_cast<float>(b) - static_cast<float>(a)) * t;
    return static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0f, 255.0f)));
}

std::vector<std::uint8_t> encodeOrEmpty(const RgbaImage& img) {
    std::vector<std::uint8_t> out;
    if (!encodePng(img, out)) {
        SVGA_LOG_WARN("png encode failed for %ux%u image", img.width, img.height);
        out.clear();
    }
    return out;
}

} // namespace

std::uint32_t pixelExtent(float size) noexcept {
    if (!std::isfinite(size) || size <= 0.0f) return 1;
    const float px = std::ceil(size);
    if (px >= static_cast<float>(kMaxRasterDimension)) return kMaxRasterDimension;
    return std::max<std::uint32_t>(1, static_cast<std::uint32_t>(px));
}

void fillDiagonalGradient(RgbaImage& img, const GradientStop* stops, std::size_t stopCount, bool keepAlpha) {
    if (!img.valid() || stopCount == 0) return;
    const float w = static_cast<float>(img.width);
    const float h = static_cast<float>(img.height);
    const float denom = w * w + h * h;
    for (std::uint32_t y = 0; y < img.height; ++y) {
        for (std::uint32_t x = 0; x < img.width; ++x) {
            // Projection of the pixel centre onto the (0,0)->(w,h) axis.
            const float t = std::clamp(
                ((static_cast<float>(x) + 0.5f) * w + (static_cast<float>(y) + 0.5f) * h) / denom, 0.0f, 1.0f);
            std::size_t i = 0;
            while (i + 1 < stopCount && stops[i + 1].offset < t) ++i;
            const GradientStop& lo = stops[i];
            const GradientStop& hi = stops[std::min(i + 1, stopCount - 1)];
            const float span = hi.offset - lo.offset;
            const float f = span > 0.0f ? std::clamp((t - lo.offset) / span, 0.0f, 1.0f) : 0.0f;
            std::uint8_t* px = img.at(x, y);
            px[0] = lerpChannel(lo.r, hi.r, f);
            px[1] = lerpChannel(lo.g, hi.g, f);
            px[2] = lerpChannel(lo.b, hi.b, f);
            if (!keepAlpha) px[3] = 255;
        }
    }
}

RgbaImage scaleNearest(const RgbaImage& src, std::uint32_t width, std::uint32_t height) {
    RgbaImage dst = RgbaImage::blank(width, height);
    if (!src.valid()) return dst;
    for (std::uint32_t y = 0; y < height; ++y) {
        const std::uint32_t sy = std::min<std::uint32_t>(
            src.height - 1, static_cast<std::uint32_t>((static_cast<std::uint64_t>(y) * src.height) / height));
        for (std::uint32_t x = 0; x < width; ++x) {
            const std::uint32_t sx = std::min<std::uint32_t>(
                src.width - 1, static_cast<std::uint32_t>((static_cast<std::uint64_t>(x) * src.width) / width));
            std::copy_n(src.at(sx, sy), 4, dst.at(x, y));
        }
    }
    return dst;
}

void boxBlur(RgbaImage& img, int radius) {
    if (!img.valid() || radius <= 0) return;
    const std::uint32_t w = img.width;
    const std::uint32_t h = img.height;

    // Premultiplied so transparent pixels do not darken the edges.
    std::vector<float> buf(img.pixels.size());
    for (std::size_t i = 0; i < img.pixels.size(); i += 4) {
        const float a = img.pixels[i + 3] / 255.0f;
        buf[i] = img.pixels[i] * a;
        buf[i + 1] = img.pixels[i + 1] * a;
        buf[i + 2] = img.pixels[i + 2] * a;
        buf[i + 3] = img.pixels[i + 3];
    }

    std::vector<float> tmp(buf.size());
    const float norm = 1.0f / static_cast<float>(2 * radius + 1);
    auto pass = [&](const std::vector<float>& in, std::vector<float>& out, bool horizontal) {
        const std::uint32_t lines = horizontal ? h : w;
        const std::uint32_t len = horizontal ? w : h;
        for (std::uint32_t line = 0; line < lines; ++line) {
            for (std::uint32_t k = 0; k < len; ++k) {
                float acc[4] = {0.0f, 0.0f, 0.0f, 0.0f};
                for (int d = -radius; d <= radius; ++d) {
                    const long pos = static_cast<long>(k) + d;
                    if (pos < 0 || pos >= static_cast<long>(len)) continue; // edges count as transparent
                    const std::size_t idx = horizontal
                        ? (static_cast<std::size_t>(line) * w + static_cast<std::size_t>(pos)) * 4u
                        : (static_cast<std::size_t>(pos) * w + line) * 4u;
                    for (int c = 0; c < 4; ++c) acc[c] += in[idx + c];
                }
                const std::size_t o = horizontal
                    ? (static_cast<std::size_t>(line) * w + k) * 4u
                    : (static_cast<std::size_t>(k) * w + line) * 4u;
                for (int c = 0; c < 4; ++c) out[o + c] = acc[c] * norm;
            }
        }
    };
    pass(buf, tmp, true);
    pass(tmp, buf, false);

    for (std::size_t i = 0; i < img.pixels.size(); i += 4) {
        const float a = buf[i + 3];
        img.pixels[i + 3] = static_cast<std::uint8_t>(std::lround(std::clamp(a, 0.0f, 255.0f)));
        const float unpremul = a > 0.0f ? 255.0f / a : 0.0f;
        for (int c = 0; c < 3; ++c) {
            img.pixels[i + c] = static_cast<std::uint8_t>(std::lround(std::clamp(buf[i + c] * unpremul, 0.0f, 255.0f)));
        }
    }
}

void compositeOver(RgbaImage& dst, const RgbaImage& src) {
    if (!dst.valid() || src.width != dst.width || src.height != dst.height) return;
    for (std::size_t i = 0; i < dst.pixels.size(); i += 4) {
        const float sa = src.pixels[i + 3] / 255.0f;
        const float da = dst.pixels[i + 3] / 255.0f;
        const float oa = sa + da * (1.0f - sa);
        for (int c = 0; c < 3; ++c) {
            const float v = oa > 0.0f
                ? (src.pixels[i + c] * sa + dst.pixels[i + c] * da * (1.0f - sa)) / oa
                : 0.0f;
            dst.pixels[i + c] = static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0f, 255.0f)));
        }
        dst.pixels[i + 3] = static_cast<std::uint8_t>(std::lround(std::clamp(oa * 255.0f, 0.0f, 255.0f)));
    }
}

std::vector<std::uint8_t> PngBitmapProducer::renderPlaceholder(float width, float height) {
    return encodeOrEmpty(RgbaImage::blank(pixelExtent(width), pixelExtent(height)));
}

std::vector<std::uint8_t> PngBitmapProducer::renderShineBlock(float width, float height) {
    RgbaImage img = RgbaImage::blank(pixelExtent(width), pixelExtent(height));
    fillDiagonalGradient(img, kShineBlockStops, std::size(kShineBlockStops), false);

    // Bloom: a blurred copy drawn over the sharp gradient.
    RgbaImage bloom = img;
    boxBlur(bloom, kShineBloomRadius);
    compositeOver(img, bloom);
    return encodeOrEmpty(img);
}

std::vector<std::uint8_t> PngBitmapProducer::renderShineSilhouette(
    const std::vector<std::uint8_t>& baseRaster,
    float width,
    float height) {
    RgbaImage base;
    if (!decodeImage(baseRaster.data(), baseRaster.size(), base)) {
        SVGA_LOG_WARN("shine silhouette: base raster is not a readable PNG or JPEG (%zu bytes)", baseRaster.size());
        return {};
    }
    RgbaImage img = scaleNearest(base, pixelExtent(width), pixelExtent(height));
    fillDiagonalGradient(img, kSilhouetteStops, std::size(kSilhouetteStops), true);
    boxBlur(img, kSilhouetteBlurRadius);
    return encodeOrEmpty(img);
}

std::vector<std::uint8_t> PngBitmapProducer::fitRaster(
    const std::vector<std::uint8_t>& raster,
    float width,
    float height) {
    RgbaImage src;
    if (!decodeImage(raster.data(), raster.size(), src)) {
        SVGA_LOG_WARN("fit raster: input is not a readable PNG or JPEG (%zu bytes)", raster.size());
        return {};
    }
    const std::uint32_t w = pixelExtent(width);
    const std::uint32_t h = pixelExtent(height);
    const double srcRatio = static_cast<double>(src.width) / src.height;
    const double dstRatio = static_cast<double>(w) / h;
    std::uint32_t drawW = w;
    std::uint32_t drawH = h;
    if (srcRatio > dstRatio) {
        drawH = std::max<std::uint32_t>(1, static_cast<std::uint32_t>(std::lround(w / srcRatio)));
    } else {
        drawW = std::max<std::uint32_t>(1, static_cast<std::uint32_t>(std::lround(h * srcRatio)));
    }
    drawW = std::min(drawW, w);
    drawH = std::min(drawH, h);

    const RgbaImage scaled = scaleNearest(src, drawW, drawH);
    RgbaImage canvas = RgbaImage::blank(w, h);
    const std::uint32_t ox = (w - drawW) / 2;
    const std::uint32_t oy = (h - drawH) / 2;
    for (std::uint32_t y = 0; y < drawH; ++y) {
        std::copy_n(scaled.at(0, y), static_cast<std::size_t>(drawW) * 4u, canvas.at(ox, oy + y));
    }
    return encodeOrEmpty(canvas);
}

std::vector<std::uint8_t> PngBitmapProducer::normalizeRaster(const std::vector<std::uint8_t>& raster) {
    RgbaImage img;
    if (!decodeImage(raster.data(), raster.size(), img)) return raster;
    std::vector<std::uint8_t> out = encodeOrEmpty(img);
    return out.empty() ? raster : out;
}

} // namespace svga::raster
