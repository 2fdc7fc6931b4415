#include "svga/session/svga_patcher.h"
#include "svga/core/logging.h"
#include "svga/core/string_utils.h"
#include "svga/raster/png_bitmap_producer.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

using svga::AnimationConfig;
using svga::AnimationPreset;
using svga::Document;
using svga::LayerRect;
using svga::SvgaError;

SvgaPatcher::SvgaPatcher()
    : SvgaPatcher(std::make_unique<svga::raster::PngBitmapProducer>()) {}

SvgaPatcher::SvgaPatcher(std::unique_ptr<svga::raster::BitmapProducer> producer, PatcherOptions options)
    : producer_(std::move(producer)), options_(options) {
    if (!producer_) producer_ = std::make_unique<svga::raster::PngBitmapProducer>();
}

SvgaPatcher::~SvgaPatcher() = default;

bool SvgaPatcher::load(const std::uint8_t* src, std::size_t byteCount) {
    clearError();
    Document doc;
    svga::DecodeReport report;
    const SvgaError err = svga::decodeSvga(ctx_, src, byteCount, doc, &report);
    decodeReport_ = report;
    if (err != SvgaError::Ok) {
        SVGA_LOG_WARN("load failed: %s %s", svga::svgaErrorName(err), report.detail.c_str());
        setError(err);
        return false;
    }
    doc_ = std::move(doc);
    loaded_ = true;
    viewBoxOverride_.reset();
    layers_.clear();
    lastWarnings_.clear();
    return true;
}

std::uint32_t SvgaPatcher::addLayer(
    LayerKind kind,
    const std::string& name,
    const LayerRect& rect,
    AnimationPreset animations,
    const AnimationConfig& config,
    std::vector<std::uint8_t> raster) {
    clearError();
    Layer layer{0, kind, name, rect, animations, config, std::move(raster)};
    const SvgaError err = svga::validateLayerSpec(specFor(layer));
    if (err != SvgaError::Ok) {
        setError(err);
        return 0;
    }
    if (kind == LayerKind::Key) layer.raster.clear();
    layer.id = nextLayerId_++;
    layers_.push_back(std::move(layer));
    return layers_.back().id;
}

bool SvgaPatcher::updateLayerRect(std::uint32_t id, const LayerRect& rect) {
    clearError();
    Layer* layer = findLayer(id);
    if (!layer) {
        setError(SvgaError::InvalidArgument);
        return false;
    }
    Layer updated = *layer;
    updated.rect = rect;
    const SvgaError err = svga::validateLayerSpec(specFor(updated));
    if (err != SvgaError::Ok) {
        setError(err);
        return false;
    }
    layer->rect = rect;
    return true;
}

bool SvgaPatcher::removeLayer(std::uint32_t id) {
    clearError();
    auto it = std::find_if(layers_.begin(), layers_.end(), [id](const Layer& l) { return l.id == id; });
    if (it == layers_.end()) {
        setError(SvgaError::InvalidArgument);
        return false;
    }
    layers_.erase(it);
    return true;
}

void SvgaPatcher::clearLayers() {
    clearError();
    layers_.clear();
}

bool SvgaPatcher::setViewBox(float width, float height) {
    clearError();
    if (!std::isfinite(width) || !std::isfinite(height) || width <= 0.0f || height <= 0.0f) {
        setError(SvgaError::InvalidArgument);
        return false;
    }
    viewBoxOverride_ = std::make_pair(width, height);
    return true;
}

svga::LayerSpec SvgaPatcher::specFor(const Layer& layer) const {
    svga::LayerSpec spec;
    spec.keyName = layer.name;
    spec.rect = layer.rect;
    spec.animations = layer.animations;
    spec.config = layer.config;
    return spec;
}

SvgaPatcher::Layer* SvgaPatcher::findLayer(std::uint32_t id) {
    for (Layer& layer : layers_) {
        if (layer.id == id) return &layer;
    }
    return nullptr;
}

SvgaError SvgaPatcher::buildExportDocument(Document& out, std::vector<svga::RepairWarning>& warnings) const {
    Document working = doc_;
    if (viewBoxOverride_) {
        working.params.viewBoxWidth = viewBoxOverride_->first;
        working.params.viewBoxHeight = viewBoxOverride_->second;
    }

    for (const Layer& layer : layers_) {
        std::vector<std::uint8_t> raster;
        if (layer.kind == LayerKind::Image && !layer.raster.empty()) {
            raster = producer_->fitRaster(layer.raster, layer.rect.width, layer.rect.height);
            if (raster.empty()) raster = layer.raster;
        } else if (layer.kind == LayerKind::Text) {
            raster = layer.raster;
        }

        Document next;
        const SvgaError err = svga::synthesizeLayer(
            *producer_, working, specFor(layer), raster.empty() ? nullptr : &raster, next, &warnings);
        if (err != SvgaError::Ok) return err;
        working = std::move(next);
    }

    if (options_.normalizeRasters) {
        for (auto& kv : working.images) {
            svga::ImageAsset& asset = kv.second;
            std::vector<std::uint8_t> bytes;
            if (asset.encoding == svga::ImageAsset::Encoding::Raw) {
                bytes = asset.bytes;
            } else if (!svga::base64Decode(asset.base64, bytes)) {
                continue; // left for the encoder to repair
            }
            if (bytes.empty()) continue;
            asset = svga::ImageAsset::fromBase64(svga::base64Encode(producer_->normalizeRaster(bytes)));
        }
    }

    out = std::move(working);
    return SvgaError::Ok;
}

bool SvgaPatcher::exportBytes(std::vector<std::uint8_t>& out) {
    clearError();
    if (!loaded_) {
        setError(SvgaError::InvalidArgument);
        return false;
    }

    std::vector<svga::RepairWarning> warnings;
    Document doc;
    SvgaError err = buildExportDocument(doc, warnings);
    if (err != SvgaError::Ok) {
        setError(err);
        return false;
    }

    svga::EncodeOptions encodeOptions;
    encodeOptions.compress = options_.compress;
    svga::EncodeReport report;
    std::vector<std::uint8_t> bytes;
    err = svga::encodeSvga(ctx_, doc, encodeOptions, bytes, &report);
    if (err != SvgaError::Ok) {
        setError(err);
        return false;
    }
    warnings.insert(warnings.end(), report.warnings.begin(), report.warnings.end());
    lastWarnings_ = std::move(warnings);
    out.swap(bytes);
    return true;
}

std::uintptr_t SvgaPatcher::allocBytes(std::uint32_t byteCount) {
    void* p = std::malloc(byteCount);
    return reinterpret_cast<std::uintptr_t>(p);
}

void SvgaPatcher::freeBytes(std::uintptr_t ptr) {
    std::free(reinterpret_cast<void*>(ptr));
}

void SvgaPatcher::loadFromPtr(std::uintptr_t ptr, std::uint32_t byteCount) {
    load(reinterpret_cast<const std::uint8_t*>(ptr), byteCount);
}

std::uint32_t SvgaPatcher::addLayerFromPtr(
    std::uint32_t kind,
    const std::string& name,
    float x,
    float y,
    float width,
    float height,
    std::uint32_t animations,
    float cycles,
    float intensity,
    std::uintptr_t rasterPtr,
    std::uint32_t rasterByteCount) {
    if (kind > static_cast<std::uint32_t>(LayerKind::Image) || animations > 0x7u) {
        clearError();
        setError(SvgaError::InvalidArgument);
        return 0;
    }
    std::vector<std::uint8_t> raster;
    if (rasterPtr != 0 && rasterByteCount > 0) {
        const std::uint8_t* src = reinterpret_cast<const std::uint8_t*>(rasterPtr);
        raster.assign(src, src + rasterByteCount);
    }
    return addLayer(
        static_cast<LayerKind>(kind),
        name,
        LayerRect{x, y, width, height},
        static_cast<AnimationPreset>(animations),
        AnimationConfig{cycles, intensity},
        std::move(raster));
}

SvgaPatcher::ByteBufferMeta SvgaPatcher::exportToBuffer() {
    std::vector<std::uint8_t> bytes;
    if (exportBytes(bytes)) {
        exportBuffer_.swap(bytes);
        ++exportGeneration_;
    }
    return ByteBufferMeta{
        exportGeneration_,
        static_cast<std::uint32_t>(exportBuffer_.size()),
        reinterpret_cast<std::uintptr_t>(exportBuffer_.data())};
}
