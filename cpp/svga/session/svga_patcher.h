#pragma once

#include "svga/codec/codec_context.h"
#include "svga/codec/decoder.h"
#include "svga/codec/encoder.h"
#include "svga/core/types.h"
#include "svga/model/document.h"
#include "svga/raster/bitmap_producer.h"
#include "svga/synth/layer_synthesizer.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct PatcherOptions {
    bool compress{true};
    bool normalizeRasters{true};  // re-encode every image as 32-bit RGBA PNG on export
};

enum class LayerKind : std::uint8_t {
    Key = 0,    // transparent placeholder, filled in by the player at runtime
    Text = 1,   // pre-rendered text bitmap
    Image = 2,  // uploaded image, aspect-fit into the rect on export
};

// Editing session over one loaded SVGA movie.
//
// Holds the decoded document and an ordered list of pending layers. Nothing is applied to
// the document until exportBytes(), which works on a copy, so an export can be repeated
// and yields the same bytes for the same state.
class SvgaPatcher {
public:
    struct Layer {
        std::uint32_t id;
        LayerKind kind;
        std::string name;
        svga::LayerRect rect;
        svga::AnimationPreset animations;
        svga::AnimationConfig config;
        std::vector<std::uint8_t> raster;
    };

    struct ByteBufferMeta {
        std::uint32_t generation;
        std::uint32_t byteCount;
        std::uintptr_t ptr;
    };

    SvgaPatcher();
    explicit SvgaPatcher(std::unique_ptr<svga::raster::BitmapProducer> producer, PatcherOptions options = {});
    ~SvgaPatcher();

    // Replaces the loaded document and drops every pending layer and view-box override.
    bool load(const std::uint8_t* src, std::size_t byteCount);
    bool isLoaded() const noexcept { return loaded_; }
    const svga::Document& document() const noexcept { return doc_; }
    const svga::DecodeReport& lastDecodeReport() const noexcept { return decodeReport_; }

    // Returns the new layer id, or 0 when the name or animation settings are invalid.
    std::uint32_t addLayer(
        LayerKind kind,
        const std::string& name,
        const svga::LayerRect& rect,
        svga::AnimationPreset animations = svga::AnimationPreset::None,
        const svga::AnimationConfig& config = {},
        std::vector<std::uint8_t> raster = {});
    bool updateLayerRect(std::uint32_t id, const svga::LayerRect& rect);
    bool removeLayer(std::uint32_t id);
    void clearLayers();
    const std::vector<Layer>& layers() const noexcept { return layers_; }

    bool setViewBox(float width, float height);
    void setOptions(const PatcherOptions& options) { options_ = options; }
    const PatcherOptions& options() const noexcept { return options_; }

    bool exportBytes(std::vector<std::uint8_t>& out);

    svga::SvgaError getLastError() const noexcept { return lastError; }
    const std::vector<svga::RepairWarning>& getLastWarnings() const noexcept { return lastWarnings_; }

    // Linear-memory helpers for the WASM host.
    std::uintptr_t allocBytes(std::uint32_t byteCount);
    void freeBytes(std::uintptr_t ptr);
    void loadFromPtr(std::uintptr_t ptr, std::uint32_t byteCount);
    std::uint32_t addLayerFromPtr(
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
        std::uint32_t rasterByteCount);
    ByteBufferMeta exportToBuffer();
    std::uint32_t getLastErrorCode() const noexcept { return static_cast<std::uint32_t>(lastError); }
    std::uint32_t getLastWarningCount() const noexcept { return static_cast<std::uint32_t>(lastWarnings_.size()); }

private:
    svga::SvgaError buildExportDocument(svga::Document& out, std::vector<svga::RepairWarning>& warnings) const;
    svga::LayerSpec specFor(const Layer& layer) const;
    Layer* findLayer(std::uint32_t id);

    svga::CodecContext ctx_;
    std::unique_ptr<svga::raster::BitmapProducer> producer_;
    PatcherOptions options_;

    bool loaded_{false};
    svga::Document doc_;
    svga::DecodeReport decodeReport_;
    std::optional<std::pair<float, float>> viewBoxOverride_;

    std::vector<Layer> layers_;
    std::uint32_t nextLayerId_{1};

    std::vector<std::uint8_t> exportBuffer_;
    std::uint32_t exportGeneration_{0};
    std::vector<svga::RepairWarning> lastWarnings_;

    // Error handling
    svga::SvgaError lastError{svga::SvgaError::Ok};
    void clearError() { lastError = svga::SvgaError::Ok; }
    void setError(svga::SvgaError err) { lastError = err; }
};
