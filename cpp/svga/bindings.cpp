#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "svga/session/svga_patcher.h"

#ifdef EMSCRIPTEN
EMSCRIPTEN_BINDINGS(svga_patcher_module) {
    emscripten::enum_<LayerKind>("LayerKind")
        .value("Key", LayerKind::Key)
        .value("Text", LayerKind::Text)
        .value("Image", LayerKind::Image);

    emscripten::enum_<svga::AnimationPreset>("AnimationPreset")
        .value("None", svga::AnimationPreset::None)
        .value("Pulse", svga::AnimationPreset::Pulse)
        .value("Float", svga::AnimationPreset::Float)
        .value("Shine", svga::AnimationPreset::Shine);

    emscripten::enum_<svga::SvgaError>("SvgaError")
        .value("Ok", svga::SvgaError::Ok)
        .value("DependencyUnavailable", svga::SvgaError::DependencyUnavailable)
        .value("UnsupportedLegacyFormat", svga::SvgaError::UnsupportedLegacyFormat)
        .value("MalformedContainer", svga::SvgaError::MalformedContainer)
        .value("EncodeFailed", svga::SvgaError::EncodeFailed)
        .value("InvalidArgument", svga::SvgaError::InvalidArgument);

    emscripten::value_object<SvgaPatcher::ByteBufferMeta>("ByteBufferMeta")
        .field("generation", &SvgaPatcher::ByteBufferMeta::generation)
        .field("byteCount", &SvgaPatcher::ByteBufferMeta::byteCount)
        .field("ptr", &SvgaPatcher::ByteBufferMeta::ptr);

    emscripten::value_object<svga::LayerRect>("LayerRect")
        .field("x", &svga::LayerRect::x)
        .field("y", &svga::LayerRect::y)
        .field("width", &svga::LayerRect::width)
        .field("height", &svga::LayerRect::height);

    emscripten::value_object<PatcherOptions>("PatcherOptions")
        .field("compress", &PatcherOptions::compress)
        .field("normalizeRasters", &PatcherOptions::normalizeRasters);

    emscripten::class_<SvgaPatcher>("SvgaPatcher")
        .constructor<>()
        .function("allocBytes", &SvgaPatcher::allocBytes)
        .function("freeBytes", &SvgaPatcher::freeBytes)
        .function("loadFromPtr", &SvgaPatcher::loadFromPtr)
        .function("isLoaded", &SvgaPatcher::isLoaded)
        .function("addLayerFromPtr", &SvgaPatcher::addLayerFromPtr)
        .function("updateLayerRect", &SvgaPatcher::updateLayerRect)
        .function("removeLayer", &SvgaPatcher::removeLayer)
        .function("clearLayers", &SvgaPatcher::clearLayers)
        .function("setViewBox", &SvgaPatcher::setViewBox)
        .function("setOptions", &SvgaPatcher::setOptions)
        .function("exportToBuffer", &SvgaPatcher::exportToBuffer)
        .function("getLastErrorCode", &SvgaPatcher::getLastErrorCode)
        .function("getLastWarningCount", &SvgaPatcher::getLastWarningCount);
}
#endif
