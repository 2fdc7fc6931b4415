#include "svga/codec/codec_context.h"
#include "svga/codec/compression.h"
#include "svga/core/logging.h"

#include "svga.pb.h"

#include <google/protobuf/descriptor.h>

namespace svga {

namespace {

struct FieldSpec {
    const char* message;
    const char* field;
    int number;
};

// Published 2.0 numbering.
constexpr FieldSpec kFieldTable[] = {
    {"MovieParams", "viewBoxWidth", 1},
    {"MovieParams", "viewBoxHeight", 2},
    {"MovieParams", "fps", 3},
    {"MovieParams", "frames", 4},
    {"SpriteEntity", "imageKey", 1},
    {"SpriteEntity", "frames", 2},
    {"SpriteEntity", "matteKey", 3},
    {"AudioEntity", "audioKey", 1},
    {"AudioEntity", "startFrame", 2},
    {"AudioEntity", "endFrame", 3},
    {"AudioEntity", "startTime", 4},
    {"AudioEntity", "totalTime", 5},
    {"Layout", "x", 1},
    {"Layout", "y", 2},
    {"Layout", "width", 3},
    {"Layout", "height", 4},
    {"Transform", "a", 1},
    {"Transform", "b", 2},
    {"Transform", "c", 3},
    {"Transform", "d", 4},
    {"Transform", "tx", 5},
    {"Transform", "ty", 6},
    {"ShapeEntity.ShapeArgs", "d", 1},
    {"ShapeEntity.RectArgs", "x", 1},
    {"ShapeEntity.RectArgs", "y", 2},
    {"ShapeEntity.RectArgs", "width", 3},
    {"ShapeEntity.RectArgs", "height", 4},
    {"ShapeEntity.RectArgs", "cornerRadius", 5},
    {"ShapeEntity.EllipseArgs", "x", 1},
    {"ShapeEntity.EllipseArgs", "y", 2},
    {"ShapeEntity.EllipseArgs", "radiusX", 3},
    {"ShapeEntity.EllipseArgs", "radiusY", 4},
    {"ShapeEntity.ShapeStyle.RGBAColor", "r", 1},
    {"ShapeEntity.ShapeStyle.RGBAColor", "g", 2},
    {"ShapeEntity.ShapeStyle.RGBAColor", "b", 3},
    {"ShapeEntity.ShapeStyle.RGBAColor", "a", 4},
    {"ShapeEntity.ShapeStyle", "fill", 1},
    {"ShapeEntity.ShapeStyle", "stroke", 2},
    {"ShapeEntity.ShapeStyle", "strokeWidth", 3},
    {"ShapeEntity.ShapeStyle", "lineCap", 4},
    {"ShapeEntity.ShapeStyle", "lineJoin", 5},
    {"ShapeEntity.ShapeStyle", "miterLimit", 6},
    {"ShapeEntity.ShapeStyle", "lineDash", 7},
    {"ShapeEntity", "type", 1},
    {"ShapeEntity", "shape", 2},
    {"ShapeEntity", "rect", 3},
    {"ShapeEntity", "ellipse", 4},
    {"ShapeEntity", "styles", 10},
    {"ShapeEntity", "transform", 11},
    {"FrameEntity", "alpha", 1},
    {"FrameEntity", "layout", 2},
    {"FrameEntity", "transform", 3},
    {"FrameEntity", "clipPath", 4},
    {"FrameEntity", "shapes", 5},
    {"MovieEntity", "version", 1},
    {"MovieEntity", "params", 2},
    {"MovieEntity", "images", 3},
    {"MovieEntity", "sprites", 4},
    {"MovieEntity", "audios", 5},
};

struct Binding {
    SvgaError status{SvgaError::DependencyUnavailable};
    std::string reason;
    std::unordered_map<std::string, const google::protobuf::Descriptor*> descriptors;
};

Binding bindPool(const google::protobuf::DescriptorPool* pool) {
    Binding b;
    if (!codec::compressionRuntimeReady()) {
        b.reason = "zlib runtime does not match the headers it was built against";
        return b;
    }
    if (!pool) {
        b.reason = "no descriptor pool";
        return b;
    }

    const std::string prefix = std::string(kSvgaPackage) + ".";
    for (const FieldSpec& spec : kFieldTable) {
        auto it = b.descriptors.find(spec.message);
        if (it == b.descriptors.end()) {
            const google::protobuf::Descriptor* desc = pool->FindMessageTypeByName(prefix + spec.message);
            if (!desc) {
                b.descriptors.clear();
                b.reason = std::string("missing message ") + spec.message;
                return b;
            }
            it = b.descriptors.emplace(spec.message, desc).first;
        }
        const google::protobuf::FieldDescriptor* field = it->second->FindFieldByName(spec.field);
        if (!field) {
            b.descriptors.clear();
            b.reason = std::string("missing field ") + spec.message + "." + spec.field;
            return b;
        }
        if (field->number() != spec.number) {
            b.descriptors.clear();
            b.reason = std::string("field ") + spec.message + "." + spec.field + " is numbered "
                + std::to_string(field->number()) + ", expected " + std::to_string(spec.number);
            return b;
        }
        if (field->is_repeated() && field->is_packed()) {
            b.descriptors.clear();
            b.reason = std::string("repeated field ") + spec.message + "." + spec.field + " must be unpacked";
            return b;
        }
    }

    b.status = SvgaError::Ok;
    return b;
}

const Binding& generatedBinding() {
    static const Binding binding = bindPool(google::protobuf::DescriptorPool::generated_pool());
    return binding;
}

} // namespace

CodecContext::CodecContext() {
    // Touch the generated type so its file is registered in the generated pool.
    (void)com::opensource::svga::MovieEntity::descriptor();
    const Binding& b = generatedBinding();
    status_ = b.status;
    failureReason_ = b.reason;
    descriptors_ = b.descriptors;
    if (status_ != SvgaError::Ok) {
        SVGA_LOG_WARN("codec context unavailable: %s", failureReason_.c_str());
    }
}

CodecContext::CodecContext(const google::protobuf::DescriptorPool* pool) {
    Binding b = bindPool(pool);
    status_ = b.status;
    failureReason_ = std::move(b.reason);
    descriptors_ = std::move(b.descriptors);
    if (status_ != SvgaError::Ok) {
        SVGA_LOG_WARN("codec context unavailable: %s", failureReason_.c_str());
    }
}

const google::protobuf::Descriptor* CodecContext::descriptor(std::string_view messageName) const {
    auto it = descriptors_.find(std::string(messageName));
    if (it == descriptors_.end()) return nullptr;
    return it->second;
}

} // namespace svga
