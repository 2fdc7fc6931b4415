#include "svga/model/document.h"

namespace svga {

bool operator==(const MovieParams& lhs, const MovieParams& rhs) {
    return lhs.viewBoxWidth == rhs.viewBoxWidth
        && lhs.viewBoxHeight == rhs.viewBoxHeight
        && lhs.fps == rhs.fps
        && lhs.frames == rhs.frames;
}

bool operator==(const Layout& lhs, const Layout& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y && lhs.width == rhs.width && lhs.height == rhs.height;
}

bool operator==(const Transform& lhs, const Transform& rhs) {
    return lhs.a == rhs.a && lhs.b == rhs.b && lhs.c == rhs.c && lhs.d == rhs.d
        && lhs.tx == rhs.tx && lhs.ty == rhs.ty;
}

bool operator==(const RGBAColor& lhs, const RGBAColor& rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b && lhs.a == rhs.a;
}

bool operator==(const ShapeStyle& lhs, const ShapeStyle& rhs) {
    return lhs.fill == rhs.fill
        && lhs.stroke == rhs.stroke
        && lhs.strokeWidth == rhs.strokeWidth
        && lhs.lineCap == rhs.lineCap
        && lhs.lineJoin == rhs.lineJoin
        && lhs.miterLimit == rhs.miterLimit
        && lhs.lineDash == rhs.lineDash;
}

bool operator==(const PathArgs& lhs, const PathArgs& rhs) {
    return lhs.d == rhs.d;
}

bool operator==(const RectArgs& lhs, const RectArgs& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y && lhs.width == rhs.width && lhs.height == rhs.height
        && lhs.cornerRadius == rhs.cornerRadius;
}

bool operator==(const EllipseArgs& lhs, const EllipseArgs& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y && lhs.radiusX == rhs.radiusX && lhs.radiusY == rhs.radiusY;
}

bool operator==(const Shape& lhs, const Shape& rhs) {
    return lhs.type == rhs.type
        && lhs.args == rhs.args
        && lhs.style == rhs.style
        && lhs.transform == rhs.transform;
}

bool operator==(const Frame& lhs, const Frame& rhs) {
    return lhs.alpha == rhs.alpha
        && lhs.layout == rhs.layout
        && lhs.transform == rhs.transform
        && lhs.clipPath == rhs.clipPath
        && lhs.shapes == rhs.shapes;
}

bool operator==(const Sprite& lhs, const Sprite& rhs) {
    return lhs.imageKey == rhs.imageKey && lhs.matteKey == rhs.matteKey && lhs.frames == rhs.frames;
}

bool operator==(const AudioCue& lhs, const AudioCue& rhs) {
    return lhs.audioKey == rhs.audioKey
        && lhs.startFrame == rhs.startFrame
        && lhs.endFrame == rhs.endFrame
        && lhs.startTime == rhs.startTime
        && lhs.totalTime == rhs.totalTime;
}

bool operator==(const ImageAsset& lhs, const ImageAsset& rhs) {
    if (lhs.encoding != rhs.encoding) return false;
    if (lhs.encoding == ImageAsset::Encoding::Base64) return lhs.base64 == rhs.base64;
    return lhs.bytes == rhs.bytes;
}

bool operator==(const Document& lhs, const Document& rhs) {
    return lhs.version == rhs.version
        && lhs.params == rhs.params
        && lhs.images == rhs.images
        && lhs.sprites == rhs.sprites
        && lhs.audios == rhs.audios;
}

} // namespace svga
