#include "svga/codec/decoder.h"
#include "svga/codec/codec_internal.h"
#include "svga/codec/compression.h"
#include "svga/core/logging.h"
#include "svga/core/string_utils.h"

#include <limits>

namespace svga {

namespace codec::detail {

namespace {

Layout toLayout(const pb::Layout& l) {
    Layout out;
    out.x = l.x();
    out.y = l.y();
    out.width = l.width();
    out.height = l.height();
    return out;
}

Transform toTransform(const pb::Transform& t) {
    Transform out;
    out.a = t.a();
    out.b = t.b();
    out.c = t.c();
    out.d = t.d();
    out.tx = t.tx();
    out.ty = t.ty();
    return out;
}

RGBAColor toColor(const pb::ShapeEntity_ShapeStyle_RGBAColor& c) {
    return RGBAColor{c.r(), c.g(), c.b(), c.a()};
}

ShapeType toShapeType(int v) {
    switch (v) {
        case 1: return ShapeType::Rect;
        case 2: return ShapeType::Ellipse;
        case 3: return ShapeType::Keep;
        default: return ShapeType::Shape;
    }
}

LineCap toLineCap(int v) {
    if (v == 1) return LineCap::Round;
    if (v == 2) return LineCap::Square;
    return LineCap::Butt;
}

LineJoin toLineJoin(int v) {
    if (v == 1) return LineJoin::Round;
    if (v == 2) return LineJoin::Bevel;
    return LineJoin::Miter;
}

ShapeStyle toStyle(const pb::ShapeEntity_ShapeStyle& s) {
    ShapeStyle out;
    if (s.has_fill()) out.fill = toColor(s.fill());
    if (s.has_stroke()) out.stroke = toColor(s.stroke());
    out.strokeWidth = s.strokewidth();
    out.lineCap = toLineCap(static_cast<int>(s.linecap()));
    out.lineJoin = toLineJoin(static_cast<int>(s.linejoin()));
    out.miterLimit = s.miterlimit();
    out.lineDash.assign(s.linedash().begin(), s.linedash().end());
    return out;
}

Shape toShape(const pb::ShapeEntity& s) {
    Shape out;
    out.type = toShapeType(static_cast<int>(s.type()));
    switch (s.args_case()) {
        case pb::ShapeEntity::kShape:
            out.args = PathArgs{s.shape().d()};
            break;
        case pb::ShapeEntity::kRect: {
            const auto& r = s.rect();
            out.args = RectArgs{r.x(), r.y(), r.width(), r.height(), r.cornerradius()};
            break;
        }
        case pb::ShapeEntity::kEllipse: {
            const auto& e = s.ellipse();
            out.args = EllipseArgs{e.x(), e.y(), e.radiusx(), e.radiusy()};
            break;
        }
        default:
            break;
    }
    if (s.has_styles()) out.style = toStyle(s.styles());
    if (s.has_transform()) out.transform = toTransform(s.transform());
    return out;
}

Frame toFrame(const pb::FrameEntity& f) {
    Frame out;
    out.alpha = f.alpha();
    if (f.has_layout()) out.layout = toLayout(f.layout());
    if (f.has_transform()) out.transform = toTransform(f.transform());
    out.clipPath = f.clippath();
    out.shapes.reserve(static_cast<std::size_t>(f.shapes_size()));
    for (const auto& shape : f.shapes()) out.shapes.push_back(toShape(shape));
    return out;
}

} // namespace

void messageToDocument(const pb::MovieEntity& msg, Document& out) {
    out = Document{};
    out.version = msg.version();

    const pb::MovieParams& params = msg.params();
    out.params.viewBoxWidth = params.viewboxwidth();
    out.params.viewBoxHeight = params.viewboxheight();
    out.params.fps = params.fps();
    out.params.frames = params.frames();

    for (const auto& kv : msg.images()) {
        const std::string& bytes = kv.second;
        out.images.emplace(kv.first, ImageAsset::fromBase64(
            base64Encode(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size())));
    }

    out.sprites.reserve(static_cast<std::size_t>(msg.sprites_size()));
    for (const auto& s : msg.sprites()) {
        Sprite sprite;
        sprite.imageKey = s.imagekey();
        sprite.matteKey = s.mattekey();
        sprite.frames.reserve(static_cast<std::size_t>(s.frames_size()));
        for (const auto& f : s.frames()) sprite.frames.push_back(toFrame(f));
        out.sprites.push_back(std::move(sprite));
    }

    out.audios.reserve(static_cast<std::size_t>(msg.audios_size()));
    for (const auto& a : msg.audios()) {
        AudioCue cue;
        cue.audioKey = a.audiokey();
        cue.startFrame = a.startframe();
        cue.endFrame = a.endframe();
        cue.startTime = a.starttime();
        cue.totalTime = a.totaltime();
        out.audios.push_back(std::move(cue));
    }
}

} // namespace codec::detail

SvgaError decodeSvga(
    const CodecContext& ctx,
    const std::uint8_t* src,
    std::size_t byteCount,
    Document& out,
    DecodeReport* report) {
    DecodeReport local;
    DecodeReport& rep = report ? *report : local;
    rep = DecodeReport{};

    if (!ctx.ready()) {
        rep.detail = ctx.failureReason();
        return SvgaError::DependencyUnavailable;
    }

    if (byteCount >= 2 && src && src[0] == kLegacyArchiveMagic0 && src[1] == kLegacyArchiveMagic1) {
        rep.detail = "ZIP-based SVGA 1.x container; only SVGA 2.0 is supported";
        return SvgaError::UnsupportedLegacyFormat;
    }

    if (!src || byteCount == 0) {
        rep.detail = "empty input";
        return SvgaError::MalformedContainer;
    }

    std::vector<std::uint8_t> inflated;
    const std::uint8_t* payload = src;
    std::size_t payloadBytes = byteCount;
    if (codec::inflateBytes(src, byteCount, codec::InflateFraming::Zlib, kMaxInflatedBytes, inflated)) {
        rep.decompressed = true;
        rep.compression = CompressionKind::Zlib;
    } else if (codec::inflateBytes(src, byteCount, codec::InflateFraming::Raw, kMaxInflatedBytes, inflated)) {
        rep.decompressed = true;
        rep.compression = CompressionKind::RawDeflate;
    } else {
        SVGA_LOG_WARN("decompression failed or input is uncompressed; parsing %zu raw bytes", byteCount);
    }
    if (rep.decompressed) {
        payload = inflated.data();
        payloadBytes = inflated.size();
    }

    codec::detail::pb::MovieEntity msg;
    const bool parsed = payloadBytes <= static_cast<std::size_t>(std::numeric_limits<int>::max())
        && msg.ParseFromArray(payload, static_cast<int>(payloadBytes));
    if (!parsed) {
        rep.detail = rep.decompressed
            ? "decompression succeeded but the payload is not a valid SVGA 2.0 movie"
            : "input is not compressed in a supported format and does not parse as an SVGA 2.0 movie";
        return SvgaError::MalformedContainer;
    }

    Document doc;
    codec::detail::messageToDocument(msg, doc);
    out = std::move(doc);
    return SvgaError::Ok;
}

} // namespace svga
