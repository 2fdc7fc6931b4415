#include "svga/codec/encoder.h"
#include "svga/codec/codec_internal.h"
#include "svga/codec/compression.h"
#include "svga/core/logging.h"
#include "svga/sanitize/key_registry.h"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include <limits>

namespace svga {

namespace codec::detail {

namespace {

void fillLayout(const Layout& l, pb::Layout* out) {
    out->set_x(l.x);
    out->set_y(l.y);
    out->set_width(l.width);
    out->set_height(l.height);
}

void fillTransform(const Transform& t, pb::Transform* out) {
    out->set_a(t.a);
    out->set_b(t.b);
    out->set_c(t.c);
    out->set_d(t.d);
    out->set_tx(t.tx);
    out->set_ty(t.ty);
}

void fillColor(const RGBAColor& c, pb::ShapeEntity_ShapeStyle_RGBAColor* out) {
    out->set_r(c.r);
    out->set_g(c.g);
    out->set_b(c.b);
    out->set_a(c.a);
}

void fillStyle(const ShapeStyle& s, pb::ShapeEntity_ShapeStyle* out) {
    if (s.fill) fillColor(*s.fill, out->mutable_fill());
    if (s.stroke) fillColor(*s.stroke, out->mutable_stroke());
    out->set_strokewidth(s.strokeWidth);
    out->set_linecap(static_cast<pb::ShapeEntity_ShapeStyle_LineCap>(static_cast<int>(s.lineCap)));
    out->set_linejoin(static_cast<pb::ShapeEntity_ShapeStyle_LineJoin>(static_cast<int>(s.lineJoin)));
    out->set_miterlimit(s.miterLimit);
    for (const float v : s.lineDash) out->add_linedash(v);
}

struct ArgsWriter {
    pb::ShapeEntity* out;

    void operator()(const std::monostate&) const {}

    void operator()(const PathArgs& p) const { out->mutable_shape()->set_d(p.d); }

    void operator()(const RectArgs& r) const {
        pb::ShapeEntity_RectArgs* rect = out->mutable_rect();
        rect->set_x(r.x);
        rect->set_y(r.y);
        rect->set_width(r.width);
        rect->set_height(r.height);
        rect->set_cornerradius(r.cornerRadius);
    }

    void operator()(const EllipseArgs& e) const {
        pb::ShapeEntity_EllipseArgs* ellipse = out->mutable_ellipse();
        ellipse->set_x(e.x);
        ellipse->set_y(e.y);
        ellipse->set_radiusx(e.radiusX);
        ellipse->set_radiusy(e.radiusY);
    }
};

void fillShape(const Shape& s, pb::ShapeEntity* out) {
    out->set_type(static_cast<pb::ShapeEntity_ShapeType>(static_cast<int>(s.type)));
    std::visit(ArgsWriter{out}, s.args);
    if (s.style) fillStyle(*s.style, out->mutable_styles());
    if (s.transform) fillTransform(*s.transform, out->mutable_transform());
}

void fillFrame(const Frame& f, pb::FrameEntity* out) {
    out->set_alpha(f.alpha);
    fillLayout(f.layout, out->mutable_layout());
    fillTransform(f.transform, out->mutable_transform());
    out->set_clippath(f.clipPath);
    for (const Shape& shape : f.shapes) fillShape(shape, out->add_shapes());
}

} // namespace

void documentToMessage(const Document& doc, pb::MovieEntity& out) {
    out.Clear();
    out.set_version(doc.version);

    pb::MovieParams* params = out.mutable_params();
    params->set_viewboxwidth(doc.params.viewBoxWidth);
    params->set_viewboxheight(doc.params.viewBoxHeight);
    params->set_fps(doc.params.fps);
    params->set_frames(doc.params.frames);

    auto& images = *out.mutable_images();
    for (const auto& kv : doc.images) {
        const std::vector<std::uint8_t>& bytes = kv.second.bytes;
        images[kv.first].assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    for (const Sprite& sprite : doc.sprites) {
        pb::SpriteEntity* s = out.add_sprites();
        s->set_imagekey(sprite.imageKey);
        s->set_mattekey(sprite.matteKey);
        for (const Frame& frame : sprite.frames) fillFrame(frame, s->add_frames());
    }

    for (const AudioCue& audio : doc.audios) {
        pb::AudioEntity* a = out.add_audios();
        a->set_audiokey(audio.audioKey);
        a->set_startframe(audio.startFrame);
        a->set_endframe(audio.endFrame);
        a->set_starttime(audio.startTime);
        a->set_totaltime(audio.totalTime);
    }
}

} // namespace codec::detail

namespace {

bool serializeDeterministic(const codec::detail::pb::MovieEntity& msg, std::vector<std::uint8_t>& out) {
    const std::size_t size = msg.ByteSizeLong();
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) return false;
    out.assign(size, 0);
    google::protobuf::io::ArrayOutputStream array(out.data(), static_cast<int>(size));
    google::protobuf::io::CodedOutputStream stream(&array);
    stream.SetSerializationDeterministic(true);
    msg.SerializeWithCachedSizes(&stream);
    stream.Trim();
    return !stream.HadError() && static_cast<std::size_t>(stream.ByteCount()) == size;
}

} // namespace

SvgaError encodeSvga(
    const CodecContext& ctx,
    const Document& doc,
    const EncodeOptions& options,
    std::vector<std::uint8_t>& out,
    EncodeReport* report) {
    EncodeReport local;
    EncodeReport& rep = report ? *report : local;
    rep = EncodeReport{};

    if (!ctx.ready()) return SvgaError::DependencyUnavailable;
    if (options.compress && (options.compressionLevel < 0 || options.compressionLevel > 9)) {
        return SvgaError::InvalidArgument;
    }

    const Document clean = sanitizeDocument(doc, &rep.warnings);

    codec::detail::pb::MovieEntity msg;
    codec::detail::documentToMessage(clean, msg);

    std::vector<std::uint8_t> payload;
    if (!serializeDeterministic(msg, payload)) {
        SVGA_LOG_WARN("protobuf serialization failed");
        return SvgaError::EncodeFailed;
    }

    if (!options.compress) {
        out.swap(payload);
        return SvgaError::Ok;
    }

    std::vector<std::uint8_t> compressed;
    if (!codec::deflateBytes(payload.data(), payload.size(), options.compressionLevel, compressed)) {
        SVGA_LOG_WARN("deflate failed for %zu bytes", payload.size());
        return SvgaError::EncodeFailed;
    }
    out.swap(compressed);
    return SvgaError::Ok;
}

} // namespace svga
