#include "svga/sanitize/field_policy.h"
#include "svga/core/types.h"

#include <cmath>

namespace svga {

float epsilonNonZero(float v) noexcept {
    if (!std::isfinite(v)) return kEpsilonNonZero;
    if (std::fabs(v) <= kNearZeroThreshold) {
        return std::signbit(v) ? -kEpsilonNonZero : kEpsilonNonZero;
    }
    return v;
}

float safeFloat(float v, float fallback) noexcept {
    return std::isfinite(v) ? v : fallback;
}

RGBAColor sanitizeColor(const RGBAColor& c) {
    RGBAColor out;
    out.r = safeFloat(c.r, 0.0f);
    out.g = safeFloat(c.g, 0.0f);
    out.b = safeFloat(c.b, 0.0f);
    out.a = safeFloat(c.a, 0.0f);
    return out;
}

Transform sanitizeTransform(const Transform& t) {
    Transform out;
    out.a = safeFloat(t.a, 1.0f);
    out.b = safeFloat(t.b, 0.0f);
    out.c = safeFloat(t.c, 0.0f);
    out.d = safeFloat(t.d, 1.0f);
    out.tx = epsilonNonZero(t.tx);
    out.ty = epsilonNonZero(t.ty);
    return out;
}

Layout sanitizeLayout(const Layout& l) {
    Layout out;
    out.x = epsilonNonZero(l.x);
    out.y = epsilonNonZero(l.y);
    out.width = epsilonNonZero(l.width);
    out.height = epsilonNonZero(l.height);
    return out;
}

ShapeStyle sanitizeStyle(const ShapeStyle& s) {
    ShapeStyle out;
    if (s.fill) out.fill = sanitizeColor(*s.fill);
    if (s.stroke) out.stroke = sanitizeColor(*s.stroke);
    out.strokeWidth = safeFloat(s.strokeWidth, 0.0f);
    out.lineCap = s.lineCap;
    out.lineJoin = s.lineJoin;
    out.miterLimit = safeFloat(s.miterLimit, 0.0f);
    out.lineDash.reserve(s.lineDash.size());
    for (const float v : s.lineDash) out.lineDash.push_back(safeFloat(v, 0.0f));
    return out;
}

namespace {

struct ShapeArgsSanitizer {
    ShapeArgs operator()(const std::monostate&) const { return std::monostate{}; }

    ShapeArgs operator()(const PathArgs& p) const { return PathArgs{p.d}; }

    ShapeArgs operator()(const RectArgs& r) const {
        RectArgs out;
        out.x = safeFloat(r.x, 0.0f);
        out.y = safeFloat(r.y, 0.0f);
        out.width = safeFloat(r.width, 0.0f);
        out.height = safeFloat(r.height, 0.0f);
        out.cornerRadius = safeFloat(r.cornerRadius, 0.0f);
        return out;
    }

    ShapeArgs operator()(const EllipseArgs& e) const {
        EllipseArgs out;
        out.x = safeFloat(e.x, 0.0f);
        out.y = safeFloat(e.y, 0.0f);
        out.radiusX = safeFloat(e.radiusX, 0.0f);
        out.radiusY = safeFloat(e.radiusY, 0.0f);
        return out;
    }
};

bool hasPathData(const ShapeArgs& args) {
    const PathArgs* path = std::get_if<PathArgs>(&args);
    return path && !path->d.empty();
}

} // namespace

Shape sanitizeShape(const Shape& s) {
    Shape out;
    out.type = s.type;
    out.args = std::visit(ShapeArgsSanitizer{}, s.args);
    if (out.type == ShapeType::Shape && !hasPathData(out.args)) {
        out.type = ShapeType::Keep;
    }
    if (s.style) out.style = sanitizeStyle(*s.style);
    if (s.transform) out.transform = sanitizeTransform(*s.transform);
    return out;
}

Frame sanitizeFrame(const Frame& f) {
    Frame out;
    out.alpha = safeFloat(f.alpha, 1.0f);
    out.layout = sanitizeLayout(f.layout);
    out.transform = sanitizeTransform(f.transform);
    out.clipPath = f.clipPath;
    out.shapes.reserve(f.shapes.size());
    for (const Shape& shape : f.shapes) out.shapes.push_back(sanitizeShape(shape));
    return out;
}

MovieParams sanitizeParams(const MovieParams& p) {
    MovieParams out;
    out.viewBoxWidth = safeFloat(p.viewBoxWidth, kDefaultViewBoxWidth);
    out.viewBoxHeight = safeFloat(p.viewBoxHeight, kDefaultViewBoxHeight);
    out.fps = p.fps != 0 ? p.fps : kDefaultFps;
    out.frames = p.frames;
    return out;
}

} // namespace svga
