#ifndef SVGA_SANITIZE_FIELD_POLICY_H
#define SVGA_SANITIZE_FIELD_POLICY_H

#include "svga/model/document.h"

// Per-field normalization applied before a document is written to the wire.
//
// Two policies exist:
//  - epsilon-nonzero: Layout x/y/width/height and Transform tx/ty. A value within 1e-5 of
//    zero becomes +/-0.00001 so proto3 keeps the field on the wire. Native players treat a
//    missing layout field as a broken frame.
//  - safe-float: everything else. Finite values pass through (zero included); non-finite
//    values take the supplied default.
//
// Every sub-object is rebuilt field by field; nothing is forwarded wholesale.

namespace svga {

float epsilonNonZero(float v) noexcept;
float safeFloat(float v, float fallback) noexcept;

RGBAColor sanitizeColor(const RGBAColor& c);
Transform sanitizeTransform(const Transform& t);
Layout sanitizeLayout(const Layout& l);
ShapeStyle sanitizeStyle(const ShapeStyle& s);

// A SHAPE without path data is turned into KEEP.
Shape sanitizeShape(const Shape& s);

Frame sanitizeFrame(const Frame& f);
MovieParams sanitizeParams(const MovieParams& p);

} // namespace svga

#endif // SVGA_SANITIZE_FIELD_POLICY_H
