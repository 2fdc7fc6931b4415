#ifndef SVGA_MODEL_DOCUMENT_H
#define SVGA_MODEL_DOCUMENT_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// Canonical in-memory form of one SVGA movie. The decoder produces it, the layer
// synthesizer appends to copies of it and the encoder consumes it.

namespace svga {

struct MovieParams {
    float viewBoxWidth{0.0f};
    float viewBoxHeight{0.0f};
    std::int32_t fps{0};
    std::int32_t frames{0};
};

struct Layout {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};
};

// Affine matrix [a c tx; b d ty].
struct Transform {
    float a{1.0f};
    float b{0.0f};
    float c{0.0f};
    float d{1.0f};
    float tx{0.0f};
    float ty{0.0f};
};

struct RGBAColor {
    float r{0.0f};
    float g{0.0f};
    float b{0.0f};
    float a{0.0f};
};

enum class LineCap : std::uint8_t { Butt = 0, Round = 1, Square = 2 };
enum class LineJoin : std::uint8_t { Miter = 0, Round = 1, Bevel = 2 };

struct ShapeStyle {
    std::optional<RGBAColor> fill;
    std::optional<RGBAColor> stroke;
    float strokeWidth{0.0f};
    LineCap lineCap{LineCap::Butt};
    LineJoin lineJoin{LineJoin::Miter};
    float miterLimit{0.0f};
    std::vector<float> lineDash;
};

enum class ShapeType : std::uint8_t { Shape = 0, Rect = 1, Ellipse = 2, Keep = 3 };

struct PathArgs {
    std::string d;
};

struct RectArgs {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};
    float cornerRadius{0.0f};
};

struct EllipseArgs {
    float x{0.0f};
    float y{0.0f};
    float radiusX{0.0f};
    float radiusY{0.0f};
};

// monostate = no payload on the wire.
using ShapeArgs = std::variant<std::monostate, PathArgs, RectArgs, EllipseArgs>;

struct Shape {
    ShapeType type{ShapeType::Shape};
    ShapeArgs args;
    std::optional<ShapeStyle> style;
    std::optional<Transform> transform;
};

struct Frame {
    float alpha{0.0f};
    Layout layout;
    Transform transform;
    std::string clipPath;
    std::vector<Shape> shapes;
};

struct Sprite {
    std::string imageKey;
    std::string matteKey;   // empty = no matte
    std::vector<Frame> frames;
};

struct AudioCue {
    std::string audioKey;
    std::int32_t startFrame{0};
    std::int32_t endFrame{0};
    std::int32_t startTime{0};
    std::int32_t totalTime{0};
};

// An image payload. Decoded documents carry base64 text; the sanitizer hands raw bytes
// to the wire builder. The encoder accepts either.
struct ImageAsset {
    enum class Encoding : std::uint8_t { Base64 = 0, Raw = 1 };

    Encoding encoding{Encoding::Raw};
    std::string base64;
    std::vector<std::uint8_t> bytes;

    static ImageAsset fromBase64(std::string text) {
        ImageAsset asset;
        asset.encoding = Encoding::Base64;
        asset.base64 = std::move(text);
        return asset;
    }

    static ImageAsset fromBytes(std::vector<std::uint8_t> raw) {
        ImageAsset asset;
        asset.encoding = Encoding::Raw;
        asset.bytes = std::move(raw);
        return asset;
    }
};

struct Document {
    std::string version;
    MovieParams params;
    std::map<std::string, ImageAsset> images;
    std::vector<Sprite> sprites;
    std::vector<AudioCue> audios;
};

// Value equality. Floats compare exactly.
bool operator==(const MovieParams& lhs, const MovieParams& rhs);
bool operator==(const Layout& lhs, const Layout& rhs);
bool operator==(const Transform& lhs, const Transform& rhs);
bool operator==(const RGBAColor& lhs, const RGBAColor& rhs);
bool operator==(const ShapeStyle& lhs, const ShapeStyle& rhs);
bool operator==(const PathArgs& lhs, const PathArgs& rhs);
bool operator==(const RectArgs& lhs, const RectArgs& rhs);
bool operator==(const EllipseArgs& lhs, const EllipseArgs& rhs);
bool operator==(const Shape& lhs, const Shape& rhs);
bool operator==(const Frame& lhs, const Frame& rhs);
bool operator==(const Sprite& lhs, const Sprite& rhs);
bool operator==(const AudioCue& lhs, const AudioCue& rhs);
bool operator==(const ImageAsset& lhs, const ImageAsset& rhs);
bool operator==(const Document& lhs, const Document& rhs);

} // namespace svga

#endif // SVGA_MODEL_DOCUMENT_H
