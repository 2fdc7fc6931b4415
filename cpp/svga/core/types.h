#ifndef SVGA_CORE_TYPES_H
#define SVGA_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>

// Lightweight types and constants shared by the SVGA codec, sanitizer and synthesizer.

namespace svga {

// Wire format constants
static constexpr const char* kSvgaWireVersion = "2.0";
static constexpr const char* kSvgaPackage = "com.opensource.svga";
static constexpr std::uint8_t kLegacyArchiveMagic0 = 0x50; // 'P'
static constexpr std::uint8_t kLegacyArchiveMagic1 = 0x4B; // 'K'
static constexpr int kDefaultCompressionLevel = 6;
static constexpr std::size_t kMaxInflatedBytes = 256u * 1024u * 1024u;

// Field policy constants
static constexpr float kEpsilonNonZero = 0.00001f;
static constexpr float kNearZeroThreshold = 1e-5f;

// Params defaults applied by the encoder
static constexpr float kDefaultViewBoxWidth = 800.0f;
static constexpr float kDefaultViewBoxHeight = 800.0f;
static constexpr std::int32_t kDefaultFps = 20;

// Raster limits (pixels per side) for generated bitmaps
static constexpr std::uint32_t kMaxRasterDimension = 4096;

// Key suffix for the shine image derived from a layer raster
static constexpr const char* kShineKeySuffix = "_shine";

enum class SvgaError : std::uint32_t {
    Ok = 0,
    DependencyUnavailable = 1,
    UnsupportedLegacyFormat = 2,
    MalformedContainer = 3,
    EncodeFailed = 4,
    InvalidArgument = 5,
};

const char* svgaErrorName(SvgaError err) noexcept;

// Non-fatal conditions. These are repaired in place and reported, never returned as errors.
enum class RepairKind : std::uint8_t {
    InvalidReference = 1,   // dangling imageKey / matteKey / audioKey, fallback asset inserted
    InvalidRasterData = 2,  // missing or undecodable raster bytes, fallback asset substituted
    KeyCollision = 3,       // two asset keys sanitized to the same name, one was renamed
};

struct RepairWarning {
    RepairKind kind;
    std::string key;
    std::string detail;
};

const char* repairKindName(RepairKind kind) noexcept;

// 1x1 fully transparent RGBA PNG. Substituted for missing, empty or undecodable rasters
// and for dangling image references.
static constexpr std::uint8_t kFallbackPng[] = {
    137, 80, 78, 71, 13, 10, 26, 10, 0, 0, 0, 13, 73, 72, 68, 82, 0, 0, 0, 1, 0,
    0, 0, 1, 8, 6, 0, 0, 0, 31, 21, 196, 137, 0, 0, 0, 1, 115, 82, 71, 66, 0,
    174, 206, 28, 233, 0, 0, 0, 4, 103, 65, 77, 65, 0, 0, 177, 143, 11, 252, 97, 5, 0,
    0, 0, 9, 112, 72, 89, 115, 0, 0, 14, 195, 0, 0, 14, 195, 1, 199, 111, 168, 100, 0,
    0, 0, 11, 73, 68, 65, 84, 120, 218, 99, 96, 0, 2, 0, 0, 5, 0, 1, 233, 250, 220,
    216, 0, 0, 0, 0, 73, 69, 78, 68, 174, 66, 96, 130,
};

inline std::vector<std::uint8_t> fallbackAssetBytes() {
    return std::vector<std::uint8_t>(std::begin(kFallbackPng), std::end(kFallbackPng));
}

} // namespace svga

#endif // SVGA_CORE_TYPES_H
