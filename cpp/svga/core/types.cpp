#include "svga/core/types.h"

namespace svga {

const char* svgaErrorName(SvgaError err) noexcept {
    switch (err) {
        case SvgaError::Ok: return "Ok";
        case SvgaError::DependencyUnavailable: return "DependencyUnavailable";
        case SvgaError::UnsupportedLegacyFormat: return "UnsupportedLegacyFormat";
        case SvgaError::MalformedContainer: return "MalformedContainer";
        case SvgaError::EncodeFailed: return "EncodeFailed";
        case SvgaError::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

const char* repairKindName(RepairKind kind) noexcept {
    switch (kind) {
        case RepairKind::InvalidReference: return "InvalidReference";
        case RepairKind::InvalidRasterData: return "InvalidRasterData";
        case RepairKind::KeyCollision: return "KeyCollision";
    }
    return "Unknown";
}

} // namespace svga
