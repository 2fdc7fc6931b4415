#ifndef SVGA_CODEC_ENCODER_H
#define SVGA_CODEC_ENCODER_H

#include "svga/codec/codec_context.h"
#include "svga/core/types.h"
#include "svga/model/document.h"

#include <cstdint>
#include <vector>

namespace svga {

struct EncodeOptions {
    bool compress{true};
    int compressionLevel{kDefaultCompressionLevel};
};

struct EncodeReport {
    std::vector<RepairWarning> warnings;
};

// Encode a Document as SVGA 2.0 bytes.
//
// The document is passed through sanitizeDocument first, so dangling references, broken
// rasters and zero layout fields are repaired rather than rejected. Serialization is
// deterministic (map entries sorted by key). With compress set the payload is wrapped in a
// zlib stream; otherwise the protobuf bytes are returned as they are.
// `out` is replaced only on Ok.
SvgaError encodeSvga(
    const CodecContext& ctx,
    const Document& doc,
    const EncodeOptions& options,
    std::vector<std::uint8_t>& out,
    EncodeReport* report = nullptr);

} // namespace svga

#endif // SVGA_CODEC_ENCODER_H
