#ifndef SVGA_CODEC_DECODER_H
#define SVGA_CODEC_DECODER_H

#include "svga/codec/codec_context.h"
#include "svga/core/types.h"
#include "svga/model/document.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace svga {

enum class CompressionKind : std::uint8_t {
    None = 0,        // bytes were parsed as-is
    Zlib = 1,        // zlib-framed deflate
    RawDeflate = 2,  // headerless deflate
};

struct DecodeReport {
    bool decompressed{false};
    CompressionKind compression{CompressionKind::None};
    std::string detail;
};

// Decode SVGA 2.0 bytes into a Document.
//
// Rejects ZIP-based 1.x files (leading "PK") before any decompression. Otherwise tries
// zlib inflate, then raw inflate, then the bytes unmodified, and parses the result as a
// MovieEntity. Images come back as base64 text. `out` is written only on Ok.
SvgaError decodeSvga(
    const CodecContext& ctx,
    const std::uint8_t* src,
    std::size_t byteCount,
    Document& out,
    DecodeReport* report = nullptr);

} // namespace svga

#endif // SVGA_CODEC_DECODER_H
