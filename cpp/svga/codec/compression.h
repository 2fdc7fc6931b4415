#ifndef SVGA_CODEC_COMPRESSION_H
#define SVGA_CODEC_COMPRESSION_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace svga::codec {

enum class InflateFraming : std::uint8_t {
    Zlib = 0,   // RFC 1950 header + adler32 trailer
    Raw = 1,    // bare RFC 1951 stream
};

// True when the linked zlib runtime matches the headers this code was built with.
bool compressionRuntimeReady() noexcept;

// Inflates the whole input. Succeeds only if the stream ends exactly at the end of the
// input and the output stays under maxOutput; `out` is left empty on failure.
bool inflateBytes(
    const std::uint8_t* src,
    std::size_t byteCount,
    InflateFraming framing,
    std::size_t maxOutput,
    std::vector<std::uint8_t>& out);

// zlib-framed deflate at the given level (0-9).
bool deflateBytes(const std::uint8_t* src, std::size_t byteCount, int level, std::vector<std::uint8_t>& out);

} // namespace svga::codec

#endif // SVGA_CODEC_COMPRESSION_H
