#include "svga/codec/compression.h"

#include <zlib.h>

#include <cstring>
#include <limits>

namespace svga::codec {

namespace {
constexpr std::size_t kChunkBytes = 64 * 1024;
constexpr int kWindowBits = 15;
} // namespace

bool compressionRuntimeReady() noexcept {
    const char* runtime = zlibVersion();
    return runtime != nullptr && runtime[0] == ZLIB_VERSION[0];
}

bool inflateBytes(
    const std::uint8_t* src,
    std::size_t byteCount,
    InflateFraming framing,
    std::size_t maxOutput,
    std::vector<std::uint8_t>& out) {
    out.clear();
    if (!src || byteCount == 0) return false;
    if (byteCount > std::numeric_limits<uInt>::max()) return false;

    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    const int windowBits = framing == InflateFraming::Zlib ? kWindowBits : -kWindowBits;
    if (inflateInit2(&zs, windowBits) != Z_OK) return false;

    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(src));
    zs.avail_in = static_cast<uInt>(byteCount);

    std::vector<std::uint8_t> result;
    int rc = Z_OK;
    while (rc == Z_OK) {
        const std::size_t o = result.size();
        if (o >= maxOutput) {
            rc = Z_MEM_ERROR;
            break;
        }
        result.resize(o + kChunkBytes);
        zs.next_out = reinterpret_cast<Bytef*>(result.data() + o);
        zs.avail_out = static_cast<uInt>(kChunkBytes);
        rc = inflate(&zs, Z_NO_FLUSH);
        result.resize(o + (kChunkBytes - zs.avail_out));
        if (rc == Z_BUF_ERROR && zs.avail_in == 0) break; // truncated stream
    }
    const bool consumedAll = zs.avail_in == 0;
    inflateEnd(&zs);

    if (rc != Z_STREAM_END || !consumedAll || result.size() > maxOutput) return false;
    out.swap(result);
    return true;
}

bool deflateBytes(const std::uint8_t* src, std::size_t byteCount, int level, std::vector<std::uint8_t>& out) {
    out.clear();
    if (level < Z_NO_COMPRESSION || level > Z_BEST_COMPRESSION) return false;
    if (byteCount > std::numeric_limits<uLong>::max()) return false;

    static const Bytef kEmpty = 0;
    const Bytef* input = byteCount > 0 ? reinterpret_cast<const Bytef*>(src) : &kEmpty;
    uLongf bound = compressBound(static_cast<uLong>(byteCount));
    std::vector<std::uint8_t> result(bound);
    const int rc = compress2(
        reinterpret_cast<Bytef*>(result.data()),
        &bound,
        input,
        static_cast<uLong>(byteCount),
        level);
    if (rc != Z_OK) return false;
    result.resize(static_cast<std::size_t>(bound));
    out.swap(result);
    return true;
}

} // namespace svga::codec
