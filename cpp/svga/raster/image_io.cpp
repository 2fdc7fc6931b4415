#include "svga/raster/image_io.h"
#include "svga/core/logging.h"
#include "svga/core/types.h"

#include <png.h>
#include <cstdio>  // jpeglib.h expects FILE
#include <jpeglib.h>

#include <csetjmp>
#include <cstring>
#include <utility>

namespace svga::raster {

namespace {

constexpr std::uint8_t kPngSignature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
constexpr int kPngCompressionLevel = 6;

// ---- libpng ----

struct PngMemorySource {
    const std::uint8_t* data;
    std::size_t size;
    std::size_t offset;
};

void pngReadData(png_structp png, png_bytep dst, png_size_t length) {
    auto* src = static_cast<PngMemorySource*>(png_get_io_ptr(png));
    if (length > src->size - src->offset) png_error(png, "read past end of buffer");
    std::memcpy(dst, src->data + src->offset, length);
    src->offset += length;
}

void pngWriteData(png_structp png, png_bytep data, png_size_t length) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + length);
}

void pngFlush(png_structp) {}

void pngErrorHook(png_structp png, png_const_charp message) {
    SVGA_LOG_WARN("libpng: %s", message);
    (void)message;
    png_longjmp(png, 1);
}

void pngWarningHook(png_structp, png_const_charp message) {
    SVGA_LOG_DEBUG("libpng warning: %s", message);
    (void)message;
}

bool decodePngImage(const std::uint8_t* src, std::size_t byteCount, RgbaImage& out) {
    png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, &pngErrorHook, &pngWarningHook);
    if (!png) return false;
    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_read_struct(&png, nullptr, nullptr);
        return false;
    }

    PngMemorySource source{src, byteCount, 0};
    RgbaImage img;
    std::vector<png_bytep> rows;
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_read_struct(&png, &info, nullptr);
        return false;
    }

    png_set_read_fn(png, &source, &pngReadData);
    png_set_user_limits(png, kMaxRasterDimension, kMaxRasterDimension);
    png_read_info(png, info);

    png_uint_32 width = 0;
    png_uint_32 height = 0;
    int bitDepth = 0;
    int colorType = 0;
    png_get_IHDR(png, info, &width, &height, &bitDepth, &colorType, nullptr, nullptr, nullptr);

    // Normalise every colour type and depth to 8-bit RGBA.
    const bool hasTrns = png_get_valid(png, info, PNG_INFO_tRNS) != 0;
    if (colorType == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
    if (colorType == PNG_COLOR_TYPE_GRAY && bitDepth < 8) png_set_expand_gray_1_2_4_to_8(png);
    if (hasTrns) png_set_tRNS_to_alpha(png);
    if (bitDepth == 16) png_set_strip_16(png);
    if (colorType == PNG_COLOR_TYPE_GRAY || colorType == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(png);
    if (!(colorType & PNG_COLOR_MASK_ALPHA) && !hasTrns) png_set_add_alpha(png, 0xFF, PNG_FILLER_AFTER);
    png_set_interlace_handling(png);
    png_read_update_info(png, info);

    if (png_get_rowbytes(png, info) != static_cast<png_size_t>(width) * 4u) {
        png_error(png, "unexpected row layout after transforms");
    }

    img = RgbaImage::blank(width, height);
    rows.resize(height);
    for (png_uint_32 y = 0; y < height; ++y) rows[y] = img.at(0, y);
    png_read_image(png, rows.data());
    png_read_end(png, nullptr);
    png_destroy_read_struct(&png, &info, nullptr);

    out = std::move(img);
    return true;
}

// ---- libjpeg ----

struct JpegErrorManager {
    jpeg_error_mgr pub;
    std::jmp_buf jump;
};

void jpegErrorExit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    char message[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, message);
    SVGA_LOG_WARN("libjpeg: %s", message);
    std::longjmp(err->jump, 1);
}

void jpegOutputMessage(j_common_ptr) {}

bool decodeJpegImage(const std::uint8_t* src, std::size_t byteCount, RgbaImage& out) {
    jpeg_decompress_struct cinfo;
    JpegErrorManager jerr;
    std::memset(&cinfo, 0, sizeof(cinfo));
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = &jpegErrorExit;
    jerr.pub.output_message = &jpegOutputMessage;

    RgbaImage img;
    std::vector<std::uint8_t> row;
    if (setjmp(jerr.jump)) {
        jpeg_destroy_decompress(&cinfo);
        return false;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, src, static_cast<unsigned long>(byteCount));
    jpeg_read_header(&cinfo, TRUE);
    cinfo.out_color_space = JCS_RGB;
    jpeg_start_decompress(&cinfo);

    if (cinfo.output_width > kMaxRasterDimension || cinfo.output_height > kMaxRasterDimension
        || cinfo.output_components != 3) {
        SVGA_LOG_WARN("jpeg %ux%u with %d components rejected",
            cinfo.output_width, cinfo.output_height, cinfo.output_components);
        jpeg_destroy_decompress(&cinfo);
        return false;
    }

    img = RgbaImage::blank(cinfo.output_width, cinfo.output_height);
    row.resize(static_cast<std::size_t>(cinfo.output_width) * 3u);
    while (cinfo.output_scanline < cinfo.output_height) {
        const JDIMENSION y = cinfo.output_scanline;
        JSAMPROW rowPtr = row.data();
        jpeg_read_scanlines(&cinfo, &rowPtr, 1);
        std::uint8_t* dst = img.at(0, y);
        for (JDIMENSION x = 0; x < cinfo.output_width; ++x) {
            dst[x * 4] = row[x * 3];
            dst[x * 4 + 1] = row[x * 3 + 1];
            dst[x * 4 + 2] = row[x * 3 + 2];
            dst[x * 4 + 3] = 0xFF;
        }
    }
    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);

    out = std::move(img);
    return true;
}

} // namespace

ImageFormat sniffImageFormat(const std::uint8_t* src, std::size_t byteCount) noexcept {
    if (!src) return ImageFormat::Unknown;
    if (byteCount >= sizeof(kPngSignature) && std::memcmp(src, kPngSignature, sizeof(kPngSignature)) == 0) {
        return ImageFormat::Png;
    }
    if (byteCount >= 3 && src[0] == 0xFF && src[1] == 0xD8 && src[2] == 0xFF) return ImageFormat::Jpeg;
    return ImageFormat::Unknown;
}

bool decodeImage(const std::uint8_t* src, std::size_t byteCount, RgbaImage& out) {
    switch (sniffImageFormat(src, byteCount)) {
        case ImageFormat::Png: return decodePngImage(src, byteCount, out);
        case ImageFormat::Jpeg: return decodeJpegImage(src, byteCount, out);
        default: return false;
    }
}

bool encodePng(const RgbaImage& image, std::vector<std::uint8_t>& out) {
    if (!image.valid()) return false;

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, &pngErrorHook, &pngWarningHook);
    if (!png) return false;
    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        return false;
    }

    std::vector<std::uint8_t> bytes;
    std::vector<png_bytep> rows(image.height);
    for (std::uint32_t y = 0; y < image.height; ++y) rows[y] = const_cast<png_bytep>(image.at(0, y));
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        return false;
    }

    png_set_write_fn(png, &bytes, &pngWriteData, &pngFlush);
    png_set_compression_level(png, kPngCompressionLevel);
    png_set_IHDR(png, info, image.width, image.height, 8, PNG_COLOR_TYPE_RGB_ALPHA, PNG_INTERLACE_NONE,
        PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    png_write_image(png, rows.data());
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);

    out.swap(bytes);
    return true;
}

} // namespace svga::raster
