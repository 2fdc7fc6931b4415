#include <gtest/gtest.h>
#include "svga/core/types.h"
#include "svga/core/string_utils.h"
#include "svga/raster/image_io.h"
#include "svga/raster/png_bitmap_producer.h"
#include "svga/synth/layer_synthesizer.h"
#include "tests/svga_test_common.h"

#include <zlib.h>
#include <cstdio>
#include <jpeglib.h>

#include <cstdlib>

using namespace svga;
using namespace svga::raster;

namespace {

void putU32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 24));
    out.push_back(static_cast<std::uint8_t>(v >> 16));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v));
}

void putChunk(std::vector<std::uint8_t>& out, const char* type, const std::vector<std::uint8_t>& data) {
    putU32(out, static_cast<std::uint32_t>(data.size()));
    std::vector<std::uint8_t> body(type, type + 4);
    body.insert(body.end(), data.begin(), data.end());
    out.insert(out.end(), body.begin(), body.end());
    putU32(out, static_cast<std::uint32_t>(crc32(0L, body.data(), static_cast<uInt>(body.size()))));
}

// Hand-assembled PNG with the given header fields and already-filtered scanlines.
std::vector<std::uint8_t> buildPng(
    std::uint32_t w,
    std::uint32_t h,
    std::uint8_t bitDepth,
    std::uint8_t colorType,
    std::uint8_t interlace,
    const std::vector<std::uint8_t>& filtered,
    const std::vector<std::uint8_t>& plte = {},
    const std::vector<std::uint8_t>& trns = {}) {
    std::vector<std::uint8_t> out = {137, 80, 78, 71, 13, 10, 26, 10};
    std::vector<std::uint8_t> ihdr;
    putU32(ihdr, w);
    putU32(ihdr, h);
    ihdr.push_back(bitDepth);
    ihdr.push_back(colorType);
    ihdr.push_back(0);
    ihdr.push_back(0);
    ihdr.push_back(interlace);
    putChunk(out, "IHDR", ihdr);
    putChunk(out, "tEXt", svga_test::bytesOf("Comment\0ignored"));
    if (!plte.empty()) putChunk(out, "PLTE", plte);
    if (!trns.empty()) putChunk(out, "tRNS", trns);
    putChunk(out, "IDAT", svga_test::zlibDeflate(filtered));
    putChunk(out, "IEND", {});
    return out;
}

int paethRef(int a, int b, int c) {
    const int p = a + b - c;
    const int pa = std::abs(p - a);
    const int pb = std::abs(p - b);
    const int pc = std::abs(p - c);
    if (pa <= pb && pa <= pc) return a;
    if (pb <= pc) return b;
    return c;
}

// 16 bits per channel RGBA, every pixel the same colour (high byte == low byte).
std::vector<std::uint8_t> deepPng(std::uint32_t w, std::uint32_t h, std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a) {
    std::vector<std::uint8_t> filtered;
    for (std::uint32_t y = 0; y < h; ++y) {
        filtered.push_back(0);
        for (std::uint32_t x = 0; x < w; ++x) {
            for (const std::uint8_t v : {r, g, b, a}) {
                filtered.push_back(v);
                filtered.push_back(v);
            }
        }
    }
    return buildPng(w, h, 16, 6, 0, filtered);
}

std::vector<std::uint8_t> solidJpeg(std::uint32_t w, std::uint32_t h, std::uint8_t r, std::uint8_t g, std::uint8_t b) {
    jpeg_compress_struct cinfo;
    jpeg_error_mgr jerr;
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_compress(&cinfo);
    unsigned char* buffer = nullptr;
    unsigned long size = 0;
    jpeg_mem_dest(&cinfo, &buffer, &size);
    cinfo.image_width = w;
    cinfo.image_height = h;
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, 95, TRUE);
    jpeg_start_compress(&cinfo, TRUE);
    std::vector<std::uint8_t> row;
    for (std::uint32_t x = 0; x < w; ++x) {
        row.push_back(r);
        row.push_back(g);
        row.push_back(b);
    }
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW rowPtr = row.data();
        jpeg_write_scanlines(&cinfo, &rowPtr, 1);
    }
    jpeg_finish_compress(&cinfo);
    std::vector<std::uint8_t> out(buffer, buffer + size);
    jpeg_destroy_compress(&cinfo);
    std::free(buffer);
    return out;
}

} // namespace

TEST(ImageIoTest, EncodeDecodeRgba) {
    RgbaImage img = RgbaImage::blank(3, 2);
    for (std::size_t i = 0; i < img.pixels.size(); ++i) img.pixels[i] = static_cast<std::uint8_t>(i * 9);
    std::vector<std::uint8_t> png;
    ASSERT_TRUE(encodePng(img, png));
    EXPECT_EQ(sniffImageFormat(png.data(), png.size()), ImageFormat::Png);

    RgbaImage back;
    ASSERT_TRUE(decodeImage(png.data(), png.size(), back));
    EXPECT_EQ(back.width, 3u);
    EXPECT_EQ(back.height, 2u);
    EXPECT_EQ(back.pixels, img.pixels);
}

TEST(ImageIoTest, FallbackAssetIsTransparentPixel) {
    const std::vector<std::uint8_t> png = fallbackAssetBytes();
    RgbaImage img;
    ASSERT_TRUE(decodeImage(png.data(), png.size(), img));
    EXPECT_EQ(img.width, 1u);
    EXPECT_EQ(img.height, 1u);
    EXPECT_EQ(img.pixels[3], 0);
}

TEST(ImageIoTest, CorruptCrcIsRejected) {
    std::vector<std::uint8_t> png = svga_test::solidPng(2, 2, 1, 2, 3, 4);
    png[20] ^= 0x01;  // inside IHDR data
    RgbaImage img;
    EXPECT_FALSE(decodeImage(png.data(), png.size(), img));
}

TEST(ImageIoTest, TruncatedIsRejected) {
    const std::vector<std::uint8_t> png = svga_test::solidPng(4, 4, 9, 9, 9, 255);
    RgbaImage img;
    EXPECT_FALSE(decodeImage(png.data(), png.size() - 5, img));
    EXPECT_FALSE(decodeImage(png.data(), 8, img));
    EXPECT_FALSE(decodeImage(nullptr, 0, img));
}

TEST(ImageIoTest, DecodesPaletteWithTransparency) {
    // 2x1: index 0 opaque red, index 1 half-transparent blue.
    const std::vector<std::uint8_t> plte = {255, 0, 0, 0, 0, 255};
    const std::vector<std::uint8_t> trns = {255, 128};
    const std::vector<std::uint8_t> filtered = {0, 0, 1};
    const std::vector<std::uint8_t> png = buildPng(2, 1, 8, 3, 0, filtered, plte, trns);
    RgbaImage img;
    ASSERT_TRUE(decodeImage(png.data(), png.size(), img));
    EXPECT_EQ(img.pixels, (std::vector<std::uint8_t>{255, 0, 0, 255, 0, 0, 255, 128}));
}

TEST(ImageIoTest, DecodesGrayAndGrayAlpha) {
    const std::vector<std::uint8_t> gray = buildPng(2, 1, 8, 0, 0, {0, 10, 200});
    RgbaImage img;
    ASSERT_TRUE(decodeImage(gray.data(), gray.size(), img));
    EXPECT_EQ(img.pixels, (std::vector<std::uint8_t>{10, 10, 10, 255, 200, 200, 200, 255}));

    const std::vector<std::uint8_t> grayAlpha = buildPng(1, 1, 8, 4, 0, {0, 77, 33});
    ASSERT_TRUE(decodeImage(grayAlpha.data(), grayAlpha.size(), img));
    EXPECT_EQ(img.pixels, (std::vector<std::uint8_t>{77, 77, 77, 33}));
}

TEST(ImageIoTest, ReversesSubUpAverageAndPaethFilters) {
    // 3x4 RGB, one filter type per row after the first.
    const std::uint32_t w = 3;
    const std::uint32_t h = 4;
    const int bpp = 3;
    std::vector<std::uint8_t> pixels(w * h * bpp);
    for (std::size_t i = 0; i < pixels.size(); ++i) pixels[i] = static_cast<std::uint8_t>((i * 37 + 11) % 256);

    const std::size_t stride = w * bpp;
    std::vector<std::uint8_t> filtered;
    for (std::uint32_t y = 0; y < h; ++y) {
        const std::uint8_t filter = static_cast<std::uint8_t>(y == 0 ? 1 : y + 1);  // 1, 2, 3, 4
        filtered.push_back(filter);
        for (std::size_t i = 0; i < stride; ++i) {
            const int x = pixels[y * stride + i];
            const int a = i >= static_cast<std::size_t>(bpp) ? pixels[y * stride + i - bpp] : 0;
            const int b = y > 0 ? pixels[(y - 1) * stride + i] : 0;
            const int c = (y > 0 && i >= static_cast<std::size_t>(bpp)) ? pixels[(y - 1) * stride + i - bpp] : 0;
            int predicted = 0;
            switch (filter) {
                case 1: predicted = a; break;
                case 2: predicted = b; break;
                case 3: predicted = (a + b) / 2; break;
                default: predicted = paethRef(a, b, c); break;
            }
            filtered.push_back(static_cast<std::uint8_t>((x - predicted) & 0xFF));
        }
    }

    const std::vector<std::uint8_t> png = buildPng(w, h, 8, 2, 0, filtered);
    RgbaImage img;
    ASSERT_TRUE(decodeImage(png.data(), png.size(), img));
    for (std::uint32_t y = 0; y < h; ++y) {
        for (std::uint32_t x = 0; x < w; ++x) {
            const std::uint8_t* px = img.at(x, y);
            const std::size_t o = y * stride + x * bpp;
            EXPECT_EQ(px[0], pixels[o]);
            EXPECT_EQ(px[1], pixels[o + 1]);
            EXPECT_EQ(px[2], pixels[o + 2]);
            EXPECT_EQ(px[3], 255);
        }
    }
}

TEST(ImageIoTest, DecodesSixteenBitChannels) {
    const std::vector<std::uint8_t> png = deepPng(4, 4, 200, 100, 50, 255);
    RgbaImage img;
    ASSERT_TRUE(decodeImage(png.data(), png.size(), img));
    EXPECT_EQ(img.width, 4u);
    EXPECT_EQ(img.height, 4u);
    for (std::size_t i = 0; i < img.pixels.size(); i += 4) {
        EXPECT_EQ(img.pixels[i], 200);
        EXPECT_EQ(img.pixels[i + 1], 100);
        EXPECT_EQ(img.pixels[i + 2], 50);
        EXPECT_EQ(img.pixels[i + 3], 255);
    }
}

TEST(ImageIoTest, DecodesAdam7Interlace) {
    // 2x2 RGBA: pass 1 holds (0,0), pass 6 holds (1,0), pass 7 holds row 1.
    const std::vector<std::uint8_t> filtered = {
        0, 1, 2, 3, 255,
        0, 4, 5, 6, 255,
        0, 7, 8, 9, 255, 10, 11, 12, 128,
    };
    const std::vector<std::uint8_t> png = buildPng(2, 2, 8, 6, 1, filtered);
    RgbaImage img;
    ASSERT_TRUE(decodeImage(png.data(), png.size(), img));
    EXPECT_EQ(img.pixels, (std::vector<std::uint8_t>{1, 2, 3, 255, 4, 5, 6, 255, 7, 8, 9, 255, 10, 11, 12, 128}));
}

TEST(ImageIoTest, DecodesJpeg) {
    const std::vector<std::uint8_t> jpeg = solidJpeg(8, 4, 200, 40, 90);
    EXPECT_EQ(sniffImageFormat(jpeg.data(), jpeg.size()), ImageFormat::Jpeg);
    RgbaImage img;
    ASSERT_TRUE(decodeImage(jpeg.data(), jpeg.size(), img));
    EXPECT_EQ(img.width, 8u);
    EXPECT_EQ(img.height, 4u);
    const std::uint8_t* px = img.at(3, 2);
    EXPECT_NEAR(px[0], 200, 4);
    EXPECT_NEAR(px[1], 40, 4);
    EXPECT_NEAR(px[2], 90, 4);
    EXPECT_EQ(px[3], 255);

    EXPECT_FALSE(decodeImage(jpeg.data(), 3, img));
}

TEST(ImageIoTest, RejectsOversizedAndUnknown) {
    RgbaImage img;
    const std::vector<std::uint8_t> oversized = buildPng(kMaxRasterDimension + 1, 1, 8, 0, 0, {0});
    EXPECT_FALSE(decodeImage(oversized.data(), oversized.size(), img));

    const std::vector<std::uint8_t> gif = svga_test::bytesOf("GIF89a");
    EXPECT_EQ(sniffImageFormat(gif.data(), gif.size()), ImageFormat::Unknown);
    EXPECT_FALSE(decodeImage(gif.data(), gif.size(), img));
}

TEST(PngBitmapProducerTest, PlaceholderCoversRoundedRect) {
    PngBitmapProducer producer;
    const std::vector<std::uint8_t> png = producer.renderPlaceholder(10.2f, 5.0f);
    RgbaImage img;
    ASSERT_TRUE(decodeImage(png.data(), png.size(), img));
    EXPECT_EQ(img.width, 11u);
    EXPECT_EQ(img.height, 5u);
    for (std::size_t i = 3; i < img.pixels.size(); i += 4) EXPECT_EQ(img.pixels[i], 0);

    EXPECT_EQ(pixelExtent(0.0f), 1u);
    EXPECT_EQ(pixelExtent(-4.0f), 1u);
    EXPECT_EQ(pixelExtent(1e9f), kMaxRasterDimension);
}

TEST(PngBitmapProducerTest, ShineBlockIsOpaqueGradient) {
    PngBitmapProducer producer;
    const std::vector<std::uint8_t> png = producer.renderShineBlock(40.0f, 20.0f);
    RgbaImage img;
    ASSERT_TRUE(decodeImage(png.data(), png.size(), img));
    EXPECT_EQ(img.width, 40u);
    for (std::size_t i = 0; i < img.pixels.size(); i += 4) {
        EXPECT_EQ(img.pixels[i], 255);
        EXPECT_EQ(img.pixels[i + 3], 255);
    }
    // Near the 0.3 stop the blue channel dips towards #FFF8E1.
    const std::uint8_t* corner = img.at(0, 0);
    const std::uint8_t* third = img.at(12, 6);
    EXPECT_GT(corner[2], third[2]);

    // The bloom pass lifts the darkest band above the sharp gradient value.
    RgbaImage sharp = RgbaImage::blank(40, 20);
    const GradientStop stops[] = {
        {0.0f, 0xFF, 0xFF, 0xFF},
        {0.3f, 0xFF, 0xF8, 0xE1},
        {0.5f, 0xFF, 0xFF, 0xFF},
        {0.7f, 0xFF, 0xF8, 0xE1},
        {1.0f, 0xFF, 0xFF, 0xFF},
    };
    fillDiagonalGradient(sharp, stops, 5, false);
    EXPECT_GT(third[2], sharp.at(12, 6)[2]);
}

TEST(PngBitmapProducerTest, CompositeOverOpaqueStaysOpaque) {
    RgbaImage dst = RgbaImage::blank(1, 1);
    dst.pixels = {0, 0, 0, 255};
    RgbaImage src = RgbaImage::blank(1, 1);
    src.pixels = {255, 255, 255, 128};
    compositeOver(dst, src);
    EXPECT_EQ(dst.pixels[3], 255);
    EXPECT_EQ(dst.pixels[0], 128);
}

TEST(PngBitmapProducerTest, SilhouetteKeepsShapeAndFeathersEdges) {
    PngBitmapProducer producer;
    const std::vector<std::uint8_t> base = svga_test::solidPng(2, 2, 10, 20, 30, 255);
    const std::vector<std::uint8_t> png = producer.renderShineSilhouette(base, 12.0f, 12.0f);
    RgbaImage img;
    ASSERT_TRUE(decodeImage(png.data(), png.size(), img));
    EXPECT_EQ(img.width, 12u);
    EXPECT_EQ(img.at(6, 6)[3], 255);
    EXPECT_EQ(img.at(6, 6)[0], 255);
    EXPECT_LT(img.at(0, 0)[3], 255);

    EXPECT_TRUE(producer.renderShineSilhouette(svga_test::bytesOf("not a png"), 4.0f, 4.0f).empty());
}

TEST(PngBitmapProducerTest, FitRasterCentresWithAspect) {
    PngBitmapProducer producer;
    const std::vector<std::uint8_t> wide = svga_test::solidPng(4, 2, 0, 255, 0, 255);
    const std::vector<std::uint8_t> png = producer.fitRaster(wide, 8.0f, 8.0f);
    RgbaImage img;
    ASSERT_TRUE(decodeImage(png.data(), png.size(), img));
    EXPECT_EQ(img.width, 8u);
    EXPECT_EQ(img.height, 8u);
    EXPECT_EQ(img.at(0, 0)[3], 0);
    EXPECT_EQ(img.at(0, 1)[3], 0);
    EXPECT_EQ(img.at(0, 2)[3], 255);
    EXPECT_EQ(img.at(7, 5)[3], 255);
    EXPECT_EQ(img.at(7, 6)[3], 0);
}

TEST(PngBitmapProducerTest, NormalizeRewritesAs32Bit) {
    PngBitmapProducer producer;
    const std::vector<std::uint8_t> gray = buildPng(2, 1, 8, 0, 0, {0, 10, 200});
    const std::vector<std::uint8_t> png = producer.normalizeRaster(gray);
    ASSERT_NE(png, gray);
    ASSERT_GT(png.size(), 26u);
    EXPECT_EQ(png[25], 6);  // IHDR colour type
    RgbaImage img;
    ASSERT_TRUE(decodeImage(png.data(), png.size(), img));
    EXPECT_EQ(img.pixels, (std::vector<std::uint8_t>{10, 10, 10, 255, 200, 200, 200, 255}));

    const std::vector<std::uint8_t> mp3 = svga_test::bytesOf("ID3 not an image");
    EXPECT_EQ(producer.normalizeRaster(mp3), mp3);
}

TEST(PngBitmapProducerTest, SixteenBitUploadIsFittedAndSilhouetted) {
    PngBitmapProducer producer;
    const std::vector<std::uint8_t> deep = deepPng(4, 4, 200, 100, 50, 255);
    const std::vector<std::uint8_t> fitted = producer.fitRaster(deep, 8.0f, 8.0f);
    ASSERT_FALSE(fitted.empty());
    RgbaImage img;
    ASSERT_TRUE(decodeImage(fitted.data(), fitted.size(), img));
    EXPECT_EQ(img.width, 8u);
    EXPECT_EQ(img.at(4, 4)[0], 200);

    Document doc;
    doc.params.frames = 2;
    LayerSpec spec;
    spec.keyName = "gift";
    spec.rect = LayerRect{0.0f, 0.0f, 16.0f, 16.0f};
    spec.animations = AnimationPreset::Shine;
    Document out;
    std::vector<RepairWarning> warnings;
    ASSERT_EQ(synthesizeLayer(producer, doc, spec, &deep, out, &warnings), SvgaError::Ok);
    EXPECT_TRUE(warnings.empty());

    std::vector<std::uint8_t> shine;
    ASSERT_TRUE(base64Decode(out.images.at("gift_shine").base64, shine));
    EXPECT_NE(shine, fallbackAssetBytes());
    ASSERT_TRUE(decodeImage(shine.data(), shine.size(), img));
    EXPECT_EQ(img.width, 16u);
    EXPECT_EQ(img.at(8, 8)[3], 255);
}

TEST(PngBitmapProducerTest, JpegUploadIsFitted) {
    PngBitmapProducer producer;
    const std::vector<std::uint8_t> jpeg = solidJpeg(4, 2, 10, 200, 10);
    const std::vector<std::uint8_t> png = producer.fitRaster(jpeg, 8.0f, 8.0f);
    RgbaImage img;
    ASSERT_TRUE(decodeImage(png.data(), png.size(), img));
    EXPECT_EQ(sniffImageFormat(png.data(), png.size()), ImageFormat::Png);
    EXPECT_EQ(img.at(0, 1)[3], 0);
    EXPECT_EQ(img.at(0, 2)[3], 255);
    EXPECT_NEAR(img.at(4, 4)[1], 200, 4);
}
