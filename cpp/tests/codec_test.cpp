#include <gtest/gtest.h>
#include "svga/codec/codec_internal.h"
#include "svga/codec/decoder.h"
#include "svga/codec/encoder.h"
#include "svga/core/string_utils.h"
#include "svga/sanitize/key_registry.h"
#include "tests/svga_test_common.h"

#include <limits>

using namespace svga;
using svga_test::bytesOf;

class CodecTest : public ::testing::Test {
protected:
    CodecContext ctx;
};

TEST_F(CodecTest, LegacyArchiveRejectedBeforeDecompression) {
    const std::vector<std::uint8_t> zip = {0x50, 0x4B, 0x03, 0x04, 0x14, 0x00, 0x00, 0x00};
    Document doc;
    DecodeReport report;
    EXPECT_EQ(decodeSvga(ctx, zip.data(), zip.size(), doc, &report), SvgaError::UnsupportedLegacyFormat);
    EXPECT_FALSE(report.decompressed);
    EXPECT_EQ(report.compression, CompressionKind::None);
}

TEST_F(CodecTest, EmptyInputIsMalformed) {
    Document doc;
    EXPECT_EQ(decodeSvga(ctx, nullptr, 0, doc), SvgaError::MalformedContainer);
}

TEST_F(CodecTest, RoundTripMatchesSanitizedInput) {
    const Document doc = svga_test::sampleDocument();
    const std::vector<std::uint8_t> bytes = svga_test::encodeOrDie(ctx, doc, true);

    Document decoded;
    DecodeReport report;
    ASSERT_EQ(decodeSvga(ctx, bytes.data(), bytes.size(), decoded, &report), SvgaError::Ok);
    EXPECT_TRUE(report.decompressed);
    EXPECT_EQ(report.compression, CompressionKind::Zlib);

    EXPECT_EQ(decoded.version, "2.0");
    EXPECT_EQ(decoded.params.fps, 30);
    EXPECT_EQ(decoded.params.frames, 3);
    ASSERT_EQ(decoded.sprites.size(), 3u);
    EXPECT_EQ(decoded.sprites[0].matteKey, "mask");
    ASSERT_EQ(decoded.sprites[2].frames[0].shapes.size(), 3u);
    EXPECT_EQ(decoded.sprites[2].frames[0].shapes[0].style->lineDash, (std::vector<float>{3.0f, 1.0f, 0.0f}));
    EXPECT_EQ(decoded.sprites[2].frames[0].shapes[0].style->lineJoin, LineJoin::Bevel);
    EXPECT_EQ(decoded.images.at("bg").encoding, ImageAsset::Encoding::Base64);
    EXPECT_EQ(decoded.images.at("bgm").base64, base64Encode(bytesOf("ID3-audio")));
    ASSERT_EQ(decoded.audios.size(), 1u);
    EXPECT_EQ(decoded.audios[0].totalTime, 100);

    EXPECT_TRUE(sanitizeDocument(decoded) == sanitizeDocument(doc));
}

TEST_F(CodecTest, UncompressedPayloadTakesThirdPath) {
    const std::vector<std::uint8_t> bytes = svga_test::encodeOrDie(ctx, svga_test::sampleDocument(), false);
    Document decoded;
    DecodeReport report;
    ASSERT_EQ(decodeSvga(ctx, bytes.data(), bytes.size(), decoded, &report), SvgaError::Ok);
    EXPECT_FALSE(report.decompressed);
    EXPECT_EQ(report.compression, CompressionKind::None);
    EXPECT_EQ(decoded.sprites.size(), 3u);
}

TEST_F(CodecTest, RawDeflateTakesSecondPath) {
    const std::vector<std::uint8_t> plain = svga_test::encodeOrDie(ctx, svga_test::sampleDocument(), false);
    const std::vector<std::uint8_t> raw = svga_test::rawDeflate(plain);
    Document decoded;
    DecodeReport report;
    ASSERT_EQ(decodeSvga(ctx, raw.data(), raw.size(), decoded, &report), SvgaError::Ok);
    EXPECT_TRUE(report.decompressed);
    EXPECT_EQ(report.compression, CompressionKind::RawDeflate);
    EXPECT_EQ(decoded.sprites.size(), 3u);
}

TEST_F(CodecTest, MalformedReportsWhetherDecompressionWorked) {
    const std::vector<std::uint8_t> garbage(16, 0xFF);

    Document doc;
    doc.version = "untouched";
    DecodeReport report;
    EXPECT_EQ(decodeSvga(ctx, garbage.data(), garbage.size(), doc, &report), SvgaError::MalformedContainer);
    EXPECT_FALSE(report.decompressed);
    EXPECT_FALSE(report.detail.empty());
    EXPECT_EQ(doc.version, "untouched");

    const std::vector<std::uint8_t> packed = svga_test::zlibDeflate(garbage);
    EXPECT_EQ(decodeSvga(ctx, packed.data(), packed.size(), doc, &report), SvgaError::MalformedContainer);
    EXPECT_TRUE(report.decompressed);
    EXPECT_EQ(doc.version, "untouched");
}

TEST_F(CodecTest, MissingImageGetsFallback) {
    Document doc;
    doc.params.frames = 1;
    Sprite sprite;
    sprite.imageKey = "missing";
    sprite.frames.push_back(svga_test::makeFrame(1.0f, 0.0f, 0.0f, 10.0f, 10.0f));
    doc.sprites.push_back(sprite);

    EncodeOptions options;
    options.compress = false;
    std::vector<std::uint8_t> bytes;
    EncodeReport report;
    ASSERT_EQ(encodeSvga(ctx, doc, options, bytes, &report), SvgaError::Ok);

    const svga_test::pb::MovieEntity msg = svga_test::parseWire(bytes);
    ASSERT_EQ(msg.images().count("missing"), 1u);
    const std::string& png = msg.images().at("missing");
    EXPECT_EQ(std::vector<std::uint8_t>(png.begin(), png.end()), fallbackAssetBytes());
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_EQ(report.warnings[0].kind, RepairKind::InvalidReference);
    EXPECT_EQ(report.warnings[0].key, "missing");
}

TEST_F(CodecTest, EveryReferenceResolvesOnTheWire) {
    Document doc = svga_test::sampleDocument();
    doc.images.clear();
    doc.sprites[0].matteKey = "matte layer";

    const svga_test::pb::MovieEntity msg = svga_test::parseWire(svga_test::encodeOrDie(ctx, doc, false));
    for (const auto& sprite : msg.sprites()) {
        if (!sprite.imagekey().empty()) EXPECT_EQ(msg.images().count(sprite.imagekey()), 1u) << sprite.imagekey();
        if (!sprite.mattekey().empty()) EXPECT_EQ(msg.images().count(sprite.mattekey()), 1u) << sprite.mattekey();
    }
    EXPECT_EQ(msg.sprites(0).mattekey(), "matte_layer");
}

TEST_F(CodecTest, LayoutAndTranslationNeverZeroOnWire) {
    Document doc;
    doc.params.frames = 1;
    Sprite sprite;
    sprite.imageKey = "img";
    Frame f;
    f.alpha = 1.0f;
    f.layout = Layout{0.0f, -0.0f, 0.0f, 64.0f};
    f.transform = Transform{1.0f, 0.0f, 0.0f, 1.0f, 0.0f, -1e-7f};
    sprite.frames.push_back(f);
    doc.sprites.push_back(sprite);
    doc.images.emplace("img", ImageAsset::fromBytes(fallbackAssetBytes()));

    const svga_test::pb::MovieEntity msg = svga_test::parseWire(svga_test::encodeOrDie(ctx, doc, false));
    const auto& frame = msg.sprites(0).frames(0);
    ASSERT_TRUE(frame.has_layout());
    EXPECT_EQ(frame.layout().x(), kEpsilonNonZero);
    EXPECT_EQ(frame.layout().y(), -kEpsilonNonZero);
    EXPECT_EQ(frame.layout().width(), kEpsilonNonZero);
    EXPECT_EQ(frame.layout().height(), 64.0f);
    EXPECT_EQ(frame.transform().tx(), kEpsilonNonZero);
    EXPECT_EQ(frame.transform().ty(), -kEpsilonNonZero);
    EXPECT_EQ(frame.transform().b(), 0.0f);
}

TEST_F(CodecTest, DashEntriesAreUnpacked) {
    Document doc;
    Sprite sprite;
    Frame f;
    Shape shape;
    shape.type = ShapeType::Shape;
    shape.args = PathArgs{"M0 0"};
    ShapeStyle style;
    style.lineDash = {1.0f, 2.0f, 3.0f};
    shape.style = style;
    f.shapes.push_back(shape);
    sprite.frames.push_back(f);
    doc.sprites.push_back(sprite);

    svga_test::pb::MovieEntity msg;
    codec::detail::documentToMessage(sanitizeDocument(doc), msg);
    const std::string styleBytes = msg.sprites(0).frames(0).shapes(0).styles().SerializeAsString();

    // (7 << 3) | 5: field 7, fixed32. One tag per element, no length-delimited block.
    ASSERT_EQ(styleBytes.size(), 15u);
    EXPECT_EQ(static_cast<std::uint8_t>(styleBytes[0]), 0x3D);
    EXPECT_EQ(static_cast<std::uint8_t>(styleBytes[5]), 0x3D);
    EXPECT_EQ(static_cast<std::uint8_t>(styleBytes[10]), 0x3D);
}

TEST_F(CodecTest, CollidingKeysSurviveUnderDistinctNames) {
    Document doc;
    doc.images.emplace("a b", ImageAsset::fromBytes(bytesOf("one")));
    doc.images.emplace("a_b", ImageAsset::fromBytes(bytesOf("two")));

    EncodeOptions options;
    options.compress = false;
    std::vector<std::uint8_t> bytes;
    EncodeReport report;
    ASSERT_EQ(encodeSvga(ctx, doc, options, bytes, &report), SvgaError::Ok);
    const svga_test::pb::MovieEntity msg = svga_test::parseWire(bytes);
    EXPECT_EQ(msg.images().size(), 2u);
    EXPECT_EQ(msg.images().at("a_b"), "two");
    EXPECT_EQ(msg.images().at("a_b_2"), "one");
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_EQ(report.warnings[0].kind, RepairKind::KeyCollision);
}

TEST_F(CodecTest, EncodingIsDeterministic) {
    Document doc = svga_test::sampleDocument();
    for (int i = 0; i < 20; ++i) {
        doc.images.emplace("extra" + std::to_string(i), ImageAsset::fromBytes(bytesOf(std::to_string(i))));
    }
    EXPECT_EQ(svga_test::encodeOrDie(ctx, doc, true), svga_test::encodeOrDie(ctx, doc, true));
    EXPECT_EQ(svga_test::encodeOrDie(ctx, doc, false), svga_test::encodeOrDie(ctx, doc, false));
}

TEST_F(CodecTest, ParamsDefaultsAndVersionOnEncode) {
    Document doc;
    doc.version = "1.0";
    doc.params = MovieParams{std::numeric_limits<float>::quiet_NaN(), 600.0f, 0, 12};
    const svga_test::pb::MovieEntity msg = svga_test::parseWire(svga_test::encodeOrDie(ctx, doc, false));
    EXPECT_EQ(msg.version(), "2.0");
    EXPECT_EQ(msg.params().viewboxwidth(), kDefaultViewBoxWidth);
    EXPECT_EQ(msg.params().viewboxheight(), 600.0f);
    EXPECT_EQ(msg.params().fps(), kDefaultFps);
    EXPECT_EQ(msg.params().frames(), 12);
}

TEST_F(CodecTest, AbsentFrameFieldsDecodeToDefaults) {
    svga_test::pb::MovieEntity msg;
    msg.set_version("2.0");
    auto* sprite = msg.add_sprites();
    sprite->set_imagekey("x");
    sprite->add_frames()->set_alpha(0.5f);
    auto* shape = sprite->mutable_frames(0)->add_shapes();
    shape->set_type(svga_test::pb::ShapeEntity::KEEP);
    const std::string wire = msg.SerializeAsString();

    Document doc;
    ASSERT_EQ(decodeSvga(ctx, reinterpret_cast<const std::uint8_t*>(wire.data()), wire.size(), doc), SvgaError::Ok);
    const Frame& frame = doc.sprites[0].frames[0];
    EXPECT_EQ(frame.alpha, 0.5f);
    EXPECT_TRUE(frame.transform == Transform{});
    EXPECT_TRUE(frame.layout == Layout{});
    ASSERT_EQ(frame.shapes.size(), 1u);
    EXPECT_EQ(frame.shapes[0].type, ShapeType::Keep);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(frame.shapes[0].args));
    EXPECT_FALSE(frame.shapes[0].style.has_value());
}

TEST_F(CodecTest, BadCompressionLevelIsRejected) {
    EncodeOptions options;
    options.compressionLevel = 12;
    std::vector<std::uint8_t> out;
    EXPECT_EQ(encodeSvga(ctx, svga_test::sampleDocument(), options, out), SvgaError::InvalidArgument);
    EXPECT_TRUE(out.empty());
}
