#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "core/pipeline.h"
#include "core/text_overlay.h"

using namespace brandimg::core;

namespace {

// Lato Regular (SIL OFL 1.1), shipped in tests/data.
constexpr const char* k_test_font = BRANDIMG_TEST_FONT;

} // namespace

TEST(Utf8Test, DecodesMultiByteSequences) {
    const std::vector<char32_t> cps = decode_utf8("A\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
    ASSERT_EQ(cps.size(), 4u);
    EXPECT_EQ(cps[0], U'A');
    EXPECT_EQ(cps[1], U'\u00E9');
    EXPECT_EQ(cps[2], U'\u20AC');
    EXPECT_EQ(cps[3], U'\U0001F600');
}

TEST(Utf8Test, InvalidBytesBecomeReplacementCharacters) {
    const std::vector<char32_t> truncated = decode_utf8("a\xE2\x82");
    ASSERT_EQ(truncated.size(), 3u);
    EXPECT_EQ(truncated[1], U'\uFFFD');

    const std::vector<char32_t> overlong = decode_utf8("\xC0\x80");
    ASSERT_FALSE(overlong.empty());
    EXPECT_EQ(overlong[0], U'\uFFFD');

    const std::vector<char32_t> stray = decode_utf8("\x80z");
    ASSERT_EQ(stray.size(), 2u);
    EXPECT_EQ(stray[0], U'\uFFFD');
    EXPECT_EQ(stray[1], U'z');
}

TEST(FontFaceTest, RejectsNonFontData) {
    FontFace font;
    Error error;
    EXPECT_FALSE(font.load_from_memory({}, error));
    EXPECT_EQ(error.code, ErrorCode::FontError);
    EXPECT_FALSE(font.load("/nonexistent/font.ttf", error));
    EXPECT_EQ(error.code, ErrorCode::FontError);
    EXPECT_FALSE(font.loaded());
    EXPECT_FLOAT_EQ(font.measure("abc", 20.0f), 0.0f);
}

TEST(TextLayerTest, UnloadedFontIsAnError) {
    FontFace font;
    Layer layer;
    Error error;
    EXPECT_FALSE(render_text_layer(font, "Hi", 100, 50, TextStyle{}, layer, error));
    EXPECT_EQ(error.code, ErrorCode::FontError);
}

TEST(TextLayerTest, RendersWhiteCoverageAroundAnchor) {
    FontFace font;
    Error error;
    ASSERT_TRUE(font.load(k_test_font, error)) << error.message;
    EXPECT_GT(font.measure("Brand", 40.0f), font.measure("B", 40.0f));

    TextStyle style;
    style.pixel_height = 40.0f;
    style.anchor_x = 200.0;
    style.anchor_y = 50.0;
    Layer layer;
    ASSERT_TRUE(render_text_layer(font, "Brand", 400, 100, style, layer, error)) << error.message;
    EXPECT_EQ(layer.left, 0);
    EXPECT_EQ(layer.top, 0);
    ASSERT_EQ(layer.image.width(), 400);

    int covered = 0;
    int min_x = 400;
    int max_x = -1;
    for (int y = 0; y < 100; ++y) {
        for (int x = 0; x < 400; ++x) {
            const Pixel p = layer.image.get(x, y);
            EXPECT_EQ(p.rgb(), (Rgb{255, 255, 255}));
            if (p.a > 0) {
                ++covered;
                min_x = std::min(min_x, x);
                max_x = std::max(max_x, x);
            }
        }
    }
    EXPECT_GT(covered, 0);
    EXPECT_LT(min_x, 200);
    EXPECT_GT(max_x, 200);
}

TEST(TextLayerTest, BannerWithText) {
    FontFace font;
    Error error;
    ASSERT_TRUE(font.load(k_test_font, error)) << error.message;

    BannerRequest request;
    request.type = BannerType::Post;
    request.text = "Join us";
    request.font = &font;
    request.format = ImageFormat::Png;
    CompositionResult result;
    ASSERT_TRUE(compose_banner(request, BrandConfig::brand_defaults(), result, error)) << error.message;
    EXPECT_EQ(result.width, 1200);
    RasterImage image;
    ASSERT_TRUE(decode_image(result.output.bytes, image, error)) << error.message;
    int white = 0;
    for (int y = 0; y < image.height(); ++y) {
        for (int x = 0; x < image.width(); ++x) {
            const Pixel p = image.get(x, y);
            if (p.r == 255 && p.g == 255 && p.b == 255) {
                ++white;
            }
        }
    }
    EXPECT_GT(white, 0);
    EXPECT_EQ(image.get(0, 0), (Pixel{30, 42, 69, 255}));
}

TEST(FontFaceTest, MeasureScalesWithPixelHeight) {
    FontFace font;
    Error error;
    ASSERT_TRUE(font.load(k_test_font, error)) << error.message;
    EXPECT_TRUE(font.loaded());
    const float small = font.measure("Brand", 20.0f);
    const float large = font.measure("Brand", 40.0f);
    EXPECT_GT(small, 0.0f);
    EXPECT_NEAR(large, 2.0f * small, 2.0f);
    EXPECT_FLOAT_EQ(font.measure("", 40.0f), 0.0f);
}
