#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/codec.h"
#include "core/svg_raster.h"

using namespace brandimg::core;

namespace {

std::vector<unsigned char> bytes_of(const std::string& text) {
    return std::vector<unsigned char>(text.begin(), text.end());
}

// 20x10 fuchsia bar.
const std::string k_wide_bar =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!-- brand bar -->\n"
    "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"20\" height=\"10\" viewBox=\"0 0 20 10\">"
    "<rect width=\"20\" height=\"10\" fill=\"#ff008f\"/></svg>\n";

} // namespace

TEST(SvgRasterTest, DetectsSvgDocuments) {
    EXPECT_TRUE(is_svg_document(bytes_of(k_wide_bar)));
    EXPECT_TRUE(is_svg_document(bytes_of("\xEF\xBB\xBF  <svg xmlns=\"http://www.w3.org/2000/svg\"/>")));
    EXPECT_TRUE(is_svg_document(bytes_of(
        "<!DOCTYPE svg PUBLIC \"-//W3C//DTD SVG 1.1//EN\" \"x\">\n<svg\nwidth=\"1\"/>")));
    EXPECT_FALSE(is_svg_document(bytes_of("<svgx/>")));
    EXPECT_FALSE(is_svg_document(bytes_of("<html><svg/></html>")));
    EXPECT_FALSE(is_svg_document(bytes_of("\x89PNG\r\n\x1a\n")));
    EXPECT_FALSE(is_svg_document({}));
}

TEST(SvgRasterTest, ContainCentersTheDrawing) {
    RasterImage out;
    Error error;
    ASSERT_TRUE(rasterize_svg(bytes_of(k_wide_bar), 40, 40, FitMode::Contain, out, error)) << error.message;
    ASSERT_EQ(out.width(), 40);
    ASSERT_EQ(out.height(), 40);
    // The bar scales to 40x20 and sits in rows [10, 30).
    EXPECT_EQ(out.get(20, 20), (Pixel{255, 0, 143, 255}));
    EXPECT_EQ(out.get(1, 15), (Pixel{255, 0, 143, 255}));
    EXPECT_EQ(out.get(20, 2).a, 0);
    EXPECT_EQ(out.get(20, 37).a, 0);
}

TEST(SvgRasterTest, CoverFillsTheBox) {
    RasterImage out;
    Error error;
    ASSERT_TRUE(rasterize_svg(bytes_of(k_wide_bar), 40, 40, FitMode::Cover, out, error)) << error.message;
    EXPECT_EQ(out.get(20, 1), (Pixel{255, 0, 143, 255}));
    EXPECT_EQ(out.get(20, 38), (Pixel{255, 0, 143, 255}));
}

TEST(SvgRasterTest, DecodeAndResizeRendersSvgLogos) {
    RasterImage out;
    Error error;
    ASSERT_TRUE(decode_and_resize(bytes_of(k_wide_bar), 32, 32, FitMode::Contain, out, error))
        << error.message;
    EXPECT_EQ(out.width(), 32);
    EXPECT_EQ(out.get(16, 16), (Pixel{255, 0, 143, 255}));
    EXPECT_EQ(out.get(16, 1).a, 0);
}

TEST(SvgRasterTest, MalformedSvgIsCorruptImage) {
    RasterImage out;
    Error error;
    EXPECT_FALSE(rasterize_svg(bytes_of("<svg xmlns=\"http://www.w3.org/2000/svg\"><rect"), 16, 16,
                               FitMode::Contain, out, error));
    EXPECT_EQ(error.code, ErrorCode::CorruptImage);
}

TEST(SvgRasterTest, NonSvgIsUnsupportedFormat) {
    RasterImage out;
    Error error;
    EXPECT_FALSE(rasterize_svg(bytes_of("plain text"), 16, 16, FitMode::Contain, out, error));
    EXPECT_EQ(error.code, ErrorCode::UnsupportedFormat);
}

TEST(SvgRasterTest, RejectsBadTargetSize) {
    RasterImage out;
    Error error;
    EXPECT_FALSE(rasterize_svg(bytes_of(k_wide_bar), 0, 16, FitMode::Contain, out, error));
    EXPECT_EQ(error.code, ErrorCode::InvalidDimensions);
}
