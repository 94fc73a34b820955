#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>
#include <vector>

#include "core/raster.h"

using namespace brandimg::core;

TEST(RasterImageTest, NewImageIsTransparent) {
    RasterImage image(3, 2);
    EXPECT_EQ(image.width(), 3);
    EXPECT_EQ(image.height(), 2);
    EXPECT_EQ(image.pixel_count(), 6u);
    EXPECT_EQ(image.data().size(), 24u);
    EXPECT_EQ(image.get(2, 1), (Pixel{0, 0, 0, 0}));
}

TEST(RasterImageTest, SetAndGet) {
    RasterImage image(4, 4);
    image.set(1, 2, Pixel{10, 20, 30, 40});
    EXPECT_EQ(image.get(1, 2), (Pixel{10, 20, 30, 40}));
    EXPECT_EQ(image.get(2, 1), (Pixel{0, 0, 0, 0}));
    EXPECT_EQ(image.row(2)[4], 10);
}

TEST(RasterImageTest, OutOfBoundsAccessThrows) {
    RasterImage image(2, 2);
    EXPECT_THROW((void)image.get(2, 0), std::out_of_range);
    EXPECT_THROW((void)image.get(0, -1), std::out_of_range);
    EXPECT_THROW(image.set(-1, 0, Pixel{}), std::out_of_range);
    EXPECT_THROW((void)image.row(2), std::out_of_range);
}

TEST(RasterImageTest, MoveLeavesSourceEmpty) {
    RasterImage a(5, 5);
    RasterImage b(std::move(a));
    EXPECT_EQ(b.width(), 5);
    EXPECT_TRUE(a.empty());
}

TEST(RasterImageTest, FromRgbaChecksBufferSize) {
    RasterImage out;
    Error error;
    EXPECT_FALSE(RasterImage::from_rgba(2, 2, std::vector<unsigned char>(15, 0), out, error));
    EXPECT_TRUE(RasterImage::from_rgba(2, 2, std::vector<unsigned char>(16, 7), out, error));
    EXPECT_EQ(out.get(1, 1), (Pixel{7, 7, 7, 7}));
}

TEST(ValidateDimensionsTest, RejectsNonPositiveAndHuge) {
    Error error;
    EXPECT_TRUE(validate_dimensions(1, 1, error));
    EXPECT_FALSE(validate_dimensions(0, 10, error));
    EXPECT_EQ(error.code, ErrorCode::InvalidDimensions);
    EXPECT_FALSE(validate_dimensions(10, -3, error));
    EXPECT_FALSE(validate_dimensions(k_max_image_dimension + 1, 1, error));
    EXPECT_FALSE(validate_dimensions(20000, 20000, error));
}

TEST(ErrorCodeTest, ConfigurationDefects) {
    EXPECT_TRUE(is_configuration_defect(ErrorCode::NoShadowColorAvailable));
    EXPECT_TRUE(is_configuration_defect(ErrorCode::EmptyVisibleRegion));
    EXPECT_TRUE(is_configuration_defect(ErrorCode::InvalidConfig));
    EXPECT_FALSE(is_configuration_defect(ErrorCode::UnknownColor));
    EXPECT_FALSE(is_configuration_defect(ErrorCode::CorruptImage));
}
