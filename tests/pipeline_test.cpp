#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "core/pipeline.h"
#include "test_support.h"

using namespace brandimg::core;

namespace {

constexpr Pixel k_navy{30, 42, 69, 255};
constexpr Pixel k_aqua{0, 255, 220, 255};

std::vector<unsigned char> disc_portrait(const Rgb& color) {
    return brandimg::test::encode_png(brandimg::test::make_disc(200, 60.0, color));
}

RasterImage decode_result(const CompositionResult& result) {
    RasterImage image;
    Error error;
    if (!decode_image(result.output.bytes, image, error)) {
        ADD_FAILURE() << error.message;
    }
    return image;
}

AvatarRequest avatar_request(const std::string& color, int size) {
    AvatarRequest request;
    request.portrait = disc_portrait(Rgb{240, 240, 240});
    request.color = color;
    request.size = size;
    return request;
}

} // namespace

TEST(AvatarPipelineTest, Navy512EndToEnd) {
    const BrandConfig config = BrandConfig::brand_defaults();
    CompositionResult result;
    Error error;
    ASSERT_TRUE(compose_avatar(avatar_request("navy", 512), config, result, error)) << error.message;

    EXPECT_EQ(result.width, 512);
    EXPECT_EQ(result.height, 512);
    EXPECT_EQ(result.background, (Rgb{30, 42, 69}));
    EXPECT_EQ(result.shadow_color, "aqua");
    ASSERT_TRUE(result.silhouette.has_value());
    EXPECT_EQ(result.silhouette->silhouette_size, 614);
    EXPECT_EQ(result.silhouette->offset, 15);
    EXPECT_EQ(result.silhouette->placed_x, -66);
    EXPECT_EQ(result.silhouette->placed_y, -66);
    EXPECT_EQ(result.output.format, ImageFormat::Png);
    EXPECT_EQ(result.output.attempts, 1);
    EXPECT_LE(result.output.size(), k_default_byte_budget);

    const RasterImage image = decode_result(result);
    ASSERT_EQ(image.width(), 512);
    ASSERT_EQ(image.height(), 512);
    // Background corner, subject center and a silhouette-only point up-left of the subject.
    EXPECT_EQ(image.get(0, 0), k_navy);
    EXPECT_EQ(image.get(256, 256), (Pixel{240, 240, 240, 255}));
    EXPECT_EQ(image.get(71, 241), k_aqua);
    EXPECT_EQ(image.get(511, 511), k_navy);
}

TEST(AvatarPipelineTest, WithoutShadowOnlySubjectIsDrawn) {
    const BrandConfig config = BrandConfig::brand_defaults();
    AvatarRequest request = avatar_request("navy", 512);
    request.with_shadow = false;
    CompositionResult result;
    Error error;
    ASSERT_TRUE(compose_avatar(request, config, result, error)) << error.message;
    EXPECT_FALSE(result.silhouette.has_value());
    EXPECT_TRUE(result.shadow_color.empty());
    const RasterImage image = decode_result(result);
    EXPECT_EQ(image.get(71, 241), k_navy);
}

TEST(AvatarPipelineTest, GrayscaleLeavesBackgroundColored) {
    const BrandConfig config = BrandConfig::brand_defaults();
    AvatarRequest request;
    request.portrait = disc_portrait(Rgb{255, 0, 143});
    request.color = "navy";
    request.size = 256;
    request.grayscale = true;
    CompositionResult result;
    Error error;
    ASSERT_TRUE(compose_avatar(request, config, result, error)) << error.message;
    const RasterImage image = decode_result(result);
    EXPECT_EQ(image.get(128, 128), (Pixel{93, 93, 93, 255}));
    EXPECT_EQ(image.get(0, 0), k_navy);
}

TEST(AvatarPipelineTest, LayerOrderAndGeometry) {
    const BrandConfig config = BrandConfig::brand_defaults();
    CompositionRequest composition;
    std::optional<SilhouettePlan> plan;
    std::string shadow;
    Error error;
    ASSERT_TRUE(build_avatar_composition(avatar_request("aqua", 512), config, composition, plan,
                                         shadow, error)) << error.message;
    ASSERT_EQ(composition.layers.size(), 2u);
    EXPECT_EQ(composition.layers[0].label, "silhouette");
    EXPECT_EQ(composition.layers[0].image.width(), 512);
    EXPECT_EQ(composition.layers[0].left, 0);
    EXPECT_EQ(composition.layers[1].label, "subject");
    EXPECT_EQ(composition.layers[1].image.width(), 512);
    EXPECT_EQ(shadow, "navy");

    const Pixel silhouette_pixel = composition.layers[0].image.get(175, 175);
    EXPECT_EQ(silhouette_pixel.rgb(), (Rgb{30, 42, 69}));
}

TEST(AvatarPipelineTest, JpegOutput) {
    const BrandConfig config = BrandConfig::brand_defaults();
    AvatarRequest request = avatar_request("fuchsia", 256);
    request.format = ImageFormat::Jpeg;
    CompositionResult result;
    Error error;
    ASSERT_TRUE(compose_avatar(request, config, result, error)) << error.message;
    ASSERT_GE(result.output.size(), 2u);
    EXPECT_EQ(result.output.bytes[0], 0xFF);
    EXPECT_EQ(result.output.bytes[1], 0xD8);
    EXPECT_EQ(result.output.setting_used, 90);
}

TEST(AvatarPipelineTest, RequestErrors) {
    const BrandConfig config = BrandConfig::brand_defaults();
    CompositionResult result;
    Error error;
    EXPECT_FALSE(compose_avatar(avatar_request("teal", 512), config, result, error));
    EXPECT_EQ(error.code, ErrorCode::UnknownColor);

    error = Error{};
    EXPECT_FALSE(compose_avatar(avatar_request("navy", 0), config, result, error));
    EXPECT_EQ(error.code, ErrorCode::InvalidDimensions);

    AvatarRequest garbage = avatar_request("navy", 64);
    garbage.portrait = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
    error = Error{};
    EXPECT_FALSE(compose_avatar(garbage, config, result, error));
    EXPECT_EQ(error.code, ErrorCode::UnsupportedFormat);
}

TEST(AvatarPipelineTest, MissingShadowEntryIsConfigurationDefect) {
    BrandConfig config = BrandConfig::brand_defaults();
    Error error;
    ASSERT_TRUE(config.palette.add("coral", Rgb{255, 127, 80}, error));
    CompositionResult result;
    EXPECT_FALSE(compose_avatar(avatar_request("coral", 128), config, result, error));
    EXPECT_EQ(error.code, ErrorCode::NoShadowColorAvailable);
    EXPECT_TRUE(is_configuration_defect(error.code));
}

TEST(AvatarPipelineTest, TinyCanvasHasNoVisibleSilhouette) {
    const BrandConfig config = BrandConfig::brand_defaults();
    CompositionResult result;
    Error error;
    EXPECT_FALSE(compose_avatar(avatar_request("navy", 1), config, result, error));
    EXPECT_EQ(error.code, ErrorCode::EmptyVisibleRegion);

    AvatarRequest no_shadow = avatar_request("navy", 1);
    no_shadow.with_shadow = false;
    error = Error{};
    EXPECT_TRUE(compose_avatar(no_shadow, config, result, error)) << error.message;
}

TEST(BannerSpecTest, Table) {
    ASSERT_EQ(banner_specs().size(), 6u);
    const BannerSpec* post = find_banner_spec("Post");
    ASSERT_NE(post, nullptr);
    EXPECT_EQ(post->recommended_width, 1200);
    EXPECT_EQ(post->recommended_height, 627);
    EXPECT_EQ(post->default_format, ImageFormat::Jpeg);
    EXPECT_EQ(banner_spec(BannerType::Logo).default_format, ImageFormat::Png);
    EXPECT_EQ(banner_spec(BannerType::Title).recommended_width, 4200);
    EXPECT_NE(find_banner_spec("culture-main"), nullptr);
    EXPECT_EQ(find_banner_spec("cover"), nullptr);
}

TEST(BannerLayoutTest, LogoPlacement) {
    const LogoPlacement logo = logo_placement(BannerType::Logo, 400, 400);
    EXPECT_EQ(logo.size, 320);
    EXPECT_EQ(logo.x, 40);
    EXPECT_EQ(logo.y, 40);

    const LogoPlacement title = logo_placement(BannerType::Title, 4200, 700);
    EXPECT_EQ(title.size, 280);
    EXPECT_EQ(title.x, 210);
    EXPECT_EQ(title.y, 210);

    const LogoPlacement post = logo_placement(BannerType::Post, 1200, 627);
    EXPECT_EQ(post.size, 188);
    EXPECT_EQ(post.x, 60);
    EXPECT_EQ(post.y, 31);
}

TEST(BannerLayoutTest, TextStyle) {
    const TextStyle title = banner_text_style(BannerType::Title, 4200, 700);
    EXPECT_FLOAT_EQ(title.pixel_height, 105.0f);
    EXPECT_DOUBLE_EQ(title.anchor_x, 2520.0);
    EXPECT_DOUBLE_EQ(title.anchor_y, 350.0);

    const TextStyle post = banner_text_style(BannerType::Post, 1200, 627);
    EXPECT_FLOAT_EQ(post.pixel_height, 75.0f);
    EXPECT_EQ(post.color, (Rgb{255, 255, 255}));
}

TEST(BannerPipelineTest, PlainPostBanner) {
    const BrandConfig config = BrandConfig::brand_defaults();
    BannerRequest request;
    request.type = BannerType::Post;
    request.color = "aqua";
    CompositionResult result;
    Error error;
    ASSERT_TRUE(compose_banner(request, config, result, error)) << error.message;
    EXPECT_EQ(result.width, 1200);
    EXPECT_EQ(result.height, 627);
    EXPECT_EQ(result.output.format, ImageFormat::Jpeg);
    EXPECT_TRUE(result.warnings.empty());

    const RasterImage image = decode_result(result);
    EXPECT_EQ(image.width(), 1200);
    EXPECT_EQ(image.height(), 627);
}

TEST(BannerPipelineTest, MinimumDimensions) {
    const BrandConfig config = BrandConfig::brand_defaults();
    BannerRequest request;
    request.type = BannerType::Photo;
    request.use_recommended = false;
    request.format = ImageFormat::Png;
    CompositionResult result;
    Error error;
    ASSERT_TRUE(compose_banner(request, config, result, error)) << error.message;
    EXPECT_EQ(result.width, 264);
    EXPECT_EQ(result.height, 176);
    EXPECT_EQ(result.output.format, ImageFormat::Png);
}

TEST(BannerPipelineTest, LogoIsCentredOnLogoBanner) {
    const BrandConfig config = BrandConfig::brand_defaults();
    RasterImage logo(50, 50);
    logo.fill(Pixel{255, 0, 0, 255});
    BannerRequest request;
    request.type = BannerType::Logo;
    request.logo = brandimg::test::encode_png(logo);
    CompositionResult result;
    Error error;
    ASSERT_TRUE(compose_banner(request, config, result, error)) << error.message;
    const RasterImage image = decode_result(result);
    ASSERT_EQ(image.width(), 400);
    EXPECT_EQ(image.get(200, 200), (Pixel{255, 0, 0, 255}));
    EXPECT_EQ(image.get(10, 10), k_navy);
    EXPECT_EQ(image.get(390, 390), k_navy);
}

TEST(BannerPipelineTest, LogoBannerWithoutLogoWarns) {
    const BrandConfig config = BrandConfig::brand_defaults();
    BannerRequest request;
    request.type = BannerType::Logo;
    CompositionResult result;
    Error error;
    ASSERT_TRUE(compose_banner(request, config, result, error)) << error.message;
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST(BannerPipelineTest, TextNeedsAFont) {
    const BrandConfig config = BrandConfig::brand_defaults();
    BannerRequest request;
    request.text = "Hello";
    CompositionResult result;
    Error error;
    EXPECT_FALSE(compose_banner(request, config, result, error));
    EXPECT_EQ(error.code, ErrorCode::FontError);
}

TEST(BannerPipelineTest, BadLogoIsReported) {
    const BrandConfig config = BrandConfig::brand_defaults();
    BannerRequest request;
    request.logo = std::vector<unsigned char>{'x', 'y', 'z'};
    CompositionResult result;
    Error error;
    EXPECT_FALSE(compose_banner(request, config, result, error));
    EXPECT_EQ(error.code, ErrorCode::UnsupportedFormat);
    EXPECT_EQ(error.message.rfind("logo: ", 0), 0u);
}

TEST(BannerPipelineTest, MissingLogoFileIsSkippedWithWarning) {
    const BrandConfig config = BrandConfig::brand_defaults();
    BannerRequest request;
    request.type = BannerType::Logo;
    request.logo_path = std::filesystem::temp_directory_path() / "brandimg-no-such-logo.svg";
    CompositionResult result;
    Error error;
    ASSERT_TRUE(compose_banner(request, config, result, error)) << error.message;
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("skipping logo overlay"), std::string::npos);
    const RasterImage image = decode_result(result);
    EXPECT_EQ(image.get(200, 200), k_navy);
}

TEST(BannerPipelineTest, SvgLogoFileIsRendered) {
    const std::filesystem::path file = std::filesystem::temp_directory_path() / "brandimg-logo-test.svg";
    {
        std::ofstream out(file);
        out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"10\" height=\"10\">"
               "<circle cx=\"5\" cy=\"5\" r=\"5\" fill=\"#00ffdc\"/></svg>\n";
    }
    const BrandConfig config = BrandConfig::brand_defaults();
    BannerRequest request;
    request.type = BannerType::Logo;
    request.logo_path = file;
    CompositionResult result;
    Error error;
    ASSERT_TRUE(compose_banner(request, config, result, error)) << error.message;
    EXPECT_TRUE(result.warnings.empty());
    const RasterImage image = decode_result(result);
    EXPECT_EQ(image.get(200, 200), k_aqua);
    EXPECT_EQ(image.get(10, 10), k_navy);
    std::filesystem::remove(file);
}

TEST(AvatarPipelineTest, ConcurrentRequestsAreIndependent) {
    const BrandConfig config = BrandConfig::brand_defaults();
    const std::vector<std::string> colors = {"aqua", "teal", "navy", "fuchsia"};
    std::vector<int> outcomes(colors.size(), -1);
    std::vector<std::thread> workers;
    for (size_t i = 0; i < colors.size(); ++i) {
        workers.emplace_back([&, i]() {
            CompositionResult result;
            Error error;
            outcomes[i] = compose_avatar(avatar_request(colors[i], 128), config, result, error) ? 1 : 0;
        });
    }
    for (std::thread& t : workers) {
        t.join();
    }
    EXPECT_EQ(outcomes, (std::vector<int>{1, 0, 1, 1}));
}
