#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "brand_config.h"
#include "codec.h"
#include "compositor.h"
#include "encoder.h"
#include "placement.h"
#include "raster.h"
#include "text_overlay.h"

namespace brandimg::core {

// One composition: canvas in the background color, layers painted in order
// (silhouette, subject or logo, text), then a budgeted encode. Owns its
// layers; consumed by a single run_composition call.
struct CompositionRequest {
    int width = 0;
    int height = 0;
    std::string background;
    std::vector<Layer> layers;
    ImageFormat format = ImageFormat::Png;
    size_t byte_budget = k_default_byte_budget;
};

struct CompositionResult {
    EncodedOutput output;
    int width = 0;
    int height = 0;
    Rgb background;
    std::optional<SilhouettePlan> silhouette;
    std::string shadow_color;
    std::vector<std::string> warnings;
};

bool run_composition(CompositionRequest request, const BrandConfig& config,
                     CompositionResult& out, Error& error);

// Square avatar from a pre-cut, alpha-transparent portrait.
struct AvatarRequest {
    std::vector<unsigned char> portrait;
    std::string color;
    int size = 512;
    bool grayscale = false;
    bool with_shadow = true;
    ImageFormat format = ImageFormat::Png;
    size_t byte_budget = k_default_byte_budget;
};

bool build_avatar_composition(const AvatarRequest& request, const BrandConfig& config,
                              CompositionRequest& out, std::optional<SilhouettePlan>& plan,
                              std::string& shadow_color, Error& error);

bool compose_avatar(const AvatarRequest& request, const BrandConfig& config,
                    CompositionResult& out, Error& error);

enum class BannerType { Logo, Title, CultureMain, CultureModule, Photo, Post };

struct BannerSpec {
    BannerType type;
    const char* name;
    int min_width;
    int min_height;
    int recommended_width;
    int recommended_height;
    ImageFormat default_format;
    const char* description;
};

const std::array<BannerSpec, 6>& banner_specs();
const BannerSpec* find_banner_spec(const std::string& name);
const BannerSpec& banner_spec(BannerType type);

struct LogoPlacement {
    int size = 0;
    int x = 0;
    int y = 0;
};

LogoPlacement logo_placement(BannerType type, int width, int height);
TextStyle banner_text_style(BannerType type, int width, int height);

struct BannerRequest {
    BannerType type = BannerType::Post;
    std::string color = "navy";
    std::optional<std::vector<unsigned char>> logo;
    // Read when `logo` is empty. A missing file only adds a warning.
    std::filesystem::path logo_path;
    std::string text;
    const FontFace* font = nullptr;
    std::optional<ImageFormat> format;
    bool use_recommended = true;
    size_t byte_budget = k_default_byte_budget;
};

bool compose_banner(const BannerRequest& request, const BrandConfig& config,
                    CompositionResult& out, Error& error);

} // namespace brandimg::core
