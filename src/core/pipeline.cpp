#include "pipeline.h"

#include <algorithm>
#include <cmath>
#include <system_error>
#include <utility>

#include "canvas.h"
#include "cli_parse.h"
#include "silhouette.h"

namespace brandimg::core {

namespace {

constexpr double k_logo_share_logo = 0.8;
constexpr double k_logo_share_title = 0.4;
constexpr double k_logo_share_default = 0.3;
constexpr double k_logo_margin = 0.05;
constexpr double k_text_share_title = 0.15;
constexpr double k_text_share_post = 0.12;
constexpr double k_text_share_default = 0.08;
constexpr double k_text_anchor_title = 0.6;

constexpr std::array<BannerSpec, 6> k_banner_specs = {{
    {BannerType::Logo, "logo", 268, 268, 400, 400, ImageFormat::Png,
     "Logo image for company page"},
    {BannerType::Title, "title", 4200, 700, 4200, 700, ImageFormat::Jpeg,
     "Title image for company page"},
    {BannerType::CultureMain, "culture-main", 1128, 376, 1128, 376, ImageFormat::Jpeg,
     "Company culture main image"},
    {BannerType::CultureModule, "culture-module", 502, 282, 502, 282, ImageFormat::Jpeg,
     "Company culture custom module image"},
    {BannerType::Photo, "photo", 264, 176, 900, 600, ImageFormat::Jpeg,
     "Company photo"},
    {BannerType::Post, "post", 200, 105, 1200, 627, ImageFormat::Jpeg,
     "Custom post image (1.91:1 ratio)"},
}};

int floor_share(double share, int length) {
    return static_cast<int>(std::floor(share * length));
}

bool build_silhouette_layer(const RasterImage& subject, const BrandConfig& config,
                            const std::string& background, int canvas_size,
                            Layer& layer, SilhouettePlan& plan, std::string& shadow_name,
                            Error& error) {
    ShadowChoice shadow;
    if (!select_shadow_color(config.palette, config.shadows, background, shadow, error)) {
        return false;
    }
    if (!plan_silhouette(config.placement, canvas_size, plan, error)) {
        return false;
    }
    RasterImage fitted;
    if (!resize_image(subject, plan.silhouette_size, plan.silhouette_size, FitMode::Cover,
                      fitted, error)) {
        return false;
    }
    RasterImage visible;
    if (!crop_raster(recolor_silhouette(fitted, shadow.rgb), plan.crop, visible, error)) {
        return false;
    }
    layer.image = std::move(visible);
    layer.left = plan.dest_x;
    layer.top = plan.dest_y;
    layer.label = "silhouette";
    shadow_name = shadow.name;
    return true;
}

} // namespace

bool run_composition(CompositionRequest request, const BrandConfig& config,
                     CompositionResult& out, Error& error) {
    Rgb background;
    if (!config.palette.resolve(request.background, background, error)) {
        return false;
    }
    RasterImage canvas;
    if (!build_canvas(request.width, request.height, background, canvas, error)) {
        return false;
    }
    RasterImage composed = composite(canvas, request.layers);

    EncodedOutput encoded;
    if (!encode_within_budget(composed, request.format, request.byte_budget, config.encoding,
                              encoded, error)) {
        return false;
    }
    out.output = std::move(encoded);
    out.width = request.width;
    out.height = request.height;
    out.background = background;
    return true;
}

bool build_avatar_composition(const AvatarRequest& request, const BrandConfig& config,
                              CompositionRequest& out, std::optional<SilhouettePlan>& plan,
                              std::string& shadow_color, Error& error) {
    if (!validate_dimensions(request.size, request.size, error)) {
        return false;
    }
    Rgb background;
    if (!config.palette.resolve(request.color, background, error)) {
        return false;
    }
    RasterImage portrait;
    if (!decode_image(request.portrait, portrait, error)) {
        return false;
    }

    CompositionRequest composition;
    composition.width = request.size;
    composition.height = request.size;
    composition.background = request.color;
    composition.format = request.format;
    composition.byte_budget = request.byte_budget;

    plan.reset();
    shadow_color.clear();
    if (request.with_shadow) {
        Layer silhouette;
        SilhouettePlan silhouette_plan;
        if (!build_silhouette_layer(portrait, config, request.color, request.size,
                                    silhouette, silhouette_plan, shadow_color, error)) {
            return false;
        }
        plan = silhouette_plan;
        composition.layers.push_back(std::move(silhouette));
    }

    Layer subject;
    if (!resize_image(portrait, request.size, request.size, FitMode::Cover, subject.image, error)) {
        return false;
    }
    if (request.grayscale) {
        convert_to_grayscale(subject.image);
    }
    subject.label = "subject";
    composition.layers.push_back(std::move(subject));

    out = std::move(composition);
    return true;
}

bool compose_avatar(const AvatarRequest& request, const BrandConfig& config,
                    CompositionResult& out, Error& error) {
    CompositionRequest composition;
    std::optional<SilhouettePlan> plan;
    std::string shadow_color;
    if (!build_avatar_composition(request, config, composition, plan, shadow_color, error)) {
        return false;
    }
    CompositionResult result;
    if (!run_composition(std::move(composition), config, result, error)) {
        return false;
    }
    result.silhouette = std::move(plan);
    result.shadow_color = std::move(shadow_color);
    out = std::move(result);
    return true;
}

const std::array<BannerSpec, 6>& banner_specs() {
    return k_banner_specs;
}

const BannerSpec* find_banner_spec(const std::string& name) {
    const std::string lower = to_lower_copy(trim_copy(name));
    for (const BannerSpec& spec : k_banner_specs) {
        if (lower == spec.name) {
            return &spec;
        }
    }
    return nullptr;
}

const BannerSpec& banner_spec(BannerType type) {
    for (const BannerSpec& spec : k_banner_specs) {
        if (spec.type == type) {
            return spec;
        }
    }
    return k_banner_specs.back();
}

LogoPlacement logo_placement(BannerType type, int width, int height) {
    LogoPlacement placement;
    switch (type) {
        case BannerType::Logo:
            placement.size = floor_share(k_logo_share_logo, std::min(width, height));
            placement.x = floor_div(width - placement.size, 2);
            placement.y = floor_div(height - placement.size, 2);
            break;
        case BannerType::Title:
            placement.size = floor_share(k_logo_share_title, height);
            placement.x = floor_share(k_logo_margin, width);
            placement.y = floor_div(height - placement.size, 2);
            break;
        default:
            placement.size = floor_share(k_logo_share_default, std::min(width, height));
            placement.x = floor_share(k_logo_margin, width);
            placement.y = floor_share(k_logo_margin, height);
            break;
    }
    placement.size = std::max(1, placement.size);
    return placement;
}

TextStyle banner_text_style(BannerType type, int width, int height) {
    TextStyle style;
    style.anchor_x = width / 2.0;
    style.anchor_y = height / 2.0;
    switch (type) {
        case BannerType::Title:
            style.pixel_height = static_cast<float>(floor_share(k_text_share_title, height));
            style.anchor_x = width * k_text_anchor_title;
            break;
        case BannerType::Post:
            style.pixel_height = static_cast<float>(floor_share(k_text_share_post, height));
            break;
        default:
            style.pixel_height = static_cast<float>(floor_share(k_text_share_default,
                                                                std::min(width, height)));
            break;
    }
    style.pixel_height = std::max(1.0f, style.pixel_height);
    return style;
}

bool compose_banner(const BannerRequest& request, const BrandConfig& config,
                    CompositionResult& out, Error& error) {
    const BannerSpec& spec = banner_spec(request.type);
    CompositionRequest composition;
    composition.width = request.use_recommended ? spec.recommended_width : spec.min_width;
    composition.height = request.use_recommended ? spec.recommended_height : spec.min_height;
    composition.background = request.color;
    composition.format = request.format.value_or(spec.default_format);
    composition.byte_budget = request.byte_budget;

    Rgb background;
    if (!config.palette.resolve(request.color, background, error)) {
        return false;
    }

    std::vector<std::string> warnings;
    const std::vector<unsigned char>* logo_bytes = request.logo ? &*request.logo : nullptr;
    std::vector<unsigned char> logo_file;
    bool logo_skipped = false;
    if (logo_bytes == nullptr && !request.logo_path.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(request.logo_path, ec)) {
            warnings.push_back("logo not found: " + request.logo_path.string() + ", skipping logo overlay");
            logo_skipped = true;
        } else {
            if (!read_file_bytes(request.logo_path, logo_file, error)) {
                error.message = "logo: " + error.message;
                return false;
            }
            logo_bytes = &logo_file;
        }
    }

    if (logo_bytes != nullptr) {
        const LogoPlacement placement = logo_placement(request.type, composition.width,
                                                       composition.height);
        Layer logo;
        if (!decode_and_resize(*logo_bytes, placement.size, placement.size, FitMode::Contain,
                               logo.image, error)) {
            error.message = "logo: " + error.message;
            return false;
        }
        logo.left = placement.x;
        logo.top = placement.y;
        logo.label = "logo";
        composition.layers.push_back(std::move(logo));
    } else if (request.type == BannerType::Logo && !logo_skipped) {
        warnings.emplace_back("no logo image given for a logo banner; rendering the background only");
    }

    if (!request.text.empty()) {
        if (request.font == nullptr || !request.font->loaded()) {
            error.set(ErrorCode::FontError, "text overlay requires a TrueType font");
            return false;
        }
        Layer text;
        if (!render_text_layer(*request.font, request.text, composition.width, composition.height,
                               banner_text_style(request.type, composition.width, composition.height),
                               text, error)) {
            return false;
        }
        composition.layers.push_back(std::move(text));
    }

    CompositionResult result;
    if (!run_composition(std::move(composition), config, result, error)) {
        return false;
    }
    result.warnings = std::move(warnings);
    out = std::move(result);
    return true;
}

} // namespace brandimg::core
