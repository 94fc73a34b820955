#include "silhouette.h"

#include <vector>

namespace brandimg::core {

namespace {

constexpr int k_luma_weight_r = 299;
constexpr int k_luma_weight_g = 587;
constexpr int k_luma_weight_b = 114;
constexpr int k_luma_weight_total = 1000;

} // namespace

RasterImage recolor_silhouette(const RasterImage& subject, const Rgb& color) {
    RasterImage out(subject.width(), subject.height());
    for (int y = 0; y < subject.height(); ++y) {
        for (int x = 0; x < subject.width(); ++x) {
            const Pixel src = subject.get(x, y);
            out.set(x, y, Pixel{color.r, color.g, color.b, src.a});
        }
    }
    return out;
}

void convert_to_grayscale(RasterImage& image) {
    for (int y = 0; y < image.height(); ++y) {
        for (int x = 0; x < image.width(); ++x) {
            Pixel p = image.get(x, y);
            const int luma = (k_luma_weight_r * p.r + k_luma_weight_g * p.g + k_luma_weight_b * p.b
                              + k_luma_weight_total / 2) / k_luma_weight_total;
            const auto value = static_cast<unsigned char>(luma);
            p.r = value;
            p.g = value;
            p.b = value;
            image.set(x, y, p);
        }
    }
}

bool select_shadow_color(const Palette& palette,
                         const ShadowTable& shadows,
                         const std::string& background,
                         ShadowChoice& out,
                         Error& error) {
    const std::vector<std::string>* candidates = shadows.candidates(background);
    if (candidates == nullptr || candidates->empty()) {
        error.set(ErrorCode::NoShadowColorAvailable,
                  "no shadow color configured for background '" + background + "'");
        return false;
    }
    const std::string& name = candidates->front();
    Rgb rgb;
    if (!palette.resolve(name, rgb, error)) {
        error.set(ErrorCode::NoShadowColorAvailable,
                  "shadow color '" + name + "' for background '" + background
                  + "' is not in the palette");
        return false;
    }
    out.name = name;
    out.rgb = rgb;
    return true;
}

} // namespace brandimg::core
