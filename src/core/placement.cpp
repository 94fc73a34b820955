#include "placement.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <utility>

namespace brandimg::core {

PlacementRules PlacementRules::brand_defaults() {
    PlacementRules rules;
    rules.bands = {
        OffsetBand{"small", 256, 0.02, 4},
        OffsetBand{"medium", 512, 0.03, 8},
        OffsetBand{"large", k_unbounded_band_size, 0.04, 12},
    };
    rules.silhouette_multiplier = 1.2;
    return rules;
}

bool normalize_placement_rules(PlacementRules& rules, std::string& error) {
    if (rules.bands.empty()) {
        error = "no offset bands defined";
        return false;
    }
    if (!std::isfinite(rules.silhouette_multiplier) || rules.silhouette_multiplier <= 1.0) {
        error = "silhouette size multiplier must be greater than 1.0";
        return false;
    }
    for (const OffsetBand& band : rules.bands) {
        if (band.max_size <= 0) {
            error = "band '" + band.name + "' has a non-positive max_size";
            return false;
        }
        if (!std::isfinite(band.multiplier) || band.multiplier < 0.0) {
            error = "band '" + band.name + "' has an invalid multiplier";
            return false;
        }
        if (band.min_offset < 0) {
            error = "band '" + band.name + "' has a negative min_offset";
            return false;
        }
    }
    std::ranges::stable_sort(rules.bands, [](const OffsetBand& lhs, const OffsetBand& rhs) {
        return lhs.max_size < rhs.max_size;
    });
    for (size_t i = 1; i < rules.bands.size(); ++i) {
        if (rules.bands[i].max_size == rules.bands[i - 1].max_size) {
            error = "bands '" + rules.bands[i - 1].name + "' and '" + rules.bands[i].name
                    + "' share the same max_size";
            return false;
        }
    }
    return true;
}

int floor_div(int numerator, int denominator) {
    int quotient = numerator / denominator;
    const int remainder = numerator % denominator;
    if (remainder != 0 && ((remainder < 0) != (denominator < 0))) {
        --quotient;
    }
    return quotient;
}

const OffsetBand& select_offset_band(const std::vector<OffsetBand>& bands, int canvas_size) {
    for (const OffsetBand& band : bands) {
        if (canvas_size <= band.max_size) {
            return band;
        }
    }
    return bands.back();
}

int compute_offset(const OffsetBand& band, int canvas_size) {
    // Saturate before converting; an oversized offset must still push the layer off canvas.
    const double scaled = std::round(static_cast<double>(canvas_size) * band.multiplier);
    if (!(scaled < static_cast<double>(k_unbounded_band_size))) {
        return k_unbounded_band_size;
    }
    return std::max(band.min_offset, static_cast<int>(scaled));
}

int compute_silhouette_size(double multiplier, int canvas_size) {
    const double scaled = std::floor(static_cast<double>(canvas_size) * multiplier);
    if (!(scaled >= 1.0)) {
        return 1;
    }
    if (scaled >= static_cast<double>(k_unbounded_band_size)) {
        return k_unbounded_band_size;
    }
    return static_cast<int>(scaled);
}

bool compute_visible_region(int canvas_w, int canvas_h,
                            int layer_w, int layer_h,
                            int placed_x, int placed_y,
                            CropRect& out, Error& error) {
    const long long left = std::max(0LL, -static_cast<long long>(placed_x));
    const long long top = std::max(0LL, -static_cast<long long>(placed_y));
    const long long right = std::min<long long>(layer_w, static_cast<long long>(canvas_w) - placed_x);
    const long long bottom = std::min<long long>(layer_h, static_cast<long long>(canvas_h) - placed_y);
    if (right <= left || bottom <= top) {
        error.set(ErrorCode::EmptyVisibleRegion,
                  "layer " + std::to_string(layer_w) + "x" + std::to_string(layer_h) + " at ("
                  + std::to_string(placed_x) + "," + std::to_string(placed_y)
                  + ") has no visible pixels on a " + std::to_string(canvas_w) + "x"
                  + std::to_string(canvas_h) + " canvas");
        return false;
    }
    CropRect rect;
    rect.left = static_cast<int>(left);
    rect.top = static_cast<int>(top);
    rect.right = static_cast<int>(right);
    rect.bottom = static_cast<int>(bottom);
    out = rect;
    return true;
}

bool plan_silhouette(const PlacementRules& rules, int canvas_size,
                     SilhouettePlan& out, Error& error) {
    if (!validate_dimensions(canvas_size, canvas_size, error)) {
        return false;
    }
    if (rules.bands.empty()) {
        error.set(ErrorCode::InvalidConfig, "no offset bands defined");
        return false;
    }

    SilhouettePlan plan;
    plan.canvas_size = canvas_size;
    plan.silhouette_size = compute_silhouette_size(rules.silhouette_multiplier, canvas_size);
    const OffsetBand& band = select_offset_band(rules.bands, canvas_size);
    plan.band = band.name;
    plan.offset = compute_offset(band, canvas_size);
    plan.center = floor_div(canvas_size - plan.silhouette_size, 2);
    // A layer at INT_MIN is still entirely off any canvas, so saturating keeps the result.
    const long long placed = std::max<long long>(static_cast<long long>(plan.center) - plan.offset,
                                                 std::numeric_limits<int>::min());
    plan.placed_x = static_cast<int>(placed);
    plan.placed_y = static_cast<int>(placed);

    if (!compute_visible_region(canvas_size, canvas_size,
                                plan.silhouette_size, plan.silhouette_size,
                                plan.placed_x, plan.placed_y, plan.crop, error)) {
        error.message = "silhouette for " + std::to_string(canvas_size) + "px canvas (band '"
                        + plan.band + "'): " + error.message;
        return false;
    }
    plan.dest_x = std::max(0, plan.placed_x);
    plan.dest_y = std::max(0, plan.placed_y);
    out = std::move(plan);
    return true;
}

bool crop_raster(const RasterImage& source, const CropRect& rect,
                 RasterImage& out, Error& error) {
    if (rect.left < 0 || rect.top < 0 || rect.right > source.width() || rect.bottom > source.height()
        || rect.width() <= 0 || rect.height() <= 0) {
        error.set(ErrorCode::EmptyVisibleRegion,
                  "crop [" + std::to_string(rect.left) + "," + std::to_string(rect.right) + ")x["
                  + std::to_string(rect.top) + "," + std::to_string(rect.bottom)
                  + ") does not fit a " + std::to_string(source.width()) + "x"
                  + std::to_string(source.height()) + " raster");
        return false;
    }
    RasterImage cropped(rect.width(), rect.height());
    const size_t row_bytes = cropped.row_bytes();
    const size_t src_offset = static_cast<size_t>(rect.left) * k_num_channels;
    for (int y = 0; y < rect.height(); ++y) {
        std::memcpy(cropped.row(y), source.row(rect.top + y) + src_offset, row_bytes);
    }
    out = std::move(cropped);
    return true;
}

} // namespace brandimg::core
