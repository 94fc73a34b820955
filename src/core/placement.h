#pragma once

#include <limits>
#include <string>
#include <vector>

#include "raster.h"

namespace brandimg::core {

constexpr int k_unbounded_band_size = std::numeric_limits<int>::max();

// One row of the size-tiered offset table. A canvas of size C belongs to
// the first band (ascending max_size) with C <= max_size.
struct OffsetBand {
    std::string name;
    int max_size = k_unbounded_band_size;
    double multiplier = 0.0;
    int min_offset = 0;
};

struct PlacementRules {
    std::vector<OffsetBand> bands;
    double silhouette_multiplier = 1.2;

    static PlacementRules brand_defaults();
};

// Sorts bands by max_size and rejects empty tables, duplicate bounds and
// non-finite or negative parameters.
bool normalize_placement_rules(PlacementRules& rules, std::string& error);

// Floor division; (-51) / 2 == -26.
int floor_div(int numerator, int denominator);

// Requires a non-empty, sorted band table. Sizes beyond the last bound fall
// into the last band.
const OffsetBand& select_offset_band(const std::vector<OffsetBand>& bands, int canvas_size);

// max(min_offset, round(canvas_size * multiplier))
int compute_offset(const OffsetBand& band, int canvas_size);

// floor(canvas_size * multiplier), at least 1.
int compute_silhouette_size(double multiplier, int canvas_size);

// Half-open source rectangle [left, right) x [top, bottom).
struct CropRect {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    [[nodiscard]] int width() const { return right - left; }
    [[nodiscard]] int height() const { return bottom - top; }
};

// Visible part of a layer_w x layer_h layer placed at (placed_x, placed_y)
// on a canvas_w x canvas_h canvas. Fails with EmptyVisibleRegion when
// nothing of the layer lands on the canvas.
bool compute_visible_region(int canvas_w, int canvas_h,
                            int layer_w, int layer_h,
                            int placed_x, int placed_y,
                            CropRect& out, Error& error);

struct SilhouettePlan {
    int canvas_size = 0;
    int silhouette_size = 0;
    std::string band;
    int offset = 0;
    int center = 0;
    int placed_x = 0;
    int placed_y = 0;
    CropRect crop;
    int dest_x = 0;
    int dest_y = 0;
};

bool plan_silhouette(const PlacementRules& rules, int canvas_size,
                     SilhouettePlan& out, Error& error);

bool crop_raster(const RasterImage& source, const CropRect& rect,
                 RasterImage& out, Error& error);

} // namespace brandimg::core
