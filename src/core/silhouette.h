#pragma once

#include <string>

#include "palette.h"
#include "raster.h"

namespace brandimg::core {

// Flat-color copy of `subject`: RGB replaced by `color`, alpha copied unchanged.
RasterImage recolor_silhouette(const RasterImage& subject, const Rgb& color);

// In-place luma conversion; alpha is left untouched.
void convert_to_grayscale(RasterImage& image);

struct ShadowChoice {
    std::string name;
    Rgb rgb;
};

// First shadow candidate listed for `background`.
bool select_shadow_color(const Palette& palette,
                         const ShadowTable& shadows,
                         const std::string& background,
                         ShadowChoice& out,
                         Error& error);

} // namespace brandimg::core
