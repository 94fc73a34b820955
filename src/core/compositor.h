#pragma once

#include <string>
#include <vector>

#include "raster.h"

namespace brandimg::core {

enum class BlendMode { SourceOver };

struct Layer {
    RasterImage image;
    int left = 0;
    int top = 0;
    BlendMode blend = BlendMode::SourceOver;
    std::string label;
};

// Paints `layer` onto `target` in place. Pixels outside `target` are skipped.
void blend_layer(RasterImage& target, const Layer& layer);

// Copies `canvas` and paints `layers` over it in order, later layers on top.
RasterImage composite(const RasterImage& canvas, const std::vector<Layer>& layers);

} // namespace brandimg::core
