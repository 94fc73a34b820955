#pragma once

#include "raster.h"

namespace brandimg::core {

// Opaque canvas, every pixel (r, g, b, 255).
bool build_canvas(int width, int height, const Rgb& rgb, RasterImage& out, Error& error);

} // namespace brandimg::core
