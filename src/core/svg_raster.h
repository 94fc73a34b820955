#pragma once

#include <vector>

#include "codec.h"
#include "raster.h"

namespace brandimg::core {

// True when the bytes start (after an optional BOM, whitespace, XML
// declaration or comments) with an <svg> root element.
bool is_svg_document(const std::vector<unsigned char>& bytes);

// Renders the document into a target_w x target_h RGBA raster with a
// transparent background. Contain keeps the whole drawing centered in the
// box; Cover scales it to fill the box and clips the overflow.
// UnsupportedFormat for non-SVG input, CorruptImage when librsvg rejects it.
bool rasterize_svg(const std::vector<unsigned char>& bytes, int target_w, int target_h, FitMode fit,
                   RasterImage& out, Error& error);

} // namespace brandimg::core
