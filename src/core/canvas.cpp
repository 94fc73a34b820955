#include "canvas.h"

#include <utility>

namespace brandimg::core {

bool build_canvas(int width, int height, const Rgb& rgb, RasterImage& out, Error& error) {
    if (!validate_dimensions(width, height, error)) {
        return false;
    }
    RasterImage canvas(width, height);
    canvas.fill(Pixel{rgb.r, rgb.g, rgb.b, static_cast<unsigned char>(k_max_channel_value)});
    out = std::move(canvas);
    return true;
}

} // namespace brandimg::core
