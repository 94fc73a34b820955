#include "compositor.h"

#include <algorithm>

namespace brandimg::core {

namespace {

// out = src * a / 255 + dst * (255 - a) / 255, rounded.
unsigned char blend_channel(int src, int dst, int alpha) {
    const int inverse = k_max_channel_value - alpha;
    return static_cast<unsigned char>((src * alpha + dst * inverse + k_max_channel_value / 2)
                                      / k_max_channel_value);
}

} // namespace

void blend_layer(RasterImage& target, const Layer& layer) {
    const RasterImage& src = layer.image;
    // Layers may sit anywhere in int range; clip in 64 bits.
    const long long left = layer.left;
    const long long top = layer.top;
    const int x0 = static_cast<int>(std::max(0LL, left));
    const int y0 = static_cast<int>(std::max(0LL, top));
    const int x1 = static_cast<int>(std::min<long long>(target.width(), left + src.width()));
    const int y1 = static_cast<int>(std::min<long long>(target.height(), top + src.height()));
    if (x0 >= x1 || y0 >= y1) {
        return;
    }

    for (int y = y0; y < y1; ++y) {
        const unsigned char* src_row = src.row(y - layer.top);
        unsigned char* dst_row = target.row(y);
        for (int x = x0; x < x1; ++x) {
            const unsigned char* s = src_row + static_cast<size_t>(x - layer.left) * k_num_channels;
            unsigned char* d = dst_row + static_cast<size_t>(x) * k_num_channels;
            const int alpha = s[k_channel_a];
            if (alpha == 0) {
                continue;
            }
            if (alpha == k_max_channel_value) {
                d[k_channel_r] = s[k_channel_r];
                d[k_channel_g] = s[k_channel_g];
                d[k_channel_b] = s[k_channel_b];
                d[k_channel_a] = static_cast<unsigned char>(k_max_channel_value);
                continue;
            }
            d[k_channel_r] = blend_channel(s[k_channel_r], d[k_channel_r], alpha);
            d[k_channel_g] = blend_channel(s[k_channel_g], d[k_channel_g], alpha);
            d[k_channel_b] = blend_channel(s[k_channel_b], d[k_channel_b], alpha);
            // Source-over coverage: a + da * (1 - a). An opaque destination stays opaque.
            const int dst_alpha = d[k_channel_a];
            d[k_channel_a] = static_cast<unsigned char>(
                alpha + (dst_alpha * (k_max_channel_value - alpha) + k_max_channel_value / 2)
                            / k_max_channel_value);
        }
    }
}

RasterImage composite(const RasterImage& canvas, const std::vector<Layer>& layers) {
    RasterImage out = canvas;
    for (const Layer& layer : layers) {
        switch (layer.blend) {
            case BlendMode::SourceOver:
                blend_layer(out, layer);
                break;
        }
    }
    return out;
}

} // namespace brandimg::core
