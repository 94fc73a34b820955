#include "svg_raster.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <cairo.h>
#include <glib.h>
#include <librsvg/rsvg.h>

namespace brandimg::core {

namespace {

constexpr size_t k_sniff_limit = 4096;
constexpr double k_svg_dpi = 96.0;

struct HandleDeleter {
    void operator()(RsvgHandle* handle) const { g_object_unref(handle); }
};
struct SurfaceDeleter {
    void operator()(cairo_surface_t* surface) const { cairo_surface_destroy(surface); }
};
struct ContextDeleter {
    void operator()(cairo_t* cr) const { cairo_destroy(cr); }
};

using HandlePtr = std::unique_ptr<RsvgHandle, HandleDeleter>;
using SurfacePtr = std::unique_ptr<cairo_surface_t, SurfaceDeleter>;
using ContextPtr = std::unique_ptr<cairo_t, ContextDeleter>;

std::string take_message(GError* gerror, const char* fallback) {
    if (gerror == nullptr) {
        return fallback;
    }
    std::string message = gerror->message != nullptr ? gerror->message : fallback;
    g_error_free(gerror);
    return message;
}

bool skip_past(std::string_view& text, std::string_view terminator) {
    const size_t pos = text.find(terminator);
    if (pos == std::string_view::npos) {
        return false;
    }
    text.remove_prefix(pos + terminator.size());
    return true;
}

void skip_space(std::string_view& text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\r'
                             || text.front() == '\n')) {
        text.remove_prefix(1);
    }
}

// Cairo ARGB32 is premultiplied, one native-endian uint32 per pixel.
void unpremultiply_into(const unsigned char* data, int stride, RasterImage& out) {
    for (int y = 0; y < out.height(); ++y) {
        const unsigned char* src_row = data + static_cast<size_t>(y) * static_cast<size_t>(stride);
        unsigned char* dst_row = out.row(y);
        for (int x = 0; x < out.width(); ++x) {
            uint32_t argb = 0;
            std::memcpy(&argb, src_row + static_cast<size_t>(x) * 4, sizeof(argb));
            unsigned char* d = dst_row + static_cast<size_t>(x) * k_num_channels;
            const uint32_t a = argb >> 24;
            if (a == 0) {
                continue;
            }
            const auto unpremultiply = [a](uint32_t c) {
                return static_cast<unsigned char>(std::min<uint32_t>(k_max_channel_value,
                                                                     (c * k_max_channel_value + a / 2) / a));
            };
            d[k_channel_r] = unpremultiply((argb >> 16) & 0xFF);
            d[k_channel_g] = unpremultiply((argb >> 8) & 0xFF);
            d[k_channel_b] = unpremultiply(argb & 0xFF);
            d[k_channel_a] = static_cast<unsigned char>(a);
        }
    }
}

} // namespace

bool is_svg_document(const std::vector<unsigned char>& bytes) {
    std::string_view text(reinterpret_cast<const char*>(bytes.data()), std::min(bytes.size(), k_sniff_limit));
    if (text.starts_with("\xEF\xBB\xBF")) {
        text.remove_prefix(3);
    }
    while (true) {
        skip_space(text);
        if (text.starts_with("<?")) {
            if (!skip_past(text, "?>")) {
                return false;
            }
        } else if (text.starts_with("<!--")) {
            if (!skip_past(text, "-->")) {
                return false;
            }
        } else if (text.starts_with("<!DOCTYPE") || text.starts_with("<!doctype")) {
            if (!skip_past(text, ">")) {
                return false;
            }
        } else {
            break;
        }
    }
    if (!text.starts_with("<svg") || text.size() < 5) {
        return false;
    }
    const char next = text[4];
    return next == ' ' || next == '\t' || next == '\r' || next == '\n' || next == '>' || next == '/';
}

bool rasterize_svg(const std::vector<unsigned char>& bytes, int target_w, int target_h, FitMode fit,
                   RasterImage& out, Error& error) {
    if (!is_svg_document(bytes)) {
        error.set(ErrorCode::UnsupportedFormat, "not an SVG document");
        return false;
    }
    if (!validate_dimensions(target_w, target_h, error)) {
        return false;
    }

    GError* gerror = nullptr;
    HandlePtr handle(rsvg_handle_new_from_data(bytes.data(), bytes.size(), &gerror));
    if (!handle) {
        error.set(ErrorCode::CorruptImage, "svg: " + take_message(gerror, "failed to parse document"));
        return false;
    }
    rsvg_handle_set_dpi_x_y(handle.get(), k_svg_dpi, k_svg_dpi);

    SurfacePtr surface(cairo_image_surface_create(CAIRO_FORMAT_ARGB32, target_w, target_h));
    if (cairo_surface_status(surface.get()) != CAIRO_STATUS_SUCCESS) {
        error.set(ErrorCode::InvalidDimensions, "svg: cannot allocate a " + std::to_string(target_w) + "x"
                                                + std::to_string(target_h) + " surface");
        return false;
    }
    ContextPtr cr(cairo_create(surface.get()));

    // The viewport keeps the drawing's aspect ratio and centers it.
    RsvgRectangle viewport{0.0, 0.0, static_cast<double>(target_w), static_cast<double>(target_h)};
    gdouble intrinsic_w = 0.0;
    gdouble intrinsic_h = 0.0;
    if (fit == FitMode::Cover
        && rsvg_handle_get_intrinsic_size_in_pixels(handle.get(), &intrinsic_w, &intrinsic_h)
        && intrinsic_w > 0.0 && intrinsic_h > 0.0) {
        const double scale = std::max(target_w / intrinsic_w, target_h / intrinsic_h);
        viewport.width = intrinsic_w * scale;
        viewport.height = intrinsic_h * scale;
        viewport.x = (target_w - viewport.width) / 2.0;
        viewport.y = (target_h - viewport.height) / 2.0;
    }

    if (!rsvg_handle_render_document(handle.get(), cr.get(), &viewport, &gerror)) {
        error.set(ErrorCode::CorruptImage, "svg: " + take_message(gerror, "failed to render document"));
        return false;
    }
    cairo_surface_flush(surface.get());

    RasterImage raster(target_w, target_h);
    unpremultiply_into(cairo_image_surface_get_data(surface.get()),
                       cairo_image_surface_get_stride(surface.get()), raster);
    out = std::move(raster);
    return true;
}

} // namespace brandimg::core
