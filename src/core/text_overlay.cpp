#include "text_overlay.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "codec.h"

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

namespace brandimg::core {

namespace {

constexpr char32_t k_replacement_char = 0xFFFD;
constexpr char32_t k_max_code_point = 0x10FFFF;

} // namespace

struct FontFace::Impl {
    std::vector<unsigned char> data;
    stbtt_fontinfo info{};
};

FontFace::FontFace() = default;
FontFace::~FontFace() = default;
FontFace::FontFace(FontFace&&) noexcept = default;
FontFace& FontFace::operator=(FontFace&&) noexcept = default;

bool FontFace::load(const std::filesystem::path& path, Error& error) {
    std::vector<unsigned char> bytes;
    if (!read_file_bytes(path, bytes, error)) {
        error.code = ErrorCode::FontError;
        return false;
    }
    if (!load_from_memory(std::move(bytes), error)) {
        error.message = path.string() + ": " + error.message;
        return false;
    }
    return true;
}

bool FontFace::load_from_memory(std::vector<unsigned char> bytes, Error& error) {
    auto impl = std::make_unique<Impl>();
    impl->data = std::move(bytes);
    if (impl->data.empty()) {
        error.set(ErrorCode::FontError, "empty font data");
        return false;
    }
    // stb_truetype keeps pointers into `data`; the vector is not touched again.
    const int offset = stbtt_GetFontOffsetForIndex(impl->data.data(), 0);
    if (offset < 0 || stbtt_InitFont(&impl->info, impl->data.data(), offset) == 0) {
        error.set(ErrorCode::FontError, "not a TrueType font");
        return false;
    }
    impl_ = std::move(impl);
    return true;
}

bool FontFace::loaded() const {
    return impl_ != nullptr;
}

float FontFace::measure(const std::string& text, float pixel_height) const {
    if (!impl_) {
        return 0.0f;
    }
    const float scale = stbtt_ScaleForPixelHeight(&impl_->info, pixel_height);
    const std::vector<char32_t> code_points = decode_utf8(text);
    float width = 0.0f;
    for (size_t i = 0; i < code_points.size(); ++i) {
        int advance = 0;
        int lsb = 0;
        const int cp = static_cast<int>(code_points[i]);
        stbtt_GetCodepointHMetrics(&impl_->info, cp, &advance, &lsb);
        width += static_cast<float>(advance) * scale;
        if (i + 1 < code_points.size()) {
            width += scale * static_cast<float>(stbtt_GetCodepointKernAdvance(
                                 &impl_->info, cp, static_cast<int>(code_points[i + 1])));
        }
    }
    return width;
}

std::vector<char32_t> decode_utf8(const std::string& text) {
    std::vector<char32_t> out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        size_t extra = 0;
        char32_t min_value = 0;
        if (lead < 0x80) {
            out.push_back(lead);
            ++i;
            continue;
        }
        if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
            min_value = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
            min_value = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
            min_value = 0x10000;
        } else {
            out.push_back(k_replacement_char);
            ++i;
            continue;
        }
        if (i + extra >= text.size()) {
            out.push_back(k_replacement_char);
            ++i;
            continue;
        }
        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (!valid || cp < min_value || cp > k_max_code_point || (cp >= 0xD800 && cp <= 0xDFFF)) {
            out.push_back(k_replacement_char);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

bool render_text_layer(const FontFace& font, const std::string& text,
                       int canvas_w, int canvas_h, const TextStyle& style,
                       Layer& out, Error& error) {
    if (!validate_dimensions(canvas_w, canvas_h, error)) {
        return false;
    }
    if (!font.impl_) {
        error.set(ErrorCode::FontError, "no font loaded for text overlay");
        return false;
    }
    if (!(style.pixel_height > 0.0f)) {
        error.set(ErrorCode::FontError, "font size must be positive");
        return false;
    }

    const stbtt_fontinfo& info = font.impl_->info;
    const float scale = stbtt_ScaleForPixelHeight(&info, style.pixel_height);
    int ascent = 0;
    int descent = 0;
    int line_gap = 0;
    stbtt_GetFontVMetrics(&info, &ascent, &descent, &line_gap);

    const std::vector<char32_t> code_points = decode_utf8(text);
    const double text_width = font.measure(text, style.pixel_height);
    double pen_x = style.anchor_x - text_width / 2.0;
    // descent is negative; this centers the ascent..descent span on anchor_y.
    const long baseline = std::lround(style.anchor_y + (ascent + descent) * scale / 2.0);

    std::vector<unsigned char> coverage(static_cast<size_t>(canvas_w) * static_cast<size_t>(canvas_h), 0);
    std::vector<unsigned char> glyph;
    for (size_t i = 0; i < code_points.size(); ++i) {
        const int cp = static_cast<int>(code_points[i]);
        int advance = 0;
        int lsb = 0;
        stbtt_GetCodepointHMetrics(&info, cp, &advance, &lsb);

        int x0 = 0;
        int y0 = 0;
        int x1 = 0;
        int y1 = 0;
        stbtt_GetCodepointBitmapBox(&info, cp, scale, scale, &x0, &y0, &x1, &y1);
        const int gw = x1 - x0;
        const int gh = y1 - y0;
        if (gw > 0 && gh > 0) {
            glyph.assign(static_cast<size_t>(gw) * static_cast<size_t>(gh), 0);
            stbtt_MakeCodepointBitmap(&info, glyph.data(), gw, gh, gw, scale, scale, cp);
            const long origin_x = std::lround(pen_x) + x0;
            const long origin_y = baseline + y0;
            for (int gy = 0; gy < gh; ++gy) {
                const long cy = origin_y + gy;
                if (cy < 0 || cy >= canvas_h) {
                    continue;
                }
                for (int gx = 0; gx < gw; ++gx) {
                    const long cx = origin_x + gx;
                    if (cx < 0 || cx >= canvas_w) {
                        continue;
                    }
                    unsigned char& dst = coverage[static_cast<size_t>(cy) * static_cast<size_t>(canvas_w)
                                                  + static_cast<size_t>(cx)];
                    dst = std::max(dst, glyph[static_cast<size_t>(gy) * static_cast<size_t>(gw)
                                              + static_cast<size_t>(gx)]);
                }
            }
        }

        pen_x += static_cast<double>(advance) * scale;
        if (i + 1 < code_points.size()) {
            pen_x += scale * static_cast<double>(stbtt_GetCodepointKernAdvance(
                                 &info, cp, static_cast<int>(code_points[i + 1])));
        }
    }

    RasterImage image(canvas_w, canvas_h);
    for (int y = 0; y < canvas_h; ++y) {
        for (int x = 0; x < canvas_w; ++x) {
            const unsigned char a = coverage[static_cast<size_t>(y) * static_cast<size_t>(canvas_w)
                                             + static_cast<size_t>(x)];
            image.set(x, y, Pixel{style.color.r, style.color.g, style.color.b, a});
        }
    }

    Layer layer;
    layer.image = std::move(image);
    layer.left = 0;
    layer.top = 0;
    layer.label = "text";
    out = std::move(layer);
    return true;
}

} // namespace brandimg::core
