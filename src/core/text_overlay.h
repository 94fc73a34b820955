#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "compositor.h"
#include "raster.h"

namespace brandimg::core {

struct TextStyle;

// TrueType face backed by stb_truetype. Holds its own copy of the font file.
class FontFace {
public:
    FontFace();
    ~FontFace();
    FontFace(FontFace&&) noexcept;
    FontFace& operator=(FontFace&&) noexcept;
    FontFace(const FontFace&) = delete;
    FontFace& operator=(const FontFace&) = delete;

    bool load(const std::filesystem::path& path, Error& error);
    bool load_from_memory(std::vector<unsigned char> bytes, Error& error);
    [[nodiscard]] bool loaded() const;

    // Advance width of `text` (UTF-8) at the given pixel height, kerning included.
    [[nodiscard]] float measure(const std::string& text, float pixel_height) const;

    struct Impl;

private:
    friend bool render_text_layer(const FontFace& font, const std::string& text,
                                  int canvas_w, int canvas_h, const TextStyle& style,
                                  Layer& out, Error& error);

    std::unique_ptr<Impl> impl_;
};

struct TextStyle {
    float pixel_height = 32.0f;
    // Horizontal center and vertical middle of the line, in canvas pixels.
    double anchor_x = 0.0;
    double anchor_y = 0.0;
    Rgb color{255, 255, 255};
};

std::vector<char32_t> decode_utf8(const std::string& text);

// Full-canvas layer at (0, 0): `style.color` everywhere, glyph coverage as alpha.
bool render_text_layer(const FontFace& font, const std::string& text,
                       int canvas_w, int canvas_h, const TextStyle& style,
                       Layer& out, Error& error);

} // namespace brandimg::core
