#include "palette.h"

#include <cctype>
#include <cstdio>
#include <utility>

#include "cli_parse.h"

namespace brandimg::core {

namespace {

constexpr int k_hex_short_len = 3;
constexpr int k_hex_long_len = 6;
constexpr int k_hex_base = 16;

int hex_digit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f') {
        return 10 + (lower - 'a');
    }
    return -1;
}

} // namespace

bool parse_hex_color(const std::string& value, Rgb& out) {
    std::string hex = trim_copy(value);
    if (!hex.empty() && hex.front() == '#') {
        hex.erase(0, 1);
    }
    if (hex.size() != k_hex_short_len && hex.size() != k_hex_long_len) {
        return false;
    }
    int digits[k_hex_long_len] = {0, 0, 0, 0, 0, 0};
    for (size_t i = 0; i < hex.size(); ++i) {
        digits[i] = hex_digit(hex[i]);
        if (digits[i] < 0) {
            return false;
        }
    }
    if (hex.size() == k_hex_short_len) {
        out.r = static_cast<unsigned char>((digits[0] << 4) | digits[0]);
        out.g = static_cast<unsigned char>((digits[1] << 4) | digits[1]);
        out.b = static_cast<unsigned char>((digits[2] << 4) | digits[2]);
        return true;
    }
    out.r = static_cast<unsigned char>(digits[0] * k_hex_base + digits[1]);
    out.g = static_cast<unsigned char>(digits[2] * k_hex_base + digits[3]);
    out.b = static_cast<unsigned char>(digits[4] * k_hex_base + digits[5]);
    return true;
}

std::string to_hex_string(const Rgb& rgb) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X", rgb.r, rgb.g, rgb.b);
    return buffer;
}

bool Palette::add(const std::string& name, const Rgb& rgb, Error& error) {
    std::string key = to_lower_copy(trim_copy(name));
    if (key.empty()) {
        error.set(ErrorCode::InvalidConfig, "color name must not be empty");
        return false;
    }
    if (colors_.find(key) != colors_.end()) {
        error.set(ErrorCode::InvalidConfig, "duplicate color '" + key + "'");
        return false;
    }
    colors_.emplace(key, rgb);
    order_.push_back(std::move(key));
    return true;
}

bool Palette::resolve(const std::string& name, Rgb& out, Error& error) const {
    auto it = colors_.find(to_lower_copy(trim_copy(name)));
    if (it == colors_.end()) {
        std::string known;
        for (const std::string& n : order_) {
            known += known.empty() ? n : ", " + n;
        }
        error.set(ErrorCode::UnknownColor,
                  "unknown color '" + name + "' (expected one of: " + known + ")");
        return false;
    }
    out = it->second;
    return true;
}

bool Palette::contains(const std::string& name) const {
    return colors_.find(to_lower_copy(trim_copy(name))) != colors_.end();
}

Palette Palette::brand_defaults() {
    Palette palette;
    const std::pair<const char*, Rgb> defaults[] = {
        {"aqua", Rgb{0x00, 0xFF, 0xDC}},
        {"navy", Rgb{0x1E, 0x2A, 0x45}},
        {"fuchsia", Rgb{0xFF, 0x00, 0x8F}},
    };
    for (const auto& [name, rgb] : defaults) {
        palette.colors_.emplace(name, rgb);
        palette.order_.emplace_back(name);
    }
    return palette;
}

void ShadowTable::set(const std::string& background, std::vector<std::string> candidates) {
    for (std::string& c : candidates) {
        c = to_lower_copy(trim_copy(c));
    }
    entries_[to_lower_copy(trim_copy(background))] = std::move(candidates);
}

const std::vector<std::string>* ShadowTable::candidates(const std::string& background) const {
    auto it = entries_.find(to_lower_copy(trim_copy(background)));
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool ShadowTable::validate(const Palette& palette, std::string& error) const {
    for (const std::string& name : palette.names()) {
        const std::vector<std::string>* list = candidates(name);
        if (list == nullptr || list->empty()) {
            error = "color '" + name + "' has no shadow colors";
            return false;
        }
        for (const std::string& candidate : *list) {
            if (!palette.contains(candidate)) {
                error = "shadow color '" + candidate + "' for '" + name + "' is not in the palette";
                return false;
            }
        }
    }
    return true;
}

ShadowTable ShadowTable::brand_defaults() {
    ShadowTable table;
    table.set("aqua", {"navy", "fuchsia"});
    table.set("navy", {"aqua", "fuchsia"});
    table.set("fuchsia", {"navy", "aqua"});
    return table;
}

} // namespace brandimg::core
