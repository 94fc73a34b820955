#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "raster.h"

namespace brandimg::core {

// "#RRGGBB", "RRGGBB" or "#RGB", case-insensitive.
bool parse_hex_color(const std::string& value, Rgb& out);
std::string to_hex_string(const Rgb& rgb);

// Named brand colors. Names are matched case-insensitively and kept in
// insertion order for listings.
class Palette {
public:
    bool add(const std::string& name, const Rgb& rgb, Error& error);
    bool resolve(const std::string& name, Rgb& out, Error& error) const;
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] const std::vector<std::string>& names() const { return order_; }
    [[nodiscard]] size_t size() const { return order_.size(); }
    [[nodiscard]] bool empty() const { return order_.empty(); }

    static Palette brand_defaults();

private:
    std::unordered_map<std::string, Rgb> colors_;
    std::vector<std::string> order_;
};

// Background color name -> ordered shadow color candidates.
class ShadowTable {
public:
    void set(const std::string& background, std::vector<std::string> candidates);
    [[nodiscard]] const std::vector<std::string>* candidates(const std::string& background) const;
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    // Every palette color needs a non-empty candidate list whose names resolve.
    bool validate(const Palette& palette, std::string& error) const;

    static ShadowTable brand_defaults();

private:
    std::unordered_map<std::string, std::vector<std::string>> entries_;
};

} // namespace brandimg::core
