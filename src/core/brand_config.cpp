#include "brand_config.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "cli_parse.h"

#ifndef BRANDIMG_GLOBAL_CONFIG
#define BRANDIMG_GLOBAL_CONFIG "/usr/local/share/brandimg/brandimg.cfg"
#endif

namespace fs = std::filesystem;

namespace brandimg::core {

namespace {

enum class SectionKind { None, Color, Band, Silhouette, Encoding };

struct ColorEntry {
    std::string name;
    std::optional<Rgb> rgb;
    std::vector<std::string> shadows;
    size_t line_number = 0;
};

std::string at_line(size_t line_number) {
    return " at line " + std::to_string(line_number);
}

bool parse_band_max_size(const std::string& value, int& out) {
    const std::string lower = to_lower_copy(value);
    if (lower == "unlimited" || lower == "none" || lower == "max") {
        out = k_unbounded_band_size;
        return true;
    }
    return parse_positive_int(value, out);
}

} // namespace

BrandConfig BrandConfig::brand_defaults() {
    BrandConfig config;
    config.palette = Palette::brand_defaults();
    config.shadows = ShadowTable::brand_defaults();
    config.placement = PlacementRules::brand_defaults();
    return config;
}

bool parse_brand_config(std::istream& input, BrandConfig& out, std::string& error) {
    BrandConfig config = BrandConfig::brand_defaults();
    std::vector<ColorEntry> colors;
    std::vector<OffsetBand> bands;
    std::unordered_set<std::string> seen_colors;
    std::unordered_set<std::string> seen_bands;

    SectionKind section = SectionKind::None;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            std::string header = trimmed.substr(1, trimmed.size() - 2);
            std::istringstream iss(header);
            std::string section_type;
            if (!(iss >> section_type)) {
                error = "empty section header" + at_line(line_number);
                return false;
            }
            section_type = to_lower_copy(section_type);
            std::string name;
            iss >> name;
            std::string extra;
            if (iss >> extra) {
                error = "unexpected token '" + extra + "' in section header" + at_line(line_number);
                return false;
            }

            if (section_type == "color" || section_type == "band") {
                if (name.empty()) {
                    error = "missing " + section_type + " name" + at_line(line_number);
                    return false;
                }
                name = to_lower_copy(name);
                auto& seen = (section_type == "color") ? seen_colors : seen_bands;
                if (!seen.insert(name).second) {
                    error = "duplicate " + section_type + " '" + name + "'" + at_line(line_number);
                    return false;
                }
                if (section_type == "color") {
                    ColorEntry entry;
                    entry.name = name;
                    entry.line_number = line_number;
                    colors.push_back(std::move(entry));
                    section = SectionKind::Color;
                } else {
                    OffsetBand band;
                    band.name = name;
                    bands.push_back(std::move(band));
                    section = SectionKind::Band;
                }
            } else if (section_type == "silhouette" || section_type == "encoding") {
                if (!name.empty()) {
                    error = "section '" + section_type + "' takes no name" + at_line(line_number);
                    return false;
                }
                section = (section_type == "silhouette") ? SectionKind::Silhouette : SectionKind::Encoding;
            } else {
                error = "unsupported section '" + section_type + "'" + at_line(line_number);
                return false;
            }
            continue;
        }

        if (section == SectionKind::None) {
            error = "entry outside of a section" + at_line(line_number);
            return false;
        }

        size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            error = "invalid line '" + trimmed + "'" + at_line(line_number);
            return false;
        }
        std::string key = to_lower_copy(trim_copy(trimmed.substr(0, equals)));
        std::string value = trim_copy(trimmed.substr(equals + 1));
        if (key.empty()) {
            error = "empty key" + at_line(line_number);
            return false;
        }
        if (value.empty()) {
            error = "empty value for key '" + key + "'" + at_line(line_number);
            return false;
        }

        switch (section) {
            case SectionKind::Color: {
                ColorEntry& entry = colors.back();
                if (key == "hex") {
                    Rgb rgb;
                    if (!parse_hex_color(value, rgb)) {
                        error = "invalid hex color '" + value + "'" + at_line(line_number);
                        return false;
                    }
                    entry.rgb = rgb;
                } else if (key == "shadow") {
                    entry.shadows = split_list(value);
                } else {
                    error = "unknown key '" + key + "' in color section" + at_line(line_number);
                    return false;
                }
                break;
            }
            case SectionKind::Band: {
                OffsetBand& band = bands.back();
                if (key == "max_size") {
                    if (!parse_band_max_size(value, band.max_size)) {
                        error = "invalid max_size '" + value + "'" + at_line(line_number);
                        return false;
                    }
                } else if (key == "multiplier") {
                    if (!parse_positive_double(value, band.multiplier)) {
                        error = "invalid multiplier '" + value + "'" + at_line(line_number);
                        return false;
                    }
                } else if (key == "min_offset") {
                    if (!parse_non_negative_int(value, band.min_offset)) {
                        error = "invalid min_offset '" + value + "'" + at_line(line_number);
                        return false;
                    }
                } else {
                    error = "unknown key '" + key + "' in band section" + at_line(line_number);
                    return false;
                }
                break;
            }
            case SectionKind::Silhouette: {
                if (key == "size_multiplier") {
                    if (!parse_positive_double(value, config.placement.silhouette_multiplier)) {
                        error = "invalid size_multiplier '" + value + "'" + at_line(line_number);
                        return false;
                    }
                } else {
                    error = "unknown key '" + key + "' in silhouette section" + at_line(line_number);
                    return false;
                }
                break;
            }
            case SectionKind::Encoding: {
                int* target = nullptr;
                if (key == "jpeg_quality") {
                    target = &config.encoding.jpeg_quality;
                } else if (key == "jpeg_retry_quality") {
                    target = &config.encoding.jpeg_retry_quality;
                } else if (key == "png_compression") {
                    target = &config.encoding.png_compression;
                } else if (key == "png_retry_compression") {
                    target = &config.encoding.png_retry_compression;
                } else {
                    error = "unknown key '" + key + "' in encoding section" + at_line(line_number);
                    return false;
                }
                if (!parse_positive_int(value, *target)) {
                    error = "invalid " + key + " '" + value + "'" + at_line(line_number);
                    return false;
                }
                break;
            }
            case SectionKind::None:
                break;
        }
    }

    if (!colors.empty()) {
        Palette palette;
        ShadowTable shadows;
        for (const ColorEntry& entry : colors) {
            if (!entry.rgb) {
                error = "color '" + entry.name + "' has no hex value" + at_line(entry.line_number);
                return false;
            }
            Error add_error;
            if (!palette.add(entry.name, *entry.rgb, add_error)) {
                error = add_error.message + at_line(entry.line_number);
                return false;
            }
            shadows.set(entry.name, entry.shadows);
        }
        config.palette = std::move(palette);
        config.shadows = std::move(shadows);
    }
    if (!config.shadows.validate(config.palette, error)) {
        return false;
    }

    if (!bands.empty()) {
        config.placement.bands = std::move(bands);
    }
    if (!normalize_placement_rules(config.placement, error)) {
        return false;
    }
    if (!validate_encode_settings(config.encoding, error)) {
        return false;
    }

    out = std::move(config);
    return true;
}

bool load_brand_config_from_file(const fs::path& path, BrandConfig& out, std::string& error) {
    std::ifstream input(path);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    return parse_brand_config(input, out, error);
}

fs::path global_config_path() {
    return fs::path(BRANDIMG_GLOBAL_CONFIG);
}

std::optional<fs::path> resolve_user_config_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return fs::path(home) / k_user_config_relpath;
}

std::vector<fs::path> config_candidates(const std::string& explicit_path, const fs::path& exec_dir) {
    std::vector<fs::path> candidates;
    if (!explicit_path.empty()) {
        candidates.emplace_back(explicit_path);
        return candidates;
    }
    if (std::optional<fs::path> user_config = resolve_user_config_path()) {
        candidates.push_back(*user_config);
    }
    if (!exec_dir.empty()) {
        candidates.push_back(exec_dir / k_config_filename);
    }
    candidates.push_back(global_config_path());
    return candidates;
}

bool load_brand_config(const std::string& explicit_path, const fs::path& exec_dir,
                       BrandConfig& out, fs::path& source, Error& error) {
    source.clear();
    for (const fs::path& candidate : config_candidates(explicit_path, exec_dir)) {
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) {
            if (!explicit_path.empty()) {
                error.set(ErrorCode::InvalidConfig,
                          "config file '" + candidate.string() + "' does not exist");
                return false;
            }
            continue;
        }
        std::string parse_error;
        if (!load_brand_config_from_file(candidate, out, parse_error)) {
            error.set(ErrorCode::InvalidConfig, candidate.string() + ": " + parse_error);
            return false;
        }
        source = candidate;
        return true;
    }
    out = BrandConfig::brand_defaults();
    return true;
}

} // namespace brandimg::core
