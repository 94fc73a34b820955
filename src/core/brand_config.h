#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "encoder.h"
#include "palette.h"
#include "placement.h"
#include "raster.h"

namespace brandimg::core {

constexpr const char* k_config_filename = "brandimg.cfg";
constexpr const char* k_user_config_relpath = ".config/brandimg/brandimg.cfg";

// Read-only after loading; shared by every request of a run.
struct BrandConfig {
    Palette palette;
    ShadowTable shadows;
    PlacementRules placement;
    EncodeSettings encoding;

    static BrandConfig brand_defaults();
};

// Sections: [color NAME], [band NAME], [silhouette], [encoding]. Starts from
// the built-in defaults; any [color] section replaces the whole palette and
// shadow table, any [band] section replaces the whole band table.
bool parse_brand_config(std::istream& input, BrandConfig& out, std::string& error);

bool load_brand_config_from_file(const std::filesystem::path& path, BrandConfig& out,
                                 std::string& error);

std::optional<std::filesystem::path> resolve_user_config_path();

// System-wide file, fixed at build time.
std::filesystem::path global_config_path();

// Explicit path first, otherwise user, executable directory and global
// locations in that order.
std::vector<std::filesystem::path> config_candidates(const std::string& explicit_path,
                                                     const std::filesystem::path& exec_dir);

// Loads the first existing candidate. `source` receives the file used, or
// stays empty when the built-in defaults apply. A missing explicit path or a
// file that fails to parse is an InvalidConfig error.
bool load_brand_config(const std::string& explicit_path, const std::filesystem::path& exec_dir,
                       BrandConfig& out, std::filesystem::path& source, Error& error);

} // namespace brandimg::core
