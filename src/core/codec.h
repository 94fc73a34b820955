#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "raster.h"

namespace brandimg::core {

enum class ImageFormat { Png, Jpeg };

enum class FitMode {
    Cover,   // fill the box, crop the overflow symmetrically
    Contain, // fit inside the box, pad with transparent pixels
};

bool parse_image_format(const std::string& value, ImageFormat& out);
const char* image_format_name(ImageFormat format);
const char* image_format_extension(ImageFormat format);

bool read_file_bytes(const std::filesystem::path& path, std::vector<unsigned char>& out, Error& error);
bool write_file_bytes(const std::filesystem::path& path, const std::vector<unsigned char>& bytes,
                      Error& error);

// Any format stb_image understands, expanded to RGBA.
// UnsupportedFormat when the header is not recognized, CorruptImage when
// the header is fine but the pixel data is not.
bool decode_image(const std::vector<unsigned char>& bytes, RasterImage& out, Error& error);

// Area averaging when shrinking, bilinear when enlarging; both on
// premultiplied alpha.
bool resize_image(const RasterImage& source, int target_w, int target_h, FitMode fit,
                  RasterImage& out, Error& error);

// SVG documents are rendered straight at the target size; anything else
// goes through decode_image and resize_image.
bool decode_and_resize(const std::vector<unsigned char>& bytes, int target_w, int target_h,
                       FitMode fit, RasterImage& out, Error& error);

// `setting` is the JPEG quality (1-100) or the PNG zlib effort (>= 1).
bool encode_image(const RasterImage& image, ImageFormat format, int setting,
                  std::vector<unsigned char>& out, Error& error);

} // namespace brandimg::core
