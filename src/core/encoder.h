#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "codec.h"
#include "raster.h"

namespace brandimg::core {

constexpr size_t k_default_byte_budget = 3 * 1024 * 1024;

struct EncodeSettings {
    int jpeg_quality = 90;
    int jpeg_retry_quality = 75;
    int png_compression = 8;
    int png_retry_compression = 12;

    [[nodiscard]] int normal_setting(ImageFormat format) const {
        return format == ImageFormat::Jpeg ? jpeg_quality : png_compression;
    }
    [[nodiscard]] int retry_setting(ImageFormat format) const {
        return format == ImageFormat::Jpeg ? jpeg_retry_quality : png_retry_compression;
    }
};

// Retry must be strictly stricter: lower JPEG quality, higher PNG effort.
bool validate_encode_settings(const EncodeSettings& settings, std::string& error);

struct EncodedOutput {
    std::vector<unsigned char> bytes;
    ImageFormat format = ImageFormat::Png;
    int attempts = 0;
    int setting_used = 0;
    size_t first_attempt_size = 0;
    bool over_budget = false;

    [[nodiscard]] size_t size() const { return bytes.size(); }
};

// Encodes at the normal setting; when the result exceeds `byte_budget`,
// encodes exactly once more at the retry setting and keeps that result
// whether or not it fits. `over_budget` reports a miss. Two attempts is the
// whole policy: there is no search for the best setting that fits.
bool encode_within_budget(const RasterImage& image, ImageFormat format, size_t byte_budget,
                          const EncodeSettings& settings, EncodedOutput& out, Error& error);

} // namespace brandimg::core
