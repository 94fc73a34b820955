#include "encoder.h"

#include <utility>

namespace brandimg::core {

bool validate_encode_settings(const EncodeSettings& settings, std::string& error) {
    if (settings.jpeg_quality < 1 || settings.jpeg_quality > 100) {
        error = "jpeg_quality must be within 1-100";
        return false;
    }
    if (settings.jpeg_retry_quality < 1 || settings.jpeg_retry_quality >= settings.jpeg_quality) {
        error = "jpeg_retry_quality must be positive and lower than jpeg_quality";
        return false;
    }
    if (settings.png_compression < 1) {
        error = "png_compression must be positive";
        return false;
    }
    if (settings.png_retry_compression <= settings.png_compression) {
        error = "png_retry_compression must be higher than png_compression";
        return false;
    }
    return true;
}

bool encode_within_budget(const RasterImage& image, ImageFormat format, size_t byte_budget,
                          const EncodeSettings& settings, EncodedOutput& out, Error& error) {
    EncodedOutput result;
    result.format = format;
    result.setting_used = settings.normal_setting(format);
    if (!encode_image(image, format, result.setting_used, result.bytes, error)) {
        return false;
    }
    result.attempts = 1;
    result.first_attempt_size = result.bytes.size();

    if (result.bytes.size() > byte_budget) {
        const int retry = settings.retry_setting(format);
        std::vector<unsigned char> retried;
        if (!encode_image(image, format, retry, retried, error)) {
            return false;
        }
        result.bytes = std::move(retried);
        result.setting_used = retry;
        result.attempts = 2;
    }
    result.over_budget = result.bytes.size() > byte_budget;
    out = std::move(result);
    return true;
}

} // namespace brandimg::core
