#include "raster.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace brandimg::core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidDimensions: return "invalid dimensions";
        case ErrorCode::UnknownColor: return "unknown color";
        case ErrorCode::NoShadowColorAvailable: return "no shadow color available";
        case ErrorCode::EmptyVisibleRegion: return "empty visible region";
        case ErrorCode::UnsupportedFormat: return "unsupported format";
        case ErrorCode::CorruptImage: return "corrupt image";
        case ErrorCode::InvalidConfig: return "invalid configuration";
        case ErrorCode::IoError: return "i/o error";
        case ErrorCode::FontError: return "font error";
    }
    return "unknown error";
}

bool is_configuration_defect(ErrorCode code) {
    return code == ErrorCode::NoShadowColorAvailable
        || code == ErrorCode::EmptyVisibleRegion
        || code == ErrorCode::InvalidConfig;
}

bool checked_mul_size_t(size_t a, size_t b, size_t& out) {
    if (a == 0 || b <= std::numeric_limits<size_t>::max() / a) {
        out = a * b;
        return true;
    }
    return false;
}

bool validate_dimensions(int width, int height, Error& error) {
    if (width <= 0 || height <= 0) {
        error.set(ErrorCode::InvalidDimensions,
                  "invalid size " + std::to_string(width) + "x" + std::to_string(height)
                  + ": width and height must be positive integers");
        return false;
    }
    if (width > k_max_image_dimension || height > k_max_image_dimension) {
        error.set(ErrorCode::InvalidDimensions,
                  "invalid size " + std::to_string(width) + "x" + std::to_string(height)
                  + ": exceeds " + std::to_string(k_max_image_dimension) + " pixels per side");
        return false;
    }
    size_t pixels = 0;
    if (!checked_mul_size_t(static_cast<size_t>(width), static_cast<size_t>(height), pixels)
        || pixels > k_max_total_pixels) {
        error.set(ErrorCode::InvalidDimensions,
                  "invalid size " + std::to_string(width) + "x" + std::to_string(height)
                  + ": too many pixels");
        return false;
    }
    return true;
}

RasterImage::RasterImage(int width, int height)
    : width_(std::max(0, width)),
      height_(std::max(0, height)),
      data_(static_cast<size_t>(width_) * static_cast<size_t>(height_) * k_num_channels, 0) {
}

RasterImage::RasterImage(RasterImage&& other) noexcept
    : width_(other.width_), height_(other.height_), data_(std::move(other.data_)) {
    other.width_ = 0;
    other.height_ = 0;
}

RasterImage& RasterImage::operator=(RasterImage&& other) noexcept {
    if (this != &other) {
        width_ = other.width_;
        height_ = other.height_;
        data_ = std::move(other.data_);
        other.width_ = 0;
        other.height_ = 0;
    }
    return *this;
}

size_t RasterImage::offset(int x, int y) const {
    if (!contains(x, y)) {
        throw std::out_of_range("pixel (" + std::to_string(x) + "," + std::to_string(y)
                                + ") outside " + std::to_string(width_) + "x"
                                + std::to_string(height_) + " raster");
    }
    return ((static_cast<size_t>(y) * static_cast<size_t>(width_)) + static_cast<size_t>(x))
           * k_num_channels;
}

Pixel RasterImage::get(int x, int y) const {
    const size_t o = offset(x, y);
    return Pixel{data_[o + k_channel_r], data_[o + k_channel_g],
                 data_[o + k_channel_b], data_[o + k_channel_a]};
}

void RasterImage::set(int x, int y, const Pixel& p) {
    const size_t o = offset(x, y);
    data_[o + k_channel_r] = p.r;
    data_[o + k_channel_g] = p.g;
    data_[o + k_channel_b] = p.b;
    data_[o + k_channel_a] = p.a;
}

const unsigned char* RasterImage::row(int y) const {
    return data_.data() + offset(0, y);
}

unsigned char* RasterImage::row(int y) {
    return data_.data() + offset(0, y);
}

void RasterImage::fill(const Pixel& p) {
    for (size_t o = 0; o < data_.size(); o += k_num_channels) {
        data_[o + k_channel_r] = p.r;
        data_[o + k_channel_g] = p.g;
        data_[o + k_channel_b] = p.b;
        data_[o + k_channel_a] = p.a;
    }
}

bool RasterImage::from_rgba(int width, int height, std::vector<unsigned char> bytes,
                            RasterImage& out, Error& error) {
    if (!validate_dimensions(width, height, error)) {
        return false;
    }
    const size_t expected = static_cast<size_t>(width) * static_cast<size_t>(height) * k_num_channels;
    if (bytes.size() != expected) {
        error.set(ErrorCode::CorruptImage,
                  "pixel buffer holds " + std::to_string(bytes.size()) + " bytes, expected "
                  + std::to_string(expected));
        return false;
    }
    RasterImage image;
    image.width_ = width;
    image.height_ = height;
    image.data_ = std::move(bytes);
    out = std::move(image);
    return true;
}

} // namespace brandimg::core
