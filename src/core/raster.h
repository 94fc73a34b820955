#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace brandimg::core {

constexpr int k_num_channels = 4;
constexpr int k_channel_r = 0;
constexpr int k_channel_g = 1;
constexpr int k_channel_b = 2;
constexpr int k_channel_a = 3;
constexpr int k_max_channel_value = 255;
constexpr int k_max_image_dimension = 32768;
constexpr size_t k_max_total_pixels = 100000000;

enum class ErrorCode {
    None,
    InvalidDimensions,
    UnknownColor,
    NoShadowColorAvailable,
    EmptyVisibleRegion,
    UnsupportedFormat,
    CorruptImage,
    InvalidConfig,
    IoError,
    FontError,
};

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;

    void set(ErrorCode c, std::string text) {
        code = c;
        message = std::move(text);
    }
};

const char* error_code_name(ErrorCode code);

// Table defects: a correctly populated configuration never produces these.
bool is_configuration_defect(ErrorCode code);

struct Rgb {
    unsigned char r = 0;
    unsigned char g = 0;
    unsigned char b = 0;

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Rgb& other) const {
        return !(*this == other);
    }
};

struct Pixel {
    unsigned char r = 0;
    unsigned char g = 0;
    unsigned char b = 0;
    unsigned char a = 0;

    bool operator==(const Pixel& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Pixel& other) const {
        return !(*this == other);
    }

    [[nodiscard]] Rgb rgb() const { return Rgb{r, g, b}; }
};

bool checked_mul_size_t(size_t a, size_t b, size_t& out);

// Validates a raster size against the dimension and pixel-count caps.
bool validate_dimensions(int width, int height, Error& error);

// RGBA8 raster, row-major, top-left origin. The buffer always holds
// width * height * 4 bytes.
class RasterImage {
public:
    RasterImage() = default;
    // Zero-filled (fully transparent). Caller validates the dimensions.
    RasterImage(int width, int height);

    RasterImage(const RasterImage&) = default;
    RasterImage& operator=(const RasterImage&) = default;
    RasterImage(RasterImage&& other) noexcept;
    RasterImage& operator=(RasterImage&& other) noexcept;

    [[nodiscard]] int width() const { return width_; }
    [[nodiscard]] int height() const { return height_; }
    [[nodiscard]] bool empty() const { return width_ == 0 || height_ == 0; }
    [[nodiscard]] size_t pixel_count() const {
        return static_cast<size_t>(width_) * static_cast<size_t>(height_);
    }

    [[nodiscard]] bool contains(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    // Throws std::out_of_range outside the raster.
    [[nodiscard]] Pixel get(int x, int y) const;
    void set(int x, int y, const Pixel& p);

    // Pointer to the first byte of row y. Throws std::out_of_range for a bad row.
    [[nodiscard]] const unsigned char* row(int y) const;
    unsigned char* row(int y);
    [[nodiscard]] size_t row_bytes() const {
        return static_cast<size_t>(width_) * k_num_channels;
    }

    void fill(const Pixel& p);

    [[nodiscard]] const std::vector<unsigned char>& data() const { return data_; }
    std::vector<unsigned char>& data() { return data_; }

    // Takes ownership of a raw RGBA buffer. Fails when the size does not match.
    static bool from_rgba(int width, int height, std::vector<unsigned char> bytes,
                          RasterImage& out, Error& error);

private:
    [[nodiscard]] size_t offset(int x, int y) const;

    int width_ = 0;
    int height_ = 0;
    std::vector<unsigned char> data_;
};

} // namespace brandimg::core
