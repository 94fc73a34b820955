#include "codec.h"

#include <algorithm>
#include <climits>
#include <cmath>
#include <fstream>
#include <iterator>
#include <mutex>
#include <utility>

#include "cli_parse.h"
#include "svg_raster.h"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace fs = std::filesystem;

namespace brandimg::core {

namespace {

constexpr int k_min_jpeg_quality = 1;
constexpr int k_max_jpeg_quality = 100;

// stb_image_write keeps the PNG compression level in a global.
std::mutex g_png_level_mutex;

struct Accumulator {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 0.0;

    void add(const Pixel& p, double weight) {
        const double wa = weight * p.a;
        r += p.r * wa;
        g += p.g * wa;
        b += p.b * wa;
        a += wa;
    }
};

unsigned char clamp_channel(double value) {
    return static_cast<unsigned char>(std::clamp(std::lround(value), 0L,
                                                 static_cast<long>(k_max_channel_value)));
}

// `total_weight` is the full source footprint of the destination pixel, so
// footprints that hang over the source edge come out partially transparent.
Pixel resolve(const Accumulator& acc, double total_weight) {
    if (acc.a <= 0.0 || total_weight <= 0.0) {
        return Pixel{};
    }
    return Pixel{clamp_channel(acc.r / acc.a), clamp_channel(acc.g / acc.a),
                 clamp_channel(acc.b / acc.a), clamp_channel(acc.a / total_weight)};
}

// Destination coordinate = origin + source coordinate * scale.
struct Mapping {
    double scale = 1.0;
    double origin_x = 0.0;
    double origin_y = 0.0;
};

Pixel sample_area(const RasterImage& src, const Mapping& m, int x, int y) {
    const double u0 = (x - m.origin_x) / m.scale;
    const double u1 = (x + 1 - m.origin_x) / m.scale;
    const double v0 = (y - m.origin_y) / m.scale;
    const double v1 = (y + 1 - m.origin_y) / m.scale;
    const double cu0 = std::max(0.0, u0);
    const double cu1 = std::min(static_cast<double>(src.width()), u1);
    const double cv0 = std::max(0.0, v0);
    const double cv1 = std::min(static_cast<double>(src.height()), v1);
    if (cu0 >= cu1 || cv0 >= cv1) {
        return Pixel{};
    }

    Accumulator acc;
    const int iy_begin = static_cast<int>(std::floor(cv0));
    const int iy_end = std::min(src.height(), static_cast<int>(std::ceil(cv1)));
    const int ix_begin = static_cast<int>(std::floor(cu0));
    const int ix_end = std::min(src.width(), static_cast<int>(std::ceil(cu1)));
    for (int iy = iy_begin; iy < iy_end; ++iy) {
        const double wy = std::min(cv1, iy + 1.0) - std::max(cv0, static_cast<double>(iy));
        if (wy <= 0.0) {
            continue;
        }
        for (int ix = ix_begin; ix < ix_end; ++ix) {
            const double wx = std::min(cu1, ix + 1.0) - std::max(cu0, static_cast<double>(ix));
            if (wx <= 0.0) {
                continue;
            }
            acc.add(src.get(ix, iy), wx * wy);
        }
    }
    return resolve(acc, (u1 - u0) * (v1 - v0));
}

Pixel sample_bilinear(const RasterImage& src, const Mapping& m, int x, int y) {
    const double cu = (x + 0.5 - m.origin_x) / m.scale;
    const double cv = (y + 0.5 - m.origin_y) / m.scale;
    if (cu < 0.0 || cv < 0.0 || cu > src.width() || cv > src.height()) {
        return Pixel{};
    }
    const double u = std::clamp(cu - 0.5, 0.0, static_cast<double>(src.width() - 1));
    const double v = std::clamp(cv - 0.5, 0.0, static_cast<double>(src.height() - 1));
    const int x0 = static_cast<int>(std::floor(u));
    const int y0 = static_cast<int>(std::floor(v));
    const int x1 = std::min(x0 + 1, src.width() - 1);
    const int y1 = std::min(y0 + 1, src.height() - 1);
    const double fx = u - x0;
    const double fy = v - y0;

    Accumulator acc;
    acc.add(src.get(x0, y0), (1.0 - fx) * (1.0 - fy));
    acc.add(src.get(x1, y0), fx * (1.0 - fy));
    acc.add(src.get(x0, y1), (1.0 - fx) * fy);
    acc.add(src.get(x1, y1), fx * fy);
    return resolve(acc, 1.0);
}

void write_to_vector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<unsigned char>*>(context);
    const auto* bytes = static_cast<const unsigned char*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // namespace

bool parse_image_format(const std::string& value, ImageFormat& out) {
    const std::string lower = to_lower_copy(trim_copy(value));
    if (lower == "png") {
        out = ImageFormat::Png;
        return true;
    }
    if (lower == "jpeg" || lower == "jpg") {
        out = ImageFormat::Jpeg;
        return true;
    }
    return false;
}

const char* image_format_name(ImageFormat format) {
    return format == ImageFormat::Png ? "png" : "jpeg";
}

const char* image_format_extension(ImageFormat format) {
    return format == ImageFormat::Png ? "png" : "jpg";
}

bool read_file_bytes(const fs::path& path, std::vector<unsigned char>& out, Error& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error.set(ErrorCode::IoError, "failed to open '" + path.string() + "'");
        return false;
    }
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)),
                                     std::istreambuf_iterator<char>());
    if (in.bad()) {
        error.set(ErrorCode::IoError, "failed to read '" + path.string() + "'");
        return false;
    }
    out = std::move(bytes);
    return true;
}

bool write_file_bytes(const fs::path& path, const std::vector<unsigned char>& bytes, Error& error) {
    std::error_code ec;
    const fs::path parent = path.parent_path();
    if (!parent.empty() && !fs::exists(parent, ec)) {
        fs::create_directories(parent, ec);
        if (ec) {
            error.set(ErrorCode::IoError,
                      "failed to create directory '" + parent.string() + "': " + ec.message());
            return false;
        }
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error.set(ErrorCode::IoError, "failed to open '" + path.string() + "' for writing");
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        error.set(ErrorCode::IoError, "failed to write '" + path.string() + "'");
        return false;
    }
    return true;
}

bool decode_image(const std::vector<unsigned char>& bytes, RasterImage& out, Error& error) {
    if (bytes.empty()) {
        error.set(ErrorCode::UnsupportedFormat, "empty image data");
        return false;
    }
    if (bytes.size() > static_cast<size_t>(INT_MAX)) {
        error.set(ErrorCode::UnsupportedFormat, "image data is too large");
        return false;
    }
    const int length = static_cast<int>(bytes.size());
    int w = 0;
    int h = 0;
    int channels = 0;
    if (stbi_info_from_memory(bytes.data(), length, &w, &h, &channels) == 0) {
        const char* reason = stbi_failure_reason();
        error.set(ErrorCode::UnsupportedFormat,
                  std::string("unrecognized image format") + (reason ? std::string(": ") + reason : ""));
        return false;
    }
    if (!validate_dimensions(w, h, error)) {
        error.code = ErrorCode::CorruptImage;
        return false;
    }

    unsigned char* data = stbi_load_from_memory(bytes.data(), length, &w, &h, &channels, k_num_channels);
    if (!data) {
        const char* reason = stbi_failure_reason();
        error.set(ErrorCode::CorruptImage,
                  std::string("failed to decode image") + (reason ? std::string(": ") + reason : ""));
        return false;
    }
    const size_t byte_count = static_cast<size_t>(w) * static_cast<size_t>(h) * k_num_channels;
    std::vector<unsigned char> pixels(data, data + byte_count);
    stbi_image_free(data);
    return RasterImage::from_rgba(w, h, std::move(pixels), out, error);
}

bool resize_image(const RasterImage& source, int target_w, int target_h, FitMode fit,
                  RasterImage& out, Error& error) {
    if (!validate_dimensions(target_w, target_h, error)) {
        return false;
    }
    if (source.empty()) {
        error.set(ErrorCode::InvalidDimensions, "cannot resize an empty image");
        return false;
    }

    const double sx = static_cast<double>(target_w) / source.width();
    const double sy = static_cast<double>(target_h) / source.height();
    Mapping m;
    m.scale = (fit == FitMode::Cover) ? std::max(sx, sy) : std::min(sx, sy);
    m.origin_x = (target_w - source.width() * m.scale) / 2.0;
    m.origin_y = (target_h - source.height() * m.scale) / 2.0;

    RasterImage resized(target_w, target_h);
    const bool shrinking = m.scale < 1.0;
    for (int y = 0; y < target_h; ++y) {
        for (int x = 0; x < target_w; ++x) {
            resized.set(x, y, shrinking ? sample_area(source, m, x, y)
                                        : sample_bilinear(source, m, x, y));
        }
    }
    out = std::move(resized);
    return true;
}

bool decode_and_resize(const std::vector<unsigned char>& bytes, int target_w, int target_h,
                       FitMode fit, RasterImage& out, Error& error) {
    if (is_svg_document(bytes)) {
        return rasterize_svg(bytes, target_w, target_h, fit, out, error);
    }
    RasterImage decoded;
    if (!decode_image(bytes, decoded, error)) {
        return false;
    }
    return resize_image(decoded, target_w, target_h, fit, out, error);
}

bool encode_image(const RasterImage& image, ImageFormat format, int setting,
                  std::vector<unsigned char>& out, Error& error) {
    if (image.empty()) {
        error.set(ErrorCode::InvalidDimensions, "cannot encode an empty image");
        return false;
    }
    std::vector<unsigned char> bytes;
    int ok = 0;
    if (format == ImageFormat::Jpeg) {
        if (setting < k_min_jpeg_quality || setting > k_max_jpeg_quality) {
            error.set(ErrorCode::InvalidConfig,
                      "jpeg quality " + std::to_string(setting) + " outside 1-100");
            return false;
        }
        // JPEG has no alpha; stb drops the fourth channel.
        ok = stbi_write_jpg_to_func(write_to_vector, &bytes, image.width(), image.height(),
                                    k_num_channels, image.data().data(), setting);
    } else {
        if (setting < 1) {
            error.set(ErrorCode::InvalidConfig,
                      "png compression effort " + std::to_string(setting) + " must be positive");
            return false;
        }
        std::scoped_lock lock(g_png_level_mutex);
        stbi_write_png_compression_level = setting;
        ok = stbi_write_png_to_func(write_to_vector, &bytes, image.width(), image.height(),
                                    k_num_channels, image.data().data(),
                                    static_cast<int>(image.row_bytes()));
    }
    if (ok == 0) {
        error.set(ErrorCode::IoError, std::string("failed to encode ") + image_format_name(format));
        return false;
    }
    out = std::move(bytes);
    return true;
}

} // namespace brandimg::core
