// brandbanner_command.cpp
// MIT License (c) 2026 Pedro

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

#include "command_support.h"
#include "core/cli_parse.h"
#include "core/codec.h"
#include "core/pipeline.h"
#include "core/text_overlay.h"

namespace {

using brandimg::core::BannerRequest;
using brandimg::core::BannerSpec;
using brandimg::core::BrandConfig;
using brandimg::core::CompositionResult;
using brandimg::core::Error;
using brandimg::core::ImageFormat;

struct BannerOptions {
    std::string type = "post";
    std::string color = "navy";
    std::string output;
    std::string logo;
    std::string text;
    std::string font;
    std::optional<ImageFormat> format;
    bool use_minimum = false;
    size_t byte_budget = brandimg::core::k_default_byte_budget;
    std::string config_path;
    bool quiet = false;
    bool list_colors = false;
    bool list_types = false;
};

void print_types() {
    for (const BannerSpec& spec : brandimg::core::banner_specs()) {
        std::cout << "  " << std::left << std::setw(16) << spec.name
                  << spec.recommended_width << "x" << spec.recommended_height
                  << " (min " << spec.min_width << "x" << spec.min_height << ", "
                  << brandimg::core::image_format_name(spec.default_format) << ")  "
                  << spec.description << '\n';
    }
}

void print_usage() {
    std::cout << "Usage: brandbanner --type TYPE --output PATH [OPTIONS]\n"
              << "\n"
              << "Generate LinkedIn company page images on a brand color background.\n"
              << "\n"
              << "Options:\n"
              << "  --type TYPE            Image type (default: post), see --list-types\n"
              << "  --color NAME           Brand color for the background (default: navy)\n"
              << "  --output PATH          Output file\n"
              << "  --logo PATH            Logo image (PNG, JPEG or SVG) placed per image type\n"
              << "  --text TEXT            Text drawn in white\n"
              << "  --font PATH            TrueType font for --text\n"
              << "  --format png|jpeg      Output format (default: per image type)\n"
              << "  --min                  Use the minimum dimensions instead of the recommended ones\n"
              << "  --max-bytes N[K|M]     Output size limit (default: 3M)\n"
              << "  --config PATH          Brand configuration file\n"
              << "  --list-colors          Print the brand palette and exit\n"
              << "  --list-types           Print the image types and exit\n"
              << "  --quiet                Only print warnings and errors\n"
              << "  --help, -h             Show this help message\n";
}

bool parse_options(int argc, char** argv, BannerOptions& options, bool& show_help) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else if (arg == "--type" && i + 1 < argc) {
            options.type = argv[++i];
        } else if (arg == "--color" && i + 1 < argc) {
            options.color = brandimg::core::to_lower_copy(argv[++i]);
        } else if (arg == "--output" && i + 1 < argc) {
            options.output = argv[++i];
        } else if (arg == "--logo" && i + 1 < argc) {
            options.logo = argv[++i];
        } else if (arg == "--text" && i + 1 < argc) {
            options.text = argv[++i];
        } else if (arg == "--font" && i + 1 < argc) {
            options.font = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            std::string value = argv[++i];
            ImageFormat parsed = ImageFormat::Png;
            if (!brandimg::core::parse_image_format(value, parsed)) {
                std::cerr << "Error: Invalid format: " << value << ". Must be png or jpeg\n";
                return false;
            }
            options.format = parsed;
        } else if (arg == "--min") {
            options.use_minimum = true;
        } else if (arg == "--max-bytes" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!brandimg::core::parse_byte_count(value, options.byte_budget)) {
                std::cerr << "Error: Invalid byte limit: " << value << '\n';
                return false;
            }
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--quiet" || arg == "-q") {
            options.quiet = true;
        } else if (arg == "--list-colors") {
            options.list_colors = true;
        } else if (arg == "--list-types") {
            options.list_types = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << '\n';
            print_usage();
            return false;
        }
    }
    return true;
}

} // namespace

namespace brandimg::commands {

int run_brandbanner(int argc, char** argv) {
    BannerOptions options;
    bool show_help = false;
    if (!parse_options(argc, argv, options, show_help)) {
        return k_exit_request_failed;
    }
    if (show_help) {
        print_usage();
        return k_exit_ok;
    }
    if (options.list_types) {
        print_types();
        return k_exit_ok;
    }

    BrandConfig config;
    if (!load_config_or_report(options.config_path, argc > 0 ? argv[0] : nullptr, options.quiet, config)) {
        return k_exit_config_defect;
    }
    if (options.list_colors) {
        print_palette(config);
        return k_exit_ok;
    }

    const BannerSpec* spec = core::find_banner_spec(options.type);
    if (spec == nullptr) {
        std::cerr << "Error: Unknown image type: " << options.type << ". Available types:\n";
        print_types();
        return k_exit_request_failed;
    }
    if (options.output.empty()) {
        std::cerr << "Error: --output is required\n";
        print_usage();
        return k_exit_request_failed;
    }
    if (!options.text.empty() && options.font.empty()) {
        std::cerr << "Error: --text requires --font\n";
        return k_exit_request_failed;
    }

    Error error;
    BannerRequest request;
    request.type = spec->type;
    request.color = options.color;
    request.text = options.text;
    request.format = options.format;
    request.use_recommended = !options.use_minimum;
    request.byte_budget = options.byte_budget;

    request.logo_path = options.logo;

    core::FontFace font;
    if (!options.font.empty()) {
        if (!font.load(options.font, error)) {
            return report_error("Failed to load font", error);
        }
        request.font = &font;
    }

    if (!options.quiet) {
        std::cout << "Generating " << spec->name << " image with " << options.color << " background...\n";
    }
    CompositionResult result;
    if (!core::compose_banner(request, config, result, error)) {
        return report_error("Failed to generate image", error);
    }
    if (!core::write_file_bytes(options.output, result.output.bytes, error)) {
        return report_error("Failed to write image", error);
    }
    report_warnings(options.output, result, options.byte_budget);
    if (!options.quiet) {
        std::cout << "Image generated successfully: " << options.output << '\n'
                  << "Type: " << spec->description << '\n'
                  << "Size: " << result.width << "x" << result.height << "px\n"
                  << "Format: " << core::image_format_name(result.output.format) << '\n'
                  << "File size: " << format_megabytes(result.output.size()) << '\n';
    }
    return k_exit_ok;
}

} // namespace brandimg::commands
