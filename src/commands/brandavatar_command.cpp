// brandavatar_command.cpp
// MIT License (c) 2026 Pedro

#include <algorithm>
#include <array>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "command_support.h"
#include "core/cli_parse.h"
#include "core/codec.h"
#include "core/pipeline.h"

namespace fs = std::filesystem;

namespace {

using brandimg::core::AvatarRequest;
using brandimg::core::BrandConfig;
using brandimg::core::CompositionResult;
using brandimg::core::Error;
using brandimg::core::ImageFormat;
using brandimg::core::parse_byte_count;
using brandimg::core::parse_positive_int;
using brandimg::core::parse_positive_int_list;
using brandimg::core::split_list;
using brandimg::core::to_lower_copy;
namespace commands = brandimg::commands;

constexpr int k_default_avatar_size = 512;
constexpr std::array<int, 2> k_default_batch_sizes = {256, 512};

struct AvatarOptions {
    std::string portrait;
    std::string color;
    int size = k_default_avatar_size;
    std::string output;
    ImageFormat format = ImageFormat::Png;
    bool grayscale = false;
    bool with_shadow = true;
    size_t byte_budget = brandimg::core::k_default_byte_budget;
    std::string config_path;
    bool quiet = false;
    bool list_colors = false;

    bool batch = false;
    std::vector<std::string> colors;
    std::vector<int> sizes;
    std::string output_dir = "output/avatars";
    unsigned int threads = 0;
};

struct BatchJob {
    std::string color;
    int size = 0;
    fs::path output;
};

std::string avatar_file_name(const std::string& portrait_stem, const std::string& color, int size,
                             bool grayscale, ImageFormat format) {
    return "avatar-" + portrait_stem + "-" + color + "-" + std::to_string(size)
           + (grayscale ? "-grayscale" : "") + "." + brandimg::core::image_format_extension(format);
}

void print_usage() {
    std::cout << "Usage: brandavatar --portrait PATH --color NAME --output PATH [OPTIONS]\n"
              << "       brandavatar --portrait PATH --batch [OPTIONS]\n"
              << "\n"
              << "Generate square avatars from a cut-out portrait (PNG with transparency)\n"
              << "on a brand color background with a drop silhouette.\n"
              << "\n"
              << "Options:\n"
              << "  --portrait PATH        Cut-out portrait image\n"
              << "  --color NAME           Brand color for the background\n"
              << "  --size N               Output size in pixels (default: " << k_default_avatar_size << ")\n"
              << "  --output PATH          Output file\n"
              << "  --format png|jpeg      Output format (default: png)\n"
              << "  --grayscale            Convert the portrait to grayscale (background stays colored)\n"
              << "  --no-shadow            Do not draw the drop silhouette\n"
              << "  --max-bytes N[K|M]     Output size limit (default: 3M)\n"
              << "  --config PATH          Brand configuration file\n"
              << "  --list-colors          Print the brand palette and exit\n"
              << "  --quiet                Only print warnings and errors\n"
              << "\n"
              << "Batch options:\n"
              << "  --batch                Generate every color/size combination\n"
              << "  --colors a,b,...       Colors to generate (default: whole palette)\n"
              << "  --sizes N,M,...        Sizes to generate (default: 256,512)\n"
              << "  --output-dir DIR       Output directory (default: output/avatars)\n"
              << "  --threads N            Number of worker threads\n"
              << "  --help, -h             Show this help message\n";
}

bool parse_options(int argc, char** argv, AvatarOptions& options, bool& show_help) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else if (arg == "--portrait" && i + 1 < argc) {
            options.portrait = argv[++i];
        } else if (arg == "--color" && i + 1 < argc) {
            options.color = to_lower_copy(argv[++i]);
        } else if (arg == "--size" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_positive_int(value, options.size)) {
                std::cerr << "Error: Invalid size: " << value << ". Must be a positive integer\n";
                return false;
            }
        } else if (arg == "--output" && i + 1 < argc) {
            options.output = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!brandimg::core::parse_image_format(value, options.format)) {
                std::cerr << "Error: Invalid format: " << value << ". Must be png or jpeg\n";
                return false;
            }
        } else if (arg == "--grayscale" || arg == "--gray" || arg == "--grey") {
            options.grayscale = true;
        } else if (arg == "--no-shadow") {
            options.with_shadow = false;
        } else if (arg == "--max-bytes" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_byte_count(value, options.byte_budget)) {
                std::cerr << "Error: Invalid byte limit: " << value << '\n';
                return false;
            }
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--quiet" || arg == "-q") {
            options.quiet = true;
        } else if (arg == "--list-colors") {
            options.list_colors = true;
        } else if (arg == "--batch") {
            options.batch = true;
        } else if (arg == "--colors" && i + 1 < argc) {
            options.colors = split_list(to_lower_copy(argv[++i]));
            if (options.colors.empty()) {
                std::cerr << "Error: --colors needs at least one color\n";
                return false;
            }
        } else if (arg == "--sizes" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_positive_int_list(value, options.sizes)) {
                std::cerr << "Error: Invalid size list: " << value << '\n';
                return false;
            }
        } else if (arg == "--output-dir" && i + 1 < argc) {
            options.output_dir = argv[++i];
        } else if (arg == "--threads" && i + 1 < argc) {
            std::string value = argv[++i];
            int parsed = 0;
            if (!parse_positive_int(value, parsed)) {
                std::cerr << "Error: Invalid thread count: " << value << '\n';
                return false;
            }
            options.threads = static_cast<unsigned int>(parsed);
        } else {
            std::cerr << "Error: Unknown option: " << arg << '\n';
            print_usage();
            return false;
        }
    }
    return true;
}

AvatarRequest make_request(const AvatarOptions& options, const std::vector<unsigned char>& portrait,
                           const std::string& color, int size) {
    AvatarRequest request;
    request.portrait = portrait;
    request.color = color;
    request.size = size;
    request.grayscale = options.grayscale;
    request.with_shadow = options.with_shadow;
    request.format = options.format;
    request.byte_budget = options.byte_budget;
    return request;
}

int run_single(const AvatarOptions& options, const BrandConfig& config,
               const std::vector<unsigned char>& portrait) {
    if (!options.quiet) {
        std::cout << "Generating " << options.size << "x" << options.size << "px avatar with "
                  << options.color << " background...\n";
    }
    CompositionResult result;
    Error error;
    if (!brandimg::core::compose_avatar(make_request(options, portrait, options.color, options.size),
                                        config, result, error)) {
        return commands::report_error("Failed to generate avatar", error);
    }
    if (!brandimg::core::write_file_bytes(options.output, result.output.bytes, error)) {
        return commands::report_error("Failed to write avatar", error);
    }
    commands::report_warnings(options.output, result, options.byte_budget);
    if (!options.quiet) {
        std::cout << "Avatar generated successfully: " << options.output << '\n'
                  << "Size: " << result.width << "x" << result.height << "px\n"
                  << "Color: " << options.color << " (" << brandimg::core::to_hex_string(result.background)
                  << ")\n"
                  << "File size: " << commands::format_megabytes(result.output.size()) << '\n';
        if (result.silhouette) {
            std::cout << "Silhouette: " << result.shadow_color << ", " << result.silhouette->silhouette_size
                      << "px, band " << result.silhouette->band << ", offset " << result.silhouette->offset
                      << '\n';
        }
        if (options.grayscale) {
            std::cout << "Portrait: grayscale\n";
        }
    }
    return commands::k_exit_ok;
}

int run_batch(const AvatarOptions& options, const BrandConfig& config,
              const std::vector<unsigned char>& portrait) {
    std::vector<std::string> colors = options.colors;
    if (colors.empty()) {
        colors = config.palette.names();
    }
    for (const std::string& color : colors) {
        Error error;
        brandimg::core::Rgb rgb;
        if (!config.palette.resolve(color, rgb, error)) {
            return commands::report_error("Invalid batch color", error);
        }
    }
    std::vector<int> sizes = options.sizes;
    if (sizes.empty()) {
        sizes.assign(k_default_batch_sizes.begin(), k_default_batch_sizes.end());
    }
    // Repeated entries would map to the same file and race in the pool.
    brandimg::core::remove_duplicates(colors);
    brandimg::core::remove_duplicates(sizes);

    const std::string stem = fs::path(options.portrait).stem().string();
    std::vector<BatchJob> jobs;
    for (const std::string& color : colors) {
        for (int size : sizes) {
            BatchJob job;
            job.color = color;
            job.size = size;
            job.output = fs::path(options.output_dir)
                         / avatar_file_name(stem, color, size, options.grayscale, options.format);
            jobs.push_back(std::move(job));
        }
    }

    unsigned int worker_count = options.threads > 0 ? options.threads : std::thread::hardware_concurrency();
    if (worker_count == 0) {
        worker_count = 1;
    }
    worker_count = std::min<unsigned int>(worker_count, static_cast<unsigned int>(jobs.size()));

    if (!options.quiet) {
        std::cout << "Generating " << jobs.size() << " avatar(s) on " << worker_count << " thread(s)...\n";
    }

    // One slot per job; a failure only marks its own slot.
    std::vector<int> exit_codes(jobs.size(), commands::k_exit_ok);
    std::atomic<size_t> next_index{0};
    std::mutex output_mutex;
    auto worker = [&]() {
        while (true) {
            const size_t idx = next_index.fetch_add(1, std::memory_order_relaxed);
            if (idx >= jobs.size()) {
                break;
            }
            const BatchJob& job = jobs[idx];
            const std::string label = job.output.filename().string();
            CompositionResult result;
            Error error;
            bool ok = brandimg::core::compose_avatar(make_request(options, portrait, job.color, job.size),
                                                     config, result, error)
                      && brandimg::core::write_file_bytes(job.output, result.output.bytes, error);

            std::scoped_lock lock(output_mutex);
            if (!ok) {
                exit_codes[idx] = commands::report_error(label, error);
                continue;
            }
            commands::report_warnings(label, result, options.byte_budget);
            if (!options.quiet) {
                std::cout << "[" << (idx + 1) << "/" << jobs.size() << "] " << job.output.string() << '\n';
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (unsigned int i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    const size_t failed = static_cast<size_t>(std::ranges::count_if(
        exit_codes, [](int code) { return code != commands::k_exit_ok; }));
    if (failed > 0) {
        std::cerr << "Error: " << failed << " of " << jobs.size() << " avatar(s) failed\n";
        return *std::ranges::max_element(exit_codes);
    }
    if (!options.quiet) {
        std::cout << "All " << jobs.size() << " avatar(s) generated in " << options.output_dir << '\n';
    }
    return commands::k_exit_ok;
}

} // namespace

namespace brandimg::commands {

int run_brandavatar(int argc, char** argv) {
    AvatarOptions options;
    bool show_help = false;
    if (!parse_options(argc, argv, options, show_help)) {
        return k_exit_request_failed;
    }
    if (show_help) {
        print_usage();
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

    if (options.portrait.empty()) {
        std::cerr << "Error: --portrait is required\n";
        print_usage();
        return k_exit_request_failed;
    }
    if (!options.batch && (options.color.empty() || options.output.empty())) {
        std::cerr << "Error: --color and --output are required unless --batch is given\n";
        print_usage();
        return k_exit_request_failed;
    }

    std::vector<unsigned char> portrait;
    Error error;
    if (!core::read_file_bytes(options.portrait, portrait, error)) {
        return report_error("Portrait image not found", error);
    }

    return options.batch ? run_batch(options, config, portrait) : run_single(options, config, portrait);
}

} // namespace brandimg::commands
