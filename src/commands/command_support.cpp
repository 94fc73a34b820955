// command_support.cpp
// MIT License (c) 2026 Pedro

#include "command_support.h"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

#include "core/palette.h"

namespace fs = std::filesystem;

namespace brandimg::commands {

fs::path executable_dir(const char* argv0) {
    if (argv0 == nullptr || argv0[0] == '\0') {
        return {};
    }
    std::error_code ec;
    fs::path exe = fs::absolute(fs::path(argv0), ec);
    if (ec) {
        return {};
    }
    return exe.parent_path();
}

bool load_config_or_report(const std::string& explicit_path, const char* argv0, bool quiet,
                           core::BrandConfig& out) {
    core::Error error;
    fs::path source;
    if (!core::load_brand_config(explicit_path, executable_dir(argv0), out, source, error)) {
        std::cerr << "Error: Failed to load configuration: " << error.message << '\n';
        return false;
    }
    if (!quiet) {
        if (source.empty()) {
            std::cout << "Using built-in brand configuration\n";
        } else {
            std::cout << "Using configuration " << source.string() << '\n';
        }
    }
    return true;
}

int report_error(const std::string& context, const core::Error& error) {
    std::cerr << "Error: " << context << ": " << error.message;
    if (core::is_configuration_defect(error.code)) {
        std::cerr << " (configuration defect: " << core::error_code_name(error.code) << ")";
    }
    std::cerr << '\n';
    return core::is_configuration_defect(error.code) ? k_exit_config_defect : k_exit_request_failed;
}

void report_warnings(const std::string& label, const core::CompositionResult& result,
                     size_t byte_budget) {
    for (const std::string& warning : result.warnings) {
        std::cerr << "Warning: " << label << ": " << warning << '\n';
    }
    const core::EncodedOutput& encoded = result.output;
    if (encoded.attempts > 1) {
        std::cerr << "Warning: " << label << ": first encoding was "
                  << format_megabytes(encoded.first_attempt_size) << ", over the "
                  << format_megabytes(byte_budget) << " limit; re-encoded at setting "
                  << encoded.setting_used << '\n';
    }
    if (encoded.over_budget) {
        std::cerr << "Warning: " << label << ": output is " << format_megabytes(encoded.size())
                  << " and still exceeds the " << format_megabytes(byte_budget) << " limit\n";
    }
}

void print_palette(const core::BrandConfig& config) {
    for (const std::string& name : config.palette.names()) {
        core::Rgb rgb;
        core::Error error;
        if (!config.palette.resolve(name, rgb, error)) {
            continue;
        }
        std::cout << "  " << std::left << std::setw(12) << name << core::to_hex_string(rgb);
        if (const std::vector<std::string>* shadows = config.shadows.candidates(name)) {
            std::cout << "  shadow:";
            for (const std::string& shadow : *shadows) {
                std::cout << ' ' << shadow;
            }
        }
        std::cout << '\n';
    }
}

std::string format_megabytes(size_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << static_cast<double>(bytes) / (1024.0 * 1024.0) << "MB";
    return oss.str();
}

} // namespace brandimg::commands
