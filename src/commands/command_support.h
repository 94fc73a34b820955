// command_support.h
// MIT License (c) 2026 Pedro

#pragma once

#include <filesystem>
#include <string>

#include "core/brand_config.h"
#include "core/pipeline.h"
#include "core/raster.h"

namespace brandimg::commands {

constexpr int k_exit_ok = 0;
constexpr int k_exit_request_failed = 1;
constexpr int k_exit_config_defect = 2;

int run_brandavatar(int argc, char** argv);
int run_brandbanner(int argc, char** argv);

std::filesystem::path executable_dir(const char* argv0);

// Loads the configuration and reports problems on stderr.
bool load_config_or_report(const std::string& explicit_path, const char* argv0, bool quiet,
                           core::BrandConfig& out);

// Prints "Error: ..." and returns the exit code for the error class.
int report_error(const std::string& context, const core::Error& error);

// Warnings of a finished request, the byte budget miss included.
void report_warnings(const std::string& label, const core::CompositionResult& result,
                     size_t byte_budget);

void print_palette(const core::BrandConfig& config);

std::string format_megabytes(size_t bytes);

} // namespace brandimg::commands
