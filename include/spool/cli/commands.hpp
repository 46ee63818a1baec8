// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/config.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace spool::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string command;
    std::vector<std::string> operands;
    std::string config_path;
    std::uint32_t workers{0};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Register an NZB file and print its public path
[[nodiscard]] CliResult register_file(const core::ServiceConfig& config,
                                      const std::string& nzb_file,
                                      const std::string& name) noexcept;

// List a virtual directory
[[nodiscard]] CliResult list(const core::ServiceConfig& config, const std::string& dir) noexcept;

// Describe a virtual file; path arguments (range, size) are decoded and shown
[[nodiscard]] CliResult stat(const core::ServiceConfig& config, const std::string& path) noexcept;

// Evict expired registrations
[[nodiscard]] CliResult sweep(const core::ServiceConfig& config) noexcept;

// Show the segment window chosen for a byte range
[[nodiscard]] CliResult window(const core::ServiceConfig& config,
                               const std::string& start,
                               const std::string& end) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace spool::cli
