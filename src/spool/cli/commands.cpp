// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/cli/commands.hpp>
#include <spool/core/error.hpp>
#include <spool/core/path_args.hpp>
#include <spool/core/range.hpp>
#include <spool/meta/metadata_reader.hpp>
#include <spool/meta/metadata_store.hpp>
#include <spool/nzb/registry.hpp>
#include <spool/stream/reader_factory.hpp>
#include <spool/version.hpp>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>

using namespace spool::core;

namespace spool::cli {

namespace {

std::expected<std::int64_t, std::error_code> parse_offset(const std::string& text) {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(make_error_code(StreamErrc::invalid_number));
    }
    return value;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
            continue;
        }
        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                args.config_path = argv[++i];
            }
            continue;
        }
        if (arg == "-w" || arg == "--workers") {
            if (i + 1 < argc) {
                char* end = nullptr;
                args.workers = static_cast<std::uint32_t>(std::strtoul(argv[++i], &end, 10));
                if (end == nullptr || *end != '\0') {
                    args.workers = 0;
                }
            }
            continue;
        }
        // Negative offsets ("-1") are operands, not options
        if (args.command.empty()) {
            args.command = arg;
        } else {
            args.operands.push_back(arg);
        }
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult register_file(const ServiceConfig& config, const std::string& nzb_file, const std::string& name) noexcept {
    try {
        std::ifstream file(nzb_file, std::ios::binary);
        if (!file) {
            std::cerr << "Error: Cannot open " << nzb_file << std::endl;
            return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
        }
        std::string archive((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        meta::MetadataStore store(config.metadata_root);
        nzb::Registry registry(&store, config.stream_root, config.max_age);

        auto suggested = name.empty() ? std::filesystem::path(nzb_file).filename().string() : name;
        auto registration = registry.register_archive(archive, suggested);
        if (!registration) {
            std::cerr << "Error: Registration failed: " << registration.error().message() << std::endl;
            return std::unexpected(registration.error());
        }

        std::cout << registration->path << "\t" << registration->size << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
}

CliResult list(const ServiceConfig& config, const std::string& dir) noexcept {
    try {
        meta::MetadataStore store(config.metadata_root);
        meta::MetadataReader reader(store);

        auto contents = reader.list_directory_contents(nzb::Registry::store_path(dir));
        if (!contents) {
            std::cerr << "Error: " << contents.error().message() << std::endl;
            return std::unexpected(contents.error());
        }

        for (const auto& d : contents->directories) {
            std::cout << "d  " << d.name << "/" << std::endl;
        }
        for (const auto& f : contents->files) {
            std::cout << "-  " << f.name << "\t" << f.metadata.file_size
                      << "\t" << meta::to_string(f.metadata.status) << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
}

CliResult stat(const ServiceConfig& config, const std::string& path) noexcept {
    try {
        auto parsed = PathWithArgs::parse(path);
        if (!parsed) {
            std::cerr << "Error: Invalid path arguments: " << parsed.error().message() << std::endl;
            return std::unexpected(parsed.error());
        }

        meta::MetadataStore store(config.metadata_root);
        meta::MetadataReader reader(store);

        auto desc = reader.describe_file(nzb::Registry::store_path(parsed->path()));
        if (!desc) {
            std::cerr << "Error: " << path << ": " << desc.error().message() << std::endl;
            return std::unexpected(desc.error());
        }

        std::cout << "Path: " << desc->virtual_path << std::endl;
        std::cout << "Size: " << desc->file_size << std::endl;
        std::cout << "Segments: " << desc->segment_count << std::endl;
        std::cout << "Status: " << meta::to_string(desc->status) << std::endl;
        std::cout << "Archive: " << desc->source_archive << std::endl;

        auto range = parsed->range();
        if (!range) {
            std::cerr << "Error: Invalid range argument: " << range.error().message() << std::endl;
            return std::unexpected(range.error());
        }
        if (*range) {
            auto fixed = fix_range_header(**range, desc->file_size);
            auto window = stream::compute_window(config.workers, fixed.end - fixed.start + 1);
            std::cout << "Range: " << fixed.to_string() << " (window " << window << ")" << std::endl;
        }
        if (parsed->is_copy()) {
            std::cout << "Copy: yes" << std::endl;
        }
        if (auto origin = parsed->origin(); !origin.empty()) {
            std::cout << "Origin: " << origin << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
}

CliResult sweep(const ServiceConfig& config) noexcept {
    try {
        meta::MetadataStore store(config.metadata_root);
        nzb::Registry registry(&store, config.stream_root, config.max_age);

        auto report = registry.sweep();
        std::cout << "Removed: " << report.removed << std::endl;
        std::cout << "Failed: " << report.failed << std::endl;
        return report.failed == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
}

CliResult window(const ServiceConfig& config, const std::string& start, const std::string& end) noexcept {
    auto first = parse_offset(start);
    auto last = parse_offset(end);
    if (!first || !last || *first < 0 || *last < *first) {
        std::cerr << "Error: Invalid range " << start << "-" << end << std::endl;
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }

    auto bytes = *last - *first + 1;
    std::cout << "Workers: " << config.workers << std::endl;
    std::cout << "Range bytes: " << bytes << std::endl;
    std::cout << "Window: " << stream::compute_window(config.workers, bytes) << " segments" << std::endl;
    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "spool " << program_name << " - NZB-backed virtual file store\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <COMMAND> [ARGS]...\n";
    std::cout << "\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  register <nzb-file> [name]  Register an NZB and print its stream path\n";
    std::cout << "  ls [dir]                    List a virtual directory\n";
    std::cout << "  stat <path>                 Describe a virtual file\n";
    std::cout << "  sweep                       Remove expired registrations\n";
    std::cout << "  window <start> <end>        Show the segment window for a byte range\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Only log warnings and errors\n";
    std::cout << "  -c, --config <FILE>     Load configuration from a JSON file\n";
    std::cout << "  -w, --workers <N>       Download workers (default: " << DEFAULT_WORKERS << ")\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " register movie.nzb\n";
    std::cout << "  " << program_name << " stat 'streams/<id>/movie.mkv?ARGS?webdav+context+key+rangeKey=bytes%3D0-99'\n";
    std::cout << "  " << program_name << " -w 30 window 0 104857599\n";
}

void print_version() noexcept {
    std::cout << "spool " << spool::version.to_string() << std::endl;
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, expat, nlohmann/json, spdlog\n";
}

} // namespace spool::cli
