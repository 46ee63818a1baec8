// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace spool::core {

// Segment window sizing
constexpr std::uint32_t DEFAULT_WORKERS = 15;
constexpr std::uint32_t WINDOW_PER_WORKER = 8;
constexpr std::uint32_t WINDOW_MIN = 20;
constexpr std::uint32_t WINDOW_MAX = 100;
constexpr std::uint32_t BULK_WINDOW_PER_WORKER = 12;
constexpr std::uint32_t BULK_WINDOW_MIN = 30;
constexpr std::uint32_t BULK_WINDOW_MAX = 150;
constexpr std::int64_t BULK_READ_THRESHOLD = 50 * 1024 * 1024;     // 50 MiB, likely a streaming read

// Storage layout
constexpr std::string_view METADATA_EXTENSION = ".meta";
constexpr std::string_view ARCHIVE_EXTENSION = ".nzb";
constexpr std::string_view PUBLIC_PREFIX = "streams";
constexpr std::string_view LEGACY_STREAM_DIR = "streams";
constexpr std::string_view FALLBACK_STREAM_NAME = "stream.bin";

constexpr std::chrono::seconds DEFAULT_MAX_AGE{24 * 60 * 60};
constexpr std::chrono::seconds DEFAULT_SWEEP_INTERVAL{15 * 60};

// Runtime configuration, loaded once and read-only afterwards
struct ServiceConfig {
    std::string metadata_root{"spool-data/metadata"};
    std::string stream_root{"spool-data/streams"};
    std::chrono::seconds max_age{DEFAULT_MAX_AGE};
    std::uint32_t workers{DEFAULT_WORKERS};
    std::string log_level{"info"};
};

// Load configuration from a JSON file. Keys absent from the file keep their defaults.
[[nodiscard]] std::expected<ServiceConfig, std::error_code>
load_config(std::string_view path) noexcept;

// Parse configuration from JSON text
[[nodiscard]] std::expected<ServiceConfig, std::error_code>
parse_config(std::string_view json) noexcept;

} // namespace spool::core
