// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/config.hpp>
#include <spool/core/error.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace spool::core {

std::expected<ServiceConfig, std::error_code>
parse_config(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(StreamErrc::invalid_config));
        }

        ServiceConfig cfg;

        if (j.contains("metadataRoot")) {
            cfg.metadata_root = j["metadataRoot"].get<std::string>();
        }
        if (j.contains("streamRoot")) {
            cfg.stream_root = j["streamRoot"].get<std::string>();
        }
        if (j.contains("maxAgeSeconds")) {
            cfg.max_age = std::chrono::seconds(j["maxAgeSeconds"].get<std::int64_t>());
        }
        if (j.contains("workers")) {
            cfg.workers = j["workers"].get<std::uint32_t>();
            if (cfg.workers == 0) {
                cfg.workers = DEFAULT_WORKERS;
            }
        }
        if (j.contains("logLevel")) {
            cfg.log_level = j["logLevel"].get<std::string>();
        }

        return cfg;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StreamErrc::invalid_config));
    }
}

std::expected<ServiceConfig, std::error_code>
load_config(std::string_view path) noexcept {
    try {
        std::ifstream file(std::string(path), std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(std::errc::no_such_file_or_directory));
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        return parse_config(buffer.str());
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StreamErrc::invalid_config));
    }
}

} // namespace spool::core
