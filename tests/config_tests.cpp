// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <spool/core/config.hpp>
#include <spool/core/error.hpp>
#include <filesystem>
#include <fstream>

using namespace spool::core;

namespace fs = std::filesystem;

TEST_CASE("parse_config", "[config]") {
    SECTION("Empty object keeps defaults") {
        auto cfg = parse_config("{}");
        REQUIRE(cfg.has_value());
        CHECK(cfg->workers == DEFAULT_WORKERS);
        CHECK(cfg->max_age == DEFAULT_MAX_AGE);
        CHECK(cfg->log_level == "info");
    }

    SECTION("All keys") {
        auto cfg = parse_config(R"({
            "metadataRoot": "/var/lib/spool/meta",
            "streamRoot": "/var/lib/spool/streams",
            "maxAgeSeconds": 3600,
            "workers": 30,
            "logLevel": "debug"
        })");
        REQUIRE(cfg.has_value());
        CHECK(cfg->metadata_root == "/var/lib/spool/meta");
        CHECK(cfg->stream_root == "/var/lib/spool/streams");
        CHECK(cfg->max_age == std::chrono::seconds(3600));
        CHECK(cfg->workers == 30);
        CHECK(cfg->log_level == "debug");
    }

    SECTION("Zero workers falls back to the default") {
        auto cfg = parse_config(R"({"workers": 0})");
        REQUIRE(cfg.has_value());
        CHECK(cfg->workers == DEFAULT_WORKERS);
    }

    SECTION("Wrong type") {
        auto cfg = parse_config(R"({"workers": "many"})");
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error() == StreamErrc::invalid_config);
    }

    SECTION("Not JSON") {
        CHECK_FALSE(parse_config("workers=3").has_value());
        CHECK_FALSE(parse_config("[1, 2]").has_value());
    }
}

TEST_CASE("load_config", "[config]") {
    auto dir = fs::temp_directory_path() / "spool_config_tests";
    fs::create_directories(dir);

    SECTION("Reads a file") {
        auto path = dir / "spool.json";
        {
            std::ofstream out(path);
            out << R"({"streamRoot": "streams-here", "workers": 4})";
        }
        auto cfg = load_config(path.string());
        REQUIRE(cfg.has_value());
        CHECK(cfg->stream_root == "streams-here");
        CHECK(cfg->workers == 4);
    }

    SECTION("Missing file") {
        auto cfg = load_config((dir / "absent.json").string());
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error() == std::errc::no_such_file_or_directory);
    }

    fs::remove_all(dir);
}
