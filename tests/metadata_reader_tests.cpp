// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <spool/core/error.hpp>
#include <spool/meta/metadata_reader.hpp>
#include <filesystem>
#include <fstream>

using namespace spool::meta;
using spool::core::StreamErrc;

namespace fs = std::filesystem;

namespace {

fs::path fresh_root(std::string_view name) {
    auto path = fs::temp_directory_path() / name;
    fs::remove_all(path);
    return path;
}

struct ReaderFixture {
    fs::path root;
    MetadataStore store;
    MetadataReader reader;

    ReaderFixture()
        : root(fresh_root("spool_reader_tests"))
        , store(root)
        , reader(store) {
        auto meta = store.create(2048, "/tmp/movie.nzb", FileStatus::healthy, {
            SegmentRef{"a@example", 1024, std::nullopt},
            SegmentRef{"b@example", 1024, std::nullopt},
        });
        REQUIRE(meta.has_value());
        REQUIRE_FALSE(store.write("movies/movie.mkv", *meta));
        REQUIRE_FALSE(store.write("movies/extras/clip.mkv", *meta));
    }

    ~ReaderFixture() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
};

} // namespace

TEST_CASE_METHOD(ReaderFixture, "MetadataReader::list_directory_contents", "[reader]") {
    SECTION("One file and one nested directory") {
        auto contents = reader.list_directory_contents("movies");
        REQUIRE(contents.has_value());
        REQUIRE(contents->files.size() == 1);
        REQUIRE(contents->directories.size() == 1);
        CHECK(contents->files[0].name == "movie.mkv");
        CHECK(contents->files[0].metadata.file_size == 2048);
        CHECK(contents->directories[0].name == "extras");
        CHECK(contents->directories[0].path == "movies/extras");
        CHECK(contents->directories[0].is_dir());
        CHECK(contents->directories[0].modified_at > 0);
    }

    SECTION("Root lists the top-level directory") {
        auto contents = reader.list_directory_contents("/");
        REQUIRE(contents.has_value());
        CHECK(contents->files.empty());
        REQUIRE(contents->directories.size() == 1);
        CHECK(contents->directories[0].name == "movies");
    }

    SECTION("Missing directory lists as empty") {
        auto contents = reader.list_directory_contents("tv");
        REQUIRE(contents.has_value());
        CHECK(contents->files.empty());
        CHECK(contents->directories.empty());
    }

    SECTION("Unreadable record fails the listing") {
        {
            std::ofstream broken(root / "movies" / "broken.mkv.meta");
            broken << "{not json";
        }
        auto names = reader.list_directory("movies");
        REQUIRE(names.has_value());
        CHECK(names->size() == 2);

        auto contents = reader.list_directory_contents("movies");
        REQUIRE_FALSE(contents.has_value());
        CHECK(contents.error() == StoreErrc::corrupt_record);
    }

    SECTION("Name-only listings") {
        auto names = reader.list_directory("movies");
        REQUIRE(names.has_value());
        CHECK(*names == std::vector<std::string>{"movie.mkv"});

        auto dirs = reader.list_subdirectories("");
        REQUIRE(dirs.has_value());
        CHECK(*dirs == std::vector<std::string>{"movies"});
    }
}

TEST_CASE_METHOD(ReaderFixture, "MetadataReader path queries", "[reader]") {
    SECTION("path_exists") {
        CHECK(reader.path_exists("").value());
        CHECK(reader.path_exists("movies").value());
        CHECK(reader.path_exists("movies/movie.mkv").value());
        CHECK(reader.path_exists("/movies/extras/").value());
        CHECK_FALSE(reader.path_exists("movies/missing.mkv").value());
    }

    SECTION("is_directory") {
        CHECK(reader.is_directory("/").value());
        CHECK(reader.is_directory("movies/extras").value());
        CHECK_FALSE(reader.is_directory("movies/movie.mkv").value());

        auto missing = reader.is_directory("movies/missing");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error() == StreamErrc::not_found);
    }

    SECTION("get_directory_info") {
        auto info = reader.get_directory_info("movies");
        REQUIRE(info.has_value());
        CHECK(info->name == "movies");

        auto root = reader.get_directory_info("");
        REQUIRE(root.has_value());
        CHECK(root->path.empty());

        auto file = reader.get_directory_info("movies/movie.mkv");
        REQUIRE_FALSE(file.has_value());
        CHECK(file.error() == StreamErrc::not_a_directory);

        auto missing = reader.get_directory_info("nope");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error() == StreamErrc::not_found);
    }

    SECTION("Escaping paths are rejected") {
        auto result = reader.path_exists("../../etc");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == StoreErrc::invalid_path);
    }
}

TEST_CASE_METHOD(ReaderFixture, "MetadataReader file queries", "[reader]") {
    SECTION("get_file_metadata on an absent path is not an error") {
        auto meta = reader.get_file_metadata("movies/missing.mkv");
        REQUIRE(meta.has_value());
        CHECK_FALSE(meta->has_value());
    }

    SECTION("get_file_segments preserves order") {
        auto segments = reader.get_file_segments("movies/movie.mkv");
        REQUIRE(segments.has_value());
        REQUIRE(segments->size() == 2);
        CHECK((*segments)[0].id == "a@example");
        CHECK((*segments)[1].id == "b@example");

        auto missing = reader.get_file_segments("movies/missing.mkv");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error() == StreamErrc::not_found);
    }

    SECTION("describe_file") {
        auto desc = reader.describe_file("/movies//movie.mkv");
        REQUIRE(desc.has_value());
        CHECK(desc->virtual_path == "/movies//movie.mkv");
        CHECK(desc->normalized_path == "movies/movie.mkv");
        CHECK(desc->source_archive == "/tmp/movie.nzb");
        CHECK(desc->file_size == 2048);
        CHECK(desc->segment_count == 2);
        CHECK(desc->status == FileStatus::healthy);
    }

    SECTION("describe_file shows a corrupted status") {
        REQUIRE_FALSE(store.update_status("movies/movie.mkv", FileStatus::corrupted));
        auto desc = reader.describe_file("movies/movie.mkv");
        REQUIRE(desc.has_value());
        CHECK(desc->status == FileStatus::corrupted);
    }
}
