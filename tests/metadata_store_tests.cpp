// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <spool/meta/metadata_store.hpp>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace spool::meta;

namespace fs = std::filesystem;

namespace {

struct TempRoot {
    fs::path path;

    explicit TempRoot(std::string_view name)
        : path(fs::temp_directory_path() / name) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempRoot() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

FileMetadata sample(MetadataStore& store, std::int64_t size, std::string source) {
    auto meta = store.create(size, std::move(source), FileStatus::healthy,
                             {SegmentRef{"seg1@example", 100, std::nullopt}});
    REQUIRE(meta.has_value());
    return *meta;
}

} // namespace

TEST_CASE("normalize_virtual_path", "[metadata]") {
    SECTION("Leading and trailing separators") {
        CHECK(normalize_virtual_path("/movies/a.mkv") == "movies/a.mkv");
        CHECK(normalize_virtual_path("movies/") == "movies");
    }

    SECTION("Root spellings") {
        CHECK(normalize_virtual_path("") == "");
        CHECK(normalize_virtual_path("/") == "");
        CHECK(normalize_virtual_path(".") == "");
    }

    SECTION("Lexical cleanup") {
        CHECK(normalize_virtual_path("movies//x/../a.mkv") == "movies/a.mkv");
        CHECK(normalize_virtual_path("./movies/./a.mkv") == "movies/a.mkv");
    }

    SECTION("Escaping the root") {
        auto result = normalize_virtual_path("../etc/passwd");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == StoreErrc::invalid_path);
        CHECK_FALSE(normalize_virtual_path("..").has_value());
    }
}

TEST_CASE("FileMetadata::create", "[metadata]") {
    SECTION("Invalid segments are dropped and ids trimmed") {
        auto meta = FileMetadata::create(1000, "a.nzb", FileStatus::healthy, {
            SegmentRef{"  good@example \n", 100, std::nullopt},
            SegmentRef{"", 100, std::nullopt},
            SegmentRef{"zero@example", 0, std::nullopt},
        });
        REQUIRE(meta.has_value());
        REQUIRE(meta->segments.size() == 1);
        CHECK(meta->segments[0].id == "good@example");
        CHECK(meta->created_at == meta->modified_at);
        CHECK(meta->created_at > 0);
    }

    SECTION("Encryption needs key and IV") {
        auto missing = FileMetadata::create(10, "a.nzb", FileStatus::healthy, {}, Encryption::rclone);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error() == StoreErrc::missing_encryption_params);

        auto ok = FileMetadata::create(10, "a.nzb", FileStatus::healthy, {}, Encryption::rclone, "key-1", "iv-1");
        REQUIRE(ok.has_value());
        CHECK(ok->key_ref == "key-1");
    }
}

TEST_CASE("FileMetadata JSON record", "[metadata]") {
    auto meta = FileMetadata::create(4096, "/data/a.nzb", FileStatus::partial, {
        SegmentRef{"s1@example", 100, DecodedSpan{0, 99}},
        SegmentRef{"s2@example", 100, std::nullopt},
    });
    REQUIRE(meta.has_value());

    auto decoded = FileMetadata::from_json(meta->to_json());
    REQUIRE(decoded.has_value());
    CHECK(*decoded == *meta);
    CHECK(decoded->segments[0].is_resolved());
    CHECK_FALSE(decoded->segments[1].is_resolved());

    SECTION("Garbage is a corrupt record") {
        auto bad = FileMetadata::from_json("{not json");
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error() == StoreErrc::corrupt_record);
    }
}

TEST_CASE("MetadataStore write, read, update, remove", "[metadata]") {
    TempRoot tmp("spool_store_tests");
    MetadataStore store(tmp.path);

    auto meta = sample(store, 1024, "/tmp/source.nzb");
    REQUIRE_FALSE(store.write("movies/movie.mkv", meta));
    CHECK(fs::exists(tmp.path / "movies" / "movie.mkv.meta"));

    SECTION("Read returns the written record") {
        auto read = store.read("movies/movie.mkv");
        REQUIRE(read.has_value());
        REQUIRE(read->has_value());
        CHECK((*read)->file_size == 1024);
        CHECK((*read)->source_archive_path == "/tmp/source.nzb");
        CHECK(store.exists("/movies/movie.mkv"));
    }

    SECTION("Update moves modified_at forward") {
        auto before = store.read("movies/movie.mkv");
        REQUIRE(before.has_value());
        REQUIRE(before->has_value());

        auto err = store.update("movies/movie.mkv", [](FileMetadata& m) {
            m.file_size = 2048;
            m.status = FileStatus::partial;
        });
        REQUIRE_FALSE(err);

        auto after = store.read("movies/movie.mkv");
        REQUIRE(after.has_value());
        REQUIRE(after->has_value());
        CHECK((*after)->file_size == 2048);
        CHECK((*after)->status == FileStatus::partial);
        CHECK((*after)->modified_at > (*before)->modified_at);
        CHECK((*after)->created_at == (*before)->created_at);
    }

    SECTION("Back-to-back updates stay strictly increasing") {
        REQUIRE_FALSE(store.update_status("movies/movie.mkv", FileStatus::partial));
        auto first = store.read("movies/movie.mkv");
        REQUIRE_FALSE(store.update_status("movies/movie.mkv", FileStatus::corrupted));
        auto second = store.read("movies/movie.mkv");
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        CHECK((*second)->modified_at > (*first)->modified_at);
        CHECK((*second)->status == FileStatus::corrupted);
    }

    SECTION("Update of an absent path fails") {
        auto err = store.update_status("movies/absent.mkv", FileStatus::corrupted);
        CHECK(err == StoreErrc::not_found);
        CHECK_FALSE(store.exists("movies/absent.mkv"));
    }

    SECTION("Remove makes the record absent, not an error") {
        REQUIRE_FALSE(store.remove("movies/movie.mkv"));
        CHECK_FALSE(store.exists("movies/movie.mkv"));

        auto read = store.read("movies/movie.mkv");
        REQUIRE(read.has_value());
        CHECK_FALSE(read->has_value());

        // Idempotent, and the emptied directory is pruned
        CHECK_FALSE(store.remove("movies/movie.mkv"));
        CHECK_FALSE(store.directory_exists("movies"));
        CHECK_FALSE(fs::exists(tmp.path / "movies"));
        CHECK(fs::exists(tmp.path));
    }

    SECTION("Invalid segments are never persisted") {
        FileMetadata bad = meta;
        bad.segments = {SegmentRef{"", -5, std::nullopt}, SegmentRef{"ok@example", 0, std::nullopt}};
        CHECK(store.write("movies/bad.mkv", bad) == StoreErrc::invalid_segment);
        CHECK_FALSE(store.exists("movies/bad.mkv"));

        auto err = store.update("movies/movie.mkv", [](FileMetadata& m) {
            m.segments.push_back(SegmentRef{" ", -1, std::nullopt});
        });
        CHECK(err == StoreErrc::invalid_segment);

        auto read = store.read("movies/movie.mkv");
        REQUIRE(read.has_value());
        REQUIRE(read->has_value());
        CHECK((*read)->segments.size() == 1);
    }

    SECTION("Segment ids are trimmed on write") {
        FileMetadata padded = meta;
        padded.segments = {SegmentRef{"  padded@example\n", 100, std::nullopt}};
        REQUIRE_FALSE(store.write("movies/padded.mkv", padded));

        auto read = store.read("movies/padded.mkv");
        REQUIRE(read.has_value());
        REQUIRE(read->has_value());
        REQUIRE((*read)->segments.size() == 1);
        CHECK((*read)->segments[0].id == "padded@example");
    }

    SECTION("Root cannot hold a record") {
        CHECK(store.write("/", meta) == StoreErrc::invalid_path);
        CHECK(store.write("../outside.mkv", meta) == StoreErrc::invalid_path);
    }
}

TEST_CASE("MetadataStore directories", "[metadata]") {
    TempRoot tmp("spool_store_dir_tests");
    MetadataStore store(tmp.path);
    auto meta = sample(store, 10, "a.nzb");

    SECTION("Missing directories list as empty") {
        auto files = store.list_directory("nothing/here");
        REQUIRE(files.has_value());
        CHECK(files->empty());

        auto dirs = store.list_subdirectories("nothing/here");
        REQUIRE(dirs.has_value());
        CHECK(dirs->empty());
        CHECK_FALSE(store.directory_exists("nothing"));
    }

    SECTION("Directories derive from file paths") {
        REQUIRE_FALSE(store.write("movies/b.mkv", meta));
        REQUIRE_FALSE(store.write("movies/a.mkv", meta));
        REQUIRE_FALSE(store.write("movies/extras/clip.mkv", meta));

        auto root_dirs = store.list_subdirectories("");
        REQUIRE(root_dirs.has_value());
        CHECK(*root_dirs == std::vector<std::string>{"movies"});

        auto files = store.list_directory("movies");
        REQUIRE(files.has_value());
        CHECK(*files == std::vector<std::string>{"a.mkv", "b.mkv"});

        auto sub = store.list_subdirectories("movies");
        REQUIRE(sub.has_value());
        CHECK(*sub == std::vector<std::string>{"movies/extras"});

        CHECK(store.directory_exists("movies"));
        CHECK(store.directory_exists("movies/extras"));
        CHECK_FALSE(store.directory_exists("movies/a.mkv"));
    }

    SECTION("Directory holding no records does not exist") {
        fs::create_directories(tmp.path / "empty" / "deeper");
        CHECK_FALSE(store.directory_exists("empty"));

        auto dirs = store.list_subdirectories("");
        REQUIRE(dirs.has_value());
        CHECK(dirs->empty());
    }

    SECTION("remove_directory drops every record beneath") {
        REQUIRE_FALSE(store.write("show/s01/e01.mkv", meta));
        REQUIRE_FALSE(store.write("show/s01/e02.mkv", meta));
        REQUIRE_FALSE(store.write("show/s02/e01.mkv", meta));
        REQUIRE_FALSE(store.write("other/x.mkv", meta));

        REQUIRE_FALSE(store.remove_directory("show"));
        CHECK_FALSE(store.directory_exists("show"));
        CHECK_FALSE(store.exists("show/s01/e01.mkv"));
        CHECK(store.exists("other/x.mkv"));

        // Idempotent
        CHECK_FALSE(store.remove_directory("show"));
    }
}

TEST_CASE("MetadataStore concurrent writers", "[metadata]") {
    TempRoot tmp("spool_store_concurrency_tests");
    MetadataStore store(tmp.path);
    auto meta = sample(store, 10, "a.nzb");
    REQUIRE_FALSE(store.write("shared.mkv", meta));

    constexpr int threads = 8;
    constexpr int updates = 20;

    std::vector<std::jthread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&store, t] {
            auto own = "own/file" + std::to_string(t) + ".mkv";
            auto m = store.create(t + 1, "a.nzb", FileStatus::healthy, {});
            if (m) {
                (void)store.write(own, *m);
            }
            for (int i = 0; i < updates; ++i) {
                (void)store.update("shared.mkv", [](FileMetadata& shared) { shared.file_size += 1; });
            }
        });
    }
    workers.clear();

    auto shared = store.read("shared.mkv");
    REQUIRE(shared.has_value());
    REQUIRE(shared->has_value());
    CHECK((*shared)->file_size == 10 + threads * updates);

    auto own = store.list_directory("own");
    REQUIRE(own.has_value());
    CHECK(own->size() == static_cast<std::size_t>(threads));
}

TEST_CASE("MetadataStore write races removal of a sibling", "[metadata]") {
    TempRoot tmp("spool_store_prune_race_tests");
    MetadataStore store(tmp.path);
    auto meta = sample(store, 10, "a.nzb");

    constexpr int rounds = 300;
    int failures = 0;

    for (int i = 0; i < rounds; ++i) {
        REQUIRE_FALSE(store.write("race/y.mkv", meta));

        auto path = "race/x" + std::to_string(i) + ".mkv";
        std::error_code write_err;
        std::error_code remove_err;
        {
            std::jthread writer([&] { write_err = store.write(path, meta); });
            std::jthread remover([&] { remove_err = store.remove("race/y.mkv"); });
        }

        if (write_err || remove_err) {
            ++failures;
        }
        CHECK(store.exists(path));

        // Empty the directory again so the next removal prunes it
        REQUIRE_FALSE(store.remove(path));
    }

    CHECK(failures == 0);
}
