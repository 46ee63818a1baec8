// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <spool/core/range.hpp>

using namespace spool::core;

TEST_CASE("parse_range_header - valid ranges", "[range]") {
    SECTION("Bounded range") {
        auto result = parse_range_header("bytes=0-1023");
        REQUIRE(result.has_value());
        CHECK(result->start == 0);
        CHECK(result->end == 1023);
    }

    SECTION("Open-ended range") {
        auto result = parse_range_header("bytes=500-");
        REQUIRE(result.has_value());
        CHECK(result->start == 500);
        CHECK(result->end == -1);
        CHECK(result->is_open_ended());
    }

    SECTION("Suffix range") {
        auto result = parse_range_header("bytes=-200");
        REQUIRE(result.has_value());
        CHECK(result->is_suffix());
        CHECK(result->end == 200);
    }

    SECTION("Single byte") {
        auto result = parse_range_header("bytes=7-7");
        REQUIRE(result.has_value());
        CHECK(result->start == 7);
        CHECK(result->end == 7);
    }
}

TEST_CASE("parse_range_header - invalid ranges", "[range]") {
    SECTION("Wrong unit") {
        auto result = parse_range_header("items=0-1");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == StreamErrc::invalid_preamble);
    }

    SECTION("Multiple ranges") {
        auto result = parse_range_header("bytes=0-1,2-3");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == StreamErrc::multi_range);
    }

    SECTION("End before start") {
        auto result = parse_range_header("bytes=10-5");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == StreamErrc::invalid_range);
    }

    SECTION("Garbage") {
        CHECK_FALSE(parse_range_header("bytes=abc-def").has_value());
        CHECK_FALSE(parse_range_header("bytes=").has_value());
        CHECK_FALSE(parse_range_header("bytes=-").has_value());
        CHECK_FALSE(parse_range_header("").has_value());
    }
}

TEST_CASE("RangeHeader::decode", "[range]") {
    SECTION("Bounded range gives offset and length") {
        RangeHeader hdr{100, 199};
        auto [offset, limit] = hdr.decode(1000);
        CHECK(offset == 100);
        CHECK(limit == 100);
    }

    SECTION("End past the file is clamped") {
        RangeHeader hdr{900, 5000};
        auto [offset, limit] = hdr.decode(1000);
        CHECK(offset == 900);
        CHECK(limit == 100);
    }

    SECTION("Suffix range reads to the end") {
        RangeHeader hdr{-1, 200};
        auto [offset, limit] = hdr.decode(1000);
        CHECK(offset == 800);
        CHECK(limit == -1);
    }

    SECTION("Open-ended range has no limit") {
        RangeHeader hdr{10, -1};
        auto [offset, limit] = hdr.decode(1000);
        CHECK(offset == 10);
        CHECK(limit == -1);
    }
}

TEST_CASE("fix_range_header", "[range]") {
    SECTION("Suffix becomes absolute") {
        auto fixed = fix_range_header(RangeHeader{-1, 200}, 1000);
        CHECK(fixed.start == 800);
        CHECK(fixed.end == 999);

        auto [offset, limit] = fixed.decode(1000);
        CHECK(offset == 800);
        CHECK(limit == 200);
    }

    SECTION("Suffix longer than the file starts at zero") {
        auto fixed = fix_range_header(RangeHeader{-1, 5000}, 1000);
        CHECK(fixed.start == 0);
        CHECK(fixed.end == 999);
    }

    SECTION("Open-ended range is closed at the last byte") {
        auto fixed = fix_range_header(RangeHeader{100, -1}, 1000);
        CHECK(fixed.start == 100);
        CHECK(fixed.end == 999);
    }

    SECTION("Oversized end is clamped") {
        auto fixed = fix_range_header(RangeHeader{0, 4096}, 1000);
        CHECK(fixed.end == 999);
    }

    SECTION("Empty file") {
        auto fixed = fix_range_header(RangeHeader{-1, 10}, 0);
        CHECK(fixed.start == 0);
        CHECK(fixed.end == 0);
    }
}

TEST_CASE("RangeHeader::to_string", "[range]") {
    CHECK(RangeHeader{0, 99}.to_string() == "bytes=0-99");
    CHECK(RangeHeader{5, -1}.to_string() == "bytes=5-");
    CHECK(RangeHeader{-1, 20}.to_string() == "bytes=-20");

    auto reparsed = parse_range_header(RangeHeader{-1, 20}.to_string());
    REQUIRE(reparsed.has_value());
    CHECK(*reparsed == RangeHeader{-1, 20});
}
