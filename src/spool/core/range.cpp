// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/range.hpp>
#include <algorithm>
#include <charconv>
#include <format>

namespace spool::core {

namespace {

constexpr std::string_view RANGE_PREAMBLE = "bytes=";

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool parse_offset(std::string_view s, std::int64_t& out) noexcept {
    s = trim(s);
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size() && out >= 0;
}

} // namespace

std::expected<RangeHeader, std::error_code>
parse_range_header(std::string_view text) noexcept {
    text = trim(text);
    if (!text.starts_with(RANGE_PREAMBLE)) {
        return std::unexpected(make_error_code(StreamErrc::invalid_preamble));
    }
    auto ranges = text.substr(RANGE_PREAMBLE.size());

    if (ranges.find(',') != std::string_view::npos) {
        return std::unexpected(make_error_code(StreamErrc::multi_range));
    }

    auto dash = ranges.find('-');
    if (dash == std::string_view::npos) {
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }

    auto first = trim(ranges.substr(0, dash));
    auto second = trim(ranges.substr(dash + 1));

    RangeHeader header;

    if (first.empty()) {
        // Suffix range: last N bytes
        std::int64_t suffix = 0;
        if (!parse_offset(second, suffix)) {
            return std::unexpected(make_error_code(StreamErrc::invalid_range));
        }
        header.start = -1;
        header.end = suffix;
        return header;
    }

    if (!parse_offset(first, header.start)) {
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }

    if (second.empty()) {
        header.end = -1;
        return header;
    }

    if (!parse_offset(second, header.end) || header.end < header.start) {
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }

    return header;
}

std::pair<std::int64_t, std::int64_t> RangeHeader::decode(std::int64_t total_size) const noexcept {
    if (is_suffix()) {
        return {std::max<std::int64_t>(0, total_size - end), -1};
    }
    if (is_open_ended()) {
        return {start, -1};
    }

    auto last = end;
    if (total_size > 0 && last > total_size - 1) {
        last = total_size - 1;
    }
    return {start, std::max<std::int64_t>(0, last - start + 1)};
}

std::string RangeHeader::to_string() const {
    if (is_suffix()) {
        return std::format("bytes=-{}", end);
    }
    if (is_open_ended()) {
        return std::format("bytes={}-", start);
    }
    return std::format("bytes={}-{}", start, end);
}

RangeHeader fix_range_header(const RangeHeader& header, std::int64_t total_size) noexcept {
    if (total_size <= 0) {
        return {0, 0};
    }

    const std::int64_t last = total_size - 1;
    RangeHeader fixed = header;

    if (header.is_suffix()) {
        fixed.start = std::max<std::int64_t>(0, total_size - header.end);
        fixed.end = last;
        return fixed;
    }

    if (header.is_open_ended() || fixed.end > last) {
        fixed.end = last;
    }
    fixed.start = std::clamp<std::int64_t>(fixed.start, 0, last);
    fixed.end = std::clamp<std::int64_t>(fixed.end, fixed.start, last);
    return fixed;
}

} // namespace spool::core
