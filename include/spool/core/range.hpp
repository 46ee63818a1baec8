// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace spool::core {

// Single HTTP byte range. Three shapes:
//   {start, end}  bounded, both inclusive
//   {start, -1}   open-ended, start to end of resource
//   {-1, n}       suffix, the last n bytes
struct RangeHeader {
    std::int64_t start{0};
    std::int64_t end{-1};

    [[nodiscard]] bool is_suffix() const noexcept { return start == -1; }
    [[nodiscard]] bool is_open_ended() const noexcept { return start >= 0 && end == -1; }

    // Zero-based offset and byte count. A limit of -1 means "read to end".
    [[nodiscard]] std::pair<std::int64_t, std::int64_t> decode(std::int64_t total_size) const noexcept;

    // Serialize back to "bytes=..." form
    [[nodiscard]] std::string to_string() const;

    constexpr bool operator==(const RangeHeader&) const = default;
};

// Parse "bytes=START-END", "bytes=START-" or "bytes=-SUFFIX"
[[nodiscard]] std::expected<RangeHeader, std::error_code>
parse_range_header(std::string_view text) noexcept;

// Resolve suffix and open-ended ranges against a known size and clamp to [0, total_size - 1]
[[nodiscard]] RangeHeader fix_range_header(const RangeHeader& header, std::int64_t total_size) noexcept;

} // namespace spool::core
