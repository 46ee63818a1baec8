// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace spool::stream {

// One article to fetch, with the decoded byte window to keep from it
struct PlannedSegment {
    std::string id;
    std::int64_t segment_size{0};     // Decoded length used for planning
    std::int64_t file_offset{0};      // File offset of the segment's first decoded byte
    std::int64_t read_start{0};       // Inclusive, relative to the segment
    std::int64_t read_end{0};         // Inclusive, relative to the segment
    std::vector<std::string> groups;

    [[nodiscard]] std::int64_t read_length() const noexcept { return read_end - read_start + 1; }
};

// Contiguous, order-preserving run of segments covering a byte range
struct SegmentPlan {
    std::int64_t range_start{0};
    std::int64_t range_end{0};
    std::vector<PlannedSegment> segments;

    [[nodiscard]] std::size_t count() const noexcept { return segments.size(); }

    // Bytes the plan delivers; may fall short of the range when the window was capped
    [[nodiscard]] std::int64_t planned_bytes() const noexcept;

    // "none", or "group:count" pairs sorted by group name
    [[nodiscard]] std::string summarize_groups() const;
};

} // namespace spool::stream
