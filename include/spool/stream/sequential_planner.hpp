// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/stream/collaborators.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace spool::stream {

// Decoded length assumed for a segment whose offsets are not resolved yet.
// yEnc adds roughly 3% on top of the payload.
[[nodiscard]] std::int64_t estimated_decoded_size(const meta::SegmentRef& seg) noexcept;

// Segment id -> newsgroups, read from the archive kept beside a registration.
// Unreadable archives give an empty map.
[[nodiscard]] std::unordered_map<std::string, std::vector<std::string>>
load_segment_groups(const std::string& archive_path) noexcept;

// Walks segments in declaration order, laying them end to end, and keeps the
// contiguous run that covers the requested range.
class SequentialPlanner final : public SegmentPlanner {
public:
    [[nodiscard]] std::expected<SegmentPlan, std::error_code>
    build_plan(const meta::FileMetadata& meta, std::int64_t start, std::int64_t end,
               std::size_t max_segments) override;
};

} // namespace spool::stream
