// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/stream/sequential_planner.hpp>
#include <spool/core/error.hpp>
#include <spool/nzb/nzb_document.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <iterator>

namespace spool::stream {

std::int64_t estimated_decoded_size(const meta::SegmentRef& seg) noexcept {
    if (seg.decoded) {
        auto len = seg.decoded->length();
        if (len > 0) return len;
    }
    auto estimate = (seg.segment_size * 97) / 100;
    return estimate > 0 ? estimate : seg.segment_size;
}

std::unordered_map<std::string, std::vector<std::string>>
load_segment_groups(const std::string& archive_path) noexcept {
    std::unordered_map<std::string, std::vector<std::string>> groups;
    if (archive_path.empty()) {
        return groups;
    }

    try {
        std::ifstream file(archive_path, std::ios::binary);
        if (!file) {
            spdlog::warn("[planner] cannot open archive {} for groups", archive_path);
            return groups;
        }
        std::string xml((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        auto doc = nzb::parse_nzb(xml);
        if (!doc) {
            spdlog::warn("[planner] cannot parse archive {} for groups: {}", archive_path, doc.error().message());
            return groups;
        }
        for (const auto& f : doc->files) {
            for (const auto& seg : f.segments) {
                auto id = meta::trim_space(seg.id);
                if (!id.empty()) {
                    groups[std::string(id)] = f.groups;
                }
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("[planner] group lookup for {} failed: {}", archive_path, e.what());
        groups.clear();
    }
    return groups;
}

std::expected<SegmentPlan, std::error_code>
SequentialPlanner::build_plan(const meta::FileMetadata& meta, std::int64_t start, std::int64_t end,
                              std::size_t max_segments) {
    if (meta.file_size <= 0 || start < 0 || start >= meta.file_size) {
        return std::unexpected(make_error_code(core::StreamErrc::invalid_range));
    }
    if (end < 0 || end >= meta.file_size) {
        end = meta.file_size - 1;
    }
    if (end < start) {
        return std::unexpected(make_error_code(core::StreamErrc::invalid_range));
    }

    auto groups = load_segment_groups(meta.source_archive_path);

    SegmentPlan plan;
    plan.range_start = start;
    plan.range_end = end;

    std::int64_t cursor = 0;
    for (const auto& seg : meta.segments) {
        const auto size = estimated_decoded_size(seg);
        if (size <= 0) {
            continue;
        }

        const auto seg_start = cursor;
        const auto seg_end = cursor + size - 1;
        cursor += size;

        if (seg_end < start) {
            continue;
        }
        if (seg_start > end) {
            break;
        }

        PlannedSegment planned;
        planned.id = seg.id;
        planned.segment_size = size;
        planned.file_offset = seg_start;
        planned.read_start = std::max(start, seg_start) - seg_start;
        planned.read_end = std::min(end, seg_end) - seg_start;
        if (auto it = groups.find(seg.id); it != groups.end()) {
            planned.groups = it->second;
        }
        plan.segments.push_back(std::move(planned));

        if (max_segments > 0 && plan.segments.size() >= max_segments) {
            spdlog::debug("[planner] segment limit reached max={}", max_segments);
            break;
        }
        if (seg_end >= end) {
            break;
        }
    }

    if (plan.segments.empty()) {
        return std::unexpected(make_error_code(core::StreamErrc::no_usable_segments));
    }
    return plan;
}

} // namespace spool::stream
