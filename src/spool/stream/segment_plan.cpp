// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/stream/segment_plan.hpp>
#include <format>
#include <map>

namespace spool::stream {

std::int64_t SegmentPlan::planned_bytes() const noexcept {
    std::int64_t total = 0;
    for (const auto& seg : segments) {
        total += seg.read_length();
    }
    return total;
}

std::string SegmentPlan::summarize_groups() const {
    std::map<std::string, std::size_t> counts;
    for (const auto& seg : segments) {
        for (const auto& group : seg.groups) {
            ++counts[group];
        }
    }
    if (counts.empty()) {
        return "none";
    }

    std::string out;
    for (const auto& [group, count] : counts) {
        if (!out.empty()) out += ',';
        out += std::format("{}:{}", group, count);
    }
    return out;
}

} // namespace spool::stream
