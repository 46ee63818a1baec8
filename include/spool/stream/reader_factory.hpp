// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/config.hpp>
#include <spool/stream/collaborators.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <stop_token>

namespace spool::stream {

// Segment window for a request: workers*8 clamped to [20, 100], widened to
// workers*12 clamped to [30, 150] when the range exceeds the bulk-read threshold.
[[nodiscard]] std::size_t compute_window(std::uint32_t workers, std::int64_t range_bytes) noexcept;

// Opens range readers over remote segments with a bounded window per request
class SegmentReaderFactory {
public:
    SegmentReaderFactory(std::shared_ptr<PoolProvider> pools,
                         std::shared_ptr<SegmentPlanner> planner,
                         std::shared_ptr<StreamOpener> opener,
                         std::uint32_t workers = core::DEFAULT_WORKERS) noexcept;

    // end < 0 reads to the end of the file. Collaborator errors come back as-is.
    [[nodiscard]] std::expected<std::unique_ptr<ReadStream>, std::error_code>
    new_reader(std::stop_token stop, const meta::FileMetadata& meta,
               std::int64_t start, std::int64_t end) noexcept;

    [[nodiscard]] std::uint32_t workers() const noexcept { return workers_; }

    // Window that new_reader would request for this range
    [[nodiscard]] std::size_t window_for(const meta::FileMetadata& meta,
                                         std::int64_t start, std::int64_t end) const noexcept;

private:
    std::shared_ptr<PoolProvider> pools_;
    std::shared_ptr<SegmentPlanner> planner_;
    std::shared_ptr<StreamOpener> opener_;
    std::uint32_t workers_;
};

} // namespace spool::stream
