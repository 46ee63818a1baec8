// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/stream/reader_factory.hpp>
#include <spool/core/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <format>

namespace spool::stream {

namespace {

std::string format_created(std::int64_t created_at) {
    if (created_at <= 0) {
        return "unknown";
    }
    auto tp = std::chrono::sys_seconds{std::chrono::seconds{created_at}};
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", tp);
}

std::int64_t age_seconds(std::int64_t created_at) {
    if (created_at <= 0) {
        return 0;
    }
    return std::max<std::int64_t>(0, meta::now_seconds() - created_at);
}

} // namespace

std::size_t compute_window(std::uint32_t workers, std::int64_t range_bytes) noexcept {
    const std::size_t w = workers == 0 ? core::DEFAULT_WORKERS : workers;

    if (range_bytes > core::BULK_READ_THRESHOLD) {
        return std::clamp<std::size_t>(w * core::BULK_WINDOW_PER_WORKER,
                                        core::BULK_WINDOW_MIN, core::BULK_WINDOW_MAX);
    }
    return std::clamp<std::size_t>(w * core::WINDOW_PER_WORKER, core::WINDOW_MIN, core::WINDOW_MAX);
}

SegmentReaderFactory::SegmentReaderFactory(std::shared_ptr<PoolProvider> pools,
                                           std::shared_ptr<SegmentPlanner> planner,
                                           std::shared_ptr<StreamOpener> opener,
                                           std::uint32_t workers) noexcept
    : pools_(std::move(pools))
    , planner_(std::move(planner))
    , opener_(std::move(opener))
    , workers_(workers == 0 ? core::DEFAULT_WORKERS : workers) {}

std::size_t SegmentReaderFactory::window_for(const meta::FileMetadata& meta,
                                             std::int64_t start, std::int64_t end) const noexcept {
    // Open-ended ranges run to the end of the file
    const auto last = end < 0 ? meta.file_size - 1 : end;
    return compute_window(workers_, last - start + 1);
}

std::expected<std::unique_ptr<ReadStream>, std::error_code>
SegmentReaderFactory::new_reader(std::stop_token stop, const meta::FileMetadata& meta,
                                 std::int64_t start, std::int64_t end) noexcept {
    if (!pools_) {
        spdlog::error("[stream] reader start={} end={} failed: connection pool not configured", start, end);
        return std::unexpected(make_error_code(core::StreamErrc::pool_not_configured));
    }
    if (!planner_ || !opener_) {
        spdlog::error("[stream] reader start={} end={} failed: segment planner not configured", start, end);
        return std::unexpected(make_error_code(core::StreamErrc::planner_not_configured));
    }

    try {
        if (stop.stop_requested()) {
            return std::unexpected(make_error_code(core::StreamErrc::cancelled));
        }

        auto pool = pools_->pool();
        if (!pool) {
            spdlog::error("[stream] reader start={} end={} pool error: {}", start, end, pool.error().message());
            return std::unexpected(pool.error());
        }
        if (!*pool) {
            return std::unexpected(make_error_code(core::StreamErrc::pool_not_configured));
        }

        const auto window = window_for(meta, start, end);
        auto plan = planner_->build_plan(meta, start, end, window);
        if (!plan) {
            spdlog::error("[stream] reader start={} end={} window={} plan error: {}",
                          start, end, window, plan.error().message());
            return std::unexpected(plan.error());
        }

        spdlog::info("[stream] reader start nzb=\"{}\" start={} end={} segments={} size={} groups={} created={} age={}s",
                     meta::trim_space(meta.source_archive_path), start, end, plan->count(),
                     meta.file_size, plan->summarize_groups(), format_created(meta.created_at),
                     age_seconds(meta.created_at));

        if (stop.stop_requested()) {
            return std::unexpected(make_error_code(core::StreamErrc::cancelled));
        }

        auto reader = opener_->open(stop, **pool, *plan, workers_);
        if (!reader) {
            spdlog::error("[stream] reader error start={} end={} segments={}: {}",
                          start, end, plan->count(), reader.error().message());
            return std::unexpected(reader.error());
        }

        // Cancelled while opening: release whatever the opener acquired
        if (stop.stop_requested()) {
            if (*reader) {
                (*reader)->close();
            }
            return std::unexpected(make_error_code(core::StreamErrc::cancelled));
        }

        return std::move(*reader);
    } catch (const std::exception& e) {
        spdlog::error("[stream] reader start={} end={} failed: {}", start, end, e.what());
        return std::unexpected(make_error_code(std::errc::not_enough_memory));
    }
}

} // namespace spool::stream
