// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/stream/health_reporter.hpp>
#include <spdlog/spdlog.h>
#include <variant>

namespace spool::stream {

void HealthReporter::report(std::string_view path, const core::ReadFailure& failure) noexcept {
    if (const auto* partial = std::get_if<core::PartialContentError>(&failure)) {
        mark_partial(path, *partial);
    } else if (const auto* corrupted = std::get_if<core::CorruptedFileError>(&failure)) {
        mark_corrupted(path, *corrupted);
    }
}

void MetadataHealthReporter::mark_partial(std::string_view path, const core::PartialContentError& failure) noexcept {
    try {
        spdlog::warn("[health] {} partial: {}", path, failure.message());
    } catch (const std::exception&) {
        // Logging only
    }
    if (auto err = store_.update_status(path, meta::FileStatus::partial)) {
        spdlog::warn("[health] cannot mark {} partial: {}", path, err.message());
    }
}

void MetadataHealthReporter::mark_corrupted(std::string_view path, const core::CorruptedFileError& failure) noexcept {
    try {
        spdlog::error("[health] {} corrupted: {}", path, failure.message());
    } catch (const std::exception&) {
        // Logging only
    }
    if (auto err = store_.update_status(path, meta::FileStatus::corrupted)) {
        spdlog::warn("[health] cannot mark {} corrupted: {}", path, err.message());
    }
}

} // namespace spool::stream
