// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/read_error.hpp>
#include <spool/meta/metadata_store.hpp>
#include <string_view>

namespace spool::stream {

// Records damage discovered while streaming a virtual file
class HealthReporter {
public:
    virtual ~HealthReporter() = default;

    virtual void mark_partial(std::string_view path, const core::PartialContentError& failure) noexcept = 0;
    virtual void mark_corrupted(std::string_view path, const core::CorruptedFileError& failure) noexcept = 0;

    // Dispatch a classified read failure
    void report(std::string_view path, const core::ReadFailure& failure) noexcept;
};

// Persists health into the file's metadata record
class MetadataHealthReporter final : public HealthReporter {
public:
    explicit MetadataHealthReporter(meta::MetadataStore& store) noexcept : store_(store) {}

    void mark_partial(std::string_view path, const core::PartialContentError& failure) noexcept override;
    void mark_corrupted(std::string_view path, const core::CorruptedFileError& failure) noexcept override;

private:
    meta::MetadataStore& store_;
};

} // namespace spool::stream
