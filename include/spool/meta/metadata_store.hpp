// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/meta/error.hpp>
#include <spool/meta/file_metadata.hpp>
#include <array>
#include <atomic>
#include <expected>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace spool::meta {

// Normalize a caller-supplied virtual path: lexical cleanup, no leading or trailing
// separator, root becomes "". Paths escaping the root are rejected.
[[nodiscard]] std::expected<std::string, std::error_code>
normalize_virtual_path(std::string_view path) noexcept;

// Durable mapping from virtual path to FileMetadata.
//
// Each record lives at <root>/<virtual path>.meta. Directories are never stored as
// nodes of their own: a directory exists while at least one record lives beneath it.
// Writes go through a temp file and a rename, so readers never see a partial record.
// Writers to the same path are serialized; writers to different paths run concurrently.
class MetadataStore {
public:
    using Mutator = std::function<void(FileMetadata&)>;

    explicit MetadataStore(std::filesystem::path root);

    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    // Pure constructor, does not touch storage
    [[nodiscard]] std::expected<FileMetadata, std::error_code>
    create(std::int64_t size,
           std::string source_archive_path,
           FileStatus status,
           std::vector<SegmentRef> segments,
           Encryption encryption = Encryption::none,
           std::string key_ref = {},
           std::string iv = {}) const;

    // Persist or overwrite a record, creating parent directories as needed.
    // Segment ids are trimmed; a record with an invalid segment fails with invalid_segment.
    [[nodiscard]] std::error_code write(std::string_view path, const FileMetadata& meta) noexcept;

    // std::nullopt means "not found", which is not an error
    [[nodiscard]] std::expected<std::optional<FileMetadata>, std::error_code>
    read(std::string_view path) const noexcept;

    // Read-modify-write. Fails with not_found when absent. modified_at always moves forward.
    [[nodiscard]] std::error_code update(std::string_view path, const Mutator& mutator) noexcept;
    [[nodiscard]] std::error_code update_status(std::string_view path, FileStatus status) noexcept;

    // Idempotent. Parent directories left empty are pruned.
    [[nodiscard]] std::error_code remove(std::string_view path) noexcept;

    // Remove every record beneath a directory. Idempotent.
    [[nodiscard]] std::error_code remove_directory(std::string_view dir) noexcept;

    [[nodiscard]] bool exists(std::string_view path) const noexcept;
    [[nodiscard]] bool directory_exists(std::string_view dir) const noexcept;

    // Immediate file children (names only). Empty when the directory is absent.
    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
    list_directory(std::string_view dir) const noexcept;

    // Immediate subdirectories holding at least one record, as virtual paths
    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
    list_subdirectories(std::string_view dir) const noexcept;

    // On-disk locations
    [[nodiscard]] std::filesystem::path record_path(std::string_view normalized) const;
    [[nodiscard]] std::filesystem::path directory_path(std::string_view normalized) const;
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    static constexpr std::size_t LOCK_STRIPES = 64;

    [[nodiscard]] std::mutex& lock_for(std::string_view normalized) const noexcept;
    [[nodiscard]] std::expected<std::optional<FileMetadata>, std::error_code>
    read_record(std::string_view normalized) const noexcept;
    [[nodiscard]] std::error_code write_record(std::string_view normalized, const FileMetadata& meta) noexcept;
    void prune_empty_parents(std::filesystem::path dir) const noexcept;

    std::filesystem::path root_;
    mutable std::array<std::mutex, LOCK_STRIPES> stripes_;
    // Shared by writers between directory creation and rename, exclusive while pruning
    mutable std::shared_mutex tree_mutex_;
    std::atomic<std::uint64_t> temp_counter_{0};
};

} // namespace spool::meta
