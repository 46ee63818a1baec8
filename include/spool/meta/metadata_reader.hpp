// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/meta/metadata_store.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace spool::meta {

// Directory entry returned by listings
struct DirectoryEntry {
    std::string name;         // Last path component
    std::string path;         // Full virtual path
    std::int64_t modified_at{0};

    [[nodiscard]] bool is_dir() const noexcept { return true; }
};

struct FileEntry {
    std::string name;
    FileMetadata metadata;
};

struct DirectoryContents {
    std::vector<DirectoryEntry> directories;
    std::vector<FileEntry> files;
};

// Summary of a virtual file without its segment list
struct FileDescriptor {
    std::string virtual_path;
    std::string normalized_path;
    std::string source_archive;
    std::int64_t file_size{0};
    std::size_t segment_count{0};
    std::int64_t created_at{0};
    FileStatus status{FileStatus::healthy};
};

// Read-only query facade over the metadata store
class MetadataReader {
public:
    explicit MetadataReader(const MetadataStore& store) noexcept : store_(store) {}

    // Subdirectories and files directly under dir. Absent directories list as empty.
    [[nodiscard]] std::expected<DirectoryContents, std::error_code>
    list_directory_contents(std::string_view dir) const noexcept;

    [[nodiscard]] std::expected<DirectoryEntry, std::error_code>
    get_directory_info(std::string_view dir) const noexcept;

    [[nodiscard]] std::expected<std::optional<FileMetadata>, std::error_code>
    get_file_metadata(std::string_view path) const noexcept { return store_.read(path); }

    // File with metadata, or directory with at least one record beneath it
    [[nodiscard]] std::expected<bool, std::error_code> path_exists(std::string_view path) const noexcept;

    // Fails with not_found when the path is neither a file nor a directory
    [[nodiscard]] std::expected<bool, std::error_code> is_directory(std::string_view path) const noexcept;

    [[nodiscard]] std::expected<std::vector<SegmentRef>, std::error_code>
    get_file_segments(std::string_view path) const noexcept;

    [[nodiscard]] std::expected<FileDescriptor, std::error_code>
    describe_file(std::string_view path) const noexcept;

    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
    list_directory(std::string_view dir) const noexcept { return store_.list_directory(dir); }

    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
    list_subdirectories(std::string_view dir) const noexcept { return store_.list_subdirectories(dir); }

private:
    [[nodiscard]] DirectoryEntry make_entry(const std::string& path) const;

    const MetadataStore& store_;
};

} // namespace spool::meta
