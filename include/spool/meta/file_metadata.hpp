// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/meta/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spool::meta {

enum class FileStatus : std::uint8_t {
    healthy,
    partial,
    corrupted,
};

enum class Encryption : std::uint8_t {
    none,
    rclone,
};

[[nodiscard]] std::string_view to_string(FileStatus status) noexcept;
[[nodiscard]] std::string_view to_string(Encryption encryption) noexcept;
[[nodiscard]] std::optional<FileStatus> parse_status(std::string_view text) noexcept;
[[nodiscard]] std::optional<Encryption> parse_encryption(std::string_view text) noexcept;

// Decoded byte-stream coordinates of a segment, both inclusive
struct DecodedSpan {
    std::int64_t start{0};
    std::int64_t end{0};

    [[nodiscard]] std::int64_t length() const noexcept { return end - start + 1; }

    constexpr bool operator==(const DecodedSpan&) const = default;
};

// One remote article backing part of a file
struct SegmentRef {
    std::string id;
    std::int64_t segment_size{0};        // Encoded size as declared by the archive
    std::optional<DecodedSpan> decoded;   // Unresolved until the fetch layer decodes the article

    [[nodiscard]] bool is_resolved() const noexcept { return decoded.has_value(); }
    [[nodiscard]] bool valid() const noexcept { return segment_size > 0 && !id.empty(); }

    bool operator==(const SegmentRef&) const = default;
};

// Metadata for one virtual file. Treated as an immutable value: updates replace the whole record.
struct FileMetadata {
    std::int64_t file_size{0};
    std::string source_archive_path;
    FileStatus status{FileStatus::healthy};
    std::vector<SegmentRef> segments;
    Encryption encryption{Encryption::none};
    std::string key_ref;                  // Set only when encrypted
    std::string iv;                       // Set only when encrypted
    std::int64_t created_at{0};
    std::int64_t modified_at{0};

    bool operator==(const FileMetadata&) const = default;

    // Build a record without touching storage. Invalid segments are dropped and ids trimmed;
    // encrypted records require key and IV.
    [[nodiscard]] static std::expected<FileMetadata, std::error_code>
    create(std::int64_t size,
           std::string source_archive_path,
           FileStatus status,
           std::vector<SegmentRef> segments,
           Encryption encryption = Encryption::none,
           std::string key_ref = {},
           std::string iv = {});

    // JSON record encoding used by the store
    [[nodiscard]] std::string to_json() const;
    [[nodiscard]] static std::expected<FileMetadata, std::error_code> from_json(std::string_view json) noexcept;
};

// Seconds since epoch
[[nodiscard]] std::int64_t now_seconds() noexcept;

// Trim ASCII whitespace from both ends
[[nodiscard]] std::string_view trim_space(std::string_view s) noexcept;

} // namespace spool::meta
