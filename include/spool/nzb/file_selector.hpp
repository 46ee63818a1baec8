// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/nzb/nzb_document.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace spool::nzb {

// Rank given to containers that are not in the preference table
constexpr int UNRANKED_EXTENSION = 9;

// The file chosen for streaming out of a multi-file archive
struct SelectedFile {
    std::string subject;
    std::vector<NzbSegment> segments;     // Only usable segments, declaration order
    std::vector<std::string> groups;
    std::int64_t declared_size{0};        // Sum of encoded segment sizes
    std::int64_t decoded_size{0};         // From the yEnc marker, 0 when absent
    int extension_rank{UNRANKED_EXTENSION};

    // Decoded size when known; otherwise the encoded sum, which overestimates by the yEnc overhead
    [[nodiscard]] std::int64_t total_size() const noexcept {
        return decoded_size > 0 ? decoded_size : declared_size;
    }
};

// Pick the best streamable file: lowest extension rank, ties broken by larger declared size.
// Parity, verification and info files never qualify.
[[nodiscard]] std::expected<SelectedFile, std::error_code>
select_streamable_file(const NzbDocument& doc) noexcept;

// True for par2/par/srr/sfv/nfo subjects
[[nodiscard]] bool should_skip_subject(std::string_view subject) noexcept;

// Size following the "yEnc" marker, e.g. `"video.mkv" yEnc 1314508577 (1/1834)`. 0 when absent.
[[nodiscard]] std::int64_t extract_decoded_size(std::string_view subject) noexcept;

// Container extension found in a subject (lowercase, with dot), empty when none is recognized
[[nodiscard]] std::string detect_container_extension(std::string_view subject);

[[nodiscard]] int extension_rank(std::string_view extension) noexcept;

// Strip separators and unsafe characters: " ../Some Movie!.mkv  " -> "Some_Movie_.mkv"
[[nodiscard]] std::string sanitize_file_name(std::string_view name);

} // namespace spool::nzb
