// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/error.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace spool::nzb {

struct NzbSegment {
    std::string id;            // Message-ID without angle brackets, as written in the document
    std::int64_t bytes{0};     // Encoded article size
    std::int32_t number{0};
};

struct NzbFile {
    std::string subject;
    std::string poster;
    std::int64_t date{0};
    std::vector<std::string> groups;
    std::vector<NzbSegment> segments;   // Declaration order
};

struct NzbDocument {
    std::map<std::string, std::string> head;   // <meta type="...">value</meta>
    std::vector<NzbFile> files;
};

// Parse an NZB document. Fails with malformed_archive on invalid XML.
[[nodiscard]] std::expected<NzbDocument, std::error_code> parse_nzb(std::string_view xml) noexcept;

} // namespace spool::nzb
