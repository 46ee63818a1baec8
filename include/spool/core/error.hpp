// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace spool::core {

enum class StreamErrc {
    success = 0,
    invalid_range,
    multi_range,
    invalid_preamble,
    invalid_encoding,
    invalid_number,
    malformed_archive,
    no_files,
    no_usable_segments,
    unknown_size,
    pool_not_configured,
    planner_not_configured,
    store_not_configured,
    cancelled,
    partial_content,
    corrupted_file,
    not_found,
    not_a_directory,
    invalid_config,
};

namespace detail {

struct StreamErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "spool::stream";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<StreamErrc>(ev)) {
            case StreamErrc::success:                return "Success";
            case StreamErrc::invalid_range:          return "Invalid byte range";
            case StreamErrc::multi_range:            return "Multiple ranges are not supported";
            case StreamErrc::invalid_preamble:       return "Range unit is not bytes";
            case StreamErrc::invalid_encoding:       return "Malformed percent-encoding";
            case StreamErrc::invalid_number:         return "Value is not a valid integer";
            case StreamErrc::malformed_archive:      return "Malformed NZB document";
            case StreamErrc::no_files:               return "NZB declares no files";
            case StreamErrc::no_usable_segments:     return "NZB contains no usable segments";
            case StreamErrc::unknown_size:           return "Unable to determine file size";
            case StreamErrc::pool_not_configured:    return "Connection pool not configured";
            case StreamErrc::planner_not_configured: return "Segment planner not configured";
            case StreamErrc::store_not_configured:   return "Metadata store not configured";
            case StreamErrc::cancelled:              return "Operation cancelled";
            case StreamErrc::partial_content:        return "Partial content";
            case StreamErrc::corrupted_file:         return "File is corrupted, segments are missing";
            case StreamErrc::not_found:              return "Path does not exist";
            case StreamErrc::not_a_directory:        return "Not a directory";
            case StreamErrc::invalid_config:         return "Invalid configuration";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::StreamErrcCategory& stream_errc_category() noexcept {
    static detail::StreamErrcCategory category;
    return category;
}

inline std::error_code make_error_code(StreamErrc e) noexcept {
    return {static_cast<int>(e), stream_errc_category()};
}

} // namespace spool::core

namespace std {

template<>
struct is_error_code_enum<spool::core::StreamErrc> : true_type {};

} // namespace std
