// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/error.hpp>
#include <spool/core/range.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace spool::core {

// Separator between a virtual path and its encoded argument block
constexpr std::string_view ARGS_SEPARATOR = "?ARGS?";

// Argument keys, kept identical to what the WebDAV layer emits
constexpr std::string_view RANGE_KEY = "webdav context key rangeKey";
constexpr std::string_view FILE_SIZE_KEY = "webdav context key fileSizeKey";
constexpr std::string_view IS_COPY_KEY = "webdav context key isCopyKey";
constexpr std::string_view ORIGIN_KEY = "webdav context key originKey";

// A virtual path carrying a bag of string arguments through layers that only pass one string
class PathWithArgs {
public:
    PathWithArgs() = default;
    explicit PathWithArgs(std::string path) : path_(std::move(path)) {}

    // Split "<path>?ARGS?<query>" and decode the query block
    static std::expected<PathWithArgs, std::error_code> parse(std::string_view text) noexcept;

    // Deterministic encoding; keys are emitted in sorted order
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    void path(std::string p) noexcept { path_ = std::move(p); }

    [[nodiscard]] const std::map<std::string, std::string, std::less<>>& args() const noexcept { return args_; }
    void set(std::string_view key, std::string_view value);
    [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const noexcept;

    void set_range(std::string_view range) { set(RANGE_KEY, range); }
    void set_file_size(std::string_view size) { set(FILE_SIZE_KEY, size); }
    void set_file_size(std::int64_t size);
    void set_is_copy() { set(IS_COPY_KEY, "true"); }
    void set_origin(std::string_view origin) { set(ORIGIN_KEY, origin); }

    // Absent range is not an error
    [[nodiscard]] std::expected<std::optional<RangeHeader>, std::error_code> range() const noexcept;
    [[nodiscard]] std::expected<std::int64_t, std::error_code> file_size() const noexcept;
    [[nodiscard]] bool is_copy() const noexcept { return args_.contains(IS_COPY_KEY); }
    [[nodiscard]] std::string origin() const;

    bool operator==(const PathWithArgs&) const = default;

private:
    std::string path_;
    std::map<std::string, std::string, std::less<>> args_;
};

// Percent-encoding helpers for the argument block
[[nodiscard]] std::string query_escape(std::string_view value);
[[nodiscard]] std::expected<std::string, std::error_code> query_unescape(std::string_view value) noexcept;

} // namespace spool::core
