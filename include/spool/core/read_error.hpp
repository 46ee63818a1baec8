// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/error.hpp>
#include <cstdint>
#include <string>
#include <variant>

namespace spool::core {

// A read produced some bytes before the source failed. Recoverable by the caller.
struct PartialContentError {
    std::int64_t bytes_read{0};
    std::int64_t total_expected{0};
    std::error_code cause;

    [[nodiscard]] std::string message() const;
    [[nodiscard]] std::error_code code() const noexcept { return make_error_code(StreamErrc::partial_content); }
};

// No bytes were available against a nonzero expectation. Terminal for that read.
struct CorruptedFileError {
    std::int64_t total_expected{0};
    std::error_code cause;

    [[nodiscard]] std::string message() const;
    [[nodiscard]] std::error_code code() const noexcept { return make_error_code(StreamErrc::corrupted_file); }
};

using ReadFailure = std::variant<PartialContentError, CorruptedFileError>;

// Decide which failure a broken read represents
[[nodiscard]] ReadFailure classify_read_failure(std::int64_t bytes_read,
                                                std::int64_t total_expected,
                                                std::error_code cause) noexcept;

[[nodiscard]] std::error_code failure_code(const ReadFailure& failure) noexcept;
[[nodiscard]] std::error_code failure_cause(const ReadFailure& failure) noexcept;
[[nodiscard]] std::string failure_message(const ReadFailure& failure);

} // namespace spool::core
