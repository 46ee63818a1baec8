// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/read_error.hpp>
#include <format>

namespace spool::core {

std::string PartialContentError::message() const {
    return std::format("partial content: read {}/{} bytes, underlying error: {}",
                       bytes_read, total_expected, cause.message());
}

std::string CorruptedFileError::message() const {
    return std::format("corrupted file: no content available from {} expected bytes, underlying error: {}",
                       total_expected, cause.message());
}

ReadFailure classify_read_failure(std::int64_t bytes_read,
                                  std::int64_t total_expected,
                                  std::error_code cause) noexcept {
    if (bytes_read <= 0 && total_expected > 0) {
        return CorruptedFileError{total_expected, cause};
    }
    return PartialContentError{bytes_read, total_expected, cause};
}

std::error_code failure_code(const ReadFailure& failure) noexcept {
    return std::visit([](const auto& f) { return f.code(); }, failure);
}

std::error_code failure_cause(const ReadFailure& failure) noexcept {
    return std::visit([](const auto& f) { return f.cause; }, failure);
}

std::string failure_message(const ReadFailure& failure) {
    return std::visit([](const auto& f) { return f.message(); }, failure);
}

} // namespace spool::core
