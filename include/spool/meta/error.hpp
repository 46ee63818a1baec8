// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace spool::meta {

enum class StoreErrc {
    success = 0,
    invalid_path,
    not_found,
    read_error,
    write_error,
    corrupt_record,
    missing_encryption_params,
    invalid_segment,
};

namespace detail {

struct StoreErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "spool::store";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<StoreErrc>(ev)) {
            case StoreErrc::success:                   return "Success";
            case StoreErrc::invalid_path:              return "Invalid virtual path";
            case StoreErrc::not_found:                 return "Metadata not found";
            case StoreErrc::read_error:                return "Read error";
            case StoreErrc::write_error:               return "Write error";
            case StoreErrc::corrupt_record:            return "Corrupt metadata record";
            case StoreErrc::missing_encryption_params: return "Encryption requires key and IV";
            case StoreErrc::invalid_segment:           return "Invalid segment reference";
            default:                                   return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::StoreErrcCategory& store_errc_category() noexcept {
    static detail::StoreErrcCategory category;
    return category;
}

inline std::error_code make_error_code(StoreErrc e) noexcept {
    return {static_cast<int>(e), store_errc_category()};
}

} // namespace spool::meta

namespace std {

template<>
struct is_error_code_enum<spool::meta::StoreErrc> : true_type {};

} // namespace std
