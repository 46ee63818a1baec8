// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/path_args.hpp>
#include <curl/curl.h>
#include <cctype>
#include <charconv>
#include <memory>
#include <new>

namespace spool::core {

namespace {

// RAII holder for strings allocated by libcurl
struct CurlString {
    char* ptr = nullptr;

    CurlString() = default;
    explicit CurlString(char* p) : ptr(p) {}
    ~CurlString() { if (ptr) curl_free(ptr); }

    CurlString(const CurlString&) = delete;
    CurlString& operator=(const CurlString&) = delete;
};

bool is_hex(char c) noexcept {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string query_escape(std::string_view value) {
    if (value.empty()) {
        return {};
    }
    CurlString escaped(curl_easy_escape(nullptr, value.data(), static_cast<int>(value.size())));
    if (!escaped.ptr) {
        throw std::bad_alloc();
    }
    return std::string(escaped.ptr);
}

std::expected<std::string, std::error_code> query_unescape(std::string_view value) noexcept {
    try {
        // libcurl passes malformed escapes through untouched, so validate first
        std::string form;
        form.reserve(value.size());
        for (std::size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (c == '%') {
                if (i + 2 >= value.size() || !is_hex(value[i + 1]) || !is_hex(value[i + 2])) {
                    return std::unexpected(make_error_code(StreamErrc::invalid_encoding));
                }
            }
            form += (c == '+') ? ' ' : c;
        }

        if (form.empty()) {
            return form;
        }

        int out_len = 0;
        CurlString decoded(curl_easy_unescape(nullptr, form.data(), static_cast<int>(form.size()), &out_len));
        if (!decoded.ptr) {
            return std::unexpected(make_error_code(StreamErrc::invalid_encoding));
        }
        return std::string(decoded.ptr, static_cast<std::size_t>(out_len));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StreamErrc::invalid_encoding));
    }
}

std::expected<PathWithArgs, std::error_code> PathWithArgs::parse(std::string_view text) noexcept {
    try {
        auto sep = text.rfind(ARGS_SEPARATOR);
        if (sep == std::string_view::npos) {
            return PathWithArgs(std::string(text));
        }

        PathWithArgs result(std::string(text.substr(0, sep)));
        auto query = text.substr(sep + ARGS_SEPARATOR.size());

        while (!query.empty()) {
            auto amp = query.find('&');
            auto pair = query.substr(0, amp);
            query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);

            if (pair.empty()) continue;

            auto eq = pair.find('=');
            auto key = query_unescape(pair.substr(0, eq));
            if (!key) {
                return std::unexpected(key.error());
            }
            std::string value;
            if (eq != std::string_view::npos) {
                auto decoded = query_unescape(pair.substr(eq + 1));
                if (!decoded) {
                    return std::unexpected(decoded.error());
                }
                value = std::move(*decoded);
            }
            // First occurrence wins
            result.args_.try_emplace(std::move(*key), std::move(value));
        }

        return result;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StreamErrc::invalid_encoding));
    }
}

std::string PathWithArgs::to_string() const {
    // A path holding the separator needs a trailing one so parse() splits after it
    if (args_.empty() && path_.find(ARGS_SEPARATOR) == std::string::npos) {
        return path_;
    }

    std::string result = path_;
    result += ARGS_SEPARATOR;
    bool first = true;
    for (const auto& [key, value] : args_) {
        if (!first) result += '&';
        first = false;
        result += query_escape(key);
        result += '=';
        result += query_escape(value);
    }
    return result;
}

void PathWithArgs::set(std::string_view key, std::string_view value) {
    args_.insert_or_assign(std::string(key), std::string(value));
}

std::optional<std::string_view> PathWithArgs::get(std::string_view key) const noexcept {
    auto it = args_.find(key);
    if (it == args_.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

void PathWithArgs::set_file_size(std::int64_t size) {
    set(FILE_SIZE_KEY, std::to_string(size));
}

std::expected<std::optional<RangeHeader>, std::error_code> PathWithArgs::range() const noexcept {
    auto value = get(RANGE_KEY);
    if (!value || value->empty()) {
        return std::optional<RangeHeader>{};
    }
    auto parsed = parse_range_header(*value);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return std::optional<RangeHeader>{*parsed};
}

std::expected<std::int64_t, std::error_code> PathWithArgs::file_size() const noexcept {
    auto value = get(FILE_SIZE_KEY);
    if (!value || value->empty()) {
        return std::unexpected(make_error_code(StreamErrc::invalid_number));
    }
    std::int64_t size = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), size);
    if (ec != std::errc{} || ptr != value->data() + value->size()) {
        return std::unexpected(make_error_code(StreamErrc::invalid_number));
    }
    return size;
}

std::string PathWithArgs::origin() const {
    auto value = get(ORIGIN_KEY);
    return value ? std::string(*value) : std::string{};
}

} // namespace spool::core
