// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/nzb/file_selector.hpp>
#include <spool/meta/file_metadata.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace spool::nzb {

namespace {

constexpr std::array<std::string_view, 5> SKIP_FRAGMENTS = {
    ".par2", ".par", ".srr", ".sfv", ".nfo",
};

// Ordered by how well the container streams
constexpr std::array<std::string_view, 8> CONTAINER_PREFERENCE = {
    ".mp4", ".mkv", ".ts", ".m2ts", ".mts", ".avi", ".mov", ".webm",
};

constexpr std::string_view SIZE_MARKER = "yEnc";

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
bool is_space(char c) noexcept { return c == ' ' || c == '\t'; }

bool is_safe_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
}

// Extension after the last dot of a file name
std::string_view extension_of(std::string_view name) noexcept {
    auto dot = name.rfind('.');
    auto slash = name.find_last_of("/\\");
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
        return {};
    }
    return name.substr(dot);
}

// File name between the last pair of double quotes, if any
std::string_view quoted_name(std::string_view subject) noexcept {
    auto close = subject.rfind('"');
    if (close == std::string_view::npos || close == 0) {
        return {};
    }
    auto open = subject.rfind('"', close - 1);
    if (open == std::string_view::npos) {
        return {};
    }
    return subject.substr(open + 1, close - open - 1);
}

} // namespace

bool should_skip_subject(std::string_view subject) noexcept {
    try {
        auto lower = to_lower(subject);
        return std::any_of(SKIP_FRAGMENTS.begin(), SKIP_FRAGMENTS.end(), [&](std::string_view fragment) {
            return lower.find(fragment) != std::string::npos;
        });
    } catch (const std::exception&) {
        return false;
    }
}

std::int64_t extract_decoded_size(std::string_view subject) noexcept {
    auto marker = subject.find(SIZE_MARKER);
    if (marker == std::string_view::npos) {
        return 0;
    }

    auto rest = subject.substr(marker + SIZE_MARKER.size());
    while (!rest.empty() && is_space(rest.front())) {
        rest.remove_prefix(1);
    }

    std::size_t len = 0;
    while (len < rest.size() && is_digit(rest[len])) {
        ++len;
    }
    if (len == 0) {
        return 0;
    }
    // The run must end the token; "1/612" is a part counter, not a size
    if (len < rest.size() && !is_space(rest[len]) && rest[len] != '(') {
        return 0;
    }

    std::int64_t size = 0;
    auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + len, size);
    if (ec != std::errc{}) {
        return 0;
    }
    return size;
}

int extension_rank(std::string_view extension) noexcept {
    auto it = std::find(CONTAINER_PREFERENCE.begin(), CONTAINER_PREFERENCE.end(), extension);
    if (it == CONTAINER_PREFERENCE.end()) {
        return UNRANKED_EXTENSION;
    }
    return static_cast<int>(std::distance(CONTAINER_PREFERENCE.begin(), it));
}

std::string detect_container_extension(std::string_view subject) {
    auto lower = to_lower(meta::trim_space(subject));
    if (lower.empty()) {
        return {};
    }

    auto quoted = quoted_name(lower);
    auto ext = extension_of(quoted.empty() ? std::string_view(lower) : quoted);
    if (extension_rank(ext) != UNRANKED_EXTENSION) {
        return std::string(ext);
    }

    for (auto candidate : CONTAINER_PREFERENCE) {
        std::string c(candidate);
        if (lower.ends_with(c) ||
            lower.find(c + "_") != std::string::npos ||
            lower.find(c + ".") != std::string::npos ||
            lower.find(c + "-") != std::string::npos ||
            lower.find(c + " ") != std::string::npos) {
            return c;
        }
    }
    return {};
}

std::string sanitize_file_name(std::string_view name) {
    auto trimmed = meta::trim_space(name);
    if (trimmed.empty()) {
        return {};
    }

    std::string out;
    out.reserve(trimmed.size());
    bool in_run = false;
    for (char c : trimmed) {
        if (c == '/' || c == '\\') {
            c = '_';
        }
        if (is_safe_char(c)) {
            out += c;
            in_run = false;
        } else if (!in_run) {
            out += '_';
            in_run = true;
        }
    }

    auto first = out.find_first_not_of("._-");
    if (first == std::string::npos) {
        return {};
    }
    out.erase(0, first);

    auto last = out.find_last_not_of('_');
    out.erase(last + 1);
    first = out.find_first_not_of('_');
    out.erase(0, first);
    return out;
}

std::expected<SelectedFile, std::error_code>
select_streamable_file(const NzbDocument& doc) noexcept {
    if (doc.files.empty()) {
        return std::unexpected(make_error_code(core::StreamErrc::no_files));
    }

    try {
        SelectedFile best;
        bool have_best = false;

        for (const auto& file : doc.files) {
            auto subject = meta::trim_space(file.subject);
            if (should_skip_subject(subject)) {
                continue;
            }

            std::int64_t total = 0;
            std::vector<NzbSegment> usable;
            usable.reserve(file.segments.size());
            for (const auto& seg : file.segments) {
                auto id = meta::trim_space(seg.id);
                if (seg.bytes <= 0 || id.empty()) {
                    continue;
                }
                total += seg.bytes;
                usable.push_back(NzbSegment{std::string(id), seg.bytes, seg.number});
            }
            if (total == 0 || usable.empty()) {
                continue;
            }

            int rank = extension_rank(detect_container_extension(subject));
            if (!have_best || rank < best.extension_rank ||
                (rank == best.extension_rank && total > best.declared_size)) {
                best.subject = file.subject;
                best.segments = std::move(usable);
                best.groups = file.groups;
                best.declared_size = total;
                best.decoded_size = extract_decoded_size(subject);
                best.extension_rank = rank;
                have_best = true;
            }
        }

        if (!have_best) {
            return std::unexpected(make_error_code(core::StreamErrc::no_usable_segments));
        }
        return best;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(core::StreamErrc::malformed_archive));
    }
}

} // namespace spool::nzb
