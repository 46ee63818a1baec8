// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/meta/metadata_reader.hpp>
#include <spool/core/error.hpp>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

namespace spool::meta {

namespace {

bool is_root(std::string_view normalized) noexcept {
    return normalized.empty();
}

} // namespace

DirectoryEntry MetadataReader::make_entry(const std::string& path) const {
    DirectoryEntry entry;
    entry.path = path;
    auto slash = path.rfind('/');
    entry.name = (slash == std::string::npos) ? path : path.substr(slash + 1);

    std::error_code ec;
    auto mtime = fs::last_write_time(store_.directory_path(path), ec);
    if (!ec) {
        auto sys = std::chrono::file_clock::to_sys(mtime);
        entry.modified_at = std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
    }
    return entry;
}

std::expected<DirectoryContents, std::error_code>
MetadataReader::list_directory_contents(std::string_view dir) const noexcept {
    auto normalized = normalize_virtual_path(dir);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }

    try {
        DirectoryContents contents;

        auto subdirs = store_.list_subdirectories(*normalized);
        if (!subdirs) {
            return std::unexpected(subdirs.error());
        }
        for (const auto& sub : *subdirs) {
            contents.directories.push_back(make_entry(sub));
        }

        auto names = store_.list_directory(*normalized);
        if (!names) {
            return std::unexpected(names.error());
        }
        for (const auto& name : *names) {
            auto child = normalized->empty() ? name : *normalized + "/" + name;
            auto meta = store_.read(child);
            if (!meta) {
                return std::unexpected(meta.error());
            }
            // A record removed since the listing is skipped
            if (!meta->has_value()) {
                continue;
            }
            contents.files.push_back(FileEntry{name, std::move(**meta)});
        }

        return contents;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StoreErrc::read_error));
    }
}

std::expected<DirectoryEntry, std::error_code>
MetadataReader::get_directory_info(std::string_view dir) const noexcept {
    auto normalized = normalize_virtual_path(dir);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }

    try {
        if (!is_root(*normalized) && !store_.directory_exists(*normalized)) {
            if (store_.exists(*normalized)) {
                return std::unexpected(make_error_code(core::StreamErrc::not_a_directory));
            }
            return std::unexpected(make_error_code(core::StreamErrc::not_found));
        }
        return make_entry(*normalized);
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StoreErrc::read_error));
    }
}

std::expected<bool, std::error_code> MetadataReader::path_exists(std::string_view path) const noexcept {
    auto normalized = normalize_virtual_path(path);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }
    if (is_root(*normalized)) {
        return true;
    }
    return store_.directory_exists(*normalized) || store_.exists(*normalized);
}

std::expected<bool, std::error_code> MetadataReader::is_directory(std::string_view path) const noexcept {
    auto normalized = normalize_virtual_path(path);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }
    if (is_root(*normalized) || store_.directory_exists(*normalized)) {
        return true;
    }
    if (store_.exists(*normalized)) {
        return false;
    }
    return std::unexpected(make_error_code(core::StreamErrc::not_found));
}

std::expected<std::vector<SegmentRef>, std::error_code>
MetadataReader::get_file_segments(std::string_view path) const noexcept {
    auto meta = store_.read(path);
    if (!meta) {
        return std::unexpected(meta.error());
    }
    if (!meta->has_value()) {
        return std::unexpected(make_error_code(core::StreamErrc::not_found));
    }
    return std::move((*meta)->segments);
}

std::expected<FileDescriptor, std::error_code>
MetadataReader::describe_file(std::string_view path) const noexcept {
    auto normalized = normalize_virtual_path(path);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }

    auto meta = store_.read(*normalized);
    if (!meta) {
        return std::unexpected(meta.error());
    }
    if (!meta->has_value()) {
        return std::unexpected(make_error_code(core::StreamErrc::not_found));
    }

    try {
        const auto& m = **meta;
        FileDescriptor desc;
        desc.virtual_path = std::string(path);
        desc.normalized_path = *normalized;
        desc.source_archive = std::string(trim_space(m.source_archive_path));
        desc.file_size = m.file_size;
        desc.segment_count = m.segments.size();
        desc.created_at = m.created_at;
        desc.status = m.status;
        return desc;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StoreErrc::read_error));
    }
}

} // namespace spool::meta
