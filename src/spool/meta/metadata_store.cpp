// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/meta/metadata_store.hpp>
#include <spool/core/config.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace spool::meta {

namespace {

bool is_record(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_regular_file(ec) && entry.path().extension().string() == core::METADATA_EXTENSION;
}

// True when any record lives beneath dir
bool has_records(const fs::path& dir) {
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, ec);
    if (ec) {
        return false;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return false;
        }
        if (is_record(*it)) {
            return true;
        }
    }
    return false;
}

// Trim segment ids in place. Records carrying an unusable segment are never persisted.
std::error_code check_segments(FileMetadata& meta) {
    for (auto& seg : meta.segments) {
        seg.id = std::string(trim_space(seg.id));
        if (!seg.valid()) {
            return make_error_code(StoreErrc::invalid_segment);
        }
    }
    return {};
}

std::string join_virtual(std::string_view dir, std::string_view name) {
    if (dir.empty()) {
        return std::string(name);
    }
    std::string result(dir);
    result += '/';
    result += name;
    return result;
}

} // namespace

std::expected<std::string, std::error_code>
normalize_virtual_path(std::string_view path) noexcept {
    try {
        auto normal = fs::path(std::string(path)).lexically_normal().generic_string();

        while (!normal.empty() && normal.front() == '/') normal.erase(0, 1);
        while (!normal.empty() && normal.back() == '/') normal.pop_back();
        if (normal == ".") {
            normal.clear();
        }

        if (normal == ".." || normal.starts_with("../")) {
            return std::unexpected(make_error_code(StoreErrc::invalid_path));
        }
        return normal;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StoreErrc::invalid_path));
    }
}

MetadataStore::MetadataStore(fs::path root) : root_(std::move(root)) {}

std::expected<FileMetadata, std::error_code>
MetadataStore::create(std::int64_t size,
                      std::string source_archive_path,
                      FileStatus status,
                      std::vector<SegmentRef> segments,
                      Encryption encryption,
                      std::string key_ref,
                      std::string iv) const {
    return FileMetadata::create(size, std::move(source_archive_path), status, std::move(segments),
                                encryption, std::move(key_ref), std::move(iv));
}

fs::path MetadataStore::record_path(std::string_view normalized) const {
    auto p = root_ / fs::path(std::string(normalized));
    p += core::METADATA_EXTENSION;
    return p;
}

fs::path MetadataStore::directory_path(std::string_view normalized) const {
    if (normalized.empty()) {
        return root_;
    }
    return root_ / fs::path(std::string(normalized));
}

std::mutex& MetadataStore::lock_for(std::string_view normalized) const noexcept {
    return stripes_[std::hash<std::string_view>{}(normalized) % LOCK_STRIPES];
}

std::error_code MetadataStore::write(std::string_view path, const FileMetadata& meta) noexcept {
    auto normalized = normalize_virtual_path(path);
    if (!normalized) {
        return normalized.error();
    }
    if (normalized->empty()) {
        return make_error_code(StoreErrc::invalid_path);
    }

    FileMetadata checked;
    try {
        checked = meta;
    } catch (const std::exception&) {
        return make_error_code(StoreErrc::write_error);
    }
    if (auto err = check_segments(checked)) {
        return err;
    }

    std::lock_guard<std::mutex> lock(lock_for(*normalized));
    return write_record(*normalized, checked);
}

std::error_code MetadataStore::write_record(std::string_view normalized, const FileMetadata& meta) noexcept {
    fs::path temp;
    try {
        auto target = record_path(normalized);

        // Held until the rename so pruning never removes the directory under us
        std::shared_lock<std::shared_mutex> tree(tree_mutex_);

        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return make_error_code(StoreErrc::write_error);
        }

        temp = target;
        temp += ".tmp-" + std::to_string(temp_counter_.fetch_add(1, std::memory_order_relaxed));

        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return make_error_code(StoreErrc::write_error);
            }
            file << meta.to_json();
            file.flush();
            if (!file) {
                file.close();
                fs::remove(temp, ec);
                return make_error_code(StoreErrc::write_error);
            }
        }

        // Rename replaces the previous record in one step
        fs::rename(temp, target, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return make_error_code(StoreErrc::write_error);
        }
        return {};
    } catch (const std::exception&) {
        if (!temp.empty()) {
            std::error_code ignored;
            fs::remove(temp, ignored);
        }
        return make_error_code(StoreErrc::write_error);
    }
}

std::expected<std::optional<FileMetadata>, std::error_code>
MetadataStore::read(std::string_view path) const noexcept {
    auto normalized = normalize_virtual_path(path);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }
    if (normalized->empty()) {
        return std::optional<FileMetadata>{};
    }
    return read_record(*normalized);
}

std::expected<std::optional<FileMetadata>, std::error_code>
MetadataStore::read_record(std::string_view normalized) const noexcept {
    try {
        auto target = record_path(normalized);

        std::ifstream file(target, std::ios::binary);
        if (!file) {
            std::error_code ec;
            if (!fs::exists(target, ec) && !ec) {
                return std::optional<FileMetadata>{};
            }
            return std::unexpected(make_error_code(StoreErrc::read_error));
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();

        auto meta = FileMetadata::from_json(buffer.str());
        if (!meta) {
            return std::unexpected(meta.error());
        }
        return std::optional<FileMetadata>{std::move(*meta)};
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StoreErrc::read_error));
    }
}

std::error_code MetadataStore::update(std::string_view path, const Mutator& mutator) noexcept {
    auto normalized = normalize_virtual_path(path);
    if (!normalized) {
        return normalized.error();
    }
    if (normalized->empty()) {
        return make_error_code(StoreErrc::not_found);
    }

    std::lock_guard<std::mutex> lock(lock_for(*normalized));

    auto current = read_record(*normalized);
    if (!current) {
        return current.error();
    }
    if (!current->has_value()) {
        return make_error_code(StoreErrc::not_found);
    }

    FileMetadata next = **current;
    try {
        mutator(next);
        if (auto err = check_segments(next)) {
            return err;
        }
    } catch (const std::exception&) {
        return make_error_code(StoreErrc::write_error);
    }

    // Second resolution: force a visible step even for back-to-back updates
    next.modified_at = std::max(now_seconds(), (*current)->modified_at + 1);

    return write_record(*normalized, next);
}

std::error_code MetadataStore::update_status(std::string_view path, FileStatus status) noexcept {
    return update(path, [status](FileMetadata& meta) { meta.status = status; });
}

std::error_code MetadataStore::remove(std::string_view path) noexcept {
    auto normalized = normalize_virtual_path(path);
    if (!normalized) {
        return normalized.error();
    }
    if (normalized->empty()) {
        return {};
    }

    std::lock_guard<std::mutex> lock(lock_for(*normalized));

    try {
        auto target = record_path(*normalized);
        std::error_code ec;
        fs::remove(target, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return make_error_code(StoreErrc::write_error);
        }
        prune_empty_parents(target.parent_path());
        return {};
    } catch (const std::exception&) {
        return make_error_code(StoreErrc::write_error);
    }
}

void MetadataStore::prune_empty_parents(fs::path dir) const noexcept {
    try {
        std::unique_lock<std::shared_mutex> tree(tree_mutex_);

        // Compare with a trailing separator so "root" and "root/" match
        const auto root = (root_ / "").lexically_normal();
        while (!dir.empty() && (dir / "").lexically_normal() != root) {
            std::error_code ec;
            if (!fs::is_empty(dir, ec) || ec) {
                return;
            }
            if (!fs::remove(dir, ec) || ec) {
                return;
            }
            dir = dir.parent_path();
        }
    } catch (const std::exception&) {
        // Leftover empty directories are invisible to listings
        return;
    }
}

std::error_code MetadataStore::remove_directory(std::string_view dir) noexcept {
    auto normalized = normalize_virtual_path(dir);
    if (!normalized) {
        return normalized.error();
    }

    try {
        auto base = directory_path(*normalized);
        std::vector<std::string> records;

        std::error_code ec;
        fs::recursive_directory_iterator it(base, ec);
        if (ec) {
            return {};
        }
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                return make_error_code(StoreErrc::read_error);
            }
            if (!is_record(*it)) {
                continue;
            }
            auto rel = it->path().lexically_relative(root_).generic_string();
            rel.resize(rel.size() - core::METADATA_EXTENSION.size());
            records.push_back(std::move(rel));
        }

        for (const auto& record : records) {
            if (auto err = remove(record)) {
                return err;
            }
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(StoreErrc::write_error);
    }
}

bool MetadataStore::exists(std::string_view path) const noexcept {
    auto normalized = normalize_virtual_path(path);
    if (!normalized || normalized->empty()) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(record_path(*normalized), ec);
}

bool MetadataStore::directory_exists(std::string_view dir) const noexcept {
    auto normalized = normalize_virtual_path(dir);
    if (!normalized) {
        return false;
    }
    try {
        return has_records(directory_path(*normalized));
    } catch (const std::exception&) {
        return false;
    }
}

std::expected<std::vector<std::string>, std::error_code>
MetadataStore::list_directory(std::string_view dir) const noexcept {
    auto normalized = normalize_virtual_path(dir);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }

    try {
        std::vector<std::string> names;

        std::error_code ec;
        fs::directory_iterator it(directory_path(*normalized), ec);
        if (ec) {
            if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
                return names;
            }
            return std::unexpected(make_error_code(StoreErrc::read_error));
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                return std::unexpected(make_error_code(StoreErrc::read_error));
            }
            if (is_record(*it)) {
                names.push_back(it->path().stem().string());
            }
        }

        std::sort(names.begin(), names.end());
        return names;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StoreErrc::read_error));
    }
}

std::expected<std::vector<std::string>, std::error_code>
MetadataStore::list_subdirectories(std::string_view dir) const noexcept {
    auto normalized = normalize_virtual_path(dir);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }

    try {
        std::vector<std::string> dirs;

        std::error_code ec;
        fs::directory_iterator it(directory_path(*normalized), ec);
        if (ec) {
            if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
                return dirs;
            }
            return std::unexpected(make_error_code(StoreErrc::read_error));
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                return std::unexpected(make_error_code(StoreErrc::read_error));
            }
            std::error_code type_ec;
            if (!it->is_directory(type_ec) || !has_records(it->path())) {
                continue;
            }
            dirs.push_back(join_virtual(*normalized, it->path().filename().string()));
        }

        std::sort(dirs.begin(), dirs.end());
        return dirs;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StoreErrc::read_error));
    }
}

} // namespace spool::meta
