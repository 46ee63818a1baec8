// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/nzb/registry.hpp>
#include <spool/nzb/file_selector.hpp>
#include <spool/nzb/nzb_document.hpp>
#include <spool/core/error.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <format>
#include <fstream>
#include <random>

namespace fs = std::filesystem;

namespace spool::nzb {

namespace {

std::string archive_file_name(std::string_view suggested, std::string_view id) {
    auto name = sanitize_file_name(suggested);
    if (name.empty()) {
        name = std::string(id) + std::string(core::ARCHIVE_EXTENSION);
    }
    std::string lower = name;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (!lower.ends_with(core::ARCHIVE_EXTENSION)) {
        name += core::ARCHIVE_EXTENSION;
    }
    return name;
}

std::string media_file_name(std::string_view subject, std::string_view suggested) {
    auto name = sanitize_file_name(subject);
    if (name.empty()) {
        name = sanitize_file_name(suggested);
    }
    if (name.empty()) {
        name = std::string(core::FALLBACK_STREAM_NAME);
    }
    return name;
}

std::string age_label(fs::file_time_type mtime) {
    auto age = std::chrono::duration_cast<std::chrono::seconds>(fs::file_time_type::clock::now() - mtime);
    return std::format("{}s", age.count());
}

} // namespace

Registry::Registry(meta::MetadataStore* store, fs::path root, std::chrono::seconds max_age)
    : store_(store)
    , root_(std::move(root))
    , max_age_(max_age) {}

Registry::~Registry() {
    stop_sweeper();
}

std::string Registry::new_stream_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t hi = dist(rng);
    std::uint64_t lo = dist(rng);

    // RFC 4122 version 4, variant 1
    hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       hi >> 32, (hi >> 16) & 0xffff, hi & 0xffff,
                       lo >> 48, lo & 0xffffffffffffULL);
}

std::string Registry::store_path(std::string_view public_path) {
    auto path = public_path;
    while (path.starts_with('/')) path.remove_prefix(1);
    std::string prefix = std::string(core::PUBLIC_PREFIX) + "/";
    if (path.starts_with(prefix)) {
        path.remove_prefix(prefix.size());
    }
    return std::string(path);
}

std::expected<Registration, std::error_code>
Registry::register_archive(std::string_view archive, std::string_view suggested_name) noexcept {
    if (store_ == nullptr) {
        return std::unexpected(make_error_code(core::StreamErrc::store_not_configured));
    }

    try {
        spdlog::info("[registry] register begin file=\"{}\" bytes={}",
                     meta::trim_space(suggested_name), archive.size());

        auto doc = parse_nzb(archive);
        if (!doc) {
            return std::unexpected(doc.error());
        }

        auto selected = select_streamable_file(*doc);
        if (!selected) {
            return std::unexpected(selected.error());
        }

        if (selected->decoded_size <= 0) {
            spdlog::warn("[registry] no yEnc size in subject, using encoded size estimate subject=\"{}\"",
                         selected->subject);
        }
        const std::int64_t total_size = selected->total_size();
        if (total_size <= 0) {
            return std::unexpected(make_error_code(core::StreamErrc::unknown_size));
        }

        // Decoded offsets stay unresolved: yEnc overhead differs per article
        std::vector<meta::SegmentRef> segments;
        segments.reserve(selected->segments.size());
        for (const auto& seg : selected->segments) {
            segments.push_back(meta::SegmentRef{seg.id, seg.bytes, std::nullopt});
        }

        const auto id = new_stream_id();
        const auto media_name = media_file_name(selected->subject, suggested_name);
        const auto relative = id + "/" + media_name;
        const auto public_path = std::string(core::PUBLIC_PREFIX) + "/" + relative;
        const auto stream_dir = root_ / id;
        const auto archive_path = stream_dir / archive_file_name(suggested_name, id);

        auto meta = store_->create(total_size, archive_path.string(), meta::FileStatus::healthy,
                                   std::move(segments));
        if (!meta) {
            return std::unexpected(meta.error());
        }
        if (meta->segments.empty()) {
            return std::unexpected(make_error_code(core::StreamErrc::no_usable_segments));
        }

        spdlog::info("[registry] register parsed subject=\"{}\" segments={} totalSize={}",
                     selected->subject, meta->segments.size(), total_size);

        std::lock_guard<std::mutex> lock(mutex_);

        (void)sweep_locked();

        std::error_code ec;
        fs::create_directories(stream_dir, ec);
        if (ec) {
            spdlog::error("[registry] create stream directory {} failed: {}", stream_dir.string(), ec.message());
            return std::unexpected(ec);
        }

        {
            std::ofstream file(archive_path, std::ios::binary | std::ios::trunc);
            if (file) {
                file.write(archive.data(), static_cast<std::streamsize>(archive.size()));
            }
            if (!file) {
                spdlog::error("[registry] write nzb file {} failed", archive_path.string());
                discard_registration(stream_dir);
                return std::unexpected(make_error_code(meta::StoreErrc::write_error));
            }
        }

        // Last step: the path becomes resolvable only once everything else is on disk
        if (auto err = store_->write(relative, *meta)) {
            spdlog::error("[registry] write metadata {} failed: {}", relative, err.message());
            discard_registration(stream_dir);
            return std::unexpected(err);
        }

        spdlog::info("[registry] register complete path=\"{}\" size={} nzb=\"{}\"",
                     public_path, total_size, archive_path.string());
        return Registration{public_path, total_size};
    } catch (const std::exception& e) {
        spdlog::error("[registry] register failed: {}", e.what());
        return std::unexpected(make_error_code(meta::StoreErrc::write_error));
    }
}

void Registry::discard_registration(const fs::path& stream_dir) noexcept {
    std::error_code ec;
    fs::remove_all(stream_dir, ec);
    if (ec) {
        spdlog::warn("[registry] cleanup of failed registration {} failed: {}", stream_dir.string(), ec.message());
    }
}

SweepReport Registry::sweep() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweep_locked();
}

std::error_code Registry::remove_entry(const fs::path& dir, std::string_view store_dir) noexcept {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        return ec;
    }
    if (store_ != nullptr && !store_dir.empty()) {
        return store_->remove_directory(store_dir);
    }
    return {};
}

SweepReport Registry::sweep_locked() noexcept {
    SweepReport report;
    const auto max_age = max_age_.load();
    if (max_age.count() <= 0 || root_.empty()) {
        return report;
    }

    try {
        const auto cutoff = fs::file_time_type::clock::now() - max_age;

        std::error_code ec;
        fs::directory_iterator it(root_, ec);
        if (ec) {
            if (ec != std::errc::no_such_file_or_directory) {
                spdlog::warn("[registry] cleanup cannot list {}: {}", root_.string(), ec.message());
            }
            return report;
        }

        // Collect first, removing while iterating invalidates the iterator
        std::vector<fs::path> expired;
        std::vector<fs::path> legacy_expired;

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            std::error_code entry_ec;
            if (!it->is_directory(entry_ec)) {
                continue;
            }

            if (it->path().filename() == core::LEGACY_STREAM_DIR) {
                std::error_code legacy_ec;
                for (const auto& legacy : fs::directory_iterator(it->path(), legacy_ec)) {
                    std::error_code e;
                    if (!legacy.is_directory(e)) continue;
                    auto mtime = legacy.last_write_time(e);
                    if (!e && mtime < cutoff) {
                        legacy_expired.push_back(legacy.path());
                    }
                }
                continue;
            }

            auto mtime = it->last_write_time(entry_ec);
            if (!entry_ec && mtime < cutoff) {
                expired.push_back(it->path());
            }
        }

        for (const auto& dir : legacy_expired) {
            std::error_code e;
            spdlog::info("[registry] cleanup removing legacy {} (age={})", dir.string(), age_label(fs::last_write_time(dir, e)));
            if (auto err = remove_entry(dir, {})) {
                spdlog::warn("[registry] cleanup failed for {}: {}", dir.string(), err.message());
                ++report.failed;
            } else {
                ++report.removed;
            }
        }

        for (const auto& dir : expired) {
            std::error_code e;
            spdlog::info("[registry] cleanup removing {} (age={})", dir.string(), age_label(fs::last_write_time(dir, e)));
            if (auto err = remove_entry(dir, dir.filename().string())) {
                spdlog::warn("[registry] cleanup failed for {}: {}", dir.string(), err.message());
                ++report.failed;
            } else {
                ++report.removed;
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("[registry] cleanup aborted: {}", e.what());
        ++report.failed;
    }

    return report;
}

std::error_code Registry::touch(std::string_view public_path) noexcept {
    try {
        auto relative = store_path(public_path);
        auto slash = relative.find('/');
        auto id = relative.substr(0, slash);
        if (id.empty() || id == "." || id == "..") {
            return make_error_code(meta::StoreErrc::invalid_path);
        }

        std::error_code ec;
        fs::last_write_time(root_ / id, fs::file_time_type::clock::now(), ec);
        return ec;
    } catch (const std::exception&) {
        return make_error_code(meta::StoreErrc::write_error);
    }
}

void Registry::start_sweeper(std::chrono::seconds interval) {
    stop_sweeper();
    sweeper_ = std::jthread([this, interval](std::stop_token stoken) {
        while (!stoken.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(sweeper_mutex_);
                if (sweeper_cv_.wait_for(lock, stoken, interval, [] { return false; })) {
                    break;
                }
            }
            if (stoken.stop_requested()) {
                break;
            }
            auto report = sweep();
            spdlog::debug("[registry] periodic sweep removed={} failed={}", report.removed, report.failed);
        }
    });
}

void Registry::stop_sweeper() noexcept {
    if (sweeper_.joinable()) {
        sweeper_.request_stop();
        sweeper_.join();
    }
}

} // namespace spool::nzb
