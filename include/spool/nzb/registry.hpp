// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/config.hpp>
#include <spool/meta/metadata_store.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace spool::nzb {

struct Registration {
    std::string path;          // Public path, "streams/<id>/<name>"
    std::int64_t size{0};
};

struct SweepReport {
    std::size_t removed{0};
    std::size_t failed{0};
};

// Turns uploaded NZB documents into streamable virtual files.
//
// Each registration gets a fresh id. The uploaded document is kept at
// <root>/<id>/<name>.nzb and the metadata record at <id>/<media name> in the store.
// Registrations older than max_age are evicted before every new registration and,
// optionally, on a background timer.
class Registry {
public:
    Registry(meta::MetadataStore* store,
             std::filesystem::path root,
             std::chrono::seconds max_age = core::DEFAULT_MAX_AGE);
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    [[nodiscard]] std::expected<Registration, std::error_code>
    register_archive(std::string_view archive, std::string_view suggested_name) noexcept;

    // Remove expired registrations. Failures are logged and counted, never returned.
    SweepReport sweep() noexcept;

    // Refresh a registration's modification time so an active stream is not evicted
    [[nodiscard]] std::error_code touch(std::string_view public_path) noexcept;

    // Run sweep() every interval until stop_sweeper() or destruction
    void start_sweeper(std::chrono::seconds interval = core::DEFAULT_SWEEP_INTERVAL);
    void stop_sweeper() noexcept;

    // Safe while the sweeper runs
    void max_age(std::chrono::seconds age) noexcept { max_age_.store(age); }
    [[nodiscard]] std::chrono::seconds max_age() const noexcept { return max_age_.load(); }
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    // Store path for a public path ("streams/<id>/x" -> "<id>/x")
    [[nodiscard]] static std::string store_path(std::string_view public_path);

    [[nodiscard]] static std::string new_stream_id();

private:
    SweepReport sweep_locked() noexcept;

    // Fallible cleanup of one expired entry. The caller logs and discards the result.
    [[nodiscard]] std::error_code remove_entry(const std::filesystem::path& dir, std::string_view store_dir) noexcept;

    void discard_registration(const std::filesystem::path& stream_dir) noexcept;

    meta::MetadataStore* store_;
    std::filesystem::path root_;
    std::atomic<std::chrono::seconds> max_age_;

    std::mutex mutex_;

    std::jthread sweeper_;
    std::mutex sweeper_mutex_;
    std::condition_variable_any sweeper_cv_;
};

} // namespace spool::nzb
