// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/meta/file_metadata.hpp>
#include <spool/stream/segment_plan.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <stop_token>
#include <system_error>

namespace spool::stream {

// Remote-fetch seams. Implementations live with the transport; the core only plans and wires.

// Opaque handle to a set of provider connections
class ConnectionPool {
public:
    virtual ~ConnectionPool() = default;
};

class PoolProvider {
public:
    virtual ~PoolProvider() = default;

    [[nodiscard]] virtual std::expected<std::shared_ptr<ConnectionPool>, std::error_code> pool() = 0;
};

class SegmentPlanner {
public:
    virtual ~SegmentPlanner() = default;

    // Plan at most max_segments segments covering [start, end]. end < 0 means end of file.
    [[nodiscard]] virtual std::expected<SegmentPlan, std::error_code>
    build_plan(const meta::FileMetadata& meta, std::int64_t start, std::int64_t end,
               std::size_t max_segments) = 0;
};

// Byte stream over a plan. read() returns 0 at end of stream.
class ReadStream {
public:
    virtual ~ReadStream() = default;

    [[nodiscard]] virtual std::expected<std::size_t, std::error_code> read(std::span<std::byte> buffer) = 0;

    // Release connections. Safe to call more than once.
    virtual void close() noexcept = 0;
};

class StreamOpener {
public:
    virtual ~StreamOpener() = default;

    // May block until the first segments are in flight. Must honor stop requests.
    [[nodiscard]] virtual std::expected<std::unique_ptr<ReadStream>, std::error_code>
    open(std::stop_token stop, ConnectionPool& pool, const SegmentPlan& plan, std::uint32_t workers) = 0;
};

} // namespace spool::stream
