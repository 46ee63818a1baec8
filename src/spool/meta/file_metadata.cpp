// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/meta/file_metadata.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>

namespace spool::meta {

namespace {

void to_json(nlohmann::json& j, const SegmentRef& seg) {
    j = nlohmann::json{{"id", seg.id}, {"segmentSize", seg.segment_size}};
    if (seg.decoded) {
        j["startOffset"] = seg.decoded->start;
        j["endOffset"] = seg.decoded->end;
    }
}

SegmentRef segment_from_json(const nlohmann::json& j) {
    SegmentRef seg;
    seg.id = j.at("id").get<std::string>();
    seg.segment_size = j.at("segmentSize").get<std::int64_t>();
    if (j.contains("startOffset") && j.contains("endOffset")) {
        seg.decoded = DecodedSpan{j["startOffset"].get<std::int64_t>(), j["endOffset"].get<std::int64_t>()};
    }
    return seg;
}

} // namespace

std::string_view to_string(FileStatus status) noexcept {
    switch (status) {
        case FileStatus::healthy:   return "healthy";
        case FileStatus::partial:   return "partial";
        case FileStatus::corrupted: return "corrupted";
    }
    return "unknown";
}

std::string_view to_string(Encryption encryption) noexcept {
    switch (encryption) {
        case Encryption::none:   return "none";
        case Encryption::rclone: return "rclone";
    }
    return "unknown";
}

std::optional<FileStatus> parse_status(std::string_view text) noexcept {
    if (text == "healthy") return FileStatus::healthy;
    if (text == "partial") return FileStatus::partial;
    if (text == "corrupted") return FileStatus::corrupted;
    return std::nullopt;
}

std::optional<Encryption> parse_encryption(std::string_view text) noexcept {
    if (text == "none") return Encryption::none;
    if (text == "rclone") return Encryption::rclone;
    return std::nullopt;
}

std::int64_t now_seconds() noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string_view trim_space(std::string_view s) noexcept {
    constexpr std::string_view ws = " \t\r\n\v\f";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::expected<FileMetadata, std::error_code>
FileMetadata::create(std::int64_t size,
                     std::string source_archive_path,
                     FileStatus status,
                     std::vector<SegmentRef> segments,
                     Encryption encryption,
                     std::string key_ref,
                     std::string iv) {
    FileMetadata meta;
    meta.file_size = size;
    meta.source_archive_path = std::move(source_archive_path);
    meta.status = status;
    meta.encryption = encryption;

    if (encryption != Encryption::none) {
        if (key_ref.empty() || iv.empty()) {
            return std::unexpected(make_error_code(StoreErrc::missing_encryption_params));
        }
        meta.key_ref = std::move(key_ref);
        meta.iv = std::move(iv);
    }

    meta.segments.reserve(segments.size());
    for (auto& seg : segments) {
        seg.id = std::string(trim_space(seg.id));
        if (!seg.valid()) {
            continue;
        }
        meta.segments.push_back(std::move(seg));
    }

    meta.created_at = now_seconds();
    meta.modified_at = meta.created_at;
    return meta;
}

std::string FileMetadata::to_json() const {
    nlohmann::json j;
    j["fileSize"] = file_size;
    j["sourceArchivePath"] = source_archive_path;
    j["status"] = std::string(spool::meta::to_string(status));
    j["encryption"] = std::string(spool::meta::to_string(encryption));
    if (encryption != Encryption::none) {
        j["keyRef"] = key_ref;
        j["iv"] = iv;
    }
    j["createdAt"] = created_at;
    j["modifiedAt"] = modified_at;

    auto& segs = j["segments"] = nlohmann::json::array();
    for (const auto& seg : segments) {
        nlohmann::json s;
        spool::meta::to_json(s, seg);
        segs.push_back(std::move(s));
    }
    return j.dump();
}

std::expected<FileMetadata, std::error_code> FileMetadata::from_json(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);

        FileMetadata meta;
        meta.file_size = j.at("fileSize").get<std::int64_t>();
        meta.source_archive_path = j.at("sourceArchivePath").get<std::string>();

        auto status = parse_status(j.at("status").get<std::string>());
        auto encryption = parse_encryption(j.value("encryption", std::string("none")));
        if (!status || !encryption) {
            return std::unexpected(make_error_code(StoreErrc::corrupt_record));
        }
        meta.status = *status;
        meta.encryption = *encryption;
        if (meta.encryption != Encryption::none) {
            meta.key_ref = j.at("keyRef").get<std::string>();
            meta.iv = j.at("iv").get<std::string>();
        }
        meta.created_at = j.value("createdAt", std::int64_t{0});
        meta.modified_at = j.value("modifiedAt", std::int64_t{0});

        if (j.contains("segments")) {
            const auto& segs = j["segments"];
            meta.segments.reserve(segs.size());
            for (const auto& s : segs) {
                meta.segments.push_back(segment_from_json(s));
            }
        }

        return meta;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StoreErrc::corrupt_record));
    }
}

} // namespace spool::meta
