// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/resume_store.hpp>
#include <surge/core/config.hpp>
#include <surge/disk/error.hpp>
#include <surge/disk/file_writer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace surge::core {

using nlohmann::json;

namespace {

json optional_u64(const std::optional<std::uint64_t>& v) {
    return v ? json(*v) : json(nullptr);
}

std::optional<std::uint64_t> read_optional_u64(const json& j, const char* key) {
    const auto& v = j.at(key);
    if (v.is_null()) return std::nullopt;
    if (!v.is_number_unsigned()) {
        throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
    }
    return v.get<std::uint64_t>();
}

std::string optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    return it->get<std::string>();
}

// Plan must be contiguous from zero, with progress inside each segment
bool is_consistent(const ResumeRecord& r) noexcept {
    if (r.segments.empty()) return false;
    std::uint64_t expected = 0;
    for (std::size_t i = 0; i < r.segments.size(); ++i) {
        const auto& s = r.segments[i];
        if (s.index != i || s.offset != expected) return false;
        if (!s.length) {
            // Unknown length only for a lone whole-resource segment
            if (r.segments.size() != 1 || r.total_size) return false;
            continue;
        }
        if (s.downloaded > *s.length) return false;
        expected += *s.length;
    }
    if (r.total_size && expected != *r.total_size) return false;
    return true;
}

} // namespace

std::uint64_t ResumeRecord::partial_bytes() const noexcept {
    std::uint64_t total = 0;
    for (const auto& s : segments) {
        total += s.downloaded;
    }
    return total;
}

SegmentPlan ResumeRecord::plan() const {
    SegmentPlan result;
    result.reserve(segments.size());
    for (const auto& s : segments) {
        result.push_back(SegmentSpec{s.index, s.offset, s.length});
    }
    return result;
}

std::string serialize_record(const ResumeRecord& r) {
    json segments = json::array();
    for (const auto& s : r.segments) {
        segments.push_back({
            {"index", s.index},
            {"offset", s.offset},
            {"length", optional_u64(s.length)},
            {"downloaded", s.downloaded},
        });
    }

    json j = {
        {"version", RESUME_FORMAT_VERSION},
        {"task_id", r.task_id},
        {"url", r.url},
        {"destination", r.destination.string()},
        {"total_size", optional_u64(r.total_size)},
        {"requested_segments", r.requested_segments},
        {"min_segment_size", r.min_segment_size},
        {"supports_ranges", r.supports_ranges},
        {"etag", r.etag},
        {"last_modified", r.last_modified},
        {"segments", std::move(segments)},
        {"created_at", r.created_at},
        {"updated_at", r.updated_at},
    };
    if (r.checksum) {
        j["checksum"] = {{"algo", std::string(to_string(r.checksum->algo))}, {"hex", r.checksum->hex}};
    } else {
        j["checksum"] = nullptr;
    }
    return j.dump(2);
}

std::expected<ResumeRecord, std::error_code> parse_record(std::string_view text) noexcept {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(DownloadErrc::resume_corrupt));
        }

        auto version = j.at("version").get<std::uint32_t>();
        if (version == 0 || version > RESUME_FORMAT_VERSION) {
            spdlog::warn("Resume record version {} not supported", version);
            return std::unexpected(make_error_code(DownloadErrc::resume_corrupt));
        }

        ResumeRecord r;
        r.task_id = j.at("task_id").get<TaskId>();
        r.url = j.at("url").get<std::string>();
        r.destination = j.at("destination").get<std::string>();
        r.total_size = read_optional_u64(j, "total_size");
        r.requested_segments = j.at("requested_segments").get<std::uint32_t>();
        r.min_segment_size = j.at("min_segment_size").get<std::uint64_t>();
        r.supports_ranges = j.at("supports_ranges").get<bool>();
        r.etag = optional_string(j, "etag");
        r.last_modified = optional_string(j, "last_modified");
        r.created_at = j.value("created_at", std::int64_t{0});
        r.updated_at = j.value("updated_at", std::int64_t{0});

        if (auto it = j.find("checksum"); it != j.end() && !it->is_null()) {
            auto algo = parse_hash_algo(it->at("algo").get<std::string>());
            if (!algo) {
                return std::unexpected(make_error_code(DownloadErrc::resume_corrupt));
            }
            r.checksum = Checksum{*algo, it->at("hex").get<std::string>()};
        }

        const auto& segments = j.at("segments");
        if (!segments.is_array()) {
            return std::unexpected(make_error_code(DownloadErrc::resume_corrupt));
        }
        for (const auto& s : segments) {
            SegmentCheckpoint cp;
            cp.index = s.at("index").get<std::uint32_t>();
            cp.offset = s.at("offset").get<std::uint64_t>();
            cp.length = read_optional_u64(s, "length");
            cp.downloaded = s.at("downloaded").get<std::uint64_t>();
            r.segments.push_back(cp);
        }

        if (r.url.empty() || r.destination.empty() || !is_consistent(r)) {
            return std::unexpected(make_error_code(DownloadErrc::resume_corrupt));
        }
        return r;
    } catch (const json::exception& e) {
        spdlog::debug("Resume record parse error: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::resume_corrupt));
    } catch (const std::invalid_argument& e) {
        spdlog::debug("Resume record invalid field: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::resume_corrupt));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(disk::DiskErrc::allocation_failed));
    }
}

//=============================================================================
// ResumeStore
//=============================================================================

ResumeStore::ResumeStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path ResumeStore::record_path(TaskId id) const {
    return directory_ / (std::to_string(id) + std::string(RESUME_EXTENSION));
}

std::error_code ResumeStore::save(const ResumeRecord& record) const noexcept {
    try {
        auto text = serialize_record(record);
        auto target = record_path(record.task_id);
        auto tmp = target;
        tmp += ".tmp";

        disk::FileWriter writer;
        if (auto ec = writer.open(tmp, std::nullopt, /*truncate=*/true)) {
            return ec;
        }
        if (auto ec = writer.write(0, std::as_bytes(std::span(text.data(), text.size())))) {
            writer.close();
            (void)disk::remove_file(tmp);
            return ec;
        }
        if (auto ec = writer.flush()) {
            writer.close();
            (void)disk::remove_file(tmp);
            return ec;
        }
        writer.close();

        if (auto ec = disk::atomic_replace(tmp, target)) {
            (void)disk::remove_file(tmp);
            return ec;
        }
        spdlog::debug("Checkpoint task {} ({} bytes)", record.task_id, record.partial_bytes());
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Resume save for task {} failed: {}", record.task_id, e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::expected<ResumeRecord, std::error_code> ResumeStore::load(TaskId id) const noexcept {
    try {
        auto path = record_path(id);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return std::unexpected(make_error_code(DownloadErrc::resume_not_found));
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(DownloadErrc::resume_not_found));
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();

        auto record = parse_record(buffer.str());
        if (record && record->task_id != id) {
            return std::unexpected(make_error_code(DownloadErrc::resume_corrupt));
        }
        return record;
    } catch (const std::exception& e) {
        spdlog::error("Resume load for task {} failed: {}", id, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::error_code ResumeStore::remove(TaskId id) const noexcept {
    try {
        return disk::remove_file(record_path(id));
    } catch (const std::bad_alloc&) {
        return make_error_code(disk::DiskErrc::allocation_failed);
    }
}

std::expected<std::vector<TaskId>, std::error_code> ResumeStore::list() const noexcept {
    std::vector<TaskId> ids;
    try {
        std::error_code ec;
        if (!std::filesystem::is_directory(directory_, ec)) {
            return ids;
        }
        for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
            if (!entry.is_regular_file()) continue;
            const auto& p = entry.path();
            if (p.extension() != RESUME_EXTENSION) continue;

            auto stem = p.stem().string();
            TaskId id = 0;
            auto [ptr, perr] = std::from_chars(stem.data(), stem.data() + stem.size(), id);
            if (perr != std::errc{} || ptr != stem.data() + stem.size()) continue;
            ids.push_back(id);
        }
        if (ec) {
            return std::unexpected(disk::errno_to_error_code(ec.value(), disk::DiskErrc::read_error));
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    } catch (const std::exception& e) {
        spdlog::error("Listing {} failed: {}", directory_.string(), e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace surge::core
