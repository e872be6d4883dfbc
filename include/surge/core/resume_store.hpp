// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/checksum.hpp>
#include <surge/core/error.hpp>
#include <surge/core/segment_planner.hpp>
#include <surge/core/task_types.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace surge::core {

constexpr std::uint32_t RESUME_FORMAT_VERSION = 1;

// Segment metadata for persistence
struct SegmentCheckpoint {
    std::uint32_t index{0};
    std::uint64_t offset{0};
    std::optional<std::uint64_t> length;
    std::uint64_t downloaded{0};

    bool operator==(const SegmentCheckpoint&) const = default;
};

// Everything needed to continue a task after a restart
struct ResumeRecord {
    TaskId task_id{0};
    std::string url;
    std::filesystem::path destination;
    std::optional<std::uint64_t> total_size;
    std::uint32_t requested_segments{0};
    std::uint64_t min_segment_size{0};
    bool supports_ranges{false};
    std::string etag;
    std::string last_modified;
    std::optional<Checksum> checksum;
    std::vector<SegmentCheckpoint> segments;
    std::int64_t created_at{0};   // Unix seconds
    std::int64_t updated_at{0};

    [[nodiscard]] std::uint64_t partial_bytes() const noexcept;
    [[nodiscard]] SegmentPlan plan() const;

    bool operator==(const ResumeRecord&) const = default;
};

// Entry returned by DownloadManager::list_resumable
struct ResumableTask {
    TaskId task_id{0};
    std::string url;
    std::filesystem::path destination;
    std::uint64_t partial_bytes{0};
    std::optional<std::uint64_t> total_size;
};

// One JSON file per task under a state directory. Saves go through a temp
// file, fsync and rename, so a crash leaves either the old or the new record.
class ResumeStore {
public:
    explicit ResumeStore(std::filesystem::path directory);

    [[nodiscard]] std::error_code save(const ResumeRecord& record) const noexcept;

    // resume_not_found when absent, resume_corrupt when unparseable or inconsistent
    [[nodiscard]] std::expected<ResumeRecord, std::error_code> load(TaskId id) const noexcept;

    // A missing record is not an error
    [[nodiscard]] std::error_code remove(TaskId id) const noexcept;

    // Ids of every record file present (parsed or not), ascending
    [[nodiscard]] std::expected<std::vector<TaskId>, std::error_code> list() const noexcept;

    [[nodiscard]] std::filesystem::path record_path(TaskId id) const;
    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    std::filesystem::path directory_;
};

// Serialization, exposed for tests
[[nodiscard]] std::string serialize_record(const ResumeRecord& record);
[[nodiscard]] std::expected<ResumeRecord, std::error_code> parse_record(std::string_view text) noexcept;

} // namespace surge::core
