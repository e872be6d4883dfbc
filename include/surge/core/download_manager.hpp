// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/checksum.hpp>
#include <surge/core/config.hpp>
#include <surge/core/download_task.hpp>
#include <surge/core/error.hpp>
#include <surge/core/progress_aggregator.hpp>
#include <surge/core/resume_store.hpp>
#include <surge/core/task_types.hpp>
#include <surge/net/http_client.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string_view>
#include <vector>

namespace surge::core {

// Engine entry point. Owns the task table, admits at most
// max_active_tasks runs at once and queues the rest.
class DownloadManager {
public:
    // A null client selects CurlHttpClient
    explicit DownloadManager(EngineConfig config = {},
                             std::shared_ptr<net::HttpClient> http = nullptr);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // segments = 0 uses EngineConfig::default_segments
    [[nodiscard]] std::expected<TaskId, std::error_code>
    start_download(std::string_view url, std::filesystem::path destination,
                   std::uint32_t segments = 0, std::optional<Checksum> checksum = std::nullopt);

    [[nodiscard]] std::error_code pause_download(TaskId id);

    // Also resumes tasks recovered from a previous process and failed tasks with a record
    [[nodiscard]] std::error_code resume_download(TaskId id);

    [[nodiscard]] std::error_code cancel_download(TaskId id);

    // Drop a completed or cancelled task from the table. Live and resumable
    // tasks are refused with invalid_state.
    [[nodiscard]] std::error_code forget(TaskId id);

    [[nodiscard]] std::expected<SubscriptionId, std::error_code>
    subscribe(TaskId id, ProgressCallback on_progress, TerminalCallback on_terminal);
    void unsubscribe(TaskId id, SubscriptionId subscription);

    // Tasks with a resume record that are not currently running or queued
    [[nodiscard]] std::vector<ResumableTask> list_resumable() const;

    [[nodiscard]] std::expected<TaskState, std::error_code> state(TaskId id) const;
    [[nodiscard]] std::expected<ProgressSnapshot, std::error_code> progress(TaskId id) const;
    [[nodiscard]] std::expected<std::vector<SegmentView>, std::error_code> segments(TaskId id) const;
    [[nodiscard]] std::vector<TaskId> tasks() const;

    // Block until the task is settled (paused, failed or terminal) and idle; false on timeout
    bool wait_idle(TaskId id, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    [[nodiscard]] std::size_t active_count() const;
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    struct QueueEntry {
        TaskId id;
        bool resume;
    };

    // Last known state of a task that reached Completed or Cancelled
    struct FinishedTask {
        TerminalEvent event;
        ProgressSnapshot progress;
        std::vector<SegmentView> segments;
    };

    using TaskPtr = std::shared_ptr<DownloadTask>;

    [[nodiscard]] TaskPtr make_task(TaskId id, std::string url, std::filesystem::path destination,
                                    TaskOptions options);
    [[nodiscard]] TaskPtr make_task(ResumeRecord record);

    // Task in the table, or loaded from its resume record
    [[nodiscard]] std::expected<TaskPtr, std::error_code> find_or_recover(TaskId id);
    [[nodiscard]] TaskPtr find(TaskId id) const;
    [[nodiscard]] bool queued_locked(TaskId id) const;
    [[nodiscard]] bool at_capacity_locked() const noexcept;

    // Start or resume now if a slot is free, otherwise queue
    [[nodiscard]] std::error_code admit(const TaskPtr& task, bool resume);
    [[nodiscard]] std::error_code launch(const TaskPtr& task, bool resume);

    void on_task_state(TaskId id, TaskState from, TaskState to);
    void drain_queue();
    void reap_retired();

    EngineConfig config_;
    TaskContext context_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::map<TaskId, TaskPtr> tasks_;
    std::map<TaskId, FinishedTask> finished_;
    std::set<TaskId> active_;
    std::deque<QueueEntry> queue_;
    std::vector<TaskPtr> retired_;
    TaskId next_id_{1};
    bool closing_{false};
};

} // namespace surge::core
