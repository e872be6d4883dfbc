// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/checksum.hpp>
#include <surge/core/config.hpp>
#include <surge/core/connection_limiter.hpp>
#include <surge/core/error.hpp>
#include <surge/core/progress_aggregator.hpp>
#include <surge/core/range_probe.hpp>
#include <surge/core/resume_store.hpp>
#include <surge/core/segment.hpp>
#include <surge/core/segment_worker.hpp>
#include <surge/core/task_types.hpp>
#include <surge/disk/file_writer.hpp>
#include <surge/net/http_client.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace surge::core {

struct TaskOptions {
    std::uint32_t segments{0};            // 0 = EngineConfig::default_segments
    std::optional<Checksum> checksum;
};

// Shared collaborators handed to every task by the manager
struct TaskContext {
    std::shared_ptr<net::HttpClient> http;
    std::shared_ptr<ResumeStore> store;
    std::shared_ptr<ConnectionLimiter> limiter;   // May be null
    EngineConfig config;
};

using TerminalCallback = std::function<void(const TerminalEvent&)>;
using StateCallback = std::function<void(TaskId, TaskState from, TaskState to)>;

// One download: plan -> spawn workers -> aggregate -> finalize.
// A control thread drives each run; public calls only signal it and wait.
class DownloadTask {
public:
    DownloadTask(TaskId id, std::string url, std::filesystem::path destination,
                 TaskOptions options, TaskContext context);

    // Task recovered from disk; starts Paused and is validated on resume()
    DownloadTask(ResumeRecord record, TaskContext context);

    ~DownloadTask();

    DownloadTask(const DownloadTask&) = delete;
    DownloadTask& operator=(const DownloadTask&) = delete;

    // Planning -> probe, plan, Downloading
    [[nodiscard]] std::error_code start();

    // Downloading -> Paused; blocks until workers have stopped and offsets are saved
    [[nodiscard]] std::error_code pause();

    // Paused -> Downloading from the recorded offsets
    [[nodiscard]] std::error_code resume();

    // Any non-terminal state -> Cancelled; removes the .part file and the resume record
    [[nodiscard]] std::error_code cancel();

    // Stop without a terminal state: Downloading pauses, Planning is abandoned
    void shutdown();

    // Wait until no run is in progress; false on timeout
    bool wait(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Register the hook before start(); called on the thread making the change
    void on_state_change(StateCallback callback);

    // Progress arrives at the publish rate; terminal fires once (immediately if already terminal)
    SubscriptionId subscribe(ProgressCallback on_progress, TerminalCallback on_terminal);
    void unsubscribe(SubscriptionId id);

    [[nodiscard]] TaskId id() const noexcept { return id_; }
    [[nodiscard]] TaskState state() const;
    [[nodiscard]] bool running() const;
    [[nodiscard]] ProgressSnapshot progress() const;
    [[nodiscard]] std::vector<SegmentView> segments() const;
    [[nodiscard]] std::optional<TerminalEvent> terminal_event() const;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] const std::filesystem::path& destination() const noexcept { return destination_; }
    [[nodiscard]] const std::filesystem::path& part_path() const noexcept { return part_path_; }

    // Current state as a persisted record
    [[nodiscard]] ResumeRecord checkpoint_record() const;

private:
    enum class Command : std::uint8_t { none, pause, cancel, shutdown };
    enum class RunMode : std::uint8_t { fresh, resume_memory, resume_record };
    enum class PhaseResult : std::uint8_t { complete, stopped, failed, replan_single, replan_fresh };

    struct WorkerHandle {
        Segment* segment{nullptr};
        std::jthread thread;
        bool finished{false};
        bool collected{false};
        WorkerOutcome outcome{WorkerOutcome::paused};
        std::uint32_t runs{1};
    };

    void control_main(std::stop_token stop, RunMode mode);

    // Probe + plan + open .part + first checkpoint
    [[nodiscard]] std::error_code prepare_fresh(std::stop_token stop);
    [[nodiscard]] std::error_code prepare_from_record(std::stop_token stop);
    [[nodiscard]] std::error_code reopen_for_resume();

    // New plan from scratch: truncate .part, zero progress, checkpoint
    [[nodiscard]] std::error_code begin_fresh();

    // Probe; an ambiguous answer degrades to single-segment, unknown size
    [[nodiscard]] std::expected<ProbeResult, std::error_code> probe(std::stop_token stop);
    void apply_probe(const ProbeResult& info);

    void run_download(std::stop_token stop);

    PhaseResult download_phase(std::stop_token stop, std::error_code& failure);
    void spawn_worker(WorkerHandle& handle);
    void stop_workers(std::vector<std::unique_ptr<WorkerHandle>>& workers);

    void finalize();
    void handle_stop();
    void fail(std::error_code ec, std::string message, bool keep_record = true);
    void finish_cancel();

    // Validated transition; fires state hook and, for terminal states, the terminal event
    bool transition(TaskState to, std::optional<TerminalEvent> event = std::nullopt);

    [[nodiscard]] std::error_code save_checkpoint();
    void install_plan(const SegmentPlan& plan, const std::vector<SegmentCheckpoint>* progress);
    [[nodiscard]] net::HttpRequest request_template() const;
    [[nodiscard]] std::uint32_t requested_segments() const noexcept;
    [[nodiscard]] bool on_control_thread() const noexcept;

    const TaskId id_;
    const std::string url_;
    const std::filesystem::path destination_;
    const std::filesystem::path part_path_;
    const TaskOptions options_;
    const TaskContext ctx_;
    const std::int64_t created_at_;

    // Server facts from the last probe (or the resume record)
    std::optional<std::uint64_t> total_size_;
    bool supports_ranges_{false};
    std::string etag_;
    std::string last_modified_;

    std::optional<ResumeRecord> pending_record_;  // Set for tasks recovered from disk
    bool record_saved_{false};
    bool committing_{false};  // Guarded by state_mutex_; set once the rename is under way
    bool collapsed_to_single_{false};
    bool replanned_fresh_{false};

    mutable std::mutex segments_mutex_;
    std::vector<std::unique_ptr<Segment>> segments_;

    disk::FileWriter file_;
    ProgressAggregator progress_;
    std::chrono::steady_clock::time_point last_checkpoint_;

    // Worker completion signal
    std::mutex events_mutex_;
    std::condition_variable_any events_cv_;
    std::uint32_t pending_events_{0};

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    TaskState state_{TaskState::planning};
    bool running_{false};
    bool started_{false};
    std::optional<TerminalEvent> terminal_;
    std::atomic<Command> command_{Command::none};

    std::mutex callbacks_mutex_;
    StateCallback state_callback_;
    std::map<SubscriptionId, TerminalCallback> terminal_subscribers_;

    // Serializes start/pause/resume/cancel
    std::mutex ops_mutex_;
    std::jthread control_;
    std::atomic<std::thread::id> control_id_{};
};

} // namespace surge::core
