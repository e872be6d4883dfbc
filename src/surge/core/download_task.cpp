// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/download_task.hpp>
#include <surge/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace surge::core {

namespace {

std::int64_t unix_now() noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::filesystem::path make_part_path(const std::filesystem::path& destination) {
    auto part = destination;
    part += PART_EXTENSION;
    return part;
}

std::string describe_size(const std::optional<std::uint64_t>& size) {
    return size ? std::to_string(*size) + " bytes" : std::string("unknown size");
}

} // namespace

//=============================================================================
// Construction
//=============================================================================

DownloadTask::DownloadTask(TaskId id, std::string url, std::filesystem::path destination,
                           TaskOptions options, TaskContext context)
    : id_(id)
    , url_(std::move(url))
    , destination_(std::move(destination))
    , part_path_(make_part_path(destination_))
    , options_(std::move(options))
    , ctx_(std::move(context))
    , created_at_(unix_now())
    , progress_(std::nullopt, ctx_.config.speed_window, ctx_.config.publish_interval) {}

DownloadTask::DownloadTask(ResumeRecord record, TaskContext context)
    : id_(record.task_id)
    , url_(record.url)
    , destination_(record.destination)
    , part_path_(make_part_path(destination_))
    , options_(TaskOptions{record.requested_segments, record.checksum})
    , ctx_(std::move(context))
    , created_at_(record.created_at != 0 ? record.created_at : unix_now())
    , progress_(record.total_size, ctx_.config.speed_window, ctx_.config.publish_interval) {
    total_size_ = record.total_size;
    supports_ranges_ = record.supports_ranges;
    etag_ = record.etag;
    last_modified_ = record.last_modified;
    install_plan(record.plan(), &record.segments);
    progress_.reset(record.partial_bytes());

    state_ = TaskState::paused;
    started_ = true;
    record_saved_ = true;
    pending_record_ = std::move(record);
}

DownloadTask::~DownloadTask() {
    shutdown();
    if (control_.joinable()) {
        control_.join();
    }
    file_.close();
}

//=============================================================================
// Commands
//=============================================================================

std::error_code DownloadTask::start() {
    std::lock_guard ops(ops_mutex_);
    {
        std::lock_guard lock(state_mutex_);
        if (started_ || state_ != TaskState::planning) {
            return make_error_code(DownloadErrc::invalid_state);
        }
        started_ = true;
        running_ = true;
    }
    command_.store(Command::none);
    control_ = std::jthread([this](std::stop_token stop) { control_main(stop, RunMode::fresh); });
    return {};
}

std::error_code DownloadTask::pause() {
    {
        std::lock_guard ops(ops_mutex_);
        std::lock_guard lock(state_mutex_);
        if (state_ != TaskState::downloading || !running_) {
            return make_error_code(DownloadErrc::invalid_state);
        }
        Command expected = Command::none;
        if (!command_.compare_exchange_strong(expected, Command::pause)) {
            return make_error_code(DownloadErrc::invalid_state);
        }
        control_.request_stop();
    }

    // Called from a progress callback: the control thread finishes the pause itself
    if (on_control_thread()) {
        return {};
    }
    wait();
    return state() == TaskState::paused ? std::error_code{} : make_error_code(DownloadErrc::invalid_state);
}

std::error_code DownloadTask::resume() {
    std::lock_guard ops(ops_mutex_);
    {
        std::lock_guard lock(state_mutex_);
        if (state_ != TaskState::paused || running_) {
            return make_error_code(DownloadErrc::invalid_state);
        }
        running_ = true;
    }
    if (control_.joinable()) {
        control_.join();
    }

    const auto mode = pending_record_ ? RunMode::resume_record : RunMode::resume_memory;
    command_.store(Command::none);
    transition(TaskState::downloading);
    control_ = std::jthread([this, mode](std::stop_token stop) { control_main(stop, mode); });
    return {};
}

std::error_code DownloadTask::cancel() {
    {
        std::unique_lock ops(ops_mutex_);
        std::unique_lock lock(state_mutex_);
        if (is_terminal(state_) || committing_) {
            return make_error_code(DownloadErrc::invalid_state);
        }
        if (running_) {
            command_.store(Command::cancel);
            control_.request_stop();
            lock.unlock();
            ops.unlock();
            if (!on_control_thread()) {
                wait();
            }
            return {};
        }
        lock.unlock();

        // Queued, paused or failed: nothing is running, clean up here
        if (control_.joinable()) {
            control_.join();
        }
        command_.store(Command::cancel);
        finish_cancel();
    }
    return {};
}

void DownloadTask::shutdown() {
    {
        std::lock_guard ops(ops_mutex_);
        std::lock_guard lock(state_mutex_);
        if (!running_) {
            return;
        }
        Command expected = Command::none;
        command_.compare_exchange_strong(expected, Command::shutdown);
        control_.request_stop();
    }
    if (!on_control_thread()) {
        wait();
    }
}

bool DownloadTask::wait(std::optional<std::chrono::milliseconds> timeout) {
    std::unique_lock lock(state_mutex_);
    auto idle = [this] { return !running_; };
    if (timeout) {
        return state_cv_.wait_for(lock, *timeout, idle);
    }
    state_cv_.wait(lock, idle);
    return true;
}

//=============================================================================
// Subscriptions and queries
//=============================================================================

void DownloadTask::on_state_change(StateCallback callback) {
    std::lock_guard lock(callbacks_mutex_);
    state_callback_ = std::move(callback);
}

SubscriptionId DownloadTask::subscribe(ProgressCallback on_progress, TerminalCallback on_terminal) {
    if (!on_progress) {
        on_progress = [](const ProgressSnapshot&) {};
    }
    auto id = progress_.subscribe(std::move(on_progress));
    if (!on_terminal) {
        return id;
    }

    std::optional<TerminalEvent> already;
    {
        std::lock_guard lock(state_mutex_);
        if (terminal_) {
            already = terminal_;
        } else {
            std::lock_guard cb_lock(callbacks_mutex_);
            terminal_subscribers_.emplace(id, on_terminal);
        }
    }
    if (already) {
        on_terminal(*already);
    }
    return id;
}

void DownloadTask::unsubscribe(SubscriptionId id) {
    progress_.unsubscribe(id);
    std::lock_guard lock(callbacks_mutex_);
    terminal_subscribers_.erase(id);
}

TaskState DownloadTask::state() const {
    std::lock_guard lock(state_mutex_);
    return state_;
}

bool DownloadTask::running() const {
    std::lock_guard lock(state_mutex_);
    return running_;
}

ProgressSnapshot DownloadTask::progress() const {
    return progress_.snapshot(std::chrono::steady_clock::now());
}

std::vector<SegmentView> DownloadTask::segments() const {
    std::lock_guard lock(segments_mutex_);
    std::vector<SegmentView> views;
    views.reserve(segments_.size());
    for (const auto& seg : segments_) {
        views.push_back(seg->view());
    }
    return views;
}

std::optional<TerminalEvent> DownloadTask::terminal_event() const {
    std::lock_guard lock(state_mutex_);
    return terminal_;
}

ResumeRecord DownloadTask::checkpoint_record() const {
    ResumeRecord record;
    record.task_id = id_;
    record.url = url_;
    record.destination = destination_;
    record.total_size = total_size_;
    record.requested_segments = requested_segments();
    record.min_segment_size = ctx_.config.min_segment_size;
    record.supports_ranges = supports_ranges_;
    record.etag = etag_;
    record.last_modified = last_modified_;
    record.checksum = options_.checksum;
    record.created_at = created_at_;
    record.updated_at = unix_now();

    std::lock_guard lock(segments_mutex_);
    record.segments.reserve(segments_.size());
    for (const auto& seg : segments_) {
        record.segments.push_back(SegmentCheckpoint{
            seg->index(), seg->offset(), seg->length(), seg->downloaded()});
    }
    return record;
}

//=============================================================================
// Control thread
//=============================================================================

void DownloadTask::control_main(std::stop_token stop, RunMode mode) {
    control_id_.store(std::this_thread::get_id());

    try {
        std::error_code ec;
        switch (mode) {
            case RunMode::fresh:         ec = prepare_fresh(stop); break;
            case RunMode::resume_record: ec = prepare_from_record(stop); break;
            case RunMode::resume_memory: ec = reopen_for_resume(); break;
        }

        if (stop.stop_requested()) {
            handle_stop();
        } else if (ec) {
            fail(ec, "Could not start download: " + ec.message());
        } else {
            run_download(stop);
        }
    } catch (const std::system_error& e) {
        spdlog::error("Task {}: {}", id_, e.what());
        fail(e.code(), e.what());
    } catch (const std::bad_alloc&) {
        fail(make_error_code(disk::DiskErrc::allocation_failed), "Out of memory");
    } catch (const std::exception& e) {
        spdlog::error("Task {}: {}", id_, e.what());
        fail(make_error_code(DownloadErrc::invalid_state), e.what());
    }

    // A cancel issued from a terminal callback on this thread lands here
    if (command_.load() == Command::cancel && state() == TaskState::failed) {
        finish_cancel();
    }

    {
        std::lock_guard lock(state_mutex_);
        running_ = false;
    }
    control_id_.store(std::thread::id{});
    state_cv_.notify_all();
}

std::expected<ProbeResult, std::error_code> DownloadTask::probe(std::stop_token stop) {
    RangeProbe prober(*ctx_.http, request_template());
    auto info = prober.probe(url_, stop);
    if (!info && info.error() == DownloadErrc::probe_ambiguous) {
        spdlog::warn("Task {}: server answers are ambiguous, using a single stream", id_);
        return ProbeResult{};
    }
    return info;
}

void DownloadTask::apply_probe(const ProbeResult& info) {
    total_size_ = info.total_size;
    supports_ranges_ = info.supports_ranges;
    etag_ = info.etag;
    last_modified_ = info.last_modified;
}

std::error_code DownloadTask::prepare_fresh(std::stop_token stop) {
    auto info = probe(stop);
    if (!info) {
        return info.error();
    }
    apply_probe(*info);

    if (auto ec = begin_fresh()) {
        return ec;
    }
    transition(TaskState::downloading);
    return {};
}

std::error_code DownloadTask::begin_fresh() {
    SegmentPlanner planner(ctx_.config.min_segment_size, ctx_.config.max_segments);
    auto plan = planner.plan(total_size_, supports_ranges_, requested_segments());
    spdlog::info("Task {}: {} segment(s), {}, ranges {}", id_, plan.size(),
                 describe_size(total_size_), supports_ranges_ ? "supported" : "unsupported");

    file_.close();
    if (auto ec = file_.open(part_path_, total_size_, /*truncate=*/true)) {
        spdlog::error("Task {}: cannot open {}: {}", id_, part_path_.string(), ec.message());
        return ec;
    }

    install_plan(plan, nullptr);
    progress_.set_total(total_size_);
    progress_.reset(0);
    return save_checkpoint();
}

std::error_code DownloadTask::prepare_from_record(std::stop_token stop) {
    // The record stays pending until it is validated or replaced
    const ResumeRecord& record = *pending_record_;

    auto info = probe(stop);
    if (stop.stop_requested()) {
        return {};
    }
    if (!info) {
        return info.error();
    }

    std::string stale;
    std::error_code ec;
    if (info->total_size != record.total_size) {
        stale = "size changed";
    } else if (!record.etag.empty() && info->etag != record.etag) {
        stale = "ETag changed";
    } else if (!record.last_modified.empty() && info->last_modified != record.last_modified) {
        stale = "Last-Modified changed";
    } else if (record.supports_ranges && !info->supports_ranges) {
        stale = "server stopped accepting ranges";
    } else if (!std::filesystem::exists(part_path_, ec)) {
        stale = "partial file missing";
    } else {
        auto max_segments = std::max<std::uint32_t>(ctx_.config.max_segments,
                                                    static_cast<std::uint32_t>(record.segments.size()));
        SegmentPlanner planner(record.min_segment_size, max_segments);
        auto rebuilt = planner.plan(record.total_size, record.supports_ranges, record.requested_segments);
        if (rebuilt != record.plan()) {
            stale = "plan does not reconstruct";
        }
    }

    if (!stale.empty()) {
        spdlog::warn("Task {}: resume state is stale ({}), restarting from scratch", id_, stale);
        if (auto rm = ctx_.store->remove(id_)) {
            spdlog::warn("Task {}: could not remove resume record: {}", id_, rm.message());
        }
        apply_probe(*info);
        if (auto fresh_ec = begin_fresh()) {
            return fresh_ec;
        }
        pending_record_.reset();
        return {};
    }

    if (auto open_ec = file_.open(part_path_, total_size_, /*truncate=*/false)) {
        return open_ec;
    }
    const auto partial = record.partial_bytes();
    pending_record_.reset();
    progress_.set_total(total_size_);
    progress_.reset(partial);
    spdlog::info("Task {}: resuming at {} of {}", id_, partial, describe_size(total_size_));
    return {};
}

std::error_code DownloadTask::reopen_for_resume() {
    std::uint64_t done = 0;
    {
        std::lock_guard lock(segments_mutex_);
        for (const auto& seg : segments_) {
            done += seg->downloaded();
        }
    }

    std::error_code ec;
    if (done > 0 && !std::filesystem::exists(part_path_, ec)) {
        spdlog::warn("Task {}: partial file disappeared, restarting from scratch", id_);
        return begin_fresh();
    }
    if (auto open_ec = file_.open(part_path_, total_size_, /*truncate=*/false)) {
        return open_ec;
    }
    progress_.reset(done);
    spdlog::info("Task {}: resuming at {} of {}", id_, done, describe_size(total_size_));
    return {};
}

void DownloadTask::run_download(std::stop_token stop) {
    while (true) {
        std::error_code failure;
        auto result = download_phase(stop, failure);

        switch (result) {
            case PhaseResult::complete:
                finalize();
                return;

            case PhaseResult::stopped:
                handle_stop();
                return;

            case PhaseResult::failed:
                fail(failure, "Segment failed: " + failure.message());
                return;

            case PhaseResult::replan_single: {
                collapsed_to_single_ = true;
                spdlog::warn("Task {}: server ignores ranges, falling back to a single stream", id_);
                supports_ranges_ = false;
                if (auto ec = begin_fresh()) {
                    fail(ec, "Could not restart download: " + ec.message());
                    return;
                }
                break;
            }

            case PhaseResult::replan_fresh: {
                replanned_fresh_ = true;
                spdlog::warn("Task {}: range not satisfiable, re-probing", id_);
                auto info = probe(stop);
                if (stop.stop_requested()) {
                    handle_stop();
                    return;
                }
                if (!info) {
                    fail(info.error(), "Re-probe failed: " + info.error().message());
                    return;
                }
                apply_probe(*info);
                if (auto ec = begin_fresh()) {
                    fail(ec, "Could not restart download: " + ec.message());
                    return;
                }
                break;
            }
        }
    }
}

DownloadTask::PhaseResult DownloadTask::download_phase(std::stop_token stop, std::error_code& failure) {
    std::vector<std::unique_ptr<WorkerHandle>> workers;
    {
        std::lock_guard lock(segments_mutex_);
        for (auto& seg : segments_) {
            if (seg->is_complete()) {
                seg->state(SegmentState::completed);
                continue;
            }
            auto handle = std::make_unique<WorkerHandle>();
            handle->segment = seg.get();
            workers.push_back(std::move(handle));
        }
    }
    {
        std::lock_guard lock(events_mutex_);
        pending_events_ = 0;
    }
    for (auto& handle : workers) {
        spawn_worker(*handle);
    }

    last_checkpoint_ = std::chrono::steady_clock::now();
    progress_.publish_now(last_checkpoint_);

    while (true) {
        // Collect finished workers
        std::vector<WorkerHandle*> finished;
        std::size_t outstanding = 0;
        {
            std::lock_guard lock(events_mutex_);
            for (auto& handle : workers) {
                if (handle->finished && !handle->collected) {
                    handle->collected = true;
                    finished.push_back(handle.get());
                } else if (!handle->finished) {
                    ++outstanding;
                }
            }
        }

        for (auto* handle : finished) {
            if (handle->thread.joinable()) {
                handle->thread.join();
            }
            if (handle->outcome == WorkerOutcome::completed) {
                continue;
            }
            if (handle->outcome == WorkerOutcome::paused && stop.stop_requested()) {
                continue;
            }

            auto ec = handle->segment->error();
            if (!ec) {
                ec = make_error_code(DownloadErrc::connection_lost);
            }

            if (ec == DownloadErrc::range_ignored && !collapsed_to_single_) {
                stop_workers(workers);
                return PhaseResult::replan_single;
            }
            if (ec == DownloadErrc::range_not_satisfiable && !replanned_fresh_) {
                stop_workers(workers);
                return PhaseResult::replan_fresh;
            }
            if (ctx_.config.failure_policy == FailurePolicy::best_effort &&
                handle->runs <= ctx_.config.task_retries) {
                spdlog::warn("Task {}: segment {} failed ({}), task-level retry {}/{}", id_,
                             handle->segment->index(), ec.message(), handle->runs,
                             ctx_.config.task_retries);
                ++handle->runs;
                spawn_worker(*handle);
                ++outstanding;
                continue;
            }

            failure = ec;
            stop_workers(workers);
            return PhaseResult::failed;
        }

        if (stop.stop_requested()) {
            stop_workers(workers);
            return PhaseResult::stopped;
        }

        if (outstanding == 0) {
            bool all_complete = true;
            {
                std::lock_guard lock(segments_mutex_);
                for (const auto& seg : segments_) {
                    all_complete = all_complete && seg->is_complete();
                }
            }
            if (all_complete) {
                return PhaseResult::complete;
            }
            failure = make_error_code(DownloadErrc::connection_lost);
            return PhaseResult::failed;
        }

        auto now = std::chrono::steady_clock::now();
        progress_.tick(now);

        if (now - last_checkpoint_ >= ctx_.config.checkpoint_interval) {
            if (auto ec = save_checkpoint()) {
                failure = ec;
                stop_workers(workers);
                return PhaseResult::failed;
            }
        }

        std::unique_lock lock(events_mutex_);
        events_cv_.wait_for(lock, stop, MONITOR_INTERVAL, [this] { return pending_events_ > 0; });
        pending_events_ = 0;
    }
}

void DownloadTask::spawn_worker(WorkerHandle& handle) {
    std::size_t segment_count = 0;
    {
        std::lock_guard lock(segments_mutex_);
        segment_count = segments_.size();
    }

    net::HttpRequest request = request_template();
    if (ctx_.config.speed_limit_bps > 0 && segment_count > 0) {
        request.max_recv_speed = std::max<std::uint64_t>(1, ctx_.config.speed_limit_bps / segment_count);
    }

    WorkerContext context{
        *ctx_.http,
        file_,
        progress_,
        ctx_.limiter.get(),
        ctx_.config.retry,
        std::move(request),
        supports_ranges_,
        segment_count == 1,
    };

    {
        std::lock_guard lock(events_mutex_);
        handle.finished = false;
        handle.collected = false;
    }

    handle.thread = std::jthread([this, &handle, context = std::move(context)](std::stop_token stop) {
        auto outcome = WorkerOutcome::failed;
        try {
            SegmentWorker worker(*handle.segment, context);
            outcome = worker.run(stop);
        } catch (const std::exception& e) {
            spdlog::error("Task {}: segment {} worker threw: {}", id_, handle.segment->index(), e.what());
            handle.segment->error(make_error_code(DownloadErrc::network_error));
            handle.segment->state(SegmentState::failed);
        }
        {
            std::lock_guard lock(events_mutex_);
            handle.outcome = outcome;
            handle.finished = true;
            ++pending_events_;
        }
        events_cv_.notify_all();
    });
}

void DownloadTask::stop_workers(std::vector<std::unique_ptr<WorkerHandle>>& workers) {
    for (auto& handle : workers) {
        handle->thread.request_stop();
    }
    for (auto& handle : workers) {
        if (handle->thread.joinable()) {
            handle->thread.join();
        }
    }
}

//=============================================================================
// Terminal paths
//=============================================================================

void DownloadTask::finalize() {
    transition(TaskState::finalizing);
    progress_.publish_now(std::chrono::steady_clock::now());

    if (auto ec = file_.flush()) {
        fail(ec, "Flushing " + part_path_.string() + " failed: " + ec.message());
        return;
    }
    file_.close();

    std::error_code fs_ec;
    auto actual = std::filesystem::file_size(part_path_, fs_ec);
    if (fs_ec) {
        auto ec = disk::errno_to_error_code(fs_ec.value(), disk::DiskErrc::read_error);
        fail(ec, "Cannot stat " + part_path_.string() + ": " + ec.message());
        return;
    }

    if (total_size_ && actual != *total_size_) {
        fail(make_error_code(DownloadErrc::size_mismatch),
             "Expected " + std::to_string(*total_size_) + " bytes, got " + std::to_string(actual),
             /*keep_record=*/false);
        return;
    }

    std::string digest;
    if (options_.checksum) {
        auto computed = hash_file(part_path_, options_.checksum->algo);
        if (!computed) {
            fail(computed.error(), "Hashing failed: " + computed.error().message());
            return;
        }
        if (!digest_equals(*computed, options_.checksum->hex)) {
            fail(make_error_code(DownloadErrc::checksum_mismatch),
                 std::string(to_string(options_.checksum->algo)) + " mismatch: expected " +
                     options_.checksum->hex + ", got " + *computed,
                 /*keep_record=*/false);
            return;
        }
        digest = std::move(*computed);
    }

    // Past this point cancel() is refused
    bool cancelled = false;
    {
        std::lock_guard lock(state_mutex_);
        cancelled = command_.load() == Command::cancel;
        committing_ = !cancelled;
    }
    if (cancelled) {
        finish_cancel();
        return;
    }

    if (auto ec = disk::atomic_replace(part_path_, destination_)) {
        {
            std::lock_guard lock(state_mutex_);
            committing_ = false;
        }
        fail(ec, "Cannot move download into place: " + ec.message());
        return;
    }
    if (auto ec = ctx_.store->remove(id_)) {
        spdlog::warn("Task {}: could not remove resume record: {}", id_, ec.message());
    }
    record_saved_ = false;

    TerminalEvent event;
    event.task_id = id_;
    event.state = TaskState::completed;
    event.message = "Saved " + destination_.string();
    event.path = destination_;
    event.digest = std::move(digest);
    transition(TaskState::completed, std::move(event));
}

void DownloadTask::handle_stop() {
    auto command = command_.load();
    if (command == Command::cancel) {
        finish_cancel();
        return;
    }

    if (state() == TaskState::downloading) {
        if (auto ec = save_checkpoint()) {
            spdlog::error("Task {}: checkpoint on pause failed: {}", id_, ec.message());
        }
        file_.close();
        progress_.publish_now(std::chrono::steady_clock::now());
        transition(TaskState::paused);
        return;
    }

    // Shutdown while still planning: drop the half-prepared file unless a record refers to it
    file_.close();
    if (!record_saved_) {
        if (auto ec = disk::remove_file(part_path_)) {
            spdlog::warn("Task {}: could not remove {}: {}", id_, part_path_.string(), ec.message());
        }
    }
}

void DownloadTask::fail(std::error_code ec, std::string message, bool keep_record) {
    bool has_plan = false;
    {
        std::lock_guard lock(segments_mutex_);
        has_plan = !segments_.empty();
    }

    if (keep_record && has_plan) {
        if (auto save_ec = save_checkpoint()) {
            spdlog::error("Task {}: checkpoint after failure failed: {}", id_, save_ec.message());
        }
    } else if (!keep_record) {
        if (auto rm = ctx_.store->remove(id_)) {
            spdlog::warn("Task {}: could not remove resume record: {}", id_, rm.message());
        }
        record_saved_ = false;
    }
    file_.close();

    spdlog::error("Task {} failed: {}", id_, message);

    TerminalEvent event;
    event.task_id = id_;
    event.state = TaskState::failed;
    event.error = ec;
    event.message = std::move(message);
    std::error_code exists_ec;
    if (std::filesystem::exists(part_path_, exists_ec)) {
        event.path = part_path_;
    }
    transition(TaskState::failed, std::move(event));
}

void DownloadTask::finish_cancel() {
    file_.close();
    if (auto ec = disk::remove_file(part_path_)) {
        spdlog::warn("Task {}: could not remove {}: {}", id_, part_path_.string(), ec.message());
    }
    if (auto ec = ctx_.store->remove(id_)) {
        spdlog::warn("Task {}: could not remove resume record: {}", id_, ec.message());
    }
    record_saved_ = false;

    TerminalEvent event;
    event.task_id = id_;
    event.state = TaskState::cancelled;
    event.error = make_error_code(DownloadErrc::cancelled);
    event.message = "Download cancelled";
    transition(TaskState::cancelled, std::move(event));
}

bool DownloadTask::transition(TaskState to, std::optional<TerminalEvent> event) {
    TaskState from;
    {
        std::lock_guard lock(state_mutex_);
        if (!is_valid_transition(state_, to)) {
            spdlog::error("Task {}: rejected transition {} -> {}", id_, to_string(state_), to_string(to));
            return false;
        }
        from = state_;
        state_ = to;
        if (event) {
            terminal_ = *event;
        }
    }
    state_cv_.notify_all();

    if (to == TaskState::completed) {
        spdlog::info("Task {}: {} -> {}", id_, to_string(from), to_string(to));
    } else {
        spdlog::debug("Task {}: {} -> {}", id_, to_string(from), to_string(to));
    }

    StateCallback hook;
    std::vector<TerminalCallback> subscribers;
    {
        std::lock_guard lock(callbacks_mutex_);
        hook = state_callback_;
        if (event) {
            for (const auto& [sid, cb] : terminal_subscribers_) {
                subscribers.push_back(cb);
            }
        }
    }

    try {
        if (hook) {
            hook(id_, from, to);
        }
        for (const auto& cb : subscribers) {
            cb(*event);
        }
    } catch (const std::exception& e) {
        spdlog::error("Task {}: state subscriber threw: {}", id_, e.what());
    }
    return true;
}

//=============================================================================
// Helpers
//=============================================================================

std::error_code DownloadTask::save_checkpoint() {
    // Snapshot first: every byte the record claims was written before the flush
    auto record = checkpoint_record();
    if (file_.is_open()) {
        if (auto ec = file_.flush()) {
            return ec;
        }
    }
    if (auto ec = ctx_.store->save(record)) {
        return ec;
    }
    record_saved_ = true;
    last_checkpoint_ = std::chrono::steady_clock::now();
    return {};
}

void DownloadTask::install_plan(const SegmentPlan& plan, const std::vector<SegmentCheckpoint>* progress) {
    std::lock_guard lock(segments_mutex_);
    segments_.clear();
    segments_.reserve(plan.size());
    for (std::size_t i = 0; i < plan.size(); ++i) {
        std::uint64_t done = (progress && i < progress->size()) ? (*progress)[i].downloaded : 0;
        auto seg = std::make_unique<Segment>(plan[i], done);
        if (!seg->is_complete() && done > 0) {
            seg->state(SegmentState::paused);
        }
        segments_.push_back(std::move(seg));
    }
}

net::HttpRequest DownloadTask::request_template() const {
    net::HttpRequest request;
    request.url = url_;
    request.connect_timeout = ctx_.config.connect_timeout;
    request.read_timeout = ctx_.config.read_timeout;
    request.user_agent = ctx_.config.user_agent;
    request.verify_tls = ctx_.config.verify_tls;
    return request;
}

std::uint32_t DownloadTask::requested_segments() const noexcept {
    return options_.segments != 0 ? options_.segments : ctx_.config.default_segments;
}

bool DownloadTask::on_control_thread() const noexcept {
    return control_id_.load() == std::this_thread::get_id();
}

} // namespace surge::core
