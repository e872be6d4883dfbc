// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/download_manager.hpp>
#include <surge/core/url.hpp>
#include <surge/net/curl_http_client.hpp>
#include <surge/version.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace surge::core {

namespace {

ProgressSnapshot snapshot_from_record(const ResumeRecord& record) {
    ProgressSnapshot snap;
    snap.downloaded_bytes = record.partial_bytes();
    snap.total_bytes = record.total_size;
    snap.timestamp = std::chrono::steady_clock::now();
    return snap;
}

std::vector<SegmentView> views_from_record(const ResumeRecord& record) {
    std::vector<SegmentView> views;
    views.reserve(record.segments.size());
    for (const auto& cp : record.segments) {
        SegmentView view;
        view.index = cp.index;
        view.offset = cp.offset;
        view.length = cp.length;
        view.downloaded = cp.downloaded;
        view.state = (cp.length && cp.downloaded >= *cp.length) ? SegmentState::completed
                                                                : SegmentState::paused;
        views.push_back(view);
    }
    return views;
}

} // namespace

//=============================================================================
// Construction
//=============================================================================

DownloadManager::DownloadManager(EngineConfig config, std::shared_ptr<net::HttpClient> http)
    : config_(std::move(config)) {
    set_log_level(config_.log_level);

    if (!http) {
        http = std::make_shared<net::CurlHttpClient>();
    }
    context_.http = std::move(http);
    context_.store = std::make_shared<ResumeStore>(config_.state_dir);
    if (config_.max_connections > 0) {
        context_.limiter = std::make_shared<ConnectionLimiter>(config_.max_connections);
    }
    context_.config = config_;

    spdlog::info("surge {} engine, state in {}", version.to_string(), config_.state_dir.string());

    auto ids = context_.store->list();
    if (!ids) {
        spdlog::warn("Cannot scan {}: {}", config_.state_dir.string(), ids.error().message());
        return;
    }

    std::size_t recovered = 0;
    for (auto id : *ids) {
        next_id_ = std::max(next_id_, id + 1);
        auto record = context_.store->load(id);
        if (!record) {
            spdlog::warn("Discarding unreadable resume record {}: {}", id, record.error().message());
            if (auto ec = context_.store->remove(id)) {
                spdlog::warn("Could not remove resume record {}: {}", id, ec.message());
            }
            continue;
        }
        ++recovered;
    }
    if (recovered > 0) {
        spdlog::info("{} resumable download(s) found", recovered);
    }
}

DownloadManager::~DownloadManager() {
    std::vector<TaskPtr> tasks;
    {
        std::lock_guard lock(mutex_);
        closing_ = true;
        queue_.clear();
        for (const auto& [id, task] : tasks_) {
            tasks.push_back(task);
        }
    }

    // Running downloads pause and keep their record for the next process
    for (const auto& task : tasks) {
        task->shutdown();
    }

    std::vector<TaskPtr> retired;
    {
        std::lock_guard lock(mutex_);
        tasks_.clear();
        retired.swap(retired_);
    }
    tasks.clear();
    retired.clear();
}

//=============================================================================
// Engine API
//=============================================================================

std::expected<TaskId, std::error_code>
DownloadManager::start_download(std::string_view url, std::filesystem::path destination,
                                std::uint32_t segments, std::optional<Checksum> checksum) {
    auto parsed = Url::parse(url);
    if (!parsed) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
    if (destination.empty() || !destination.has_filename()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
    }
    reap_retired();

    TaskId id = 0;
    {
        std::lock_guard lock(mutex_);
        if (closing_) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_state));
        }
        id = next_id_++;
    }

    auto task = make_task(id, std::string(url), std::move(destination),
                          TaskOptions{segments, std::move(checksum)});
    {
        std::lock_guard lock(mutex_);
        tasks_.emplace(id, task);
    }
    spdlog::info("Task {}: {} -> {}", id, task->url(), task->destination().string());

    if (auto ec = admit(task, /*resume=*/false)) {
        return std::unexpected(ec);
    }
    return id;
}

std::error_code DownloadManager::pause_download(TaskId id) {
    reap_retired();

    TaskPtr task;
    {
        std::lock_guard lock(mutex_);
        auto queued = std::find_if(queue_.begin(), queue_.end(),
                                   [id](const QueueEntry& e) { return e.id == id; });
        if (queued != queue_.end()) {
            // A queued resume simply stays paused; a queued start has nothing to pause yet
            if (!queued->resume) {
                return make_error_code(DownloadErrc::invalid_state);
            }
            queue_.erase(queued);
            return {};
        }
        if (finished_.contains(id)) {
            return make_error_code(DownloadErrc::invalid_state);
        }
        task = find(id);
    }

    if (!task) {
        std::error_code ec;
        if (std::filesystem::exists(context_.store->record_path(id), ec)) {
            return make_error_code(DownloadErrc::invalid_state);
        }
        return make_error_code(DownloadErrc::unknown_task);
    }
    return task->pause();
}

std::error_code DownloadManager::resume_download(TaskId id) {
    reap_retired();
    {
        std::lock_guard lock(mutex_);
        if (queued_locked(id)) {
            return {};
        }
    }

    auto found = find_or_recover(id);
    if (!found) {
        return found.error();
    }
    auto task = *found;

    if (task->state() == TaskState::failed) {
        // Retry a failed task from its last checkpoint
        auto record = context_.store->load(id);
        if (!record) {
            return record.error() == DownloadErrc::resume_not_found
                       ? make_error_code(DownloadErrc::invalid_state)
                       : record.error();
        }
        auto fresh = make_task(std::move(*record));
        {
            std::lock_guard lock(mutex_);
            retired_.push_back(task);
            tasks_[id] = fresh;
        }
        task = std::move(fresh);
    }

    if (task->state() != TaskState::paused || task->running()) {
        return make_error_code(DownloadErrc::invalid_state);
    }
    return admit(task, /*resume=*/true);
}

std::error_code DownloadManager::cancel_download(TaskId id) {
    reap_retired();

    auto found = find_or_recover(id);
    if (!found) {
        return found.error();
    }
    {
        std::lock_guard lock(mutex_);
        std::erase_if(queue_, [id](const QueueEntry& e) { return e.id == id; });
    }
    return (*found)->cancel();
}

std::error_code DownloadManager::forget(TaskId id) {
    reap_retired();
    {
        std::lock_guard lock(mutex_);
        if (finished_.erase(id) > 0) {
            return {};
        }
        if (find(id) || queued_locked(id)) {
            return make_error_code(DownloadErrc::invalid_state);
        }
    }
    std::error_code ec;
    if (std::filesystem::exists(context_.store->record_path(id), ec)) {
        return make_error_code(DownloadErrc::invalid_state);
    }
    return make_error_code(DownloadErrc::unknown_task);
}

std::expected<SubscriptionId, std::error_code>
DownloadManager::subscribe(TaskId id, ProgressCallback on_progress, TerminalCallback on_terminal) {
    std::optional<TerminalEvent> finished;
    {
        std::lock_guard lock(mutex_);
        auto it = finished_.find(id);
        if (it != finished_.end()) {
            finished = it->second.event;
        }
    }
    if (finished) {
        if (on_terminal) {
            on_terminal(*finished);
        }
        return SubscriptionId{0};
    }

    auto found = find_or_recover(id);
    if (!found) {
        return std::unexpected(found.error());
    }
    return (*found)->subscribe(std::move(on_progress), std::move(on_terminal));
}

void DownloadManager::unsubscribe(TaskId id, SubscriptionId subscription) {
    TaskPtr task;
    {
        std::lock_guard lock(mutex_);
        task = find(id);
    }
    if (task) {
        task->unsubscribe(subscription);
    }
}

std::vector<ResumableTask> DownloadManager::list_resumable() const {
    std::vector<ResumableTask> result;
    auto ids = context_.store->list();
    if (!ids) {
        spdlog::warn("Cannot scan {}: {}", config_.state_dir.string(), ids.error().message());
        return result;
    }

    for (auto id : *ids) {
        {
            std::lock_guard lock(mutex_);
            if (queued_locked(id)) {
                continue;
            }
            if (auto task = find(id)) {
                auto st = task->state();
                if ((st != TaskState::paused && st != TaskState::failed) || task->running()) {
                    continue;
                }
            }
        }

        auto record = context_.store->load(id);
        if (!record) {
            continue;
        }
        result.push_back(ResumableTask{
            record->task_id, record->url, record->destination,
            record->partial_bytes(), record->total_size});
    }
    return result;
}

//=============================================================================
// Queries
//=============================================================================

std::expected<TaskState, std::error_code> DownloadManager::state(TaskId id) const {
    {
        std::lock_guard lock(mutex_);
        if (auto task = find(id)) {
            return task->state();
        }
        auto it = finished_.find(id);
        if (it != finished_.end()) {
            return it->second.event.state;
        }
    }
    auto record = context_.store->load(id);
    if (!record) {
        return std::unexpected(make_error_code(DownloadErrc::unknown_task));
    }
    return TaskState::paused;
}

std::expected<ProgressSnapshot, std::error_code> DownloadManager::progress(TaskId id) const {
    TaskPtr task;
    {
        std::lock_guard lock(mutex_);
        task = find(id);
        if (!task) {
            auto it = finished_.find(id);
            if (it != finished_.end()) {
                return it->second.progress;
            }
        }
    }
    if (task) {
        return task->progress();
    }
    auto record = context_.store->load(id);
    if (!record) {
        return std::unexpected(make_error_code(DownloadErrc::unknown_task));
    }
    return snapshot_from_record(*record);
}

std::expected<std::vector<SegmentView>, std::error_code> DownloadManager::segments(TaskId id) const {
    TaskPtr task;
    {
        std::lock_guard lock(mutex_);
        task = find(id);
        if (!task) {
            auto it = finished_.find(id);
            if (it != finished_.end()) {
                return it->second.segments;
            }
        }
    }
    if (task) {
        return task->segments();
    }
    auto record = context_.store->load(id);
    if (!record) {
        return std::unexpected(make_error_code(DownloadErrc::unknown_task));
    }
    return views_from_record(*record);
}

std::vector<TaskId> DownloadManager::tasks() const {
    std::lock_guard lock(mutex_);
    std::set<TaskId> ids;
    for (const auto& [id, task] : tasks_) {
        ids.insert(id);
    }
    for (const auto& [id, done] : finished_) {
        ids.insert(id);
    }
    return {ids.begin(), ids.end()};
}

bool DownloadManager::wait_idle(TaskId id, std::optional<std::chrono::milliseconds> timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout.value_or(std::chrono::milliseconds{0});
    TaskPtr task;
    {
        std::unique_lock lock(mutex_);
        auto idle = [&] {
            if (finished_.contains(id)) {
                return true;
            }
            auto it = tasks_.find(id);
            if (it == tasks_.end()) {
                return true;
            }
            if (queued_locked(id)) {
                return false;
            }
            task = it->second;
            auto st = task->state();
            return is_settled(st) || (st == TaskState::planning && !active_.contains(id));
        };
        if (timeout) {
            if (!idle_cv_.wait_until(lock, deadline, idle)) {
                return false;
            }
        } else {
            idle_cv_.wait(lock, idle);
        }
    }

    if (!task) {
        return true;
    }
    if (!timeout) {
        return task->wait();
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return task->wait(std::max(left, std::chrono::milliseconds{0}));
}

std::size_t DownloadManager::active_count() const {
    std::lock_guard lock(mutex_);
    return active_.size();
}

//=============================================================================
// Task table
//=============================================================================

DownloadManager::TaskPtr DownloadManager::make_task(TaskId id, std::string url,
                                                    std::filesystem::path destination,
                                                    TaskOptions options) {
    auto task = std::make_shared<DownloadTask>(id, std::move(url), std::move(destination),
                                               std::move(options), context_);
    task->on_state_change([this](TaskId tid, TaskState from, TaskState to) { on_task_state(tid, from, to); });
    return task;
}

DownloadManager::TaskPtr DownloadManager::make_task(ResumeRecord record) {
    auto task = std::make_shared<DownloadTask>(std::move(record), context_);
    task->on_state_change([this](TaskId tid, TaskState from, TaskState to) { on_task_state(tid, from, to); });
    return task;
}

std::expected<DownloadManager::TaskPtr, std::error_code> DownloadManager::find_or_recover(TaskId id) {
    {
        std::lock_guard lock(mutex_);
        if (auto task = find(id)) {
            return task;
        }
        if (finished_.contains(id)) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_state));
        }
    }

    auto record = context_.store->load(id);
    if (!record) {
        if (record.error() == DownloadErrc::resume_not_found) {
            return std::unexpected(make_error_code(DownloadErrc::unknown_task));
        }
        return std::unexpected(record.error());
    }

    auto task = make_task(std::move(*record));
    std::lock_guard lock(mutex_);
    auto [it, inserted] = tasks_.emplace(id, task);
    if (inserted) {
        spdlog::info("Task {}: recovered from resume record", id);
    }
    return it->second;
}

DownloadManager::TaskPtr DownloadManager::find(TaskId id) const {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : it->second;
}

bool DownloadManager::queued_locked(TaskId id) const {
    return std::any_of(queue_.begin(), queue_.end(), [id](const QueueEntry& e) { return e.id == id; });
}

bool DownloadManager::at_capacity_locked() const noexcept {
    return config_.max_active_tasks != 0 && active_.size() >= config_.max_active_tasks;
}

//=============================================================================
// Admission
//=============================================================================

std::error_code DownloadManager::admit(const TaskPtr& task, bool resume) {
    {
        std::lock_guard lock(mutex_);
        if (closing_) {
            return make_error_code(DownloadErrc::invalid_state);
        }
        if (at_capacity_locked()) {
            queue_.push_back(QueueEntry{task->id(), resume});
            spdlog::info("Task {}: queued ({} active)", task->id(), active_.size());
            return {};
        }
        active_.insert(task->id());
    }

    auto ec = launch(task, resume);
    if (ec) {
        {
            std::lock_guard lock(mutex_);
            active_.erase(task->id());
        }
        idle_cv_.notify_all();
    }
    return ec;
}

std::error_code DownloadManager::launch(const TaskPtr& task, bool resume) {
    return resume ? task->resume() : task->start();
}

void DownloadManager::on_task_state(TaskId id, TaskState /*from*/, TaskState to) {
    if (is_settled(to)) {
        TaskPtr task;
        {
            std::lock_guard lock(mutex_);
            task = find(id);
        }

        // Read outside the manager lock; the task has already recorded its state
        std::optional<FinishedTask> done;
        if (task && is_terminal(to)) {
            if (auto event = task->terminal_event()) {
                done = FinishedTask{*event, task->progress(), task->segments()};
            }
        }

        std::lock_guard lock(mutex_);
        active_.erase(id);
        if (done) {
            finished_[id] = std::move(*done);
            auto it = tasks_.find(id);
            if (it != tasks_.end()) {
                retired_.push_back(it->second);
                tasks_.erase(it);
            }
        }
    }
    idle_cv_.notify_all();

    if (is_settled(to)) {
        drain_queue();
    }
}

void DownloadManager::drain_queue() {
    while (true) {
        TaskPtr task;
        bool resume = false;
        {
            std::lock_guard lock(mutex_);
            if (closing_ || queue_.empty() || at_capacity_locked()) {
                return;
            }
            auto entry = queue_.front();
            queue_.pop_front();
            task = find(entry.id);
            if (!task) {
                continue;
            }
            resume = entry.resume;
            active_.insert(entry.id);
        }

        if (auto ec = launch(task, resume)) {
            spdlog::warn("Task {}: could not leave the queue: {}", task->id(), ec.message());
            {
                std::lock_guard lock(mutex_);
                active_.erase(task->id());
            }
            idle_cv_.notify_all();
        }
    }
}

void DownloadManager::reap_retired() {
    std::vector<TaskPtr> reaped;
    {
        std::lock_guard lock(mutex_);
        auto idle = std::stable_partition(retired_.begin(), retired_.end(),
                                          [](const TaskPtr& t) { return t->running(); });
        reaped.assign(std::make_move_iterator(idle), std::make_move_iterator(retired_.end()));
        retired_.erase(idle, retired_.end());
    }
    // Task destructors join their threads outside the lock
}

} // namespace surge::core
