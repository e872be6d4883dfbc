// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/download_task.hpp>
#include "support/fake_http_client.hpp"
#include "support/temp_dir.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

using namespace surge::core;
using namespace std::chrono_literals;
using surge::test::Fault;
using surge::test::FakeHttpClient;
using surge::test::TempDir;
using surge::test::make_body;
using surge::test::read_file;

namespace {

constexpr std::uint64_t SIZE = 200'000;
const std::string URL = "http://mirror.example.com/dist/archive.tar.gz";

EngineConfig test_config() {
    EngineConfig cfg;
    cfg.max_connections = 0;
    cfg.default_segments = 4;
    cfg.min_segment_size = 1000;
    cfg.retry = RetryPolicy{3, 1ms, 2.0, 5ms};
    cfg.publish_interval = 10ms;
    cfg.checkpoint_interval = 20ms;
    cfg.log_level = "warn";
    return cfg;
}

struct Fixture {
    TempDir dir;
    std::vector<std::byte> body = make_body(SIZE);
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>(body);
    std::shared_ptr<ResumeStore> store = std::make_shared<ResumeStore>(dir / "state");
    std::filesystem::path destination = dir / "archive.tar.gz";

    Fixture() { http->chunk_size(4096); }

    TaskContext context(EngineConfig cfg = test_config()) {
        return TaskContext{http, store, nullptr, std::move(cfg)};
    }

    std::unique_ptr<DownloadTask> make_task(TaskOptions options = {}, EngineConfig cfg = test_config()) {
        return std::make_unique<DownloadTask>(1, URL, destination, std::move(options), context(std::move(cfg)));
    }

    std::unique_ptr<DownloadTask> run_to_end(TaskOptions options = {}, EngineConfig cfg = test_config()) {
        auto task = make_task(std::move(options), std::move(cfg));
        REQUIRE(!task->start());
        REQUIRE(task->wait(10s));
        return task;
    }
};

std::string sha256_hex(std::span<const std::byte> data) {
    Hasher hasher(HashAlgo::sha256);
    REQUIRE(!hasher.update(data));
    auto digest = hasher.finish();
    REQUIRE(digest);
    return *digest;
}

} // namespace

TEST_CASE("DownloadTask - segmented download completes", "[task]") {
    Fixture fx;
    auto task = fx.run_to_end();

    CHECK(task->state() == TaskState::completed);
    CHECK(read_file(fx.destination) == fx.body);
    CHECK_FALSE(std::filesystem::exists(task->part_path()));
    CHECK_FALSE(std::filesystem::exists(fx.store->record_path(1)));

    auto segments = task->segments();
    REQUIRE(segments.size() == 4);
    std::uint64_t expected_offset = 0;
    for (const auto& s : segments) {
        CHECK(s.offset == expected_offset);
        CHECK(s.state == SegmentState::completed);
        CHECK(s.downloaded == *s.length);
        expected_offset += *s.length;
    }
    CHECK(expected_offset == SIZE);

    auto event = task->terminal_event();
    REQUIRE(event);
    CHECK(event->state == TaskState::completed);
    CHECK_FALSE(event->error);
    CHECK(event->path == fx.destination);

    auto snap = task->progress();
    CHECK(snap.downloaded_bytes == SIZE);
    REQUIRE(snap.total_bytes);
    CHECK(*snap.total_bytes == SIZE);
}

TEST_CASE("DownloadTask - pause and resume", "[task]") {
    Fixture fx;
    fx.http->hold_after(60'000);
    auto task = fx.make_task();
    REQUIRE(!task->start());
    REQUIRE(fx.http->wait_for_bytes(60'000));

    REQUIRE(!task->pause());
    CHECK(task->state() == TaskState::paused);
    CHECK_FALSE(task->running());
    CHECK(task->progress().downloaded_bytes == 60'000);

    auto record = fx.store->load(1);
    REQUIRE(record);
    CHECK(record->partial_bytes() == 60'000);
    CHECK(std::filesystem::exists(task->part_path()));

    SECTION("Pausing twice is rejected") {
        CHECK(task->pause() == DownloadErrc::invalid_state);
    }

    SECTION("Resume continues from the recorded offsets") {
        auto before = fx.http->requests().size();
        fx.http->release();
        REQUIRE(!task->resume());
        REQUIRE(task->wait(10s));
        CHECK(task->state() == TaskState::completed);
        CHECK(read_file(fx.destination) == fx.body);

        // Resumed transfers start past the bytes already on disk
        auto log = fx.http->requests();
        for (const auto& cp : record->segments) {
            if (cp.downloaded == 0 || cp.downloaded == cp.length) continue;
            bool found = std::any_of(log.begin() + static_cast<std::ptrdiff_t>(before), log.end(),
                [&](const auto& r) { return r.range && r.range->first == cp.offset + cp.downloaded; });
            CHECK(found);
        }
        CHECK(fx.http->bytes_served() == SIZE);
    }
}

TEST_CASE("DownloadTask - cancel removes partial state", "[task]") {
    Fixture fx;
    fx.http->hold_after(30'000);
    auto task = fx.make_task();

    std::atomic<int> terminal_calls{0};
    task->subscribe(nullptr, [&](const TerminalEvent& e) {
        if (e.state == TaskState::cancelled) ++terminal_calls;
    });

    REQUIRE(!task->start());
    REQUIRE(fx.http->wait_for_bytes(30'000));

    SECTION("While downloading") {
        REQUIRE(!task->cancel());
    }

    SECTION("While paused") {
        REQUIRE(!task->pause());
        REQUIRE(std::filesystem::exists(fx.store->record_path(1)));
        REQUIRE(!task->cancel());
    }

    CHECK(task->state() == TaskState::cancelled);
    CHECK(terminal_calls.load() == 1);
    CHECK_FALSE(std::filesystem::exists(task->part_path()));
    CHECK_FALSE(std::filesystem::exists(fx.destination));
    CHECK_FALSE(std::filesystem::exists(fx.store->record_path(1)));
    CHECK(task->cancel() == DownloadErrc::invalid_state);
    CHECK(task->resume() == DownloadErrc::invalid_state);
}

TEST_CASE("DownloadTask - transient fault is retried", "[task]") {
    Fixture fx;
    fx.http->add_fault({50'000, Fault::connection_reset, 10'000});
    auto task = fx.run_to_end();

    CHECK(task->state() == TaskState::completed);
    CHECK(read_file(fx.destination) == fx.body);
    auto segments = task->segments();
    REQUIRE(segments.size() == 4);
    CHECK(segments[1].retries == 1);
    CHECK(segments[0].retries == 0);
}

TEST_CASE("DownloadTask - consecutive transient errors", "[task]") {
    Fixture fx;
    auto cfg = test_config();
    cfg.retry.max_attempts = 4;

    SECTION("Three resets then success on the fourth attempt") {
        fx.http->add_fault({50'000, Fault::connection_reset, 0, 3});
        auto task = fx.run_to_end({}, cfg);
        CHECK(task->state() == TaskState::completed);
        CHECK(read_file(fx.destination) == fx.body);
        auto segments = task->segments();
        REQUIRE(segments.size() == 4);
        CHECK(segments[1].retries == 3);
        CHECK(segments[2].retries == 0);
    }

    SECTION("Timeouts are retried the same way") {
        fx.http->add_fault({50'000, Fault::timeout, 0, 3});
        auto task = fx.run_to_end({}, cfg);
        CHECK(task->state() == TaskState::completed);
        CHECK(read_file(fx.destination) == fx.body);
        CHECK(task->segments()[1].retries == 3);
    }

    SECTION("One attempt short fails the task") {
        fx.http->add_fault({50'000, Fault::connection_reset, 0, 4});
        auto task = fx.run_to_end({}, cfg);
        CHECK(task->state() == TaskState::failed);
        auto event = task->terminal_event();
        REQUIRE(event);
        CHECK(event->error == DownloadErrc::connection_lost);
        CHECK(event->error == ErrorKind::transient_network);
    }
}

TEST_CASE("DownloadTask - range not satisfiable starts over", "[task]") {
    Fixture fx;

    SECTION("Once: checks the resource again and restarts") {
        fx.http->add_fault({50'000, Fault::range_not_satisfiable});
        auto task = fx.run_to_end();
        CHECK(task->state() == TaskState::completed);
        CHECK(read_file(fx.destination) == fx.body);
        CHECK(fx.http->head_count() == 2);
    }

    SECTION("Twice: the task fails") {
        fx.http->add_fault({50'000, Fault::range_not_satisfiable, 0, 2});
        auto task = fx.run_to_end();
        CHECK(task->state() == TaskState::failed);
        auto event = task->terminal_event();
        REQUIRE(event);
        CHECK(event->error == DownloadErrc::range_not_satisfiable);
        CHECK(fx.http->head_count() == 2);
    }
}

TEST_CASE("DownloadTask - checkpoints only claim written bytes", "[task]") {
    Fixture fx;
    fx.http->chunk_delay(1ms);
    auto task = fx.make_task();
    REQUIRE(!task->start());

    int checked = 0;
    while (!task->wait(5ms)) {
        auto record = fx.store->load(1);
        if (!record) {
            continue;
        }
        auto data = read_file(task->part_path());
        if (data.size() != SIZE) {
            continue;  // Renamed into place meanwhile
        }
        for (const auto& seg : record->segments) {
            REQUIRE(seg.offset + seg.downloaded <= data.size());
            auto first = static_cast<std::ptrdiff_t>(seg.offset);
            auto last = static_cast<std::ptrdiff_t>(seg.offset + seg.downloaded);
            CHECK(std::equal(data.begin() + first, data.begin() + last, fx.body.begin() + first));
        }
        ++checked;
    }
    CHECK(checked > 0);
    CHECK(task->state() == TaskState::completed);
}

TEST_CASE("DownloadTask - permanent error fails fast", "[task]") {
    Fixture fx;
    fx.http->add_fault({0, Fault::not_found});
    auto task = fx.run_to_end();

    CHECK(task->state() == TaskState::failed);
    auto event = task->terminal_event();
    REQUIRE(event);
    CHECK(event->error == DownloadErrc::not_found);
    CHECK(event->error == ErrorKind::permanent_http);
    CHECK(event->path == task->part_path());
    CHECK_FALSE(std::filesystem::exists(fx.destination));

    // Partial state stays for a later retry
    CHECK(std::filesystem::exists(task->part_path()));
    CHECK(std::filesystem::exists(fx.store->record_path(1)));
    CHECK(task->resume() == DownloadErrc::invalid_state);

    SECTION("A failed task can still be cancelled") {
        REQUIRE(!task->cancel());
        CHECK(task->state() == TaskState::cancelled);
        CHECK_FALSE(std::filesystem::exists(task->part_path()));
        CHECK_FALSE(std::filesystem::exists(fx.store->record_path(1)));
    }
}

TEST_CASE("DownloadTask - best effort re-runs a failed segment", "[task]") {
    Fixture fx;
    auto cfg = test_config();
    cfg.failure_policy = FailurePolicy::best_effort;
    cfg.task_retries = 2;
    // Exhausts the worker's three attempts once, then succeeds on the second run
    fx.http->add_fault({100'000, Fault::server_error, 0, 3});
    auto task = fx.run_to_end({}, cfg);

    CHECK(task->state() == TaskState::completed);
    CHECK(read_file(fx.destination) == fx.body);
}

TEST_CASE("DownloadTask - checksum verification", "[task]") {
    Fixture fx;

    SECTION("Matching digest") {
        auto expected = sha256_hex(fx.body);
        auto task = fx.run_to_end(TaskOptions{0, Checksum{HashAlgo::sha256, expected}});
        CHECK(task->state() == TaskState::completed);
        CHECK(task->terminal_event()->digest == expected);
    }

    SECTION("Mismatch keeps the data but not the record") {
        auto task = fx.run_to_end(TaskOptions{0, Checksum{HashAlgo::sha256, std::string(64, '0')}});
        CHECK(task->state() == TaskState::failed);
        auto event = task->terminal_event();
        REQUIRE(event);
        CHECK(event->error == DownloadErrc::checksum_mismatch);
        CHECK(event->error == ErrorKind::verification);
        CHECK(std::filesystem::exists(task->part_path()));
        CHECK_FALSE(std::filesystem::exists(fx.destination));
        CHECK_FALSE(std::filesystem::exists(fx.store->record_path(1)));
    }
}

TEST_CASE("DownloadTask - servers without range support", "[task]") {
    Fixture fx;

    SECTION("Not advertised: single segment") {
        fx.http->advertise_ranges(false);
        fx.http->supports_ranges(false);
        auto task = fx.run_to_end();
        CHECK(task->state() == TaskState::completed);
        CHECK(task->segments().size() == 1);
        CHECK(fx.http->get_count() == 1);
        CHECK(read_file(fx.destination) == fx.body);
    }

    SECTION("Advertised but ignored: collapses to one segment") {
        fx.http->supports_ranges(false);
        auto task = fx.run_to_end();
        CHECK(task->state() == TaskState::completed);
        CHECK(task->segments().size() == 1);
        CHECK(read_file(fx.destination) == fx.body);
    }

    SECTION("HEAD rejected and no ranges") {
        fx.http->advertise_ranges(false);
        fx.http->supports_ranges(false);
        fx.http->head_reports_length(false);
        fx.http->head_supported(false);
        auto task = fx.run_to_end();
        CHECK(task->state() == TaskState::completed);
        CHECK(read_file(fx.destination) == fx.body);
    }
}

TEST_CASE("DownloadTask - resume from a saved record", "[task]") {
    Fixture fx;
    fx.http->etag("\"v1\"");
    fx.http->hold_after(80'000);
    {
        auto task = fx.make_task();
        REQUIRE(!task->start());
        REQUIRE(fx.http->wait_for_bytes(80'000));
        REQUIRE(!task->pause());
    }

    auto record = fx.store->load(1);
    REQUIRE(record);
    CHECK(record->etag == "\"v1\"");
    CHECK(record->partial_bytes() == 80'000);
    fx.http->release();

    SECTION("Unchanged resource continues") {
        DownloadTask task(*record, fx.context());
        CHECK(task.state() == TaskState::paused);
        CHECK(task.progress().downloaded_bytes == 80'000);

        REQUIRE(!task.resume());
        REQUIRE(task.wait(10s));
        CHECK(task.state() == TaskState::completed);
        CHECK(read_file(fx.destination) == fx.body);
        CHECK(fx.http->bytes_served() == SIZE);
    }

    SECTION("Changed resource starts over") {
        auto changed = make_body(SIZE, 99);
        fx.http->body(changed);
        fx.http->etag("\"v2\"");

        DownloadTask task(*record, fx.context());
        REQUIRE(!task.resume());
        REQUIRE(task.wait(10s));
        CHECK(task.state() == TaskState::completed);
        CHECK(read_file(fx.destination) == changed);
        CHECK(fx.http->bytes_served() == 80'000 + SIZE);
    }

    SECTION("Pause while revalidating keeps the saved record") {
        auto changed = make_body(SIZE, 99);
        fx.http->body(changed);
        fx.http->etag("\"v2\"");
        fx.http->hold_head(true);
        const auto seen = fx.http->requests().size();

        DownloadTask task(*record, fx.context());
        REQUIRE(!task.resume());
        REQUIRE(fx.http->wait_for_requests(seen + 1));

        std::error_code paused;
        std::jthread pauser([&] { paused = task.pause(); });
        // pause() is waiting on the held HEAD by now
        std::this_thread::sleep_for(50ms);
        fx.http->hold_head(false);
        pauser.join();

        REQUIRE(!paused);
        CHECK(task.state() == TaskState::paused);
        auto saved = fx.store->load(1);
        REQUIRE(saved);
        CHECK(saved->etag == "\"v1\"");
        CHECK(saved->partial_bytes() == 80'000);

        REQUIRE(!task.resume());
        REQUIRE(task.wait(10s));
        CHECK(task.state() == TaskState::completed);
        CHECK(read_file(fx.destination) == changed);
    }

    SECTION("Missing partial file starts over") {
        std::filesystem::remove(fx.dir / "archive.tar.gz.part");

        DownloadTask task(*record, fx.context());
        REQUIRE(!task.resume());
        REQUIRE(task.wait(10s));
        CHECK(task.state() == TaskState::completed);
        CHECK(read_file(fx.destination) == fx.body);
    }
}

TEST_CASE("DownloadTask - callbacks", "[task]") {
    Fixture fx;
    fx.http->chunk_delay(1ms);
    auto task = fx.make_task();

    std::mutex m;
    std::vector<std::uint64_t> progress;
    std::vector<TaskState> transitions;
    int terminal = 0;

    task->on_state_change([&](TaskId, TaskState, TaskState to) {
        std::lock_guard l(m);
        transitions.push_back(to);
    });
    task->subscribe(
        [&](const ProgressSnapshot& s) {
            std::lock_guard l(m);
            progress.push_back(s.downloaded_bytes);
        },
        [&](const TerminalEvent&) {
            std::lock_guard l(m);
            ++terminal;
        });

    REQUIRE(!task->start());
    REQUIRE(task->wait(10s));

    std::lock_guard l(m);
    CHECK(terminal == 1);
    REQUIRE_FALSE(progress.empty());
    CHECK(std::is_sorted(progress.begin(), progress.end()));
    CHECK(progress.back() == SIZE);
    CHECK(transitions == std::vector<TaskState>{TaskState::downloading, TaskState::finalizing,
                                                TaskState::completed});

    SECTION("Late subscriber gets the terminal event at once") {
        bool late = false;
        task->subscribe(nullptr, [&](const TerminalEvent& e) { late = e.state == TaskState::completed; });
        CHECK(late);
    }
}

TEST_CASE("DownloadTask - cancel while finalizing", "[task]") {
    Fixture fx;

    SECTION("Accepted cancel wins over the rename") {
        auto task = fx.make_task();
        std::atomic<bool> accepted{false};
        auto* raw = task.get();
        task->on_state_change([&](TaskId, TaskState, TaskState to) {
            if (to == TaskState::finalizing) {
                accepted = !raw->cancel();
            }
        });
        REQUIRE(!task->start());
        REQUIRE(task->wait(10s));

        CHECK(accepted.load());
        CHECK(task->state() == TaskState::cancelled);
        CHECK_FALSE(std::filesystem::exists(fx.destination));
        CHECK_FALSE(std::filesystem::exists(task->part_path()));
    }

    SECTION("Result of cancel matches the outcome") {
        auto task = fx.make_task();
        std::atomic<bool> finalizing{false};
        task->on_state_change([&](TaskId, TaskState, TaskState to) {
            if (to == TaskState::finalizing) {
                finalizing = true;
            }
        });
        REQUIRE(!task->start());

        std::error_code result;
        std::jthread canceller([&] {
            while (!finalizing.load()) {
                std::this_thread::yield();
            }
            result = task->cancel();
        });
        canceller.join();
        REQUIRE(task->wait(10s));

        if (!result) {
            CHECK(task->state() == TaskState::cancelled);
            CHECK_FALSE(std::filesystem::exists(fx.destination));
        } else {
            CHECK(result == DownloadErrc::invalid_state);
            CHECK(task->state() == TaskState::completed);
            CHECK(read_file(fx.destination) == fx.body);
        }
    }
}

TEST_CASE("DownloadTask - invalid operations", "[task]") {
    Fixture fx;
    auto task = fx.make_task();
    CHECK(task->state() == TaskState::planning);
    CHECK(task->pause() == DownloadErrc::invalid_state);
    CHECK(task->resume() == DownloadErrc::invalid_state);

    SECTION("Cancel before start") {
        REQUIRE(!task->cancel());
        CHECK(task->state() == TaskState::cancelled);
        CHECK(task->start() == DownloadErrc::invalid_state);
        CHECK(fx.http->requests().empty());
    }

    SECTION("Unreachable server fails during planning") {
        fx.http->unreachable(true);
        REQUIRE(!task->start());
        REQUIRE(task->wait(10s));
        CHECK(task->state() == TaskState::failed);
        CHECK(task->terminal_event()->error == ErrorKind::probe);
        CHECK(task->start() == DownloadErrc::invalid_state);
    }
}
