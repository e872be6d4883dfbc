// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/config.hpp>
#include <surge/disk/error.hpp>
#include "support/temp_dir.hpp"

using namespace surge::core;
using namespace std::chrono_literals;
using surge::test::TempDir;
using surge::test::write_text;

TEST_CASE("EngineConfig - defaults", "[config]") {
    EngineConfig cfg;
    CHECK(cfg.default_segments == DEFAULT_SEGMENTS);
    CHECK(cfg.max_active_tasks == MAX_ACTIVE_TASKS);
    CHECK(cfg.failure_policy == FailurePolicy::fail_fast);
    CHECK(cfg.retry.max_attempts == RETRY_COUNT);
    CHECK(cfg.speed_limit_bps == 0);
}

TEST_CASE("EngineConfig - save and load", "[config]") {
    TempDir dir;
    auto path = dir / "conf" / "surge.json";

    EngineConfig cfg;
    cfg.state_dir = dir.path() / "state";
    cfg.max_active_tasks = 1;
    cfg.default_segments = 8;
    cfg.min_segment_size = 4096;
    cfg.retry.max_attempts = 2;
    cfg.retry.initial_backoff = 10ms;
    cfg.failure_policy = FailurePolicy::best_effort;
    cfg.checkpoint_interval = 250ms;
    cfg.user_agent = "test-agent";
    cfg.verify_tls = false;

    REQUIRE(!save_engine_config(path, cfg));
    auto loaded = load_engine_config(path);
    REQUIRE(loaded);
    CHECK(loaded->state_dir == cfg.state_dir);
    CHECK(loaded->max_active_tasks == 1);
    CHECK(loaded->default_segments == 8);
    CHECK(loaded->min_segment_size == 4096);
    CHECK(loaded->retry.max_attempts == 2);
    CHECK(loaded->retry.initial_backoff == 10ms);
    CHECK(loaded->failure_policy == FailurePolicy::best_effort);
    CHECK(loaded->checkpoint_interval == 250ms);
    CHECK(loaded->user_agent == "test-agent");
    CHECK_FALSE(loaded->verify_tls);
}

TEST_CASE("EngineConfig - partial and unknown keys", "[config]") {
    TempDir dir;
    auto path = dir / "surge.json";
    write_text(path, R"({"max_segments": 6, "shiny_new_option": [1, 2], "retry": {"multiplier": 3.0}})");

    auto cfg = load_engine_config(path);
    REQUIRE(cfg);
    CHECK(cfg->max_segments == 6);
    CHECK(cfg->retry.multiplier == Catch::Approx(3.0));
    CHECK(cfg->retry.max_attempts == RETRY_COUNT);
    CHECK(cfg->default_segments == DEFAULT_SEGMENTS);
}

TEST_CASE("EngineConfig - rejected files", "[config]") {
    TempDir dir;
    auto path = dir / "surge.json";

    SECTION("Missing file") {
        auto cfg = load_engine_config(dir / "absent.json");
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error() == surge::disk::DiskErrc::file_not_found);
    }

    SECTION("Unknown failure policy") {
        write_text(path, R"({"failure_policy": "sometimes"})");
        auto cfg = load_engine_config(path);
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error() == DownloadErrc::invalid_config);
    }

    SECTION("Zero segments") {
        write_text(path, R"({"max_segments": 0})");
        auto cfg = load_engine_config(path);
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error() == DownloadErrc::invalid_config);
    }

    SECTION("Wrong type") {
        write_text(path, R"({"max_active_tasks": "three"})");
        CHECK(load_engine_config(path).error() == DownloadErrc::invalid_config);
    }

    SECTION("Negative count") {
        write_text(path, R"({"max_active_tasks": -1})");
        auto cfg = load_engine_config(path);
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error() == DownloadErrc::invalid_config);
    }

    SECTION("Count too large for its field") {
        write_text(path, R"({"retry": {"max_attempts": 4294967296}})");
        CHECK(load_engine_config(path).error() == DownloadErrc::invalid_config);
    }

    SECTION("Negative interval") {
        write_text(path, R"({"publish_interval_ms": -250})");
        CHECK(load_engine_config(path).error() == DownloadErrc::invalid_config);
    }

    SECTION("Not an object") {
        write_text(path, "[1, 2, 3]");
        CHECK(load_engine_config(path).error() == DownloadErrc::invalid_config);
    }

    SECTION("Not JSON") {
        write_text(path, "max_segments = 4");
        CHECK(load_engine_config(path).error() == DownloadErrc::invalid_config);
    }
}
