// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace surge::core {

constexpr std::uint32_t DEFAULT_SEGMENTS = 4;
constexpr std::uint32_t MAX_SEGMENTS = 32;
constexpr std::uint64_t MIN_SEGMENT_SIZE = 256 * 1024;              // 256 KB floor per segment

constexpr std::uint32_t MAX_ACTIVE_TASKS = 3;                       // Tasks downloading at once
constexpr std::uint32_t MAX_CONNECTIONS = 16;                       // Sockets across all tasks

constexpr std::chrono::seconds CONNECTION_TIMEOUT{30};
constexpr std::chrono::seconds READ_TIMEOUT{30};                    // No bytes for this long = stalled

constexpr std::uint32_t RETRY_COUNT = 5;                            // Attempts per worker run
constexpr std::chrono::milliseconds INITIAL_BACKOFF{500};
constexpr double BACKOFF_MULTIPLIER = 2.0;
constexpr std::chrono::milliseconds MAX_BACKOFF{30'000};
constexpr std::uint32_t TASK_RETRY_COUNT = 2;                       // Extra segment runs under best-effort

constexpr std::chrono::milliseconds PUBLISH_INTERVAL{200};
constexpr std::chrono::milliseconds SPEED_WINDOW{3000};
constexpr std::chrono::milliseconds CHECKPOINT_INTERVAL{1000};
constexpr std::chrono::milliseconds MONITOR_INTERVAL{50};

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;                // 256 KB
constexpr std::size_t HASH_BUFFER_SIZE = 1024 * 1024;

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::string_view PART_EXTENSION = ".part";
constexpr std::string_view RESUME_EXTENSION = ".json";
constexpr std::string_view USER_AGENT = "surge/0.1";

// What a task does when a segment fails for good
enum class FailurePolicy : std::uint8_t {
    fail_fast,   // First failed segment fails the task
    best_effort  // Re-run the segment up to task_retries more times first
};

[[nodiscard]] std::string_view to_string(FailurePolicy policy) noexcept;

struct RetryPolicy {
    std::uint32_t max_attempts{RETRY_COUNT};
    std::chrono::milliseconds initial_backoff{INITIAL_BACKOFF};
    double multiplier{BACKOFF_MULTIPLIER};
    std::chrono::milliseconds max_backoff{MAX_BACKOFF};
};

// Runtime configuration for a DownloadManager and its tasks
struct EngineConfig {
    std::filesystem::path state_dir{".surge"};

    std::uint32_t max_active_tasks{MAX_ACTIVE_TASKS};
    std::uint32_t max_connections{MAX_CONNECTIONS};   // 0 = unlimited
    std::uint32_t default_segments{DEFAULT_SEGMENTS};
    std::uint32_t max_segments{MAX_SEGMENTS};
    std::uint64_t min_segment_size{MIN_SEGMENT_SIZE};

    std::chrono::milliseconds connect_timeout{CONNECTION_TIMEOUT};
    std::chrono::milliseconds read_timeout{READ_TIMEOUT};
    RetryPolicy retry{};
    FailurePolicy failure_policy{FailurePolicy::fail_fast};
    std::uint32_t task_retries{TASK_RETRY_COUNT};

    std::uint64_t speed_limit_bps{0};                 // Per task, 0 = unlimited

    std::chrono::milliseconds publish_interval{PUBLISH_INTERVAL};
    std::chrono::milliseconds speed_window{SPEED_WINDOW};
    std::chrono::milliseconds checkpoint_interval{CHECKPOINT_INTERVAL};

    std::string user_agent{USER_AGENT};
    bool verify_tls{true};
    std::string log_level{"info"};
};

// Load a JSON config file; keys not present keep their defaults, unknown keys are ignored
[[nodiscard]] std::expected<EngineConfig, std::error_code>
load_engine_config(const std::filesystem::path& path) noexcept;

[[nodiscard]] std::error_code
save_engine_config(const std::filesystem::path& path, const EngineConfig& config) noexcept;

// Map "trace|debug|info|warn|error|off" onto the spdlog default logger
void set_log_level(std::string_view level) noexcept;

} // namespace surge::core
