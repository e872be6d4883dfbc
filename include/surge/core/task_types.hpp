// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace surge::core {

using TaskId = std::uint32_t;

// Task lifecycle
enum class TaskState : std::uint8_t {
    planning,     // Probing + segment planning, or queued behind the active-task cap
    downloading,  // Workers running
    paused,       // Workers stopped, offsets persisted
    finalizing,   // Size/hash verification and rename
    completed,
    failed,
    cancelled
};

[[nodiscard]] constexpr bool is_terminal(TaskState s) noexcept {
    return s == TaskState::completed || s == TaskState::cancelled;
}

// Settled: no thread is working on the task
[[nodiscard]] constexpr bool is_settled(TaskState s) noexcept {
    return is_terminal(s) || s == TaskState::failed || s == TaskState::paused;
}

// Every legal edge of the state machine; anything else is rejected
[[nodiscard]] constexpr bool is_valid_transition(TaskState from, TaskState to) noexcept {
    switch (from) {
        case TaskState::planning:
            return to == TaskState::downloading || to == TaskState::failed || to == TaskState::cancelled;
        case TaskState::downloading:
            return to == TaskState::paused || to == TaskState::finalizing ||
                   to == TaskState::failed || to == TaskState::cancelled;
        case TaskState::paused:
            return to == TaskState::downloading || to == TaskState::cancelled;
        case TaskState::finalizing:
            return to == TaskState::completed || to == TaskState::failed || to == TaskState::cancelled;
        case TaskState::failed:
            // A failed task keeps its partial state until the user discards it
            return to == TaskState::cancelled;
        case TaskState::completed:
        case TaskState::cancelled:
            return false;
    }
    return false;
}

[[nodiscard]] constexpr std::string_view to_string(TaskState s) noexcept {
    switch (s) {
        case TaskState::planning:    return "planning";
        case TaskState::downloading: return "downloading";
        case TaskState::paused:      return "paused";
        case TaskState::finalizing:  return "finalizing";
        case TaskState::completed:   return "completed";
        case TaskState::failed:      return "failed";
        case TaskState::cancelled:   return "cancelled";
    }
    return "unknown";
}

// Delivered once per task when it reaches completed, failed or cancelled
struct TerminalEvent {
    TaskId task_id{0};
    TaskState state{TaskState::failed};
    std::error_code error;          // Empty on success; compare with ErrorKind for the category
    std::string message;            // Human-readable cause
    std::filesystem::path path;     // Final file (completed) or retained .part (failed)
    std::string digest;             // Verified checksum hex, if one was supplied
};

} // namespace surge::core
