// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/disk/error.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>

namespace surge::disk {

// Positional writer shared by all segment workers of one task.
// Writes to disjoint offsets need no locking; pwrite carries its own offset.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Open (creating parent directories) for random-access writes.
    // truncate discards existing content; size pre-allocates the file.
    [[nodiscard]] std::error_code open(const std::filesystem::path& path,
                                       std::optional<std::uint64_t> size,
                                       bool truncate) noexcept;

    [[nodiscard]] std::error_code write(std::uint64_t offset,
                                        std::span<const std::byte> data) noexcept;

    // fsync
    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() const noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] std::uint64_t bytes_written() const noexcept {
        return bytes_written_.load(std::memory_order_relaxed);
    }

private:
    int fd_{-1};
    std::filesystem::path path_;
    std::atomic<std::uint64_t> bytes_written_{0};
};

// fsync a directory so a rename inside it is durable
[[nodiscard]] std::error_code sync_directory(const std::filesystem::path& dir) noexcept;

// rename(from, to) followed by a directory sync; replaces an existing target
[[nodiscard]] std::error_code atomic_replace(const std::filesystem::path& from,
                                             const std::filesystem::path& to) noexcept;

// Remove a file; a missing file is not an error
[[nodiscard]] std::error_code remove_file(const std::filesystem::path& path) noexcept;

} // namespace surge::disk
