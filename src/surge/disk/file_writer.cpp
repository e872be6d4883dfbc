// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace surge::disk {

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_))
    , bytes_written_(other.bytes_written_.load(std::memory_order_relaxed)) {
    other.fd_ = -1;
}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        bytes_written_.store(other.bytes_written_.load(std::memory_order_relaxed),
                             std::memory_order_relaxed);
        other.fd_ = -1;
    }
    return *this;
}

std::error_code FileWriter::open(const std::filesystem::path& path,
                                 std::optional<std::uint64_t> size,
                                 bool truncate) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::file_exists);
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return errno_to_error_code(ec.value(), DiskErrc::invalid_path);
        }
    }

    int flags = O_CREAT | O_RDWR | O_CLOEXEC;
    if (truncate) {
        flags |= O_TRUNC;
    }

    int fd = -1;
    do {
        fd = ::open(path.c_str(), flags, 0644);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return errno_to_error_code(errno, DiskErrc::invalid_path);
    }

    // Pre-allocate only grows the file; a resumed .part keeps its bytes
    if (size && *size > 0) {
        struct stat st{};
        if (::fstat(fd, &st) != 0) {
            int err = errno;
            ::close(fd);
            return errno_to_error_code(err, DiskErrc::allocation_failed);
        }
        if (static_cast<std::uint64_t>(st.st_size) < *size &&
            ::ftruncate(fd, static_cast<off_t>(*size)) != 0) {
            int err = errno;
            ::close(fd);
            return errno_to_error_code(err, DiskErrc::allocation_failed);
        }
    }

    fd_ = fd;
    try {
        path_ = path;
    } catch (const std::bad_alloc&) {
        close();
        return make_error_code(DiskErrc::allocation_failed);
    }
    bytes_written_.store(0, std::memory_order_relaxed);
    return {};
}

std::error_code FileWriter::write(std::uint64_t offset,
                                  std::span<const std::byte> data) noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* ptr = data.data();
    std::size_t remaining = data.size();
    auto pos = static_cast<off_t>(offset);

    while (remaining > 0) {
        ssize_t n = ::pwrite(fd_, ptr, remaining, pos);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno, DiskErrc::write_error);
        }
        if (n == 0) {
            return make_error_code(DiskErrc::write_error);
        }
        ptr += n;
        pos += n;
        remaining -= static_cast<std::size_t>(n);
    }

    bytes_written_.fetch_add(data.size(), std::memory_order_relaxed);
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd_) != 0) {
        return errno_to_error_code(errno, DiskErrc::sync_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (fd_ < 0) {
        return;
    }
    if (::close(fd_) != 0) {
        spdlog::warn("close({}) failed: errno {}", path_.string(), errno);
    }
    fd_ = -1;
}

std::expected<std::uint64_t, std::error_code> FileWriter::size() const noexcept {
    if (!is_open()) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }
    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

//=============================================================================
// Directory helpers
//=============================================================================

std::error_code sync_directory(const std::filesystem::path& dir) noexcept {
    const auto& target = dir.empty() ? std::filesystem::path(".") : dir;
    int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return errno_to_error_code(errno, DiskErrc::sync_error);
    }
    std::error_code ec;
    if (::fsync(fd) != 0) {
        ec = errno_to_error_code(errno, DiskErrc::sync_error);
    }
    ::close(fd);
    return ec;
}

std::error_code atomic_replace(const std::filesystem::path& from,
                               const std::filesystem::path& to) noexcept {
    if (::rename(from.c_str(), to.c_str()) != 0) {
        return errno_to_error_code(errno, DiskErrc::rename_error);
    }
    return sync_directory(to.parent_path());
}

std::error_code remove_file(const std::filesystem::path& path) noexcept {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }
    return {};
}

} // namespace surge::disk
