// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <system_error>

namespace surge::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    file_exists,
    write_error,
    read_error,
    sync_error,
    rename_error,
    allocation_failed,
    handle_invalid,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "surge::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:            return "Success";
            case DiskErrc::file_not_found:     return "File not found";
            case DiskErrc::access_denied:      return "Access denied";
            case DiskErrc::disk_full:          return "Disk full";
            case DiskErrc::invalid_path:       return "Invalid path";
            case DiskErrc::file_exists:        return "File already exists";
            case DiskErrc::write_error:        return "Write error";
            case DiskErrc::read_error:         return "Read error";
            case DiskErrc::sync_error:         return "Sync to disk failed";
            case DiskErrc::rename_error:       return "Rename failed";
            case DiskErrc::allocation_failed:  return "Allocation failed";
            case DiskErrc::handle_invalid:     return "Invalid handle";
            default:                           return "Unknown error";
        }
    }

    // Every disk failure is a FilesystemError
    [[nodiscard]] std::error_condition default_error_condition(int) const noexcept override {
        return core::make_error_condition(core::ErrorKind::filesystem);
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Translate an errno value from a failed system call
[[nodiscard]] std::error_code errno_to_error_code(int err, DiskErrc fallback = DiskErrc::write_error) noexcept;

} // namespace surge::disk

namespace std {

template<>
struct is_error_code_enum<surge::disk::DiskErrc> : true_type {};

} // namespace std
