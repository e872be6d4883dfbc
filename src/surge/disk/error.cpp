// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/disk/error.hpp>
#include <cerrno>

namespace surge::disk {

std::error_code errno_to_error_code(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case 0:            return {};
        case ENOENT:       return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:        return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
        case EINVAL:       return make_error_code(DiskErrc::invalid_path);
        case EEXIST:       return make_error_code(DiskErrc::file_exists);
        case ENOMEM:       return make_error_code(DiskErrc::allocation_failed);
        case EBADF:        return make_error_code(DiskErrc::handle_invalid);
        default:           return make_error_code(fallback);
    }
}

} // namespace surge::disk
