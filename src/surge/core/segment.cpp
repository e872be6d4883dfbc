// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/segment.hpp>

namespace surge::core {

Segment::Segment(const SegmentSpec& spec, std::uint64_t downloaded) noexcept
    : index_(spec.index)
    , offset_(spec.offset)
    , length_(spec.length.value_or(UNKNOWN_LENGTH))
    , downloaded_(downloaded) {
    if (is_complete()) {
        state_.store(SegmentState::completed, std::memory_order_relaxed);
    }
}

std::optional<std::uint64_t> Segment::length() const noexcept {
    auto len = length_.load(std::memory_order_acquire);
    if (len == UNKNOWN_LENGTH) return std::nullopt;
    return len;
}

std::optional<std::uint64_t> Segment::remaining() const noexcept {
    auto len = length();
    if (!len) return std::nullopt;
    auto done = downloaded();
    return done >= *len ? 0 : *len - done;
}

bool Segment::is_complete() const noexcept {
    auto len = length();
    return len && downloaded() >= *len;
}

std::error_code Segment::error() const {
    std::lock_guard lock(error_mutex_);
    return error_;
}

void Segment::error(std::error_code ec) {
    std::lock_guard lock(error_mutex_);
    error_ = ec;
}

SegmentView Segment::view() const {
    return SegmentView{
        index_,
        offset_,
        length(),
        downloaded(),
        state(),
        retries(),
        error(),
    };
}

} // namespace surge::core
