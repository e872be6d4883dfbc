// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/segment_planner.hpp>
#include <algorithm>

namespace surge::core {

SegmentPlanner::SegmentPlanner(std::uint64_t min_segment_size, std::uint32_t max_segments) noexcept
    : min_segment_size_(std::max<std::uint64_t>(1, min_segment_size))
    , max_segments_(std::max<std::uint32_t>(1, max_segments)) {}

std::uint32_t SegmentPlanner::effective_count(std::uint64_t total_size,
                                              std::uint32_t requested_segments) const noexcept {
    std::uint64_t n = std::clamp<std::uint32_t>(requested_segments, 1, max_segments_);
    // Every segment must hold at least the floor
    std::uint64_t by_floor = std::max<std::uint64_t>(1, total_size / min_segment_size_);
    return static_cast<std::uint32_t>(std::min(n, by_floor));
}

SegmentPlan SegmentPlanner::plan(std::optional<std::uint64_t> total_size,
                                 bool supports_ranges,
                                 std::uint32_t requested_segments) const {
    SegmentPlan result;

    if (!total_size || !supports_ranges) {
        result.push_back(SegmentSpec{0, 0, total_size});
        return result;
    }

    const std::uint64_t total = *total_size;
    const std::uint32_t n = effective_count(total, requested_segments);
    const std::uint64_t base = total / n;

    result.reserve(n);
    std::uint64_t offset = 0;
    for (std::uint32_t i = 0; i < n; ++i) {
        // Final segment absorbs the remainder
        std::uint64_t length = (i + 1 == n) ? total - offset : base;
        result.push_back(SegmentSpec{i, offset, length});
        offset += length;
    }
    return result;
}

bool is_exact_partition(const SegmentPlan& plan, std::uint64_t total_size) noexcept {
    if (plan.empty()) return false;
    std::uint64_t expected = 0;
    for (std::size_t i = 0; i < plan.size(); ++i) {
        const auto& seg = plan[i];
        if (seg.index != i || seg.offset != expected || !seg.length) {
            return false;
        }
        if (*seg.length == 0 && plan.size() > 1) {
            return false;
        }
        expected += *seg.length;
    }
    return expected == total_size;
}

} // namespace surge::core
