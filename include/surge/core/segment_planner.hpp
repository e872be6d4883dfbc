// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace surge::core {

// One planned byte range; length is unknown only for a single whole-resource segment
struct SegmentSpec {
    std::uint32_t index{0};
    std::uint64_t offset{0};
    std::optional<std::uint64_t> length;

    // Inclusive last byte; nullopt for unknown length or zero-length
    [[nodiscard]] std::optional<std::uint64_t> last() const noexcept {
        if (!length || *length == 0) return std::nullopt;
        return offset + *length - 1;
    }

    bool operator==(const SegmentSpec&) const = default;
};

using SegmentPlan = std::vector<SegmentSpec>;

// Splits a resource into contiguous segments. Pure and deterministic:
// a persisted plan is validated by re-planning with the same inputs.
class SegmentPlanner {
public:
    explicit SegmentPlanner(std::uint64_t min_segment_size = MIN_SEGMENT_SIZE,
                            std::uint32_t max_segments = MAX_SEGMENTS) noexcept;

    [[nodiscard]] SegmentPlan plan(std::optional<std::uint64_t> total_size,
                                   bool supports_ranges,
                                   std::uint32_t requested_segments) const;

    // Segment count actually used for a known size
    [[nodiscard]] std::uint32_t effective_count(std::uint64_t total_size,
                                                std::uint32_t requested_segments) const noexcept;

    [[nodiscard]] std::uint64_t min_segment_size() const noexcept { return min_segment_size_; }
    [[nodiscard]] std::uint32_t max_segments() const noexcept { return max_segments_; }

private:
    std::uint64_t min_segment_size_;
    std::uint32_t max_segments_;
};

// True when the plan covers [0, total) in order with no gaps or overlaps
[[nodiscard]] bool is_exact_partition(const SegmentPlan& plan, std::uint64_t total_size) noexcept;

} // namespace surge::core
