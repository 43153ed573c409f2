#pragma once

#include <cstdint>
#include <vector>

namespace ndcapture
{

// Frame boundaries of a size-capped (segmented) export.
struct SegmentPlan
{
    double   segment_seconds    = 0.0;
    uint32_t frames_per_segment = 0;
    uint32_t total_frames       = 0;
    uint32_t segment_count      = 0;
};

class SegmentPlanner
{
   public:
    static constexpr uint64_t DEFAULT_TARGET_BYTES = 50ull * 1024 * 1024;   // 50 MiB
    static constexpr double   MIN_SEGMENT_SECONDS  = 5.0;

    // segment_seconds = max(5, min(duration, target_bytes * 8 / bitrate_bps)).
    // Throws std::invalid_argument on non-positive or non-finite input.
    static SegmentPlan plan(uint64_t target_bytes, double bitrate_mbps, double duration_sec, double fps);

    // Frames in the segment starting at global frame `frames_done`.
    static uint32_t frames_for_segment(const SegmentPlan& plan, uint32_t frames_done);

    // Every segment's frame count, in order. Sums to plan.total_frames.
    static std::vector<uint32_t> segment_frame_counts(const SegmentPlan& plan);
};

}   // namespace ndcapture
