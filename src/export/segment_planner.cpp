#include "segment_planner.hpp"

#include <algorithm>
#include <cmath>
#include <ndcapture/export_settings.hpp>
#include <ndcapture/logger.hpp>
#include <stdexcept>
#include <string>

namespace ndcapture
{

namespace
{

bool positive_finite(double v)
{
    return std::isfinite(v) && v > 0.0;
}

}   // anonymous namespace

SegmentPlan SegmentPlanner::plan(uint64_t target_bytes,
                                 double   bitrate_mbps,
                                 double   duration_sec,
                                 double   fps)
{
    if (target_bytes == 0)
        throw std::invalid_argument("Segment target size must be positive");
    if (!positive_finite(bitrate_mbps))
        throw std::invalid_argument("Invalid bitrate: " + std::to_string(bitrate_mbps));
    if (!positive_finite(duration_sec))
        throw std::invalid_argument("Invalid duration: " + std::to_string(duration_sec));
    if (!positive_finite(fps))
        throw std::invalid_argument("Invalid FPS: " + std::to_string(fps));
    if (duration_sec * fps > static_cast<double>(MAX_FRAME_COUNT))
        throw std::invalid_argument("Too many frames: " + std::to_string(duration_sec) + "s at "
                                    + std::to_string(fps) + " FPS");

    const double bits_per_sec   = bitrate_mbps * 1024.0 * 1024.0;
    const double seconds_at_cap = static_cast<double>(target_bytes) * 8.0 / bits_per_sec;

    SegmentPlan p;
    p.segment_seconds    = std::max(MIN_SEGMENT_SECONDS, std::min(duration_sec, seconds_at_cap));
    // Clamped so the rounding sum below stays in uint32 range
    const double per_segment = std::ceil(p.segment_seconds * fps - 1e-9);
    p.frames_per_segment     = static_cast<uint32_t>(
        std::clamp(per_segment, 1.0, static_cast<double>(MAX_FRAME_COUNT)));
    p.total_frames  = total_frame_count(duration_sec, fps);
    p.segment_count = (p.total_frames + p.frames_per_segment - 1) / p.frames_per_segment;

    NDCAPTURE_LOG_DEBUG("segment",
                        "Plan: {}s per segment, {} frames per segment, {} segments",
                        p.segment_seconds,
                        p.frames_per_segment,
                        p.segment_count);
    return p;
}

uint32_t SegmentPlanner::frames_for_segment(const SegmentPlan& plan, uint32_t frames_done)
{
    if (frames_done >= plan.total_frames)
        return 0;
    return std::min(plan.frames_per_segment, plan.total_frames - frames_done);
}

std::vector<uint32_t> SegmentPlanner::segment_frame_counts(const SegmentPlan& plan)
{
    std::vector<uint32_t> counts;
    counts.reserve(plan.segment_count);
    uint32_t done = 0;
    while (done < plan.total_frames)
    {
        uint32_t n = frames_for_segment(plan, done);
        counts.push_back(n);
        done += n;
    }
    return counts;
}

}   // namespace ndcapture
