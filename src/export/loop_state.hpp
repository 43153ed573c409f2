#pragma once

#include <cstdint>
#include <filesystem>
#include <ndcapture/export_settings.hpp>
#include <optional>

#include "export_phase.hpp"
#include "segment_planner.hpp"

namespace ndcapture
{

// Mutable state of one export run. Owned by exactly one scheduler.
struct LoopState
{
    ExportPhase    phase = phase::Idle{};
    ExportMode     mode  = ExportMode::InMemory;
    ExportSettings settings;
    Resolution     export_size;

    // Bumped on every start(); batches carry the value they were posted with.
    uint64_t generation = 0;

    // Frame counters
    uint32_t frame_index        = 0;   // Within the active capturing phase
    uint32_t warmup_frame_index = 0;
    uint32_t phase_total_frames = 0;   // Preview or full export
    uint32_t total_frames       = 0;   // Full export

    // Synthetic timeline
    double frame_duration_sec = 0.0;
    double frame_duration_ms  = 0.0;
    double timeline_anchor_ms = 0.0;

    // Wall clock
    double  export_start_ms     = 0.0;
    double  last_eta_publish_ms = 0.0;
    int64_t export_timestamp    = 0;   // Epoch ms, used in artifact names

    // Stream mode
    std::optional<std::filesystem::path> stream_destination;

    // Segmented mode
    SegmentPlan plan;
    uint32_t    segment_index       = 1;   // 1-based
    uint32_t    frames_in_segment   = 0;
    uint32_t    segment_frame_total = 0;   // Planned frames of the current segment
    uint32_t    segment_first_frame = 0;
    double      segment_start_sec   = 0.0;   // Synthetic video time
};

}   // namespace ndcapture
