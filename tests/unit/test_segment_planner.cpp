#include <gtest/gtest.h>
#include <limits>
#include <ndcapture/export_settings.hpp>
#include <numeric>
#include <stdexcept>

#include "export/segment_planner.hpp"

using namespace ndcapture;

TEST(SegmentPlanner, FiftyMiBAtEightMbps)
{
    auto p = SegmentPlanner::plan(SegmentPlanner::DEFAULT_TARGET_BYTES, 8.0, 600.0, 30.0);
    EXPECT_DOUBLE_EQ(p.segment_seconds, 50.0);
    EXPECT_EQ(p.frames_per_segment, 1500u);
    EXPECT_EQ(p.total_frames, 18000u);
    EXPECT_EQ(p.segment_count, 12u);
}

TEST(SegmentPlanner, ShortExportIsOneSegment)
{
    auto p = SegmentPlanner::plan(SegmentPlanner::DEFAULT_TARGET_BYTES, 8.0, 20.0, 30.0);
    EXPECT_DOUBLE_EQ(p.segment_seconds, 20.0);
    EXPECT_EQ(p.segment_count, 1u);
    EXPECT_EQ(SegmentPlanner::frames_for_segment(p, 0), 600u);
}

TEST(SegmentPlanner, SegmentsNeverShorterThanFiveSeconds)
{
    // 1 MiB at 100 Mbit/s is 0.08 s
    auto p = SegmentPlanner::plan(1024 * 1024, 100.0, 60.0, 24.0);
    EXPECT_DOUBLE_EQ(p.segment_seconds, SegmentPlanner::MIN_SEGMENT_SECONDS);
    EXPECT_EQ(p.frames_per_segment, 120u);

    // Even when the export itself is shorter
    auto q = SegmentPlanner::plan(1024 * 1024, 100.0, 2.0, 24.0);
    EXPECT_DOUBLE_EQ(q.segment_seconds, 5.0);
    EXPECT_EQ(q.segment_count, 1u);
    EXPECT_EQ(SegmentPlanner::frames_for_segment(q, 0), 48u);
}

TEST(SegmentPlanner, FinalSegmentHoldsTheRemainder)
{
    auto p = SegmentPlanner::plan(5ull * 1024 * 1024, 8.0, 12.0, 10.0);
    EXPECT_EQ(p.frames_per_segment, 50u);
    EXPECT_EQ(p.segment_count, 3u);
    EXPECT_EQ(SegmentPlanner::frames_for_segment(p, 0), 50u);
    EXPECT_EQ(SegmentPlanner::frames_for_segment(p, 50), 50u);
    EXPECT_EQ(SegmentPlanner::frames_for_segment(p, 100), 20u);
    EXPECT_EQ(SegmentPlanner::frames_for_segment(p, 120), 0u);
}

TEST(SegmentPlanner, CountsSumToTotal)
{
    const double durations[] = {7.3, 59.99, 600.0, 3601.5};
    const double rates[]     = {24.0, 29.97, 60.0};
    for (double d : durations)
    {
        for (double fps : rates)
        {
            auto p      = SegmentPlanner::plan(SegmentPlanner::DEFAULT_TARGET_BYTES, 40.0, d, fps);
            auto counts = SegmentPlanner::segment_frame_counts(p);
            ASSERT_EQ(counts.size(), p.segment_count) << d << "s @ " << fps;
            EXPECT_EQ(std::accumulate(counts.begin(), counts.end(), 0u), p.total_frames);
            for (size_t i = 0; i + 1 < counts.size(); ++i)
                EXPECT_EQ(counts[i], p.frames_per_segment);
            EXPECT_LE(counts.back(), p.frames_per_segment);
            EXPECT_GT(counts.back(), 0u);
        }
    }
}

TEST(SegmentPlanner, RejectsInvalidInput)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(SegmentPlanner::plan(0, 8.0, 10.0, 30.0), std::invalid_argument);
    EXPECT_THROW(SegmentPlanner::plan(1024, 0.0, 10.0, 30.0), std::invalid_argument);
    EXPECT_THROW(SegmentPlanner::plan(1024, nan, 10.0, 30.0), std::invalid_argument);
    EXPECT_THROW(SegmentPlanner::plan(1024, 8.0, -1.0, 30.0), std::invalid_argument);
    EXPECT_THROW(SegmentPlanner::plan(1024, 8.0, 10.0, 0.0), std::invalid_argument);
}

TEST(SegmentPlanner, RejectsFrameCountOverflow)
{
    EXPECT_THROW(SegmentPlanner::plan(1024, 8.0, 1e9, 60.0), std::invalid_argument);
}

TEST(SegmentPlanner, HugeFpsShortExportStaysInRange)
{
    // The 5 s floor at 1e9 FPS would be 5e9 frames per segment
    auto p = SegmentPlanner::plan(1024, 8.0, 0.5, 1e9);
    EXPECT_EQ(p.total_frames, 500000000u);
    EXPECT_EQ(p.frames_per_segment, MAX_FRAME_COUNT);
    EXPECT_EQ(p.segment_count, 1u);
    EXPECT_EQ(SegmentPlanner::frames_for_segment(p, 0), 500000000u);
}
