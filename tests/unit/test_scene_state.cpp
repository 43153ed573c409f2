#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <ndcapture/scene_state.hpp>
#include <numbers>
#include <stdexcept>

#include "anim/rotation_snapshot.hpp"

using namespace ndcapture;

constexpr double TWO_PI = 2.0 * std::numbers::pi;

// ═══════════════════════════════════════════════════════════════════════════════
// Rotation planes
// ═══════════════════════════════════════════════════════════════════════════════

TEST(RotationPlanes, AxisNames)
{
    EXPECT_EQ(axis_name(0), "X");
    EXPECT_EQ(axis_name(3), "W");
    EXPECT_EQ(axis_name(5), "U");
    EXPECT_EQ(axis_name(6), "A6");
    EXPECT_EQ(axis_name(10), "A10");
}

TEST(RotationPlanes, CountIsNChooseTwo)
{
    EXPECT_EQ(rotation_plane_count(2), 1u);
    EXPECT_EQ(rotation_plane_count(3), 3u);
    EXPECT_EQ(rotation_plane_count(4), 6u);
    EXPECT_EQ(rotation_plane_count(11), 55u);
    EXPECT_THROW(rotation_plane_count(1), std::invalid_argument);
    EXPECT_THROW(rotation_planes(0), std::invalid_argument);
}

TEST(RotationPlanes, FourDimensionalOrder)
{
    auto planes = rotation_planes(4);
    std::vector<std::string> expected = {"XY", "XZ", "XW", "YZ", "YW", "ZW"};
    EXPECT_EQ(planes, expected);
}

TEST(RotationPlanes, HighDimensionsUseIndexedAxes)
{
    auto planes = rotation_planes(8);
    EXPECT_EQ(planes.size(), 28u);
    EXPECT_EQ(planes.back(), "A6A7");
    EXPECT_EQ(planes[5], "XA6");
}

TEST(RotationPlanes, ParseRoundTripsEveryPlane)
{
    for (uint32_t dim : {2u, 5u, 9u})
    {
        for (const auto& name : rotation_planes(dim))
        {
            auto [a, b] = parse_plane_name(name);
            EXPECT_EQ(axis_name(a) + axis_name(b), name);
        }
    }
}

TEST(RotationPlanes, ParseRejectsMalformed)
{
    EXPECT_THROW(parse_plane_name(""), std::invalid_argument);
    EXPECT_THROW(parse_plane_name("X"), std::invalid_argument);
    EXPECT_THROW(parse_plane_name("YX"), std::invalid_argument);
    EXPECT_THROW(parse_plane_name("XX"), std::invalid_argument);
    EXPECT_THROW(parse_plane_name("XQ"), std::invalid_argument);
    EXPECT_THROW(parse_plane_name("XA"), std::invalid_argument);
    EXPECT_THROW(parse_plane_name("XA3"), std::invalid_argument);
    EXPECT_THROW(parse_plane_name("XYZ"), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Multipliers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(PlaneMultiplier, ZeroBiasIsUniform)
{
    for (size_t i = 0; i < 10; ++i)
        EXPECT_DOUBLE_EQ(plane_multiplier(i, 10, 0.0), 1.0);
}

TEST(PlaneMultiplier, FollowsGoldenRatioSpread)
{
    const double bias = 0.75;
    for (size_t i = 0; i < 6; ++i)
    {
        double expected =
            1.0 + std::sin(static_cast<double>(i) * TWO_PI * GOLDEN_RATIO + std::numbers::pi / 4.0) * bias * 0.8;
        EXPECT_NEAR(plane_multiplier(i, 6, bias), expected, 1e-12);
    }
}

TEST(PlaneMultiplier, StaysWithinClampRange)
{
    for (double bias : {0.25, 1.0, 5.0})
    {
        for (double m : plane_multipliers(20, bias))
        {
            EXPECT_GE(m, MIN_MULTIPLIER);
            EXPECT_LE(m, MAX_MULTIPLIER);
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Advancement
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SceneAdvance, DeltaScalesWithSpeedAndDirection)
{
    AnimationParams p;
    p.speed     = 2.0;
    p.direction = -1;
    EXPECT_DOUBLE_EQ(rotation_delta(p, 0.5), -BASE_ROTATION_RATE * 2.0 * 0.5);
}

TEST(SceneAdvance, OnlyAnimatingPlanesMove)
{
    RotationState   r = {{"XY", 0.5}, {"ZW", 1.0}};
    AnimationParams p;
    p.animating_planes = {"XY"};

    RotationState next = advance_rotations(r, p, 1.0);
    EXPECT_DOUBLE_EQ(next.at("XY"), 0.5 + BASE_ROTATION_RATE);
    EXPECT_DOUBLE_EQ(next.at("ZW"), 1.0);
    // Input untouched
    EXPECT_DOUBLE_EQ(r.at("XY"), 0.5);
}

TEST(SceneAdvance, MissingAnimatingPlaneStartsAtZero)
{
    AnimationParams p;
    p.animating_planes = {"XW"};
    RotationState next = advance_rotations({}, p, 2.0);
    EXPECT_DOUBLE_EQ(next.at("XW"), BASE_ROTATION_RATE * 2.0);
}

TEST(SceneAdvance, AnglesWrapIntoRange)
{
    EXPECT_NEAR(wrap_angle(TWO_PI + 0.25), 0.25, 1e-12);
    EXPECT_NEAR(wrap_angle(-0.25), TWO_PI - 0.25, 1e-12);
    EXPECT_DOUBLE_EQ(wrap_angle(0.0), 0.0);
    EXPECT_DOUBLE_EQ(wrap_angle(std::numeric_limits<double>::infinity()), 0.0);
    EXPECT_DOUBLE_EQ(wrap_angle(std::numeric_limits<double>::quiet_NaN()), 0.0);

    AnimationParams p;
    p.animating_planes = {"XY"};
    p.speed            = 100.0;
    RotationState next = advance_rotations({{"XY", 6.0}}, p, 1.0);
    EXPECT_GE(next.at("XY"), 0.0);
    EXPECT_LT(next.at("XY"), TWO_PI);
}

TEST(SceneAdvance, DeterministicAcrossRuns)
{
    SceneState a;
    a.animation.animating_planes = {"XY", "XZ", "YZ"};
    a.animation.bias             = 0.6;
    SceneState b                 = a;

    for (int i = 0; i < 240; ++i)
    {
        advance_scene(a, 1.0 / 60.0);
        advance_scene(b, 1.0 / 60.0);
    }
    EXPECT_EQ(a.rotations, b.rotations);
}

TEST(SceneAdvance, BiasGivesPlanesDifferentSpeeds)
{
    AnimationParams p;
    p.animating_planes = {"XY", "XZ"};
    p.bias             = 1.0;
    RotationState next = advance_rotations({}, p, 1.0);
    EXPECT_NE(next.at("XY"), next.at("XZ"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// RotationSnapshot
// ═══════════════════════════════════════════════════════════════════════════════

TEST(RotationSnapshot, RestoresCapturedState)
{
    RotationState    r    = {{"XY", 0.1}, {"XW", 0.2}};
    RotationSnapshot snap = RotationSnapshot::capture(r);
    EXPECT_EQ(snap.plane_count(), 2u);
    EXPECT_FALSE(snap.consumed());

    r["XY"] = 3.0;
    r["ZW"] = 1.0;   // Added after capture
    ASSERT_TRUE(snap.restore_into(r));

    RotationState expected = {{"XY", 0.1}, {"XW", 0.2}};
    EXPECT_EQ(r, expected);
}

TEST(RotationSnapshot, RestoreConsumes)
{
    RotationState    r    = {{"XY", 0.1}};
    RotationSnapshot snap = RotationSnapshot::capture(r);
    ASSERT_TRUE(snap.restore_into(r));
    EXPECT_TRUE(snap.consumed());

    r["XY"] = 2.0;
    EXPECT_FALSE(snap.restore_into(r));
    EXPECT_DOUBLE_EQ(r.at("XY"), 2.0);
}

TEST(RotationSnapshot, EmptySnapshotRestoresNothing)
{
    RotationSnapshot snap;
    RotationState    r = {{"XY", 1.0}};
    EXPECT_TRUE(snap.consumed());
    EXPECT_FALSE(snap.restore_into(r));
    EXPECT_EQ(r.size(), 1u);
}

TEST(RotationSnapshot, ReproducesPostWarmupTrajectory)
{
    SceneState s;
    s.animation.animating_planes = {"XY", "XW", "ZW"};
    s.animation.bias             = 0.3;
    for (int i = 0; i < 5; ++i)
        advance_scene(s, 1.0 / 30.0);

    RotationSnapshot snap = RotationSnapshot::capture(s.rotations);
    std::vector<RotationState> first;
    for (int i = 0; i < 10; ++i)
    {
        advance_scene(s, 1.0 / 30.0);
        first.push_back(s.rotations);
    }

    ASSERT_TRUE(snap.restore_into(s.rotations));
    for (int i = 0; i < 10; ++i)
    {
        advance_scene(s, 1.0 / 30.0);
        EXPECT_EQ(s.rotations, first[i]) << "frame " << i;
    }
}
