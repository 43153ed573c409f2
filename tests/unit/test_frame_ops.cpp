#include <gtest/gtest.h>
#include <vector>

#include "io/frame_ops.hpp"

using namespace ndcapture;

// ─── Helper: frame where each pixel encodes its coordinates ─────────────────

static std::vector<uint8_t> coordinate_frame(uint32_t w, uint32_t h)
{
    std::vector<uint8_t> rgba(static_cast<size_t>(w) * h * 4);
    for (uint32_t y = 0; y < h; ++y)
    {
        for (uint32_t x = 0; x < w; ++x)
        {
            size_t idx    = (static_cast<size_t>(y) * w + x) * 4;
            rgba[idx + 0] = static_cast<uint8_t>(x);
            rgba[idx + 1] = static_cast<uint8_t>(y);
            rgba[idx + 2] = 200;
            rgba[idx + 3] = 255;
        }
    }
    return rgba;
}

// ─── Crop ────────────────────────────────────────────────────────────────────

TEST(FrameCrop, DisabledIsFullFrame)
{
    CropRegion crop;
    EXPECT_EQ(resolve_crop(crop, 640, 480), (PixelRect{0, 0, 640, 480}));
    EXPECT_EQ(resolve_crop(crop, 641, 481), (PixelRect{0, 0, 640, 480}));
}

TEST(FrameCrop, CenterQuarter)
{
    CropRegion crop{true, 0.25f, 0.25f, 0.5f, 0.5f};
    EXPECT_EQ(resolve_crop(crop, 400, 200), (PixelRect{100, 50, 200, 100}));
}

TEST(FrameCrop, ResultIsEvenAndInside)
{
    CropRegion crop{true, 0.33f, 0.71f, 0.29f, 0.29f};
    PixelRect  r = resolve_crop(crop, 123, 77);
    EXPECT_EQ(r.x % 2, 0u);
    EXPECT_EQ(r.y % 2, 0u);
    EXPECT_EQ(r.width % 2, 0u);
    EXPECT_EQ(r.height % 2, 0u);
    EXPECT_LE(r.x + r.width, 122u);
    EXPECT_LE(r.y + r.height, 76u);
}

TEST(FrameCrop, TinyCropKeepsTwoByTwo)
{
    CropRegion crop{true, 0.999f, 0.999f, 0.0001f, 0.0001f};
    PixelRect  r = resolve_crop(crop, 100, 100);
    EXPECT_EQ(r.width, 2u);
    EXPECT_EQ(r.height, 2u);
    EXPECT_LE(r.x + r.width, 100u);
    EXPECT_LE(r.y + r.height, 100u);
}

TEST(FrameCrop, CopiesRows)
{
    auto                 src = coordinate_frame(16, 8);
    std::vector<uint8_t> out;
    crop_rgba(src.data(), 16, 8, PixelRect{4, 2, 6, 4}, out);
    ASSERT_EQ(out.size(), 6u * 4u * 4u);

    // Top-left of the crop is source pixel (4, 2)
    EXPECT_EQ(out[0], 4);
    EXPECT_EQ(out[1], 2);
    // Bottom-right is (9, 5)
    size_t last = (3 * 6 + 5) * 4;
    EXPECT_EQ(out[last + 0], 9);
    EXPECT_EQ(out[last + 1], 5);
}

TEST(FrameCrop, NullSourceGivesBlackFrame)
{
    std::vector<uint8_t> out;
    crop_rgba(nullptr, 16, 8, PixelRect{0, 0, 4, 4}, out);
    ASSERT_EQ(out.size(), 64u);
    for (uint8_t b : out)
        EXPECT_EQ(b, 0);
}

// ─── Fade ────────────────────────────────────────────────────────────────────

TEST(FrameFade, NoFadeIsUnity)
{
    FadeSettings fade;
    EXPECT_FLOAT_EQ(fade_factor(0.0, 10.0, fade), 1.0f);
    EXPECT_FLOAT_EQ(fade_factor(9.99, 10.0, fade), 1.0f);
}

TEST(FrameFade, RampsInAndOut)
{
    FadeSettings fade{1.0f, 2.0f};
    EXPECT_FLOAT_EQ(fade_factor(0.0, 10.0, fade), 0.0f);
    EXPECT_FLOAT_EQ(fade_factor(0.5, 10.0, fade), 0.5f);
    EXPECT_FLOAT_EQ(fade_factor(5.0, 10.0, fade), 1.0f);
    EXPECT_FLOAT_EQ(fade_factor(9.0, 10.0, fade), 0.5f);
    EXPECT_FLOAT_EQ(fade_factor(10.0, 10.0, fade), 0.0f);
}

TEST(FrameFade, OverlappingFadesTakeMinimum)
{
    FadeSettings fade{2.0f, 2.0f};
    // 2 s timeline: at 0.5 s in-ramp is 0.25, out-ramp 0.75
    EXPECT_FLOAT_EQ(fade_factor(0.5, 2.0, fade), 0.25f);
    EXPECT_FLOAT_EQ(fade_factor(1.5, 2.0, fade), 0.25f);
}

TEST(FrameFade, ScalesColorNotAlpha)
{
    std::vector<uint8_t> px = {200, 100, 50, 255, 10, 20, 30, 128};
    apply_fade(px.data(), 2, 0.5f);
    EXPECT_EQ(px[0], 100);
    EXPECT_EQ(px[1], 50);
    EXPECT_EQ(px[2], 25);
    EXPECT_EQ(px[3], 255);
    EXPECT_EQ(px[4], 5);
    EXPECT_EQ(px[7], 128);

    apply_fade(px.data(), 2, 0.0f);
    EXPECT_EQ(px[0], 0);
    EXPECT_EQ(px[3], 255);
}
