#pragma once

#include <cstddef>
#include <cstdint>
#include <ndcapture/export_settings.hpp>
#include <vector>

namespace ndcapture
{

// Pixel rectangle inside a frame.
struct PixelRect
{
    uint32_t x      = 0;
    uint32_t y      = 0;
    uint32_t width  = 0;
    uint32_t height = 0;

    bool operator==(const PixelRect&) const = default;
};

// Resolve a normalized crop against a frame. The result has even width and
// height (at least 2x2) and lies inside the frame. A disabled crop yields
// the full frame.
PixelRect resolve_crop(const CropRegion& crop, uint32_t frame_width, uint32_t frame_height);

// Copy `rect` out of a tightly packed RGBA8 frame into `out` (resized).
void crop_rgba(const uint8_t*        src,
               uint32_t              src_width,
               uint32_t              src_height,
               const PixelRect&      rect,
               std::vector<uint8_t>& out);

// Brightness factor in [0, 1] at `time_sec` of a `total_sec` timeline.
float fade_factor(double time_sec, double total_sec, const FadeSettings& fade);

// Multiply RGB (not alpha) by `factor`.
void apply_fade(uint8_t* rgba, size_t pixel_count, float factor);

}   // namespace ndcapture
