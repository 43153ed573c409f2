#include "frame_ops.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace ndcapture
{

namespace
{

uint32_t floor_even(uint32_t v)
{
    return v & ~1u;
}

}   // anonymous namespace

PixelRect resolve_crop(const CropRegion& crop, uint32_t frame_width, uint32_t frame_height)
{
    const uint32_t fw = floor_even(frame_width);
    const uint32_t fh = floor_even(frame_height);
    if (!crop.enabled)
        return {0, 0, fw, fh};

    auto clamp01 = [](float v) { return std::clamp(std::isfinite(v) ? v : 0.0f, 0.0f, 1.0f); };

    const float nx = clamp01(crop.x);
    const float ny = clamp01(crop.y);
    const float nw = std::min(clamp01(crop.width), 1.0f - nx);
    const float nh = std::min(clamp01(crop.height), 1.0f - ny);

    PixelRect r;
    r.x      = floor_even(static_cast<uint32_t>(std::lround(nx * static_cast<float>(frame_width))));
    r.y      = floor_even(static_cast<uint32_t>(std::lround(ny * static_cast<float>(frame_height))));
    r.width  = floor_even(static_cast<uint32_t>(std::lround(nw * static_cast<float>(frame_width))));
    r.height = floor_even(static_cast<uint32_t>(std::lround(nh * static_cast<float>(frame_height))));

    // Keep at least 2x2 and stay inside the frame
    r.width  = std::max(r.width, 2u);
    r.height = std::max(r.height, 2u);
    if (r.x + r.width > fw)
        r.x = fw >= r.width ? floor_even(fw - r.width) : 0;
    if (r.y + r.height > fh)
        r.y = fh >= r.height ? floor_even(fh - r.height) : 0;
    r.width  = std::min(r.width, fw);
    r.height = std::min(r.height, fh);
    return r;
}

void crop_rgba(const uint8_t*        src,
               uint32_t              src_width,
               uint32_t              src_height,
               const PixelRect&      rect,
               std::vector<uint8_t>& out)
{
    const uint32_t w = std::min(rect.width, src_width > rect.x ? src_width - rect.x : 0u);
    const uint32_t h = std::min(rect.height, src_height > rect.y ? src_height - rect.y : 0u);
    out.assign(static_cast<size_t>(rect.width) * rect.height * 4, 0);
    if (!src || w == 0 || h == 0)
        return;

    const size_t src_stride = static_cast<size_t>(src_width) * 4;
    const size_t dst_stride = static_cast<size_t>(rect.width) * 4;
    for (uint32_t row = 0; row < h; ++row)
    {
        const uint8_t* s = src + (static_cast<size_t>(rect.y) + row) * src_stride + static_cast<size_t>(rect.x) * 4;
        std::memcpy(out.data() + row * dst_stride, s, static_cast<size_t>(w) * 4);
    }
}

float fade_factor(double time_sec, double total_sec, const FadeSettings& fade)
{
    double f = 1.0;
    if (fade.fade_in_sec > 0.0f && time_sec < fade.fade_in_sec)
        f = std::min(f, std::max(0.0, time_sec) / fade.fade_in_sec);
    if (fade.fade_out_sec > 0.0f && total_sec > 0.0)
    {
        const double until_end = total_sec - time_sec;
        if (until_end < fade.fade_out_sec)
            f = std::min(f, std::max(0.0, until_end) / fade.fade_out_sec);
    }
    return static_cast<float>(std::clamp(f, 0.0, 1.0));
}

void apply_fade(uint8_t* rgba, size_t pixel_count, float factor)
{
    if (!rgba || factor >= 1.0f)
        return;
    const float k = std::max(0.0f, factor);
    for (size_t i = 0; i < pixel_count; ++i)
    {
        uint8_t* p = rgba + i * 4;
        p[0]       = static_cast<uint8_t>(std::lround(p[0] * k));
        p[1]       = static_cast<uint8_t>(std::lround(p[1] * k));
        p[2]       = static_cast<uint8_t>(std::lround(p[2] * k));
    }
}

}   // namespace ndcapture
