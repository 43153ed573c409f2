#pragma once

#include <cstdint>

namespace ndcapture
{

// Output surface of the renderer.
struct RenderSurface
{
    uint32_t width       = 0;
    uint32_t height      = 0;
    float    pixel_ratio = 1.0f;

    bool operator==(const RenderSurface&) const = default;
};

// Progressive-refinement stage of adaptive renderers (raymarched fractals).
enum class RefinementStage
{
    Low,
    Medium,
    High,
    Final,
};

// Global quality knobs the export overrides for its duration.
struct QualityFlags
{
    float           quality_multiplier     = 1.0f;
    bool            low_quality_animation  = true;
    RefinementStage refinement_stage       = RefinementStage::Final;
    bool            temporal_reprojection  = true;

    bool operator==(const QualityFlags&) const = default;
};

// Renderer — the external collaborator that produces frames.
//
// The scheduler only ever calls it from the thread that drains the host task
// queue. advance() must accept arbitrary synthetic timestamps; they are not
// related to wall-clock time.
class Renderer
{
   public:
    virtual ~Renderer() = default;

    virtual RenderSurface surface() const = 0;

    // Resize the drawing surface. Throws std::runtime_error on failure.
    virtual void set_surface(const RenderSurface& surface) = 0;

    virtual QualityFlags quality() const                   = 0;
    virtual void         set_quality(const QualityFlags& flags) = 0;

    // Synchronously produce one frame for the given synthetic timestamp.
    virtual void advance(double timestamp_ms) = 0;

    // Copy the last produced frame as tightly packed RGBA8.
    // Returns false if the surface does not match width x height.
    virtual bool read_pixels(uint8_t* rgba, uint32_t width, uint32_t height) = 0;
};

}   // namespace ndcapture
