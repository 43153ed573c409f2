#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ndcapture
{

// Angular speed of a plane at speed 1 and bias 0, in radians per second.
inline constexpr double BASE_ROTATION_RATE = 0.5;

inline constexpr double GOLDEN_RATIO   = 1.6180339887498949;
inline constexpr double MIN_MULTIPLIER = 0.1;
inline constexpr double MAX_MULTIPLIER = 3.0;
inline constexpr double MAX_DEVIATION  = 0.8;

// Rotation plane name ("XY", "XW", "A6A7") → angle in radians.
using RotationState = std::map<std::string, double>;

// Time-dependent animation parameters of the scene.
struct AnimationParams
{
    std::vector<std::string> animating_planes;   // In insertion order
    double                   speed     = 1.0;
    int                      direction = 1;      // +1 or -1
    double                   bias      = 0.0;    // [0, 1] per-plane speed spread
};

// Everything the export advances per synthetic frame.
struct SceneState
{
    RotationState   rotations;
    AnimationParams animation;
};

// ─── Rotation planes ─────────────────────────────────────────────────────────

// X, Y, Z, W, V, U, then A6, A7, ...
std::string axis_name(uint32_t index);

// n(n-1)/2. Throws std::invalid_argument for dimension < 2.
size_t rotation_plane_count(uint32_t dimension);

// All planes (i < j) in row order: XY, XZ, YZ ... for 3D.
std::vector<std::string> rotation_planes(uint32_t dimension);

// "XW" → (0, 3). Throws std::invalid_argument on malformed names.
std::pair<uint32_t, uint32_t> parse_plane_name(const std::string& name);

// ─── Scene advancement ───────────────────────────────────────────────────────

// Speed multiplier for one plane. 1.0 at zero bias; otherwise spread along a
// golden-ratio sequence and clamped to [MIN_MULTIPLIER, MAX_MULTIPLIER].
double plane_multiplier(size_t plane_index, size_t plane_count, double bias);

std::vector<double> plane_multipliers(size_t plane_count, double bias);

// Un-biased angle step for `dt_sec` of animation.
double rotation_delta(const AnimationParams& params, double dt_sec);

// Wrap into [0, 2π). Non-finite input maps to 0.
double wrap_angle(double angle);

// Pure: returns `rotations` advanced by `dt_sec`. Planes that are not
// animating keep their angle; animating planes missing from the map start at 0.
RotationState advance_rotations(const RotationState&   rotations,
                                const AnimationParams& params,
                                double                 dt_sec);

// In-place form used by the export loop.
void advance_scene(SceneState& scene, double dt_sec);

}   // namespace ndcapture
