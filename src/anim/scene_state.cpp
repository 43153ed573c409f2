#include <algorithm>
#include <cmath>
#include <ndcapture/logger.hpp>
#include <ndcapture/scene_state.hpp>
#include <numbers>
#include <stdexcept>

namespace ndcapture
{

namespace
{

constexpr double TWO_PI = 2.0 * std::numbers::pi;

constexpr const char* BASE_AXES[] = {"X", "Y", "Z", "W", "V", "U"};
constexpr uint32_t    BASE_AXIS_COUNT = 6;

uint32_t axis_index(const std::string& name, size_t& pos)
{
    if (pos >= name.size())
        throw std::invalid_argument("Invalid rotation plane: " + name);

    char c = name[pos];
    if (c == 'A')
    {
        size_t start = ++pos;
        while (pos < name.size() && name[pos] >= '0' && name[pos] <= '9')
            ++pos;
        if (pos == start)
            throw std::invalid_argument("Invalid rotation plane: " + name);
        unsigned long idx = std::stoul(name.substr(start, pos - start));
        if (idx < BASE_AXIS_COUNT)
            throw std::invalid_argument("Invalid rotation plane: " + name);
        return static_cast<uint32_t>(idx);
    }

    for (uint32_t i = 0; i < BASE_AXIS_COUNT; ++i)
    {
        if (c == BASE_AXES[i][0])
        {
            ++pos;
            return i;
        }
    }
    throw std::invalid_argument("Invalid rotation plane: " + name);
}

}   // anonymous namespace

std::string axis_name(uint32_t index)
{
    if (index < BASE_AXIS_COUNT)
        return BASE_AXES[index];
    return "A" + std::to_string(index);
}

size_t rotation_plane_count(uint32_t dimension)
{
    if (dimension < 2)
        throw std::invalid_argument("Dimension must be at least 2, got " + std::to_string(dimension));
    return static_cast<size_t>(dimension) * (dimension - 1) / 2;
}

std::vector<std::string> rotation_planes(uint32_t dimension)
{
    std::vector<std::string> planes;
    planes.reserve(rotation_plane_count(dimension));
    for (uint32_t i = 0; i < dimension; ++i)
    {
        for (uint32_t j = i + 1; j < dimension; ++j)
        {
            planes.push_back(axis_name(i) + axis_name(j));
        }
    }
    return planes;
}

std::pair<uint32_t, uint32_t> parse_plane_name(const std::string& name)
{
    size_t   pos = 0;
    uint32_t a   = axis_index(name, pos);
    uint32_t b   = axis_index(name, pos);
    if (pos != name.size() || a >= b)
        throw std::invalid_argument("Invalid rotation plane: " + name);
    return {a, b};
}

double plane_multiplier(size_t plane_index, size_t plane_count, double bias)
{
    if (bias == 0.0 || plane_count == 0)
        return 1.0;

    // Golden-ratio phase spreads the planes evenly regardless of count
    double phase = static_cast<double>(plane_index) * TWO_PI * GOLDEN_RATIO + std::numbers::pi / 4.0;
    double m     = 1.0 + std::sin(phase) * bias * MAX_DEVIATION;
    return std::clamp(m, MIN_MULTIPLIER, MAX_MULTIPLIER);
}

std::vector<double> plane_multipliers(size_t plane_count, double bias)
{
    std::vector<double> out(plane_count);
    for (size_t i = 0; i < plane_count; ++i)
        out[i] = plane_multiplier(i, plane_count, bias);
    return out;
}

double rotation_delta(const AnimationParams& params, double dt_sec)
{
    return BASE_ROTATION_RATE * params.speed * static_cast<double>(params.direction) * dt_sec;
}

double wrap_angle(double angle)
{
    if (!std::isfinite(angle))
        return 0.0;
    double r = std::fmod(angle, TWO_PI);
    if (r < 0.0)
        r += TWO_PI;
    // fmod of a tiny negative value can round up to exactly 2π
    if (r >= TWO_PI)
        r = 0.0;
    return r;
}

RotationState advance_rotations(const RotationState&   rotations,
                                const AnimationParams& params,
                                double                 dt_sec)
{
    RotationState next  = rotations;
    const size_t  count = params.animating_planes.size();
    if (count == 0)
        return next;

    const double delta = rotation_delta(params, dt_sec);
    for (size_t i = 0; i < count; ++i)
    {
        const std::string& plane = params.animating_planes[i];
        double             angle = 0.0;
        if (auto it = next.find(plane); it != next.end())
            angle = it->second;
        next[plane] = wrap_angle(angle + delta * plane_multiplier(i, count, params.bias));
    }
    return next;
}

void advance_scene(SceneState& scene, double dt_sec)
{
    scene.rotations = advance_rotations(scene.rotations, scene.animation, dt_sec);
    NDCAPTURE_LOG_TRACE("scene", "Advanced {} planes by {}s", scene.animation.animating_planes.size(), dt_sec);
}

}   // namespace ndcapture
