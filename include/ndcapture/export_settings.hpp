#pragma once

#include <cstdint>
#include <string>

namespace ndcapture
{

// Container the recorder muxes into.
enum class ExportFormat
{
    MP4,
    WebM,
};

// Video codec inside the container.
enum class VideoCodec
{
    AVC,    // H.264
    HEVC,   // H.265
    VP9,
    AV1,
};

enum class ResolutionPreset
{
    HD720,    // 1280x720
    HD1080,   // 1920x1080
    UHD4K,    // 3840x2160
    Custom,   // custom_width x custom_height
};

// Output strategy. The three modes share one scheduler state machine.
enum class ExportMode
{
    InMemory,    // Whole video buffered, handed back as one blob
    Stream,      // Written incrementally to a destination chosen up front
    Segmented,   // Split into size-capped parts, each delivered on completion
};

// Normalized [0,1] crop rectangle within the rendered surface.
struct CropRegion
{
    bool  enabled = false;
    float x       = 0.0f;
    float y       = 0.0f;
    float width   = 1.0f;
    float height  = 1.0f;
};

struct TextOverlay
{
    bool        enabled = false;
    std::string text;
    float       position_x = 0.5f;   // Normalized anchor, 0 = left
    float       position_y = 0.9f;   // Normalized anchor, 0 = top
    uint32_t    color      = 0xFFFFFFFF;   // 0xRRGGBBAA
    float       opacity    = 1.0f;
    uint32_t    font_size  = 48;
};

// Fades keyed to the full export timeline, not to individual segments.
struct FadeSettings
{
    float fade_in_sec  = 0.0f;
    float fade_out_sec = 0.0f;
};

// Immutable description of one export request.
struct ExportSettings
{
    ExportFormat     format     = ExportFormat::MP4;
    VideoCodec       codec      = VideoCodec::AVC;
    ResolutionPreset resolution = ResolutionPreset::HD1080;

    uint32_t custom_width  = 1920;
    uint32_t custom_height = 1080;

    double   fps           = 60.0;
    double   duration      = 5.0;    // Seconds
    double   bitrate       = 12.0;   // Mbit/s
    uint32_t warmup_frames = 5;

    CropRegion   crop;
    TextOverlay  text_overlay;
    FadeSettings fade;

    // Temporal reprojection reuses the previous frame's volumetric result and
    // assumes real frame pacing; export renders with it switched off.
    bool disable_temporal_reprojection = true;
};

// Upper bound on ceil(duration * fps); about 207 days at 60 fps.
inline constexpr uint32_t MAX_FRAME_COUNT = 1u << 30;

struct Resolution
{
    uint32_t width  = 0;
    uint32_t height = 0;
};

// Checks every numeric field and the codec/container pairing.
// Returns false and fills `error` on the first violation.
bool validate_settings(const ExportSettings& settings, std::string& error);

// Export surface size for the configured preset, floored to even numbers.
Resolution resolve_resolution(const ExportSettings& settings);

// ceil(duration * fps), tolerant of binary rounding in the product.
// Clamped to MAX_FRAME_COUNT.
uint32_t total_frame_count(double duration_sec, double fps);

bool codec_supported_in(ExportFormat format, VideoCodec codec);

const char* file_extension(ExportFormat format);
const char* mime_type(ExportFormat format);

const char* to_string(ExportFormat format);
const char* to_string(VideoCodec codec);
const char* to_string(ResolutionPreset preset);
const char* to_string(ExportMode mode);

bool parse_format(const std::string& s, ExportFormat& out);
bool parse_codec(const std::string& s, VideoCodec& out);
bool parse_resolution(const std::string& s, ResolutionPreset& out);
bool parse_mode(const std::string& s, ExportMode& out);

}   // namespace ndcapture
