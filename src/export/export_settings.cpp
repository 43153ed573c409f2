#include <cmath>
#include <ndcapture/export_settings.hpp>
#include <sstream>

namespace ndcapture
{

static bool positive_finite(double v)
{
    return std::isfinite(v) && v > 0.0;
}

static std::string number_text(double v)
{
    std::ostringstream os;
    os << v;
    return os.str();
}

bool validate_settings(const ExportSettings& settings, std::string& error)
{
    if (!positive_finite(settings.fps))
    {
        error = "Invalid FPS: " + number_text(settings.fps);
        return false;
    }
    if (!positive_finite(settings.duration))
    {
        error = "Invalid duration: " + number_text(settings.duration);
        return false;
    }
    if (!positive_finite(settings.bitrate))
    {
        error = "Invalid bitrate: " + number_text(settings.bitrate);
        return false;
    }
    if (settings.duration * settings.fps > static_cast<double>(MAX_FRAME_COUNT))
    {
        error = "Too many frames: " + number_text(settings.duration) + "s at "
                + number_text(settings.fps) + " FPS exceeds " + std::to_string(MAX_FRAME_COUNT);
        return false;
    }
    if (settings.resolution == ResolutionPreset::Custom
        && (settings.custom_width < 2 || settings.custom_height < 2))
    {
        error = "Invalid custom resolution: " + std::to_string(settings.custom_width) + "x"
                + std::to_string(settings.custom_height);
        return false;
    }
    if (!codec_supported_in(settings.format, settings.codec))
    {
        error = std::string("Codec ") + to_string(settings.codec) + " cannot be muxed into "
                + to_string(settings.format);
        return false;
    }

    const CropRegion& c = settings.crop;
    if (c.enabled)
    {
        bool inside = std::isfinite(c.x) && std::isfinite(c.y) && std::isfinite(c.width)
                      && std::isfinite(c.height) && c.x >= 0.0f && c.y >= 0.0f && c.width > 0.0f
                      && c.height > 0.0f && c.x + c.width <= 1.0f + 1e-6f
                      && c.y + c.height <= 1.0f + 1e-6f;
        if (!inside)
        {
            error = "Crop region must lie inside the unit square";
            return false;
        }
    }

    if (!std::isfinite(settings.fade.fade_in_sec) || !std::isfinite(settings.fade.fade_out_sec)
        || settings.fade.fade_in_sec < 0.0f || settings.fade.fade_out_sec < 0.0f)
    {
        error = "Fade durations must be finite and non-negative";
        return false;
    }

    return true;
}

Resolution resolve_resolution(const ExportSettings& settings)
{
    uint32_t w = 1920;
    uint32_t h = 1080;
    switch (settings.resolution)
    {
        case ResolutionPreset::HD720:
            w = 1280;
            h = 720;
            break;
        case ResolutionPreset::HD1080:
            w = 1920;
            h = 1080;
            break;
        case ResolutionPreset::UHD4K:
            w = 3840;
            h = 2160;
            break;
        case ResolutionPreset::Custom:
            w = settings.custom_width;
            h = settings.custom_height;
            break;
    }

    // Even dimensions (required by yuv420p encoders)
    return {w / 2 * 2, h / 2 * 2};
}

uint32_t total_frame_count(double duration_sec, double fps)
{
    if (!positive_finite(duration_sec) || !positive_finite(fps))
        return 0;
    double frames = std::ceil(duration_sec * fps - 1e-9);
    if (frames < 1.0)
        return 1;
    if (frames > static_cast<double>(MAX_FRAME_COUNT))
        return MAX_FRAME_COUNT;
    return static_cast<uint32_t>(frames);
}

bool codec_supported_in(ExportFormat format, VideoCodec codec)
{
    switch (format)
    {
        case ExportFormat::MP4:
            return codec == VideoCodec::AVC || codec == VideoCodec::HEVC
                   || codec == VideoCodec::VP9 || codec == VideoCodec::AV1;
        case ExportFormat::WebM:
            return codec == VideoCodec::VP9 || codec == VideoCodec::AV1;
    }
    return false;
}

const char* file_extension(ExportFormat format)
{
    switch (format)
    {
        case ExportFormat::MP4:
            return "mp4";
        case ExportFormat::WebM:
            return "webm";
    }
    return "mp4";
}

const char* mime_type(ExportFormat format)
{
    switch (format)
    {
        case ExportFormat::MP4:
            return "video/mp4";
        case ExportFormat::WebM:
            return "video/webm";
    }
    return "application/octet-stream";
}

// ─── Enum names ──────────────────────────────────────────────────────────────

const char* to_string(ExportFormat format)
{
    return file_extension(format);
}

const char* to_string(VideoCodec codec)
{
    switch (codec)
    {
        case VideoCodec::AVC:
            return "avc";
        case VideoCodec::HEVC:
            return "hevc";
        case VideoCodec::VP9:
            return "vp9";
        case VideoCodec::AV1:
            return "av1";
    }
    return "avc";
}

const char* to_string(ResolutionPreset preset)
{
    switch (preset)
    {
        case ResolutionPreset::HD720:
            return "720p";
        case ResolutionPreset::HD1080:
            return "1080p";
        case ResolutionPreset::UHD4K:
            return "4k";
        case ResolutionPreset::Custom:
            return "custom";
    }
    return "1080p";
}

const char* to_string(ExportMode mode)
{
    switch (mode)
    {
        case ExportMode::InMemory:
            return "in-memory";
        case ExportMode::Stream:
            return "stream";
        case ExportMode::Segmented:
            return "segmented";
    }
    return "in-memory";
}

bool parse_format(const std::string& s, ExportFormat& out)
{
    if (s == "mp4")
        out = ExportFormat::MP4;
    else if (s == "webm")
        out = ExportFormat::WebM;
    else
        return false;
    return true;
}

bool parse_codec(const std::string& s, VideoCodec& out)
{
    if (s == "avc")
        out = VideoCodec::AVC;
    else if (s == "hevc")
        out = VideoCodec::HEVC;
    else if (s == "vp9")
        out = VideoCodec::VP9;
    else if (s == "av1")
        out = VideoCodec::AV1;
    else
        return false;
    return true;
}

bool parse_resolution(const std::string& s, ResolutionPreset& out)
{
    if (s == "720p")
        out = ResolutionPreset::HD720;
    else if (s == "1080p")
        out = ResolutionPreset::HD1080;
    else if (s == "4k")
        out = ResolutionPreset::UHD4K;
    else if (s == "custom")
        out = ResolutionPreset::Custom;
    else
        return false;
    return true;
}

bool parse_mode(const std::string& s, ExportMode& out)
{
    if (s == "in-memory")
        out = ExportMode::InMemory;
    else if (s == "stream")
        out = ExportMode::Stream;
    else if (s == "segmented")
        out = ExportMode::Segmented;
    else
        return false;
    return true;
}

}   // namespace ndcapture
