#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <ndcapture/ffmpeg_recorder.hpp>
#include <ndcapture/logger.hpp>
#include <sstream>
#include <stdexcept>

#include "frame_ops.hpp"

namespace ndcapture
{

namespace fs = std::filesystem;

namespace
{

std::atomic<uint64_t> g_temp_counter{0};

// Single-quote for /bin/sh.
std::string shell_quote(const std::string& s)
{
    std::string out = "'";
    for (char c : s)
    {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}

// Escape a literal for use as a drawtext option value.
std::string drawtext_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        if (c == '\\' || c == '\'' || c == ':' || c == '%' || c == ',')
            out += '\\';
        out += c;
    }
    return out;
}

std::string drawtext_filter(const TextOverlay& t)
{
    char color[16];
    std::snprintf(color, sizeof(color), "0x%06X", static_cast<unsigned>(t.color >> 8));
    const float alpha   = static_cast<float>(t.color & 0xFF) / 255.0f;
    const float opacity = std::clamp(t.opacity * alpha, 0.0f, 1.0f);

    std::ostringstream f;
    f << "drawtext=text='" << drawtext_escape(t.text) << "'"
      << ":fontsize=" << t.font_size << ":fontcolor=" << color << "@" << opacity
      << ":x=(w-text_w)*" << t.position_x << ":y=(h-text_h)*" << t.position_y;
    return f.str();
}

}   // anonymous namespace

// ─── Command line ────────────────────────────────────────────────────────────

const char* FfmpegRecorder::encoder_name(VideoCodec codec)
{
    switch (codec)
    {
        case VideoCodec::AVC:
            return "libx264";
        case VideoCodec::HEVC:
            return "libx265";
        case VideoCodec::VP9:
            return "libvpx-vp9";
        case VideoCodec::AV1:
            return "libaom-av1";
    }
    return "libx264";
}

std::string FfmpegRecorder::build_command(const RecorderConfig& config,
                                          uint32_t              out_width,
                                          uint32_t              out_height,
                                          const fs::path&       output)
{
    const auto bits_per_sec = static_cast<long long>(std::llround(config.bitrate * 1024.0 * 1024.0));

    std::ostringstream cmd;
    cmd << "ffmpeg -y -loglevel error"
        << " -f rawvideo"
        << " -vcodec rawvideo"
        << " -pix_fmt rgba"
        << " -s " << out_width << "x" << out_height << " -r " << config.fps << " -i -"
        << " -c:v " << encoder_name(config.codec) << " -b:v " << bits_per_sec
        << " -pix_fmt yuv420p";

    if (config.text_overlay.enabled && !config.text_overlay.text.empty())
    {
        cmd << " -vf " << shell_quote(drawtext_filter(config.text_overlay));
    }
    if (config.format == ExportFormat::MP4)
    {
        cmd << " -movflags +faststart";
    }
    cmd << " -f " << file_extension(config.format) << " " << shell_quote(output.string())
        << " 2>/dev/null";
    return cmd.str();
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

FfmpegRecorder::FfmpegRecorder(Renderer& renderer, RecorderConfig config)
    : renderer_(renderer), config_(std::move(config))
{
}

FfmpegRecorder::~FfmpegRecorder()
{
    dispose();
}

void FfmpegRecorder::initialize()
{
    if (state_ != State::Created)
    {
        throw std::runtime_error("Recorder already initialized");
    }
    if (config_.width < 2 || config_.height < 2 || config_.width % 2 != 0 || config_.height % 2 != 0)
    {
        throw std::runtime_error("Recorder size must be even: " + std::to_string(config_.width) + "x"
                                 + std::to_string(config_.height));
    }

    PixelRect rect = resolve_crop(config_.crop, config_.width, config_.height);
    out_width_     = rect.width;
    out_height_    = rect.height;
    frame_buffer_.resize(static_cast<size_t>(config_.width) * config_.height * 4);

    if (config_.destination)
    {
        output_path_ = *config_.destination;
        owns_output_ = false;
        std::error_code ec;
        if (output_path_.has_parent_path())
            fs::create_directories(output_path_.parent_path(), ec);
    }
    else
    {
        output_path_ = fs::temp_directory_path()
                       / ("ndcapture-" + std::to_string(g_temp_counter.fetch_add(1)) + "-"
                          + std::to_string(reinterpret_cast<uintptr_t>(this)) + "."
                          + file_extension(config_.format));
        owns_output_ = true;
    }

#ifdef NDCAPTURE_USE_FFMPEG
    std::string cmd = build_command(config_, out_width_, out_height_, output_path_);
    NDCAPTURE_LOG_DEBUG("recorder", "Launching: " + cmd);
    pipe_ = popen(cmd.c_str(), "w");
    if (!pipe_)
    {
        throw std::runtime_error("Failed to open ffmpeg pipe");
    }
    state_ = State::Recording;
#else
    throw std::runtime_error("Video export requires NDCAPTURE_USE_FFMPEG");
#endif
}

void FfmpegRecorder::capture_frame(double                segment_time_sec,
                                   double                frame_duration_sec,
                                   std::optional<double> global_time_sec)
{
    (void)frame_duration_sec;
    if (state_ != State::Recording || !pipe_)
    {
        throw std::runtime_error("Recorder not initialized or not recording");
    }

    if (!renderer_.read_pixels(frame_buffer_.data(), config_.width, config_.height))
    {
        throw std::runtime_error("Failed to read pixels from renderer");
    }

    uint8_t* data = frame_buffer_.data();
    if (config_.crop.enabled)
    {
        crop_rgba(frame_buffer_.data(),
                  config_.width,
                  config_.height,
                  resolve_crop(config_.crop, config_.width, config_.height),
                  crop_buffer_);
        data = crop_buffer_.data();
    }

    const double t     = global_time_sec.value_or(segment_time_sec);
    const double total = config_.timeline_duration.value_or(config_.duration);
    const size_t px    = static_cast<size_t>(out_width_) * out_height_;
    apply_fade(data, px, fade_factor(t, total, config_.fade));

    const size_t frame_bytes = px * 4;
    size_t       written     = std::fwrite(data, 1, frame_bytes, pipe_);
    if (written != frame_bytes)
    {
        throw std::runtime_error("Failed to write frame to ffmpeg pipe");
    }
    ++frames_written_;
}

std::optional<Blob> FfmpegRecorder::finalize()
{
    if (state_ != State::Recording)
    {
        throw std::runtime_error("Recorder not initialized");
    }
    state_ = State::Finalized;

    int status = pipe_ ? pclose(pipe_) : -1;
    pipe_      = nullptr;
    if (status != 0)
    {
        throw std::runtime_error("ffmpeg exited with non-zero status");
    }

    NDCAPTURE_LOG_DEBUG("recorder", "Encoded {} frames to {}", frames_written_, output_path_.string());

    if (!owns_output_)
    {
        return std::nullopt;
    }

    std::ifstream in(output_path_, std::ios::binary);
    if (!in)
    {
        throw std::runtime_error("Failed to read encoded output: " + output_path_.string());
    }
    Blob blob;
    blob.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    blob.mime_type = mime_type(config_.format);
    in.close();
    remove_temp_output();
    return blob;
}

void FfmpegRecorder::dispose()
{
    if (state_ == State::Disposed)
    {
        return;
    }
    close_pipe();
    remove_temp_output();
    frame_buffer_.clear();
    crop_buffer_.clear();
    state_ = State::Disposed;
}

void FfmpegRecorder::close_pipe()
{
    if (pipe_)
    {
        int status = pclose(pipe_);
        pipe_      = nullptr;
        if (status != 0)
        {
            NDCAPTURE_LOG_DEBUG("recorder", "ffmpeg closed with status {}", status);
        }
    }
}

void FfmpegRecorder::remove_temp_output()
{
    if (owns_output_ && !output_path_.empty())
    {
        std::error_code ec;
        fs::remove(output_path_, ec);
        owns_output_ = false;
    }
}

RecorderFactory make_ffmpeg_recorder_factory(Renderer& renderer)
{
    return [&renderer](const RecorderConfig& config)
    { return std::make_unique<FfmpegRecorder>(renderer, config); };
}

}   // namespace ndcapture
