#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <ndcapture/recorder.hpp>
#include <ndcapture/renderer.hpp>
#include <string>
#include <vector>

namespace ndcapture
{

// Recorder that pipes raw RGBA frames into an ffmpeg child process.
//
// Frames are read back from the renderer, cropped and faded here; the text
// overlay is drawn by ffmpeg. Output goes to config.destination when set,
// otherwise to a temporary file that finalize() returns as a Blob.
//
// Requires NDCAPTURE_USE_FFMPEG; without it initialize() throws.
class FfmpegRecorder final : public Recorder
{
   public:
    FfmpegRecorder(Renderer& renderer, RecorderConfig config);
    ~FfmpegRecorder() override;

    FfmpegRecorder(const FfmpegRecorder&)            = delete;
    FfmpegRecorder& operator=(const FfmpegRecorder&) = delete;

    void                initialize() override;
    void                capture_frame(double                segment_time_sec,
                                      double                frame_duration_sec,
                                      std::optional<double> global_time_sec) override;
    std::optional<Blob> finalize() override;
    void                dispose() override;

    uint32_t                     output_width() const { return out_width_; }
    uint32_t                     output_height() const { return out_height_; }
    uint64_t                     frames_written() const { return frames_written_; }
    const std::filesystem::path& output_path() const { return output_path_; }

    // Full shell command for one encode. Input is raw RGBA of
    // out_width x out_height read from stdin.
    static std::string build_command(const RecorderConfig&        config,
                                     uint32_t                     out_width,
                                     uint32_t                     out_height,
                                     const std::filesystem::path& output);

    static const char* encoder_name(VideoCodec codec);

   private:
    enum class State
    {
        Created,
        Recording,
        Finalized,
        Disposed,
    };

    Renderer&             renderer_;
    RecorderConfig        config_;
    State                 state_ = State::Created;
    FILE*                 pipe_  = nullptr;
    std::filesystem::path output_path_;
    bool                  owns_output_ = false;   // Temporary file, removed on dispose

    uint32_t             out_width_      = 0;
    uint32_t             out_height_     = 0;
    uint64_t             frames_written_ = 0;
    std::vector<uint8_t> frame_buffer_;
    std::vector<uint8_t> crop_buffer_;

    void close_pipe();
    void remove_temp_output();
};

RecorderFactory make_ffmpeg_recorder_factory(Renderer& renderer);

}   // namespace ndcapture
