#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <ndcapture/export_settings.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ndcapture
{

// Encoded container bytes held in memory.
struct Blob
{
    std::vector<uint8_t> bytes;
    std::string          mime_type;

    size_t size() const { return bytes.size(); }
    bool   empty() const { return bytes.empty(); }
};

// Configuration for one recorder instance (one phase or one segment).
struct RecorderConfig
{
    uint32_t     width   = 1920;   // Source surface width, even
    uint32_t     height  = 1080;   // Source surface height, even
    double       fps     = 60.0;
    double       bitrate = 12.0;   // Mbit/s
    ExportFormat format  = ExportFormat::MP4;
    VideoCodec   codec   = VideoCodec::AVC;

    CropRegion   crop;
    TextOverlay  text_overlay;
    FadeSettings fade;

    // Span covered by this recorder (a segment or the whole export).
    double duration = 0.0;

    // Length of the full export timeline; fades are keyed to it.
    std::optional<double> timeline_duration;

    // Stream mode: write directly here instead of producing a blob.
    std::optional<std::filesystem::path> destination;
};

// Recorder — encoder/muxer for one contiguous run of frames.
//
// Call order: initialize() → capture_frame()* → finalize() → dispose().
// Failures are reported by throwing std::runtime_error. dispose() must be
// safe to call at any point and more than once.
class Recorder
{
   public:
    virtual ~Recorder() = default;

    virtual void initialize() = 0;

    // `segment_time_sec` is relative to this recorder's first frame.
    // `global_time_sec` is the position on the un-segmented export timeline;
    // absent when the two coincide.
    virtual void capture_frame(double                segment_time_sec,
                               double                frame_duration_sec,
                               std::optional<double> global_time_sec) = 0;

    // Returns the encoded bytes, or nullopt when output went to a destination.
    virtual std::optional<Blob> finalize() = 0;

    virtual void dispose() = 0;
};

using RecorderFactory = std::function<std::unique_ptr<Recorder>(const RecorderConfig&)>;

}   // namespace ndcapture
