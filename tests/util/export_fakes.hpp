#pragma once

// In-process stand-ins for the scheduler's collaborators.
//
// Usage:
//   auto log = std::make_shared<ndcapture::test::RecorderLog>();
//   ndcapture::test::ManualTimeSource clock;
//   ndcapture::test::FakeRenderer renderer(&clock, 1.0);
//   ExportScheduler sched(renderer, scene, queue,
//                         ndcapture::test::fake_recorder_factory(log), sink, clock);

#include <cstdint>
#include <functional>
#include <memory>
#include <ndcapture/artifact_sink.hpp>
#include <ndcapture/recorder.hpp>
#include <ndcapture/renderer.hpp>
#include <ndcapture/time_source.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ndcapture::test
{

// Clock that only moves when told to.
class ManualTimeSource final : public TimeSource
{
   public:
    double  now_ms() const override { return now_; }
    int64_t epoch_ms() const override { return epoch_; }

    void advance(double ms) { now_ += ms; }
    void set_epoch(int64_t ms) { epoch_ = ms; }

   private:
    double  now_   = 1000.0;
    int64_t epoch_ = 1700000000000;
};

// Renderer that records every call. Each advance() costs `ms_per_frame` on
// the attached clock.
class FakeRenderer final : public Renderer
{
   public:
    explicit FakeRenderer(ManualTimeSource* clock = nullptr, double ms_per_frame = 0.0)
        : clock_(clock), ms_per_frame_(ms_per_frame)
    {
    }

    RenderSurface surface() const override { return surface_; }

    void set_surface(const RenderSurface& s) override
    {
        ++set_surface_calls;
        if (fail_resize && s.width != initial_surface.width)
            throw std::runtime_error("Surface allocation failed");
        surface_ = s;
    }

    QualityFlags quality() const override { return quality_; }

    void set_quality(const QualityFlags& q) override
    {
        ++set_quality_calls;
        quality_ = q;
        quality_history.push_back(q);
    }

    void advance(double timestamp_ms) override
    {
        timestamps.push_back(timestamp_ms);
        if (clock_)
            clock_->advance(ms_per_frame_);
        if (on_advance)
            on_advance(timestamp_ms);
    }

    bool read_pixels(uint8_t* rgba, uint32_t width, uint32_t height) override
    {
        if (width != surface_.width || height != surface_.height)
            return false;
        const size_t  n     = static_cast<size_t>(width) * height * 4;
        const uint8_t value = static_cast<uint8_t>(timestamps.size() & 0xFF);
        for (size_t i = 0; i < n; ++i)
            rgba[i] = value;
        return true;
    }

    // True if the export changed anything on the renderer
    bool touched() const
    {
        return set_surface_calls > 0 || set_quality_calls > 0 || !timestamps.empty();
    }

    const RenderSurface initial_surface{640, 480, 2.0f};
    const QualityFlags  initial_quality{0.5f, true, RefinementStage::Low, true};

    std::vector<double>         timestamps;
    std::vector<QualityFlags>   quality_history;
    int                         set_surface_calls = 0;
    int                         set_quality_calls = 0;
    bool                        fail_resize       = false;
    std::function<void(double)> on_advance;

   private:
    ManualTimeSource* clock_;
    double            ms_per_frame_;
    RenderSurface     surface_ = initial_surface;
    QualityFlags      quality_ = initial_quality;
};

struct CaptureRecord
{
    size_t                instance;
    double                segment_time;
    double                frame_duration;
    std::optional<double> global_time;
};

// Shared journal and script for every FakeRecorder a factory creates.
struct RecorderLog
{
    std::vector<RecorderConfig> configs;           // One per instance
    std::vector<int>            initialize_calls;  // Per instance
    std::vector<int>            finalize_calls;
    std::vector<int>            dispose_calls;
    std::vector<size_t>         frames;            // Captured per instance
    std::vector<CaptureRecord>  captures;
    int                         order_violations = 0;

    // Script
    bool                        fail_initialize = false;
    std::optional<size_t>       fail_capture_at;    // Global capture index
    bool                        fail_finalize   = false;
    std::function<void(size_t)> on_capture;         // Called with the capture count

    size_t instances() const { return configs.size(); }

    bool all_disposed_once() const
    {
        for (int d : dispose_calls)
            if (d != 1)
                return false;
        return true;
    }
};

class FakeRecorder final : public Recorder
{
   public:
    FakeRecorder(std::shared_ptr<RecorderLog> log, const RecorderConfig& config)
        : log_(std::move(log)), id_(log_->configs.size()), config_(config)
    {
        log_->configs.push_back(config);
        log_->initialize_calls.push_back(0);
        log_->finalize_calls.push_back(0);
        log_->dispose_calls.push_back(0);
        log_->frames.push_back(0);
    }

    void initialize() override
    {
        ++log_->initialize_calls[id_];
        if (log_->dispose_calls[id_] > 0)
            ++log_->order_violations;
        if (log_->fail_initialize)
            throw std::runtime_error("Encoder unavailable");
        initialized_ = true;
    }

    void capture_frame(double segment_time, double frame_duration, std::optional<double> global_time) override
    {
        if (!initialized_ || finalized_ || log_->dispose_calls[id_] > 0)
            ++log_->order_violations;
        log_->captures.push_back({id_, segment_time, frame_duration, global_time});
        ++log_->frames[id_];
        const size_t index = log_->captures.size() - 1;
        if (log_->fail_capture_at && *log_->fail_capture_at == index)
            throw std::runtime_error("Encoder rejected frame");
        if (log_->on_capture)
            log_->on_capture(log_->captures.size());
    }

    std::optional<Blob> finalize() override
    {
        ++log_->finalize_calls[id_];
        if (!initialized_ || finalized_ || log_->dispose_calls[id_] > 0)
            ++log_->order_violations;
        finalized_ = true;
        if (log_->fail_finalize)
            throw std::runtime_error("Muxer failed");
        if (config_.destination)
            return std::nullopt;

        // One byte per frame so callers can count frames per artifact
        Blob blob;
        blob.bytes.assign(log_->frames[id_], static_cast<uint8_t>(id_ & 0xFF));
        blob.mime_type = mime_type(config_.format);
        return blob;
    }

    void dispose() override { ++log_->dispose_calls[id_]; }

   private:
    std::shared_ptr<RecorderLog> log_;
    size_t                       id_;
    RecorderConfig               config_;
    bool                         initialized_ = false;
    bool                         finalized_   = false;
};

inline RecorderFactory fake_recorder_factory(std::shared_ptr<RecorderLog> log)
{
    return [log](const RecorderConfig& config) -> std::unique_ptr<Recorder>
    { return std::make_unique<FakeRecorder>(log, config); };
}

// Artifact sink that keeps everything in memory.
class CollectingSink final : public ArtifactSink
{
   public:
    void deliver_segment(const Blob& blob, const std::string& filename) override
    {
        if (fail)
            throw std::runtime_error("Download blocked");
        delivered.emplace_back(filename, blob);
    }

    std::vector<std::pair<std::string, Blob>> delivered;
    bool                                      fail = false;
};

}   // namespace ndcapture::test
