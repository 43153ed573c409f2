#include "recorder_lifecycle.hpp"

#include <exception>
#include <ndcapture/logger.hpp>
#include <stdexcept>

namespace ndcapture
{

RecorderLifecycle::RecorderLifecycle(RecorderFactory factory) : factory_(std::move(factory)) {}

RecorderLifecycle::~RecorderLifecycle()
{
    dispose();
}

void RecorderLifecycle::open(const RecorderConfig& config)
{
    if (recorder_)
    {
        throw std::logic_error("Recorder already active");
    }
    if (!factory_)
    {
        throw std::logic_error("No recorder factory configured");
    }

    std::unique_ptr<Recorder> rec = factory_(config);
    if (!rec)
    {
        throw std::runtime_error("Recorder factory returned no recorder");
    }
    ++instances_created_;

    try
    {
        rec->initialize();
    }
    catch (const std::exception& e)
    {
        NDCAPTURE_LOG_ERROR("recorder", std::string("Recorder initialize failed: ") + e.what());
        rec->dispose();
        throw;
    }

    recorder_        = std::move(rec);
    config_          = config;
    state_           = State::Initialized;
    frames_captured_ = 0;

    NDCAPTURE_LOG_DEBUG("recorder",
                        "Opened recorder #{} ({}x{} @ {} fps, {}s)",
                        instances_created_,
                        config.width,
                        config.height,
                        config.fps,
                        config.duration);
}

void RecorderLifecycle::capture(double                segment_time_sec,
                                double                frame_duration_sec,
                                std::optional<double> global_time_sec)
{
    if (!recorder_ || state_ != State::Initialized)
    {
        throw std::logic_error("Recorder not initialized or not recording");
    }
    recorder_->capture_frame(segment_time_sec, frame_duration_sec, global_time_sec);
    ++frames_captured_;
}

std::optional<Blob> RecorderLifecycle::finalize()
{
    if (!recorder_ || state_ != State::Initialized)
    {
        throw std::logic_error("Recorder not initialized");
    }
    state_ = State::Finalized;
    auto blob = recorder_->finalize();
    NDCAPTURE_LOG_DEBUG("recorder",
                        "Finalized recorder #{} after {} frames ({} bytes)",
                        instances_created_,
                        frames_captured_,
                        blob ? blob->size() : size_t{0});
    return blob;
}

void RecorderLifecycle::dispose() noexcept
{
    if (!recorder_)
    {
        return;
    }
    std::unique_ptr<Recorder> rec = std::move(recorder_);
    state_ = State::Empty;
    try
    {
        rec->dispose();
    }
    catch (const std::exception& e)
    {
        // Disposal runs on exit paths that are already reporting a result
        NDCAPTURE_LOG_WARN("recorder", std::string("Recorder dispose failed: ") + e.what());
    }
}

}   // namespace ndcapture
