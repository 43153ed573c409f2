#pragma once

#include <cstdint>
#include <memory>
#include <ndcapture/recorder.hpp>
#include <optional>

namespace ndcapture
{

// Owns at most one recorder at a time and enforces its call order:
// open (construct + initialize) → capture* → finalize → dispose.
//
// dispose() is applied exactly once to every recorder this object created,
// whichever path the export leaves by.
class RecorderLifecycle
{
   public:
    enum class State
    {
        Empty,         // No recorder
        Initialized,   // Accepting frames
        Finalized,     // Output produced, awaiting dispose
    };

    explicit RecorderLifecycle(RecorderFactory factory);
    ~RecorderLifecycle();

    RecorderLifecycle(const RecorderLifecycle&)            = delete;
    RecorderLifecycle& operator=(const RecorderLifecycle&) = delete;

    // Construct and initialize a recorder. Throws std::logic_error if one is
    // still held. If initialize() throws, the new recorder is disposed before
    // the exception propagates.
    void open(const RecorderConfig& config);

    // Throws std::logic_error unless a recorder is initialized.
    void capture(double segment_time_sec, double frame_duration_sec, std::optional<double> global_time_sec);

    // Throws std::logic_error unless a recorder is initialized.
    std::optional<Blob> finalize();

    // Dispose and release the held recorder. No-op when empty.
    void dispose() noexcept;

    bool     active() const { return recorder_ != nullptr; }
    State    state() const { return state_; }
    uint64_t instances_created() const { return instances_created_; }
    uint64_t frames_captured() const { return frames_captured_; }

    const RecorderConfig& config() const { return config_; }

   private:
    RecorderFactory           factory_;
    std::unique_ptr<Recorder> recorder_;
    RecorderConfig            config_;
    State                     state_             = State::Empty;
    uint64_t                  instances_created_ = 0;
    uint64_t                  frames_captured_   = 0;   // Current recorder only
};

}   // namespace ndcapture
