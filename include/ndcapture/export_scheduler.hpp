#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <ndcapture/artifact_sink.hpp>
#include <ndcapture/export_settings.hpp>
#include <ndcapture/export_status.hpp>
#include <ndcapture/recorder.hpp>
#include <ndcapture/renderer.hpp>
#include <ndcapture/scene_state.hpp>
#include <ndcapture/task_queue.hpp>
#include <ndcapture/time_source.hpp>
#include <optional>
#include <string>

namespace ndcapture
{

// ExportScheduler — turns the interactive render loop into a deterministic
// video export.
//
// The scheduler drives the renderer one synthetic frame at a time, feeds each
// frame to a recorder and yields to the host after at most
// MAX_BLOCKING_TIME_MS (plus one frame) by posting its next batch to the
// TaskExecutor. All collaborators are borrowed and must outlive the
// scheduler.
//
// Usage:
//   ExportScheduler sched(renderer, scene, queue, factory, sink);
//   sched.set_on_status([](const ExportProgress& p) { ... });
//   sched.start(settings, ExportMode::InMemory);
//   while (sched.busy()) queue.run_one();
//
// Not thread-safe, except abort() which may be called from any thread.
class ExportScheduler
{
   public:
    static constexpr double MAX_BLOCKING_TIME_MS    = 30.0;
    static constexpr double PREVIEW_DURATION_SEC    = 3.0;
    static constexpr double ETA_PUBLISH_INTERVAL_MS = 500.0;

    using StatusCallback  = std::function<void(const ExportProgress&)>;
    using PreviewCallback = std::function<void(const Blob&)>;

    ExportScheduler(Renderer&       renderer,
                    SceneState&     scene,
                    TaskExecutor&   executor,
                    RecorderFactory recorder_factory,
                    ArtifactSink&   sink,
                    TimeSource&     time = SteadyTimeSource::instance());
    ~ExportScheduler();

    ExportScheduler(const ExportScheduler&)            = delete;
    ExportScheduler& operator=(const ExportScheduler&) = delete;

    // Stream mode asks this for the output path before anything else happens.
    void set_destination_picker(DestinationPicker picker);

    // Artifact names are "<prefix>-<timestamp>[-part<N>].<ext>". Default "ndcapture".
    void               set_file_prefix(std::string prefix);
    const std::string& file_prefix() const;

    // Size cap for segmented mode. Default SegmentPlanner::DEFAULT_TARGET_BYTES.
    void     set_segment_target_bytes(uint64_t bytes);
    uint64_t segment_target_bytes() const;

    void set_on_status(StatusCallback cb);
    void set_on_preview(PreviewCallback cb);

    // Begin an export. Returns false if one is already running, the settings
    // are invalid, the user cancelled the destination picker, or setup failed;
    // status() tells which.
    bool start(const ExportSettings& settings, ExportMode mode);

    // Request cancellation. Takes effect at the next tick.
    void abort();

    // Run one time-budgeted batch. Normally invoked through the executor.
    void process_batch();

    bool           busy() const;
    ExportStatus   status() const;
    ExportProgress progress() const;
    std::string    phase_name() const;

    uint32_t total_frames() const;
    uint32_t frames_recorded() const;

    // In-memory mode result, available once status() is Completed.
    const std::optional<Blob>& result() const;

    // Stream mode preview clip.
    const std::optional<Blob>& preview() const;

    // Consume the in-memory result.
    std::optional<Blob> take_result();

   private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}   // namespace ndcapture
