#include <algorithm>
#include <atomic>
#include <cmath>
#include <ndcapture/export_scheduler.hpp>
#include <ndcapture/logger.hpp>
#include <stdexcept>

#include "../anim/rotation_snapshot.hpp"
#include "export_phase.hpp"
#include "loop_state.hpp"
#include "recorder_lifecycle.hpp"
#include "segment_planner.hpp"

namespace ndcapture
{

namespace
{

struct SavedRendererState
{
    RenderSurface surface;
    QualityFlags  quality;
};

std::string format_eta(double remaining_ms)
{
    auto secs = static_cast<long long>(std::ceil(std::max(0.0, remaining_ms) / 1000.0));
    return std::to_string(secs) + "s";
}

}   // anonymous namespace

// ─── Impl ────────────────────────────────────────────────────────────────────

struct ExportScheduler::Impl
{
    Impl(Renderer&       r,
         SceneState&     s,
         TaskExecutor&   e,
         RecorderFactory f,
         ArtifactSink&   a,
         TimeSource&     t)
        : renderer(r), scene(s), executor(e), recorder(std::move(f)), sink(a), time(t)
    {
    }

    ~Impl()
    {
        // Scheduler destroyed mid-run: leave the renderer as we found it
        restore_renderer();
        recorder.dispose();
    }

    Renderer&         renderer;
    SceneState&       scene;
    TaskExecutor&     executor;
    RecorderLifecycle recorder;
    ArtifactSink&     sink;
    TimeSource&       time;

    DestinationPicker picker;
    StatusCallback    on_status;
    PreviewCallback   on_preview;
    std::string       file_prefix  = "ndcapture";
    uint64_t          target_bytes = SegmentPlanner::DEFAULT_TARGET_BYTES;

    LoopState                         loop;
    RotationSnapshot                  snapshot;
    std::optional<SavedRendererState> saved;
    ExportProgress                    published;
    std::optional<Blob>               result;
    std::optional<Blob>               preview;

    std::atomic<bool>     abort_requested{false};
    std::shared_ptr<bool> alive = std::make_shared<bool>(true);

    // ── Phase machine ──

    // Apply an event; returns the action to perform, or nullopt if rejected.
    std::optional<PhaseAction> fire(const PhaseEvent& event)
    {
        auto t = transition(loop.phase, event, loop.mode);
        if (!t)
        {
            NDCAPTURE_LOG_WARN("export",
                               "Event '{}' ignored in phase '{}'",
                               to_string(event.type),
                               ndcapture::phase_name(loop.phase));
            return std::nullopt;
        }
        NDCAPTURE_LOG_INFO("export",
                           "{} -> {} ({})",
                           ndcapture::phase_name(loop.phase),
                           ndcapture::phase_name(t->next),
                           to_string(t->action));
        loop.phase = std::move(t->next);
        return t->action;
    }

    // ── Status ──

    void publish()
    {
        published.status = status_for(loop.phase);
        if (const auto* err = std::get_if<phase::Error>(&loop.phase))
            published.error = err->message;
        if (on_status)
            on_status(published);
    }

    void update_progress()
    {
        if (std::holds_alternative<phase::Preview>(loop.phase) && loop.phase_total_frames > 0)
        {
            published.progress =
                static_cast<float>(loop.frame_index) / static_cast<float>(loop.phase_total_frames);
        }
        else if (std::holds_alternative<phase::Recording>(loop.phase) && loop.total_frames > 0)
        {
            published.progress =
                static_cast<float>(loop.frame_index) / static_cast<float>(loop.total_frames);
        }
    }

    void maybe_publish_eta()
    {
        const double now = time.now_ms();
        if (now - loop.last_eta_publish_ms < ETA_PUBLISH_INTERVAL_MS || loop.frame_index == 0)
            return;
        loop.last_eta_publish_ms = now;

        const double elapsed   = now - loop.export_start_ms;
        const double per_frame = elapsed / static_cast<double>(loop.frame_index);
        const double remaining = per_frame * static_cast<double>(loop.total_frames - loop.frame_index);
        published.eta          = format_eta(remaining);
        NDCAPTURE_LOG_TRACE("export", "ETA {}", published.eta);
    }

    // ── Resources ──

    void restore_renderer()
    {
        if (!saved)
            return;
        SavedRendererState s = *saved;
        saved.reset();

        renderer.set_quality(s.quality);
        try
        {
            renderer.set_surface(s.surface);
        }
        catch (const std::exception& e)
        {
            NDCAPTURE_LOG_ERROR("export", std::string("Failed to restore renderer surface: ") + e.what());
        }
        NDCAPTURE_LOG_DEBUG("export",
                            "Restored renderer to {}x{} @ {}",
                            s.surface.width,
                            s.surface.height,
                            s.surface.pixel_ratio);
    }

    RecorderConfig recorder_config(double duration_sec) const
    {
        const ExportSettings& st = loop.settings;
        RecorderConfig        c;
        c.width        = loop.export_size.width;
        c.height       = loop.export_size.height;
        c.fps          = st.fps;
        c.bitrate      = st.bitrate;
        c.format       = st.format;
        c.codec        = st.codec;
        c.crop         = st.crop;
        c.text_overlay = st.text_overlay;
        c.fade         = st.fade;
        c.duration     = duration_sec;
        return c;
    }

    std::string artifact_name(std::optional<uint32_t> part) const
    {
        std::string name = file_prefix + "-" + std::to_string(loop.export_timestamp);
        if (part)
            name += "-part" + std::to_string(*part);
        return name + "." + file_extension(loop.settings.format);
    }

    void open_segment()
    {
        loop.segment_frame_total = SegmentPlanner::frames_for_segment(loop.plan, loop.frame_index);
        loop.segment_first_frame = loop.frame_index;
        loop.segment_start_sec   = static_cast<double>(loop.frame_index) * loop.frame_duration_sec;
        loop.frames_in_segment   = 0;

        RecorderConfig c    = recorder_config(static_cast<double>(loop.segment_frame_total) / loop.settings.fps);
        c.timeline_duration = loop.settings.duration;
        recorder.open(c);
        NDCAPTURE_LOG_INFO("segment",
                           "Segment {}/{} opened ({} frames)",
                           loop.segment_index,
                           loop.plan.segment_count,
                           loop.segment_frame_total);
    }

    void deliver_segment(std::optional<Blob> blob)
    {
        if (!blob)
            throw std::runtime_error("Recorder produced no output for segment "
                                     + std::to_string(loop.segment_index));
        sink.deliver_segment(*blob, artifact_name(loop.segment_index));
    }

    void schedule_next_batch()
    {
        std::weak_ptr<bool> token = alive;
        const uint64_t      gen   = loop.generation;
        executor.post(
            [this, token, gen]()
            {
                if (token.expired() || loop.generation != gen)
                    return;
                run_batch();
            });
    }

    // ── Actions ──

    void perform(PhaseAction action)
    {
        switch (action)
        {
            case PhaseAction::SnapshotAndOpenPreview:
            {
                snapshot = RotationSnapshot::capture(scene.rotations);
                loop.timeline_anchor_ms +=
                    static_cast<double>(loop.settings.warmup_frames) * loop.frame_duration_ms;
                const double preview_sec = std::min(PREVIEW_DURATION_SEC, loop.settings.duration);
                loop.frame_index         = 0;
                loop.phase_total_frames  = total_frame_count(preview_sec, loop.settings.fps);
                recorder.open(recorder_config(preview_sec));
                break;
            }
            case PhaseAction::BeginRecording:
                loop.timeline_anchor_ms +=
                    static_cast<double>(loop.settings.warmup_frames) * loop.frame_duration_ms;
                loop.frame_index        = 0;
                loop.phase_total_frames = loop.total_frames;
                break;

            case PhaseAction::FinalizePreviewAndOpenMain:
            {
                auto clip = recorder.finalize();
                recorder.dispose();
                if (clip)
                {
                    preview = clip;
                    if (on_preview)
                        on_preview(*preview);
                }
                snapshot.restore_into(scene.rotations);

                RecorderConfig c = recorder_config(loop.settings.duration);
                c.destination    = loop.stream_destination;
                recorder.open(c);
                loop.frame_index         = 0;
                loop.phase_total_frames  = loop.total_frames;
                loop.export_start_ms     = time.now_ms();
                loop.last_eta_publish_ms = loop.export_start_ms;
                published.progress       = 0.0f;
                break;
            }
            case PhaseAction::RotateSegment:
                deliver_segment(recorder.finalize());
                recorder.dispose();
                ++loop.segment_index;
                open_segment();
                break;

            case PhaseAction::None:
            case PhaseAction::BeginWarmup:
            case PhaseAction::FinalizeOutput:
            case PhaseAction::DiscardOutput:
            case PhaseAction::ReportFailure:
            case PhaseAction::Publish:
                break;
        }
    }

    // ── Ticks ──

    void render_frame(double timestamp_ms)
    {
        advance_scene(scene, loop.frame_duration_sec);
        renderer.advance(timestamp_ms);
    }

    void tick_warmup()
    {
        if (loop.warmup_frame_index >= loop.settings.warmup_frames)
        {
            if (auto a = fire({PhaseEventType::WarmupDone, {}}))
                perform(*a);
            publish();
            return;
        }
        render_frame(loop.timeline_anchor_ms
                     + static_cast<double>(loop.warmup_frame_index) * loop.frame_duration_ms);
        ++loop.warmup_frame_index;
    }

    void tick_capture()
    {
        const bool in_preview = std::holds_alternative<phase::Preview>(loop.phase);

        if (loop.frame_index >= loop.phase_total_frames)
        {
            auto a = fire({in_preview ? PhaseEventType::PreviewDone : PhaseEventType::FramesDone, {}});
            if (a)
                perform(*a);
            publish();
            return;
        }

        if (!in_preview && loop.mode == ExportMode::Segmented
            && loop.frames_in_segment >= loop.segment_frame_total)
        {
            if (auto a = fire({PhaseEventType::SegmentFull, {}}))
                perform(*a);
        }

        const double timestamp = loop.timeline_anchor_ms + static_cast<double>(loop.frame_index) * loop.frame_duration_ms;
        render_frame(timestamp);

        std::optional<double> global_time;
        double                segment_time = static_cast<double>(loop.frame_index) * loop.frame_duration_sec;
        if (!in_preview && loop.mode == ExportMode::Segmented)
        {
            global_time  = segment_time;
            segment_time = static_cast<double>(loop.frame_index - loop.segment_first_frame)
                           * loop.frame_duration_sec;
        }
        recorder.capture(segment_time, loop.frame_duration_sec, global_time);

        ++loop.frame_index;
        ++loop.frames_in_segment;
        if (!in_preview)
            maybe_publish_eta();
    }

    void run_finishing()
    {
        if (const auto* f = std::get_if<phase::Finishing>(&loop.phase);
            f && f->reason == FinishReason::Completed)
        {
            try
            {
                complete_output();
            }
            catch (const std::exception& e)
            {
                NDCAPTURE_LOG_ERROR("export", std::string("Finalization failed: ") + e.what());
                fire(PhaseEvent::failure(e.what()));
            }
        }

        restore_renderer();
        recorder.dispose();
        snapshot = RotationSnapshot{};

        if (std::holds_alternative<phase::Finishing>(loop.phase)
            && std::get<phase::Finishing>(loop.phase).reason == FinishReason::Completed)
        {
            published.progress = 1.0f;
            published.eta.clear();
        }
        fire({PhaseEventType::Finished, {}});
        publish();
    }

    void complete_output()
    {
        auto blob = recorder.finalize();

        CompletionDetails details;
        details.mode = loop.mode;
        switch (loop.mode)
        {
            case ExportMode::InMemory:
                if (!blob)
                    throw std::runtime_error("Recorder produced no output");
                result = std::move(blob);
                NDCAPTURE_LOG_INFO("export", "Export complete ({} bytes in memory)", result->size());
                break;
            case ExportMode::Stream:
                details.destination = loop.stream_destination;
                NDCAPTURE_LOG_INFO("export",
                                   "Export written to {}",
                                   loop.stream_destination ? loop.stream_destination->string()
                                                           : std::string("(none)"));
                break;
            case ExportMode::Segmented:
                deliver_segment(std::move(blob));
                details.segment_count = loop.segment_index;
                NDCAPTURE_LOG_INFO("export", "Export complete ({} segments)", loop.segment_index);
                break;
        }
        published.completion = details;
    }

    // Route any failure through finishing. Safe to call from every phase.
    void handle_error(const std::string& message)
    {
        NDCAPTURE_LOG_ERROR("export", "Export failed: " + message);
        if (!fire(PhaseEvent::failure(message)))
        {
            // Not running: nothing to unwind beyond the resources themselves
            restore_renderer();
            recorder.dispose();
            loop.phase = phase::Error{message};
            publish();
            return;
        }
        run_finishing();
    }

    void step()
    {
        if (abort_requested.exchange(false))
        {
            if (fire({PhaseEventType::Abort, {}}))
            {
                NDCAPTURE_LOG_INFO("export", "Export aborted at frame {}", loop.frame_index);
                publish();
            }
        }

        if (std::holds_alternative<phase::Warmup>(loop.phase))
            tick_warmup();
        else if (is_capturing(loop.phase))
            tick_capture();
        else if (std::holds_alternative<phase::Finishing>(loop.phase))
            run_finishing();
    }

    void run_batch()
    {
        if (!is_running(loop.phase))
            return;

        const double batch_start = time.now_ms();
        size_t       ticks       = 0;
        try
        {
            while (is_running(loop.phase) && time.now_ms() - batch_start <= MAX_BLOCKING_TIME_MS)
            {
                step();
                ++ticks;
            }
            NDCAPTURE_LOG_TRACE("export",
                                "Batch: {} ticks in {}ms, frame {}/{}",
                                ticks,
                                time.now_ms() - batch_start,
                                loop.frame_index,
                                loop.phase_total_frames);

            if (is_running(loop.phase))
            {
                update_progress();
                publish();
                schedule_next_batch();
            }
        }
        catch (const std::exception& e)
        {
            handle_error(e.what());
        }
    }

    bool begin(const ExportSettings& settings, ExportMode mode)
    {
        if (is_running(loop.phase))
        {
            NDCAPTURE_LOG_WARN("export", "Export already in progress, start ignored");
            return false;
        }

        std::string error;
        if (!validate_settings(settings, error))
        {
            NDCAPTURE_LOG_ERROR("export", "Invalid export settings: " + error);
            published            = ExportProgress{};
            loop.phase           = phase::Error{error};
            publish();
            return false;
        }

        const int64_t stamp = time.epoch_ms();
        std::optional<std::filesystem::path> destination;
        if (mode == ExportMode::Stream)
        {
            if (!picker)
            {
                published  = ExportProgress{};
                loop.phase = phase::Error{"Stream export requires a destination picker"};
                NDCAPTURE_LOG_ERROR("export", "Stream export requires a destination picker");
                publish();
                return false;
            }
            loop.export_timestamp = stamp;
            loop.settings         = settings;
            destination           = picker(artifact_name(std::nullopt));
            if (!destination)
            {
                NDCAPTURE_LOG_INFO("export", "Destination picker cancelled");
                published  = ExportProgress{};
                loop.phase = phase::Idle{};
                publish();
                return false;
            }
        }

        // Fresh run
        const uint64_t gen = loop.generation + 1;
        loop               = LoopState{};
        loop.generation    = gen;
        loop.mode          = mode;
        loop.settings      = settings;
        loop.export_size   = resolve_resolution(settings);
        loop.total_frames  = total_frame_count(settings.duration, settings.fps);
        loop.frame_duration_sec = 1.0 / settings.fps;
        loop.frame_duration_ms  = 1000.0 / settings.fps;
        loop.export_timestamp   = stamp;
        loop.stream_destination = std::move(destination);

        published = ExportProgress{};
        result.reset();
        preview.reset();
        snapshot = RotationSnapshot{};
        abort_requested.store(false);

        auto a = fire({PhaseEventType::Start, {}});
        if (!a)
            return false;

        NDCAPTURE_LOG_INFO("export",
                           "Starting {} export: {}x{} @ {} fps, {}s ({} frames)",
                           to_string(mode),
                           loop.export_size.width,
                           loop.export_size.height,
                           settings.fps,
                           settings.duration,
                           loop.total_frames);

        saved = SavedRendererState{renderer.surface(), renderer.quality()};
        try
        {
            QualityFlags q          = saved->quality;
            q.low_quality_animation = false;
            q.refinement_stage      = RefinementStage::Final;
            if (settings.disable_temporal_reprojection)
                q.temporal_reprojection = false;
            renderer.set_quality(q);

            renderer.set_surface({loop.export_size.width, loop.export_size.height, 1.0f});

            switch (mode)
            {
                case ExportMode::InMemory:
                {
                    RecorderConfig c    = recorder_config(settings.duration);
                    c.timeline_duration = settings.duration;
                    recorder.open(c);
                    break;
                }
                case ExportMode::Segmented:
                    loop.plan = SegmentPlanner::plan(target_bytes, settings.bitrate, settings.duration, settings.fps);
                    loop.segment_index = 1;
                    open_segment();
                    break;
                case ExportMode::Stream:
                    break;   // Preview recorder opens after warm-up
            }

            const double now         = time.now_ms();
            loop.timeline_anchor_ms  = now;
            loop.export_start_ms     = now;
            loop.last_eta_publish_ms = now;

            publish();
            schedule_next_batch();
        }
        catch (const std::exception& e)
        {
            handle_error(e.what());
            return false;
        }
        return true;
    }
};

// ─── ExportScheduler ─────────────────────────────────────────────────────────

ExportScheduler::ExportScheduler(Renderer&       renderer,
                                 SceneState&     scene,
                                 TaskExecutor&   executor,
                                 RecorderFactory recorder_factory,
                                 ArtifactSink&   sink,
                                 TimeSource&     time)
    : impl_(std::make_unique<Impl>(renderer, scene, executor, std::move(recorder_factory), sink, time))
{
}

ExportScheduler::~ExportScheduler() = default;

void ExportScheduler::set_destination_picker(DestinationPicker picker)
{
    impl_->picker = std::move(picker);
}

void ExportScheduler::set_file_prefix(std::string prefix)
{
    impl_->file_prefix = std::move(prefix);
}

const std::string& ExportScheduler::file_prefix() const
{
    return impl_->file_prefix;
}

void ExportScheduler::set_segment_target_bytes(uint64_t bytes)
{
    if (bytes > 0)
        impl_->target_bytes = bytes;
}

uint64_t ExportScheduler::segment_target_bytes() const
{
    return impl_->target_bytes;
}

void ExportScheduler::set_on_status(StatusCallback cb)
{
    impl_->on_status = std::move(cb);
}

void ExportScheduler::set_on_preview(PreviewCallback cb)
{
    impl_->on_preview = std::move(cb);
}

bool ExportScheduler::start(const ExportSettings& settings, ExportMode mode)
{
    return impl_->begin(settings, mode);
}

void ExportScheduler::abort()
{
    impl_->abort_requested.store(true);
}

void ExportScheduler::process_batch()
{
    impl_->run_batch();
}

bool ExportScheduler::busy() const
{
    return is_running(impl_->loop.phase);
}

ExportStatus ExportScheduler::status() const
{
    return status_for(impl_->loop.phase);
}

ExportProgress ExportScheduler::progress() const
{
    return impl_->published;
}

std::string ExportScheduler::phase_name() const
{
    return ndcapture::phase_name(impl_->loop.phase);
}

uint32_t ExportScheduler::total_frames() const
{
    return impl_->loop.total_frames;
}

uint32_t ExportScheduler::frames_recorded() const
{
    if (std::holds_alternative<phase::Preview>(impl_->loop.phase))
        return 0;
    return impl_->loop.frame_index;
}

const std::optional<Blob>& ExportScheduler::result() const
{
    return impl_->result;
}

const std::optional<Blob>& ExportScheduler::preview() const
{
    return impl_->preview;
}

std::optional<Blob> ExportScheduler::take_result()
{
    std::optional<Blob> out = std::move(impl_->result);
    impl_->result.reset();
    return out;
}

}   // namespace ndcapture
