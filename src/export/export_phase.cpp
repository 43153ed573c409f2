#include "export_phase.hpp"

namespace ndcapture
{

namespace
{

// Phases from which a new export may start.
bool is_restartable(const ExportPhase& p)
{
    return std::holds_alternative<phase::Idle>(p) || std::holds_alternative<phase::Completed>(p)
           || std::holds_alternative<phase::Error>(p);
}

bool is_active(const ExportPhase& p)
{
    return std::holds_alternative<phase::Warmup>(p) || std::holds_alternative<phase::Preview>(p)
           || std::holds_alternative<phase::Recording>(p);
}

}   // anonymous namespace

std::optional<Transition> transition(const ExportPhase& current, const PhaseEvent& event, ExportMode mode)
{
    switch (event.type)
    {
        case PhaseEventType::Start:
            if (is_restartable(current))
                return Transition{phase::Warmup{}, PhaseAction::BeginWarmup};
            return std::nullopt;

        case PhaseEventType::WarmupDone:
            if (!std::holds_alternative<phase::Warmup>(current))
                return std::nullopt;
            if (mode == ExportMode::Stream)
                return Transition{phase::Preview{}, PhaseAction::SnapshotAndOpenPreview};
            return Transition{phase::Recording{}, PhaseAction::BeginRecording};

        case PhaseEventType::PreviewDone:
            if (!std::holds_alternative<phase::Preview>(current))
                return std::nullopt;
            return Transition{phase::Recording{}, PhaseAction::FinalizePreviewAndOpenMain};

        case PhaseEventType::SegmentFull:
            if (mode != ExportMode::Segmented || !std::holds_alternative<phase::Recording>(current))
                return std::nullopt;
            return Transition{phase::Recording{}, PhaseAction::RotateSegment};

        case PhaseEventType::FramesDone:
            if (!std::holds_alternative<phase::Recording>(current))
                return std::nullopt;
            return Transition{phase::Finishing{FinishReason::Completed, {}}, PhaseAction::FinalizeOutput};

        case PhaseEventType::Abort:
            if (!is_active(current))
                return std::nullopt;
            return Transition{phase::Finishing{FinishReason::Aborted, {}}, PhaseAction::DiscardOutput};

        case PhaseEventType::Failure:
            if (is_active(current))
                return Transition{phase::Finishing{FinishReason::Failed, event.message},
                                  PhaseAction::ReportFailure};
            // A failure while finalizing a completed run
            if (const auto* f = std::get_if<phase::Finishing>(&current);
                f && f->reason != FinishReason::Failed)
                return Transition{phase::Finishing{FinishReason::Failed, event.message},
                                  PhaseAction::ReportFailure};
            return std::nullopt;

        case PhaseEventType::Finished:
        {
            const auto* f = std::get_if<phase::Finishing>(&current);
            if (!f)
                return std::nullopt;
            switch (f->reason)
            {
                case FinishReason::Completed:
                    return Transition{phase::Completed{}, PhaseAction::Publish};
                case FinishReason::Aborted:
                    return Transition{phase::Idle{}, PhaseAction::Publish};
                case FinishReason::Failed:
                    return Transition{phase::Error{f->error}, PhaseAction::Publish};
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool is_running(const ExportPhase& p)
{
    return is_active(p) || std::holds_alternative<phase::Finishing>(p);
}

bool is_capturing(const ExportPhase& p)
{
    return std::holds_alternative<phase::Preview>(p) || std::holds_alternative<phase::Recording>(p);
}

ExportStatus status_for(const ExportPhase& p)
{
    struct Visitor
    {
        ExportStatus operator()(const phase::Idle&) const { return ExportStatus::Idle; }
        ExportStatus operator()(const phase::Warmup&) const { return ExportStatus::Rendering; }
        ExportStatus operator()(const phase::Preview&) const { return ExportStatus::Previewing; }
        ExportStatus operator()(const phase::Recording&) const { return ExportStatus::Rendering; }
        ExportStatus operator()(const phase::Finishing&) const { return ExportStatus::Encoding; }
        ExportStatus operator()(const phase::Completed&) const { return ExportStatus::Completed; }
        ExportStatus operator()(const phase::Error&) const { return ExportStatus::Error; }
    };
    return std::visit(Visitor{}, p);
}

const char* to_string(ExportStatus status)
{
    switch (status)
    {
        case ExportStatus::Idle:
            return "idle";
        case ExportStatus::Rendering:
            return "rendering";
        case ExportStatus::Previewing:
            return "previewing";
        case ExportStatus::Encoding:
            return "encoding";
        case ExportStatus::Completed:
            return "completed";
        case ExportStatus::Error:
            return "error";
    }
    return "idle";
}

const char* phase_name(const ExportPhase& p)
{
    static constexpr const char* NAMES[] = {
        "idle", "warmup", "preview", "recording", "finishing", "completed", "error"};
    return NAMES[p.index()];
}

const char* to_string(PhaseEventType type)
{
    switch (type)
    {
        case PhaseEventType::Start:
            return "start";
        case PhaseEventType::WarmupDone:
            return "warmup-done";
        case PhaseEventType::PreviewDone:
            return "preview-done";
        case PhaseEventType::SegmentFull:
            return "segment-full";
        case PhaseEventType::FramesDone:
            return "frames-done";
        case PhaseEventType::Abort:
            return "abort";
        case PhaseEventType::Failure:
            return "failure";
        case PhaseEventType::Finished:
            return "finished";
    }
    return "unknown";
}

const char* to_string(PhaseAction action)
{
    switch (action)
    {
        case PhaseAction::None:
            return "none";
        case PhaseAction::BeginWarmup:
            return "begin-warmup";
        case PhaseAction::SnapshotAndOpenPreview:
            return "snapshot-and-open-preview";
        case PhaseAction::BeginRecording:
            return "begin-recording";
        case PhaseAction::FinalizePreviewAndOpenMain:
            return "finalize-preview-and-open-main";
        case PhaseAction::RotateSegment:
            return "rotate-segment";
        case PhaseAction::FinalizeOutput:
            return "finalize-output";
        case PhaseAction::DiscardOutput:
            return "discard-output";
        case PhaseAction::ReportFailure:
            return "report-failure";
        case PhaseAction::Publish:
            return "publish";
    }
    return "unknown";
}

}   // namespace ndcapture
