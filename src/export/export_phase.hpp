#pragma once

#include <ndcapture/export_settings.hpp>
#include <ndcapture/export_status.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace ndcapture
{

// ─── Phases ──────────────────────────────────────────────────────────────────

enum class FinishReason
{
    Completed,
    Aborted,
    Failed,
};

namespace phase
{
struct Idle
{
    bool operator==(const Idle&) const = default;
};
struct Warmup
{
    bool operator==(const Warmup&) const = default;
};
struct Preview
{
    bool operator==(const Preview&) const = default;
};
struct Recording
{
    bool operator==(const Recording&) const = default;
};
struct Finishing
{
    FinishReason reason = FinishReason::Completed;
    std::string  error;   // Failed only

    bool operator==(const Finishing&) const = default;
};
struct Completed
{
    bool operator==(const Completed&) const = default;
};
struct Error
{
    std::string message;

    bool operator==(const Error&) const = default;
};
}   // namespace phase

using ExportPhase = std::variant<phase::Idle,
                                 phase::Warmup,
                                 phase::Preview,
                                 phase::Recording,
                                 phase::Finishing,
                                 phase::Completed,
                                 phase::Error>;

// ─── Events ──────────────────────────────────────────────────────────────────

enum class PhaseEventType
{
    Start,
    WarmupDone,
    PreviewDone,
    SegmentFull,
    FramesDone,
    Abort,
    Failure,
    Finished,
};

struct PhaseEvent
{
    PhaseEventType type = PhaseEventType::Start;
    std::string    message;   // Failure only

    static PhaseEvent failure(std::string msg) { return {PhaseEventType::Failure, std::move(msg)}; }
};

// Side effect the scheduler performs when a transition fires.
enum class PhaseAction
{
    None,
    BeginWarmup,                  // Reset counters, render warm-up frames
    SnapshotAndOpenPreview,       // Stream: capture rotations, open preview recorder
    BeginRecording,               // Move anchor, record into the recorder opened at start
    FinalizePreviewAndOpenMain,   // Stream: publish preview, restore rotations, open main
    RotateSegment,                // Segmented: deliver part N, open part N+1
    FinalizeOutput,               // Finalize the last recorder and complete the mode
    DiscardOutput,                // Abort: dispose without finalizing
    ReportFailure,                // Record the error message
    Publish,                      // Restoration done, publish the terminal status
};

struct Transition
{
    ExportPhase next;
    PhaseAction action = PhaseAction::None;
};

// Pure transition function. Returns nullopt when `event` is not accepted in
// `current` (e.g. SegmentFull outside segmented mode, Abort while finishing).
std::optional<Transition> transition(const ExportPhase& current, const PhaseEvent& event, ExportMode mode);

// ─── Queries ─────────────────────────────────────────────────────────────────

// True between Start and the terminal phase (Finishing included).
bool is_running(const ExportPhase& phase);

// Whether this phase captures frames into a recorder.
bool is_capturing(const ExportPhase& phase);

ExportStatus status_for(const ExportPhase& phase);

const char* phase_name(const ExportPhase& phase);
const char* to_string(PhaseEventType type);
const char* to_string(PhaseAction action);

}   // namespace ndcapture
