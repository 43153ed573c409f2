#pragma once

#include <cstdint>
#include <filesystem>
#include <ndcapture/export_settings.hpp>
#include <optional>
#include <string>

namespace ndcapture
{

// Status published to the host UI.
enum class ExportStatus
{
    Idle,
    Rendering,
    Previewing,
    Encoding,
    Completed,
    Error,
};

const char* to_string(ExportStatus status);

// What a finished export produced.
struct CompletionDetails
{
    ExportMode                           mode          = ExportMode::InMemory;
    uint32_t                             segment_count = 0;   // Segmented mode only
    std::optional<std::filesystem::path> destination;         // Stream mode only
};

// Snapshot handed to status observers.
struct ExportProgress
{
    ExportStatus                     status   = ExportStatus::Idle;
    float                            progress = 0.0f;   // [0, 1]
    std::string                      eta;               // e.g. "12s", empty if unknown
    std::string                      error;
    std::optional<CompletionDetails> completion;
};

}   // namespace ndcapture
