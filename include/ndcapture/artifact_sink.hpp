#pragma once

#include <filesystem>
#include <functional>
#include <ndcapture/recorder.hpp>
#include <optional>
#include <string>

namespace ndcapture
{

// Receives finished segments of a segmented export.
class ArtifactSink
{
   public:
    virtual ~ArtifactSink() = default;

    // Throws std::runtime_error if the artifact cannot be stored.
    virtual void deliver_segment(const Blob& blob, const std::string& filename) = 0;
};

// Writes each delivered artifact as a file inside one directory.
class DirectoryArtifactSink final : public ArtifactSink
{
   public:
    explicit DirectoryArtifactSink(std::filesystem::path directory);

    void deliver_segment(const Blob& blob, const std::string& filename) override;

    // Write an arbitrary blob (e.g. an in-memory result) next to the segments.
    std::filesystem::path save(const Blob& blob, const std::string& filename) const;

    const std::filesystem::path& directory() const { return directory_; }

   private:
    std::filesystem::path directory_;
};

// Interactive "choose save location" step of stream mode.
// Returns nullopt when the user dismisses it.
using DestinationPicker =
    std::function<std::optional<std::filesystem::path>(const std::string& suggested_name)>;

}   // namespace ndcapture
