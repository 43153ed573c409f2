#include <fstream>
#include <ndcapture/artifact_sink.hpp>
#include <ndcapture/logger.hpp>
#include <stdexcept>

namespace ndcapture
{

DirectoryArtifactSink::DirectoryArtifactSink(std::filesystem::path directory)
    : directory_(std::move(directory))
{
}

void DirectoryArtifactSink::deliver_segment(const Blob& blob, const std::string& filename)
{
    auto path = save(blob, filename);
    NDCAPTURE_LOG_INFO("segment", "Delivered {} ({} bytes)", path.string(), blob.size());
}

std::filesystem::path DirectoryArtifactSink::save(const Blob& blob, const std::string& filename) const
{
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec)
    {
        throw std::runtime_error("Failed to create directory: " + directory_.string());
    }

    fs::path      path = directory_ / filename;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw std::runtime_error("Failed to open " + path.string() + " for writing");
    }
    out.write(reinterpret_cast<const char*>(blob.bytes.data()),
              static_cast<std::streamsize>(blob.bytes.size()));
    if (!out)
    {
        throw std::runtime_error("Failed to write " + path.string());
    }
    return path;
}

}   // namespace ndcapture
