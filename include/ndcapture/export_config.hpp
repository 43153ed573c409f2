#pragma once

#include <ndcapture/export_settings.hpp>
#include <string>

namespace ndcapture
{

// Everything a saved export preset carries.
struct ExportConfig
{
    ExportSettings settings;
    ExportMode     mode        = ExportMode::InMemory;
    std::string    output_dir  = ".";
    std::string    file_prefix = "ndcapture";
    std::string    log_level   = "info";
};

// Persistent export configuration: save/load an ExportConfig as JSON.
// Keys that are missing or unknown keep their defaults; a malformed value
// fails the load and leaves the current config untouched.
class ExportConfigFile
{
   public:
    ExportConfigFile() = default;
    explicit ExportConfigFile(ExportConfig config) : config_(std::move(config)) {}

    const ExportConfig& config() const { return config_; }
    ExportConfig&       config() { return config_; }
    void                set_config(ExportConfig config) { config_ = std::move(config); }

    // Save to a JSON file, creating parent directories. Returns true on success.
    bool save(const std::string& path) const;

    // Load from a JSON file. Returns true on success; see last_error() otherwise.
    bool load(const std::string& path);

    // Default config file path (~/.config/ndcapture/export.json).
    static std::string default_path();

    std::string serialize() const;
    bool        deserialize(const std::string& json);

    const std::string& last_error() const { return last_error_; }

   private:
    ExportConfig config_;
    std::string  last_error_;
};

}   // namespace ndcapture
