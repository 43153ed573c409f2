#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <ndcapture/export_config.hpp>
#include <ndcapture/logger.hpp>
#include <optional>
#include <sstream>
#include <type_traits>

namespace ndcapture
{

// ─── JSON serialization ──────────────────────────────────────────────────────

static std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

static std::string unescape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] != '\\' || i + 1 == s.size())
        {
            out += s[i];
            continue;
        }
        char c = s[++i];
        switch (c)
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            default:
                out += c;   // \" and \\ and anything else literal
                break;
        }
    }
    return out;
}

std::string ExportConfigFile::serialize() const
{
    const ExportSettings& s = config_.settings;

    std::ostringstream os;
    os.precision(17);
    os << "{\n";
    os << "  \"version\": 1,\n";
    os << "  \"mode\": \"" << to_string(config_.mode) << "\",\n";
    os << "  \"output_dir\": \"" << escape_json(config_.output_dir) << "\",\n";
    os << "  \"file_prefix\": \"" << escape_json(config_.file_prefix) << "\",\n";
    os << "  \"log_level\": \"" << escape_json(config_.log_level) << "\",\n";
    os << "  \"format\": \"" << to_string(s.format) << "\",\n";
    os << "  \"codec\": \"" << to_string(s.codec) << "\",\n";
    os << "  \"resolution\": \"" << to_string(s.resolution) << "\",\n";
    os << "  \"custom_width\": " << s.custom_width << ",\n";
    os << "  \"custom_height\": " << s.custom_height << ",\n";
    os << "  \"fps\": " << s.fps << ",\n";
    os << "  \"duration\": " << s.duration << ",\n";
    os << "  \"bitrate\": " << s.bitrate << ",\n";
    os << "  \"warmup_frames\": " << s.warmup_frames << ",\n";
    os << "  \"crop_enabled\": " << (s.crop.enabled ? "true" : "false") << ",\n";
    os << "  \"crop_x\": " << s.crop.x << ",\n";
    os << "  \"crop_y\": " << s.crop.y << ",\n";
    os << "  \"crop_width\": " << s.crop.width << ",\n";
    os << "  \"crop_height\": " << s.crop.height << ",\n";
    os << "  \"text_enabled\": " << (s.text_overlay.enabled ? "true" : "false") << ",\n";
    os << "  \"text\": \"" << escape_json(s.text_overlay.text) << "\",\n";
    os << "  \"text_x\": " << s.text_overlay.position_x << ",\n";
    os << "  \"text_y\": " << s.text_overlay.position_y << ",\n";
    os << "  \"text_color\": " << s.text_overlay.color << ",\n";
    os << "  \"text_opacity\": " << s.text_overlay.opacity << ",\n";
    os << "  \"font_size\": " << s.text_overlay.font_size << ",\n";
    os << "  \"fade_in\": " << s.fade.fade_in_sec << ",\n";
    os << "  \"fade_out\": " << s.fade.fade_out_sec << ",\n";
    os << "  \"disable_temporal_reprojection\": "
       << (s.disable_temporal_reprojection ? "true" : "false") << "\n";
    os << "}\n";
    return os.str();
}

// Key lookup for the flat object written above. Strings are skipped whole
// and only a string directly after '{' or ',' is treated as a key, so a
// value spelled like a key name never matches.
static std::optional<size_t> find_value(const std::string& json, const std::string& key)
{
    bool   key_position = false;
    size_t i            = 0;
    while (i < json.size())
    {
        const char c = json[i];
        if (c == '{' || c == ',')
        {
            key_position = true;
            ++i;
            continue;
        }
        if (c != '"')
        {
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
                key_position = false;
            ++i;
            continue;
        }

        size_t end = i + 1;
        while (end < json.size() && json[end] != '"')
            end += json[end] == '\\' ? 2 : 1;
        if (end >= json.size())
            return std::nullopt;

        if (key_position && json.compare(i + 1, end - i - 1, key) == 0)
        {
            size_t pos = json.find_first_not_of(" \t\n\r", end + 1);
            if (pos == std::string::npos || json[pos] != ':')
                return std::nullopt;
            pos = json.find_first_not_of(" \t\n\r", pos + 1);
            if (pos == std::string::npos)
                return std::nullopt;
            return pos;
        }
        key_position = false;
        i            = end + 1;
    }
    return std::nullopt;
}

static bool read_json_string(const std::string& json, const std::string& key, std::string& out)
{
    auto pos = find_value(json, key);
    if (!pos || json[*pos] != '"')
        return false;
    size_t end = *pos + 1;
    while (end < json.size())
    {
        if (json[end] == '"')
            break;
        end += json[end] == '\\' ? 2 : 1;
    }
    out = unescape_json(json.substr(*pos + 1, end - *pos - 1));
    return true;
}

static bool read_json_bool(const std::string& json, const std::string& key, bool def)
{
    auto pos = find_value(json, key);
    if (!pos)
        return def;
    if (json.compare(*pos, 4, "true") == 0)
        return true;
    if (json.compare(*pos, 5, "false") == 0)
        return false;
    return def;
}

// Returns false only for a present but malformed number.
template <typename T>
static bool read_json_number(const std::string& json, const std::string& key, T& out)
{
    auto pos = find_value(json, key);
    if (!pos)
        return true;
    const char* begin = json.c_str() + *pos;
    char*       end   = nullptr;
    double      v     = std::strtod(begin, &end);
    if (end == begin)
        return false;
    if constexpr (std::is_integral_v<T>)
    {
        if (!std::isfinite(v) || v < static_cast<double>(std::numeric_limits<T>::min())
            || v > static_cast<double>(std::numeric_limits<T>::max()))
            return false;
    }
    out = static_cast<T>(v);
    return true;
}

bool ExportConfigFile::deserialize(const std::string& json)
{
    last_error_.clear();
    if (json.empty())
    {
        last_error_ = "Empty config";
        return false;
    }

    // Check version
    int version = 1;
    if (!read_json_number(json, "version", version))
    {
        last_error_ = "Malformed value for 'version'";
        return false;
    }
    if (version > 1)
    {
        last_error_ = "Unsupported config version " + std::to_string(version);
        return false;
    }

    ExportConfig    c = config_;
    ExportSettings& s = c.settings;

    // Numbers are parsed into the copy; any failure discards it
    bool        ok  = true;
    const char* bad = nullptr;
    auto        num = [&](const char* key, auto& field)
    {
        if (ok && !read_json_number(json, key, field))
        {
            ok  = false;
            bad = key;
        }
    };
    num("custom_width", s.custom_width);
    num("custom_height", s.custom_height);
    num("fps", s.fps);
    num("duration", s.duration);
    num("bitrate", s.bitrate);
    num("warmup_frames", s.warmup_frames);
    num("crop_x", s.crop.x);
    num("crop_y", s.crop.y);
    num("crop_width", s.crop.width);
    num("crop_height", s.crop.height);
    num("text_x", s.text_overlay.position_x);
    num("text_y", s.text_overlay.position_y);
    num("text_color", s.text_overlay.color);
    num("text_opacity", s.text_overlay.opacity);
    num("font_size", s.text_overlay.font_size);
    num("fade_in", s.fade.fade_in_sec);
    num("fade_out", s.fade.fade_out_sec);
    if (!ok)
    {
        last_error_ = std::string("Malformed value for '") + bad + "'";
        return false;
    }

    std::string str;
    if (read_json_string(json, "mode", str) && !parse_mode(str, c.mode))
    {
        last_error_ = "Unknown export mode '" + str + "'";
        return false;
    }
    if (read_json_string(json, "format", str) && !parse_format(str, s.format))
    {
        last_error_ = "Unknown format '" + str + "'";
        return false;
    }
    if (read_json_string(json, "codec", str) && !parse_codec(str, s.codec))
    {
        last_error_ = "Unknown codec '" + str + "'";
        return false;
    }
    if (read_json_string(json, "resolution", str) && !parse_resolution(str, s.resolution))
    {
        last_error_ = "Unknown resolution '" + str + "'";
        return false;
    }

    read_json_string(json, "output_dir", c.output_dir);
    read_json_string(json, "file_prefix", c.file_prefix);
    read_json_string(json, "log_level", c.log_level);
    read_json_string(json, "text", s.text_overlay.text);

    s.crop.enabled                  = read_json_bool(json, "crop_enabled", s.crop.enabled);
    s.text_overlay.enabled          = read_json_bool(json, "text_enabled", s.text_overlay.enabled);
    s.disable_temporal_reprojection = read_json_bool(json,
                                                     "disable_temporal_reprojection",
                                                     s.disable_temporal_reprojection);

    config_ = std::move(c);
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool ExportConfigFile::save(const std::string& path) const
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            NDCAPTURE_LOG_WARN("config", "Cannot create " + dir.string() + ": " + ec.message());
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        NDCAPTURE_LOG_ERROR("config", "Cannot write " + path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool ExportConfigFile::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        last_error_ = "Cannot open " + path;
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(json))
    {
        NDCAPTURE_LOG_ERROR("config", path + ": " + last_error_);
        return false;
    }
    NDCAPTURE_LOG_INFO("config", "Loaded export config from " + path);
    return true;
}

std::string ExportConfigFile::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "export.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "ndcapture";
    return (dir / "export.json").string();
}

}   // namespace ndcapture
