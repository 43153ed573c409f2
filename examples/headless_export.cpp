#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <ndcapture/artifact_sink.hpp>
#include <ndcapture/export_config.hpp>
#include <ndcapture/export_scheduler.hpp>
#include <ndcapture/ffmpeg_recorder.hpp>
#include <ndcapture/logger.hpp>
#include <ndcapture/scene_state.hpp>
#include <ndcapture/task_queue.hpp>
#include <optional>
#include <stdexcept>
#include <vector>

using namespace ndcapture;

// Software renderer: projects the 16 vertices of a tesseract through the
// current rotation state and splats them into an RGBA buffer.
class TesseractRenderer final : public Renderer
{
   public:
    explicit TesseractRenderer(SceneState& scene) : scene_(scene) {}

    RenderSurface surface() const override { return surface_; }

    void set_surface(const RenderSurface& s) override
    {
        if (s.width == 0 || s.height == 0)
            throw std::runtime_error("Empty surface");
        surface_ = s;
        pixels_.assign(static_cast<size_t>(s.width) * s.height * 4, 0);
    }

    QualityFlags quality() const override { return quality_; }
    void         set_quality(const QualityFlags& q) override { quality_ = q; }

    // The scheduler has already stepped the scene to `timestamp_ms`
    void advance(double /*timestamp_ms*/) override { draw(); }

    bool read_pixels(uint8_t* rgba, uint32_t width, uint32_t height) override
    {
        if (width != surface_.width || height != surface_.height || pixels_.empty())
            return false;
        std::copy(pixels_.begin(), pixels_.end(), rgba);
        return true;
    }

   private:
    static void rotate(double v[4], int a, int b, double angle)
    {
        const double c = std::cos(angle), s = std::sin(angle);
        const double x = v[a], y = v[b];
        v[a]           = c * x - s * y;
        v[b]           = s * x + c * y;
    }

    void draw()
    {
        std::fill(pixels_.begin(), pixels_.end(), 0);
        for (size_t i = 3; i < pixels_.size(); i += 4)
            pixels_[i] = 255;

        const double cx = surface_.width * 0.5, cy = surface_.height * 0.5;
        const double scale = std::min(surface_.width, surface_.height) * 0.18;

        for (int corner = 0; corner < 16; ++corner)
        {
            double v[4];
            for (int d = 0; d < 4; ++d)
                v[d] = (corner >> d) & 1 ? 1.0 : -1.0;

            for (const auto& [name, angle] : scene_.rotations)
            {
                auto [a, b] = parse_plane_name(name);
                if (a < 4 && b < 4)
                    rotate(v, static_cast<int>(a), static_cast<int>(b), angle);
            }

            // Perspective divide along W, then Z
            const double w  = 1.0 / (3.0 - v[3]);
            const double z  = 1.0 / (4.0 - v[2] * w);
            const int    px = static_cast<int>(cx + v[0] * w * z * scale * 4.0);
            const int    py = static_cast<int>(cy + v[1] * w * z * scale * 4.0);
            splat(px, py, corner);
        }
    }

    void splat(int px, int py, int corner)
    {
        for (int dy = -3; dy <= 3; ++dy)
        {
            for (int dx = -3; dx <= 3; ++dx)
            {
                const int x = px + dx, y = py + dy;
                if (x < 0 || y < 0 || x >= static_cast<int>(surface_.width)
                    || y >= static_cast<int>(surface_.height))
                    continue;
                uint8_t* p = &pixels_[(static_cast<size_t>(y) * surface_.width + x) * 4];
                p[0]       = static_cast<uint8_t>(80 + corner * 10);
                p[1]       = 200;
                p[2]       = static_cast<uint8_t>(255 - corner * 10);
            }
        }
    }

    SceneState&          scene_;
    RenderSurface        surface_{640, 480, 1.0f};
    QualityFlags         quality_;
    std::vector<uint8_t> pixels_ = std::vector<uint8_t>(640u * 480u * 4u, 0);
};

int main(int argc, char** argv)
{
    // Usage: headless_export [config.json] [log-file]
    Logger::instance().add_sink(sinks::console_sink());
    if (argc > 2)
        Logger::instance().add_sink(sinks::file_sink(argv[2]));

    ExportConfigFile cfg;
    std::string      path = argc > 1 ? argv[1] : ExportConfigFile::default_path();
    if (std::filesystem::exists(path))
    {
        if (!cfg.load(path))
        {
            std::cerr << "Invalid config " << path << ": " << cfg.last_error() << "\n";
            return 1;
        }
    }
    else if (argc > 1)
    {
        std::cerr << "Config not found: " << path << "\n";
        return 1;
    }

    LogLevel level = LogLevel::Info;
    if (!Logger::parse_level(cfg.config().log_level, level))
        NDCAPTURE_LOG_WARN("example", "Unknown log level '{}'", cfg.config().log_level);
    Logger::instance().set_level(level);

    SceneState scene;
    scene.animation.animating_planes = {"XY", "XW", "ZW"};
    scene.animation.bias             = 0.4;

    TesseractRenderer     renderer(scene);
    TaskQueue             queue;
    DirectoryArtifactSink sink(cfg.config().output_dir);

    ExportScheduler sched(renderer, scene, queue, make_ffmpeg_recorder_factory(renderer), sink);
    sched.set_file_prefix(cfg.config().file_prefix);
    sched.set_destination_picker([&sink](const std::string& suggested)
                                 { return std::optional(sink.directory() / suggested); });
    sched.set_on_status(
        [](const ExportProgress& p)
        {
            std::cout << "\r" << to_string(p.status) << " " << static_cast<int>(p.progress * 100.0f)
                      << "% " << p.eta << "    " << std::flush;
        });

    if (!sched.start(cfg.config().settings, cfg.config().mode))
    {
        std::cerr << "\nExport did not start: " << sched.progress().error << "\n";
        return 1;
    }

    while (sched.busy() && queue.run_one())
    {
    }
    std::cout << "\n";

    ExportProgress done = sched.progress();
    if (done.status != ExportStatus::Completed)
    {
        std::cerr << "Export failed: " << done.error << "\n";
        return 1;
    }

    if (auto blob = sched.take_result())
    {
        try
        {
            auto out = sink.save(*blob,
                                 cfg.config().file_prefix + "."
                                     + file_extension(cfg.config().settings.format));
            std::cout << "Saved " << out.string() << " (" << blob->size() << " bytes)\n";
        }
        catch (const std::exception& e)
        {
            std::cerr << "Save failed: " << e.what() << "\n";
            return 1;
        }
    }
    else if (done.completion && done.completion->destination)
    {
        std::cout << "Saved " << done.completion->destination->string() << "\n";
    }
    else if (done.completion)
    {
        std::cout << "Wrote " << done.completion->segment_count << " segments to "
                  << sink.directory().string() << "\n";
    }
    return 0;
}
