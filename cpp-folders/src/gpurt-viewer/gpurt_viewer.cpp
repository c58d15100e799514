#define SDL_MAIN_HANDLED

#include <cstdint>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <SDL2/SDL.h>

#include <gpurt/camera/free_camera_controller.hpp>
#include <gpurt/core/config.hpp>
#include <gpurt/core/context.hpp>
#include <gpurt/core/log.hpp>
#include <gpurt/core/time.hpp>
#include <gpurt/gfx/image.hpp>
#include <gpurt/job/thread_pool_job_system.hpp>
#include <gpurt/platform/sdl/sdl_runtime.hpp>
#include <gpurt/render/vk_ray_tracer.hpp>
#include <gpurt/rhi/backend/backend_factory.hpp>
#include <gpurt/rhi/drivers/vulkan/vk_shader_utils.hpp>
#include <gpurt/scene/scene_presets.hpp>
#include <gpurt/trace/cpu_ray_tracer.hpp>

namespace
{
constexpr const char* kAppName = "gpurt";
constexpr const char* kDefaultCapturePath = "gpurt_capture.ppm";

gpurt::RayTracerShaderPaths builtin_shader_paths(const std::string& override_dir)
{
    gpurt::RayTracerShaderPaths p{};
    p.compute = gpurt::vk_resolve_shader_path(override_dir, GPURT_RAYTRACE_COMP_SPV);
    p.vertex = gpurt::vk_resolve_shader_path(override_dir, GPURT_FULLSCREEN_VERT_SPV);
    p.fragment = gpurt::vk_resolve_shader_path(override_dir, GPURT_PRESENT_FRAG_SPV);
    return p;
}

class ViewerApp
{
public:
    explicit ViewerApp(gpurt::AppConfig cfg)
        : cfg_(std::move(cfg))
    {}

    ~ViewerApp()
    {
        cleanup();
    }

    int run()
    {
        init_jobs();
        init_scene();
        if (cfg_.headless) return run_headless();

        init_runtime();
        init_backend();
        return main_loop();
    }

private:
    void init_jobs()
    {
        jobs_ = std::make_unique<gpurt::ThreadPoolJobSystem>(cfg_.workers);
        ctx_.job_system = jobs_.get();
        cpu_tracer_.set_job_system(jobs_.get());
    }

    void init_scene()
    {
        const gpurt::ImageExtent image{(uint32_t)cfg_.width, (uint32_t)cfg_.height};
        gpurt::Result<gpurt::Scene> preset = gpurt::make_scene_preset(cfg_.scene, image);
        if (!preset) throw std::runtime_error(preset.error);
        const gpurt::Status valid = preset.value.validate();
        if (!valid) throw std::runtime_error("scene '" + cfg_.scene + "': " + valid.error);

        scene_ = std::move(preset.value);
        home_camera_ = scene_.camera;
        controller_.sync_from(scene_.camera);
        shade_ = cfg_.shade_mode;
        gpurt::log_info("scene '" + cfg_.scene + "': " + std::to_string(scene_.spheres().size()) + " spheres");
    }

    int run_headless()
    {
        gpurt::log_info("headless capture " + std::to_string(cfg_.width) + "x" + std::to_string(cfg_.height));
        return write_capture(cfg_.capture_path) ? 0 : 1;
    }

    void init_runtime()
    {
        gpurt::WindowDesc win{};
        win.title = kAppName;
        win.width = cfg_.width;
        win.height = cfg_.height;
        win.resizable = true;
        win.vulkan = cfg_.backend == gpurt::RenderBackendType::Vulkan;
        runtime_ = std::make_unique<gpurt::SdlRuntime>(win);
        if (!runtime_->valid()) throw std::runtime_error("SDL window creation failed");
    }

    void init_backend()
    {
        gpurt::RenderBackendSet backends = gpurt::create_render_backends(cfg_.backend);
        if (!backends.note.empty()) gpurt::log_info(backends.note);
        for (auto& b : backends.owned)
        {
            ctx_.register_backend(b.get());
            keep_.push_back(std::move(b));
        }
        ctx_.set_primary_backend(backends.active);

        int dw = 0;
        int dh = 0;
        runtime_->drawable_size(dw, dh);
        if (dw <= 0 || dh <= 0)
        {
            dw = cfg_.width;
            dh = cfg_.height;
        }

        if (backends.active == gpurt::RenderBackendType::Vulkan)
        {
            vk_ = dynamic_cast<gpurt::VulkanRenderBackend*>(ctx_.backend(gpurt::RenderBackendType::Vulkan));
            if (!vk_)
            {
                throw std::runtime_error("Factory returned non-Vulkan backend instance for Vulkan request.");
            }

            gpurt::VulkanRenderBackend::InitDesc init{};
            init.window = runtime_->window();
            init.width = dw;
            init.height = dh;
            init.enable_validation = cfg_.validation;
            init.present_mode = cfg_.present_mode;
            init.app_name = kAppName;
            if (!vk_->init_sdl(init))
            {
                throw std::runtime_error("Vulkan backend init_sdl failed");
            }

            tracer_ = std::make_unique<gpurt::VulkanRayTracer>(*vk_, builtin_shader_paths(cfg_.shader_dir));
            tracer_->init();
        }
        else
        {
            sw_ = dynamic_cast<gpurt::SoftwareRenderBackend*>(ctx_.backend(gpurt::RenderBackendType::Software));
            if (!sw_) throw std::runtime_error("Software backend missing");
            sw_->on_resize(ctx_, dw, dh);
            (void)scene_.camera.resize((uint32_t)dw, (uint32_t)dh);
        }

        gpurt::log_info(std::string("active backend: ") + ctx_.active_backend_name());
    }

    int main_loop()
    {
        gpurt::FrameClock clock{};
        clock.tick_hz = (double)SDL_GetPerformanceFrequency();

        while (true)
        {
            const float dt = clock.begin_frame(SDL_GetPerformanceCounter());

            gpurt::PlatformInputState input{};
            if (!runtime_->pump_input(input)) break;
            handle_input(input, dt);

            if (input.minimized)
            {
                SDL_Delay(16);
                continue;
            }

            int exit_code = 0;
            if (!render_frame(exit_code)) return exit_code;

            ++ctx_.frame_index;
            if (fps_.tick(dt)) update_title();

            if (cfg_.capture_enabled() && ctx_.frame_index >= (uint64_t)cfg_.capture_after_frames)
            {
                return write_capture(cfg_.capture_path) ? 0 : 1;
            }
        }

        if (vk_) (void)vk_->wait_idle();
        return 0;
    }

    void handle_input(const gpurt::PlatformInputState& input, float dt)
    {
        if (input.resized && input.resize_width > 0 && input.resize_height > 0)
        {
            if (vk_)
            {
                vk_->request_resize(input.resize_width, input.resize_height);
            }
            else if (sw_)
            {
                sw_->on_resize(ctx_, input.resize_width, input.resize_height);
                (void)scene_.camera.resize((uint32_t)input.resize_width, (uint32_t)input.resize_height);
            }
        }

        if (input.cycle_shade_mode)
        {
            shade_ = gpurt::next_shade_mode(shade_);
            gpurt::log_info(std::string("shade mode: ") + gpurt::shade_mode_name(shade_));
            update_title();
        }
        if (input.reset_camera)
        {
            const gpurt::ImageExtent image = scene_.camera.image();
            scene_.camera = home_camera_;
            (void)scene_.camera.resize(image.width, image.height);
            controller_.sync_from(scene_.camera);
        }
        if (input.request_capture)
        {
            (void)write_capture(cfg_.capture_enabled() ? cfg_.capture_path : kDefaultCapturePath);
        }

        runtime_->set_relative_mouse_mode(input.right_mouse_down);
        (void)controller_.update(scene_.camera, input, dt);
    }

    // Returns false when the app must exit; exit_code is set then.
    bool render_frame(int& exit_code)
    {
        if (tracer_) return render_frame_vulkan(exit_code);
        render_frame_software();
        return true;
    }

    bool render_frame_vulkan(int& exit_code)
    {
        const gpurt::FrameStatus status = tracer_->render_frame(ctx_, scene_, shade_);
        ctx_.frame_status.record(status);
        switch (status)
        {
            case gpurt::FrameStatus::Ok:
                return true;
            case gpurt::FrameStatus::Skipped:
                SDL_Delay(4);
                return true;
            case gpurt::FrameStatus::SurfaceOutOfDate:
            case gpurt::FrameStatus::SurfaceLost:
            {
                int w = 0;
                int h = 0;
                runtime_->drawable_size(w, h);
                vk_->request_resize(w, h);
                if (status == gpurt::FrameStatus::SurfaceLost)
                {
                    gpurt::log_warn("vulkan: surface lost, re-creating");
                }
                return true;
            }
            case gpurt::FrameStatus::OutOfMemory:
            case gpurt::FrameStatus::DeviceLost:
                gpurt::log_error(std::string("vulkan: fatal frame status: ") + gpurt::frame_status_name(status));
                exit_code = 1;
                return false;
            case gpurt::FrameStatus::Error:
                gpurt::log_error("vulkan: frame failed");
                return true;
        }
        return true;
    }

    void render_frame_software()
    {
        gpurt::RenderBackendFrameInfo frame{};
        frame.frame_index = ctx_.frame_index;
        frame.width = (int)scene_.camera.image().width;
        frame.height = (int)scene_.camera.image().height;

        sw_->begin_frame(ctx_, frame);
        cpu_tracer_.render(scene_, shade_, ldr_, &ctx_.stats);
        runtime_->upload_rgba8(ldr_.rgba8_data(), ldr_.w, ldr_.h, ldr_.pitch_bytes());
        runtime_->present();
        sw_->end_frame(ctx_, frame);
        ctx_.frame_status.record(gpurt::FrameStatus::Ok);
    }

    // Captures always come from the CPU tracer at the current camera.
    bool write_capture(const std::string& path)
    {
        gpurt::RT_ColorLDR image{};
        gpurt::TraceStats stats{};
        cpu_tracer_.render(scene_, shade_, image, &stats);
        if (!gpurt::write_ldr_to_ppm(path, image))
        {
            gpurt::log_error("capture: failed to write " + path);
            return false;
        }
        gpurt::log_info(
            "capture: wrote " + path + " (" + std::to_string(image.w) + "x" + std::to_string(image.h) +
            ", " + std::to_string(stats.ms_trace) + " ms)");
        return true;
    }

    void update_title()
    {
        if (!runtime_) return;
        char buf[256];
        const gpurt::ImageExtent image = scene_.camera.image();
        std::snprintf(
            buf,
            sizeof(buf),
            "%s | %s | %s | %ux%u | %.1f fps (%.2f ms) | trace %.2f ms",
            kAppName,
            ctx_.active_backend_name(),
            gpurt::shade_mode_name(shade_),
            image.width,
            image.height,
            fps_.fps,
            fps_.avg_ms,
            ctx_.stats.ms_trace);
        runtime_->set_title(buf);
    }

    void cleanup()
    {
        if (cleaned_up_) return;
        cleaned_up_ = true;

        if (vk_) (void)vk_->wait_idle();
        tracer_.reset();
        vk_ = nullptr;
        sw_ = nullptr;
        keep_.clear();
        runtime_.reset();
        jobs_.reset();
    }

private:
    gpurt::AppConfig cfg_{};
    bool cleaned_up_ = false;

    std::unique_ptr<gpurt::ThreadPoolJobSystem> jobs_{};
    std::unique_ptr<gpurt::SdlRuntime> runtime_{};
    gpurt::Context ctx_{};
    std::vector<std::unique_ptr<gpurt::IRenderBackend>> keep_{};
    gpurt::VulkanRenderBackend* vk_ = nullptr;
    gpurt::SoftwareRenderBackend* sw_ = nullptr;
    std::unique_ptr<gpurt::VulkanRayTracer> tracer_{};

    gpurt::Scene scene_{};
    gpurt::Camera home_camera_{};
    gpurt::FreeCameraController controller_{};
    gpurt::ShadeMode shade_ = gpurt::ShadeMode::Lit;
    gpurt::CpuRayTracer cpu_tracer_{};
    gpurt::RT_ColorLDR ldr_{};
    gpurt::FpsCounter fps_{};
};
}

int main(int argc, char** argv)
{
    const gpurt::Result<gpurt::AppConfig> cfg = gpurt::parse_app_config(argc, argv);
    if (!cfg)
    {
        std::fprintf(stderr, "%s\n\n%s", cfg.error.c_str(), gpurt::app_usage());
        return 2;
    }
    if (cfg.value.show_help)
    {
        std::printf("%s", gpurt::app_usage());
        return 0;
    }

    try
    {
        ViewerApp app(cfg.value);
        return app.run();
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "Fatal: %s\n", e.what());
        return 1;
    }
}
