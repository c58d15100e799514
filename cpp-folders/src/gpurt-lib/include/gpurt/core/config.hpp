#pragma once

/*
    GPURT RENDERER SAN

    FILE: config.hpp
    MODULE: core
    PURPOSE: Viewer configuration from the command line and GPURT_* environment
             variables. The command line wins over the environment.
*/


#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>

#include "gpurt/core/result.hpp"
#include "gpurt/rhi/core/backend.hpp"
#include "gpurt/scene/scene_presets.hpp"
#include "gpurt/trace/shading.hpp"

namespace gpurt
{
    inline constexpr int k_max_window_dimension = 16384;

    struct AppConfig
    {
        int width = 1280;
        int height = 720;
        RenderBackendType backend = RenderBackendType::Vulkan;
        std::string scene = "default";
        ShadeMode shade_mode = ShadeMode::Lit;
        PresentModePreference present_mode = PresentModePreference::Fifo;
        bool validation = false;
        std::string capture_path{};
        int capture_after_frames = 8;
        bool headless = false;
        size_t workers = 0;
        std::string shader_dir{};
        bool show_help = false;

        bool capture_enabled() const { return !capture_path.empty(); }
    };

    using EnvLookup = std::function<const char*(const char*)>;

    inline const char* process_env_lookup(const char* name)
    {
        return std::getenv(name);
    }

    inline const char* app_usage()
    {
        return
            "usage: gpurt_viewer [options]\n"
            "  --width N               window width (default 1280)\n"
            "  --height N              window height (default 720)\n"
            "  --backend vulkan|software\n"
            "  --scene single|default|grid\n"
            "  --shade lit|normals|depth\n"
            "  --present-mode fifo|mailbox\n"
            "  --validation            enable Vulkan validation layers\n"
            "  --capture PATH.ppm      write a CPU-traced frame and exit\n"
            "  --capture-after N       frames to run before capturing (default 8)\n"
            "  --headless              capture without opening a window\n"
            "  --workers N             CPU tracer threads (0 = all cores)\n"
            "  --help\n"
            "environment: GPURT_RENDER_BACKEND, GPURT_VK_PRESENT_MODE, GPURT_VK_VALIDATION, GPURT_SHADER_DIR\n";
    }

    inline bool parse_int_arg(std::string_view text, int& out)
    {
        if (text.empty()) return false;
        const char* first = text.data();
        const char* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, out);
        return ec == std::errc{} && ptr == last;
    }

    inline bool parse_env_flag(std::string_view text)
    {
        const std::string v = to_lower_ascii(text);
        return v == "1" || v == "true" || v == "yes" || v == "on";
    }

    inline bool try_parse_shade_mode(std::string_view text, ShadeMode& out)
    {
        const std::string v = to_lower_ascii(text);
        if (v == "lit") { out = ShadeMode::Lit; return true; }
        if (v == "normals" || v == "normal") { out = ShadeMode::Normals; return true; }
        if (v == "depth") { out = ShadeMode::Depth; return true; }
        return false;
    }

    inline bool is_scene_preset_name(std::string_view name)
    {
        for (std::string_view n : k_scene_preset_names)
        {
            if (n == name) return true;
        }
        return false;
    }

    inline Status apply_config_env(AppConfig& cfg, const EnvLookup& env)
    {
        if (!env) return status_ok();

        if (const char* v = env("GPURT_RENDER_BACKEND"); v && v[0] != '\0')
        {
            const auto t = try_parse_render_backend_type(v);
            if (!t) return Status::failure(std::string("GPURT_RENDER_BACKEND: unknown backend '") + v + "'");
            cfg.backend = *t;
        }
        if (const char* v = env("GPURT_VK_PRESENT_MODE"); v && v[0] != '\0')
        {
            const auto p = try_parse_present_mode_preference(v);
            if (!p) return Status::failure(std::string("GPURT_VK_PRESENT_MODE: unknown present mode '") + v + "'");
            cfg.present_mode = *p;
        }
        if (const char* v = env("GPURT_VK_VALIDATION"); v && v[0] != '\0')
        {
            cfg.validation = parse_env_flag(v);
        }
        if (const char* v = env("GPURT_SHADER_DIR"); v && v[0] != '\0')
        {
            cfg.shader_dir = v;
        }
        return status_ok();
    }

    inline Result<AppConfig> parse_app_config(int argc, const char* const* argv, const EnvLookup& env = process_env_lookup)
    {
        AppConfig cfg{};
        const Status env_status = apply_config_env(cfg, env);
        if (!env_status.ok) return Result<AppConfig>::failure(env_status.error);

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i] ? argv[i] : "";
            const auto next_value = [&](std::string& out) -> bool {
                if (i + 1 >= argc || !argv[i + 1]) return false;
                out = argv[++i];
                return true;
            };
            const auto missing = [&]() {
                return Result<AppConfig>::failure("missing value for " + arg);
            };

            std::string value{};
            if (arg == "--help" || arg == "-h")
            {
                cfg.show_help = true;
            }
            else if (arg == "--width" || arg == "--height")
            {
                if (!next_value(value)) return missing();
                int n = 0;
                if (!parse_int_arg(value, n) || n <= 0 || n > k_max_window_dimension)
                {
                    return Result<AppConfig>::failure(arg + ": expected 1.." + std::to_string(k_max_window_dimension) + ", got '" + value + "'");
                }
                (arg == "--width" ? cfg.width : cfg.height) = n;
            }
            else if (arg == "--backend")
            {
                if (!next_value(value)) return missing();
                const auto t = try_parse_render_backend_type(value);
                if (!t) return Result<AppConfig>::failure("--backend: unknown backend '" + value + "'");
                cfg.backend = *t;
            }
            else if (arg == "--scene")
            {
                if (!next_value(value)) return missing();
                if (!is_scene_preset_name(value))
                {
                    return Result<AppConfig>::failure("--scene: unknown scene '" + value + "', expected " + scene_preset_list());
                }
                cfg.scene = value;
            }
            else if (arg == "--shade")
            {
                if (!next_value(value)) return missing();
                if (!try_parse_shade_mode(value, cfg.shade_mode))
                {
                    return Result<AppConfig>::failure("--shade: unknown mode '" + value + "'");
                }
            }
            else if (arg == "--present-mode")
            {
                if (!next_value(value)) return missing();
                const auto p = try_parse_present_mode_preference(value);
                if (!p) return Result<AppConfig>::failure("--present-mode: unknown present mode '" + value + "'");
                cfg.present_mode = *p;
            }
            else if (arg == "--validation")
            {
                cfg.validation = true;
            }
            else if (arg == "--capture")
            {
                if (!next_value(value) || value.empty()) return missing();
                cfg.capture_path = value;
            }
            else if (arg == "--capture-after")
            {
                if (!next_value(value)) return missing();
                int n = 0;
                if (!parse_int_arg(value, n) || n < 1)
                {
                    return Result<AppConfig>::failure("--capture-after: expected a positive frame count, got '" + value + "'");
                }
                cfg.capture_after_frames = n;
            }
            else if (arg == "--headless")
            {
                cfg.headless = true;
            }
            else if (arg == "--workers")
            {
                if (!next_value(value)) return missing();
                int n = 0;
                if (!parse_int_arg(value, n) || n < 0)
                {
                    return Result<AppConfig>::failure("--workers: expected a non-negative count, got '" + value + "'");
                }
                cfg.workers = (size_t)n;
            }
            else
            {
                return Result<AppConfig>::failure("unknown option '" + arg + "'");
            }
        }

        if (cfg.headless && !cfg.capture_enabled())
        {
            return Result<AppConfig>::failure("--headless requires --capture PATH");
        }
        return Result<AppConfig>::success(cfg);
    }
}
