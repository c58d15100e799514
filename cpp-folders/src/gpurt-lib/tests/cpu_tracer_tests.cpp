#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "gpurt/core/context.hpp"
#include "gpurt/gfx/image.hpp"
#include "gpurt/job/job_system.hpp"
#include "gpurt/job/thread_pool_job_system.hpp"
#include "gpurt/scene/scene_presets.hpp"
#include "gpurt/trace/cpu_ray_tracer.hpp"
#include "gpurt/trace/shading.hpp"

namespace
{
    bool near_u8(uint8_t a, int b, int tol = 1)
    {
        return std::abs((int)a - b) <= tol;
    }

    bool test_center_pixel_modes()
    {
        // Odd size so pixel (32, 32) looks straight down -Z.
        const gpurt::Scene scene = gpurt::make_single_sphere_scene(gpurt::ImageExtent{65, 65});
        const gpurt::CpuRayTracer tracer{};

        const gpurt::Color n = tracer.trace_pixel(scene, gpurt::ShadeMode::Normals, 32, 32);
        if (!near_u8(n.r, 186) || !near_u8(n.g, 186) || n.b != 255 || n.a != 255) return false;

        const gpurt::Color d = tracer.trace_pixel(scene, gpurt::ShadeMode::Depth, 32, 32);
        if (!near_u8(d.r, 212) || d.r != d.g || d.g != d.b) return false;

        const gpurt::Color lit = tracer.trace_pixel(scene, gpurt::ShadeMode::Lit, 32, 32);
        return lit.r > lit.g && lit.r > lit.b;
    }

    bool test_misses_show_sky()
    {
        const gpurt::Scene scene = gpurt::make_single_sphere_scene(gpurt::ImageExtent{65, 65});
        const gpurt::CpuRayTracer tracer{};

        const gpurt::Color depth_miss = tracer.trace_pixel(scene, gpurt::ShadeMode::Depth, 0, 0);
        if (depth_miss != gpurt::Color{0, 0, 0, 255}) return false;

        const glm::vec3 sky = scene.sky.color(scene.camera.primary_ray(0, 0).direction);
        const gpurt::Color expected{
            gpurt::encode_display_channel(sky.r),
            gpurt::encode_display_channel(sky.g),
            gpurt::encode_display_channel(sky.b),
            255};
        if (tracer.trace_pixel(scene, gpurt::ShadeMode::Lit, 0, 0) != expected) return false;
        return tracer.trace_pixel(scene, gpurt::ShadeMode::Normals, 0, 0) == expected;
    }

    gpurt::Scene make_shadow_scene(bool with_blocker)
    {
        gpurt::Scene scene{};
        scene.camera = gpurt::Camera(gpurt::CameraDesc{}, gpurt::ImageExtent{16, 16});
        scene.sun.direction = glm::vec3(0.0f, 1.0f, 0.0f);
        scene.sun.intensity = 1.0f;
        scene.sun.ambient = 0.15f;
        const uint32_t white = scene.add_material(gpurt::Material{glm::vec3(1.0f)});
        scene.add_sphere(gpurt::Sphere{gpurt::Point3(0.0f, -100.5f, -1.0f), 100.0f, white});
        if (with_blocker)
        {
            scene.add_sphere(gpurt::Sphere{gpurt::Point3(0.0f, 0.5f, -1.0f), 0.3f, white});
        }
        return scene;
    }

    bool test_sun_shadow()
    {
        gpurt::Ray ray{};
        ray.origin = glm::vec3(0.0f);
        ray.direction = glm::vec3(0.0f, -0.5f, -1.0f);

        gpurt::ShadeCounters shadowed_counters{};
        const glm::vec3 shadowed = gpurt::trace_ray_color(make_shadow_scene(true), ray, gpurt::ShadeMode::Lit, &shadowed_counters);
        if (std::abs(shadowed.r - 0.15f) > 1e-3f || shadowed_counters.shadow_rays != 1u) return false;

        const glm::vec3 open = gpurt::trace_ray_color(make_shadow_scene(false), ray, gpurt::ShadeMode::Lit);
        if (std::abs(open.r - 1.15f) > 1e-3f) return false;

        // Over-bright radiance clamps on encode.
        return gpurt::encode_display_channel(open.r) == 255 && gpurt::encode_display_channel(-1.0f) == 0;
    }

    bool test_parallel_render_matches_inline()
    {
        const gpurt::Scene scene = gpurt::make_default_scene(gpurt::ImageExtent{37, 23});

        gpurt::InlineJobSystem inline_jobs{};
        gpurt::CpuRayTracer serial(&inline_jobs);
        gpurt::RT_ColorLDR a{};
        gpurt::TraceStats stats_a{};
        serial.render(scene, gpurt::ShadeMode::Lit, a, &stats_a);

        gpurt::ThreadPoolJobSystem pool(3);
        gpurt::CpuRayTracer parallel(&pool);
        gpurt::RT_ColorLDR b{};
        gpurt::TraceStats stats_b{};
        parallel.render(scene, gpurt::ShadeMode::Lit, b, &stats_b);

        if (a.w != 37 || a.h != 23 || b.w != 37 || b.h != 23) return false;
        if (a.color.data != b.color.data) return false;

        if (stats_a.primary_rays != 851u || stats_b.primary_rays != 851u) return false;
        if (stats_a.shadow_rays != stats_b.shadow_rays || stats_a.shadow_rays == 0u) return false;
        if (stats_a.sphere_tests != (851u + stats_a.shadow_rays) * 2u) return false;
        if (stats_a.dispatch_groups_x != 5u || stats_a.dispatch_groups_y != 3u) return false;

        // Spot check against the single-pixel path.
        return a.color.at(18, 11) == serial.trace_pixel(scene, gpurt::ShadeMode::Lit, 18, 11);
    }

    bool test_write_ppm()
    {
        const gpurt::Scene scene = gpurt::make_default_scene(gpurt::ImageExtent{37, 23});
        gpurt::CpuRayTracer tracer{};
        gpurt::RT_ColorLDR ldr{};
        tracer.render(scene, gpurt::ShadeMode::Normals, ldr);

        const std::filesystem::path path = std::filesystem::temp_directory_path() / "gpurt_cpu_tracer_test.ppm";
        if (!gpurt::write_ldr_to_ppm(path.string(), ldr)) return false;

        std::ifstream in(path, std::ios::binary);
        const std::vector<char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        in.close();
        std::error_code ec{};
        std::filesystem::remove(path, ec);

        const std::string header = "P6\n37 23\n255\n";
        if (bytes.size() != header.size() + 37u * 23u * 3u) return false;
        if (std::string(bytes.begin(), bytes.begin() + (std::ptrdiff_t)header.size()) != header) return false;

        const gpurt::Color first = ldr.color.at(0, 0);
        if ((uint8_t)bytes[header.size() + 0] != first.r) return false;
        if ((uint8_t)bytes[header.size() + 2] != first.b) return false;

        return !gpurt::write_ldr_to_ppm(path.string(), gpurt::RT_ColorLDR{});
    }
}

int main()
{
    const bool ok_center = test_center_pixel_modes();
    const bool ok_sky = test_misses_show_sky();
    const bool ok_shadow = test_sun_shadow();
    const bool ok_parallel = test_parallel_render_matches_inline();
    const bool ok_ppm = test_write_ppm();

    if (!ok_center) std::fprintf(stderr, "[cpu-tracer-tests] center pixel shade modes failed\n");
    if (!ok_sky) std::fprintf(stderr, "[cpu-tracer-tests] sky on miss failed\n");
    if (!ok_shadow) std::fprintf(stderr, "[cpu-tracer-tests] sun shadow failed\n");
    if (!ok_parallel) std::fprintf(stderr, "[cpu-tracer-tests] parallel vs inline render failed\n");
    if (!ok_ppm) std::fprintf(stderr, "[cpu-tracer-tests] PPM capture failed\n");

    if (!(ok_center && ok_sky && ok_shadow && ok_parallel && ok_ppm)) return 1;
    std::fprintf(stderr, "[cpu-tracer-tests] all tests passed\n");
    return 0;
}
